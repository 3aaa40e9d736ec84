#pragma once
#include <courier/fetch/response.h>
#include <courier/net/header_map.h>
#include <courier/url/url.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace courier::fetch {

// The request as it went over the wire on the final hop.
struct HttpRequestRecord {
    url::URL url;
    std::string method;
    net::HeaderMap headers;
    std::optional<std::vector<uint8_t>> body;
    std::optional<uint64_t> pipeline_id;
    std::chrono::system_clock::time_point started_date_time;
    // Milliseconds since the epoch.
    int64_t time_stamp = 0;
    // Milliseconds spent in the transport before the head arrived.
    uint64_t connect_time = 0;
    uint64_t send_time = 0;
    bool is_xhr = false;
};

// The unfiltered response of the final hop, without its Date header.
struct HttpResponseRecord {
    std::optional<net::HeaderMap> headers;
    std::optional<HttpStatus> status;
    std::optional<std::vector<uint8_t>> body;
    std::optional<uint64_t> pipeline_id;
};

using DevtoolsMessage = std::variant<HttpRequestRecord, HttpResponseRecord>;

// Unbounded multi-producer queue of records for an external tool.
class DevtoolsChannel {
public:
    void send(DevtoolsMessage message);

    std::optional<DevtoolsMessage> receive(std::chrono::milliseconds timeout);
    std::optional<DevtoolsMessage> try_receive();
    std::size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<DevtoolsMessage> messages_;
};

} // namespace courier::fetch
