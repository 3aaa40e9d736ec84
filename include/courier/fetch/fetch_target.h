#pragma once
#include <courier/fetch/request.h>
#include <courier/fetch/response.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace courier::fetch {

// Streaming observer of one fetch. Calls arrive in this order:
// process_request_body, process_request_eof, process_response,
// process_response_chunk (zero or more), process_response_eof.
class FetchTarget {
public:
    virtual ~FetchTarget() = default;

    virtual void process_request_body(const Request&) {}
    virtual void process_request_eof(const Request&) {}
    virtual void process_response(const Response&) {}
    virtual void process_response_chunk(const std::vector<uint8_t>&) {}
    virtual void process_response_eof(const Response&) {}
};

// Holds the response handed to process_response_eof until someone takes it.
class ResponseCollector : public FetchTarget {
public:
    void process_response_chunk(const std::vector<uint8_t>& chunk) override;
    void process_response_eof(const Response& response) override;

    // Blocks until the fetch finished.
    Response wait();
    std::optional<Response> wait_for(std::chrono::milliseconds timeout);

    bool finished() const;
    // Bytes seen through process_response_chunk, in delivery order.
    std::vector<uint8_t> streamed_bytes() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Response> response_;
    std::vector<uint8_t> streamed_;
};

} // namespace courier::fetch
