#pragma once
#include <courier/net/header_map.h>
#include <courier/url/url.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace courier::fetch {

enum class ResponseType {
    Basic,
    Cors,
    Default,
    Error,
    Opaque,
    OpaqueRedirect,
};

enum class CacheState {
    None,
    Local,
    Validated,
    Partial,
};

enum class BodyState {
    Empty,
    Receiving,
    Done,
};

const char* response_type_name(ResponseType type);

// Body storage shared between a filtered response and its internal response.
// Written only by the fetch that owns it; every access takes the lock.
class ResponseBody {
public:
    BodyState state() const;
    bool is_done() const;
    std::size_t size() const;
    std::vector<uint8_t> bytes() const;

    // Empty -> Receiving. Appending to a finished body is ignored.
    void append(const std::vector<uint8_t>& chunk);
    // -> Done, keeping whatever was received.
    void finish();
    void finish_with(std::vector<uint8_t> bytes);

private:
    mutable std::mutex mutex_;
    BodyState state_ = BodyState::Empty;
    std::vector<uint8_t> bytes_;
};

struct HttpStatus {
    uint16_t code = 200;
    std::string reason = "OK";

    bool operator==(const HttpStatus& other) const {
        return code == other.code && reason == other.reason;
    }
    bool operator!=(const HttpStatus& other) const { return !(*this == other); }
};

struct Response {
    ResponseType type = ResponseType::Default;
    std::optional<HttpStatus> status = HttpStatus{};
    net::HeaderMap headers;
    std::shared_ptr<ResponseBody> body = std::make_shared<ResponseBody>();
    std::vector<url::URL> url_list;
    CacheState cache_state = CacheState::None;
    // The unfiltered response behind a Basic, Cors, Opaque or OpaqueRedirect view.
    std::shared_ptr<const Response> internal_response;
    // Why a network error happened; empty otherwise.
    std::string termination_reason;

    static Response network_error(std::string reason);

    bool is_network_error() const { return type == ResponseType::Error; }
    // Own body done (or one is not allowed) and the internal body done.
    bool is_done() const;
    std::optional<url::URL> url() const;

    const Response& actual_response() const;

    // Wraps the unfiltered response in a view of the given type.
    // credentials_included widens "Access-Control-Expose-Headers: *".
    Response to_filtered(ResponseType filter, bool credentials_included = false) const;
};

} // namespace courier::fetch
