#include <courier/fetch/cors.h>
#include <courier/fetch/response.h>

#include <algorithm>
#include <utility>

namespace courier::fetch {

const char* response_type_name(ResponseType type) {
    switch (type) {
        case ResponseType::Basic: return "basic";
        case ResponseType::Cors: return "cors";
        case ResponseType::Default: return "default";
        case ResponseType::Error: return "error";
        case ResponseType::Opaque: return "opaque";
        case ResponseType::OpaqueRedirect: return "opaqueredirect";
    }
    return "default";
}

// ---------------------------------------------------------------------------
// ResponseBody
// ---------------------------------------------------------------------------

BodyState ResponseBody::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool ResponseBody::is_done() const {
    std::lock_guard lock(mutex_);
    return state_ == BodyState::Done;
}

std::size_t ResponseBody::size() const {
    std::lock_guard lock(mutex_);
    return bytes_.size();
}

std::vector<uint8_t> ResponseBody::bytes() const {
    std::lock_guard lock(mutex_);
    return bytes_;
}

void ResponseBody::append(const std::vector<uint8_t>& chunk) {
    std::lock_guard lock(mutex_);
    if (state_ == BodyState::Done) {
        return;
    }
    state_ = BodyState::Receiving;
    bytes_.insert(bytes_.end(), chunk.begin(), chunk.end());
}

void ResponseBody::finish() {
    std::lock_guard lock(mutex_);
    state_ = BodyState::Done;
}

void ResponseBody::finish_with(std::vector<uint8_t> bytes) {
    std::lock_guard lock(mutex_);
    bytes_ = std::move(bytes);
    state_ = BodyState::Done;
}

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------

Response Response::network_error(std::string reason) {
    Response response;
    response.type = ResponseType::Error;
    response.status.reset();
    response.termination_reason = std::move(reason);
    return response;
}

bool Response::is_done() const {
    bool own_done = true;
    switch (type) {
        case ResponseType::Default:
        case ResponseType::Basic:
        case ResponseType::Cors:
            own_done = body->is_done();
            break;
        case ResponseType::Error:
        case ResponseType::Opaque:
        case ResponseType::OpaqueRedirect:
            break;
    }

    bool internal_done = internal_response == nullptr || internal_response->body->is_done();
    return own_done && internal_done;
}

std::optional<url::URL> Response::url() const {
    if (url_list.empty()) {
        return std::nullopt;
    }
    return url_list.back();
}

const Response& Response::actual_response() const {
    if (internal_response != nullptr) {
        return *internal_response;
    }
    return *this;
}

Response Response::to_filtered(ResponseType filter, bool credentials_included) const {
    const Response& unfiltered = actual_response();
    if (filter == ResponseType::Default) {
        return unfiltered;
    }
    if (filter == ResponseType::Error) {
        return network_error(unfiltered.termination_reason);
    }

    auto internal = std::make_shared<const Response>(unfiltered);

    Response view;
    view.type = filter;
    view.internal_response = internal;

    switch (filter) {
        case ResponseType::Basic:
            view.status = unfiltered.status;
            view.body = unfiltered.body;
            view.url_list = unfiltered.url_list;
            view.cache_state = unfiltered.cache_state;
            for (const auto& [name, value] : unfiltered.headers) {
                if (!cors::is_forbidden_response_header(name)) {
                    view.headers.append(name, value);
                }
            }
            break;

        case ResponseType::Cors: {
            view.status = unfiltered.status;
            view.body = unfiltered.body;
            view.url_list = unfiltered.url_list;
            view.cache_state = unfiltered.cache_state;

            auto exposed = cors::exposed_header_names(unfiltered.headers);
            bool expose_all = !credentials_included &&
                std::find(exposed.begin(), exposed.end(), "*") != exposed.end();
            for (const auto& [name, value] : unfiltered.headers) {
                if (cors::is_forbidden_response_header(name)) {
                    continue;
                }
                std::string lower = net::HeaderMap::normalize_name(name);
                if (expose_all || cors::is_cors_safelisted_response_header(lower) ||
                    std::find(exposed.begin(), exposed.end(), lower) != exposed.end()) {
                    view.headers.append(name, value);
                }
            }
            break;
        }

        case ResponseType::Opaque:
        case ResponseType::OpaqueRedirect:
            // Everything suppressed; the body is a fresh, permanently empty one.
            view.status.reset();
            view.cache_state = CacheState::None;
            break;

        case ResponseType::Default:
        case ResponseType::Error:
            break;
    }
    return view;
}

} // namespace courier::fetch
