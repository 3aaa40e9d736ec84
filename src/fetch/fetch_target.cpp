#include <courier/fetch/fetch_target.h>

namespace courier::fetch {

void ResponseCollector::process_response_chunk(const std::vector<uint8_t>& chunk) {
    std::lock_guard lock(mutex_);
    streamed_.insert(streamed_.end(), chunk.begin(), chunk.end());
}

void ResponseCollector::process_response_eof(const Response& response) {
    {
        std::lock_guard lock(mutex_);
        response_ = response;
    }
    cv_.notify_all();
}

Response ResponseCollector::wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return response_.has_value(); });
    return *response_;
}

std::optional<Response> ResponseCollector::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return response_.has_value(); })) {
        return std::nullopt;
    }
    return response_;
}

bool ResponseCollector::finished() const {
    std::lock_guard lock(mutex_);
    return response_.has_value();
}

std::vector<uint8_t> ResponseCollector::streamed_bytes() const {
    std::lock_guard lock(mutex_);
    return streamed_;
}

} // namespace courier::fetch
