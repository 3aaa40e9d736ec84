#include <courier/fetch/devtools.h>

#include <utility>

namespace courier::fetch {

void DevtoolsChannel::send(DevtoolsMessage message) {
    {
        std::lock_guard lock(mutex_);
        messages_.push_back(std::move(message));
    }
    cv_.notify_one();
}

std::optional<DevtoolsMessage> DevtoolsChannel::receive(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !messages_.empty(); })) {
        return std::nullopt;
    }
    DevtoolsMessage message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

std::optional<DevtoolsMessage> DevtoolsChannel::try_receive() {
    std::lock_guard lock(mutex_);
    if (messages_.empty()) {
        return std::nullopt;
    }
    DevtoolsMessage message = std::move(messages_.front());
    messages_.pop_front();
    return message;
}

std::size_t DevtoolsChannel::pending() const {
    std::lock_guard lock(mutex_);
    return messages_.size();
}

} // namespace courier::fetch
