#include <courier/core/config.h>
#include <courier/fetch/cors_cache.h>
#include <courier/net/header_map.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace courier::fetch {

CorsCache::CorsCache() : CorsCache([]() { return std::chrono::system_clock::now(); }) {}

CorsCache::CorsCache(Clock clock) : clock_(std::move(clock)) {}

CorsCache::Key CorsCache::key_for(const Request& request) {
    return Key{request.origin.identity(), request.current_url().serialize(),
               request.credentials_mode == CredentialsMode::Include};
}

template <typename Lookup>
bool CorsCache::match(const Request& request, Lookup lookup) const {
    Key key = key_for(request);
    auto now = clock_();

    std::lock_guard lock(mutex_);
    auto check = [&](const Key& k) {
        auto it = entries_.find(k);
        if (it == entries_.end()) {
            return false;
        }
        auto expiry = lookup(it->second);
        return expiry.has_value() && now < *expiry;
    };

    if (check(key)) {
        return true;
    }
    if (!key.credentials) {
        key.credentials = true;
        return check(key);
    }
    return false;
}

bool CorsCache::match_method(const Request& request, const std::string& method) const {
    return match(request, [&method](const Entry& entry)
                              -> std::optional<std::chrono::system_clock::time_point> {
        auto it = entry.methods.find(method);
        if (it == entry.methods.end()) return std::nullopt;
        return it->second;
    });
}

bool CorsCache::match_header(const Request& request, const std::string& header) const {
    std::string name = net::HeaderMap::normalize_name(header);
    return match(request, [&name](const Entry& entry)
                              -> std::optional<std::chrono::system_clock::time_point> {
        auto it = entry.headers.find(name);
        if (it == entry.headers.end()) return std::nullopt;
        return it->second;
    });
}

void CorsCache::insert(const Request& request, uint64_t max_age_seconds,
                       const std::vector<std::string>& methods,
                       const std::vector<std::string>& headers) {
    Key key = key_for(request);
    const uint64_t cap = static_cast<uint64_t>(core::config::kMaxPreflightCacheAge.count());
    auto expiry = clock_() + std::chrono::seconds(std::min(max_age_seconds, cap));

    std::lock_guard lock(mutex_);
    auto& entry = entries_[key];
    for (const auto& method : methods) {
        entry.methods[method] = expiry;
    }
    for (const auto& header : headers) {
        entry.headers[net::HeaderMap::normalize_name(header)] = expiry;
    }
}

void CorsCache::remove(const Request& request) {
    Key key = key_for(request);

    std::lock_guard lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.origin == key.origin && it->first.url == key.url) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void CorsCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

std::size_t CorsCache::size() const {
    auto now = clock_();

    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& [key, entry] : entries_) {
        for (const auto& [method, expiry] : entry.methods) {
            if (now < expiry) ++count;
        }
        for (const auto& [header, expiry] : entry.headers) {
            if (now < expiry) ++count;
        }
    }
    return count;
}

} // namespace courier::fetch
