#pragma once
#include <courier/fetch/request.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace courier::fetch {

// Preflight authorizations keyed by (origin, url, credentials). Shared by
// concurrent fetches; expired entries behave as absent.
class CorsCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    CorsCache();
    explicit CorsCache(Clock clock);

    bool match_method(const Request& request, const std::string& method) const;
    bool match_header(const Request& request, const std::string& header) const;

    // Adds or refreshes an authorization for every method and header given.
    // max_age_seconds is clamped to core::config::kMaxPreflightCacheAge.
    void insert(const Request& request, uint64_t max_age_seconds,
                const std::vector<std::string>& methods,
                const std::vector<std::string>& headers);

    // Drops every entry for the request's origin and current URL.
    void remove(const Request& request);
    void clear();

    // Number of unexpired method and header authorizations.
    std::size_t size() const;

private:
    struct Key {
        std::string origin;
        std::string url;
        bool credentials = false;

        bool operator<(const Key& other) const {
            if (origin != other.origin) return origin < other.origin;
            if (url != other.url) return url < other.url;
            return credentials < other.credentials;
        }
    };

    struct Entry {
        std::map<std::string, std::chrono::system_clock::time_point> methods;
        std::map<std::string, std::chrono::system_clock::time_point> headers;
    };

    static Key key_for(const Request& request);

    // An entry created with credentials also answers for requests without.
    template <typename Lookup>
    bool match(const Request& request, Lookup lookup) const;

    Clock clock_;
    mutable std::mutex mutex_;
    std::map<Key, Entry> entries_;
};

} // namespace courier::fetch
