#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace courier::core::config {

inline constexpr std::size_t kMaxRedirects = 20;

inline constexpr const char kDefaultUserAgent[] =
    "courier/0.1 (Fetch; Linux x86_64)";
inline constexpr const char kDefaultAcceptLanguage[] = "en-US";
inline constexpr const char kDefaultAcceptEncoding[] = "gzip, deflate";

inline constexpr std::size_t kFetchWorkerThreads = 4;
inline constexpr std::chrono::milliseconds kTransportTimeout{30000};
inline constexpr std::size_t kBodyChunkSize = 8192;
inline constexpr std::size_t kMaxResponseHeadBytes = 64 * 1024;

// Upper bound on Access-Control-Max-Age, whatever the server asks for.
inline constexpr std::chrono::seconds kMaxPreflightCacheAge{7200};

inline constexpr std::size_t kMaxRetainedDiagnostics = 1024;

}  // namespace courier::core::config
