#pragma once

#include <courier/net/header_map.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace courier::fetch {
struct Request;
}

namespace courier::fetch::cors {

bool is_cors_safelisted_request_header(std::string_view name, std::string_view value);
// Sorted, lowercase, without duplicates.
std::vector<std::string> unsafe_request_header_names(const net::HeaderMap& headers);

bool is_cors_safelisted_response_header(std::string_view name);
bool is_forbidden_response_header(std::string_view name);

// Lowercase names listed by Access-Control-Expose-Headers.
std::vector<std::string> exposed_header_names(const net::HeaderMap& response_headers);

// Access-Control-Allow-Origin / -Credentials check of response headers
// against the request's origin and credentials mode.
bool cors_check(const Request& request, const net::HeaderMap& response_headers);

// Access-Control-Max-Age in seconds; nullopt when absent or malformed.
std::optional<uint64_t> parse_max_age(const net::HeaderMap& response_headers);

} // namespace courier::fetch::cors
