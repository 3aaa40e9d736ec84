#pragma once
#include <string>
#include <string_view>

namespace courier::net {

// Methods are byte strings; extension methods such as "PROPFIND" pass through.
namespace method {
inline constexpr const char GET[] = "GET";
inline constexpr const char HEAD[] = "HEAD";
inline constexpr const char POST[] = "POST";
inline constexpr const char PUT[] = "PUT";
inline constexpr const char DELETE_METHOD[] = "DELETE";
inline constexpr const char OPTIONS[] = "OPTIONS";
inline constexpr const char PATCH[] = "PATCH";
} // namespace method

// Upper-cases DELETE, GET, HEAD, OPTIONS, POST and PUT; leaves anything else alone.
std::string normalize_method(std::string_view method);

bool is_method_token(std::string_view method);
bool is_cors_safelisted_method(std::string_view method);
bool is_forbidden_method(std::string_view method);

} // namespace courier::net
