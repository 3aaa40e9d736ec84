#include <courier/net/method.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace courier::net {

namespace {

std::string to_upper_ascii(std::string_view input) {
    std::string upper(input);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

bool is_token_char(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

std::string normalize_method(std::string_view method) {
    static constexpr std::array<std::string_view, 6> kNormalized = {
        "DELETE", "GET", "HEAD", "OPTIONS", "POST", "PUT"};

    std::string upper = to_upper_ascii(method);
    for (auto candidate : kNormalized) {
        if (upper == candidate) {
            return upper;
        }
    }
    return std::string(method);
}

bool is_method_token(std::string_view method) {
    return !method.empty() &&
           std::all_of(method.begin(), method.end(),
                       [](char c) { return is_token_char(static_cast<unsigned char>(c)); });
}

bool is_cors_safelisted_method(std::string_view method) {
    return method == "GET" || method == "HEAD" || method == "POST";
}

bool is_forbidden_method(std::string_view method) {
    std::string upper = to_upper_ascii(method);
    return upper == "CONNECT" || upper == "TRACE" || upper == "TRACK";
}

} // namespace courier::net
