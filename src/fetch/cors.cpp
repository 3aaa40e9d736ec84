#include <courier/fetch/cors.h>
#include <courier/fetch/request.h>
#include <courier/url/url.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>

namespace courier::fetch::cors {
namespace {

std::string trim_copy(std::string value) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool has_invalid_header_octet(std::string_view value) {
    for (unsigned char ch : value) {
        if (ch <= 0x1f || ch == 0x7f) {
            return true;
        }
    }
    return false;
}

// Canonical serialization of an Access-Control-Allow-Origin value, or
// nullopt when it is not a single well-formed origin.
std::optional<std::string> parse_serialized_origin(std::string_view input) {
    std::string trimmed = trim_copy(std::string(input));
    if (trimmed.empty() || has_invalid_header_octet(trimmed)) {
        return std::nullopt;
    }
    if (trimmed == "null") {
        return std::string("null");
    }

    const std::size_t scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos || scheme_end + 3 >= trimmed.size()) {
        return std::nullopt;
    }
    if (trimmed.find_first_of("/?#@", scheme_end + 3) != std::string::npos) {
        return std::nullopt;
    }

    auto parsed = url::parse(to_lower_ascii(trimmed));
    if (!parsed.has_value() || parsed->host.empty()) {
        return std::nullopt;
    }
    if (parsed->scheme != "http" && parsed->scheme != "https") {
        return std::nullopt;
    }
    return parsed->origin().serialize();
}

bool is_safelisted_content_type(std::string_view value) {
    std::string essence = to_lower_ascii(std::string(value.substr(0, value.find(';'))));
    essence = trim_copy(essence);
    return essence == "application/x-www-form-urlencoded" ||
           essence == "multipart/form-data" ||
           essence == "text/plain";
}

} // namespace

bool is_cors_safelisted_request_header(std::string_view name, std::string_view value) {
    std::string lower = to_lower_ascii(std::string(name));
    if (value.size() > 128) {
        return false;
    }
    if (lower == "accept" || lower == "accept-language" || lower == "content-language") {
        return !has_invalid_header_octet(value);
    }
    if (lower == "content-type") {
        return is_safelisted_content_type(value);
    }
    return false;
}

std::vector<std::string> unsafe_request_header_names(const net::HeaderMap& headers) {
    std::vector<std::string> names;
    for (const auto& [name, value] : headers) {
        if (!is_cors_safelisted_request_header(name, value)) {
            names.push_back(to_lower_ascii(name));
        }
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

bool is_cors_safelisted_response_header(std::string_view name) {
    std::string lower = to_lower_ascii(std::string(name));
    return lower == "cache-control" || lower == "content-language" ||
           lower == "content-type" || lower == "expires" ||
           lower == "last-modified" || lower == "pragma";
}

bool is_forbidden_response_header(std::string_view name) {
    std::string lower = to_lower_ascii(std::string(name));
    return lower == "set-cookie" || lower == "set-cookie2";
}

std::vector<std::string> exposed_header_names(const net::HeaderMap& response_headers) {
    std::vector<std::string> names;
    auto combined = response_headers.get_combined("access-control-expose-headers");
    if (!combined.has_value()) {
        return names;
    }
    for (auto& token : net::split_header_list(*combined)) {
        names.push_back(to_lower_ascii(std::move(token)));
    }
    return names;
}

bool cors_check(const Request& request, const net::HeaderMap& response_headers) {
    auto acao_values = response_headers.get_all("access-control-allow-origin");
    if (acao_values.size() != 1) {
        return false;
    }

    std::string acao = trim_copy(acao_values.front());
    if (acao.empty() || has_invalid_header_octet(acao)) {
        return false;
    }
    if (acao.find(',') != std::string::npos) {
        return false;
    }

    const bool credentials = request.credentials_mode == CredentialsMode::Include;
    if (!credentials && acao == "*") {
        return true;
    }

    auto allowed_origin = parse_serialized_origin(acao);
    if (!allowed_origin.has_value() || allowed_origin.value() != request.origin.serialize()) {
        return false;
    }

    if (!credentials) {
        return true;
    }

    auto acac_values = response_headers.get_all("access-control-allow-credentials");
    if (acac_values.size() != 1) {
        return false;
    }

    std::string acac = trim_copy(acac_values.front());
    if (acac.empty() || has_invalid_header_octet(acac)) {
        return false;
    }
    return acac == "true";
}

std::optional<uint64_t> parse_max_age(const net::HeaderMap& response_headers) {
    auto value = response_headers.get("access-control-max-age");
    if (!value.has_value()) {
        return std::nullopt;
    }
    std::string trimmed = trim_copy(*value);
    uint64_t seconds = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), seconds);
    if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size() || trimmed.empty()) {
        return std::nullopt;
    }
    return seconds;
}

} // namespace courier::fetch::cors
