#include <courier/url/percent_encoding.h>
#include <courier/url/url.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace courier::url {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

bool is_ascii_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_ascii_alphanumeric(char c) {
    return is_ascii_alpha(c) || is_ascii_digit(c);
}

std::string to_lower_ascii(std::string_view input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Strip leading and trailing C0 control characters and spaces
std::string_view trim_input(std::string_view input) {
    auto is_trimmed = [](char c) {
        return static_cast<unsigned char>(c) <= 0x20;
    };
    size_t start = 0;
    while (start < input.size() && is_trimmed(input[start])) {
        ++start;
    }
    size_t end = input.size();
    while (end > start && is_trimmed(input[end - 1])) {
        --end;
    }
    return input.substr(start, end - start);
}

std::string remove_tab_newline(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (char c : input) {
        if (c != '\t' && c != '\n' && c != '\r') {
            result += c;
        }
    }
    return result;
}

// Special URLs treat '\' as '/' up to the query or fragment.
std::string normalize_backslashes(std::string_view input) {
    std::string result(input);
    for (char& c : result) {
        if (c == '?' || c == '#') break;
        if (c == '\\') c = '/';
    }
    return result;
}

bool is_forbidden_host_code_point(unsigned char c) {
    if (c <= 0x20 || c == 0x7F) return true;
    switch (c) {
        case '#': case '%': case '/': case ':': case '<': case '>':
        case '?': case '@': case '[': case '\\': case ']': case '^': case '|':
            return true;
        default:
            return false;
    }
}

std::string resolve_dot_segments(std::string_view path) {
    if (path.empty()) return {};

    std::vector<std::string_view> segments;
    bool leading_slash = path.front() == '/';
    size_t pos = leading_slash ? 1 : 0;
    bool trailing_slash = false;

    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        std::string_view segment = path.substr(pos, next - pos);
        bool last = next >= path.size();

        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
            trailing_slash = last;
        } else if (segment == ".") {
            trailing_slash = last;
        } else {
            segments.push_back(segment);
            trailing_slash = false;
        }

        if (last) break;
        pos = next + 1;
    }

    std::string result;
    if (leading_slash) result += '/';
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '/';
        result += segments[i];
    }
    if (trailing_slash && (result.empty() || result.back() != '/')) {
        result += '/';
    }
    return result;
}

std::string merge_paths(const URL& base, std::string_view relative_path) {
    if (!base.host.empty() && base.path.empty()) {
        return "/" + std::string(relative_path);
    }

    auto last_slash = base.path.rfind('/');
    if (last_slash != std::string::npos) {
        return base.path.substr(0, last_slash + 1) + std::string(relative_path);
    }
    return std::string(relative_path);
}

// nullopt: invalid port; optional-nullopt: default/absent port.
std::optional<std::optional<uint16_t>> parse_port(std::string_view port_str,
                                                  std::string_view scheme) {
    if (port_str.empty()) {
        return std::optional<uint16_t>{};
    }

    uint32_t value = 0;
    for (char c : port_str) {
        if (!is_ascii_digit(c)) return std::nullopt;
        value = value * 10 + static_cast<uint32_t>(c - '0');
        if (value > 65535) return std::nullopt;
    }

    auto port = static_cast<uint16_t>(value);
    if (default_port_for_scheme(scheme) == port) {
        return std::optional<uint16_t>{};
    }
    return std::optional<uint16_t>{port};
}

std::optional<std::string> parse_host(std::string_view input, bool special) {
    if (input.empty()) {
        return std::string{};
    }

    if (input.front() == '[') {
        if (input.back() != ']' || input.size() < 3) {
            return std::nullopt;
        }
        return to_lower_ascii(input);
    }

    if (!special) {
        return percent_encode(input, EncodeSet::C0Control);
    }

    std::string host = to_lower_ascii(percent_decode(input));
    for (unsigned char c : host) {
        if (is_forbidden_host_code_point(c)) {
            return std::nullopt;
        }
    }
    return host;
}

// Parses "userinfo@host:port" into url. Returns false on failure.
bool parse_authority(std::string_view authority, URL& url) {
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        std::string_view userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        auto colon = userinfo.find(':');
        if (colon != std::string_view::npos) {
            url.username = percent_encode(userinfo.substr(0, colon), EncodeSet::Userinfo);
            url.password = percent_encode(userinfo.substr(colon + 1), EncodeSet::Userinfo);
        } else {
            url.username = percent_encode(userinfo, EncodeSet::Userinfo);
        }
    }

    std::string_view host_part = authority;
    std::string_view port_part;
    bool has_port = false;

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return false;
        host_part = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return false;
            port_part = authority.substr(close + 2);
            has_port = true;
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host_part = authority.substr(0, colon);
            port_part = authority.substr(colon + 1);
            has_port = true;
        }
    }

    bool special = url.is_special();
    auto host = parse_host(host_part, special);
    if (!host.has_value()) return false;
    url.host = std::move(host.value());

    if (url.scheme == "file" && url.host == "localhost") {
        url.host.clear();
    }
    if (special && url.scheme != "file" && url.host.empty()) {
        return false;
    }

    if (has_port) {
        if (url.scheme == "file" || (url.host.empty() && !port_part.empty())) {
            return false;
        }
        auto port = parse_port(port_part, url.scheme);
        if (!port.has_value()) return false;
        url.port = port.value();
    }
    return true;
}

struct Tail {
    std::string_view path;
    std::optional<std::string_view> query;
    std::optional<std::string_view> fragment;
};

Tail split_tail(std::string_view rest) {
    Tail tail;
    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        tail.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        tail.query = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }
    tail.path = rest;
    return tail;
}

void assign_query_fragment(const Tail& tail, URL& url) {
    if (tail.query.has_value()) {
        url.query = percent_encode(*tail.query, EncodeSet::Query);
    }
    if (tail.fragment.has_value()) {
        url.fragment = percent_encode(*tail.fragment, EncodeSet::Fragment);
    }
}

void assign_path(std::string_view path, URL& url) {
    std::string encoded = percent_encode(path, EncodeSet::Path);
    if (!encoded.empty() && encoded.front() != '/' && (url.is_special() || !url.host.empty())) {
        encoded.insert(encoded.begin(), '/');
    }
    url.path = resolve_dot_segments(encoded);
    if (url.path.empty() && url.is_special()) {
        url.path = "/";
    }
}

// "//authority/path?query#fragment" with the leading slashes already removed.
std::optional<URL> parse_after_authority_start(std::string_view rest, URL url) {
    auto authority_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, authority_end);
    std::string_view remainder =
        authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    if (!parse_authority(authority, url)) {
        return std::nullopt;
    }

    Tail tail = split_tail(remainder);
    assign_path(tail.path, url);
    assign_query_fragment(tail, url);
    return url;
}

std::optional<URL> resolve_relative(std::string_view reference, const URL& base) {
    URL url;
    url.scheme = base.scheme;

    std::string normalized = base.is_special() ? normalize_backslashes(reference)
                                               : std::string(reference);
    std::string_view ref(normalized);

    if (ref.starts_with("//")) {
        return parse_after_authority_start(ref.substr(2), url);
    }

    url.username = base.username;
    url.password = base.password;
    url.host = base.host;
    url.port = base.port;

    if (ref.empty()) {
        url.path = base.path;
        url.query = base.query;
        return url;
    }

    Tail tail = split_tail(ref);
    if (tail.path.empty()) {
        url.path = base.path;
        url.query = tail.query.has_value() ? std::string{} : base.query;
        assign_query_fragment(tail, url);
        return url;
    }

    if (tail.path.front() == '/') {
        assign_path(tail.path, url);
    } else {
        assign_path(merge_paths(base, tail.path), url);
    }
    assign_query_fragment(tail, url);
    return url;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// parse()
// ---------------------------------------------------------------------------
std::optional<URL> parse(std::string_view raw_input, const URL* base) {
    std::string input = remove_tab_newline(trim_input(raw_input));

    // ------- Scheme extraction -------
    size_t scheme_end = 0;
    bool has_scheme = false;
    if (!input.empty() && is_ascii_alpha(input[0])) {
        scheme_end = 1;
        while (scheme_end < input.size() &&
               (is_ascii_alphanumeric(input[scheme_end]) || input[scheme_end] == '+' ||
                input[scheme_end] == '-' || input[scheme_end] == '.')) {
            ++scheme_end;
        }
        has_scheme = scheme_end < input.size() && input[scheme_end] == ':';
    }

    if (!has_scheme) {
        if (base == nullptr) {
            return std::nullopt;
        }
        if (base->opaque_path) {
            if (input.empty() || input.front() != '#') {
                return std::nullopt;
            }
            URL url = *base;
            url.fragment = percent_encode(std::string_view(input).substr(1), EncodeSet::Fragment);
            return url;
        }
        return resolve_relative(input, *base);
    }

    URL url;
    url.scheme = to_lower_ascii(std::string_view(input).substr(0, scheme_end));
    std::string_view rest = std::string_view(input).substr(scheme_end + 1);

    if (url.is_special()) {
        std::string normalized = normalize_backslashes(rest);
        std::string_view view(normalized);

        if (view.starts_with("//")) {
            view.remove_prefix(2);
            if (url.scheme != "file") {
                while (!view.empty() && view.front() == '/') view.remove_prefix(1);
            }
            return parse_after_authority_start(view, url);
        }

        if (base != nullptr && base->scheme == url.scheme && !base->opaque_path) {
            return resolve_relative(view, *base);
        }

        if (url.scheme == "file") {
            Tail tail = split_tail(view);
            assign_path(tail.path, url);
            assign_query_fragment(tail, url);
            return url;
        }

        while (!view.empty() && view.front() == '/') view.remove_prefix(1);
        return parse_after_authority_start(view, url);
    }

    if (rest.starts_with("//")) {
        return parse_after_authority_start(rest.substr(2), url);
    }

    Tail tail = split_tail(rest);
    if (!tail.path.empty() && tail.path.front() == '/') {
        assign_path(tail.path, url);
    } else {
        url.opaque_path = true;
        url.path = percent_encode(tail.path, EncodeSet::C0Control);
    }
    assign_query_fragment(tail, url);
    return url;
}

} // namespace courier::url
