#include <courier/fetch/scheme_fetch.h>
#include <courier/url/percent_encoding.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace courier::fetch {

namespace {

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim_copy(std::string_view value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return std::string(value.substr(start, end - start));
}

int base64_value(char ch) {
    if (ch >= 'A' && ch <= 'Z') return ch - 'A';
    if (ch >= 'a' && ch <= 'z') return ch - 'a' + 26;
    if (ch >= '0' && ch <= '9') return ch - '0' + 52;
    if (ch == '+') return 62;
    if (ch == '/') return 63;
    return -1;
}

// type "/" subtype with token characters on both sides.
bool is_valid_media_type(const std::string& media_type) {
    std::string essence = media_type.substr(0, media_type.find(';'));
    auto slash = essence.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= essence.size()) {
        return false;
    }
    for (unsigned char c : essence) {
        if (c != '/' && !std::isalnum(c) && std::string_view("!#$&-^_.+").find(c) == std::string_view::npos) {
            return false;
        }
    }
    return essence.find('/', slash + 1) == std::string::npos;
}

// Lowercases type and subtype, keeps parameters as written.
std::string normalize_media_type(const std::string& media_type) {
    auto semi = media_type.find(';');
    std::string essence = to_lower_ascii(trim_copy(media_type.substr(0, semi)));
    if (semi == std::string::npos) {
        return essence;
    }
    return essence + media_type.substr(semi);
}

Response local_response(const Request& request, const std::string& content_type,
                        std::vector<uint8_t> bytes) {
    Response response;
    response.url_list = request.url_list;
    response.headers.set("Content-Type", content_type);
    response.body->finish_with(std::move(bytes));
    return response;
}

Response about_fetch(const Request& request) {
    if (request.current_url().path != "blank") {
        return Response::network_error("unsupported about: URL " + request.current_url().serialize());
    }
    return local_response(request, "text/html;charset=utf-8", {});
}

Response data_fetch(const Request& request) {
    auto data = process_data_url(request.current_url());
    if (!data.has_value()) {
        return Response::network_error("malformed data: URL");
    }
    return local_response(request, data->media_type, std::move(data->body));
}

Response file_fetch(const Request& request) {
    const url::URL& url = request.current_url();
    std::string path = url::percent_decode(url.path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Response::network_error("no such file: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Response::network_error("cannot open file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Response::network_error("cannot read file: " + path);
    }

    std::string content_type = sniff_mime_type(path, bytes);
    return local_response(request, content_type, std::move(bytes));
}

} // anonymous namespace

bool is_local_scheme(std::string_view scheme) {
    return scheme == "about" || scheme == "blob" || scheme == "data";
}

bool is_scheme_fetched_locally(std::string_view scheme) {
    return scheme == "about" || scheme == "data" || scheme == "file";
}

std::optional<std::vector<uint8_t>> forgiving_base64_decode(std::string_view input) {
    std::string payload;
    payload.reserve(input.size());
    for (char ch : input) {
        if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\f' || ch == '\r') continue;
        payload.push_back(ch);
    }

    if (payload.size() % 4 == 0 && !payload.empty()) {
        if (payload.back() == '=') payload.pop_back();
        if (payload.back() == '=') payload.pop_back();
    }
    if (payload.size() % 4 == 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> decoded;
    decoded.reserve((payload.size() / 4) * 3 + 2);

    uint32_t buffer = 0;
    int bits = 0;
    for (char ch : payload) {
        int value = base64_value(ch);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<uint8_t>((buffer >> bits) & 0xff));
        }
    }
    return decoded;
}

std::optional<DataUrl> process_data_url(const url::URL& url) {
    if (url.scheme != "data") {
        return std::nullopt;
    }

    std::string input = url.path;
    if (!url.query.empty()) {
        input += "?" + url.query;
    }

    const std::size_t comma_pos = input.find(',');
    if (comma_pos == std::string::npos) {
        return std::nullopt;
    }

    std::string metadata = trim_copy(std::string_view(input).substr(0, comma_pos));
    const std::string payload = input.substr(comma_pos + 1);

    bool uses_base64 = false;
    auto semi = metadata.rfind(';');
    if (semi != std::string::npos &&
        to_lower_ascii(trim_copy(std::string_view(metadata).substr(semi + 1))) == "base64") {
        uses_base64 = true;
        metadata = trim_copy(std::string_view(metadata).substr(0, semi));
    }

    if (!metadata.empty() && metadata.front() == ';') {
        metadata = "text/plain" + metadata;
    }

    DataUrl result;
    result.media_type = is_valid_media_type(metadata) ? normalize_media_type(metadata)
                                                      : "text/plain;charset=US-ASCII";

    std::vector<uint8_t> bytes = url::percent_decode_bytes(payload);
    if (uses_base64) {
        std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        auto decoded = forgiving_base64_decode(text);
        if (!decoded.has_value()) {
            return std::nullopt;
        }
        result.body = std::move(*decoded);
    } else {
        result.body = std::move(bytes);
    }
    return result;
}

std::string sniff_mime_type(std::string_view path, const std::vector<uint8_t>& bytes) {
    struct Extension {
        const char* suffix;
        const char* mime;
    };
    static constexpr std::array<Extension, 21> kExtensions = {{
        {".css", "text/css"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".xhtml", "application/xhtml+xml"},
        {".js", "application/javascript"},
        {".mjs", "application/javascript"},
        {".json", "application/json"},
        {".txt", "text/plain"},
        {".xml", "application/xml"},
        {".svg", "image/svg+xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".ico", "image/x-icon"},
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".wasm", "application/wasm"},
    }};

    std::string lower_path = to_lower_ascii(std::string(path));
    for (const auto& ext : kExtensions) {
        if (lower_path.ends_with(ext.suffix)) {
            return ext.mime;
        }
    }

    auto starts_with = [&bytes](std::string_view prefix) {
        return bytes.size() >= prefix.size() &&
               std::equal(prefix.begin(), prefix.end(), bytes.begin(),
                          [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; });
    };

    if (starts_with("\x89PNG\r\n\x1a\n")) return "image/png";
    if (starts_with("GIF87a") || starts_with("GIF89a")) return "image/gif";
    if (starts_with("\xff\xd8\xff")) return "image/jpeg";
    if (starts_with("%PDF-")) return "application/pdf";

    std::string head(bytes.begin(), bytes.begin() + std::min<std::size_t>(bytes.size(), 512));
    std::string lower_head = to_lower_ascii(trim_copy(head));
    if (lower_head.starts_with("<!doctype html") || lower_head.starts_with("<html")) {
        return "text/html";
    }
    if (lower_head.starts_with("<?xml")) {
        return "text/xml";
    }

    for (uint8_t b : bytes) {
        if (b <= 0x08 || b == 0x0b || (b >= 0x0e && b <= 0x1a) || (b >= 0x1c && b <= 0x1f)) {
            return "application/octet-stream";
        }
    }
    return "text/plain";
}

Response scheme_fetch(const Request& request) {
    const std::string& scheme = request.current_url().scheme;
    if (scheme == "about") {
        return about_fetch(request);
    }
    if (scheme == "data") {
        return data_fetch(request);
    }
    if (scheme == "file") {
        return file_fetch(request);
    }
    return Response::network_error("unsupported scheme " + scheme);
}

} // namespace courier::fetch
