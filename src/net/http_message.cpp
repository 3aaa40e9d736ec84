#include <courier/net/http_message.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <sstream>
#include <string_view>
#include <zlib.h>

namespace courier::net {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

size_t find_header_end(const std::vector<uint8_t>& data) {
    static constexpr char kSeparator[] = "\r\n\r\n";
    auto it = std::search(data.begin(), data.end(), kSeparator, kSeparator + 4);
    if (it == data.end()) {
        return std::string::npos;
    }
    return static_cast<size_t>(it - data.begin()) + 4;
}

// Longest chunk-size line accepted, extensions included.
constexpr std::size_t kMaxChunkSizeLine = 1024;

} // anonymous namespace

std::string host_header_value(const url::URL& url) {
    std::string value = url.host;
    if (url.port.has_value()) {
        value += ":" + std::to_string(url.port.value());
    }
    return value;
}

std::vector<uint8_t> serialize_request(const std::string& method,
                                       const url::URL& url,
                                       const HeaderMap& headers,
                                       const std::optional<std::vector<uint8_t>>& body) {
    std::ostringstream oss;

    // Request line
    oss << method << " " << (url.path.empty() ? "/" : url.path);
    if (!url.query.empty()) {
        oss << "?" << url.query;
    }
    oss << " HTTP/1.1\r\n";

    // Host header (always first)
    oss << "Host: " << host_header_value(url) << "\r\n";

    // No connection reuse: one exchange per socket
    oss << "Connection: close\r\n";

    for (const auto& [name, value] : headers) {
        if (HeaderMap::names_equal(name, "host") || HeaderMap::names_equal(name, "connection")) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }

    if (body.has_value() && !body->empty() && !headers.has("content-length")) {
        oss << "Content-Length: " << body->size() << "\r\n";
    }

    oss << "\r\n";

    std::string head = oss.str();
    std::vector<uint8_t> result(head.begin(), head.end());
    if (body.has_value()) {
        result.insert(result.end(), body->begin(), body->end());
    }
    return result;
}

std::optional<ResponseHead> parse_response_head(const std::vector<uint8_t>& data) {
    size_t header_end = find_header_end(data);
    if (header_end == std::string::npos) {
        return std::nullopt;
    }

    std::string header_section(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(header_end));

    auto first_crlf = header_section.find("\r\n");
    std::string status_line = header_section.substr(0, first_crlf);

    // "HTTP/1.1 <status_code> <reason>" - the reason may be empty
    auto sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || !status_line.starts_with("HTTP/")) {
        return std::nullopt;
    }
    auto sp2 = status_line.find(' ', sp1 + 1);
    std::string code_str = status_line.substr(
        sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);

    ResponseHead head;
    head.http_version = status_line.substr(0, sp1);
    unsigned status = 0;
    auto [ptr, ec] = std::from_chars(code_str.data(), code_str.data() + code_str.size(), status);
    if (ec != std::errc{} || ptr != code_str.data() + code_str.size() ||
        status < 100 || status > 999) {
        return std::nullopt;
    }
    head.status = static_cast<uint16_t>(status);
    head.reason = sp2 == std::string::npos ? std::string{} : status_line.substr(sp2 + 1);

    size_t pos = first_crlf + 2;
    while (pos + 2 <= header_end - 2) {
        auto line_end = header_section.find("\r\n", pos);
        if (line_end == std::string::npos || line_end == pos) break;

        std::string line = header_section.substr(pos, line_end - pos);
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::nullopt;
        }
        head.headers.append(line.substr(0, colon), trim(line.substr(colon + 1)));
        pos = line_end + 2;
    }

    head.header_length = header_end;
    return head;
}

bool ChunkedDecoder::parse_size_line() {
    std::string_view size_str(line_);
    // Chunk extensions follow a semicolon
    auto semi = size_str.find(';');
    if (semi != std::string_view::npos) {
        size_str = size_str.substr(0, semi);
    }
    while (!size_str.empty() && (size_str.back() == ' ' || size_str.back() == '\t')) {
        size_str.remove_suffix(1);
    }

    std::size_t chunk_size = 0;
    auto [ptr, ec] = std::from_chars(size_str.data(), size_str.data() + size_str.size(),
                                     chunk_size, 16);
    if (ec != std::errc{} || ptr != size_str.data() + size_str.size()) {
        return false;
    }

    if (chunk_size == 0) {
        phase_ = Phase::Done;
    } else {
        remaining_ = chunk_size;
        phase_ = Phase::Data;
    }
    return true;
}

bool ChunkedDecoder::feed(const uint8_t* data, std::size_t len, std::vector<uint8_t>& out) {
    std::size_t pos = 0;
    while (pos < len && phase_ != Phase::Done) {
        switch (phase_) {
        case Phase::Size: {
            char c = static_cast<char>(data[pos++]);
            if (c != '\n') {
                if (line_.size() >= kMaxChunkSizeLine) return false;
                line_.push_back(c);
                break;
            }
            if (line_.empty() || line_.back() != '\r') return false;
            line_.pop_back();
            if (!parse_size_line()) return false;
            line_.clear();
            break;
        }
        case Phase::Data: {
            std::size_t take = std::min(remaining_, len - pos);
            out.insert(out.end(), data + pos, data + pos + take);
            pos += take;
            remaining_ -= take;
            if (remaining_ == 0) {
                phase_ = Phase::DataEnd;
            }
            break;
        }
        case Phase::DataEnd:
            line_.push_back(static_cast<char>(data[pos++]));
            if (line_.size() == 2) {
                if (line_ != "\r\n") return false;
                line_.clear();
                phase_ = Phase::Size;
            }
            break;
        case Phase::Done:
            break;
        }
    }
    return true;
}

ContentDecoder::ContentDecoder(const std::string& encoding) {
    std::string lower = to_lower(trim(encoding));
    if (lower.empty() || lower == "identity") {
        kind_ = Kind::Identity;
    } else if (lower == "gzip" || lower == "x-gzip") {
        kind_ = Kind::Inflate;
    } else if (lower == "deflate") {
        kind_ = Kind::Inflate;
        allow_raw_ = true;
    } else {
        kind_ = Kind::Unsupported;
    }
}

ContentDecoder::~ContentDecoder() {
    stop();
}

bool ContentDecoder::start(int window_bits) {
    stream_ = std::make_unique<z_stream>();
    if (inflateInit2(stream_.get(), window_bits) != Z_OK) {
        stream_.reset();
        return false;
    }
    return true;
}

void ContentDecoder::stop() {
    if (stream_) {
        inflateEnd(stream_.get());
        stream_.reset();
    }
}

bool ContentDecoder::inflate_into(const uint8_t* data, std::size_t len,
                                  std::vector<uint8_t>& out) {
    stream_->next_in = const_cast<Bytef*>(data);
    stream_->avail_in = static_cast<uInt>(len);

    uint8_t buffer[32768];
    while (true) {
        stream_->next_out = buffer;
        stream_->avail_out = sizeof(buffer);
        int ret = inflate(stream_.get(), Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR ||
            ret == Z_MEM_ERROR || ret == Z_NEED_DICT) {
            return false;
        }

        size_t have = sizeof(buffer) - stream_->avail_out;
        if (have > 0) {
            out.insert(out.end(), buffer, buffer + have);
            produced_ = true;
        }
        if (ret == Z_STREAM_END) {
            stream_end_ = true;
            return true;
        }
        // Z_BUF_ERROR: no progress possible until more input arrives
        if (ret == Z_BUF_ERROR || (stream_->avail_in == 0 && stream_->avail_out != 0)) {
            return true;
        }
    }
}

bool ContentDecoder::feed(const uint8_t* data, std::size_t len, std::vector<uint8_t>& out) {
    if (kind_ == Kind::Unsupported) {
        return false;
    }
    if (kind_ == Kind::Identity) {
        out.insert(out.end(), data, data + len);
        return true;
    }
    if (len == 0 || stream_end_) {
        return true;
    }
    saw_input_ = true;

    if (!stream_ && !start(15 + 32)) {
        return false;
    }
    const bool may_retry = allow_raw_ && !raw_ && !produced_;
    if (may_retry) {
        prefix_.insert(prefix_.end(), data, data + len);
    }

    if (inflate_into(data, len, out)) {
        if (produced_) {
            prefix_.clear();
        }
        return true;
    }
    if (!may_retry || produced_) {
        return false;
    }

    // Some servers send raw deflate under Content-Encoding: deflate
    stop();
    raw_ = true;
    if (!start(-15)) {
        return false;
    }
    std::vector<uint8_t> replay = std::move(prefix_);
    prefix_.clear();
    return inflate_into(replay.data(), replay.size(), out);
}

bool ContentDecoder::finish() const {
    return kind_ != Kind::Inflate || !saw_input_ || stream_end_;
}

std::optional<std::vector<uint8_t>> decode_chunked_body(const uint8_t* data, std::size_t len) {
    ChunkedDecoder decoder;
    std::vector<uint8_t> result;
    if (!decoder.feed(data, len, result) || !decoder.done()) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::vector<uint8_t>> decode_content(const std::string& encoding,
                                                   const std::vector<uint8_t>& body) {
    ContentDecoder decoder(encoding);
    if (!decoder.supported()) {
        return std::nullopt;
    }
    std::vector<uint8_t> result;
    if (!decoder.feed(body.data(), body.size(), result) || !decoder.finish()) {
        return std::nullopt;
    }
    return result;
}

} // namespace courier::net
