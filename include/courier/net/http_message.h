#pragma once
#include <courier/net/header_map.h>
#include <courier/url/url.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct z_stream_s;

namespace courier::net {

struct ResponseHead {
    std::string http_version;
    uint16_t status = 0;
    std::string reason;
    HeaderMap headers;
    // Offset of the first body byte in the buffer the head was parsed from.
    std::size_t header_length = 0;
};

// host[:port], the port only when it is not the scheme default.
std::string host_header_value(const url::URL& url);

// Serialize to HTTP/1.1 request bytes. Host, Content-Length and Connection
// are derived from the arguments; headers given by the caller follow them.
std::vector<uint8_t> serialize_request(const std::string& method,
                                       const url::URL& url,
                                       const HeaderMap& headers,
                                       const std::optional<std::vector<uint8_t>>& body);

// nullopt until the blank line ending the head has been received, or if malformed.
std::optional<ResponseHead> parse_response_head(const std::vector<uint8_t>& data);

// Undoes Transfer-Encoding: chunked as bytes arrive. Trailers after the
// last chunk are ignored.
class ChunkedDecoder {
public:
    // Appends decoded payload to out. false once the framing is malformed.
    bool feed(const uint8_t* data, std::size_t len, std::vector<uint8_t>& out);
    // True after the zero-size chunk.
    bool done() const { return phase_ == Phase::Done; }

private:
    enum class Phase {
        Size,
        Data,
        DataEnd,
        Done,
    };

    bool parse_size_line();

    Phase phase_ = Phase::Size;
    std::string line_;
    std::size_t remaining_ = 0;
};

// Undoes Content-Encoding (gzip, x-gzip, deflate, identity) as bytes
// arrive, through zlib's streaming inflate.
class ContentDecoder {
public:
    explicit ContentDecoder(const std::string& encoding);
    ~ContentDecoder();

    ContentDecoder(const ContentDecoder&) = delete;
    ContentDecoder& operator=(const ContentDecoder&) = delete;

    bool supported() const { return kind_ != Kind::Unsupported; }

    // false on corrupt data.
    bool feed(const uint8_t* data, std::size_t len, std::vector<uint8_t>& out);
    // false if the compressed stream was cut short.
    bool finish() const;

private:
    enum class Kind {
        Identity,
        Inflate,
        Unsupported,
    };

    bool start(int window_bits);
    void stop();
    bool inflate_into(const uint8_t* data, std::size_t len, std::vector<uint8_t>& out);

    Kind kind_ = Kind::Identity;
    // Raw deflate is tried when a "deflate" body has no zlib wrapper.
    bool allow_raw_ = false;
    bool raw_ = false;
    bool produced_ = false;
    bool stream_end_ = false;
    bool saw_input_ = false;
    // Input kept until the first output byte, for the raw deflate retry.
    std::vector<uint8_t> prefix_;
    std::unique_ptr<z_stream_s> stream_;
};

// nullopt if the chunked framing is truncated or malformed.
std::optional<std::vector<uint8_t>> decode_chunked_body(const uint8_t* data, std::size_t len);

// Undo Content-Encoding (gzip, x-gzip, deflate, identity).
// nullopt for unknown encodings or corrupt data.
std::optional<std::vector<uint8_t>> decode_content(const std::string& encoding,
                                                   const std::vector<uint8_t>& body);

} // namespace courier::net
