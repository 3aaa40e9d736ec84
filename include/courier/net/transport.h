#pragma once
#include <courier/net/header_map.h>
#include <courier/url/url.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace courier::net {

struct BodyChunk {
    // Position of this chunk in the body; chunks may be read out of order.
    std::size_t sequence = 0;
    std::vector<uint8_t> bytes;
};

class BodyStream {
public:
    enum class ReadStatus {
        Chunk,
        End,
        Failed,
    };

    virtual ~BodyStream() = default;

    // Blocks until a chunk is available, the body ended, or the transport failed.
    virtual ReadStatus read(BodyChunk& chunk) = 0;
};

// Serves chunks that are already in memory, in the order they were queued.
class BufferedBodyStream : public BodyStream {
public:
    BufferedBodyStream() = default;
    explicit BufferedBodyStream(const std::vector<uint8_t>& body,
                                std::size_t chunk_size = 0);

    void push(BodyChunk chunk);
    // Makes the stream fail once the queued chunks are consumed.
    void fail_after_queued();

    ReadStatus read(BodyChunk& chunk) override;

private:
    std::deque<BodyChunk> chunks_;
    bool fail_ = false;
};

struct TransportRequest {
    std::string method = "GET";
    url::URL url;
    HeaderMap headers;
    std::optional<std::vector<uint8_t>> body;
};

struct TransportResponse {
    uint16_t status = 0;
    std::string reason;
    HeaderMap headers;
    std::unique_ptr<BodyStream> body;
};

// One round-trip per call. nullopt is the only failure signal.
class Transport {
public:
    virtual ~Transport() = default;
    virtual std::optional<TransportResponse> send(const TransportRequest& request) = 0;
};

} // namespace courier::net
