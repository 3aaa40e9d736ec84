#include <courier/net/transport.h>

#include <algorithm>

namespace courier::net {

BufferedBodyStream::BufferedBodyStream(const std::vector<uint8_t>& body, std::size_t chunk_size) {
    if (body.empty()) {
        return;
    }
    if (chunk_size == 0) {
        chunk_size = body.size();
    }

    std::size_t sequence = 0;
    for (std::size_t offset = 0; offset < body.size(); offset += chunk_size) {
        auto end = std::min(body.size(), offset + chunk_size);
        BodyChunk chunk;
        chunk.sequence = sequence++;
        chunk.bytes.assign(body.begin() + static_cast<std::ptrdiff_t>(offset),
                           body.begin() + static_cast<std::ptrdiff_t>(end));
        chunks_.push_back(std::move(chunk));
    }
}

void BufferedBodyStream::push(BodyChunk chunk) {
    chunks_.push_back(std::move(chunk));
}

void BufferedBodyStream::fail_after_queued() {
    fail_ = true;
}

BodyStream::ReadStatus BufferedBodyStream::read(BodyChunk& chunk) {
    if (chunks_.empty()) {
        return fail_ ? ReadStatus::Failed : ReadStatus::End;
    }
    chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return ReadStatus::Chunk;
}

} // namespace courier::net
