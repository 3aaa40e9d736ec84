#pragma once
#include <courier/net/transport.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace courier::net {

// HTTP/1.1 over POSIX sockets, one connection per exchange. https runs
// through OpenSSL with peer and hostname (or IP address) verification.
//
// send() returns once the status line and headers are in. The body stream
// owns the connection and reads it as the caller pulls chunks; each socket
// read is bounded by the timeout.
class HttpTransport : public Transport {
public:
    HttpTransport();
    ~HttpTransport() override;

    std::optional<TransportResponse> send(const TransportRequest& request) override;

    void set_timeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds timeout() const;

    // PEM trust anchors used instead of the system store. Empty restores it.
    void set_ca_file(std::string path);

private:
    std::chrono::milliseconds timeout_;
    std::string ca_file_;
};

} // namespace courier::net
