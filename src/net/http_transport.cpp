#include <courier/core/config.h>
#include <courier/net/http_message.h>
#include <courier/net/http_transport.h>

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace courier::net {

namespace {

struct FramingInfo {
    std::optional<size_t> content_length;
    bool chunked = false;
};

FramingInfo framing_for(const ResponseHead& head) {
    FramingInfo info;
    if (auto te = head.headers.get_combined("transfer-encoding")) {
        std::string lower = HeaderMap::normalize_name(*te);
        info.chunked = lower.find("chunked") != std::string::npos;
    }
    if (!info.chunked) {
        if (auto cl = head.headers.get("content-length")) {
            size_t length = 0;
            auto [ptr, ec] = std::from_chars(cl->data(), cl->data() + cl->size(), length);
            if (ec == std::errc{} && ptr == cl->data() + cl->size()) {
                info.content_length = length;
            }
        }
    }
    return info;
}

bool has_null_body(uint16_t status, bool head_only) {
    return head_only || (status >= 100 && status < 200) || status == 204 || status == 304;
}

void init_openssl_once() {
    static std::once_flag once;
    std::call_once(once, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

int connect_tcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    // Bracketed IPv6 literals are resolved without their brackets
    std::string node = host;
    if (node.size() > 2 && node.front() == '[' && node.back() == ']') {
        node = node.substr(1, node.size() - 2);
    }
    std::string port_str = std::to_string(port);

    struct addrinfo* result = nullptr;
    int rv = ::getaddrinfo(node.c_str(), port_str.c_str(), &hints, &result);
    if (rv != 0 || result == nullptr) {
        return -1;
    }

    int fd = -1;
    for (auto* rp = result; rp != nullptr; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        // Non-blocking connect so the timeout applies
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }

        rv = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (rv == 0) {
            if (flags >= 0) {
                ::fcntl(fd, F_SETFL, flags);
            }
            break;
        }

        if (errno == EINPROGRESS) {
            struct pollfd pfd {};
            pfd.fd = fd;
            pfd.events = POLLOUT;

            int poll_rv = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (poll_rv > 0 && (pfd.revents & POLLOUT)) {
                int sock_err = 0;
                socklen_t err_len = sizeof(sock_err);
                if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_err, &err_len) == 0 &&
                    sock_err == 0) {
                    if (flags >= 0) {
                        ::fcntl(fd, F_SETFL, flags);
                    }
                    break;
                }
            }
        }

        ::close(fd);
        fd = -1;
    }

    ::freeaddrinfo(result);
    return fd;
}

// The address text of an IPv4 or bracketed IPv6 host, nullopt for names.
std::optional<std::string> ip_literal(const std::string& host) {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        std::string inner = host.substr(1, host.size() - 2);
        in6_addr v6 {};
        if (::inet_pton(AF_INET6, inner.c_str(), &v6) == 1) {
            return inner;
        }
        return std::nullopt;
    }
    in_addr v4 {};
    if (::inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        return host;
    }
    return std::nullopt;
}

// One TCP connection, wrapped in TLS for https. Blocking I/O bounded by
// SO_RCVTIMEO / SO_SNDTIMEO.
class Connection {
public:
    Connection() = default;
    ~Connection() { close(); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const url::URL& url, std::chrono::milliseconds timeout,
              const std::string& ca_file) {
        fd_ = connect_tcp(url.host, url.effective_port(), timeout);
        if (fd_ < 0) {
            return false;
        }

        struct timeval tv {};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (url.scheme == "https") {
            return start_tls(url.host, ca_file);
        }
        return true;
    }

    bool write_all(const uint8_t* data, size_t len) {
        size_t written = 0;
        while (written < len) {
            if (ssl_ != nullptr) {
                const int chunk = static_cast<int>(std::min<size_t>(len - written, 1 << 20));
                const int rc = SSL_write(ssl_, data + written, chunk);
                if (rc > 0) {
                    written += static_cast<size_t>(rc);
                    continue;
                }
                return false;
            }

            ssize_t n = ::send(fd_, data + written, len - written, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            if (n == 0) return false;
            written += static_cast<size_t>(n);
        }
        return true;
    }

    // Bytes read, 0 at end of stream, -1 on error or timeout.
    ssize_t read_some(uint8_t* buffer, size_t size) {
        while (true) {
            if (ssl_ != nullptr) {
                const int rc = SSL_read(ssl_, buffer, static_cast<int>(size));
                if (rc > 0) {
                    return rc;
                }
                const int ssl_error = SSL_get_error(ssl_, rc);
                if (ssl_error == SSL_ERROR_ZERO_RETURN) {
                    return 0;
                }
                // Servers that close without close_notify end the body too
                if (ssl_error == SSL_ERROR_SYSCALL && errno == 0) {
                    return 0;
                }
                return -1;
            }

            ssize_t n = ::recv(fd_, buffer, size, 0);
            if (n < 0 && errno == EINTR) continue;
            return n;
        }
    }

private:
    bool start_tls(const std::string& host, const std::string& ca_file) {
        init_openssl_once();

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (ctx_ == nullptr) {
            return false;
        }
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        const int trust_ok = ca_file.empty()
            ? SSL_CTX_set_default_verify_paths(ctx_)
            : SSL_CTX_load_verify_locations(ctx_, ca_file.c_str(), nullptr);
        if (trust_ok != 1) {
            return false;
        }

        ssl_ = SSL_new(ctx_);
        if (ssl_ == nullptr) {
            return false;
        }
        const auto ip = ip_literal(host);
        // SNI carries DNS names only
        if (!ip.has_value()) {
            SSL_set_tlsext_host_name(ssl_, host.c_str());
        }
        SSL_set_fd(ssl_, fd_);

        if (SSL_connect(ssl_) != 1) {
            return false;
        }
        if (SSL_get_verify_result(ssl_) != X509_V_OK) {
            return false;
        }

        X509* peer = SSL_get_peer_certificate(ssl_);
        if (peer == nullptr) {
            return false;
        }
        const int host_ok = ip.has_value()
            ? X509_check_ip_asc(peer, ip->c_str(), 0)
            : X509_check_host(peer, host.c_str(), host.size(), 0, nullptr);
        X509_free(peer);
        return host_ok == 1;
    }

    void close() {
        if (ssl_ != nullptr) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_ != nullptr) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int fd_ = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

// Reads the status line and headers. Bytes past the head are left in
// buffer for the body.
std::optional<ResponseHead> recv_head(Connection& connection, std::vector<uint8_t>& buffer,
                                      std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (auto head = parse_response_head(buffer)) {
            buffer.erase(buffer.begin(),
                         buffer.begin() + static_cast<std::ptrdiff_t>(head->header_length));
            return head;
        }
        if (buffer.size() > core::config::kMaxResponseHeadBytes ||
            std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }

        uint8_t chunk[core::config::kBodyChunkSize];
        ssize_t n = connection.read_some(chunk, sizeof(chunk));
        if (n <= 0) {
            return std::nullopt;
        }
        buffer.insert(buffer.end(), chunk, chunk + n);
    }
}

// Body read straight off the connection, one chunk per socket read.
// Transfer and content codings are undone as the bytes arrive.
class SocketBodyStream : public BodyStream {
public:
    SocketBodyStream(std::unique_ptr<Connection> connection, const FramingInfo& framing,
                     std::unique_ptr<ContentDecoder> decoder, std::vector<uint8_t> initial)
        : connection_(std::move(connection)),
          chunked_(framing.chunked),
          remaining_(framing.content_length),
          decoder_(std::move(decoder)),
          initial_(std::move(initial)) {}

    ReadStatus read(BodyChunk& chunk) override {
        if (failed_) {
            return ReadStatus::Failed;
        }

        std::vector<uint8_t> out;
        if (!finished_ && remaining_.has_value() && *remaining_ == 0 && !end_body()) {
            return fail();
        }
        if (!finished_ && !initial_.empty()) {
            std::vector<uint8_t> data = std::move(initial_);
            initial_.clear();
            if (!consume(data.data(), data.size(), out)) {
                return fail();
            }
        }

        while (out.empty() && !finished_) {
            uint8_t buffer[core::config::kBodyChunkSize];
            ssize_t n = connection_->read_some(buffer, sizeof(buffer));
            if (n < 0) {
                return fail();
            }
            if (n == 0) {
                // Only a close-delimited body may end with the peer closing
                if (chunked_ || remaining_.has_value() || !end_body()) {
                    return fail();
                }
                break;
            }
            if (!consume(buffer, static_cast<size_t>(n), out)) {
                return fail();
            }
        }

        if (out.empty()) {
            return ReadStatus::End;
        }
        chunk.sequence = next_sequence_++;
        chunk.bytes = std::move(out);
        return ReadStatus::Chunk;
    }

private:
    bool consume(const uint8_t* data, size_t len, std::vector<uint8_t>& out) {
        std::vector<uint8_t> framed;
        if (chunked_) {
            if (!chunked_decoder_.feed(data, len, framed)) return false;
        } else if (remaining_.has_value()) {
            size_t take = std::min(len, *remaining_);
            framed.assign(data, data + take);
            *remaining_ -= take;
        } else {
            framed.assign(data, data + len);
        }

        if (decoder_) {
            if (!decoder_->feed(framed.data(), framed.size(), out)) return false;
        } else {
            out.insert(out.end(), framed.begin(), framed.end());
        }

        const bool complete = chunked_ ? chunked_decoder_.done()
                                       : remaining_.has_value() && *remaining_ == 0;
        return !complete || end_body();
    }

    bool end_body() {
        if (decoder_ && !decoder_->finish()) {
            return false;
        }
        finished_ = true;
        initial_.clear();
        connection_.reset();
        return true;
    }

    ReadStatus fail() {
        failed_ = true;
        connection_.reset();
        return ReadStatus::Failed;
    }

    std::unique_ptr<Connection> connection_;
    bool chunked_ = false;
    ChunkedDecoder chunked_decoder_;
    std::optional<size_t> remaining_;
    std::unique_ptr<ContentDecoder> decoder_;
    std::vector<uint8_t> initial_;
    std::size_t next_sequence_ = 0;
    bool finished_ = false;
    bool failed_ = false;
};

} // anonymous namespace

HttpTransport::HttpTransport() : timeout_(core::config::kTransportTimeout) {}
HttpTransport::~HttpTransport() = default;

void HttpTransport::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

std::chrono::milliseconds HttpTransport::timeout() const {
    return timeout_;
}

void HttpTransport::set_ca_file(std::string path) {
    ca_file_ = std::move(path);
}

std::optional<TransportResponse> HttpTransport::send(const TransportRequest& request) {
    if ((request.url.scheme != "http" && request.url.scheme != "https") ||
        request.url.host.empty()) {
        return std::nullopt;
    }

    auto connection = std::make_unique<Connection>();
    if (!connection->open(request.url, timeout_, ca_file_)) {
        return std::nullopt;
    }

    auto data = serialize_request(request.method, request.url, request.headers, request.body);
    if (!connection->write_all(data.data(), data.size())) {
        return std::nullopt;
    }

    std::vector<uint8_t> buffer;
    auto head = recv_head(*connection, buffer, timeout_);
    if (!head.has_value()) {
        return std::nullopt;
    }

    TransportResponse response;
    response.status = head->status;
    response.reason = head->reason;

    if (has_null_body(head->status, request.method == "HEAD")) {
        response.body = std::make_unique<BufferedBodyStream>();
    } else {
        std::unique_ptr<ContentDecoder> decoder;
        if (auto encoding = head->headers.get("content-encoding")) {
            decoder = std::make_unique<ContentDecoder>(*encoding);
            if (!decoder->supported()) {
                return std::nullopt;
            }
        }
        response.body = std::make_unique<SocketBodyStream>(
            std::move(connection), framing_for(*head), std::move(decoder), std::move(buffer));
    }
    response.headers = std::move(head->headers);
    return response;
}

} // namespace courier::net
