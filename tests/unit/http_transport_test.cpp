#include <courier/net/http_transport.h>
#include <courier/url/url.h>

#include <gtest/gtest.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <zlib.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace courier;
using namespace courier::net;

namespace {

// Listening socket on 127.0.0.1 with a kernel-chosen port.
int listen_loopback(uint16_t& port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    int yes = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd, 8);

    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
    return fd;
}

void send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += static_cast<size_t>(n);
    }
}

// Accepts connections on 127.0.0.1 and answers each with the next canned
// reply. With a pause, the head goes out first and the body after the pause.
class LoopbackServer {
public:
    explicit LoopbackServer(std::vector<std::string> replies,
                            std::chrono::milliseconds pause_after_head = std::chrono::milliseconds(0))
        : replies_(std::move(replies)), pause_after_head_(pause_after_head) {
        fd_ = listen_loopback(port_);
        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackServer() {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        if (thread_.joinable()) thread_.join();
    }

    uint16_t port() const { return port_; }

    url::URL url(const std::string& path) const {
        return *url::parse("http://127.0.0.1:" + std::to_string(port_) + path);
    }

    std::vector<std::string> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    void serve() {
        for (const auto& reply : replies_) {
            int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) return;

            std::string request;
            char buffer[4096];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0) break;
                request.append(buffer, static_cast<size_t>(n));
            }
            size_t head_end = request.find("\r\n\r\n");
            size_t length_at = request.find("Content-Length: ");
            if (head_end != std::string::npos && length_at != std::string::npos && length_at < head_end) {
                size_t expected = head_end + 4 + std::stoul(request.substr(length_at + 16));
                while (request.size() < expected) {
                    ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
                    if (n <= 0) break;
                    request.append(buffer, static_cast<size_t>(n));
                }
            }
            {
                std::lock_guard lock(mutex_);
                requests_.push_back(request);
            }

            size_t split = reply.find("\r\n\r\n");
            if (pause_after_head_.count() > 0 && split != std::string::npos) {
                send_all(client, reply.substr(0, split + 4));
                std::this_thread::sleep_for(pause_after_head_);
                send_all(client, reply.substr(split + 4));
            } else {
                send_all(client, reply);
            }
            ::close(client);
        }
    }

    std::vector<std::string> replies_;
    std::chrono::milliseconds pause_after_head_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
};

// Self-signed certificate naming one IP address, written to a PEM file
// the transport can trust.
class TestCertificate {
public:
    explicit TestCertificate(const std::string& ip) {
        EVP_PKEY_CTX* kctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
        EVP_PKEY_keygen_init(kctx);
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx, NID_X9_62_prime256v1);
        EVP_PKEY_keygen(kctx, &key_);
        EVP_PKEY_CTX_free(kctx);

        cert_ = X509_new();
        X509_set_version(cert_, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert_), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert_), -60);
        X509_gmtime_adj(X509_getm_notAfter(cert_), 3600);
        X509_set_pubkey(cert_, key_);

        X509_NAME* name = X509_get_subject_name(cert_);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("courier test"),
                                   -1, -1, 0);
        X509_set_issuer_name(cert_, name);

        X509V3_CTX v3;
        X509V3_set_ctx_nodb(&v3);
        X509V3_set_ctx(&v3, cert_, cert_, nullptr, nullptr, 0);
        std::string san = "IP:" + ip;
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, NID_subject_alt_name, san.c_str());
        X509_add_ext(cert_, ext, -1);
        X509_EXTENSION_free(ext);
        X509_sign(cert_, key_, EVP_sha256());

        pem_path_ = (std::filesystem::temp_directory_path() /
                     ("courier_tls_" + ip + ".pem")).string();
        FILE* file = std::fopen(pem_path_.c_str(), "w");
        PEM_write_X509(file, cert_);
        std::fclose(file);
    }

    ~TestCertificate() {
        std::remove(pem_path_.c_str());
        X509_free(cert_);
        EVP_PKEY_free(key_);
    }

    X509* cert() const { return cert_; }
    EVP_PKEY* key() const { return key_; }
    const std::string& pem_path() const { return pem_path_; }

private:
    EVP_PKEY* key_ = nullptr;
    X509* cert_ = nullptr;
    std::string pem_path_;
};

// One TLS exchange on 127.0.0.1 with the given certificate.
class TlsLoopbackServer {
public:
    TlsLoopbackServer(const TestCertificate& certificate, std::string reply)
        : reply_(std::move(reply)) {
        std::signal(SIGPIPE, SIG_IGN);
        ctx_ = SSL_CTX_new(TLS_server_method());
        SSL_CTX_use_certificate(ctx_, certificate.cert());
        SSL_CTX_use_PrivateKey(ctx_, certificate.key());
        fd_ = listen_loopback(port_);
        thread_ = std::thread([this]() { serve(); });
    }

    ~TlsLoopbackServer() {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        if (thread_.joinable()) thread_.join();
        SSL_CTX_free(ctx_);
    }

    url::URL url(const std::string& path) const {
        return *url::parse("https://127.0.0.1:" + std::to_string(port_) + path);
    }

    bool served() const { return served_; }

private:
    void serve() {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) return;

        SSL* ssl = SSL_new(ctx_);
        SSL_set_fd(ssl, client);
        if (SSL_accept(ssl) == 1) {
            std::string request;
            char buffer[4096];
            while (request.find("\r\n\r\n") == std::string::npos) {
                int n = SSL_read(ssl, buffer, sizeof(buffer));
                if (n <= 0) break;
                request.append(buffer, static_cast<size_t>(n));
            }
            if (request.find("\r\n\r\n") != std::string::npos) {
                SSL_write(ssl, reply_.data(), static_cast<int>(reply_.size()));
                served_ = true;
                SSL_shutdown(ssl);
            }
        }
        SSL_free(ssl);
        ::close(client);
    }

    std::string reply_;
    SSL_CTX* ctx_ = nullptr;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::atomic<bool> served_{false};
};

std::string read_all(BodyStream& stream) {
    std::string out;
    BodyChunk chunk;
    while (stream.read(chunk) == BodyStream::ReadStatus::Chunk) {
        out.append(chunk.bytes.begin(), chunk.bytes.end());
    }
    return out;
}

std::string gzip(const std::string& input) {
    z_stream strm{};
    deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    std::string out(deflateBound(&strm, static_cast<uLong>(input.size())) + 32, '\0');
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = reinterpret_cast<Bytef*>(out.data());
    strm.avail_out = static_cast<uInt>(out.size());
    deflate(&strm, Z_FINISH);
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Content-Length framed response
// ---------------------------------------------------------------------------
TEST(HttpTransportTest, ContentLengthResponse) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: 12\r\nX-Test: yes\r\n\r\nHello World!"});
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/hello");
    request.headers.set("Accept", "*/*");

    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 200);
    EXPECT_EQ(response->reason, "OK");
    EXPECT_EQ(response->headers.get("x-test"), "yes");
    ASSERT_NE(response->body, nullptr);
    EXPECT_EQ(read_all(*response->body), "Hello World!");

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].rfind("GET /hello HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(requests[0].find("Accept: */*\r\n"), std::string::npos);
}

// ---------------------------------------------------------------------------
// 2. Chunked response
// ---------------------------------------------------------------------------
TEST(HttpTransportTest, ChunkedResponse) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                           "3\r\nACK\r\n2\r\n!!\r\n0\r\n\r\n"});
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(read_all(*response->body), "ACK!!");
}

// ---------------------------------------------------------------------------
// 3. Close-delimited response
// ---------------------------------------------------------------------------
TEST(HttpTransportTest, CloseDelimitedResponse) {
    LoopbackServer server({"HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nuntil close"});
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(read_all(*response->body), "until close");
}

// ---------------------------------------------------------------------------
// 4. gzip content decoding
// ---------------------------------------------------------------------------
TEST(HttpTransportTest, GzipBodyDecoded) {
    const std::string compressed = gzip("compressed payload");
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Encoding: gzip\r\nContent-Length: " +
                           std::to_string(compressed.size()) + "\r\n\r\n" + compressed});
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(read_all(*response->body), "compressed payload");
}

// ---------------------------------------------------------------------------
// 5. POST body reaches the server
// ---------------------------------------------------------------------------
TEST(HttpTransportTest, PostSendsBody) {
    LoopbackServer server({"HTTP/1.1 204 No Content\r\n\r\n"});
    HttpTransport transport;

    TransportRequest request;
    request.method = "POST";
    request.url = server.url("/submit");
    request.body = std::vector<uint8_t>{'k', '=', 'v'};
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 204);
    EXPECT_EQ(read_all(*response->body), "");

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_NE(requests[0].find("Content-Length: 3\r\n"), std::string::npos);
}

// ---------------------------------------------------------------------------
// 6. Failures
// ---------------------------------------------------------------------------
TEST(HttpTransportTest, RefusedConnectionIsFailure) {
    uint16_t port = 0;
    {
        LoopbackServer server({});
        port = server.port();
    }
    HttpTransport transport;
    transport.set_timeout(std::chrono::milliseconds(2000));

    TransportRequest request;
    request.url = *url::parse("http://127.0.0.1:" + std::to_string(port) + "/");
    EXPECT_FALSE(transport.send(request).has_value());
}

TEST(HttpTransportTest, TlsHandshakeWithPlainServerFails) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"});
    HttpTransport transport;
    transport.set_timeout(std::chrono::milliseconds(1000));

    TransportRequest request;
    request.url = *url::parse("https://127.0.0.1:" + std::to_string(server.port()) + "/");
    EXPECT_FALSE(transport.send(request).has_value());
}

TEST(HttpTransportTest, OtherSchemesAreRefused) {
    HttpTransport transport;
    TransportRequest request;
    request.url = *url::parse("ftp://127.0.0.1/file");
    EXPECT_FALSE(transport.send(request).has_value());
}

TEST(HttpTransportTest, TruncatedBodyFailsTheStream) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort"});
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 200);

    std::string received;
    BodyChunk chunk;
    BodyStream::ReadStatus status;
    while ((status = response->body->read(chunk)) == BodyStream::ReadStatus::Chunk) {
        received.append(chunk.bytes.begin(), chunk.bytes.end());
    }
    EXPECT_EQ(status, BodyStream::ReadStatus::Failed);
    EXPECT_EQ(received, "short");
}

TEST(HttpTransportTest, TruncatedChunkedBodyFailsTheStream) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                           "5\r\nhel"});
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());

    BodyChunk chunk;
    BodyStream::ReadStatus status;
    while ((status = response->body->read(chunk)) == BodyStream::ReadStatus::Chunk) {
    }
    EXPECT_EQ(status, BodyStream::ReadStatus::Failed);
}

TEST(HttpTransportTest, MissingHeadIsFailure) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Le"});
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    EXPECT_FALSE(transport.send(request).has_value());
}

TEST(HttpTransportTest, UnknownContentEncodingIsFailure) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Encoding: br\r\nContent-Length: 2\r\n\r\nxx"});
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    EXPECT_FALSE(transport.send(request).has_value());
}

// ---------------------------------------------------------------------------
// 7. Streaming: the head is returned before the body arrives
// ---------------------------------------------------------------------------
TEST(HttpTransportTest, HeadReturnsBeforeDelayedBody) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nlate"},
                          std::chrono::milliseconds(800));
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    auto started = std::chrono::steady_clock::now();
    auto response = transport.send(request);
    auto head_after = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 200);
    EXPECT_EQ(response->headers.get("content-length"), "4");
    EXPECT_LT(head_after, std::chrono::milliseconds(500));

    EXPECT_EQ(read_all(*response->body), "late");
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(700));
}

TEST(HttpTransportTest, DelayedChunkedGzipBodyStreams) {
    const std::string compressed = gzip("streamed and compressed");
    std::string framed;
    char size_line[16];
    std::snprintf(size_line, sizeof(size_line), "%zx\r\n", compressed.size());
    framed = size_line + compressed + "\r\n0\r\n\r\n";

    LoopbackServer server({"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n"
                           "Content-Encoding: gzip\r\n\r\n" + framed},
                          std::chrono::milliseconds(300));
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(read_all(*response->body), "streamed and compressed");
}

TEST(HttpTransportTest, ChunkSequenceNumbersIncrease) {
    std::string body(3 * 8192, 'x');
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) +
                           "\r\n\r\n" + body});
    HttpTransport transport;

    TransportRequest request;
    request.url = server.url("/");
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());

    size_t total = 0;
    size_t expected_sequence = 0;
    BodyChunk chunk;
    while (response->body->read(chunk) == BodyStream::ReadStatus::Chunk) {
        EXPECT_EQ(chunk.sequence, expected_sequence++);
        total += chunk.bytes.size();
    }
    EXPECT_EQ(total, body.size());
    EXPECT_GE(expected_sequence, 1u);
}

// ---------------------------------------------------------------------------
// 8. TLS to an IP address
// ---------------------------------------------------------------------------
TEST(HttpTransportTest, TlsVerifiesIpAddressHost) {
    TestCertificate certificate("127.0.0.1");
    TlsLoopbackServer server(certificate, "HTTP/1.1 200 OK\r\nContent-Length: 6\r\n\r\nsecure");
    HttpTransport transport;
    transport.set_timeout(std::chrono::milliseconds(5000));
    transport.set_ca_file(certificate.pem_path());

    TransportRequest request;
    request.url = server.url("/");
    auto response = transport.send(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 200);
    EXPECT_EQ(read_all(*response->body), "secure");
}

TEST(HttpTransportTest, TlsRejectsCertificateForOtherAddress) {
    TestCertificate certificate("127.0.0.2");
    TlsLoopbackServer server(certificate, "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    HttpTransport transport;
    transport.set_timeout(std::chrono::milliseconds(5000));
    transport.set_ca_file(certificate.pem_path());

    TransportRequest request;
    request.url = server.url("/");
    EXPECT_FALSE(transport.send(request).has_value());
    EXPECT_FALSE(server.served());
}

TEST(HttpTransportTest, TimeoutIsConfigurable) {
    HttpTransport transport;
    EXPECT_EQ(transport.timeout(), std::chrono::milliseconds(30000));
    transport.set_timeout(std::chrono::milliseconds(250));
    EXPECT_EQ(transport.timeout(), std::chrono::milliseconds(250));
}
