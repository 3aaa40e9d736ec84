#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace courier::url {

// An origin is either opaque (unique, serialises as "null") or a
// (scheme, host, port) tuple. Copies of an opaque origin compare equal.
class Origin {
public:
    Origin();

    static Origin opaque();
    static Origin tuple(std::string scheme, std::string host, std::optional<uint16_t> port);

    bool is_opaque() const { return opaque_; }
    const std::string& scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    std::optional<uint16_t> port() const { return port_; }

    // ASCII serialization, "null" for opaque origins.
    std::string serialize() const;

    // Unique key: the serialization for tuple origins, "opaque#<id>" otherwise.
    std::string identity() const;

    bool operator==(const Origin& other) const;
    bool operator!=(const Origin& other) const { return !(*this == other); }

private:
    bool opaque_ = true;
    std::uint64_t id_ = 0;
    std::string scheme_;
    std::string host_;
    std::optional<uint16_t> port_;
};

struct URL {
    std::string scheme;
    std::string username;
    std::string password;
    std::string host;
    std::optional<uint16_t> port;
    std::string path;
    std::string query;
    std::string fragment;
    // about:blank, data:... and friends carry an opaque path and cannot be a base.
    bool opaque_path = false;

    std::string serialize() const;
    Origin origin() const;
    bool is_special() const;
    bool has_credentials() const;
    uint16_t effective_port() const;

    // Resolve a possibly relative reference against this URL.
    std::optional<URL> join(std::string_view reference) const;

    bool operator==(const URL& other) const { return serialize() == other.serialize(); }
    bool operator!=(const URL& other) const { return !(*this == other); }
};

std::optional<URL> parse(std::string_view input, const URL* base = nullptr);
bool is_special_scheme(std::string_view scheme);
std::optional<uint16_t> default_port_for_scheme(std::string_view scheme);

} // namespace courier::url
