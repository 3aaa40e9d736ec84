#include <courier/url/url.h>

#include <atomic>
#include <string>

namespace courier::url {

namespace {

std::uint64_t next_opaque_id() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Origin
// ---------------------------------------------------------------------------

Origin::Origin() : opaque_(true), id_(next_opaque_id()) {}

Origin Origin::opaque() {
    return Origin();
}

Origin Origin::tuple(std::string scheme, std::string host, std::optional<uint16_t> port) {
    Origin origin;
    origin.opaque_ = false;
    origin.id_ = 0;
    origin.scheme_ = std::move(scheme);
    origin.host_ = std::move(host);
    origin.port_ = port;
    return origin;
}

std::string Origin::serialize() const {
    if (opaque_) {
        return "null";
    }

    std::string result = scheme_ + "://" + host_;
    if (port_.has_value()) {
        result += ':';
        result += std::to_string(port_.value());
    }
    return result;
}

std::string Origin::identity() const {
    if (opaque_) {
        return "opaque#" + std::to_string(id_);
    }
    return serialize();
}

bool Origin::operator==(const Origin& other) const {
    if (opaque_ || other.opaque_) {
        return opaque_ && other.opaque_ && id_ == other.id_;
    }
    return scheme_ == other.scheme_ && host_ == other.host_ && port_ == other.port_;
}

// ---------------------------------------------------------------------------
// URL
// ---------------------------------------------------------------------------

bool is_special_scheme(std::string_view scheme) {
    return scheme == "http" || scheme == "https" ||
           scheme == "ftp" || scheme == "ws" ||
           scheme == "wss" || scheme == "file";
}

std::optional<uint16_t> default_port_for_scheme(std::string_view scheme) {
    if (scheme == "http")  return 80;
    if (scheme == "https") return 443;
    if (scheme == "ftp")   return 21;
    if (scheme == "ws")    return 80;
    if (scheme == "wss")   return 443;
    return std::nullopt;
}

bool URL::is_special() const {
    return is_special_scheme(scheme);
}

bool URL::has_credentials() const {
    return !username.empty() || !password.empty();
}

uint16_t URL::effective_port() const {
    if (port.has_value()) {
        return port.value();
    }
    return default_port_for_scheme(scheme).value_or(0);
}

std::string URL::serialize() const {
    std::string result;
    result += scheme;
    result += ':';

    if (!host.empty() || scheme == "file") {
        result += "//";

        if (has_credentials()) {
            result += username;
            if (!password.empty()) {
                result += ':';
                result += password;
            }
            result += '@';
        }

        result += host;

        if (port.has_value()) {
            result += ':';
            result += std::to_string(port.value());
        }
    }

    result += path;

    if (!query.empty()) {
        result += '?';
        result += query;
    }

    if (!fragment.empty()) {
        result += '#';
        result += fragment;
    }

    return result;
}

Origin URL::origin() const {
    // blob: URLs inherit the origin of the URL they wrap.
    if (scheme == "blob") {
        if (auto inner = parse(path); inner.has_value() &&
            (inner->scheme == "http" || inner->scheme == "https")) {
            return inner->origin();
        }
        return Origin::opaque();
    }

    if (scheme == "file" || !is_special()) {
        return Origin::opaque();
    }

    return Origin::tuple(scheme, host, port);
}

std::optional<URL> URL::join(std::string_view reference) const {
    return parse(reference, this);
}

} // namespace courier::url
