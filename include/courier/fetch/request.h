#pragma once
#include <courier/net/header_map.h>
#include <courier/url/url.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace courier::fetch {

enum class Destination {
    None,
    Document,
    Frame,
    Image,
    Media,
    Script,
    Style,
    Font,
};

enum class RequestMode {
    Navigate,
    SameOrigin,
    NoCors,
    Cors,
};

enum class CredentialsMode {
    Omit,
    SameOrigin,
    Include,
};

enum class RedirectMode {
    Follow,
    Error,
    Manual,
};

enum class ResponseTainting {
    Basic,
    Cors,
    Opaque,
};

enum class ReferrerPolicy {
    NoReferrer,
    NoReferrerWhenDowngrade,
    Origin,
    OriginWhenCrossOrigin,
    SameOrigin,
    StrictOrigin,
    StrictOriginWhenCrossOrigin,
    UnsafeUrl,
};

const char* referrer_policy_name(ReferrerPolicy policy);
std::optional<ReferrerPolicy> parse_referrer_policy(const std::string& token);

struct Referrer {
    enum class Kind {
        NoReferrer,
        Client,
        Url,
    };

    Kind kind = Kind::Client;
    std::optional<url::URL> url;

    static Referrer none();
    static Referrer client();
    static Referrer from_url(url::URL url);
};

// One fetch's parameters. The fetcher rewrites method, body, origin,
// response_tainting and url_list between redirect hops; everything else is
// left as the caller set it.
struct Request {
    // A missing origin becomes a fresh opaque origin.
    explicit Request(url::URL url,
                     std::optional<url::Origin> origin = std::nullopt,
                     std::optional<uint64_t> pipeline_id = std::nullopt);

    std::string method = "GET";
    net::HeaderMap headers;
    std::optional<std::vector<uint8_t>> body;

    url::Origin origin;
    std::optional<uint64_t> pipeline_id;
    Destination destination = Destination::None;

    Referrer referrer;
    std::optional<ReferrerPolicy> referrer_policy;

    RequestMode mode = RequestMode::NoCors;
    CredentialsMode credentials_mode = CredentialsMode::Omit;
    RedirectMode redirect_mode = RedirectMode::Follow;
    ResponseTainting response_tainting = ResponseTainting::Basic;
    bool use_cors_preflight = false;
    bool local_urls_only = false;

    // Every URL visited so far; never empty, the last entry is the current URL.
    std::vector<url::URL> url_list;

    const url::URL& current_url() const { return url_list.back(); }
    std::size_t redirect_count() const { return url_list.size() - 1; }

    // True when the request's origin and current URL are the same origin.
    bool is_same_origin() const;
    bool includes_credentials() const;
};

// Value for the Referer header of the next hop, nullopt when none is sent.
// Client referrers resolve to no referrer.
std::optional<std::string> compute_referrer(const Request& request);

// Accept header used when the caller did not set one.
const char* default_accept_for(Destination destination);

} // namespace courier::fetch
