#include <courier/fetch/request.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace courier::fetch {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool is_potentially_trustworthy(const url::URL& url) {
    if (url.scheme == "https" || url.scheme == "wss" || url.scheme == "file" ||
        url.scheme == "data" || url.scheme == "about") {
        return true;
    }
    return url.host == "localhost" || url.host == "127.0.0.1" || url.host == "[::1]";
}

// Strips credentials and fragment; origin_only also drops path and query.
url::URL strip_for_referrer(url::URL url, bool origin_only) {
    url.username.clear();
    url.password.clear();
    url.fragment.clear();
    if (origin_only) {
        url.path = "/";
        url.query.clear();
    }
    return url;
}

} // anonymous namespace

const char* referrer_policy_name(ReferrerPolicy policy) {
    switch (policy) {
        case ReferrerPolicy::NoReferrer: return "no-referrer";
        case ReferrerPolicy::NoReferrerWhenDowngrade: return "no-referrer-when-downgrade";
        case ReferrerPolicy::Origin: return "origin";
        case ReferrerPolicy::OriginWhenCrossOrigin: return "origin-when-cross-origin";
        case ReferrerPolicy::SameOrigin: return "same-origin";
        case ReferrerPolicy::StrictOrigin: return "strict-origin";
        case ReferrerPolicy::StrictOriginWhenCrossOrigin: return "strict-origin-when-cross-origin";
        case ReferrerPolicy::UnsafeUrl: return "unsafe-url";
    }
    return "no-referrer-when-downgrade";
}

std::optional<ReferrerPolicy> parse_referrer_policy(const std::string& token) {
    static constexpr ReferrerPolicy kAll[] = {
        ReferrerPolicy::NoReferrer,
        ReferrerPolicy::NoReferrerWhenDowngrade,
        ReferrerPolicy::Origin,
        ReferrerPolicy::OriginWhenCrossOrigin,
        ReferrerPolicy::SameOrigin,
        ReferrerPolicy::StrictOrigin,
        ReferrerPolicy::StrictOriginWhenCrossOrigin,
        ReferrerPolicy::UnsafeUrl,
    };
    std::string lower = to_lower(token);
    for (auto policy : kAll) {
        if (lower == referrer_policy_name(policy)) {
            return policy;
        }
    }
    return std::nullopt;
}

Referrer Referrer::none() {
    return Referrer{Kind::NoReferrer, std::nullopt};
}

Referrer Referrer::client() {
    return Referrer{Kind::Client, std::nullopt};
}

Referrer Referrer::from_url(url::URL url) {
    return Referrer{Kind::Url, std::move(url)};
}

Request::Request(url::URL url, std::optional<url::Origin> origin,
                 std::optional<uint64_t> pipeline_id)
    : origin(origin.has_value() ? std::move(*origin) : url::Origin::opaque()),
      pipeline_id(pipeline_id) {
    url_list.push_back(std::move(url));
}

bool Request::is_same_origin() const {
    if (origin.is_opaque()) {
        return false;
    }
    return current_url().origin() == origin;
}

bool Request::includes_credentials() const {
    switch (credentials_mode) {
        case CredentialsMode::Include: return true;
        case CredentialsMode::SameOrigin: return response_tainting == ResponseTainting::Basic;
        case CredentialsMode::Omit: return false;
    }
    return false;
}

std::optional<std::string> compute_referrer(const Request& request) {
    if (request.referrer.kind != Referrer::Kind::Url || !request.referrer.url.has_value()) {
        return std::nullopt;
    }

    const url::URL& source = *request.referrer.url;
    if (source.scheme != "http" && source.scheme != "https") {
        return std::nullopt;
    }

    const url::URL& target = request.current_url();
    const bool same_origin = source.origin() == target.origin();
    const bool downgrade = is_potentially_trustworthy(source) && !is_potentially_trustworthy(target);
    const std::string full = strip_for_referrer(source, false).serialize();
    const std::string origin_only = strip_for_referrer(source, true).serialize();

    switch (request.referrer_policy.value_or(ReferrerPolicy::NoReferrerWhenDowngrade)) {
        case ReferrerPolicy::NoReferrer:
            return std::nullopt;
        case ReferrerPolicy::NoReferrerWhenDowngrade:
            if (downgrade) return std::nullopt;
            return full;
        case ReferrerPolicy::Origin:
            return origin_only;
        case ReferrerPolicy::OriginWhenCrossOrigin:
            return same_origin ? full : origin_only;
        case ReferrerPolicy::SameOrigin:
            if (!same_origin) return std::nullopt;
            return full;
        case ReferrerPolicy::StrictOrigin:
            if (downgrade) return std::nullopt;
            return origin_only;
        case ReferrerPolicy::StrictOriginWhenCrossOrigin:
            if (same_origin) return full;
            if (downgrade) return std::nullopt;
            return origin_only;
        case ReferrerPolicy::UnsafeUrl:
            return full;
    }
    return std::nullopt;
}

const char* default_accept_for(Destination destination) {
    switch (destination) {
        case Destination::Document:
        case Destination::Frame:
            return "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
        case Destination::Image:
            return "image/png,image/svg+xml,image/*;q=0.8,*/*;q=0.5";
        case Destination::Style:
            return "text/css,*/*;q=0.1";
        case Destination::Script:
        case Destination::Media:
        case Destination::Font:
        case Destination::None:
            return "*/*";
    }
    return "*/*";
}

} // namespace courier::fetch
