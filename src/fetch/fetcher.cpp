#include <courier/fetch/cors.h>
#include <courier/fetch/fetcher.h>
#include <courier/fetch/scheme_fetch.h>
#include <courier/net/http_message.h>
#include <courier/net/http_transport.h>
#include <courier/net/method.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace courier::fetch {

namespace {

constexpr const char kModule[] = "fetch";

bool is_redirect_status(uint16_t status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

bool is_null_body_status(uint16_t status) {
    return status == 101 || status == 204 || status == 205 || status == 304;
}

bool is_http_scheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ",";
        joined += name;
    }
    return joined;
}

void drain(net::BodyStream* stream) {
    if (stream == nullptr) {
        return;
    }
    net::BodyChunk chunk;
    while (stream->read(chunk) == net::BodyStream::ReadStatus::Chunk) {
    }
}

// A response from one hop, before filtering. The body bytes are still in
// the stream.
struct HopResult {
    Response response;
    std::unique_ptr<net::BodyStream> stream;
};

HopResult error_hop(std::string reason) {
    return HopResult{Response::network_error(std::move(reason)), nullptr};
}

// One top-level fetch. Owns the per-fetch state the redirect loop carries.
class FetchRun {
public:
    FetchRun(const Fetcher& fetcher, Request& request, CorsCache& cache,
             FetchTarget* target, uint64_t correlation_id)
        : fetcher_(fetcher),
          request_(request),
          cache_(cache),
          target_(target),
          cid_(correlation_id) {}

    // An exception from a target callback ends the fetch as a network
    // error. process_response_eof is delivered at most once.
    Response run();

private:
    Response run_hops();
    void deliver_eof(const Response& response);
    HopResult dispatch();
    HopResult http_fetch(bool cors_flag, bool preflight_flag);
    HopResult network_fetch();
    std::optional<Response> cors_preflight();
    std::optional<Response> follow_redirect(uint16_t status, const std::string& location);

    net::HeaderMap hop_headers() const;
    void deliver_body(const Response& unfiltered, const Response& view,
                      std::unique_ptr<net::BodyStream> stream);
    void emit_devtools();

    void log(core::Severity severity, const std::string& stage, const std::string& message) const {
        if (fetcher_.context().diagnostics) {
            fetcher_.context().diagnostics->emit(severity, kModule, stage, message, cid_);
        }
    }

    const Fetcher& fetcher_;
    Request& request_;
    CorsCache& cache_;
    FetchTarget* target_;
    uint64_t cid_;

    bool hop_used_cors_ = false;
    bool eof_delivered_ = false;
    std::optional<HttpRequestRecord> request_record_;
    std::optional<HttpResponseRecord> response_record_;
};

Response FetchRun::run() {
    try {
        return run_hops();
    } catch (const std::exception& e) {
        log(core::Severity::Error, "abort", e.what());
        Response error = Response::network_error(e.what());
        deliver_eof(error);
        return error;
    }
}

void FetchRun::deliver_eof(const Response& response) {
    if (!target_ || eof_delivered_) {
        return;
    }
    eof_delivered_ = true;
    target_->process_response_eof(response);
}

Response FetchRun::run_hops() {
    if (request_.url_list.empty()) {
        log(core::Severity::Error, "start", "request has no URL");
        Response error = Response::network_error("request has no URL");
        deliver_eof(error);
        return error;
    }

    log(core::Severity::Info, "start",
        request_.method + " " + request_.current_url().serialize());

    if (target_) {
        target_->process_request_body(request_);
        target_->process_request_eof(request_);
    }

    if (!request_.referrer_policy.has_value()) {
        request_.referrer_policy = ReferrerPolicy::NoReferrerWhenDowngrade;
    }

    HopResult terminal;
    bool manual_redirect = false;
    while (true) {
        HopResult hop = dispatch();
        if (hop.response.is_network_error() || !hop.response.status.has_value()) {
            terminal = std::move(hop);
            break;
        }

        const uint16_t status = hop.response.status->code;
        auto location = hop.response.headers.get("location");
        if (!is_redirect_status(status) || !location.has_value() ||
            !is_http_scheme(request_.current_url().scheme)) {
            terminal = std::move(hop);
            break;
        }

        if (request_.redirect_mode == RedirectMode::Error) {
            drain(hop.stream.get());
            terminal = error_hop("redirect received with redirect mode error");
            break;
        }
        if (request_.redirect_mode == RedirectMode::Manual) {
            manual_redirect = true;
            terminal = std::move(hop);
            break;
        }

        drain(hop.stream.get());
        if (auto failure = follow_redirect(status, *location)) {
            terminal = HopResult{std::move(*failure), nullptr};
            break;
        }
    }

    Response unfiltered = std::move(terminal.response);
    Response result;
    if (unfiltered.is_network_error()) {
        log(core::Severity::Warning, "network-error", unfiltered.termination_reason);
        result = unfiltered;
    } else {
        ResponseType filter = ResponseType::Basic;
        if (manual_redirect) {
            filter = ResponseType::OpaqueRedirect;
        } else if (request_.response_tainting == ResponseTainting::Cors) {
            filter = ResponseType::Cors;
        } else if (request_.response_tainting == ResponseTainting::Opaque) {
            filter = ResponseType::Opaque;
        }
        result = unfiltered.to_filtered(filter,
                                        request_.credentials_mode == CredentialsMode::Include);
    }

    emit_devtools();

    if (target_) {
        target_->process_response(result);
    }
    if (!unfiltered.is_network_error()) {
        deliver_body(unfiltered, result, std::move(terminal.stream));
    }
    deliver_eof(result);

    log(core::Severity::Info, "done",
        std::string(response_type_name(result.type)) + " response after " +
        std::to_string(request_.redirect_count()) + " redirect(s)");
    return result;
}

HopResult FetchRun::dispatch() {
    const url::URL& url = request_.current_url();
    hop_used_cors_ = false;

    if (request_.local_urls_only && !is_local_scheme(url.scheme)) {
        return error_hop("non-local URL " + url.serialize() + " with local_urls_only set");
    }

    if (is_scheme_fetched_locally(url.scheme)) {
        log(core::Severity::Info, "scheme", url.scheme + ": resolved locally");
        return HopResult{scheme_fetch(request_), nullptr};
    }

    if (!is_http_scheme(url.scheme)) {
        return error_hop("unsupported scheme " + url.scheme);
    }

    if ((request_.is_same_origin() && request_.response_tainting == ResponseTainting::Basic) ||
        request_.mode == RequestMode::Navigate) {
        request_.response_tainting = ResponseTainting::Basic;
        return http_fetch(false, false);
    }

    if (request_.mode == RequestMode::SameOrigin) {
        return error_hop("cross-origin request in same-origin mode");
    }

    if (request_.mode == RequestMode::NoCors) {
        if (request_.redirect_mode != RedirectMode::Follow) {
            return error_hop("cross-origin no-cors request must follow redirects");
        }
        request_.response_tainting = ResponseTainting::Opaque;
        return http_fetch(false, false);
    }

    request_.response_tainting = ResponseTainting::Cors;
    bool preflight = request_.use_cors_preflight ||
                     !net::is_cors_safelisted_method(request_.method) ||
                     !cors::unsafe_request_header_names(request_.headers).empty();
    return http_fetch(true, preflight);
}

HopResult FetchRun::http_fetch(bool cors_flag, bool preflight_flag) {
    hop_used_cors_ = cors_flag;

    if (preflight_flag) {
        bool needs_preflight = false;
        if (!cache_.match_method(request_, request_.method) &&
            (!net::is_cors_safelisted_method(request_.method) || request_.use_cors_preflight)) {
            needs_preflight = true;
        }
        for (const auto& name : cors::unsafe_request_header_names(request_.headers)) {
            if (!cache_.match_header(request_, name)) {
                needs_preflight = true;
            }
        }

        if (needs_preflight) {
            if (auto failure = cors_preflight()) {
                return HopResult{std::move(*failure), nullptr};
            }
        } else {
            log(core::Severity::Info, "preflight", "authorized by preflight cache");
        }
    }

    HopResult hop = network_fetch();
    if (hop.response.is_network_error()) {
        if (preflight_flag) {
            cache_.remove(request_);
        }
        return hop;
    }

    if (cors_flag && !cors::cors_check(request_, hop.response.headers)) {
        drain(hop.stream.get());
        return error_hop("CORS check failed for " + request_.current_url().serialize());
    }
    return hop;
}

HopResult FetchRun::network_fetch() {
    const url::URL& url = request_.current_url();
    auto transport = fetcher_.transport_for(url.scheme);
    if (!transport) {
        return error_hop("no transport for scheme " + url.scheme);
    }

    net::TransportRequest outgoing;
    outgoing.method = request_.method;
    outgoing.url = url;
    outgoing.headers = hop_headers();
    outgoing.body = request_.body;

    auto started = std::chrono::system_clock::now();
    auto steady_start = std::chrono::steady_clock::now();
    auto received = transport->send(outgoing);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - steady_start);

    if (!received.has_value()) {
        return error_hop("transport failed for " + url.serialize());
    }

    Response response;
    response.status = HttpStatus{received->status, received->reason};
    response.headers = std::move(received->headers);
    response.url_list = request_.url_list;

    if (fetcher_.context().devtools) {
        HttpRequestRecord record;
        record.url = url;
        record.method = outgoing.method;
        record.headers.set("Host", net::host_header_value(url));
        for (const auto& [name, value] : outgoing.headers) {
            record.headers.append(name, value);
        }
        record.body = outgoing.body;
        record.pipeline_id = request_.pipeline_id;
        record.started_date_time = started;
        record.time_stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            started.time_since_epoch()).count();
        record.connect_time = static_cast<uint64_t>(elapsed.count());
        record.send_time = static_cast<uint64_t>(elapsed.count());
        record.is_xhr = request_.destination == Destination::None;
        request_record_ = std::move(record);

        HttpResponseRecord response_record;
        net::HeaderMap headers = response.headers;
        headers.remove("date");
        response_record.headers = std::move(headers);
        response_record.status = response.status;
        response_record.pipeline_id = request_.pipeline_id;
        response_record_ = std::move(response_record);
    }

    return HopResult{std::move(response), std::move(received->body)};
}

std::optional<Response> FetchRun::cors_preflight() {
    const url::URL& url = request_.current_url();
    auto transport = fetcher_.transport_for(url.scheme);
    if (!transport) {
        return Response::network_error("no transport for scheme " + url.scheme);
    }

    auto unsafe_names = cors::unsafe_request_header_names(request_.headers);

    net::TransportRequest preflight;
    preflight.method = net::method::OPTIONS;
    preflight.url = url;
    preflight.headers.set("Accept", "*/*");
    preflight.headers.set("Access-Control-Request-Method", request_.method);
    // Always present, empty when no author header needs authorizing.
    preflight.headers.set("Access-Control-Request-Headers", join_names(unsafe_names));
    preflight.headers.set("Origin", request_.origin.serialize());
    preflight.headers.set("User-Agent", fetcher_.context().user_agent);
    if (auto referrer = compute_referrer(request_)) {
        preflight.headers.set("Referer", *referrer);
    }

    log(core::Severity::Info, "preflight", "OPTIONS " + url.serialize());
    auto received = transport->send(preflight);
    if (!received.has_value()) {
        return Response::network_error("preflight transport failed for " + url.serialize());
    }
    drain(received->body.get());

    if (!cors::cors_check(request_, received->headers) ||
        received->status < 200 || received->status > 299) {
        return Response::network_error("preflight rejected with status " +
                                       std::to_string(received->status));
    }

    std::vector<std::string> methods;
    if (auto allowed = received->headers.get_combined("access-control-allow-methods")) {
        methods = net::split_header_list(*allowed);
    }
    std::vector<std::string> header_names;
    if (auto allowed = received->headers.get_combined("access-control-allow-headers")) {
        for (auto& name : net::split_header_list(*allowed)) {
            header_names.push_back(net::HeaderMap::normalize_name(name));
        }
    }

    if (methods.empty() && request_.use_cors_preflight) {
        methods.push_back(request_.method);
    }

    const bool credentials = request_.credentials_mode == CredentialsMode::Include;
    if (!contains(methods, request_.method) &&
        !net::is_cors_safelisted_method(request_.method) &&
        (credentials || !contains(methods, "*"))) {
        return Response::network_error("method " + request_.method + " not allowed by preflight");
    }

    for (const auto& name : unsafe_names) {
        if (!contains(header_names, name) && (credentials || !contains(header_names, "*"))) {
            return Response::network_error("header " + name + " not allowed by preflight");
        }
    }

    auto max_age = cors::parse_max_age(received->headers);
    if (max_age.has_value() && *max_age > 0) {
        cache_.insert(request_, *max_age, methods, header_names);
    }

    log(core::Severity::Info, "preflight", "authorized " + request_.method);
    return std::nullopt;
}

std::optional<Response> FetchRun::follow_redirect(uint16_t status, const std::string& location) {
    const url::URL current = request_.current_url();
    auto next = current.join(location);
    if (!next.has_value()) {
        return Response::network_error("invalid Location: " + location);
    }
    if (!is_http_scheme(next->scheme)) {
        return Response::network_error("redirect to non-HTTP(S) URL " + next->serialize());
    }
    if (request_.redirect_count() >= core::config::kMaxRedirects) {
        return Response::network_error("too many redirects");
    }

    const bool cross_origin = next->origin() != current.origin();
    if (request_.mode == RequestMode::Cors && next->has_credentials() && cross_origin) {
        return Response::network_error("cross-origin redirect to URL with credentials");
    }
    if (request_.response_tainting == ResponseTainting::Cors && next->has_credentials()) {
        return Response::network_error("CORS redirect to URL with credentials");
    }
    if (hop_used_cors_ && cross_origin) {
        request_.origin = url::Origin::opaque();
    }

    if (((status == 301 || status == 302) && request_.method == net::method::POST) ||
        status == 303) {
        request_.method = net::method::GET;
        request_.body.reset();
        for (const char* name : {"content-encoding", "content-language",
                                 "content-location", "content-type", "content-length"}) {
            request_.headers.remove(name);
        }
    }

    request_.url_list.push_back(*next);
    log(core::Severity::Info, "redirect",
        std::to_string(status) + " " + current.serialize() + " -> " + next->serialize());
    return std::nullopt;
}

net::HeaderMap FetchRun::hop_headers() const {
    net::HeaderMap headers = request_.headers;

    if (!headers.has("user-agent")) {
        headers.set("User-Agent", fetcher_.context().user_agent);
    }
    if (!headers.has("accept")) {
        headers.set("Accept", default_accept_for(request_.destination));
    }
    if (!headers.has("accept-language")) {
        headers.set("Accept-Language", core::config::kDefaultAcceptLanguage);
    }
    if (!headers.has("accept-encoding")) {
        headers.set("Accept-Encoding", core::config::kDefaultAcceptEncoding);
    }

    const bool unsafe_method = request_.method != net::method::GET &&
                               request_.method != net::method::HEAD;
    if (request_.response_tainting == ResponseTainting::Cors || unsafe_method) {
        headers.set("Origin", request_.origin.serialize());
    }

    if (auto referrer = compute_referrer(request_)) {
        headers.set("Referer", *referrer);
    }

    if (!request_.body.has_value() && !headers.has("content-length") &&
        (request_.method == net::method::POST || request_.method == net::method::PUT)) {
        headers.set("Content-Length", "0");
    }
    return headers;
}

void FetchRun::deliver_body(const Response& unfiltered, const Response& view,
                            std::unique_ptr<net::BodyStream> stream) {
    const bool expose = view.type == ResponseType::Basic || view.type == ResponseType::Cors ||
                        view.type == ResponseType::Default;
    auto& body = unfiltered.body;

    if (body->is_done()) {
        if (expose && target_ && body->size() > 0) {
            target_->process_response_chunk(body->bytes());
        }
        return;
    }

    const bool bodiless = request_.method == net::method::HEAD ||
                          (unfiltered.status.has_value() &&
                           is_null_body_status(unfiltered.status->code));
    if (!stream || bodiless) {
        drain(stream.get());
        body->finish();
        return;
    }

    // The transport may hand chunks over out of order; re-serialize by sequence.
    std::map<std::size_t, std::vector<uint8_t>> pending;
    std::size_t next_sequence = 0;
    auto emit = [&](const std::vector<uint8_t>& bytes) {
        body->append(bytes);
        if (expose && target_) {
            target_->process_response_chunk(bytes);
        }
    };

    while (true) {
        net::BodyChunk chunk;
        auto status = stream->read(chunk);
        if (status == net::BodyStream::ReadStatus::End) {
            break;
        }
        if (status == net::BodyStream::ReadStatus::Failed) {
            log(core::Severity::Warning, "body", "body stream failed after " +
                std::to_string(body->size()) + " bytes");
            break;
        }

        pending.emplace(chunk.sequence, std::move(chunk.bytes));
        for (auto it = pending.find(next_sequence); it != pending.end();
             it = pending.find(next_sequence)) {
            emit(it->second);
            pending.erase(it);
            ++next_sequence;
        }
    }

    if (!pending.empty()) {
        log(core::Severity::Warning, "body",
            std::to_string(pending.size()) + " chunk(s) arrived after a gap");
        for (const auto& [sequence, bytes] : pending) {
            emit(bytes);
        }
    }
    body->finish();
}

void FetchRun::emit_devtools() {
    auto channel = fetcher_.context().devtools;
    if (!channel || !request_record_.has_value() || !response_record_.has_value()) {
        return;
    }
    channel->send(std::move(*request_record_));
    channel->send(std::move(*response_record_));
    request_record_.reset();
    response_record_.reset();
}

} // anonymous namespace

Fetcher::Fetcher(FetchContext context, size_t worker_threads)
    : context_(std::move(context)), pool_(worker_threads) {
    auto http = std::make_shared<net::HttpTransport>();
    transports_["http"] = http;
    transports_["https"] = http;
}

Fetcher::~Fetcher() {
    pool_.shutdown();
}

void Fetcher::register_transport(const std::string& scheme,
                                 std::shared_ptr<net::Transport> transport) {
    std::lock_guard lock(transports_mutex_);
    if (transport) {
        transports_[scheme] = std::move(transport);
    } else {
        transports_.erase(scheme);
    }
}

std::shared_ptr<net::Transport> Fetcher::transport_for(const std::string& scheme) const {
    std::lock_guard lock(transports_mutex_);
    auto it = transports_.find(scheme);
    if (it == transports_.end()) {
        return nullptr;
    }
    return it->second;
}

Response Fetcher::fetch(Request& request, FetchTarget* target) {
    return fetch_with_cors_cache(request, cors_cache_, target);
}

Response Fetcher::fetch_with_cors_cache(Request& request, CorsCache& cache, FetchTarget* target) {
    FetchRun run(*this, request, cache, target, next_correlation_id_++);
    return run.run();
}

void Fetcher::fetch_async(Request request, std::shared_ptr<FetchTarget> target) {
    auto shared_request = std::make_shared<Request>(std::move(request));
    pool_.post([this, shared_request, target]() {
        try {
            fetch(*shared_request, target.get());
        } catch (const std::exception& e) {
            // Only a throwing process_response_eof gets this far.
            log(core::Severity::Error, "async", e.what(), 0);
        }
    });
}

Response Fetcher::fetch_sync(Request request) {
    auto collector = std::make_shared<ResponseCollector>();
    fetch_async(std::move(request), collector);
    return collector->wait();
}

void Fetcher::wait_idle() {
    pool_.wait_idle();
}

void Fetcher::log(core::Severity severity, const std::string& stage,
                  const std::string& message, uint64_t correlation_id) const {
    if (context_.diagnostics) {
        context_.diagnostics->emit(severity, kModule, stage, message, correlation_id);
    }
}

} // namespace courier::fetch
