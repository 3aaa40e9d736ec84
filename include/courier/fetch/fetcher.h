#pragma once
#include <courier/core/config.h>
#include <courier/core/diagnostics.h>
#include <courier/fetch/cors_cache.h>
#include <courier/fetch/devtools.h>
#include <courier/fetch/fetch_target.h>
#include <courier/fetch/request.h>
#include <courier/fetch/response.h>
#include <courier/net/transport.h>
#include <courier/platform/thread_pool.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace courier::fetch {

struct FetchContext {
    std::string user_agent = core::config::kDefaultUserAgent;
    // Receives one request and one response record per fetch that hit the network.
    std::shared_ptr<DevtoolsChannel> devtools;
    std::shared_ptr<core::DiagnosticEmitter> diagnostics;
};

// Runs the fetch algorithm: scheme dispatch, CORS and preflight, redirects,
// response filtering and streaming delivery. Failures are reported as
// network-error responses, never thrown.
class Fetcher {
public:
    explicit Fetcher(FetchContext context = {},
                     size_t worker_threads = core::config::kFetchWorkerThreads);
    ~Fetcher();

    Fetcher(const Fetcher&) = delete;
    Fetcher& operator=(const Fetcher&) = delete;

    // http and https are served by net::HttpTransport unless replaced here.
    // A null transport unregisters the scheme.
    void register_transport(const std::string& scheme, std::shared_ptr<net::Transport> transport);
    std::shared_ptr<net::Transport> transport_for(const std::string& scheme) const;

    // Runs on the calling thread with the fetcher's own preflight cache.
    Response fetch(Request& request, FetchTarget* target = nullptr);
    Response fetch_with_cors_cache(Request& request, CorsCache& cache, FetchTarget* target = nullptr);

    // Runs on a worker; the target's callbacks are made from that worker.
    void fetch_async(Request request, std::shared_ptr<FetchTarget> target);
    // fetch_async plus a wait for process_response_eof. Not for use on a fetch worker.
    Response fetch_sync(Request request);

    // Blocks until every fetch_async call has delivered its eof.
    void wait_idle();

    CorsCache& cors_cache() { return cors_cache_; }
    const FetchContext& context() const { return context_; }

private:
    void log(core::Severity severity, const std::string& stage,
             const std::string& message, uint64_t correlation_id) const;

    FetchContext context_;
    CorsCache cors_cache_;
    mutable std::mutex transports_mutex_;
    std::map<std::string, std::shared_ptr<net::Transport>> transports_;
    std::atomic<uint64_t> next_correlation_id_{1};
    // Last member: joined first, while everything the workers touch is alive.
    platform::ThreadPool pool_;
};

} // namespace courier::fetch
