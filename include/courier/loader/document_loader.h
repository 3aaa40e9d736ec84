#pragma once
#include <courier/core/diagnostics.h>
#include <courier/fetch/fetch_target.h>
#include <courier/fetch/fetcher.h>
#include <courier/fetch/request.h>
#include <courier/url/url.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace courier::loader {

enum class LoadKind {
    Image,
    Script,
    Subframe,
    Stylesheet,
    PageSource,
    Media,
};

const char* load_kind_name(LoadKind kind);
fetch::Destination destination_for(LoadKind kind);

struct LoadType {
    LoadKind kind = LoadKind::PageSource;
    url::URL url;

    bool operator==(const LoadType& other) const {
        return kind == other.kind && url == other.url;
    }
    bool operator!=(const LoadType& other) const { return !(*this == other); }
};

// Loads a document's load event waits on. Completions arrive from fetch
// workers, so every method is thread-safe.
class DocumentLoader {
public:
    DocumentLoader(fetch::Fetcher& fetcher,
                   std::optional<uint64_t> pipeline_id = std::nullopt,
                   std::optional<url::URL> initial_load = std::nullopt,
                   std::shared_ptr<core::DiagnosticEmitter> diagnostics = nullptr);

    void add_blocking_load(LoadType load);

    // Registers the load, then fetches; the load finishes right after the
    // target's process_response_eof.
    void fetch_async(LoadType load, fetch::Request request,
                     std::shared_ptr<fetch::FetchTarget> target);

    // false (and an error event) for a load that is not pending.
    bool finish_load(const LoadType& load);

    bool is_blocked() const;
    size_t pending_count() const;
    std::vector<LoadType> blocking_loads() const;

    void inhibit_events();
    bool events_inhibited() const;

    std::optional<uint64_t> pipeline_id() const { return pipeline_id_; }

private:
    struct State {
        mutable std::mutex mutex;
        std::vector<LoadType> loads;
        bool events_inhibited = false;
        std::shared_ptr<core::DiagnosticEmitter> diagnostics;

        bool finish(const LoadType& load);
    };

    class FinishingTarget;

    fetch::Fetcher& fetcher_;
    std::optional<uint64_t> pipeline_id_;
    // Shared with in-flight fetches that may finish after the loader is gone.
    std::shared_ptr<State> state_;
};

// Keeps one load pending for as long as it lives.
class LoadBlocker {
public:
    LoadBlocker(DocumentLoader& loader, LoadType load);
    ~LoadBlocker();

    LoadBlocker(const LoadBlocker&) = delete;
    LoadBlocker& operator=(const LoadBlocker&) = delete;
    LoadBlocker(LoadBlocker&& other) noexcept;
    LoadBlocker& operator=(LoadBlocker&& other) noexcept;

    // Finishes the load now; later calls do nothing.
    void terminate();
    bool active() const { return load_.has_value(); }
    std::optional<url::URL> url() const;

private:
    DocumentLoader* loader_;
    std::optional<LoadType> load_;
};

} // namespace courier::loader
