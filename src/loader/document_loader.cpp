#include <courier/loader/document_loader.h>

#include <algorithm>
#include <utility>

namespace courier::loader {

const char* load_kind_name(LoadKind kind) {
    switch (kind) {
        case LoadKind::Image: return "image";
        case LoadKind::Script: return "script";
        case LoadKind::Subframe: return "subframe";
        case LoadKind::Stylesheet: return "stylesheet";
        case LoadKind::PageSource: return "page-source";
        case LoadKind::Media: return "media";
    }
    return "unknown";
}

fetch::Destination destination_for(LoadKind kind) {
    switch (kind) {
        case LoadKind::Image: return fetch::Destination::Image;
        case LoadKind::Script: return fetch::Destination::Script;
        case LoadKind::Subframe: return fetch::Destination::Frame;
        case LoadKind::Stylesheet: return fetch::Destination::Style;
        case LoadKind::PageSource: return fetch::Destination::Document;
        case LoadKind::Media: return fetch::Destination::Media;
    }
    return fetch::Destination::None;
}

// ---------------------------------------------------------------------------
// DocumentLoader
// ---------------------------------------------------------------------------

class DocumentLoader::FinishingTarget : public fetch::FetchTarget {
public:
    FinishingTarget(std::shared_ptr<State> state, LoadType load,
                    std::shared_ptr<fetch::FetchTarget> inner)
        : state_(std::move(state)), load_(std::move(load)), inner_(std::move(inner)) {}

    void process_request_body(const fetch::Request& request) override {
        if (inner_) inner_->process_request_body(request);
    }
    void process_request_eof(const fetch::Request& request) override {
        if (inner_) inner_->process_request_eof(request);
    }
    void process_response(const fetch::Response& response) override {
        if (inner_) inner_->process_response(response);
    }
    void process_response_chunk(const std::vector<uint8_t>& chunk) override {
        if (inner_) inner_->process_response_chunk(chunk);
    }
    void process_response_eof(const fetch::Response& response) override {
        if (inner_) inner_->process_response_eof(response);
        state_->finish(load_);
    }

private:
    std::shared_ptr<State> state_;
    LoadType load_;
    std::shared_ptr<fetch::FetchTarget> inner_;
};

bool DocumentLoader::State::finish(const LoadType& load) {
    {
        std::lock_guard lock(mutex);
        auto it = std::find(loads.begin(), loads.end(), load);
        if (it != loads.end()) {
            loads.erase(it);
            return true;
        }
    }
    if (diagnostics) {
        diagnostics->emit(core::Severity::Error, "loader", "finish",
                          std::string("unknown completed load ") + load_kind_name(load.kind) +
                              " " + load.url.serialize());
    }
    return false;
}

DocumentLoader::DocumentLoader(fetch::Fetcher& fetcher,
                               std::optional<uint64_t> pipeline_id,
                               std::optional<url::URL> initial_load,
                               std::shared_ptr<core::DiagnosticEmitter> diagnostics)
    : fetcher_(fetcher),
      pipeline_id_(pipeline_id),
      state_(std::make_shared<State>()) {
    state_->diagnostics = std::move(diagnostics);
    if (initial_load.has_value()) {
        state_->loads.push_back(LoadType{LoadKind::PageSource, std::move(*initial_load)});
    }
}

void DocumentLoader::add_blocking_load(LoadType load) {
    std::lock_guard lock(state_->mutex);
    state_->loads.push_back(std::move(load));
}

void DocumentLoader::fetch_async(LoadType load, fetch::Request request,
                                 std::shared_ptr<fetch::FetchTarget> target) {
    if (request.destination == fetch::Destination::None) {
        request.destination = destination_for(load.kind);
    }
    if (!request.pipeline_id.has_value()) {
        request.pipeline_id = pipeline_id_;
    }

    add_blocking_load(load);
    auto finishing = std::make_shared<FinishingTarget>(state_, std::move(load), std::move(target));
    fetcher_.fetch_async(std::move(request), std::move(finishing));
}

bool DocumentLoader::finish_load(const LoadType& load) {
    return state_->finish(load);
}

bool DocumentLoader::is_blocked() const {
    std::lock_guard lock(state_->mutex);
    return !state_->loads.empty();
}

size_t DocumentLoader::pending_count() const {
    std::lock_guard lock(state_->mutex);
    return state_->loads.size();
}

std::vector<LoadType> DocumentLoader::blocking_loads() const {
    std::lock_guard lock(state_->mutex);
    return state_->loads;
}

void DocumentLoader::inhibit_events() {
    std::lock_guard lock(state_->mutex);
    state_->events_inhibited = true;
}

bool DocumentLoader::events_inhibited() const {
    std::lock_guard lock(state_->mutex);
    return state_->events_inhibited;
}

// ---------------------------------------------------------------------------
// LoadBlocker
// ---------------------------------------------------------------------------

LoadBlocker::LoadBlocker(DocumentLoader& loader, LoadType load)
    : loader_(&loader), load_(std::move(load)) {
    loader_->add_blocking_load(*load_);
}

LoadBlocker::~LoadBlocker() {
    terminate();
}

LoadBlocker::LoadBlocker(LoadBlocker&& other) noexcept
    : loader_(other.loader_), load_(std::move(other.load_)) {
    other.load_.reset();
}

LoadBlocker& LoadBlocker::operator=(LoadBlocker&& other) noexcept {
    if (this != &other) {
        terminate();
        loader_ = other.loader_;
        load_ = std::move(other.load_);
        other.load_.reset();
    }
    return *this;
}

void LoadBlocker::terminate() {
    if (load_.has_value()) {
        loader_->finish_load(*load_);
        load_.reset();
    }
}

std::optional<url::URL> LoadBlocker::url() const {
    if (!load_.has_value()) {
        return std::nullopt;
    }
    return load_->url;
}

} // namespace courier::loader
