#include <courier/core/config.h>
#include <courier/core/diagnostics.h>

#include <iostream>
#include <sstream>

namespace courier::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stderr_observer() {
    return [](const DiagnosticEvent& event) {
        std::cerr << format_diagnostic(event) << '\n';
    };
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t max_retained)
    : max_retained_(max_retained == 0 ? config::kMaxRetainedDiagnostics : max_retained) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             std::uint64_t correlation_id) {
    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.correlation_id = correlation_id;

    std::vector<DiagnosticObserver> observers;
    {
        std::lock_guard lock(mutex_);
        if (severity < min_severity_) {
            return;
        }
        events_.push_back(event);
        while (events_.size() > max_retained_) {
            events_.pop_front();
        }
        observers = observers_;
    }

    for (const auto& observer : observers) {
        observer(event);
    }
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    std::lock_guard lock(mutex_);
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    std::lock_guard lock(mutex_);
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    std::lock_guard lock(mutex_);
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    std::lock_guard lock(mutex_);
    return {events_.begin(), events_.end()};
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_correlation(
    std::uint64_t correlation_id) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.correlation_id == correlation_id) {
            result.push_back(e);
        }
    }
    return result;
}

void DiagnosticEmitter::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

}  // namespace courier::core
