#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace courier::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Observer that prints every event to std::cerr.
DiagnosticObserver stderr_observer();

// Thread-safe event sink. Observers run on the emitting thread, outside the lock.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t max_retained = 0);

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::uint64_t correlation_id = 0);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_correlation(std::uint64_t correlation_id) const;

    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t max_retained_;
    Severity min_severity_ = Severity::Info;
};

}  // namespace courier::core
