#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace trellis::core {

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
    std::uint64_t correlation_id = 0;  // frame number, 0 outside a frame
    std::uint64_t element_key = 0;     // element the event is about, 0 if none
};

const char* severity_name(Severity severity);

// `[warning] layout/inline (cid:3) <element 12>: message`
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects structured events from the cascade, layout and font stages.
// Components take a nullable pointer to an emitter; a null emitter means
// diagnostics are off. Only the most recent `capacity()` events are kept.
class DiagnosticEmitter {
public:
    DiagnosticEmitter();

    void emit(Severity severity, const std::string& module, const std::string& stage,
              const std::string& message, std::uint64_t element_key = 0);

    void set_correlation_id(std::uint64_t id) { correlation_id_ = id; }
    std::uint64_t correlation_id() const { return correlation_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    // Shrinking drops the oldest events first.
    void set_capacity(std::size_t capacity);
    std::size_t capacity() const { return capacity_; }
    // Events pushed out of the history so far.
    std::size_t dropped() const { return dropped_; }

    // Observers see every accepted event, including ones later dropped.
    void add_observer(DiagnosticObserver observer);

    const std::deque<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::size_t count(Severity severity) const;

    void clear();
    std::size_t size() const { return events_.size(); }

private:
    void trim();

    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
    std::size_t capacity_;
    std::size_t dropped_ = 0;
};

// Emits through `emitter` when it is non-null.
void emit_if(DiagnosticEmitter* emitter, Severity severity, const std::string& module,
             const std::string& stage, const std::string& message,
             std::uint64_t element_key = 0);

struct FailureSnapshot {
    std::string key;
    std::string value;
};

// Everything known about a fatal contract violation at the point it was hit.
struct FailureTrace {
    std::uint64_t correlation_id = 0;
    std::string module;
    std::string stage;
    std::string error_message;
    std::vector<DiagnosticEvent> context_events;  // oldest first
    std::vector<FailureSnapshot> snapshots;

    void add_snapshot(const std::string& key, const std::string& value);
    const std::string* snapshot(const std::string& key) const;
    std::string format() const;
};

// Builds a trace carrying the emitter's most recent events, if any.
FailureTrace capture_failure(const DiagnosticEmitter* emitter,
                             const std::string& module,
                             const std::string& stage,
                             const std::string& error_message);

// Contract violations that leave the pipeline unable to continue.
// Writes the formatted trace to stderr and aborts the process.
[[noreturn]] void fatal_error(const FailureTrace& trace);

}  // namespace trellis::core
