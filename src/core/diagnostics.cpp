#include <trellis/core/diagnostics.h>
#include <trellis/core/config.h>

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <sstream>

namespace trellis::core {

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
    oss << "[" << severity_name(event.severity) << "] " << event.module;
    if (!event.stage.empty()) oss << "/" << event.stage;
    if (event.correlation_id != 0) oss << " (cid:" << event.correlation_id << ")";
    if (event.element_key != 0) oss << " <element " << event.element_key << ">";
    oss << ": " << event.message;
    return oss.str();
}

// ---------------------------------------------------------------------------
// DiagnosticEmitter
// ---------------------------------------------------------------------------

DiagnosticEmitter::DiagnosticEmitter()
    : capacity_(config::kDiagnosticHistoryLimit) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             std::uint64_t element_key) {
    if (severity < min_severity_) return;

    DiagnosticEvent event{std::chrono::steady_clock::now(), severity, module, stage,
                          message, correlation_id_, element_key};
    for (const auto& observer : observers_) {
        observer(event);
    }
    events_.push_back(std::move(event));
    trim();
}

void DiagnosticEmitter::set_capacity(std::size_t capacity) {
    capacity_ = capacity;
    trim();
}

void DiagnosticEmitter::trim() {
    while (events_.size() > capacity_) {
        events_.pop_front();
        ++dropped_;
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [severity](const DiagnosticEvent& e) { return e.severity == severity; });
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [&module](const DiagnosticEvent& e) { return e.module == module; });
    return result;
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

void DiagnosticEmitter::clear() {
    events_.clear();
    dropped_ = 0;
}

void emit_if(DiagnosticEmitter* emitter, Severity severity, const std::string& module,
             const std::string& stage, const std::string& message, std::uint64_t element_key) {
    if (emitter) {
        emitter->emit(severity, module, stage, message, element_key);
    }
}

// ---------------------------------------------------------------------------
// FailureTrace
// ---------------------------------------------------------------------------

void FailureTrace::add_snapshot(const std::string& key, const std::string& value) {
    snapshots.push_back({key, value});
}

const std::string* FailureTrace::snapshot(const std::string& key) const {
    for (const auto& s : snapshots) {
        if (s.key == key) return &s.value;
    }
    return nullptr;
}

std::string FailureTrace::format() const {
    std::ostringstream oss;
    oss << "fatal error in " << module << "/" << stage;
    if (correlation_id != 0) oss << " (cid:" << correlation_id << ")";
    oss << ": " << error_message << "\n";
    for (const auto& s : snapshots) {
        oss << "  " << s.key << " = " << s.value << "\n";
    }
    if (!context_events.empty()) {
        oss << "  recent events (" << context_events.size() << "):\n";
        for (const auto& e : context_events) {
            oss << "    " << format_diagnostic(e) << "\n";
        }
    }
    return oss.str();
}

FailureTrace capture_failure(const DiagnosticEmitter* emitter,
                             const std::string& module,
                             const std::string& stage,
                             const std::string& error_message) {
    FailureTrace trace;
    trace.module = module;
    trace.stage = stage;
    trace.error_message = error_message;
    if (emitter) {
        trace.correlation_id = emitter->correlation_id();
        const auto& events = emitter->events();
        const std::size_t keep = std::min(events.size(), config::kFailureContextEvents);
        trace.context_events.assign(events.end() - static_cast<std::ptrdiff_t>(keep),
                                    events.end());
    }
    return trace;
}

void fatal_error(const FailureTrace& trace) {
    std::cerr << trace.format() << std::flush;
    std::abort();
}

}  // namespace trellis::core
