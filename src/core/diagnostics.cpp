#include <scenesync/core/diagnostics.h>
#include <scenesync/core/config.h>

#include <ostream>
#include <sstream>

namespace scenesync::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug:   return "debug";
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
    if (event.node_id != 0) {
        oss << " (node:" << event.node_id << ")";
    }
    if (event.batch_id != 0) {
        oss << " (batch:" << event.batch_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stream_observer(std::ostream& out) {
    return [&out](const DiagnosticEvent& event) {
        out << format_diagnostic(event) << '\n';
    };
}

// ---------------------------------------------------------------------------
// DiagnosticEmitter
// ---------------------------------------------------------------------------

DiagnosticEmitter::DiagnosticEmitter()
    : retention_limit_(config::kMaxRetainedDiagnostics) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             std::uint64_t node_id) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.node_id = node_id;
    event.batch_id = batch_id_;

    if (retention_limit_ > 0) {
        if (events_.size() >= retention_limit_) {
            events_.pop_front();
        }
        events_.push_back(event);
    }

    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::set_batch_id(std::uint64_t id) {
    batch_id_ = id;
}

std::uint64_t DiagnosticEmitter::batch_id() const {
    return batch_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::set_retention_limit(std::size_t limit) {
    retention_limit_ = limit;
    while (events_.size() > retention_limit_) {
        events_.pop_front();
    }
}

std::size_t DiagnosticEmitter::retention_limit() const {
    return retention_limit_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::deque<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for_node(std::uint64_t node_id) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.node_id == node_id) {
            result.push_back(e);
        }
    }
    return result;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

// ---------------------------------------------------------------------------
// FailureTrace
// ---------------------------------------------------------------------------

void FailureTrace::add_snapshot(const std::string& key, const std::string& value) {
    snapshots.push_back({key, value});
}

std::string FailureTrace::format() const {
    std::ostringstream oss;
    oss << "FailureTrace";
    if (batch_id != 0) {
        oss << " (batch:" << batch_id << ")";
    }
    oss << "\n";
    oss << "  module: " << module << "\n";
    oss << "  stage: " << stage << "\n";
    oss << "  error: " << error_message << "\n";
    if (!snapshots.empty()) {
        oss << "  snapshots:\n";
        for (const auto& s : snapshots) {
            oss << "    " << s.key << "=" << s.value << "\n";
        }
    }
    if (!context_events.empty()) {
        oss << "  context_events: " << context_events.size() << "\n";
    }
    return oss.str();
}

FailureTrace& FailureTraceCollector::capture(const DiagnosticEmitter& emitter,
                                             const std::string& module,
                                             const std::string& stage,
                                             const std::string& error_message) {
    FailureTrace trace;
    trace.batch_id = emitter.batch_id();
    trace.module = module;
    trace.stage = stage;
    trace.error_message = error_message;
    trace.context_events.assign(emitter.events().begin(), emitter.events().end());
    traces_.push_back(std::move(trace));
    return traces_.back();
}

const std::vector<FailureTrace>& FailureTraceCollector::traces() const {
    return traces_;
}

void FailureTraceCollector::clear() {
    traces_.clear();
}

std::size_t FailureTraceCollector::size() const {
    return traces_.size();
}

}  // namespace scenesync::core
