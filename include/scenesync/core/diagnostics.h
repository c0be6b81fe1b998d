#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace scenesync::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t node_id = 0;   // 0 when the event is not tied to a scene node
    std::uint64_t batch_id = 0;  // commit batch the event belongs to
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Observer that writes every event as one formatted line.
DiagnosticObserver stream_observer(std::ostream& out);

// Collects structured diagnostics for one scene. Events below the minimum
// severity are dropped before observers see them; the retained history is
// capped so long-running scenes do not grow without bound.
class DiagnosticEmitter {
public:
    DiagnosticEmitter();

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::uint64_t node_id = 0);

    void set_batch_id(std::uint64_t id);
    std::uint64_t batch_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void set_retention_limit(std::size_t limit);
    std::size_t retention_limit() const;

    void add_observer(DiagnosticObserver observer);

    // Oldest first.
    const std::deque<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_for_node(std::uint64_t node_id) const;

    void clear();
    std::size_t size() const;

private:
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t batch_id_ = 0;
    Severity min_severity_ = Severity::Info;
    std::size_t retention_limit_;
};

struct FailureSnapshot {
    std::string key;
    std::string value;
};

// State captured right before a fatal misuse error is raised.
struct FailureTrace {
    std::uint64_t batch_id = 0;
    std::string module;
    std::string stage;
    std::string error_message;
    std::vector<DiagnosticEvent> context_events;
    std::vector<FailureSnapshot> snapshots;

    void add_snapshot(const std::string& key, const std::string& value);
    std::string format() const;
};

class FailureTraceCollector {
public:
    FailureTrace& capture(const DiagnosticEmitter& emitter,
                          const std::string& module,
                          const std::string& stage,
                          const std::string& error_message);

    const std::vector<FailureTrace>& traces() const;
    void clear();
    std::size_t size() const;

private:
    std::vector<FailureTrace> traces_;
};

}  // namespace scenesync::core
