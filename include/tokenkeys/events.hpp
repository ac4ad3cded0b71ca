#pragma once

#include "tokenkeys/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace tokenkeys {

// ============================================================================
// Stage Events
// ============================================================================

enum class Outcome {
    started,
    succeeded,
    failed,
    degraded,  // stage continues after a non-fatal warning
};

inline const char* outcome_to_string(Outcome o) {
    switch (o) {
        case Outcome::started: return "started";
        case Outcome::succeeded: return "succeeded";
        case Outcome::failed: return "failed";
        case Outcome::degraded: return "degraded";
    }
    return "unknown";
}

struct Event {
    Stage stage;
    Outcome outcome;
    std::string message;
    // Degraded events carry the warning key under "warning"
    std::unordered_map<std::string, std::string> fields;
};

/**
 * Receiver for provisioning progress. The core reports through this and
 * never owns a logger; how (or whether) events are recorded is up to the
 * implementation passed in.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const Event& event) = 0;

    void emit(Stage stage, Outcome outcome, const std::string& message = "");

    // Emit a degraded event for a warning with its context fields
    void warn(Stage stage, Warning warning, const std::string& message,
              std::unordered_map<std::string, std::string> fields = {});
};

class NullEventSink : public EventSink {
public:
    void emit(const Event&) override {}
    using EventSink::emit;
};

// Returns a process-wide sink that discards everything
EventSink& null_event_sink();

// ============================================================================
// Event Collector
// ============================================================================

/**
 * Records every event. Optionally forwards to another sink so a caller can
 * both log and inspect afterwards.
 */
class EventCollector : public EventSink {
public:
    EventCollector() = default;
    explicit EventCollector(EventSink* forward) : forward_(forward) {}

    void emit(const Event& event) override;
    using EventSink::emit;

    const std::vector<Event>& events() const { return events_; }

    // Warnings derived from degraded events, in emission order
    std::vector<WarningObject> get_warnings() const;

    bool has_warnings() const;
    bool has_failures() const;

    // Number of events for a given stage and outcome
    size_t count(Stage stage, Outcome outcome) const;

    void clear();

private:
    EventSink* forward_ = nullptr;
    std::vector<Event> events_;
};

// ============================================================================
// Warning field helpers
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> directory_hardening_failed(
    const std::string& path,
    const std::string& reason) {
    return {{"path", path}, {"reason", reason}};
}

inline std::unordered_map<std::string, std::string> restricted_write_fallback(
    const std::string& path,
    const std::string& mode,
    const std::string& reason) {
    return {{"path", path}, {"mode", mode}, {"reason", reason}};
}

inline std::unordered_map<std::string, std::string> environment_load_failed(
    const std::string& source_path,
    const std::string& reason) {
    return {{"source_path", source_path}, {"reason", reason}};
}

} // namespace warnings

} // namespace tokenkeys
