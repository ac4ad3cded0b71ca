#include "tokenkeys/events.hpp"

#include <algorithm>

namespace tokenkeys {

// ============================================================================
// EventSink
// ============================================================================

void EventSink::emit(Stage stage, Outcome outcome, const std::string& message) {
    emit(Event{stage, outcome, message, {}});
}

void EventSink::warn(Stage stage, Warning warning, const std::string& message,
                     std::unordered_map<std::string, std::string> fields) {
    fields["warning"] = warning_to_string(warning);
    emit(Event{stage, Outcome::degraded, message, std::move(fields)});
}

EventSink& null_event_sink() {
    static NullEventSink sink;
    return sink;
}

// ============================================================================
// EventCollector Implementation
// ============================================================================

void EventCollector::emit(const Event& event) {
    events_.push_back(event);
    if (forward_) {
        forward_->emit(event);
    }
}

std::vector<WarningObject> EventCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& e : events_) {
        if (e.outcome != Outcome::degraded) {
            continue;
        }

        WarningObject obj;
        auto it = e.fields.find("warning");
        obj.key = it != e.fields.end() ? it->second : "unknown";
        obj.action = "warn";
        for (const auto& [name, value] : e.fields) {
            if (name != "warning") {
                obj.fields[name] = value;
            }
        }
        result.push_back(std::move(obj));
    }

    return result;
}

bool EventCollector::has_warnings() const {
    return std::any_of(events_.begin(), events_.end(),
                       [](const Event& e) { return e.outcome == Outcome::degraded; });
}

bool EventCollector::has_failures() const {
    return std::any_of(events_.begin(), events_.end(),
                       [](const Event& e) { return e.outcome == Outcome::failed; });
}

size_t EventCollector::count(Stage stage, Outcome outcome) const {
    return static_cast<size_t>(std::count_if(
        events_.begin(), events_.end(),
        [&](const Event& e) { return e.stage == stage && e.outcome == outcome; }));
}

void EventCollector::clear() {
    events_.clear();
}

} // namespace tokenkeys
