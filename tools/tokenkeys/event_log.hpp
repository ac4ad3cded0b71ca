/**
 * tokenkeys CLI - event logging
 *
 * Turns provisioning events into spdlog output and, optionally, a JSON log
 * file.
 */

#pragma once

#include <tokenkeys/events.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace tokenkeys::cli {

// "minimal" -> warn, "all" -> trace. Returns false for anything else.
bool configure_logging(const std::string& level_name);

/**
 * Logs each event through spdlog: stage start at debug, success at info,
 * degradations at warn and failures at error. With a log file path, also
 * keeps every event for write_log_file().
 */
class SpdlogEventSink : public EventSink {
public:
    explicit SpdlogEventSink(std::string log_file = "") : log_file_(std::move(log_file)) {}

    void emit(const Event& event) override;
    using EventSink::emit;

    // Write the collected events as a JSON array. No-op without a log file.
    IoResult write_log_file(FileSystem& fs) const;

    const nlohmann::json& entries() const { return entries_; }

private:
    std::string log_file_;
    nlohmann::json entries_ = nlohmann::json::array();
};

} // namespace tokenkeys::cli
