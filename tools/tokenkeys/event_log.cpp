/**
 * tokenkeys CLI - event logging
 */

#include "event_log.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>

namespace tokenkeys::cli {

namespace {

// Current time as RFC3339 (UTC)
std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

spdlog::level::level_enum level_for(Outcome outcome) {
    switch (outcome) {
        case Outcome::started: return spdlog::level::debug;
        case Outcome::succeeded: return spdlog::level::info;
        case Outcome::degraded: return spdlog::level::warn;
        case Outcome::failed: return spdlog::level::err;
    }
    return spdlog::level::info;
}

} // namespace

bool configure_logging(const std::string& level_name) {
    if (level_name == "minimal") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level_name == "all") {
        spdlog::set_level(spdlog::level::trace);
    } else {
        return false;
    }
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S %^%l%$: %v");
    return true;
}

void SpdlogEventSink::emit(const Event& event) {
    auto level = level_for(event.outcome);
    const char* stage = stage_to_string(event.stage);

    if (event.message.empty()) {
        spdlog::log(level, "[{}] {}", stage, outcome_to_string(event.outcome));
    } else {
        spdlog::log(level, "[{}] {}", stage, event.message);
    }

    if (log_file_.empty()) {
        return;
    }

    nlohmann::json entry;
    entry["time"] = current_timestamp();
    entry["level"] = spdlog::level::to_string_view(level).data();
    entry["stage"] = stage;
    entry["outcome"] = outcome_to_string(event.outcome);
    entry["message"] = event.message;
    entry["fields"] = event.fields;
    entries_.push_back(std::move(entry));
}

IoResult SpdlogEventSink::write_log_file(FileSystem& fs) const {
    if (log_file_.empty()) {
        IoResult skipped;
        skipped.ok = true;
        return skipped;
    }

    std::string parent = get_parent_directory(log_file_);
    if (!parent.empty()) {
        auto created = fs.create_directories(parent);
        if (!created.ok) {
            return created;
        }
    }

    return fs.write_file(log_file_, entries_.dump(2) + "\n", std::nullopt);
}

} // namespace tokenkeys::cli
