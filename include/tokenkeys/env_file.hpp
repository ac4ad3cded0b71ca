#pragma once

#include "tokenkeys/events.hpp"
#include "tokenkeys/platform.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tokenkeys {

// ============================================================================
// Environment Record
// ============================================================================

/**
 * Ordered KEY -> value mapping with unique keys.
 *
 * set() on an existing key replaces the value in place; new keys are
 * appended, so iteration follows first-insertion order.
 */
class EnvironmentRecord {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    EnvironmentRecord() = default;
    EnvironmentRecord(std::initializer_list<Entry> entries);

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    const std::vector<Entry>& entries() const { return entries_; }

    bool operator==(const EnvironmentRecord& other) const { return entries_ == other.entries_; }
    bool operator!=(const EnvironmentRecord& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

// ============================================================================
// Parsing and Serialization
// ============================================================================

/**
 * Parse env file content.
 *
 * - Blank lines and lines starting with '#' (after whitespace) are skipped
 * - Each line is split on the first '='; lines without one are ignored
 * - The key is trimmed; empty keys are ignored
 * - The value is trimmed, then one layer of surrounding double quotes is
 *   stripped. Inside quotes, the sequence \n decodes to a newline.
 * - A later duplicate key overrides an earlier one
 */
EnvironmentRecord parse_env(const std::string& content);

// Serialize as KEY="value" lines. Newlines in values are written as \n;
// nothing else is escaped.
std::string serialize_env(const EnvironmentRecord& record);

// ============================================================================
// Loading and Merging
// ============================================================================

/**
 * Load an existing env file. Never fails.
 *
 * A missing file yields an empty record. An unreadable file yields an empty
 * record and an environment_load_failed warning on the sink.
 */
EnvironmentRecord load_env_file(const std::string& path,
                                FileSystem& fs,
                                EventSink& sink);

// updates win for shared keys; every other existing key is kept
EnvironmentRecord merge_env(const EnvironmentRecord& existing,
                            const EnvironmentRecord& updates);

} // namespace tokenkeys
