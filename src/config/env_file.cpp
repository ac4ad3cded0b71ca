#include "tokenkeys/env_file.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tokenkeys {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string unescape_newlines(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size() && s[i + 1] == 'n') {
            result += '\n';
            ++i;
        } else {
            result += s[i];
        }
    }
    return result;
}

std::string escape_newlines(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '\n') {
            result += "\\n";
        } else {
            result += c;
        }
    }
    return result;
}

} // namespace

// ============================================================================
// EnvironmentRecord
// ============================================================================

EnvironmentRecord::EnvironmentRecord(std::initializer_list<Entry> entries) {
    for (const auto& [key, value] : entries) {
        set(key, value);
    }
}

void EnvironmentRecord::set(const std::string& key, const std::string& value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == key; });
    if (it != entries_.end()) {
        it->second = value;
    } else {
        entries_.emplace_back(key, value);
    }
}

std::optional<std::string> EnvironmentRecord::get(const std::string& key) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool EnvironmentRecord::contains(const std::string& key) const {
    return get(key).has_value();
}

// ============================================================================
// Parsing and Serialization
// ============================================================================

EnvironmentRecord parse_env(const std::string& content) {
    EnvironmentRecord record;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(trimmed.substr(0, eq));
        if (key.empty()) {
            continue;
        }

        std::string value = trim(trimmed.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = unescape_newlines(value.substr(1, value.size() - 2));
        }

        record.set(key, value);
    }

    return record;
}

std::string serialize_env(const EnvironmentRecord& record) {
    std::string out;
    bool first = true;
    for (const auto& [key, value] : record) {
        if (!first) {
            out += '\n';
        }
        first = false;
        out += key;
        out += "=\"";
        out += escape_newlines(value);
        out += '"';
    }
    return out;
}

// ============================================================================
// Loading and Merging
// ============================================================================

EnvironmentRecord load_env_file(const std::string& path,
                                FileSystem& fs,
                                EventSink& sink) {
    auto read = fs.read_file(path);
    if (!read.ok) {
        if (!read.not_found) {
            sink.warn(Stage::load_environment, Warning::environment_load_failed,
                      "could not read existing env file: " + read.error,
                      warnings::environment_load_failed(path, read.error));
        }
        return {};
    }

    return parse_env(read.content);
}

EnvironmentRecord merge_env(const EnvironmentRecord& existing,
                            const EnvironmentRecord& updates) {
    EnvironmentRecord merged = existing;
    for (const auto& [key, value] : updates) {
        merged.set(key, value);
    }
    return merged;
}

} // namespace tokenkeys
