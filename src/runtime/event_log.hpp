/**
 * Sandbox event log
 *
 * Structured per-sandbox record of lifecycle, execution, file and cleanup
 * events. Cleanup failures swallowed by close() end up here and are the
 * only place they are surfaced. Bounded in memory, exportable as JSONL.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace sandkit::runtime {

enum class EventCategory {
    LIFECYCLE,    // Provision, ready, close
    EXECUTION,    // run_code, compliance probes
    FILESYSTEM,   // write/read/delete of files and directories
    CLEANUP       // Teardown steps, including swallowed failures
};

inline std::string event_category_to_string(EventCategory cat) {
    switch (cat) {
        case EventCategory::LIFECYCLE:  return "LIFECYCLE";
        case EventCategory::EXECUTION:  return "EXECUTION";
        case EventCategory::FILESYSTEM: return "FILESYSTEM";
        case EventCategory::CLEANUP:    return "CLEANUP";
        default: return "UNKNOWN";
    }
}

inline std::optional<EventCategory> event_category_from_string(const std::string& str) {
    if (str == "LIFECYCLE")  return EventCategory::LIFECYCLE;
    if (str == "EXECUTION")  return EventCategory::EXECUTION;
    if (str == "FILESYSTEM") return EventCategory::FILESYSTEM;
    if (str == "CLEANUP")    return EventCategory::CLEANUP;
    return std::nullopt;
}

struct EventLogEntry {
    uint64_t id;
    std::chrono::system_clock::time_point timestamp;
    EventCategory category;
    std::string event_type;                   // e.g. "CONTAINER_CREATED", "REMOVE_IMAGE"
    std::string sandbox_id;
    nlohmann::json details;
    bool success;

    nlohmann::json to_json() const;

    // Single line, newline-terminated
    std::string to_jsonl() const;
};

class EventLog {
public:
    explicit EventLog(std::string sandbox_id, size_t max_entries = 1000);

    void log(EventCategory category,
             const std::string& event_type,
             const nlohmann::json& details = nlohmann::json::object(),
             bool success = true);

    // Shorthand for a swallowed failure
    void log_failure(EventCategory category,
                     const std::string& event_type,
                     const std::string& error,
                     nlohmann::json details = nlohmann::json::object());

    // Chronological; category nullopt = all
    std::vector<EventLogEntry> get_entries(
        std::optional<EventCategory> category = std::nullopt,
        uint64_t since_id = 0,
        size_t limit = 0                       // 0 = no limit
    ) const;

    // Entries with success == false
    std::vector<EventLogEntry> failures() const;

    std::string export_jsonl(size_t limit = 0) const;  // 0 = all entries

    void clear();

    size_t entry_count() const;
    uint64_t last_entry_id() const;
    const std::string& sandbox_id() const { return sandbox_id_; }

private:
    std::string sandbox_id_;
    size_t max_entries_;
    std::deque<EventLogEntry> entries_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;

    void trim_entries();
};

} // namespace sandkit::runtime
