#include "runtime/event_log.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sandkit::runtime {

using json = nlohmann::json;

// ============================================================================
// EventLogEntry
// ============================================================================

json EventLogEntry::to_json() const {
    json j;
    j["id"] = id;

    // ISO 8601, millisecond precision
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    j["timestamp"] = oss.str();

    j["category"] = event_category_to_string(category);
    j["event_type"] = event_type;
    j["sandbox_id"] = sandbox_id;
    j["success"] = success;
    j["details"] = details;

    return j;
}

std::string EventLogEntry::to_jsonl() const {
    return to_json().dump() + "\n";
}

// ============================================================================
// EventLog
// ============================================================================

EventLog::EventLog(std::string sandbox_id, size_t max_entries)
    : sandbox_id_(std::move(sandbox_id)),
      max_entries_(std::max<size_t>(max_entries, 1)) {}

void EventLog::log(EventCategory category,
                   const std::string& event_type,
                   const json& details,
                   bool success) {
    std::lock_guard<std::mutex> lock(mutex_);

    EventLogEntry entry;
    entry.id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.category = category;
    entry.event_type = event_type;
    entry.sandbox_id = sandbox_id_;
    entry.details = details;
    entry.success = success;

    entries_.push_back(std::move(entry));
    trim_entries();

    spdlog::trace("Event[{}] {}: {} success={}",
                  event_category_to_string(category), sandbox_id_, event_type, success);
}

void EventLog::log_failure(EventCategory category,
                           const std::string& event_type,
                           const std::string& error,
                           json details) {
    details["error"] = error;
    log(category, event_type, details, false);
}

std::vector<EventLogEntry> EventLog::get_entries(std::optional<EventCategory> category,
                                                 uint64_t since_id,
                                                 size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventLogEntry> result;

    // Newest first so the limit keeps the most recent entries
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (limit > 0 && result.size() >= limit) {
            break;
        }
        if (it->id <= since_id) {
            continue;
        }
        if (category && it->category != *category) {
            continue;
        }
        result.push_back(*it);
    }

    std::reverse(result.begin(), result.end());
    return result;
}

std::vector<EventLogEntry> EventLog::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventLogEntry> result;
    for (const auto& entry : entries_) {
        if (!entry.success) {
            result.push_back(entry);
        }
    }
    return result;
}

std::string EventLog::export_jsonl(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    size_t count = 0;
    for (const auto& entry : entries_) {
        if (limit > 0 && count >= limit) {
            break;
        }
        oss << entry.to_jsonl();
        count++;
    }

    return oss.str();
}

void EventLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t EventLog::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t EventLog::last_entry_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

void EventLog::trim_entries() {
    // Caller must hold the mutex
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
}

} // namespace sandkit::runtime
