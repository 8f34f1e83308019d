#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace courier {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Free-form key/value bag carried by messages, tasks and events. Always a
// JSON object; a null value reads as empty.
using Metadata = nlohmann::json;

// Object-only shallow merge, keys of `from` win.
void merge_metadata(Metadata& into, const Metadata& from);

// Compact JSON text; invalid UTF-8 in strings is replaced, never thrown on.
std::string dump_metadata(const Metadata& m);

enum class TaskMode : uint8_t {
    Worker,     // tools run in-process
    Subagent,   // ephemeral delegate agent, torn down afterwards
    Background  // async run on the primary agent, polled
};

enum class TaskPriority : uint8_t {
    Low,
    Normal,
    High,
    Urgent
};

enum class TaskStatus : uint8_t {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

enum class TaskEventType : uint8_t {
    Created,
    Started,
    Progress,
    Completed,
    Failed,
    Cancelled,
    CancelRequested
};

const char* to_string(TaskMode mode);
const char* to_string(TaskPriority priority);
const char* to_string(TaskStatus status);
const char* to_string(TaskEventType type);

// Parsers return nullopt for anything outside the closed set.
std::optional<TaskMode> parse_task_mode(const std::string& s);
std::optional<TaskPriority> parse_task_priority(const std::string& s);
std::optional<TaskStatus> parse_task_status(const std::string& s);
std::optional<TaskEventType> parse_task_event_type(const std::string& s);

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

// Append-only audit record.
struct TaskEvent {
    std::string id;
    std::string task_id;
    TaskEventType event_type = TaskEventType::Created;
    Timestamp timestamp{};
    Metadata data = Metadata::object();
};

struct Task {
    std::string id;
    std::string description;
    TaskMode mode = TaskMode::Worker;
    TaskPriority priority = TaskPriority::Normal;
    TaskStatus status = TaskStatus::Pending;
    Timestamp created_at{};
    std::string created_by;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    std::optional<std::string> result;
    std::optional<std::string> error;
    std::optional<double> progress;
    std::optional<std::string> progress_message;
    Metadata metadata = Metadata::object();
    bool cancel_requested = false;
};

// ISO-8601 UTC with microseconds, e.g. 2026-10-19T12:00:00.123456
std::string format_timestamp(Timestamp ts);
std::optional<Timestamp> parse_timestamp(const std::string& s);

std::string generate_uuid();

// Code points in UTF-8 text.
size_t utf8_length(const std::string& s);

// First n code points of s, unchanged if shorter. Never splits a UTF-8
// sequence.
std::string truncate(const std::string& s, size_t n);

} // namespace courier
