#include "include/courier.hpp"
#include <cstdio>
#include <ctime>
#include <random>

namespace courier {

const char* to_string(TaskMode mode) {
    switch (mode) {
    case TaskMode::Worker: return "worker";
    case TaskMode::Subagent: return "subagent";
    case TaskMode::Background: return "background";
    }
    return "worker";
}

const char* to_string(TaskPriority priority) {
    switch (priority) {
    case TaskPriority::Low: return "low";
    case TaskPriority::Normal: return "normal";
    case TaskPriority::High: return "high";
    case TaskPriority::Urgent: return "urgent";
    }
    return "normal";
}

const char* to_string(TaskStatus status) {
    switch (status) {
    case TaskStatus::Pending: return "pending";
    case TaskStatus::Running: return "running";
    case TaskStatus::Completed: return "completed";
    case TaskStatus::Failed: return "failed";
    case TaskStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

const char* to_string(TaskEventType type) {
    switch (type) {
    case TaskEventType::Created: return "created";
    case TaskEventType::Started: return "started";
    case TaskEventType::Progress: return "progress";
    case TaskEventType::Completed: return "completed";
    case TaskEventType::Failed: return "failed";
    case TaskEventType::Cancelled: return "cancelled";
    case TaskEventType::CancelRequested: return "cancel_requested";
    }
    return "created";
}

std::optional<TaskMode> parse_task_mode(const std::string& s) {
    if (s == "worker") return TaskMode::Worker;
    if (s == "subagent") return TaskMode::Subagent;
    if (s == "background") return TaskMode::Background;
    return std::nullopt;
}

std::optional<TaskPriority> parse_task_priority(const std::string& s) {
    if (s == "low") return TaskPriority::Low;
    if (s == "normal") return TaskPriority::Normal;
    if (s == "high") return TaskPriority::High;
    if (s == "urgent") return TaskPriority::Urgent;
    return std::nullopt;
}

std::optional<TaskStatus> parse_task_status(const std::string& s) {
    if (s == "pending") return TaskStatus::Pending;
    if (s == "running") return TaskStatus::Running;
    if (s == "completed") return TaskStatus::Completed;
    if (s == "failed") return TaskStatus::Failed;
    if (s == "cancelled") return TaskStatus::Cancelled;
    return std::nullopt;
}

std::optional<TaskEventType> parse_task_event_type(const std::string& s) {
    if (s == "created") return TaskEventType::Created;
    if (s == "started") return TaskEventType::Started;
    if (s == "progress") return TaskEventType::Progress;
    if (s == "completed") return TaskEventType::Completed;
    if (s == "failed") return TaskEventType::Failed;
    if (s == "cancelled") return TaskEventType::Cancelled;
    if (s == "cancel_requested") return TaskEventType::CancelRequested;
    return std::nullopt;
}

std::string format_timestamp(Timestamp ts) {
    using namespace std::chrono;
    auto us = duration_cast<microseconds>(ts.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(us / 1000000);
    long frac = static_cast<long>(us % 1000000);
    if (frac < 0) {
        frac += 1000000;
        --secs;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ld",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return buf;
}

std::optional<Timestamp> parse_timestamp(const std::string& s) {
    std::tm tm{};
    long frac = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%6ld",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &frac);
    if (n < 6) return std::nullopt;
    if (n == 6) frac = 0;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t secs = timegm(&tm);
    return Timestamp(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(secs) + std::chrono::microseconds(frac)));
}

void merge_metadata(Metadata& into, const Metadata& from) {
    if (!into.is_object()) into = Metadata::object();
    if (!from.is_object()) return;
    for (auto it = from.begin(); it != from.end(); ++it) into[it.key()] = it.value();
}

std::string dump_metadata(const Metadata& m) {
    if (!m.is_object()) return "{}";
    return m.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

namespace {

inline bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

std::string truncate(const std::string& s, size_t n) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
        if (seen == n) return s.substr(0, i);
        ++seen;
    }
    return s;
}

std::string generate_uuid() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    unsigned char bytes[16];
    for (int i = 0; i < 16; i += 8) {
        uint64_t r = rng();
        for (int j = 0; j < 8; ++j) bytes[i + j] = static_cast<unsigned char>(r >> (j * 8));
    }
    // version 4, variant 10xx
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    char buf[37];
    std::snprintf(buf, sizeof(buf),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3],
        bytes[4], bytes[5], bytes[6], bytes[7],
        bytes[8], bytes[9], bytes[10], bytes[11],
        bytes[12], bytes[13], bytes[14], bytes[15]);
    return buf;
}

} // namespace courier
