#pragma once
#include "courier.hpp"
#include <sqlite3.h>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace courier {

// Durable tasks/task_events table pair.
//
// Every status change is a conditional UPDATE on the current status and the
// matching event row is written in the same transaction, so a change either
// lands with its audit entry or not at all. The connection is serialized by
// an internal mutex; the store may be shared by any number of threads.
class TaskStore {
public:
    TaskStore();
    ~TaskStore();

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    // Opens (creating if needed) the database and its schema. Use ":memory:"
    // for a private in-process database. Throws StoreError.
    void open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Inserts a pending task and its `created` event.
    void insert_task(const Task& task, const Metadata& event_data);

    std::optional<Task> get_task(const std::string& task_id);
    // Newest first.
    std::vector<Task> list_tasks(std::optional<TaskStatus> status, int limit);
    // Highest priority, then oldest, among pending tasks.
    std::optional<Task> next_pending();

    // pending -> running. False when the task is no longer pending.
    bool claim(const std::string& task_id, Timestamp now);

    // running -> completed|failed|cancelled. `result` and `error` are written
    // to the row untruncated; `event_data` goes into the event as given.
    bool finish(const std::string& task_id, TaskStatus to, Timestamp now,
                const std::optional<std::string>& result,
                const std::optional<std::string>& error,
                const Metadata& event_data);

    // pending -> cancelled.
    bool cancel_pending(const std::string& task_id, Timestamp now, const Metadata& event_data);

    // Sets cancel_requested on a running task. Status is left alone.
    bool request_cancel(const std::string& task_id);

    // Returns false if the task does not exist.
    bool update_progress(const std::string& task_id, double progress,
                         const std::optional<std::string>& message);

    bool is_cancel_requested(const std::string& task_id);

    std::vector<TaskEvent> events(const std::string& task_id);

    // Every status is present, zero counts included.
    std::map<TaskStatus, int64_t> count_by_status();

private:
    void exec(const std::string& sql);
    void ensure_schema();
    void append_event(const std::string& task_id, TaskEventType type, const Metadata& data);
    Task read_task(sqlite3_stmt* stmt);
    [[noreturn]] void throw_db_error(const std::string& what);

    sqlite3* db_;
    std::mutex mtx_;
};

} // namespace courier
