#pragma once
#include "include/courier.hpp"
#include "include/task_store.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace courier {

// Priority queue of background tasks on top of TaskStore.
class TaskScheduler {
public:
    explicit TaskScheduler(TaskStore& store);

    Task create(const std::string& description,
                TaskMode mode = TaskMode::Worker,
                TaskPriority priority = TaskPriority::Normal,
                const std::string& created_by = "agent",
                const Metadata& metadata = Metadata::object());

    // Next pending task by (priority desc, created_at asc). Blocks up to
    // `timeout` for a new task; nullopt on timeout, shutdown, or once `abort`
    // reports true after a wake_waiters(). The task is not claimed.
    std::optional<Task> dequeue(std::chrono::milliseconds timeout,
                                const std::function<bool()>& abort = nullptr);

    // pending -> running; false when another claimant got there first.
    bool claim(const std::string& task_id);

    void report_progress(const std::string& task_id, double progress,
                         const std::optional<std::string>& message = std::nullopt);

    bool complete(const std::string& task_id, const std::optional<std::string>& result = std::nullopt);
    bool fail(const std::string& task_id, const std::string& error);

    // Pending tasks are cancelled outright; running tasks only get the
    // cancel_requested flag. False for unknown or finished tasks.
    bool cancel(const std::string& task_id);

    // Executor-side running -> cancelled once the flag has been observed.
    bool mark_cancelled(const std::string& task_id, const std::string& reason = "user_requested");

    bool is_cancellation_requested(const std::string& task_id);

    std::optional<Task> get(const std::string& task_id);
    std::vector<Task> list(std::optional<TaskStatus> status = std::nullopt, int limit = 50);
    std::vector<TaskEvent> events(const std::string& task_id);
    std::map<TaskStatus, int64_t> stats();

    // Wakes every dequeue waiter; later dequeues return immediately when empty.
    void shutdown();
    bool is_shut_down();

    // Wakes dequeue waiters so they re-check their abort predicate. Does not
    // latch anything.
    void wake_waiters();

private:
    void notify_task_added();

    TaskStore& store_;
    std::mutex wait_mtx_;
    std::condition_variable task_added_cv_;
    uint64_t added_seq_;
    bool shutdown_;
};

} // namespace courier
