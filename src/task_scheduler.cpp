#include "task_scheduler.hpp"
#include <algorithm>
#include <iostream>

namespace courier {

namespace {

constexpr size_t kResultEventChars = 200;
constexpr size_t kErrorEventChars = 500;

} // namespace

TaskScheduler::TaskScheduler(TaskStore& store)
    : store_(store), added_seq_(0), shutdown_(false) {}

Task TaskScheduler::create(const std::string& description, TaskMode mode, TaskPriority priority,
                           const std::string& created_by, const Metadata& metadata) {
    Task task;
    task.id = generate_uuid();
    task.description = description;
    task.mode = mode;
    task.priority = priority;
    task.status = TaskStatus::Pending;
    task.created_at = Clock::now();
    task.created_by = created_by;
    task.metadata = metadata;

    Metadata ev;
    ev["description"] = description;
    ev["mode"] = to_string(mode);
    ev["priority"] = to_string(priority);
    store_.insert_task(task, ev);

    notify_task_added();
    std::cout << "[TaskScheduler] TASK_CREATED id=" << task.id << " mode=" << to_string(mode)
              << " priority=" << to_string(priority) << " desc=" << truncate(description, 50) << "\n";
    return task;
}

void TaskScheduler::notify_task_added() {
    {
        std::lock_guard<std::mutex> lk(wait_mtx_);
        ++added_seq_;
    }
    task_added_cv_.notify_all();
}

std::optional<Task> TaskScheduler::dequeue(std::chrono::milliseconds timeout,
                                           const std::function<bool()>& abort) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        // Snapshot the counter before querying so a create() landing between
        // the query and the wait still wakes us.
        uint64_t seen;
        {
            std::lock_guard<std::mutex> lk(wait_mtx_);
            if (shutdown_ || (abort && abort())) return std::nullopt;
            seen = added_seq_;
        }

        auto task = store_.next_pending();
        if (task) return task;

        // abort is evaluated under wait_mtx_, and wake_waiters() takes it
        // before notifying, so a flag set before the wake is never missed.
        std::unique_lock<std::mutex> lk(wait_mtx_);
        bool woke = task_added_cv_.wait_until(lk, deadline, [&]{
            return added_seq_ != seen || shutdown_ || (abort && abort());
        });
        if (!woke || shutdown_ || (abort && abort())) return std::nullopt;
    }
}

bool TaskScheduler::claim(const std::string& task_id) {
    bool ok = store_.claim(task_id, Clock::now());
    if (ok) {
        std::cout << "[TaskScheduler] TASK_CLAIMED id=" << task_id << "\n";
    }
    return ok;
}

void TaskScheduler::report_progress(const std::string& task_id, double progress,
                                    const std::optional<std::string>& message) {
    progress = std::min(1.0, std::max(0.0, progress));
    if (!store_.update_progress(task_id, progress, message)) {
        std::cerr << "[TaskScheduler] PROGRESS_UNKNOWN_TASK id=" << task_id << "\n";
    }
}

bool TaskScheduler::complete(const std::string& task_id, const std::optional<std::string>& result) {
    Metadata ev;
    if (result) ev["result"] = truncate(*result, kResultEventChars);
    bool ok = store_.finish(task_id, TaskStatus::Completed, Clock::now(), result, std::nullopt, ev);
    if (ok) {
        std::cout << "[TaskScheduler] TASK_COMPLETED id=" << task_id << "\n";
    } else {
        std::cerr << "[TaskScheduler] COMPLETE_REJECTED id=" << task_id << " (not running)\n";
    }
    return ok;
}

bool TaskScheduler::fail(const std::string& task_id, const std::string& error) {
    Metadata ev;
    ev["error"] = truncate(error, kErrorEventChars);
    bool ok = store_.finish(task_id, TaskStatus::Failed, Clock::now(), std::nullopt, error, ev);
    if (ok) {
        std::cerr << "[TaskScheduler] TASK_FAILED id=" << task_id << " error=" << truncate(error, 100) << "\n";
    } else {
        std::cerr << "[TaskScheduler] FAIL_REJECTED id=" << task_id << " (not running)\n";
    }
    return ok;
}

bool TaskScheduler::cancel(const std::string& task_id) {
    Metadata ev;
    ev["reason"] = "user_requested";
    if (store_.cancel_pending(task_id, Clock::now(), ev)) {
        std::cout << "[TaskScheduler] TASK_CANCELLED id=" << task_id << " (was pending)\n";
        return true;
    }
    // Either not pending any more (possibly claimed a moment ago) or finished.
    if (store_.request_cancel(task_id)) {
        std::cout << "[TaskScheduler] CANCEL_REQUESTED id=" << task_id << " (is running)\n";
        return true;
    }
    return false;
}

bool TaskScheduler::mark_cancelled(const std::string& task_id, const std::string& reason) {
    Metadata ev;
    ev["reason"] = reason;
    bool ok = store_.finish(task_id, TaskStatus::Cancelled, Clock::now(), std::nullopt, std::nullopt, ev);
    if (ok) {
        std::cout << "[TaskScheduler] TASK_CANCELLED id=" << task_id << " (was running)\n";
    }
    return ok;
}

bool TaskScheduler::is_cancellation_requested(const std::string& task_id) {
    return store_.is_cancel_requested(task_id);
}

std::optional<Task> TaskScheduler::get(const std::string& task_id) {
    return store_.get_task(task_id);
}

std::vector<Task> TaskScheduler::list(std::optional<TaskStatus> status, int limit) {
    return store_.list_tasks(status, limit);
}

std::vector<TaskEvent> TaskScheduler::events(const std::string& task_id) {
    return store_.events(task_id);
}

std::map<TaskStatus, int64_t> TaskScheduler::stats() {
    return store_.count_by_status();
}

void TaskScheduler::wake_waiters() {
    std::lock_guard<std::mutex> lk(wait_mtx_);
    task_added_cv_.notify_all();
}

bool TaskScheduler::is_shut_down() {
    std::lock_guard<std::mutex> lk(wait_mtx_);
    return shutdown_;
}

void TaskScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lk(wait_mtx_);
        shutdown_ = true;
    }
    task_added_cv_.notify_all();
}

} // namespace courier
