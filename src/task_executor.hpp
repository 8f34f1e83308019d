#pragma once
#include "include/courier.hpp"
#include "collaborators.hpp"
#include "execution.hpp"
#include "task_scheduler.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <thread>

namespace courier {

struct ExecutorOptions {
    std::chrono::milliseconds dequeue_timeout{5000};
    std::chrono::milliseconds poll_interval{5000};
    int max_polls = 60;
    // Back-off after a loop-level fault (store error etc.).
    std::chrono::milliseconds error_backoff{1000};
};

// Single consumer loop: dequeue, claim, run the strategy for the task's mode,
// record the outcome. Several executors may share one scheduler.
class TaskExecutor {
public:
    using CompletionHandler = std::function<void(const Task&)>;

    TaskExecutor(TaskScheduler& scheduler, ToolRunner& tools, AgentProvider& agents,
                 ExecutorOptions options = ExecutorOptions());
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    void start();
    void stop();
    bool running() const { return running_.load(); }

    // Called with the finished task after a successful completion.
    void set_completion_handler(CompletionHandler handler);

    // Replaces the strategy used for one mode.
    void set_strategy(TaskMode mode, std::unique_ptr<ExecutionStrategy> strategy);

    // Claims and runs one specific task on the calling thread. Returns false
    // if the claim was lost.
    bool run_task(const Task& task);

    uint64_t processed_count() const { return processed_.load(); }

private:
    void loop();
    void execute(const Task& task);
    void backoff();

    TaskScheduler& scheduler_;
    ExecutorOptions options_;
    std::map<TaskMode, std::unique_ptr<ExecutionStrategy>> strategies_;
    CompletionHandler on_complete_;

    std::thread th_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> processed_{0};
};

} // namespace courier
