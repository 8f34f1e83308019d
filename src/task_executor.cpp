#include "task_executor.hpp"
#include "include/errors.hpp"
#include <iostream>

namespace courier {

TaskExecutor::TaskExecutor(TaskScheduler& scheduler, ToolRunner& tools, AgentProvider& agents,
                           ExecutorOptions options)
    : scheduler_(scheduler), options_(options) {
    strategies_[TaskMode::Worker].reset(new WorkerStrategy(tools));
    strategies_[TaskMode::Subagent].reset(new SubagentStrategy(agents));
    strategies_[TaskMode::Background].reset(
        new BackgroundStrategy(agents, options_.poll_interval, options_.max_polls));
}

TaskExecutor::~TaskExecutor() {
    stop();
}

void TaskExecutor::start() {
    if (running_.exchange(true)) return;
    stop_requested_.store(false);
    th_ = std::thread(&TaskExecutor::loop, this);
    std::cout << "[TaskExecutor] STARTED\n";
}

void TaskExecutor::stop() {
    stop_requested_.store(true);
    if (!running_.exchange(false)) return;
    scheduler_.wake_waiters();
    if (th_.joinable()) th_.join();
    std::cout << "[TaskExecutor] STOPPED processed=" << processed_.load() << "\n";
}

void TaskExecutor::set_completion_handler(CompletionHandler handler) {
    on_complete_ = std::move(handler);
}

void TaskExecutor::set_strategy(TaskMode mode, std::unique_ptr<ExecutionStrategy> strategy) {
    strategies_[mode] = std::move(strategy);
}

void TaskExecutor::loop() {
    while (!stop_requested_.load()) {
        try {
            auto task = scheduler_.dequeue(options_.dequeue_timeout,
                                           [this]{ return stop_requested_.load(); });
            if (!task) {
                if (scheduler_.is_shut_down()) {
                    std::cout << "[TaskExecutor] SCHEDULER_SHUT_DOWN leaving loop\n";
                    return;
                }
                continue;
            }
            run_task(*task);
        } catch (const std::exception& e) {
            // Store trouble and the like; never let it end the loop.
            std::cerr << "[TaskExecutor] LOOP_ERROR err=" << e.what() << "\n";
            backoff();
        }
    }
}

void TaskExecutor::backoff() {
    auto deadline = std::chrono::steady_clock::now() + options_.error_backoff;
    while (!stop_requested_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

bool TaskExecutor::run_task(const Task& task) {
    if (!scheduler_.claim(task.id)) {
        std::cout << "[TaskExecutor] CLAIM_LOST id=" << task.id << "\n";
        return false;
    }
    std::cout << "[TaskExecutor] PROCESSING id=" << task.id << " mode=" << to_string(task.mode)
              << " desc=" << truncate(task.description, 50) << "\n";
    execute(task);
    processed_.fetch_add(1);
    return true;
}

void TaskExecutor::execute(const Task& task) {
    ExecutionContext ctx(scheduler_, task, stop_requested_);
    ExecutionOutcome outcome;
    try {
        auto it = strategies_.find(task.mode);
        if (it == strategies_.end() || !it->second) {
            throw ExecutionFailure(std::string("No strategy for mode ") + to_string(task.mode));
        }
        outcome = it->second->execute(ctx);
    } catch (const std::exception& e) {
        std::cerr << "[TaskExecutor] TASK_EXCEPTION id=" << task.id << " err=" << e.what() << "\n";
        scheduler_.fail(task.id, e.what());
        return;
    }

    if (outcome.cancelled) {
        // Normally already moved by the checkpoint; this covers strategies
        // that bail out without one.
        if (ctx.cancelled() || scheduler_.mark_cancelled(task.id)) {
            std::cout << "[TaskExecutor] TASK_ABORTED id=" << task.id << " note=" << outcome.output << "\n";
        }
        return;
    }

    if (!scheduler_.complete(task.id, outcome.output)) return;
    if (!on_complete_) return;

    try {
        auto finished = scheduler_.get(task.id);
        if (finished) on_complete_(*finished);
    } catch (const std::exception& e) {
        std::cerr << "[TaskExecutor] COMPLETION_HANDLER_ERROR id=" << task.id << " err=" << e.what() << "\n";
    }
}

} // namespace courier
