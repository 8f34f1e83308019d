#pragma once
#include "include/courier.hpp"
#include "collaborators.hpp"
#include "task_scheduler.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace courier {

// Per-task handle given to strategies and tool runners. Owned by the executor
// for the duration of one task; nothing here is global.
class ExecutionContext {
public:
    ExecutionContext(TaskScheduler& scheduler, const Task& task, const std::atomic<bool>& stop_requested);

    const Task& task() const { return task_; }

    void progress(double value, const std::string& message);

    // Cancellation checkpoint. On the first positive poll the task is moved
    // to cancelled here; callers just return early.
    bool cancelled();

    // Sleeps up to `d`, returning false early if the executor is stopping.
    bool pause(std::chrono::milliseconds d);
    bool stopping() const { return stop_requested_.load(); }

private:
    TaskScheduler& scheduler_;
    Task task_;
    const std::atomic<bool>& stop_requested_;
    bool cancelled_;
};

struct ExecutionOutcome {
    bool cancelled = false;
    std::string output;

    static ExecutionOutcome done(std::string output) { return {false, std::move(output)}; }
    static ExecutionOutcome aborted(std::string note) { return {true, std::move(note)}; }
};

class ExecutionStrategy {
public:
    virtual ~ExecutionStrategy() = default;
    // Throws on failure; the executor turns that into a failed task.
    virtual ExecutionOutcome execute(ExecutionContext& ctx) = 0;
};

// Runs tools in-process, no agent involved.
class WorkerStrategy : public ExecutionStrategy {
public:
    explicit WorkerStrategy(ToolRunner& tools);
    ExecutionOutcome execute(ExecutionContext& ctx) override;

private:
    ToolRunner& tools_;
};

// Spawns a throwaway agent for the task; it is destroyed on every exit path.
class SubagentStrategy : public ExecutionStrategy {
public:
    explicit SubagentStrategy(AgentProvider& agents);
    ExecutionOutcome execute(ExecutionContext& ctx) override;

private:
    AgentProvider& agents_;
};

// Hands the task to the primary agent's async runs and polls until done or
// until max_polls * poll_interval has elapsed.
class BackgroundStrategy : public ExecutionStrategy {
public:
    BackgroundStrategy(AgentProvider& agents, std::chrono::milliseconds poll_interval, int max_polls);
    ExecutionOutcome execute(ExecutionContext& ctx) override;

private:
    AgentProvider& agents_;
    std::chrono::milliseconds poll_interval_;
    int max_polls_;
};

} // namespace courier
