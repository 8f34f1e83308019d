#include "execution.hpp"
#include "include/errors.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace courier {

const char* to_string(RunState state) {
    switch (state) {
    case RunState::Queued: return "queued";
    case RunState::Running: return "running";
    case RunState::Completed: return "completed";
    case RunState::Failed: return "failed";
    }
    return "queued";
}

ExecutionContext::ExecutionContext(TaskScheduler& scheduler, const Task& task, const std::atomic<bool>& stop_requested)
    : scheduler_(scheduler), task_(task), stop_requested_(stop_requested), cancelled_(false) {}

void ExecutionContext::progress(double value, const std::string& message) {
    scheduler_.report_progress(task_.id, value, message);
}

bool ExecutionContext::cancelled() {
    if (cancelled_) return true;
    if (!scheduler_.is_cancellation_requested(task_.id)) return false;
    std::cout << "[TaskExecutor] CANCEL_OBSERVED id=" << task_.id << "\n";
    scheduler_.mark_cancelled(task_.id);
    cancelled_ = true;
    return true;
}

bool ExecutionContext::pause(std::chrono::milliseconds d) {
    using namespace std::chrono;
    auto deadline = steady_clock::now() + d;
    while (!stopping()) {
        auto now = steady_clock::now();
        if (now >= deadline) return true;
        auto slice = std::min<steady_clock::duration>(deadline - now, milliseconds(50));
        std::this_thread::sleep_for(slice);
    }
    return false;
}

namespace {

// Keeps the ephemeral agent alive for one scope and always tears it down.
class AgentLease {
public:
    AgentLease(AgentProvider& provider, std::unique_ptr<EphemeralAgent> agent)
        : provider_(provider), agent_(std::move(agent)) {}
    ~AgentLease() {
        if (!agent_) return;
        try {
            provider_.destroy_ephemeral(*agent_);
            std::cout << "[TaskExecutor] SUBAGENT_DESTROYED agent=" << agent_->id() << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[TaskExecutor] SUBAGENT_DESTROY_FAILED agent=" << agent_->id()
                      << " err=" << e.what() << "\n";
        }
    }
    AgentLease(const AgentLease&) = delete;
    AgentLease& operator=(const AgentLease&) = delete;

    EphemeralAgent& agent() { return *agent_; }

private:
    AgentProvider& provider_;
    std::unique_ptr<EphemeralAgent> agent_;
};

} // namespace

WorkerStrategy::WorkerStrategy(ToolRunner& tools) : tools_(tools) {}

ExecutionOutcome WorkerStrategy::execute(ExecutionContext& ctx) {
    ctx.progress(0.1, "Starting worker execution...");
    if (ctx.cancelled()) return ExecutionOutcome::aborted("Task cancelled");

    std::string output = tools_.run(ctx.task().description, ctx);

    ctx.progress(0.9, "Finishing up...");
    if (ctx.cancelled()) return ExecutionOutcome::aborted("Task cancelled");
    return ExecutionOutcome::done(std::move(output));
}

SubagentStrategy::SubagentStrategy(AgentProvider& agents) : agents_(agents) {}

ExecutionOutcome SubagentStrategy::execute(ExecutionContext& ctx) {
    const Task& task = ctx.task();
    ctx.progress(0.1, "Creating subagent...");

    std::unique_ptr<EphemeralAgent> spawned = agents_.spawn_ephemeral(
        "task-worker-" + truncate(task.id, 8),
        "Worker agent for task: " + truncate(task.description, 100));
    if (!spawned) throw ExecutionFailure("Subagent could not be created");
    AgentLease lease(agents_, std::move(spawned));
    std::cout << "[TaskExecutor] SUBAGENT_SPAWNED task=" << task.id << " agent=" << lease.agent().id() << "\n";

    ctx.progress(0.2, "Subagent created, starting work...");
    if (ctx.cancelled()) return ExecutionOutcome::aborted("Task cancelled");

    std::string output = lease.agent().run(
        "Please complete this task:\n\n" + task.description +
        "\n\nWork through it step by step and provide a comprehensive result.");

    ctx.progress(0.8, "Subagent completed, collecting results...");
    if (ctx.cancelled()) return ExecutionOutcome::aborted("Task cancelled");

    if (output.empty()) output = "Subagent completed but returned no response";
    return ExecutionOutcome::done(std::move(output));
}

BackgroundStrategy::BackgroundStrategy(AgentProvider& agents, std::chrono::milliseconds poll_interval, int max_polls)
    : agents_(agents), poll_interval_(poll_interval), max_polls_(max_polls) {}

ExecutionOutcome BackgroundStrategy::execute(ExecutionContext& ctx) {
    const Task& task = ctx.task();
    ctx.progress(0.1, "Starting background execution...");

    std::string run_id = agents_.start_background_run(
        "[BACKGROUND TASK]\n\nPlease complete this task in the background:\n\n" + task.description +
        "\n\nWhen done, summarize your results.");
    ctx.progress(0.3, "Background run started: " + run_id);

    for (int i = 0; i < max_polls_; ++i) {
        if (ctx.cancelled()) {
            return ExecutionOutcome::aborted("Task cancelled (background run may still be processing)");
        }

        RunStatus status = agents_.poll_run(run_id);
        if (status.state == RunState::Completed) {
            ctx.progress(0.95, "Collecting results...");
            if (status.output.empty()) status.output = "Background task completed";
            return ExecutionOutcome::done(std::move(status.output));
        }
        if (status.state == RunState::Failed) {
            throw ExecutionFailure("Background run failed: " + status.error);
        }

        double p = 0.3 + (static_cast<double>(i) / max_polls_) * 0.6;
        ctx.progress(p, std::string("Background run status: ") + to_string(status.state));

        if (!ctx.pause(poll_interval_)) {
            throw ExecutionFailure("Executor stopped while waiting for background run " + run_id);
        }
    }

    auto total = std::chrono::duration_cast<std::chrono::seconds>(poll_interval_ * max_polls_);
    throw TaskTimeout("Background run timed out after " + std::to_string(total.count()) + " seconds");
}

} // namespace courier
