#pragma once
#include "include/courier.hpp"
#include <functional>
#include <memory>
#include <string>

namespace courier {

class ExecutionContext;

// In-process tool execution used by worker-mode tasks.
class ToolRunner {
public:
    virtual ~ToolRunner() = default;
    // May poll ctx.cancelled() between tool invocations.
    virtual std::string run(const std::string& description, ExecutionContext& ctx) = 0;
};

// Delegate agent that exists only for the duration of one task.
class EphemeralAgent {
public:
    virtual ~EphemeralAgent() = default;
    virtual std::string id() const = 0;
    virtual std::string run(const std::string& prompt) = 0;
};

enum class RunState : uint8_t {
    Queued,
    Running,
    Completed,
    Failed
};

const char* to_string(RunState state);

struct RunStatus {
    RunState state = RunState::Queued;
    std::string output;
    std::string error;
};

// Agent backend used by subagent and background modes.
class AgentProvider {
public:
    virtual ~AgentProvider() = default;

    virtual std::unique_ptr<EphemeralAgent> spawn_ephemeral(const std::string& name,
                                                            const std::string& description) = 0;
    virtual void destroy_ephemeral(EphemeralAgent& agent) = 0;

    // Asynchronous run on the primary agent; returns a run id for poll_run.
    virtual std::string start_background_run(const std::string& prompt) = 0;
    virtual RunStatus poll_run(const std::string& run_id) = 0;
};

// Plain-text notice towards the user's transport.
using Notifier = std::function<void(const std::string&)>;

} // namespace courier
