#include "config.hpp"
#include "conversation_manager.hpp"
#include "include/task_store.hpp"
#include "task_executor.hpp"
#include "task_scheduler.hpp"
#include "task_tools.hpp"
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>

using namespace courier;

namespace {

// Stand-in for real tool execution: echoes the description back.
class EchoToolRunner : public ToolRunner {
public:
    std::string run(const std::string& description, ExecutionContext& ctx) override {
        ctx.progress(0.5, "Echoing");
        return "echo: " + description;
    }
};

class LocalAgent : public EphemeralAgent {
public:
    explicit LocalAgent(std::string name) : name_(std::move(name)) {}
    std::string id() const override { return name_; }
    std::string run(const std::string& prompt) override {
        return name_ + " handled " + std::to_string(prompt.size()) + " chars";
    }

private:
    std::string name_;
};

// In-process agent backend; background runs finish on their second poll.
class LocalAgentProvider : public AgentProvider {
public:
    std::unique_ptr<EphemeralAgent> spawn_ephemeral(const std::string& name, const std::string&) override {
        std::cout << "[Demo] SPAWN agent=" << name << "\n";
        return std::unique_ptr<EphemeralAgent>(new LocalAgent(name));
    }
    void destroy_ephemeral(EphemeralAgent& agent) override {
        std::cout << "[Demo] DESTROY agent=" << agent.id() << "\n";
    }
    std::string start_background_run(const std::string&) override {
        std::lock_guard<std::mutex> lk(mtx_);
        std::string id = "run-" + std::to_string(++next_run_);
        polls_[id] = 0;
        return id;
    }
    RunStatus poll_run(const std::string& run_id) override {
        std::lock_guard<std::mutex> lk(mtx_);
        RunStatus st;
        st.state = ++polls_[run_id] >= 2 ? RunState::Completed : RunState::Running;
        if (st.state == RunState::Completed) st.output = run_id + " finished";
        return st;
    }

private:
    std::mutex mtx_;
    int next_run_ = 0;
    std::map<std::string, int> polls_;
};

} // namespace

int main() {
    Config cfg = load_config_from_env();

    TaskStore store;
    try {
        store.open(cfg.task_db_path);
    } catch (const std::exception& e) {
        std::cerr << "[Demo] cannot open task store: " << e.what() << "\n";
        return 1;
    }

    TaskScheduler scheduler(store);
    EchoToolRunner tools;
    LocalAgentProvider agents;

    ExecutorOptions opts;
    opts.dequeue_timeout = cfg.dequeue_timeout;
    opts.poll_interval = cfg.background_poll_interval;
    opts.max_polls = cfg.background_max_polls;
    TaskExecutor executor(scheduler, tools, agents, opts);
    executor.set_completion_handler([](const Task& t) {
        std::cout << "[Demo] DONE id=" << truncate(t.id, 8) << " result=" << t.result.value_or("") << "\n";
    });
    executor.start();

    TaskTools task_tools(scheduler, [](const std::string& text) { std::cout << "[Demo] NOTICE " << text << "\n"; });

    ConversationManager conversations(cfg.debounce);
    auto reply = [&task_tools](int64_t cid, int64_t, const std::string& content, const Metadata&,
                               const InterruptCheck& interrupted) -> std::string {
        for (int i = 0; i < 10; ++i) {
            if (interrupted()) return "";
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        std::cout << "[Demo] REPLY conversation=" << cid << " to=\"" << content << "\"\n";
        if (content.find("research") != std::string::npos) task_tools.spawn_task(content, "subagent", "high");
        return content;
    };

    conversations.add_message(1, 42, "hello", {}, reply);
    conversations.add_message(1, 42, "please research sqlite WAL mode", {}, reply);
    conversations.add_message(2, 7, "status?", {}, reply);

    task_tools.spawn_task("summarize the logs", "worker", "normal");
    task_tools.spawn_task("long running analysis", "background", "low");

    std::this_thread::sleep_for(std::chrono::seconds(3));
    std::cout << task_tools.list_tasks();

    conversations.shutdown();
    scheduler.shutdown();
    executor.stop();
    store.close();
    std::cout << "exiting\n";
    return 0;
}
