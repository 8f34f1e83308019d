#pragma once
#include "include/courier.hpp"
#include "collaborators.hpp"
#include "task_scheduler.hpp"
#include <string>

namespace courier {

// Tool-facing surface over one scheduler. Every call returns plain
// `key: value` text for the agent to read; bad input is reported in the
// text, never thrown.
class TaskTools {
public:
    explicit TaskTools(TaskScheduler& scheduler, Notifier notifier = Notifier());

    std::string spawn_task(const std::string& description,
                           const std::string& mode = "worker",
                           const std::string& priority = "normal");

    // Empty status lists everything.
    std::string list_tasks(const std::string& status = "", int limit = 10);

    std::string get_task_status(const std::string& task_id);

    std::string cancel_task(const std::string& task_id);

private:
    void notify(const std::string& text);

    TaskScheduler& scheduler_;
    Notifier notifier_;
};

} // namespace courier
