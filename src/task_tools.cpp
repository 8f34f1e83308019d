#include "task_tools.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace courier {

namespace {

std::string error_text(const std::string& msg) {
    return "success: false\nerror: " + msg + "\n";
}

std::string ellipsize(const std::string& s, size_t n) {
    return utf8_length(s) > n ? truncate(s, n) + "..." : s;
}

// Strings print bare, everything else as compact JSON.
std::string metadata_value(const Metadata& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump(-1, ' ', false, Metadata::error_handler_t::replace);
}

void write_metadata(std::ostringstream& os, const char* key, const Metadata& m, const std::string& indent) {
    if (!m.is_object() || m.empty()) return;
    os << indent << key << ":\n";
    for (auto it = m.begin(); it != m.end(); ++it) {
        os << indent << "  " << it.key() << ": " << metadata_value(it.value()) << "\n";
    }
}

void write_task(std::ostringstream& os, const Task& t, const std::string& indent) {
    os << indent << "id: " << t.id << "\n"
       << indent << "description: " << t.description << "\n"
       << indent << "mode: " << to_string(t.mode) << "\n"
       << indent << "priority: " << to_string(t.priority) << "\n"
       << indent << "status: " << to_string(t.status) << "\n"
       << indent << "created_at: " << format_timestamp(t.created_at) << "\n"
       << indent << "created_by: " << t.created_by << "\n";
    if (t.started_at) os << indent << "started_at: " << format_timestamp(*t.started_at) << "\n";
    if (t.completed_at) os << indent << "completed_at: " << format_timestamp(*t.completed_at) << "\n";
    if (t.progress) os << indent << "progress: " << *t.progress << "\n";
    if (t.progress_message) os << indent << "progress_message: " << *t.progress_message << "\n";
    if (t.result) os << indent << "result: " << *t.result << "\n";
    if (t.error) os << indent << "error: " << *t.error << "\n";
    write_metadata(os, "metadata", t.metadata, indent);
}

} // namespace

TaskTools::TaskTools(TaskScheduler& scheduler, Notifier notifier)
    : scheduler_(scheduler), notifier_(std::move(notifier)) {}

void TaskTools::notify(const std::string& text) {
    if (!notifier_) return;
    try {
        notifier_(text);
    } catch (const std::exception& e) {
        std::cerr << "[TaskTools] NOTIFY_FAILED err=" << e.what() << "\n";
    }
}

std::string TaskTools::spawn_task(const std::string& description, const std::string& mode,
                                  const std::string& priority) {
    auto m = parse_task_mode(mode);
    if (!m) return error_text("Invalid mode '" + mode + "'. Use: worker, subagent, or background");
    auto p = parse_task_priority(priority);
    if (!p) return error_text("Invalid priority '" + priority + "'. Use: low, normal, high, or urgent");

    Task task = scheduler_.create(description, *m, *p, "agent");

    std::ostringstream notice;
    notice << "Background task started: " << ellipsize(description, 60) << "\n\n"
           << "Task ID: " << truncate(task.id, 8) << "\n"
           << "Mode: " << to_string(task.mode) << " | Priority: " << to_string(task.priority);
    notify(notice.str());

    std::ostringstream os;
    os << "success: true\n"
       << "task_id: " << task.id << "\n"
       << "description: " << task.description << "\n"
       << "mode: " << to_string(task.mode) << "\n"
       << "priority: " << to_string(task.priority) << "\n"
       << "status: " << to_string(task.status) << "\n"
       << "message: Task created and queued. Use get_task_status('" << task.id << "') to check progress.\n";
    return os.str();
}

std::string TaskTools::list_tasks(const std::string& status, int limit) {
    std::optional<TaskStatus> filter;
    if (!status.empty()) {
        filter = parse_task_status(status);
        if (!filter) {
            return error_text("Invalid status '" + status +
                              "'. Use: pending, running, completed, failed, cancelled");
        }
    }

    auto tasks = scheduler_.list(filter, limit);
    std::ostringstream os;
    os << "success: true\n";
    os << "tasks:\n";
    for (const auto& t : tasks) {
        os << "  - id: " << t.id << "\n"
           << "    description: " << ellipsize(t.description, 100) << "\n"
           << "    mode: " << to_string(t.mode) << "\n"
           << "    priority: " << to_string(t.priority) << "\n"
           << "    status: " << to_string(t.status) << "\n"
           << "    created_at: " << format_timestamp(t.created_at) << "\n";
        if (t.progress) {
            os << "    progress: " << std::fixed << std::setprecision(0) << (*t.progress * 100.0) << "%\n";
            os.unsetf(std::ios::floatfield);
            os << std::setprecision(6);
        }
        if (t.progress_message && !t.progress_message->empty())
            os << "    progress_message: " << *t.progress_message << "\n";
        if (t.error && !t.error->empty()) os << "    error: " << truncate(*t.error, 100) << "\n";
    }
    os << "stats:\n";
    for (const auto& kv : scheduler_.stats()) os << "  " << to_string(kv.first) << ": " << kv.second << "\n";
    os << "count: " << tasks.size() << "\n";
    return os.str();
}

std::string TaskTools::get_task_status(const std::string& task_id) {
    auto task = scheduler_.get(task_id);
    if (!task) return error_text("Task not found: " + task_id);

    auto evs = scheduler_.events(task_id);
    std::ostringstream os;
    os << "success: true\n";
    os << "task:\n";
    write_task(os, *task, "  ");
    os << "events:\n";
    size_t first = evs.size() > 10 ? evs.size() - 10 : 0;
    for (size_t i = first; i < evs.size(); ++i) {
        const auto& e = evs[i];
        os << "  - event_type: " << to_string(e.event_type) << "\n"
           << "    timestamp: " << format_timestamp(e.timestamp) << "\n";
        write_metadata(os, "data", e.data, "    ");
    }
    os << "event_count: " << evs.size() << "\n";
    return os.str();
}

std::string TaskTools::cancel_task(const std::string& task_id) {
    auto task = scheduler_.get(task_id);
    if (!task) return error_text("Task not found: " + task_id);
    if (is_terminal(task->status)) {
        return error_text(std::string("Task already finished with status: ") + to_string(task->status));
    }

    if (!scheduler_.cancel(task_id)) return error_text("Failed to cancel task");

    // A claim may have landed since the read above; only the running path
    // sets the flag.
    auto after = scheduler_.get(task_id);
    bool requested = after && after->cancel_requested;

    std::ostringstream os;
    os << "success: true\n"
       << "task_id: " << task_id << "\n"
       << "message: "
       << (requested ? "Cancellation requested (task is running, may take a moment)"
                     : "Task cancelled immediately (was pending)")
       << "\n";
    std::cout << "[TaskTools] CANCEL id=" << task_id << " path=" << (requested ? "requested" : "immediate") << "\n";
    return os.str();
}

} // namespace courier
