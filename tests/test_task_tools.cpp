#include "task_tools.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <string>
#include <vector>

using namespace courier;

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Value of the first "key: value" line with that key, list dashes ignored.
static std::string field(const std::string& text, const std::string& key) {
    std::string prefix = key + ": ";
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(pos, end - pos);
        size_t start = line.find_first_not_of(" -");
        if (start != std::string::npos && line.compare(start, prefix.size(), prefix) == 0)
            return line.substr(start + prefix.size());
        pos = end + 1;
    }
    return "";
}

static void test_spawn_validates_and_notifies() {
    TaskStore store;
    store.open(":memory:");
    TaskScheduler sched(store);
    std::vector<std::string> notices;
    TaskTools tools(sched, [&](const std::string& text) { notices.push_back(text); });

    std::string bad_mode = tools.spawn_task("x", "turbo");
    assert(field(bad_mode, "success") == "false");
    assert(contains(bad_mode, "Invalid mode 'turbo'"));
    assert(contains(bad_mode, "worker, subagent, or background"));

    std::string bad_prio = tools.spawn_task("x", "worker", "asap");
    assert(field(bad_prio, "success") == "false");
    assert(contains(bad_prio, "low, normal, high, or urgent"));
    assert(sched.list().empty());
    assert(notices.empty());

    std::string desc(80, 'd');
    std::string out = tools.spawn_task(desc, "subagent", "high");
    assert(field(out, "success") == "true");
    std::string id = field(out, "task_id");
    auto task = sched.get(id);
    assert(task);
    assert(task->mode == TaskMode::Subagent);
    assert(task->priority == TaskPriority::High);
    assert(task->created_by == "agent");
    assert(field(out, "status") == "pending");
    assert(contains(out, "get_task_status('" + id + "')"));

    assert(notices.size() == 1);
    assert(contains(notices[0], "Background task started: " + std::string(60, 'd') + "..."));
    assert(contains(notices[0], "Task ID: " + id.substr(0, 8)));
    assert(contains(notices[0], "Mode: subagent | Priority: high"));
}

static void test_notifier_failure_is_ignored() {
    TaskStore store;
    store.open(":memory:");
    TaskScheduler sched(store);
    TaskTools tools(sched, [](const std::string&) { throw std::runtime_error("transport down"); });
    std::string out = tools.spawn_task("still created");
    assert(field(out, "success") == "true");
    assert(sched.list().size() == 1);

    TaskTools silent(sched);
    assert(field(silent.spawn_task("no notifier"), "success") == "true");
}

static void test_list_tasks() {
    TaskStore store;
    store.open(":memory:");
    TaskScheduler sched(store);
    TaskTools tools(sched);

    Task a = sched.create(std::string(150, 'a'));
    Task b = sched.create("second");
    assert(sched.claim(b.id));
    sched.report_progress(b.id, 0.42, std::string("halfway"));
    Task c = sched.create("third");
    assert(sched.claim(c.id));
    assert(sched.fail(c.id, std::string(300, 'e')));

    std::string bad = tools.list_tasks("sleeping");
    assert(field(bad, "success") == "false");
    assert(contains(bad, "Invalid status 'sleeping'"));

    std::string all = tools.list_tasks();
    assert(field(all, "success") == "true");
    assert(field(all, "count") == "3");
    assert(contains(all, std::string(100, 'a') + "...\n"));
    assert(!contains(all, std::string(101, 'a')));
    assert(contains(all, "progress: 42%"));
    assert(contains(all, "progress_message: halfway"));
    assert(contains(all, "error: " + std::string(100, 'e') + "\n"));
    assert(field(all, "pending") == "1");
    assert(field(all, "running") == "1");
    assert(field(all, "failed") == "1");

    std::string running = tools.list_tasks("running");
    assert(field(running, "count") == "1");
    assert(field(running, "id") == b.id);

    assert(field(tools.list_tasks("", 2), "count") == "2");
}

static void test_get_task_status() {
    TaskStore store;
    store.open(":memory:");
    TaskScheduler sched(store);
    TaskTools tools(sched);

    std::string missing = tools.get_task_status("nope");
    assert(field(missing, "success") == "false");
    assert(contains(missing, "Task not found: nope"));

    Task t = sched.create("chatty");
    assert(sched.claim(t.id));
    for (int i = 0; i < 12; ++i) sched.report_progress(t.id, i / 12.0, "step " + std::to_string(i));

    std::string out = tools.get_task_status(t.id);
    assert(field(out, "success") == "true");
    assert(field(out, "id") == t.id);
    assert(field(out, "status") == "running");
    assert(field(out, "event_count") == "14");
    assert(!contains(out, "event_type: created"));
    assert(!contains(out, "message: step 1\n"));
    assert(contains(out, "message: step 2\n"));
    assert(contains(out, "message: step 11\n"));
    assert(contains(out, "progress_message: step 11"));
}

static void test_cancel_task() {
    TaskStore store;
    store.open(":memory:");
    TaskScheduler sched(store);
    TaskTools tools(sched);

    assert(contains(tools.cancel_task("ghost"), "Task not found: ghost"));

    Task pending = sched.create("queued");
    std::string out = tools.cancel_task(pending.id);
    assert(field(out, "success") == "true");
    assert(field(out, "message") == "Task cancelled immediately (was pending)");
    assert(sched.get(pending.id)->status == TaskStatus::Cancelled);

    std::string again = tools.cancel_task(pending.id);
    assert(field(again, "success") == "false");
    assert(contains(again, "Task already finished with status: cancelled"));

    Task running = sched.create("busy");
    assert(sched.claim(running.id));
    out = tools.cancel_task(running.id);
    assert(field(out, "message") == "Cancellation requested (task is running, may take a moment)");
    assert(sched.get(running.id)->status == TaskStatus::Running);
    assert(sched.is_cancellation_requested(running.id));
}

static void test_notice_ellipsis_keeps_utf8() {
    TaskStore store;
    store.open(":memory:");
    TaskScheduler sched(store);
    std::vector<std::string> notices;
    TaskTools tools(sched, [&](const std::string& text) { notices.push_back(text); });

    const std::string e_acute = "\xc3\xa9";
    std::string desc = std::string(59, 'd') + e_acute + "tude des logs";
    tools.spawn_task(desc);
    assert(notices.size() == 1);
    assert(contains(notices[0], "Background task started: " + std::string(59, 'd') + e_acute + "...\n"));

    std::string exact = std::string(58, 'x') + e_acute + e_acute;
    tools.spawn_task(exact);
    assert(notices.size() == 2);
    assert(contains(notices[1], "Background task started: " + exact + "\n"));
}

static void test_cancel_message_follows_final_state() {
    TaskStore store;
    store.open(":memory:");
    TaskScheduler sched(store);
    TaskTools tools(sched);

    for (int round = 0; round < 50; ++round) {
        Task t = sched.create("contended " + std::to_string(round));
        std::thread claimer([&] { sched.claim(t.id); });
        std::string out = tools.cancel_task(t.id);
        claimer.join();

        assert(field(out, "success") == "true");
        auto after = sched.get(t.id);
        std::string message = field(out, "message");
        if (message == "Cancellation requested (task is running, may take a moment)") {
            assert(after->status == TaskStatus::Running);
            assert(after->cancel_requested);
        } else {
            assert(message == "Task cancelled immediately (was pending)");
            assert(after->status == TaskStatus::Cancelled);
            assert(!after->cancel_requested);
        }
    }
}

int main() {
    test_spawn_validates_and_notifies();
    test_notifier_failure_is_ignored();
    test_list_tasks();
    test_get_task_status();
    test_cancel_task();
    test_notice_ellipsis_keeps_utf8();
    test_cancel_message_follows_final_state();
    std::cout << "TaskTools test PASSED\n";
    return 0;
}
