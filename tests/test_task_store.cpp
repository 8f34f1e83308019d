#include "include/task_store.hpp"
#include "include/errors.hpp"
#include <cassert>
#include <iostream>

using namespace courier;

static Task make_task(const std::string& desc, TaskPriority prio = TaskPriority::Normal) {
    Task t;
    t.id = generate_uuid();
    t.description = desc;
    t.priority = prio;
    t.created_at = Clock::now();
    t.created_by = "test";
    return t;
}

static void test_insert_and_read_back() {
    TaskStore store;
    store.open(":memory:");
    assert(store.is_open());

    Task t = make_task("index the repo");
    t.mode = TaskMode::Background;
    t.metadata = {{"origin", "chat"}, {"chat_id", "77"}};
    store.insert_task(t, {{"description", t.description}});

    auto got = store.get_task(t.id);
    assert(got);
    assert(got->description == "index the repo");
    assert(got->mode == TaskMode::Background);
    assert(got->status == TaskStatus::Pending);
    assert(got->created_by == "test");
    assert(got->metadata.at("origin") == "chat");
    assert(got->metadata.at("chat_id") == "77");
    assert(!got->started_at && !got->result && !got->progress);
    assert(!got->cancel_requested);

    auto evs = store.events(t.id);
    assert(evs.size() == 1);
    assert(evs[0].event_type == TaskEventType::Created);
    assert(evs[0].data.at("description") == "index the repo");

    assert(!store.get_task("missing"));
}

static void test_metadata_keeps_json_types() {
    TaskStore store;
    store.open(":memory:");

    Task t = make_task("typed");
    t.metadata = {
        {"count", 3},
        {"ratio", 0.5},
        {"flag", true},
        {"nothing", nullptr},
        {"tags", Metadata::array({"a", "b"})},
        {"nested", {{"k", "v"}, {"depth", 2}}},
        {"label", "x\"y"},
    };
    store.insert_task(t, {{"attempt", 1}});

    auto got = store.get_task(t.id);
    assert(got);
    const Metadata& m = got->metadata;
    assert(m == t.metadata);
    assert(m.at("count").is_number_integer() && m.at("count") == 3);
    assert(m.at("ratio").is_number_float() && m.at("ratio") == 0.5);
    assert(m.at("flag").is_boolean() && m.at("flag") == true);
    assert(m.at("nothing").is_null());
    assert(m.at("tags").is_array() && m.at("tags").size() == 2 && m.at("tags")[1] == "b");
    assert(m.at("nested").is_object() && m.at("nested").at("depth") == 2);
    assert(m.at("label") == "x\"y");

    auto evs = store.events(t.id);
    assert(evs[0].data.at("attempt").is_number_integer());

    // The running-path cancel adds its flag without disturbing the rest.
    assert(store.claim(t.id, Clock::now()));
    assert(store.request_cancel(t.id));
    auto flagged = store.get_task(t.id);
    assert(flagged->metadata.at("cancel_requested") == true);
    assert(flagged->metadata.at("count") == 3);
    assert(flagged->metadata.at("tags") == t.metadata.at("tags"));

    Task empty = make_task("no metadata");
    store.insert_task(empty, {});
    auto e = store.get_task(empty.id);
    assert(e->metadata.is_object() && e->metadata.empty());
}

static void test_claim_is_conditional() {
    TaskStore store;
    store.open(":memory:");
    Task t = make_task("once");
    store.insert_task(t, {});

    assert(store.claim(t.id, Clock::now()));
    assert(!store.claim(t.id, Clock::now()));
    auto got = store.get_task(t.id);
    assert(got->status == TaskStatus::Running);
    assert(got->started_at);

    auto evs = store.events(t.id);
    assert(evs.size() == 2);
    assert(evs[1].event_type == TaskEventType::Started);
}

static void test_finish_and_cancel_rules() {
    TaskStore store;
    store.open(":memory:");
    Task t = make_task("finish me");
    store.insert_task(t, {});

    // not running yet
    assert(!store.finish(t.id, TaskStatus::Completed, Clock::now(), std::string("x"), std::nullopt, {}));
    assert(!store.request_cancel(t.id));

    assert(store.claim(t.id, Clock::now()));
    assert(store.request_cancel(t.id));
    assert(store.is_cancel_requested(t.id));
    auto running = store.get_task(t.id);
    assert(running->status == TaskStatus::Running);
    assert(running->cancel_requested);
    assert(running->metadata.at("cancel_requested").is_boolean());
    assert(running->metadata.at("cancel_requested") == true);

    assert(store.finish(t.id, TaskStatus::Completed, Clock::now(), std::string("done"), std::nullopt,
                        {{"result", "done"}}));
    auto done = store.get_task(t.id);
    assert(done->status == TaskStatus::Completed);
    assert(done->result && *done->result == "done");
    assert(done->progress && *done->progress == 1.0);
    assert(done->completed_at);

    assert(!store.finish(t.id, TaskStatus::Failed, Clock::now(), std::nullopt, std::string("late"), {}));
    assert(!store.cancel_pending(t.id, Clock::now(), {}));
    assert(!store.request_cancel(t.id));

    // a non-terminal target is refused
    Task u = make_task("other");
    store.insert_task(u, {});
    assert(store.claim(u.id, Clock::now()));
    assert(!store.finish(u.id, TaskStatus::Pending, Clock::now(), std::nullopt, std::nullopt, {}));
}

static void test_next_pending_priority_order() {
    TaskStore store;
    store.open(":memory:");
    Task low = make_task("low", TaskPriority::Low);
    Task urgent = make_task("urgent", TaskPriority::Urgent);
    Task normal_a = make_task("normal-a", TaskPriority::Normal);
    Task normal_b = make_task("normal-b", TaskPriority::Normal);
    normal_b.created_at = normal_a.created_at;
    store.insert_task(low, {});
    store.insert_task(urgent, {});
    store.insert_task(normal_a, {});
    store.insert_task(normal_b, {});

    const char* expected[] = {"urgent", "normal-a", "normal-b", "low"};
    for (const char* name : expected) {
        auto next = store.next_pending();
        assert(next && next->description == name);
        assert(store.claim(next->id, Clock::now()));
    }
    assert(!store.next_pending());
}

static void test_progress_and_counts() {
    TaskStore store;
    store.open(":memory:");
    Task t = make_task("progress");
    store.insert_task(t, {});
    assert(store.update_progress(t.id, 0.4, std::string("reading")));
    assert(store.update_progress(t.id, 0.2, std::nullopt));
    assert(!store.update_progress("missing", 0.5, std::nullopt));

    auto got = store.get_task(t.id);
    assert(got->progress && *got->progress == 0.2);
    assert(!got->progress_message);

    auto evs = store.events(t.id);
    assert(evs.size() == 3);
    assert(evs[1].event_type == TaskEventType::Progress);
    assert(evs[1].data.at("message") == "reading");
    assert(evs[1].data.at("progress").is_number());
    assert(evs[1].data.at("progress").get<double>() == 0.4);

    Task c = make_task("to cancel");
    store.insert_task(c, {});
    assert(store.cancel_pending(c.id, Clock::now(), {{"reason", "user_requested"}}));

    auto counts = store.count_by_status();
    assert(counts.size() == 5);
    assert(counts[TaskStatus::Pending] == 1);
    assert(counts[TaskStatus::Cancelled] == 1);
    assert(counts[TaskStatus::Running] == 0);

    auto pending = store.list_tasks(TaskStatus::Pending, 10);
    assert(pending.size() == 1 && pending[0].id == t.id);
    auto all = store.list_tasks(std::nullopt, 10);
    assert(all.size() == 2 && all[0].id == c.id);
    assert(store.list_tasks(std::nullopt, 1).size() == 1);
}

static void test_closed_store_throws() {
    TaskStore store;
    bool threw = false;
    try {
        store.get_task("x");
    } catch (const StoreError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        store.open("/nonexistent-dir/sub/tasks.db");
    } catch (const StoreError&) {
        threw = true;
    }
    assert(threw);
    assert(!store.is_open());
}

int main() {
    test_insert_and_read_back();
    test_metadata_keeps_json_types();
    test_claim_is_conditional();
    test_finish_and_cancel_rules();
    test_next_pending_priority_order();
    test_progress_and_counts();
    test_closed_store_throws();
    std::cout << "TaskStore test PASSED\n";
    return 0;
}
