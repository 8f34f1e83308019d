#include "conversation_state.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace courier;

static void test_combine_merges_in_order() {
    ConversationState st(1, 10);
    st.add_message("first", {{"a", 1}});
    st.add_message("second", {{"b", 2}});
    st.add_message("third", {{"a", 3}});
    assert(st.pending_count() == 3);

    CombinedMessage m = st.get_combined_message();
    assert(m.content == "first\nsecond\nthird");
    assert(m.metadata.size() == 2);
    assert(m.metadata["a"] == 3);
    assert(m.metadata["b"] == 2);
    assert(st.pending_count() == 0);

    CombinedMessage empty = st.get_combined_message();
    assert(empty.content.empty() && empty.metadata.empty());
}

static void test_add_while_processing_interrupts() {
    ConversationState st(1, 10);
    st.set_processing(true);
    AddResult r = st.add_message("late");
    assert(r.interrupted_processing && !r.interrupted_debounce);
    assert(st.pending_count() == 1);
    assert(st.interrupt_raised());

    assert(st.check_interrupt());
    assert(!st.check_interrupt());
    assert(st.pending_count() == 1);
}

static void test_add_while_debouncing_signals_debounce() {
    ConversationState st(1, 10);
    st.set_debouncing(true);
    AddResult r = st.add_message("again");
    assert(!r.interrupted_processing && r.interrupted_debounce);
    assert(st.debounce_raised());
    assert(!st.interrupt_raised());

    ConversationState idle(2, 10);
    AddResult r2 = idle.add_message("hi");
    assert(!r2.interrupted_processing && !r2.interrupted_debounce);
}

static void test_debounce_wait_ends_early_on_new_message() {
    ConversationState st(1, 10);
    uint64_t gen = 0;
    assert(st.try_acquire_loop(gen));
    uint64_t other = 0;
    assert(!st.try_acquire_loop(other));

    std::thread sender([&]{
        while (!st.is_debouncing()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        st.add_message("wake");
    });
    auto t0 = std::chrono::steady_clock::now();
    st.wait_for_debounce(std::chrono::milliseconds(5000), gen);
    auto waited = std::chrono::steady_clock::now() - t0;
    sender.join();
    assert(waited < std::chrono::milliseconds(2000));
    assert(st.pending_count() == 1);
}

static void test_begin_batch_clears_stale_signals() {
    ConversationState st(1, 10);
    uint64_t gen = 0;
    assert(st.try_acquire_loop(gen));
    st.set_processing(true);
    st.add_message("one");
    assert(st.interrupt_raised());

    auto batch = st.begin_batch(gen);
    assert(batch && batch->content == "one");
    assert(st.is_processing());
    assert(!st.interrupted(gen));
    assert(st.finish_batch(gen));
    assert(!st.is_processing());
    assert(st.release_loop_if_idle(gen));
}

static void test_release_refused_while_pending() {
    ConversationState st(1, 10);
    uint64_t gen = 0;
    assert(st.try_acquire_loop(gen));
    st.add_message("waiting");
    assert(!st.release_loop_if_idle(gen));
    uint64_t other = 0;
    assert(!st.try_acquire_loop(other));
}

static void test_reset_abandons_generation() {
    ConversationState st(1, 10);
    uint64_t gen = 0;
    assert(st.try_acquire_loop(gen));
    auto batch = st.begin_batch(gen);
    assert(batch);
    st.add_message("queued");

    assert(st.reset());
    assert(!st.is_current(gen));
    assert(!st.is_processing());
    assert(st.pending_count() == 0);
    // the old loop sees an interrupt forever and cannot touch the state
    assert(st.interrupted(gen));
    assert(!st.finish_batch(gen));
    assert(!st.begin_batch(gen));
    assert(st.release_loop_if_idle(gen));

    uint64_t fresh = 0;
    assert(st.try_acquire_loop(fresh));
    assert(fresh != gen);

    ConversationState idle(2, 10);
    assert(!idle.reset());
}

int main() {
    test_combine_merges_in_order();
    test_add_while_processing_interrupts();
    test_add_while_debouncing_signals_debounce();
    test_debounce_wait_ends_early_on_new_message();
    test_begin_batch_clears_stale_signals();
    test_release_refused_while_pending();
    test_reset_abandons_generation();
    std::cout << "ConversationState test PASSED\n";
    return 0;
}
