#pragma once
#include "include/courier.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace courier {

struct PendingMessage {
    std::string content;
    Metadata metadata = Metadata::object();
    Timestamp created_at;
};

struct AddResult {
    bool interrupted_processing = false;
    bool interrupted_debounce = false;
};

struct CombinedMessage {
    std::string content;
    Metadata metadata = Metadata::object();
};

// Per-conversation buffer and flags. All members are guarded by one mutex so
// add_message() can race freely with the loop that owns the conversation.
//
// The generation counter changes only on reset(); a loop started under an
// older generation has been abandoned and must not touch the state again.
class ConversationState {
public:
    ConversationState(int64_t conversation_id, int64_t participant_id);

    int64_t conversation_id() const { return conversation_id_; }
    int64_t participant_id() const { return participant_id_; }

    // Buffers the message and signals whichever phase the loop is in.
    AddResult add_message(const std::string& content, const Metadata& metadata = Metadata::object());

    // Drains the buffer: contents joined by newline in arrival order,
    // metadata merged with later keys winning.
    CombinedMessage get_combined_message();

    // Edge-triggered: reports and clears the interrupt signal.
    bool check_interrupt();

    bool is_processing() const;
    bool is_debouncing() const;
    size_t pending_count() const;
    bool interrupt_raised() const;
    bool debounce_raised() const;

    void set_processing(bool value);
    void set_debouncing(bool value);

    // ---- loop ownership, used by ConversationManager ----

    // Takes ownership if no loop is active; `generation` receives the
    // generation the new loop runs under.
    bool try_acquire_loop(uint64_t& generation);

    // Gives up ownership when nothing is pending. Also true when the loop is
    // stale, so the caller always exits on true.
    bool release_loop_if_idle(uint64_t generation);

    // Debounce phase: waits up to `d`, returning early once the debounce
    // signal is raised or the generation moves on.
    void wait_for_debounce(std::chrono::milliseconds d, uint64_t generation);

    // Drains pending messages into one batch and enters the processing
    // phase. Leftover interrupt/debounce signals belong to the drained
    // messages and are cleared. nullopt when stale.
    std::optional<CombinedMessage> begin_batch(uint64_t generation);

    // Leaves the processing phase. False when stale.
    bool finish_batch(uint64_t generation);

    // What the processing callback polls.
    bool interrupted(uint64_t generation);

    bool is_current(uint64_t generation) const;

    // Hard cancel: new generation, flags and buffer cleared, ownership
    // released. Returns whether anything was in flight or queued.
    bool reset();

private:
    CombinedMessage combine_locked();

    const int64_t conversation_id_;
    const int64_t participant_id_;

    mutable std::mutex mtx_;
    std::condition_variable debounce_cv_;
    std::deque<PendingMessage> pending_;
    bool is_processing_;
    bool is_debouncing_;
    bool interrupt_signal_;
    bool debounce_signal_;
    bool loop_active_;
    uint64_t generation_;
};

} // namespace courier
