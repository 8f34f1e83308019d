#pragma once
#include "include/courier.hpp"
#include "conversation_state.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace courier {

using InterruptCheck = std::function<bool()>;

// The slow external routine that handles one combined batch. It should poll
// interrupt_check() and return early once it reports true; its return value
// is informational only.
using ProcessCallback = std::function<std::string(int64_t conversation_id,
                                                  int64_t participant_id,
                                                  const std::string& content,
                                                  const Metadata& metadata,
                                                  const InterruptCheck& interrupt_check)>;

// Registry of conversations plus one processing loop thread per busy
// conversation.
//
// The first message of an idle conversation is processed at once. Messages
// arriving while a batch runs interrupt it and are handled by the same loop
// after a debounce wait, which lets a burst collapse into one batch.
class ConversationManager {
public:
    explicit ConversationManager(std::chrono::milliseconds debounce = std::chrono::milliseconds(2000));
    ~ConversationManager();

    ConversationManager(const ConversationManager&) = delete;
    ConversationManager& operator=(const ConversationManager&) = delete;

    // Never waits for processing.
    void add_message(int64_t conversation_id, int64_t participant_id,
                     const std::string& content, const Metadata& metadata,
                     ProcessCallback callback);

    // Abandons the in-flight batch and drops everything queued.
    bool cancel(int64_t conversation_id);

    bool is_processing(int64_t conversation_id) const;
    bool is_debouncing(int64_t conversation_id) const;
    size_t pending_count(int64_t conversation_id) const;
    size_t conversation_count() const;

    std::shared_ptr<ConversationState> get_or_create_state(int64_t conversation_id, int64_t participant_id);

    // Runs the loop for `state` on the calling thread until it goes idle.
    // False if another loop already owns the conversation.
    bool drain(const std::shared_ptr<ConversationState>& state, const ProcessCallback& callback);

    // Cancels every conversation and joins all loop threads.
    void shutdown();

    std::chrono::milliseconds debounce() const { return debounce_; }

private:
    struct LoopThread {
        std::thread th;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::shared_ptr<ConversationState> find_state(int64_t conversation_id) const;
    void process_loop(const std::shared_ptr<ConversationState>& state, uint64_t generation,
                      std::optional<CombinedMessage> batch, const ProcessCallback& callback);
    void reap_finished_locked();

    const std::chrono::milliseconds debounce_;

    mutable std::mutex mtx_;
    std::map<int64_t, std::shared_ptr<ConversationState>> states_;
    std::list<LoopThread> loops_;
    bool shutting_down_;
};

} // namespace courier
