#include "conversation_manager.hpp"
#include <iostream>

namespace courier {

ConversationManager::ConversationManager(std::chrono::milliseconds debounce)
    : debounce_(debounce), shutting_down_(false) {}

ConversationManager::~ConversationManager() {
    shutdown();
}

std::shared_ptr<ConversationState> ConversationManager::get_or_create_state(int64_t conversation_id,
                                                                            int64_t participant_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = states_.find(conversation_id);
    if (it != states_.end()) return it->second;
    auto state = std::make_shared<ConversationState>(conversation_id, participant_id);
    states_.emplace(conversation_id, state);
    return state;
}

std::shared_ptr<ConversationState> ConversationManager::find_state(int64_t conversation_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = states_.find(conversation_id);
    return it == states_.end() ? nullptr : it->second;
}

void ConversationManager::add_message(int64_t conversation_id, int64_t participant_id,
                                      const std::string& content, const Metadata& metadata,
                                      ProcessCallback callback) {
    auto state = get_or_create_state(conversation_id, participant_id);
    AddResult r = state->add_message(content, metadata);
    if (r.interrupted_processing) {
        std::cout << "[ConversationManager] INTERRUPT conversation=" << conversation_id
                  << " pending=" << state->pending_count() << "\n";
        return;
    }
    if (r.interrupted_debounce) {
        std::cout << "[ConversationManager] DEBOUNCE_EXTENDED conversation=" << conversation_id << "\n";
        return;
    }

    uint64_t generation = 0;
    if (!state->try_acquire_loop(generation)) return;

    // First batch is taken here so the conversation reads as processing by
    // the time add_message returns.
    std::optional<CombinedMessage> first = state->begin_batch(generation);

    std::lock_guard<std::mutex> lk(mtx_);
    if (shutting_down_) {
        std::cerr << "[ConversationManager] DROPPED_AFTER_SHUTDOWN conversation=" << conversation_id << "\n";
        state->reset();
        return;
    }
    reap_finished_locked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    LoopThread lt;
    lt.done = done;
    lt.th = std::thread([this, state, generation, first, callback, done]() {
        process_loop(state, generation, first, callback);
        done->store(true);
    });
    loops_.push_back(std::move(lt));
    std::cout << "[ConversationManager] LOOP_STARTED conversation=" << conversation_id
              << " generation=" << generation << "\n";
}

bool ConversationManager::drain(const std::shared_ptr<ConversationState>& state, const ProcessCallback& callback) {
    uint64_t generation = 0;
    if (!state->try_acquire_loop(generation)) return false;
    process_loop(state, generation, state->begin_batch(generation), callback);
    return true;
}

void ConversationManager::process_loop(const std::shared_ptr<ConversationState>& state, uint64_t generation,
                                       std::optional<CombinedMessage> batch, const ProcessCallback& callback) {
    const int64_t cid = state->conversation_id();
    const int64_t pid = state->participant_id();
    InterruptCheck interrupt_check = [state, generation]() { return state->interrupted(generation); };

    while (true) {
        if (!batch) {
            if (state->release_loop_if_idle(generation)) break;
            // Not the first batch since idle: let a burst settle first.
            state->wait_for_debounce(debounce_, generation);
            batch = state->begin_batch(generation);
            if (!batch) break;
        }
        if (batch->content.empty() && batch->metadata.empty()) {
            if (!state->finish_batch(generation)) break;
            batch.reset();
            continue;
        }

        std::cout << "[ConversationManager] PROCESSING conversation=" << cid
                  << " chars=" << batch->content.size() << "\n";
        try {
            callback(cid, pid, batch->content, batch->metadata, interrupt_check);
        } catch (const std::exception& e) {
            std::cerr << "[ConversationManager] CALLBACK_ERROR conversation=" << cid
                      << " err=" << e.what() << " batch_dropped_chars=" << batch->content.size() << "\n";
        } catch (...) {
            std::cerr << "[ConversationManager] CALLBACK_ERROR conversation=" << cid
                      << " err=unknown batch_dropped_chars=" << batch->content.size() << "\n";
        }

        if (!state->finish_batch(generation)) {
            std::cout << "[ConversationManager] LOOP_ABANDONED conversation=" << cid
                      << " generation=" << generation << "\n";
            return;
        }
        batch.reset();
    }
    std::cout << "[ConversationManager] LOOP_IDLE conversation=" << cid << "\n";
}

bool ConversationManager::cancel(int64_t conversation_id) {
    auto state = find_state(conversation_id);
    if (!state) return false;
    bool had_work = state->reset();
    std::cout << "[ConversationManager] CANCELLED conversation=" << conversation_id
              << " had_work=" << had_work << "\n";
    return had_work;
}

bool ConversationManager::is_processing(int64_t conversation_id) const {
    auto state = find_state(conversation_id);
    return state && state->is_processing();
}

bool ConversationManager::is_debouncing(int64_t conversation_id) const {
    auto state = find_state(conversation_id);
    return state && state->is_debouncing();
}

size_t ConversationManager::pending_count(int64_t conversation_id) const {
    auto state = find_state(conversation_id);
    return state ? state->pending_count() : 0;
}

size_t ConversationManager::conversation_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return states_.size();
}

void ConversationManager::reap_finished_locked() {
    for (auto it = loops_.begin(); it != loops_.end();) {
        if (it->done->load()) {
            if (it->th.joinable()) it->th.join();
            it = loops_.erase(it);
        } else {
            ++it;
        }
    }
}

void ConversationManager::shutdown() {
    std::list<LoopThread> loops;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shutting_down_ && loops_.empty()) return;
        shutting_down_ = true;
        for (auto& kv : states_) kv.second->reset();
        loops.swap(loops_);
    }
    // Abandoned callbacks see interrupt_check() == true and wind down.
    for (auto& lt : loops) {
        if (lt.th.joinable()) lt.th.join();
    }
}

} // namespace courier
