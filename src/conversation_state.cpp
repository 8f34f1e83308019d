#include "conversation_state.hpp"

namespace courier {

ConversationState::ConversationState(int64_t conversation_id, int64_t participant_id)
    : conversation_id_(conversation_id), participant_id_(participant_id),
      is_processing_(false), is_debouncing_(false),
      interrupt_signal_(false), debounce_signal_(false),
      loop_active_(false), generation_(0) {}

AddResult ConversationState::add_message(const std::string& content, const Metadata& metadata) {
    AddResult r;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pending_.push_back(PendingMessage{content, metadata, Clock::now()});
        if (is_processing_) {
            interrupt_signal_ = true;
            r.interrupted_processing = true;
        } else if (is_debouncing_) {
            debounce_signal_ = true;
            r.interrupted_debounce = true;
        }
    }
    if (r.interrupted_debounce) debounce_cv_.notify_all();
    return r;
}

CombinedMessage ConversationState::combine_locked() {
    CombinedMessage out;
    for (size_t i = 0; i < pending_.size(); ++i) {
        if (i) out.content += "\n";
        out.content += pending_[i].content;
        merge_metadata(out.metadata, pending_[i].metadata);
    }
    pending_.clear();
    return out;
}

CombinedMessage ConversationState::get_combined_message() {
    std::lock_guard<std::mutex> lk(mtx_);
    return combine_locked();
}

bool ConversationState::check_interrupt() {
    std::lock_guard<std::mutex> lk(mtx_);
    bool was = interrupt_signal_;
    interrupt_signal_ = false;
    return was;
}

bool ConversationState::is_processing() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return is_processing_;
}

bool ConversationState::is_debouncing() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return is_debouncing_;
}

size_t ConversationState::pending_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pending_.size();
}

bool ConversationState::interrupt_raised() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return interrupt_signal_;
}

bool ConversationState::debounce_raised() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return debounce_signal_;
}

void ConversationState::set_processing(bool value) {
    std::lock_guard<std::mutex> lk(mtx_);
    is_processing_ = value;
}

void ConversationState::set_debouncing(bool value) {
    std::lock_guard<std::mutex> lk(mtx_);
    is_debouncing_ = value;
}

bool ConversationState::try_acquire_loop(uint64_t& generation) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (loop_active_) return false;
    loop_active_ = true;
    generation = generation_;
    return true;
}

bool ConversationState::release_loop_if_idle(uint64_t generation) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (generation != generation_) return true;
    if (!pending_.empty()) return false;
    loop_active_ = false;
    is_debouncing_ = false;
    return true;
}

void ConversationState::wait_for_debounce(std::chrono::milliseconds d, uint64_t generation) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (generation != generation_) return;
    is_debouncing_ = true;
    debounce_signal_ = false;
    debounce_cv_.wait_for(lk, d, [&]{ return debounce_signal_ || generation != generation_; });
    if (generation == generation_) debounce_signal_ = false;
}

std::optional<CombinedMessage> ConversationState::begin_batch(uint64_t generation) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (generation != generation_) return std::nullopt;
    CombinedMessage batch = combine_locked();
    is_processing_ = true;
    is_debouncing_ = false;
    interrupt_signal_ = false;
    debounce_signal_ = false;
    return batch;
}

bool ConversationState::finish_batch(uint64_t generation) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (generation != generation_) return false;
    is_processing_ = false;
    return true;
}

bool ConversationState::interrupted(uint64_t generation) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (generation != generation_) return true;
    bool was = interrupt_signal_;
    interrupt_signal_ = false;
    return was;
}

bool ConversationState::is_current(uint64_t generation) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return generation == generation_;
}

bool ConversationState::reset() {
    bool had_work;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        had_work = is_processing_ || is_debouncing_ || !pending_.empty() || loop_active_;
        ++generation_;
        pending_.clear();
        is_processing_ = false;
        is_debouncing_ = false;
        interrupt_signal_ = false;
        debounce_signal_ = false;
        loop_active_ = false;
    }
    debounce_cv_.notify_all();
    return had_work;
}

} // namespace courier
