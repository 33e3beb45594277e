#include "state_machine.h"
#include <mutex>

namespace voxlink {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "IDLE";
        case SessionState::Recording: return "RECORDING";
        case SessionState::Finalizing: return "FINALIZING";
        case SessionState::Responding: return "RESPONDING";
        default: return "UNKNOWN";
    }
}

class StateMachine::Impl {
public:
    Impl() : state_(SessionState::Idle), generation_(0) {}

    SessionState get_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void on_start(Generation generation) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Recording;
        generation_ = generation;
    }

    bool on_end() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Recording) {
            return false;
        }
        state_ = SessionState::Finalizing;
        return true;
    }

    bool on_transcript(bool blank) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Finalizing) {
            return false;
        }
        state_ = blank ? SessionState::Idle : SessionState::Responding;
        return !blank;
    }

    void on_pipeline_finished(Generation generation) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Responding && generation == generation_) {
            state_ = SessionState::Idle;
        }
    }

    bool is_recording() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ == SessionState::Recording;
    }

    Generation generation() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Idle;
    }

private:
    mutable std::mutex mutex_;
    SessionState state_;
    Generation generation_;
};

StateMachine::StateMachine() : pimpl_(std::make_unique<Impl>()) {}
StateMachine::~StateMachine() = default;

SessionState StateMachine::get_state() const {
    return pimpl_->get_state();
}

void StateMachine::on_start(Generation generation) {
    pimpl_->on_start(generation);
}

bool StateMachine::on_end() {
    return pimpl_->on_end();
}

bool StateMachine::on_transcript(bool blank) {
    return pimpl_->on_transcript(blank);
}

void StateMachine::on_pipeline_finished(Generation generation) {
    pimpl_->on_pipeline_finished(generation);
}

bool StateMachine::is_recording() const {
    return pimpl_->is_recording();
}

Generation StateMachine::generation() const {
    return pimpl_->generation();
}

void StateMachine::reset() {
    pimpl_->reset();
}

} // namespace voxlink
