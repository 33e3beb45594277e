#pragma once

#include "common.h"
#include <memory>

namespace voxlink {

/**
 * @brief Session state enumeration
 */
enum class SessionState {
    Idle,        ///< No open utterance, no response of the current generation running
    Recording,   ///< Between start and end; audio goes to the recognizer
    Finalizing,  ///< Recognizer is producing the transcript
    Responding   ///< Pipeline of the current generation is running
};

const char* session_state_name(SessionState state);

/**
 * @brief Lifecycle of one connection's utterances
 *
 * - any state -> Recording (on_start; restarts an open utterance)
 * - Recording -> Finalizing (on_end)
 * - Finalizing -> Idle (on_transcript, blank)
 * - Finalizing -> Responding (on_transcript, text)
 * - Responding -> Idle (on_pipeline_finished for the responding generation)
 *
 * Thread-safe: pipeline threads report completion while the connection
 * thread drives the rest.
 */
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    SessionState get_state() const;

    /**
     * @brief A start message opened utterance `generation`
     */
    void on_start(Generation generation);

    /**
     * @brief An end message arrived
     * @return true if an utterance was open (Recording -> Finalizing)
     */
    bool on_end();

    /**
     * @brief Transcript of the finalizing utterance is known
     * @return true if a response should be generated
     */
    bool on_transcript(bool blank);

    /**
     * @brief Pipeline of `generation` returned
     *
     * Only the generation that is currently responding moves the session
     * back to Idle; superseded pipelines are ignored.
     */
    void on_pipeline_finished(Generation generation);

    bool is_recording() const;

    /// Generation of the utterance last opened by on_start
    Generation generation() const;

    /**
     * @brief Reset state machine to Idle
     */
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
