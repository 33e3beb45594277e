#pragma once

#include "common.h"
#include "config.h"
#include <string>
#include <memory>

namespace voxlink {

/**
 * @brief Per-utterance speech recognizer.
 *
 * start() opens a fresh utterance, feed() appends raw s16le PCM, stop()
 * closes it, text() transcribes what was collected (synchronously).
 */
class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    virtual void start() = 0;
    virtual void feed(const std::string& pcm_bytes) = 0;
    virtual void stop() = 0;
    virtual std::string text() = 0;
};

/**
 * @brief Shared whisper.cpp model.
 *
 * The model is loaded once; each transcribe() call uses its own
 * whisper_state so sessions can transcribe concurrently.
 */
class STTEngine {
public:
    explicit STTEngine(const STTConfig& config);
    ~STTEngine();

    // Non-copyable
    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    // Transcribe 16 kHz mono audio; empty string on failure
    std::string transcribe(const AudioBuffer& audio);

    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief SpeechRecognizer that buffers one utterance and runs it through STTEngine
 */
class WhisperRecognizer : public SpeechRecognizer {
public:
    explicit WhisperRecognizer(std::shared_ptr<STTEngine> engine);

    void start() override;
    void feed(const std::string& pcm_bytes) override;
    void stop() override;
    std::string text() override;

private:
    std::shared_ptr<STTEngine> engine_;
    std::string pending_;  // raw bytes, may end mid-sample until the next feed
    bool open_ = false;
};

} // namespace voxlink
