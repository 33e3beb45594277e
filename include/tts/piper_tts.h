#pragma once

/**
 * @file piper_tts.h
 * @brief Piper subprocess synthesizer
 *
 * One Piper process per sentence, fed {"text": ...} on stdin with
 * --json-input and --output_raw; stdout is read as it is produced and
 * handed out in fixed-size PCM chunks. Cancellation kills the process.
 */

#include "tts_engine.h"
#include "config.h"
#include <memory>
#include <string>

namespace voxlink {
namespace tts {

class PiperSynthesizer : public SpeechSynthesizer {
public:
    explicit PiperSynthesizer(const TTSConfig& config);
    ~PiperSynthesizer() override;

    // Non-copyable
    PiperSynthesizer(const PiperSynthesizer&) = delete;
    PiperSynthesizer& operator=(const PiperSynthesizer&) = delete;

    VoidResult synthesize(const std::string& sentence,
                          const CancelToken& cancel,
                          const PcmChunkCallback& on_chunk) override;

    int sample_rate() const override;

    /// True if the piper binary and voice model were found
    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Scale s16le PCM in place, clipping to the int16 range
 */
void apply_gain(PcmChunk& pcm, float gain);

/**
 * @brief Read "audio.sample_rate" from a Piper voice's .onnx.json
 * @return Sample rate, or fallback if the file is missing or has no rate
 */
int read_voice_sample_rate(const std::string& voice_path, int fallback);

} // namespace tts
} // namespace voxlink
