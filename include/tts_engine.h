#pragma once

#include "common.h"
#include "cancellation.h"
#include "errors.h"
#include <functional>
#include <string>

namespace voxlink {

/**
 * @brief Receives PCM chunks of one sentence in order.
 * @return false to stop synthesis early
 */
using PcmChunkCallback = std::function<bool(const PcmChunk&)>;

/**
 * @brief Speech synthesizer: one sentence in, a lazy sequence of PCM chunks out.
 */
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    /**
     * @brief Synthesize a sentence, delivering chunks as they are produced
     * @return Error if the synthesizer failed; chunks already delivered stay valid
     */
    virtual VoidResult synthesize(const std::string& sentence,
                                  const CancelToken& cancel,
                                  const PcmChunkCallback& on_chunk) = 0;

    /// Sample rate of the produced PCM (s16le mono)
    virtual int sample_rate() const = 0;
};

} // namespace voxlink
