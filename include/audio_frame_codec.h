#pragma once

#include "common.h"
#include <string>
#include <vector>

namespace voxlink {

/**
 * @brief Raw PCM framing for binary WebSocket messages.
 *
 * Binary messages carry s16le mono PCM with no header. Frames are passed
 * through byte-for-byte in arrival order; the codec only splits outgoing
 * audio into frames of the nominal size and converts between bytes and
 * samples.
 */
class AudioFrameCodec {
public:
    explicit AudioFrameCodec(size_t frame_bytes = DEFAULT_FRAME_BYTES);

    size_t frame_bytes() const { return frame_bytes_; }

    /**
     * @brief Split PCM bytes into frames of frame_bytes() (last one may be shorter)
     * @return Frames in order; empty input yields no frames
     */
    std::vector<PcmChunk> split(const std::string& pcm) const;

    static PcmChunk samples_to_bytes(const AudioBuffer& samples);

    /**
     * @brief Convert s16le bytes to samples. A trailing odd byte is ignored.
     */
    static AudioBuffer bytes_to_samples(const std::string& bytes);

private:
    size_t frame_bytes_;
};

} // namespace voxlink
