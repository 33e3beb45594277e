#include "audio_frame_codec.h"

namespace voxlink {

AudioFrameCodec::AudioFrameCodec(size_t frame_bytes)
    : frame_bytes_(frame_bytes > 0 ? frame_bytes : DEFAULT_FRAME_BYTES) {}

std::vector<PcmChunk> AudioFrameCodec::split(const std::string& pcm) const {
    std::vector<PcmChunk> frames;
    frames.reserve(pcm.size() / frame_bytes_ + 1);
    for (size_t pos = 0; pos < pcm.size(); pos += frame_bytes_) {
        frames.push_back(pcm.substr(pos, frame_bytes_));
    }
    return frames;
}

PcmChunk AudioFrameCodec::samples_to_bytes(const AudioBuffer& samples) {
    PcmChunk out(samples.size() * BYTES_PER_SAMPLE, '\0');
    for (size_t i = 0; i < samples.size(); i++) {
        uint16_t v = static_cast<uint16_t>(samples[i]);
        out[2 * i] = static_cast<char>(v & 0xFF);
        out[2 * i + 1] = static_cast<char>((v >> 8) & 0xFF);
    }
    return out;
}

AudioBuffer AudioFrameCodec::bytes_to_samples(const std::string& bytes) {
    AudioBuffer out(bytes.size() / BYTES_PER_SAMPLE);
    for (size_t i = 0; i < out.size(); i++) {
        uint16_t lo = static_cast<unsigned char>(bytes[2 * i]);
        uint16_t hi = static_cast<unsigned char>(bytes[2 * i + 1]);
        out[i] = static_cast<Sample>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return out;
}

} // namespace voxlink
