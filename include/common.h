#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace voxlink {

// Audio types
using Sample = int16_t;
using AudioBuffer = std::vector<Sample>;

/// Raw PCM bytes exactly as carried by one binary WebSocket message
using PcmChunk = std::string;

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

// Audio format constants (s16le mono)
constexpr int BYTES_PER_SAMPLE = sizeof(Sample);
constexpr int DEFAULT_CAPTURE_RATE = 16000;    // mic -> server, what whisper expects
constexpr int DEFAULT_PLAYBACK_RATE = 22050;   // server -> speaker, Piper voice rate
constexpr int DEFAULT_FRAME_BYTES = 1024;      // nominal binary frame size

// Reconnect defaults
constexpr int DEFAULT_RECONNECT_INITIAL_MS = 1000;
constexpr int DEFAULT_RECONNECT_MAX_MS = 30000;

/// Identifies one utterance within a session; larger is newer
using Generation = uint64_t;

/// A remembered fact about the user
struct UserFact {
    std::string text;
    std::string created_at;  ///< YYYY-MM-DD
};

using FactList = std::vector<UserFact>;

} // namespace voxlink
