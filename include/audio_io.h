#pragma once

#include "common.h"
#include "errors.h"
#include "playback_queue.h"
#include <string>
#include <memory>

namespace voxlink {

/**
 * @brief Microphone capture using a blocking PortAudio input stream
 *
 * Produces s16le mono frames of a fixed byte size at the configured rate.
 * read_frame() is meant for a single capture thread.
 */
class AudioCapture {
public:
    AudioCapture();
    ~AudioCapture();

    // Non-copyable
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /**
     * @brief Open and start the input stream
     * @param device Device name, index, or "default"
     * @param sample_rate Capture rate in Hz
     * @param frame_bytes Bytes per frame returned by read_frame (even)
     */
    VoidResult open(const std::string& device, int sample_rate, size_t frame_bytes);

    /**
     * @brief Read one frame (blocking)
     * @return false on error or when the stream is closed
     */
    bool read_frame(PcmChunk& frame);

    void close();

    bool is_open() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Speaker output using a blocking PortAudio output stream.
 *
 * write() blocks until the chunk is handed to the device, in short slices
 * so a cancelled token cuts it within one slice (barge-in).
 */
class AudioPlayback : public AudioSink {
public:
    AudioPlayback();
    ~AudioPlayback() override;

    // Non-copyable
    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    VoidResult open(const std::string& device, int sample_rate);

    bool write(const PcmChunk& pcm, const CancelToken& cancel) override;

    void close();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief List all available audio devices to the log
 */
void list_audio_devices();

} // namespace voxlink
