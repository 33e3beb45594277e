#pragma once

#include "cancellation.h"
#include "common.h"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace voxlink {

/**
 * @brief Destination of received PCM (speaker, file, test capture)
 */
class AudioSink {
public:
    virtual ~AudioSink() = default;

    /**
     * @brief Blocking write of one chunk; false on device error.
     *
     * Stops early (returning true) once `cancel` is set. The token may
     * already be cancelled on entry, in which case nothing is played.
     */
    virtual bool write(const PcmChunk& pcm, const CancelToken& cancel) = 0;

    /// Wake a write blocked on the device after its token was cancelled; optional
    virtual void abort() {}
};

/**
 * @brief Ordered FIFO of PCM chunks played by one consumer thread.
 *
 * enqueue() never blocks on the device. Chunks reach the sink in enqueue
 * order, one at a time. Every drain starts a new epoch: a chunk carries the
 * token of the epoch it was popped in, so a drain that lands between the
 * pop and the device write still cuts it.
 */
class PlaybackQueue {
public:
    explicit PlaybackQueue(AudioSink& sink);
    ~PlaybackQueue();

    // Non-copyable
    PlaybackQueue(const PlaybackQueue&) = delete;
    PlaybackQueue& operator=(const PlaybackQueue&) = delete;

    /// Append a chunk; ignored after stop()
    void enqueue(const PcmChunk& pcm);

    /**
     * @brief Drop pending chunks and cut the one being played.
     *
     * The queue stays usable; later enqueues play normally.
     */
    void drain_and_stop();

    /**
     * @brief Block until nothing is queued and nothing is being written
     */
    void wait_idle();

    /**
     * @brief Shut down the consumer thread (pending chunks are dropped)
     */
    void stop();

    size_t pending() const;

    /// Chunks handed to the sink so far
    size_t played() const;

private:
    void worker_loop();

    AudioSink& sink_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<PcmChunk> chunks_;
    CancelTokenPtr epoch_;
    bool writing_ = false;
    bool stopped_ = false;
    size_t played_ = 0;
    std::thread worker_;
};

} // namespace voxlink
