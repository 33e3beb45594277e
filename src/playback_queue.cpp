#include "playback_queue.h"
#include "logger.h"

namespace voxlink {

PlaybackQueue::PlaybackQueue(AudioSink& sink)
    : sink_(sink),
      epoch_(std::make_shared<CancelToken>()) {
    worker_ = std::thread(&PlaybackQueue::worker_loop, this);
}

PlaybackQueue::~PlaybackQueue() {
    stop();
}

void PlaybackQueue::enqueue(const PcmChunk& pcm) {
    if (pcm.empty()) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        chunks_.push_back(pcm);
    }
    work_cv_.notify_one();
}

void PlaybackQueue::drain_and_stop() {
    size_t dropped = 0;
    bool was_writing = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = chunks_.size();
        chunks_.clear();
        epoch_->cancel();
        epoch_ = std::make_shared<CancelToken>();
        was_writing = writing_;
    }
    if (was_writing) {
        sink_.abort();
    }
    idle_cv_.notify_all();
    if (dropped > 0) {
        LOG_AUDIO("Playback drained, " + std::to_string(dropped) + " chunks dropped");
    }
}

void PlaybackQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return stopped_ || (chunks_.empty() && !writing_); });
}

void PlaybackQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_ && !worker_.joinable()) return;
        stopped_ = true;
        chunks_.clear();
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

size_t PlaybackQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

size_t PlaybackQueue::played() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return played_;
}

void PlaybackQueue::worker_loop() {
    while (true) {
        PcmChunk chunk;
        CancelTokenPtr epoch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopped_ || !chunks_.empty(); });
            if (stopped_) break;
            chunk = std::move(chunks_.front());
            chunks_.pop_front();
            epoch = epoch_;
            writing_ = true;
        }

        if (!sink_.write(chunk, *epoch)) {
            LOG_WARN("Audio sink rejected " + std::to_string(chunk.size()) + " bytes");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            writing_ = false;
            played_++;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

} // namespace voxlink
