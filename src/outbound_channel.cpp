#include "outbound_channel.h"
#include "logger.h"

namespace voxlink {

OutboundChannel::OutboundChannel(std::shared_ptr<MessageSink> sink)
    : sink_(std::move(sink)) {}

Generation OutboundChannel::advance() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++current_;
}

Generation OutboundChannel::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

bool OutboundChannel::is_current(Generation generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_ && generation == current_;
}

bool OutboundChannel::admit_locked(Generation generation) {
    if (closed_) return false;
    if (generation != current_) {
        dropped_++;
        return false;
    }
    return true;
}

bool OutboundChannel::send_control(Generation generation, const ControlMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!admit_locked(generation)) {
        LOG_DEBUG(std::string("Dropping stale ") + ControlChannel::kind_name(message) +
                  " of generation " + std::to_string(generation));
        return false;
    }
    return sink_->send_text(ControlChannel::serialize(message));
}

bool OutboundChannel::send_audio(Generation generation, const PcmChunk& pcm) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!admit_locked(generation)) return false;
    return sink_->send_binary(pcm);
}

void OutboundChannel::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool OutboundChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace voxlink
