#pragma once

#include "common.h"
#include "control_channel.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace voxlink {

/**
 * @brief Raw outbound side of one connection (text and binary frames)
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;

    virtual bool send_text(const std::string& text) = 0;
    virtual bool send_binary(const std::string& data) = 0;
};

/**
 * @brief Generation gate in front of a connection's MessageSink.
 *
 * Every outbound message is tagged with the generation that produced it and
 * sent only if that generation is still current. The check and the send
 * happen under one lock, and advance() takes the same lock, so once
 * advance() returns no message of an older generation can reach the client.
 */
class OutboundChannel {
public:
    explicit OutboundChannel(std::shared_ptr<MessageSink> sink);

    /**
     * @brief Start a new generation; all older ones lose the right to send
     * @return The new current generation
     */
    Generation advance();

    Generation current() const;

    bool is_current(Generation generation) const;

    /**
     * @brief Send a control message on behalf of generation
     * @return false if the generation is stale, the channel is closed or the send failed
     */
    bool send_control(Generation generation, const ControlMessage& message);

    /**
     * @brief Send PCM on behalf of generation
     */
    bool send_audio(Generation generation, const PcmChunk& pcm);

    /// Refuse all further sends (connection is going away)
    void close();

    bool is_closed() const;

    /// Messages suppressed because their generation was stale
    size_t dropped_count() const { return dropped_.load(); }

private:
    bool admit_locked(Generation generation);

    std::shared_ptr<MessageSink> sink_;
    mutable std::mutex mutex_;
    Generation current_ = 0;
    bool closed_ = false;
    std::atomic<size_t> dropped_{0};
};

} // namespace voxlink
