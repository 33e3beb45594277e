#pragma once

#include "common.h"
#include "config.h"
#include "control_channel.h"
#include "playback_queue.h"
#include <memory>
#include <string>

namespace voxlink {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected
};

const char* connection_state_name(ConnectionState state);

/**
 * @brief Where recorded PCM frames come from (microphone, file, test data)
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool open() = 0;
    /// Blocking read of one frame; false ends the recording
    virtual bool read_frame(PcmChunk& frame) = 0;
    virtual void close() = 0;
};

/**
 * @brief Receives everything the user should see
 */
class DisplaySink {
public:
    virtual ~DisplaySink() = default;

    virtual void on_control(const ControlMessage& message) = 0;
    virtual void on_connection(ConnectionState state) { (void)state; }
};

/**
 * @brief WebSocket client side of a voice session.
 *
 * A reconnect thread keeps the connection up with exponential backoff.
 * While connected, recorded frames go out as binary messages, received
 * PCM goes to the PlaybackQueue and received control messages go to the
 * DisplaySink. start_recording() and stop_recording() are user edges and
 * never block the receive path.
 */
class ClientTransport {
public:
    ClientTransport(const ClientConfig& config,
                    FrameSource& source,
                    PlaybackQueue& playback,
                    DisplaySink& display);
    ~ClientTransport();

    // Non-copyable
    ClientTransport(const ClientTransport&) = delete;
    ClientTransport& operator=(const ClientTransport&) = delete;

    /// Launch the reconnect thread
    void start();

    /// Stop recording, close the connection, join all threads
    void stop();

    /**
     * @brief Begin an utterance: drain playback, send start, capture frames
     * @return false if not connected
     */
    bool start_recording();

    /**
     * @brief End the utterance: stop capture, send end
     */
    void stop_recording();

    bool is_recording() const;

    ConnectionState state() const;

    /// Route one inbound text frame (control message)
    void handle_text(const std::string& text);

    /// Route one inbound binary frame (PCM)
    void handle_binary(const std::string& data);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
