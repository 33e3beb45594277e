#pragma once

#include "config.h"
#include "errors.h"
#include "session.h"
#include <memory>

namespace voxlink {

/**
 * @brief WebSocket endpoint (ws://host:port/ws) hosting one Session per connection.
 *
 * IXWebSocket delivers each connection's messages in order on that
 * connection's thread; the Session is created on open and torn down
 * (pipelines cancelled and joined) on close.
 */
class VoiceServer {
public:
    VoiceServer(const ServerConfig& config,
                const SessionServices& services,
                const SessionOptions& options);
    ~VoiceServer();

    // Non-copyable
    VoiceServer(const VoiceServer&) = delete;
    VoiceServer& operator=(const VoiceServer&) = delete;

    /**
     * @brief Bind and start accepting connections
     */
    VoidResult start();

    /**
     * @brief Tear down all sessions and stop the listener
     */
    void stop();

    size_t session_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
