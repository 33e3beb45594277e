#include "client_transport.h"
#include "logger.h"
#include "reconnect_backoff.h"
#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocket.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <variant>

namespace voxlink {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting: return "CONNECTING";
        case ConnectionState::Connected: return "CONNECTED";
        default: return "UNKNOWN";
    }
}

class ClientTransport::Impl {
public:
    Impl(const ClientConfig& config, FrameSource& source, PlaybackQueue& playback, DisplaySink& display)
        : config_(config),
          source_(source),
          playback_(playback),
          display_(display),
          backoff_(config.reconnect) {
        socket_.setUrl(config_.server_url);
        socket_.disableAutomaticReconnection();
        socket_.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
            on_message(msg);
        });
    }

    ~Impl() {
        stop();
    }

    void start() {
        if (reconnect_thread_.joinable()) return;
        ix::initNetSystem();
        stopping_ = false;
        reconnect_thread_ = std::thread(&Impl::reconnect_loop, this);
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            stopping_ = true;
        }
        wait_cv_.notify_all();
        socket_.close();
        if (reconnect_thread_.joinable()) {
            reconnect_thread_.join();
        }
        end_capture();
        set_state(ConnectionState::Disconnected);
    }

    bool start_recording() {
        if (state() != ConnectionState::Connected) {
            LOG_WS("Not connected; cannot start recording");
            return false;
        }

        std::lock_guard<std::mutex> lock(recording_mutex_);
        if (recording_) return true;

        // A capture that ended on its own (source failure) is still joinable
        if (capture_thread_.joinable()) {
            capture_thread_.join();
        }

        // Barge-in on our side: whatever is still playing belongs to the old turn.
        // PCM of that turn may still be in flight; drop it until the new transcription.
        discard_audio_ = true;
        playback_.drain_and_stop();

        if (!send_text(ControlChannel::serialize(StartMsg{}))) {
            discard_audio_ = false;
            return false;
        }
        recording_ = true;
        capture_thread_ = std::thread(&Impl::capture_loop, this);
        LOG_AUDIO("Recording started");
        return true;
    }

    void stop_recording() {
        if (!end_capture()) return;
        if (state() == ConnectionState::Connected) {
            send_text(ControlChannel::serialize(EndMsg{}));
        }
        LOG_AUDIO("Recording stopped, " + std::to_string(frames_sent_.load()) + " frames sent");
    }

    bool is_recording() const {
        return recording_.load();
    }

    ConnectionState state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    void handle_text(const std::string& text) {
        auto parsed = ControlChannel::parse(text, Direction::ServerToClient);
        if (parsed.is_error()) {
            LOG_WARN("Ignoring server message: " + parsed.error().to_string());
            return;
        }
        if (std::holds_alternative<UserTranscriptionMsg>(parsed.value())) {
            discard_audio_ = false;
        }
        display_.on_control(parsed.value());
    }

    void handle_binary(const std::string& data) {
        if (discard_audio_) {
            LOG_AUDIO("Dropping " + std::to_string(data.size()) + " bytes of stale audio");
            return;
        }
        playback_.enqueue(data);
    }

private:
    void reconnect_loop() {
        const int timeout_secs = std::max(1, config_.reconnect.connect_timeout_ms / 1000);

        while (!stopping_) {
            set_state(ConnectionState::Connecting);
            LOG_WS("Connecting to " + config_.server_url);

            ix::WebSocketInitResult result = socket_.connect(timeout_secs);
            if (stopping_) break;

            if (result.success) {
                backoff_.reset();
                set_state(ConnectionState::Connected);
                LOG_WS("Connected to " + config_.server_url);

                // Blocks delivering messages until the connection closes
                socket_.run();

                end_capture();
                set_state(ConnectionState::Disconnected);
                if (stopping_) break;
                LOG_WS("Connection lost");
            } else {
                set_state(ConnectionState::Disconnected);
                LOG_WS(make_transport_error("connect failed: " + result.errorStr).to_string());
            }

            int delay_ms = backoff_.next_delay_ms();
            LOG_WS("Reconnecting in " + std::to_string(delay_ms) + " ms");
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this] { return stopping_.load(); });
        }
    }

    void on_message(const ix::WebSocketMessagePtr& msg) {
        switch (msg->type) {
            case ix::WebSocketMessageType::Message:
                if (msg->binary) {
                    handle_binary(msg->str);
                } else {
                    handle_text(msg->str);
                }
                break;
            case ix::WebSocketMessageType::Close:
                LOG_WS("Server closed the connection (" + std::to_string(msg->closeInfo.code) +
                       " " + msg->closeInfo.reason + ")");
                break;
            case ix::WebSocketMessageType::Error:
                LOG_WS(make_transport_error(msg->errorInfo.reason).to_string());
                break;
            default:
                break;
        }
    }

    void capture_loop() {
        if (!source_.open()) {
            Logger::error("Cannot open audio source; recording aborted");
            // The server already has our start; close the utterance
            if (recording_.exchange(false) && state() == ConnectionState::Connected) {
                send_text(ControlChannel::serialize(EndMsg{}));
            }
            return;
        }
        frames_sent_ = 0;
        PcmChunk frame;
        while (recording_) {
            if (!source_.read_frame(frame)) break;
            if (!recording_) break;
            if (state() != ConnectionState::Connected) continue;
            if (send_binary(frame)) {
                frames_sent_++;
            }
        }
        source_.close();
    }

    /// Stop and join the capture thread; true if the utterance was still open
    bool end_capture() {
        std::lock_guard<std::mutex> lock(recording_mutex_);
        bool was_recording = recording_.exchange(false);
        if (capture_thread_.joinable()) {
            capture_thread_.join();
        }
        return was_recording;
    }

    bool send_text(const std::string& text) {
        ix::WebSocketSendInfo info = socket_.sendText(text);
        if (!info.success) {
            LOG_WS("Failed to send control message");
        }
        return info.success;
    }

    bool send_binary(const std::string& data) {
        return socket_.sendBinary(data).success;
    }

    void set_state(ConnectionState state) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == state) return;
            state_ = state;
        }
        display_.on_connection(state);
    }

    ClientConfig config_;
    FrameSource& source_;
    PlaybackQueue& playback_;
    DisplaySink& display_;
    ReconnectBackoff backoff_;
    ix::WebSocket socket_;

    mutable std::mutex state_mutex_;
    ConnectionState state_ = ConnectionState::Disconnected;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::atomic<bool> stopping_{false};
    std::thread reconnect_thread_;

    std::mutex recording_mutex_;
    std::atomic<bool> recording_{false};
    std::atomic<size_t> frames_sent_{0};
    std::atomic<bool> discard_audio_{false};
    std::thread capture_thread_;
};

ClientTransport::ClientTransport(const ClientConfig& config,
                                 FrameSource& source,
                                 PlaybackQueue& playback,
                                 DisplaySink& display)
    : pimpl_(std::make_unique<Impl>(config, source, playback, display)) {}

ClientTransport::~ClientTransport() = default;

void ClientTransport::start() {
    pimpl_->start();
}

void ClientTransport::stop() {
    pimpl_->stop();
}

bool ClientTransport::start_recording() {
    return pimpl_->start_recording();
}

void ClientTransport::stop_recording() {
    pimpl_->stop_recording();
}

bool ClientTransport::is_recording() const {
    return pimpl_->is_recording();
}

ConnectionState ClientTransport::state() const {
    return pimpl_->state();
}

void ClientTransport::handle_text(const std::string& text) {
    pimpl_->handle_text(text);
}

void ClientTransport::handle_binary(const std::string& data) {
    pimpl_->handle_binary(data);
}

} // namespace voxlink
