#include "voice_server.h"
#include "logger.h"
#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocketServer.h>
#include <atomic>
#include <map>
#include <mutex>

namespace voxlink {

namespace {

const char* kSessionPath = "/ws";

class WebSocketSink : public MessageSink {
public:
    explicit WebSocketSink(ix::WebSocket& socket) : socket_(socket) {}

    bool send_text(const std::string& text) override {
        return socket_.sendText(text).success;
    }

    bool send_binary(const std::string& data) override {
        return socket_.sendBinary(data).success;
    }

private:
    ix::WebSocket& socket_;
};

} // namespace

class VoiceServer::Impl {
public:
    Impl(const ServerConfig& config, const SessionServices& services, const SessionOptions& options)
        : config_(config),
          services_(services),
          options_(options),
          server_(config.port, config.host, ix::SocketServer::kDefaultTcpBacklog,
                  static_cast<size_t>(config.max_connections)) {}

    ~Impl() {
        stop();
    }

    VoidResult start() {
        ix::initNetSystem();

        server_.setOnClientMessageCallback(
            [this](std::shared_ptr<ix::ConnectionState> connection,
                   ix::WebSocket& socket,
                   const ix::WebSocketMessagePtr& msg) {
                on_message(connection->getId(), socket, msg);
            });

        auto res = server_.listen();
        if (!res.first) {
            return make_transport_error("Cannot listen on " + config_.host + ":" +
                                        std::to_string(config_.port) + ": " + res.second);
        }
        server_.start();
        running_ = true;
        LOG_WS("Listening on ws://" + config_.host + ":" + std::to_string(config_.port) + kSessionPath);
        return VoidResult();
    }

    void stop() {
        if (!running_.exchange(false)) return;

        // Sessions hold references to their sockets; finish them first
        std::map<std::string, std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions.swap(sessions_);
        }
        for (auto& entry : sessions) {
            entry.second->on_disconnect();
        }
        server_.stop();
        sessions.clear();
        LOG_WS("Server stopped");
    }

    size_t session_count() const {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        return sessions_.size();
    }

private:
    void on_message(const std::string& connection_id, ix::WebSocket& socket,
                    const ix::WebSocketMessagePtr& msg) {
        switch (msg->type) {
            case ix::WebSocketMessageType::Open:
                on_open(connection_id, socket, msg->openInfo.uri);
                break;

            case ix::WebSocketMessageType::Message: {
                std::shared_ptr<Session> session = find(connection_id);
                if (!session) return;
                if (msg->binary) {
                    session->on_binary(msg->str);
                } else {
                    session->on_text(msg->str);
                }
                break;
            }

            case ix::WebSocketMessageType::Close:
                LOG_WS("Connection " + connection_id + " closed (" +
                       std::to_string(msg->closeInfo.code) + " " + msg->closeInfo.reason + ")");
                remove(connection_id);
                break;

            case ix::WebSocketMessageType::Error:
                LOG_ERROR(make_transport_error("connection " + connection_id + ": " +
                                               msg->errorInfo.reason).to_string());
                remove(connection_id);
                break;

            default:
                break;
        }
    }

    void on_open(const std::string& connection_id, ix::WebSocket& socket, const std::string& uri) {
        if (uri != kSessionPath) {
            LOG_WS("Rejecting connection " + connection_id + " to " + uri);
            socket.close(1008, "Unknown path");
            return;
        }

        uint64_t id = ++next_session_id_;
        auto session = std::make_shared<Session>(
            id, std::make_shared<WebSocketSink>(socket), services_, options_);

        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[connection_id] = std::move(session);
        LOG_WS("Connection " + connection_id + " -> session " + std::to_string(id) +
               " (" + std::to_string(sessions_.size()) + " active)");
    }

    std::shared_ptr<Session> find(const std::string& connection_id) {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(connection_id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    void remove(const std::string& connection_id) {
        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            auto it = sessions_.find(connection_id);
            if (it == sessions_.end()) return;
            session = std::move(it->second);
            sessions_.erase(it);
        }
        // Joins the session's pipelines outside the map lock
        session->on_disconnect();
    }

    ServerConfig config_;
    SessionServices services_;
    SessionOptions options_;
    ix::WebSocketServer server_;

    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::atomic<uint64_t> next_session_id_{0};
    std::atomic<bool> running_{false};
};

VoiceServer::VoiceServer(const ServerConfig& config,
                         const SessionServices& services,
                         const SessionOptions& options)
    : pimpl_(std::make_unique<Impl>(config, services, options)) {}

VoiceServer::~VoiceServer() = default;

VoidResult VoiceServer::start() {
    return pimpl_->start();
}

void VoiceServer::stop() {
    pimpl_->stop();
}

size_t VoiceServer::session_count() const {
    return pimpl_->session_count();
}

} // namespace voxlink
