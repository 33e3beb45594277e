/**
 * Client side of a voice session.
 * Asserts:
 * - Server control messages reach the display; invalid ones are dropped.
 * - Binary frames go to the playback queue in order.
 * - Recording cannot start while disconnected; stop() is safe before start().
 * - Against a loopback WebSocket server: backoff restarts after a real
 *   connection, start + frames + end go out, replies are routed, audio of
 *   the interrupted turn is dropped, and a microphone that fails to open
 *   closes the utterance and leaves the client able to record again.
 *
 * Run from build dir: ./test_client_transport
 */

#include "client_transport.h"
#include "logger.h"
#include "playback_queue.h"
#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocketServer.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace voxlink;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

using Clock = std::chrono::steady_clock;

static bool wait_until(const std::function<bool()>& done, int timeout_ms = 3000) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (Clock::now() < deadline) {
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return done();
}

/// Hands out a fixed list of frames; open() can be made to fail
class ScriptedSource : public FrameSource {
public:
    bool open() override {
        std::lock_guard<std::mutex> lock(mutex);
        opened++;
        next = 0;
        return !fail_open;
    }
    bool read_frame(PcmChunk& frame) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (next >= frames.size()) return false;
        frame = frames[next++];
        return true;
    }
    void close() override {
        std::lock_guard<std::mutex> lock(mutex);
        closed++;
    }

    std::mutex mutex;
    std::vector<PcmChunk> frames;
    size_t next = 0;
    bool fail_open = false;
    int opened = 0;
    int closed = 0;
};

class CaptureSink : public AudioSink {
public:
    bool write(const PcmChunk& pcm, const CancelToken& cancel) override {
        (void)cancel;
        std::lock_guard<std::mutex> lock(mutex);
        chunks.push_back(pcm);
        return true;
    }

    std::vector<PcmChunk> played() {
        std::lock_guard<std::mutex> lock(mutex);
        return chunks;
    }

    std::mutex mutex;
    std::vector<PcmChunk> chunks;
};

class ListDisplay : public DisplaySink {
public:
    void on_control(const ControlMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(ControlChannel::kind_name(message));
        if (const auto* at = std::get_if<AssistantTextMsg>(&message)) texts.push_back(at->text);
    }
    void on_connection(ConnectionState state) override {
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back({state, Clock::now()});
    }

    size_t message_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }

    /// Times at which the connection reached `state`, in order
    std::vector<Clock::time_point> times_of(ConnectionState state) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<Clock::time_point> out;
        for (const auto& s : states) {
            if (s.first == state) out.push_back(s.second);
        }
        return out;
    }

    std::mutex mutex;
    std::vector<std::string> messages;
    std::vector<std::string> texts;
    std::vector<std::pair<ConnectionState, Clock::time_point>> states;
};

/// Loopback voice server: drops its first connection, answers utterances
class LoopbackServer {
public:
    explicit LoopbackServer(int port) : server_(port, "127.0.0.1") {
        server_.setOnClientMessageCallback(
            [this](std::shared_ptr<ix::ConnectionState> connection,
                   ix::WebSocket& socket,
                   const ix::WebSocketMessagePtr& msg) {
                (void)connection;
                on_message(socket, msg);
            });
    }

    bool start() {
        auto res = server_.listen();
        if (!res.first) return false;
        server_.start();
        return true;
    }

    void stop() { server_.stop(); }

    int connections() { return connections_.load(); }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    size_t count(const std::string& what) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : received_) n += r == what ? 1 : 0;
        return n;
    }

private:
    void on_message(ix::WebSocket& socket, const ix::WebSocketMessagePtr& msg) {
        if (msg->type == ix::WebSocketMessageType::Open) {
            if (++connections_ == 1) socket.close();
            return;
        }
        if (msg->type != ix::WebSocketMessageType::Message) return;

        std::string entry = msg->binary ? "bin:" + msg->str : msg->str;
        size_t frames_in_utterance = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(entry);
            if (entry == "{\"start\":true}") frames_ = 0;
            if (msg->binary) frames_++;
            frames_in_utterance = frames_;
        }

        if (entry == "{\"start\":true}") {
            // Tail of the previous reply, still on the wire at barge-in
            socket.sendBinary("stale");
        } else if (entry == "{\"end\":true}" && frames_in_utterance > 0) {
            socket.sendText("{\"user_transcription\":\"открой ютуб\"}");
            socket.sendText("{\"assistant_text\":\"Открываю.\"}");
            socket.sendBinary("fresh");
            socket.sendText("{\"end\":true}");
        }
    }

    ix::WebSocketServer server_;
    std::atomic<int> connections_{0};
    std::mutex mutex_;
    std::vector<std::string> received_;
    size_t frames_ = 0;
};

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Offline routing ---
    {
        ClientConfig config;
        config.server_url = "ws://127.0.0.1:9/ws";

        ScriptedSource source;
        CaptureSink speaker;
        PlaybackQueue playback(speaker);
        ListDisplay display;

        {
            ClientTransport transport(config, source, playback, display);
            ASSERT(transport.state() == ConnectionState::Disconnected);

            // --- Control routing ---
            transport.handle_text("{\"user_transcription\":\"открой ютуб\"}");
            transport.handle_text("{\"assistant_text\":\"[\xF0\x9F\x9B\xA0\xEF\xB8\x8F open_url]\"}");
            transport.handle_text("{\"assistant_text\":\"Открываю.\"}");
            transport.handle_text("{\"start\":true}");  // client-only message
            transport.handle_text("garbage");
            transport.handle_text("{\"end\":true}");
            ASSERT(display.messages.size() == 4);
            if (display.messages.size() == 4) {
                ASSERT(display.messages[0] == "user_transcription");
                ASSERT(display.messages[3] == "end_of_turn");
            }
            ASSERT(display.texts.size() == 2 && display.texts[1] == "Открываю.");

            // --- Audio routing ---
            transport.handle_binary(std::string("\x01\x02", 2));
            transport.handle_binary("");
            transport.handle_binary(std::string("\x03\x04", 2));
            playback.wait_idle();
            auto played = speaker.played();
            ASSERT(played.size() == 2);
            ASSERT(played.size() == 2 && played[1] == std::string("\x03\x04", 2));

            // --- Recording needs a connection ---
            ASSERT(!transport.start_recording());
            ASSERT(!transport.is_recording());
            ASSERT(source.opened == 0);
            transport.stop_recording();  // no-op

            transport.stop();
            transport.stop();
            ASSERT(transport.state() == ConnectionState::Disconnected);
        }

        ASSERT(connection_state_name(ConnectionState::Connecting) == std::string("CONNECTING"));
        playback.stop();
    }

    // --- Loopback server ---
    {
        ix::initNetSystem();
        const int port = 18462;

        ClientConfig config;
        config.server_url = "ws://127.0.0.1:" + std::to_string(port) + "/ws";
        config.reconnect.initial_ms = 50;
        config.reconnect.max_ms = 2000;
        config.reconnect.multiplier = 2.0;
        config.reconnect.connect_timeout_ms = 1000;

        ScriptedSource source;
        CaptureSink speaker;
        PlaybackQueue playback(speaker);
        ListDisplay display;
        ClientTransport transport(config, source, playback, display);

        // Nobody listens yet: delays grow 50, 100, 200, 400, ...
        transport.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(700));
        ASSERT(transport.state() != ConnectionState::Connected);

        LoopbackServer server(port);
        ASSERT(server.start());

        // First connection is dropped by the server; the retry after it must
        // start from the initial delay again
        ASSERT(wait_until([&] { return server.connections() >= 2 &&
                                       transport.state() == ConnectionState::Connected; }, 5000));
        auto connected = display.times_of(ConnectionState::Connected);
        auto disconnected = display.times_of(ConnectionState::Disconnected);
        ASSERT(connected.size() >= 2);
        if (connected.size() >= 2 && !disconnected.empty()) {
            // Last Disconnected before the second Connected
            Clock::time_point drop = disconnected.front();
            for (const auto& t : disconnected) {
                if (t < connected[1]) drop = t;
            }
            auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(connected[1] - drop).count();
            ASSERT(gap < 500);
        }

        // --- Microphone that cannot be opened ---
        {
            std::lock_guard<std::mutex> lock(source.mutex);
            source.fail_open = true;
        }
        ASSERT(transport.start_recording());
        ASSERT(wait_until([&] { return server.count("{\"end\":true}") == 1; }));
        ASSERT(wait_until([&] { return !transport.is_recording(); }));
        ASSERT(server.count("{\"start\":true}") == 1);

        // --- Recording again: start, frames, end ---
        {
            std::lock_guard<std::mutex> lock(source.mutex);
            source.fail_open = false;
            source.frames = {"f1", "f2", "f3"};
        }
        ASSERT(transport.start_recording());
        ASSERT(transport.is_recording());
        ASSERT(wait_until([&] { return server.count("bin:f3") == 1; }));
        transport.stop_recording();
        ASSERT(!transport.is_recording());
        ASSERT(wait_until([&] { return server.count("{\"end\":true}") == 2; }));

        auto received = server.received();
        std::vector<std::string> expected = {
            "{\"start\":true}", "{\"end\":true}",
            "{\"start\":true}", "bin:f1", "bin:f2", "bin:f3", "{\"end\":true}"};
        ASSERT(received == expected);
        ASSERT(source.opened == 2);
        ASSERT(source.closed == 1);

        // --- Reply routed; the interrupted turn's audio is not played ---
        ASSERT(wait_until([&] { return display.message_count() >= 3; }));
        playback.wait_idle();
        auto played = speaker.played();
        ASSERT((played == std::vector<PcmChunk>{"fresh"}));
        {
            std::lock_guard<std::mutex> lock(display.mutex);
            ASSERT((display.messages == std::vector<std::string>{
                "user_transcription", "assistant_text", "end_of_turn"}));
        }

        transport.stop();
        ASSERT(transport.state() == ConnectionState::Disconnected);
        server.stop();
        playback.stop();
    }

    Logger::shutdown();

    if (failed == 0) {
        std::cout << "test_client_transport: all assertions passed\n";
        return 0;
    }
    std::cerr << "test_client_transport: " << failed << " assertion(s) failed\n";
    return 1;
}
