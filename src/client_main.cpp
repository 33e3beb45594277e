#include "audio_io.h"
#include "client_transport.h"
#include "config.h"
#include "logger.h"
#include "playback_queue.h"
#include <poll.h>
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <mutex>
#include <type_traits>

namespace voxlink {

static std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    (void)signal;
    g_running = false;
}

/// FrameSource over the PortAudio microphone
class MicrophoneSource : public FrameSource {
public:
    explicit MicrophoneSource(const AudioConfig& config) : config_(config) {}

    bool open() override {
        auto res = capture_.open(config_.input_device, config_.capture_rate,
                                 static_cast<size_t>(config_.frame_bytes));
        if (res.is_error()) {
            Logger::error(res.error().to_string());
            return false;
        }
        return true;
    }

    bool read_frame(PcmChunk& frame) override {
        return capture_.read_frame(frame);
    }

    void close() override {
        capture_.close();
    }

private:
    AudioConfig config_;
    AudioCapture capture_;
};

/// Prints the conversation to the terminal
class ConsoleDisplay : public DisplaySink {
public:
    void on_control(const ControlMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::visit([](const auto& msg) {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, UserTranscriptionMsg>) {
                std::cout << "\nYou: " << msg.text << std::endl;
            } else if constexpr (std::is_same_v<T, AssistantTextMsg>) {
                std::cout << "Assistant: " << msg.text << std::endl;
            } else if constexpr (std::is_same_v<T, EndOfTurnMsg>) {
                std::cout << "-- Press Enter to speak --" << std::endl;
            }
        }, message);
    }

    void on_connection(ConnectionState state) override {
        LOG_WS(std::string("Connection: ") + connection_state_name(state));
    }

private:
    std::mutex mutex_;
};

} // namespace voxlink

int main(int argc, char* argv[]) {
    using namespace voxlink;

    Logger::initialize(LogLevel::INFO);

    // List devices if requested (check before loading config)
    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        list_audio_devices();
        Logger::shutdown();
        return 0;
    }

    std::string config_path = argc > 1 ? argv[1] : "config/voxlink.json";
    Config config = Config::load_from_file(config_path);

    Logger::shutdown();
    Logger::initialize(parse_log_level(config.log.level), config.log.file);

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) {
            Logger::error("Config: " + p);
        }
        Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    AudioPlayback speaker;
    auto opened = speaker.open(config.audio.output_device, config.audio.playback_rate);
    if (opened.is_error()) {
        Logger::error(opened.error().to_string());
        Logger::shutdown();
        return 1;
    }

    PlaybackQueue playback(speaker);
    MicrophoneSource microphone(config.audio);
    ConsoleDisplay display;
    ClientTransport transport(config.client, microphone, playback, display);
    transport.start();

    std::cout << "Press Enter to start/stop recording, q + Enter to quit." << std::endl;

    while (g_running) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0) continue;

        std::string line;
        if (!std::getline(std::cin, line)) break;
        if (line == "q" || line == "quit") break;

        if (transport.is_recording()) {
            transport.stop_recording();
            std::cout << "... thinking" << std::endl;
        } else if (transport.start_recording()) {
            std::cout << "Recording... press Enter to stop" << std::endl;
        } else {
            std::cout << "Not connected yet (" << connection_state_name(transport.state()) << ")" << std::endl;
        }
    }

    Logger::info("Shutting down...");
    transport.stop();
    playback.stop();
    speaker.close();
    Logger::shutdown();
    return 0;
}
