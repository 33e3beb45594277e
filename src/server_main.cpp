#include "config.h"
#include "http_api.h"
#include "logger.h"
#include "llm_client.h"
#include "session.h"
#include "stt_engine.h"
#include "tool_call_extractor.h"
#include "tool_executor.h"
#include "voice_server.h"
#include "memory/fact_extractor.h"
#include "memory/fact_store.h"
#include "tts/piper_tts.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

namespace voxlink {

static std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    (void)signal;
    g_running = false;
}

} // namespace voxlink

int main(int argc, char* argv[]) {
    using namespace voxlink;

    Logger::initialize(LogLevel::INFO);

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

    // Piper stdin writes must not kill the process when a child exits early
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto stt = std::make_shared<STTEngine>(config.stt);
    if (!stt->is_ready()) {
        Logger::error("Speech recognizer not ready (stt.model_path = '" + config.stt.model_path + "')");
        Logger::shutdown();
        return 1;
    }

    tts::PiperSynthesizer synthesizer(config.tts);
    if (!synthesizer.is_ready()) {
        Logger::warn("Piper is not ready; responses will be text only");
    } else if (synthesizer.sample_rate() != config.audio.playback_rate) {
        Logger::warn("Voice rate " + std::to_string(synthesizer.sample_rate()) +
                     " Hz differs from audio.playback_rate " + std::to_string(config.audio.playback_rate) +
                     " Hz; clients will play at the wrong speed");
    }

    LLMClient backend(config.llm);
    SystemToolExecutor tools;
    ToolCallExtractor extractor;

    memory::FactStore facts(config.memory.enabled ? config.memory.facts_path : "");
    facts.load();
    LOG_MEMORY(std::to_string(facts.size()) + " user facts loaded");
    memory::FactExtractor fact_worker(backend, facts);

    SessionServices services;
    services.pipeline.backend = &backend;
    services.pipeline.synthesizer = &synthesizer;
    services.pipeline.tools = &tools;
    services.pipeline.extractor = &extractor;
    if (config.memory.enabled) {
        services.pipeline.schedule_fact_extraction = [&fact_worker](const std::string& text) {
            fact_worker.schedule(text);
        };
    }
    services.make_recognizer = [stt]() -> std::unique_ptr<SpeechRecognizer> {
        return std::make_unique<WhisperRecognizer>(stt);
    };
    services.facts = &facts;

    SessionOptions options;
    options.min_sentence_chars = static_cast<size_t>(config.pipeline.min_sentence_chars);
    options.apology_text = config.pipeline.apology_text;
    options.tools_enabled = config.llm.tools_enabled;
    options.frame_bytes = static_cast<size_t>(config.audio.frame_bytes);
    options.blank_sentinel = config.stt.blank_sentinel;

    VoiceServer server(config.server, services, options);
    auto started = server.start();
    if (started.is_error()) {
        Logger::error(started.error().to_string());
        fact_worker.shutdown();
        Logger::shutdown();
        return 1;
    }

    std::unique_ptr<HttpApi> http_api;
    if (config.server.http_port != 0) {
        http_api = std::make_unique<HttpApi>(config.server, services, options,
                                             config.llm.provider, config.llm.model_name);
        auto http_started = http_api->start();
        if (http_started.is_error()) {
            Logger::error(http_started.error().to_string());
            server.stop();
            fact_worker.shutdown();
            Logger::shutdown();
            return 1;
        }
    }

    Logger::info("VoxLink server ready (model " + config.llm.model_name + " via " + config.llm.provider +
                 ", voice at " + std::to_string(synthesizer.sample_rate()) + " Hz)");

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::info("Shutting down...");
    if (http_api) http_api->stop();
    server.stop();
    fact_worker.shutdown();
    Logger::shutdown();
    return 0;
}
