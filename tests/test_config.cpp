/**
 * Configuration parsing and validation.
 * Asserts:
 * - Empty document yields defaults that validate.
 * - Sections override only the keys they name; wrong-typed values are ignored.
 * - save_to_file() + load_from_file() round-trips (except api_key).
 * - validate() reports each bad value.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "logger.h"
#include "utils.h"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace voxlink;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool mentions(const std::vector<std::string>& errors, const std::string& needle) {
    for (const auto& e : errors) {
        if (e.find(needle) != std::string::npos) return true;
    }
    return false;
}

int main() {
    Logger::initialize(LogLevel::ERROR);
    unsetenv("VOXLINK_SERVER_URL");
    unsetenv("VOXLINK_API_KEY");
    unsetenv("VOXLINK_LOG_LEVEL");

    // --- Defaults ---
    {
        auto parsed = Config::parse("{}");
        ASSERT(parsed.is_ok());
        const Config& cfg = parsed.value();
        ASSERT(cfg.server.port == 8000);
        ASSERT(cfg.server.http_port == 8001);
        ASSERT(cfg.client.server_url == "ws://localhost:8000/ws");
        ASSERT(cfg.client.reconnect.initial_ms == 1000);
        ASSERT(cfg.client.reconnect.max_ms == 30000);
        ASSERT(cfg.audio.capture_rate == 16000);
        ASSERT(cfg.audio.playback_rate == 22050);
        ASSERT(cfg.audio.frame_bytes == 1024);
        ASSERT(cfg.stt.blank_sentinel == "[BLANK_AUDIO]");
        ASSERT(cfg.llm.provider == "ollama");
        ASSERT(cfg.llm.tools_enabled);
        ASSERT(cfg.pipeline.min_sentence_chars == 3);
        ASSERT(cfg.pipeline.apology_text == "Извини, произошла техническая ошибка. Попробуй еще раз.");
        ASSERT(cfg.validate().empty());
    }

    // --- Overrides ---
    {
        auto parsed = Config::parse(R"({
            "server": {"port": 9001, "host": "127.0.0.1"},
            "client": {"server_url": "wss://voice.example/ws",
                       "reconnect": {"initial_ms": 250, "multiplier": 1.5}},
            "llm": {"provider": "openai", "model_name": "llama-3.1-8b-instant",
                    "temperature": 0.7, "tools_enabled": false, "max_tokens": "lots"},
            "memory": {"facts_path": "~/voxlink/facts.json"},
            "unknown_section": {"x": 1}
        })");
        ASSERT(parsed.is_ok());
        const Config& cfg = parsed.value();
        ASSERT(cfg.server.port == 9001);
        ASSERT(cfg.server.host == "127.0.0.1");
        ASSERT(cfg.server.max_connections == 8);
        ASSERT(cfg.client.server_url == "wss://voice.example/ws");
        ASSERT(cfg.client.reconnect.initial_ms == 250);
        ASSERT(cfg.client.reconnect.max_ms == 30000);
        ASSERT(cfg.client.reconnect.multiplier == 1.5);
        ASSERT(cfg.llm.provider == "openai");
        ASSERT(cfg.llm.temperature > 0.69f && cfg.llm.temperature < 0.71f);
        ASSERT(!cfg.llm.tools_enabled);
        ASSERT(cfg.llm.max_tokens == 512);  // wrong type ignored
        const char* home = std::getenv("HOME");
        if (home) {
            ASSERT(cfg.memory.facts_path == std::string(home) + "/voxlink/facts.json");
        }
        ASSERT(cfg.validate().empty());
    }

    // --- Parse errors ---
    {
        ASSERT(Config::parse("{ nope").is_error());
        auto arr = Config::parse("[1, 2]");
        ASSERT(arr.is_error());
        if (arr.is_error()) {
            ASSERT(arr.error().type == ErrorType::ParseError);
        }
    }

    // --- Validation ---
    {
        Config cfg;
        cfg.server.port = 70000;
        cfg.client.server_url = "http://localhost:8000/ws";
        cfg.client.reconnect.max_ms = 10;
        cfg.audio.frame_bytes = 1023;
        cfg.llm.provider = "carrier-pigeon";
        cfg.tts.chunk_bytes = 0;
        cfg.memory.facts_path = "";
        auto errors = cfg.validate();
        ASSERT(errors.size() == 7);
        ASSERT(mentions(errors, "server.port"));
        ASSERT(mentions(errors, "ws://"));
        ASSERT(mentions(errors, "max_ms"));
        ASSERT(mentions(errors, "frame_bytes"));
        ASSERT(mentions(errors, "carrier-pigeon"));
        ASSERT(mentions(errors, "chunk_bytes"));
        ASSERT(mentions(errors, "facts_path"));

        cfg.memory.enabled = false;
        ASSERT(!mentions(cfg.validate(), "facts_path"));

        Config clash;
        clash.server.http_port = clash.server.port;
        ASSERT(mentions(clash.validate(), "http_port"));
        clash.server.http_port = 0;
        ASSERT(clash.validate().empty());

        Config flat;
        flat.client.reconnect.multiplier = 1.0;
        auto flat_errors = flat.validate();
        ASSERT(flat_errors.size() == 1 && mentions(flat_errors, "multiplier"));
        flat.client.reconnect.multiplier = 1.01;
        ASSERT(flat.validate().empty());
    }

    // --- File round trip and environment overrides ---
    {
        char path_template[] = "/tmp/voxlink_config_XXXXXX";
        int fd = mkstemp(path_template);
        ASSERT(fd >= 0);
        if (fd >= 0) close(fd);
        const std::string path = path_template;

        Config original;
        original.server.port = 8123;
        original.llm.api_key = "secret";
        original.pipeline.min_sentence_chars = 5;
        original.save_to_file(path);

        Config loaded = Config::load_from_file(path);
        ASSERT(loaded.server.port == 8123);
        ASSERT(loaded.pipeline.min_sentence_chars == 5);
        ASSERT(loaded.llm.api_key.empty());

        setenv("VOXLINK_API_KEY", "from-env", 1);
        setenv("VOXLINK_SERVER_URL", "ws://10.0.0.2:8000/ws", 1);
        loaded = Config::load_from_file(path);
        ASSERT(loaded.llm.api_key == "from-env");
        ASSERT(loaded.client.server_url == "ws://10.0.0.2:8000/ws");
        unsetenv("VOXLINK_API_KEY");
        unsetenv("VOXLINK_SERVER_URL");

        std::remove(path.c_str());
        Config missing = Config::load_from_file(path);
        ASSERT(missing.server.port == 8000);
    }

    // --- Log level names ---
    {
        ASSERT(parse_log_level("debug") == LogLevel::DEBUG);
        ASSERT(parse_log_level("WARN") == LogLevel::WARN);
        ASSERT(parse_log_level("loud", LogLevel::ERROR) == LogLevel::ERROR);
    }

    // --- Lowercasing device and level names ---
    {
        ASSERT(utils::to_lower("HDA Intel PCH: ALC257") == "hda intel pch: alc257");
        // UTF-8 bytes (high bit set) pass through untouched
        const std::string cyrillic = "USB \xD0\x9C\xD0\xB8\xD0\xBA\xD1\x80\xD0\xBE\xD1\x84\xD0\xBE\xD0\xBD";
        const std::string lowered = utils::to_lower(cyrillic);
        ASSERT(lowered.size() == cyrillic.size());
        ASSERT(lowered.substr(0, 4) == "usb ");
        ASSERT(lowered.substr(4) == cyrillic.substr(4));
        ASSERT(utils::to_lower(std::string("\xFF\x80", 2)) == std::string("\xFF\x80", 2));
    }

    Logger::shutdown();

    if (failed == 0) {
        std::cout << "test_config: all assertions passed\n";
        return 0;
    }
    std::cerr << "test_config: " << failed << " assertion(s) failed\n";
    return 1;
}
