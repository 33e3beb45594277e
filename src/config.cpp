#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <typename T>
void read_int(const json& obj, const char* key, T& out) {
    if (obj.contains(key) && obj[key].is_number_integer()) out = obj[key].get<T>();
}

template <typename T>
void read_number(const json& obj, const char* key, T& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<T>();
}

void read_string(const json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

void read_bool(const json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean()) out = obj[key].get<bool>();
}

/// Apply every recognized section of j onto cfg. Unknown keys are ignored.
void apply_json_to_config(voxlink::Config& cfg, const json& j) {
    if (j.contains("server") && j["server"].is_object()) {
        const auto& s = j["server"];
        read_string(s, "host", cfg.server.host);
        read_int(s, "port", cfg.server.port);
        read_int(s, "max_connections", cfg.server.max_connections);
        read_int(s, "http_port", cfg.server.http_port);
    }

    if (j.contains("client") && j["client"].is_object()) {
        const auto& c = j["client"];
        read_string(c, "server_url", cfg.client.server_url);
        if (c.contains("reconnect") && c["reconnect"].is_object()) {
            const auto& r = c["reconnect"];
            read_int(r, "initial_ms", cfg.client.reconnect.initial_ms);
            read_int(r, "max_ms", cfg.client.reconnect.max_ms);
            read_number(r, "multiplier", cfg.client.reconnect.multiplier);
            read_int(r, "connect_timeout_ms", cfg.client.reconnect.connect_timeout_ms);
        }
    }

    if (j.contains("audio") && j["audio"].is_object()) {
        const auto& a = j["audio"];
        read_string(a, "input_device", cfg.audio.input_device);
        read_string(a, "output_device", cfg.audio.output_device);
        read_int(a, "capture_rate", cfg.audio.capture_rate);
        read_int(a, "playback_rate", cfg.audio.playback_rate);
        read_int(a, "frame_bytes", cfg.audio.frame_bytes);
    }

    if (j.contains("stt") && j["stt"].is_object()) {
        const auto& s = j["stt"];
        read_string(s, "model_path", cfg.stt.model_path);
        read_string(s, "language", cfg.stt.language);
        read_string(s, "blank_sentinel", cfg.stt.blank_sentinel);
        read_bool(s, "use_gpu", cfg.stt.use_gpu);
        read_int(s, "threads", cfg.stt.threads);
    }

    if (j.contains("llm") && j["llm"].is_object()) {
        const auto& l = j["llm"];
        read_string(l, "provider", cfg.llm.provider);
        read_string(l, "endpoint", cfg.llm.endpoint);
        read_string(l, "model_name", cfg.llm.model_name);
        read_string(l, "api_key", cfg.llm.api_key);
        read_int(l, "timeout_ms", cfg.llm.timeout_ms);
        read_int(l, "connect_timeout_ms", cfg.llm.connect_timeout_ms);
        read_int(l, "max_tokens", cfg.llm.max_tokens);
        read_number(l, "temperature", cfg.llm.temperature);
        read_bool(l, "tools_enabled", cfg.llm.tools_enabled);
        read_string(l, "system_prompt", cfg.llm.system_prompt);
        read_string(l, "fact_prompt", cfg.llm.fact_prompt);
    }

    if (j.contains("tts") && j["tts"].is_object()) {
        const auto& t = j["tts"];
        read_string(t, "piper_path", cfg.tts.piper_path);
        read_string(t, "voice_path", cfg.tts.voice_path);
        read_string(t, "espeak_data_path", cfg.tts.espeak_data_path);
        read_int(t, "chunk_bytes", cfg.tts.chunk_bytes);
        read_number(t, "output_gain", cfg.tts.output_gain);
    }

    if (j.contains("pipeline") && j["pipeline"].is_object()) {
        const auto& p = j["pipeline"];
        read_int(p, "min_sentence_chars", cfg.pipeline.min_sentence_chars);
        read_string(p, "apology_text", cfg.pipeline.apology_text);
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        const auto& m = j["memory"];
        read_bool(m, "enabled", cfg.memory.enabled);
        read_string(m, "facts_path", cfg.memory.facts_path);
    }

    if (j.contains("log") && j["log"].is_object()) {
        const auto& lg = j["log"];
        read_string(lg, "level", cfg.log.level);
        read_string(lg, "file", cfg.log.file);
    }
}

void expand_paths(voxlink::Config& cfg) {
    cfg.stt.model_path = voxlink::expand_path(cfg.stt.model_path);
    cfg.tts.voice_path = voxlink::expand_path(cfg.tts.voice_path);
    cfg.tts.piper_path = voxlink::expand_path(cfg.tts.piper_path);
    cfg.memory.facts_path = voxlink::expand_path(cfg.memory.facts_path);
    cfg.log.file = voxlink::expand_path(cfg.log.file);
    if (cfg.tts.espeak_data_path.empty())
        cfg.tts.espeak_data_path = voxlink::default_espeak_data_path();
    else
        cfg.tts.espeak_data_path = voxlink::expand_path(cfg.tts.espeak_data_path);
}

} // namespace

namespace voxlink {

Result<Config> Config::parse(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("config: ") + e.what());
    }
    if (!j.is_object()) {
        return make_parse_error("config: top-level value must be an object");
    }

    Config cfg;
    apply_json_to_config(cfg, j);
    expand_paths(cfg);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file " + path + ". Using defaults.");
        expand_paths(cfg);
        cfg.apply_env_overrides();
        return cfg;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse(buffer.str());
    if (parsed.is_error()) {
        Logger::error("Error parsing " + path + ": " + parsed.error().message + ". Using defaults.");
        expand_paths(cfg);
    } else {
        cfg = parsed.value();
    }

    cfg.apply_env_overrides();
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* url = std::getenv("VOXLINK_SERVER_URL")) {
        if (*url) client.server_url = url;
    }
    if (const char* key = std::getenv("VOXLINK_API_KEY")) {
        if (*key) llm.api_key = key;
    }
    if (const char* level = std::getenv("VOXLINK_LOG_LEVEL")) {
        if (*level) log.level = level;
    }
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;

    if (server.port <= 0 || server.port > 65535)
        errors.push_back("server.port out of range: " + std::to_string(server.port));
    if (server.http_port < 0 || server.http_port > 65535 || (server.http_port != 0 && server.http_port == server.port))
        errors.push_back("server.http_port must be 0 or a free port other than server.port");
    if (client.server_url.rfind("ws://", 0) != 0 && client.server_url.rfind("wss://", 0) != 0)
        errors.push_back("client.server_url must start with ws:// or wss://");
    if (client.reconnect.initial_ms <= 0)
        errors.push_back("client.reconnect.initial_ms must be positive");
    if (client.reconnect.max_ms < client.reconnect.initial_ms)
        errors.push_back("client.reconnect.max_ms must be >= initial_ms");
    if (client.reconnect.multiplier <= 1.0)
        errors.push_back("client.reconnect.multiplier must be > 1.0");
    if (audio.capture_rate <= 0 || audio.playback_rate <= 0)
        errors.push_back("audio sample rates must be positive");
    if (audio.frame_bytes <= 0 || audio.frame_bytes % BYTES_PER_SAMPLE != 0)
        errors.push_back("audio.frame_bytes must be a positive multiple of " + std::to_string(BYTES_PER_SAMPLE));
    if (llm.provider != "ollama" && llm.provider != "openai")
        errors.push_back("llm.provider must be \"ollama\" or \"openai\", got \"" + llm.provider + "\"");
    if (llm.endpoint.empty())
        errors.push_back("llm.endpoint is empty");
    if (tts.chunk_bytes <= 0 || tts.chunk_bytes % BYTES_PER_SAMPLE != 0)
        errors.push_back("tts.chunk_bytes must be a positive multiple of " + std::to_string(BYTES_PER_SAMPLE));
    if (pipeline.min_sentence_chars < 0)
        errors.push_back("pipeline.min_sentence_chars must be >= 0");
    if (memory.enabled && memory.facts_path.empty())
        errors.push_back("memory.facts_path is empty while memory is enabled");

    return errors;
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["server"]["host"] = server.host;
    j["server"]["port"] = server.port;
    j["server"]["max_connections"] = server.max_connections;
    j["server"]["http_port"] = server.http_port;

    j["client"]["server_url"] = client.server_url;
    j["client"]["reconnect"]["initial_ms"] = client.reconnect.initial_ms;
    j["client"]["reconnect"]["max_ms"] = client.reconnect.max_ms;
    j["client"]["reconnect"]["multiplier"] = client.reconnect.multiplier;
    j["client"]["reconnect"]["connect_timeout_ms"] = client.reconnect.connect_timeout_ms;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["capture_rate"] = audio.capture_rate;
    j["audio"]["playback_rate"] = audio.playback_rate;
    j["audio"]["frame_bytes"] = audio.frame_bytes;

    j["stt"]["model_path"] = stt.model_path;
    j["stt"]["language"] = stt.language;
    j["stt"]["blank_sentinel"] = stt.blank_sentinel;
    j["stt"]["use_gpu"] = stt.use_gpu;
    j["stt"]["threads"] = stt.threads;

    j["llm"]["provider"] = llm.provider;
    j["llm"]["endpoint"] = llm.endpoint;
    j["llm"]["model_name"] = llm.model_name;
    // api_key is never written back; it usually comes from VOXLINK_API_KEY
    j["llm"]["timeout_ms"] = llm.timeout_ms;
    j["llm"]["connect_timeout_ms"] = llm.connect_timeout_ms;
    j["llm"]["max_tokens"] = llm.max_tokens;
    j["llm"]["temperature"] = llm.temperature;
    j["llm"]["tools_enabled"] = llm.tools_enabled;
    j["llm"]["system_prompt"] = llm.system_prompt;
    j["llm"]["fact_prompt"] = llm.fact_prompt;

    j["tts"]["piper_path"] = tts.piper_path;
    j["tts"]["voice_path"] = tts.voice_path;
    j["tts"]["espeak_data_path"] = tts.espeak_data_path;
    j["tts"]["chunk_bytes"] = tts.chunk_bytes;
    j["tts"]["output_gain"] = tts.output_gain;

    j["pipeline"]["min_sentence_chars"] = pipeline.min_sentence_chars;
    j["pipeline"]["apology_text"] = pipeline.apology_text;

    j["memory"]["enabled"] = memory.enabled;
    j["memory"]["facts_path"] = memory.facts_path;

    j["log"]["level"] = log.level;
    j["log"]["file"] = log.file;

    std::ofstream file(path);
    if (file.is_open()) {
        file << j.dump(2);
    } else {
        Logger::warn("Could not write config file " + path);
    }
}

} // namespace voxlink
