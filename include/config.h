#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <cstdint>
#include <vector>

namespace voxlink {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int max_connections = 8;
    int http_port = 8001;   ///< GET /status and POST /chat; 0 disables
};

struct ReconnectConfig {
    int initial_ms = DEFAULT_RECONNECT_INITIAL_MS;
    int max_ms = DEFAULT_RECONNECT_MAX_MS;
    double multiplier = 2.0;
    int connect_timeout_ms = 5000;  ///< Give up on one attempt after this long
};

struct ClientConfig {
    std::string server_url = "ws://localhost:8000/ws";
    ReconnectConfig reconnect;
};

/// PCM format on both directions of the wire (s16le mono, no header)
struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int capture_rate = DEFAULT_CAPTURE_RATE;    ///< Client mic -> server
    int playback_rate = DEFAULT_PLAYBACK_RATE;  ///< Server TTS -> client speaker
    int frame_bytes = DEFAULT_FRAME_BYTES;      ///< Nominal binary frame size
};

struct STTConfig {
    std::string model_path;
    std::string language = "ru";
    std::string blank_sentinel = "[BLANK_AUDIO]";  ///< Treat this exact string (after trim) as blank
    bool use_gpu = true;
    int threads = 4;
};

struct LLMConfig {
    /// "ollama" (NDJSON /api/chat) or "openai" (SSE /v1/chat/completions, e.g. Groq)
    std::string provider = "ollama";
    std::string endpoint = "http://localhost:11434/api/chat";
    std::string model_name = "qwen2.5-coder:3b";
    std::string api_key;              ///< Bearer token for "openai"; VOXLINK_API_KEY overrides
    int timeout_ms = 60000;
    int connect_timeout_ms = 3000;
    int max_tokens = 512;
    float temperature = 0.1f;
    bool tools_enabled = true;
    std::string system_prompt =
        "Ты - голосовой ассистент. Отвечай кратко, одним-двумя предложениями. "
        "Если нужно открыть сайт или приложение, вызывай инструмент. "
        "Если инструмент не сработал, напиши команду текстом в начале ответа: "
        "\"CMD_OPEN_URL: ссылка\" или \"CMD_RUN_APP: название\".";
    std::string fact_prompt =
        "Найди новые факты о пользователе в его сообщении. "
        "Верни только JSON: {\"new_fact\": \"текст факта в 3-м лице или null\"}";
};

struct TTSConfig {
    std::string piper_path;         ///< Piper binary path (empty = auto-detect)
    std::string voice_path;
    std::string espeak_data_path;   ///< espeak-ng data dir (empty = Piper default)
    int chunk_bytes = 4096;         ///< Size of each PCM chunk sent to the client
    float output_gain = 1.0f;
};

struct PipelineConfig {
    int min_sentence_chars = 3;     ///< Letters/digits a sentence needs before it is spoken alone
    std::string apology_text = "Извини, произошла техническая ошибка. Попробуй еще раз.";
};

struct MemoryConfig {
    bool enabled = true;
    std::string facts_path = "memory.json";
};

struct LogConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    ServerConfig server;
    ClientConfig client;
    AudioConfig audio;
    STTConfig stt;
    LLMConfig llm;
    TTSConfig tts;
    PipelineConfig pipeline;
    MemoryConfig memory;
    LogConfig log;

    /**
     * @brief Load configuration from a JSON file.
     *
     * Missing keys keep their defaults. A missing or malformed file logs a
     * warning and yields the defaults. Environment overrides are applied last.
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Parse configuration from a JSON document (no environment overrides)
     */
    static Result<Config> parse(const std::string& json_text);

    void save_to_file(const std::string& path) const;

    /// Apply VOXLINK_SERVER_URL, VOXLINK_API_KEY, VOXLINK_LOG_LEVEL
    void apply_env_overrides();

    /**
     * @brief Validate configuration
     * @return Error messages, empty if valid
     */
    std::vector<std::string> validate() const;
};

} // namespace voxlink
