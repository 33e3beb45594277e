#include "llm_client.h"
#include "logger.h"
#include "memory/fact_store.h"
#include "utils.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

/// Tool arguments come as an object (Ollama) or a JSON string (OpenAI)
bool arguments_to_map(const json& args, std::map<std::string, std::string>& out) {
    json obj = args;
    if (args.is_string()) {
        const std::string raw = args.get<std::string>();
        if (utils::is_empty_or_whitespace(raw)) return true;
        try {
            obj = json::parse(raw);
        } catch (const json::exception&) {
            return false;
        }
    }
    if (obj.is_null()) return true;
    if (!obj.is_object()) return false;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        out[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return true;
}

std::string error_message_of(const json& err) {
    if (err.is_string()) return err.get<std::string>();
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
    }
    return err.dump();
}

} // namespace

ChatDialect parse_chat_dialect(const std::string& provider) {
    return to_lower(provider) == "openai" ? ChatDialect::OpenAI : ChatDialect::Ollama;
}

// --- ChatStreamParser -------------------------------------------------------

ChatStreamParser::ChatStreamParser(ChatDialect dialect, StreamItemCallback on_item)
    : dialect_(dialect), on_item_(std::move(on_item)) {}

bool ChatStreamParser::feed(const std::string& bytes) {
    if (stopped_ || done_) return false;
    line_buffer_ += bytes;

    size_t start = 0;
    size_t nl;
    while ((nl = line_buffer_.find('\n', start)) != std::string::npos) {
        std::string line = line_buffer_.substr(start, nl - start);
        start = nl + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!handle_line(line)) {
            line_buffer_.erase(0, start);
            return false;
        }
    }
    line_buffer_.erase(0, start);
    return true;
}

void ChatStreamParser::finish() {
    if (!stopped_ && !done_ && !line_buffer_.empty()) {
        std::string line;
        line.swap(line_buffer_);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        handle_line(line);
    }
    if (!stopped_) flush_tool_calls();
    done_ = true;
}

bool ChatStreamParser::handle_line(const std::string& line) {
    if (utils::is_empty_or_whitespace(line)) return true;
    return dialect_ == ChatDialect::Ollama ? handle_ollama(line) : handle_openai(line);
}

bool ChatStreamParser::handle_ollama(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::exception& e) {
        LOG_LLM(std::string("Skipping unparsable stream line: ") + e.what());
        return true;
    }

    if (j.contains("error")) {
        std::string msg = error_message_of(j["error"]);
        throw BackendError(msg, LLMClient::is_tool_call_error(0, msg));
    }

    if (j.contains("message") && j["message"].is_object()) {
        const json& message = j["message"];
        if (message.contains("content") && message["content"].is_string()) {
            std::string content = message["content"].get<std::string>();
            if (!content.empty() && !deliver(TextFragment{content})) return false;
        }
        if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
            for (const auto& tc : message["tool_calls"]) {
                if (!tc.contains("function") || !tc["function"].is_object()) continue;
                const json& func = tc["function"];
                ToolCall call;
                if (func.contains("name") && func["name"].is_string()) {
                    call.name = func["name"].get<std::string>();
                }
                if (call.name.empty()) continue;
                if (func.contains("arguments") &&
                    !arguments_to_map(func["arguments"], call.arguments)) {
                    LOG_LLM("Dropping tool call with invalid arguments: " + call.name);
                    continue;
                }
                if (!deliver(call)) return false;
            }
        }
    }

    if (j.contains("done") && j["done"].is_boolean() && j["done"].get<bool>()) {
        done_ = true;
        return false;
    }
    return true;
}

bool ChatStreamParser::handle_openai(const std::string& line) {
    if (line[0] == ':') return true;  // SSE comment / keep-alive
    if (line.compare(0, 5, "data:") != 0) {
        // A non-SSE body (plain JSON error) may still show up here
        if (line[0] == '{') {
            try {
                json j = json::parse(line);
                if (j.contains("error")) {
                    std::string msg = error_message_of(j["error"]);
                    throw BackendError(msg, LLMClient::is_tool_call_error(0, msg));
                }
            } catch (const json::exception&) {
                LOG_LLM("Ignoring non-SSE line: " + utils::preview(line));
            }
        }
        return true;
    }

    std::string payload = utils::trim_copy(line.substr(5));
    if (payload == "[DONE]") {
        flush_tool_calls();
        done_ = true;
        return false;
    }

    json j;
    try {
        j = json::parse(payload);
    } catch (const json::exception& e) {
        LOG_LLM(std::string("Skipping unparsable SSE event: ") + e.what());
        return true;
    }

    if (j.contains("error")) {
        std::string msg = error_message_of(j["error"]);
        throw BackendError(msg, LLMClient::is_tool_call_error(0, msg));
    }
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) return true;

    const json& choice = j["choices"][0];
    if (!choice.contains("delta") || !choice["delta"].is_object()) return true;
    const json& delta = choice["delta"];

    if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
        for (const auto& tc : delta["tool_calls"]) {
            int index = tc.contains("index") && tc["index"].is_number_integer() ? tc["index"].get<int>() : 0;
            PendingToolCall& pending = tool_calls_[index];
            if (tc.contains("function") && tc["function"].is_object()) {
                const json& func = tc["function"];
                if (func.contains("name") && func["name"].is_string() &&
                    !func["name"].get<std::string>().empty()) {
                    pending.name = func["name"].get<std::string>();
                }
                if (func.contains("arguments") && func["arguments"].is_string()) {
                    pending.arguments += func["arguments"].get<std::string>();
                }
            }
        }
    }

    if (delta.contains("content") && delta["content"].is_string()) {
        std::string content = delta["content"].get<std::string>();
        if (!content.empty() && !deliver(TextFragment{content})) return false;
    }
    return true;
}

bool ChatStreamParser::flush_tool_calls() {
    if (tool_calls_flushed_) return !stopped_;
    tool_calls_flushed_ = true;
    for (const auto& entry : tool_calls_) {
        const PendingToolCall& pending = entry.second;
        if (pending.name.empty()) continue;
        ToolCall call;
        call.name = pending.name;
        if (!arguments_to_map(json(pending.arguments), call.arguments)) {
            LOG_LLM("Dropping tool call with invalid arguments: " + pending.name);
            continue;
        }
        if (!deliver(call)) return false;
    }
    tool_calls_.clear();
    return true;
}

bool ChatStreamParser::deliver(const StreamItem& item) {
    if (stopped_) return false;
    if (!on_item_(item)) {
        stopped_ = true;
        return false;
    }
    return true;
}

// --- LLMClient ----------------------------------------------------------------

class LLMClient::Impl {
public:
    Impl(const LLMConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        dialect_ = parse_chat_dialect(config_.provider);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    void generate(const std::string& user_text, const FactList& facts, bool use_tools,
                  const CancelToken& cancel, const StreamItemCallback& on_item) {
        json messages = json::array();
        messages.push_back({{"role", "system"}, {"content", build_system_prompt(facts)}});
        messages.push_back({{"role", "user"}, {"content", user_text}});

        json request;
        request["model"] = config_.model_name;
        request["messages"] = messages;
        request["stream"] = true;
        if (dialect_ == ChatDialect::Ollama) {
            request["options"]["temperature"] = config_.temperature;
            request["options"]["num_predict"] = config_.max_tokens;
        } else {
            request["temperature"] = config_.temperature;
            request["max_tokens"] = config_.max_tokens;
        }
        if (use_tools) {
            request["tools"] = json::parse(tool_definitions_json());
            if (dialect_ == ChatDialect::OpenAI) request["tool_choice"] = "auto";
        }

        LOG_LLM(std::string("Streaming request (tools=") + (use_tools ? "on" : "off") + ") to " +
                config_.endpoint);

        ChatStreamParser parser(dialect_, on_item);
        StreamTransfer transfer;
        transfer.parser = &parser;
        transfer.cancel = &cancel;

        std::string body = request.dump(-1, ' ', false, json::error_handler_t::replace);
        CURLcode res = perform(body, true, &transfer);

        if (transfer.failure) {
            std::rethrow_exception(transfer.failure);
        }
        if (cancel.is_cancelled()) {
            LOG_LLM("Stream aborted by cancellation");
            return;
        }
        if (transfer.http_status >= 400) {
            std::string msg = "HTTP " + std::to_string(transfer.http_status) + ": " +
                              extract_error_text(transfer.error_body);
            throw BackendError(msg, LLMClient::is_tool_call_error(transfer.http_status, msg));
        }
        // Write aborts are ours: the consumer stopped or the stream reported done
        if (res != CURLE_OK && res != CURLE_WRITE_ERROR) {
            throw BackendError(std::string("request failed: ") + curl_easy_strerror(res), false);
        }
        parser.finish();
    }

    std::optional<std::string> extract_fact(const std::string& user_text, const FactList& facts) {
        std::string system = config_.fact_prompt;
        if (!facts.empty()) {
            system += "\nУже известно:";
            for (const auto& fact : facts) system += "\n- " + fact.text;
        }

        json request;
        request["model"] = config_.model_name;
        request["messages"] = json::array({
            {{"role", "system"}, {"content", system}},
            {{"role", "user"}, {"content", user_text}}
        });
        request["stream"] = false;
        if (dialect_ == ChatDialect::Ollama) {
            request["format"] = "json";
        } else {
            request["response_format"] = {{"type", "json_object"}};
        }

        std::string response_buffer;
        CURLcode res = perform(request.dump(-1, ' ', false, json::error_handler_t::replace),
                               false, &response_buffer);
        if (res != CURLE_OK) {
            LOG_LLM(std::string("Fact extraction request failed: ") + curl_easy_strerror(res));
            return std::nullopt;
        }

        std::string content;
        try {
            json response_json = json::parse(response_buffer);
            if (dialect_ == ChatDialect::Ollama) {
                if (response_json.contains("message") && response_json["message"].contains("content") &&
                    response_json["message"]["content"].is_string()) {
                    content = response_json["message"]["content"].get<std::string>();
                }
            } else if (response_json.contains("choices") && response_json["choices"].is_array() &&
                       !response_json["choices"].empty()) {
                const json& msg = response_json["choices"][0]["message"];
                if (msg.contains("content") && msg["content"].is_string()) {
                    content = msg["content"].get<std::string>();
                }
            }
        } catch (const json::exception& e) {
            LOG_LLM(std::string("Fact extraction: bad response: ") + e.what());
            return std::nullopt;
        }
        return LLMClient::parse_fact_answer(content);
    }

    std::string build_system_prompt(const FactList& facts) const {
        std::ostringstream oss;
        oss << config_.system_prompt;
        oss << "\nСегодня: " << memory::FactStore::today() << ".";
        if (!facts.empty()) {
            oss << "\nИзвестные факты о пользователе:";
            for (const auto& fact : facts) {
                oss << "\n- [" << fact.created_at << "] " << fact.text;
            }
        }
        return oss.str();
    }

private:
    struct StreamTransfer {
        ChatStreamParser* parser = nullptr;
        const CancelToken* cancel = nullptr;
        CURL* curl = nullptr;
        long http_status = 0;
        bool status_known = false;
        std::string error_body;
        std::exception_ptr failure;
    };

    /// POST body to the endpoint; userdata is StreamTransfer* when streaming, std::string* otherwise
    CURLcode perform(const std::string& body, bool streaming, void* userdata) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            if (streaming) throw BackendError("Failed to initialize CURL", false);
            return CURLE_FAILED_INIT;
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        std::string auth;
        if (!config_.api_key.empty()) {
            auth = "Authorization: Bearer " + config_.api_key;
            headers = curl_slist_append(headers, auth.c_str());
        }
        if (streaming && dialect_ == ChatDialect::OpenAI) {
            headers = curl_slist_append(headers, "Accept: text/event-stream");
        }

        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (streaming) {
            StreamTransfer* transfer = static_cast<StreamTransfer*>(userdata);
            transfer->curl = curl;
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, transfer);
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, transfer);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        } else {
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, userdata);
        }

        CURLcode res = curl_easy_perform(curl);

        if (streaming) {
            StreamTransfer* transfer = static_cast<StreamTransfer*>(userdata);
            if (!transfer->status_known) {
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &transfer->http_status);
            }
            std::ostringstream oss;
            oss << "Stream finished: curl=" << res << " http=" << transfer->http_status;
            LOG_LLM(oss.str());
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return res;
    }

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        std::string* buffer = static_cast<std::string*>(userp);
        size_t total_size = size * nmemb;
        buffer->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    static size_t stream_write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
        StreamTransfer* transfer = static_cast<StreamTransfer*>(userp);
        size_t total_size = size * nmemb;

        if (!transfer->status_known) {
            curl_easy_getinfo(transfer->curl, CURLINFO_RESPONSE_CODE, &transfer->http_status);
            transfer->status_known = true;
        }
        if (transfer->http_status >= 400) {
            transfer->error_body.append(contents, total_size);
            return total_size;
        }
        if (transfer->cancel->is_cancelled()) return 0;

        // Exceptions must not cross libcurl; park them and rethrow after perform
        try {
            if (!transfer->parser->feed(std::string(contents, total_size))) return 0;
        } catch (...) {
            transfer->failure = std::current_exception();
            return 0;
        }
        return total_size;
    }

    static int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        StreamTransfer* transfer = static_cast<StreamTransfer*>(userp);
        return transfer->cancel->is_cancelled() ? 1 : 0;
    }

    static std::string extract_error_text(const std::string& body) {
        try {
            json j = json::parse(body);
            if (j.contains("error")) return error_message_of(j["error"]);
        } catch (const json::exception&) {
            // Not JSON; report the raw body
        }
        return utils::preview(utils::trim_copy(body), 200);
    }

    LLMConfig config_;
    ChatDialect dialect_;
};

LLMClient::LLMClient(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

LLMClient::~LLMClient() = default;

void LLMClient::generate(const std::string& user_text, const FactList& facts, bool use_tools,
                         const CancelToken& cancel, const StreamItemCallback& on_item) {
    pimpl_->generate(user_text, facts, use_tools, cancel, on_item);
}

std::optional<std::string> LLMClient::extract_fact(const std::string& user_text, const FactList& facts) {
    return pimpl_->extract_fact(user_text, facts);
}

std::string LLMClient::build_system_prompt(const FactList& facts) const {
    return pimpl_->build_system_prompt(facts);
}

std::string LLMClient::tool_definitions_json() {
    auto make_tool = [](const char* name, const char* description, const char* param,
                        const char* param_description) {
        json tool;
        tool["type"] = "function";
        tool["function"]["name"] = name;
        tool["function"]["description"] = description;
        tool["function"]["parameters"]["type"] = "object";
        tool["function"]["parameters"]["properties"][param]["type"] = "string";
        tool["function"]["parameters"]["properties"][param]["description"] = param_description;
        tool["function"]["parameters"]["required"] = json::array({param});
        return tool;
    };

    json tools = json::array();
    tools.push_back(make_tool("open_url", "Opens a website or URL in the default browser.",
                              "url", "The URL to open (e.g., https://google.com)"));
    tools.push_back(make_tool("open_path", "Opens a folder or file on the local computer.",
                              "path", "Path to folder/file. Supports '~' for home directory."));
    tools.push_back(make_tool("run_app", "Launches an application by its name.",
                              "app_name", "The name of the application (e.g., 'Telegram', 'Chrome')"));
    return tools.dump();
}

bool LLMClient::is_tool_call_error(long http_status, const std::string& message) {
    if (http_status == 400) return true;
    std::string lower = to_lower(message);
    return lower.find("tool") != std::string::npos ||
           lower.find("function") != std::string::npos;
}

std::optional<std::string> LLMClient::parse_fact_answer(const std::string& content) {
    if (utils::is_empty_or_whitespace(content)) return std::nullopt;
    try {
        json j = json::parse(content);
        if (!j.is_object() || !j.contains("new_fact") || !j["new_fact"].is_string()) {
            return std::nullopt;
        }
        std::string fact = utils::trim_copy(j["new_fact"].get<std::string>());
        if (fact.empty() || to_lower(fact) == "null") return std::nullopt;
        return fact;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace voxlink
