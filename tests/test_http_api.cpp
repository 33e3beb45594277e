/**
 * HTTP side endpoint: /status and text-only /chat turns.
 * Asserts:
 * - /status reports the backend profile and model.
 * - /chat runs tools and joins markers and sentences; nothing is synthesized.
 * - Backend failure answers with the apology; bad requests get 4xx.
 * - The listener serves /status over a real socket on 127.0.0.1.
 *
 * Run from build dir: ./test_http_api
 */

#include "fakes.h"
#include "http_api.h"
#include "logger.h"
#include "tool_call_extractor.h"
#include <ixwebsocket/IXHttpClient.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace voxlink;
using namespace voxlink::fakes;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static const char* kApology = "Извини, произошла техническая ошибка. Попробуй еще раз.";
static const std::string kTool = "[\xF0\x9F\x9B\xA0\xEF\xB8\x8F ";

struct Services {
    ScriptedBackend backend;
    FakeSynthesizer synth;
    FakeToolExecutor tools;
    ToolCallExtractor extractor;
    std::vector<std::string> scheduled;
    SessionServices session;
    SessionOptions options;
    ServerConfig server;

    explicit Services(std::vector<BackendScript> scripts) : backend(std::move(scripts)) {
        session.pipeline.backend = &backend;
        session.pipeline.synthesizer = &synth;
        session.pipeline.tools = &tools;
        session.pipeline.extractor = &extractor;
        session.pipeline.schedule_fact_extraction = [this](const std::string& text) { scheduled.push_back(text); };
        options.apology_text = kApology;
        server.host = "127.0.0.1";
        server.http_port = 18461;
    }
};

static json body_of(const HttpReply& reply) {
    return json::parse(reply.body, nullptr, false);
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- /status ---
    {
        Services s({});
        HttpApi api(s.server, s.session, s.options, "ollama", "qwen2.5:7b");
        HttpReply reply = api.handle("GET", "/status", "");
        ASSERT(reply.status == 200);
        ASSERT(reply.content_type == "application/json");
        json j = body_of(reply);
        ASSERT(j["status"] == "ok");
        ASSERT(j["profile"] == "ollama");
        ASSERT(j["model"] == "qwen2.5:7b");
        ASSERT(api.handle("GET", "/status?verbose=1", "").status == 200);
        ASSERT(api.handle("POST", "/status", "").status == 405);
        ASSERT(api.handle("GET", "/ws", "").status == 404);
    }

    // --- /chat: structured and text tools, joined response ---
    {
        BackendScript script;
        script.items.push_back(ToolCall{"open_url", {{"url", "https://youtube.com"}}});
        script.items.push_back(TextFragment{"Открываю ютуб. CMD_RUN_APP: telegram. Запускаю"});
        script.items.push_back(TextFragment{" телеграм."});
        Services s({script});
        HttpApi api(s.server, s.session, s.options, "ollama", "qwen");

        HttpReply reply = api.handle("POST", "/chat", R"({"user_text": "  открой ютуб и телеграм "})");
        ASSERT(reply.status == 200);
        json j = body_of(reply);
        ASSERT(j["outcome"] == "completed");
        ASSERT(j["response"] == kTool + "open_url] Открываю ютуб. " + kTool + "run_app] Запускаю телеграм.");

        auto calls = s.tools.calls();
        ASSERT(calls.size() == 2);
        ASSERT(calls.size() == 2 && calls[0] == "open_url:https://youtube.com" && calls[1] == "run_app:telegram");
        ASSERT(s.synth.sentences().empty());
        ASSERT(s.scheduled.size() == 1 && s.scheduled[0] == "открой ютуб и телеграм");
    }

    // --- /chat: backend failure ends in the apology ---
    {
        BackendScript broken;
        broken.fail = true;
        broken.tool_shaped = false;
        Services s({broken});
        HttpApi api(s.server, s.session, s.options, "openai", "llama");
        HttpReply reply = api.handle("POST", "/chat", R"({"user_text": "погода"})");
        ASSERT(reply.status == 200);
        json j = body_of(reply);
        ASSERT(j["outcome"] == "apologized");
        ASSERT(j["response"] == kApology);
    }

    // --- /chat: malformed requests ---
    {
        Services s({});
        HttpApi api(s.server, s.session, s.options, "ollama", "qwen");
        ASSERT(api.handle("POST", "/chat", "not json").status == 400);
        ASSERT(api.handle("POST", "/chat", "{}").status == 400);
        ASSERT(api.handle("POST", "/chat", R"({"user_text": 5})").status == 400);
        ASSERT(api.handle("POST", "/chat", R"({"user_text": "   "})").status == 400);
        ASSERT(api.handle("GET", "/chat", "").status == 405);
        ASSERT(s.backend.use_tools().empty());
        ASSERT(body_of(api.handle("POST", "/chat", "{}")).contains("error"));
    }

    // --- Listener ---
    {
        Services s({});
        HttpApi api(s.server, s.session, s.options, "ollama", "qwen");
        auto started = api.start();
        ASSERT(started.is_ok());
        if (started.is_ok()) {
            ix::HttpClient client;
            ix::HttpRequestArgsPtr args = client.createRequest();
            args->connectTimeout = 2;
            args->transferTimeout = 2;
            ix::HttpResponsePtr response = client.get("http://127.0.0.1:18461/status", args);
            ASSERT(response && response->statusCode == 200);
            if (response) {
                json j = json::parse(response->body, nullptr, false);
                ASSERT(!j.is_discarded() && j["status"] == "ok" && j["profile"] == "ollama");
            }
            response = client.get("http://127.0.0.1:18461/nowhere", args);
            ASSERT(response && response->statusCode == 404);
        }
        api.stop();
        api.stop();
    }

    Logger::shutdown();

    if (failed == 0) {
        std::cout << "test_http_api: all assertions passed\n";
        return 0;
    }
    std::cerr << "test_http_api: " << failed << " assertion(s) failed\n";
    return 1;
}
