#include "http_api.h"
#include "logger.h"
#include "outbound_channel.h"
#include "response_pipeline.h"
#include "utils.h"
#include <ixwebsocket/IXHttpServer.h>
#include <ixwebsocket/IXNetSystem.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <vector>

namespace voxlink {

using json = nlohmann::json;

namespace {

/// Collects the assistant_text of one text-only turn
class TextCollector : public MessageSink {
public:
    bool send_text(const std::string& text) override {
        auto parsed = ControlChannel::parse(text, Direction::ServerToClient);
        if (parsed.is_ok()) {
            if (const auto* at = std::get_if<AssistantTextMsg>(&parsed.value())) {
                std::lock_guard<std::mutex> lock(mutex_);
                parts_.push_back(at->text);
            }
        }
        return true;
    }

    bool send_binary(const std::string& data) override {
        (void)data;
        return true;
    }

    std::string joined() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (const auto& part : parts_) {
            if (!out.empty()) out += " ";
            out += part;
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> parts_;
};

HttpReply json_reply(int status, const json& body) {
    HttpReply reply;
    reply.status = status;
    reply.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    return reply;
}

HttpReply error_reply(int status, const std::string& message) {
    return json_reply(status, json{{"error", message}});
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        default: return "Internal Server Error";
    }
}

} // namespace

class HttpApi::Impl {
public:
    Impl(const ServerConfig& config, const SessionServices& services, const SessionOptions& options,
         const std::string& profile, const std::string& model)
        : config_(config),
          services_(services),
          options_(options),
          profile_(profile),
          model_(model),
          server_(config.http_port, config.host, ix::SocketServer::kDefaultTcpBacklog,
                  static_cast<size_t>(config.max_connections)) {
        // Text turns never synthesize
        services_.pipeline.synthesizer = nullptr;
    }

    ~Impl() {
        stop();
    }

    VoidResult start() {
        ix::initNetSystem();

        server_.setOnConnectionCallback(
            [this](ix::HttpRequestPtr request,
                   std::shared_ptr<ix::ConnectionState> connection) -> ix::HttpResponsePtr {
                (void)connection;
                HttpReply reply = handle(request->method, request->uri, request->body);
                ix::WebSocketHttpHeaders headers;
                headers["Content-Type"] = reply.content_type;
                return std::make_shared<ix::HttpResponse>(
                    reply.status, reason_phrase(reply.status), ix::HttpErrorCode::Ok,
                    headers, reply.body);
            });

        auto res = server_.listen();
        if (!res.first) {
            return make_transport_error("Cannot listen on " + config_.host + ":" +
                                        std::to_string(config_.http_port) + ": " + res.second);
        }
        server_.start();
        running_ = true;
        LOG_WS("HTTP API on http://" + config_.host + ":" + std::to_string(config_.http_port));
        return VoidResult();
    }

    void stop() {
        if (!running_.exchange(false)) return;
        server_.stop();
    }

    HttpReply handle(const std::string& method, const std::string& uri, const std::string& body) {
        std::string path = uri.substr(0, uri.find('?'));

        if (path == "/status") {
            if (method != "GET") return error_reply(405, "use GET");
            return json_reply(200, json{{"status", "ok"}, {"profile", profile_}, {"model", model_}});
        }
        if (path == "/chat") {
            if (method != "POST") return error_reply(405, "use POST");
            return chat(body);
        }
        return error_reply(404, "no such endpoint: " + path);
    }

private:
    HttpReply chat(const std::string& body) {
        json request = json::parse(body, nullptr, false);
        if (request.is_discarded() || !request.is_object() ||
            !request.contains("user_text") || !request["user_text"].is_string()) {
            return error_reply(400, "expected {\"user_text\": \"...\"}");
        }
        std::string user_text = utils::trim_copy(request["user_text"].get<std::string>());
        if (user_text.empty()) {
            return error_reply(400, "user_text is empty");
        }

        FactList facts;
        if (services_.facts) {
            facts = services_.facts->facts();
        }

        PipelineOptions pipeline_options;
        pipeline_options.min_sentence_chars = options_.min_sentence_chars;
        pipeline_options.apology_text = options_.apology_text;
        pipeline_options.tools_enabled = options_.tools_enabled;

        auto collector = std::make_shared<TextCollector>();
        OutboundChannel out(collector);
        Generation generation = out.advance();
        ResponsePipeline pipeline(services_.pipeline, pipeline_options, out, generation,
                                  std::make_shared<CancelToken>());
        PipelineOutcome outcome = pipeline.run(user_text, facts);
        LOG_PIPELINE("Text turn " + std::string(pipeline_outcome_name(outcome)) + ": \"" +
                     utils::preview(user_text, 40) + "\"");

        return json_reply(200, json{{"response", collector->joined()},
                                    {"outcome", pipeline_outcome_name(outcome)}});
    }

    ServerConfig config_;
    SessionServices services_;
    SessionOptions options_;
    std::string profile_;
    std::string model_;
    ix::HttpServer server_;
    std::atomic<bool> running_{false};
};

HttpApi::HttpApi(const ServerConfig& config,
                 const SessionServices& services,
                 const SessionOptions& options,
                 const std::string& profile,
                 const std::string& model)
    : pimpl_(std::make_unique<Impl>(config, services, options, profile, model)) {}

HttpApi::~HttpApi() = default;

VoidResult HttpApi::start() {
    return pimpl_->start();
}

void HttpApi::stop() {
    pimpl_->stop();
}

HttpReply HttpApi::handle(const std::string& method, const std::string& uri, const std::string& body) {
    return pimpl_->handle(method, uri, body);
}

} // namespace voxlink
