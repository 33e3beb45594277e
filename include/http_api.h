#pragma once

#include "config.h"
#include "errors.h"
#include "session.h"
#include <memory>
#include <string>

namespace voxlink {

/// Status line, JSON body and content type of one HTTP answer
struct HttpReply {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

/**
 * @brief Side HTTP endpoint of the server (http://host:http_port).
 *
 *   GET  /status  {"status":"ok","profile":...,"model":...}
 *   POST /chat    {"user_text":"..."} -> {"response":"...","outcome":"..."}
 *
 * /chat runs one text-only turn through the same ResponsePipeline as a
 * voice session (tools executed, facts scheduled, no synthesis) and answers
 * with the tool markers and sentences joined by spaces.
 */
class HttpApi {
public:
    HttpApi(const ServerConfig& config,
            const SessionServices& services,
            const SessionOptions& options,
            const std::string& profile,
            const std::string& model);
    ~HttpApi();

    // Non-copyable
    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;

    /**
     * @brief Bind http_port and start serving
     */
    VoidResult start();

    void stop();

    /// Route one request; used by the listener and directly by tests
    HttpReply handle(const std::string& method, const std::string& uri, const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
