#pragma once

/**
 * In-process stand-ins for the server's collaborators, shared by the
 * pipeline and session tests. No network, audio device or model.
 */

#include "control_channel.h"
#include "errors.h"
#include "generation_backend.h"
#include "outbound_channel.h"
#include "stt_engine.h"
#include "tool.h"
#include "tts_engine.h"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace voxlink {
namespace fakes {

/// Everything a connection sent, in order
class RecordingSink : public MessageSink {
public:
    struct Sent {
        bool binary;
        std::string payload;
    };

    bool send_text(const std::string& text) override {
        return record(false, text);
    }

    bool send_binary(const std::string& data) override {
        return record(true, data);
    }

    std::vector<Sent> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

    /// Block until at least n messages were sent (or timeout)
    bool wait_for(size_t n, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&] { return sent_.size() >= n; });
    }

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& s : sent_) {
            if (s.payload.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    bool record(bool binary, const std::string& payload) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back({binary, payload});
        }
        cv_.notify_all();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Sent> sent_;
};

inline std::string text_of(const ControlMessage& message) {
    return ControlChannel::serialize(message);
}

/// What one generate() call does
struct BackendScript {
    std::vector<StreamItem> items;
    bool fail = false;               ///< Throw BackendError ...
    size_t fail_at = 0;              ///< ... before delivering items[fail_at] (or at the end)
    bool tool_shaped = false;
    bool hold_after_first = false;   ///< Wait for cancellation after the first item
    bool ignore_stop = false;        ///< Keep delivering after the consumer said stop
};

class ScriptedBackend : public GenerationBackend {
public:
    explicit ScriptedBackend(std::vector<BackendScript> scripts = {})
        : scripts_(std::move(scripts)) {}

    void generate(const std::string& user_text,
                  const FactList& facts,
                  bool use_tools,
                  const CancelToken& cancel,
                  const StreamItemCallback& on_item) override {
        (void)facts;
        BackendScript script;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t idx = use_tools_.size();
            use_tools_.push_back(use_tools);
            prompts_.push_back(user_text);
            if (scripts_.empty()) return;
            script = idx < scripts_.size() ? scripts_[idx] : scripts_.back();
        }

        for (size_t i = 0; i < script.items.size(); i++) {
            if (script.fail && i == script.fail_at) {
                throw BackendError("scripted failure", script.tool_shaped);
            }
            bool keep_going = on_item(script.items[i]);
            if (!keep_going && !script.ignore_stop) return;

            if (i == 0 && script.hold_after_first) {
                auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
                while (!cancel.is_cancelled() && std::chrono::steady_clock::now() < deadline) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
            }
        }
        if (script.fail && script.fail_at >= script.items.size()) {
            throw BackendError("scripted failure", script.tool_shaped);
        }
    }

    std::optional<std::string> extract_fact(const std::string& user_text,
                                            const FactList& facts) override {
        (void)facts;
        std::lock_guard<std::mutex> lock(mutex_);
        fact_requests_.push_back(user_text);
        auto it = facts_.find(user_text);
        if (it == facts_.end()) return std::nullopt;
        return it->second;
    }

    void set_fact(const std::string& user_text, const std::string& fact) {
        std::lock_guard<std::mutex> lock(mutex_);
        facts_[user_text] = fact;
    }

    std::vector<bool> use_tools() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return use_tools_;
    }

    std::vector<std::string> fact_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fact_requests_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<BackendScript> scripts_;
    std::vector<bool> use_tools_;
    std::vector<std::string> prompts_;
    std::vector<std::string> fact_requests_;
    std::map<std::string, std::string> facts_;
};

/// Emits `chunks` PCM chunks per sentence: "pcm|<sentence>|<i>"
class FakeSynthesizer : public SpeechSynthesizer {
public:
    explicit FakeSynthesizer(int chunks = 2) : chunks_(chunks) {}

    VoidResult synthesize(const std::string& sentence,
                          const CancelToken& cancel,
                          const PcmChunkCallback& on_chunk) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sentences_.push_back(sentence);
        }
        if (fail_) {
            return make_error(ErrorType::IOError, "synthesizer unavailable");
        }
        for (int i = 0; i < chunks_; i++) {
            if (cancel.is_cancelled()) break;
            if (!on_chunk(chunk(sentence, i))) break;
        }
        return VoidResult();
    }

    int sample_rate() const override { return 22050; }

    static std::string chunk(const std::string& sentence, int i) {
        return "pcm|" + sentence + "|" + std::to_string(i);
    }

    void set_fail(bool fail) { fail_ = fail; }

    std::vector<std::string> sentences() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sentences_;
    }

private:
    int chunks_;
    bool fail_ = false;
    mutable std::mutex mutex_;
    std::vector<std::string> sentences_;
};

/// Records calls; open_path fails for paths starting with "/missing", run_app("boom") throws
class FakeToolExecutor : public ToolExecutor {
public:
    ToolResult open_url(const std::string& url) override {
        log("open_url:" + url);
        return ToolResult::success_result("Opened URL: " + url);
    }

    ToolResult open_path(const std::string& path) override {
        log("open_path:" + path);
        if (path.rfind("/missing", 0) == 0) {
            return ToolResult::error_result("Error: Path does not exist: " + path);
        }
        return ToolResult::success_result("Opened path: " + path);
    }

    ToolResult run_app(const std::string& app_name) override {
        log("run_app:" + app_name);
        if (app_name == "boom") throw std::runtime_error("launcher crashed");
        return ToolResult::success_result("Launched application: " + app_name);
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    void log(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(call);
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

/// Shared view of what the session's recognizers saw
struct RecognizerLog {
    std::mutex mutex;
    std::vector<std::string> transcripts;  ///< Returned by successive text() calls (last one repeats)
    size_t text_calls = 0;
    size_t starts = 0;
    size_t bytes_fed = 0;
};

class FakeRecognizer : public SpeechRecognizer {
public:
    explicit FakeRecognizer(std::shared_ptr<RecognizerLog> log) : log_(std::move(log)) {}

    void start() override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        log_->starts++;
        log_->bytes_fed = 0;
    }

    void feed(const std::string& pcm_bytes) override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        log_->bytes_fed += pcm_bytes.size();
    }

    void stop() override {}

    std::string text() override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        if (log_->transcripts.empty()) return "";
        size_t idx = std::min(log_->text_calls, log_->transcripts.size() - 1);
        log_->text_calls++;
        return log_->transcripts[idx];
    }

private:
    std::shared_ptr<RecognizerLog> log_;
};

} // namespace fakes
} // namespace voxlink
