#include "session.h"
#include "control_channel.h"
#include "logger.h"
#include "utils.h"
#include <type_traits>

namespace voxlink {

Session::Session(uint64_t id,
                 std::shared_ptr<MessageSink> sink,
                 const SessionServices& services,
                 const SessionOptions& options)
    : id_(id),
      services_(services),
      options_(options),
      out_(std::move(sink)) {
    if (services_.make_recognizer) {
        recognizer_ = services_.make_recognizer();
    }
    if (!recognizer_) {
        LOG_SESSION("Session " + std::to_string(id_) + " has no speech recognizer; utterances will be blank");
    }
    LOG_SESSION("Session " + std::to_string(id_) + " opened");
}

Session::~Session() {
    on_disconnect();
}

void Session::on_text(const std::string& text) {
    auto parsed = ControlChannel::parse(text, Direction::ClientToServer);
    if (parsed.is_error()) {
        LOG_WARN("Session " + std::to_string(id_) + ": " + parsed.error().to_string());
        return;
    }

    std::visit([this](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, StartMsg>) {
            handle_start();
        } else if constexpr (std::is_same_v<T, EndMsg>) {
            handle_end();
        }
    }, parsed.value());
}

void Session::on_binary(const std::string& data) {
    if (!state_.is_recording()) {
        LOG_DEBUG("Session " + std::to_string(id_) + ": " + std::to_string(data.size()) +
                  " audio bytes outside an utterance, ignored");
        return;
    }
    if (recognizer_) {
        recognizer_->feed(data);
    }
    size_t frames = ++frames_received_;
    if (frames % 100 == 0) {
        LOG_AUDIO("Session " + std::to_string(id_) + ": " + std::to_string(frames) + " frames");
    }
}

void Session::handle_start() {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        if (disconnected_) return;
    }

    cancel_running();
    Generation generation = out_.advance();

    if (recognizer_) {
        recognizer_->start();
    }
    frames_received_ = 0;
    state_.on_start(generation);
    reap_finished();

    LOG_TRACE(id_, generation, "start", "");
}

void Session::handle_end() {
    if (!state_.on_end()) {
        LOG_DEBUG("Session " + std::to_string(id_) + ": end without an open utterance, ignored");
        return;
    }

    Generation generation = state_.generation();
    LOG_TRACE(id_, generation, "end", std::to_string(frames_received_.load()) + " frames");

    std::string transcript;
    if (recognizer_) {
        recognizer_->stop();
        transcript = recognizer_->text();
    }

    bool blank = utils::is_blank_transcript(transcript, options_.blank_sentinel);
    if (!state_.on_transcript(blank)) {
        return;
    }
    if (blank) {
        LOG_STT(make_error(ErrorType::STTDecode, "blank transcript, session " +
                           std::to_string(id_) + " back to idle").to_string());
        return;
    }

    LOG_TRACE(id_, generation, "transcript", utils::preview(transcript));
    spawn_pipeline(utils::trim_copy(transcript), generation);
}

void Session::spawn_pipeline(const std::string& user_text, Generation generation) {
    FactList facts;
    if (services_.facts) {
        facts = services_.facts->facts();
    }

    PipelineOptions pipeline_options;
    pipeline_options.min_sentence_chars = options_.min_sentence_chars;
    pipeline_options.apology_text = options_.apology_text;
    pipeline_options.tools_enabled = options_.tools_enabled;
    pipeline_options.frame_bytes = options_.frame_bytes;
    pipeline_options.session_id = id_;

    PipelineTask task;
    task.generation = generation;
    task.cancel = std::make_shared<CancelToken>();
    task.done = std::make_shared<std::atomic<bool>>(false);

    CancelTokenPtr cancel = task.cancel;
    std::shared_ptr<std::atomic<bool>> done = task.done;
    PipelineServices services = services_.pipeline;

    std::lock_guard<std::mutex> lock(tasks_mutex_);
    if (disconnected_) return;

    task.thread = std::thread([this, services, pipeline_options, generation, cancel, done,
                               user_text, facts]() {
        ResponsePipeline pipeline(services, pipeline_options, out_, generation, cancel);
        PipelineOutcome outcome = PipelineOutcome::Cancelled;
        try {
            outcome = pipeline.run(user_text, facts);
        } catch (const std::exception& e) {
            LOG_ERROR("Session " + std::to_string(id_) + " pipeline failed: " + e.what());
        }
        state_.on_pipeline_finished(generation);
        LOG_TRACE(id_, generation, "pipeline_done",
                  std::string(pipeline_outcome_name(outcome)) +
                  " attempts=" + std::to_string(pipeline.attempts()));
        done->store(true);
    });
    tasks_.push_back(std::move(task));
}

void Session::cancel_running() {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    for (auto& task : tasks_) {
        if (!task.done->load()) {
            task.cancel->cancel();
            LOG_TRACE(id_, task.generation, "cancelled", "");
        }
    }
}

void Session::reap_finished() {
    std::vector<PipelineTask> finished;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.begin();
        while (it != tasks_.end()) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& task : finished) {
        if (task.thread.joinable()) task.thread.join();
    }
}

void Session::drain() {
    std::vector<PipelineTask> all;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        all.swap(tasks_);
    }
    for (auto& task : all) {
        if (task.thread.joinable()) task.thread.join();
    }
}

void Session::on_disconnect() {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        if (disconnected_) return;
        disconnected_ = true;
        for (auto& task : tasks_) {
            task.cancel->cancel();
        }
    }

    out_.close();
    drain();
    state_.reset();

    LOG_SESSION("Session " + std::to_string(id_) + " closed (" +
                std::to_string(out_.dropped_count()) + " stale messages dropped)");
}

} // namespace voxlink
