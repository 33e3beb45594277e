#include "stt_engine.h"
#include "audio_frame_codec.h"
#include "logger.h"
#include "utils.h"
#include <whisper.h>
#include <chrono>
#include <sstream>

namespace voxlink {

class STTEngine::Impl {
public:
    Impl(const STTConfig& config) : config_(config), ctx_(nullptr), ready_(false) {
        if (config_.model_path.empty()) {
            LOG_STT("No model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            LOG_STT("Failed to load whisper model: " + config_.model_path);
            return;
        }

        ready_ = true;
        LOG_STT("Model loaded: " + config_.model_path);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    std::string transcribe(const AudioBuffer& audio) {
        if (!ctx_ || audio.empty()) {
            return "";
        }

        auto start = std::chrono::steady_clock::now();

        // The model is shared; decoder state is per call
        whisper_state* state = whisper_init_state(ctx_);
        if (!state) {
            LOG_STT("whisper_init_state failed");
            return "";
        }

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = config_.threads;
        params.no_context = true;

        std::vector<float> pcmf32(audio.size());
        for (size_t i = 0; i < audio.size(); i++) {
            pcmf32[i] = static_cast<float>(audio[i]) / 32768.0f;
        }

        int ret = whisper_full_with_state(ctx_, state, params, pcmf32.data(),
                                          static_cast<int>(pcmf32.size()));
        if (ret != 0) {
            std::ostringstream oss;
            oss << "whisper_full failed: " << ret;
            LOG_STT(oss.str());
            whisper_free_state(state);
            return "";
        }

        std::string text;
        int n_segments = whisper_full_n_segments_from_state(state);
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text_from_state(state, i);
        }
        whisper_free_state(state);

        utils::trim(text);
        std::ostringstream oss;
        oss << "Transcribed " << audio.size() << " samples in " << ms_since(start) << "ms: \""
            << utils::preview(text) << "\"";
        LOG_STT(oss.str());

        if (utils::is_blank_transcript(text, config_.blank_sentinel)) {
            return "";
        }
        return text;
    }

    bool is_ready() const {
        return ready_;
    }

private:
    STTConfig config_;
    whisper_context* ctx_;
    bool ready_;
};

STTEngine::STTEngine(const STTConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

STTEngine::~STTEngine() = default;

std::string STTEngine::transcribe(const AudioBuffer& audio) {
    return pimpl_->transcribe(audio);
}

bool STTEngine::is_ready() const {
    return pimpl_->is_ready();
}

WhisperRecognizer::WhisperRecognizer(std::shared_ptr<STTEngine> engine)
    : engine_(std::move(engine)) {}

void WhisperRecognizer::start() {
    pending_.clear();
    open_ = true;
}

void WhisperRecognizer::feed(const std::string& pcm_bytes) {
    if (!open_) return;
    pending_ += pcm_bytes;
}

void WhisperRecognizer::stop() {
    open_ = false;
}

std::string WhisperRecognizer::text() {
    AudioBuffer audio = AudioFrameCodec::bytes_to_samples(pending_);
    pending_.clear();
    if (!engine_ || audio.empty()) {
        return "";
    }
    return engine_->transcribe(audio);
}

} // namespace voxlink
