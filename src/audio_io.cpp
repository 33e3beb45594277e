#include "audio_io.h"
#include "logger.h"
#include "utils.h"
#include <portaudio.h>
#include <algorithm>
#include <cctype>
#include <atomic>
#include <mutex>
#include <sstream>

namespace voxlink {

namespace {

// Samples written per Pa_WriteStream call, so a cancelled chunk stops quickly
constexpr unsigned long WRITE_SLICE_SAMPLES = 1024;

/// Pa_Initialize/Pa_Terminate pair for one stream's lifetime
class PortAudioSession {
public:
    PortAudioSession() : err_(Pa_Initialize()) {}
    ~PortAudioSession() {
        if (err_ == paNoError) Pa_Terminate();
    }
    PortAudioSession(const PortAudioSession&) = delete;
    PortAudioSession& operator=(const PortAudioSession&) = delete;

    bool ok() const { return err_ == paNoError; }
    std::string error_text() const { return Pa_GetErrorText(err_); }

private:
    PaError err_;
};

bool has_channels(const PaDeviceInfo* info, bool is_input) {
    return info && (is_input ? info->maxInputChannels > 0 : info->maxOutputChannels > 0);
}

int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    // Try default device first (most common case)
    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default " << (is_input ? "input" : "output")
                << " device: [" << default_idx << "] " << (info ? info->name : "?");
            Logger::debug(oss.str());
            return default_idx;
        }
        return -1;
    }

    // Numeric device index
    try {
        size_t consumed = 0;
        int device_idx = std::stoi(name, &consumed);
        if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices &&
            has_channels(Pa_GetDeviceInfo(device_idx), is_input)) {
            return device_idx;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    // Exact name, then substring (case-insensitive)
    const std::string wanted = utils::to_lower(name);
    int partial = -1;
    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!has_channels(info, is_input)) continue;
        if (info->name == name) return i;

        if (partial < 0 && utils::to_lower(info->name).find(wanted) != std::string::npos) {
            partial = i;
        }
    }
    return partial;
}

} // namespace

// --- AudioCapture ---

class AudioCapture::Impl {
public:
    ~Impl() {
        close();
    }

    VoidResult open(const std::string& device, int sample_rate, size_t frame_bytes) {
        close();

        pa_ = std::make_unique<PortAudioSession>();
        if (!pa_->ok()) {
            std::string text = pa_->error_text();
            pa_.reset();
            return make_error(ErrorType::IOError, "PortAudio init error: " + text);
        }

        int idx = find_device(device, true);
        if (idx < 0) {
            pa_.reset();
            return make_error(ErrorType::IOError, "Input device not found: " + device);
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(idx);

        PaStreamParameters params;
        params.device = idx;
        params.channelCount = 1;
        params.sampleFormat = paInt16;
        params.suggestedLatency = info->defaultLowInputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        frame_samples_ = std::max<size_t>(1, frame_bytes / BYTES_PER_SAMPLE);
        PaError err = Pa_OpenStream(&stream_, &params, nullptr, sample_rate,
                                    frame_samples_, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            stream_ = nullptr;
            pa_.reset();
            return make_error(ErrorType::IOError, "Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::string text = Pa_GetErrorText(err);
            if (err == paUnanticipatedHostError) {
                Logger::error("This may be a microphone permissions issue.");
            }
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            pa_.reset();
            return make_error(ErrorType::IOError, "Failed to start input stream: " + text);
        }

        Logger::info("Capturing from [" + std::to_string(idx) + "] " + info->name +
                     " at " + std::to_string(sample_rate) + " Hz");
        return VoidResult();
    }

    bool read_frame(PcmChunk& frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) return false;

        AudioBuffer samples(frame_samples_);
        PaError err = Pa_ReadStream(stream_, samples.data(), frame_samples_);
        if (err == paInputOverflowed) {
            LOG_AUDIO("Input overflow");
        } else if (err != paNoError) {
            Logger::warn("Input read failed: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        frame.assign(reinterpret_cast<const char*>(samples.data()), samples.size() * BYTES_PER_SAMPLE);
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        pa_.reset();
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_ != nullptr;
    }

private:
    mutable std::mutex mutex_;
    std::unique_ptr<PortAudioSession> pa_;
    PaStream* stream_ = nullptr;
    size_t frame_samples_ = DEFAULT_FRAME_BYTES / BYTES_PER_SAMPLE;
};

AudioCapture::AudioCapture() : pimpl_(std::make_unique<Impl>()) {}
AudioCapture::~AudioCapture() = default;

VoidResult AudioCapture::open(const std::string& device, int sample_rate, size_t frame_bytes) {
    return pimpl_->open(device, sample_rate, frame_bytes);
}

bool AudioCapture::read_frame(PcmChunk& frame) {
    return pimpl_->read_frame(frame);
}

void AudioCapture::close() {
    pimpl_->close();
}

bool AudioCapture::is_open() const {
    return pimpl_->is_open();
}

// --- AudioPlayback ---

class AudioPlayback::Impl {
public:
    ~Impl() {
        close();
    }

    VoidResult open(const std::string& device, int sample_rate) {
        close();

        pa_ = std::make_unique<PortAudioSession>();
        if (!pa_->ok()) {
            std::string text = pa_->error_text();
            pa_.reset();
            return make_error(ErrorType::IOError, "PortAudio init error: " + text);
        }

        int idx = find_device(device, false);
        if (idx < 0) {
            pa_.reset();
            return make_error(ErrorType::IOError, "Output device not found: " + device);
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(idx);

        PaStreamParameters params;
        params.device = idx;
        params.channelCount = 1;
        params.sampleFormat = paInt16;
        params.suggestedLatency = info->defaultLowOutputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_OpenStream(&stream_, nullptr, &params, sample_rate,
                                    paFramesPerBufferUnspecified, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            stream_ = nullptr;
            pa_.reset();
            return make_error(ErrorType::IOError, "Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
        }
        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::string text = Pa_GetErrorText(err);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            pa_.reset();
            return make_error(ErrorType::IOError, "Failed to start output stream: " + text);
        }

        Logger::info("Playing to [" + std::to_string(idx) + "] " + info->name +
                     " at " + std::to_string(sample_rate) + " Hz");
        return VoidResult();
    }

    bool write(const PcmChunk& pcm, const CancelToken& cancel) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) return false;

        size_t total = pcm.size() / BYTES_PER_SAMPLE;
        const char* bytes = pcm.data();
        AudioBuffer slice;
        for (size_t offset = 0; offset < total; offset += WRITE_SLICE_SAMPLES) {
            if (cancel.is_cancelled() || closing_) return true;
            size_t count = std::min<size_t>(WRITE_SLICE_SAMPLES, total - offset);
            slice.resize(count);
            std::copy(bytes + offset * BYTES_PER_SAMPLE,
                      bytes + (offset + count) * BYTES_PER_SAMPLE,
                      reinterpret_cast<char*>(slice.data()));
            PaError err = Pa_WriteStream(stream_, slice.data(), count);
            if (err == paOutputUnderflowed) {
                LOG_AUDIO("Output underflow");
            } else if (err != paNoError) {
                Logger::warn("Output write failed: " + std::string(Pa_GetErrorText(err)));
                return false;
            }
        }
        return true;
    }

    void close() {
        closing_ = true;
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_) {
            Pa_AbortStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        pa_.reset();
        closing_ = false;
    }

private:
    std::mutex mutex_;
    std::unique_ptr<PortAudioSession> pa_;
    PaStream* stream_ = nullptr;
    std::atomic<bool> closing_{false};
};

AudioPlayback::AudioPlayback() : pimpl_(std::make_unique<Impl>()) {}
AudioPlayback::~AudioPlayback() = default;

VoidResult AudioPlayback::open(const std::string& device, int sample_rate) {
    return pimpl_->open(device, sample_rate);
}

bool AudioPlayback::write(const PcmChunk& pcm, const CancelToken& cancel) {
    return pimpl_->write(pcm, cancel);
}

void AudioPlayback::close() {
    pimpl_->close();
}

// --- Devices ---

void list_audio_devices() {
    PortAudioSession pa;
    if (!pa.ok()) {
        Logger::error("PortAudio init error: " + pa.error_text());
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    int default_in = Pa_GetDefaultInputDevice();
    int default_out = Pa_GetDefaultOutputDevice();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        if (info->maxInputChannels == 0 && info->maxOutputChannels == 0) oss << " (no I/O)";
        if (i == default_in) oss << " [default input]";
        if (i == default_out) oss << " [default output]";
        Logger::info(oss.str());
    }
}

} // namespace voxlink
