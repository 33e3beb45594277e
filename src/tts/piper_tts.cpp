#include "tts/piper_tts.h"
#include "audio_frame_codec.h"
#include "logger.h"
#include "path_utils.h"
#include "tool_executor.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <csignal>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace voxlink {
namespace tts {

void apply_gain(PcmChunk& pcm, float gain) {
    if (gain == 1.0f) return;
    AudioBuffer samples = AudioFrameCodec::bytes_to_samples(pcm);
    for (auto& s : samples) {
        float scaled = static_cast<float>(s) * gain;
        if (scaled > 32767.0f) scaled = 32767.0f;
        if (scaled < -32768.0f) scaled = -32768.0f;
        s = static_cast<Sample>(scaled);
    }
    pcm = AudioFrameCodec::samples_to_bytes(samples);
}

int read_voice_sample_rate(const std::string& voice_path, int fallback) {
    std::ifstream f(voice_path + ".json");
    if (!f.is_open()) return fallback;
    try {
        json j;
        f >> j;
        if (j.contains("audio") && j["audio"].is_object() &&
            j["audio"].contains("sample_rate") && j["audio"]["sample_rate"].is_number_integer()) {
            return j["audio"]["sample_rate"].get<int>();
        }
    } catch (const json::exception& e) {
        LOG_TTS("Could not parse " + voice_path + ".json: " + e.what());
    }
    return fallback;
}

class PiperSynthesizer::Impl {
public:
    Impl(const TTSConfig& config) : config_(config) {
        find_piper_path();
        sample_rate_ = read_voice_sample_rate(config_.voice_path, DEFAULT_PLAYBACK_RATE);
        if (config_.voice_path.empty()) {
            LOG_TTS("WARNING: no voice model configured (tts.voice_path)");
        }
        LOG_TTS("Voice sample rate: " + std::to_string(sample_rate_) + " Hz");
    }

    bool is_ready() const {
        return !piper_path_.empty() && !config_.voice_path.empty();
    }

    int sample_rate() const { return sample_rate_; }

    VoidResult synthesize(const std::string& sentence, const CancelToken& cancel,
                          const PcmChunkCallback& on_chunk) {
        if (!is_ready()) {
            return make_error(ErrorType::IOError, "piper not available");
        }
        if (cancel.is_cancelled()) return VoidResult();

        int to_child[2] = {-1, -1};
        int from_child[2] = {-1, -1};
        // Close-on-exec: dup2 below clears it for the child's stdin/stdout only
        if (!process::open_pipe(to_child) || !process::open_pipe(from_child)) {
            close_fd(to_child[0]); close_fd(to_child[1]);
            close_fd(from_child[0]); close_fd(from_child[1]);
            return make_io_error(std::string("pipe failed: ") + std::strerror(errno));
        }

        std::string espeak = config_.espeak_data_path;
        pid_t pid = fork();
        if (pid == -1) {
            close_fd(to_child[0]); close_fd(to_child[1]);
            close_fd(from_child[0]); close_fd(from_child[1]);
            return make_io_error(std::string("fork failed: ") + std::strerror(errno));
        }

        if (pid == 0) {
            dup2(to_child[0], STDIN_FILENO);
            dup2(from_child[1], STDOUT_FILENO);
            close(to_child[0]); close(to_child[1]);
            close(from_child[0]); close(from_child[1]);
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
            if (espeak.empty()) {
                execl(piper_path_.c_str(), "piper",
                      "--model", config_.voice_path.c_str(),
                      "--json-input", "--output_raw", "--quiet",
                      static_cast<char*>(nullptr));
            } else {
                execl(piper_path_.c_str(), "piper",
                      "--model", config_.voice_path.c_str(),
                      "--espeak_data", espeak.c_str(),
                      "--json-input", "--output_raw", "--quiet",
                      static_cast<char*>(nullptr));
            }
            _exit(127);
        }

        close(to_child[0]);
        close(from_child[1]);

        // Piper reads one JSON object per line
        json input;
        input["text"] = sentence;
        std::string line = input.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
        bool write_ok = write_all(to_child[1], line);
        close(to_child[1]);
        if (!write_ok) {
            close(from_child[0]);
            kill_and_reap(pid);
            return make_io_error("failed to write to piper stdin");
        }

        const size_t chunk_bytes = config_.chunk_bytes > 0 ? static_cast<size_t>(config_.chunk_bytes) : 4096;
        PcmChunk pending;
        size_t total_bytes = 0;
        bool stopped = false;
        char buffer[8192];
        auto start = std::chrono::steady_clock::now();

        while (!stopped) {
            if (cancel.is_cancelled()) {
                stopped = true;
                break;
            }
            struct pollfd pfd;
            pfd.fd = from_child[0];
            pfd.events = POLLIN;
            int pr = poll(&pfd, 1, 100);
            if (pr < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (pr == 0) continue;  // re-check cancellation

            ssize_t n = read(from_child[0], buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                break;
            }
            if (n == 0) break;  // EOF: sentence done

            pending.append(buffer, static_cast<size_t>(n));
            total_bytes += static_cast<size_t>(n);
            while (pending.size() >= chunk_bytes) {
                PcmChunk chunk = pending.substr(0, chunk_bytes);
                pending.erase(0, chunk_bytes);
                apply_gain(chunk, config_.output_gain);
                if (!on_chunk(chunk)) {
                    stopped = true;
                    break;
                }
            }
        }
        close(from_child[0]);

        if (stopped) {
            kill_and_reap(pid);
            LOG_TTS("Synthesis stopped early");
            return VoidResult();
        }

        // Keep sample alignment on the final chunk
        if (pending.size() % 2 != 0) pending.pop_back();
        if (!pending.empty()) {
            apply_gain(pending, config_.output_gain);
            on_chunk(pending);
        }

        int status = 0;
        waitpid(pid, &status, 0);
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            std::ostringstream oss;
            oss << "piper failed: ";
            if (WIFEXITED(status))
                oss << "exit " << WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                oss << "signal " << WTERMSIG(status);
            else
                oss << "status " << status;
            return make_io_error(oss.str());
        }

        std::ostringstream oss;
        oss << "Synthesized " << total_bytes << " bytes in " << ms_since(start) << "ms: \""
            << utils::preview(sentence, 40) << "\"";
        LOG_TTS(oss.str());
        return VoidResult();
    }

private:
    void find_piper_path() {
        if (!config_.piper_path.empty()) {
            std::ifstream test(config_.piper_path);
            if (test.good()) {
                piper_path_ = config_.piper_path;
                LOG_TTS("Using config piper path: " + piper_path_);
                return;
            }
            LOG_TTS("Configured piper path not found: " + config_.piper_path);
        }

        std::vector<std::string> possible_paths;
        const char* home = std::getenv("HOME");
        if (home) {
            possible_paths.push_back(std::string(home) + "/bin/piper");
            possible_paths.push_back(std::string(home) + "/.local/bin/piper");
        }
        possible_paths.push_back("/usr/local/bin/piper");
        possible_paths.push_back("/usr/bin/piper");
#ifdef __APPLE__
        possible_paths.push_back("/opt/homebrew/bin/piper");
#endif
        for (const auto& path : possible_paths) {
            std::ifstream test(path);
            if (test.good()) {
                piper_path_ = path;
                LOG_TTS("Found piper at: " + piper_path_);
                return;
            }
        }

        piper_path_ = find_in_path("piper");
        if (piper_path_.empty()) {
            LOG_TTS("WARNING: Piper not found!");
        } else {
            LOG_TTS("Found piper in PATH: " + piper_path_);
        }
    }

    static void close_fd(int fd) {
        if (fd >= 0) close(fd);
    }

    static bool write_all(int fd, const std::string& data) {
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = write(fd, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            off += static_cast<size_t>(n);
        }
        return true;
    }

    static void kill_and_reap(pid_t pid) {
        kill(pid, SIGTERM);
        int status = 0;
        waitpid(pid, &status, 0);
    }

    TTSConfig config_;
    std::string piper_path_;
    int sample_rate_ = DEFAULT_PLAYBACK_RATE;
};

PiperSynthesizer::PiperSynthesizer(const TTSConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

PiperSynthesizer::~PiperSynthesizer() = default;

VoidResult PiperSynthesizer::synthesize(const std::string& sentence, const CancelToken& cancel,
                                        const PcmChunkCallback& on_chunk) {
    return pimpl_->synthesize(sentence, cancel, on_chunk);
}

int PiperSynthesizer::sample_rate() const {
    return pimpl_->sample_rate();
}

bool PiperSynthesizer::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace tts
} // namespace voxlink
