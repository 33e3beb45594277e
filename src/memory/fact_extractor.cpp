#include "memory/fact_extractor.h"
#include "logger.h"
#include "utils.h"

namespace voxlink {
namespace memory {

FactExtractor::FactExtractor(GenerationBackend& backend, FactStore& store)
    : backend_(backend), store_(store) {
    worker_thread_ = std::thread(&FactExtractor::worker_loop, this);
    LOG_MEMORY("Background fact extractor started");
}

FactExtractor::~FactExtractor() {
    shutdown();
}

bool FactExtractor::schedule(const std::string& user_text) {
    if (utils::is_empty_or_whitespace(user_text)) return false;
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        if (worker_shutdown_) return false;
        jobs_.push(user_text);
    }
    job_cv_.notify_one();
    return true;
}

void FactExtractor::wait_idle() {
    std::unique_lock<std::mutex> lock(job_mutex_);
    idle_cv_.wait(lock, [this] { return (jobs_.empty() && !busy_) || worker_shutdown_; });
}

void FactExtractor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        worker_shutdown_ = true;
    }
    job_cv_.notify_one();
    idle_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

size_t FactExtractor::facts_added() const {
    std::lock_guard<std::mutex> lock(job_mutex_);
    return facts_added_;
}

void FactExtractor::worker_loop() {
    while (true) {
        std::string job;
        {
            std::unique_lock<std::mutex> lock(job_mutex_);
            job_cv_.wait(lock, [this] {
                return worker_shutdown_ || !jobs_.empty();
            });
            if (worker_shutdown_) break;
            job = std::move(jobs_.front());
            jobs_.pop();
            busy_ = true;
        }

        process(job);

        {
            std::lock_guard<std::mutex> lock(job_mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void FactExtractor::process(const std::string& user_text) {
    std::optional<std::string> fact;
    try {
        fact = backend_.extract_fact(user_text, store_.facts());
    } catch (const std::exception& e) {
        LOG_MEMORY(std::string("Fact extraction failed: ") + e.what());
        return;
    }
    if (!fact) return;

    if (store_.append_if_new(*fact)) {
        {
            std::lock_guard<std::mutex> lock(job_mutex_);
            facts_added_++;
        }
        auto saved = store_.save();
        if (saved.is_error()) {
            LOG_MEMORY("Could not save facts: " + saved.error().to_string());
        }
    }
}

} // namespace memory
} // namespace voxlink
