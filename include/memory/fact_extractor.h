#pragma once

/**
 * @file fact_extractor.h
 * @brief Background worker that learns user facts from finished turns
 *
 * One thread shared by all sessions. schedule() never blocks on the model;
 * failures are logged and never reach the visible response.
 */

#include "generation_backend.h"
#include "memory/fact_store.h"
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace voxlink {
namespace memory {

class FactExtractor {
public:
    FactExtractor(GenerationBackend& backend, FactStore& store);
    ~FactExtractor();

    // Non-copyable
    FactExtractor(const FactExtractor&) = delete;
    FactExtractor& operator=(const FactExtractor&) = delete;

    /**
     * @brief Queue user text for fact extraction
     * @return false if the worker is shut down
     */
    bool schedule(const std::string& user_text);

    /**
     * @brief Block until the queue is empty and no job is running
     */
    void wait_idle();

    /// Stop accepting jobs, finish the current one, join the worker
    void shutdown();

    size_t facts_added() const;

private:
    void worker_loop();
    void process(const std::string& user_text);

    GenerationBackend& backend_;
    FactStore& store_;

    mutable std::mutex job_mutex_;
    std::condition_variable job_cv_;
    std::condition_variable idle_cv_;
    std::queue<std::string> jobs_;
    bool busy_ = false;
    bool worker_shutdown_ = false;
    size_t facts_added_ = 0;
    std::thread worker_thread_;
};

} // namespace memory
} // namespace voxlink
