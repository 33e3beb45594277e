#pragma once

/**
 * @file fact_store.h
 * @brief Persistent list of facts the assistant remembers about the user
 *
 * File format: {"user_facts": [{"text": "...", "created_at": "YYYY-MM-DD"}]}
 * Facts are keyed by exact text; appending a known text is a no-op.
 */

#include "common.h"
#include "errors.h"
#include <memory>
#include <string>

namespace voxlink {
namespace memory {

class FactStore {
public:
    /**
     * @param path JSON file to persist to (empty = in-memory only)
     */
    explicit FactStore(const std::string& path);
    ~FactStore();

    // Non-copyable
    FactStore(const FactStore&) = delete;
    FactStore& operator=(const FactStore&) = delete;

    /**
     * @brief (Re)load facts from disk.
     *
     * A missing file yields no facts. A malformed file is logged and the
     * store starts over with no facts; it is rewritten on the next save().
     */
    FactList load();

    /// Snapshot of the current facts
    FactList facts() const;

    /**
     * @brief Add a fact unless one with identical text exists
     * @return true if the fact was added
     */
    bool append_if_new(const std::string& text, const std::string& created_at = today());

    /**
     * @brief Write all facts to disk (temp file + rename)
     */
    VoidResult save();

    size_t size() const;

    /// Local date as YYYY-MM-DD
    static std::string today();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace memory
} // namespace voxlink
