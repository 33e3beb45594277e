#include "memory/fact_store.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

using json = nlohmann::json;

namespace voxlink {
namespace memory {

class FactStore::Impl {
public:
    explicit Impl(const std::string& path) : path_(path) {}

    FactList load() {
        std::lock_guard<std::mutex> lock(mutex_);
        facts_.clear();
        if (path_.empty()) return facts_;

        std::ifstream file(path_);
        if (!file.is_open()) {
            LOG_MEMORY("No fact file at " + path_ + "; starting empty");
            return facts_;
        }

        try {
            json data = json::parse(file);
            if (!data.is_object() || !data.contains("user_facts") || !data["user_facts"].is_array()) {
                throw std::runtime_error("missing \"user_facts\" array");
            }
            for (const auto& entry : data["user_facts"]) {
                if (!entry.is_object() || !entry.contains("text") || !entry["text"].is_string()) {
                    LOG_WARN("[Memory] Skipping malformed fact entry in " + path_);
                    continue;
                }
                UserFact fact;
                fact.text = entry["text"].get<std::string>();
                if (entry.contains("created_at") && entry["created_at"].is_string()) {
                    fact.created_at = entry["created_at"].get<std::string>();
                }
                if (!contains_locked(fact.text)) {
                    facts_.push_back(std::move(fact));
                }
            }
        } catch (const std::exception& e) {
            // Self-heal: a broken file must not take the session down
            Logger::warn(make_error(ErrorType::FactStore, path_ + ": " + e.what()).to_string() +
                         "; starting with no facts");
            facts_.clear();
        }

        LOG_MEMORY("Loaded " + std::to_string(facts_.size()) + " facts from " + path_);
        return facts_;
    }

    FactList facts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return facts_;
    }

    bool append_if_new(const std::string& text, const std::string& created_at) {
        std::string trimmed = utils::trim_copy(text);
        if (trimmed.empty()) return false;

        std::lock_guard<std::mutex> lock(mutex_);
        if (contains_locked(trimmed)) return false;
        facts_.push_back(UserFact{trimmed, created_at});
        LOG_MEMORY("New fact: " + trimmed);
        return true;
    }

    VoidResult save() {
        json data;
        data["user_facts"] = json::array();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (path_.empty()) return VoidResult();
            for (const auto& fact : facts_) {
                json entry;
                entry["text"] = fact.text;
                entry["created_at"] = fact.created_at;
                data["user_facts"].push_back(entry);
            }
        }

        std::lock_guard<std::mutex> io_lock(io_mutex_);
        const std::string tmp_path = path_ + ".tmp";
        {
            std::ofstream file(tmp_path);
            if (!file.is_open()) {
                return make_error(ErrorType::FactStore, "Failed to open file for writing: " + tmp_path);
            }
            file << data.dump(2, ' ', false, json::error_handler_t::replace);
            if (!file.good()) {
                return make_error(ErrorType::FactStore, "Failed to write " + tmp_path);
            }
        }
        if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
            std::remove(tmp_path.c_str());
            return make_error(ErrorType::FactStore, "Failed to replace " + path_);
        }
        return VoidResult();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return facts_.size();
    }

private:
    bool contains_locked(const std::string& text) const {
        for (const auto& fact : facts_) {
            if (fact.text == text) return true;
        }
        return false;
    }

    std::string path_;
    mutable std::mutex mutex_;
    std::mutex io_mutex_;
    FactList facts_;
};

FactStore::FactStore(const std::string& path)
    : impl_(std::make_unique<Impl>(path)) {}

FactStore::~FactStore() = default;

FactList FactStore::load() {
    return impl_->load();
}

FactList FactStore::facts() const {
    return impl_->facts();
}

bool FactStore::append_if_new(const std::string& text, const std::string& created_at) {
    return impl_->append_if_new(text, created_at);
}

VoidResult FactStore::save() {
    return impl_->save();
}

size_t FactStore::size() const {
    return impl_->size();
}

std::string FactStore::today() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local_tm);
    return buf;
}

} // namespace memory
} // namespace voxlink
