#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ragline_core {

/**
 * @class ScopeLocks
 * @brief One reader/writer lock per knowledge base id.
 *
 * Ingestion holds the shared side while it writes a knowledge base's rows and
 * vectors; deleting the knowledge base takes the exclusive side. Locks are
 * created on first use and live as long as the registry.
 */
class ScopeLocks {
 public:
  ScopeLocks() = default;

  ScopeLocks(const ScopeLocks &) = delete;
  ScopeLocks &operator=(const ScopeLocks &) = delete;

  std::shared_ptr<std::shared_mutex> lock_for(const std::string &knowledge_base_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto &entry = locks_[knowledge_base_id];
    if (!entry) {
      entry = std::make_shared<std::shared_mutex>();
    }
    return entry;
  }

 private:
  std::mutex mtx_;
  std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> locks_;
};

}  // namespace ragline_core
