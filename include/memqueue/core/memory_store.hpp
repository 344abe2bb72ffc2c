/**
 * @file memory_store.hpp
 * @brief In-process KeyValueStore.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/export.hpp"
#include "memqueue/core/key_value_store.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace memqueue {
namespace core {

/**
 * @class MemoryStore
 * @brief Thread-safe map honouring the KeyValueStore contract.
 *
 * Nothing expires and nothing is evicted. Suitable for tests and for
 * embedding a queue inside a single process.
 */
class MEMQUEUE_CORE_API MemoryStore : public KeyValueStore {
public:
    MemoryStore() = default;
    ~MemoryStore() override = default;

    // Non-copyable
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool add(const std::string& key, const std::string& value) override;
    bool append(const std::string& key, const std::string& suffix) override;
    bool remove(const std::string& key) override;
    void flushAll() override;

    /**
     * @brief Number of keys currently held.
     */
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> data_;
};

}  // namespace core
}  // namespace memqueue
