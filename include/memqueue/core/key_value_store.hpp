/**
 * @file key_value_store.hpp
 * @brief The primitive cache operations the queue is built on.
 *
 * Any backend offering these five operations, each atomic on a single
 * key, can carry a MemQueue: memcached (net::MemcacheStore), the
 * in-process MemoryStore, or a test double.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/export.hpp"

#include <optional>
#include <string>

namespace memqueue {
namespace core {

/**
 * @class KeyValueStore
 * @brief Capability interface over opaque string keys and values.
 *
 * Implementations report connectivity failures by throwing CacheError.
 * A missing key is never an exception.
 */
class MEMQUEUE_CORE_API KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /**
     * @brief Read a value.
     * @return std::nullopt if the key is absent.
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * @brief Unconditional write.
     */
    virtual void set(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Atomic create-if-absent.
     * @return False if the key already exists.
     */
    virtual bool add(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Atomic append-if-present.
     * @return False if the key does not exist.
     */
    virtual bool append(const std::string& key, const std::string& suffix) = 0;

    /**
     * @brief Delete a key.
     * @return True if a key was removed.
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * @brief Drop every key held by the store.
     */
    virtual void flushAll() = 0;
};

}  // namespace core
}  // namespace memqueue
