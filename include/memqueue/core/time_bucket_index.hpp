/**
 * @file time_bucket_index.hpp
 * @brief Minute buckets listing the message keys of a queue.
 *
 * The cache has no ordered index, so each queue keeps one append-only
 * list per wall-clock minute. Reading the buckets of the last N minutes
 * in order approximates "recent messages, oldest first".
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/clock.hpp"
#include "memqueue/core/export.hpp"
#include "memqueue/core/key_value_store.hpp"

#include <string>
#include <vector>

namespace memqueue {
namespace core {

/**
 * @class TimeBucketIndex
 * @brief Names buckets and registers message keys in them.
 *
 * Holds no locks. Concurrent registrations converge through the cache's
 * single-key atomicity (append, add, append).
 */
class MEMQUEUE_CORE_API TimeBucketIndex {
public:
    TimeBucketIndex(KeyValueStore& store, const Clock& clock);

    /**
     * @brief Bucket keys covering the trailing window, oldest first.
     * @param queue Queue name.
     * @param windowMinutes Minutes before the current one to include (>= 0).
     * @return windowMinutes + 1 keys ending with the current minute's bucket.
     * @throws std::invalid_argument if windowMinutes is negative.
     */
    std::vector<std::string> bucketKeys(const std::string& queue, int windowMinutes) const;

    /**
     * @brief Append a message key to the current minute's bucket and touch
     *        the queue's existence marker.
     * @throws CacheError if the bucket cannot be created or appended to.
     */
    void registerMessage(const std::string& queue, const std::string& messageKey);

private:
    KeyValueStore& store_;
    const Clock& clock_;
};

}  // namespace core
}  // namespace memqueue
