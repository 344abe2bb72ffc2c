/**
 * @file queue_writer.hpp
 * @brief Enqueue path.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/clock.hpp"
#include "memqueue/core/export.hpp"
#include "memqueue/core/key_value_store.hpp"
#include "memqueue/core/time_bucket_index.hpp"

#include <string>

namespace memqueue {
namespace core {

/**
 * @class QueueWriter
 * @brief Stores messages and keeps the queue's index and pointers current.
 */
class MEMQUEUE_CORE_API QueueWriter {
public:
    QueueWriter(KeyValueStore& store, const Clock& clock, TimeBucketIndex& index);

    /**
     * @brief Enqueue a payload.
     *
     * Stores the payload under a fresh key, registers the key in the
     * current bucket and points the queue's LASTMSG at it.
     *
     * @param queue Queue name, must not be empty.
     * @param payload Opaque bytes; keep below the cache's item size limit.
     * @param clientId Producer identifier, embedded in the key.
     * @return The message key.
     * @throws std::invalid_argument on an empty queue name, or a queue name
     *         or client id containing the bucket delimiter.
     * @throws CacheError if any write fails.
     */
    std::string put(const std::string& queue, const std::string& payload,
                    const std::string& clientId);

private:
    KeyValueStore& store_;
    const Clock& clock_;
    TimeBucketIndex& index_;
};

}  // namespace core
}  // namespace memqueue
