/**
 * @file queue_writer.cpp
 * @brief QueueWriter implementation.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/core/queue_writer.hpp"
#include "memqueue/core/queue_keys.hpp"
#include "memqueue/utils/logger.hpp"
#include "memqueue/utils/uuid.hpp"

#include <stdexcept>

namespace memqueue {
namespace core {

QueueWriter::QueueWriter(KeyValueStore& store, const Clock& clock, TimeBucketIndex& index)
    : store_(store)
    , clock_(clock)
    , index_(index)
{}

std::string QueueWriter::put(const std::string& queue, const std::string& payload,
                             const std::string& clientId) {
    if (queue.empty()) {
        throw std::invalid_argument("queue name must not be empty");
    }
    // Keys are stored ','-separated in bucket lists
    if (queue.find(keys::BUCKET_DELIMITER) != std::string::npos) {
        throw std::invalid_argument("queue name must not contain ',': " + queue);
    }
    if (clientId.find(keys::BUCKET_DELIMITER) != std::string::npos) {
        throw std::invalid_argument("client id must not contain ',': " + clientId);
    }

    const std::string key = keys::message(queue, clientId, formatTimestamp(clock_.now()),
                                          utils::UUIDGenerator::generate());

    store_.set(key, payload);
    index_.registerMessage(queue, key);
    store_.set(keys::lastMessage(queue), key);

    LOG_DEBUG("QueueWriter", "Put {} ({} bytes) from {}", key, payload.size(), clientId);
    return key;
}

}  // namespace core
}  // namespace memqueue
