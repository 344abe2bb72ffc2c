/**
 * @file queue_reader.cpp
 * @brief QueueReader implementation.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/core/queue_reader.hpp"
#include "memqueue/core/errors.hpp"
#include "memqueue/core/queue_keys.hpp"
#include "memqueue/utils/logger.hpp"

namespace memqueue {
namespace core {

QueueReader::QueueReader(KeyValueStore& store, const TimeBucketIndex& index,
                         ClientCursor& cursor)
    : store_(store)
    , index_(index)
    , cursor_(cursor)
{}

std::vector<std::string> QueueReader::splitBucket(const std::string& bucketKey,
                                                  const std::string& value) {
    std::vector<std::string> entries;
    if (value.empty()) {
        return entries;
    }

    if (value.back() != keys::BUCKET_DELIMITER) {
        LOG_ERROR("QueueReader", "Bucket {} is not delimiter-terminated", bucketKey);
        throw CorruptStateError("bucket " + bucketKey + " is not delimiter-terminated");
    }

    size_t start = 0;
    while (start < value.size()) {
        size_t end = value.find(keys::BUCKET_DELIMITER, start);
        if (end == start) {
            LOG_ERROR("QueueReader", "Bucket {} has an empty entry at offset {}",
                      bucketKey, start);
            throw CorruptStateError("bucket " + bucketKey + " has an empty entry");
        }
        entries.push_back(value.substr(start, end - start));
        start = end + 1;
    }
    return entries;
}

std::vector<std::string> QueueReader::listMessageKeys(const std::string& queue,
                                                      int windowMinutes) const {
    std::vector<std::string> result;

    for (const auto& bucketKey : index_.bucketKeys(queue, windowMinutes)) {
        auto value = store_.get(bucketKey);
        if (!value) {
            continue;
        }
        auto entries = splitBucket(bucketKey, *value);
        result.insert(result.end(),
                      std::make_move_iterator(entries.begin()),
                      std::make_move_iterator(entries.end()));
    }

    LOG_TRACE("QueueReader", "Listed {} keys on {} over {} minutes",
              result.size(), queue, windowMinutes);
    return result;
}

std::optional<std::string> QueueReader::fetch(const std::string& queue,
                                              const std::string& messageKey,
                                              const std::string& clientId,
                                              bool autodelete) {
    auto payload = store_.get(messageKey);

    if (autodelete) {
        store_.remove(messageKey);
    }

    cursor_.set(queue, clientId, messageKey);

    LOG_TRACE("QueueReader", "Fetched {} for {} ({})", messageKey, clientId,
              payload ? "hit" : "miss");
    return payload;
}

std::optional<std::string> QueueReader::last(const std::string& queue,
                                             const std::string& clientId,
                                             bool autodelete) {
    auto key = lastMessageKey(queue);
    if (!key) {
        return std::nullopt;
    }
    return fetch(queue, *key, clientId, autodelete);
}

std::optional<std::string> QueueReader::lastMessageKey(const std::string& queue) const {
    return store_.get(keys::lastMessage(queue));
}

}  // namespace core
}  // namespace memqueue
