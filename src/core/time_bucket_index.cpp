/**
 * @file time_bucket_index.cpp
 * @brief TimeBucketIndex implementation.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/core/time_bucket_index.hpp"
#include "memqueue/core/errors.hpp"
#include "memqueue/core/queue_keys.hpp"
#include "memqueue/utils/logger.hpp"

#include <stdexcept>

namespace memqueue {
namespace core {

TimeBucketIndex::TimeBucketIndex(KeyValueStore& store, const Clock& clock)
    : store_(store)
    , clock_(clock)
{}

std::vector<std::string> TimeBucketIndex::bucketKeys(const std::string& queue,
                                                     int windowMinutes) const {
    if (windowMinutes < 0) {
        throw std::invalid_argument("window must be >= 0 minutes, got " +
                                    std::to_string(windowMinutes));
    }

    const Clock::TimePoint now = clock_.now();

    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(windowMinutes) + 1);
    for (int i = windowMinutes; i >= 0; --i) {
        result.push_back(keys::bucket(queue, formatMinute(now - std::chrono::minutes(i))));
    }
    return result;
}

void TimeBucketIndex::registerMessage(const std::string& queue, const std::string& messageKey) {
    const Clock::TimePoint now = clock_.now();
    const std::string bucketKey = keys::bucket(queue, formatMinute(now));
    const std::string entry = messageKey + keys::BUCKET_DELIMITER;

    if (!store_.append(bucketKey, entry)) {
        if (!store_.add(bucketKey, entry)) {
            // Another writer created the bucket between our append and add
            LOG_DEBUG("TimeBucketIndex", "Lost creation race for {}, appending", bucketKey);
            if (!store_.append(bucketKey, entry)) {
                LOG_ERROR("TimeBucketIndex", "Bucket {} vanished while registering {}",
                          bucketKey, messageKey);
                throw CacheError("cannot register " + messageKey + " in bucket " + bucketKey);
            }
        } else {
            LOG_TRACE("TimeBucketIndex", "Created bucket {}", bucketKey);
        }
    }

    store_.set(keys::existenceMarker(queue), formatTimestamp(now));
}

}  // namespace core
}  // namespace memqueue
