/**
 * @file queue_reader.hpp
 * @brief Windowed listing and payload retrieval.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/client_cursor.hpp"
#include "memqueue/core/export.hpp"
#include "memqueue/core/key_value_store.hpp"
#include "memqueue/core/time_bucket_index.hpp"

#include <optional>
#include <string>
#include <vector>

namespace memqueue {
namespace core {

/**
 * @class QueueReader
 * @brief Merges minute buckets into an ordered key list and reads messages.
 *
 * Every successful or unsuccessful fetch moves the reading client's
 * cursor to the fetched key.
 */
class MEMQUEUE_CORE_API QueueReader {
public:
    QueueReader(KeyValueStore& store, const TimeBucketIndex& index, ClientCursor& cursor);

    /**
     * @brief Message keys registered during the window, oldest first.
     *
     * Buckets are concatenated oldest first; order within a bucket is
     * registration order. Buckets the cache no longer holds contribute
     * nothing.
     *
     * @throws CorruptStateError if a bucket is not a delimiter-terminated list.
     */
    std::vector<std::string> listMessageKeys(const std::string& queue, int windowMinutes) const;

    /**
     * @brief Read one message and record the delivery.
     * @param autodelete Delete the message once read.
     * @return The payload, or std::nullopt if the key is absent.
     */
    std::optional<std::string> fetch(const std::string& queue, const std::string& messageKey,
                                     const std::string& clientId, bool autodelete);

    /**
     * @brief Fetch the queue's newest message.
     * @return std::nullopt if nothing was ever written.
     */
    std::optional<std::string> last(const std::string& queue, const std::string& clientId,
                                    bool autodelete);

    /**
     * @brief Key the queue's LASTMSG pointer refers to.
     */
    std::optional<std::string> lastMessageKey(const std::string& queue) const;

    /**
     * @brief Split one bucket value into its keys.
     * @param bucketKey Used for error reporting only.
     * @throws CorruptStateError on a missing terminator or an empty entry.
     */
    static std::vector<std::string> splitBucket(const std::string& bucketKey,
                                                const std::string& value);

private:
    KeyValueStore& store_;
    const TimeBucketIndex& index_;
    ClientCursor& cursor_;
};

}  // namespace core
}  // namespace memqueue
