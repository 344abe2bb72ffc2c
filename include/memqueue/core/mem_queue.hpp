/**
 * @file mem_queue.hpp
 * @brief Message queue over a shared key-value cache.
 *
 * MemQueue is the handle applications hold. It owns the cache connection
 * (a KeyValueStore) and the queue configuration, and exposes enqueue,
 * listing, direct reads, and per-client sequential consumption.
 *
 * Queues are created implicitly by the first put().
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/client_cursor.hpp"
#include "memqueue/core/clock.hpp"
#include "memqueue/core/export.hpp"
#include "memqueue/core/key_value_store.hpp"
#include "memqueue/core/queue_config.hpp"
#include "memqueue/core/queue_reader.hpp"
#include "memqueue/core/queue_writer.hpp"
#include "memqueue/core/sequential_consumer.hpp"
#include "memqueue/core/time_bucket_index.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace memqueue {
namespace core {

/// Client identifier used when the caller does not supply one.
inline const std::string DEFAULT_CLIENT_ID = "UnknownClient";

/**
 * @class MemQueue
 * @brief Queue API over a KeyValueStore.
 *
 * Thread safety follows the store: every operation is a short series of
 * independent cache calls and the handle keeps no mutable state of its own.
 *
 * Usage:
 * @code
 * auto store = std::make_shared<net::MemcacheStore>(config.servers);
 * MemQueue mq(store, config);
 *
 * mq.put("jobs", "payload");
 * while (auto msg = mq.nextmsg("jobs", worker_id)) {
 *     process(*msg);
 * }
 * @endcode
 */
class MEMQUEUE_CORE_API MemQueue {
public:
    /**
     * @param store Cache backend, may be shared with other handles.
     * @param config autodelete and client_lag_seconds are used here;
     *        servers is consumed by whoever built @p store.
     * @param clock Time source, SystemClock when null.
     * @throws NotSupportedError if backup_servers is not empty.
     * @throws std::invalid_argument on a null store or a non-positive lag.
     */
    explicit MemQueue(std::shared_ptr<KeyValueStore> store,
                      QueueConfig config = {},
                      std::shared_ptr<const Clock> clock = nullptr);

    ~MemQueue() = default;

    // Non-copyable, members refer to each other
    MemQueue(const MemQueue&) = delete;
    MemQueue& operator=(const MemQueue&) = delete;

    /**
     * @brief Enqueue a payload.
     * @return Key the message was stored under.
     */
    std::string put(const std::string& queue, const std::string& payload,
                    const std::string& clientId = DEFAULT_CLIENT_ID);

    /**
     * @brief Read a message by key and record the delivery for the client.
     * @return The payload, or std::nullopt if it does not exist (any more).
     */
    std::optional<std::string> get(const std::string& queue, const std::string& messageKey,
                                   const std::string& clientId = DEFAULT_CLIENT_ID);

    /**
     * @brief Read the newest message of the queue.
     */
    std::optional<std::string> last(const std::string& queue,
                                    const std::string& clientId = DEFAULT_CLIENT_ID);

    /**
     * @brief Read the next message this client has not seen.
     * @return std::nullopt when the client is caught up.
     */
    std::optional<std::string> nextmsg(const std::string& queue,
                                       const std::string& clientId = DEFAULT_CLIENT_ID);

    /**
     * @brief Keys written during the last @p windowMinutes minutes, oldest first.
     *
     * Best effort: buckets evicted by the cache are silently missing.
     */
    std::vector<std::string> listMessages(const std::string& queue, int windowMinutes = 10,
                                          const std::string& clientId = DEFAULT_CLIENT_ID);

    /**
     * @brief Delete one message. Its key stays listed in its bucket.
     * @return True if the message existed.
     */
    bool remove(const std::string& queue, const std::string& messageKey);

    /**
     * @brief Delete every message listed in the window.
     * @return Number of messages actually deleted.
     */
    size_t purgeQueue(const std::string& queue, int windowMinutes = 30,
                      const std::string& clientId = DEFAULT_CLIENT_ID);

    /**
     * @brief Time of the last write to the queue.
     * @return Epoch seconds, or 0 if the queue was never written.
     */
    double checkQueue(const std::string& queue);

    /**
     * @brief A fresh identifier for a consumer. Never repeats.
     */
    static std::string createClientID();

    const QueueConfig& config() const { return config_; }

private:
    QueueConfig config_;
    std::shared_ptr<KeyValueStore> store_;
    std::shared_ptr<const Clock> clock_;

    TimeBucketIndex index_;
    ClientCursor cursor_;
    QueueWriter writer_;
    QueueReader reader_;
    SequentialConsumer consumer_;

    static QueueConfig validated(QueueConfig config);
    static std::shared_ptr<KeyValueStore> requireStore(std::shared_ptr<KeyValueStore> store);
};

}  // namespace core
}  // namespace memqueue
