/**
 * @file mem_queue.cpp
 * @brief MemQueue implementation.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/core/mem_queue.hpp"
#include "memqueue/core/errors.hpp"
#include "memqueue/core/queue_keys.hpp"
#include "memqueue/utils/logger.hpp"
#include "memqueue/utils/uuid.hpp"

#include <stdexcept>

namespace memqueue {
namespace core {

QueueConfig MemQueue::validated(QueueConfig config) {
    if (!config.backup_servers.empty()) {
        LOG_ERROR("MemQueue", "Rejecting {} backup servers: mirroring is not supported",
                  config.backup_servers.size());
        throw NotSupportedError("backup servers are not supported; "
                                "writes are never mirrored");
    }
    if (config.client_lag_seconds <= 0) {
        throw std::invalid_argument("client_lag_seconds must be positive, got " +
                                    std::to_string(config.client_lag_seconds));
    }
    return config;
}

std::shared_ptr<KeyValueStore> MemQueue::requireStore(std::shared_ptr<KeyValueStore> store) {
    if (!store) {
        throw std::invalid_argument("MemQueue needs a key-value store");
    }
    return store;
}

MemQueue::MemQueue(std::shared_ptr<KeyValueStore> store,
                   QueueConfig config,
                   std::shared_ptr<const Clock> clock)
    : config_(validated(std::move(config)))
    , store_(requireStore(std::move(store)))
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
    , index_(*store_, *clock_)
    , cursor_(*store_, *clock_)
    , writer_(*store_, *clock_, index_)
    , reader_(*store_, index_, cursor_)
    , consumer_(cursor_, reader_, *clock_, config_.client_lag_seconds, config_.autodelete)
{
    LOG_INFO("MemQueue", "Created queue handle (autodelete={}, client_lag={}s)",
             config_.autodelete ? "on" : "off", config_.client_lag_seconds);
}

std::string MemQueue::put(const std::string& queue, const std::string& payload,
                          const std::string& clientId) {
    return writer_.put(queue, payload, clientId);
}

std::optional<std::string> MemQueue::get(const std::string& queue,
                                         const std::string& messageKey,
                                         const std::string& clientId) {
    return reader_.fetch(queue, messageKey, clientId, config_.autodelete);
}

std::optional<std::string> MemQueue::last(const std::string& queue,
                                          const std::string& clientId) {
    return reader_.last(queue, clientId, config_.autodelete);
}

std::optional<std::string> MemQueue::nextmsg(const std::string& queue,
                                             const std::string& clientId) {
    return consumer_.next(queue, clientId);
}

std::vector<std::string> MemQueue::listMessages(const std::string& queue, int windowMinutes,
                                                const std::string& clientId) {
    LOG_TRACE("MemQueue", "{} lists {} over {} minutes", clientId, queue, windowMinutes);
    return reader_.listMessageKeys(queue, windowMinutes);
}

bool MemQueue::remove(const std::string& queue, const std::string& messageKey) {
    bool removed = store_->remove(messageKey);
    LOG_DEBUG("MemQueue", "Delete {} from {}: {}", messageKey, queue,
              removed ? "removed" : "not found");
    return removed;
}

size_t MemQueue::purgeQueue(const std::string& queue, int windowMinutes,
                            const std::string& clientId) {
    size_t removed = 0;
    for (const auto& key : listMessages(queue, windowMinutes, clientId)) {
        if (remove(queue, key)) {
            ++removed;
        }
    }

    LOG_INFO("MemQueue", "Purged {} messages from {} ({} minute window)",
             removed, queue, windowMinutes);
    return removed;
}

double MemQueue::checkQueue(const std::string& queue) {
    auto marker = store_->get(keys::existenceMarker(queue));
    if (!marker) {
        return 0.0;
    }

    auto ts = parseTimestamp(*marker);
    if (!ts) {
        LOG_ERROR("MemQueue", "Existence marker of {} is not a timestamp: '{}'", queue, *marker);
        throw CorruptStateError("existence marker of queue " + queue +
                                " is not a timestamp: '" + *marker + "'");
    }
    return *ts;
}

std::string MemQueue::createClientID() {
    return utils::UUIDGenerator::generate();
}

}  // namespace core
}  // namespace memqueue
