/**
 * @file client_cursor.cpp
 * @brief ClientCursor implementation.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/core/client_cursor.hpp"
#include "memqueue/core/errors.hpp"
#include "memqueue/core/queue_keys.hpp"
#include "memqueue/utils/logger.hpp"

namespace memqueue {
namespace core {

ClientCursor::ClientCursor(KeyValueStore& store, const Clock& clock)
    : store_(store)
    , clock_(clock)
{}

CursorState ClientCursor::get(const std::string& queue, const std::string& clientId) const {
    CursorState state;
    state.lastKey = store_.get(keys::clientLastMessage(queue, clientId));

    auto rawTime = store_.get(keys::clientLastTime(queue, clientId));
    if (rawTime) {
        state.lastTime = parseTimestamp(*rawTime);
        if (!state.lastTime) {
            LOG_ERROR("ClientCursor", "Unreadable delivery time '{}' for client {} on {}",
                      *rawTime, clientId, queue);
            throw CorruptStateError("cursor time of client " + clientId + " on queue " +
                                    queue + " is not a timestamp: '" + *rawTime + "'");
        }
    }
    return state;
}

void ClientCursor::set(const std::string& queue, const std::string& clientId,
                       const std::string& messageKey) {
    store_.set(keys::clientLastMessage(queue, clientId), messageKey);
    store_.set(keys::clientLastTime(queue, clientId), formatTimestamp(clock_.now()));

    LOG_TRACE("ClientCursor", "Client {} on {} now at {}", clientId, queue, messageKey);
}

}  // namespace core
}  // namespace memqueue
