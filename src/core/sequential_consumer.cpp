/**
 * @file sequential_consumer.cpp
 * @brief SequentialConsumer implementation.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/core/sequential_consumer.hpp"
#include "memqueue/utils/logger.hpp"

#include <algorithm>

namespace memqueue {
namespace core {

SequentialConsumer::SequentialConsumer(const ClientCursor& cursor, QueueReader& reader,
                                       const Clock& clock, int clientLagSeconds,
                                       bool autodelete)
    : cursor_(cursor)
    , reader_(reader)
    , clock_(clock)
    , clientLagSeconds_(clientLagSeconds)
    , autodelete_(autodelete)
{}

std::optional<std::string> SequentialConsumer::next(const std::string& queue,
                                                    const std::string& clientId) {
    const CursorState state = cursor_.get(queue, clientId);
    const std::optional<std::string> lastGlobal = reader_.lastMessageKey(queue);

    if (state.lastKey == lastGlobal) {
        LOG_TRACE("SequentialConsumer", "Client {} caught up on {}", clientId, queue);
        return std::nullopt;
    }

    if (state.lastTime) {
        double silence = toEpochSeconds(clock_.now()) - *state.lastTime;
        if (silence > clientLagSeconds_) {
            LOG_DEBUG("SequentialConsumer",
                      "Client {} silent {}s on {} (limit {}s), fast-forwarding to newest",
                      clientId, silence, queue, clientLagSeconds_);
            return reader_.last(queue, clientId, autodelete_);
        }
    }

    std::vector<std::string> window =
        reader_.listMessageKeys(queue, windowMinutesFor(clientLagSeconds_));

    size_t nextIndex = 0;
    if (state.lastKey) {
        auto it = std::find(window.begin(), window.end(), *state.lastKey);
        if (it != window.end()) {
            nextIndex = static_cast<size_t>(std::distance(window.begin(), it)) + 1;
        }
    }

    if (nextIndex >= window.size()) {
        LOG_TRACE("SequentialConsumer", "Client {} at end of window on {}", clientId, queue);
        return std::nullopt;
    }

    LOG_TRACE("SequentialConsumer", "Client {} on {} gets index {} of {}",
              clientId, queue, nextIndex, window.size());
    return reader_.fetch(queue, window[nextIndex], clientId, autodelete_);
}

}  // namespace core
}  // namespace memqueue
