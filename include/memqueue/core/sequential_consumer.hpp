/**
 * @file sequential_consumer.hpp
 * @brief "Next unseen message" resolution for a client.
 *
 * A client is in one of these states on a queue:
 * - never consumed: no cursor; gets the oldest message in the window
 * - caught up: cursor equals LASTMSG; gets nothing
 * - behind, fresh: gets the message after its cursor within the window
 * - behind, lagging: silent longer than the lag threshold; fast-forwarded
 *   straight to the newest message, skipping everything in between
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/client_cursor.hpp"
#include "memqueue/core/clock.hpp"
#include "memqueue/core/export.hpp"
#include "memqueue/core/queue_reader.hpp"

#include <optional>
#include <string>

namespace memqueue {
namespace core {

/**
 * @class SequentialConsumer
 * @brief Decides and fetches the next message for a client.
 */
class MEMQUEUE_CORE_API SequentialConsumer {
public:
    /**
     * @param clientLagSeconds Silence after which a client is fast-forwarded.
     *        The same number, read as minutes, sets the scan window.
     * @param autodelete Passed through to every fetch.
     */
    SequentialConsumer(const ClientCursor& cursor, QueueReader& reader, const Clock& clock,
                       int clientLagSeconds, bool autodelete);

    /**
     * @brief Deliver the next message the client has not seen.
     * @return The payload, or std::nullopt when the client is caught up.
     */
    std::optional<std::string> next(const std::string& queue, const std::string& clientId);

    /**
     * @brief Minutes of buckets scanned for a given lag threshold.
     *
     * The lag value is reused as a minute count.
     */
    static int windowMinutesFor(int clientLagSeconds) {
        return clientLagSeconds <= 0 ? 0 : clientLagSeconds;
    }

private:
    const ClientCursor& cursor_;
    QueueReader& reader_;
    const Clock& clock_;
    int clientLagSeconds_;
    bool autodelete_;
};

}  // namespace core
}  // namespace memqueue
