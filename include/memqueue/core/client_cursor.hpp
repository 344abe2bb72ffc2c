/**
 * @file client_cursor.hpp
 * @brief Per (queue, client) delivery position.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/clock.hpp"
#include "memqueue/core/export.hpp"
#include "memqueue/core/key_value_store.hpp"

#include <optional>
#include <string>

namespace memqueue {
namespace core {

/**
 * @brief Last delivery recorded for a client. Both empty before the first.
 */
struct CursorState {
    std::optional<std::string> lastKey;   ///< Key of the last delivered message
    std::optional<double> lastTime;       ///< Epoch seconds of that delivery
};

/**
 * @class ClientCursor
 * @brief Reads and overwrites a client's cursor entries.
 *
 * Writes are unconditional: concurrent deliveries to the same client
 * resolve as last-writer-wins.
 */
class MEMQUEUE_CORE_API ClientCursor {
public:
    ClientCursor(KeyValueStore& store, const Clock& clock);

    /**
     * @throws CorruptStateError if the stored time is not a timestamp.
     */
    CursorState get(const std::string& queue, const std::string& clientId) const;

    /**
     * @brief Record delivery of @p messageKey to the client, now.
     */
    void set(const std::string& queue, const std::string& clientId,
             const std::string& messageKey);

private:
    KeyValueStore& store_;
    const Clock& clock_;
};

}  // namespace core
}  // namespace memqueue
