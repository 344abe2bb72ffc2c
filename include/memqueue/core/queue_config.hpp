/**
 * @file queue_config.hpp
 * @brief Construction-time settings of a MemQueue.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include <string>
#include <vector>

namespace memqueue {
namespace core {

/**
 * @brief Queue configuration
 */
struct QueueConfig {
    std::vector<std::string> servers = {"127.0.0.1:11211"};  ///< Cache endpoints, "host[:port]"
    std::vector<std::string> backup_servers;   ///< Mirroring targets; rejected when non-empty
    bool autodelete = false;                   ///< Delete each message after its first read
    int client_lag_seconds = 120;              ///< Silence after which nextmsg fast-forwards
};

}  // namespace core
}  // namespace memqueue
