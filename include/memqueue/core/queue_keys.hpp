/**
 * @file queue_keys.hpp
 * @brief Cache key layout of a queue.
 *
 * For a queue Q:
 * - Q                          existence marker, timestamp of the last write
 * - Q_{client}_{ts}_{uuid}     one message payload
 * - Q_LIST_{YYYYMMDDHHMM}      bucket: "key1,key2,..." written in that minute
 * - Q_LASTMSG                  key of the newest message
 * - Q_LASTMSG_{client}         last key delivered to a client
 * - Q_LASTTIME_{client}        when that delivery happened
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include <string>

namespace memqueue {
namespace core {
namespace keys {

/// Terminates every entry of a bucket list.
constexpr char BUCKET_DELIMITER = ',';

inline std::string existenceMarker(const std::string& queue) {
    return queue;
}

inline std::string message(const std::string& queue, const std::string& clientId,
                           const std::string& timestamp, const std::string& uniqueId) {
    return queue + "_" + clientId + "_" + timestamp + "_" + uniqueId;
}

inline std::string bucket(const std::string& queue, const std::string& minuteStamp) {
    return queue + "_LIST_" + minuteStamp;
}

inline std::string lastMessage(const std::string& queue) {
    return queue + "_LASTMSG";
}

inline std::string clientLastMessage(const std::string& queue, const std::string& clientId) {
    return queue + "_LASTMSG_" + clientId;
}

inline std::string clientLastTime(const std::string& queue, const std::string& clientId) {
    return queue + "_LASTTIME_" + clientId;
}

}  // namespace keys
}  // namespace core
}  // namespace memqueue
