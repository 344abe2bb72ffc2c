/**
 * @file uuid.hpp
 * @brief UUID v4 generation utilities.
 *
 * Used for message key uniqueness and for client identifiers.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/utils/export.hpp"

#include <string>

namespace memqueue {
namespace utils {

/**
 * @class UUIDGenerator
 * @brief Thread-safe RFC 4122 version 4 UUID generator.
 *
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y one of 8, 9, a, b.
 */
class MEMQUEUE_UTILS_API UUIDGenerator {
public:
    /**
     * @brief Generate a new random UUID v4 in lower-case hex.
     */
    static std::string generate();

    /**
     * @brief Check the 8-4-4-4-12 hex layout.
     */
    static bool isValid(const std::string& uuid);

    /**
     * @brief "00000000-0000-0000-0000-000000000000"
     */
    static std::string nil() {
        return "00000000-0000-0000-0000-000000000000";
    }
};

/**
 * @brief Shorthand for UUIDGenerator::generate().
 */
inline std::string generateUUID() {
    return UUIDGenerator::generate();
}

}  // namespace utils
}  // namespace memqueue
