/**
 * @file errors.hpp
 * @brief Exception types raised by the queue core and cache backends.
 *
 * Absence (no message, no queue, caught-up client) is never an error and
 * is reported through empty results instead.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include <stdexcept>
#include <string>

namespace memqueue {
namespace core {

/**
 * @brief Base of every MemQueue exception.
 */
class MemQueueError : public std::runtime_error {
public:
    explicit MemQueueError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The cache could not be reached or answered outside its protocol.
 */
class CacheError : public MemQueueError {
public:
    explicit CacheError(const std::string& what) : MemQueueError(what) {}
};

/**
 * @brief A bucket list or cursor entry holds data this code never writes.
 */
class CorruptStateError : public MemQueueError {
public:
    explicit CorruptStateError(const std::string& what) : MemQueueError(what) {}
};

/**
 * @brief A requested capability exists in the configuration surface only.
 */
class NotSupportedError : public MemQueueError {
public:
    explicit NotSupportedError(const std::string& what) : MemQueueError(what) {}
};

}  // namespace core
}  // namespace memqueue
