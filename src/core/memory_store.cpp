/**
 * @file memory_store.cpp
 * @brief MemoryStore implementation.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/core/memory_store.hpp"
#include "memqueue/utils/logger.hpp"

namespace memqueue {
namespace core {

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
}

bool MemoryStore::add(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.emplace(key, value).second;
}

bool MemoryStore::append(const std::string& key, const std::string& suffix) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = data_.find(key);
    if (it == data_.end()) {
        return false;
    }
    it->second += suffix;
    return true;
}

bool MemoryStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.erase(key) > 0;
}

void MemoryStore::flushAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_DEBUG("MemoryStore", "Flushing {} keys", data_.size());
    data_.clear();
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

}  // namespace core
}  // namespace memqueue
