/**
 * @file crc64.hpp
 * @brief CRC64 (ECMA-182) hashing, used to spread cache keys over servers.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/utils/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace memqueue {
namespace utils {

/**
 * @class CRC64
 * @brief CRC64 calculator, polynomial 0x42F0E1EBA9EA3693.
 *
 * Usage:
 * @code
 * size_t server = CRC64::shard("queue_LASTMSG", servers.size());
 * @endcode
 */
class MEMQUEUE_UTILS_API CRC64 {
public:
    static constexpr uint64_t POLYNOMIAL = 0x42F0E1EBA9EA3693ULL;

    static uint64_t compute(const std::string& data) {
        return compute(data.data(), data.size());
    }

    static uint64_t compute(const void* data, size_t length) {
        CRC64 crc;
        crc.update(data, length);
        return crc.finalize();
    }

    /**
     * @brief Map a key onto one of @p shards slots. Stable across processes.
     * @return 0 when @p shards is 0 or 1.
     */
    static size_t shard(const std::string& key, size_t shards) {
        if (shards <= 1) {
            return 0;
        }
        return static_cast<size_t>(compute(key) % shards);
    }

    CRC64() : crc_(0xFFFFFFFFFFFFFFFFULL) {}

    void update(const std::string& data) {
        update(data.data(), data.size());
    }

    void update(const void* data, size_t length) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        for (size_t i = 0; i < length; ++i) {
            uint8_t index = static_cast<uint8_t>(crc_ >> 56) ^ bytes[i];
            crc_ = table()[index] ^ (crc_ << 8);
        }
    }

    uint64_t finalize() const {
        return crc_ ^ 0xFFFFFFFFFFFFFFFFULL;
    }

private:
    uint64_t crc_;

    static const std::array<uint64_t, 256>& table() {
        static const std::array<uint64_t, 256> t = generateTable();
        return t;
    }

    static std::array<uint64_t, 256> generateTable() {
        std::array<uint64_t, 256> t{};
        for (uint64_t i = 0; i < 256; ++i) {
            uint64_t crc = i << 56;
            for (int j = 0; j < 8; ++j) {
                crc = (crc & 0x8000000000000000ULL) ? (crc << 1) ^ POLYNOMIAL : crc << 1;
            }
            t[i] = crc;
        }
        return t;
    }
};

}  // namespace utils
}  // namespace memqueue
