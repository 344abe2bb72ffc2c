/**
 * @file memcache_store.hpp
 * @brief KeyValueStore speaking the memcached text protocol.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/key_value_store.hpp"
#include "memqueue/net/export.hpp"
#include "memqueue/net/tcp_socket.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace memqueue {
namespace net {

/**
 * @class MemcacheStore
 * @brief memcached client over one TCP connection per server.
 *
 * Keys are spread over the servers by CRC64, so every client configured
 * with the same server list agrees on where a key lives. Connections are
 * opened lazily and reopened on the next call after a failure.
 *
 * Any I/O failure or error reply throws core::CacheError. Calls are
 * serialized by an internal mutex; give each busy thread its own store
 * to avoid contention.
 *
 * Usage:
 * @code
 * auto store = std::make_shared<MemcacheStore>(
 *     std::vector<std::string>{"10.0.0.1:11211", "10.0.0.2"});
 * core::MemQueue mq(store);
 * @endcode
 */
class MEMQUEUE_NET_API MemcacheStore : public core::KeyValueStore {
public:
    static constexpr uint16_t DEFAULT_PORT = 11211;
    static constexpr size_t MAX_KEY_LENGTH = 250;

    /**
     * @param servers Endpoints, "host[:port]".
     * @param timeoutMs Connect, send and receive timeout per operation step.
     * @throws std::invalid_argument on an empty list or a malformed endpoint.
     */
    explicit MemcacheStore(const std::vector<std::string>& servers, int timeoutMs = 3000);
    ~MemcacheStore() override = default;

    MemcacheStore(const MemcacheStore&) = delete;
    MemcacheStore& operator=(const MemcacheStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool add(const std::string& key, const std::string& value) override;
    bool append(const std::string& key, const std::string& suffix) override;
    bool remove(const std::string& key) override;
    void flushAll() override;

    size_t serverCount() const { return servers_.size(); }

    /**
     * @brief Endpoint a key is routed to.
     */
    const Endpoint& serverFor(const std::string& key) const;

    /**
     * @brief 1..250 bytes, no whitespace or control characters.
     */
    static bool isValidKey(const std::string& key);

private:
    struct Server {
        Endpoint endpoint;
        TcpSocket socket;
        std::string pending;  ///< Bytes received but not yet consumed
    };

    Server& route(const std::string& key);
    void ensureConnected(Server& server);
    void send(Server& server, const std::string& request);
    std::string readLine(Server& server);
    std::string readBlock(Server& server, size_t length);
    bool fillPending(Server& server);

    /**
     * @brief Issue set/add/append and map the reply.
     * @return True on STORED, false on NOT_STORED.
     */
    bool store(const char* verb, const std::string& key, const std::string& value);

    [[noreturn]] void fail(Server& server, const std::string& what);

    std::vector<Server> servers_;
    int timeoutMs_;
    std::mutex mutex_;
};

}  // namespace net
}  // namespace memqueue
