/**
 * @file memcache_store.cpp
 * @brief MemcacheStore implementation (memcached text protocol).
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/net/memcache_store.hpp"
#include "memqueue/core/errors.hpp"
#include "memqueue/utils/crc64.hpp"
#include "memqueue/utils/logger.hpp"

#include <sstream>
#include <stdexcept>

namespace memqueue {
namespace net {

namespace {

constexpr const char* CRLF = "\r\n";

bool isErrorReply(const std::string& line) {
    return line == "ERROR" ||
           line.compare(0, 12, "CLIENT_ERROR") == 0 ||
           line.compare(0, 12, "SERVER_ERROR") == 0;
}

void requireValidKey(const std::string& key) {
    if (!MemcacheStore::isValidKey(key)) {
        LOG_ERROR("MemcacheStore", "Rejecting invalid key '{}'", key);
        throw core::CacheError("invalid memcached key '" + key + "'");
    }
}

}  // namespace

MemcacheStore::MemcacheStore(const std::vector<std::string>& servers, int timeoutMs)
    : timeoutMs_(timeoutMs)
{
    if (servers.empty()) {
        throw std::invalid_argument("MemcacheStore needs at least one server");
    }

    servers_.reserve(servers.size());
    for (const auto& text : servers) {
        Server server;
        server.endpoint = Endpoint::parse(text, DEFAULT_PORT);
        servers_.push_back(std::move(server));
    }

    LOG_INFO("MemcacheStore", "Configured {} server(s), timeout {}ms",
             servers_.size(), timeoutMs_);
}

bool MemcacheStore::isValidKey(const std::string& key) {
    if (key.empty() || key.size() > MAX_KEY_LENGTH) {
        return false;
    }
    for (unsigned char c : key) {
        if (c <= 0x20 || c == 0x7F) {
            return false;
        }
    }
    return true;
}

const Endpoint& MemcacheStore::serverFor(const std::string& key) const {
    return servers_[utils::CRC64::shard(key, servers_.size())].endpoint;
}

MemcacheStore::Server& MemcacheStore::route(const std::string& key) {
    Server& server = servers_[utils::CRC64::shard(key, servers_.size())];
    ensureConnected(server);
    return server;
}

void MemcacheStore::ensureConnected(Server& server) {
    if (server.socket.isConnected()) {
        return;
    }

    server.pending.clear();
    if (!server.socket.connect(server.endpoint, timeoutMs_)) {
        throw core::CacheError("cannot connect to memcached at " + server.endpoint.toString() +
                               " (error " + std::to_string(server.socket.getLastError()) + ")");
    }
}

void MemcacheStore::fail(Server& server, const std::string& what) {
    int error = server.socket.getLastError();
    server.socket.close();
    server.pending.clear();

    LOG_ERROR("MemcacheStore", "{}: {} (error {})", server.endpoint.toString(), what, error);
    throw core::CacheError(server.endpoint.toString() + ": " + what);
}

void MemcacheStore::send(Server& server, const std::string& request) {
    if (!server.socket.sendAll(request.data(), request.size(), timeoutMs_)) {
        fail(server, "send failed");
    }
}

bool MemcacheStore::fillPending(Server& server) {
    char buf[4096];
    int n = server.socket.receive(buf, sizeof(buf), timeoutMs_);
    if (n <= 0) {
        return false;
    }
    server.pending.append(buf, static_cast<size_t>(n));
    return true;
}

std::string MemcacheStore::readLine(Server& server) {
    size_t pos;
    while ((pos = server.pending.find(CRLF)) == std::string::npos) {
        if (!fillPending(server)) {
            fail(server, "connection lost or timed out awaiting reply");
        }
    }

    std::string line = server.pending.substr(0, pos);
    server.pending.erase(0, pos + 2);
    return line;
}

std::string MemcacheStore::readBlock(Server& server, size_t length) {
    // Data block is followed by its own CRLF
    while (server.pending.size() < length + 2) {
        if (!fillPending(server)) {
            fail(server, "connection lost or timed out reading value");
        }
    }

    if (server.pending.compare(length, 2, CRLF) != 0) {
        fail(server, "value block not terminated by CRLF");
    }

    std::string block = server.pending.substr(0, length);
    server.pending.erase(0, length + 2);
    return block;
}

// =============================================================================
// KeyValueStore
// =============================================================================

std::optional<std::string> MemcacheStore::get(const std::string& key) {
    requireValidKey(key);
    std::lock_guard<std::mutex> lock(mutex_);

    Server& server = route(key);
    send(server, "get " + key + CRLF);

    std::optional<std::string> value;
    for (;;) {
        std::string line = readLine(server);
        if (line == "END") {
            break;
        }
        if (isErrorReply(line)) {
            fail(server, "get " + key + " -> " + line);
        }

        // VALUE <key> <flags> <bytes>
        std::istringstream iss(line);
        std::string tag, replyKey;
        unsigned long flags = 0;
        size_t bytes = 0;
        if (!(iss >> tag >> replyKey >> flags >> bytes) || tag != "VALUE") {
            fail(server, "unexpected get reply '" + line + "'");
        }

        std::string block = readBlock(server, bytes);
        if (replyKey == key) {
            value = std::move(block);
        }
    }

    LOG_TRACE("MemcacheStore", "get {} -> {}", key, value ? "hit" : "miss");
    return value;
}

bool MemcacheStore::store(const char* verb, const std::string& key, const std::string& value) {
    requireValidKey(key);
    std::lock_guard<std::mutex> lock(mutex_);

    Server& server = route(key);

    // <verb> <key> <flags> <exptime> <bytes>\r\n<data>\r\n
    std::string request;
    request.reserve(key.size() + value.size() + 48);
    request.append(verb).append(" ").append(key)
           .append(" 0 0 ").append(std::to_string(value.size())).append(CRLF)
           .append(value).append(CRLF);
    send(server, request);

    std::string reply = readLine(server);
    LOG_TRACE("MemcacheStore", "{} {} ({} bytes) -> {}", verb, key, value.size(), reply);

    if (reply == "STORED") {
        return true;
    }
    if (reply == "NOT_STORED") {
        return false;
    }
    fail(server, std::string(verb) + " " + key + " -> " + reply);
}

void MemcacheStore::set(const std::string& key, const std::string& value) {
    if (!store("set", key, value)) {
        throw core::CacheError("memcached refused to set " + key);
    }
}

bool MemcacheStore::add(const std::string& key, const std::string& value) {
    return store("add", key, value);
}

bool MemcacheStore::append(const std::string& key, const std::string& suffix) {
    return store("append", key, suffix);
}

bool MemcacheStore::remove(const std::string& key) {
    requireValidKey(key);
    std::lock_guard<std::mutex> lock(mutex_);

    Server& server = route(key);
    send(server, "delete " + key + CRLF);

    std::string reply = readLine(server);
    LOG_TRACE("MemcacheStore", "delete {} -> {}", key, reply);

    if (reply == "DELETED") {
        return true;
    }
    if (reply == "NOT_FOUND") {
        return false;
    }
    fail(server, "delete " + key + " -> " + reply);
}

void MemcacheStore::flushAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& server : servers_) {
        ensureConnected(server);
        send(server, std::string("flush_all") + CRLF);

        std::string reply = readLine(server);
        if (reply != "OK") {
            fail(server, "flush_all -> " + reply);
        }
    }
    LOG_DEBUG("MemcacheStore", "Flushed {} server(s)", servers_.size());
}

}  // namespace net
}  // namespace memqueue
