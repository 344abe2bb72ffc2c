/**
 * @file tcp_socket.hpp
 * @brief RAII TCP client socket with timeouts.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/net/export.hpp"
#include "memqueue/net/platform.hpp"

#include <cstdint>
#include <string>

namespace memqueue {
namespace net {

/**
 * @struct Endpoint
 * @brief Host name or IP plus port.
 */
struct MEMQUEUE_NET_API Endpoint {
    std::string host;
    uint16_t port;

    Endpoint() : host("127.0.0.1"), port(0) {}
    Endpoint(const std::string& host_, uint16_t port_) : host(host_), port(port_) {}

    std::string toString() const { return host + ":" + std::to_string(port); }

    bool operator==(const Endpoint& other) const {
        return host == other.host && port == other.port;
    }

    /**
     * @brief Parse "host", "host:port" or "[v6addr]:port".
     * @param text Endpoint text.
     * @param defaultPort Used when the text carries no port.
     * @throws std::invalid_argument on an empty host or a bad port.
     */
    static Endpoint parse(const std::string& text, uint16_t defaultPort);
};

/**
 * @class TcpSocket
 * @brief Blocking TCP client connection.
 *
 * Usage:
 * @code
 * TcpSocket sock;
 * if (sock.connect(Endpoint("127.0.0.1", 11211), 1000)) {
 *     sock.sendAll("version\r\n", 9, 1000);
 *     char buf[64];
 *     int n = sock.receive(buf, sizeof(buf), 1000);
 * }
 * @endcode
 */
class MEMQUEUE_NET_API TcpSocket {
public:
    TcpSocket();
    ~TcpSocket();

    // Non-copyable, but movable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    /**
     * @brief True once connect() succeeded and until close().
     */
    bool isConnected() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Resolve and connect, trying every resolved address.
     * @param timeoutMs Per-address connect timeout (-1 = blocking connect).
     * @return True on success. On failure the socket stays closed.
     */
    bool connect(const Endpoint& endpoint, int timeoutMs);

    /**
     * @brief Send the whole buffer.
     * @param timeoutMs Maximum wait for the socket to become writable, per chunk.
     * @return False on error or timeout; the connection is then unusable.
     */
    bool sendAll(const void* data, size_t length, int timeoutMs);

    /**
     * @brief Receive whatever is available, waiting up to timeoutMs.
     * @return Bytes received, 0 on timeout, -1 on error or peer close.
     */
    int receive(void* buffer, size_t bufferSize, int timeoutMs);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
    bool waitFor(bool writable, int timeoutMs);
    bool connectOne(const struct addrinfo* ai, int timeoutMs);
};

}  // namespace net
}  // namespace memqueue
