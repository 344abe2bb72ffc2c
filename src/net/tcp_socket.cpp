/**
 * @file tcp_socket.cpp
 * @brief Cross-platform TCP client socket implementation.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/net/tcp_socket.hpp"
#include "memqueue/utils/logger.hpp"

#include <stdexcept>

namespace memqueue {
namespace net {

// =============================================================================
// Endpoint
// =============================================================================

Endpoint Endpoint::parse(const std::string& text, uint16_t defaultPort) {
    std::string host = text;
    std::string port;

    if (!text.empty() && text.front() == '[') {
        size_t close = text.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("unterminated IPv6 address in '" + text + "'");
        }
        host = text.substr(1, close - 1);
        if (close + 1 < text.size()) {
            if (text[close + 1] != ':') {
                throw std::invalid_argument("unexpected text after ']' in '" + text + "'");
            }
            port = text.substr(close + 2);
        }
    } else {
        size_t colon = text.rfind(':');
        if (colon != std::string::npos) {
            host = text.substr(0, colon);
            port = text.substr(colon + 1);
        }
    }

    if (host.empty()) {
        throw std::invalid_argument("missing host in endpoint '" + text + "'");
    }

    if (port.empty()) {
        return Endpoint(host, defaultPort);
    }

    size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(port, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad port in endpoint '" + text + "'");
    }
    if (consumed != port.size() || value == 0 || value > 65535) {
        throw std::invalid_argument("bad port in endpoint '" + text + "'");
    }
    return Endpoint(host, static_cast<uint16_t>(value));
}

// =============================================================================
// TcpSocket
// =============================================================================

TcpSocket::TcpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool TcpSocket::connect(const Endpoint& endpoint, int timeoutMs) {
    close();

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* results = nullptr;
    const std::string service = std::to_string(endpoint.port);
    int rc = ::getaddrinfo(endpoint.host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        lastError_ = rc;
        LOG_ERROR("TcpSocket", "Cannot resolve {}: {}", endpoint.toString(), gai_strerror(rc));
        return false;
    }

    bool connected = false;
    for (const struct addrinfo* ai = results; ai != nullptr && !connected; ai = ai->ai_next) {
        connected = connectOne(ai, timeoutMs);
    }
    ::freeaddrinfo(results);

    if (!connected) {
        LOG_ERROR("TcpSocket", "Failed to connect to {} - error {}",
                  endpoint.toString(), lastError_);
        return false;
    }

    if (!setNoDelay(socket_)) {
        LOG_WARN("TcpSocket", "Could not disable Nagle on {} - error {}",
                 endpoint.toString(), getLastSocketError());
    }

    LOG_DEBUG("TcpSocket", "Connected to {}", endpoint.toString());
    return true;
}

bool TcpSocket::connectOne(const struct addrinfo* ai, int timeoutMs) {
    socket_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        return false;
    }

    if (timeoutMs < 0) {
        if (::connect(socket_, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen)) != 0) {
            setLastError();
            close();
            return false;
        }
        return true;
    }

    // Non-blocking connect bounded by select(), then back to blocking
    if (!setNonBlocking(socket_, true)) {
        setLastError();
        close();
        return false;
    }

    int rc = ::connect(socket_, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
    if (rc != 0) {
        setLastError();
        if (!isConnectInProgress(lastError_) || !waitFor(true, timeoutMs)) {
            close();
            return false;
        }

        int soError = pendingSocketError(socket_);
        if (soError != 0) {
            lastError_ = soError;
            close();
            return false;
        }
    }

    if (!setNonBlocking(socket_, false)) {
        setLastError();
        close();
        return false;
    }
    return true;
}

bool TcpSocket::waitFor(bool writable, int timeoutMs) {
    if (timeoutMs < 0) {
        return true;
    }

    fd_set set;
    FD_ZERO(&set);
    FD_SET(socket_, &set);

    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;

    int nfds = selectWidth(socket_);
    int rc = writable ? ::select(nfds, nullptr, &set, nullptr, &tv)
                      : ::select(nfds, &set, nullptr, nullptr, &tv);
    if (rc < 0) {
        setLastError();
        return false;
    }
    if (rc == 0) {
        lastError_ = SOCKET_TIMEOUT_ERROR;
        return false;
    }
    return true;
}

bool TcpSocket::sendAll(const void* data, size_t length, int timeoutMs) {
    if (!isConnected()) {
        return false;
    }

    const char* bytes = static_cast<const char*>(data);
    size_t sent = 0;
    while (sent < length) {
        if (!waitFor(true, timeoutMs)) {
            return false;
        }

#ifdef _WIN32
        int result = ::send(socket_, bytes + sent, static_cast<int>(length - sent), SEND_FLAGS);
#else
        ssize_t result = ::send(socket_, bytes + sent, length - sent, SEND_FLAGS);
#endif
        if (result < 0) {
            setLastError();
            return false;
        }
        sent += static_cast<size_t>(result);
    }
    return true;
}

int TcpSocket::receive(void* buffer, size_t bufferSize, int timeoutMs) {
    if (!isConnected()) {
        return -1;
    }

    if (!waitFor(false, timeoutMs)) {
        return lastError_ == SOCKET_TIMEOUT_ERROR ? 0 : -1;
    }

#ifdef _WIN32
    int result = ::recv(socket_, static_cast<char*>(buffer), static_cast<int>(bufferSize), 0);
#else
    ssize_t result = ::recv(socket_, buffer, bufferSize, 0);
#endif

    if (result < 0) {
        setLastError();
        return -1;
    }
    if (result == 0) {
        // Orderly shutdown by the peer
        lastError_ = 0;
        return -1;
    }
    return static_cast<int>(result);
}

void TcpSocket::close() {
    if (isConnected()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void TcpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace memqueue
