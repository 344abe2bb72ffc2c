/**
 * @file platform.hpp
 * @brief Cross-platform socket types and the handful of socket calls
 *        TcpSocket needs (non-blocking mode, Nagle, pending errors).
 *
 * Everything that differs between Winsock2 and POSIX lives here so the
 * socket code itself has no platform branches.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")

    namespace memqueue {
    namespace net {
        using SocketHandle = SOCKET;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }

        inline bool initializeSockets() {
            WSADATA wsaData;
            return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
        }

        inline void cleanupSockets() {
            WSACleanup();
        }

        constexpr int SOCKET_TIMEOUT_ERROR = WSAETIMEDOUT;
        constexpr int SEND_FLAGS = 0;

        inline bool isConnectInProgress(int error) { return error == WSAEWOULDBLOCK; }

        // Winsock ignores the first select() argument
        inline int selectWidth(SocketHandle) { return 0; }

        inline bool setNonBlocking(SocketHandle s, bool enabled) {
            u_long mode = enabled ? 1 : 0;
            return ioctlsocket(s, FIONBIO, &mode) == 0;
        }

        inline bool setNoDelay(SocketHandle s) {
            BOOL on = TRUE;
            return setsockopt(s, IPPROTO_TCP, TCP_NODELAY,
                              reinterpret_cast<const char*>(&on), sizeof(on)) == 0;
        }

        inline int pendingSocketError(SocketHandle s) {
            int error = 0;
            int len = sizeof(error);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&error), &len) != 0) {
                return getLastSocketError();
            }
            return error;
        }
    }  // namespace net
    }  // namespace memqueue

#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <fcntl.h>
    #include <netdb.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>

    namespace memqueue {
    namespace net {
        using SocketHandle = int;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }

        inline bool initializeSockets() { return true; }
        inline void cleanupSockets() {}

        constexpr int SOCKET_TIMEOUT_ERROR = ETIMEDOUT;
    #ifdef MSG_NOSIGNAL
        constexpr int SEND_FLAGS = MSG_NOSIGNAL;  // EPIPE instead of SIGPIPE
    #else
        constexpr int SEND_FLAGS = 0;
    #endif

        inline bool isConnectInProgress(int error) { return error == EINPROGRESS; }

        inline int selectWidth(SocketHandle s) { return s + 1; }

        inline bool setNonBlocking(SocketHandle s, bool enabled) {
            int flags = fcntl(s, F_GETFL, 0);
            if (flags < 0) {
                return false;
            }
            flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            return fcntl(s, F_SETFL, flags) == 0;
        }

        inline bool setNoDelay(SocketHandle s) {
            int on = 1;
            return setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)) == 0;
        }

        inline int pendingSocketError(SocketHandle s) {
            int error = 0;
            socklen_t len = sizeof(error);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &error, &len) != 0) {
                return errno;
            }
            return error;
        }
    }  // namespace net
    }  // namespace memqueue

#endif

namespace memqueue {
namespace net {

/**
 * @brief RAII helper for socket initialization.
 *
 * Create one instance at program startup so Winsock is initialized on
 * Windows. No-op elsewhere.
 */
class SocketInitializer {
public:
    SocketInitializer() : initialized_(initializeSockets()) {}
    ~SocketInitializer() { if (initialized_) cleanupSockets(); }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

}  // namespace net
}  // namespace memqueue
