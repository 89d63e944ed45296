/*
 * PicoOSC - Open Sound Control over UDP.
 * Internal socket helpers shared by Server and Client.
 */

#pragma once

#include <netdb.h>
#include <sys/socket.h>

#include <cstdint>
#include <memory>
#include <string>

namespace picoosc {
    namespace detail {

        constexpr int INVALID_SOCKET_VALUE = -1;

        using AddrInfoPtr = std::unique_ptr<addrinfo, void (*)(addrinfo *)>;

        /**
         * @brief Resolve a host and port for UDP
         *
         * An empty host resolves to the wildcard address when passive is set.
         *
         * @param error Receives the resolver message on failure
         * @return The address list, or an empty pointer on failure
         */
        AddrInfoPtr resolveUdp(const std::string &host, uint16_t port, bool passive,
                               std::string &error);

        /**
         * @brief Owns a socket descriptor and closes it on destruction
         */
        class SocketHandle {
           public:
            SocketHandle() = default;
            explicit SocketHandle(int fd) : fd_(fd) {}
            ~SocketHandle() { close(); }

            SocketHandle(const SocketHandle &) = delete;
            SocketHandle &operator=(const SocketHandle &) = delete;

            SocketHandle(SocketHandle &&other) noexcept : fd_(other.release()) {}
            SocketHandle &operator=(SocketHandle &&other) noexcept;

            int get() const { return fd_; }
            bool valid() const { return fd_ != INVALID_SOCKET_VALUE; }
            int release();
            void close();

           private:
            int fd_ = INVALID_SOCKET_VALUE;
        };

        /**
         * @brief Text of the current errno
         */
        std::string lastSocketError();

        /**
         * @brief Numeric "host:port" of a socket address, for log lines
         */
        std::string describeAddress(const sockaddr *address, socklen_t length);

    }  // namespace detail
}  // namespace picoosc
