/*
 * PicoOSC - Open Sound Control over UDP.
 * POSIX socket helpers shared by Server and Client.
 */

#include "Socket.h"

#include <netinet/in.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace picoosc {
    namespace detail {

        AddrInfoPtr resolveUdp(const std::string &host, uint16_t port, bool passive,
                               std::string &error) {
            addrinfo hints;
            std::memset(&hints, 0, sizeof(hints));
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_DGRAM;
            hints.ai_protocol = IPPROTO_UDP;
            hints.ai_flags = AI_NUMERICSERV | (passive ? AI_PASSIVE : 0);

            const std::string service = std::to_string(port);
            addrinfo *result = nullptr;
            int status = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints,
                                     &result);
            if (status != 0) {
                error = gai_strerror(status);
                return AddrInfoPtr(nullptr, freeaddrinfo);
            }

            return AddrInfoPtr(result, freeaddrinfo);
        }

        SocketHandle &SocketHandle::operator=(SocketHandle &&other) noexcept {
            if (this != &other) {
                close();
                fd_ = other.release();
            }
            return *this;
        }

        int SocketHandle::release() {
            int fd = fd_;
            fd_ = INVALID_SOCKET_VALUE;
            return fd;
        }

        void SocketHandle::close() {
            if (fd_ != INVALID_SOCKET_VALUE) {
                ::close(fd_);
                fd_ = INVALID_SOCKET_VALUE;
            }
        }

        std::string lastSocketError() {
            int code = errno;
            return std::string(std::strerror(code)) + " (errno " + std::to_string(code) + ")";
        }

        std::string describeAddress(const sockaddr *address, socklen_t length) {
            char host[NI_MAXHOST];
            char service[NI_MAXSERV];
            if (getnameinfo(address, length, host, sizeof(host), service, sizeof(service),
                            NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
                return "<unknown>";
            }
            return std::string(host) + ":" + service;
        }

    }  // namespace detail
}  // namespace picoosc
