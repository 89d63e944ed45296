/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the Server class: socket setup
 * and the receive thread.
 */

#include "picoosc/Server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>

#include "Socket.h"
#include "picoosc/Codec.h"
#include "picoosc/Exceptions.h"
#include "picoosc/Logging.h"

namespace picoosc {

    // Constructor
    Server::Server(Endpoint endpoint, std::shared_ptr<Dispatcher> dispatcher, ServerOptions options)
        : endpoint_(std::move(endpoint)),
          dispatcher_(std::move(dispatcher)),
          options_(options),
          state_(ServerState::Created),
          socket_(detail::INVALID_SOCKET_VALUE),
          boundPort_(0),
          stopRequested_(false) {
        if (!dispatcher_) {
            throw InvalidArgumentException("Server for " + endpoint_.url() + " needs a dispatcher");
        }
        if (options_.receiveBufferSize == 0) {
            throw InvalidArgumentException("Receive buffer size must be positive");
        }
        if (options_.pollInterval.count() <= 0) {
            throw InvalidArgumentException("Poll interval must be positive");
        }
    }

    // Destructor
    Server::~Server() { stop(); }

    // Bind the socket and launch the receive thread
    void Server::start() {
        std::lock_guard<std::mutex> lock(stateMutex_);

        switch (state_) {
            case ServerState::Running:
                return;
            case ServerState::Stopping:
            case ServerState::Stopped:
                throw ServerException("Server for " + endpoint_.url() +
                                      " has been stopped and cannot be restarted");
            case ServerState::Created:
                break;
        }

        bindSocket();

        stopRequested_ = false;
        try {
            thread_ = std::thread(&Server::run, this);
        } catch (const std::system_error &e) {
            ::close(socket_);
            socket_ = detail::INVALID_SOCKET_VALUE;
            throw ServerException("Failed to start receive thread for " + endpoint_.url() + ": " +
                                  e.what());
        }

        state_ = ServerState::Running;
        PICOOSC_LOG_INFO("Listening on %s (bound port %u)", endpoint_.url().c_str(),
                         static_cast<unsigned>(boundPort_.load()));
    }

    // Stop the receive thread and release the socket
    void Server::stop() {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (state_ == ServerState::Created) {
                state_ = ServerState::Stopped;
                return;
            }
            if (state_ != ServerState::Running) {
                return;
            }
            state_ = ServerState::Stopping;
        }

        stopRequested_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }

        std::lock_guard<std::mutex> lock(stateMutex_);
        if (socket_ != detail::INVALID_SOCKET_VALUE) {
            ::close(socket_);
            socket_ = detail::INVALID_SOCKET_VALUE;
        }
        state_ = ServerState::Stopped;
        PICOOSC_LOG_INFO("Stopped listening on %s", endpoint_.url().c_str());
    }

    ServerState Server::state() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return state_;
    }

    bool Server::isRunning() const { return state() == ServerState::Running; }

    const Endpoint &Server::endpoint() const { return endpoint_; }

    uint16_t Server::port() const { return boundPort_; }

    std::shared_ptr<Dispatcher> Server::dispatcher() const { return dispatcher_; }

    // Resolve the endpoint and bind the first address that accepts a socket
    void Server::bindSocket() {
        std::string error;
        detail::AddrInfoPtr addresses = detail::resolveUdp(endpoint_.host, endpoint_.port, true, error);
        if (!addresses) {
            throw BindError("Failed to resolve host '" + endpoint_.host + "': " + error);
        }

        std::string lastError = "no usable address";
        for (addrinfo *ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
            detail::SocketHandle sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
            if (!sock.valid()) {
                lastError = detail::lastSocketError();
                continue;
            }

            // select() can only watch descriptors below FD_SETSIZE
            if (sock.get() >= FD_SETSIZE) {
                lastError = "socket descriptor " + std::to_string(sock.get()) +
                            " exceeds FD_SETSIZE (" + std::to_string(FD_SETSIZE) + ")";
                continue;
            }

            if (options_.reuseAddress) {
                int enable = 1;
                if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
                    lastError = detail::lastSocketError();
                    continue;
                }
            }

            if (::bind(sock.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
                lastError = detail::lastSocketError();
                continue;
            }

            sockaddr_storage bound;
            socklen_t boundLength = sizeof(bound);
            if (getsockname(sock.get(), reinterpret_cast<sockaddr *>(&bound), &boundLength) < 0) {
                lastError = detail::lastSocketError();
                continue;
            }

            if (bound.ss_family == AF_INET6) {
                boundPort_ = ntohs(reinterpret_cast<sockaddr_in6 *>(&bound)->sin6_port);
            } else {
                boundPort_ = ntohs(reinterpret_cast<sockaddr_in *>(&bound)->sin_port);
            }

            socket_ = sock.release();
            return;
        }

        throw BindError("Failed to bind " + endpoint_.url() + ": " + lastError);
    }

    // Receive thread
    void Server::run() {
        std::vector<std::byte> buffer(options_.receiveBufferSize);

        while (!stopRequested_) {
            try {
                if (!waitReadable() || stopRequested_) {
                    continue;
                }
                receiveOnce(buffer);
            } catch (const std::exception &e) {
                PICOOSC_LOG_ERROR("Receive loop error on %s: %s", endpoint_.url().c_str(), e.what());
            }
        }
    }

    // Wait at most one poll interval for a datagram
    bool Server::waitReadable() {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(socket_, &readfds);

        auto interval = options_.pollInterval.count();
        timeval tv;
        tv.tv_sec = static_cast<long>(interval / 1000);
        tv.tv_usec = static_cast<long>((interval % 1000) * 1000);

        int result = select(socket_ + 1, &readfds, nullptr, nullptr, &tv);
        if (result < 0) {
            if (errno != EINTR) {
                PICOOSC_LOG_WARNING("select failed on %s: %s", endpoint_.url().c_str(),
                                    detail::lastSocketError().c_str());
                std::this_thread::sleep_for(options_.pollInterval);
            }
            return false;
        }

        return result > 0;
    }

    // Receive, decode and dispatch one datagram
    void Server::receiveOnce(std::vector<std::byte> &buffer) {
        sockaddr_storage sender;
        socklen_t senderLength = sizeof(sender);

        // MSG_TRUNC makes recvfrom report the full datagram length
        ssize_t received = recvfrom(socket_, buffer.data(), buffer.size(), MSG_TRUNC,
                                    reinterpret_cast<sockaddr *>(&sender), &senderLength);
        if (received < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                PICOOSC_LOG_WARNING("recvfrom failed on %s: %s", endpoint_.url().c_str(),
                                    detail::lastSocketError().c_str());
            }
            return;
        }

        const std::string from =
            detail::describeAddress(reinterpret_cast<sockaddr *>(&sender), senderLength);
        const auto size = static_cast<size_t>(received);
        if (size > buffer.size()) {
            PICOOSC_LOG_WARNING("Dropped %zu byte datagram from %s: larger than receive buffer (%zu)",
                                size, from.c_str(), buffer.size());
            return;
        }

        try {
            Packet packet = codec::decode(buffer.data(), size);
            PICOOSC_LOG_DEBUG("Received %zu bytes from %s", size, from.c_str());
            dispatcher_->dispatch(packet);
        } catch (const DecodeError &e) {
            PICOOSC_LOG_WARNING("Dropped malformed datagram from %s: %s", from.c_str(), e.what());
        }
    }

}  // namespace picoosc
