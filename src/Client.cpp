/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the Client class, which sends
 * OSC packets to a UDP endpoint.
 */

#include "picoosc/Client.h"

#include "Socket.h"
#include "picoosc/Codec.h"
#include "picoosc/Exceptions.h"
#include "picoosc/Logging.h"

namespace picoosc {

    Client::Client(Endpoint target) : target_(std::move(target)) {}

    const Endpoint &Client::target() const { return target_; }

    void Client::send(const Message &message) const { sendRaw(codec::encode(message)); }

    void Client::send(const Bundle &bundle) const { sendRaw(codec::encode(bundle)); }

    void Client::send(const std::string &address, const std::vector<Value> &arguments) const {
        send(Message(address, arguments));
    }

    // Transmit one datagram through a short-lived socket
    void Client::sendRaw(const std::vector<std::byte> &data) const {
        std::string error;
        detail::AddrInfoPtr addresses = detail::resolveUdp(target_.host, target_.port, false, error);
        if (!addresses) {
            throw SendError("Failed to resolve host '" + target_.host + "': " + error);
        }

        // Use the first address a socket can be opened for
        const addrinfo *ai = addresses.get();
        detail::SocketHandle sock;
        for (; ai != nullptr; ai = ai->ai_next) {
            sock = detail::SocketHandle(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
            if (sock.valid()) {
                break;
            }
        }
        if (!sock.valid()) {
            throw SendError("Failed to create socket for " + target_.url() + ": " +
                            detail::lastSocketError());
        }

        ssize_t sent = ::sendto(sock.get(), data.data(), data.size(), 0, ai->ai_addr, ai->ai_addrlen);
        if (sent < 0) {
            throw SendError("Failed to send to " + target_.url() + ": " + detail::lastSocketError());
        }
        if (static_cast<size_t>(sent) != data.size()) {
            throw SendError("Partial send to " + target_.url() + ": " + std::to_string(sent) + " of " +
                            std::to_string(data.size()) + " bytes");
        }

        PICOOSC_LOG_DEBUG("Sent %zu bytes to %s", data.size(), target_.url().c_str());
    }

}  // namespace picoosc
