/*
 *  PicoOSC - Open Sound Control over UDP.
 *  This header file declares the Client, which sends OSC packets to one endpoint.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "picoosc/Bundle.h"
#include "picoosc/Endpoint.h"
#include "picoosc/Message.h"

namespace picoosc {

    /**
     * @brief Sends OSC packets to a fixed UDP endpoint
     *
     * The client keeps no socket open: each send resolves the target, opens an
     * ephemeral socket, transmits one datagram and closes it again. Sends are
     * fire-and-forget and never retried. Concurrent calls are safe.
     */
    class Client {
       public:
        explicit Client(Endpoint target);

        const Endpoint &target() const;

        /**
         * @brief Send a message
         * @throws EncodeError if the message cannot be encoded
         * @throws SendError if the datagram cannot be sent
         */
        void send(const Message &message) const;

        /**
         * @brief Send a bundle
         * @throws EncodeError if the bundle cannot be encoded
         * @throws SendError if the datagram cannot be sent
         */
        void send(const Bundle &bundle) const;

        /**
         * @brief Build and send a message
         * @throws AddressException if the address does not start with '/'
         */
        void send(const std::string &address, const std::vector<Value> &arguments) const;

        /**
         * @brief Send an already encoded packet as one datagram
         * @throws SendError if the datagram cannot be sent completely
         */
        void sendRaw(const std::vector<std::byte> &data) const;

       private:
        Endpoint target_;
    };

}  // namespace picoosc
