/*
 *  PicoOSC - Open Sound Control over UDP.
 *  Binary encoding and decoding of OSC 1.0 messages and bundles.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "picoosc/Bundle.h"
#include "picoosc/Message.h"

namespace picoosc {
    namespace codec {

        /// Largest payload a single UDP datagram can carry
        constexpr size_t kMaxPacketSize = 65507;

        /// Bundle marker, "#bundle" followed by a null byte
        constexpr char kBundleTag[8] = {'#', 'b', 'u', 'n', 'd', 'l', 'e', '\0'};

        /**
         * @brief Encode a message to the OSC binary format
         *
         * Layout: padded address string, padded type tag string (',' + one tag per
         * argument), then argument payloads in order.
         *
         * @throws EncodeError if the address is invalid, a string contains an embedded
         *         null, or the result exceeds kMaxPacketSize
         */
        std::vector<std::byte> encode(const Message &message);

        /**
         * @brief Encode a bundle, including nested bundles
         * @throws EncodeError as for messages
         */
        std::vector<std::byte> encode(const Bundle &bundle);

        /**
         * @brief Encode whichever packet type is held
         */
        std::vector<std::byte> encode(const Packet &packet);

        /**
         * @brief Decode one OSC packet
         *
         * Buffers starting with "#bundle\0" decode to a Bundle, everything else to a
         * Message. Non-null padding bytes are tolerated.
         *
         * @throws DecodeError if the buffer is truncated or malformed or holds an
         *         unknown type tag
         */
        Packet decode(const std::byte *data, size_t size);

        Packet decode(const std::vector<std::byte> &data);

        /**
         * @brief Check for the bundle marker without decoding
         */
        bool isBundle(const std::byte *data, size_t size);

    }  // namespace codec
}  // namespace picoosc
