/*
 *  PicoOSC - Open Sound Control over UDP.
 *  This header file declares the Endpoint, a UDP host and port pair.
 */

#pragma once

#include <cstdint>
#include <string>

namespace picoosc {

    /**
     * @brief A UDP host and port, used both for listening and as a send target
     *
     * Endpoints are plain values; two endpoints with the same host string and port
     * are the same endpoint. Host names are resolved only when a socket is opened.
     */
    struct Endpoint {
        std::string host;
        uint16_t port = 0;

        Endpoint() = default;
        Endpoint(std::string host, uint16_t port);

        /**
         * @brief URL of this endpoint, "osc.udp://host:port/"
         */
        std::string url() const;

        /**
         * @brief Parse "osc.udp://host:port/" (the trailing slash is optional)
         * @throws AddressException if the scheme, host or port is invalid
         */
        static Endpoint fromUrl(const std::string &url);

        bool operator==(const Endpoint &other) const;
        bool operator!=(const Endpoint &other) const;
        bool operator<(const Endpoint &other) const;
    };

}  // namespace picoosc
