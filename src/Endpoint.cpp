/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the Endpoint type and its
 * osc.udp:// URL form.
 */

#include "picoosc/Endpoint.h"

#include <cctype>
#include <sstream>
#include <tuple>

#include "picoosc/Exceptions.h"

namespace picoosc {

    Endpoint::Endpoint(std::string host, uint16_t port) : host(std::move(host)), port(port) {}

    std::string Endpoint::url() const {
        std::ostringstream url;
        url << "osc.udp://" << host << ":" << port << "/";
        return url.str();
    }

    // URL parser factory method
    Endpoint Endpoint::fromUrl(const std::string &url) {
        const std::string scheme = "osc.udp://";
        if (url.compare(0, scheme.size(), scheme) != 0) {
            throw AddressException("Invalid OSC URL format: " + url);
        }

        std::string rest = url.substr(scheme.size());
        if (!rest.empty() && rest.back() == '/') {
            rest.pop_back();
        }

        // Split on the last colon so the host part may itself contain colons
        size_t colonPos = rest.rfind(':');
        if (colonPos == std::string::npos) {
            throw AddressException("Invalid OSC URL format, missing port in " + url);
        }

        std::string host = rest.substr(0, colonPos);
        std::string portText = rest.substr(colonPos + 1);
        if (host.empty()) {
            throw AddressException("Invalid OSC URL format, missing host in " + url);
        }
        if (portText.empty() || portText.size() > 5) {
            throw AddressException("Invalid port in " + url);
        }

        unsigned long port = 0;
        for (char c : portText) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw AddressException("Invalid port in " + url);
            }
            port = port * 10 + static_cast<unsigned long>(c - '0');
        }
        if (port > 65535) {
            throw AddressException("Port out of range in " + url);
        }

        return Endpoint(host, static_cast<uint16_t>(port));
    }

    bool Endpoint::operator==(const Endpoint &other) const {
        return host == other.host && port == other.port;
    }

    bool Endpoint::operator!=(const Endpoint &other) const { return !(*this == other); }

    bool Endpoint::operator<(const Endpoint &other) const {
        return std::tie(host, port) < std::tie(other.host, other.port);
    }

}  // namespace picoosc
