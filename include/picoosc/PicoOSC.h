/*
 *  PicoOSC - Open Sound Control over UDP.
 *
 *  A small C++ implementation of OSC 1.0 messaging: packet encoding, address
 *  pattern dispatch, UDP servers and clients, and a registry tying receivers
 *  and senders to endpoints.
 */

#pragma once

/**
 * @file PicoOSC.h
 * @brief Main include file for the PicoOSC library
 *
 * Example usage:
 *
 * ```cpp
 * picoosc::Registry registry;
 * picoosc::Endpoint local("127.0.0.1", 19994);
 *
 * registry.onReceive(local, "/some/addr",
 *                    [](const std::string &address, const std::vector<picoosc::Value> &args) {
 *                        std::cout << address << ": " << args.at(0).toString() << "\n";
 *                    });
 * registry.startAll();
 *
 * picoosc::Client client(local);
 * client.send("/some/addr", {"Hey this is something"});
 *
 * registry.wait();
 * ```
 */

#include <string>

#include "picoosc/AddressMatcher.h"
#include "picoosc/Bundle.h"
#include "picoosc/Client.h"
#include "picoosc/Codec.h"
#include "picoosc/Config.h"
#include "picoosc/Dispatcher.h"
#include "picoosc/Endpoint.h"
#include "picoosc/Exceptions.h"
#include "picoosc/Logging.h"
#include "picoosc/Message.h"
#include "picoosc/Registry.h"
#include "picoosc/Server.h"
#include "picoosc/Types.h"

// Version information
#define PICOOSC_VERSION_MAJOR 0
#define PICOOSC_VERSION_MINOR 1
#define PICOOSC_VERSION_PATCH 0
#define PICOOSC_VERSION_STRING "0.1.0"

namespace picoosc {

    /**
     * @brief Get the library version as a string
     * @return Version string in format "major.minor.patch"
     */
    inline std::string getVersionString() { return PICOOSC_VERSION_STRING; }

}  // namespace picoosc
