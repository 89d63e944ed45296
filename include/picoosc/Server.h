/*
 *  PicoOSC - Open Sound Control over UDP.
 *  This header file declares the Server, which receives OSC packets on one UDP
 *  endpoint and hands them to a Dispatcher.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "picoosc/Dispatcher.h"
#include "picoosc/Endpoint.h"

namespace picoosc {

    /**
     * @brief Lifecycle of a Server; a stopped server is never restarted
     */
    enum class ServerState { Created, Running, Stopping, Stopped };

    /**
     * @brief Tunables for the receive loop
     */
    struct ServerOptions {
        /// Longest time the receive loop blocks before checking for stop()
        std::chrono::milliseconds pollInterval{100};
        /// Size of the datagram receive buffer
        size_t receiveBufferSize = 65536;
        /// Set SO_REUSEADDR before binding
        bool reuseAddress = false;
    };

    /**
     * @brief UDP server running one receive thread
     *
     * Every received datagram is decoded and passed to the dispatcher. Datagrams
     * that fail to decode are logged and dropped without stopping the loop.
     */
    class Server {
       public:
        /**
         * @brief Create a server; nothing is bound until start()
         * @throws InvalidArgumentException if the dispatcher is null or an option is invalid
         */
        Server(Endpoint endpoint, std::shared_ptr<Dispatcher> dispatcher,
               ServerOptions options = ServerOptions());

        /**
         * @brief Stops the server
         */
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        /**
         * @brief Bind the endpoint and launch the receive thread
         *
         * Does nothing if the server is already running.
         *
         * @throws BindError if the host cannot be resolved or the port cannot be bound
         * @throws ServerException if the server has been stopped
         */
        void start();

        /**
         * @brief Stop the receive thread and close the socket
         *
         * Returns within about one poll interval. Safe to call more than once.
         */
        void stop();

        ServerState state() const;
        bool isRunning() const;

        const Endpoint &endpoint() const;

        /**
         * @brief Port actually bound, 0 before start()
         *
         * Differs from endpoint().port when binding port 0.
         */
        uint16_t port() const;

        std::shared_ptr<Dispatcher> dispatcher() const;

       private:
        void bindSocket();
        void run();
        bool waitReadable();
        void receiveOnce(std::vector<std::byte> &buffer);

        Endpoint endpoint_;
        std::shared_ptr<Dispatcher> dispatcher_;
        ServerOptions options_;

        mutable std::mutex stateMutex_;
        ServerState state_;
        int socket_;
        std::atomic<uint16_t> boundPort_;
        std::atomic<bool> stopRequested_;
        std::thread thread_;
    };

}  // namespace picoosc
