/*
 *  PicoOSC - Open Sound Control over UDP.
 *  This header file declares the Registry, which groups receivers by endpoint and
 *  owns the servers that feed them.
 */

#pragma once

#include <atomic>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "picoosc/Client.h"
#include "picoosc/Dispatcher.h"
#include "picoosc/Endpoint.h"
#include "picoosc/Logging.h"
#include "picoosc/Server.h"

namespace picoosc {

    /**
     * @brief Receivers and senders of one application
     *
     * Receivers registered for the same endpoint share one Dispatcher and, once
     * started, one Server. Construct the registry during setup, register handlers,
     * then call startAll().
     *
     * @code
     * picoosc::Registry registry;
     * Endpoint local("127.0.0.1", 19994);
     * registry.onReceive(local, "/some/addr", [](const std::string &address, const std::vector<Value> &args) {
     *     std::cout << address << " " << args.size() << std::endl;
     * });
     * auto reply = registry.bindSender(local, [](const std::string &text) {
     *     return Message("/some/addr", {text});
     * });
     * registry.startAll();
     * reply("hello");
     * registry.wait();
     * @endcode
     */
    class Registry {
       public:
        explicit Registry(ServerOptions options = ServerOptions());

        /**
         * @brief Stops all servers
         */
        ~Registry();

        Registry(const Registry &) = delete;
        Registry &operator=(const Registry &) = delete;

        /**
         * @brief Register a handler for messages arriving on an endpoint
         *
         * Can be called after startAll(); the handler is live immediately.
         */
        HandlerId onReceive(const Endpoint &endpoint, const std::string &pattern, Handler handler);

        /**
         * @brief Register one handler for several patterns
         * @throws InvalidArgumentException if no pattern is given
         */
        std::vector<HandlerId> onReceive(const Endpoint &endpoint,
                                         const std::vector<std::string> &patterns, Handler handler);

        std::vector<HandlerId> onReceive(const Endpoint &endpoint,
                                         std::initializer_list<std::string> patterns,
                                         Handler handler);

        /**
         * @brief Wrap a message producer so that each call sends what it returns
         *
         * The returned callable forwards its arguments to the producer, sends the
         * resulting Message to the target and returns it. Send errors propagate
         * to the caller.
         */
        template <typename Producer>
        auto bindSender(const Endpoint &target, Producer producer) {
            Client client(target);
            return [client, producer](auto &&...args) mutable -> Message {
                Message message = producer(std::forward<decltype(args)>(args)...);
                PICOOSC_LOG_DEBUG("Sending %s -> %s", message.toString().c_str(),
                                  client.target().url().c_str());
                client.send(message);
                return message;
            };
        }

        /**
         * @brief Dispatcher for an endpoint, created on first use
         */
        std::shared_ptr<Dispatcher> dispatcher(const Endpoint &endpoint);

        /**
         * @brief Endpoints that have at least one receiver, in sorted order
         */
        std::vector<Endpoint> endpoints() const;

        /**
         * @brief Server bound to an endpoint, nullptr before startAll()
         */
        std::shared_ptr<Server> server(const Endpoint &endpoint) const;

        /**
         * @brief Start a server for every endpoint with receivers
         *
         * A failure to bind one endpoint is logged and does not prevent the others
         * from starting.
         *
         * @param blocking Call wait() after starting
         * @return Number of servers running
         */
        size_t startAll(bool blocking = false);

        /**
         * @brief Block until SIGINT, SIGTERM or shutdown()
         */
        void wait();

        /**
         * @brief Wake a thread blocked in wait()
         */
        void shutdown();

        /**
         * @brief Stop every server; startAll() may be called again afterwards
         */
        void stopAll();

        size_t runningCount() const;

       private:
        ServerOptions options_;

        mutable std::mutex mutex_;
        std::map<Endpoint, std::shared_ptr<Dispatcher>> dispatchers_;
        std::map<Endpoint, std::shared_ptr<Server>> servers_;

        std::atomic<bool> shutdownRequested_;
    };

}  // namespace picoosc
