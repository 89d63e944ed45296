/*
 *  PicoOSC - Open Sound Control over UDP.
 *  This header file declares the Dispatcher, which routes received messages to
 *  the handlers registered for matching address patterns.
 */

#pragma once

#include <functional>
#include <future>
#include <list>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "picoosc/Bundle.h"
#include "picoosc/Types.h"

namespace picoosc {

    using HandlerId = int;

    /**
     * @brief Callback invoked with the received address and its arguments
     */
    using Handler = std::function<void(const std::string &address, const std::vector<Value> &arguments)>;

    /**
     * @brief A registered pattern and the handler it triggers
     */
    struct HandlerBinding {
        HandlerId id;
        std::string pattern;
        Handler handler;
    };

    /**
     * @brief Routes messages to every handler whose pattern matches
     *
     * Handlers run on their own worker threads so a slow handler never blocks the
     * caller of route(). Exceptions thrown by a handler are logged and discarded.
     * Registration is thread-safe and may happen while messages are being routed.
     */
    class Dispatcher {
       public:
        Dispatcher();

        /**
         * @brief Waits for running handlers
         */
        ~Dispatcher();

        Dispatcher(const Dispatcher &) = delete;
        Dispatcher &operator=(const Dispatcher &) = delete;

        /**
         * @brief Register a handler for an address pattern
         *
         * The same pattern may be registered several times; every binding fires.
         *
         * @param pattern OSC address pattern, may contain wildcards
         * @param handler Function called for each matching message
         * @return HandlerId usable with removeHandler()
         * @throws InvalidArgumentException if the handler is empty
         */
        HandlerId addHandler(const std::string &pattern, Handler handler);

        /**
         * @brief Remove a previously registered handler
         * @return true if a binding was removed
         */
        bool removeHandler(HandlerId id);

        /**
         * @brief Handler run when a message matches no binding (nullptr clears it)
         */
        void setDefaultHandler(Handler handler);

        /**
         * @brief Number of registered bindings, the default handler excluded
         */
        size_t handlerCount() const;

        /**
         * @brief Start every handler matching the address, in registration order
         * @return Number of handlers started (the default handler included)
         */
        size_t route(const std::string &address, const std::vector<Value> &arguments);

        /**
         * @brief Route a message, or every message of a bundle in element order
         * @return Number of handlers started
         */
        size_t dispatch(const Packet &packet);

        /**
         * @brief Block until all handlers started so far have returned
         */
        void waitForHandlers();

       private:
        void launch(const Handler &handler, const std::string &pattern, const std::string &address,
                    const std::vector<Value> &arguments);
        void reapFinished();

        mutable std::mutex bindingMutex_;
        std::map<HandlerId, HandlerBinding> bindings_;
        Handler defaultHandler_;
        HandlerId nextHandlerId_;

        std::mutex workerMutex_;
        std::list<std::future<void>> workers_;
    };

}  // namespace picoosc
