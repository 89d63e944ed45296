/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the Dispatcher class, which
 * routes messages to the handlers bound to matching patterns.
 */

#include "picoosc/Dispatcher.h"

#include <chrono>

#include "picoosc/AddressMatcher.h"
#include "picoosc/Exceptions.h"
#include "picoosc/Logging.h"

namespace picoosc {

    Dispatcher::Dispatcher() : nextHandlerId_(1) {}

    Dispatcher::~Dispatcher() { waitForHandlers(); }

    // Add a handler binding
    HandlerId Dispatcher::addHandler(const std::string &pattern, Handler handler) {
        if (!handler) {
            throw InvalidArgumentException("Empty handler for pattern '" + pattern + "'");
        }

        std::lock_guard<std::mutex> lock(bindingMutex_);

        HandlerId id = nextHandlerId_++;
        bindings_[id] = HandlerBinding{id, pattern, std::move(handler)};
        return id;
    }

    // Remove a handler binding
    bool Dispatcher::removeHandler(HandlerId id) {
        std::lock_guard<std::mutex> lock(bindingMutex_);
        return bindings_.erase(id) > 0;
    }

    void Dispatcher::setDefaultHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(bindingMutex_);
        defaultHandler_ = std::move(handler);
    }

    size_t Dispatcher::handlerCount() const {
        std::lock_guard<std::mutex> lock(bindingMutex_);
        return bindings_.size();
    }

    // Route one message to all matching handlers
    size_t Dispatcher::route(const std::string &address, const std::vector<Value> &arguments) {
        // Snapshot the matches so handlers run without holding the binding lock;
        // ids increase monotonically so map order is registration order
        std::vector<HandlerBinding> matched;
        Handler fallback;
        {
            std::lock_guard<std::mutex> lock(bindingMutex_);
            for (const auto &pair : bindings_) {
                if (AddressMatcher::matches(pair.second.pattern, address)) {
                    matched.push_back(pair.second);
                }
            }
            if (matched.empty()) {
                fallback = defaultHandler_;
            }
        }

        reapFinished();

        if (matched.empty()) {
            if (fallback) {
                launch(fallback, "<default>", address, arguments);
                return 1;
            }
            PICOOSC_LOG_DEBUG("No handler for %s", address.c_str());
            return 0;
        }

        for (const auto &binding : matched) {
            launch(binding.handler, binding.pattern, address, arguments);
        }
        return matched.size();
    }

    // Route a message or the messages of a bundle
    size_t Dispatcher::dispatch(const Packet &packet) {
        if (const auto *message = std::get_if<Message>(&packet)) {
            return route(message->getAddress(), message->getArguments());
        }

        size_t started = 0;
        std::get<Bundle>(packet).forEach(
            [this, &started](const Message &message) {
                started += route(message.getAddress(), message.getArguments());
            });
        return started;
    }

    void Dispatcher::waitForHandlers() {
        std::list<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(workerMutex_);
            pending.swap(workers_);
        }

        for (auto &worker : pending) {
            worker.wait();
        }
    }

    // Run one handler on its own thread, isolating any exception it throws
    void Dispatcher::launch(const Handler &handler, const std::string &pattern,
                            const std::string &address, const std::vector<Value> &arguments) {
        auto worker = std::async(std::launch::async, [handler, pattern, address, arguments]() {
            try {
                handler(address, arguments);
            } catch (const std::exception &e) {
                PICOOSC_LOG_ERROR("Exception in handler for %s (pattern %s): %s", address.c_str(),
                                  pattern.c_str(), e.what());
            } catch (...) {
                PICOOSC_LOG_ERROR("Unknown exception in handler for %s (pattern %s)",
                                  address.c_str(), pattern.c_str());
            }
        });

        std::lock_guard<std::mutex> lock(workerMutex_);
        workers_.push_back(std::move(worker));
    }

    // Drop futures of handlers that already returned
    void Dispatcher::reapFinished() {
        std::lock_guard<std::mutex> lock(workerMutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

}  // namespace picoosc
