/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the Registry class.
 */

#include "picoosc/Registry.h"

#include <chrono>
#include <csignal>
#include <thread>

#include "picoosc/Exceptions.h"

namespace picoosc {
    namespace {
        // Set from the signal handler installed by Registry::wait()
        std::atomic<bool> g_signalReceived(false);

        void signalHandler(int) { g_signalReceived.store(true); }

        constexpr std::chrono::milliseconds kWaitPollInterval(100);
    }  // namespace

    Registry::Registry(ServerOptions options) : options_(options), shutdownRequested_(false) {}

    // Handlers may still be using the registry, so they must finish before any
    // member is destroyed
    Registry::~Registry() {
        stopAll();

        std::vector<std::shared_ptr<Dispatcher>> dispatchers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &pair : dispatchers_) {
                dispatchers.push_back(pair.second);
            }
        }
        for (auto &dispatcher : dispatchers) {
            dispatcher->waitForHandlers();
        }
    }

    HandlerId Registry::onReceive(const Endpoint &endpoint, const std::string &pattern,
                                  Handler handler) {
        HandlerId id = dispatcher(endpoint)->addHandler(pattern, std::move(handler));
        PICOOSC_LOG_DEBUG("Bound %s on %s", pattern.c_str(), endpoint.url().c_str());
        return id;
    }

    std::vector<HandlerId> Registry::onReceive(const Endpoint &endpoint,
                                               const std::vector<std::string> &patterns,
                                               Handler handler) {
        if (patterns.empty()) {
            throw InvalidArgumentException("At least one address pattern is required for " +
                                           endpoint.url());
        }

        std::vector<HandlerId> ids;
        for (const auto &pattern : patterns) {
            ids.push_back(onReceive(endpoint, pattern, handler));
        }
        return ids;
    }

    std::vector<HandlerId> Registry::onReceive(const Endpoint &endpoint,
                                               std::initializer_list<std::string> patterns,
                                               Handler handler) {
        return onReceive(endpoint, std::vector<std::string>(patterns), std::move(handler));
    }

    std::shared_ptr<Dispatcher> Registry::dispatcher(const Endpoint &endpoint) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto &entry = dispatchers_[endpoint];
        if (!entry) {
            entry = std::make_shared<Dispatcher>();
        }
        return entry;
    }

    std::vector<Endpoint> Registry::endpoints() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<Endpoint> result;
        for (const auto &pair : dispatchers_) {
            result.push_back(pair.first);
        }
        return result;
    }

    std::shared_ptr<Server> Registry::server(const Endpoint &endpoint) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = servers_.find(endpoint);
        return it != servers_.end() ? it->second : nullptr;
    }

    // Start servers for every endpoint
    size_t Registry::startAll(bool blocking) {
        size_t running = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdownRequested_ = false;

            for (const auto &pair : dispatchers_) {
                const Endpoint &endpoint = pair.first;

                // Stopped servers cannot restart, so they are replaced
                auto &server = servers_[endpoint];
                try {
                    if (!server || server->state() == ServerState::Stopped) {
                        server = std::make_shared<Server>(endpoint, pair.second, options_);
                    }
                    server->start();
                    ++running;
                } catch (const OSCException &e) {
                    PICOOSC_LOG_ERROR("Failed to start server on %s: %s", endpoint.url().c_str(),
                                      e.what());
                }
            }
        }

        if (blocking) {
            wait();
        }

        return running;
    }

    void Registry::wait() {
        g_signalReceived = false;
        auto previousInt = std::signal(SIGINT, signalHandler);
        auto previousTerm = std::signal(SIGTERM, signalHandler);

        while (!shutdownRequested_ && !g_signalReceived) {
            std::this_thread::sleep_for(kWaitPollInterval);
        }

        if (g_signalReceived) {
            PICOOSC_LOG_INFO("Shutdown requested by signal");
        }

        std::signal(SIGINT, previousInt == SIG_ERR ? SIG_DFL : previousInt);
        std::signal(SIGTERM, previousTerm == SIG_ERR ? SIG_DFL : previousTerm);
    }

    void Registry::shutdown() { shutdownRequested_ = true; }

    void Registry::stopAll() {
        std::map<Endpoint, std::shared_ptr<Server>> servers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            servers = servers_;
        }

        for (auto &pair : servers) {
            if (pair.second) {
                pair.second->stop();
            }
        }
    }

    size_t Registry::runningCount() const {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t running = 0;
        for (const auto &pair : servers_) {
            if (pair.second && pair.second->isRunning()) {
                ++running;
            }
        }
        return running;
    }

}  // namespace picoosc
