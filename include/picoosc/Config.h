/*
 *  PicoOSC - Open Sound Control over UDP.
 *  JSON configuration for servers, send targets and logging.
 */

#pragma once

#include <string>
#include <vector>

#include "picoosc/Endpoint.h"
#include "picoosc/Logging.h"
#include "picoosc/Server.h"

namespace picoosc {

    /**
     * @brief Settings loaded from a JSON document
     *
     * Recognised keys, all optional:
     *
     * @code
     * {
     *   "logLevel": "info",
     *   "logFile": "picoosc.log",
     *   "server": { "pollIntervalMs": 100, "receiveBufferSize": 65536, "reuseAddress": false },
     *   "listen": [ { "host": "127.0.0.1", "port": 19994 } ],
     *   "targets": [ { "host": "127.0.0.1", "port": 19994 } ]
     * }
     * @endcode
     *
     * Unknown keys are ignored.
     */
    class Config {
       public:
        Config();

        /**
         * @brief Parse a configuration from a JSON string
         * @throws ConfigException on malformed JSON, wrong value types or invalid ports
         */
        static Config fromJsonString(const std::string &jsonStr);

        /**
         * @brief Read and parse a configuration file
         * @throws ConfigException if the file cannot be read or parsed
         */
        static Config loadFromFile(const std::string &filePath);

        /**
         * @brief Serialize to JSON in the same shape fromJsonString() accepts
         */
        std::string toJsonString() const;

        /**
         * @brief Write toJsonString() to a file
         * @return true on success
         */
        bool saveToFile(const std::string &filePath) const;

        /**
         * @brief Apply the log level, opening the log file if one is set
         * @throws ConfigException if the log file cannot be opened
         */
        void applyLogging() const;

        LogLevel getLogLevel() const { return m_logLevel; }
        void setLogLevel(LogLevel level) { m_logLevel = level; }

        const std::string &getLogFile() const { return m_logFile; }
        void setLogFile(const std::string &path) { m_logFile = path; }

        const ServerOptions &getServerOptions() const { return m_serverOptions; }
        void setServerOptions(const ServerOptions &options) { m_serverOptions = options; }

        const std::vector<Endpoint> &getListenEndpoints() const { return m_listen; }
        void addListenEndpoint(const Endpoint &endpoint) { m_listen.push_back(endpoint); }

        const std::vector<Endpoint> &getTargets() const { return m_targets; }
        void addTarget(const Endpoint &endpoint) { m_targets.push_back(endpoint); }

       private:
        LogLevel m_logLevel;
        std::string m_logFile;
        ServerOptions m_serverOptions;
        std::vector<Endpoint> m_listen;
        std::vector<Endpoint> m_targets;
    };

}  // namespace picoosc
