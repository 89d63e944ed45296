/*
 * PicoOSC - Open Sound Control over UDP.
 * This file contains the implementation of the Config class, which loads
 * and saves JSON configuration.
 */

#include "picoosc/Config.h"

#include <cctype>
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "picoosc/Exceptions.h"

using json = nlohmann::json;

namespace picoosc {
    namespace {

        Endpoint parseEndpoint(const json &j, const std::string &section) {
            if (!j.is_object()) {
                throw ConfigException("Entries of '" + section + "' must be objects");
            }

            Endpoint endpoint;
            if (j.contains("host")) {
                endpoint.host = j["host"].get<std::string>();
            }

            if (!j.contains("port")) {
                throw ConfigException("Entry of '" + section + "' is missing 'port'");
            }
            const json &port = j["port"];
            if (!port.is_number_integer()) {
                throw ConfigException("Port in '" + section + "' must be an integer");
            }
            auto value = port.get<long long>();
            if (value < 0 || value > 65535) {
                throw ConfigException("Port " + std::to_string(value) + " in '" + section +
                                      "' is out of range");
            }
            endpoint.port = static_cast<uint16_t>(value);

            return endpoint;
        }

        std::vector<Endpoint> parseEndpointList(const json &j, const std::string &section) {
            if (!j.is_array()) {
                throw ConfigException("'" + section + "' must be an array");
            }

            std::vector<Endpoint> endpoints;
            for (const auto &entry : j) {
                endpoints.push_back(parseEndpoint(entry, section));
            }
            return endpoints;
        }

        json endpointListToJson(const std::vector<Endpoint> &endpoints) {
            json list = json::array();
            for (const auto &endpoint : endpoints) {
                json e;
                e["host"] = endpoint.host;
                e["port"] = endpoint.port;
                list.push_back(e);
            }
            return list;
        }

        std::string lowercaseLevelName(LogLevel level) {
            std::string name = logLevelName(level);
            for (auto &c : name) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return name;
        }

    }  // namespace

    Config::Config() : m_logLevel(LogLevel::Warning) {}

    Config Config::fromJsonString(const std::string &jsonStr) {
        Config config;
        try {
            json j = json::parse(jsonStr);
            if (!j.is_object()) {
                throw ConfigException("Configuration root must be a JSON object");
            }

            if (j.contains("logLevel")) {
                try {
                    config.setLogLevel(logLevelFromString(j["logLevel"].get<std::string>()));
                } catch (const InvalidArgumentException &e) {
                    throw ConfigException(e.what());
                }
            }

            if (j.contains("logFile")) config.setLogFile(j["logFile"].get<std::string>());

            if (j.contains("server")) {
                const json &server = j["server"];
                if (!server.is_object()) {
                    throw ConfigException("'server' must be an object");
                }

                ServerOptions options;
                if (server.contains("pollIntervalMs")) {
                    auto interval = server["pollIntervalMs"].get<long long>();
                    if (interval <= 0) {
                        throw ConfigException("'pollIntervalMs' must be positive");
                    }
                    options.pollInterval = std::chrono::milliseconds(interval);
                }
                if (server.contains("receiveBufferSize")) {
                    auto size = server["receiveBufferSize"].get<long long>();
                    if (size <= 0) {
                        throw ConfigException("'receiveBufferSize' must be positive");
                    }
                    options.receiveBufferSize = static_cast<size_t>(size);
                }
                if (server.contains("reuseAddress")) {
                    options.reuseAddress = server["reuseAddress"].get<bool>();
                }
                config.setServerOptions(options);
            }

            if (j.contains("listen")) {
                for (const auto &endpoint : parseEndpointList(j["listen"], "listen")) {
                    config.addListenEndpoint(endpoint);
                }
            }

            if (j.contains("targets")) {
                for (const auto &endpoint : parseEndpointList(j["targets"], "targets")) {
                    config.addTarget(endpoint);
                }
            }
        } catch (const json::exception &e) {
            throw ConfigException(std::string("JSON parsing error: ") + e.what());
        }

        return config;
    }

    Config Config::loadFromFile(const std::string &filePath) {
        std::ifstream file(filePath);
        if (!file.is_open()) {
            throw ConfigException("Failed to open configuration file: " + filePath);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        try {
            return fromJsonString(buffer.str());
        } catch (const ConfigException &e) {
            throw ConfigException(filePath + ": " + e.what());
        }
    }

    std::string Config::toJsonString() const {
        json j;

        j["logLevel"] = lowercaseLevelName(m_logLevel);
        j["logFile"] = m_logFile;

        json server;
        server["pollIntervalMs"] = m_serverOptions.pollInterval.count();
        server["receiveBufferSize"] = m_serverOptions.receiveBufferSize;
        server["reuseAddress"] = m_serverOptions.reuseAddress;
        j["server"] = server;

        j["listen"] = endpointListToJson(m_listen);
        j["targets"] = endpointListToJson(m_targets);

        return j.dump(4);
    }

    bool Config::saveToFile(const std::string &filePath) const {
        std::ofstream file(filePath);
        if (!file.is_open()) {
            PICOOSC_LOG_ERROR("Failed to open file for writing: %s", filePath.c_str());
            return false;
        }

        file << toJsonString() << std::endl;
        return file.good();
    }

    void Config::applyLogging() const {
        if (!m_logFile.empty() && !initLogging(m_logFile, m_logLevel == LogLevel::Debug)) {
            throw ConfigException("Failed to open log file: " + m_logFile);
        }
        picoosc::setLogLevel(m_logLevel);
    }

}  // namespace picoosc
