#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "picoosc/Config.h"
#include "picoosc/Exceptions.h"

using namespace picoosc;

TEST(Config, Defaults) {
    Config config = Config::fromJsonString("{}");
    EXPECT_EQ(config.getLogLevel(), LogLevel::Warning);
    EXPECT_TRUE(config.getLogFile().empty());
    EXPECT_EQ(config.getServerOptions().pollInterval, std::chrono::milliseconds(100));
    EXPECT_EQ(config.getServerOptions().receiveBufferSize, 65536u);
    EXPECT_FALSE(config.getServerOptions().reuseAddress);
    EXPECT_TRUE(config.getListenEndpoints().empty());
    EXPECT_TRUE(config.getTargets().empty());
}

TEST(Config, ParsesAllKeys) {
    const std::string json = R"({
        "logLevel": "debug",
        "logFile": "picoosc.log",
        "server": { "pollIntervalMs": 25, "receiveBufferSize": 2048, "reuseAddress": true },
        "listen": [ { "host": "127.0.0.1", "port": 19994 }, { "port": 0 } ],
        "targets": [ { "host": "localhost", "port": 9000 } ],
        "somethingElse": 1
    })";

    Config config = Config::fromJsonString(json);
    EXPECT_EQ(config.getLogLevel(), LogLevel::Debug);
    EXPECT_EQ(config.getLogFile(), "picoosc.log");
    EXPECT_EQ(config.getServerOptions().pollInterval, std::chrono::milliseconds(25));
    EXPECT_EQ(config.getServerOptions().receiveBufferSize, 2048u);
    EXPECT_TRUE(config.getServerOptions().reuseAddress);

    ASSERT_EQ(config.getListenEndpoints().size(), 2u);
    EXPECT_EQ(config.getListenEndpoints()[0], Endpoint("127.0.0.1", 19994));
    EXPECT_EQ(config.getListenEndpoints()[1], Endpoint("", 0));

    ASSERT_EQ(config.getTargets().size(), 1u);
    EXPECT_EQ(config.getTargets()[0], Endpoint("localhost", 9000));
}

TEST(Config, InvalidDocuments) {
    EXPECT_THROW(Config::fromJsonString("not json"), ConfigException);
    EXPECT_THROW(Config::fromJsonString("[1, 2]"), ConfigException);
    EXPECT_THROW(Config::fromJsonString(R"({"logLevel": "loud"})"), ConfigException);
    EXPECT_THROW(Config::fromJsonString(R"({"logLevel": 3})"), ConfigException);
    EXPECT_THROW(Config::fromJsonString(R"({"server": {"pollIntervalMs": 0}})"), ConfigException);
    EXPECT_THROW(Config::fromJsonString(R"({"server": {"reuseAddress": "yes"}})"), ConfigException);
    EXPECT_THROW(Config::fromJsonString(R"({"listen": {"port": 1}})"), ConfigException);
    EXPECT_THROW(Config::fromJsonString(R"({"listen": [{"host": "a"}]})"), ConfigException);
    EXPECT_THROW(Config::fromJsonString(R"({"listen": [{"port": 70000}]})"), ConfigException);
    EXPECT_THROW(Config::fromJsonString(R"({"targets": [{"port": -1}]})"), ConfigException);
    EXPECT_THROW(Config::fromJsonString(R"({"targets": [{"port": "80"}]})"), ConfigException);
}

TEST(Config, JsonRoundTrip) {
    Config config;
    config.setLogLevel(LogLevel::Info);
    config.setLogFile("out.log");
    ServerOptions options;
    options.pollInterval = std::chrono::milliseconds(50);
    options.reuseAddress = true;
    config.setServerOptions(options);
    config.addListenEndpoint(Endpoint("0.0.0.0", 7000));
    config.addTarget(Endpoint("192.168.1.20", 7001));

    Config parsed = Config::fromJsonString(config.toJsonString());
    EXPECT_EQ(parsed.getLogLevel(), LogLevel::Info);
    EXPECT_EQ(parsed.getLogFile(), "out.log");
    EXPECT_EQ(parsed.getServerOptions().pollInterval, std::chrono::milliseconds(50));
    EXPECT_TRUE(parsed.getServerOptions().reuseAddress);
    ASSERT_EQ(parsed.getListenEndpoints().size(), 1u);
    EXPECT_EQ(parsed.getListenEndpoints()[0], Endpoint("0.0.0.0", 7000));
    ASSERT_EQ(parsed.getTargets().size(), 1u);
    EXPECT_EQ(parsed.getTargets()[0], Endpoint("192.168.1.20", 7001));
}

TEST(Config, LoadFromFile) {
    EXPECT_THROW(Config::loadFromFile("/nonexistent/picoosc.json"), ConfigException);

    std::string path = ::testing::TempDir() + "picoosc_config_test.json";
    Config config;
    config.addTarget(Endpoint("127.0.0.1", 19994));
    ASSERT_TRUE(config.saveToFile(path));

    Config loaded = Config::loadFromFile(path);
    ASSERT_EQ(loaded.getTargets().size(), 1u);
    EXPECT_EQ(loaded.getTargets()[0].port, 19994);

    std::remove(path.c_str());
}

TEST(Config, ApplyLogging) {
    LogLevel previous = getLogLevel();

    Config config = Config::fromJsonString(R"({"logLevel": "error"})");
    config.applyLogging();
    EXPECT_EQ(getLogLevel(), LogLevel::Error);

    Config badFile;
    badFile.setLogFile("/nonexistent/dir/picoosc.log");
    EXPECT_THROW(badFile.applyLogging(), ConfigException);

    shutdownLogging();
    setLogLevel(previous);
}
