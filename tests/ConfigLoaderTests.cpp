#include <catch2/catch.hpp>

#include "ConfigLoader.hpp"
#include "TestSupport.hpp"

namespace config_loader_tests {

TEST_CASE("Defaults apply when nothing is configured", "[config]") {
    ConfigLoader loader;
    AppConfig config = loader.getConfig();
    CHECK(config.logLevel == "INFO");
    CHECK_FALSE(config.consoleLogging);
    CHECK(config.refreshIntervalMs == 3000);
    CHECK(config.fastRefreshIntervalMs == 1000);
    CHECK(config.bootTimeoutSeconds == 180);
    CHECK(config.commandTimeoutSeconds == 30);
    CHECK(config.cacheMaxAgeSeconds == 300);
    CHECK(config.enableIos);
    CHECK(config.input.navigationBatchMs == 50);
    CHECK(config.input.debounceMs == 8);
    CHECK(config.input.maxBatchSize == 5);
}

TEST_CASE("Present keys override defaults, absent keys keep them", "[config]") {
    ConfigLoader loader;
    REQUIRE(loader.loadFromString(R"({
        "androidHome": "/opt/android-sdk",
        "logLevel": "DEBUG",
        "refreshIntervalMs": 5000,
        "enableIos": false,
        "input": {"debounceMs": 20}
    })"));

    AppConfig config = loader.getConfig();
    CHECK(config.androidHome == "/opt/android-sdk");
    CHECK(config.logLevel == "DEBUG");
    CHECK(config.refreshIntervalMs == 5000);
    CHECK(config.fastRefreshIntervalMs == 1000);
    CHECK_FALSE(config.enableIos);
    CHECK(config.input.debounceMs == 20);
    CHECK(config.input.navigationBatchMs == 50);
    CHECK(loader.resolveAndroidHome() == "/opt/android-sdk");
}

TEST_CASE("Inconsistent values are clamped", "[config]") {
    ConfigLoader loader;
    REQUIRE(loader.loadFromString(R"({
        "refreshIntervalMs": 500,
        "fastRefreshIntervalMs": 2000,
        "input": {"maxBatchSize": 0}
    })"));
    AppConfig config = loader.getConfig();
    CHECK(config.fastRefreshIntervalMs == 500);
    CHECK(config.input.maxBatchSize == 1);
}

TEST_CASE("Malformed configuration is rejected", "[config]") {
    ConfigLoader loader;
    CHECK_FALSE(loader.loadFromString("{ not json"));
    CHECK_FALSE(loader.loadFromString("[1, 2, 3]"));
    CHECK_FALSE(loader.loadFromString(R"({"refreshIntervalMs": "fast"})"));
    CHECK_FALSE(loader.loadFromFile("/nonexistent/emu-config.json"));
}

TEST_CASE("Configuration files are read from disk", "[config]") {
    TempDir dir;
    auto path = dir.path() / "config.json";
    writeFile(path, R"({"avdHome": "/tmp/avds", "cacheFile": "/tmp/cache.json"})");

    ConfigLoader loader;
    REQUIRE(loader.loadFromFile(path.string()));
    CHECK(loader.getConfig().cacheFile == "/tmp/cache.json");
    CHECK(loader.resolveAvdHome() == "/tmp/avds");

    loader.setLogLevel("ERROR");
    loader.setLogFile("/tmp/emu.log");
    CHECK(loader.getConfig().logLevel == "ERROR");
    CHECK(loader.getConfig().logFile == "/tmp/emu.log");
}

} // namespace config_loader_tests
