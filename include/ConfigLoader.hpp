#pragma once
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct InputConfig {
    int navigationBatchMs;
    int debounceMs;
    int maxBatchSize;
};

struct AppConfig {
    std::string androidHome;
    std::string avdHome;
    std::string logFile;
    std::string logLevel;
    bool consoleLogging;
    int refreshIntervalMs;
    int fastRefreshIntervalMs;
    int bootTimeoutSeconds;
    int commandTimeoutSeconds;
    std::string cacheFile;
    int cacheMaxAgeSeconds;
    bool enableIos;
    InputConfig input;
};

class ConfigLoader {
public:
    ConfigLoader();
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& content);
    AppConfig getConfig() const;

    // Command line overrides
    void setLogLevel(const std::string& level) { config_.logLevel = level; }
    void setLogFile(const std::string& file) { config_.logFile = file; }

    // androidHome from the config, then ANDROID_HOME, then ANDROID_SDK_ROOT.
    // Empty when none is set.
    std::string resolveAndroidHome() const;
    // avdHome from the config, then ANDROID_AVD_HOME, then ~/.android/avd
    std::string resolveAvdHome() const;

private:
    AppConfig config_;
    void setDefaults();
    bool loadAppConfig(const json& jsonConfig);
};
