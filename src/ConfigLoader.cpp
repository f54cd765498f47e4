#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include <cstdlib>
#include <fstream>

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::string();
}

} // namespace

ConfigLoader::ConfigLoader() {
    setDefaults();
}

bool ConfigLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_WARNING("Config file not found: " + filename + ", using defaults");
        return false;
    }

    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            LOG_ERROR("Unknown configuration file format: " + filename);
            return false;
        }
        return loadAppConfig(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing config file: " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadFromString(const std::string& content) {
    try {
        json j = json::parse(content);
        if (!j.is_object()) {
            LOG_ERROR("Configuration must be a JSON object");
            return false;
        }
        return loadAppConfig(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing config: " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadAppConfig(const json& j) {
    if (j.contains("androidHome")) {
        config_.androidHome = j["androidHome"].get<std::string>();
    }
    if (j.contains("avdHome")) {
        config_.avdHome = j["avdHome"].get<std::string>();
    }
    if (j.contains("logFile")) {
        config_.logFile = j["logFile"].get<std::string>();
    }
    if (j.contains("logLevel")) {
        config_.logLevel = j["logLevel"].get<std::string>();
    }
    if (j.contains("consoleLogging")) {
        config_.consoleLogging = j["consoleLogging"].get<bool>();
    }
    if (j.contains("refreshIntervalMs")) {
        config_.refreshIntervalMs = j["refreshIntervalMs"].get<int>();
    }
    if (j.contains("fastRefreshIntervalMs")) {
        config_.fastRefreshIntervalMs = j["fastRefreshIntervalMs"].get<int>();
    }
    if (j.contains("bootTimeoutSeconds")) {
        config_.bootTimeoutSeconds = j["bootTimeoutSeconds"].get<int>();
    }
    if (j.contains("commandTimeoutSeconds")) {
        config_.commandTimeoutSeconds = j["commandTimeoutSeconds"].get<int>();
    }
    if (j.contains("cacheFile")) {
        config_.cacheFile = j["cacheFile"].get<std::string>();
    }
    if (j.contains("cacheMaxAgeSeconds")) {
        config_.cacheMaxAgeSeconds = j["cacheMaxAgeSeconds"].get<int>();
    }
    if (j.contains("enableIos")) {
        config_.enableIos = j["enableIos"].get<bool>();
    }
    if (j.contains("input")) {
        auto inputCfg = j["input"];
        if (inputCfg.contains("navigationBatchMs")) {
            config_.input.navigationBatchMs = inputCfg["navigationBatchMs"].get<int>();
        }
        if (inputCfg.contains("debounceMs")) {
            config_.input.debounceMs = inputCfg["debounceMs"].get<int>();
        }
        if (inputCfg.contains("maxBatchSize")) {
            config_.input.maxBatchSize = inputCfg["maxBatchSize"].get<int>();
        }
    }

    if (config_.fastRefreshIntervalMs > config_.refreshIntervalMs) {
        LOG_WARNING("fastRefreshIntervalMs is larger than refreshIntervalMs, clamping");
        config_.fastRefreshIntervalMs = config_.refreshIntervalMs;
    }
    if (config_.input.maxBatchSize < 1) {
        LOG_WARNING("maxBatchSize must be at least 1, using 1");
        config_.input.maxBatchSize = 1;
    }

    LOG_INFO("Configuration loaded successfully");
    return true;
}

AppConfig ConfigLoader::getConfig() const {
    return config_;
}

std::string ConfigLoader::resolveAndroidHome() const {
    if (!config_.androidHome.empty()) {
        return config_.androidHome;
    }
    std::string home = envOrEmpty("ANDROID_HOME");
    if (!home.empty()) {
        return home;
    }
    return envOrEmpty("ANDROID_SDK_ROOT");
}

std::string ConfigLoader::resolveAvdHome() const {
    if (!config_.avdHome.empty()) {
        return config_.avdHome;
    }
    std::string avdHome = envOrEmpty("ANDROID_AVD_HOME");
    if (!avdHome.empty()) {
        return avdHome;
    }
    std::string home = envOrEmpty("HOME");
    return home.empty() ? std::string(".android/avd") : home + "/.android/avd";
}

void ConfigLoader::setDefaults() {
    config_.androidHome = "";
    config_.avdHome = "";
    config_.logFile = "";
    config_.logLevel = "INFO";
    config_.consoleLogging = false;
    config_.refreshIntervalMs = 3000;
    config_.fastRefreshIntervalMs = 1000;
    config_.bootTimeoutSeconds = 180;
    config_.commandTimeoutSeconds = 30;
    config_.cacheFile = "";
    config_.cacheMaxAgeSeconds = 300;
    config_.enableIos = true;
    config_.input.navigationBatchMs = 50;
    config_.input.debounceMs = 8;
    config_.input.maxBatchSize = 5;
}
