#include "DeviceCacheStore.hpp"
#include "Logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

template <typename T>
json toJsonArray(const std::vector<T>& items) {
    json array = json::array();
    for (const auto& item : items) {
        array.push_back(item.toJson());
    }
    return array;
}

template <typename T>
std::vector<T> fromJsonArray(const json& j, const char* key) {
    std::vector<T> items;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& entry : j[key]) {
            items.push_back(T::fromJson(entry));
        }
    }
    return items;
}

} // namespace

bool DeviceCacheSnapshot::isValid(int maxAgeSeconds, std::time_t now) const {
    if (version != kCurrentVersion) {
        return false;
    }
    return now >= lastUpdated && (now - lastUpdated) < maxAgeSeconds;
}

json DeviceCacheSnapshot::toJson() const {
    json j;
    j["version"] = version;
    j["lastUpdated"] = static_cast<long long>(lastUpdated);
    j["androidDevices"] = toJsonArray(androidDevices);
    j["iosDevices"] = toJsonArray(iosDevices);
    j["androidDeviceTypes"] = toJsonArray(androidDeviceTypes);
    j["androidTargets"] = toJsonArray(androidTargets);
    j["iosDeviceTypes"] = toJsonArray(iosDeviceTypes);
    j["iosRuntimes"] = toJsonArray(iosRuntimes);
    return j;
}

DeviceCacheSnapshot DeviceCacheSnapshot::fromJson(const json& j) {
    DeviceCacheSnapshot snapshot;
    snapshot.version = j.value("version", 0);
    snapshot.lastUpdated = static_cast<std::time_t>(j.value("lastUpdated", 0LL));
    snapshot.androidDevices = fromJsonArray<AndroidDevice>(j, "androidDevices");
    snapshot.iosDevices = fromJsonArray<IosDevice>(j, "iosDevices");
    snapshot.androidDeviceTypes = fromJsonArray<AvailableDevice>(j, "androidDeviceTypes");
    snapshot.androidTargets = fromJsonArray<ApiTarget>(j, "androidTargets");
    snapshot.iosDeviceTypes = fromJsonArray<IosDeviceType>(j, "iosDeviceTypes");
    snapshot.iosRuntimes = fromJsonArray<IosRuntime>(j, "iosRuntimes");
    return snapshot;
}

DeviceCacheStore::DeviceCacheStore(const std::string& path, int maxAgeSeconds)
    : path_(path), maxAgeSeconds_(maxAgeSeconds) {
}

std::string DeviceCacheStore::defaultPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    fs::path base;
    if (xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME")) {
        base = fs::path(home) / ".config";
    } else {
        base = ".";
    }
    return (base / "emu" / "cache" / "devices.json").string();
}

bool DeviceCacheStore::load(DeviceCacheSnapshot& snapshot) const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        LOG_DEBUG("No device cache at " + path_);
        return false;
    }

    try {
        json j;
        file >> j;
        DeviceCacheSnapshot loaded = DeviceCacheSnapshot::fromJson(j);
        if (!loaded.isValid(maxAgeSeconds_, std::time(nullptr))) {
            LOG_INFO("Device cache is stale, ignoring: " + path_);
            return false;
        }
        snapshot = loaded;
        return true;
    } catch (const std::exception& e) {
        LOG_WARNING("Error reading device cache " + path_ + ": " + std::string(e.what()));
        return false;
    }
}

bool DeviceCacheStore::save(const DeviceCacheSnapshot& snapshot) const {
    try {
        fs::path target(path_);
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path());
        }

        std::string tmpPath = path_ + ".tmp";
        {
            std::ofstream file(tmpPath, std::ios::trunc);
            if (!file.is_open()) {
                LOG_WARNING("Cannot write device cache: " + tmpPath);
                return false;
            }
            file << snapshot.toJson().dump(2);
        }
        fs::rename(tmpPath, target);
        LOG_DEBUG("Device cache saved to " + path_);
        return true;
    } catch (const std::exception& e) {
        LOG_WARNING("Failed to save device cache: " + std::string(e.what()));
        return false;
    }
}
