#pragma once
#include "Device.hpp"
#include <string>
#include <vector>
#include <ctime>

struct DeviceCacheSnapshot {
    static constexpr int kCurrentVersion = 1;

    int version{kCurrentVersion};
    std::time_t lastUpdated{0};
    std::vector<AndroidDevice> androidDevices;
    std::vector<IosDevice> iosDevices;
    std::vector<AvailableDevice> androidDeviceTypes;
    std::vector<ApiTarget> androidTargets;
    std::vector<IosDeviceType> iosDeviceTypes;
    std::vector<IosRuntime> iosRuntimes;

    bool isValid(int maxAgeSeconds, std::time_t now) const;

    json toJson() const;
    static DeviceCacheSnapshot fromJson(const json& j);
};

// Persists device lists and creation catalogs between runs so the first
// screen can be drawn before the SDK tools answer.
class DeviceCacheStore {
public:
    DeviceCacheStore(const std::string& path, int maxAgeSeconds);

    // False when the file is missing, unreadable, stale or of another version
    bool load(DeviceCacheSnapshot& snapshot) const;
    bool save(const DeviceCacheSnapshot& snapshot) const;

    const std::string& getPath() const { return path_; }

    static std::string defaultPath();

private:
    std::string path_;
    int maxAgeSeconds_;
};
