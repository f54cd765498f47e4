#pragma once
#include "Device.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <utility>

// Lower values sort first.
int calculateAndroidDevicePriority(const std::string& deviceId, const std::string& displayName);
int calculateIosDevicePriority(const std::string& displayName);

// Marketing name for an API level, "API <n>" outside the known table
std::string androidVersionName(int apiLevel);

// Maps "Android 14" style version numbers to their API level, 0 when unknown
int apiLevelFromAndroidVersion(const std::string& version);

// Words of a display name outside parentheses, at most three
std::vector<std::string> parseDeviceNameParts(const std::string& displayName);

std::string getDeviceCategory(const std::string& deviceId, const std::string& displayName);

class DevicePriorityCache {
public:
    static DevicePriorityCache& getInstance();

    int androidPriority(const std::string& deviceId, const std::string& displayName);
    int iosPriority(const std::string& displayName);

    void loadDeviceCatalog(const std::vector<AvailableDevice>& devices);

    // Catalog lookup by id; ids never loaded return 0
    int catalogPriority(const std::string& deviceId);

    std::vector<std::string> parseDeviceName(const std::string& deviceType);

    void clear();
    size_t size();

private:
    DevicePriorityCache() = default;
    ~DevicePriorityCache() = default;
    DevicePriorityCache(const DevicePriorityCache&) = delete;
    DevicePriorityCache& operator=(const DevicePriorityCache&) = delete;

    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, int> androidCache_;
    std::map<std::string, int> iosCache_;
    std::map<std::string, AvailableDevice> catalog_;
};
