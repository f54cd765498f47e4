#pragma once
#include <string>
#include <vector>
#include <map>
#include <variant>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class DeviceStatus {
    Unknown,
    Creating,
    Starting,
    Running,
    Stopping,
    Stopped,
    Error
};

enum class Platform {
    Android,
    Ios
};

std::string statusToString(DeviceStatus status);
std::string platformToString(Platform platform);

// API level used when no parsing strategy could resolve one
constexpr int kInvalidApiLevel = 0;

struct AndroidDevice {
    std::string name;            // AVD name, also the identifier
    std::string deviceType;      // hardware profile, e.g. "pixel_7"
    int apiLevel{kInvalidApiLevel};
    std::string target;          // raw "Target:" text from avdmanager
    std::string tagAbi;
    std::string path;
    std::string category{"phone"};
    DeviceStatus status{DeviceStatus::Stopped};
    bool isRunning{false};
    std::string ramSize{"2048"};
    std::string storageSize{"8192M"};

    json toJson() const;
    static AndroidDevice fromJson(const json& j);
};

struct IosDevice {
    std::string name;            // "<name> (iOS <version>)"
    std::string udid;
    std::string deviceType;      // deviceTypeIdentifier
    std::string iosVersion;
    std::string runtimeVersion;  // runtime key, e.g. com.apple.CoreSimulator.SimRuntime.iOS-17-0
    DeviceStatus status{DeviceStatus::Unknown};
    bool isRunning{false};
    bool isAvailable{false};

    json toJson() const;
    static IosDevice fromJson(const json& j);
};

using Device = std::variant<AndroidDevice, IosDevice>;

const std::string& deviceName(const Device& device);
const std::string& deviceIdentifier(const Device& device);
DeviceStatus deviceStatus(const Device& device);
bool deviceIsRunning(const Device& device);
Platform devicePlatform(const Device& device);

// Keeps isRunning in step with status
void setStatus(AndroidDevice& device, DeviceStatus status);
void setStatus(IosDevice& device, DeviceStatus status);
void setStatus(Device& device, DeviceStatus status);

struct DeviceConfig {
    std::string name;
    std::string deviceType;
    std::string version;         // API level for Android, runtime identifier for iOS
    std::string ramSize;         // MB, empty for tool default
    std::string storageSize;     // MB, empty for tool default
    std::map<std::string, std::string> additionalOptions;
};

struct DeviceDetails {
    std::string name;
    std::string identifier;
    Platform platform{Platform::Android};
    std::string status;
    std::string version;         // "API 34 (Android 14)" or "17.0"
    std::string deviceType;
    std::string ramSize;
    std::string storageSize;
    std::string resolution;
    std::string dpi;
    std::string devicePath;
    std::string systemImage;
};

// Creation catalogs

struct AvailableDevice {
    std::string id;
    std::string displayName;
    std::string oem;
    std::string category;

    json toJson() const;
    static AvailableDevice fromJson(const json& j);
};

struct SystemImage {
    std::string packageId;       // system-images;android-34;google_apis;x86_64
    int apiLevel{kInvalidApiLevel};
    std::string tag;
    std::string abi;
};

struct ApiTarget {
    int apiLevel{kInvalidApiLevel};
    std::string display;         // "API 34 - Android 14"

    json toJson() const;
    static ApiTarget fromJson(const json& j);
};

struct ApiLevelInfo {
    int apiLevel{kInvalidApiLevel};
    std::string versionName;
    std::string packageId;
    bool installed{false};
};

struct IosDeviceType {
    std::string identifier;
    std::string name;

    json toJson() const;
    static IosDeviceType fromJson(const json& j);
};

struct IosRuntime {
    std::string identifier;
    std::string name;
    std::string version;

    json toJson() const;
    static IosRuntime fromJson(const json& j);
};
