#include "Device.hpp"

std::string statusToString(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Unknown: return "Unknown";
        case DeviceStatus::Creating: return "Creating";
        case DeviceStatus::Starting: return "Starting";
        case DeviceStatus::Running: return "Running";
        case DeviceStatus::Stopping: return "Stopping";
        case DeviceStatus::Stopped: return "Stopped";
        case DeviceStatus::Error: return "Error";
        default: return "Unknown";
    }
}

std::string platformToString(Platform platform) {
    return platform == Platform::Android ? "Android" : "iOS";
}

namespace {

DeviceStatus statusFromString(const std::string& value) {
    for (DeviceStatus status : {DeviceStatus::Creating, DeviceStatus::Starting, DeviceStatus::Running,
                                DeviceStatus::Stopping, DeviceStatus::Stopped, DeviceStatus::Error}) {
        if (statusToString(status) == value) {
            return status;
        }
    }
    return DeviceStatus::Unknown;
}

} // namespace

json AndroidDevice::toJson() const {
    json j;
    j["name"] = name;
    j["deviceType"] = deviceType;
    j["apiLevel"] = apiLevel;
    j["target"] = target;
    j["tagAbi"] = tagAbi;
    j["path"] = path;
    j["category"] = category;
    j["status"] = statusToString(status);
    j["ramSize"] = ramSize;
    j["storageSize"] = storageSize;
    return j;
}

AndroidDevice AndroidDevice::fromJson(const json& j) {
    AndroidDevice device;
    device.name = j.value("name", "");
    device.deviceType = j.value("deviceType", "");
    device.apiLevel = j.value("apiLevel", kInvalidApiLevel);
    device.target = j.value("target", "");
    device.tagAbi = j.value("tagAbi", "");
    device.path = j.value("path", "");
    device.category = j.value("category", "phone");
    device.ramSize = j.value("ramSize", "2048");
    device.storageSize = j.value("storageSize", "8192M");
    setStatus(device, statusFromString(j.value("status", "Stopped")));
    return device;
}

json IosDevice::toJson() const {
    json j;
    j["name"] = name;
    j["udid"] = udid;
    j["deviceType"] = deviceType;
    j["iosVersion"] = iosVersion;
    j["runtimeVersion"] = runtimeVersion;
    j["status"] = statusToString(status);
    j["isAvailable"] = isAvailable;
    return j;
}

IosDevice IosDevice::fromJson(const json& j) {
    IosDevice device;
    device.name = j.value("name", "");
    device.udid = j.value("udid", "");
    device.deviceType = j.value("deviceType", "");
    device.iosVersion = j.value("iosVersion", "");
    device.runtimeVersion = j.value("runtimeVersion", "");
    device.isAvailable = j.value("isAvailable", false);
    setStatus(device, statusFromString(j.value("status", "Unknown")));
    return device;
}

const std::string& deviceName(const Device& device) {
    return std::visit([](const auto& d) -> const std::string& { return d.name; }, device);
}

const std::string& deviceIdentifier(const Device& device) {
    if (const auto* ios = std::get_if<IosDevice>(&device)) {
        return ios->udid;
    }
    return std::get<AndroidDevice>(device).name;
}

DeviceStatus deviceStatus(const Device& device) {
    return std::visit([](const auto& d) { return d.status; }, device);
}

bool deviceIsRunning(const Device& device) {
    return std::visit([](const auto& d) { return d.isRunning; }, device);
}

Platform devicePlatform(const Device& device) {
    return std::holds_alternative<IosDevice>(device) ? Platform::Ios : Platform::Android;
}

void setStatus(AndroidDevice& device, DeviceStatus status) {
    device.status = status;
    device.isRunning = status == DeviceStatus::Running;
}

void setStatus(IosDevice& device, DeviceStatus status) {
    device.status = status;
    device.isRunning = status == DeviceStatus::Running;
}

void setStatus(Device& device, DeviceStatus status) {
    std::visit([status](auto& d) { setStatus(d, status); }, device);
}

json AvailableDevice::toJson() const {
    return json{{"id", id}, {"displayName", displayName}, {"oem", oem}, {"category", category}};
}

AvailableDevice AvailableDevice::fromJson(const json& j) {
    AvailableDevice device;
    device.id = j.value("id", "");
    device.displayName = j.value("displayName", "");
    device.oem = j.value("oem", "");
    device.category = j.value("category", "phone");
    return device;
}

json ApiTarget::toJson() const {
    return json{{"apiLevel", apiLevel}, {"display", display}};
}

ApiTarget ApiTarget::fromJson(const json& j) {
    ApiTarget target;
    target.apiLevel = j.value("apiLevel", kInvalidApiLevel);
    target.display = j.value("display", "");
    return target;
}

json IosDeviceType::toJson() const {
    return json{{"identifier", identifier}, {"name", name}};
}

IosDeviceType IosDeviceType::fromJson(const json& j) {
    IosDeviceType type;
    type.identifier = j.value("identifier", "");
    type.name = j.value("name", "");
    return type;
}

json IosRuntime::toJson() const {
    return json{{"identifier", identifier}, {"name", name}, {"version", version}};
}

IosRuntime IosRuntime::fromJson(const json& j) {
    IosRuntime runtime;
    runtime.identifier = j.value("identifier", "");
    runtime.name = j.value("name", "");
    runtime.version = j.value("version", "");
    return runtime;
}
