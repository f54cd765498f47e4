#include "IosManager.hpp"
#include "DevicePriority.hpp"
#include "EmuError.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

const std::string kXcrun = "xcrun";
const std::string kRuntimePrefix = "com.apple.CoreSimulator.SimRuntime.";
const std::string kDeviceTypePrefix = "com.apple.CoreSimulator.SimDeviceType.";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

json parseDocument(const std::string& jsonText, const std::string& what) {
    try {
        return json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw EmuError(EmuErrorKind::ParseFailure, "Malformed simctl " + what + " JSON: " + std::string(e.what()));
    }
}

std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

bool boolField(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

// "17.0.1" -> {17, 0, 1}
std::vector<int> versionParts(const std::string& version) {
    std::vector<int> parts;
    std::istringstream stream(version);
    std::string part;
    while (std::getline(stream, part, '.')) {
        int value = 0;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) break;
            value = value * 10 + (c - '0');
        }
        parts.push_back(value);
    }
    return parts;
}

} // namespace

IosManager::IosManager(CommandExecutor& executor) : executor_(executor) {
    if (!executor_.commandExists(kXcrun)) {
        throw EmuError(EmuErrorKind::SdkUnavailable, "xcrun not found. Install Xcode to manage iOS simulators.");
    }
}

CommandResult IosManager::simctl(const std::vector<std::string>& args) {
    std::vector<std::string> fullArgs = {"simctl"};
    fullArgs.insert(fullArgs.end(), args.begin(), args.end());
    return executor_.run(kXcrun, fullArgs);
}

CommandResult IosManager::listJson(const std::string& what) {
    CommandResult result = simctl({"list", what, "--json"});
    if (!result.success()) {
        LOG_DEBUG("simctl list " + what + " --json failed, retrying with -j");
        result = simctl({"list", what, "-j"});
    }
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to list iOS " + what + ": " + trim(result.stderrText), result.stderrText);
    }
    return result;
}

std::vector<IosDevice> IosManager::listDevices() {
    CommandResult result = listJson("devices");
    std::vector<IosDevice> devices = parseDeviceList(result.stdoutText);

    auto& cache = DevicePriorityCache::getInstance();
    std::stable_sort(devices.begin(), devices.end(), [&cache](const IosDevice& a, const IosDevice& b) {
        int pa = cache.iosPriority(a.name);
        int pb = cache.iosPriority(b.name);
        if (pa != pb) return pa < pb;
        return a.name < b.name;
    });

    LOG_DEBUG("Found " + std::to_string(devices.size()) + " iOS simulators");
    return devices;
}

std::vector<IosDevice> IosManager::parseDeviceList(const std::string& jsonText) {
    json root = parseDocument(jsonText, "devices");

    std::vector<IosDevice> devices;
    auto runtimes = root.find("devices");
    if (runtimes == root.end() || !runtimes->is_object()) {
        return devices;
    }

    for (auto runtime = runtimes->begin(); runtime != runtimes->end(); ++runtime) {
        if (!runtime.value().is_array()) {
            continue;
        }
        const std::string version = versionFromRuntimeKey(runtime.key());

        for (const auto& entry : runtime.value()) {
            if (!entry.is_object()) {
                continue;
            }
            IosDevice device;
            device.udid = stringField(entry, "udid");
            std::string name = stringField(entry, "name");
            if (device.udid.empty() || name.empty()) {
                LOG_DEBUG("Skipping simulator record without udid or name under " + runtime.key());
                continue;
            }

            device.name = name + " (iOS " + version + ")";
            device.deviceType = stringField(entry, "deviceTypeIdentifier");
            device.iosVersion = version;
            device.runtimeVersion = runtime.key();
            device.isAvailable = boolField(entry, "isAvailable");
            setStatus(device, mapSimulatorState(stringField(entry, "state")));
            devices.push_back(device);
        }
    }
    return devices;
}

DeviceStatus IosManager::mapSimulatorState(const std::string& state) {
    if (state == "Booted") return DeviceStatus::Running;
    if (state == "Shutdown") return DeviceStatus::Stopped;
    return DeviceStatus::Unknown;
}

std::string IosManager::versionFromRuntimeKey(const std::string& runtimeKey) {
    size_t pos = runtimeKey.find("iOS-");
    if (pos == std::string::npos) {
        return "Unknown";
    }
    std::string version = replaceAll(runtimeKey.substr(pos + 4), "-", ".");
    return version.empty() ? "Unknown" : version;
}

void IosManager::createDevice(const DeviceConfig& config) {
    if (trim(config.name).empty()) {
        throw EmuError(EmuErrorKind::CreationFailure, "Device name must not be empty");
    }
    if (config.deviceType.empty() || config.version.empty()) {
        throw EmuError(EmuErrorKind::CreationFailure, "Device type and runtime are required");
    }

    CommandResult result = simctl({"create", config.name, config.deviceType, config.version});
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CreationFailure,
                       "Failed to create simulator '" + config.name + "': " + trim(result.stderrText),
                       result.stderrText);
    }
    LOG_INFO("Created simulator '" + config.name + "' (" + trim(result.stdoutText) + ")");
}

void IosManager::startDevice(const std::string& udid) {
    CommandResult result = simctl({"boot", udid});
    if (!result.success()) {
        if (contains(result.stderrText, "Unable to boot device in current state: Booted")) {
            LOG_INFO("Simulator " + udid + " already booted");
        } else if (contains(result.stderrText, "Invalid device")) {
            throw EmuError(EmuErrorKind::DeviceNotFound, "Simulator not found: " + udid, result.stderrText);
        } else {
            throw EmuError(EmuErrorKind::CommandExecutionFailure,
                           "Failed to boot simulator: " + trim(result.stderrText), result.stderrText);
        }
    }

    try {
        executor_.spawnDetached("open", {"-a", "Simulator"});
    } catch (const EmuError& e) {
        LOG_WARNING("Failed to open Simulator app: " + std::string(e.what()));
    }
}

void IosManager::stopDevice(const std::string& udid) {
    CommandResult result = simctl({"shutdown", udid});
    if (!result.success()) {
        if (contains(result.stderrText, "Unable to shutdown device in current state: Shutdown")) {
            LOG_INFO("Simulator " + udid + " already shut down");
        } else {
            throw EmuError(EmuErrorKind::CommandExecutionFailure,
                           "Failed to shut down simulator: " + trim(result.stderrText), result.stderrText);
        }
    }
    quitSimulatorIfIdle();
}

void IosManager::quitSimulatorIfIdle() {
    try {
        auto devices = listDevices();
        bool anyRunning = std::any_of(devices.begin(), devices.end(),
                                      [](const IosDevice& d) { return d.isRunning; });
        if (anyRunning) {
            return;
        }
        CommandResult quit = executor_.run("osascript", {"-e", "tell application \"Simulator\" to quit"});
        if (!quit.success()) {
            CommandResult kill = executor_.run("killall", {"Simulator"});
            if (!kill.success()) {
                LOG_DEBUG("Simulator app was not running");
            }
        }
    } catch (const EmuError& e) {
        LOG_WARNING("Could not quit Simulator app: " + std::string(e.what()));
    }
}

void IosManager::deleteDevice(const std::string& udid) {
    CommandResult shutdown = simctl({"shutdown", udid});
    if (!shutdown.success()) {
        LOG_DEBUG("Shutdown before delete failed (ignored): " + trim(shutdown.stderrText));
    }

    CommandResult result = simctl({"delete", udid});
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to delete simulator: " + trim(result.stderrText), result.stderrText);
    }
    LOG_INFO("Deleted simulator " + udid);
}

void IosManager::wipeDevice(const std::string& udid) {
    CommandResult result = simctl({"erase", udid});
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to erase simulator: " + trim(result.stderrText), result.stderrText);
    }
    LOG_INFO("Erased simulator " + udid);
}

DeviceDetails IosManager::getDeviceDetails(const IosDevice& device) {
    DeviceDetails details;
    details.name = device.name;
    details.identifier = device.udid;
    details.platform = Platform::Ios;
    details.status = statusToString(device.status);
    details.version = device.iosVersion;
    details.deviceType = parseDeviceTypeDisplayName(device.deviceType);
    details.resolution = resolutionForDeviceType(details.deviceType);
    details.systemImage = device.runtimeVersion;
    return details;
}

std::vector<IosDeviceType> IosManager::listDeviceTypes() {
    CommandResult result = listJson("devicetypes");
    std::vector<IosDeviceType> types = parseDeviceTypes(result.stdoutText);

    auto& cache = DevicePriorityCache::getInstance();
    std::stable_sort(types.begin(), types.end(), [&cache](const IosDeviceType& a, const IosDeviceType& b) {
        return cache.iosPriority(a.name) < cache.iosPriority(b.name);
    });
    return types;
}

std::vector<IosDeviceType> IosManager::parseDeviceTypes(const std::string& jsonText) {
    json root = parseDocument(jsonText, "devicetypes");

    std::vector<IosDeviceType> types;
    auto list = root.find("devicetypes");
    if (list == root.end() || !list->is_array()) {
        return types;
    }
    for (const auto& entry : *list) {
        if (!entry.is_object()) continue;
        IosDeviceType type;
        type.identifier = stringField(entry, "identifier");
        if (type.identifier.empty()) continue;
        type.name = stringField(entry, "name");
        if (type.name.empty()) {
            type.name = parseDeviceTypeDisplayName(type.identifier);
        }
        types.push_back(type);
    }
    return types;
}

std::vector<IosRuntime> IosManager::listRuntimes() {
    CommandResult result = listJson("runtimes");
    return parseRuntimes(result.stdoutText);
}

std::vector<IosRuntime> IosManager::parseRuntimes(const std::string& jsonText) {
    json root = parseDocument(jsonText, "runtimes");

    std::vector<IosRuntime> runtimes;
    auto list = root.find("runtimes");
    if (list == root.end() || !list->is_array()) {
        return runtimes;
    }
    for (const auto& entry : *list) {
        if (!entry.is_object() || !boolField(entry, "isAvailable")) continue;
        IosRuntime runtime;
        runtime.identifier = stringField(entry, "identifier");
        if (runtime.identifier.empty()) continue;
        runtime.version = stringField(entry, "version");
        runtime.name = stringField(entry, "name");
        if (runtime.name.empty()) {
            runtime.name = runtime.version.empty()
                ? replaceAll(replaceAll(replaceAll(runtime.identifier, kRuntimePrefix, ""), "-", "."), "iOS.", "iOS ")
                : "iOS " + runtime.version;
        }
        if (runtime.version.empty()) {
            runtime.version = versionFromRuntimeKey(runtime.identifier);
        }
        runtimes.push_back(runtime);
    }

    std::stable_sort(runtimes.begin(), runtimes.end(), [](const IosRuntime& a, const IosRuntime& b) {
        return versionParts(a.version) > versionParts(b.version);
    });
    return runtimes;
}

std::string IosManager::parseDeviceTypeDisplayName(const std::string& identifier) {
    std::string cleaned = replaceAll(identifier, kDeviceTypePrefix, "");
    std::replace(cleaned.begin(), cleaned.end(), '-', ' ');
    std::replace(cleaned.begin(), cleaned.end(), '_', ' ');

    // "12 9 inch" -> 12.9"
    cleaned = replaceAll(cleaned, "12 9 inch", "12.9\"");
    cleaned = replaceAll(cleaned, "13 inch", "13\"");
    cleaned = replaceAll(cleaned, "11 inch", "11\"");
    cleaned = replaceAll(cleaned, "8GB", "(8GB)");
    cleaned = replaceAll(cleaned, "16GB", "(16GB)");

    std::istringstream words(cleaned);
    std::string word;
    std::string display;
    while (words >> word) {
        std::string lower = toLower(word);
        bool chip = (lower[0] == 'm' && word.size() <= 3 && word.size() > 1 && std::isdigit(static_cast<unsigned char>(word[1]))) ||
                    (lower[0] == 'a' && word.size() > 1 && std::isdigit(static_cast<unsigned char>(word[1])));
        if (chip) {
            std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return std::toupper(c); });
        } else if (lower == "se" || lower == "mini" || lower == "max" || lower == "plus" || lower == "pro" ||
                   lower == "air" || lower == "ultra" || lower == "inch" ||
                   word.rfind("iPhone", 0) == 0 || word.rfind("iPad", 0) == 0 || word.rfind("iPod", 0) == 0 ||
                   contains(word, "\"") || contains(word, "(")) {
            // kept as written
        } else {
            word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
        }
        if (!display.empty()) display += " ";
        display += word;
    }
    return display;
}

std::string IosManager::resolutionForDeviceType(const std::string& deviceType) {
    const std::string lower = toLower(deviceType);

    if (contains(lower, "iphone")) {
        if (contains(lower, "16") || contains(lower, "15") || contains(lower, "14")) {
            if (contains(lower, "pro max") || contains(lower, "plus")) return "1290x2796";
            return "1179x2556";
        }
        if (contains(lower, "se")) return "750x1334";
    }

    if (contains(lower, "ipad")) {
        if (contains(lower, "pro")) {
            if (contains(lower, "13") || contains(lower, "12.9")) return "2048x2732";
            if (contains(lower, "11")) return "1668x2388";
        } else if (contains(lower, "air")) {
            return contains(lower, "13") ? "2048x2732" : "1640x2360";
        } else if (contains(lower, "mini")) {
            return "1488x2266";
        } else {
            return "1640x2360";
        }
    }

    return "";
}
