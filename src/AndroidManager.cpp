#include "AndroidManager.hpp"
#include "DevicePriority.hpp"
#include "EmuError.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <regex>
#include <set>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kUserDataFiles = {
    "userdata.img",
    "userdata-qemu.img",
    "cache.img",
    "cache.img.qcow2",
    "userdata.img.qcow2",
    "sdcard.img",
    "sdcard.img.qcow2",
    "multiinstance.lock",
};

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

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool isSeparatorLine(const std::string& line) {
    std::string t = trim(line);
    return t.size() >= 3 && t.find_first_not_of('-') == std::string::npos;
}

// Digit run captured from tool output; kInvalidApiLevel when empty or implausibly long
int parseApiNumber(const std::string& digits) {
    constexpr size_t kMaxApiDigits = 4;
    if (digits.empty() || digits.size() > kMaxApiDigits) {
        return kInvalidApiLevel;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return kInvalidApiLevel;
        }
    }
    return std::stoi(digits);
}

// First integer in a string such as "34" or "API 34 - Android 14"
int firstInteger(const std::string& text) {
    static const std::regex number(R"((\d+))");
    std::smatch match;
    if (std::regex_search(text, match, number)) {
        return parseApiNumber(match[1].str());
    }
    return kInvalidApiLevel;
}

int parseMegabytes(const std::string& value, int fallback) {
    constexpr size_t kMaxSizeDigits = 9;
    std::string digits;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        digits.push_back(c);
    }
    if (digits.empty() || digits.size() > kMaxSizeDigits) {
        return fallback;
    }
    return std::stoi(digits);
}

std::string combinedOutput(const CommandResult& result) {
    std::string text = trim(result.stderrText);
    std::string out = trim(result.stdoutText);
    if (!out.empty()) {
        text += text.empty() ? out : "\n" + out;
    }
    return text;
}

AndroidDevice finishBlock(const std::string& name, const std::string& deviceLine, const std::string& path,
                          const std::string& target, const std::string& tagAbi, const std::string& blockText) {
    AndroidDevice device;
    device.name = name;
    device.path = path;
    device.target = target;
    device.tagAbi = tagAbi;

    size_t paren = deviceLine.find(" (");
    device.deviceType = trim(paren == std::string::npos ? deviceLine : deviceLine.substr(0, paren));

    device.apiLevel = AndroidManager::parseApiLevelFromTarget(target);
    if (device.apiLevel == kInvalidApiLevel) {
        static const std::regex generic(R"((?:API level |android-)(\d+))");
        std::smatch match;
        if (std::regex_search(blockText, match, generic)) {
            device.apiLevel = parseApiNumber(match[1].str());
        }
    }

    device.category = getDeviceCategory(device.deviceType, deviceLine);
    setStatus(device, DeviceStatus::Stopped);
    return device;
}

} // namespace

AndroidManager::AndroidManager(CommandExecutor& executor, const std::string& androidHome, const std::string& avdHome)
    : executor_(executor), androidHome_(androidHome), avdHome_(avdHome) {
    if (androidHome_.empty()) {
        throw EmuError(EmuErrorKind::SdkUnavailable,
                       "Android SDK not found. Set ANDROID_HOME or ANDROID_SDK_ROOT to your SDK location.");
    }
    if (!fs::is_directory(androidHome_)) {
        throw EmuError(EmuErrorKind::SdkUnavailable,
                       "Android SDK directory does not exist: " + androidHome_);
    }

    avdmanagerPath_ = findTool({"cmdline-tools/latest/bin/avdmanager", "tools/bin/avdmanager"}, "");
    if (avdmanagerPath_.empty()) {
        throw EmuError(EmuErrorKind::SdkUnavailable,
                       "avdmanager not found under " + androidHome_ +
                       ". Install the Android SDK command-line tools.");
    }

    emulatorPath_ = findTool({"emulator/emulator", "tools/emulator"}, "");
    if (emulatorPath_.empty()) {
        throw EmuError(EmuErrorKind::SdkUnavailable,
                       "emulator not found under " + androidHome_ + ". Install the Android Emulator package.");
    }

    sdkmanagerPath_ = findTool({"cmdline-tools/latest/bin/sdkmanager", "tools/bin/sdkmanager"}, "sdkmanager");
    adbPath_ = findTool({"platform-tools/adb"}, "adb");

    LOG_INFO("Android SDK: " + androidHome_ + ", AVD home: " + avdHome_);
}

std::string AndroidManager::findTool(const std::vector<std::string>& candidates, const std::string& fallback) const {
    for (const auto& candidate : candidates) {
        fs::path toolPath = fs::path(androidHome_) / candidate;
        if (fs::exists(toolPath)) {
            return toolPath.string();
        }
    }
    return fallback;
}

std::vector<AndroidDevice> AndroidManager::listDevices() {
    CommandResult result = executor_.run(avdmanagerPath_, {"list", "avd"});
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to list Android virtual devices: " + combinedOutput(result), result.stderrText);
    }

    std::vector<AndroidDevice> devices = parseAvdListOutput(result.stdoutText);

    for (auto& device : devices) {
        std::map<std::string, std::string> config;
        if (!readConfigIni(configIniPath(device), config)) {
            continue;
        }
        int level = parseApiLevelFromConfig(config);
        if (level != kInvalidApiLevel) {
            device.apiLevel = level;
        }
        if (config.count("hw.ramSize")) {
            device.ramSize = config["hw.ramSize"];
        }
        if (config.count("disk.dataPartition.size")) {
            device.storageSize = config["disk.dataPartition.size"];
        }
    }

    std::map<std::string, std::string> running;
    try {
        running = getRunningAvdNames();
    } catch (const EmuError& e) {
        LOG_WARNING("Could not query running emulators: " + std::string(e.what()));
    }

    for (auto& device : devices) {
        std::string normalized = device.name;
        std::replace(normalized.begin(), normalized.end(), ' ', '_');
        if (running.count(device.name) || running.count(normalized)) {
            setStatus(device, DeviceStatus::Running);
        }
    }

    LOG_DEBUG("Found " + std::to_string(devices.size()) + " Android virtual devices, " +
              std::to_string(running.size()) + " running name entries");
    return devices;
}

std::vector<AndroidDevice> AndroidManager::parseAvdListOutput(const std::string& output) {
    static const std::regex nameRe(R"(^Name:\s*(.*)$)");
    static const std::regex deviceRe(R"(^Device:\s*(.+)$)");
    static const std::regex pathRe(R"(^Path:\s*(.+)$)");
    static const std::regex targetRe(R"(^Target:\s*(.+)$)");
    static const std::regex basedOnRe(R"(^Based on:\s*(.+)$)");
    static const std::regex tagAbiRe(R"(Tag/ABI:\s*(\S+))");

    std::vector<AndroidDevice> devices;
    std::string name, deviceLine, path, target, tagAbi, blockText;
    bool inBlock = false;
    int dropped = 0;

    auto flush = [&]() {
        if (inBlock) {
            if (!name.empty()) {
                devices.push_back(finishBlock(name, deviceLine, path, target, tagAbi, blockText));
            } else {
                ++dropped;
            }
        }
        name.clear(); deviceLine.clear(); path.clear(); target.clear(); tagAbi.clear(); blockText.clear();
        inBlock = false;
    };

    std::istringstream stream(output);
    std::string rawLine;
    while (std::getline(stream, rawLine)) {
        if (rawLine.find("could not be loaded") != std::string::npos) {
            break;
        }
        if (isSeparatorLine(rawLine)) {
            flush();
            continue;
        }

        std::string line = trim(rawLine);
        if (line.empty()) {
            continue;
        }

        std::smatch match;
        if (std::regex_match(line, match, nameRe)) {
            inBlock = true;
            name = trim(match[1].str());
        } else if (std::regex_match(line, match, deviceRe)) {
            inBlock = true;
            deviceLine = trim(match[1].str());
        } else if (std::regex_match(line, match, pathRe)) {
            inBlock = true;
            path = trim(match[1].str());
        } else if (std::regex_match(line, match, targetRe)) {
            inBlock = true;
            target = trim(match[1].str());
        } else if (std::regex_match(line, match, basedOnRe)) {
            target += target.empty() ? line : " " + line;
        }

        if (std::regex_search(line, match, tagAbiRe)) {
            tagAbi = match[1].str();
        }
        if (inBlock) {
            blockText += line + "\n";
        }
    }
    flush();

    if (dropped > 0) {
        LOG_DEBUG("Dropped " + std::to_string(dropped) + " AVD block(s) without a name");
    }
    return devices;
}

int AndroidManager::parseApiLevelFromTarget(const std::string& target) {
    static const std::regex apiLevelRe(R"(API level (\d+))");
    static const std::regex basedOnRe(R"(Based on:\s*Android\s*([\d.]+))");

    std::smatch match;
    if (std::regex_search(target, match, apiLevelRe)) {
        return parseApiNumber(match[1].str());
    }
    if (std::regex_search(target, match, basedOnRe)) {
        return apiLevelFromAndroidVersion(match[1].str());
    }
    return kInvalidApiLevel;
}

int AndroidManager::parseApiLevelFromConfig(const std::map<std::string, std::string>& config) {
    static const std::regex sysdirRe(R"(system-images/android-(\d+)/?)");
    static const std::regex targetRe(R"(android-(\d+))");

    std::smatch match;
    auto sysdir = config.find("image.sysdir.1");
    if (sysdir != config.end() && std::regex_search(sysdir->second, match, sysdirRe)) {
        return parseApiNumber(match[1].str());
    }
    auto target = config.find("target");
    if (target != config.end() && std::regex_search(target->second, match, targetRe)) {
        return parseApiNumber(match[1].str());
    }
    return kInvalidApiLevel;
}

std::map<std::string, std::string> AndroidManager::parseConfigIni(const std::string& content) {
    std::map<std::string, std::string> config;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        config[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return config;
}

std::string AndroidManager::avdDirectory(const std::string& name) const {
    return (fs::path(avdHome_) / (name + ".avd")).string();
}

std::string AndroidManager::configIniPath(const AndroidDevice& device) const {
    if (!device.path.empty()) {
        return (fs::path(device.path) / "config.ini").string();
    }
    return (fs::path(avdDirectory(device.name)) / "config.ini").string();
}

bool AndroidManager::readConfigIni(const std::string& path, std::map<std::string, std::string>& config) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    config = parseConfigIni(buffer.str());
    return true;
}

void AndroidManager::updateConfigIni(const std::string& path, const std::map<std::string, std::string>& values) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WARNING("config.ini not found, skipping hardware settings: " + path);
        return;
    }

    std::vector<std::string> lines;
    std::set<std::string> written;
    std::string line;
    while (std::getline(in, line)) {
        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            std::string key = trim(line.substr(0, eq));
            auto it = values.find(key);
            if (it != values.end()) {
                line = key + "=" + it->second;
                written.insert(key);
            }
        }
        lines.push_back(line);
    }
    in.close();

    for (const auto& entry : values) {
        if (!written.count(entry.first)) {
            lines.push_back(entry.first + "=" + entry.second);
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw EmuError(EmuErrorKind::PermissionDenied, "Cannot write " + path);
    }
    for (const auto& l : lines) {
        out << l << "\n";
    }
}

std::vector<std::pair<std::string, std::string>> AndroidManager::parseAdbDevicesOutput(const std::string& output) {
    std::vector<std::pair<std::string, std::string>> entries;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!startsWith(line, "emulator-")) {
            continue;
        }
        std::istringstream fields(line);
        std::string serial, state;
        if (fields >> serial >> state) {
            entries.emplace_back(serial, state);
        }
    }
    return entries;
}

DeviceStatus AndroidManager::mapAdbState(const std::string& state) {
    return state == "device" ? DeviceStatus::Running : DeviceStatus::Stopped;
}

std::map<std::string, std::string> AndroidManager::getRunningAvdNames() {
    std::map<std::string, std::string> running;

    CommandResult devices = executor_.run(adbPath_, {"devices"});
    if (!devices.success()) {
        LOG_DEBUG("adb devices failed: " + trim(devices.stderrText));
        return running;
    }

    for (const auto& entry : parseAdbDevicesOutput(devices.stdoutText)) {
        const std::string& serial = entry.first;
        if (mapAdbState(entry.second) != DeviceStatus::Running) {
            continue;
        }

        std::string avdName;
        for (const char* prop : {"ro.kernel.qemu.avd_name", "ro.boot.qemu.avd_name"}) {
            CommandResult lookup = executor_.run(adbPath_, {"-s", serial, "shell", "getprop", prop});
            if (lookup.success() && !trim(lookup.stdoutText).empty()) {
                avdName = trim(lookup.stdoutText);
                break;
            }
        }
        if (avdName.empty()) {
            CommandResult console = executor_.run(adbPath_, {"-s", serial, "emu", "avd", "name"});
            if (console.success()) {
                std::istringstream lines(console.stdoutText);
                std::string first;
                std::getline(lines, first);
                first = trim(first);
                if (!first.empty() && first != "OK") {
                    avdName = first;
                }
            }
        }

        if (avdName.empty()) {
            LOG_DEBUG("Could not associate " + serial + " with an AVD, ignoring");
            continue;
        }

        running[avdName] = serial;
        std::string normalized = avdName;
        std::replace(normalized.begin(), normalized.end(), ' ', '_');
        if (normalized != avdName) {
            running[normalized] = serial;
        }
    }
    return running;
}

std::string AndroidManager::findRunningSerial(const std::string& name) {
    auto running = getRunningAvdNames();
    auto it = running.find(name);
    if (it != running.end()) {
        return it->second;
    }
    std::string normalized = name;
    std::replace(normalized.begin(), normalized.end(), ' ', '_');
    it = running.find(normalized);
    return it != running.end() ? it->second : "";
}

std::string AndroidManager::sanitizeAvdName(const std::string& name) {
    std::string sanitized;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.' || c == '-') {
            sanitized.push_back(c);
        } else if (c == ' ' || c == '_') {
            sanitized.push_back('_');
        }
    }
    size_t start = sanitized.find_first_not_of('_');
    if (start == std::string::npos) {
        return "";
    }
    size_t end = sanitized.find_last_not_of('_');
    return sanitized.substr(start, end - start + 1);
}

std::string AndroidManager::hostAbi() {
#if defined(__aarch64__) || defined(__arm64__)
    return "arm64-v8a";
#else
    return "x86_64";
#endif
}

void AndroidManager::createDevice(const DeviceConfig& config) {
    std::string avdName = sanitizeAvdName(config.name);
    if (avdName.empty()) {
        throw EmuError(EmuErrorKind::CreationFailure,
                       "Invalid device name '" + config.name + "': use letters, digits, '.', '-' or '_'");
    }

    for (const auto& existing : listDevices()) {
        if (existing.name == avdName) {
            throw EmuError(EmuErrorKind::CreationFailure, "Device '" + avdName + "' already exists");
        }
    }

    int apiLevel = firstInteger(config.version);
    if (apiLevel == kInvalidApiLevel) {
        throw EmuError(EmuErrorKind::CreationFailure, "Invalid API level: '" + config.version + "'");
    }

    std::string packageId = resolveSystemImage(apiLevel, config);
    LOG_INFO("Creating AVD '" + avdName + "' with " + packageId);

    std::vector<std::string> args = {"create", "avd", "-n", avdName, "-k", packageId};
    if (!config.deviceType.empty()) {
        args.push_back("--device");
        args.push_back(config.deviceType);
    }

    CommandResult result = executor_.run(avdmanagerPath_, args);
    if (!result.success()) {
        throwCreationError(config, packageId, result);
    }

    std::map<std::string, std::string> settings;
    if (!config.ramSize.empty()) {
        settings["hw.ramSize"] = config.ramSize;
    }
    if (!config.storageSize.empty()) {
        int storageMb = parseMegabytes(config.storageSize, 8192);
        settings["disk.dataPartition.size"] = std::to_string(std::max(1, storageMb / 1024)) + "G";
    }
    settings["avd.ini.displayname"] = config.name;
    settings["AvdId"] = avdName;
    updateConfigIni((fs::path(avdDirectory(avdName)) / "config.ini").string(), settings);

    LOG_INFO("Created AVD '" + avdName + "'");
}

std::string AndroidManager::resolveSystemImage(int apiLevel, const DeviceConfig& config) {
    auto tagOpt = config.additionalOptions.find("tag");
    auto abiOpt = config.additionalOptions.find("abi");
    const std::string wantedTag = tagOpt != config.additionalOptions.end() ? tagOpt->second : "";
    const std::string wantedAbi = abiOpt != config.additionalOptions.end() ? abiOpt->second : "";

    std::vector<SystemImage> images;
    try {
        images = listAvailableSystemImages();
    } catch (const EmuError& e) {
        throw EmuError(EmuErrorKind::CreationFailure,
                       "Cannot resolve a system image for API " + std::to_string(apiLevel) + ": " + e.what(),
                       e.toolStderr());
    }

    for (const auto& image : images) {
        if (image.apiLevel != apiLevel) continue;
        if (!wantedTag.empty() && image.tag != wantedTag) continue;
        if (!wantedAbi.empty() && image.abi != wantedAbi) continue;
        return image.packageId;
    }

    std::string tag = wantedTag.empty() ? "google_apis_playstore" : wantedTag;
    std::string abi = wantedAbi.empty() ? hostAbi() : wantedAbi;
    std::string wanted = "system-images;android-" + std::to_string(apiLevel) + ";" + tag + ";" + abi;

    std::string available;
    for (const auto& image : images) {
        available += (available.empty() ? "" : ", ") + image.packageId;
    }
    throw EmuError(EmuErrorKind::CreationFailure,
                   "System image '" + wanted + "' not found. Install it with: sdkmanager \"" + wanted + "\"\n" +
                   "Available images: " + (available.empty() ? "none" : available));
}

void AndroidManager::throwCreationError(const DeviceConfig& config, const std::string& packageId,
                                        const CommandResult& result) const {
    const std::string output = combinedOutput(result);
    const std::string lower = toLower(output);

    if (lower.find("package path is not valid") != std::string::npos ||
        lower.find("system image") != std::string::npos ||
        lower.find("not installed") != std::string::npos) {
        throw EmuError(EmuErrorKind::CreationFailure,
                       "System image not installed: " + packageId + ". Install it with: sdkmanager \"" +
                       packageId + "\"", result.stderrText);
    }
    if (lower.find("license") != std::string::npos) {
        throw EmuError(EmuErrorKind::CreationFailure,
                       "Android SDK licenses not accepted. Run: sdkmanager --licenses", result.stderrText);
    }
    if (lower.find("already exists") != std::string::npos) {
        throw EmuError(EmuErrorKind::CreationFailure,
                       "Device '" + config.name + "' already exists", result.stderrText);
    }
    if (lower.find("device") != std::string::npos && lower.find("not found") != std::string::npos) {
        throw EmuError(EmuErrorKind::CreationFailure,
                       "Device type '" + config.deviceType + "' not found", result.stderrText);
    }
    throw EmuError(EmuErrorKind::CommandExecutionFailure,
                   "Failed to create device '" + config.name + "': " + output, result.stderrText);
}

void AndroidManager::startDevice(const std::string& name) {
    if (!findRunningSerial(name).empty()) {
        LOG_INFO("Device '" + name + "' is already running");
        return;
    }

    pid_t pid = executor_.spawnDetached(emulatorPath_,
                                        {"-avd", name, "-no-audio", "-no-snapshot-save", "-no-boot-anim", "-netfast"});
    waitForBoot(name, pid);
    LOG_INFO("Device '" + name + "' finished booting");
}

void AndroidManager::waitForBoot(const std::string& name, pid_t emulatorPid) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(bootTimeoutSeconds_);
    auto remainingMs = [&deadline]() {
        return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count());
    };

    std::string serial;
    bool attached = false;

    while (remainingMs() > 0) {
        if (!executor_.isProcessAlive(emulatorPid)) {
            throw EmuError(EmuErrorKind::CommandExecutionFailure,
                           "Emulator process for '" + name + "' exited during boot");
        }

        if (serial.empty()) {
            serial = findRunningSerial(name);
        }

        if (!serial.empty()) {
            if (!attached) {
                CommandResult wait = executor_.execute(adbPath_, {"-s", serial, "wait-for-device"},
                                                       std::max(remainingMs(), 1));
                attached = wait.success();
            }
            if (attached) {
                CommandResult boot = executor_.run(adbPath_, {"-s", serial, "shell", "getprop", "sys.boot_completed"});
                if (boot.success() && trim(boot.stdoutText) == "1") {
                    return;
                }
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(
            std::min(bootPollIntervalMs_, std::max(remainingMs(), 0))));
    }

    throw EmuError(EmuErrorKind::Timeout,
                   "Device '" + name + "' did not finish booting within " +
                   std::to_string(bootTimeoutSeconds_) + " seconds");
}

void AndroidManager::stopDevice(const std::string& name) {
    std::string serial = findRunningSerial(name);
    if (serial.empty()) {
        throw EmuError(EmuErrorKind::DeviceNotFound, "Device '" + name + "' is not running");
    }

    CommandResult result = executor_.run(adbPath_, {"-s", serial, "emu", "kill"});
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to stop device '" + name + "': " + combinedOutput(result), result.stderrText);
    }
    LOG_INFO("Stopped device '" + name + "' (" + serial + ")");
}

void AndroidManager::deleteDevice(const std::string& name) {
    if (!findRunningSerial(name).empty()) {
        try {
            stopDevice(name);
        } catch (const EmuError& e) {
            LOG_WARNING("Could not stop '" + name + "' before deletion: " + std::string(e.what()));
        }
    }

    CommandResult result = executor_.run(avdmanagerPath_, {"delete", "avd", "-n", name});
    if (!result.success()) {
        const std::string output = combinedOutput(result);
        if (toLower(output).find("there is no android virtual device") != std::string::npos) {
            throw EmuError(EmuErrorKind::DeviceNotFound, "Device '" + name + "' not found", result.stderrText);
        }
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to delete device '" + name + "': " + output, result.stderrText);
    }
    LOG_INFO("Deleted device '" + name + "'");
}

void AndroidManager::wipeDevice(const std::string& name) {
    fs::path avdDir = avdDirectory(name);
    if (!fs::is_directory(avdDir)) {
        throw EmuError(EmuErrorKind::DeviceNotFound, "AVD directory not found: " + avdDir.string());
    }

    if (!findRunningSerial(name).empty()) {
        stopDevice(name);
    }

    std::error_code ec;
    for (const auto& file : kUserDataFiles) {
        fs::path target = avdDir / file;
        if (fs::exists(target, ec) && !fs::remove(target, ec)) {
            throw EmuError(EmuErrorKind::PermissionDenied, "Cannot remove " + target.string() + ": " + ec.message());
        }
    }

    fs::path snapshots = avdDir / "snapshots";
    if (fs::exists(snapshots, ec)) {
        fs::remove_all(snapshots, ec);
        if (ec) {
            throw EmuError(EmuErrorKind::PermissionDenied, "Cannot remove " + snapshots.string() + ": " + ec.message());
        }
    }
    LOG_INFO("Wiped user data of '" + name + "'");
}

DeviceDetails AndroidManager::getDeviceDetails(const AndroidDevice& device) {
    DeviceDetails details;
    details.name = device.name;
    details.identifier = device.name;
    details.platform = Platform::Android;
    details.status = statusToString(device.status);
    details.deviceType = device.deviceType;
    details.ramSize = device.ramSize;
    details.storageSize = device.storageSize;
    details.devicePath = device.path.empty() ? avdDirectory(device.name) : device.path;

    int apiLevel = device.apiLevel;
    std::map<std::string, std::string> config;
    if (readConfigIni(configIniPath(device), config)) {
        if (config.count("hw.ramSize")) details.ramSize = config["hw.ramSize"];
        if (config.count("disk.dataPartition.size")) details.storageSize = config["disk.dataPartition.size"];
        if (config.count("hw.lcd.width") && config.count("hw.lcd.height")) {
            details.resolution = config["hw.lcd.width"] + "x" + config["hw.lcd.height"];
        }
        if (config.count("hw.lcd.density")) details.dpi = config["hw.lcd.density"];
        if (config.count("image.sysdir.1")) details.systemImage = config["image.sysdir.1"];
        int configLevel = parseApiLevelFromConfig(config);
        if (configLevel != kInvalidApiLevel) apiLevel = configLevel;
    }

    details.version = apiLevel == kInvalidApiLevel
        ? "Unknown"
        : "API " + std::to_string(apiLevel) + " (" + androidVersionName(apiLevel) + ")";
    return details;
}

std::vector<AvailableDevice> AndroidManager::parseDeviceDefinitions(const std::string& output) {
    static const std::regex idRe(R"(^id:\s*\d+\s+or\s+\"([^\"]+)\")");
    static const std::regex nameRe(R"(^Name:\s*(.+)$)");
    static const std::regex oemRe(R"(^OEM\s*:\s*(.+)$)");

    std::vector<AvailableDevice> devices;
    AvailableDevice current;

    auto flush = [&]() {
        if (!current.id.empty()) {
            if (current.displayName.empty()) {
                current.displayName = current.id;
            }
            if (!current.oem.empty() && current.oem != "Generic") {
                current.displayName += " (" + current.oem + ")";
            }
            current.category = getDeviceCategory(current.id, current.displayName);
            devices.push_back(current);
        }
        current = AvailableDevice();
    };

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        std::smatch match;
        if (std::regex_search(line, match, idRe)) {
            flush();
            current.id = match[1].str();
        } else if (std::regex_match(line, match, nameRe)) {
            current.displayName = trim(match[1].str());
        } else if (std::regex_match(line, match, oemRe)) {
            current.oem = trim(match[1].str());
        }
    }
    flush();
    return devices;
}

std::vector<AvailableDevice> AndroidManager::listAvailableDevices() {
    CommandResult result = executor_.run(avdmanagerPath_, {"list", "device"});
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to list device definitions: " + combinedOutput(result), result.stderrText);
    }

    std::vector<AvailableDevice> devices = parseDeviceDefinitions(result.stdoutText);
    auto& cache = DevicePriorityCache::getInstance();
    cache.loadDeviceCatalog(devices);

    std::stable_sort(devices.begin(), devices.end(), [&cache](const AvailableDevice& a, const AvailableDevice& b) {
        int pa = cache.androidPriority(a.id, a.displayName);
        int pb = cache.androidPriority(b.id, b.displayName);
        if (pa != pb) return pa < pb;
        return a.displayName < b.displayName;
    });
    return devices;
}

std::vector<SystemImage> AndroidManager::parseSystemImages(const std::string& output, bool installedOnly) {
    static const std::regex packageRe(R"(^system-images;android-(\d+);([^;]+);([^;\s|]+))");

    std::vector<SystemImage> images;
    std::set<std::string> seen;
    bool inInstalled = false;

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (startsWith(line, "Installed packages:")) {
            inInstalled = true;
            continue;
        }
        if (startsWith(line, "Available Packages:") || startsWith(line, "Available Updates:") ||
            startsWith(line, "Updates:")) {
            if (installedOnly) break;
            inInstalled = false;
            continue;
        }
        if (installedOnly && !inInstalled) {
            continue;
        }

        std::smatch match;
        if (!std::regex_search(line, match, packageRe)) {
            continue;
        }
        SystemImage image;
        image.apiLevel = parseApiNumber(match[1].str());
        if (image.apiLevel == kInvalidApiLevel) {
            LOG_DEBUG("Skipping system image with unusable API level: " + trim(line));
            continue;
        }
        image.tag = match[2].str();
        image.abi = match[3].str();
        image.packageId = "system-images;android-" + match[1].str() + ";" + image.tag + ";" + image.abi;
        if (seen.insert(image.packageId).second) {
            images.push_back(image);
        }
    }
    return images;
}

std::vector<SystemImage> AndroidManager::listAvailableSystemImages() {
    CommandResult result = executor_.run(sdkmanagerPath_, {"--list", "--verbose", "--include_obsolete"});
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to list system images: " + combinedOutput(result), result.stderrText);
    }
    return parseSystemImages(result.stdoutText, true);
}

std::vector<ApiTarget> AndroidManager::listAvailableTargets() {
    std::set<int, std::greater<int>> levels;
    for (const auto& image : listAvailableSystemImages()) {
        levels.insert(image.apiLevel);
    }

    std::vector<ApiTarget> targets;
    for (int level : levels) {
        ApiTarget target;
        target.apiLevel = level;
        target.display = "API " + std::to_string(level) + " - " + androidVersionName(level);
        targets.push_back(target);
    }
    return targets;
}

std::vector<ApiLevelInfo> AndroidManager::listApiLevels() {
    CommandResult result = executor_.run(sdkmanagerPath_, {"--list", "--verbose", "--include_obsolete"});
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to list SDK packages: " + combinedOutput(result), result.stderrText);
    }

    std::map<int, ApiLevelInfo, std::greater<int>> levels;
    for (const auto& image : parseSystemImages(result.stdoutText, true)) {
        ApiLevelInfo& info = levels[image.apiLevel];
        if (!info.installed) {
            info.apiLevel = image.apiLevel;
            info.versionName = androidVersionName(image.apiLevel);
            info.packageId = image.packageId;
            info.installed = true;
        }
    }
    for (const auto& image : parseSystemImages(result.stdoutText, false)) {
        if (levels.count(image.apiLevel)) continue;
        if (image.abi != hostAbi()) continue;
        ApiLevelInfo info;
        info.apiLevel = image.apiLevel;
        info.versionName = androidVersionName(image.apiLevel);
        info.packageId = image.packageId;
        levels[image.apiLevel] = info;
    }

    std::vector<ApiLevelInfo> list;
    for (const auto& entry : levels) {
        list.push_back(entry.second);
    }
    return list;
}

void AndroidManager::installSystemImage(const std::string& packageId) {
    CommandResult result = executor_.execute(sdkmanagerPath_, {packageId}, 30 * 60 * 1000);
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to install " + packageId + ": " + combinedOutput(result), result.stderrText);
    }
    LOG_INFO("Installed " + packageId);
}

void AndroidManager::uninstallSystemImage(const std::string& packageId) {
    CommandResult result = executor_.run(sdkmanagerPath_, {"--uninstall", packageId});
    if (!result.success()) {
        throw EmuError(EmuErrorKind::CommandExecutionFailure,
                       "Failed to uninstall " + packageId + ": " + combinedOutput(result), result.stderrText);
    }
    LOG_INFO("Uninstalled " + packageId);
}
