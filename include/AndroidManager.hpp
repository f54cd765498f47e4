#pragma once
#include "CommandExecutor.hpp"
#include "Device.hpp"
#include <string>
#include <vector>
#include <map>
#include <utility>

class AndroidManager {
public:
    // Throws EmuError(SdkUnavailable) when the SDK root or its tools cannot be found
    AndroidManager(CommandExecutor& executor, const std::string& androidHome, const std::string& avdHome);

    std::vector<AndroidDevice> listDevices();

    // AVD name -> emulator serial for every emulator in the "device" state.
    // Names are also registered with spaces replaced by underscores.
    std::map<std::string, std::string> getRunningAvdNames();

    void createDevice(const DeviceConfig& config);
    void startDevice(const std::string& name);
    void stopDevice(const std::string& name);
    void deleteDevice(const std::string& name);
    void wipeDevice(const std::string& name);

    DeviceDetails getDeviceDetails(const AndroidDevice& device);

    std::vector<AvailableDevice> listAvailableDevices();
    std::vector<SystemImage> listAvailableSystemImages();
    std::vector<ApiTarget> listAvailableTargets();
    std::vector<ApiLevelInfo> listApiLevels();
    void installSystemImage(const std::string& packageId);
    void uninstallSystemImage(const std::string& packageId);

    void setBootTimeoutSeconds(int seconds) { bootTimeoutSeconds_ = seconds; }
    void setBootPollIntervalMs(int ms) { bootPollIntervalMs_ = ms; }

    const std::string& getAvdHome() const { return avdHome_; }
    const std::string& getAdbPath() const { return adbPath_; }

    // Parsing helpers, exposed for tests
    static std::vector<AndroidDevice> parseAvdListOutput(const std::string& output);
    static std::vector<std::pair<std::string, std::string>> parseAdbDevicesOutput(const std::string& output);
    static DeviceStatus mapAdbState(const std::string& state);
    static int parseApiLevelFromTarget(const std::string& target);
    static int parseApiLevelFromConfig(const std::map<std::string, std::string>& config);
    static std::map<std::string, std::string> parseConfigIni(const std::string& content);
    static std::vector<SystemImage> parseSystemImages(const std::string& output, bool installedOnly);
    static std::vector<AvailableDevice> parseDeviceDefinitions(const std::string& output);
    static std::string sanitizeAvdName(const std::string& name);
    static std::string hostAbi();

private:
    std::string findTool(const std::vector<std::string>& candidates, const std::string& fallback) const;
    std::string configIniPath(const AndroidDevice& device) const;
    std::string avdDirectory(const std::string& name) const;
    bool readConfigIni(const std::string& path, std::map<std::string, std::string>& config) const;
    void updateConfigIni(const std::string& path, const std::map<std::string, std::string>& values) const;
    std::string resolveSystemImage(int apiLevel, const DeviceConfig& config);
    std::string findRunningSerial(const std::string& name);
    void waitForBoot(const std::string& name, pid_t emulatorPid);
    [[noreturn]] void throwCreationError(const DeviceConfig& config, const std::string& packageId,
                                         const CommandResult& result) const;

    CommandExecutor& executor_;
    std::string androidHome_;
    std::string avdHome_;
    std::string avdmanagerPath_;
    std::string sdkmanagerPath_;
    std::string emulatorPath_;
    std::string adbPath_;
    int bootTimeoutSeconds_{180};
    int bootPollIntervalMs_{2000};
};
