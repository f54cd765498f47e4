#pragma once
#include "CommandExecutor.hpp"
#include "Device.hpp"
#include <string>
#include <vector>

class IosManager {
public:
    // Throws EmuError(SdkUnavailable) when xcrun cannot be found
    explicit IosManager(CommandExecutor& executor);

    std::vector<IosDevice> listDevices();

    void createDevice(const DeviceConfig& config);
    void startDevice(const std::string& udid);
    void stopDevice(const std::string& udid);
    void deleteDevice(const std::string& udid);
    void wipeDevice(const std::string& udid);

    DeviceDetails getDeviceDetails(const IosDevice& device);

    std::vector<IosDeviceType> listDeviceTypes();
    std::vector<IosRuntime> listRuntimes();

    // Parsing helpers, exposed for tests. A document that is not valid JSON
    // raises EmuError(ParseFailure); bad records are skipped.
    static std::vector<IosDevice> parseDeviceList(const std::string& jsonText);
    static std::vector<IosDeviceType> parseDeviceTypes(const std::string& jsonText);
    static std::vector<IosRuntime> parseRuntimes(const std::string& jsonText);
    static DeviceStatus mapSimulatorState(const std::string& state);
    static std::string versionFromRuntimeKey(const std::string& runtimeKey);
    static std::string parseDeviceTypeDisplayName(const std::string& identifier);
    static std::string resolutionForDeviceType(const std::string& deviceType);

private:
    CommandResult simctl(const std::vector<std::string>& args);
    CommandResult listJson(const std::string& what);
    void quitSimulatorIfIdle();

    CommandExecutor& executor_;
};
