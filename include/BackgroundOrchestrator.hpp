#pragma once
#include "AndroidManager.hpp"
#include "AppState.hpp"
#include "CommandExecutor.hpp"
#include "DeviceCacheStore.hpp"
#include "IosManager.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>

// Runs everything that talks to the SDK tools off the input thread and
// writes the results back into the shared AppState. Tool commands never run
// while the state lock is held.
class BackgroundOrchestrator {
public:
    // Either manager may be null when its platform is unavailable
    BackgroundOrchestrator(AppState& state, CommandExecutor& executor,
                           AndroidManager* android, IosManager* ios,
                           DeviceCacheStore* cacheStore = nullptr);
    ~BackgroundOrchestrator();

    BackgroundOrchestrator(const BackgroundOrchestrator&) = delete;
    BackgroundOrchestrator& operator=(const BackgroundOrchestrator&) = delete;

    // Starts the periodic refresh thread
    bool start();
    // Stops refresh and log streaming, then waits for running operations
    void stop();
    bool isRunning() const;

    template <typename Fn>
    auto withState(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        return fn(static_cast<const AppState&>(state_));
    }

    template <typename Fn>
    auto updateState(Fn&& fn) {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        return fn(state_);
    }

    // Seeds AppState from the persistent cache; false when nothing usable was found
    bool loadCachedDevices();
    void refreshDevices();
    void requestRefresh();

    // Starts a stopped device or stops a running one, asynchronously
    void toggleSelectedDevice();
    // Validates the create form and creates the device asynchronously.
    // False when validation failed or a creation is already running.
    bool requestCreateDevice();
    void confirmDelete();
    void confirmWipe();

    void updateLogStream();
    // Log update after a panel or selection change, coalesced over the delay
    void scheduleLogStreamUpdate(std::chrono::milliseconds delay);
    void updateDeviceDetails();
    void onSelectionChanged();

    void loadCreateFormCatalogs();
    void loadApiLevels();
    // Asynchronous variants for the input thread
    void requestCreateFormCatalogs();
    void requestApiLevels();
    // Installs the selected API level, or uninstalls it when already installed
    void toggleSelectedApiLevel();

    // Blocks until every asynchronous operation has finished
    void waitForOperations();

    void setCatalogMaxAge(std::chrono::seconds maxAge) { catalogMaxAge_ = maxAge; }

    static std::string classifyAndroidLogLine(const std::string& line);
    static std::string classifyIosLogLine(const std::string& line);

private:
    void refreshLoop();
    void runOperation(const std::string& name, std::function<void()> operation);

    void performStart(Platform platform, const std::string& identifier, const std::string& name);
    void performStop(Platform platform, const std::string& identifier, const std::string& name);

    void streamLogs(Panel panel, const std::string& identifier, const std::string& name, uint64_t generation);
    void streamAndroidLogs(const std::string& name, const CommandExecutor::KeepGoing& keepGoing);
    void streamIosLogs(const std::string& udid, const CommandExecutor::KeepGoing& keepGoing);
    bool isLogStreamActive(Panel panel, const std::string& identifier, uint64_t generation) const;
    void stopLogStream();

    void applyCatalogsToForm();
    void saveCache();

    AndroidManager& androidManager() const;
    IosManager& iosManager() const;

    AppState& state_;
    mutable std::shared_mutex stateMutex_;
    CommandExecutor& executor_;
    AndroidManager* android_;
    IosManager* ios_;
    DeviceCacheStore* cacheStore_;
    std::chrono::seconds catalogMaxAge_{300};

    // Starting/Stopping statuses of in-flight operations, guarded by stateMutex_
    std::map<std::pair<Platform, std::string>, DeviceStatus> inFlight_;

    std::atomic<bool> running_{false};
    std::atomic<bool> refreshRequested_{false};
    std::atomic<bool> stopping_{false};
    std::thread refreshThread_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;

    std::mutex logThreadMutex_;
    std::thread logThread_;
    std::atomic<uint64_t> logGeneration_{0};
    std::atomic<uint64_t> logUpdateToken_{0};

    std::mutex operationsMutex_;
    std::condition_variable operationsCv_;
    int activeOperations_{0};

    std::mutex cacheMutex_;
    std::string lastSavedCache_;
};
