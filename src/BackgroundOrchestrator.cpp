#include "BackgroundOrchestrator.hpp"
#include "DevicePriority.hpp"
#include "EmuError.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <ctime>

namespace {

bool containsAny(const std::string& line, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

Panel panelForPlatform(Platform platform) {
    return platform == Platform::Ios ? Panel::Ios : Panel::Android;
}

} // namespace

BackgroundOrchestrator::BackgroundOrchestrator(AppState& state, CommandExecutor& executor,
                                               AndroidManager* android, IosManager* ios,
                                               DeviceCacheStore* cacheStore)
    : state_(state), executor_(executor), android_(android), ios_(ios), cacheStore_(cacheStore) {
}

BackgroundOrchestrator::~BackgroundOrchestrator() {
    stop();
}

bool BackgroundOrchestrator::start() {
    if (running_.load()) {
        LOG_WARNING("Background orchestrator already running");
        return true;
    }

    try {
        running_.store(true);
        refreshThread_ = std::thread(&BackgroundOrchestrator::refreshLoop, this);
        LOG_INFO("Background orchestrator started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start background orchestrator: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void BackgroundOrchestrator::stop() {
    bool wasRunning = running_.exchange(false);
    wakeCv_.notify_all();
    if (refreshThread_.joinable()) {
        refreshThread_.join();
    }

    stopping_.store(true);
    waitForOperations();
    stopLogStream();

    if (wasRunning) {
        LOG_INFO("Background orchestrator stopped");
    }
}

bool BackgroundOrchestrator::isRunning() const {
    return running_.load();
}

void BackgroundOrchestrator::refreshLoop() {
    LOG_DEBUG("Refresh thread started");

    while (running_.load()) {
        auto now = std::chrono::steady_clock::now();
        bool due = refreshRequested_.exchange(false) ||
                   withState([now](const AppState& s) { return s.shouldAutoRefresh(now); });
        if (due) {
            try {
                refreshDevices();
            } catch (const std::exception& e) {
                LOG_ERROR("Device refresh failed: " + std::string(e.what()));
            }
        }

        updateState([](AppState& s) {
            s.dismissExpiredNotifications(std::chrono::steady_clock::now());
            return 0;
        });

        std::unique_lock<std::mutex> lock(wakeMutex_);
        wakeCv_.wait_for(lock, std::chrono::milliseconds(250), [this] {
            return !running_.load() || refreshRequested_.load();
        });
    }

    LOG_DEBUG("Refresh thread stopped");
}

void BackgroundOrchestrator::requestRefresh() {
    refreshRequested_.store(true);
    wakeCv_.notify_all();
}

void BackgroundOrchestrator::runOperation(const std::string& name, std::function<void()> operation) {
    {
        std::lock_guard<std::mutex> lock(operationsMutex_);
        ++activeOperations_;
    }

    auto finish = [this]() {
        std::lock_guard<std::mutex> lock(operationsMutex_);
        --activeOperations_;
        operationsCv_.notify_all();
    };

    try {
        std::thread([this, name, operation, finish]() {
            try {
                operation();
            } catch (const std::exception& e) {
                LOG_ERROR("Operation '" + name + "' failed: " + std::string(e.what()));
                updateState([&e](AppState& s) {
                    s.clearDeviceOperationStatus();
                    s.addErrorNotification(formatUserError(e));
                    return 0;
                });
            }
            finish();
        }).detach();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start operation '" + name + "': " + std::string(e.what()));
        finish();
    }
}

void BackgroundOrchestrator::waitForOperations() {
    std::unique_lock<std::mutex> lock(operationsMutex_);
    if (activeOperations_ > 0) {
        LOG_INFO("Waiting for " + std::to_string(activeOperations_) + " device operation(s) to finish");
    }
    operationsCv_.wait(lock, [this] { return activeOperations_ == 0; });
}

AndroidManager& BackgroundOrchestrator::androidManager() const {
    if (!android_) {
        throw EmuError(EmuErrorKind::SdkUnavailable, "Android SDK is not available");
    }
    return *android_;
}

IosManager& BackgroundOrchestrator::iosManager() const {
    if (!ios_) {
        throw EmuError(EmuErrorKind::SdkUnavailable, "iOS simulator tools are not available");
    }
    return *ios_;
}

bool BackgroundOrchestrator::loadCachedDevices() {
    if (!cacheStore_) {
        return false;
    }

    DeviceCacheSnapshot snapshot;
    if (!cacheStore_->load(snapshot)) {
        return false;
    }

    auto age = std::chrono::seconds(std::max<long long>(0, std::time(nullptr) - snapshot.lastUpdated));
    updateState([&snapshot, age](AppState& s) {
        s.setAndroidDevices(snapshot.androidDevices);
        s.setIosDevices(snapshot.iosDevices);
        auto& catalog = s.getFormCatalogCache();
        auto loadedAt = std::chrono::steady_clock::now() - age;
        if (!snapshot.androidDeviceTypes.empty() || !snapshot.androidTargets.empty()) {
            catalog.updateAndroid(snapshot.androidDeviceTypes, snapshot.androidTargets, loadedAt);
        }
        if (!snapshot.iosDeviceTypes.empty() || !snapshot.iosRuntimes.empty()) {
            catalog.updateIos(snapshot.iosDeviceTypes, snapshot.iosRuntimes, loadedAt);
        }
        return 0;
    });
    DevicePriorityCache::getInstance().loadDeviceCatalog(snapshot.androidDeviceTypes);

    LOG_INFO("Loaded " + std::to_string(snapshot.androidDevices.size()) + " Android and " +
             std::to_string(snapshot.iosDevices.size()) + " iOS devices from cache");
    return true;
}

void BackgroundOrchestrator::refreshDevices() {
    std::vector<AndroidDevice> androidDevices;
    std::vector<IosDevice> iosDevices;
    bool androidOk = false;
    bool iosOk = false;

    if (android_) {
        try {
            androidDevices = android_->listDevices();
            androidOk = true;
        } catch (const std::exception& e) {
            LOG_WARNING("Failed to list Android devices: " + std::string(e.what()));
        }
    }
    if (ios_) {
        try {
            iosDevices = ios_->listDevices();
            iosOk = true;
        } catch (const std::exception& e) {
            LOG_WARNING("Failed to list iOS devices: " + std::string(e.what()));
        }
    }

    bool startedSelected = false;
    updateState([&](AppState& s) {
        std::vector<std::string> nowRunning;
        auto applyInFlight = [&](auto& device, Platform platform, const std::string& identifier) {
            if (s.isPendingDeviceStart(identifier)) {
                if (device.isRunning) {
                    nowRunning.push_back(identifier);
                    s.addSuccessNotification("Device '" + device.name + "' is now running!");
                    inFlight_.erase({platform, identifier});
                    return;
                }
            }
            auto it = inFlight_.find({platform, identifier});
            if (it == inFlight_.end()) {
                return;
            }
            // Keep the in-flight status until the operation reaches its target
            bool reached = (it->second == DeviceStatus::Starting && device.isRunning) ||
                           (it->second == DeviceStatus::Stopping && !device.isRunning);
            if (!reached) {
                setStatus(device, it->second);
            }
        };

        if (androidOk) {
            for (auto& device : androidDevices) {
                applyInFlight(device, Platform::Android, device.name);
            }
            s.setAndroidDevices(std::move(androidDevices));
        }
        if (iosOk) {
            for (auto& device : iosDevices) {
                applyInFlight(device, Platform::Ios, device.udid);
            }
            s.setIosDevices(std::move(iosDevices));
        }

        std::optional<Device> selected = s.getSelectedDevice();
        for (const auto& identifier : nowRunning) {
            s.removePendingDeviceStart(identifier);
            if (selected && deviceIdentifier(*selected) == identifier) {
                startedSelected = true;
            }
        }
        if (!nowRunning.empty() && s.getPendingDeviceStarts().empty()) {
            s.clearDeviceOperationStatus();
        }
        s.markRefreshed(std::chrono::steady_clock::now());
        return 0;
    });

    saveCache();
    updateLogStream();
    if (startedSelected) {
        updateDeviceDetails();
    }
}

void BackgroundOrchestrator::toggleSelectedDevice() {
    enum class Action { None, Start, Stop };
    Platform platform = Platform::Android;
    std::string identifier;
    std::string name;

    // Decide and mark under one lock so two toggles cannot both pass the check
    Action action = updateState([&](AppState& s) {
        std::optional<Device> device = s.getSelectedDevice();
        if (!device) {
            return Action::None;
        }
        platform = devicePlatform(*device);
        identifier = deviceIdentifier(*device);
        name = deviceName(*device);

        try {
            auto inFlight = inFlight_.find({platform, identifier});
            DeviceStatus status = inFlight != inFlight_.end() ? inFlight->second : deviceStatus(*device);
            if (status == DeviceStatus::Starting || s.isPendingDeviceStart(identifier)) {
                throw EmuError(EmuErrorKind::ConcurrentOperationConflict,
                               "Device '" + name + "' is already starting");
            }
            if (status == DeviceStatus::Stopping || inFlight != inFlight_.end()) {
                throw EmuError(EmuErrorKind::ConcurrentOperationConflict,
                               "Device '" + name + "' is already stopping");
            }

            if (deviceIsRunning(*device)) {
                inFlight_[{platform, identifier}] = DeviceStatus::Stopping;
                s.setDeviceStatus(platform, identifier, DeviceStatus::Stopping);
                s.setDeviceOperationStatus("Stopping device '" + name + "'...");
                return Action::Stop;
            }

            s.addPendingDeviceStart(identifier);
        } catch (const EmuError& e) {
            LOG_WARNING(e.what());
            s.addWarningNotification(formatUserError(e));
            return Action::None;
        }
        inFlight_[{platform, identifier}] = DeviceStatus::Starting;
        s.setDeviceStatus(platform, identifier, DeviceStatus::Starting);
        s.setDeviceOperationStatus("Starting device '" + name + "'...");
        s.addInfoNotification("Starting device '" + name + "'...");
        return Action::Start;
    });

    if (action == Action::Stop) {
        runOperation("stop " + name, [this, platform, identifier, name]() {
            performStop(platform, identifier, name);
        });
    } else if (action == Action::Start) {
        runOperation("start " + name, [this, platform, identifier, name]() {
            performStart(platform, identifier, name);
        });
        requestRefresh();
    }
}

void BackgroundOrchestrator::performStart(Platform platform, const std::string& identifier,
                                          const std::string& name) {
    try {
        if (platform == Platform::Android) {
            androidManager().startDevice(identifier);
        } else {
            iosManager().startDevice(identifier);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start device '" + name + "': " + std::string(e.what()));
        updateState([&](AppState& s) {
            inFlight_.erase({platform, identifier});
            s.removePendingDeviceStart(identifier);
            s.clearDeviceOperationStatus();
            s.setDeviceStatus(platform, identifier, DeviceStatus::Error);
            s.addErrorNotification("Failed to start device '" + name + "': " + formatUserError(e));
            return 0;
        });
        return;
    }

    LOG_INFO("Device '" + name + "' started");
    updateState([&](AppState& s) {
        inFlight_.erase({platform, identifier});
        s.setDeviceStatus(platform, identifier, DeviceStatus::Running);
        if (s.isPendingDeviceStart(identifier)) {
            s.removePendingDeviceStart(identifier);
            s.addSuccessNotification("Device '" + name + "' is now running!");
        }
        if (s.getPendingDeviceStarts().empty()) {
            s.clearDeviceOperationStatus();
        }
        return 0;
    });
    refreshDevices();
}

void BackgroundOrchestrator::performStop(Platform platform, const std::string& identifier,
                                         const std::string& name) {
    try {
        if (platform == Platform::Android) {
            androidManager().stopDevice(identifier);
        } else {
            iosManager().stopDevice(identifier);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to stop device '" + name + "': " + std::string(e.what()));
        updateState([&](AppState& s) {
            inFlight_.erase({platform, identifier});
            s.clearDeviceOperationStatus();
            s.setDeviceStatus(platform, identifier, DeviceStatus::Error);
            s.addErrorNotification("Failed to stop device '" + name + "': " + formatUserError(e));
            return 0;
        });
        return;
    }

    LOG_INFO("Device '" + name + "' stopped");
    updateState([&](AppState& s) {
        inFlight_.erase({platform, identifier});
        s.setDeviceStatus(platform, identifier, DeviceStatus::Stopped);
        s.clearDeviceOperationStatus();
        s.clearCachedDeviceDetails();
        s.addSuccessNotification("Device '" + name + "' stopped");
        return 0;
    });
    refreshDevices();
}

bool BackgroundOrchestrator::requestCreateDevice() {
    DeviceConfig config;
    Platform platform = Platform::Android;

    bool accepted = updateState([&](AppState& s) {
        CreateDeviceForm& form = s.getCreateDeviceForm();
        if (form.isCreating()) {
            return false;
        }
        if (!form.validate()) {
            return false;
        }
        config = form.toDeviceConfig();
        platform = form.getPlatform();
        form.setCreating(true);
        form.setCreationStatus("Creating device '" + config.name + "'...");
        s.setDeviceOperationStatus("Creating device '" + config.name + "'...");
        return true;
    });
    if (!accepted) {
        return false;
    }

    runOperation("create " + config.name, [this, config, platform]() {
        try {
            if (platform == Platform::Android) {
                androidManager().createDevice(config);
            } else {
                iosManager().createDevice(config);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to create device '" + config.name + "': " + std::string(e.what()));
            std::string message = formatUserError(e);
            updateState([&](AppState& s) {
                CreateDeviceForm& form = s.getCreateDeviceForm();
                form.setCreating(false);
                form.clearCreationStatus();
                form.setErrorMessage(message);
                s.clearDeviceOperationStatus();
                s.addErrorNotification("Failed to create device: " + message);
                return 0;
            });
            return;
        }

        LOG_INFO("Device '" + config.name + "' created");
        updateState([&](AppState& s) {
            if (s.getMode() == Mode::CreateDevice) {
                s.closeCreateForm();
            }
            s.clearDeviceOperationStatus();
            s.addSuccessNotification("Device '" + config.name + "' created successfully");
            return 0;
        });
        refreshDevices();
    });
    return true;
}

void BackgroundOrchestrator::confirmDelete() {
    std::optional<ConfirmDeleteDialog> dialog = updateState([](AppState& s) {
        std::optional<ConfirmDeleteDialog> current = s.getConfirmDeleteDialog();
        s.cancelDialog();
        if (current) {
            s.setDeviceOperationStatus("Deleting device '" + current->deviceName + "'...");
        }
        return current;
    });
    if (!dialog) {
        return;
    }

    runOperation("delete " + dialog->deviceName, [this, dialog]() {
        try {
            if (dialog->platform == Platform::Android) {
                androidManager().deleteDevice(dialog->deviceIdentifier);
            } else {
                iosManager().deleteDevice(dialog->deviceIdentifier);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to delete device '" + dialog->deviceName + "': " + std::string(e.what()));
            updateState([&](AppState& s) {
                s.clearDeviceOperationStatus();
                s.addErrorNotification("Failed to delete device '" + dialog->deviceName + "': " + formatUserError(e));
                return 0;
            });
            return;
        }

        updateState([&](AppState& s) {
            const auto& current = s.getCurrentLogDevice();
            if (current && current->second == dialog->deviceIdentifier) {
                s.clearCurrentLogDevice();
            }
            s.clearCachedDeviceDetails();
            s.clearDeviceOperationStatus();
            s.addSuccessNotification("Device '" + dialog->deviceName + "' deleted");
            return 0;
        });
        refreshDevices();
    });
}

void BackgroundOrchestrator::confirmWipe() {
    std::optional<ConfirmWipeDialog> dialog = updateState([](AppState& s) {
        std::optional<ConfirmWipeDialog> current = s.getConfirmWipeDialog();
        s.cancelDialog();
        if (current) {
            s.setDeviceOperationStatus("Wiping device '" + current->deviceName + "'...");
        }
        return current;
    });
    if (!dialog) {
        return;
    }

    runOperation("wipe " + dialog->deviceName, [this, dialog]() {
        try {
            if (dialog->platform == Platform::Android) {
                androidManager().wipeDevice(dialog->deviceIdentifier);
            } else {
                iosManager().wipeDevice(dialog->deviceIdentifier);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to wipe device '" + dialog->deviceName + "': " + std::string(e.what()));
            updateState([&](AppState& s) {
                s.clearDeviceOperationStatus();
                s.addErrorNotification("Failed to wipe device '" + dialog->deviceName + "': " + formatUserError(e));
                return 0;
            });
            return;
        }

        updateState([&](AppState& s) {
            s.clearDeviceOperationStatus();
            s.addSuccessNotification("Device '" + dialog->deviceName + "' wiped");
            return 0;
        });
        refreshDevices();
    });
}

std::string BackgroundOrchestrator::classifyAndroidLogLine(const std::string& line) {
    // logcat -v time puts the level before the tag: "E/Tag(123):"
    if (containsAny(line, {" E ", " E/", "ERROR"})) return "ERROR";
    if (containsAny(line, {" W ", " W/", "WARN"})) return "WARN";
    if (containsAny(line, {" I ", " I/", "INFO"})) return "INFO";
    if (containsAny(line, {" D ", " D/", "DEBUG"})) return "DEBUG";
    return "INFO";
}

std::string BackgroundOrchestrator::classifyIosLogLine(const std::string& line) {
    if (containsAny(line, {"error", "Error"})) return "ERROR";
    if (containsAny(line, {"warning", "Warning"})) return "WARN";
    return "INFO";
}

void BackgroundOrchestrator::updateLogStream() {
    Panel panel = Panel::Android;
    std::string identifier;
    std::string name;
    uint64_t generation = 0;

    if (stopping_.load()) {
        return;
    }

    bool startStream = updateState([&](AppState& s) {
        std::optional<Device> device = s.getSelectedDevice();
        if (!device) {
            s.clearCurrentLogDevice();
            return false;
        }

        panel = panelForPlatform(devicePlatform(*device));
        identifier = deviceIdentifier(*device);
        name = deviceName(*device);

        const auto& current = s.getCurrentLogDevice();
        if (current && current->first == panel && current->second == identifier) {
            return false;
        }

        if (!deviceIsRunning(*device)) {
            s.clearCurrentLogDevice();
            return false;
        }

        s.setCurrentLogDevice(panel, identifier);
        s.clearLogs();
        s.resetLogScroll();
        generation = ++logGeneration_;
        return true;
    });
    if (!startStream) {
        return;
    }

    std::lock_guard<std::mutex> lock(logThreadMutex_);
    if (logThread_.joinable()) {
        logThread_.join();
    }
    logThread_ = std::thread(&BackgroundOrchestrator::streamLogs, this, panel, identifier, name, generation);
}

void BackgroundOrchestrator::scheduleLogStreamUpdate(std::chrono::milliseconds delay) {
    uint64_t token = ++logUpdateToken_;
    runOperation("log stream update", [this, delay, token]() {
        std::this_thread::sleep_for(delay);
        // A newer request supersedes this one
        if (logUpdateToken_.load() != token) {
            return;
        }
        updateLogStream();
    });
}

void BackgroundOrchestrator::onSelectionChanged() {
    scheduleLogStreamUpdate(std::chrono::milliseconds(100));
    runOperation("device details", [this]() { updateDeviceDetails(); });
}

bool BackgroundOrchestrator::isLogStreamActive(Panel panel, const std::string& identifier,
                                               uint64_t generation) const {
    if (logGeneration_.load() != generation) {
        return false;
    }
    return withState([&](const AppState& s) {
        const auto& current = s.getCurrentLogDevice();
        return current && current->first == panel && current->second == identifier;
    });
}

void BackgroundOrchestrator::stopLogStream() {
    ++logGeneration_;
    std::lock_guard<std::mutex> lock(logThreadMutex_);
    if (logThread_.joinable()) {
        logThread_.join();
    }
}

void BackgroundOrchestrator::streamLogs(Panel panel, const std::string& identifier,
                                        const std::string& name, uint64_t generation) {
    LOG_DEBUG("Log stream started for " + name);
    auto keepGoing = [this, panel, identifier, generation]() {
        return isLogStreamActive(panel, identifier, generation);
    };

    try {
        if (panel == Panel::Ios) {
            streamIosLogs(identifier, keepGoing);
        } else {
            streamAndroidLogs(name, keepGoing);
        }
    } catch (const std::exception& e) {
        LOG_WARNING("Log stream for '" + name + "' failed: " + std::string(e.what()));
        if (keepGoing()) {
            updateState([&e](AppState& s) {
                s.addLog("ERROR", "Log stream failed: " + formatUserError(e));
                return 0;
            });
        }
    }

    // The stream ended on its own, so a later update may start a new one
    updateState([&](AppState& s) {
        const auto& current = s.getCurrentLogDevice();
        if (logGeneration_.load() == generation && current &&
            current->first == panel && current->second == identifier) {
            s.clearCurrentLogDevice();
        }
        return 0;
    });
    LOG_DEBUG("Log stream ended for " + name);
}

void BackgroundOrchestrator::streamAndroidLogs(const std::string& name,
                                               const CommandExecutor::KeepGoing& keepGoing) {
    std::map<std::string, std::string> running = androidManager().getRunningAvdNames();

    std::string serial;
    std::string normalized = name;
    std::replace(normalized.begin(), normalized.end(), ' ', '_');
    if (running.count(name)) {
        serial = running[name];
    } else if (running.count(normalized)) {
        serial = running[normalized];
    } else if (!running.empty()) {
        serial = running.begin()->second;
        LOG_DEBUG("No serial for '" + name + "', using " + serial);
    }

    if (serial.empty()) {
        updateState([&name](AppState& s) {
            s.addLog("WARN", "No running emulator found for '" + name + "'");
            return 0;
        });
        return;
    }

    executor_.streamLines(androidManager().getAdbPath(), {"-s", serial, "logcat", "-v", "time"},
        [this](const std::string& line) {
            if (isBlank(line)) {
                return;
            }
            std::string level = classifyAndroidLogLine(line);
            updateState([&](AppState& s) {
                s.addLog(level, line);
                return 0;
            });
        },
        keepGoing);
}

void BackgroundOrchestrator::streamIosLogs(const std::string& udid,
                                           const CommandExecutor::KeepGoing& keepGoing) {
    const std::vector<std::pair<std::string, std::vector<std::string>>> commands = {
        {"xcrun", {"simctl", "spawn", udid, "log", "stream"}},
        {"log", {"stream", "--style", "compact"}},
        {"log", {"stream"}},
    };

    auto onLine = [this](const std::string& line) {
        if (isBlank(line)) {
            return;
        }
        std::string level = classifyIosLogLine(line);
        updateState([&](AppState& s) {
            s.addLog(level, line);
            return 0;
        });
    };

    for (const auto& command : commands) {
        try {
            executor_.streamLines(command.first, command.second, onLine, keepGoing);
            return;
        } catch (const EmuError& e) {
            if (e.kind() != EmuErrorKind::SdkUnavailable && e.kind() != EmuErrorKind::PermissionDenied) {
                throw;
            }
            LOG_DEBUG("Cannot launch " + CommandExecutor::formatCommandLine(command.first, command.second) +
                      ", trying next log source");
        }
    }
    throw EmuError(EmuErrorKind::SdkUnavailable, "No log stream source available for " + udid);
}

void BackgroundOrchestrator::updateDeviceDetails() {
    std::optional<Device> device = withState([](const AppState& s) { return s.getSelectedDevice(); });
    if (!device) {
        return;
    }

    DeviceDetails details;
    try {
        if (const auto* android = std::get_if<AndroidDevice>(&*device)) {
            details = androidManager().getDeviceDetails(*android);
        } else if (const auto* ios = std::get_if<IosDevice>(&*device)) {
            details = iosManager().getDeviceDetails(*ios);
        }
    } catch (const std::exception& e) {
        LOG_WARNING("Failed to load details for '" + deviceName(*device) + "': " + std::string(e.what()));
        return;
    }

    updateState([&](AppState& s) {
        std::optional<Device> selected = s.getSelectedDevice();
        if (selected && deviceIdentifier(*selected) == details.identifier) {
            s.updateCachedDeviceDetails(details);
        }
        return 0;
    });
}

void BackgroundOrchestrator::loadCreateFormCatalogs() {
    auto now = std::chrono::steady_clock::now();
    Platform platform = Platform::Android;
    bool fresh = updateState([&](AppState& s) {
        platform = s.getCreateDeviceForm().getPlatform();
        s.getCreateDeviceForm().setLoadingCache(true);
        const FormCatalogCache& catalog = s.getFormCatalogCache();
        if (catalog.isStale(catalogMaxAge_, now)) {
            return false;
        }
        return platform == Platform::Android
            ? !catalog.androidTargets.empty()
            : !catalog.iosRuntimes.empty();
    });

    if (!fresh) {
        try {
            if (platform == Platform::Android) {
                std::vector<AvailableDevice> deviceTypes = androidManager().listAvailableDevices();
                std::vector<ApiTarget> targets = androidManager().listAvailableTargets();
                DevicePriorityCache::getInstance().loadDeviceCatalog(deviceTypes);
                updateState([&](AppState& s) {
                    s.getFormCatalogCache().updateAndroid(deviceTypes, targets, std::chrono::steady_clock::now());
                    return 0;
                });
            } else {
                std::vector<IosDeviceType> deviceTypes = iosManager().listDeviceTypes();
                std::vector<IosRuntime> runtimes = iosManager().listRuntimes();
                updateState([&](AppState& s) {
                    s.getFormCatalogCache().updateIos(deviceTypes, runtimes, std::chrono::steady_clock::now());
                    return 0;
                });
            }
            saveCache();
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to load device catalogs: " + std::string(e.what()));
            std::string message = formatUserError(e);
            updateState([&](AppState& s) {
                s.getCreateDeviceForm().setLoadingCache(false);
                s.getCreateDeviceForm().setErrorMessage(message);
                s.addErrorNotification("Failed to load device catalogs: " + message);
                return 0;
            });
            return;
        }
    }

    applyCatalogsToForm();
}

void BackgroundOrchestrator::requestCreateFormCatalogs() {
    runOperation("load catalogs", [this]() { loadCreateFormCatalogs(); });
}

void BackgroundOrchestrator::requestApiLevels() {
    runOperation("load api levels", [this]() { loadApiLevels(); });
}

void BackgroundOrchestrator::applyCatalogsToForm() {
    updateState([](AppState& s) {
        CreateDeviceForm& form = s.getCreateDeviceForm();
        const FormCatalogCache& catalog = s.getFormCatalogCache();
        form.setLoadingCache(false);
        if (s.getMode() != Mode::CreateDevice) {
            return 0;
        }

        std::vector<std::pair<std::string, std::string>> versions;
        if (form.getPlatform() == Platform::Android) {
            for (const auto& target : catalog.androidTargets) {
                versions.emplace_back(std::to_string(target.apiLevel), target.display);
            }
            form.setAvailableVersions(versions);
            form.applyCategoryFilter(catalog.androidDeviceTypes);
            if (versions.empty()) {
                form.setErrorMessage("No system images installed. Install one with sdkmanager first.");
            }
        } else {
            for (const auto& runtime : catalog.iosRuntimes) {
                std::string display = runtime.name.rfind("iOS", 0) == 0 ? runtime.name : "iOS " + runtime.version;
                versions.emplace_back(runtime.identifier, display);
            }
            form.setAvailableVersions(versions);
            std::vector<std::pair<std::string, std::string>> deviceTypes;
            for (const auto& type : catalog.iosDeviceTypes) {
                deviceTypes.emplace_back(type.identifier, type.name);
            }
            form.setAvailableDeviceTypes(deviceTypes);
            if (versions.empty()) {
                form.setErrorMessage("No iOS runtimes available");
            }
        }
        return 0;
    });
}

void BackgroundOrchestrator::loadApiLevels() {
    updateState([](AppState& s) {
        s.setMode(Mode::ManageApiLevels);
        s.getApiLevelManagement().isLoading = true;
        s.getApiLevelManagement().errorMessage.reset();
        return 0;
    });

    try {
        std::vector<ApiLevelInfo> levels = androidManager().listApiLevels();
        updateState([&levels](AppState& s) {
            ApiLevelManagement& management = s.getApiLevelManagement();
            management.apiLevels = std::move(levels);
            management.isLoading = false;
            if (management.selectedIndex >= management.apiLevels.size()) {
                management.selectedIndex = 0;
            }
            return 0;
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list API levels: " + std::string(e.what()));
        std::string message = formatUserError(e);
        updateState([&message](AppState& s) {
            s.getApiLevelManagement().isLoading = false;
            s.getApiLevelManagement().errorMessage = message;
            return 0;
        });
    }
}

void BackgroundOrchestrator::toggleSelectedApiLevel() {
    std::optional<ApiLevelInfo> level = updateState([](AppState& s) -> std::optional<ApiLevelInfo> {
        ApiLevelManagement& management = s.getApiLevelManagement();
        if (management.installingPackage || management.selectedIndex >= management.apiLevels.size()) {
            return std::nullopt;
        }
        ApiLevelInfo info = management.apiLevels[management.selectedIndex];
        management.installingPackage = info.packageId;
        s.setDeviceOperationStatus((info.installed ? "Uninstalling " : "Installing ") + info.packageId + "...");
        return info;
    });
    if (!level) {
        return;
    }

    runOperation("api level " + level->packageId, [this, level]() {
        try {
            if (level->installed) {
                androidManager().uninstallSystemImage(level->packageId);
            } else {
                androidManager().installSystemImage(level->packageId);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("System image operation failed: " + std::string(e.what()));
            updateState([&](AppState& s) {
                s.getApiLevelManagement().installingPackage.reset();
                s.clearDeviceOperationStatus();
                s.addErrorNotification(formatUserError(e));
                return 0;
            });
            return;
        }

        updateState([&](AppState& s) {
            s.getApiLevelManagement().installingPackage.reset();
            s.clearDeviceOperationStatus();
            // Targets changed, the next form opening reloads them
            s.getFormCatalogCache().lastUpdated.reset();
            s.addSuccessNotification("API " + std::to_string(level->apiLevel) +
                                     (level->installed ? " uninstalled" : " installed"));
            return 0;
        });
        loadApiLevels();
    });
}

void BackgroundOrchestrator::saveCache() {
    if (!cacheStore_) {
        return;
    }

    DeviceCacheSnapshot snapshot = withState([](const AppState& s) {
        DeviceCacheSnapshot snap;
        snap.androidDevices = s.getAndroidDevices();
        snap.iosDevices = s.getIosDevices();
        const FormCatalogCache& catalog = s.getFormCatalogCache();
        snap.androidDeviceTypes = catalog.androidDeviceTypes;
        snap.androidTargets = catalog.androidTargets;
        snap.iosDeviceTypes = catalog.iosDeviceTypes;
        snap.iosRuntimes = catalog.iosRuntimes;
        return snap;
    });

    std::lock_guard<std::mutex> lock(cacheMutex_);
    // Only the content is compared, the timestamp changes every time
    std::string content = snapshot.toJson().dump();
    if (content == lastSavedCache_) {
        return;
    }
    snapshot.lastUpdated = std::time(nullptr);
    if (cacheStore_->save(snapshot)) {
        lastSavedCache_ = content;
    }
}
