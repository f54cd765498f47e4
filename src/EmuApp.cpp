#include "EmuApp.hpp"
#include "DevicePriority.hpp"
#include "EmuError.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <map>
#include <ostream>
#include <sstream>
#include <poll.h>
#include <unistd.h>

namespace {

constexpr size_t kLogPageSize = 10;
constexpr size_t kVisibleLogLines = 10;
constexpr int kPollIntervalMs = 8;

const std::map<std::string, std::string>& namedKeys() {
    static const std::map<std::string, std::string> keys = {
        {"up", "Up"}, {"down", "Down"}, {"left", "Left"}, {"right", "Right"},
        {"tab", "Tab"}, {"backtab", "BackTab"}, {"enter", "Enter"}, {"esc", "Esc"},
        {"backspace", "Backspace"}, {"space", " "}, {"pageup", "PageUp"},
        {"pagedown", "PageDown"}, {"home", "Home"}, {"end", "End"},
    };
    return keys;
}

std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

void renderAndroidList(std::ostream& out, const std::vector<AndroidDevice>& devices,
                       size_t selected, bool active) {
    out << (active ? "* " : "  ") << "Android (" << devices.size() << ")\n";
    for (size_t i = 0; i < devices.size(); ++i) {
        const auto& d = devices[i];
        std::string version = d.apiLevel == kInvalidApiLevel
            ? "API ?"
            : "API " + std::to_string(d.apiLevel) + " (" + androidVersionName(d.apiLevel) + ")";
        out << (i == selected ? "  > " : "    ") << std::left << std::setw(32) << d.name
            << std::setw(10) << statusToString(d.status) << version << "\n";
    }
}

void renderIosList(std::ostream& out, const std::vector<IosDevice>& devices,
                   size_t selected, bool active) {
    out << (active ? "* " : "  ") << "iOS (" << devices.size() << ")\n";
    for (size_t i = 0; i < devices.size(); ++i) {
        const auto& d = devices[i];
        out << (i == selected ? "  > " : "    ") << std::left << std::setw(40) << d.name
            << std::setw(10) << statusToString(d.status) << (d.isAvailable ? "" : "unavailable") << "\n";
    }
}

void renderCreateForm(std::ostream& out, const CreateDeviceForm& form) {
    out << "Create " << platformToString(form.getPlatform()) << " device"
        << (form.isLoadingCache() ? " (loading catalogs...)" : "") << "\n";

    auto field = [&](CreateDeviceField f, const std::string& label, const std::string& value) {
        out << (form.getActiveField() == f ? "  > " : "    ") << std::left << std::setw(14) << label << value << "\n";
    };
    field(CreateDeviceField::ApiLevel, form.getPlatform() == Platform::Ios ? "iOS version" : "API level",
          form.getVersionDisplay());
    if (form.getPlatform() == Platform::Android) {
        field(CreateDeviceField::Category, "Category", form.getCategoryFilter());
    }
    field(CreateDeviceField::DeviceType, "Device type", form.getDeviceType());
    if (form.getPlatform() == Platform::Android) {
        field(CreateDeviceField::RamSize, "RAM (MB)", form.getRamSize());
        field(CreateDeviceField::StorageSize, "Storage (MB)", form.getStorageSize());
    }
    field(CreateDeviceField::Name, "Name", form.getName());
    if (form.getCreationStatus()) {
        out << "  " << *form.getCreationStatus() << "\n";
    }
    if (form.getErrorMessage()) {
        out << "  Error: " << *form.getErrorMessage() << "\n";
    }
}

void renderDetails(std::ostream& out, const DeviceDetails& details) {
    out << "Details: " << details.name << "\n";
    auto line = [&out](const std::string& label, const std::string& value) {
        if (!value.empty()) {
            out << "    " << std::left << std::setw(14) << label << value << "\n";
        }
    };
    line("Platform", platformToString(details.platform));
    line("Status", details.status);
    line("Version", details.version);
    line("Device type", details.deviceType);
    line("RAM", details.ramSize);
    line("Storage", details.storageSize);
    line("Resolution", details.resolution);
    line("DPI", details.dpi);
    line("Path", details.devicePath);
    line("System image", details.systemImage);
    line("Identifier", details.identifier);
}

} // namespace

EmuApp::EmuApp() : running_(false) {}

EmuApp::EmuApp(std::unique_ptr<CommandExecutor> executor)
    : executor_(std::move(executor)), running_(false) {}

EmuApp::~EmuApp() {
    shutdown();
}

bool EmuApp::initialize(const std::string& configPath, const CommandLineOverrides& overrides) {
    try {
        config_ = ConfigLoader();
        if (!configPath.empty() && !config_.loadFromFile(configPath)) {
            lastError_ = "Failed to load configuration from " + configPath;
            LOG_ERROR(lastError_);
            return false;
        }
        if (!overrides.logLevel.empty()) {
            config_.setLogLevel(overrides.logLevel);
        }
        if (!overrides.logFile.empty()) {
            config_.setLogFile(overrides.logFile);
        }

        AppConfig appConfig = config_.getConfig();
        Logger::getInstance().setLogLevel(Logger::parseLevel(appConfig.logLevel));
        Logger::getInstance().setConsoleOutput(appConfig.consoleLogging);
        if (!appConfig.logFile.empty() && !Logger::getInstance().setLogFile(appConfig.logFile)) {
            lastError_ = "Cannot open log file " + appConfig.logFile;
            return false;
        }

        if (!executor_) {
            executor_ = std::make_unique<ProcessCommandExecutor>();
        }
        executor_->setDefaultTimeoutMs(appConfig.commandTimeoutSeconds * 1000);

        std::string androidHome = config_.resolveAndroidHome();
        std::string androidProblem;
        try {
            android_ = std::make_unique<AndroidManager>(*executor_, androidHome, config_.resolveAvdHome());
            android_->setBootTimeoutSeconds(appConfig.bootTimeoutSeconds);
        } catch (const EmuError& e) {
            androidProblem = e.what();
            LOG_WARNING("Android support disabled: " + androidProblem);
        }

        if (appConfig.enableIos) {
            try {
                ios_ = std::make_unique<IosManager>(*executor_);
            } catch (const EmuError& e) {
                LOG_INFO("iOS support disabled: " + std::string(e.what()));
            }
        }

        if (!android_ && !ios_) {
            lastError_ = androidProblem +
                ". Set ANDROID_HOME or androidHome in the config file to your Android SDK.";
            LOG_ERROR("No platform available: " + lastError_);
            return false;
        }

        std::string cachePath = appConfig.cacheFile.empty() ? DeviceCacheStore::defaultPath() : appConfig.cacheFile;
        cacheStore_ = std::make_unique<DeviceCacheStore>(cachePath, appConfig.cacheMaxAgeSeconds);

        state_.setRefreshIntervals(std::chrono::milliseconds(appConfig.refreshIntervalMs),
                                   std::chrono::milliseconds(appConfig.fastRefreshIntervalMs));
        if (!android_) {
            state_.setActivePanel(Panel::Ios);
            state_.addNotification(Notification::persistent(
                "Android SDK not found: " + androidProblem, NotificationType::Warning));
        }

        orchestrator_ = std::make_unique<BackgroundOrchestrator>(
            state_, *executor_, android_.get(), ios_.get(), cacheStore_.get());
        orchestrator_->setCatalogMaxAge(std::chrono::seconds(appConfig.cacheMaxAgeSeconds));

        batcher_ = std::make_unique<EventBatcher>(
            static_cast<size_t>(appConfig.input.maxBatchSize),
            std::chrono::milliseconds(appConfig.input.debounceMs),
            std::chrono::milliseconds(appConfig.input.navigationBatchMs));

        running_ = true;
        LOG_INFO(std::string("Initialized (Android: ") + (android_ ? "yes" : "no") +
                 ", iOS: " + (ios_ ? "yes" : "no") + ")");
        return true;

    } catch (const std::exception& e) {
        lastError_ = e.what();
        LOG_ERROR("Failed to initialize: " + lastError_);
        return false;
    }
}

int EmuApp::listDevices(std::ostream& out) {
    bool anyListed = false;

    if (android_) {
        try {
            std::vector<AndroidDevice> devices = android_->listDevices();
            renderAndroidList(out, devices, devices.size(), false);
            anyListed = true;
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to list Android devices: " + std::string(e.what()));
            out << "Android: " << formatUserError(e) << "\n";
        }
    }
    if (ios_) {
        try {
            std::vector<IosDevice> devices = ios_->listDevices();
            renderIosList(out, devices, devices.size(), false);
            anyListed = true;
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to list iOS devices: " + std::string(e.what()));
            out << "iOS: " << formatUserError(e) << "\n";
        }
    }
    return anyListed ? 0 : 1;
}

std::vector<InputEvent> EmuApp::parseInputLine(const std::string& line, InputClock::time_point timestamp) {
    std::vector<InputEvent> events;
    std::string trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == '\n')) {
        trimmed.pop_back();
    }

    if (trimmed.empty()) {
        events.push_back(InputEvent::keyPress("Enter", timestamp));
        return events;
    }

    std::string lower = toLower(trimmed);
    if (lower == "quit") {
        InputEvent quit;
        quit.kind = InputEventKind::Quit;
        quit.timestamp = timestamp;
        events.push_back(quit);
        return events;
    }
    auto named = namedKeys().find(lower);
    if (named != namedKeys().end()) {
        events.push_back(InputEvent::keyPress(named->second, timestamp));
        return events;
    }

    for (char c : trimmed) {
        events.push_back(InputEvent::keyPress(std::string(1, c), timestamp));
    }
    return events;
}

void EmuApp::run(int inputFd, std::ostream& out, const std::atomic<bool>& interrupted) {
    if (!running_) {
        LOG_ERROR("run() called before initialize()");
        return;
    }

    orchestrator_->loadCachedDevices();
    orchestrator_->start();
    LOG_INFO("Interactive session started");

    std::string lastSnapshot;
    std::string pending;
    bool quit = false;
    bool inputClosed = false;
    auto lastRender = InputClock::now();

    while (!quit && !interrupted.load()) {
        if (!inputClosed) {
            pollfd fd{inputFd, POLLIN, 0};
            int ready = poll(&fd, 1, kPollIntervalMs);
            if (ready > 0) {
                char buffer[512];
                ssize_t n = read(inputFd, buffer, sizeof(buffer));
                if (n <= 0) {
                    inputClosed = true;
                } else {
                    pending.append(buffer, static_cast<size_t>(n));
                }
            } else if (ready < 0 && errno != EINTR) {
                LOG_ERROR("Failed to poll input: " + std::string(std::strerror(errno)));
                inputClosed = true;
            }
        } else {
            usleep(kPollIntervalMs * 1000);
        }

        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            auto now = InputClock::now();
            for (const auto& event : parseInputLine(line, now)) {
                bool typing = orchestrator_->withState([](const AppState& s) {
                    return s.getMode() == Mode::CreateDevice;
                });
                if (typing || event.kind == InputEventKind::Quit) {
                    // Text entry bypasses navigation batching, h/j/k/l are letters here
                    EventBatch flushed = batcher_->takeBatch(now + std::chrono::hours(1));
                    if (flushed.navigation) {
                        applyNavigation(*flushed.navigation);
                    }
                    for (const auto& queued : flushed.events) {
                        quit = quit || !handleEvent(queued);
                    }
                    quit = quit || !handleEvent(event);
                } else {
                    batcher_->push(event);
                }
            }
        }

        auto now = InputClock::now();
        EventBatch batch = batcher_->takeBatch(now);
        if (batch.navigation) {
            applyNavigation(*batch.navigation);
        }
        for (const auto& event : batch.events) {
            if (!handleEvent(event)) {
                quit = true;
                break;
            }
        }

        if (inputClosed && !batcher_->hasPendingEvents(now + std::chrono::hours(1))) {
            quit = true;
        }

        // Background changes are picked up by re-rendering at most every 250 ms
        if (!batch.empty() || now - lastRender >= std::chrono::milliseconds(250) || quit) {
            std::ostringstream snapshot;
            renderSnapshot(snapshot);
            if (snapshot.str() != lastSnapshot) {
                lastSnapshot = snapshot.str();
                out << lastSnapshot << std::flush;
            }
            lastRender = now;
        }
    }

    LOG_INFO("Interactive session ended");
}

void EmuApp::shutdown() {
    if (!running_) return;

    LOG_INFO("Shutting down...");
    running_ = false;

    if (orchestrator_) {
        orchestrator_->stop();
    }
    LOG_INFO("Shutdown complete");
}

bool EmuApp::handleEvent(const InputEvent& event) {
    if (event.kind == InputEventKind::Quit) {
        return false;
    }
    if (event.kind == InputEventKind::Resize) {
        return true;
    }

    Mode mode = orchestrator_->withState([](const AppState& s) { return s.getMode(); });
    switch (mode) {
        case Mode::CreateDevice: return handleCreateFormKey(event.key);
        case Mode::ConfirmDelete:
        case Mode::ConfirmWipe: return handleConfirmKey(event.key);
        case Mode::ManageApiLevels: return handleApiLevelKey(event.key);
        case Mode::Normal: return handleNormalKey(event.key);
    }
    return true;
}

void EmuApp::applyNavigation(const NavigationStep& step) {
    Mode mode = orchestrator_->withState([](const AppState& s) { return s.getMode(); });

    if (mode == Mode::ManageApiLevels) {
        orchestrator_->updateState([&step](AppState& s) {
            ApiLevelManagement& management = s.getApiLevelManagement();
            const int count = static_cast<int>(management.apiLevels.size());
            if (count > 0) {
                int index = (static_cast<int>(management.selectedIndex) + step.vertical) % count;
                management.selectedIndex = static_cast<size_t>(index < 0 ? index + count : index);
            }
            return 0;
        });
        return;
    }
    if (mode != Mode::Normal) {
        return;
    }

    bool selectionChanged = orchestrator_->updateState([&step](AppState& s) {
        std::optional<Device> before = s.getSelectedDevice();
        for (int i = 0; i < std::abs(step.vertical); ++i) {
            if (step.vertical < 0) {
                s.moveUp();
            } else {
                s.moveDown();
            }
        }
        std::optional<Device> after = s.getSelectedDevice();
        return before.has_value() != after.has_value() ||
               (before && deviceIdentifier(*before) != deviceIdentifier(*after));
    });

    // Left and right alternate between the two device panels
    if (step.horizontal % 2 != 0) {
        switchPanel();
    } else if (selectionChanged) {
        orchestrator_->onSelectionChanged();
    }
}

void EmuApp::switchPanel() {
    orchestrator_->updateState([](AppState& s) {
        s.nextPanel();
        return 0;
    });
    orchestrator_->onSelectionChanged();
}

void EmuApp::openCreateForm() {
    bool opened = orchestrator_->updateState([this](AppState& s) {
        Platform platform = s.getDevicePanel() == Panel::Ios ? Platform::Ios : Platform::Android;
        if ((platform == Platform::Android && !android_) || (platform == Platform::Ios && !ios_)) {
            s.addWarningNotification(platformToString(platform) + " tools are not available");
            return false;
        }
        s.openCreateForm(platform);
        return true;
    });
    if (opened) {
        orchestrator_->requestCreateFormCatalogs();
    }
}

bool EmuApp::handleNormalKey(const std::string& key) {
    if (key == "q") {
        return false;
    }
    if (key == "Tab" || key == "BackTab") {
        switchPanel();
    } else if (key == "Enter") {
        orchestrator_->toggleSelectedDevice();
    } else if (key == "c") {
        openCreateForm();
    } else if (key == "d" || key == "w") {
        orchestrator_->updateState([&key](AppState& s) {
            return key == "d" ? s.beginConfirmDelete() : s.beginConfirmWipe();
        });
    } else if (key == "r") {
        orchestrator_->updateState([](AppState& s) {
            s.addInfoNotification("Refreshing device lists...");
            return 0;
        });
        orchestrator_->requestRefresh();
    } else if (key == "m") {
        if (android_) {
            orchestrator_->updateState([](AppState& s) {
                s.setMode(Mode::ManageApiLevels);
                return 0;
            });
            orchestrator_->requestApiLevels();
        }
    } else if (key == "i") {
        orchestrator_->updateState([](AppState& s) {
            s.setActivePanel(s.getActivePanel() == Panel::Details ? s.getDevicePanel() : Panel::Details);
            return 0;
        });
        orchestrator_->onSelectionChanged();
    } else if (key == "Esc") {
        orchestrator_->updateState([](AppState& s) {
            if (s.getActivePanel() == Panel::Details) {
                s.setActivePanel(s.getDevicePanel());
            }
            return 0;
        });
    } else {
        orchestrator_->updateState([&key](AppState& s) {
            if (key == "f") s.toggleLogFilter();
            else if (key == "s") s.toggleAutoScroll();
            else if (key == "F") s.toggleFullscreenLogs();
            else if (key == "x") s.dismissAllNotifications();
            else if (key == "PageUp") s.scrollLogsPageUp(kLogPageSize);
            else if (key == "PageDown") s.scrollLogsPageDown(kLogPageSize);
            else if (key == "u") s.scrollLogsHalfPageUp(kLogPageSize);
            else if (key == "n") s.scrollLogsHalfPageDown(kLogPageSize);
            else if (key == "Home") s.scrollLogsToTop();
            else if (key == "End") s.scrollLogsToBottom();
            return 0;
        });
    }
    return true;
}

bool EmuApp::handleCreateFormKey(const std::string& key) {
    if (key == "Enter") {
        orchestrator_->requestCreateDevice();
        return true;
    }

    orchestrator_->updateState([&key](AppState& s) {
        CreateDeviceForm& form = s.getCreateDeviceForm();
        if (key == "Esc") {
            s.closeCreateForm();
        } else if (key == "Tab") {
            form.focusNext();
        } else if (key == "BackTab") {
            form.focusPrev();
        } else if (key == "Down") {
            if (!form.moveSelectionDown()) form.focusNext();
        } else if (key == "Up") {
            if (!form.moveSelectionUp()) form.focusPrev();
        } else if (key == "Left" || key == "Right") {
            bool changed = key == "Left" ? form.selectPrevOption() : form.selectNextOption();
            if (changed && form.getActiveField() == CreateDeviceField::Category) {
                form.applyCategoryFilter(s.getFormCatalogCache().androidDeviceTypes);
            }
        } else if (key == "Backspace") {
            form.deleteChar();
        } else if (key.size() == 1) {
            form.insertChar(key[0]);
        }
        return 0;
    });
    return true;
}

bool EmuApp::handleConfirmKey(const std::string& key) {
    Mode mode = orchestrator_->withState([](const AppState& s) { return s.getMode(); });
    if (key == "y" || key == "Y" || key == "Enter") {
        if (mode == Mode::ConfirmDelete) {
            orchestrator_->confirmDelete();
        } else {
            orchestrator_->confirmWipe();
        }
    } else if (key == "n" || key == "N" || key == "Esc" || key == "q") {
        orchestrator_->updateState([](AppState& s) {
            s.cancelDialog();
            return 0;
        });
    }
    return true;
}

bool EmuApp::handleApiLevelKey(const std::string& key) {
    if (key == "Enter") {
        orchestrator_->toggleSelectedApiLevel();
    } else if (key == "Esc" || key == "q") {
        orchestrator_->updateState([](AppState& s) {
            s.setMode(Mode::Normal);
            return 0;
        });
    }
    return true;
}

void EmuApp::renderSnapshot(std::ostream& out) const {
    orchestrator_->withState([&out](const AppState& s) {
        out << "\n";
        if (!s.isFullscreenLogs()) {
            renderAndroidList(out, s.getAndroidDevices(), s.getSelectedAndroid(),
                              s.getActivePanel() == Panel::Android);
            renderIosList(out, s.getIosDevices(), s.getSelectedIos(), s.getActivePanel() == Panel::Ios);

            if (s.getActivePanel() == Panel::Details) {
                std::optional<DeviceDetails> details = s.getSelectedDeviceDetails();
                if (details) {
                    renderDetails(out, *details);
                }
            }
        }

        switch (s.getMode()) {
            case Mode::CreateDevice:
                renderCreateForm(out, s.getCreateDeviceForm());
                break;
            case Mode::ConfirmDelete:
                if (s.getConfirmDeleteDialog()) {
                    out << "Delete device '" << s.getConfirmDeleteDialog()->deviceName << "'? (y/n)\n";
                }
                break;
            case Mode::ConfirmWipe:
                if (s.getConfirmWipeDialog()) {
                    out << "Wipe all data of '" << s.getConfirmWipeDialog()->deviceName << "'? (y/n)\n";
                }
                break;
            case Mode::ManageApiLevels: {
                const ApiLevelManagement& management = s.getApiLevelManagement();
                out << "API levels" << (management.isLoading ? " (loading...)" : "") << "\n";
                for (size_t i = 0; i < management.apiLevels.size(); ++i) {
                    const auto& level = management.apiLevels[i];
                    out << (i == management.selectedIndex ? "  > " : "    ")
                        << (level.installed ? "[x] " : "[ ] ") << "API " << level.apiLevel
                        << " (" << level.versionName << ") " << level.packageId << "\n";
                }
                if (management.errorMessage) {
                    out << "  Error: " << *management.errorMessage << "\n";
                }
                break;
            }
            case Mode::Normal:
                break;
        }

        if (s.getDeviceOperationStatus()) {
            out << "Status: " << *s.getDeviceOperationStatus() << "\n";
        }
        for (const auto& notification : s.getNotifications()) {
            out << "[" << notificationTypeToString(notification.type) << "] " << notification.message << "\n";
        }

        const auto& logDevice = s.getCurrentLogDevice();
        if (logDevice) {
            std::vector<LogEntry> logs = s.getFilteredLogs();
            out << "Logs: " << logDevice->second << " (filter "
                << (s.getLogFilterLevel() ? *s.getLogFilterLevel() : std::string("ALL")) << ")\n";
            size_t end = std::min(logs.size(), s.getLogScrollOffset() + 1);
            size_t begin = end > kVisibleLogLines ? end - kVisibleLogLines : 0;
            for (size_t i = begin; i < end; ++i) {
                out << "  " << logs[i].timestamp << " " << std::left << std::setw(5) << logs[i].level
                    << " " << logs[i].message << "\n";
            }
        }
        return 0;
    });
}
