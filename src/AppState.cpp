#include "AppState.hpp"
#include "DevicePriority.hpp"
#include "EmuError.hpp"
#include <algorithm>
#include <ctime>

namespace {

constexpr std::chrono::milliseconds kNotificationLifetime{5000};

std::string currentTimeOfDay() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm_buf);
    return buffer;
}

Platform platformForPanel(Panel panel) {
    return panel == Panel::Ios ? Platform::Ios : Platform::Android;
}

} // namespace

std::string panelToString(Panel panel) {
    switch (panel) {
        case Panel::Android: return "Android";
        case Panel::Ios: return "iOS";
        case Panel::Details: return "Details";
        default: return "Unknown";
    }
}

std::string modeToString(Mode mode) {
    switch (mode) {
        case Mode::Normal: return "Normal";
        case Mode::CreateDevice: return "CreateDevice";
        case Mode::ConfirmDelete: return "ConfirmDelete";
        case Mode::ConfirmWipe: return "ConfirmWipe";
        case Mode::ManageApiLevels: return "ManageApiLevels";
        default: return "Unknown";
    }
}

std::string notificationTypeToString(NotificationType type) {
    switch (type) {
        case NotificationType::Success: return "SUCCESS";
        case NotificationType::Error: return "ERROR";
        case NotificationType::Warning: return "WARNING";
        case NotificationType::Info: return "INFO";
        default: return "UNKNOWN";
    }
}

Notification Notification::success(const std::string& message) {
    return Notification{message, NotificationType::Success, std::chrono::steady_clock::now(), kNotificationLifetime};
}

Notification Notification::error(const std::string& message) {
    // Errors stay until dismissed
    return persistent(message, NotificationType::Error);
}

Notification Notification::warning(const std::string& message) {
    return Notification{message, NotificationType::Warning, std::chrono::steady_clock::now(), kNotificationLifetime};
}

Notification Notification::info(const std::string& message) {
    return Notification{message, NotificationType::Info, std::chrono::steady_clock::now(), kNotificationLifetime};
}

Notification Notification::persistent(const std::string& message, NotificationType type) {
    return Notification{message, type, std::chrono::steady_clock::now(), std::nullopt};
}

bool Notification::shouldDismiss(SteadyTime now) const {
    if (!autoDismissAfter) {
        return false;
    }
    return now - timestamp >= *autoDismissAfter;
}

bool FormCatalogCache::isStale(std::chrono::seconds maxAge, SteadyTime now) const {
    if (!lastUpdated) {
        return true;
    }
    return now - *lastUpdated > maxAge;
}

void FormCatalogCache::updateAndroid(const std::vector<AvailableDevice>& deviceTypes,
                                     const std::vector<ApiTarget>& targets, SteadyTime now) {
    androidDeviceTypes = deviceTypes;
    androidTargets = targets;
    lastUpdated = now;
}

void FormCatalogCache::updateIos(const std::vector<IosDeviceType>& deviceTypes,
                                 const std::vector<IosRuntime>& runtimes, SteadyTime now) {
    iosDeviceTypes = deviceTypes;
    iosRuntimes = runtimes;
    lastUpdated = now;
}

AppState::AppState()
    : createDeviceForm_(CreateDeviceForm::forAndroid()) {
}

void AppState::setActivePanel(Panel panel) {
    if (panel != Panel::Details) {
        smartClearCachedDeviceDetails(panel);
        devicePanel_ = panel;
    }
    activePanel_ = panel;
}

void AppState::nextPanel() {
    switch (activePanel_) {
        case Panel::Android: setActivePanel(Panel::Ios); break;
        case Panel::Ios: setActivePanel(Panel::Android); break;
        case Panel::Details: setActivePanel(devicePanel_); break;
    }
}

void AppState::moveUp() {
    size_t& selected = devicePanel_ == Panel::Ios ? selectedIos_ : selectedAndroid_;
    size_t count = devicePanel_ == Panel::Ios ? iosDevices_.size() : androidDevices_.size();
    if (count == 0) {
        return;
    }
    selected = selected > 0 ? selected - 1 : count - 1;
}

void AppState::moveDown() {
    size_t& selected = devicePanel_ == Panel::Ios ? selectedIos_ : selectedAndroid_;
    size_t count = devicePanel_ == Panel::Ios ? iosDevices_.size() : androidDevices_.size();
    if (count == 0) {
        return;
    }
    selected = selected + 1 < count ? selected + 1 : 0;
}

void AppState::clampSelection() {
    if (androidDevices_.empty()) {
        selectedAndroid_ = 0;
    } else if (selectedAndroid_ >= androidDevices_.size()) {
        selectedAndroid_ = androidDevices_.size() - 1;
    }
    if (iosDevices_.empty()) {
        selectedIos_ = 0;
    } else if (selectedIos_ >= iosDevices_.size()) {
        selectedIos_ = iosDevices_.size() - 1;
    }
}

bool AppState::selectDevice(Platform platform, const std::string& identifier) {
    if (platform == Platform::Android) {
        for (size_t i = 0; i < androidDevices_.size(); ++i) {
            if (androidDevices_[i].name == identifier) {
                selectedAndroid_ = i;
                return true;
            }
        }
    } else {
        for (size_t i = 0; i < iosDevices_.size(); ++i) {
            if (iosDevices_[i].udid == identifier) {
                selectedIos_ = i;
                return true;
            }
        }
    }
    return false;
}

std::optional<Device> AppState::getSelectedDevice() const {
    if (devicePanel_ == Panel::Ios) {
        if (selectedIos_ < iosDevices_.size()) {
            return Device(iosDevices_[selectedIos_]);
        }
        return std::nullopt;
    }
    if (selectedAndroid_ < androidDevices_.size()) {
        return Device(androidDevices_[selectedAndroid_]);
    }
    return std::nullopt;
}

void AppState::setAndroidDevices(std::vector<AndroidDevice> devices) {
    androidDevices_ = std::move(devices);
    clampSelection();
}

void AppState::setIosDevices(std::vector<IosDevice> devices) {
    iosDevices_ = std::move(devices);
    clampSelection();
}

bool AppState::setDeviceStatus(Platform platform, const std::string& identifier, DeviceStatus status) {
    if (platform == Platform::Android) {
        for (auto& device : androidDevices_) {
            if (device.name == identifier) {
                setStatus(device, status);
                return true;
            }
        }
    } else {
        for (auto& device : iosDevices_) {
            if (device.udid == identifier) {
                setStatus(device, status);
                return true;
            }
        }
    }
    return false;
}

std::optional<Device> AppState::findDevice(Platform platform, const std::string& identifier) const {
    if (platform == Platform::Android) {
        for (const auto& device : androidDevices_) {
            if (device.name == identifier) {
                return Device(device);
            }
        }
    } else {
        for (const auto& device : iosDevices_) {
            if (device.udid == identifier) {
                return Device(device);
            }
        }
    }
    return std::nullopt;
}

void AppState::openCreateForm(Platform platform) {
    createDeviceForm_ = platform == Platform::Ios ? CreateDeviceForm::forIos() : CreateDeviceForm::forAndroid();
    mode_ = Mode::CreateDevice;
}

void AppState::closeCreateForm() {
    createDeviceForm_ = CreateDeviceForm::forAndroid();
    mode_ = Mode::Normal;
}

bool AppState::beginConfirmDelete() {
    std::optional<Device> device = getSelectedDevice();
    if (!device) {
        return false;
    }
    confirmDeleteDialog_ = ConfirmDeleteDialog{deviceName(*device), deviceIdentifier(*device), devicePlatform(*device)};
    mode_ = Mode::ConfirmDelete;
    return true;
}

bool AppState::beginConfirmWipe() {
    std::optional<Device> device = getSelectedDevice();
    if (!device) {
        return false;
    }
    confirmWipeDialog_ = ConfirmWipeDialog{deviceName(*device), deviceIdentifier(*device), devicePlatform(*device)};
    mode_ = Mode::ConfirmWipe;
    return true;
}

void AppState::cancelDialog() {
    confirmDeleteDialog_.reset();
    confirmWipeDialog_.reset();
    mode_ = Mode::Normal;
}

void AppState::addNotification(const Notification& notification) {
    notifications_.push_back(notification);
    while (notifications_.size() > kMaxNotifications) {
        notifications_.pop_front();
    }
}

void AppState::addSuccessNotification(const std::string& message) {
    addNotification(Notification::success(message));
}

void AppState::addErrorNotification(const std::string& message) {
    addNotification(Notification::error(message));
}

void AppState::addWarningNotification(const std::string& message) {
    addNotification(Notification::warning(message));
}

void AppState::addInfoNotification(const std::string& message) {
    addNotification(Notification::info(message));
}

void AppState::dismissExpiredNotifications(SteadyTime now) {
    notifications_.erase(
        std::remove_if(notifications_.begin(), notifications_.end(),
                       [now](const Notification& n) { return n.shouldDismiss(now); }),
        notifications_.end());
}

void AppState::dismissAllNotifications() {
    notifications_.clear();
}

void AppState::dismissNotification(size_t index) {
    if (index < notifications_.size()) {
        notifications_.erase(notifications_.begin() + static_cast<std::ptrdiff_t>(index));
    }
}

void AppState::addLog(const std::string& level, const std::string& message) {
    deviceLogs_.push_back(LogEntry{currentTimeOfDay(), level, message});
    while (deviceLogs_.size() > kMaxLogEntries) {
        deviceLogs_.pop_front();
    }

    if (autoScrollLogs_ && !manuallyScrolled_) {
        logScrollOffset_ = logMaxOffset();
    }
}

void AppState::clearLogs() {
    deviceLogs_.clear();
    logScrollOffset_ = 0;
}

std::vector<LogEntry> AppState::getFilteredLogs() const {
    std::vector<LogEntry> logs;
    for (const auto& entry : deviceLogs_) {
        if (!logFilterLevel_ || entry.level == *logFilterLevel_) {
            logs.push_back(entry);
        }
    }
    return logs;
}

size_t AppState::logMaxOffset() const {
    return deviceLogs_.empty() ? 0 : deviceLogs_.size() - 1;
}

void AppState::scrollLogsUp() {
    if (logScrollOffset_ > 0) {
        --logScrollOffset_;
        manuallyScrolled_ = true;
    }
}

void AppState::scrollLogsDown() {
    if (logScrollOffset_ < logMaxOffset()) {
        ++logScrollOffset_;
        manuallyScrolled_ = true;
    }
}

void AppState::scrollLogsPageUp(size_t pageSize) {
    logScrollOffset_ = logScrollOffset_ > pageSize ? logScrollOffset_ - pageSize : 0;
    manuallyScrolled_ = true;
}

void AppState::scrollLogsPageDown(size_t pageSize) {
    logScrollOffset_ = std::min(logScrollOffset_ + pageSize, logMaxOffset());
    manuallyScrolled_ = true;
}

void AppState::scrollLogsHalfPageUp(size_t pageSize) {
    scrollLogsPageUp(pageSize / 2);
}

void AppState::scrollLogsHalfPageDown(size_t pageSize) {
    scrollLogsPageDown(pageSize / 2);
}

void AppState::scrollLogsToTop() {
    logScrollOffset_ = 0;
    manuallyScrolled_ = true;
}

void AppState::scrollLogsToBottom() {
    size_t total = getFilteredLogs().size();
    logScrollOffset_ = total == 0 ? 0 : total - 1;
    manuallyScrolled_ = false;
}

void AppState::resetLogScroll() {
    logScrollOffset_ = 0;
    manuallyScrolled_ = false;
}

void AppState::toggleLogFilter() {
    static const std::vector<std::string> kCycle = {"ERROR", "WARN", "INFO", "DEBUG"};
    if (!logFilterLevel_) {
        setLogFilter(kCycle.front());
        return;
    }
    auto it = std::find(kCycle.begin(), kCycle.end(), *logFilterLevel_);
    if (it == kCycle.end() || it + 1 == kCycle.end()) {
        setLogFilter(std::nullopt);
    } else {
        setLogFilter(*(it + 1));
    }
}

void AppState::setLogFilter(const std::optional<std::string>& level) {
    logFilterLevel_ = level;
    resetLogScroll();
}

void AppState::toggleAutoScroll() {
    autoScrollLogs_ = !autoScrollLogs_;
    if (autoScrollLogs_) {
        manuallyScrolled_ = false;
        logScrollOffset_ = logMaxOffset();
    }
}

void AppState::setCurrentLogDevice(Panel panel, const std::string& identifier) {
    currentLogDevice_ = std::make_pair(panel, identifier);
}

std::optional<DeviceDetails> AppState::getSelectedDeviceDetails() const {
    std::optional<Device> device = getSelectedDevice();
    if (!device) {
        return std::nullopt;
    }

    if (cachedDeviceDetails_ && cachedDeviceDetails_->identifier == deviceIdentifier(*device) &&
        cachedDeviceDetails_->platform == devicePlatform(*device)) {
        return cachedDeviceDetails_;
    }

    DeviceDetails details;
    details.name = deviceName(*device);
    details.identifier = deviceIdentifier(*device);
    details.platform = devicePlatform(*device);
    details.status = statusToString(deviceStatus(*device));
    if (const auto* android = std::get_if<AndroidDevice>(&*device)) {
        details.deviceType = android->deviceType;
        details.version = android->apiLevel == kInvalidApiLevel
            ? "Unknown"
            : "API " + std::to_string(android->apiLevel) + " (" + androidVersionName(android->apiLevel) + ")";
        details.ramSize = android->ramSize;
        details.storageSize = android->storageSize;
        details.devicePath = android->path;
    } else if (const auto* ios = std::get_if<IosDevice>(&*device)) {
        details.deviceType = ios->deviceType;
        details.version = ios->iosVersion;
    }
    return details;
}

void AppState::smartClearCachedDeviceDetails(Panel newPanel) {
    if (newPanel == Panel::Details || !cachedDeviceDetails_) {
        return;
    }
    if (cachedDeviceDetails_->platform != platformForPanel(newPanel)) {
        cachedDeviceDetails_.reset();
    }
}

void AppState::addPendingDeviceStart(const std::string& identifier) {
    if (!pendingDeviceStarts_.insert(identifier).second) {
        throw EmuError(EmuErrorKind::ConcurrentOperationConflict,
                       "Device '" + identifier + "' is already starting");
    }
}

void AppState::removePendingDeviceStart(const std::string& identifier) {
    pendingDeviceStarts_.erase(identifier);
}

bool AppState::isPendingDeviceStart(const std::string& identifier) const {
    return pendingDeviceStarts_.count(identifier) > 0;
}

void AppState::setRefreshIntervals(std::chrono::milliseconds normal, std::chrono::milliseconds fast) {
    refreshInterval_ = normal;
    fastRefreshInterval_ = fast;
}

std::chrono::milliseconds AppState::currentRefreshInterval() const {
    return pendingDeviceStarts_.empty() ? refreshInterval_ : fastRefreshInterval_;
}

bool AppState::shouldAutoRefresh(SteadyTime now) const {
    return now - lastRefresh_ >= currentRefreshInterval();
}
