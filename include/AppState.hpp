#pragma once
#include "CreateDeviceForm.hpp"
#include "Device.hpp"
#include <chrono>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

enum class Panel {
    Android,
    Ios,
    Details
};

enum class Mode {
    Normal,
    CreateDevice,
    ConfirmDelete,
    ConfirmWipe,
    ManageApiLevels
};

enum class NotificationType {
    Success,
    Error,
    Warning,
    Info
};

std::string panelToString(Panel panel);
std::string modeToString(Mode mode);
std::string notificationTypeToString(NotificationType type);

using SteadyTime = std::chrono::steady_clock::time_point;

struct Notification {
    std::string message;
    NotificationType type{NotificationType::Info};
    SteadyTime timestamp;
    std::optional<std::chrono::milliseconds> autoDismissAfter;  // empty for persistent

    static Notification success(const std::string& message);
    static Notification error(const std::string& message);
    static Notification warning(const std::string& message);
    static Notification info(const std::string& message);
    static Notification persistent(const std::string& message, NotificationType type);

    bool shouldDismiss(SteadyTime now) const;
};

struct LogEntry {
    std::string timestamp;  // %H:%M:%S
    std::string level;
    std::string message;
};

struct ConfirmDeleteDialog {
    std::string deviceName;
    std::string deviceIdentifier;
    Platform platform{Platform::Android};
};

struct ConfirmWipeDialog {
    std::string deviceName;
    std::string deviceIdentifier;
    Platform platform{Platform::Android};
};

struct ApiLevelManagement {
    std::vector<ApiLevelInfo> apiLevels;
    size_t selectedIndex{0};
    bool isLoading{false};
    std::optional<std::string> installingPackage;
    std::optional<std::string> errorMessage;
};

// Creation catalogs kept between form openings
struct FormCatalogCache {
    std::vector<AvailableDevice> androidDeviceTypes;
    std::vector<ApiTarget> androidTargets;
    std::vector<IosDeviceType> iosDeviceTypes;
    std::vector<IosRuntime> iosRuntimes;
    std::optional<SteadyTime> lastUpdated;
    bool isLoading{false};

    bool isStale(std::chrono::seconds maxAge, SteadyTime now) const;
    void updateAndroid(const std::vector<AvailableDevice>& deviceTypes,
                       const std::vector<ApiTarget>& targets, SteadyTime now);
    void updateIos(const std::vector<IosDeviceType>& deviceTypes,
                   const std::vector<IosRuntime>& runtimes, SteadyTime now);
};

// All UI-observable data. Not synchronized itself: the orchestrator guards
// every access with its shared_mutex.
class AppState {
public:
    static constexpr size_t kMaxNotifications = 10;
    static constexpr size_t kMaxLogEntries = 1000;

    AppState();

    // Panels and selection
    Panel getActivePanel() const { return activePanel_; }
    void setActivePanel(Panel panel);
    void nextPanel();
    // The device list the selection refers to, Details included
    Panel getDevicePanel() const { return devicePanel_; }

    void moveUp();
    void moveDown();
    void clampSelection();
    size_t getSelectedAndroid() const { return selectedAndroid_; }
    size_t getSelectedIos() const { return selectedIos_; }
    bool selectDevice(Platform platform, const std::string& identifier);
    std::optional<Device> getSelectedDevice() const;

    // Device lists, replaced wholesale by refresh
    const std::vector<AndroidDevice>& getAndroidDevices() const { return androidDevices_; }
    const std::vector<IosDevice>& getIosDevices() const { return iosDevices_; }
    void setAndroidDevices(std::vector<AndroidDevice> devices);
    void setIosDevices(std::vector<IosDevice> devices);
    bool setDeviceStatus(Platform platform, const std::string& identifier, DeviceStatus status);
    std::optional<Device> findDevice(Platform platform, const std::string& identifier) const;

    // Modes and dialogs
    Mode getMode() const { return mode_; }
    void setMode(Mode mode) { mode_ = mode; }
    void openCreateForm(Platform platform);
    void closeCreateForm();
    CreateDeviceForm& getCreateDeviceForm() { return createDeviceForm_; }
    const CreateDeviceForm& getCreateDeviceForm() const { return createDeviceForm_; }
    bool beginConfirmDelete();
    bool beginConfirmWipe();
    void cancelDialog();
    const std::optional<ConfirmDeleteDialog>& getConfirmDeleteDialog() const { return confirmDeleteDialog_; }
    const std::optional<ConfirmWipeDialog>& getConfirmWipeDialog() const { return confirmWipeDialog_; }
    ApiLevelManagement& getApiLevelManagement() { return apiLevelManagement_; }
    const ApiLevelManagement& getApiLevelManagement() const { return apiLevelManagement_; }
    FormCatalogCache& getFormCatalogCache() { return formCatalogCache_; }
    const FormCatalogCache& getFormCatalogCache() const { return formCatalogCache_; }

    // Notifications
    void addNotification(const Notification& notification);
    void addSuccessNotification(const std::string& message);
    void addErrorNotification(const std::string& message);
    void addWarningNotification(const std::string& message);
    void addInfoNotification(const std::string& message);
    void dismissExpiredNotifications(SteadyTime now);
    void dismissAllNotifications();
    void dismissNotification(size_t index);
    const std::deque<Notification>& getNotifications() const { return notifications_; }

    // Logs
    void addLog(const std::string& level, const std::string& message);
    void clearLogs();
    const std::deque<LogEntry>& getDeviceLogs() const { return deviceLogs_; }
    std::vector<LogEntry> getFilteredLogs() const;
    void scrollLogsUp();
    void scrollLogsDown();
    void scrollLogsPageUp(size_t pageSize);
    void scrollLogsPageDown(size_t pageSize);
    void scrollLogsHalfPageUp(size_t pageSize);
    void scrollLogsHalfPageDown(size_t pageSize);
    void scrollLogsToTop();
    void scrollLogsToBottom();
    void resetLogScroll();
    size_t getLogScrollOffset() const { return logScrollOffset_; }
    bool isManuallyScrolled() const { return manuallyScrolled_; }
    // Cycles all -> ERROR -> WARN -> INFO -> DEBUG -> all
    void toggleLogFilter();
    void setLogFilter(const std::optional<std::string>& level);
    const std::optional<std::string>& getLogFilterLevel() const { return logFilterLevel_; }
    void toggleAutoScroll();
    bool isAutoScrollLogs() const { return autoScrollLogs_; }
    void toggleFullscreenLogs() { fullscreenLogs_ = !fullscreenLogs_; }
    bool isFullscreenLogs() const { return fullscreenLogs_; }

    // Active log stream target; clearing it stops the stream
    void setCurrentLogDevice(Panel panel, const std::string& identifier);
    void clearCurrentLogDevice() { currentLogDevice_.reset(); }
    const std::optional<std::pair<Panel, std::string>>& getCurrentLogDevice() const { return currentLogDevice_; }

    // Cached details when they match the selection, else the basic fields of the list entry
    std::optional<DeviceDetails> getSelectedDeviceDetails() const;
    void updateCachedDeviceDetails(const DeviceDetails& details) { cachedDeviceDetails_ = details; }
    void clearCachedDeviceDetails() { cachedDeviceDetails_.reset(); }
    // Keeps the cache only when it belongs to the platform of newPanel
    void smartClearCachedDeviceDetails(Panel newPanel);
    const std::optional<DeviceDetails>& getCachedDeviceDetails() const { return cachedDeviceDetails_; }

    // Pending starts. Throws EmuError(ConcurrentOperationConflict) on a duplicate.
    void addPendingDeviceStart(const std::string& identifier);
    void removePendingDeviceStart(const std::string& identifier);
    bool isPendingDeviceStart(const std::string& identifier) const;
    const std::set<std::string>& getPendingDeviceStarts() const { return pendingDeviceStarts_; }

    void setDeviceOperationStatus(const std::string& status) { deviceOperationStatus_ = status; }
    void clearDeviceOperationStatus() { deviceOperationStatus_.reset(); }
    const std::optional<std::string>& getDeviceOperationStatus() const { return deviceOperationStatus_; }

    // Refresh timing; the fast interval applies while a start is pending
    void setRefreshIntervals(std::chrono::milliseconds normal, std::chrono::milliseconds fast);
    std::chrono::milliseconds currentRefreshInterval() const;
    bool shouldAutoRefresh(SteadyTime now) const;
    void markRefreshed(SteadyTime now) { lastRefresh_ = now; }

private:
    size_t logMaxOffset() const;

    Panel activePanel_{Panel::Android};
    Panel devicePanel_{Panel::Android};
    Mode mode_{Mode::Normal};
    size_t selectedAndroid_{0};
    size_t selectedIos_{0};
    std::vector<AndroidDevice> androidDevices_;
    std::vector<IosDevice> iosDevices_;

    CreateDeviceForm createDeviceForm_;
    std::optional<ConfirmDeleteDialog> confirmDeleteDialog_;
    std::optional<ConfirmWipeDialog> confirmWipeDialog_;
    ApiLevelManagement apiLevelManagement_;
    FormCatalogCache formCatalogCache_;

    std::deque<Notification> notifications_;

    std::deque<LogEntry> deviceLogs_;
    size_t logScrollOffset_{0};
    bool autoScrollLogs_{true};
    bool manuallyScrolled_{false};
    bool fullscreenLogs_{false};
    std::optional<std::string> logFilterLevel_;
    std::optional<std::pair<Panel, std::string>> currentLogDevice_;

    std::optional<DeviceDetails> cachedDeviceDetails_;
    std::set<std::string> pendingDeviceStarts_;
    std::optional<std::string> deviceOperationStatus_;

    std::chrono::milliseconds refreshInterval_{3000};
    std::chrono::milliseconds fastRefreshInterval_{1000};
    SteadyTime lastRefresh_;
};
