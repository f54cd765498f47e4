#include <catch2/catch.hpp>

#include "AppState.hpp"
#include "EmuError.hpp"

namespace app_state_tests {

using namespace std::chrono_literals;

AndroidDevice android(const std::string& name, DeviceStatus status = DeviceStatus::Stopped) {
    AndroidDevice device;
    device.name = name;
    device.apiLevel = 34;
    setStatus(device, status);
    return device;
}

IosDevice ios(const std::string& udid, const std::string& name) {
    IosDevice device;
    device.udid = udid;
    device.name = name;
    device.iosVersion = "17.0";
    setStatus(device, DeviceStatus::Stopped);
    return device;
}

TEST_CASE("Selection wraps within the active device list", "[state][selection]") {
    AppState state;
    state.setAndroidDevices({android("a"), android("b"), android("c")});

    state.moveUp();
    CHECK(state.getSelectedAndroid() == 2);
    state.moveDown();
    CHECK(state.getSelectedAndroid() == 0);

    state.setActivePanel(Panel::Ios);
    state.moveDown();
    CHECK(state.getSelectedIos() == 0);
    CHECK_FALSE(state.getSelectedDevice().has_value());
}

TEST_CASE("Replacing a list keeps the selection in range", "[state][selection]") {
    AppState state;
    state.setAndroidDevices({android("a"), android("b"), android("c")});
    REQUIRE(state.selectDevice(Platform::Android, "c"));
    state.setAndroidDevices({android("a")});
    CHECK(state.getSelectedAndroid() == 0);
    state.setAndroidDevices({});
    CHECK_FALSE(state.getSelectedDevice().has_value());
}

TEST_CASE("Panel switching remembers the device list behind Details", "[state][panel]") {
    AppState state;
    state.setIosDevices({ios("U1", "iPhone 15 (iOS 17.0)")});

    state.nextPanel();
    CHECK(state.getActivePanel() == Panel::Ios);
    state.setActivePanel(Panel::Details);
    CHECK(state.getDevicePanel() == Panel::Ios);
    auto selected = state.getSelectedDevice();
    REQUIRE(selected.has_value());
    CHECK(deviceIdentifier(*selected) == "U1");

    state.nextPanel();
    CHECK(state.getActivePanel() == Panel::Ios);
    state.nextPanel();
    CHECK(state.getActivePanel() == Panel::Android);
}

TEST_CASE("Details come from the cache only for the selected device", "[state][details]") {
    AppState state;
    state.setAndroidDevices({android("a"), android("b")});

    auto basic = state.getSelectedDeviceDetails();
    REQUIRE(basic.has_value());
    CHECK(basic->version == "API 34 (Android 14)");
    CHECK(basic->status == "Stopped");

    DeviceDetails cached;
    cached.name = "a";
    cached.identifier = "a";
    cached.platform = Platform::Android;
    cached.resolution = "1080x2400";
    state.updateCachedDeviceDetails(cached);
    CHECK(state.getSelectedDeviceDetails()->resolution == "1080x2400");

    state.moveDown();
    CHECK(state.getSelectedDeviceDetails()->resolution.empty());

    state.setActivePanel(Panel::Ios);
    CHECK_FALSE(state.getCachedDeviceDetails().has_value());
}

TEST_CASE("Notifications keep the newest ten", "[state][notifications]") {
    AppState state;
    for (int i = 0; i < 12; ++i) {
        state.addInfoNotification("n" + std::to_string(i));
    }
    REQUIRE(state.getNotifications().size() == AppState::kMaxNotifications);
    CHECK(state.getNotifications().front().message == "n2");
    CHECK(state.getNotifications().back().message == "n11");

    state.dismissNotification(0);
    CHECK(state.getNotifications().front().message == "n3");
    state.dismissAllNotifications();
    CHECK(state.getNotifications().empty());
}

TEST_CASE("Only non-error notifications expire", "[state][notifications]") {
    AppState state;
    state.addErrorNotification("boom");
    state.addSuccessNotification("done");
    state.addWarningNotification("careful");

    auto later = std::chrono::steady_clock::now() + 6s;
    state.dismissExpiredNotifications(std::chrono::steady_clock::now());
    CHECK(state.getNotifications().size() == 3);
    state.dismissExpiredNotifications(later);
    REQUIRE(state.getNotifications().size() == 1);
    CHECK(state.getNotifications().front().type == NotificationType::Error);
    CHECK(notificationTypeToString(state.getNotifications().front().type) == "ERROR");
}

TEST_CASE("Log buffer is bounded and follows the tail", "[state][logs]") {
    AppState state;
    for (size_t i = 0; i < AppState::kMaxLogEntries + 5; ++i) {
        state.addLog("INFO", "line " + std::to_string(i));
    }
    REQUIRE(state.getDeviceLogs().size() == AppState::kMaxLogEntries);
    CHECK(state.getDeviceLogs().front().message == "line 5");
    CHECK(state.getLogScrollOffset() == AppState::kMaxLogEntries - 1);
    CHECK(state.getDeviceLogs().back().timestamp.size() == 8);

    state.scrollLogsUp();
    CHECK(state.isManuallyScrolled());
    size_t held = state.getLogScrollOffset();
    state.addLog("INFO", "more");
    CHECK(state.getLogScrollOffset() == held);

    state.scrollLogsToBottom();
    CHECK_FALSE(state.isManuallyScrolled());
    state.addLog("INFO", "tail");
    CHECK(state.getLogScrollOffset() == AppState::kMaxLogEntries - 1);

    state.clearLogs();
    CHECK(state.getDeviceLogs().empty());
    CHECK(state.getLogScrollOffset() == 0);
}

TEST_CASE("Log filter cycles through the levels and back to all", "[state][logs]") {
    AppState state;
    state.addLog("ERROR", "e");
    state.addLog("WARN", "w");
    state.addLog("INFO", "i");

    const std::vector<std::string> expected = {"ERROR", "WARN", "INFO", "DEBUG"};
    for (const auto& level : expected) {
        state.toggleLogFilter();
        REQUIRE(state.getLogFilterLevel().has_value());
        CHECK(*state.getLogFilterLevel() == level);
    }
    state.toggleLogFilter();
    CHECK_FALSE(state.getLogFilterLevel().has_value());
    CHECK(state.getFilteredLogs().size() == 3);

    state.setLogFilter(std::string("WARN"));
    auto filtered = state.getFilteredLogs();
    REQUIRE(filtered.size() == 1);
    CHECK(filtered[0].message == "w");
}

TEST_CASE("A device cannot be started twice at once", "[state][pending]") {
    AppState state;
    state.setRefreshIntervals(3000ms, 1000ms);
    CHECK(state.currentRefreshInterval() == 3000ms);

    state.addPendingDeviceStart("a");
    CHECK(state.isPendingDeviceStart("a"));
    CHECK(state.currentRefreshInterval() == 1000ms);

    try {
        state.addPendingDeviceStart("a");
        FAIL("duplicate start should throw");
    } catch (const EmuError& e) {
        CHECK(e.kind() == EmuErrorKind::ConcurrentOperationConflict);
    }

    state.removePendingDeviceStart("a");
    CHECK_FALSE(state.isPendingDeviceStart("a"));
    CHECK(state.currentRefreshInterval() == 3000ms);
}

TEST_CASE("Auto refresh is due once the interval has passed", "[state]") {
    AppState state;
    state.setRefreshIntervals(3000ms, 1000ms);
    auto now = std::chrono::steady_clock::now();
    state.markRefreshed(now);
    CHECK_FALSE(state.shouldAutoRefresh(now + 1000ms));
    CHECK(state.shouldAutoRefresh(now + 3000ms));
}

TEST_CASE("Dialogs capture the selected device", "[state][mode]") {
    AppState state;
    CHECK_FALSE(state.beginConfirmDelete());
    CHECK(state.getMode() == Mode::Normal);

    state.setAndroidDevices({android("a")});
    REQUIRE(state.beginConfirmWipe());
    CHECK(state.getMode() == Mode::ConfirmWipe);
    CHECK(state.getConfirmWipeDialog()->deviceIdentifier == "a");

    state.cancelDialog();
    CHECK(state.getMode() == Mode::Normal);
    CHECK_FALSE(state.getConfirmWipeDialog().has_value());

    state.openCreateForm(Platform::Ios);
    CHECK(state.getMode() == Mode::CreateDevice);
    CHECK(state.getCreateDeviceForm().getPlatform() == Platform::Ios);
    state.closeCreateForm();
    CHECK(state.getMode() == Mode::Normal);
}

TEST_CASE("Catalog cache goes stale after its maximum age", "[state][catalog]") {
    FormCatalogCache cache;
    auto now = std::chrono::steady_clock::now();
    CHECK(cache.isStale(300s, now));
    cache.updateAndroid({}, {}, now);
    CHECK_FALSE(cache.isStale(300s, now + 299s));
    CHECK(cache.isStale(300s, now + 301s));
}

} // namespace app_state_tests
