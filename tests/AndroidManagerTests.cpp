#include <catch2/catch.hpp>

#include "AndroidManager.hpp"
#include "EmuError.hpp"
#include "TestSupport.hpp"
#include <sstream>

namespace android_manager_tests {

TEST_CASE("AVD listing yields one stopped device per named block", "[android][parse]") {
    MockCommandExecutor executor;
    TempDir dir;
    std::string sdk = makeFakeSdk(dir);
    executor.respond("avdmanager list avd", kThreeAvdListing);
    executor.respond("adb devices", "List of devices attached\n\n");

    AndroidManager manager(executor, sdk, (dir.path() / "avd").string());
    std::vector<AndroidDevice> devices = manager.listDevices();

    REQUIRE(devices.size() == 3);
    CHECK(devices[0].name == "Pixel_7_API_34");
    CHECK(devices[0].deviceType == "pixel_7");
    CHECK(devices[0].apiLevel == 34);
    CHECK(devices[0].category == "phone");
    CHECK(devices[1].name == "Tablet_API_33");
    CHECK(devices[1].apiLevel == 33);
    CHECK(devices[1].category == "tablet");
    CHECK(devices[2].name == "Wear_API_30");
    CHECK(devices[2].apiLevel == 30);
    CHECK(devices[2].category == "wear");
    for (const auto& device : devices) {
        CAPTURE(device.name);
        CHECK(device.status == DeviceStatus::Stopped);
        CHECK_FALSE(device.isRunning);
    }
}

TEST_CASE("Running emulators are matched to AVDs by name", "[android]") {
    MockCommandExecutor executor;
    TempDir dir;
    std::string sdk = makeFakeSdk(dir);
    executor.respond("avdmanager list avd", kThreeAvdListing);
    executor.respond("adb devices",
                     "List of devices attached\n"
                     "emulator-5554\tdevice\n"
                     "emulator-5556\toffline\n");
    executor.respond("adb -s emulator-5554 shell getprop ro.kernel.qemu.avd_name", "Tablet_API_33\n");

    AndroidManager manager(executor, sdk, (dir.path() / "avd").string());
    std::map<std::string, std::string> running = manager.getRunningAvdNames();
    REQUIRE(running.size() == 1);
    CHECK(running["Tablet_API_33"] == "emulator-5554");

    std::vector<AndroidDevice> devices = manager.listDevices();
    REQUIRE(devices.size() == 3);
    CHECK(devices[0].status == DeviceStatus::Stopped);
    CHECK(devices[1].status == DeviceStatus::Running);
    CHECK(devices[1].isRunning);
    CHECK(devices[2].status == DeviceStatus::Stopped);

    // The offline emulator is never queried for its name
    CHECK(executor.callCount("adb -s emulator-5556 shell getprop ro.kernel.qemu.avd_name") == 0);
}

TEST_CASE("Offline emulators leave their AVD stopped", "[android]") {
    MockCommandExecutor executor;
    TempDir dir;
    std::string sdk = makeFakeSdk(dir);
    executor.respond("avdmanager list avd",
                     "Available Android Virtual Devices:\n"
                     "    Name: Pixel_7_API_34\n"
                     "  Device: pixel_7 (Google)\n"
                     "  Target: Android API level 34\n"
                     "---------\n"
                     "    Name: Galaxy_S22_API_33\n"
                     "  Device: galaxy_s22 (Samsung)\n"
                     "  Target: Android API level 33\n");
    executor.respond("adb devices",
                     "List of devices attached\n"
                     "emulator-5554\tdevice\n"
                     "emulator-5556\toffline\n");
    executor.respond("adb -s emulator-5554 shell getprop ro.kernel.qemu.avd_name", "Pixel_7_API_34\n");
    executor.respond("adb -s emulator-5556 shell getprop ro.kernel.qemu.avd_name", "Galaxy_S22_API_33\n");

    AndroidManager manager(executor, sdk, (dir.path() / "avd").string());
    std::vector<AndroidDevice> devices = manager.listDevices();

    REQUIRE(devices.size() == 2);
    CHECK(devices[0].name == "Pixel_7_API_34");
    CHECK(devices[0].status == DeviceStatus::Running);
    CHECK(devices[0].isRunning);
    CHECK(devices[1].name == "Galaxy_S22_API_33");
    CHECK(devices[1].status == DeviceStatus::Stopped);
    CHECK_FALSE(devices[1].isRunning);
}

TEST_CASE("adb states map onto device statuses", "[android][parse]") {
    CHECK(AndroidManager::mapAdbState("device") == DeviceStatus::Running);
    CHECK(AndroidManager::mapAdbState("offline") == DeviceStatus::Stopped);
    CHECK(AndroidManager::mapAdbState("unauthorized") == DeviceStatus::Stopped);
    CHECK(AndroidManager::mapAdbState("") == DeviceStatus::Stopped);

    auto entries = AndroidManager::parseAdbDevicesOutput(
        "List of devices attached\n"
        "emulator-5554\tdevice\n"
        "R58M123ABC\tdevice\n"
        "emulator-5556 offline\n");
    REQUIRE(entries.size() == 2);
    CHECK(entries[0] == std::make_pair(std::string("emulator-5554"), std::string("device")));
    CHECK(entries[1] == std::make_pair(std::string("emulator-5556"), std::string("offline")));
}

TEST_CASE("AVD blocks without a name are dropped", "[android][parse]") {
    const std::string output =
        "Available Android Virtual Devices:\n"
        "    Name: Good_Device\n"
        "  Device: pixel_6 (Google)\n"
        "  Target: Android API level 33\n"
        "---------\n"
        "    Name:\n"
        "  Device: pixel_5 (Google)\n"
        "  Target: Android API level 31\n"
        "---------\n"
        "    Name: Another\n"
        "  Target: Android API level 29\n"
        "The following Android Virtual Devices could not be loaded:\n"
        "    Name: Broken\n";

    auto devices = AndroidManager::parseAvdListOutput(output);
    REQUIRE(devices.size() == 2);
    CHECK(devices[0].name == "Good_Device");
    CHECK(devices[0].apiLevel == 33);
    CHECK(devices[1].name == "Another");
    CHECK(devices[1].apiLevel == 29);
}

TEST_CASE("Overlong numbers in tool output do not abort parsing", "[android][parse]") {
    const std::string output =
        "Available Android Virtual Devices:\n"
        "    Name: Good\n"
        "  Device: pixel_6 (Google)\n"
        "  Target: Android API level 33\n"
        "---------\n"
        "    Name: Bad\n"
        "  Device: pixel_5 (Google)\n"
        "  Target: Android API level 99999999999999999999\n"
        "---------\n"
        "    Name: Garbled\n"
        "  Target: Android API level x1\n";

    std::vector<AndroidDevice> devices;
    REQUIRE_NOTHROW(devices = AndroidManager::parseAvdListOutput(output));
    REQUIRE(devices.size() == 3);
    CHECK(devices[0].apiLevel == 33);
    CHECK(devices[1].name == "Bad");
    CHECK(devices[1].apiLevel == kInvalidApiLevel);
    CHECK(devices[2].apiLevel == kInvalidApiLevel);

    std::map<std::string, std::string> config = {
        {"image.sysdir.1", "system-images/android-123456789012/google_apis/x86_64/"}};
    CHECK(AndroidManager::parseApiLevelFromConfig(config) == kInvalidApiLevel);

    auto images = AndroidManager::parseSystemImages(
        "Installed packages:\n"
        "  system-images;android-99999999999;google_apis;x86_64 | 1 | Broken\n"
        "  system-images;android-34;google_apis;x86_64 | 7 | Google APIs\n",
        true);
    REQUIRE(images.size() == 1);
    CHECK(images[0].apiLevel == 34);
}

TEST_CASE("API level is read from config.ini when present", "[android][parse]") {
    auto config = AndroidManager::parseConfigIni(
        "# comment\n"
        "image.sysdir.1 = system-images/android-35/google_apis/x86_64/\n"
        "hw.ramSize=4096\n"
        "broken line\n");
    CHECK(config["hw.ramSize"] == "4096");
    CHECK(AndroidManager::parseApiLevelFromConfig(config) == 35);

    std::map<std::string, std::string> targetOnly = {{"target", "android-28"}};
    CHECK(AndroidManager::parseApiLevelFromConfig(targetOnly) == 28);
    CHECK(AndroidManager::parseApiLevelFromConfig({}) == kInvalidApiLevel);
}

TEST_CASE("AVD names are sanitized before creation", "[android]") {
    CHECK(AndroidManager::sanitizeAvdName("Pixel 7 API 34") == "Pixel_7_API_34");
    CHECK(AndroidManager::sanitizeAvdName("  my-device.v2!  ") == "my-device.v2");
    CHECK(AndroidManager::sanitizeAvdName("a/b\\c") == "abc");
    CHECK(AndroidManager::sanitizeAvdName("???").empty());
}

TEST_CASE("Creation failures are classified from avdmanager output", "[android][create]") {
    MockCommandExecutor executor;
    TempDir dir;
    std::string sdk = makeFakeSdk(dir);
    executor.respond("avdmanager list avd", "Available Android Virtual Devices:\n");
    executor.respond("adb devices", "List of devices attached\n");
    executor.respond("sdkmanager --list --verbose --include_obsolete",
                     "Installed packages:\n"
                     "  system-images;android-34;google_apis;x86_64\n"
                     "    Description: Google APIs Intel x86_64 Atom System Image\n"
                     "Available Packages:\n"
                     "  system-images;android-35;google_apis;x86_64\n");

    AndroidManager manager(executor, sdk, (dir.path() / "avd").string());

    DeviceConfig config;
    config.name = "Pixel 7 API 34";
    config.deviceType = "pixel_7";
    config.version = "34";

    SECTION("missing system image") {
        executor.respond("avdmanager create avd -n Pixel_7_API_34 -k system-images;android-34;google_apis;x86_64 "
                         "--device pixel_7",
                         "", 1, "Error: Package path is not valid. Valid system image paths are:\n");
        try {
            manager.createDevice(config);
            FAIL("createDevice should throw");
        } catch (const EmuError& e) {
            CHECK(e.kind() == EmuErrorKind::CreationFailure);
            CHECK(std::string(e.what()).find("System image not installed") != std::string::npos);
        }
    }

    SECTION("unknown device profile") {
        executor.respond("avdmanager create avd -n Pixel_7_API_34 -k system-images;android-34;google_apis;x86_64 "
                         "--device pixel_7",
                         "", 1, "Error: Device pixel_7 not found\n");
        try {
            manager.createDevice(config);
            FAIL("createDevice should throw");
        } catch (const EmuError& e) {
            CHECK(e.kind() == EmuErrorKind::CreationFailure);
            CHECK(std::string(e.what()).find("Device type 'pixel_7' not found") != std::string::npos);
        }
    }

    auto createCalls = [&executor]() {
        int count = 0;
        for (const auto& call : executor.calls()) {
            if (call.rfind("avdmanager create", 0) == 0) ++count;
        }
        return count;
    };

    SECTION("image that is not installed fails before avdmanager create") {
        config.version = "35";
        try {
            manager.createDevice(config);
            FAIL("createDevice should throw");
        } catch (const EmuError& e) {
            std::string message = e.what();
            CAPTURE(message);
            CHECK(e.kind() == EmuErrorKind::CreationFailure);
            CHECK(message.find("Install it with: sdkmanager \"system-images;android-35;google_apis_playstore;") !=
                  std::string::npos);
            CHECK(message.find("Available images: system-images;android-34;google_apis;x86_64") !=
                  std::string::npos);
        }
        CHECK(createCalls() == 0);
    }

    SECTION("requested tag that is not installed is not substituted") {
        config.additionalOptions["tag"] = "google_apis_playstore";
        CHECK_THROWS_AS(manager.createDevice(config), EmuError);
        CHECK(createCalls() == 0);
    }

    SECTION("unreadable image list fails before avdmanager create") {
        executor.respond("sdkmanager --list --verbose --include_obsolete", "", 1, "Warning: Could not create settings\n");
        try {
            manager.createDevice(config);
            FAIL("createDevice should throw");
        } catch (const EmuError& e) {
            CHECK(e.kind() == EmuErrorKind::CreationFailure);
            CHECK(std::string(e.what()).find("Cannot resolve a system image for API 34") != std::string::npos);
        }
        CHECK(createCalls() == 0);
    }

    SECTION("overlong API level is rejected") {
        config.version = "340000000000000000000";
        try {
            manager.createDevice(config);
            FAIL("createDevice should throw");
        } catch (const EmuError& e) {
            CHECK(e.kind() == EmuErrorKind::CreationFailure);
        }
        CHECK(createCalls() == 0);
    }

    SECTION("invalid name is rejected before any tool runs") {
        config.name = "!!!";
        CHECK_THROWS_AS(manager.createDevice(config), EmuError);
        CHECK(executor.callCount("avdmanager list avd") == 0);
    }

    SECTION("successful creation writes hardware settings") {
        const std::string create = "avdmanager create avd -n Pixel_7_API_34 -k "
                                   "system-images;android-34;google_apis;x86_64 --device pixel_7";
        executor.respond(create, "");
        writeFile(dir.path() / "avd" / "Pixel_7_API_34.avd" / "config.ini", "hw.ramSize=1536\nAvdId=old\n");
        config.ramSize = "3072";
        config.storageSize = "16384";

        manager.createDevice(config);

        CHECK(executor.callCount(create) == 1);
        std::ifstream in(dir.path() / "avd" / "Pixel_7_API_34.avd" / "config.ini");
        std::stringstream buffer;
        buffer << in.rdbuf();
        auto written = AndroidManager::parseConfigIni(buffer.str());
        CHECK(written["hw.ramSize"] == "3072");
        CHECK(written["disk.dataPartition.size"] == "16G");
        CHECK(written["AvdId"] == "Pixel_7_API_34");
        CHECK(written["avd.ini.displayname"] == "Pixel 7 API 34");
    }
}

TEST_CASE("Boot wait gives up after the configured timeout", "[android][boot]") {
    MockCommandExecutor executor;
    TempDir dir;
    std::string sdk = makeFakeSdk(dir);
    executor.respond("adb devices", "List of devices attached\n");

    AndroidManager manager(executor, sdk, (dir.path() / "avd").string());
    manager.setBootTimeoutSeconds(1);
    manager.setBootPollIntervalMs(50);

    try {
        manager.startDevice("Pixel_7_API_34");
        FAIL("startDevice should time out");
    } catch (const EmuError& e) {
        CHECK(e.kind() == EmuErrorKind::Timeout);
    }
    CHECK(executor.callCount("emulator -avd Pixel_7_API_34 -no-audio -no-snapshot-save -no-boot-anim -netfast") == 1);
}

TEST_CASE("Emulator exit during boot is reported", "[android][boot]") {
    MockCommandExecutor executor;
    TempDir dir;
    std::string sdk = makeFakeSdk(dir);
    executor.respond("adb devices", "List of devices attached\n");
    executor.setProcessAlive(false);

    AndroidManager manager(executor, sdk, (dir.path() / "avd").string());
    manager.setBootPollIntervalMs(10);

    try {
        manager.startDevice("Pixel_7_API_34");
        FAIL("startDevice should fail");
    } catch (const EmuError& e) {
        CHECK(e.kind() == EmuErrorKind::CommandExecutionFailure);
    }
}

TEST_CASE("Missing SDK is reported as unavailable", "[android]") {
    MockCommandExecutor executor;
    TempDir dir;

    try {
        AndroidManager manager(executor, "", "");
        FAIL("constructor should throw");
    } catch (const EmuError& e) {
        CHECK(e.kind() == EmuErrorKind::SdkUnavailable);
        CHECK(std::string(e.what()).find("ANDROID_HOME") != std::string::npos);
    }

    CHECK_THROWS_AS(AndroidManager(executor, (dir.path() / "nowhere").string(), ""), EmuError);
}

TEST_CASE("Wipe removes user data but keeps the AVD", "[android]") {
    MockCommandExecutor executor;
    TempDir dir;
    std::string sdk = makeFakeSdk(dir);
    executor.respond("adb devices", "List of devices attached\n");
    auto avdDir = dir.path() / "avd" / "Old.avd";
    writeFile(avdDir / "config.ini", "hw.ramSize=2048\n");
    writeFile(avdDir / "userdata-qemu.img", "data");
    writeFile(avdDir / "snapshots" / "default_boot" / "ram.bin", "ram");

    AndroidManager manager(executor, sdk, (dir.path() / "avd").string());
    manager.wipeDevice("Old");

    CHECK(std::filesystem::exists(avdDir / "config.ini"));
    CHECK_FALSE(std::filesystem::exists(avdDir / "userdata-qemu.img"));
    CHECK_FALSE(std::filesystem::exists(avdDir / "snapshots"));

    CHECK_THROWS_AS(manager.wipeDevice("Missing"), EmuError);
}

TEST_CASE("System image listings are split into installed and available", "[android][parse]") {
    const std::string output =
        "Installed packages:\n"
        "  system-images;android-34;google_apis;x86_64 | 7 | Google APIs\n"
        "Available Packages:\n"
        "  system-images;android-35;google_apis_playstore;x86_64 | 1 | Play\n"
        "  system-images;android-34;google_apis;x86_64 | 7 | Google APIs\n";

    auto installed = AndroidManager::parseSystemImages(output, true);
    REQUIRE(installed.size() == 1);
    CHECK(installed[0].apiLevel == 34);
    CHECK(installed[0].tag == "google_apis");
    CHECK(installed[0].abi == "x86_64");

    auto all = AndroidManager::parseSystemImages(output, false);
    CHECK(all.size() == 2);
}

} // namespace android_manager_tests
