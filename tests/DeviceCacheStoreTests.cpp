#include <catch2/catch.hpp>

#include "DeviceCacheStore.hpp"
#include "TestSupport.hpp"

#include <ctime>

namespace device_cache_store_tests {

DeviceCacheSnapshot sampleSnapshot(std::time_t when) {
    DeviceCacheSnapshot snapshot;
    snapshot.lastUpdated = when;

    AndroidDevice pixel;
    pixel.name = "Pixel_7_API_34";
    pixel.deviceType = "pixel_7";
    pixel.apiLevel = 34;
    setStatus(pixel, DeviceStatus::Running);
    snapshot.androidDevices.push_back(pixel);

    IosDevice phone;
    phone.udid = "AAAA-1111";
    phone.name = "iPhone 15 (iOS 17.0)";
    phone.iosVersion = "17.0";
    setStatus(phone, DeviceStatus::Stopped);
    snapshot.iosDevices.push_back(phone);

    ApiTarget target;
    target.apiLevel = 34;
    target.display = "API 34 - Android 14";
    snapshot.androidTargets.push_back(target);
    return snapshot;
}

TEST_CASE("Saved snapshots load back while fresh", "[cache]") {
    TempDir dir;
    DeviceCacheStore store((dir.path() / "nested" / "devices.json").string(), 300);

    REQUIRE(store.save(sampleSnapshot(std::time(nullptr))));

    DeviceCacheSnapshot loaded;
    REQUIRE(store.load(loaded));
    REQUIRE(loaded.androidDevices.size() == 1);
    CHECK(loaded.androidDevices[0].name == "Pixel_7_API_34");
    CHECK(loaded.androidDevices[0].apiLevel == 34);
    CHECK(loaded.androidDevices[0].status == DeviceStatus::Running);
    CHECK(loaded.androidDevices[0].isRunning);
    REQUIRE(loaded.iosDevices.size() == 1);
    CHECK(loaded.iosDevices[0].udid == "AAAA-1111");
    REQUIRE(loaded.androidTargets.size() == 1);
    CHECK(loaded.androidTargets[0].display == "API 34 - Android 14");
}

TEST_CASE("Stale or foreign cache files are ignored", "[cache]") {
    TempDir dir;
    std::string path = (dir.path() / "devices.json").string();
    DeviceCacheStore store(path, 300);
    DeviceCacheSnapshot loaded;

    SECTION("missing file") {
        CHECK_FALSE(store.load(loaded));
    }

    SECTION("too old") {
        REQUIRE(store.save(sampleSnapshot(std::time(nullptr) - 301)));
        CHECK_FALSE(store.load(loaded));
    }

    SECTION("timestamp in the future") {
        REQUIRE(store.save(sampleSnapshot(std::time(nullptr) + 3600)));
        CHECK_FALSE(store.load(loaded));
    }

    SECTION("other format version") {
        DeviceCacheSnapshot snapshot = sampleSnapshot(std::time(nullptr));
        snapshot.version = DeviceCacheSnapshot::kCurrentVersion + 1;
        REQUIRE(store.save(snapshot));
        CHECK_FALSE(store.load(loaded));
    }

    SECTION("corrupt file") {
        writeFile(path, "{\"version\": 1, \"androidDevices\": [");
        CHECK_FALSE(store.load(loaded));
    }

    CHECK(loaded.androidDevices.empty());
}

TEST_CASE("Default cache path lives under the user config directory", "[cache]") {
    std::string path = DeviceCacheStore::defaultPath();
    CHECK(path.find("devices.json") != std::string::npos);
    CHECK(path.find("emu") != std::string::npos);
}

} // namespace device_cache_store_tests
