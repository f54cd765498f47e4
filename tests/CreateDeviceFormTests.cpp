#include <catch2/catch.hpp>

#include "CreateDeviceForm.hpp"
#include "DevicePriority.hpp"

namespace create_device_form_tests {

CreateDeviceForm readyAndroidForm() {
    CreateDeviceForm form = CreateDeviceForm::forAndroid();
    form.setAvailableVersions({{"34", "API 34 - Android 14"}, {"33", "API 33 - Android 13"}});
    form.setAvailableDeviceTypes({{"pixel_7", "Pixel 7 (Google)"}, {"pixel_tablet", "Pixel Tablet (Google)"}});
    return form;
}

TEST_CASE("Android focus cycle visits six fields and closes", "[form][focus]") {
    CreateDeviceForm form = CreateDeviceForm::forAndroid();
    const std::vector<CreateDeviceField> expected = {
        CreateDeviceField::Category, CreateDeviceField::DeviceType, CreateDeviceField::RamSize,
        CreateDeviceField::StorageSize, CreateDeviceField::Name, CreateDeviceField::ApiLevel,
    };

    REQUIRE(form.getActiveField() == CreateDeviceField::ApiLevel);
    for (CreateDeviceField field : expected) {
        form.focusNext();
        CHECK(form.getActiveField() == field);
    }

    for (int i = 0; i < 6; ++i) {
        form.focusPrev();
    }
    CHECK(form.getActiveField() == CreateDeviceField::ApiLevel);

    form.focusPrev();
    CHECK(form.getActiveField() == CreateDeviceField::Name);
}

TEST_CASE("iOS focus cycle skips the Android-only fields", "[form][focus]") {
    CreateDeviceForm form = CreateDeviceForm::forIos();
    form.focusNext();
    CHECK(form.getActiveField() == CreateDeviceField::DeviceType);
    form.focusNext();
    CHECK(form.getActiveField() == CreateDeviceField::Name);
    form.focusNext();
    CHECK(form.getActiveField() == CreateDeviceField::ApiLevel);

    form.prevFieldIos();
    CHECK(form.getActiveField() == CreateDeviceField::Name);
}

TEST_CASE("Placeholder name follows the selected type and version", "[form][name]") {
    DevicePriorityCache::getInstance().clear();

    CreateDeviceForm form = readyAndroidForm();
    CHECK(form.getVersion() == "34");
    CHECK(form.getDeviceTypeId() == "pixel_7");
    CHECK(form.getName() == "Pixel 7 API 34");

    form.focusNext();
    form.focusNext();
    REQUIRE(form.getActiveField() == CreateDeviceField::DeviceType);
    CHECK(form.selectNextOption());
    CHECK(form.getDeviceTypeId() == "pixel_tablet");
    CHECK(form.getName() == "Pixel Tablet API 34");

    CreateDeviceForm ios = CreateDeviceForm::forIos();
    ios.setAvailableVersions({{"com.apple.CoreSimulator.SimRuntime.iOS-17-0", "iOS 17.0"}});
    ios.setAvailableDeviceTypes({{"com.apple.CoreSimulator.SimDeviceType.iPhone-15", "iPhone 15"}});
    CHECK(ios.getName() == "iPhone 15 iOS 17");
}

TEST_CASE("Option selection wraps around", "[form]") {
    CreateDeviceForm form = readyAndroidForm();
    CHECK(form.selectPrevOption());
    CHECK(form.getVersion() == "33");
    CHECK(form.selectNextOption());
    CHECK(form.getVersion() == "34");

    form.focusNext();
    REQUIRE(form.getActiveField() == CreateDeviceField::Category);
    CHECK(form.selectPrevOption());
    CHECK(form.getCategoryFilter() == "desktop");

    CHECK_FALSE(form.moveSelectionUp());
    CHECK_FALSE(form.moveSelectionDown());
}

TEST_CASE("Category filter narrows the device type list", "[form]") {
    CreateDeviceForm form = CreateDeviceForm::forAndroid();
    std::vector<AvailableDevice> catalog(3);
    catalog[0].id = "pixel_7";
    catalog[0].displayName = "Pixel 7";
    catalog[0].category = "phone";
    catalog[1].id = "pixel_tablet";
    catalog[1].displayName = "Pixel Tablet";
    catalog[1].category = "tablet";
    catalog[2].id = "wear_round";
    catalog[2].displayName = "Wear Round";
    catalog[2].category = "wear";

    form.applyCategoryFilter(catalog);
    CHECK(form.getAvailableDeviceTypes().size() == 3);

    form.focusNext();
    form.selectNextOption();
    form.selectNextOption();
    REQUIRE(form.getCategoryFilter() == "tablet");
    form.applyCategoryFilter(catalog);
    REQUIRE(form.getAvailableDeviceTypes().size() == 1);
    CHECK(form.getDeviceTypeId() == "pixel_tablet");

    form.selectNextOption();
    form.selectNextOption();
    form.selectNextOption();
    REQUIRE(form.getCategoryFilter() == "automotive");
    form.applyCategoryFilter(catalog);
    CHECK(form.getAvailableDeviceTypes().empty());
    CHECK(form.getDeviceTypeId().empty());
}

TEST_CASE("Validation reports the first failing rule", "[form][validate]") {
    CreateDeviceForm form = readyAndroidForm();
    REQUIRE(form.validate());
    CHECK_FALSE(form.getErrorMessage().has_value());

    SECTION("empty name") {
        form.setName("   ");
        CHECK_FALSE(form.validate());
        CHECK(*form.getErrorMessage() == "Device name cannot be empty");
    }

    SECTION("RAM out of range") {
        form.setRamSize("256");
        CHECK_FALSE(form.validate());
        CHECK(form.getErrorMessage()->find("RAM size") == 0);
    }

    SECTION("storage out of range") {
        form.setStorageSize("70000");
        CHECK_FALSE(form.validate());
        CHECK(form.getErrorMessage()->find("Storage size") == 0);
    }

    SECTION("missing device type") {
        form.setAvailableDeviceTypes({});
        CHECK_FALSE(form.validate());
        CHECK(*form.getErrorMessage() == "Select a device type");
    }
}

TEST_CASE("Size fields only accept digits", "[form]") {
    CreateDeviceForm form = readyAndroidForm();
    form.focusNext();
    form.focusNext();
    form.focusNext();
    REQUIRE(form.getActiveField() == CreateDeviceField::RamSize);

    CHECK_FALSE(form.insertChar('x'));
    CHECK(form.getErrorMessage().has_value());
    CHECK(form.deleteChar());
    CHECK(form.insertChar('4'));
    CHECK(form.getRamSize() == "2044");
    CHECK_FALSE(form.getErrorMessage().has_value());
}

TEST_CASE("Names are capped at the maximum length", "[form]") {
    CreateDeviceForm form = readyAndroidForm();
    form.focusPrev();
    REQUIRE(form.getActiveField() == CreateDeviceField::Name);
    form.setName(std::string(CreateDeviceForm::kMaxNameLength, 'a'));
    CHECK_FALSE(form.insertChar('b'));
    CHECK(form.getName().size() == CreateDeviceForm::kMaxNameLength);
}

TEST_CASE("Device config carries the form values", "[form]") {
    CreateDeviceForm form = readyAndroidForm();
    form.setName("  My Pixel  ");
    DeviceConfig config = form.toDeviceConfig();
    CHECK(config.name == "My Pixel");
    CHECK(config.deviceType == "pixel_7");
    CHECK(config.version == "34");
    CHECK(config.ramSize == "2048");
    CHECK(config.storageSize == "8192");

    CreateDeviceForm ios = CreateDeviceForm::forIos();
    ios.setAvailableVersions({{"com.apple.CoreSimulator.SimRuntime.iOS-17-0", "iOS 17.0"}});
    ios.setAvailableDeviceTypes({{"com.apple.CoreSimulator.SimDeviceType.iPhone-15", "iPhone 15"}});
    DeviceConfig iosConfig = ios.toDeviceConfig();
    CHECK(iosConfig.version == "com.apple.CoreSimulator.SimRuntime.iOS-17-0");
    CHECK(iosConfig.ramSize.empty());
}

} // namespace create_device_form_tests
