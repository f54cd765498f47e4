#pragma once
#include "Device.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class CreateDeviceField {
    ApiLevel,
    Category,
    DeviceType,
    RamSize,
    StorageSize,
    Name
};

std::string fieldToString(CreateDeviceField field);

class CreateDeviceForm {
public:
    static constexpr size_t kMaxNameLength = 50;
    static constexpr int kMinRamMb = 512;
    static constexpr int kMaxRamMb = 8192;
    static constexpr int kMinStorageMb = 1024;
    static constexpr int kMaxStorageMb = 65536;

    static CreateDeviceForm forAndroid();
    static CreateDeviceForm forIos();

    Platform getPlatform() const { return platform_; }
    CreateDeviceField getActiveField() const { return activeField_; }

    // Android cycle: ApiLevel, Category, DeviceType, RamSize, StorageSize, Name
    void nextField();
    void prevField();
    // iOS cycle: ApiLevel, DeviceType, Name
    void nextFieldIos();
    void prevFieldIos();
    // Dispatches to the cycle of the form's platform
    void focusNext();
    void focusPrev();

    // Up/down never change a selection; callers fall back to field movement
    bool moveSelectionUp() { return false; }
    bool moveSelectionDown() { return false; }

    // Left/right on a list field; false when the active field is not a list
    bool selectPrevOption();
    bool selectNextOption();

    void updateSelectedApiLevel();
    void updateSelectedCategory();
    void updateSelectedDeviceType();

    // Text entry for Name, RamSize and StorageSize. Sizes accept digits only.
    bool insertChar(char c);
    bool deleteChar();

    void setAvailableVersions(const std::vector<std::pair<std::string, std::string>>& versions);
    void setAvailableDeviceTypes(const std::vector<std::pair<std::string, std::string>>& deviceTypes);
    // Fills the device type list from the catalog entries matching the current category
    void applyCategoryFilter(const std::vector<AvailableDevice>& catalog);

    void generatePlaceholderName();

    // Sets errorMessage on the first failing rule
    bool validate();
    DeviceConfig toDeviceConfig() const;

    const std::optional<std::string>& getErrorMessage() const { return errorMessage_; }
    void setErrorMessage(const std::string& message) { errorMessage_ = message; }
    void clearErrorMessage() { errorMessage_.reset(); }

    const std::string& getName() const { return name_; }
    void setName(const std::string& name) { name_ = name; }
    const std::string& getDeviceType() const { return deviceType_; }
    const std::string& getDeviceTypeId() const { return deviceTypeId_; }
    const std::string& getVersion() const { return version_; }
    const std::string& getVersionDisplay() const { return versionDisplay_; }
    const std::string& getRamSize() const { return ramSize_; }
    void setRamSize(const std::string& ramSize) { ramSize_ = ramSize; }
    const std::string& getStorageSize() const { return storageSize_; }
    void setStorageSize(const std::string& storageSize) { storageSize_ = storageSize; }
    const std::string& getCategoryFilter() const { return categoryFilter_; }

    const std::vector<std::pair<std::string, std::string>>& getAvailableVersions() const { return availableVersions_; }
    const std::vector<std::pair<std::string, std::string>>& getAvailableDeviceTypes() const { return availableDeviceTypes_; }
    const std::vector<std::string>& getAvailableCategories() const { return availableCategories_; }

    size_t getSelectedApiLevelIndex() const { return selectedApiLevelIndex_; }
    size_t getSelectedDeviceTypeIndex() const { return selectedDeviceTypeIndex_; }
    size_t getSelectedCategoryIndex() const { return selectedCategoryIndex_; }

    bool isLoadingCache() const { return isLoadingCache_; }
    void setLoadingCache(bool loading) { isLoadingCache_ = loading; }
    bool isCreating() const { return isCreating_; }
    void setCreating(bool creating) { isCreating_ = creating; }
    const std::optional<std::string>& getCreationStatus() const { return creationStatus_; }
    void setCreationStatus(const std::string& status) { creationStatus_ = status; }
    void clearCreationStatus() { creationStatus_.reset(); }

private:
    CreateDeviceForm();
    bool selectNeighbour(bool forward);

    Platform platform_{Platform::Android};
    CreateDeviceField activeField_{CreateDeviceField::ApiLevel};
    std::string name_;
    std::string deviceType_;
    std::string deviceTypeId_;
    std::string version_;
    std::string versionDisplay_;
    std::string ramSize_{"2048"};
    std::string storageSize_{"8192"};
    std::string categoryFilter_{"all"};

    std::vector<std::pair<std::string, std::string>> availableDeviceTypes_;  // (id, display)
    std::vector<std::pair<std::string, std::string>> availableVersions_;     // (value, display)
    std::vector<std::string> availableCategories_;
    size_t selectedApiLevelIndex_{0};
    size_t selectedDeviceTypeIndex_{0};
    size_t selectedCategoryIndex_{0};

    std::optional<std::string> errorMessage_;
    bool isLoadingCache_{false};
    bool isCreating_{false};
    std::optional<std::string> creationStatus_;
};
