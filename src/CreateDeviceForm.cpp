#include "CreateDeviceForm.hpp"
#include "DevicePriority.hpp"
#include <cctype>
#include <sstream>

namespace {

bool parseMegabytes(const std::string& text, int& value) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    value = std::stoi(text);
    return true;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

// Picks the neighbouring index in a list of size n, wrapping at both ends
size_t stepIndex(size_t index, size_t n, bool forward) {
    if (forward) {
        return (index + 1) % n;
    }
    return index == 0 ? n - 1 : index - 1;
}

} // namespace

std::string fieldToString(CreateDeviceField field) {
    switch (field) {
        case CreateDeviceField::ApiLevel: return "ApiLevel";
        case CreateDeviceField::Category: return "Category";
        case CreateDeviceField::DeviceType: return "DeviceType";
        case CreateDeviceField::RamSize: return "RamSize";
        case CreateDeviceField::StorageSize: return "StorageSize";
        case CreateDeviceField::Name: return "Name";
        default: return "Unknown";
    }
}

CreateDeviceForm::CreateDeviceForm()
    : availableCategories_{"all", "phone", "tablet", "wear", "tv", "automotive", "desktop"} {
}

CreateDeviceForm CreateDeviceForm::forAndroid() {
    CreateDeviceForm form;
    form.platform_ = Platform::Android;
    form.updateSelectedCategory();
    return form;
}

CreateDeviceForm CreateDeviceForm::forIos() {
    CreateDeviceForm form;
    form.platform_ = Platform::Ios;
    form.updateSelectedCategory();
    form.activeField_ = CreateDeviceField::ApiLevel;
    return form;
}

void CreateDeviceForm::nextField() {
    switch (activeField_) {
        case CreateDeviceField::ApiLevel: activeField_ = CreateDeviceField::Category; break;
        case CreateDeviceField::Category: activeField_ = CreateDeviceField::DeviceType; break;
        case CreateDeviceField::DeviceType: activeField_ = CreateDeviceField::RamSize; break;
        case CreateDeviceField::RamSize: activeField_ = CreateDeviceField::StorageSize; break;
        case CreateDeviceField::StorageSize: activeField_ = CreateDeviceField::Name; break;
        case CreateDeviceField::Name: activeField_ = CreateDeviceField::ApiLevel; break;
    }
}

void CreateDeviceForm::prevField() {
    switch (activeField_) {
        case CreateDeviceField::ApiLevel: activeField_ = CreateDeviceField::Name; break;
        case CreateDeviceField::Category: activeField_ = CreateDeviceField::ApiLevel; break;
        case CreateDeviceField::DeviceType: activeField_ = CreateDeviceField::Category; break;
        case CreateDeviceField::RamSize: activeField_ = CreateDeviceField::DeviceType; break;
        case CreateDeviceField::StorageSize: activeField_ = CreateDeviceField::RamSize; break;
        case CreateDeviceField::Name: activeField_ = CreateDeviceField::StorageSize; break;
    }
}

void CreateDeviceForm::nextFieldIos() {
    switch (activeField_) {
        case CreateDeviceField::ApiLevel: activeField_ = CreateDeviceField::DeviceType; break;
        case CreateDeviceField::DeviceType: activeField_ = CreateDeviceField::Name; break;
        case CreateDeviceField::Name: activeField_ = CreateDeviceField::ApiLevel; break;
        default: activeField_ = CreateDeviceField::ApiLevel; break;
    }
}

void CreateDeviceForm::prevFieldIos() {
    switch (activeField_) {
        case CreateDeviceField::ApiLevel: activeField_ = CreateDeviceField::Name; break;
        case CreateDeviceField::DeviceType: activeField_ = CreateDeviceField::ApiLevel; break;
        case CreateDeviceField::Name: activeField_ = CreateDeviceField::DeviceType; break;
        default: activeField_ = CreateDeviceField::Name; break;
    }
}

void CreateDeviceForm::focusNext() {
    if (platform_ == Platform::Ios) {
        nextFieldIos();
    } else {
        nextField();
    }
}

void CreateDeviceForm::focusPrev() {
    if (platform_ == Platform::Ios) {
        prevFieldIos();
    } else {
        prevField();
    }
}

bool CreateDeviceForm::selectPrevOption() {
    return selectNeighbour(false);
}

bool CreateDeviceForm::selectNextOption() {
    return selectNeighbour(true);
}

bool CreateDeviceForm::selectNeighbour(bool forward) {
    switch (activeField_) {
        case CreateDeviceField::ApiLevel:
            if (availableVersions_.empty()) {
                return false;
            }
            selectedApiLevelIndex_ = stepIndex(selectedApiLevelIndex_, availableVersions_.size(), forward);
            updateSelectedApiLevel();
            break;
        case CreateDeviceField::Category:
            if (platform_ == Platform::Ios || availableCategories_.empty()) {
                return false;
            }
            selectedCategoryIndex_ = stepIndex(selectedCategoryIndex_, availableCategories_.size(), forward);
            updateSelectedCategory();
            break;
        case CreateDeviceField::DeviceType:
            if (availableDeviceTypes_.empty()) {
                return false;
            }
            selectedDeviceTypeIndex_ = stepIndex(selectedDeviceTypeIndex_, availableDeviceTypes_.size(), forward);
            updateSelectedDeviceType();
            break;
        default:
            return false;
    }
    errorMessage_.reset();
    return true;
}

void CreateDeviceForm::updateSelectedApiLevel() {
    if (selectedApiLevelIndex_ < availableVersions_.size()) {
        version_ = availableVersions_[selectedApiLevelIndex_].first;
        versionDisplay_ = availableVersions_[selectedApiLevelIndex_].second;
        generatePlaceholderName();
    }
}

void CreateDeviceForm::updateSelectedCategory() {
    if (selectedCategoryIndex_ < availableCategories_.size()) {
        categoryFilter_ = availableCategories_[selectedCategoryIndex_];
        // The device type list is rebuilt for the new category
        selectedDeviceTypeIndex_ = 0;
    }
}

void CreateDeviceForm::updateSelectedDeviceType() {
    if (selectedDeviceTypeIndex_ < availableDeviceTypes_.size()) {
        deviceTypeId_ = availableDeviceTypes_[selectedDeviceTypeIndex_].first;
        deviceType_ = availableDeviceTypes_[selectedDeviceTypeIndex_].second;
        generatePlaceholderName();
    }
}

bool CreateDeviceForm::insertChar(char c) {
    switch (activeField_) {
        case CreateDeviceField::Name:
            if (name_.size() >= kMaxNameLength) {
                errorMessage_ = "Name must be at most " + std::to_string(kMaxNameLength) + " characters";
                return false;
            }
            name_.push_back(c);
            break;
        case CreateDeviceField::RamSize:
        case CreateDeviceField::StorageSize: {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                errorMessage_ = "Only digits are allowed for sizes";
                return false;
            }
            std::string& target = activeField_ == CreateDeviceField::RamSize ? ramSize_ : storageSize_;
            if (target.size() >= 6) {
                return false;
            }
            target.push_back(c);
            break;
        }
        default:
            return false;
    }
    errorMessage_.reset();
    return true;
}

bool CreateDeviceForm::deleteChar() {
    std::string* target = nullptr;
    switch (activeField_) {
        case CreateDeviceField::Name: target = &name_; break;
        case CreateDeviceField::RamSize: target = &ramSize_; break;
        case CreateDeviceField::StorageSize: target = &storageSize_; break;
        default: return false;
    }
    if (target->empty()) {
        return false;
    }
    target->pop_back();
    errorMessage_.reset();
    return true;
}

void CreateDeviceForm::setAvailableVersions(const std::vector<std::pair<std::string, std::string>>& versions) {
    availableVersions_ = versions;
    if (selectedApiLevelIndex_ >= availableVersions_.size()) {
        selectedApiLevelIndex_ = 0;
    }
    updateSelectedApiLevel();
}

void CreateDeviceForm::setAvailableDeviceTypes(const std::vector<std::pair<std::string, std::string>>& deviceTypes) {
    availableDeviceTypes_ = deviceTypes;
    if (selectedDeviceTypeIndex_ >= availableDeviceTypes_.size()) {
        selectedDeviceTypeIndex_ = 0;
    }
    if (availableDeviceTypes_.empty()) {
        deviceType_.clear();
        deviceTypeId_.clear();
        return;
    }
    updateSelectedDeviceType();
}

void CreateDeviceForm::applyCategoryFilter(const std::vector<AvailableDevice>& catalog) {
    std::vector<std::pair<std::string, std::string>> filtered;
    for (const auto& device : catalog) {
        if (categoryFilter_ == "all" || device.category == categoryFilter_) {
            filtered.emplace_back(device.id, device.displayName);
        }
    }
    setAvailableDeviceTypes(filtered);
}

void CreateDeviceForm::generatePlaceholderName() {
    std::string devicePart = "Device";
    if (!deviceType_.empty()) {
        std::vector<std::string> parts = DevicePriorityCache::getInstance().parseDeviceName(deviceType_);
        if (parts.empty()) {
            std::string cleaned;
            for (char c : deviceType_) {
                if (std::isalnum(static_cast<unsigned char>(c)) || std::isspace(static_cast<unsigned char>(c))) {
                    cleaned.push_back(c);
                }
            }
            std::istringstream words(cleaned);
            std::string word;
            while (parts.size() < 3 && words >> word) {
                parts.push_back(word);
            }
        }
        if (!parts.empty()) {
            devicePart.clear();
            for (size_t i = 0; i < parts.size(); ++i) {
                if (i > 0) {
                    devicePart += " ";
                }
                devicePart += parts[i];
            }
        }
    }

    std::string apiPart = "API";
    if (!versionDisplay_.empty()) {
        if (versionDisplay_.rfind("iOS", 0) == 0) {
            // "iOS 17.0" -> "iOS 17"
            apiPart = versionDisplay_.substr(0, versionDisplay_.find('.'));
        } else if (versionDisplay_.rfind("API", 0) == 0) {
            // "API 34 - Android 14" -> "API 34"
            size_t firstSpace = versionDisplay_.find(' ');
            size_t secondSpace = firstSpace == std::string::npos
                ? std::string::npos : versionDisplay_.find(' ', firstSpace + 1);
            apiPart = versionDisplay_.substr(0, secondSpace);
        } else {
            apiPart = "API " + version_;
        }
    }

    name_ = devicePart + " " + apiPart;
    if (trim(name_).empty()) {
        name_ = "Device API " + version_;
    }
    if (name_.size() > kMaxNameLength) {
        name_ = trim(name_.substr(0, kMaxNameLength));
    }
}

bool CreateDeviceForm::validate() {
    if (trim(name_).empty()) {
        errorMessage_ = "Device name cannot be empty";
        return false;
    }
    if (name_.size() > kMaxNameLength) {
        errorMessage_ = "Device name must be at most " + std::to_string(kMaxNameLength) + " characters";
        return false;
    }
    if (version_.empty()) {
        errorMessage_ = platform_ == Platform::Ios ? "Select an iOS runtime" : "Select an API level";
        return false;
    }
    if (deviceTypeId_.empty()) {
        errorMessage_ = "Select a device type";
        return false;
    }

    if (platform_ == Platform::Android) {
        int ram = 0;
        if (!parseMegabytes(ramSize_, ram) || ram < kMinRamMb || ram > kMaxRamMb) {
            errorMessage_ = "RAM size must be between " + std::to_string(kMinRamMb) + " and " +
                            std::to_string(kMaxRamMb) + " MB";
            return false;
        }
        int storage = 0;
        if (!parseMegabytes(storageSize_, storage) || storage < kMinStorageMb || storage > kMaxStorageMb) {
            errorMessage_ = "Storage size must be between " + std::to_string(kMinStorageMb) + " and " +
                            std::to_string(kMaxStorageMb) + " MB";
            return false;
        }
    }

    errorMessage_.reset();
    return true;
}

DeviceConfig CreateDeviceForm::toDeviceConfig() const {
    DeviceConfig config;
    config.name = trim(name_);
    config.deviceType = deviceTypeId_;
    config.version = version_;
    if (platform_ == Platform::Android) {
        config.ramSize = ramSize_;
        config.storageSize = storageSize_;
    }
    return config;
}
