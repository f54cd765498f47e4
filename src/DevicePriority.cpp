#include "DevicePriority.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace {

// Android
constexpr int kPixelVersionOffset = 80;
constexpr int kPixelMaxPriority = 19;
constexpr int kPixelUnversionedPriority = 25;

// Phone brand tiers; version and OEM bonuses stay inside each tier
constexpr int kNexusBrandBase = 100;
constexpr int kOnePlusBrandBase = 200;
constexpr int kOtherBrandBase = 300;

constexpr int kPhoneCategory = 0;
constexpr int kFoldableCategory = 1000;
constexpr int kTabletCategory = 2000;
constexpr int kTvCategory = 3000;
constexpr int kWearCategory = 4000;
constexpr int kAutomotiveCategory = 5000;
constexpr int kOtherCategory = 6000;

constexpr int kVersionPriorityBase = 100;
constexpr int kMaxVersionForPriority = 99;
constexpr int kMaxVersionNumber = 50;

// iOS
constexpr int kIphoneProMax = 0;
constexpr int kIphonePro = 10;
constexpr int kIphonePlusMax = 20;
constexpr int kIphoneMini = 30;
constexpr int kIphoneSe = 40;
constexpr int kIphoneDefaultBase = 50;
constexpr int kIphoneVersionOffset = 30;

constexpr int kIpadPro129 = 100;
constexpr int kIpadPro11 = 110;
constexpr int kIpadProOther = 120;
constexpr int kIpadAir = 130;
constexpr int kIpadMini = 140;
constexpr int kIpadDefault = 150;

constexpr int kTv4k = 200;
constexpr int kTvDefault = 210;

constexpr int kWatchUltra = 300;
constexpr int kWatchSeriesBase = 310;
constexpr int kWatchSeriesOffset = 10;
constexpr int kWatchDefault = 320;
constexpr int kWatchSe = 330;
constexpr int kWatchOther = 340;

constexpr int kIosUnknown = 999;

constexpr size_t kMaxNameParts = 3;

std::string toLower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool parseSmallNumber(const std::string& text, int& out) {
    if (text.empty() || text.size() > 3) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    out = std::stoi(text);
    return true;
}

// Higher model numbers yield lower values so newer devices sort first.
// Returns kMaxVersionNumber when no version can be found.
int extractDeviceVersion(const std::string& deviceId, const std::string& displayName) {
    const std::string combined = toLower(deviceId + " " + displayName);

    static const std::vector<std::regex> patterns = {
        std::regex(R"(pixel[_\s]?(\d+))"),
        std::regex(R"(galaxy[_\s]?s(\d+))"),
        std::regex(R"(galaxy[_\s]?z[_\s]?fold[_\s]?(\d+))"),
        std::regex(R"(galaxy[_\s]?z[_\s]?flip[_\s]?(\d+))"),
        std::regex(R"(oneplus[_\s]?(\d+))"),
        std::regex(R"(nexus[_\s]?(\d+))"),
        std::regex(R"((\d+)[_\s]?pro)"),
        std::regex(R"((\d+)[_\s]?plus)"),
        std::regex(R"((\d+)[_\s]?ultra)"),
    };

    std::smatch match;
    for (const auto& pattern : patterns) {
        if (std::regex_search(combined, match, pattern)) {
            int version = 0;
            if (parseSmallNumber(match[1].str(), version)) {
                return kVersionPriorityBase - std::min(version, kMaxVersionForPriority);
            }
        }
    }

    static const std::regex numberPattern(R"(\b(\d{1,2})\b)");
    int best = 0;
    for (auto it = std::sregex_iterator(combined.begin(), combined.end(), numberPattern);
         it != std::sregex_iterator(); ++it) {
        int value = std::stoi((*it)[1].str());
        if (value > 0 && value <= kMaxVersionNumber) {
            best = std::max(best, value);
        }
    }
    if (best > 0) {
        return kVersionPriorityBase - best;
    }

    return kMaxVersionNumber;
}

int inferCategoryPriority(const std::string& combined) {
    auto sizeInch = [&combined](const char* size) {
        return contains(combined, size) && contains(combined, "inch");
    };

    if (contains(combined, "fold") || contains(combined, "flip")) {
        return kFoldableCategory;
    }

    if (contains(combined, "tablet") || contains(combined, "pad") ||
        sizeInch("10") || sizeInch("11") || sizeInch("12")) {
        return kTabletCategory;
    }

    if (contains(combined, "phone") ||
        contains(combined, "pixel") ||
        contains(combined, "galaxy") ||
        contains(combined, "oneplus") ||
        contains(combined, "nexus") ||
        sizeInch("5") || sizeInch("6") ||
        contains(combined, "pro")) {
        return kPhoneCategory;
    }

    if (contains(combined, "tv") || contains(combined, "1080p") || contains(combined, "4k")) {
        return kTvCategory;
    }

    if (contains(combined, "wear") || contains(combined, "watch") || contains(combined, "round")) {
        return kWearCategory;
    }

    if (contains(combined, "auto") || contains(combined, "car")) {
        return kAutomotiveCategory;
    }

    return kOtherCategory;
}

int oemPriority(const std::string& displayName) {
    const std::string lower = toLower(displayName);

    if (contains(lower, "google") || contains(lower, "pixel")) return 0;
    if (contains(lower, "samsung") || contains(lower, "galaxy")) return 10;
    if (contains(lower, "oneplus")) return 20;

    size_t open = displayName.find('(');
    size_t close = displayName.find(')');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        static const std::vector<std::pair<std::string, int>> oems = {
            {"xiaomi", 30}, {"asus", 40}, {"oppo", 50}, {"vivo", 60},
            {"huawei", 70}, {"motorola", 80}, {"lenovo", 90}, {"sony", 100},
        };
        const std::string oem = toLower(displayName.substr(open + 1, close - open - 1));
        for (const auto& entry : oems) {
            if (oem == entry.first) {
                return entry.second;
            }
        }
    }

    return 110;
}

// First number in a name like "iPhone 15" or "Watch Series-9", 0 if none
int extractIosModelNumber(const std::string& lowerName) {
    std::istringstream words(lowerName);
    std::string word;
    while (words >> word) {
        int value = 0;
        if (parseSmallNumber(word, value) && value > 0 && value <= kMaxVersionNumber) {
            return value;
        }
        size_t dash = word.rfind('-');
        if (dash != std::string::npos && parseSmallNumber(word.substr(dash + 1), value) &&
            value > 0 && value <= kMaxVersionNumber) {
            return value;
        }
    }
    return 0;
}

} // namespace

int calculateAndroidDevicePriority(const std::string& deviceId, const std::string& displayName) {
    const std::string combined = toLower(deviceId + " " + displayName);

    if (contains(combined, "pixel") && !contains(combined, "nexus")) {
        int versionBonus = extractDeviceVersion(deviceId, displayName);
        if (versionBonus != kMaxVersionNumber) {
            return std::min(std::max(versionBonus - kPixelVersionOffset, 0), kPixelMaxPriority);
        }
        return kPixelUnversionedPriority;
    }

    int category = inferCategoryPriority(combined);
    int versionBonus = extractDeviceVersion(deviceId, displayName);
    int oemBonus = oemPriority(displayName);

    if (category == kPhoneCategory) {
        if (contains(combined, "nexus")) {
            return kNexusBrandBase + versionBonus;
        }
        if (contains(combined, "oneplus")) {
            return kOnePlusBrandBase + versionBonus;
        }
        return kOtherBrandBase + versionBonus + oemBonus / 2;
    }
    return category + oemBonus + versionBonus;
}

int calculateIosDevicePriority(const std::string& displayName) {
    const std::string name = toLower(displayName);

    if (contains(name, "iphone")) {
        if (contains(name, "pro max")) return kIphoneProMax;
        if (contains(name, "pro")) return kIphonePro;
        if (contains(name, "plus") || contains(name, "max")) return kIphonePlusMax;
        if (contains(name, "mini")) return kIphoneMini;
        if (contains(name, "se")) return kIphoneSe;

        int version = extractIosModelNumber(name);
        if (version > 0) {
            return kIphoneDefaultBase - std::min(version, kIphoneVersionOffset);
        }
        return kMaxVersionNumber;
    }

    if (contains(name, "ipad")) {
        if (contains(name, "pro")) {
            if (contains(name, "12.9")) return kIpadPro129;
            if (contains(name, "11")) return kIpadPro11;
            return kIpadProOther;
        }
        if (contains(name, "air")) return kIpadAir;
        if (contains(name, "mini")) return kIpadMini;
        return kIpadDefault;
    }

    if (contains(name, "tv")) {
        return contains(name, "4k") ? kTv4k : kTvDefault;
    }

    if (contains(name, "watch")) {
        if (contains(name, "ultra")) return kWatchUltra;
        if (contains(name, "series")) {
            int version = extractIosModelNumber(name);
            if (version > 0) {
                return kWatchSeriesBase - std::min(version, kWatchSeriesOffset);
            }
            return kWatchDefault;
        }
        if (contains(name, "se")) return kWatchSe;
        return kWatchOther;
    }

    return kIosUnknown;
}

std::string androidVersionName(int apiLevel) {
    static const std::map<int, std::string> names = {
        {36, "Android 16 Preview"},
        {35, "Android 15"},
        {34, "Android 14"},
        {33, "Android 13"},
        {32, "Android 12L"},
        {31, "Android 12"},
        {30, "Android 11"},
        {29, "Android 10"},
        {28, "Android 9"},
        {27, "Android 8.1"},
        {26, "Android 8.0"},
        {25, "Android 7.1"},
        {24, "Android 7.0"},
        {23, "Android 6.0"},
        {22, "Android 5.1"},
        {21, "Android 5.0"},
        {20, "Android 4.4W"},
        {19, "Android 4.4"},
        {18, "Android 4.3"},
        {17, "Android 4.2"},
        {16, "Android 4.1"},
        {15, "Android 4.0.3"},
        {14, "Android 4.0"},
    };

    auto it = names.find(apiLevel);
    if (it != names.end()) {
        return it->second;
    }
    return "API " + std::to_string(apiLevel);
}

int apiLevelFromAndroidVersion(const std::string& version) {
    static const std::map<int, int> majorToApi = {
        {15, 35}, {14, 34}, {13, 33}, {12, 32}, {11, 30}, {10, 29},
        {9, 28}, {8, 26}, {7, 24}, {6, 23}, {5, 21}, {4, 15},
    };

    std::string major = version.substr(0, version.find('.'));
    int value = 0;
    if (!parseSmallNumber(major, value)) {
        return 0;
    }
    auto it = majorToApi.find(value);
    return it != majorToApi.end() ? it->second : 0;
}

std::vector<std::string> parseDeviceNameParts(const std::string& displayName) {
    std::vector<std::string> parts;
    std::string current;
    bool inParentheses = false;

    for (char c : displayName) {
        if (c == '(') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
            inParentheses = true;
        } else if (c == ')') {
            inParentheses = false;
        } else if (inParentheses) {
            continue;
        } else if (c == ' ') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }

    if (parts.size() > kMaxNameParts) {
        parts.resize(kMaxNameParts);
    }
    return parts;
}

std::string getDeviceCategory(const std::string& deviceId, const std::string& displayName) {
    const std::string combined = toLower(deviceId + " " + displayName);
    auto sizeInch = [&combined](const char* size) {
        return contains(combined, size) && contains(combined, "inch");
    };
    const bool foldOrTablet = contains(combined, "fold") || contains(combined, "tablet");

    if (contains(combined, "phone") ||
        (contains(combined, "pixel") && !foldOrTablet) ||
        (contains(combined, "galaxy") && !foldOrTablet) ||
        contains(combined, "oneplus") ||
        contains(combined, "nexus") ||
        sizeInch("5") || sizeInch("6") ||
        (contains(combined, "pro") && !foldOrTablet)) {
        return "phone";
    }

    if (contains(combined, "tablet") || contains(combined, "pad") ||
        sizeInch("10") || sizeInch("11") || sizeInch("12") || sizeInch("13")) {
        return "tablet";
    }

    if (contains(combined, "wear") || contains(combined, "watch") ||
        contains(combined, "round") || contains(combined, "square")) {
        return "wear";
    }

    if (contains(combined, "tv") || contains(combined, "1080p") ||
        contains(combined, "4k") || contains(combined, "720p")) {
        return "tv";
    }

    if (contains(combined, "auto") || contains(combined, "car")) {
        return "automotive";
    }

    if (contains(combined, "desktop") ||
        (contains(combined, "foldable") && contains(combined, "large")) ||
        sizeInch("15") || sizeInch("17")) {
        return "desktop";
    }

    return "phone";
}

DevicePriorityCache& DevicePriorityCache::getInstance() {
    static DevicePriorityCache instance;
    return instance;
}

int DevicePriorityCache::androidPriority(const std::string& deviceId, const std::string& displayName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = std::make_pair(deviceId, displayName);
    auto it = androidCache_.find(key);
    if (it != androidCache_.end()) {
        return it->second;
    }
    int priority = calculateAndroidDevicePriority(deviceId, displayName);
    androidCache_[key] = priority;
    return priority;
}

int DevicePriorityCache::iosPriority(const std::string& displayName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = iosCache_.find(displayName);
    if (it != iosCache_.end()) {
        return it->second;
    }
    int priority = calculateIosDevicePriority(displayName);
    iosCache_[displayName] = priority;
    return priority;
}

void DevicePriorityCache::loadDeviceCatalog(const std::vector<AvailableDevice>& devices) {
    std::lock_guard<std::mutex> lock(mutex_);
    catalog_.clear();
    for (const auto& device : devices) {
        catalog_[device.id] = device;
    }
    LOG_DEBUG("Priority cache loaded " + std::to_string(devices.size()) + " device definitions");
}

int DevicePriorityCache::catalogPriority(const std::string& deviceId) {
    AvailableDevice device;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = catalog_.find(deviceId);
        if (it == catalog_.end()) {
            return 0;
        }
        device = it->second;
    }
    return androidPriority(device.id, device.displayName);
}

std::vector<std::string> DevicePriorityCache::parseDeviceName(const std::string& deviceType) {
    std::string displayName = deviceType;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : catalog_) {
            const AvailableDevice& device = entry.second;
            if ((!device.displayName.empty() && contains(deviceType, device.displayName)) ||
                (!device.id.empty() && contains(deviceType, device.id))) {
                displayName = device.displayName;
                break;
            }
        }
    }
    return parseDeviceNameParts(displayName);
}

void DevicePriorityCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    androidCache_.clear();
    iosCache_.clear();
    catalog_.clear();
}

size_t DevicePriorityCache::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return androidCache_.size() + iosCache_.size();
}
