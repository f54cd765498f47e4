#include "EmuError.hpp"
#include <sstream>

EmuError::EmuError(EmuErrorKind kind, const std::string& message, const std::string& toolStderr)
    : std::runtime_error(message), kind_(kind), toolStderr_(toolStderr) {
}

std::string errorKindToString(EmuErrorKind kind) {
    switch (kind) {
        case EmuErrorKind::SdkUnavailable: return "SdkUnavailable";
        case EmuErrorKind::CommandExecutionFailure: return "CommandExecutionFailure";
        case EmuErrorKind::ParseFailure: return "ParseFailure";
        case EmuErrorKind::DeviceNotFound: return "DeviceNotFound";
        case EmuErrorKind::CreationFailure: return "CreationFailure";
        case EmuErrorKind::Timeout: return "Timeout";
        case EmuErrorKind::PermissionDenied: return "PermissionDenied";
        case EmuErrorKind::ConcurrentOperationConflict: return "ConcurrentOperationConflict";
        default: return "Unknown";
    }
}

std::string formatUserError(const std::exception& e) {
    std::istringstream stream(e.what());
    std::string line;
    while (std::getline(stream, line)) {
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) {
            continue;
        }
        line = line.substr(start);
        
        const std::string prefix = "Error: ";
        if (line.compare(0, prefix.size(), prefix) == 0) {
            line = line.substr(prefix.size());
        }
        
        size_t end = line.find_last_not_of(" \t\r");
        return line.substr(0, end + 1);
    }
    return "Unknown error";
}
