#pragma once
#include <stdexcept>
#include <string>

enum class EmuErrorKind {
    SdkUnavailable,
    CommandExecutionFailure,
    ParseFailure,
    DeviceNotFound,
    CreationFailure,
    Timeout,
    PermissionDenied,
    ConcurrentOperationConflict
};

class EmuError : public std::runtime_error {
public:
    EmuError(EmuErrorKind kind, const std::string& message, const std::string& toolStderr = "");
    
    EmuErrorKind kind() const { return kind_; }
    const std::string& toolStderr() const { return toolStderr_; }
    
private:
    EmuErrorKind kind_;
    std::string toolStderr_;
};

std::string errorKindToString(EmuErrorKind kind);

// One-line message suitable for a notification
std::string formatUserError(const std::exception& e);
