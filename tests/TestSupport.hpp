#pragma once
#include "CommandExecutor.hpp"
#include "EmuError.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

// Scripted CommandExecutor. Responses are keyed by the program's basename
// followed by its arguments, e.g. "adb -s emulator-5554 emu kill".
class MockCommandExecutor : public CommandExecutor {
public:
    struct StreamScript {
        std::vector<std::string> lines;
        int exitCode{0};
        bool launchFails{false};
        EmuErrorKind failure{EmuErrorKind::SdkUnavailable};
    };

    static std::string key(const std::string& program, const std::vector<std::string>& args) {
        std::string command = std::filesystem::path(program).filename().string();
        for (const auto& arg : args) {
            command += " " + arg;
        }
        return command;
    }

    void respond(const std::string& command, const std::string& stdoutText, int exitCode = 0,
                 const std::string& stderrText = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        CommandResult result;
        result.stdoutText = stdoutText;
        result.stderrText = stderrText;
        result.exitCode = exitCode;
        responses_[command] = result;
    }

    void stream(const std::string& command, const std::vector<std::string>& lines, int exitCode = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        StreamScript script;
        script.lines = lines;
        script.exitCode = exitCode;
        streams_[command] = script;
    }

    void failLaunch(const std::string& command, EmuErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        StreamScript script;
        script.launchFails = true;
        script.failure = kind;
        streams_[command] = script;
    }

    void addCommand(const std::string& program) {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.insert(program);
    }

    void setProcessAlive(bool alive) { processAlive_.store(alive); }

    CommandResult execute(const std::string& program, const std::vector<std::string>& args,
                          int) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string command = key(program, args);
        calls_.push_back(command);
        auto it = responses_.find(command);
        if (it != responses_.end()) {
            return it->second;
        }
        CommandResult unmatched;
        unmatched.exitCode = 1;
        unmatched.stderrText = "unexpected command: " + command;
        return unmatched;
    }

    pid_t spawnDetached(const std::string& program, const std::vector<std::string>& args) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(key(program, args));
        return 4242;
    }

    int streamLines(const std::string& program, const std::vector<std::string>& args,
                    const LineCallback& onLine, const KeepGoing& keepGoing) override {
        StreamScript script;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::string command = key(program, args);
            calls_.push_back(command);
            auto it = streams_.find(command);
            if (it == streams_.end()) {
                throw EmuError(EmuErrorKind::SdkUnavailable, "not scripted: " + command);
            }
            script = it->second;
        }
        if (script.launchFails) {
            throw EmuError(script.failure, "cannot launch " + program);
        }
        for (const auto& line : script.lines) {
            if (!keepGoing()) {
                return -1;
            }
            onLine(line);
        }
        return script.exitCode;
    }

    bool commandExists(const std::string& program) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_.count(program) > 0;
    }

    bool isProcessAlive(pid_t) override { return processAlive_.load(); }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int callCount(const std::string& command) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int count = 0;
        for (const auto& call : calls_) {
            if (call == command) ++count;
        }
        return count;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, CommandResult> responses_;
    std::map<std::string, StreamScript> streams_;
    std::set<std::string> commands_;
    std::vector<std::string> calls_;
    std::atomic<bool> processAlive_{true};
};

// Temporary directory removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("emu-tests-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

// SDK layout with the tools AndroidManager requires; returns the SDK root
inline std::string makeFakeSdk(const TempDir& dir) {
    std::filesystem::path sdk = dir.path() / "sdk";
    writeFile(sdk / "cmdline-tools" / "latest" / "bin" / "avdmanager", "");
    writeFile(sdk / "cmdline-tools" / "latest" / "bin" / "sdkmanager", "");
    writeFile(sdk / "emulator" / "emulator", "");
    std::filesystem::create_directories(dir.path() / "avd");
    return sdk.string();
}

const char* const kThreeAvdListing =
    "Available Android Virtual Devices:\n"
    "    Name: Pixel_7_API_34\n"
    "  Device: pixel_7 (Google)\n"
    "    Path: /home/user/.android/avd/Pixel_7_API_34.avd\n"
    "  Target: Google Play (Google Inc.)\n"
    "          Based on: Android 14.0 (UpsideDownCake) Tag/ABI: google_apis_playstore/x86_64\n"
    "  Sdcard: 512M\n"
    "---------\n"
    "    Name: Tablet_API_33\n"
    "  Device: pixel_tablet (Google)\n"
    "    Path: /home/user/.android/avd/Tablet_API_33.avd\n"
    "  Target: Google APIs (Google Inc.)\n"
    "          Based on: Android 13.0 (Tiramisu) Tag/ABI: google_apis/x86_64\n"
    "---------\n"
    "    Name: Wear_API_30\n"
    "  Device: wearos_small_round (Google)\n"
    "    Path: /home/user/.android/avd/Wear_API_30.avd\n"
    "  Target: Android API level 30\n"
    "          Tag/ABI: android-wear/x86\n";
