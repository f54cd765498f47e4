#pragma once
#include "AndroidManager.hpp"
#include "AppState.hpp"
#include "BackgroundOrchestrator.hpp"
#include "CommandExecutor.hpp"
#include "ConfigLoader.hpp"
#include "DeviceCacheStore.hpp"
#include "InputPipeline.hpp"
#include "IosManager.hpp"
#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>

struct CommandLineOverrides {
    std::string logLevel;
    std::string logFile;
};

// Wires configuration, managers and the orchestrator together and runs the
// line-oriented interactive loop.
class EmuApp {
public:
    EmuApp();
    ~EmuApp();

    // Uses the given executor instead of spawning real processes
    explicit EmuApp(std::unique_ptr<CommandExecutor> executor);

    bool initialize(const std::string& configPath, const CommandLineOverrides& overrides);
    // Prints both device lists once; returns the process exit code
    int listDevices(std::ostream& out);
    // Reads key lines from inputFd until quit, EOF or interrupted
    void run(int inputFd, std::ostream& out, const std::atomic<bool>& interrupted);
    void shutdown();

    // Applies one batch of input to the state, false once the user quits
    bool handleEvent(const InputEvent& event);
    void applyNavigation(const NavigationStep& step);
    void renderSnapshot(std::ostream& out) const;

    // Splits an input line into key events: a named key ("up", "tab", ...) or one event per character
    static std::vector<InputEvent> parseInputLine(const std::string& line, InputClock::time_point timestamp);

    BackgroundOrchestrator* getOrchestrator() { return orchestrator_.get(); }
    const std::string& getLastError() const { return lastError_; }

private:
    bool handleNormalKey(const std::string& key);
    bool handleCreateFormKey(const std::string& key);
    bool handleConfirmKey(const std::string& key);
    bool handleApiLevelKey(const std::string& key);
    void openCreateForm();
    void switchPanel();

    ConfigLoader config_;
    AppState state_;
    std::unique_ptr<CommandExecutor> executor_;
    std::unique_ptr<AndroidManager> android_;
    std::unique_ptr<IosManager> ios_;
    std::unique_ptr<DeviceCacheStore> cacheStore_;
    std::unique_ptr<BackgroundOrchestrator> orchestrator_;
    std::unique_ptr<EventBatcher> batcher_;
    std::atomic<bool> running_;
    std::string lastError_;
};
