#pragma once
#include <string>
#include <vector>
#include <functional>
#include <sys/types.h>

struct CommandResult {
    std::string stdoutText;
    std::string stderrText;
    int exitCode{0};
    
    bool success() const { return exitCode == 0; }
};

// Boundary to the outside world. Launch failures throw EmuError; a non-zero
// exit code is returned as data so callers can inspect stderr.
class CommandExecutor {
public:
    using LineCallback = std::function<void(const std::string&)>;
    using KeepGoing = std::function<bool()>;
    
    virtual ~CommandExecutor() = default;
    
    CommandResult run(const std::string& program, const std::vector<std::string>& args);
    CommandResult runWithRetry(const std::string& program, const std::vector<std::string>& args,
                               int attempts, int delayMs);
    
    virtual CommandResult execute(const std::string& program, const std::vector<std::string>& args,
                                  int timeoutMs) = 0;
    
    // Starts a process that outlives the caller, returns its pid
    virtual pid_t spawnDetached(const std::string& program, const std::vector<std::string>& args) = 0;
    
    // Feeds stdout lines to onLine until the process exits or keepGoing() returns false.
    // Returns the exit code, or -1 when the stream was cancelled.
    virtual int streamLines(const std::string& program, const std::vector<std::string>& args,
                            const LineCallback& onLine, const KeepGoing& keepGoing) = 0;
    
    virtual bool commandExists(const std::string& program) = 0;
    virtual bool isProcessAlive(pid_t pid) = 0;
    
    void setDefaultTimeoutMs(int timeoutMs) { defaultTimeoutMs_ = timeoutMs; }
    int getDefaultTimeoutMs() const { return defaultTimeoutMs_; }
    
    static std::string formatCommandLine(const std::string& program, const std::vector<std::string>& args);
    
protected:
    int defaultTimeoutMs_{30000};
};

class ProcessCommandExecutor : public CommandExecutor {
public:
    ProcessCommandExecutor() = default;
    
    CommandResult execute(const std::string& program, const std::vector<std::string>& args,
                          int timeoutMs) override;
    pid_t spawnDetached(const std::string& program, const std::vector<std::string>& args) override;
    int streamLines(const std::string& program, const std::vector<std::string>& args,
                    const LineCallback& onLine, const KeepGoing& keepGoing) override;
    bool commandExists(const std::string& program) override;
    bool isProcessAlive(pid_t pid) override;
};
