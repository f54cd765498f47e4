#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();
    
    void log(LogLevel level, const std::string& message);
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    // Lets callers skip building messages that would be filtered out
    bool isEnabled(LogLevel level) const;
    // Appends to filename; false when the file cannot be opened
    bool setLogFile(const std::string& filename);
    const std::string& getLogFilePath() const { return logFilePath_; }
    
    // The interactive loop owns stdout, so console output can be switched off
    void setConsoleOutput(bool enabled);
    
    static LogLevel parseLevel(const std::string& name);
    static std::string levelToString(LogLevel level);
    
private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::string getCurrentTimestamp();
    
    mutable std::mutex mutex_;
    LogLevel minLevel_;
    bool consoleOutput_;
    std::ofstream logFile_;
    std::string logFilePath_;
};

#define LOG_DEBUG(msg) Logger::getInstance().log(LogLevel::DEBUG, msg)
#define LOG_INFO(msg) Logger::getInstance().log(LogLevel::INFO, msg)
#define LOG_WARNING(msg) Logger::getInstance().log(LogLevel::WARNING, msg)
#define LOG_ERROR(msg) Logger::getInstance().log(LogLevel::ERROR, msg)
