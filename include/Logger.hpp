#pragma once

#include <string>
#include <fstream>
#include <mutex>

enum class LogLevel
{
    INFO,
    ERROR
};

// Process-wide run log. Until Init opens a file every call is a no-op, so
// library code and tests can log without a log directory.
class Logger
{
public:
    static constexpr const char* FilePrefix = "Offload_Log";

    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool Init(const std::string& LogDir);
    void Close();

    void Write(LogLevel Level, const std::string& Message);
    void Info(const std::string& Message) { Write(LogLevel::INFO, Message); }
    void Error(const std::string& Message) { Write(LogLevel::ERROR, Message); }

    // Keeps the ConfigGlobal::MaxLogFiles newest run logs in the log directory.
    void CleanupOldLogs();

    bool IsOpen();

    static std::string GetTimestampForFilename();
    static std::string GetTimestamp();
    static const char* ToString(LogLevel Level);

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    std::mutex LogWriteMutex;
    std::string LogDirectory;
};

extern Logger Log;
