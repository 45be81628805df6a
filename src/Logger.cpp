#include "Logger.hpp"
#include "ConfigGlobal.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <vector>

Logger Log;
namespace FS = std::filesystem;

namespace
{
    std::string FormatNow(const char* Format)
    {
        std::time_t Time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm Local{};
        localtime_r(&Time, &Local);

        char Buffer[32];
        const size_t Length = std::strftime(Buffer, sizeof(Buffer), Format, &Local);
        return std::string(Buffer, Length);
    }
}

bool Logger::Init(const std::string& LogDir)
{
    std::error_code ec;
    FS::create_directories(LogDir, ec);
    if (ec)
    {
        std::cerr << "Logger: Failed to create log directory: " << LogDir << " - " << ec.message() << "\n";
        return false;
    }

    const std::string FilePath = (FS::path(LogDir) / (FilePrefix + GetTimestampForFilename() + ".txt")).string();
    {
        std::lock_guard<std::mutex> Lock(LogWriteMutex);
        if (LogFile.is_open())
        {
            LogFile.close();
        }
        LogFile.open(FilePath, std::ios::out | std::ios::app);
        if (!LogFile.is_open())
        {
            std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
            return false;
        }
        LogDirectory = LogDir;
        CurrentLogFilePath = FilePath;
    }

    Info("Offload Started at " + GetTimestamp());
    return true;
}

void Logger::Close()
{
    if (!IsOpen())
    {
        return;
    }
    Info("Offload Finished at " + GetTimestamp());
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    LogFile.close();
}

Logger::~Logger()
{
    Close();
}

bool Logger::IsOpen()
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    return LogFile.is_open();
}

void Logger::CleanupOldLogs()
{
    std::string Dir;
    std::string Current;
    {
        std::lock_guard<std::mutex> Lock(LogWriteMutex);
        Dir = LogDirectory;
        Current = CurrentLogFilePath;
    }
    if (Dir.empty())
    {
        return;
    }

    // Timestamped names sort oldest first
    std::vector<FS::path> RunLogs;
    std::error_code ec;
    for (FS::directory_iterator It(Dir, ec), End; !ec && It != End; It.increment(ec))
    {
        const std::string Name = It->path().filename().string();
        if (Name.rfind(FilePrefix, 0) == 0 && It->path().string() != Current)
        {
            RunLogs.push_back(It->path());
        }
    }
    if (ec)
    {
        Error("[Logger] Cannot list log directory " + Dir + ": " + ec.message());
        return;
    }
    std::sort(RunLogs.begin(), RunLogs.end());

    // The current log counts toward the limit
    const size_t Keep = ConfigGlobal::MaxLogFiles > 0 ? ConfigGlobal::MaxLogFiles - 1u : 0u;
    size_t Removed = 0;
    while (RunLogs.size() - Removed > Keep)
    {
        const FS::path& Oldest = RunLogs[Removed++];
        if (!FS::remove(Oldest, ec))
        {
            Error("[Logger] Could not remove old log " + Oldest.string() + ": " + ec.message());
        }
    }
    if (Removed > 0)
    {
        Info("[Logger] Removed " + std::to_string(Removed) + " old log files");
    }
}

void Logger::Write(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    if (!LogFile.is_open())
    {
        return;
    }
    LogFile << "[" << GetTimestamp() << "] [" << ToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

std::string Logger::GetTimestampForFilename()
{
    return FormatNow("%Y%m%d_%H%M%S");
}

std::string Logger::GetTimestamp()
{
    return FormatNow("%Y-%m-%d %H:%M:%S");
}

const char* Logger::ToString(LogLevel Level)
{
    return Level == LogLevel::ERROR ? "ERROR" : "INFO";
}
