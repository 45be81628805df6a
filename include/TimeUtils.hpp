#pragma once

#include <ctime>
#include <cstdint>
#include <cstdio>
#include <string>

// 2026-10-18T09:30:00Z
inline std::string FormatIsoUtc(std::time_t Time)
{
    std::tm Parts{};
    gmtime_r(&Time, &Parts);
    char Buffer[32];
    std::strftime(Buffer, sizeof(Buffer), "%Y-%m-%dT%H:%M:%SZ", &Parts);
    return Buffer;
}

// 1536 -> "1.50 KiB"
inline std::string FormatBytes(uint64_t Bytes)
{
    static const char* Units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
    double Value = static_cast<double>(Bytes);
    size_t Unit = 0;
    while (Value >= 1024.0 && Unit < 4)
    {
        Value /= 1024.0;
        Unit++;
    }

    char Buffer[32];
    if (Unit == 0)
        std::snprintf(Buffer, sizeof(Buffer), "%llu B", static_cast<unsigned long long>(Bytes));
    else
        std::snprintf(Buffer, sizeof(Buffer), "%.2f %s", Value, Units[Unit]);
    return Buffer;
}

// Negative means unknown
inline std::string FormatDuration(double Seconds)
{
    if (Seconds < 0)
    {
        return "--:--";
    }
    int64_t Total = static_cast<int64_t>(Seconds + 0.5);
    char Buffer[32];
    if (Total >= 3600)
        std::snprintf(Buffer, sizeof(Buffer), "%lld:%02lld:%02lld", static_cast<long long>(Total / 3600), static_cast<long long>((Total / 60) % 60), static_cast<long long>(Total % 60));
    else
        std::snprintf(Buffer, sizeof(Buffer), "%02lld:%02lld", static_cast<long long>(Total / 60), static_cast<long long>(Total % 60));
    return Buffer;
}
