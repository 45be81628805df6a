#pragma once

#include <random>
#include <string>
#include <cstdint>

//Random lowercase hex string of ByteCount random bytes
inline std::string GenerateRandomHex(size_t ByteCount)
{
    static thread_local std::mt19937_64 Engine{ std::random_device{}() };
    static const char Digits[] = "0123456789abcdef";

    std::string Hex;
    Hex.reserve(ByteCount * 2);
    for (size_t i = 0; i < ByteCount; ++i)
    {
        uint8_t Byte = static_cast<uint8_t>(Engine() & 0xFF);
        Hex.push_back(Digits[Byte >> 4]);
        Hex.push_back(Digits[Byte & 0x0F]);
    }
    return Hex;
}
