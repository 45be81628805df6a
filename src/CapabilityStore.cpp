#include "CapabilityStore.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace FS = std::filesystem;

namespace
{
    constexpr uint32_t MaxPathLength = 4096;
    constexpr uint32_t MaxTokenLength = 1024;

    template<typename T>
    bool ReadBinary(std::ifstream& stream, T& value)
    {
        return static_cast<bool>(stream.read(reinterpret_cast<char*>(&value), sizeof(T)));
    }

    template<typename T>
    bool WriteBinary(std::ofstream& stream, const T& value)
    {
        return static_cast<bool>(stream.write(reinterpret_cast<const char*>(&value), sizeof(T)));
    }
}

CapabilityStore::CapabilityStore(const std::string& storeFilePath) : StoreFilePath(storeFilePath)
{
    EnsureStoreDirExists();
}

void CapabilityStore::EnsureStoreDirExists()
{
    auto dir = FS::path(StoreFilePath).parent_path();
    std::error_code ec;
    if (!dir.empty() && !FS::exists(dir, ec))
    {
        FS::create_directories(dir, ec);
        if (ec)
        {
            std::cerr << "CapabilityStore: Failed to create store directory: " << ec.message() << "\n";
            Log.Error(std::string("[CapabilityStore] Failed to create store directory: ") + ec.message());
        }
    }
}

// Loads every {path, token} record from the binary store file into memory
bool CapabilityStore::Load()
{
    std::lock_guard<std::mutex> lock(StoreMutex);
    Entries.clear();

    std::ifstream file(StoreFilePath, std::ios::binary);
    if (!file)
    {
        Log.Info(std::string("[CapabilityStore::Load] Starting Fresh. No Store File Found at: ") + StoreFilePath);
        return true;
    }

    while (file)
    {
        uint32_t pathLen = 0;
        if (!ReadBinary(file, pathLen)) break;
        if (pathLen == 0 || pathLen > MaxPathLength)
        {
            Log.Error(std::string("[CapabilityStore::Load] Invalid Path Length in Store"));
            Entries.clear();
            return false;
        }

        std::string path(pathLen, '\0');
        if (!file.read(&path[0], pathLen))
        {
            Log.Error(std::string("[CapabilityStore::Load] Failed to Read Path String"));
            Entries.clear();
            return false;
        }

        uint32_t tokenLen = 0;
        if (!ReadBinary(file, tokenLen) || tokenLen > MaxTokenLength)
        {
            Log.Error(std::string("[CapabilityStore::Load] Invalid Token Length for: ") + path);
            Entries.clear();
            return false;
        }

        TokenBytes token(tokenLen);
        if (tokenLen > 0 && !file.read(reinterpret_cast<char*>(token.data()), tokenLen))
        {
            Log.Error(std::string("[CapabilityStore::Load] Failed to Read Token for: ") + path);
            Entries.clear();
            return false;
        }

        Entries[std::move(path)] = std::move(token);
    }

    Log.Info(std::string("[CapabilityStore::Load] Loaded ") + std::to_string(Entries.size()) + std::string(" capabilities."));
    return true;
}

// Writes the whole map to a sibling temp file and renames it over the store so a crash never leaves a torn file
bool CapabilityStore::SaveLocked()
{
    const std::string TempPath = StoreFilePath + ".tmp";
    {
        std::ofstream file(TempPath, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            Log.Error(std::string("[CapabilityStore::Save] Failed to Open Store File for Writing: ") + TempPath);
            return false;
        }

        for (const auto& [path, token] : Entries)
        {
            uint32_t pathLen = static_cast<uint32_t>(path.size());
            uint32_t tokenLen = static_cast<uint32_t>(token.size());
            if (!WriteBinary(file, pathLen)) return false;
            if (!file.write(path.data(), pathLen)) return false;
            if (!WriteBinary(file, tokenLen)) return false;
            if (tokenLen > 0 && !file.write(reinterpret_cast<const char*>(token.data()), tokenLen)) return false;
        }
        file.flush();
        if (!file)
        {
            Log.Error(std::string("[CapabilityStore::Save] Write failed: ") + TempPath);
            return false;
        }
    }

    std::error_code ec;
    FS::rename(TempPath, StoreFilePath, ec);
    if (ec)
    {
        Log.Error(std::string("[CapabilityStore::Save] Failed to replace store file: ") + ec.message());
        FS::remove(TempPath, ec);
        return false;
    }
    return true;
}

std::optional<TokenBytes> CapabilityStore::Get(const std::string& Path) const
{
    std::lock_guard<std::mutex> lock(StoreMutex);
    auto it = Entries.find(Path);
    if (it == Entries.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool CapabilityStore::Put(const std::string& Path, const TokenBytes& Token)
{
    std::lock_guard<std::mutex> lock(StoreMutex);
    Entries[Path] = Token;
    return SaveLocked();
}

bool CapabilityStore::Remove(const std::string& Path)
{
    std::lock_guard<std::mutex> lock(StoreMutex);
    if (Entries.erase(Path) == 0)
    {
        return true;
    }
    return SaveLocked();
}

size_t CapabilityStore::Size() const
{
    std::lock_guard<std::mutex> lock(StoreMutex);
    return Entries.size();
}
