#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <optional>
#include <mutex>
#include <cstdint>

using TokenBytes = std::vector<uint8_t>;

// Persists {path -> opaque token} across process restarts. Every read and
// read-modify-write goes through StoreMutex; the backing map never leaves
// this class.
class CapabilityStore
{
public:
    explicit CapabilityStore(const std::string& storeFilePath);

    CapabilityStore(const CapabilityStore&) = delete;
    CapabilityStore& operator=(const CapabilityStore&) = delete;

    bool Load();

    std::optional<TokenBytes> Get(const std::string& Path) const;
    bool Put(const std::string& Path, const TokenBytes& Token);
    bool Remove(const std::string& Path);

    size_t Size() const;
    const std::string& GetFilePath() const { return StoreFilePath; }

private:
    mutable std::mutex StoreMutex;
    std::string StoreFilePath;
    std::unordered_map<std::string, TokenBytes> Entries;

    void EnsureStoreDirExists();
    bool SaveLocked();
};
