#include "AccessManager.hpp"
#include "IdUtils.hpp"
#include "Logger.hpp"

#include <blake3.h>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <dirent.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace FS = std::filesystem;

namespace
{
    constexpr char TokenMagic[4] = { 'O', 'C', 'A', 'P' };
    constexpr uint8_t TokenVersion = 1;
    constexpr size_t TagLength = 16;
    constexpr size_t TokenLength = sizeof(TokenMagic) + 1 + sizeof(uint64_t) * 2 + TagLength;
    constexpr const char* TagContext = "CardOffload access capability v1";

    // Volume identity the token is bound to; a remount or move changes it.
    struct VolumeIdentity
    {
        uint64_t Device = 0;
        uint64_t Inode = 0;
    };

    void ComputeTag(const std::string& Path, const VolumeIdentity& Identity, uint8_t* OutTag)
    {
        blake3_hasher hasher;
        blake3_hasher_init_derive_key(&hasher, TagContext);
        blake3_hasher_update(&hasher, Path.data(), Path.size());
        blake3_hasher_update(&hasher, &Identity.Device, sizeof(Identity.Device));
        blake3_hasher_update(&hasher, &Identity.Inode, sizeof(Identity.Inode));
        blake3_hasher_finalize(&hasher, OutTag, TagLength);
    }

    TokenBytes MintToken(const std::string& Path, const VolumeIdentity& Identity)
    {
        TokenBytes Token(TokenLength);
        uint8_t* Cursor = Token.data();
        std::memcpy(Cursor, TokenMagic, sizeof(TokenMagic));
        Cursor += sizeof(TokenMagic);
        *Cursor++ = TokenVersion;
        std::memcpy(Cursor, &Identity.Device, sizeof(uint64_t));
        Cursor += sizeof(uint64_t);
        std::memcpy(Cursor, &Identity.Inode, sizeof(uint64_t));
        Cursor += sizeof(uint64_t);
        ComputeTag(Path, Identity, Cursor);
        return Token;
    }

    bool DecodeToken(const std::string& Path, const TokenBytes& Token, VolumeIdentity& Out)
    {
        if (Token.size() != TokenLength || std::memcmp(Token.data(), TokenMagic, sizeof(TokenMagic)) != 0 || Token[4] != TokenVersion)
        {
            return false;
        }
        const uint8_t* Cursor = Token.data() + sizeof(TokenMagic) + 1;
        std::memcpy(&Out.Device, Cursor, sizeof(uint64_t));
        Cursor += sizeof(uint64_t);
        std::memcpy(&Out.Inode, Cursor, sizeof(uint64_t));
        Cursor += sizeof(uint64_t);

        uint8_t Expected[TagLength];
        ComputeTag(Path, Out, Expected);
        return std::memcmp(Expected, Cursor, TagLength) == 0;
    }

    bool CurrentIdentity(const std::string& Path, VolumeIdentity& Out, bool& IsDirectory)
    {
        struct stat StatBuf;
        if (stat(Path.c_str(), &StatBuf) != 0)
        {
            return false;
        }
        Out.Device = static_cast<uint64_t>(StatBuf.st_dev);
        Out.Inode = static_cast<uint64_t>(StatBuf.st_ino);
        IsDirectory = S_ISDIR(StatBuf.st_mode);
        return true;
    }

    bool TokenIsStale(const std::string& Path, const TokenBytes& Token)
    {
        VolumeIdentity Stored;
        VolumeIdentity Current;
        bool IsDirectory = false;
        if (!DecodeToken(Path, Token, Stored) || !CurrentIdentity(Path, Current, IsDirectory))
        {
            return true;
        }
        return Stored.Device != Current.Device || Stored.Inode != Current.Inode;
    }

    bool HasPermission(const std::string& Path, bool IsDirectory, AccessMode Mode)
    {
        int Flags = R_OK;
        if (IsDirectory)
            Flags |= X_OK;
        if (Mode == AccessMode::ReadWrite)
            Flags |= W_OK;
        return access(Path.c_str(), Flags) == 0;
    }
}

AccessManager::AccessManager(CapabilityStore& store) : Store(store)
{
}

AccessManager::~AccessManager()
{
    std::lock_guard<std::mutex> lock(AccessMutex);
    for (auto& [path, grant] : ActiveGrants)
    {
        if (grant.Fd >= 0)
        {
            close(grant.Fd);
        }
    }
    ActiveGrants.clear();
}

std::string AccessManager::NormalizePath(const std::string& Path)
{
    std::error_code ec;
    FS::path Abs = FS::absolute(FS::path(Path), ec);
    if (ec)
    {
        Abs = FS::path(Path);
    }
    std::string Normal = Abs.lexically_normal().string();
    while (Normal.size() > 1 && Normal.back() == '/')
    {
        Normal.pop_back();
    }
    return Normal;
}

void AccessManager::SetPermissionPrompt(PermissionPrompt prompt)
{
    std::lock_guard<std::mutex> lock(AccessMutex);
    Prompt = std::move(prompt);
}

std::optional<AccessCapability> AccessManager::Acquire(const std::string& Path, AccessMode Mode)
{
    const std::string Key = NormalizePath(Path);

    VolumeIdentity Identity;
    bool IsDirectory = false;
    if (!CurrentIdentity(Key, Identity, IsDirectory))
    {
        Log.Error(std::string("[AccessManager] Cannot acquire, path does not resolve: ") + Key + " - " + strerror(errno));
        return std::nullopt;
    }

    // Held across lookup, renewal and persistence so two acquirers never interleave a read-modify-write.
    std::lock_guard<std::mutex> lock(AccessMutex);

    TokenBytes Token;
    std::optional<TokenBytes> Stored = Store.Get(Key);
    if (Stored)
    {
        if (!TokenIsStale(Key, *Stored))
        {
            Token = std::move(*Stored);
        }
        else
        {
            Log.Info(std::string("[AccessManager] Stored capability is stale, renewing: ") + Key);
        }
    }

    if (Token.empty())
    {
        if (!HasPermission(Key, IsDirectory, Mode))
        {
            bool Granted = Prompt && Prompt(Key) && HasPermission(Key, IsDirectory, Mode);
            if (!Granted)
            {
                Log.Error(std::string("[AccessManager] Access denied: ") + Key);
                return std::nullopt;
            }
        }

        if (!CurrentIdentity(Key, Identity, IsDirectory))
        {
            Log.Error(std::string("[AccessManager] Path vanished while acquiring: ") + Key);
            return std::nullopt;
        }
        Token = MintToken(Key, Identity);
        if (!Store.Put(Key, Token))
        {
            Log.Error(std::string("[AccessManager] Capability minted but could not be persisted: ") + Key);
        }
        else
        {
            Log.Info(std::string("[AccessManager] Stored capability for: ") + Key);
        }
    }

    auto it = ActiveGrants.find(Key);
    if (it != ActiveGrants.end())
    {
        ++it->second.RefCount;
    }
    else
    {
        int Fd = open(Key.c_str(), O_RDONLY | O_CLOEXEC | (IsDirectory ? O_DIRECTORY : 0));
        if (Fd < 0)
        {
            Log.Error(std::string("[AccessManager] OS refused grant for: ") + Key + " - " + strerror(errno));
            return std::nullopt;
        }
        ActiveGrants.emplace(Key, ActiveGrant{ Fd, 1 });
    }

    AccessCapability Capability;
    Capability.Path = Key;
    Capability.OpaqueToken = std::move(Token);
    Capability.IsStale = false;
    return Capability;
}

void AccessManager::Release(const AccessCapability& Capability)
{
    std::lock_guard<std::mutex> lock(AccessMutex);
    auto it = ActiveGrants.find(Capability.Path);
    if (it == ActiveGrants.end())
    {
        Log.Error(std::string("[AccessManager] Release for path without active grant: ") + Capability.Path);
        return;
    }
    if (--it->second.RefCount == 0)
    {
        if (it->second.Fd >= 0)
        {
            close(it->second.Fd);
        }
        ActiveGrants.erase(it);
    }
}

bool AccessManager::IsStale(const AccessCapability& Capability) const
{
    return Capability.IsStale || TokenIsStale(Capability.Path, Capability.OpaqueToken);
}

bool AccessManager::HasActiveGrant(const std::string& Path) const
{
    const std::string Key = NormalizePath(Path);
    std::lock_guard<std::mutex> lock(AccessMutex);
    for (const auto& [GrantPath, Grant] : ActiveGrants)
    {
        if (Key == GrantPath)
        {
            return true;
        }
        const std::string Prefix = (GrantPath == "/") ? GrantPath : GrantPath + "/";
        if (Key.compare(0, Prefix.size(), Prefix) == 0)
        {
            return true;
        }
    }
    return false;
}

size_t AccessManager::ActiveGrantCount() const
{
    std::lock_guard<std::mutex> lock(AccessMutex);
    return ActiveGrants.size();
}

bool AccessManager::Validate(const std::string& Path, AccessMode Mode)
{
    std::optional<AccessCapability> Capability = Acquire(Path, Mode);
    if (!Capability)
    {
        return false;
    }

    bool Ok = ProbeRead(Capability->Path);
    if (Ok && Mode == AccessMode::ReadWrite)
    {
        Ok = ProbeWrite(Capability->Path);
    }

    Release(*Capability);

    if (!Ok)
    {
        Log.Error(std::string("[AccessManager] Validation probe failed: ") + Capability->Path);
    }
    return Ok;
}

bool AccessManager::ProbeRead(const std::string& Path) const
{
    std::error_code ec;
    if (FS::is_directory(Path, ec))
    {
        DIR* Dir = opendir(Path.c_str());
        if (Dir == nullptr)
        {
            return false;
        }
        errno = 0;
        readdir(Dir);
        bool Ok = (errno == 0);
        closedir(Dir);
        return Ok;
    }

    int Fd = open(Path.c_str(), O_RDONLY | O_CLOEXEC);
    if (Fd < 0)
    {
        return false;
    }
    char Byte;
    ssize_t BytesRead = read(Fd, &Byte, 1);
    close(Fd);
    return BytesRead >= 0;
}

bool AccessManager::ProbeWrite(const std::string& Path) const
{
    std::error_code ec;
    FS::path Dir = FS::is_directory(Path, ec) ? FS::path(Path) : FS::path(Path).parent_path();
    FS::path Probe = Dir / (".cardoffload_probe_" + GenerateRandomHex(8));

    int Fd = open(Probe.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (Fd < 0)
    {
        Log.Error(std::string("[AccessManager] Write probe failed in ") + Dir.string() + " - " + strerror(errno));
        return false;
    }
    close(Fd);

    if (unlink(Probe.c_str()) != 0)
    {
        Log.Error(std::string("[AccessManager] Could not remove write probe: ") + Probe.string());
        return false;
    }
    return true;
}
