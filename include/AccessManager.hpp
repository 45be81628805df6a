#pragma once

#include <string>
#include <unordered_map>
#include <optional>
#include <functional>
#include <mutex>

#include "CapabilityStore.hpp"

enum class AccessMode
{
    Read,
    ReadWrite
};

struct AccessCapability
{
    std::string Path;
    TokenBytes OpaqueToken;
    bool IsStale = false;
};

// Asked when the OS refuses access to a path that has no stored capability.
// Returning true means the user granted access and the check is retried.
// Runs under the manager's lock, so it must not call back into the manager.
using PermissionPrompt = std::function<bool(const std::string& Path)>;

class AccessManager
{
public:
    explicit AccessManager(CapabilityStore& store);
    ~AccessManager();

    AccessManager(const AccessManager&) = delete;
    AccessManager& operator=(const AccessManager&) = delete;

    // Returns the stored capability when it is still valid, renews it when the
    // underlying volume changed, mints a new one otherwise. nullopt means denied.
    std::optional<AccessCapability> Acquire(const std::string& Path, AccessMode Mode = AccessMode::Read);

    // Acquire, probe (read, or create+delete a probe file for write), release.
    bool Validate(const std::string& Path, AccessMode Mode = AccessMode::Read);

    void Release(const AccessCapability& Capability);

    bool IsStale(const AccessCapability& Capability) const;
    bool HasActiveGrant(const std::string& Path) const;
    size_t ActiveGrantCount() const;

    void SetPermissionPrompt(PermissionPrompt Prompt);

    static std::string NormalizePath(const std::string& Path);

private:
    struct ActiveGrant
    {
        int Fd = -1;
        size_t RefCount = 0;
    };

    CapabilityStore& Store;
    PermissionPrompt Prompt;

    mutable std::mutex AccessMutex;
    std::unordered_map<std::string, ActiveGrant> ActiveGrants;

    bool ProbeRead(const std::string& Path) const;
    bool ProbeWrite(const std::string& Path) const;
};
