#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <system_error>
#include <cstdint>

#include "TransferError.hpp"

class AccessManager;

struct FileWorkItem
{
    std::string SourcePath;
    std::string RelativePath;   // under the source root, reproduced at each destination
    uint64_t SizeBytes = 0;
};

struct ScanOutcome
{
    std::vector<FileWorkItem> Files;
    std::vector<std::string> Skipped;       // intentionally excluded
    std::vector<std::string> ScanErrors;    // subtrees or attributes that could not be read
    uint64_t TotalBytes = 0;
};

// Caller-supplied filters (presets); an empty extension list disables extension filtering.
struct ScanRules
{
    std::vector<std::string> MediaExtensions;
    std::vector<std::string> HousekeepingFiles;

    static ScanRules FromConfig();
};

class FileScanner
{
public:
    explicit FileScanner(AccessManager* access = nullptr);
    FileScanner(AccessManager* access, ScanRules rules);
    virtual ~FileScanner() = default;

    // Fails only when the root itself cannot be resolved, authorised or listed.
    bool Scan(const std::string& RootPath, ScanOutcome& Out, TransferError& Error);

    const ScanRules& GetRules() const { return Rules; }

protected:
    virtual bool ListDirectory(const std::filesystem::path& Dir, std::vector<std::filesystem::directory_entry>& Entries, std::error_code& ec);
    virtual bool ReadMetadataSize(const std::filesystem::directory_entry& Entry, uint64_t& Size);
    virtual bool ProbeSize(const std::filesystem::path& Path, uint64_t& Size);

private:
    AccessManager* Access;
    ScanRules Rules;

    bool ScanDirectoryIterative(const std::filesystem::path& Root, ScanOutcome& Out, TransferError& Error);
    void AddFile(const std::filesystem::directory_entry& Entry, const std::filesystem::path& Root, ScanOutcome& Out);

    bool IsHiddenOrTrash(const std::string& Name) const;
    bool IsHousekeeping(const std::string& Name) const;
    bool HasMediaExtension(const std::filesystem::path& Path) const;
};
