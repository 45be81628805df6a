#include <iostream>
#include <filesystem>
#include <stack>
#include <algorithm>
#include <cctype>
#include <optional>

#include <fcntl.h>
#include <unistd.h>

#include "FileScanner.hpp"
#include "AccessManager.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    std::string ToLower(std::string Value)
    {
        std::transform(Value.begin(), Value.end(), Value.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Value;
    }

    std::string NormalizeExtension(const std::string& Extension)
    {
        std::string Result = ToLower(Extension);
        if (!Result.empty() && Result.front() == '.')
        {
            Result.erase(0, 1);
        }
        return Result;
    }
}

ScanRules ScanRules::FromConfig()
{
    ScanRules Rules;
    Rules.MediaExtensions = ConfigGlobal::MediaExtensions;
    Rules.HousekeepingFiles = ConfigGlobal::HousekeepingFiles;
    return Rules;
}

FileScanner::FileScanner(AccessManager* access) : FileScanner(access, ScanRules::FromConfig())
{
}

FileScanner::FileScanner(AccessManager* access, ScanRules rules) : Access(access), Rules(std::move(rules))
{
    for (auto& Extension : Rules.MediaExtensions)
    {
        Extension = NormalizeExtension(Extension);
    }
    for (auto& Name : Rules.HousekeepingFiles)
    {
        Name = ToLower(Name);
    }
}

bool FileScanner::IsHiddenOrTrash(const std::string& Name) const
{
    if (!Name.empty() && Name.front() == '.')
    {
        return true;
    }
    return Name == "Trashes" || Name == "$RECYCLE.BIN" || Name == "System Volume Information";
}

bool FileScanner::IsHousekeeping(const std::string& Name) const
{
    const std::string Lower = ToLower(Name);
    return std::find(Rules.HousekeepingFiles.begin(), Rules.HousekeepingFiles.end(), Lower) != Rules.HousekeepingFiles.end();
}

bool FileScanner::HasMediaExtension(const FS::path& Path) const
{
    if (Rules.MediaExtensions.empty())
    {
        return true;
    }
    const std::string Extension = NormalizeExtension(Path.extension().string());
    return std::find(Rules.MediaExtensions.begin(), Rules.MediaExtensions.end(), Extension) != Rules.MediaExtensions.end();
}

bool FileScanner::ListDirectory(const FS::path& Dir, std::vector<FS::directory_entry>& Entries, std::error_code& ec)
{
    Entries.clear();
    FS::directory_iterator It(Dir, ec);
    if (ec)
    {
        return false;
    }
    for (FS::directory_iterator End; It != End; It.increment(ec))
    {
        if (ec)
        {
            return false;
        }
        Entries.push_back(*It);
    }
    if (ec)
    {
        return false;
    }
    // Deterministic depth-first order
    std::sort(Entries.begin(), Entries.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
        return A.path().filename() < B.path().filename();
    });
    return true;
}

bool FileScanner::ReadMetadataSize(const FS::directory_entry& Entry, uint64_t& Size)
{
    std::error_code ec;
    uintmax_t Value = Entry.file_size(ec);
    if (ec)
    {
        return false;
    }
    Size = static_cast<uint64_t>(Value);
    return true;
}

// Secondary size source when the metadata lookup fails: seek to the end of the open file.
bool FileScanner::ProbeSize(const FS::path& Path, uint64_t& Size)
{
    int Fd = open(Path.c_str(), O_RDONLY | O_CLOEXEC);
    if (Fd < 0)
    {
        return false;
    }
    off_t End = lseek(Fd, 0, SEEK_END);
    close(Fd);
    if (End < 0)
    {
        return false;
    }
    Size = static_cast<uint64_t>(End);
    return true;
}

bool FileScanner::Scan(const std::string& RootPath, ScanOutcome& Out, TransferError& Error)
{
    Out = ScanOutcome{};
    FS::path Root = FS::path(AccessManager::NormalizePath(RootPath));

    std::error_code ec;
    if (!FS::exists(Root, ec))
    {
        Error = TransferError(TransferErrorKind::SourceInvalid, Root.string(), "path does not exist");
        std::cerr << "Scan Error: Path does not exist: " << Root.string() << "\n";
        Log.Error("[FileScanner] Path does not exist: " + Root.string());
        return false;
    }

    std::optional<AccessCapability> Capability;
    if (Access != nullptr)
    {
        Capability = Access->Acquire(Root.string(), AccessMode::Read);
        if (!Capability)
        {
            Error = TransferError(TransferErrorKind::PermissionDenied, Root.string(), "no read access to source");
            Log.Error("[FileScanner] " + Error.Describe());
            return false;
        }
    }

    bool Ok = true;
    if (FS::is_regular_file(Root, ec)) // Single file case
    {
        FS::directory_entry Entry(Root, ec);
        AddFile(Entry, Root.parent_path(), Out);
    }
    else if (!FS::is_directory(Root, ec))
    {
        Error = TransferError(TransferErrorKind::SourceInvalid, Root.string(), "neither a directory nor a file");
        Log.Error("[FileScanner] Path is neither a directory nor a file: " + Root.string());
        Ok = false;
    }
    else
    {
        Ok = ScanDirectoryIterative(Root, Out, Error);
    }

    if (Capability)
    {
        Access->Release(*Capability);
    }

    if (Ok)
    {
        Log.Info("[FileScanner] Scanned " + Root.string() + ": " + std::to_string(Out.Files.size()) + " files, " + std::to_string(Out.TotalBytes) + " bytes, "
            + std::to_string(Out.Skipped.size()) + " skipped, " + std::to_string(Out.ScanErrors.size()) + " unreadable");
    }
    return Ok;
}

bool FileScanner::ScanDirectoryIterative(const FS::path& Root, ScanOutcome& Out, TransferError& Error)
{
    std::stack<FS::path> DirStack;
    DirStack.push(Root);
    std::vector<FS::directory_entry> Entries;

    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        std::error_code ec;
        if (!ListDirectory(Current, Entries, ec))
        {
            if (Current == Root)
            {
                Error = TransferError(TransferErrorKind::ScanFailed, Root.string(), ec.message());
                std::cerr << "Scan Error: Cannot list source root: " << Root.string() << "\n";
                Log.Error("[FileScanner] Cannot list source root: " + Root.string() + " - " + ec.message());
                Out = ScanOutcome{};
                return false;
            }
            // One unreadable subtree never stops the rest of the scan
            Out.ScanErrors.push_back(Current.string());
            std::cerr << "Skipping unreadable directory: " << Current << "\n";
            Log.Error(std::string("[FileScanner] Filesystem error iterating directory: ") + ec.message() + std::string(" Path: ") + Current.string());
            continue;
        }

        // Pushed in reverse so the stack pops subdirectories in name order
        std::vector<FS::path> SubDirs;
        for (const auto& Entry : Entries)
        {
            const std::string Name = Entry.path().filename().string();

            if (IsHiddenOrTrash(Name))
            {
                Out.Skipped.push_back(Entry.path().string());
                Log.Info(std::string("[FileScanner] Skipping hidden/system entry: ") + Entry.path().string());
                continue;
            }

            // Skip symbolic links to avoid loops or unsupported files.
            std::error_code statEc;
            if (Entry.is_symlink(statEc))
            {
                Out.Skipped.push_back(Entry.path().string());
                Log.Info(std::string("[FileScanner] Skipping SymLink: ") + Entry.path().string());
                continue;
            }

            if (Entry.is_directory(statEc))
            {
                SubDirs.push_back(Entry.path());
                continue;
            }

            if (IsHousekeeping(Name))
            {
                Out.Skipped.push_back(Entry.path().string());
                Log.Info(std::string("[FileScanner] Skipping camera housekeeping file: ") + Entry.path().string());
                continue;
            }

            if (!Entry.is_regular_file(statEc))
            {
                if (statEc)
                {
                    Out.ScanErrors.push_back(Entry.path().string());
                    Log.Error(std::string("[FileScanner] Cannot stat entry: ") + Entry.path().string() + " - " + statEc.message());
                }
                else
                {
                    Out.Skipped.push_back(Entry.path().string());
                }
                continue;
            }

            if (!HasMediaExtension(Entry.path()))
            {
                Out.Skipped.push_back(Entry.path().string());
                Log.Info(std::string("[FileScanner] Skipping non-media file: ") + Entry.path().string());
                continue;
            }

            AddFile(Entry, Root, Out);
        }

        for (auto It = SubDirs.rbegin(); It != SubDirs.rend(); ++It)
        {
            DirStack.push(*It);
        }
    }
    return true;
}

void FileScanner::AddFile(const FS::directory_entry& Entry, const FS::path& Root, ScanOutcome& Out)
{
    FileWorkItem Item;
    Item.SourcePath = Entry.path().string();
    Item.RelativePath = Entry.path().lexically_relative(Root).generic_string();

    uint64_t Size = 0;
    if (!ReadMetadataSize(Entry, Size))
    {
        Log.Info(std::string("[FileScanner] Metadata size unavailable, probing file: ") + Item.SourcePath);
        if (!ProbeSize(Entry.path(), Size))
        {
            Out.ScanErrors.push_back(Item.SourcePath);
            Log.Error(std::string("[FileScanner] Size could not be determined, counted as 0 bytes: ") + Item.SourcePath);
            Size = 0;
        }
    }
    Item.SizeBytes = Size;

    Out.TotalBytes += Item.SizeBytes;
    Out.Files.push_back(std::move(Item));
}
