#pragma once

#include <string>
#include <memory>
#include <future>
#include <functional>
#include <cstdint>

#include "FileHasher.hpp"
#include "TransferControl.hpp"
#include "TransferError.hpp"

class AccessManager;

// Escalation tiers, tried in this order starting at CopyOptions::FirstStrategy.
enum class CopyStrategy
{
    Atomic = 1,     // copy_file_range into a temp file, rename, size compare
    Buffered = 2,   // whole file through memory, temp file, rename, size compare
    Chunked = 3     // 1 MiB blocks, progress + cancellation per block, checksum verified
};

std::string ToString(CopyStrategy Strategy);

struct CopyOptions
{
    ChecksumAlgorithm Algorithm = ChecksumAlgorithm::XXHash64;
    CopyStrategy FirstStrategy = CopyStrategy::Atomic;
    uint64_t BufferedCopyLimit = 512ULL * 1024 * 1024;
    bool DetectWeakFilesystems = true;

    // When set, both ends must lie under a grant the manager currently holds.
    const AccessManager* Access = nullptr;

    static CopyOptions FromConfig();
};

struct CopyResult
{
    bool Success = false;
    TransferError Error;
    CopyStrategy StrategyUsed = CopyStrategy::Atomic;
    uint64_t BytesCopied = 0;
    bool Verified = false;          // source and destination digests compared equal
    ChecksumResult Checksum;        // valid when Verified
};

using ProgressCallback = std::function<void(uint64_t BytesSoFar, uint64_t TotalBytes, const std::string& FileName)>;
using CompletionCallback = std::function<void(const CopyResult& Result)>;

// Returned by CopyFileAsync. Cancel is cooperative; Wait joins the copy.
class CopyHandle
{
public:
    CopyHandle() = default;
    CopyHandle(std::shared_ptr<TransferControl> control, std::shared_future<CopyResult> future);

    void Cancel();
    void Pause();
    void Resume();

    CopyResult Wait() const;
    bool IsDone() const;
    bool IsValid() const { return Future.valid(); }

private:
    std::shared_ptr<TransferControl> Control;
    std::shared_future<CopyResult> Future;
};

class FileCopier
{
public:
    static bool CopyFileRangeSupported;
    static void CheckCopyFileRangeSupport();

    // Runs the tier escalation on the calling thread. OnProgress is invoked on
    // the same thread; Control may be null.
    static CopyResult CopyFile(const std::string& Source, const std::string& Destination, const CopyOptions& Options,
        TransferControl* Control = nullptr, const ProgressCallback& OnProgress = nullptr);

    static CopyHandle CopyFileAsync(const std::string& Source, const std::string& Destination, const CopyOptions& Options,
        ProgressCallback OnProgress = nullptr, CompletionCallback OnComplete = nullptr);

    // FAT/exFAT volumes, where silent corruption on removable media is common.
    static bool IsWeakFilesystem(const std::string& Path);

    // DestinationRoot/RelativePath, or empty when RelativePath escapes the root.
    static std::string DestinationPathFor(const std::string& DestinationRoot, const std::string& RelativePath);

    static bool RemovePartial(const std::string& Path);

private:
    struct SourceInfo
    {
        uint64_t Size = 0;
        int64_t AccessSec = 0, AccessNsec = 0;
        int64_t ModifySec = 0, ModifyNsec = 0;
    };

    static bool CopyAtomic(const std::string& Source, const std::string& Destination, const SourceInfo& Info, TransferError& Error);
    static bool CopyBuffered(const std::string& Source, const std::string& Destination, const SourceInfo& Info, TransferError& Error);
    static bool CopyChunked(const std::string& Source, const std::string& Destination, const SourceInfo& Info, const CopyOptions& Options,
        TransferControl* Control, const ProgressCallback& OnProgress, CopyResult& Result);

    static bool ValidateEndpoints(const std::string& Source, const std::string& Destination, const CopyOptions& Options, SourceInfo& Info, TransferError& Error);
    static bool CommitTemp(const std::string& TempPath, const std::string& Destination, uint64_t ExpectedSize, TransferError& Error);
    static std::string TempPathFor(const std::string& Destination);
    static void PreserveTimestamps(int Fd, const SourceInfo& Info, const std::string& Destination);

    static TransferError HandleCopyFailure(TransferErrorKind Kind, const std::string& FilePath, const std::string& Reason, int ErrorCode);
};
