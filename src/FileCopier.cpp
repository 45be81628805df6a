#include "FileCopier.hpp"
#include "AccessManager.hpp"
#include "ConfigGlobal.hpp"
#include "IdUtils.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <iostream>
#include <vector>
#include <new>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/vfs.h>
#include <cerrno>
#include <cstring>

namespace FS = std::filesystem;

bool FileCopier::CopyFileRangeSupported = true;

void FileCopier::CheckCopyFileRangeSupport()
{
    int srcFd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    int destFd = open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (srcFd < 0 || destFd < 0)
    {
        if (srcFd >= 0) close(srcFd);
        if (destFd >= 0) close(destFd);
        CopyFileRangeSupported = false;
        return;
    }

    ssize_t result = copy_file_range(srcFd, nullptr, destFd, nullptr, 1, 0);
    CopyFileRangeSupported = (result >= 0 || errno != ENOSYS);

    close(srcFd);
    close(destFd);
}

namespace
{
    struct CopyFileRangeInit
    {
        CopyFileRangeInit()
        {
            FileCopier::CheckCopyFileRangeSupport();
        }
    };

    static CopyFileRangeInit InitCopyFileRangeSupport;

    constexpr unsigned long MsdosSuperMagic = 0x4d44;
    constexpr unsigned long ExfatSuperMagic = 0x2011BAB0;

    TransferErrorKind SourceErrorKind(int Err)
    {
        switch (Err)
        {
        case ENOENT:
        case ENOTDIR:
            return TransferErrorKind::FileNotFound;
        case EACCES:
        case EPERM:
            return TransferErrorKind::PermissionDenied;
        default:
            return TransferErrorKind::CopyFailed;
        }
    }

    TransferErrorKind DestinationErrorKind(int Err)
    {
        switch (Err)
        {
        case EACCES:
        case EPERM:
        case EROFS:
        case ENOSPC:
        case EDQUOT:
            return TransferErrorKind::DestinationNotWritable;
        case ENOENT:
        case ENOTDIR:
        case EISDIR:
            return TransferErrorKind::DestinationInvalid;
        default:
            return TransferErrorKind::CopyFailed;
        }
    }

    // Reads until Length bytes or EOF. Returns the byte count, -1 on error.
    ssize_t ReadFull(int Fd, char* Data, size_t Length, int& Err)
    {
        size_t Total = 0;
        while (Total < Length)
        {
            ssize_t N = read(Fd, Data + Total, Length - Total);
            if (N < 0)
            {
                if (errno == EINTR)
                    continue;
                Err = errno;
                return -1;
            }
            if (N == 0)
                break;
            Total += static_cast<size_t>(N);
        }
        return static_cast<ssize_t>(Total);
    }

    bool WriteAll(int Fd, const char* Data, size_t Length, int& Err)
    {
        size_t Written = 0;
        while (Written < Length)
        {
            ssize_t N = write(Fd, Data + Written, Length - Written);
            if (N < 0)
            {
                if (errno == EINTR)
                    continue;
                Err = errno;
                return false;
            }
            Written += static_cast<size_t>(N);
        }
        return true;
    }
}

std::string ToString(CopyStrategy Strategy)
{
    switch (Strategy)
    {
    case CopyStrategy::Atomic:   return "Atomic";
    case CopyStrategy::Buffered: return "Buffered";
    case CopyStrategy::Chunked:  return "Chunked";
    }
    return "Unknown";
}

CopyOptions CopyOptions::FromConfig()
{
    CopyOptions Options;
    if (!ParseChecksumAlgorithm(ConfigGlobal::ChecksumAlgorithm, Options.Algorithm))
    {
        Log.Error("[FileCopier] Unknown checksum algorithm '" + ConfigGlobal::ChecksumAlgorithm + "', using xxHash64");
        Options.Algorithm = ChecksumAlgorithm::XXHash64;
    }
    Options.FirstStrategy = ConfigGlobal::AlwaysVerify ? CopyStrategy::Chunked : CopyStrategy::Atomic;
    Options.BufferedCopyLimit = static_cast<uint64_t>(ConfigGlobal::BufferedCopyLimitMB) * 1024 * 1024;
    return Options;
}

CopyHandle::CopyHandle(std::shared_ptr<TransferControl> control, std::shared_future<CopyResult> future)
    : Control(std::move(control)), Future(std::move(future))
{
}

void CopyHandle::Cancel()
{
    if (Control)
        Control->Cancel();
}

void CopyHandle::Pause()
{
    if (Control)
        Control->Pause();
}

void CopyHandle::Resume()
{
    if (Control)
        Control->Resume();
}

CopyResult CopyHandle::Wait() const
{
    if (!Future.valid())
    {
        CopyResult Result;
        Result.Error = TransferError(TransferErrorKind::CopyFailed, "", "no copy in flight");
        return Result;
    }
    return Future.get();
}

bool CopyHandle::IsDone() const
{
    return Future.valid() && Future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

CopyResult FileCopier::CopyFile(const std::string& Source, const std::string& Destination, const CopyOptions& Options,
    TransferControl* Control, const ProgressCallback& OnProgress)
{
    CopyResult Result;
    const std::string FileName = FS::path(Source).filename().string();

    if (Control != nullptr && Control->IsCancelled())
    {
        Result.Error = TransferError(TransferErrorKind::Cancelled, Source, "cancelled before start");
        return Result;
    }

    SourceInfo Info;
    if (!ValidateEndpoints(Source, Destination, Options, Info, Result.Error))
    {
        Log.Error("[FileCopier] " + Result.Error.Describe());
        return Result;
    }

    CopyStrategy First = Options.FirstStrategy;
    if (First != CopyStrategy::Chunked && Options.DetectWeakFilesystems
        && (IsWeakFilesystem(Source) || IsWeakFilesystem(FS::path(Destination).parent_path().string())))
    {
        Log.Info("[FileCopier] Weak filesystem detected, starting with verified chunked copy: " + Source);
        First = CopyStrategy::Chunked;
    }

    std::cout << "[COPY] " << Source << " → " << Destination << "\n";
    Log.Info(std::string("[FileCopier] Copying File: ") + Source + std::string(" → ") + Destination);

    if (OnProgress)
    {
        OnProgress(0, Info.Size, FileName);
    }

    TransferError LastError;
    for (int Tier = static_cast<int>(First); Tier <= static_cast<int>(CopyStrategy::Chunked); ++Tier)
    {
        const CopyStrategy Strategy = static_cast<CopyStrategy>(Tier);

        if (Control != nullptr && !Control->WaitWhilePaused())
        {
            LastError = TransferError(TransferErrorKind::Cancelled, Source, "cancelled before " + ToString(Strategy) + " copy");
            break;
        }

        if (Strategy == CopyStrategy::Buffered && Info.Size > Options.BufferedCopyLimit)
        {
            Log.Info("[FileCopier] " + std::to_string(Info.Size) + " bytes exceeds buffered copy limit, skipping to chunked copy: " + Source);
            continue;
        }

        Result.StrategyUsed = Strategy;
        bool Ok = false;
        if (Strategy == CopyStrategy::Atomic)
        {
            Ok = CopyAtomic(Source, Destination, Info, LastError);
        }
        else if (Strategy == CopyStrategy::Buffered)
        {
            Ok = CopyBuffered(Source, Destination, Info, LastError);
        }
        else
        {
            Ok = CopyChunked(Source, Destination, Info, Options, Control, OnProgress, Result);
            LastError = Result.Error;
        }

        if (Ok)
        {
            Result.Success = true;
            Result.Error = TransferError();
            if (Strategy != CopyStrategy::Chunked)
            {
                Result.BytesCopied = Info.Size;
                if (OnProgress)
                {
                    OnProgress(Info.Size, Info.Size, FileName);
                }
            }
            Log.Info("[FileCopier] " + ToString(Strategy) + " copy complete" + (Result.Verified ? " (verified " + ToString(Options.Algorithm) + ")" : std::string()) + ": " + Destination);
            return Result;
        }

        // Escalating cannot help once the source is gone, the copy was cancelled or verification failed
        if (LastError.Kind == TransferErrorKind::FileNotFound || LastError.Kind == TransferErrorKind::Cancelled
            || LastError.Kind == TransferErrorKind::ChecksumMismatch)
        {
            break;
        }
        if (Strategy != CopyStrategy::Chunked)
        {
            Log.Info("[FileCopier] " + ToString(Strategy) + " copy failed, escalating: " + LastError.Describe());
        }
    }

    if (!LastError.IsSet())
    {
        LastError = TransferError(TransferErrorKind::CopyFailed, Source, "no copy strategy succeeded");
    }
    Result.Success = false;
    Result.Error = LastError;
    if (LastError.Kind == TransferErrorKind::Cancelled)
    {
        Log.Info("[FileCopier] Copy cancelled: " + Source);
    }
    else
    {
        std::cerr << "[ERROR] Copy failed: " << LastError.Describe() << "\n";
        Log.Error("[FileCopier] Copy Failed: " + LastError.Describe());
    }
    return Result;
}

CopyHandle FileCopier::CopyFileAsync(const std::string& Source, const std::string& Destination, const CopyOptions& Options,
    ProgressCallback OnProgress, CompletionCallback OnComplete)
{
    auto Control = std::make_shared<TransferControl>();
    std::shared_future<CopyResult> Future = std::async(std::launch::async,
        [Source, Destination, Options, Control, OnProgress = std::move(OnProgress), OnComplete = std::move(OnComplete)]()
        {
            CopyResult Result = CopyFile(Source, Destination, Options, Control.get(), OnProgress);
            if (OnComplete)
            {
                OnComplete(Result);
            }
            return Result;
        }).share();
    return CopyHandle(Control, Future);
}

bool FileCopier::ValidateEndpoints(const std::string& Source, const std::string& Destination, const CopyOptions& Options, SourceInfo& Info, TransferError& Error)
{
    struct stat SrcStat;
    if (stat(Source.c_str(), &SrcStat) != 0)
    {
        const int Err = errno;
        const TransferErrorKind Kind = SourceErrorKind(Err);
        Error = TransferError(Kind == TransferErrorKind::CopyFailed ? TransferErrorKind::SourceInvalid : Kind, Source, std::strerror(Err));
        return false;
    }
    if (!S_ISREG(SrcStat.st_mode))
    {
        Error = TransferError(TransferErrorKind::SourceInvalid, Source, "not a regular file");
        return false;
    }

    Info.Size = static_cast<uint64_t>(SrcStat.st_size);
    Info.AccessSec = SrcStat.st_atim.tv_sec;
    Info.AccessNsec = SrcStat.st_atim.tv_nsec;
    Info.ModifySec = SrcStat.st_mtim.tv_sec;
    Info.ModifyNsec = SrcStat.st_mtim.tv_nsec;

    if (Options.Access != nullptr)
    {
        if (!Options.Access->HasActiveGrant(Source))
        {
            Error = TransferError(TransferErrorKind::PermissionDenied, Source, "no active access grant for source");
            return false;
        }
        if (!Options.Access->HasActiveGrant(Destination))
        {
            Error = TransferError(TransferErrorKind::PermissionDenied, Destination, "no active access grant for destination");
            return false;
        }
    }

    FS::path DestPath(Destination);
    if (Destination.empty() || DestPath.filename().empty())
    {
        Error = TransferError(TransferErrorKind::DestinationInvalid, Destination, "destination is not a file path");
        return false;
    }

    std::error_code ec;
    if (FS::is_directory(DestPath, ec))
    {
        Error = TransferError(TransferErrorKind::DestinationInvalid, Destination, "a directory exists at the destination path");
        return false;
    }

    FS::create_directories(DestPath.parent_path(), ec);
    if (ec)
    {
        const bool NotWritable = ec == std::errc::permission_denied || ec == std::errc::read_only_file_system
            || ec == std::errc::no_space_on_device || ec == std::errc::operation_not_permitted;
        Error = TransferError(NotWritable ? TransferErrorKind::DestinationNotWritable : TransferErrorKind::DestinationInvalid,
            DestPath.parent_path().string(), ec.message());
        return false;
    }
    return true;
}

bool FileCopier::CopyAtomic(const std::string& Source, const std::string& Destination, const SourceInfo& Info, TransferError& Error)
{
    if (!CopyFileRangeSupported)
    {
        Error = TransferError(TransferErrorKind::CopyFailed, Source, "copy_file_range unavailable");
        return false;
    }

    int srcFd = open(Source.c_str(), O_RDONLY | O_CLOEXEC);
    if (srcFd < 0)
    {
        Error = HandleCopyFailure(SourceErrorKind(errno), Source, "Failed to open source file", errno);
        return false;
    }

    const std::string TempPath = TempPathFor(Destination);
    int destFd = open(TempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (destFd < 0)
    {
        const int Err = errno;
        close(srcFd);
        Error = HandleCopyFailure(DestinationErrorKind(Err), Destination, "Failed to open destination file", Err);
        return false;
    }

    uint64_t Copied = 0;
    int Err = 0;
    while (Copied < Info.Size)
    {
        ssize_t N = copy_file_range(srcFd, nullptr, destFd, nullptr, static_cast<size_t>(Info.Size - Copied), 0);
        if (N < 0)
        {
            if (errno == EINTR)
                continue;
            Err = errno;
            break;
        }
        if (N == 0) // source shrank underneath us
            break;
        Copied += static_cast<uint64_t>(N);
    }

    if (Err == 0)
    {
        PreserveTimestamps(destFd, Info, Destination);
    }
    if (close(destFd) != 0 && Err == 0)
    {
        Err = errno;
    }
    close(srcFd);

    if (Err != 0)
    {
        RemovePartial(TempPath);
        Error = HandleCopyFailure(Err == EXDEV ? TransferErrorKind::CopyFailed : DestinationErrorKind(Err), Source,
            std::string("copy_file_range failed: ") + std::strerror(Err), Err);
        return false;
    }
    return CommitTemp(TempPath, Destination, Info.Size, Error);
}

bool FileCopier::CopyBuffered(const std::string& Source, const std::string& Destination, const SourceInfo& Info, TransferError& Error)
{
    std::vector<char> Buffer;
    try
    {
        Buffer.resize(static_cast<size_t>(Info.Size));
    }
    catch (const std::bad_alloc&)
    {
        Error = HandleCopyFailure(TransferErrorKind::CopyFailed, Source, "not enough memory to buffer file", ENOMEM);
        return false;
    }

    int srcFd = open(Source.c_str(), O_RDONLY | O_CLOEXEC);
    if (srcFd < 0)
    {
        Error = HandleCopyFailure(SourceErrorKind(errno), Source, "Failed to open source file", errno);
        return false;
    }
    int Err = 0;
    ssize_t ReadBytes = ReadFull(srcFd, Buffer.data(), Buffer.size(), Err);
    close(srcFd);
    if (ReadBytes < 0)
    {
        Error = HandleCopyFailure(TransferErrorKind::CopyFailed, Source, std::string("read failed: ") + std::strerror(Err), Err);
        return false;
    }

    const std::string TempPath = TempPathFor(Destination);
    int destFd = open(TempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (destFd < 0)
    {
        Err = errno;
        Error = HandleCopyFailure(DestinationErrorKind(Err), Destination, "Failed to open destination file", Err);
        return false;
    }

    bool Ok = WriteAll(destFd, Buffer.data(), static_cast<size_t>(ReadBytes), Err);
    if (Ok)
    {
        PreserveTimestamps(destFd, Info, Destination);
    }
    if (close(destFd) != 0 && Ok)
    {
        Err = errno;
        Ok = false;
    }
    if (!Ok)
    {
        RemovePartial(TempPath);
        Error = HandleCopyFailure(DestinationErrorKind(Err), Destination, std::string("write failed: ") + std::strerror(Err), Err);
        return false;
    }
    return CommitTemp(TempPath, Destination, Info.Size, Error);
}

bool FileCopier::CopyChunked(const std::string& Source, const std::string& Destination, const SourceInfo& Info, const CopyOptions& Options,
    TransferControl* Control, const ProgressCallback& OnProgress, CopyResult& Result)
{
    Result.BytesCopied = 0;
    Result.Verified = false;

    int srcFd = open(Source.c_str(), O_RDONLY | O_CLOEXEC);
    if (srcFd < 0)
    {
        Result.Error = HandleCopyFailure(SourceErrorKind(errno), Source, "Failed to open source file", errno);
        return false;
    }
    int destFd = open(Destination.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (destFd < 0)
    {
        const int Err = errno;
        close(srcFd);
        Result.Error = HandleCopyFailure(DestinationErrorKind(Err), Destination, "Failed to open destination file", Err);
        return false;
    }

    const std::string FileName = FS::path(Source).filename().string();
    StreamHasher SourceHasher(Options.Algorithm);
    std::vector<char> Block(FileHasher::BlockSize);
    uint64_t Copied = 0;
    TransferError Failure;

    if (!SourceHasher.IsValid())
    {
        Failure = TransferError(TransferErrorKind::IOFailure, Source, "could not initialise " + ToString(Options.Algorithm));
    }

    while (!Failure.IsSet())
    {
        // Only block boundaries observe cancellation, so Copied is always a whole number of blocks written
        if (Control != nullptr && !Control->WaitWhilePaused())
        {
            Failure = TransferError(TransferErrorKind::Cancelled, Destination, "cancelled after " + std::to_string(Copied) + " bytes");
            break;
        }

        int Err = 0;
        ssize_t N = ReadFull(srcFd, Block.data(), Block.size(), Err);
        if (N < 0)
        {
            Failure = HandleCopyFailure(TransferErrorKind::CopyFailed, Source, std::string("read failed: ") + std::strerror(Err), Err);
            break;
        }
        if (N == 0)
        {
            break;
        }

        SourceHasher.Update(Block.data(), static_cast<size_t>(N));
        if (!WriteAll(destFd, Block.data(), static_cast<size_t>(N), Err))
        {
            Failure = HandleCopyFailure(DestinationErrorKind(Err), Destination, std::string("write failed: ") + std::strerror(Err), Err);
            break;
        }

        Copied += static_cast<uint64_t>(N);
        Result.BytesCopied = Copied;
        if (OnProgress)
        {
            OnProgress(Copied, Info.Size, FileName);
        }
    }

    if (!Failure.IsSet())
    {
        PreserveTimestamps(destFd, Info, Destination);
    }
    const int CloseErr = (close(destFd) != 0) ? errno : 0;
    close(srcFd);

    if (!Failure.IsSet() && CloseErr != 0)
    {
        Failure = HandleCopyFailure(DestinationErrorKind(CloseErr), Destination, std::string("close failed: ") + std::strerror(CloseErr), CloseErr);
    }
    if (!Failure.IsSet() && Copied != Info.Size)
    {
        Failure = HandleCopyFailure(TransferErrorKind::CopyFailed, Source,
            "size mismatch: copied " + std::to_string(Copied) + " of " + std::to_string(Info.Size) + " bytes", 0);
    }
    if (!Failure.IsSet())
    {
        ChecksumResult SourceSum = SourceHasher.Finalize();
        ChecksumResult DestSum;
        TransferError DigestError;
        if (!FileHasher::Digest(Destination, Options.Algorithm, DestSum, DigestError))
        {
            Failure = DigestError;
        }
        else if (SourceSum != DestSum)
        {
            Failure = HandleCopyFailure(TransferErrorKind::ChecksumMismatch, Destination,
                ToString(Options.Algorithm) + " source " + SourceSum.DigestHex + " does not match destination " + DestSum.DigestHex, 0);
        }
        else
        {
            Result.Verified = true;
            Result.Checksum = DestSum;
        }
    }

    if (Failure.IsSet())
    {
        // A failed copy never leaves a truncated or corrupt file behind
        RemovePartial(Destination);
        Result.Error = Failure;
        return false;
    }
    return true;
}

bool FileCopier::CommitTemp(const std::string& TempPath, const std::string& Destination, uint64_t ExpectedSize, TransferError& Error)
{
    struct stat TempStat;
    if (stat(TempPath.c_str(), &TempStat) != 0)
    {
        const int Err = errno;
        RemovePartial(TempPath);
        Error = HandleCopyFailure(TransferErrorKind::CopyFailed, Destination, std::string("copied file vanished: ") + std::strerror(Err), Err);
        return false;
    }
    if (static_cast<uint64_t>(TempStat.st_size) != ExpectedSize)
    {
        RemovePartial(TempPath);
        Error = HandleCopyFailure(TransferErrorKind::CopyFailed, Destination,
            "size mismatch: " + std::to_string(TempStat.st_size) + " of " + std::to_string(ExpectedSize) + " bytes", 0);
        return false;
    }
    if (rename(TempPath.c_str(), Destination.c_str()) != 0)
    {
        const int Err = errno;
        RemovePartial(TempPath);
        Error = HandleCopyFailure(DestinationErrorKind(Err), Destination, std::string("rename failed: ") + std::strerror(Err), Err);
        return false;
    }
    return true;
}

std::string FileCopier::TempPathFor(const std::string& Destination)
{
    FS::path Dest(Destination);
    return (Dest.parent_path() / ("." + Dest.filename().string() + ".partial-" + GenerateRandomHex(4))).string();
}

void FileCopier::PreserveTimestamps(int Fd, const SourceInfo& Info, const std::string& Destination)
{
    struct timespec Times[2];
    Times[0].tv_sec = static_cast<time_t>(Info.AccessSec);
    Times[0].tv_nsec = static_cast<long>(Info.AccessNsec);
    Times[1].tv_sec = static_cast<time_t>(Info.ModifySec);
    Times[1].tv_nsec = static_cast<long>(Info.ModifyNsec);
    if (futimens(Fd, Times) != 0)
    {
        Log.Info(std::string("[FileCopier] Could not preserve timestamps on ") + Destination + ": " + std::strerror(errno));
    }
}

bool FileCopier::IsWeakFilesystem(const std::string& Path)
{
    struct statfs Buf;
    if (statfs(Path.c_str(), &Buf) != 0)
    {
        return false;
    }
    const unsigned long Type = static_cast<unsigned long>(Buf.f_type);
    return Type == MsdosSuperMagic || Type == ExfatSuperMagic;
}

std::string FileCopier::DestinationPathFor(const std::string& DestinationRoot, const std::string& RelativePath)
{
    FS::path Rel = FS::path(RelativePath).lexically_normal();
    if (Rel.empty() || Rel.is_absolute() || Rel == "." || *Rel.begin() == "..")
    {
        Log.Error("[FileCopier] Relative path escapes destination root: " + RelativePath);
        return std::string();
    }
    return (FS::path(DestinationRoot) / Rel).string();
}

bool FileCopier::RemovePartial(const std::string& Path)
{
    std::error_code ec;
    FS::remove(Path, ec);
    if (ec)
    {
        std::cerr << "[Delete Failed] " << Path << " - " << ec.message() << "\n";
        Log.Error(std::string("[FileCopier] Failed to remove partial file: ") + Path + std::string(" - ") + ec.message());
        return false;
    }
    return true;
}

TransferError FileCopier::HandleCopyFailure(TransferErrorKind Kind, const std::string& FilePath, const std::string& Reason, int ErrorCode)
{
    Log.Error(std::string("[FileCopier] Copy Failed: ") + FilePath + std::string(" | Code: ") + std::to_string(ErrorCode) + std::string(" | Reason: ") + Reason);
    return TransferError(Kind, FilePath, Reason);
}
