#include "CopyOrchestrator.hpp"
#include "AccessManager.hpp"
#include "ConfigGlobal.hpp"
#include "RunMarker.hpp"
#include "ThreadPool.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <deque>
#include <filesystem>
#include <iterator>

namespace FS = std::filesystem;

struct CopyOrchestrator::CopyUnit
{
    size_t FileIndex = 0;
    size_t DestinationIndex = 0;
    bool IsPrimary = false;     // cascade primary only
    std::string SourcePath;
    std::string DestinationPath;
};

struct CopyOrchestrator::RunState
{
    explicit RunState(const std::vector<FileWorkItem>& files) : Files(files) {}

    const std::vector<FileWorkItem>& Files;
    std::vector<std::string> Destinations;
    JobOptions Options;
    CascadeMode Cascade = CascadeMode::Disabled;
    std::shared_ptr<TransferControl> Control;
    std::string SourceRoot;

    std::vector<std::shared_ptr<TransferJob>> Jobs;    // one per destination, same index
    std::vector<char> Usable;
    std::vector<char> Interrupted;
    std::vector<AccessCapability> Grants;
    size_t PrimaryIndex = 0;
    bool Ready = false;
    TransferError SetupError;

    // Guarded by DispatchMutex
    std::deque<CopyUnit> Pending;
    size_t InFlight = 0;

    // Owned by the strand
    JobResult Result;
    std::vector<char> FileSucceeded;
    std::vector<char> FileFailed;
    std::vector<char> DestinationHadFailure;
    std::vector<size_t> DestinationSuccesses;
    size_t UnreportedErrors = 0;
};

namespace
{
    bool IsWithin(const FS::path& Candidate, const FS::path& Root)
    {
        auto [RootIt, CandidateIt] = std::mismatch(Root.begin(), Root.end(), Candidate.begin(), Candidate.end());
        return RootIt == Root.end();
    }

    // Deepest directory containing every source file.
    std::string CommonSourceRoot(const std::vector<FileWorkItem>& Files)
    {
        if (Files.empty())
        {
            return std::string();
        }
        FS::path Root = FS::path(Files.front().SourcePath).parent_path();
        for (const auto& File : Files)
        {
            const FS::path Parent = FS::path(File.SourcePath).parent_path();
            while (!IsWithin(Parent, Root) && Root.has_relative_path())
            {
                Root = Root.parent_path();
            }
        }
        return Root.string();
    }

    std::string JoinErrors(const std::vector<std::string>& Errors, size_t Unreported)
    {
        std::string Joined;
        for (const auto& Error : Errors)
        {
            if (!Joined.empty())
                Joined += "; ";
            Joined += Error;
        }
        if (Unreported > 0)
        {
            Joined += " (and " + std::to_string(Unreported) + " more)";
        }
        return Joined;
    }

    // A finishing job passes through Verifying, whatever phase it was left in.
    void AdvanceToVerifying(TransferJob& Job)
    {
        if (Job.GetStatus() == JobStatus::Paused)
            Job.Resume();
        if (Job.GetStatus() == JobStatus::Preparing)
            Job.BeginCopying();
        if (Job.GetStatus() == JobStatus::Copying)
            Job.BeginVerifying();
    }
}

std::string ToString(CascadeMode Mode)
{
    return Mode == CascadeMode::PrimaryThenFanout ? "PrimaryThenFanout" : "Disabled";
}

JobOptions JobOptions::FromConfig()
{
    JobOptions Options;
    Options.Cascade = ConfigGlobal::CascadeEnabled ? CascadeMode::PrimaryThenFanout : CascadeMode::Disabled;
    Options.MaxConcurrent = ConfigGlobal::MaxConcurrentCopies;
    Options.Copy = CopyOptions::FromConfig();
    Options.SkipExistingIdentical = ConfigGlobal::SkipExistingIdentical;
    Options.VerifyExisting = ConfigGlobal::VerifyExisting;
    Options.MaxReportedErrors = ConfigGlobal::MaxReportedErrors;
    Options.RateWindow = std::chrono::seconds(ConfigGlobal::RateWindowSeconds);
    return Options;
}

CopyOrchestrator::CopyOrchestrator(AccessManager& access) : Access(access)
{
}

CopyOrchestrator::~CopyOrchestrator()
{
    Cancel();
    std::lock_guard<std::mutex> RunLock(RunMutex);
}

std::future<ScanReport> CopyOrchestrator::ScanSourceAsync(const std::string& RootPath, const ScanRules& Rules)
{
    return std::async(std::launch::async, [this, RootPath, Rules]()
    {
        ScanReport Report;
        FileScanner Scanner(&Access, Rules);
        Report.Ok = Scanner.Scan(RootPath, Report.Outcome, Report.Error);
        return Report;
    });
}

JobResult CopyOrchestrator::RunJob(const std::vector<FileWorkItem>& Files, const std::vector<std::string>& Destinations, CascadeMode Cascade, unsigned int MaxConcurrent)
{
    JobOptions Options = JobOptions::FromConfig();
    Options.Cascade = Cascade;
    Options.MaxConcurrent = MaxConcurrent;
    return RunJob(Files, Destinations, Options);
}

std::future<JobResult> CopyOrchestrator::RunJobAsync(std::vector<FileWorkItem> Files, std::vector<std::string> Destinations, JobOptions Options)
{
    return std::async(std::launch::async, [this, Files = std::move(Files), Destinations = std::move(Destinations), Options = std::move(Options)]()
    {
        return RunJob(Files, Destinations, Options);
    });
}

JobResult CopyOrchestrator::RunJob(const std::vector<FileWorkItem>& Files, const std::vector<std::string>& Destinations, const JobOptions& Options)
{
    std::lock_guard<std::mutex> RunLock(RunMutex);

    RunState Run(Files);
    Run.Options = Options;
    if (Run.Options.MaxConcurrent == 0)
    {
        Run.Options.MaxConcurrent = 1;
    }
    Run.Cascade = Options.Cascade;
    Run.Control = std::make_shared<TransferControl>();
    Run.SourceRoot = CommonSourceRoot(Files);

    for (const auto& Destination : Destinations)
    {
        const std::string Normalized = AccessManager::NormalizePath(Destination);
        if (std::find(Run.Destinations.begin(), Run.Destinations.end(), Normalized) != Run.Destinations.end())
        {
            Log.Info("[CopyOrchestrator] Ignoring duplicate destination: " + Destination);
            continue;
        }
        Run.Destinations.push_back(Normalized);
        Run.Jobs.push_back(std::make_shared<TransferJob>(Run.SourceRoot, Normalized, Run.Options.RateWindow));
    }

    const size_t DestCount = Run.Destinations.size();
    Run.Usable.assign(DestCount, 0);
    Run.Interrupted.assign(DestCount, 0);
    Run.DestinationHadFailure.assign(DestCount, 0);
    Run.DestinationSuccesses.assign(DestCount, 0);
    Run.FileSucceeded.assign(Files.size(), 0);
    Run.FileFailed.assign(Files.size(), 0);

    uint64_t TotalBytes = 0;
    for (const auto& File : Files)
    {
        TotalBytes += File.SizeBytes;
    }

    {
        std::lock_guard<std::mutex> Lock(JobsMutex);
        Jobs.insert(Jobs.end(), Run.Jobs.begin(), Run.Jobs.end());
    }
    {
        std::lock_guard<std::mutex> Lock(ControlMutex);
        Control = Run.Control;
        RunningJobs = Run.Jobs;
    }
    PeakActive = 0;

    Log.Info("[CopyOrchestrator] Starting job: " + std::to_string(Files.size()) + " files, " + std::to_string(TotalBytes) + " bytes, "
        + std::to_string(DestCount) + " destinations, cascade " + ToString(Run.Cascade) + ", max " + std::to_string(Run.Options.MaxConcurrent) + " concurrent");

    Strand.Sync([&]()
    {
        for (auto& Job : Run.Jobs)
        {
            Job->BeginPreparing();
            Job->SetTotals(TotalBytes, Files.size());
        }
    });

    if (DestCount == 0)
    {
        Run.SetupError = TransferError(TransferErrorKind::DestinationInvalid, "", "no destinations given");
    }
    Run.Ready = DestCount > 0 && AcquireSourceGrant(Run) && PrepareDestinations(Run);

    if (Run.Ready && !Files.empty())
    {
        Strand.Sync([&]()
        {
            for (size_t i = 0; i < DestCount; ++i)
            {
                // A job paused while preparing stays paused; Resume moves it to Copying
                if (Run.Usable[i] && Run.Jobs[i]->GetStatus() == JobStatus::Preparing)
                {
                    Run.Jobs[i]->BeginCopying();
                }
            }
        });
        Dispatch(Run);
        ReconcileDestinations(Run);
    }

    return Finish(Run);
}

bool CopyOrchestrator::AcquireSourceGrant(RunState& Run)
{
    if (Run.Files.empty())
    {
        return true;
    }

    std::error_code ec;
    if (!FS::exists(Run.SourceRoot, ec))
    {
        Run.SetupError = TransferError(TransferErrorKind::SourceInvalid, Run.SourceRoot, "source is no longer available");
        Log.Error("[CopyOrchestrator] " + Run.SetupError.Describe());
        return false;
    }

    auto Capability = Access.Acquire(Run.SourceRoot, AccessMode::Read);
    if (!Capability)
    {
        Run.SetupError = TransferError(TransferErrorKind::PermissionDenied, Run.SourceRoot, "no read access to source");
        Log.Error("[CopyOrchestrator] " + Run.SetupError.Describe());
        return false;
    }
    Run.Grants.push_back(*Capability);
    return true;
}

bool CopyOrchestrator::PrepareDestinations(RunState& Run)
{
    size_t UsableCount = 0;
    bool HavePrimary = false;

    for (size_t i = 0; i < Run.Destinations.size(); ++i)
    {
        const std::string& Destination = Run.Destinations[i];
        TransferError Error;

        std::error_code ec;
        FS::create_directories(Destination, ec);
        if (ec)
        {
            const bool NotWritable = ec == std::errc::permission_denied || ec == std::errc::read_only_file_system;
            Error = TransferError(NotWritable ? TransferErrorKind::DestinationNotWritable : TransferErrorKind::DestinationInvalid, Destination, ec.message());
        }
        else if (!FS::is_directory(Destination, ec))
        {
            Error = TransferError(TransferErrorKind::DestinationInvalid, Destination, "not a directory");
        }
        else
        {
            auto Capability = Access.Acquire(Destination, AccessMode::ReadWrite);
            if (!Capability)
            {
                Error = TransferError(TransferErrorKind::PermissionDenied, Destination, "no write access to destination");
            }
            else
            {
                Run.Grants.push_back(*Capability);
            }
        }

        if (Error.IsSet())
        {
            Log.Error("[CopyOrchestrator] Destination unusable: " + Error.Describe());
            auto Job = Run.Jobs[i];
            Strand.Post([this, &Run, Job, Error]()
            {
                Job->Fail(Error);
                if (Run.Result.ReportedErrors.size() < Run.Options.MaxReportedErrors)
                    Run.Result.ReportedErrors.push_back(Error.Describe());
                else
                    ++Run.UnreportedErrors;
            });
            if (!Run.SetupError.IsSet())
            {
                Run.SetupError = Error;
            }
            continue;
        }

        Run.Usable[i] = 1;
        ++UsableCount;
        if (!HavePrimary)
        {
            Run.PrimaryIndex = i;
            HavePrimary = true;
        }

        if (Run.Options.UseRunMarkers)
        {
            Run.Interrupted[i] = RunMarker::WasInterrupted(Destination) ? 1 : 0;
            if (Run.Interrupted[i])
            {
                Log.Info("[CopyOrchestrator] Previous run on " + Destination + " was interrupted, existing files will be verified by checksum");
            }
            RunMarker::MarkInProgress(Destination, Run.Jobs[i]->GetId());
        }
    }

    if (Run.Cascade == CascadeMode::PrimaryThenFanout && UsableCount < 2)
    {
        Log.Info("[CopyOrchestrator] Cascade needs at least two usable destinations, copying without cascade");
        Run.Cascade = CascadeMode::Disabled;
    }
    return UsableCount > 0;
}

void CopyOrchestrator::Dispatch(RunState& Run)
{
    {
        std::lock_guard<std::mutex> Lock(DispatchMutex);
        for (size_t f = 0; f < Run.Files.size(); ++f)
        {
            for (size_t d = 0; d < Run.Destinations.size(); ++d)
            {
                if (!Run.Usable[d] || (Run.Cascade == CascadeMode::PrimaryThenFanout && d != Run.PrimaryIndex))
                {
                    continue;
                }
                CopyUnit Unit;
                Unit.FileIndex = f;
                Unit.DestinationIndex = d;
                Unit.IsPrimary = Run.Cascade == CascadeMode::PrimaryThenFanout;
                Unit.SourcePath = Run.Files[f].SourcePath;
                Unit.DestinationPath = FileCopier::DestinationPathFor(Run.Destinations[d], Run.Files[f].RelativePath);
                Run.Pending.push_back(std::move(Unit));
            }
        }
    }

    const size_t MaxConcurrent = Run.Options.MaxConcurrent;
    ThreadPool Pool(MaxConcurrent, "CopyWorkers");

    while (true)
    {
        CopyUnit Unit;
        {
            std::unique_lock<std::mutex> Lock(DispatchMutex);
            // Admission wait: wakes on a freed slot, on resume and on cancel
            Dispatch_CV.wait(Lock, [&]()
            {
                return Run.Control->IsCancelled()
                    || (Run.Pending.empty() && Run.InFlight == 0)
                    || (!Run.Control->IsPaused() && !Run.Pending.empty() && Run.InFlight < MaxConcurrent);
            });

            if (Run.Control->IsCancelled() || Run.Pending.empty())
            {
                break;
            }
            Unit = std::move(Run.Pending.front());
            Run.Pending.pop_front();
            ++Run.InFlight;
        }

        Pool.Submit([this, &Run, Unit]()
        {
            bool Threw = false;
            std::string Thrown;
            try
            {
                RunUnit(Run, Unit);
            }
            catch (const std::exception& ex)
            {
                Threw = true;
                Thrown = ex.what();
            }
            catch (...)
            {
                Threw = true;
                Thrown = "non-standard exception";
            }

            if (Threw)
            {
                Log.Error("[CopyOrchestrator] Copy worker threw: " + Thrown);
                FileTransferRecord Record;
                Record.FileIndex = Unit.FileIndex;
                Record.SourcePath = Unit.SourcePath;
                Record.RelativePath = Run.Files[Unit.FileIndex].RelativePath;
                Record.DestinationRoot = Run.Destinations[Unit.DestinationIndex];
                Record.DestinationPath = Unit.DestinationPath;
                Record.IsPrimary = Unit.IsPrimary;
                Record.Error = TransferError(TransferErrorKind::CopyFailed, Unit.SourcePath, Thrown);
                RecordOutcome(Run, Unit, std::move(Record), CopyEventType::Failed);
            }

            {
                std::lock_guard<std::mutex> Lock(DispatchMutex);
                --Run.InFlight;
            }
            Dispatch_CV.notify_all();
        });
    }

    Pool.Join();

    std::deque<CopyUnit> Leftover;
    {
        std::lock_guard<std::mutex> Lock(DispatchMutex);
        Leftover.swap(Run.Pending);
    }
    for (const auto& Unit : Leftover)
    {
        RecordNotAttempted(Run, Unit, TransferError(TransferErrorKind::Cancelled, Unit.SourcePath, "job cancelled before dispatch"));
    }
    Strand.Drain();
}

void CopyOrchestrator::RunUnit(RunState& Run, const CopyUnit& Unit)
{
    const FileWorkItem& File = Run.Files[Unit.FileIndex];
    const bool Cascading = Run.Cascade == CascadeMode::PrimaryThenFanout;

    FileTransferRecord Record;
    Record.FileIndex = Unit.FileIndex;
    Record.SourcePath = Unit.SourcePath;
    Record.RelativePath = File.RelativePath;
    Record.DestinationRoot = Run.Destinations[Unit.DestinationIndex];
    Record.DestinationPath = Unit.DestinationPath;
    Record.SizeBytes = File.SizeBytes;
    Record.IsPrimary = Unit.IsPrimary;

    CopyEvent Event;
    Event.RelativePath = File.RelativePath;
    Event.DestinationRoot = Record.DestinationRoot;
    Event.DestinationIndex = Unit.DestinationIndex;
    Event.IsPrimary = Unit.IsPrimary;

    if (Run.Control->IsCancelled())
    {
        RecordNotAttempted(Run, Unit, TransferError(TransferErrorKind::Cancelled, Unit.SourcePath, "job cancelled before dispatch"));
        return;
    }

    if (Unit.DestinationPath.empty())
    {
        Record.Error = TransferError(TransferErrorKind::DestinationInvalid, File.RelativePath, "relative path escapes the destination root");
        Event.Type = CopyEventType::Failed;
        Event.Error = Record.Error;
        Notify(Event);
        RecordOutcome(Run, Unit, std::move(Record), CopyEventType::Failed);
        return;
    }

    uint64_t ExistingSize = 0;
    std::string ExistingDigest;
    if (Run.Options.SkipExistingIdentical && IsAlreadyPresent(Run, Unit, ExistingSize, ExistingDigest))
    {
        Log.Info("[CopyOrchestrator] Already present, not copied: " + Unit.DestinationPath);
        Record.SizeBytes = ExistingSize;
        Record.Verified = !ExistingDigest.empty();
        Record.ChecksumHex = ExistingDigest;
        Record.Note = "already present";
        Event.Type = CopyEventType::Acknowledged;
        Notify(Event);
        RecordOutcome(Run, Unit, std::move(Record), CopyEventType::Acknowledged);
        if (Cascading && Unit.IsPrimary)
        {
            QueueSecondaries(Run, Unit.FileIndex, Unit.DestinationPath);
        }
        return;
    }

    CopyOptions Options = Run.Options.Copy;
    Options.Access = &Access;
    if (Cascading && Unit.IsPrimary)
    {
        // Secondaries are read back from this copy, so it must be checksum verified
        Options.FirstStrategy = CopyStrategy::Chunked;
    }

    std::shared_ptr<TransferJob> Job = Run.Jobs[Unit.DestinationIndex];
    uint64_t Reported = 0;
    ProgressCallback Progress = [this, &Run, Job, &Reported](uint64_t BytesSoFar, uint64_t, const std::string& FileName)
    {
        if (BytesSoFar <= Reported)
        {
            return;
        }
        const uint64_t Delta = BytesSoFar - Reported;
        Reported = BytesSoFar;
        Strand.Post([this, &Run, Job, Delta, FileName]()
        {
            Job->AddBytes(Delta);
            PublishProgress(Run, FileName);
        });
    };

    Event.Type = CopyEventType::Started;
    Notify(Event);

    NoteActive(+1);
    CopyResult Result = FileCopier::CopyFile(Unit.SourcePath, Unit.DestinationPath, Options, Run.Control.get(), Progress);
    NoteActive(-1);

    if (Result.Success)
    {
        Record.SizeBytes = Result.BytesCopied;
        Record.Verified = Result.Verified;
        Record.ChecksumHex = Result.Verified ? Result.Checksum.DigestHex : std::string();
        Record.Note = ToString(Result.StrategyUsed);
        Event.Type = CopyEventType::Verified;
        Notify(Event);
        RecordOutcome(Run, Unit, std::move(Record), CopyEventType::Verified);
        if (Cascading && Unit.IsPrimary)
        {
            QueueSecondaries(Run, Unit.FileIndex, Unit.DestinationPath);
        }
        return;
    }

    Record.Error = Result.Error;
    Event.Type = CopyEventType::Failed;
    Event.Error = Result.Error;
    Notify(Event);
    RecordOutcome(Run, Unit, std::move(Record), CopyEventType::Failed);

    if (Cascading && Unit.IsPrimary)
    {
        // No secondary is ever filled from a primary that did not verify
        for (size_t d = 0; d < Run.Destinations.size(); ++d)
        {
            if (d == Unit.DestinationIndex || !Run.Usable[d])
            {
                continue;
            }
            CopyUnit Skipped;
            Skipped.FileIndex = Unit.FileIndex;
            Skipped.DestinationIndex = d;
            Skipped.IsPrimary = false;
            Skipped.SourcePath = Unit.DestinationPath;
            Skipped.DestinationPath = FileCopier::DestinationPathFor(Run.Destinations[d], File.RelativePath);
            RecordNotAttempted(Run, Skipped, TransferError(Result.Error.Kind == TransferErrorKind::Cancelled ? TransferErrorKind::Cancelled : TransferErrorKind::CopyFailed,
                File.SourcePath, "primary copy failed: " + Result.Error.Describe()));
        }
    }
}

void CopyOrchestrator::QueueSecondaries(RunState& Run, size_t FileIndex, const std::string& PrimaryPath)
{
    {
        std::lock_guard<std::mutex> Lock(DispatchMutex);
        if (Run.Control->IsCancelled())
        {
            return;
        }
        for (size_t d = 0; d < Run.Destinations.size(); ++d)
        {
            if (d == Run.PrimaryIndex || !Run.Usable[d])
            {
                continue;
            }
            CopyUnit Unit;
            Unit.FileIndex = FileIndex;
            Unit.DestinationIndex = d;
            Unit.IsPrimary = false;
            Unit.SourcePath = PrimaryPath;
            Unit.DestinationPath = FileCopier::DestinationPathFor(Run.Destinations[d], Run.Files[FileIndex].RelativePath);
            Run.Pending.push_back(std::move(Unit));
        }
    }
    Dispatch_CV.notify_all();
}

void CopyOrchestrator::RecordOutcome(RunState& Run, const CopyUnit& Unit, FileTransferRecord Record, CopyEventType Outcome)
{
    const size_t FileIndex = Unit.FileIndex;
    const size_t DestIndex = Unit.DestinationIndex;

    Strand.Post([this, &Run, FileIndex, DestIndex, Record = std::move(Record), Outcome]()
    {
        TransferJob& Job = *Run.Jobs[DestIndex];
        switch (Outcome)
        {
        case CopyEventType::Verified:
            Job.AddCompletedFile();
            Run.FileSucceeded[FileIndex] = 1;
            ++Run.DestinationSuccesses[DestIndex];
            Run.Result.Completed.push_back(Record);
            break;
        case CopyEventType::Acknowledged:
            Job.AcknowledgeExisting(Record.SizeBytes);
            Run.FileSucceeded[FileIndex] = 1;
            ++Run.DestinationSuccesses[DestIndex];
            Run.Result.Skipped.push_back(Record);
            break;
        case CopyEventType::Started:
            break;
        case CopyEventType::Failed:
            Run.FileFailed[FileIndex] = 1;
            Run.DestinationHadFailure[DestIndex] = 1;
            if (Run.Result.ReportedErrors.size() < Run.Options.MaxReportedErrors)
                Run.Result.ReportedErrors.push_back(Record.Error.Describe());
            else
                ++Run.UnreportedErrors;
            Run.Result.Failed.push_back(Record);
            break;
        }
        PublishProgress(Run, FS::path(Record.RelativePath).filename().string());
    });
}

void CopyOrchestrator::RecordNotAttempted(RunState& Run, const CopyUnit& Unit, const TransferError& Reason)
{
    FileTransferRecord Record;
    Record.FileIndex = Unit.FileIndex;
    Record.SourcePath = Unit.SourcePath;
    Record.RelativePath = Run.Files[Unit.FileIndex].RelativePath;
    Record.DestinationRoot = Run.Destinations[Unit.DestinationIndex];
    Record.DestinationPath = Unit.DestinationPath;
    Record.SizeBytes = Run.Files[Unit.FileIndex].SizeBytes;
    Record.IsPrimary = Unit.IsPrimary;
    Record.Error = Reason;
    const size_t DestIndex = Unit.DestinationIndex;

    Strand.Post([&Run, DestIndex, Record = std::move(Record)]()
    {
        Run.DestinationHadFailure[DestIndex] = 1;
        Run.Result.NotAttempted.push_back(Record);
    });
}

bool CopyOrchestrator::IsAlreadyPresent(const RunState& Run, const CopyUnit& Unit, uint64_t& Size, std::string& DigestHex) const
{
    DigestHex.clear();
    std::error_code ec;
    if (!FS::is_regular_file(Unit.DestinationPath, ec))
    {
        return false;
    }
    const uintmax_t DestSize = FS::file_size(Unit.DestinationPath, ec);
    if (ec)
    {
        return false;
    }
    const uintmax_t SourceSize = FS::file_size(Unit.SourcePath, ec);
    if (ec || SourceSize != DestSize)
    {
        return false;
    }

    Size = static_cast<uint64_t>(DestSize);
    // A cascade primary feeds the secondaries, so a size match alone never acknowledges it
    const bool FeedsSecondaries = Run.Cascade == CascadeMode::PrimaryThenFanout && Unit.IsPrimary;
    if (!Run.Options.VerifyExisting && !Run.Interrupted[Unit.DestinationIndex] && !FeedsSecondaries)
    {
        return true;
    }

    ChecksumResult SourceSum;
    ChecksumResult DestSum;
    TransferError Error;
    if (!FileHasher::Digest(Unit.SourcePath, Run.Options.Copy.Algorithm, SourceSum, Error)
        || !FileHasher::Digest(Unit.DestinationPath, Run.Options.Copy.Algorithm, DestSum, Error))
    {
        Log.Info("[CopyOrchestrator] Could not verify existing file, copying it again: " + Error.Describe());
        return false;
    }
    if (SourceSum != DestSum)
    {
        Log.Info("[CopyOrchestrator] Existing file differs from the source, copying it again: " + Unit.DestinationPath);
        return false;
    }
    DigestHex = DestSum.DigestHex;
    return true;
}

void CopyOrchestrator::ReconcileDestinations(RunState& Run)
{
    // Finishing waits out a pause; a cancel while paused ends the wait
    if (!Run.Control->WaitWhilePaused())
    {
        return;
    }

    Strand.Sync([&]()
    {
        for (size_t d = 0; d < Run.Jobs.size(); ++d)
        {
            if (Run.Usable[d] && !Run.Jobs[d]->IsTerminal())
            {
                AdvanceToVerifying(*Run.Jobs[d]);
            }
        }

        // Final size check of every written destination before the job reports success
        std::vector<FileTransferRecord> Confirmed;
        for (auto& Record : Run.Result.Completed)
        {
            std::error_code ec;
            const uintmax_t OnDisk = FS::file_size(Record.DestinationPath, ec);
            if (!ec && OnDisk == Record.SizeBytes)
            {
                Confirmed.push_back(std::move(Record));
                continue;
            }
            Record.Error = TransferError(TransferErrorKind::IOFailure, Record.DestinationPath, ec ? ec.message() : "destination size changed after copy");
            Log.Error("[CopyOrchestrator] " + Record.Error.Describe());
            const auto DestIt = std::find(Run.Destinations.begin(), Run.Destinations.end(), Record.DestinationRoot);
            const size_t DestIndex = static_cast<size_t>(std::distance(Run.Destinations.begin(), DestIt));
            if (DestIndex < Run.Destinations.size())
            {
                Run.DestinationHadFailure[DestIndex] = 1;
                --Run.DestinationSuccesses[DestIndex];
            }
            if (Run.Result.ReportedErrors.size() < Run.Options.MaxReportedErrors)
                Run.Result.ReportedErrors.push_back(Record.Error.Describe());
            else
                ++Run.UnreportedErrors;
            Run.Result.Failed.push_back(std::move(Record));
        }
        Run.Result.Completed.swap(Confirmed);

        // A file only counts once one of its destinations still holds it
        std::fill(Run.FileSucceeded.begin(), Run.FileSucceeded.end(), 0);
        for (const auto* List : { &Run.Result.Completed, &Run.Result.Skipped })
        {
            for (const auto& Record : *List)
            {
                Run.FileSucceeded[Record.FileIndex] = 1;
            }
        }
    });
}

JobResult CopyOrchestrator::Finish(RunState& Run)
{
    Strand.Drain();
    const bool Cancelled = Run.Control->IsCancelled();

    Strand.Sync([&]()
    {
        JobResult& Result = Run.Result;
        Result.FilesSucceeded = static_cast<size_t>(std::count(Run.FileSucceeded.begin(), Run.FileSucceeded.end(), 1));
        Result.FilesFailed = 0;
        for (size_t f = 0; f < Run.Files.size(); ++f)
        {
            if (Run.FileFailed[f] && !Run.FileSucceeded[f])
                ++Result.FilesFailed;
        }
        Result.Partial = !Result.Failed.empty() || !Result.NotAttempted.empty();

        const std::string Aggregated = Run.Files.empty() ? std::string("no eligible files")
            : JoinErrors(Result.ReportedErrors, Run.UnreportedErrors);

        if (!Run.Ready)
        {
            Result.Error = Run.SetupError;
        }
        else if (Cancelled)
        {
            Result.Error = TransferError(TransferErrorKind::Cancelled, Run.SourceRoot, "job cancelled");
        }
        else if (Result.FilesSucceeded == 0)
        {
            Result.Error = TransferError(TransferErrorKind::NoFilesTransferred, Run.SourceRoot, Aggregated);
        }
        else
        {
            Result.Success = true;
            if (Result.Partial)
            {
                Result.Error = TransferError(TransferErrorKind::PartialJobFailure, Run.SourceRoot,
                    std::to_string(Result.Failed.size() + Result.NotAttempted.size()) + " copies did not complete: " + Aggregated);
            }
        }

        for (size_t d = 0; d < Run.Jobs.size(); ++d)
        {
            TransferJob& Job = *Run.Jobs[d];
            if (Job.IsTerminal())
            {
                continue;
            }
            if (!Run.Ready)
            {
                Job.Fail(Run.SetupError);
            }
            else if (Cancelled)
            {
                Job.Fail(Result.Error);
            }
            else if (Run.DestinationSuccesses[d] > 0)
            {
                AdvanceToVerifying(Job);
                Job.Complete(Run.DestinationHadFailure[d] != 0);
            }
            else
            {
                Job.Fail(TransferError(TransferErrorKind::NoFilesTransferred, Run.Destinations[d], Aggregated));
            }
        }

        Result.BytesTransferred = 0;
        Result.TotalBytes = 0;
        Result.Jobs.clear();
        for (const auto& Job : Run.Jobs)
        {
            TransferJobSnapshot Snap = Job->Snapshot();
            Result.BytesTransferred += Snap.BytesTransferred;
            Result.TotalBytes += Snap.TotalBytes;
            Result.Jobs.push_back(std::move(Snap));
        }
    });

    for (const auto& Grant : Run.Grants)
    {
        Access.Release(Grant);
    }
    if (Run.Ready && !Cancelled && Run.Options.UseRunMarkers)
    {
        for (size_t d = 0; d < Run.Destinations.size(); ++d)
        {
            if (Run.Usable[d])
                RunMarker::MarkComplete(Run.Destinations[d]);
        }
    }

    {
        std::lock_guard<std::mutex> Lock(ControlMutex);
        Control.reset();
        RunningJobs.clear();
    }

    const JobResult& Result = Run.Result;
    std::string Summary = "[CopyOrchestrator] Job " + std::string(Result.Success ? (Result.Partial ? "completed (partial)" : "completed") : "failed") + ": "
        + std::to_string(Result.FilesSucceeded) + " files succeeded, " + std::to_string(Result.Failed.size()) + " copies failed, "
        + std::to_string(Result.Skipped.size()) + " already present, " + std::to_string(Result.NotAttempted.size()) + " not attempted";
    if (Result.Success)
        Log.Info(Summary);
    else
        Log.Error(Summary + " | " + Result.Error.Describe());

    if (OnComplete)
    {
        Strand.Sync([&]() { OnComplete(Result); });
    }
    return Run.Result;
}

void CopyOrchestrator::Cancel()
{
    std::shared_ptr<TransferControl> Current;
    {
        std::lock_guard<std::mutex> Lock(ControlMutex);
        Current = Control;
    }
    if (!Current)
    {
        return;
    }

    Log.Info("[CopyOrchestrator] Cancel requested");
    Current->Cancel();
    {
        // Taken so a dispatcher between its predicate check and its wait cannot miss the wakeup
        std::lock_guard<std::mutex> Lock(DispatchMutex);
    }
    Dispatch_CV.notify_all();
}

void CopyOrchestrator::Pause()
{
    std::shared_ptr<TransferControl> Current;
    std::vector<std::shared_ptr<TransferJob>> Running;
    {
        std::lock_guard<std::mutex> Lock(ControlMutex);
        Current = Control;
        Running = RunningJobs;
    }
    if (!Current || Current->IsCancelled())
    {
        return;
    }

    Log.Info("[CopyOrchestrator] Pause requested");
    Current->Pause();
    Strand.Post([Running]()
    {
        for (const auto& Job : Running)
        {
            const JobStatus Status = Job->GetStatus();
            if (Status == JobStatus::Preparing || Status == JobStatus::Copying || Status == JobStatus::Verifying)
                Job->Pause();
        }
    });
}

void CopyOrchestrator::Resume()
{
    std::shared_ptr<TransferControl> Current;
    std::vector<std::shared_ptr<TransferJob>> Running;
    {
        std::lock_guard<std::mutex> Lock(ControlMutex);
        Current = Control;
        Running = RunningJobs;
    }
    if (!Current)
    {
        return;
    }

    Log.Info("[CopyOrchestrator] Resume requested");
    Strand.Post([Running]()
    {
        for (const auto& Job : Running)
        {
            if (Job->GetStatus() == JobStatus::Paused)
                Job->Resume();
        }
    });
    Current->Resume();
    {
        std::lock_guard<std::mutex> Lock(DispatchMutex);
    }
    Dispatch_CV.notify_all();
}

bool CopyOrchestrator::IsPaused() const
{
    std::lock_guard<std::mutex> Lock(ControlMutex);
    return Control && Control->IsPaused();
}

std::vector<std::shared_ptr<const TransferJob>> CopyOrchestrator::GetJobs() const
{
    std::lock_guard<std::mutex> Lock(JobsMutex);
    return std::vector<std::shared_ptr<const TransferJob>>(Jobs.begin(), Jobs.end());
}

size_t CopyOrchestrator::ClearFinishedJobs()
{
    std::lock_guard<std::mutex> Lock(JobsMutex);
    const size_t Before = Jobs.size();
    Jobs.erase(std::remove_if(Jobs.begin(), Jobs.end(), [](const std::shared_ptr<TransferJob>& Job) { return Job->IsTerminal(); }), Jobs.end());
    return Before - Jobs.size();
}

void CopyOrchestrator::Notify(const CopyEvent& Event) const
{
    if (OnCopyEvent)
    {
        OnCopyEvent(Event);
    }
}

void CopyOrchestrator::PublishProgress(RunState& Run, const std::string& FileName)
{
    if (!OnProgress)
    {
        return;
    }
    uint64_t Bytes = 0;
    uint64_t Total = 0;
    for (size_t d = 0; d < Run.Jobs.size(); ++d)
    {
        if (!Run.Usable[d])
            continue;
        const TransferJobSnapshot Snap = Run.Jobs[d]->Snapshot();
        Bytes += Snap.BytesTransferred;
        Total += Snap.TotalBytes;
    }
    OnProgress(Bytes, Total, FileName);
}

void CopyOrchestrator::NoteActive(int Delta)
{
    if (Delta > 0)
    {
        const size_t Now = ++ActiveCount;
        size_t Peak = PeakActive.load();
        while (Now > Peak && !PeakActive.compare_exchange_weak(Peak, Now))
        {
        }
    }
    else
    {
        --ActiveCount;
    }
}
