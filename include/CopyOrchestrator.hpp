#pragma once

#include <string>
#include <vector>
#include <memory>
#include <future>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <cstdint>

#include "FileScanner.hpp"
#include "FileCopier.hpp"
#include "TransferJob.hpp"
#include "TransferControl.hpp"
#include "TransferError.hpp"
#include "SerialQueue.hpp"

class AccessManager;

enum class CascadeMode
{
    Disabled,           // every destination is filled from the source
    PrimaryThenFanout   // first destination from the source, the rest from the verified first copy
};

std::string ToString(CascadeMode Mode);

struct JobOptions
{
    CascadeMode Cascade = CascadeMode::Disabled;
    unsigned int MaxConcurrent = 3;
    CopyOptions Copy;

    bool SkipExistingIdentical = true;
    bool VerifyExisting = false;        // digest, not just size, before acknowledging an existing file
    bool UseRunMarkers = true;
    size_t MaxReportedErrors = 5;
    std::chrono::seconds RateWindow{ 5 };

    static JobOptions FromConfig();
};

// One file at one destination.
struct FileTransferRecord
{
    size_t FileIndex = 0;           // into the job's file list
    std::string SourcePath;         // where the bytes were read (the primary copy for cascade secondaries)
    std::string RelativePath;
    std::string DestinationRoot;
    std::string DestinationPath;
    uint64_t SizeBytes = 0;
    bool IsPrimary = false;         // set for the cascade primary only
    bool Verified = false;
    std::string ChecksumHex;
    std::string Note;
    TransferError Error;
};

struct JobResult
{
    bool Success = false;
    bool Partial = false;
    TransferError Error;    // NoFilesTransferred, Cancelled, PermissionDenied... or PartialJobFailure on partial success

    std::vector<FileTransferRecord> Completed;
    std::vector<FileTransferRecord> Failed;
    std::vector<FileTransferRecord> Skipped;        // already present at the destination
    std::vector<FileTransferRecord> NotAttempted;   // primary failed, or cancelled before dispatch
    std::vector<std::string> ReportedErrors;        // at most MaxReportedErrors

    size_t FilesSucceeded = 0;
    size_t FilesFailed = 0;
    uint64_t BytesTransferred = 0;
    uint64_t TotalBytes = 0;

    std::vector<TransferJobSnapshot> Jobs;
};

struct ScanReport
{
    bool Ok = false;
    ScanOutcome Outcome;
    TransferError Error;
};

enum class CopyEventType
{
    Started,
    Verified,
    Failed,
    Acknowledged
};

struct CopyEvent
{
    CopyEventType Type = CopyEventType::Started;
    std::string RelativePath;
    std::string DestinationRoot;
    size_t DestinationIndex = 0;
    bool IsPrimary = false;
    TransferError Error;
};

using JobProgressCallback = std::function<void(uint64_t BytesTransferred, uint64_t TotalBytes, const std::string& CurrentFileName)>;
using JobCompletionCallback = std::function<void(const JobResult& Result)>;
// Invoked on the copy worker itself, immediately around each Copy Engine call.
using CopyObserver = std::function<void(const CopyEvent& Event)>;

// Runs one source file list against one or more destinations with at most
// MaxConcurrent copies in flight. All TransferJob mutation, result recording
// and progress/completion callbacks happen on one serial strand.
class CopyOrchestrator
{
public:
    explicit CopyOrchestrator(AccessManager& access);
    ~CopyOrchestrator();

    CopyOrchestrator(const CopyOrchestrator&) = delete;
    CopyOrchestrator& operator=(const CopyOrchestrator&) = delete;

    // Scans on a background worker; the outcome is published only when complete.
    std::future<ScanReport> ScanSourceAsync(const std::string& RootPath, const ScanRules& Rules);

    JobResult RunJob(const std::vector<FileWorkItem>& Files, const std::vector<std::string>& Destinations, CascadeMode Cascade, unsigned int MaxConcurrent = 3);
    JobResult RunJob(const std::vector<FileWorkItem>& Files, const std::vector<std::string>& Destinations, const JobOptions& Options);
    std::future<JobResult> RunJobAsync(std::vector<FileWorkItem> Files, std::vector<std::string> Destinations, JobOptions Options);

    void Cancel();
    void Pause();
    void Resume();
    bool IsPaused() const;

    std::vector<std::shared_ptr<const TransferJob>> GetJobs() const;
    size_t ClearFinishedJobs();

    // Set before RunJob; they are not swapped while a job runs.
    void SetProgressCallback(JobProgressCallback Callback) { OnProgress = std::move(Callback); }
    void SetCompletionCallback(JobCompletionCallback Callback) { OnComplete = std::move(Callback); }
    void SetCopyObserver(CopyObserver Observer) { OnCopyEvent = std::move(Observer); }

    size_t ActiveCopies() const { return ActiveCount.load(); }
    size_t PeakActiveCopies() const { return PeakActive.load(); }

private:
    struct CopyUnit;
    struct RunState;

    AccessManager& Access;
    SerialQueue Strand;

    std::mutex RunMutex;    // one RunJob at a time

    mutable std::mutex JobsMutex;
    std::vector<std::shared_ptr<TransferJob>> Jobs;

    mutable std::mutex ControlMutex;
    std::shared_ptr<TransferControl> Control;
    std::vector<std::shared_ptr<TransferJob>> RunningJobs;

    std::mutex DispatchMutex;
    std::condition_variable Dispatch_CV;

    std::atomic<size_t> ActiveCount{ 0 };
    std::atomic<size_t> PeakActive{ 0 };

    JobProgressCallback OnProgress;
    JobCompletionCallback OnComplete;
    CopyObserver OnCopyEvent;

    bool PrepareDestinations(RunState& Run);
    bool AcquireSourceGrant(RunState& Run);
    void Dispatch(RunState& Run);
    void RunUnit(RunState& Run, const CopyUnit& Unit);
    void QueueSecondaries(RunState& Run, size_t FileIndex, const std::string& PrimaryPath);
    void RecordOutcome(RunState& Run, const CopyUnit& Unit, FileTransferRecord Record, CopyEventType Outcome);
    void RecordNotAttempted(RunState& Run, const CopyUnit& Unit, const TransferError& Reason);
    void ReconcileDestinations(RunState& Run);
    JobResult Finish(RunState& Run);

    bool IsAlreadyPresent(const RunState& Run, const CopyUnit& Unit, uint64_t& Size, std::string& DigestHex) const;
    void Notify(const CopyEvent& Event) const;
    void PublishProgress(RunState& Run, const std::string& FileName);
    void NoteActive(int Delta);
};
