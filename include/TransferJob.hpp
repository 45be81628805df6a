#pragma once

#include <string>
#include <deque>
#include <mutex>
#include <chrono>
#include <utility>
#include <cstdint>

#include "TransferError.hpp"

enum class JobStatus
{
    NotStarted,
    Preparing,
    Copying,
    Verifying,
    Paused,
    Completed,
    Failed
};

std::string ToString(JobStatus Status);

// Copy of a job's observable fields, taken under the job's lock.
struct TransferJobSnapshot
{
    std::string Id;
    std::string Source;
    std::string Destination;
    JobStatus Status = JobStatus::NotStarted;
    TransferError FailureReason;
    bool Partial = false;

    uint64_t BytesTransferred = 0;
    uint64_t TotalBytes = 0;
    uint64_t FilesCompleted = 0;
    uint64_t TotalFiles = 0;

    double TransferRate = 0.0;                  // bytes per second over the trailing window
    double EstimatedSecondsRemaining = -1.0;    // negative while unknown

    bool IsTerminal() const { return Status == JobStatus::Completed || Status == JobStatus::Failed; }
};

// Status and progress of one source -> destination pairing.
//
// Only the orchestrator's serial strand calls the mutators; observers read
// through Snapshot(). Every mutator returns false, and changes nothing, once
// the job is Completed or Failed, or when the transition is not allowed.
class TransferJob
{
public:
    using Clock = std::chrono::steady_clock;

    TransferJob(std::string source, std::string destination, std::chrono::seconds rateWindow = std::chrono::seconds(5));

    TransferJob(const TransferJob&) = delete;
    TransferJob& operator=(const TransferJob&) = delete;

    const std::string& GetId() const { return Id; }
    const std::string& GetSource() const { return Source; }
    const std::string& GetDestination() const { return Destination; }

    JobStatus GetStatus() const;
    bool IsTerminal() const;
    TransferJobSnapshot Snapshot() const;

    bool SetTotals(uint64_t totalBytes, uint64_t totalFiles);

    bool BeginPreparing();
    bool BeginCopying();
    bool BeginVerifying();
    bool Complete(bool partial);
    bool Fail(const TransferError& Reason);

    bool Pause();
    bool Resume(Clock::time_point Now = Clock::now());

    // Counters only move forward and never past the totals.
    bool AddBytes(uint64_t Delta, Clock::time_point Now = Clock::now());
    bool AddCompletedFile();

    // Existing destination file taken as already copied: its bytes and the file count as progress.
    bool AcknowledgeExisting(uint64_t Bytes, Clock::time_point Now = Clock::now());

private:
    const std::string Id;
    const std::string Source;
    const std::string Destination;
    const Clock::duration RateWindow;

    mutable std::mutex JobMutex;
    JobStatus Status = JobStatus::NotStarted;
    TransferError FailureReason;
    bool Partial = false;

    uint64_t BytesTransferred = 0;
    uint64_t TotalBytes = 0;
    uint64_t FilesCompleted = 0;
    uint64_t TotalFiles = 0;

    std::deque<std::pair<Clock::time_point, uint64_t>> RateSamples;
    double TransferRate = 0.0;

    bool TransitionLocked(JobStatus To);
    bool RejectIfTerminalLocked(const char* Operation) const;
    void AddBytesLocked(uint64_t Delta, Clock::time_point Now);
    void SampleRateLocked(Clock::time_point Now);
};
