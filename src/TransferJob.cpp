#include "TransferJob.hpp"
#include "IdUtils.hpp"
#include "Logger.hpp"

#include <algorithm>

std::string ToString(JobStatus Status)
{
    switch (Status)
    {
    case JobStatus::NotStarted: return "NotStarted";
    case JobStatus::Preparing:  return "Preparing";
    case JobStatus::Copying:    return "Copying";
    case JobStatus::Verifying:  return "Verifying";
    case JobStatus::Paused:     return "Paused";
    case JobStatus::Completed:  return "Completed";
    case JobStatus::Failed:     return "Failed";
    }
    return "Unknown";
}

TransferJob::TransferJob(std::string source, std::string destination, std::chrono::seconds rateWindow)
    : Id(GenerateRandomHex(16)), Source(std::move(source)), Destination(std::move(destination)),
      RateWindow(rateWindow.count() > 0 ? rateWindow : std::chrono::seconds(1))
{
}

JobStatus TransferJob::GetStatus() const
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    return Status;
}

bool TransferJob::IsTerminal() const
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    return Status == JobStatus::Completed || Status == JobStatus::Failed;
}

TransferJobSnapshot TransferJob::Snapshot() const
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    TransferJobSnapshot Snap;
    Snap.Id = Id;
    Snap.Source = Source;
    Snap.Destination = Destination;
    Snap.Status = Status;
    Snap.FailureReason = FailureReason;
    Snap.Partial = Partial;
    Snap.BytesTransferred = BytesTransferred;
    Snap.TotalBytes = TotalBytes;
    Snap.FilesCompleted = FilesCompleted;
    Snap.TotalFiles = TotalFiles;
    Snap.TransferRate = TransferRate;
    if (TransferRate > 0.0)
    {
        Snap.EstimatedSecondsRemaining = static_cast<double>(TotalBytes - BytesTransferred) / TransferRate;
    }
    return Snap;
}

bool TransferJob::RejectIfTerminalLocked(const char* Operation) const
{
    if (Status == JobStatus::Completed || Status == JobStatus::Failed)
    {
        Log.Error(std::string("[TransferJob] ") + Operation + " rejected, job " + Id + " is already " + ToString(Status));
        return true;
    }
    return false;
}

bool TransferJob::TransitionLocked(JobStatus To)
{
    if (RejectIfTerminalLocked(ToString(To).c_str()))
    {
        return false;
    }

    bool Allowed = false;
    switch (To)
    {
    case JobStatus::Preparing:
        Allowed = Status == JobStatus::NotStarted;
        break;
    case JobStatus::Copying:
        Allowed = Status == JobStatus::Preparing || Status == JobStatus::Paused;
        break;
    case JobStatus::Verifying:
        Allowed = Status == JobStatus::Copying;
        break;
    case JobStatus::Paused:
        Allowed = Status == JobStatus::Preparing || Status == JobStatus::Copying || Status == JobStatus::Verifying;
        break;
    case JobStatus::Completed:
        Allowed = Status == JobStatus::Verifying;
        break;
    case JobStatus::Failed:
        Allowed = true;
        break;
    case JobStatus::NotStarted:
        Allowed = false;
        break;
    }

    if (!Allowed)
    {
        Log.Error("[TransferJob] Illegal transition " + ToString(Status) + " -> " + ToString(To) + " for job " + Id);
        return false;
    }
    Status = To;
    return true;
}

bool TransferJob::SetTotals(uint64_t totalBytes, uint64_t totalFiles)
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    if (RejectIfTerminalLocked("SetTotals"))
    {
        return false;
    }
    TotalBytes = totalBytes;
    TotalFiles = totalFiles;
    BytesTransferred = std::min(BytesTransferred, TotalBytes);
    FilesCompleted = std::min(FilesCompleted, TotalFiles);
    return true;
}

bool TransferJob::BeginPreparing()
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    return TransitionLocked(JobStatus::Preparing);
}

bool TransferJob::BeginCopying()
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    return TransitionLocked(JobStatus::Copying);
}

bool TransferJob::BeginVerifying()
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    return TransitionLocked(JobStatus::Verifying);
}

bool TransferJob::Complete(bool partial)
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    if (!TransitionLocked(JobStatus::Completed))
    {
        return false;
    }
    Partial = partial;
    if (partial)
    {
        FailureReason = TransferError(TransferErrorKind::PartialJobFailure, Destination, "some files failed");
    }
    TransferRate = 0.0;
    return true;
}

bool TransferJob::Fail(const TransferError& Reason)
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    if (!TransitionLocked(JobStatus::Failed))
    {
        return false;
    }
    FailureReason = Reason;
    TransferRate = 0.0;
    return true;
}

bool TransferJob::Pause()
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    return TransitionLocked(JobStatus::Paused);
}

bool TransferJob::Resume(Clock::time_point Now)
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    if (Status != JobStatus::Paused)
    {
        if (!RejectIfTerminalLocked("Resume"))
        {
            Log.Error("[TransferJob] Resume ignored, job " + Id + " is " + ToString(Status));
        }
        return false;
    }
    if (!TransitionLocked(JobStatus::Copying))
    {
        return false;
    }
    // The paused interval never enters the rate: start a fresh window here
    RateSamples.clear();
    RateSamples.emplace_back(Now, BytesTransferred);
    TransferRate = 0.0;
    return true;
}

void TransferJob::AddBytesLocked(uint64_t Delta, Clock::time_point Now)
{
    const uint64_t Headroom = TotalBytes - BytesTransferred;
    BytesTransferred += std::min(Delta, Headroom);
    if (Status == JobStatus::Copying || Status == JobStatus::Verifying)
    {
        SampleRateLocked(Now);
    }
}

void TransferJob::SampleRateLocked(Clock::time_point Now)
{
    RateSamples.emplace_back(Now, BytesTransferred);
    while (RateSamples.size() > 2 && RateSamples[1].first <= Now - RateWindow)
    {
        RateSamples.pop_front();
    }

    const auto& Oldest = RateSamples.front();
    const auto& Newest = RateSamples.back();
    const double Seconds = std::chrono::duration<double>(Newest.first - Oldest.first).count();
    if (Seconds > 0.0)
    {
        TransferRate = static_cast<double>(Newest.second - Oldest.second) / Seconds;
    }
}

bool TransferJob::AddBytes(uint64_t Delta, Clock::time_point Now)
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    if (RejectIfTerminalLocked("AddBytes"))
    {
        return false;
    }
    AddBytesLocked(Delta, Now);
    return true;
}

bool TransferJob::AddCompletedFile()
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    if (RejectIfTerminalLocked("AddCompletedFile"))
    {
        return false;
    }
    if (FilesCompleted < TotalFiles)
    {
        ++FilesCompleted;
    }
    return true;
}

bool TransferJob::AcknowledgeExisting(uint64_t Bytes, Clock::time_point Now)
{
    std::lock_guard<std::mutex> Lock(JobMutex);
    if (RejectIfTerminalLocked("AcknowledgeExisting"))
    {
        return false;
    }
    AddBytesLocked(Bytes, Now);
    if (FilesCompleted < TotalFiles)
    {
        ++FilesCompleted;
    }
    return true;
}
