#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "CopyOrchestrator.hpp"
#include "AccessManager.hpp"
#include "CapabilityStore.hpp"
#include "ConfigGlobal.hpp"
#include "RunMarker.hpp"
#include "TestUtils.hpp"

namespace FS = std::filesystem;

class CopyOrchestratorTest : public ::testing::Test
{
protected:
    CopyOrchestratorTest() : Store(Dir.Path("state/Capabilities.bin")), Access(Store), Orchestrator(Access)
    {
    }

    void SetUp() override
    {
        ConfigGlobal::InitializeDefaults();
        ConfigGlobal::MediaExtensions.clear();
    }

    std::vector<FileWorkItem> MakeCard(size_t Count, uint64_t Size = 64 * 1024)
    {
        for (size_t i = 0; i < Count; ++i)
        {
            TestUtils::WriteRandomFile(Dir.Path("card/DCIM/IMG" + std::to_string(100 + i) + ".jpg"), Size + i, static_cast<uint32_t>(i + 1));
        }
        ScanReport Report = Orchestrator.ScanSourceAsync(Dir.Path("card"), ScanRules::FromConfig()).get();
        EXPECT_TRUE(Report.Ok) << Report.Error.Describe();
        EXPECT_EQ(Report.Outcome.Files.size(), Count);
        return Report.Outcome.Files;
    }

    std::vector<std::string> Destinations(std::initializer_list<const char*> Names)
    {
        std::vector<std::string> Paths;
        for (const char* Name : Names)
        {
            Paths.push_back(Dir.Path(Name));
        }
        return Paths;
    }

    TempDir Dir;
    CapabilityStore Store;
    AccessManager Access;
    CopyOrchestrator Orchestrator;
};

TEST_F(CopyOrchestratorTest, CopiesEveryFileToEveryDestination)
{
    std::vector<FileWorkItem> Files = MakeCard(5);

    std::vector<uint64_t> Progress;
    uint64_t ReportedTotal = 0;
    Orchestrator.SetProgressCallback([&](uint64_t Bytes, uint64_t Total, const std::string&)
    {
        Progress.push_back(Bytes);
        ReportedTotal = Total;
    });
    bool CompletionSeen = false;
    Orchestrator.SetCompletionCallback([&](const JobResult& Result) { CompletionSeen = Result.Success; });

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "ssd", "raid" }), CascadeMode::Disabled, 3);

    ASSERT_TRUE(Result.Success) << Result.Error.Describe();
    EXPECT_FALSE(Result.Partial);
    EXPECT_FALSE(Result.Error.IsSet());
    EXPECT_EQ(Result.FilesSucceeded, 5u);
    EXPECT_EQ(Result.Completed.size(), 10u);
    EXPECT_EQ(Result.BytesTransferred, Result.TotalBytes);
    EXPECT_TRUE(CompletionSeen);

    ASSERT_EQ(Result.Jobs.size(), 2u);
    for (const auto& Job : Result.Jobs)
    {
        EXPECT_EQ(Job.Status, JobStatus::Completed);
        EXPECT_EQ(Job.FilesCompleted, 5u);
        EXPECT_FALSE(RunMarker::WasInterrupted(Job.Destination));
    }

    for (const auto& File : Files)
    {
        const std::string Original = TestUtils::ReadFile(File.SourcePath);
        EXPECT_EQ(TestUtils::ReadFile(Dir.Path("ssd/" + File.RelativePath)), Original);
        EXPECT_EQ(TestUtils::ReadFile(Dir.Path("raid/" + File.RelativePath)), Original);
    }

    ASSERT_FALSE(Progress.empty());
    EXPECT_TRUE(std::is_sorted(Progress.begin(), Progress.end()));
    EXPECT_EQ(Progress.back(), ReportedTotal);
    EXPECT_EQ(Access.ActiveGrantCount(), 0u);
}

TEST_F(CopyOrchestratorTest, NeverExceedsMaxConcurrentCopies)
{
    const unsigned int MaxConcurrent = 3;
    std::vector<FileWorkItem> Files = MakeCard(12);

    std::atomic<int> InCopy{ 0 };
    std::atomic<int> MaxObserved{ 0 };
    Orchestrator.SetCopyObserver([&](const CopyEvent& Event)
    {
        if (Event.Type == CopyEventType::Started)
        {
            int Now = ++InCopy;
            int Seen = MaxObserved.load();
            while (Now > Seen && !MaxObserved.compare_exchange_weak(Seen, Now))
            {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
        }
        else if (Event.Type == CopyEventType::Verified || Event.Type == CopyEventType::Failed)
        {
            --InCopy;
        }
    });

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "ssd" }), CascadeMode::Disabled, MaxConcurrent);

    ASSERT_TRUE(Result.Success) << Result.Error.Describe();
    EXPECT_EQ(Result.FilesSucceeded, 12u);
    EXPECT_LE(MaxObserved.load(), static_cast<int>(MaxConcurrent));
    EXPECT_GE(MaxObserved.load(), 2);
    EXPECT_LE(Orchestrator.PeakActiveCopies(), MaxConcurrent);
    EXPECT_EQ(Orchestrator.ActiveCopies(), 0u);
}

TEST_F(CopyOrchestratorTest, OneMissingFileMakesThePartialSuccess)
{
    std::vector<FileWorkItem> Files = MakeCard(10);
    FS::remove(Files[4].SourcePath);

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "ssd" }), CascadeMode::Disabled, 3);

    EXPECT_TRUE(Result.Success);
    EXPECT_TRUE(Result.Partial);
    EXPECT_EQ(Result.Error.Kind, TransferErrorKind::PartialJobFailure);
    EXPECT_EQ(Result.FilesSucceeded, 9u);
    EXPECT_EQ(Result.FilesFailed, 1u);
    ASSERT_EQ(Result.Failed.size(), 1u);
    EXPECT_EQ(Result.Failed.front().Error.Kind, TransferErrorKind::FileNotFound);
    EXPECT_EQ(Result.Failed.front().RelativePath, Files[4].RelativePath);
    EXPECT_EQ(Result.ReportedErrors.size(), 1u);

    ASSERT_EQ(Result.Jobs.size(), 1u);
    EXPECT_EQ(Result.Jobs.front().Status, JobStatus::Completed);
    EXPECT_TRUE(Result.Jobs.front().Partial);
    EXPECT_FALSE(FS::exists(Dir.Path("ssd/" + Files[4].RelativePath)));
}

TEST_F(CopyOrchestratorTest, NothingCopiedIsAFailure)
{
    std::vector<FileWorkItem> Files = MakeCard(3);
    for (const auto& File : Files)
    {
        FS::remove(File.SourcePath);
    }

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "ssd" }), CascadeMode::Disabled, 2);

    EXPECT_FALSE(Result.Success);
    EXPECT_EQ(Result.Error.Kind, TransferErrorKind::NoFilesTransferred);
    EXPECT_EQ(Result.FilesSucceeded, 0u);
    ASSERT_EQ(Result.Jobs.size(), 1u);
    EXPECT_EQ(Result.Jobs.front().Status, JobStatus::Failed);
}

TEST_F(CopyOrchestratorTest, CascadeFillsSecondariesFromTheVerifiedPrimary)
{
    std::vector<FileWorkItem> Files = MakeCard(4);

    std::mutex EventMutex;
    std::vector<CopyEvent> Events;
    Orchestrator.SetCopyObserver([&](const CopyEvent& Event)
    {
        std::lock_guard<std::mutex> Lock(EventMutex);
        Events.push_back(Event);
    });

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "A", "B", "C" }), CascadeMode::PrimaryThenFanout, 3);

    ASSERT_TRUE(Result.Success) << Result.Error.Describe();
    EXPECT_FALSE(Result.Partial);
    EXPECT_EQ(Result.Completed.size(), 12u);

    for (const auto& File : Files)
    {
        size_t PrimaryVerified = Events.size();
        std::vector<size_t> SecondaryStarts;
        for (size_t i = 0; i < Events.size(); ++i)
        {
            const CopyEvent& Event = Events[i];
            if (Event.RelativePath != File.RelativePath)
                continue;
            if (Event.IsPrimary)
            {
                EXPECT_EQ(Event.DestinationIndex, 0u);
                if (Event.Type == CopyEventType::Verified)
                    PrimaryVerified = i;
            }
            else if (Event.Type == CopyEventType::Started)
            {
                EXPECT_NE(Event.DestinationIndex, 0u);
                SecondaryStarts.push_back(i);
            }
        }
        ASSERT_LT(PrimaryVerified, Events.size()) << File.RelativePath;
        ASSERT_EQ(SecondaryStarts.size(), 2u) << File.RelativePath;
        for (size_t Start : SecondaryStarts)
        {
            EXPECT_GT(Start, PrimaryVerified) << File.RelativePath;
        }
    }

    for (const auto& Record : Result.Completed)
    {
        if (Record.IsPrimary)
        {
            EXPECT_TRUE(Record.Verified);
            EXPECT_EQ(Record.SourcePath, Files[Record.FileIndex].SourcePath);
        }
        else
        {
            EXPECT_EQ(Record.SourcePath, Dir.Path("A/" + Record.RelativePath));
        }
        EXPECT_EQ(TestUtils::ReadFile(Record.DestinationPath), TestUtils::ReadFile(Files[Record.FileIndex].SourcePath));
    }
}

TEST_F(CopyOrchestratorTest, FailedPrimarySuppressesItsSecondaries)
{
    std::vector<FileWorkItem> Files = MakeCard(3);
    // A directory squatting on the primary destination path makes that one copy fail
    FS::create_directories(Dir.Path("A/" + Files[1].RelativePath));

    std::mutex EventMutex;
    std::vector<CopyEvent> Events;
    Orchestrator.SetCopyObserver([&](const CopyEvent& Event)
    {
        std::lock_guard<std::mutex> Lock(EventMutex);
        Events.push_back(Event);
    });

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "A", "B", "C" }), CascadeMode::PrimaryThenFanout, 2);

    EXPECT_TRUE(Result.Success);
    EXPECT_TRUE(Result.Partial);
    EXPECT_EQ(Result.FilesSucceeded, 2u);
    EXPECT_EQ(Result.FilesFailed, 1u);

    ASSERT_EQ(Result.Failed.size(), 1u);
    EXPECT_TRUE(Result.Failed.front().IsPrimary);
    EXPECT_EQ(Result.Failed.front().Error.Kind, TransferErrorKind::DestinationInvalid);

    ASSERT_EQ(Result.NotAttempted.size(), 2u);
    for (const auto& Record : Result.NotAttempted)
    {
        EXPECT_EQ(Record.RelativePath, Files[1].RelativePath);
        EXPECT_FALSE(Record.IsPrimary);
    }

    for (const auto& Event : Events)
    {
        if (Event.RelativePath == Files[1].RelativePath)
        {
            EXPECT_TRUE(Event.IsPrimary);
        }
    }
    EXPECT_FALSE(FS::exists(Dir.Path("B/" + Files[1].RelativePath)));
    EXPECT_FALSE(FS::exists(Dir.Path("C/" + Files[1].RelativePath)));
    EXPECT_TRUE(FS::exists(Dir.Path("C/" + Files[2].RelativePath)));
}

TEST_F(CopyOrchestratorTest, SecondRunAcknowledgesExistingFiles)
{
    std::vector<FileWorkItem> Files = MakeCard(4);
    ASSERT_TRUE(Orchestrator.RunJob(Files, Destinations({ "ssd" }), CascadeMode::Disabled, 2).Success);

    std::atomic<int> Started{ 0 };
    Orchestrator.SetCopyObserver([&](const CopyEvent& Event)
    {
        if (Event.Type == CopyEventType::Started)
            ++Started;
    });
    JobResult Again = Orchestrator.RunJob(Files, Destinations({ "ssd" }), CascadeMode::Disabled, 2);

    ASSERT_TRUE(Again.Success);
    EXPECT_FALSE(Again.Partial);
    EXPECT_EQ(Started.load(), 0);
    EXPECT_EQ(Again.Skipped.size(), 4u);
    EXPECT_EQ(Again.FilesSucceeded, 4u);
    EXPECT_EQ(Again.BytesTransferred, Again.TotalBytes);
    for (const auto& Record : Again.Skipped)
    {
        EXPECT_EQ(Record.Note, "already present");
    }
}

TEST_F(CopyOrchestratorTest, InterruptedDestinationIsVerifiedByChecksum)
{
    std::vector<FileWorkItem> Files = MakeCard(2);
    ASSERT_TRUE(Orchestrator.RunJob(Files, Destinations({ "ssd" }), CascadeMode::Disabled, 2).Success);

    // Same size, different bytes, and a leftover marker from a crashed run
    TestUtils::FlipByte(Dir.Path("ssd/" + Files[0].RelativePath), 0);
    ASSERT_TRUE(RunMarker::MarkInProgress(Dir.Path("ssd"), "crashed"));

    JobResult Again = Orchestrator.RunJob(Files, Destinations({ "ssd" }), CascadeMode::Disabled, 2);

    ASSERT_TRUE(Again.Success) << Again.Error.Describe();
    EXPECT_EQ(Again.Completed.size(), 1u);
    EXPECT_EQ(Again.Skipped.size(), 1u);
    EXPECT_EQ(TestUtils::ReadFile(Dir.Path("ssd/" + Files[0].RelativePath)), TestUtils::ReadFile(Files[0].SourcePath));
    EXPECT_FALSE(RunMarker::WasInterrupted(Dir.Path("ssd")));
}

TEST_F(CopyOrchestratorTest, CancelStopsDispatchAndKeepsTheMarker)
{
    std::vector<FileWorkItem> Files = MakeCard(6);

    Orchestrator.SetCopyObserver([&](const CopyEvent& Event)
    {
        if (Event.Type == CopyEventType::Started)
            Orchestrator.Cancel();
    });

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "ssd" }), CascadeMode::Disabled, 1);

    EXPECT_FALSE(Result.Success);
    EXPECT_EQ(Result.Error.Kind, TransferErrorKind::Cancelled);
    ASSERT_EQ(Result.Failed.size(), 1u);
    EXPECT_EQ(Result.Failed.front().Error.Kind, TransferErrorKind::Cancelled);
    EXPECT_EQ(Result.NotAttempted.size(), 5u);
    ASSERT_EQ(Result.Jobs.size(), 1u);
    EXPECT_EQ(Result.Jobs.front().Status, JobStatus::Failed);
    EXPECT_TRUE(RunMarker::WasInterrupted(Dir.Path("ssd")));
}

TEST_F(CopyOrchestratorTest, PausedJobWaitsForResume)
{
    std::vector<FileWorkItem> Files = MakeCard(6);

    std::atomic<bool> PausedOnce{ false };
    std::atomic<int> StartedWhilePaused{ 0 };
    Orchestrator.SetCopyObserver([&](const CopyEvent& Event)
    {
        if (Event.Type != CopyEventType::Started)
            return;
        if (!PausedOnce.exchange(true))
            Orchestrator.Pause();
        else if (Orchestrator.IsPaused())
            ++StartedWhilePaused;
    });

    JobOptions Options = JobOptions::FromConfig();
    Options.MaxConcurrent = 1;
    std::future<JobResult> Pending = Orchestrator.RunJobAsync(Files, Destinations({ "ssd" }), Options);

    while (!PausedOnce.load())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(Pending.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    bool SawPausedJob = false;
    for (const auto& Job : Orchestrator.GetJobs())
    {
        SawPausedJob = SawPausedJob || Job->GetStatus() == JobStatus::Paused;
    }
    EXPECT_TRUE(SawPausedJob);

    Orchestrator.Resume();
    JobResult Result = Pending.get();

    ASSERT_TRUE(Result.Success) << Result.Error.Describe();
    EXPECT_EQ(Result.FilesSucceeded, 6u);
    EXPECT_EQ(StartedWhilePaused.load(), 0);
    EXPECT_EQ(Result.Jobs.front().Status, JobStatus::Completed);
}

TEST_F(CopyOrchestratorTest, UnusableDestinationFailsOnlyItsJob)
{
    std::vector<FileWorkItem> Files = MakeCard(2);
    TestUtils::WriteFile(Dir.Path("not_a_dir"), "file");

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "not_a_dir", "ssd" }), CascadeMode::PrimaryThenFanout, 2);

    ASSERT_TRUE(Result.Success) << Result.Error.Describe();
    ASSERT_EQ(Result.Jobs.size(), 2u);
    EXPECT_EQ(Result.Jobs[0].Status, JobStatus::Failed);
    EXPECT_EQ(Result.Jobs[1].Status, JobStatus::Completed);
    EXPECT_EQ(Result.Completed.size(), 2u);
    EXPECT_EQ(Orchestrator.ClearFinishedJobs(), 2u);
    EXPECT_TRUE(Orchestrator.GetJobs().empty());
}

TEST_F(CopyOrchestratorTest, StalePrimaryOfTheSameSizeIsRecopiedBeforeFanout)
{
    std::vector<FileWorkItem> Files = MakeCard(1);
    const std::string Original = TestUtils::ReadFile(Files[0].SourcePath);

    // Same size, different bytes, no marker: only a digest comparison can tell
    const std::string Stale = Dir.Path("A/" + Files[0].RelativePath);
    TestUtils::WriteFile(Stale, Original);
    TestUtils::FlipByte(Stale, Original.size() / 2);
    ASSERT_FALSE(RunMarker::WasInterrupted(Dir.Path("A")));

    std::atomic<int> PrimaryStarts{ 0 };
    Orchestrator.SetCopyObserver([&](const CopyEvent& Event)
    {
        if (Event.Type == CopyEventType::Started && Event.IsPrimary)
            ++PrimaryStarts;
    });

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "A", "B" }), CascadeMode::PrimaryThenFanout, 3);

    ASSERT_TRUE(Result.Success) << Result.Error.Describe();
    EXPECT_FALSE(Result.Partial);
    EXPECT_TRUE(Result.Skipped.empty());
    EXPECT_EQ(Result.Completed.size(), 2u);
    EXPECT_EQ(PrimaryStarts.load(), 1);
    EXPECT_EQ(TestUtils::ReadFile(Stale), Original);
    EXPECT_EQ(TestUtils::ReadFile(Dir.Path("B/" + Files[0].RelativePath)), Original);
}

TEST_F(CopyOrchestratorTest, IdenticalPrimaryIsAcknowledgedWithItsDigest)
{
    std::vector<FileWorkItem> Files = MakeCard(1);
    TestUtils::WriteFile(Dir.Path("A/" + Files[0].RelativePath), TestUtils::ReadFile(Files[0].SourcePath));

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "A", "B" }), CascadeMode::PrimaryThenFanout, 3);

    ASSERT_TRUE(Result.Success) << Result.Error.Describe();
    ASSERT_EQ(Result.Skipped.size(), 1u);
    EXPECT_TRUE(Result.Skipped.front().IsPrimary);
    EXPECT_TRUE(Result.Skipped.front().Verified);
    EXPECT_FALSE(Result.Skipped.front().ChecksumHex.empty());
    ASSERT_EQ(Result.Completed.size(), 1u);
    EXPECT_FALSE(Result.Completed.front().IsPrimary);
    EXPECT_EQ(TestUtils::ReadFile(Dir.Path("B/" + Files[0].RelativePath)), TestUtils::ReadFile(Files[0].SourcePath));
}

TEST_F(CopyOrchestratorTest, ReportedErrorsAreCappedWithACountOfTheRest)
{
    std::vector<FileWorkItem> Files = MakeCard(7);
    for (size_t i = 0; i < 5; ++i)
    {
        FS::remove(Files[i].SourcePath);
    }

    JobOptions Options = JobOptions::FromConfig();
    Options.MaxReportedErrors = 2;
    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "ssd" }), Options);

    EXPECT_TRUE(Result.Success);
    EXPECT_TRUE(Result.Partial);
    EXPECT_EQ(Result.Failed.size(), 5u);
    EXPECT_EQ(Result.FilesSucceeded, 2u);
    EXPECT_EQ(Result.ReportedErrors.size(), 2u);
    EXPECT_EQ(Result.Error.Kind, TransferErrorKind::PartialJobFailure);
    const std::string Suffix = "(and 3 more)";
    ASSERT_GE(Result.Error.Cause.size(), Suffix.size());
    EXPECT_EQ(Result.Error.Cause.substr(Result.Error.Cause.size() - Suffix.size()), Suffix);
}

TEST_F(CopyOrchestratorTest, NoPrimaryOutsideCascade)
{
    std::vector<FileWorkItem> Files = MakeCard(2);

    std::atomic<int> PrimaryEvents{ 0 };
    Orchestrator.SetCopyObserver([&](const CopyEvent& Event)
    {
        if (Event.IsPrimary)
            ++PrimaryEvents;
    });

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "ssd", "raid" }), CascadeMode::Disabled, 2);

    ASSERT_TRUE(Result.Success) << Result.Error.Describe();
    ASSERT_EQ(Result.Completed.size(), 4u);
    for (const auto& Record : Result.Completed)
    {
        EXPECT_FALSE(Record.IsPrimary);
        EXPECT_EQ(Record.SourcePath, Files[Record.FileIndex].SourcePath);
    }
    EXPECT_EQ(PrimaryEvents.load(), 0);
}

TEST_F(CopyOrchestratorTest, ObserverThrowingAnythingFailsOnlyThatCopy)
{
    std::vector<FileWorkItem> Files = MakeCard(3);
    const std::string Target = Files[1].RelativePath;
    Orchestrator.SetCopyObserver([&](const CopyEvent& Event)
    {
        if (Event.Type == CopyEventType::Started && Event.RelativePath == Target)
            throw 5;
    });

    JobResult Result = Orchestrator.RunJob(Files, Destinations({ "ssd" }), CascadeMode::Disabled, 2);

    EXPECT_TRUE(Result.Success);
    EXPECT_TRUE(Result.Partial);
    EXPECT_EQ(Result.FilesSucceeded, 2u);
    ASSERT_EQ(Result.Failed.size(), 1u);
    EXPECT_EQ(Result.Failed.front().RelativePath, Target);
    EXPECT_EQ(Result.Failed.front().Error.Kind, TransferErrorKind::CopyFailed);
    EXPECT_EQ(Orchestrator.ActiveCopies(), 0u);
}
