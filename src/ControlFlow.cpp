#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <chrono>
#include <algorithm>

#include "ControlFlow.hpp"
#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include "TimeUtils.hpp"
#include "HashList.hpp"

int ControlFlow::Run()
{
    std::cout << "Starting CardOffload \n";

    if (!Parser.Parse(ConfigGlobal::ConfigFile))
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
        }
        std::cerr << "Check Errors and Fix Them, Exiting Offload\n";
        return 1;
    }

    if (!Log.Init(ConfigGlobal::LogDir))
    {
        std::cerr << "Could not open a log file in " << ConfigGlobal::LogDir << ", continuing without one.\n";
    }
    for (const auto& Info : Parser.GetInfos())
    {
        std::cout << "Config Info: " << Info << "\n";
        Log.Info(Info);
    }
    Log.Info("Config Parsed Successfully.");
    std::cout << "Config Parsed Successfully.\n";

    Log.CleanupOldLogs();
    LogSourcesDestinations();

    Store = std::make_unique<CapabilityStore>(ConfigGlobal::CapabilityStoreFile);
    if (!Store->Load())
    {
        std::cerr << "Could not load capability store " << ConfigGlobal::CapabilityStoreFile << ", starting with an empty one.\n";
        Log.Error("Could not load capability store " + ConfigGlobal::CapabilityStoreFile);
    }
    Access = std::make_unique<AccessManager>(*Store);

    if (!ValidateAccess())
    {
        std::cerr << "Access check failed, Exiting Offload. Refer to the logs for details.\n";
        Log.Error("Access check failed, Exiting Offload");
        return 1;
    }

    CopyOrchestrator Orchestrator(*Access);
    Orchestrator.SetProgressCallback([](uint64_t BytesTransferred, uint64_t TotalBytes, const std::string& CurrentFileName)
    {
        std::cout << "\r" << FormatBytes(BytesTransferred) << " / " << FormatBytes(TotalBytes) << "  " << CurrentFileName << "          " << std::flush;
    });

    bool AllCompleted = true;
    for (const auto& Source : Parser.GetSources())
    {
        if (!OffloadSource(Orchestrator, Source))
        {
            AllCompleted = false;
        }
    }

    if (Log.IsOpen())
    {
        std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    }
    if (!AllCompleted)
    {
        std::cout << "Offload Finished With Failures \n";
        Log.Error("Offload Finished With Failures");
        return 1;
    }
    std::cout << "Offload Complete \n";
    Log.Info("Offload Complete");
    return 0;
}

bool ControlFlow::ValidateAccess()
{
    bool Ok = true;
    for (const auto& Source : Parser.GetSources())
    {
        if (!Access->Validate(Source, AccessMode::Read))
        {
            std::cerr << "Cannot read source: " << Source << "\n";
            Ok = false;
        }
    }

    for (const auto& Destination : ConfigGlobal::DestinationPaths)
    {
        std::error_code ec;
        std::filesystem::create_directories(Destination, ec);
        if (ec)
        {
            std::cerr << "Cannot create destination: " << Destination << " - " << ec.message() << "\n";
            Log.Error("Cannot create destination: " + Destination + " - " + ec.message());
            Ok = false;
            continue;
        }
        if (!Access->Validate(Destination, AccessMode::ReadWrite))
        {
            std::cerr << "Cannot write destination: " << Destination << "\n";
            Ok = false;
        }
    }
    return Ok;
}

bool ControlFlow::OffloadSource(CopyOrchestrator& Orchestrator, const std::string& Source)
{
    Log.Info("Scanning Source: " + Source);
    std::cout << "Scanning: " << Source << std::endl;

    ScanReport Report = Orchestrator.ScanSourceAsync(Source, ScanRules::FromConfig()).get();
    if (!Report.Ok)
    {
        std::cerr << "Scan FAILED: " << Report.Error.Describe() << "\n";
        Log.Error("Scan FAILED: " + Report.Error.Describe());
        return false;
    }

    for (const auto& ScanError : Report.Outcome.ScanErrors)
    {
        std::cerr << "Scan Warning: " << ScanError << "\n";
    }
    Log.Info("Scanning Source Complete: " + std::to_string(Report.Outcome.Files.size()) + " files, " + FormatBytes(Report.Outcome.TotalBytes) + ", " + std::to_string(Report.Outcome.Skipped.size()) + " skipped");
    std::cout << "Found " << Report.Outcome.Files.size() << " files (" << FormatBytes(Report.Outcome.TotalBytes) << ")\n";

    Log.Info("Initiating Copying...");
    std::cout << "Initiating Copying...\n";

    const JobOptions Options = JobOptions::FromConfig();
    const auto Started = std::chrono::steady_clock::now();
    JobResult Result = Orchestrator.RunJob(Report.Outcome.Files, ConfigGlobal::DestinationPaths, Options);
    const double Elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - Started).count();
    std::cout << "\n";
    PrintSummary(Source, Result, Elapsed);
    Orchestrator.ClearFinishedJobs();

    if (ConfigGlobal::CreateHashList && Result.Success)
    {
        WriteHashLists(Source, Result, Options.Copy.Algorithm);
    }

    return Result.Success;
}

void ControlFlow::LogSourcesDestinations()
{
    Log.Info("Sources:");
    for (const auto& Source : Parser.GetSources())
    {
        Log.Info("  " + Source);
    }

    Log.Info("Destinations:");
    for (const auto& Destination : ConfigGlobal::DestinationPaths)
    {
        Log.Info("  " + Destination);
    }
    Log.Info("Checksum: " + ConfigGlobal::ChecksumAlgorithm + ", Cascade: " + (ConfigGlobal::CascadeEnabled ? "YES" : "NO") + ", Max Concurrent Copies: " + std::to_string(ConfigGlobal::MaxConcurrentCopies));
}

void ControlFlow::PrintSummary(const std::string& Source, const JobResult& Result, double ElapsedSeconds)
{
    std::string Status = Result.Success ? (Result.Partial ? "Completed With Failures" : "Completed") : "FAILED";
    std::string Line = "Source " + Source + " - " + Status + ": " + std::to_string(Result.FilesSucceeded) + " files succeeded, " + std::to_string(Result.FilesFailed) + " failed, " + std::to_string(Result.Skipped.size()) + " already present, " + FormatBytes(Result.BytesTransferred) + " of " + FormatBytes(Result.TotalBytes) + " in " + FormatDuration(ElapsedSeconds);
    std::cout << Line << "\n";
    if (Result.Success)
        Log.Info(Line);
    else
        Log.Error(Line);

    for (const auto& Job : Result.Jobs)
    {
        std::string JobLine = "  -> " + Job.Destination + " [" + ToString(Job.Status) + "] " + std::to_string(Job.FilesCompleted) + "/" + std::to_string(Job.TotalFiles) + " files";
        if (Job.FailureReason.IsSet())
        {
            JobLine += " - " + Job.FailureReason.Describe();
        }
        std::cout << JobLine << "\n";
        Log.Info(JobLine);
    }

    if (!Result.Success && Result.Error.IsSet())
    {
        std::cerr << "  Reason: " << Result.Error.Describe() << "\n";
    }
    for (const auto& Reported : Result.ReportedErrors)
    {
        std::cerr << "  Error: " << Reported << "\n";
    }
}

void ControlFlow::WriteHashLists(const std::string& Source, const JobResult& Result, ChecksumAlgorithm RecordAlgorithm)
{
    ChecksumAlgorithm ListAlgorithm = ChecksumAlgorithm::MD5;
    ParseChecksumAlgorithm(ConfigGlobal::HashListAlgorithm, ListAlgorithm);

    std::vector<FileTransferRecord> Present = Result.Completed;
    Present.insert(Present.end(), Result.Skipped.begin(), Result.Skipped.end());

    const std::string SourceName = std::filesystem::path(Source).lexically_normal().filename().string();
    for (const auto& Job : Result.Jobs)
    {
        const bool HasFiles = std::any_of(Present.begin(), Present.end(), [&](const FileTransferRecord& Record) { return Record.DestinationRoot == Job.Destination; });
        if (!HasFiles)
        {
            continue;
        }
        std::string ListPath;
        TransferError Error;
        if (HashList::WriteForDestination(Job.Destination, Present, RecordAlgorithm, ListAlgorithm, SourceName, ListPath, Error))
        {
            std::cout << "Hash List Written: " << ListPath << "\n";
        }
        else
        {
            std::cerr << "Hash List FAILED for " << Job.Destination << ": " << Error.Describe() << "\n";
        }
    }
}

int ControlFlow::VerifyHashList(const std::string& ListPath, const std::string& BasePath)
{
    HashListVerification Verification = HashList::Verify(ListPath, BasePath);
    if (Verification.Error.IsSet())
    {
        std::cerr << Verification.Message << ": " << Verification.Error.Describe() << "\n";
        return 1;
    }

    for (const auto& Path : Verification.Missing)
    {
        std::cerr << "Missing: " << Path << "\n";
    }
    for (const auto& Path : Verification.Invalid)
    {
        std::cerr << "Invalid: " << Path << "\n";
    }
    std::cout << Verification.Message << " - " << Verification.Verified.size() << " verified, " << Verification.Missing.size() << " missing, " << Verification.Invalid.size() << " invalid\n";
    return Verification.Success ? 0 : 1;
}
