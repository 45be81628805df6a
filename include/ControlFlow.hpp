#pragma once

#include <memory>
#include <string>

#include "ConfigParser.hpp"
#include "CapabilityStore.hpp"
#include "AccessManager.hpp"
#include "CopyOrchestrator.hpp"

class ControlFlow
{
public:
    ControlFlow() = default;

    int Run();

    // Re-hashes every file a hash list names; 0 when all listed files match.
    static int VerifyHashList(const std::string& ListPath, const std::string& BasePath);

private:
    ConfigParser Parser;
    std::unique_ptr<CapabilityStore> Store;
    std::unique_ptr<AccessManager> Access;

    bool ValidateAccess();
    bool OffloadSource(CopyOrchestrator& Orchestrator, const std::string& Source);

    void LogSourcesDestinations();
    void PrintSummary(const std::string& Source, const JobResult& Result, double ElapsedSeconds);
    void WriteHashLists(const std::string& Source, const JobResult& Result, ChecksumAlgorithm RecordAlgorithm);
};
