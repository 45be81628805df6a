#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern std::string CapabilityStoreFile;
    extern std::string ChecksumAlgorithm;
    extern std::string HashListAlgorithm;

    extern std::vector<std::string> DestinationPaths;
    extern std::vector<std::string> MediaExtensions;
    extern std::vector<std::string> HousekeepingFiles;

    extern bool CascadeEnabled;
    extern bool AlwaysVerify;
    extern bool VerifyExisting;
    extern bool SkipExistingIdentical;
    extern bool CreateHashList;

    extern unsigned short int MaxLogFiles;
    extern unsigned short int MaxConcurrentCopies;
    extern unsigned short int MaxReportedErrors;
    extern unsigned short int RateWindowSeconds;
    extern uint32_t BufferedCopyLimitMB;

    extern std::filesystem::path IncompleteMarkerName;

    void InitializeDefaults();
}
