#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    std::string CapabilityStoreFile;
    std::string ChecksumAlgorithm;
    std::string HashListAlgorithm;

    std::vector<std::string> DestinationPaths;
    std::vector<std::string> MediaExtensions;
    std::vector<std::string> HousekeepingFiles;

    bool CascadeEnabled;
    bool AlwaysVerify;
    bool VerifyExisting;
    bool SkipExistingIdentical;
    bool CreateHashList;

    unsigned short int MaxLogFiles;
    unsigned short int MaxConcurrentCopies;
    unsigned short int MaxReportedErrors;
    unsigned short int RateWindowSeconds;
    uint32_t BufferedCopyLimitMB;

    std::filesystem::path IncompleteMarkerName;

    void InitializeDefaults()
    {
        ConfigFile = "Offload.txt"; //Can be replaced by an absolute path
        LogDir = "Offload_Logs";
        CapabilityStoreFile = "Offload_State/Capabilities.bin";
        ChecksumAlgorithm = "xxHash64";
        HashListAlgorithm = "MD5";

        DestinationPaths.clear();

        // Stills, camera video and production audio
        MediaExtensions = {
            "jpg", "jpeg", "arw", "cr2", "cr3", "nef", "raw", "dng", "raf", "heic", "png", "tif", "tiff",
            "mov", "mp4", "mxf", "r3d", "braw", "ari", "crm", "avi", "mts", "m2ts", "wav"
        };

        // Card index and database files written by camera firmware
        HousekeepingFiles = { "SONYCARD.IND", "DATABASE.BIN", "MEDIAPRO.XML", "AVIN0001.INP", "AVIN0001.BNP", "AVIN0001.INT" };

        CascadeEnabled = false;
        AlwaysVerify = false;
        VerifyExisting = false;
        SkipExistingIdentical = true;
        CreateHashList = false;

        MaxLogFiles = 10;
        MaxConcurrentCopies = 3;
        MaxReportedErrors = 5;
        RateWindowSeconds = 5;
        BufferedCopyLimitMB = 512;

        IncompleteMarkerName = ".cardoffload_incomplete"; //Do Not Touch
    }
}
