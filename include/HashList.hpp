#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

#include "FileHasher.hpp"
#include "TransferError.hpp"

struct FileTransferRecord;

struct HashListEntry
{
    std::string RelativePath;   // generic form, relative to the directory the list describes
    uint64_t Size = 0;
    std::string DigestHex;
    std::time_t ModifiedTime = 0;
};

struct HashListVerification
{
    bool Success = false;       // nothing invalid and at least one file verified
    std::string Message;
    std::vector<std::string> Verified;
    std::vector<std::string> Missing;
    std::vector<std::string> Invalid;
    TransferError Error;        // set when the list itself could not be read
};

// Media hash lists (ASC MHL 1.x hashlist documents): one <hash> element per
// file carrying its path, size, digest and modification date.
class HashList
{
public:
    static constexpr const char* DirectoryName = "MHL";
    static constexpr const char* Version = "1.1";

    // md5, sha1 and xxh64 are the digest elements the format defines
    static bool IsSupported(ChecksumAlgorithm Algorithm);
    static const char* ElementName(ChecksumAlgorithm Algorithm);

    // Entries are written in the order given. Earlier lists named in
    // PreviousLists are referenced in <history> by their SHA-1.
    static bool Write(const std::string& ListPath, const std::vector<HashListEntry>& Entries, ChecksumAlgorithm Algorithm,
        const std::vector<std::string>& PreviousLists, const std::string& Comment, TransferError& Error);

    // Builds the list for everything a job left under DestinationRoot and
    // writes it to <DestinationRoot>/MHL/<SourceName>_<timestamp>.mhl.
    // RecordAlgorithm is the algorithm the records' ChecksumHex was taken
    // with; files without a usable digest are hashed again.
    static bool WriteForDestination(const std::string& DestinationRoot, const std::vector<FileTransferRecord>& Records,
        ChecksumAlgorithm RecordAlgorithm, ChecksumAlgorithm ListAlgorithm, const std::string& SourceName,
        std::string& ListPath, TransferError& Error);

    // Re-hashes every listed file. BasePath defaults to the directory the
    // list was written for (the parent of its MHL folder).
    static HashListVerification Verify(const std::string& ListPath, const std::string& BasePath = std::string());

    static std::string DefaultBasePath(const std::string& ListPath);
};
