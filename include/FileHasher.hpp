#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <cstddef>

#include <blake3.h>

#include "TransferError.hpp"

enum class ChecksumAlgorithm
{
    XXHash64,   // default, non-cryptographic 64-bit
    MD5,        // cryptographic 128-bit
    SHA1,       // cryptographic 160-bit
    BLAKE3,     // cryptographic 256-bit
    SizeOnly    // no digest, byte count only (weaker, opt-in)
};

std::string ToString(ChecksumAlgorithm Algorithm);
bool ParseChecksumAlgorithm(const std::string& Name, ChecksumAlgorithm& Out);

struct ChecksumResult
{
    ChecksumAlgorithm Algorithm = ChecksumAlgorithm::XXHash64;
    std::string DigestHex;      // empty for SizeOnly
    uint64_t Size = 0;

    // Results under different algorithms are never equal.
    bool operator==(const ChecksumResult& Other) const;
    bool operator!=(const ChecksumResult& Other) const { return !(*this == Other); }
};

// Incremental hasher for callers that already stream the bytes (chunked copy).
class StreamHasher
{
public:
    explicit StreamHasher(ChecksumAlgorithm Algorithm);
    ~StreamHasher();

    StreamHasher(const StreamHasher&) = delete;
    StreamHasher& operator=(const StreamHasher&) = delete;

    bool Update(const void* Data, size_t Length);
    ChecksumResult Finalize();

    ChecksumAlgorithm GetAlgorithm() const { return Algorithm; }
    bool IsValid() const { return Valid; }

private:
    struct XXHStateDeleter { void operator()(void* State) const; };
    struct EvpMdCtxDeleter { void operator()(void* Ctx) const; };

    ChecksumAlgorithm Algorithm;
    bool Valid = true;
    uint64_t BytesSeen = 0;

    std::unique_ptr<void, XXHStateDeleter> XXHState;
    std::unique_ptr<void, EvpMdCtxDeleter> EvpContext;
    blake3_hasher Blake3State{};
};

class FileHasher
{
public:
    static constexpr size_t BlockSize = 1024 * 1024;

    // Streams the file in BlockSize blocks; open/read failures are IOFailure, never a mismatch.
    static bool Digest(const std::string& Path, ChecksumAlgorithm Algorithm, ChecksumResult& Out, TransferError& Error);
};
