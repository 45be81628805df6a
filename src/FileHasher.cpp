#include "FileHasher.hpp"
#include "Logger.hpp"

#include <xxhash.h>
#include <openssl/evp.h>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <vector>
#include <algorithm>
#include <cctype>

namespace
{
    std::string ToHex(const uint8_t* Bytes, size_t Length)
    {
        static const char Digits[] = "0123456789abcdef";
        std::string Hex;
        Hex.reserve(Length * 2);
        for (size_t i = 0; i < Length; ++i)
        {
            Hex.push_back(Digits[Bytes[i] >> 4]);
            Hex.push_back(Digits[Bytes[i] & 0x0F]);
        }
        return Hex;
    }

    std::string Lowercase(std::string Value)
    {
        std::transform(Value.begin(), Value.end(), Value.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Value;
    }
}

std::string ToString(ChecksumAlgorithm Algorithm)
{
    switch (Algorithm)
    {
    case ChecksumAlgorithm::XXHash64: return "xxHash64";
    case ChecksumAlgorithm::MD5:      return "MD5";
    case ChecksumAlgorithm::SHA1:     return "SHA1";
    case ChecksumAlgorithm::BLAKE3:   return "BLAKE3";
    case ChecksumAlgorithm::SizeOnly: return "SizeOnly";
    }
    return "Unknown";
}

bool ParseChecksumAlgorithm(const std::string& Name, ChecksumAlgorithm& Out)
{
    const std::string Key = Lowercase(Name);
    if (Key == "xxhash64" || Key == "xxh64")
        Out = ChecksumAlgorithm::XXHash64;
    else if (Key == "md5")
        Out = ChecksumAlgorithm::MD5;
    else if (Key == "sha1" || Key == "sha-1")
        Out = ChecksumAlgorithm::SHA1;
    else if (Key == "blake3")
        Out = ChecksumAlgorithm::BLAKE3;
    else if (Key == "sizeonly" || Key == "size")
        Out = ChecksumAlgorithm::SizeOnly;
    else
        return false;
    return true;
}

bool ChecksumResult::operator==(const ChecksumResult& Other) const
{
    if (Algorithm != Other.Algorithm)
    {
        return false;
    }
    if (Algorithm == ChecksumAlgorithm::SizeOnly)
    {
        return Size == Other.Size;
    }
    return !DigestHex.empty() && DigestHex == Other.DigestHex;
}

void StreamHasher::XXHStateDeleter::operator()(void* State) const
{
    XXH64_freeState(static_cast<XXH64_state_t*>(State));
}

void StreamHasher::EvpMdCtxDeleter::operator()(void* Ctx) const
{
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(Ctx));
}

StreamHasher::StreamHasher(ChecksumAlgorithm algorithm) : Algorithm(algorithm)
{
    switch (Algorithm)
    {
    case ChecksumAlgorithm::XXHash64:
    {
        XXH64_state_t* State = XXH64_createState();
        if (State == nullptr || XXH64_reset(State, 0) == XXH_ERROR)
        {
            XXH64_freeState(State);
            Valid = false;
            break;
        }
        XXHState.reset(State);
        break;
    }
    case ChecksumAlgorithm::MD5:
    case ChecksumAlgorithm::SHA1:
    {
        EVP_MD_CTX* Ctx = EVP_MD_CTX_new();
        if (Ctx == nullptr)
        {
            Valid = false;
            break;
        }
        EvpContext.reset(Ctx);
        const EVP_MD* Md = (Algorithm == ChecksumAlgorithm::MD5) ? EVP_md5() : EVP_sha1();
        if (EVP_DigestInit_ex(Ctx, Md, nullptr) != 1)
        {
            Valid = false;
        }
        break;
    }
    case ChecksumAlgorithm::BLAKE3:
        blake3_hasher_init(&Blake3State);
        break;
    case ChecksumAlgorithm::SizeOnly:
        break;
    }

    if (!Valid)
    {
        Log.Error("[FileHasher] Failed to initialise " + ToString(Algorithm) + " state");
    }
}

StreamHasher::~StreamHasher() = default;

bool StreamHasher::Update(const void* Data, size_t Length)
{
    if (!Valid)
    {
        return false;
    }
    BytesSeen += Length;

    switch (Algorithm)
    {
    case ChecksumAlgorithm::XXHash64:
        Valid = XXH64_update(static_cast<XXH64_state_t*>(XXHState.get()), Data, Length) != XXH_ERROR;
        break;
    case ChecksumAlgorithm::MD5:
    case ChecksumAlgorithm::SHA1:
        Valid = EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(EvpContext.get()), Data, Length) == 1;
        break;
    case ChecksumAlgorithm::BLAKE3:
        blake3_hasher_update(&Blake3State, Data, Length);
        break;
    case ChecksumAlgorithm::SizeOnly:
        break;
    }
    return Valid;
}

ChecksumResult StreamHasher::Finalize()
{
    ChecksumResult Result;
    Result.Algorithm = Algorithm;
    Result.Size = BytesSeen;

    if (!Valid)
    {
        return Result;
    }

    switch (Algorithm)
    {
    case ChecksumAlgorithm::XXHash64:
    {
        char Buffer[17];
        std::snprintf(Buffer, sizeof(Buffer), "%016llx", static_cast<unsigned long long>(XXH64_digest(static_cast<XXH64_state_t*>(XXHState.get()))));
        Result.DigestHex = Buffer;
        break;
    }
    case ChecksumAlgorithm::MD5:
    case ChecksumAlgorithm::SHA1:
    {
        unsigned char Out[EVP_MAX_MD_SIZE];
        unsigned int OutLen = 0;
        if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(EvpContext.get()), Out, &OutLen) != 1)
        {
            Valid = false;
            break;
        }
        Result.DigestHex = ToHex(Out, OutLen);
        break;
    }
    case ChecksumAlgorithm::BLAKE3:
    {
        uint8_t Out[BLAKE3_OUT_LEN];
        blake3_hasher_finalize(&Blake3State, Out, sizeof(Out));
        Result.DigestHex = ToHex(Out, sizeof(Out));
        break;
    }
    case ChecksumAlgorithm::SizeOnly:
        break;
    }
    return Result;
}

bool FileHasher::Digest(const std::string& Path, ChecksumAlgorithm Algorithm, ChecksumResult& Out, TransferError& Error)
{
    int Fd = open(Path.c_str(), O_RDONLY | O_CLOEXEC);
    if (Fd < 0)
    {
        Error = TransferError(TransferErrorKind::IOFailure, Path, std::string("open failed: ") + strerror(errno));
        Log.Error("[FileHasher] " + Error.Describe());
        return false;
    }

    if (Algorithm == ChecksumAlgorithm::SizeOnly)
    {
        struct stat StatBuf;
        if (fstat(Fd, &StatBuf) != 0)
        {
            Error = TransferError(TransferErrorKind::IOFailure, Path, std::string("fstat failed: ") + strerror(errno));
            close(Fd);
            Log.Error("[FileHasher] " + Error.Describe());
            return false;
        }
        close(Fd);
        Out = ChecksumResult{};
        Out.Algorithm = ChecksumAlgorithm::SizeOnly;
        Out.Size = static_cast<uint64_t>(StatBuf.st_size);
        return true;
    }

    StreamHasher Hasher(Algorithm);
    std::vector<uint8_t> Buffer(BlockSize);

    while (true)
    {
        ssize_t BytesRead = read(Fd, Buffer.data(), Buffer.size());
        if (BytesRead < 0)
        {
            if (errno == EINTR)
                continue;
            Error = TransferError(TransferErrorKind::IOFailure, Path, std::string("read failed: ") + strerror(errno));
            close(Fd);
            Log.Error("[FileHasher] " + Error.Describe());
            return false;
        }
        if (BytesRead == 0)
        {
            break;
        }
        if (!Hasher.Update(Buffer.data(), static_cast<size_t>(BytesRead)))
        {
            break;
        }
    }
    close(Fd);

    Out = Hasher.Finalize();
    if (!Hasher.IsValid())
    {
        Error = TransferError(TransferErrorKind::IOFailure, Path, ToString(Algorithm) + " digest computation failed");
        Log.Error("[FileHasher] " + Error.Describe());
        return false;
    }
    return true;
}
