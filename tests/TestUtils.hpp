#pragma once

#include <string>
#include <filesystem>
#include <cstdint>
#include <vector>

// Scratch directory under the system temp dir, removed with everything in it on destruction.
class TempDir
{
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Root() const { return RootPath; }
    std::string Path(const std::string& Relative) const;

private:
    std::filesystem::path RootPath;
};

namespace TestUtils
{
    void WriteFile(const std::string& Path, const std::string& Content);
    // Deterministic pseudo-random content so two files with the same seed are identical.
    void WriteRandomFile(const std::string& Path, uint64_t Size, uint32_t Seed);
    std::string ReadFile(const std::string& Path);
    void FlipByte(const std::string& Path, uint64_t Offset);
}
