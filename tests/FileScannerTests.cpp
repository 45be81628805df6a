#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>

#include "FileScanner.hpp"
#include "ConfigGlobal.hpp"
#include "TestUtils.hpp"

namespace FS = std::filesystem;

namespace
{
    // Refuses to list the directories named in FailingDirs.
    class FlakyScanner : public FileScanner
    {
    public:
        FlakyScanner(ScanRules rules, std::vector<FS::path> failingDirs)
            : FileScanner(nullptr, std::move(rules)), FailingDirs(std::move(failingDirs))
        {
        }

        bool FailMetadataSize = false;
        bool FailProbeSize = false;

    protected:
        bool ListDirectory(const FS::path& Dir, std::vector<FS::directory_entry>& Entries, std::error_code& ec) override
        {
            if (std::find(FailingDirs.begin(), FailingDirs.end(), Dir) != FailingDirs.end())
            {
                ec = std::make_error_code(std::errc::permission_denied);
                return false;
            }
            return FileScanner::ListDirectory(Dir, Entries, ec);
        }

        bool ReadMetadataSize(const FS::directory_entry& Entry, uint64_t& Size) override
        {
            return !FailMetadataSize && FileScanner::ReadMetadataSize(Entry, Size);
        }

        bool ProbeSize(const FS::path& Path, uint64_t& Size) override
        {
            return !FailProbeSize && FileScanner::ProbeSize(Path, Size);
        }

    private:
        std::vector<FS::path> FailingDirs;
    };

    std::vector<std::string> RelativePaths(const ScanOutcome& Outcome)
    {
        std::vector<std::string> Paths;
        for (const auto& File : Outcome.Files)
        {
            Paths.push_back(File.RelativePath);
        }
        return Paths;
    }
}

class FileScannerTest : public ::testing::Test
{
protected:
    void SetUp() override { ConfigGlobal::InitializeDefaults(); }

    std::string Card() const { return Dir.Path("card"); }

    TempDir Dir;
};

TEST_F(FileScannerTest, CollectsMediaAndSkipsHousekeeping)
{
    TestUtils::WriteFile(Dir.Path("card/DCIM/100MSDCF/DSC0001.ARW"), "raw1");
    TestUtils::WriteFile(Dir.Path("card/DCIM/100MSDCF/DSC0001.JPG"), "jpeg1");
    TestUtils::WriteFile(Dir.Path("card/PRIVATE/M4ROOT/CLIP/C0001.MP4"), "video");
    TestUtils::WriteFile(Dir.Path("card/PRIVATE/M4ROOT/MEDIAPRO.XML"), "<xml/>");
    TestUtils::WriteFile(Dir.Path("card/.Trashes/old.jpg"), "trash");
    TestUtils::WriteFile(Dir.Path("card/notes.txt"), "text");

    FileScanner Scanner(nullptr, ScanRules::FromConfig());
    ScanOutcome Outcome;
    TransferError Error;
    ASSERT_TRUE(Scanner.Scan(Card(), Outcome, Error)) << Error.Describe();

    std::vector<std::string> Expected = { "DCIM/100MSDCF/DSC0001.ARW", "DCIM/100MSDCF/DSC0001.JPG", "PRIVATE/M4ROOT/CLIP/C0001.MP4" };
    EXPECT_EQ(RelativePaths(Outcome), Expected);
    EXPECT_EQ(Outcome.TotalBytes, 4u + 5u + 5u);
    EXPECT_EQ(Outcome.Skipped.size(), 3u);
    EXPECT_TRUE(Outcome.ScanErrors.empty());
}

TEST_F(FileScannerTest, EmptyExtensionListTakesEveryFile)
{
    TestUtils::WriteFile(Dir.Path("card/a.txt"), "a");
    TestUtils::WriteFile(Dir.Path("card/b.bin"), "b");

    ScanRules Rules;
    FileScanner Scanner(nullptr, Rules);
    ScanOutcome Outcome;
    TransferError Error;
    ASSERT_TRUE(Scanner.Scan(Card(), Outcome, Error));
    EXPECT_EQ(Outcome.Files.size(), 2u);
}

TEST_F(FileScannerTest, OneUnreadableSubtreeDoesNotStopTheScan)
{
    for (int i = 0; i < 10; ++i)
    {
        TestUtils::WriteFile(Dir.Path("card/DIR" + std::to_string(i) + "/IMG" + std::to_string(i) + ".jpg"), "img");
    }

    FlakyScanner Scanner(ScanRules::FromConfig(), { Dir.Root() / "card" / "DIR4" });
    ScanOutcome Outcome;
    TransferError Error;
    ASSERT_TRUE(Scanner.Scan(Card(), Outcome, Error)) << Error.Describe();

    EXPECT_EQ(Outcome.Files.size(), 9u);
    ASSERT_EQ(Outcome.ScanErrors.size(), 1u);
    EXPECT_NE(Outcome.ScanErrors.front().find("DIR4"), std::string::npos);
    for (const auto& File : Outcome.Files)
    {
        EXPECT_EQ(File.RelativePath.find("DIR4"), std::string::npos);
    }
}

TEST_F(FileScannerTest, UnlistableRootFailsTheScan)
{
    TestUtils::WriteFile(Dir.Path("card/IMG1.jpg"), "img");

    FlakyScanner Scanner(ScanRules::FromConfig(), { Dir.Root() / "card" });
    ScanOutcome Outcome;
    TransferError Error;
    EXPECT_FALSE(Scanner.Scan(Card(), Outcome, Error));
    EXPECT_EQ(Error.Kind, TransferErrorKind::ScanFailed);
    EXPECT_TRUE(Outcome.Files.empty());
}

TEST_F(FileScannerTest, MissingRootIsSourceInvalid)
{
    FileScanner Scanner(nullptr, ScanRules::FromConfig());
    ScanOutcome Outcome;
    TransferError Error;
    EXPECT_FALSE(Scanner.Scan(Dir.Path("no_card"), Outcome, Error));
    EXPECT_EQ(Error.Kind, TransferErrorKind::SourceInvalid);
}

TEST_F(FileScannerTest, SizeFallsBackToProbeThenZero)
{
    TestUtils::WriteFile(Dir.Path("card/IMG1.jpg"), "12345");

    FlakyScanner Probing(ScanRules::FromConfig(), {});
    Probing.FailMetadataSize = true;
    ScanOutcome Outcome;
    TransferError Error;
    ASSERT_TRUE(Probing.Scan(Card(), Outcome, Error));
    ASSERT_EQ(Outcome.Files.size(), 1u);
    EXPECT_EQ(Outcome.Files.front().SizeBytes, 5u);
    EXPECT_TRUE(Outcome.ScanErrors.empty());

    FlakyScanner Blind(ScanRules::FromConfig(), {});
    Blind.FailMetadataSize = true;
    Blind.FailProbeSize = true;
    ASSERT_TRUE(Blind.Scan(Card(), Outcome, Error));
    ASSERT_EQ(Outcome.Files.size(), 1u);
    EXPECT_EQ(Outcome.Files.front().SizeBytes, 0u);
    EXPECT_EQ(Outcome.ScanErrors.size(), 1u);
}

TEST_F(FileScannerTest, SingleFileSourceIsRelativeToItsParent)
{
    TestUtils::WriteFile(Dir.Path("card/C0002.MP4"), "video");

    FileScanner Scanner(nullptr, ScanRules::FromConfig());
    ScanOutcome Outcome;
    TransferError Error;
    ASSERT_TRUE(Scanner.Scan(Dir.Path("card/C0002.MP4"), Outcome, Error));
    ASSERT_EQ(Outcome.Files.size(), 1u);
    EXPECT_EQ(Outcome.Files.front().RelativePath, "C0002.MP4");
}
