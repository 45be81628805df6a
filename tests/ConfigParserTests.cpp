#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "TestUtils.hpp"

namespace FS = std::filesystem;

class ConfigParserTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ConfigGlobal::InitializeDefaults();
        FS::create_directories(Dir.Path("card"));
        FS::create_directories(Dir.Path("ssd"));
    }

    bool ParseLines(const std::string& Lines)
    {
        TestUtils::WriteFile(Dir.Path("Offload.txt"), Lines);
        return Parser.Parse(Dir.Path("Offload.txt"));
    }

    bool HasErrorContaining(const std::string& Needle) const
    {
        const auto& Errors = Parser.GetErrors();
        return std::any_of(Errors.begin(), Errors.end(), [&](const std::string& Error) { return Error.find(Needle) != std::string::npos; });
    }

    TempDir Dir;
    ConfigParser Parser;
};

TEST_F(ConfigParserTest, ReadsEveryKey)
{
    const std::string Config =
        "# offload settings\n"
        "Source = " + Dir.Path("card") + "\n"
        "Destination = " + Dir.Path("ssd") + "\n"
        "Destination = " + Dir.Path("raid") + "\n"
        "MediaExtensions = mov, MP4 ,.braw\n"
        "SkipFiles = INDEX.BIN\n"
        "ChecksumAlgorithm = SHA1\n"
        "MaxConcurrentCopies = 6\n"
        "Cascade = YES\n"
        "AlwaysVerify = YES\n"
        "VerifyExisting = YES\n"
        "SkipExistingIdentical = NO\n"
        "MaxReportedErrors = 9\n"
        "BufferedCopyLimitMB = 64\n"
        "MaxLogFiles = 3\n"
        "LogDir = " + Dir.Path("logs") + "\n"
        "CapabilityStore = " + Dir.Path("state/caps.bin") + "\n";

    ASSERT_TRUE(ParseLines(Config)) << (Parser.GetErrors().empty() ? "" : Parser.GetErrors().front());

    EXPECT_EQ(Parser.GetSources(), std::vector<std::string>{ Dir.Path("card") });
    EXPECT_EQ(ConfigGlobal::DestinationPaths, (std::vector<std::string>{ Dir.Path("ssd"), Dir.Path("raid") }));
    EXPECT_EQ(ConfigGlobal::MediaExtensions, (std::vector<std::string>{ "mov", "MP4", ".braw" }));
    EXPECT_EQ(ConfigGlobal::HousekeepingFiles, std::vector<std::string>{ "INDEX.BIN" });
    EXPECT_EQ(ConfigGlobal::ChecksumAlgorithm, "SHA1");
    EXPECT_EQ(ConfigGlobal::MaxConcurrentCopies, 6);
    EXPECT_TRUE(ConfigGlobal::CascadeEnabled);
    EXPECT_TRUE(ConfigGlobal::AlwaysVerify);
    EXPECT_TRUE(ConfigGlobal::VerifyExisting);
    EXPECT_FALSE(ConfigGlobal::SkipExistingIdentical);
    EXPECT_EQ(ConfigGlobal::MaxReportedErrors, 9);
    EXPECT_EQ(ConfigGlobal::BufferedCopyLimitMB, 64u);
    EXPECT_EQ(ConfigGlobal::MaxLogFiles, 3);
    EXPECT_EQ(ConfigGlobal::LogDir, Dir.Path("logs"));
    EXPECT_EQ(ConfigGlobal::CapabilityStoreFile, Dir.Path("state/caps.bin"));
}

TEST_F(ConfigParserTest, ReportsBadLinesAndKeepsGoing)
{
    const std::string Config =
        "Source = " + Dir.Path("card") + "\n"
        "Destination = " + Dir.Path("ssd") + "\n"
        "Bogus = 1\n"
        "Cascade = maybe\n"
        "MaxConcurrentCopies = 0\n"
        "MaxReportedErrors = -3\n"
        "ChecksumAlgorithm = crc32\n"
        "no equals sign here\n";

    EXPECT_FALSE(ParseLines(Config));
    EXPECT_EQ(Parser.GetErrors().size(), 6u);
    EXPECT_TRUE(HasErrorContaining("Line 3"));
    EXPECT_TRUE(HasErrorContaining("Unknown key 'Bogus'"));
    EXPECT_TRUE(HasErrorContaining("Cascade"));
    EXPECT_EQ(ConfigGlobal::MaxConcurrentCopies, 3);
}

TEST_F(ConfigParserTest, RejectsRelativeAndMissingPaths)
{
    const std::string Config =
        "Source = relative/card\n"
        "Source = " + Dir.Path("missing") + "\n"
        "Destination = ssd\n";

    EXPECT_FALSE(ParseLines(Config));
    EXPECT_TRUE(HasErrorContaining("Source path is not absolute"));
    EXPECT_TRUE(HasErrorContaining("Source path does not exist"));
    EXPECT_TRUE(HasErrorContaining("Destination path is not absolute"));
    EXPECT_TRUE(HasErrorContaining("No source paths provided"));
    EXPECT_TRUE(HasErrorContaining("No destination path provided"));
}

TEST_F(ConfigParserTest, RejectsDestinationInsideSource)
{
    const std::string Config =
        "Source = " + Dir.Path("card") + "\n"
        "Destination = " + Dir.Path("card/backup") + "\n";

    EXPECT_FALSE(ParseLines(Config));
    EXPECT_TRUE(HasErrorContaining("is inside source directory"));
}

TEST_F(ConfigParserTest, DuplicatesAreIgnoredWithInfo)
{
    const std::string Config =
        "Source = " + Dir.Path("card") + "\n"
        "Source = " + Dir.Path("card") + "\n"
        "Destination = " + Dir.Path("ssd") + "\n"
        "Destination = " + Dir.Path("ssd") + "\n";

    ASSERT_TRUE(ParseLines(Config));
    EXPECT_EQ(Parser.GetSources().size(), 1u);
    EXPECT_EQ(ConfigGlobal::DestinationPaths.size(), 1u);
    const auto& Infos = Parser.GetInfos();
    EXPECT_EQ(std::count_if(Infos.begin(), Infos.end(), [](const std::string& Info) { return Info.find("Duplicate") != std::string::npos; }), 2);
}

TEST_F(ConfigParserTest, StarDisablesExtensionFiltering)
{
    const std::string Config =
        "Source = " + Dir.Path("card") + "\n"
        "Destination = " + Dir.Path("ssd") + "\n"
        "MediaExtensions = *\n";

    ASSERT_TRUE(ParseLines(Config));
    EXPECT_TRUE(ConfigGlobal::MediaExtensions.empty());
}

TEST_F(ConfigParserTest, MissingFileFails)
{
    EXPECT_FALSE(Parser.Parse(Dir.Path("nope.txt")));
    EXPECT_TRUE(HasErrorContaining("Config file does not exist"));

    Parser.Reset();
    EXPECT_TRUE(Parser.GetErrors().empty());
}

TEST_F(ConfigParserTest, HashListSettings)
{
    EXPECT_FALSE(ConfigGlobal::CreateHashList);
    EXPECT_EQ(ConfigGlobal::HashListAlgorithm, "MD5");

    const std::string Config =
        "Source = " + Dir.Path("card") + "\n"
        "Destination = " + Dir.Path("ssd") + "\n"
        "CreateHashList = YES\n"
        "HashListAlgorithm = xxh64\n";
    ASSERT_TRUE(ParseLines(Config));
    EXPECT_TRUE(ConfigGlobal::CreateHashList);
    EXPECT_EQ(ConfigGlobal::HashListAlgorithm, "xxHash64");

    Parser.Reset();
    const std::string Unsupported =
        "Source = " + Dir.Path("card") + "\n"
        "Destination = " + Dir.Path("ssd") + "\n"
        "HashListAlgorithm = BLAKE3\n";
    EXPECT_FALSE(ParseLines(Unsupported));
    EXPECT_TRUE(HasErrorContaining("Invalid HashListAlgorithm"));
}
