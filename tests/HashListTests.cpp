#include <gtest/gtest.h>

#include <pugixml.hpp>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "HashList.hpp"
#include "CopyOrchestrator.hpp"
#include "AccessManager.hpp"
#include "CapabilityStore.hpp"
#include "ConfigGlobal.hpp"
#include "TestUtils.hpp"

namespace FS = std::filesystem;

class HashListTest : public ::testing::Test
{
protected:
    HashListTest() : Store(Dir.Path("state/Capabilities.bin")), Access(Store), Orchestrator(Access)
    {
    }

    void SetUp() override
    {
        ConfigGlobal::InitializeDefaults();
        ConfigGlobal::MediaExtensions.clear();
    }

    JobResult OffloadCard(size_t Count, const JobOptions& Options)
    {
        for (size_t i = 0; i < Count; ++i)
        {
            TestUtils::WriteRandomFile(Dir.Path("card/DCIM/C00" + std::to_string(i) + ".MP4"), 40000 + i, static_cast<uint32_t>(i + 11));
        }
        ScanReport Report = Orchestrator.ScanSourceAsync(Dir.Path("card"), ScanRules::FromConfig()).get();
        EXPECT_TRUE(Report.Ok) << Report.Error.Describe();
        return Orchestrator.RunJob(Report.Outcome.Files, { Dir.Path("ssd") }, Options);
    }

    TempDir Dir;
    CapabilityStore Store;
    AccessManager Access;
    CopyOrchestrator Orchestrator;
};

TEST_F(HashListTest, WrittenListVerifiesUntilAFileChanges)
{
    JobResult Result = OffloadCard(3, JobOptions::FromConfig());
    ASSERT_TRUE(Result.Success) << Result.Error.Describe();
    ASSERT_EQ(Result.Completed.size(), 3u);

    std::string ListPath;
    TransferError Error;
    ASSERT_TRUE(HashList::WriteForDestination(Dir.Path("ssd"), Result.Completed, ChecksumAlgorithm::XXHash64, ChecksumAlgorithm::MD5, "card", ListPath, Error))
        << Error.Describe();
    EXPECT_EQ(FS::path(ListPath).parent_path(), FS::path(Dir.Path("ssd/MHL")));
    EXPECT_EQ(FS::path(ListPath).extension(), ".mhl");
    EXPECT_EQ(HashList::DefaultBasePath(ListPath), Dir.Path("ssd"));

    HashListVerification Clean = HashList::Verify(ListPath);
    EXPECT_TRUE(Clean.Success) << Clean.Message;
    EXPECT_EQ(Clean.Verified.size(), 3u);
    EXPECT_TRUE(Clean.Missing.empty());
    EXPECT_TRUE(Clean.Invalid.empty());

    const std::string Mutated = Dir.Path("ssd/DCIM/C001.MP4");
    TestUtils::FlipByte(Mutated, 100);
    FS::remove(Dir.Path("ssd/DCIM/C002.MP4"));

    HashListVerification After = HashList::Verify(ListPath);
    EXPECT_FALSE(After.Success);
    EXPECT_FALSE(After.Error.IsSet());
    EXPECT_EQ(After.Verified.size(), 1u);
    ASSERT_EQ(After.Invalid.size(), 1u);
    EXPECT_EQ(After.Invalid.front(), Mutated);
    ASSERT_EQ(After.Missing.size(), 1u);
    EXPECT_EQ(After.Missing.front(), Dir.Path("ssd/DCIM/C002.MP4"));
}

TEST_F(HashListTest, ReusesTheDigestTakenDuringTheCopy)
{
    JobOptions Options = JobOptions::FromConfig();
    Options.Copy.Algorithm = ChecksumAlgorithm::SHA1;
    Options.Copy.FirstStrategy = CopyStrategy::Chunked;
    JobResult Result = OffloadCard(2, Options);
    ASSERT_TRUE(Result.Success) << Result.Error.Describe();

    std::string ListPath;
    TransferError Error;
    ASSERT_TRUE(HashList::WriteForDestination(Dir.Path("ssd"), Result.Completed, ChecksumAlgorithm::SHA1, ChecksumAlgorithm::SHA1, "card", ListPath, Error));

    pugi::xml_document Doc;
    ASSERT_TRUE(Doc.load_file(ListPath.c_str()));
    const pugi::xml_node Root = Doc.child("hashlist");
    ASSERT_TRUE(Root);
    EXPECT_STREQ(Root.attribute("version").value(), HashList::Version);
    EXPECT_STREQ(Root.child("creatorinfo").child_value("name"), "CardOffload");

    size_t Entries = 0;
    for (const pugi::xml_node Hash : Root.children("hash"))
    {
        const std::string File = Hash.child_value("file");
        const auto Record = std::find_if(Result.Completed.begin(), Result.Completed.end(), [&](const FileTransferRecord& R) { return R.RelativePath == File; });
        ASSERT_NE(Record, Result.Completed.end()) << File;
        ASSERT_TRUE(Record->Verified);
        EXPECT_EQ(std::string(Hash.child_value("sha1")), Record->ChecksumHex);
        EXPECT_EQ(Hash.child("size").text().as_ullong(), Record->SizeBytes);
        EXPECT_FALSE(std::string(Hash.child_value("lastmodificationdate")).empty());
        ++Entries;
    }
    EXPECT_EQ(Entries, 2u);
    EXPECT_TRUE(HashList::Verify(ListPath).Success);
}

TEST_F(HashListTest, KnownDigestAndHistoryOfEarlierLists)
{
    TestUtils::WriteFile(Dir.Path("ssd/abc.wav"), "abc");
    HashListEntry Entry;
    Entry.RelativePath = "abc.wav";
    Entry.Size = 3;
    Entry.DigestHex = "900150983cd24fb0d6963f7d28e17f72";

    TransferError Error;
    const std::string First = Dir.Path("ssd/MHL/first.mhl");
    FS::create_directories(Dir.Path("ssd/MHL"));
    ASSERT_TRUE(HashList::Write(First, { Entry }, ChecksumAlgorithm::MD5, {}, "", Error)) << Error.Describe();
    EXPECT_TRUE(HashList::Verify(First).Success);

    const std::string Second = Dir.Path("ssd/MHL/second.mhl");
    ASSERT_TRUE(HashList::Write(Second, { Entry }, ChecksumAlgorithm::MD5, { First }, "second pass", Error));

    pugi::xml_document Doc;
    ASSERT_TRUE(Doc.load_file(Second.c_str()));
    const pugi::xml_node Previous = Doc.child("hashlist").child("history").child("hashlist");
    ASSERT_TRUE(Previous);
    EXPECT_STREQ(Previous.child_value("path"), "first.mhl");
    EXPECT_STREQ(Previous.child("hash").attribute("alg").value(), "sha1");
    EXPECT_EQ(std::string(Previous.child_value("hash")).size(), 40u);
    EXPECT_STREQ(Doc.child("hashlist").child_value("comment"), "second pass");

    HashListVerification Verification = HashList::Verify(Second);
    EXPECT_TRUE(Verification.Success);
    EXPECT_EQ(Verification.Verified.size(), 1u);
}

TEST_F(HashListTest, RejectsUnsupportedAlgorithmsAndEmptyLists)
{
    HashListEntry Entry;
    Entry.RelativePath = "a.mov";
    Entry.DigestHex = "00";

    TransferError Error;
    EXPECT_FALSE(HashList::Write(Dir.Path("x.mhl"), { Entry }, ChecksumAlgorithm::BLAKE3, {}, "", Error));
    EXPECT_FALSE(HashList::Write(Dir.Path("x.mhl"), {}, ChecksumAlgorithm::MD5, {}, "", Error));
    EXPECT_EQ(Error.Kind, TransferErrorKind::NoFilesTransferred);
    EXPECT_FALSE(FS::exists(Dir.Path("x.mhl")));

    std::string ListPath;
    EXPECT_FALSE(HashList::WriteForDestination(Dir.Path("ssd"), {}, ChecksumAlgorithm::MD5, ChecksumAlgorithm::MD5, "card", ListPath, Error));
    EXPECT_FALSE(FS::exists(Dir.Path("ssd/MHL")));
}

TEST_F(HashListTest, UnreadableOrHostileListsNeverVerify)
{
    TestUtils::WriteFile(Dir.Path("broken.mhl"), "<hashlist><hash><file>a");
    HashListVerification Broken = HashList::Verify(Dir.Path("broken.mhl"));
    EXPECT_FALSE(Broken.Success);
    EXPECT_TRUE(Broken.Error.IsSet());

    TestUtils::WriteFile(Dir.Path("secret.wav"), "abc");
    TestUtils::WriteFile(Dir.Path("ssd/escape.mhl"),
        "<?xml version=\"1.0\"?><hashlist version=\"1.1\"><hash><file>../secret.wav</file><size>3</size>"
        "<md5>900150983cd24fb0d6963f7d28e17f72</md5></hash></hashlist>");
    HashListVerification Escape = HashList::Verify(Dir.Path("ssd/escape.mhl"));
    EXPECT_FALSE(Escape.Success);
    ASSERT_EQ(Escape.Invalid.size(), 1u);
    EXPECT_TRUE(Escape.Verified.empty());
}
