#include "HashList.hpp"
#include "CopyOrchestrator.hpp"
#include "FileCopier.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <pugixml.hpp>

#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace FS = std::filesystem;

namespace
{
    constexpr const char* CreatorName = "CardOffload";
    constexpr const char* CreatorVersion = "1.0.0";
    constexpr const char* ListExtension = ".mhl";

    const ChecksumAlgorithm ListAlgorithms[] = { ChecksumAlgorithm::MD5, ChecksumAlgorithm::SHA1, ChecksumAlgorithm::XXHash64 };

    std::string Lowercase(std::string Value)
    {
        std::transform(Value.begin(), Value.end(), Value.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Value;
    }

    // Earlier lists in the folder, oldest name first
    std::vector<std::string> ExistingLists(const FS::path& Folder)
    {
        std::vector<std::string> Lists;
        std::error_code ec;
        for (FS::directory_iterator It(Folder, ec), End; !ec && It != End; It.increment(ec))
        {
            if (It->is_regular_file(ec) && Lowercase(It->path().extension().string()) == ListExtension)
            {
                Lists.push_back(It->path().string());
            }
        }
        std::sort(Lists.begin(), Lists.end());
        return Lists;
    }

    std::string ListNameFor(const std::string& SourceName)
    {
        std::string Name = SourceName;
        std::replace_if(Name.begin(), Name.end(), [](char Ch) { return Ch == '/' || Ch == ' '; }, '_');
        return Name.empty() ? std::string("Offload") : Name;
    }
}

bool HashList::IsSupported(ChecksumAlgorithm Algorithm)
{
    return ElementName(Algorithm) != nullptr;
}

const char* HashList::ElementName(ChecksumAlgorithm Algorithm)
{
    switch (Algorithm)
    {
    case ChecksumAlgorithm::MD5:      return "md5";
    case ChecksumAlgorithm::SHA1:     return "sha1";
    case ChecksumAlgorithm::XXHash64: return "xxh64";
    default:                          return nullptr;
    }
}

bool HashList::Write(const std::string& ListPath, const std::vector<HashListEntry>& Entries, ChecksumAlgorithm Algorithm,
    const std::vector<std::string>& PreviousLists, const std::string& Comment, TransferError& Error)
{
    const char* DigestElement = ElementName(Algorithm);
    if (DigestElement == nullptr)
    {
        Error = TransferError(TransferErrorKind::IOFailure, ListPath, "hash lists support MD5, SHA1 and xxHash64, not " + ToString(Algorithm));
        return false;
    }
    if (Entries.empty())
    {
        Error = TransferError(TransferErrorKind::NoFilesTransferred, ListPath, "no files to list");
        return false;
    }

    pugi::xml_document Doc;
    pugi::xml_node Declaration = Doc.append_child(pugi::node_declaration);
    Declaration.append_attribute("version") = "1.0";
    Declaration.append_attribute("encoding") = "UTF-8";

    pugi::xml_node Root = Doc.append_child("hashlist");
    Root.append_attribute("version") = Version;

    pugi::xml_node Creator = Root.append_child("creatorinfo");
    Creator.append_child("name").text().set(CreatorName);
    Creator.append_child("version").text().set(CreatorVersion);
    Creator.append_child("datetime").text().set(FormatIsoUtc(std::time(nullptr)).c_str());

    if (!Comment.empty())
    {
        Root.append_child("comment").text().set(Comment.c_str());
    }

    if (!PreviousLists.empty())
    {
        pugi::xml_node History = Root.append_child("history");
        for (const auto& Previous : PreviousLists)
        {
            ChecksumResult Sum;
            TransferError HashError;
            if (!FileHasher::Digest(Previous, ChecksumAlgorithm::SHA1, Sum, HashError))
            {
                Log.Error("[HashList] Previous list left out of history: " + HashError.Describe());
                continue;
            }
            pugi::xml_node Entry = History.append_child("hashlist");
            Entry.append_child("path").text().set(FS::path(Previous).filename().string().c_str());
            pugi::xml_node Hash = Entry.append_child("hash");
            Hash.append_attribute("alg") = "sha1";
            Hash.text().set(Sum.DigestHex.c_str());
        }
    }

    for (const auto& Entry : Entries)
    {
        pugi::xml_node Hash = Root.append_child("hash");
        Hash.append_child("file").text().set(Entry.RelativePath.c_str());
        Hash.append_child("size").text().set(static_cast<unsigned long long>(Entry.Size));
        Hash.append_child(DigestElement).text().set(Entry.DigestHex.c_str());
        Hash.append_child("lastmodificationdate").text().set(FormatIsoUtc(Entry.ModifiedTime).c_str());
    }

    const std::string TempPath = ListPath + ".tmp";
    if (!Doc.save_file(TempPath.c_str(), "    ", pugi::format_default, pugi::encoding_utf8))
    {
        Error = TransferError(TransferErrorKind::IOFailure, TempPath, "could not write hash list");
        Log.Error("[HashList] " + Error.Describe());
        return false;
    }

    std::error_code ec;
    FS::rename(TempPath, ListPath, ec);
    if (ec)
    {
        Error = TransferError(TransferErrorKind::IOFailure, ListPath, ec.message());
        Log.Error("[HashList] Failed to move hash list into place: " + Error.Describe());
        FS::remove(TempPath, ec);
        return false;
    }

    Log.Info("[HashList] Wrote " + std::to_string(Entries.size()) + " entries to " + ListPath);
    return true;
}

bool HashList::WriteForDestination(const std::string& DestinationRoot, const std::vector<FileTransferRecord>& Records,
    ChecksumAlgorithm RecordAlgorithm, ChecksumAlgorithm ListAlgorithm, const std::string& SourceName,
    std::string& ListPath, TransferError& Error)
{
    if (!IsSupported(ListAlgorithm))
    {
        Error = TransferError(TransferErrorKind::IOFailure, DestinationRoot, "hash lists support MD5, SHA1 and xxHash64, not " + ToString(ListAlgorithm));
        return false;
    }

    std::vector<HashListEntry> Entries;
    for (const auto& Record : Records)
    {
        if (Record.DestinationRoot != DestinationRoot)
        {
            continue;
        }

        struct stat St;
        if (stat(Record.DestinationPath.c_str(), &St) != 0)
        {
            Error = TransferError(TransferErrorKind::IOFailure, Record.DestinationPath, std::strerror(errno));
            Log.Error("[HashList] Listed file is gone: " + Error.Describe());
            return false;
        }

        HashListEntry Entry;
        Entry.RelativePath = FS::path(Record.RelativePath).generic_string();
        Entry.Size = static_cast<uint64_t>(St.st_size);
        Entry.ModifiedTime = St.st_mtime;

        if (RecordAlgorithm == ListAlgorithm && !Record.ChecksumHex.empty())
        {
            Entry.DigestHex = Record.ChecksumHex;
        }
        else
        {
            ChecksumResult Sum;
            if (!FileHasher::Digest(Record.DestinationPath, ListAlgorithm, Sum, Error))
            {
                Log.Error("[HashList] " + Error.Describe());
                return false;
            }
            Entry.DigestHex = Sum.DigestHex;
        }
        Entries.push_back(std::move(Entry));
    }

    if (Entries.empty())
    {
        Error = TransferError(TransferErrorKind::NoFilesTransferred, DestinationRoot, "no files to list");
        return false;
    }
    std::sort(Entries.begin(), Entries.end(), [](const HashListEntry& A, const HashListEntry& B) { return A.RelativePath < B.RelativePath; });

    const FS::path Folder = FS::path(DestinationRoot) / DirectoryName;
    std::error_code ec;
    FS::create_directories(Folder, ec);
    if (ec)
    {
        Error = TransferError(TransferErrorKind::DestinationNotWritable, Folder.string(), ec.message());
        Log.Error("[HashList] Failed to create hash list folder: " + Error.Describe());
        return false;
    }

    const std::vector<std::string> Previous = ExistingLists(Folder);

    const std::string Stem = ListNameFor(SourceName) + "_" + Logger::GetTimestampForFilename();
    FS::path Candidate = Folder / (Stem + ListExtension);
    for (int Suffix = 2; FS::exists(Candidate, ec); ++Suffix)
    {
        Candidate = Folder / (Stem + "_" + std::to_string(Suffix) + ListExtension);
    }

    ListPath = Candidate.string();
    return Write(ListPath, Entries, ListAlgorithm, Previous, "Offload of " + SourceName, Error);
}

std::string HashList::DefaultBasePath(const std::string& ListPath)
{
    const FS::path Folder = FS::path(ListPath).parent_path();
    if (Folder.filename() == DirectoryName)
    {
        return Folder.parent_path().string();
    }
    return Folder.string();
}

HashListVerification HashList::Verify(const std::string& ListPath, const std::string& BasePath)
{
    HashListVerification Out;

    pugi::xml_document Doc;
    const pugi::xml_parse_result Parsed = Doc.load_file(ListPath.c_str());
    if (!Parsed)
    {
        Out.Error = TransferError(TransferErrorKind::IOFailure, ListPath, Parsed.description());
        Out.Message = "Failed to parse hash list";
        Log.Error("[HashList] " + Out.Message + ": " + Out.Error.Describe());
        return Out;
    }

    const pugi::xml_node Root = Doc.child("hashlist");
    if (!Root)
    {
        Out.Error = TransferError(TransferErrorKind::IOFailure, ListPath, "no hashlist element");
        Out.Message = "Failed to parse hash list";
        Log.Error("[HashList] " + Out.Message + ": " + Out.Error.Describe());
        return Out;
    }

    const std::string Base = BasePath.empty() ? DefaultBasePath(ListPath) : BasePath;

    for (const pugi::xml_node Hash : Root.children("hash"))
    {
        const std::string File = Hash.child_value("file");

        ChecksumAlgorithm Algorithm = ChecksumAlgorithm::MD5;
        std::string Stored;
        for (ChecksumAlgorithm Candidate : ListAlgorithms)
        {
            const pugi::xml_node Digest = Hash.child(ElementName(Candidate));
            if (Digest)
            {
                Algorithm = Candidate;
                Stored = Lowercase(Digest.text().get());
                break;
            }
        }
        if (File.empty() || Stored.empty())
        {
            Log.Info("[HashList] Entry without a file or a digest ignored in " + ListPath);
            continue;
        }

        const std::string FilePath = FileCopier::DestinationPathFor(Base, File);
        if (FilePath.empty())
        {
            Out.Invalid.push_back(File);
            continue;
        }

        std::error_code ec;
        if (!FS::is_regular_file(FilePath, ec))
        {
            Out.Missing.push_back(FilePath);
            continue;
        }

        const pugi::xml_node SizeNode = Hash.child("size");
        if (SizeNode && FS::file_size(FilePath, ec) != SizeNode.text().as_ullong())
        {
            Out.Invalid.push_back(FilePath);
            continue;
        }

        ChecksumResult Current;
        TransferError HashError;
        if (!FileHasher::Digest(FilePath, Algorithm, Current, HashError) || Current.DigestHex != Stored)
        {
            Out.Invalid.push_back(FilePath);
            continue;
        }
        Out.Verified.push_back(FilePath);
    }

    Out.Success = Out.Invalid.empty() && !Out.Verified.empty();
    Out.Message = Out.Success ? "All files verified successfully" : "Verification failed";

    const std::string Summary = "[HashList] " + ListPath + ": " + std::to_string(Out.Verified.size()) + " verified, "
        + std::to_string(Out.Missing.size()) + " missing, " + std::to_string(Out.Invalid.size()) + " invalid";
    if (Out.Success)
        Log.Info(Summary);
    else
        Log.Error(Summary);
    return Out;
}
