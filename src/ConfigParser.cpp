#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <stdexcept>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "FileHasher.hpp"
#include "HashList.hpp"

namespace FS = std::filesystem;

namespace
{
    std::string Trim(const std::string& Input)
    {
        std::string Value = Input;
        Value.erase(Value.begin(), std::find_if(Value.begin(), Value.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Value.erase(std::find_if(Value.rbegin(), Value.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Value.end());
        return Value;
    }
}

const std::vector<std::string>& ConfigParser::GetSources() const
{
    return Sources;
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Sources.clear();
    Errors.clear();
    Infos.clear();

    ConfigGlobal::InitializeDefaults();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::IsAbsolutePath(const std::string& Path)
{
    return !Path.empty() && Path[0] == '/';
}

bool ConfigParser::IsParentDirectory(const std::string& Parent, const std::string& Child)
{
    std::error_code ec;
    auto ParentAbs = FS::absolute(FS::path(Parent), ec).lexically_normal();
    if (ec)
    {
        return false;
    }
    auto ChildAbs = FS::absolute(FS::path(Child), ec).lexically_normal();
    if (ec)
    {
        return false;
    }

    auto ParentIt = ParentAbs.begin();
    auto ChildIt = ChildAbs.begin();
    for (; ParentIt != ParentAbs.end() && ChildIt != ChildAbs.end(); ++ParentIt, ++ChildIt)
    {
        // "/a/b/" iterates with a trailing empty element
        if (ParentIt->empty())
            break;
        if (*ParentIt != *ChildIt)
            return false;
    }
    return ParentIt == ParentAbs.end() || ParentIt->empty();
}

bool ConfigParser::ParseYesNo(const std::string& Key, const std::string& Value, int LineNumber, bool& Out)
{
    if (Value == "YES")
    {
        Out = true;
    }
    else if (Value == "NO")
    {
        Out = false;
    }
    else
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid Input for " + Key + ". Use 'YES' or 'NO'.");
        return false;
    }
    AddInfo(Key + (Out ? " Enabled" : " Disabled"));
    return true;
}

bool ConfigParser::ParseNumber(const std::string& Key, const std::string& Value, int LineNumber, unsigned long Min, unsigned long Max, unsigned long& Out)
{
    try
    {
        size_t Consumed = 0;
        if (!Value.empty() && Value[0] == '-')
        {
            throw std::invalid_argument("negative");
        }
        unsigned long ValueNum = std::stoul(Value, &Consumed);
        if (Consumed != Value.size() || ValueNum < Min || ValueNum > Max)
        {
            throw std::out_of_range("range");
        }
        Out = ValueNum;
        AddInfo(Key + " set to " + std::to_string(ValueNum));
        return true;
    }
    catch (const std::logic_error&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ". Select between " + std::to_string(Min) + " and " + std::to_string(Max));
        return false;
    }
}

std::vector<std::string> ConfigParser::SplitList(const std::string& Value)
{
    std::vector<std::string> Items;
    std::stringstream Stream(Value);
    std::string Item;
    while (std::getline(Stream, Item, ','))
    {
        Item = Trim(Item);
        if (!Item.empty() && std::find(Items.begin(), Items.end(), Item) == Items.end())
        {
            Items.push_back(Item);
        }
    }
    return Items;
}

void ConfigParser::AddSource(const std::string& Value, int LineNumber)
{
    if (!IsAbsolutePath(Value))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Source path is not absolute.");
        return;
    }
    FS::path SourcePath(Value);
    std::error_code ec;
    if (!FS::exists(SourcePath, ec))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Source path does not exist. " + ec.message());
        return;
    }
    if (!FS::is_directory(SourcePath, ec) && !FS::is_regular_file(SourcePath, ec))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Source path is neither a file nor a directory.");
        return;
    }

    if (std::find(Sources.begin(), Sources.end(), Value) != Sources.end())
    {
        AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate source path '" + Value + "'. Ignored.");
        return;
    }
    for (const auto& ExistingSource : Sources)
    {
        if (IsParentDirectory(ExistingSource, Value))
        {
            AddInfo("Line " + std::to_string(LineNumber) + ": Skipping source '" + Value + "' because parent directory '" + ExistingSource + "' is already added.");
            return;
        }
        if (IsParentDirectory(Value, ExistingSource)) //Files would be offloaded twice
        {
            AddInfo("Line " + std::to_string(LineNumber) + ": Skipping parent directory '" + Value + "' because '" + ExistingSource + "' is already added.");
            return;
        }
    }
    Sources.push_back(Value);
}

void ConfigParser::AddDestination(const std::string& Value, int LineNumber)
{
    if (!IsAbsolutePath(Value))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Destination path is not absolute.");
        return;
    }
    auto& Destinations = ConfigGlobal::DestinationPaths;
    if (std::find(Destinations.begin(), Destinations.end(), Value) != Destinations.end())
    {
        AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate destination path '" + Value + "'. Ignored.");
        return;
    }

    FS::path DestPath(Value);
    std::error_code ec;
    if (FS::exists(DestPath, ec))
    {
        if (!FS::is_directory(DestPath, ec))
        {
            AddError("Line " + std::to_string(LineNumber) + ": Destination path is not a directory.");
            return;
        }
    }
    else if (!FS::is_directory(DestPath.parent_path(), ec))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Destination path does not exist and neither does its parent.");
        return;
    }
    else
    {
        AddInfo("Line " + std::to_string(LineNumber) + ": Destination '" + Value + "' will be created.");
    }

    if (Destinations.empty())
    {
        AddInfo("Primary destination: " + Value);
    }
    Destinations.push_back(Value);
}

void ConfigParser::CheckSourceDestinationOverlap()
{
    for (const auto& Destination : ConfigGlobal::DestinationPaths)
    {
        std::error_code ec;
        FS::path DestAbs = FS::absolute(Destination, ec).lexically_normal();
        for (const auto& Source : Sources)
        {
            FS::path SourceAbs = FS::absolute(Source, ec).lexically_normal();
            if (SourceAbs == DestAbs)
            {
                AddError("Source path '" + Source + "' is the same as the destination path.");
            }
            else if (IsParentDirectory(SourceAbs.string(), DestAbs.string()))
            {
                AddError("Destination '" + DestAbs.string() + "' is inside source directory '" + SourceAbs.string() + "'. This is not allowed.");
            }
        }
    }
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    std::error_code ec;
    if (!FS::exists(FilePath, ec))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;
        Line = Trim(Line);

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        Key.erase(std::remove_if(Key.begin(), Key.end(), [](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        std::string Value = Trim(Line.substr(EqualPos + 1));

        unsigned long Number = 0;

        if (Key == "Source")
        {
            AddSource(Value, LineNumber);
        }

        else if (Key == "Destination")
        {
            AddDestination(Value, LineNumber);
        }

        else if (Key == "MediaExtensions")
        {
            if (Value == "*")
            {
                ConfigGlobal::MediaExtensions.clear();
                AddInfo("Extension filtering disabled, every file is offloaded.");
                continue;
            }
            std::vector<std::string> Extensions = SplitList(Value);
            if (Extensions.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": MediaExtensions is empty. Use '*' to offload every file.");
                continue;
            }
            ConfigGlobal::MediaExtensions = Extensions;
            AddInfo("MediaExtensions set to " + std::to_string(Extensions.size()) + " extensions");
        }

        else if (Key == "SkipFiles")
        {
            ConfigGlobal::HousekeepingFiles = SplitList(Value);
            AddInfo("SkipFiles set to " + std::to_string(ConfigGlobal::HousekeepingFiles.size()) + " names");
        }

        else if (Key == "ChecksumAlgorithm")
        {
            ChecksumAlgorithm Algorithm;
            if (!ParseChecksumAlgorithm(Value, Algorithm))
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid ChecksumAlgorithm. Use 'xxHash64', 'MD5', 'SHA1', 'BLAKE3' or 'SizeOnly'.");
                continue;
            }
            ConfigGlobal::ChecksumAlgorithm = ToString(Algorithm);
            if (Algorithm == ChecksumAlgorithm::SizeOnly)
            {
                AddInfo("IMPORTANT - ! ChecksumAlgorithm 'SizeOnly' compares byte counts only, content is NOT verified !");
            }
            else
            {
                AddInfo("ChecksumAlgorithm set to " + ConfigGlobal::ChecksumAlgorithm);
            }
        }

        else if (Key == "MaxConcurrentCopies")
        {
            if (ParseNumber(Key, Value, LineNumber, 1, 64, Number))
                ConfigGlobal::MaxConcurrentCopies = static_cast<unsigned short int>(Number);
        }

        else if (Key == "Cascade")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::CascadeEnabled);
        }

        else if (Key == "AlwaysVerify")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::AlwaysVerify);
        }

        else if (Key == "VerifyExisting")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::VerifyExisting);
        }

        else if (Key == "SkipExistingIdentical")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::SkipExistingIdentical);
        }

        else if (Key == "CreateHashList")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::CreateHashList);
        }

        else if (Key == "HashListAlgorithm")
        {
            ChecksumAlgorithm Algorithm;
            if (!ParseChecksumAlgorithm(Value, Algorithm) || !HashList::IsSupported(Algorithm))
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid HashListAlgorithm. Use 'MD5', 'SHA1' or 'xxHash64'.");
                continue;
            }
            ConfigGlobal::HashListAlgorithm = ToString(Algorithm);
        }

        else if (Key == "MaxReportedErrors")
        {
            if (ParseNumber(Key, Value, LineNumber, 1, 1000, Number))
                ConfigGlobal::MaxReportedErrors = static_cast<unsigned short int>(Number);
        }

        else if (Key == "BufferedCopyLimitMB")
        {
            if (ParseNumber(Key, Value, LineNumber, 0, 65535, Number))
                ConfigGlobal::BufferedCopyLimitMB = static_cast<uint32_t>(Number);
        }

        else if (Key == "MaxLogFiles")
        {
            if (ParseNumber(Key, Value, LineNumber, 1, 65535, Number))
                ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(Number);
        }

        else if (Key == "LogDir")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": LogDir is empty.");
                continue;
            }
            ConfigGlobal::LogDir = Value;
            AddInfo("LogDir set to " + Value);
        }

        else if (Key == "CapabilityStore")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": CapabilityStore is empty.");
                continue;
            }
            ConfigGlobal::CapabilityStoreFile = Value;
            AddInfo("CapabilityStore set to " + Value);
        }

        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
            continue;
        }
    }

    if (Sources.empty())
    {
        AddError("No source paths provided.");
    }

    if (ConfigGlobal::DestinationPaths.empty())
    {
        AddError("No destination path provided.");
    }
    else if (ConfigGlobal::CascadeEnabled && ConfigGlobal::DestinationPaths.size() < 2)
    {
        AddInfo("Cascade needs at least two destinations, copying without cascade.");
    }

    CheckSourceDestinationOverlap();

    return Errors.empty();  // Return false only if fatal errors present
}
