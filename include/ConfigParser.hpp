#pragma once

#include <string>
#include <vector>

// Reads "Key = Value" lines into ConfigGlobal. Problems are collected per line;
// Parse returns false only when at least one error was recorded.
class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    const std::vector<std::string>& GetSources() const;
    void Reset();

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool IsAbsolutePath(const std::string& Path);
    bool IsParentDirectory(const std::string& Parent, const std::string& Child);

    bool ParseYesNo(const std::string& Key, const std::string& Value, int LineNumber, bool& Out);
    bool ParseNumber(const std::string& Key, const std::string& Value, int LineNumber, unsigned long Min, unsigned long Max, unsigned long& Out);
    static std::vector<std::string> SplitList(const std::string& Value);

    void AddSource(const std::string& Value, int LineNumber);
    void AddDestination(const std::string& Value, int LineNumber);
    void CheckSourceDestinationOverlap();

    std::vector<std::string> Sources;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
