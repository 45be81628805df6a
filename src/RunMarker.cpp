#include "RunMarker.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>

namespace RunMarker
{
    std::string MarkerPath(const std::string& DestinationRoot)
    {
        return (std::filesystem::path(DestinationRoot) / ConfigGlobal::IncompleteMarkerName).string();
    }

    bool MarkInProgress(const std::string& DestinationRoot, const std::string& JobId)
    {
        std::error_code ec;
        std::filesystem::create_directories(DestinationRoot, ec);
        if (ec)
        {
            Log.Error("[RunMarker] Cannot create destination root " + DestinationRoot + ": " + ec.message());
            return false;
        }

        std::ofstream ofs(MarkerPath(DestinationRoot), std::ios::trunc);
        if (!ofs.good())
        {
            Log.Error("[RunMarker] Cannot write marker in " + DestinationRoot);
            return false;
        }
        ofs << "Job = " << JobId << "\n" << "Started = " << Logger::GetTimestampForFilename() << "\n";
        return ofs.good();
    }

    bool MarkComplete(const std::string& DestinationRoot)
    {
        std::error_code ec;
        std::filesystem::remove(MarkerPath(DestinationRoot), ec);
        if (ec)
        {
            Log.Error("[RunMarker] Cannot remove marker in " + DestinationRoot + ": " + ec.message());
            return false;
        }
        return true;
    }

    bool WasInterrupted(const std::string& DestinationRoot)
    {
        std::error_code ec;
        return std::filesystem::exists(MarkerPath(DestinationRoot), ec);
    }
}
