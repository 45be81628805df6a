#pragma once

#include <string>

// Hidden marker in a destination root that exists only while a job writes there.
// Finding one at job start means the previous run on that destination was interrupted.
namespace RunMarker
{
    std::string MarkerPath(const std::string& DestinationRoot);

    bool MarkInProgress(const std::string& DestinationRoot, const std::string& JobId);
    bool MarkComplete(const std::string& DestinationRoot);
    bool WasInterrupted(const std::string& DestinationRoot);
}
