#pragma once

#include "DSMeshFwd.h"
#include <filesystem>
#include <string>

namespace DS
{

// return path to the folder with user config file(s)
[[nodiscard]] DSMESH_API std::filesystem::path getUserConfigDir();

// returns path of config file in ~/.local/share/<appname>
[[nodiscard]] DSMESH_API std::filesystem::path getUserConfigFilePath();

// returns temp directory
[[nodiscard]] DSMESH_API std::filesystem::path GetTempDirectory();

// returns home directory
[[nodiscard]] DSMESH_API std::filesystem::path GetHomeDirectory();

// returns existing directories where the system and the user keep font files
[[nodiscard]] DSMESH_API std::vector<std::filesystem::path> getSystemFontDirectories();

// returns version of DuoSign
[[nodiscard]] DSMESH_API std::string GetDSVersionString();

/// Setups logger:
/// 1) makes stdout sink with info level (debug level if verbose)
/// 2) makes file sink (DSLog_*.txt in temp directory) with trace level
DSMESH_API void setupLoggerByDefault( bool verbose = false );

} // namespace DS
