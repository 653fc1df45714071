#pragma once

#include "DSSignFwd.h"
#include "DSSignParams.h"
#include "DSSignValidator.h"
#include "DSMesh/DSVector2.h"

#include <optional>
#include <string>
#include <vector>

namespace Json
{
class Value;
}

namespace DS
{

/// name of the application, gives the name of config directory
inline constexpr const char* cSignAppName = "DuoSign";

/// size and placement of the main window
struct WindowGeometry
{
    Vector2i size{ 1100, 820 };
    Vector2i minSize{ 1000, 750 };
    /// empty if the window was never placed by the user
    std::optional<Vector2i> position;
    bool resizable = true;
};

/// returns config used when the file is missing or lacks some keys:
/// window, defaults, output, advanced, validation, recent_files, favorite_fonts, presets
[[nodiscard]] DSSIGN_API Json::Value getDefaultSignConfig();

/// installs default sign config in given config, current values are merged over the defaults
DSSIGN_API void setupSignConfigDefaults( Config& config );

/// reads "defaults" section
[[nodiscard]] DSSIGN_API SignParams loadDefaultParams( const Config& config );
/// writes "defaults" section
DSSIGN_API void saveDefaultParams( Config& config, const SignParams& params );

/// reads "validation" section and advanced.max_text_length
[[nodiscard]] DSSIGN_API ValidationRanges loadValidationRanges( const Config& config );

/// reads "window" section; a stored size below the minimal one is enlarged
[[nodiscard]] DSSIGN_API WindowGeometry loadWindowGeometry( const Config& config );
/// writes window.size, window.width, window.height and window.position (if any)
DSSIGN_API void saveWindowGeometry( Config& config, const WindowGeometry& geometry );

/// returns output.directory
[[nodiscard]] DSSIGN_API std::string getOutputDirectory( const Config& config );

/// returns favorite_fonts
[[nodiscard]] DSSIGN_API std::vector<std::string> getFavoriteFonts( const Config& config );

} //namespace DS
