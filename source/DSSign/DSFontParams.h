#pragma once

#include "DSSignFwd.h"

#include <optional>
#include <string>

namespace DS
{

enum class FontStyle
{
    Light,
    Regular,
    Bold,
    ExtraBold
};

/// returns "Light", "Regular", "Bold" or "ExtraBold"
[[nodiscard]] DSSIGN_API const char* asString( FontStyle style );

/// text adjustments simulating font boldness
struct FontParams
{
    std::string fontFamily;
    /// multiplier of the font size
    double sizeMultiplier = 1.0;
    /// offset of glyph outlines in mm, positive value makes glyphs bolder
    double strokeOffset = 0.0;
    /// multiplier of the cut depth relative to the top layer thickness
    double cutDepthMultiplier = 1.0;
    FontStyle style = FontStyle::Regular;
};

/// maps heaviness in [0,100] on font adjustments:
/// <=25 Light (0.90), <=50 Regular (1.00), <=75 Bold (1.15), otherwise ExtraBold (1.30),
/// and the position inside the range adds up to 0.05 to size multiplier
[[nodiscard]] DSSIGN_API FontParams calcFontParams( int heaviness, const std::string& fontFamily );

/// returns "light", "regular", "bold" or "extrabold" used in file names
[[nodiscard]] DSSIGN_API std::string weightLabel( int heaviness );

/// returns "Light", "Regular", "Bold" or "Extra Bold" shown near heaviness slider
[[nodiscard]] DSSIGN_API std::string heavinessPresetName( int heaviness );

/// returns heaviness of named preset: Light 15, Regular 50, Bold 75, Extra Bold 90
[[nodiscard]] DSSIGN_API std::optional<int> heavinessFromPreset( const std::string& presetName );

/// returns average width of a character relative to font size for known families, 0.55 for others
[[nodiscard]] DSSIGN_API double fontWidthFactor( const std::string& fontFamily );

/// estimates the font size (mm) fitting the text in 75% of the width and 60% of the height, clamped to [5,50];
/// multi-line text is fitted by its longest line and the height is shared between the lines
[[nodiscard]] DSSIGN_API double calcAutoFontSize( const std::string& text, double width, double height,
    const std::string& fontFamily, int heaviness );

} //namespace DS
