#pragma once

#include "DSSignFwd.h"

#include <optional>
#include <string>

namespace Json
{
class Value;
}

namespace DS
{

/// all user inputs of one sign
struct SignParams
{
    /// UTF8-encoded text, lines are separated with '\n'
    std::string text = "LABEL";
    /// sign width in mm
    double width = 100.0;
    /// sign height in mm
    double height = 25.0;
    /// font family name or path to font file
    std::string fontFamily = "Arial";
    /// font size in mm, empty value means automatic size
    std::optional<double> fontSize;
    /// text weight in [0,100]
    int heaviness = 50;
    /// base layer thickness in mm
    double bottomThickness = 1.0;
    /// top layer thickness in mm
    double topThickness = 1.0;
    /// radius of plate corners in mm
    double cornerRadius = 2.0;
    /// compute font size from text and dimensions even if fontSize is given
    bool autoSize = false;

    /// true if the font size shall be computed
    [[nodiscard]] bool isAutoSize() const { return autoSize || !fontSize; }

    bool operator==( const SignParams& ) const = default;
};

/// writes params in the form of config defaults and presets ("text", "font", "width", ...)
DSSIGN_API void serializeToJson( const SignParams& params, Json::Value& root );
/// reads params, missing keys keep their current values
DSSIGN_API void deserializeFromJson( const Json::Value& root, SignParams& params );

} //namespace DS
