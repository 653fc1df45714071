#pragma once

#include "DSSignFwd.h"
#include "DSMesh/DSExpected.h"

#include <string>
#include <vector>

namespace DS
{

/// limits of sign parameters
struct ValidationRanges
{
    double widthMin = 10;
    double widthMax = 500;
    double heightMin = 5;
    double heightMax = 200;
    double fontSizeMin = 5;
    double fontSizeMax = 50;
    double thicknessMin = 0.2;
    double thicknessMax = 5.0;
    /// maximal number of characters in the text
    int maxTextLength = 100;

    bool operator==( const ValidationRanges& ) const = default;
};

/// result of all checks
struct ValidationReport
{
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/// prediction whether the text cutout removes all material of the top layer
struct CutThroughEstimate
{
    bool willCut = false;
    /// in [0,100]
    int confidence = 0;
};

/// parameters recommended for given text and dimensions
struct SuggestedParams
{
    double fontSize = 16;
    int heaviness = 50;
    double bottomThickness = 1.0;
    double topThickness = 1.0;
    bool autoSize = false;
};

/// checks sign parameters before generation;
/// each check returns an error, or a warning (empty string if none)
class DSSIGN_CLASS SignValidator
{
public:
    SignValidator() = default;
    explicit SignValidator( const ValidationRanges& ranges ) : ranges_( ranges ) {}

    const ValidationRanges& ranges() const { return ranges_; }

    /// checks width, height and their ratio
    [[nodiscard]] DSSIGN_API Expected<std::string> validateDimensions( double width, double height ) const;

    /// checks that text is not empty and not too long, warns about characters that fonts may lack
    [[nodiscard]] DSSIGN_API Expected<std::string> validateText( const std::string& text ) const;

    /// checks font size range and estimated text width, nothing is checked for automatic size
    [[nodiscard]] DSSIGN_API Expected<std::string> validateFontSize( double fontSize, const std::string& text, double width, bool autoSize = false ) const;

    /// checks both layer thicknesses and their sum
    [[nodiscard]] DSSIGN_API Expected<std::string> validateThickness( double bottom, double top ) const;

    /// checks heaviness range, warns about heavy text on thin top layer
    [[nodiscard]] DSSIGN_API Expected<std::string> validateHeaviness( int heaviness, double fontSize, double topThickness ) const;

    /// runs all checks in order: text, dimensions, font size, thickness, heaviness
    [[nodiscard]] DSSIGN_API ValidationReport preValidateAll( const std::string& text, double width, double height,
        double fontSize, int heaviness, double bottomThickness, double topThickness, bool autoSize = false ) const;

    /// rough area (mm^2) removed from the top layer by the text
    [[nodiscard]] DSSIGN_API double estimateCutArea( const std::string& text, double fontSize, int heaviness ) const;

    /// scores the risk of cutting all material of the top layer
    [[nodiscard]] DSSIGN_API CutThroughEstimate willTextCutThrough( const std::string& text, double fontSize, int heaviness,
        double signWidth, double signHeight, double topThickness ) const;

    /// recommends font size, heaviness and thicknesses
    [[nodiscard]] DSSIGN_API SuggestedParams suggestParameters( const std::string& text, double width, double height ) const;

private:
    ValidationRanges ranges_;
};

/// formats the range as "10-500" or "0.2-5.0" (floating-point ranges keep at least one decimal)
[[nodiscard]] DSSIGN_API std::string formatRange( double min, double max, bool floatingPoint = false );

} //namespace DS
