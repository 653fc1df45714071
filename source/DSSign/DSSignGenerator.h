#pragma once

#include "DSSignFwd.h"
#include "DSSignError.h"
#include "DSSignParams.h"
#include "DSFontParams.h"
#include "DSSignValidator.h"
#include "DSMesh/DSTriMesh.h"
#include "DSSymbolMesh/DSFontFinder.h"

#include <filesystem>
#include <string>
#include <vector>

namespace DS
{

/// solids of the sign and data used to build them
struct GeneratedSign
{
    /// base plate printed in the first color
    TriMesh base;
    /// top plate with the text cut out printed in the second color
    TriMesh top;
    /// union of base and top for preview
    TriMesh combined;

    SignParams params;
    /// font size before heaviness adjustment, mm
    double fontSize = 0;
    FontParams fontParams;
    /// font file used for glyphs
    FontInfo font;

    /// plate outline centered at the origin
    Contour2d plate;
    /// glyph outlines and counters centered on the plate
    Contours2d glyphs;
};

/// one output file of the sign
enum class SignLayer
{
    Base,
    Top,
    Combined
};

/// returns "base", "top" or "combined"
[[nodiscard]] DSSIGN_API const char* asString( SignLayer layer );

/// returns "bottom_black", "top_yellow" or "combined_preview"
[[nodiscard]] DSSIGN_API const char* fileSuffix( SignLayer layer );

struct SignGeneratorSettings
{
    /// directory for STL files, created on export if absent
    std::filesystem::path outputDir = "output";
    ValidationRanges ranges;
    /// use similar or common font families if the requested one is not installed
    bool allowFontFallback = true;
    /// write textual STL instead of binary one
    bool asciiStl = false;
    /// segments approximating each rounded corner of the plate
    int cornerSegments = 8;
    /// segments approximating each Bezier curve of glyph outlines
    int fontDetalization = 5;
};

/// builds two-layer sign solids from text and exports them to STL
class DSSIGN_CLASS SignGenerator
{
public:
    DSSIGN_API explicit SignGenerator( SignGeneratorSettings settings = {} );

    const SignGeneratorSettings& settings() const { return settings_; }
    const SignValidator& validator() const { return validator_; }
    const std::filesystem::path& outputDir() const { return settings_.outputDir; }

    /// validates the parameters if requested, computes the font size, builds glyph contours and all three solids
    [[nodiscard]] DSSIGN_API SignExpected<GeneratedSign> generate( const SignParams& params, bool validate = true ) const;

    /// saves the solids to {sanitized base name}_{weight}_{suffix}.stl files in the output directory;
    /// returns paths of created files
    [[nodiscard]] DSSIGN_API SignExpected<std::vector<std::filesystem::path>> exportStl( const GeneratedSign& sign,
        const std::string& baseName, int heaviness ) const;

    /// returns the path of STL file of given layer
    [[nodiscard]] DSSIGN_API std::filesystem::path stlPath( const std::string& baseName, int heaviness, SignLayer layer ) const;

    /// keeps ASCII letters, digits, spaces, '-' and '_', replaces other characters with '_',
    /// cuts to 30 characters, trims spaces and replaces remaining spaces with '_'; returns "sign" for empty result
    [[nodiscard]] DSSIGN_API static std::string sanitizeFilename( const std::string& text );

private:
    SignExpected<void> validate_( const SignParams& params ) const;
    SignExpected<void> placeText_( GeneratedSign& sign ) const;
    SignExpected<void> exportLayer_( const TriMesh& mesh, const std::filesystem::path& path, SignLayer layer ) const;

    SignGeneratorSettings settings_;
    SignValidator validator_;
};

} //namespace DS
