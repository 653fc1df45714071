#include "DSFontParams.h"
#include "DSMesh/DSStringConvert.h"

#include <algorithm>
#include <array>
#include <utility>

namespace DS
{

namespace
{

constexpr double cMinAutoFontSize = 5.0;
constexpr double cMaxAutoFontSize = 50.0;

constexpr std::array<std::pair<const char*, int>, 4> cHeavinessPresets =
{ {
    { "Light", 15 },
    { "Regular", 50 },
    { "Bold", 75 },
    { "Extra Bold", 90 }
} };

} //anonymous namespace

const char* asString( FontStyle style )
{
    switch ( style )
    {
    case FontStyle::Light:
        return "Light";
    case FontStyle::Regular:
        return "Regular";
    case FontStyle::Bold:
        return "Bold";
    case FontStyle::ExtraBold:
        return "ExtraBold";
    }
    return "Regular";
}

FontParams calcFontParams( int heaviness, const std::string& fontFamily )
{
    FontParams res;
    res.fontFamily = fontFamily;
    const int h = std::clamp( heaviness, 0, 100 );
    int rangeStart = 0;
    if ( h <= 25 )
    {
        res.sizeMultiplier = 0.90;
        res.style = FontStyle::Light;
    }
    else if ( h <= 50 )
    {
        res.sizeMultiplier = 1.00;
        res.style = FontStyle::Regular;
        rangeStart = 25;
    }
    else if ( h <= 75 )
    {
        res.sizeMultiplier = 1.15;
        res.style = FontStyle::Bold;
        rangeStart = 50;
    }
    else
    {
        res.sizeMultiplier = 1.30;
        res.style = FontStyle::ExtraBold;
        rangeStart = 75;
    }

    // fine tuning inside the range, the upper end of the range gets the full addition
    const double rangePos = double( h - rangeStart ) / 25.0;
    res.sizeMultiplier += rangePos * 0.05;
    return res;
}

std::string weightLabel( int heaviness )
{
    if ( heaviness <= 25 )
        return "light";
    if ( heaviness <= 50 )
        return "regular";
    if ( heaviness <= 75 )
        return "bold";
    return "extrabold";
}

std::string heavinessPresetName( int heaviness )
{
    if ( heaviness <= 25 )
        return "Light";
    if ( heaviness <= 50 )
        return "Regular";
    if ( heaviness <= 75 )
        return "Bold";
    return "Extra Bold";
}

std::optional<int> heavinessFromPreset( const std::string& presetName )
{
    for ( const auto& [name, value] : cHeavinessPresets )
        if ( presetName == name )
            return value;
    return {};
}

double fontWidthFactor( const std::string& fontFamily )
{
    static const std::array<std::pair<const char*, double>, 9> cFontWidths =
    { {
        { "Impact", 0.45 },
        { "Arial", 0.55 },
        { "Arial Black", 0.65 },
        { "Helvetica", 0.55 },
        { "Verdana", 0.65 },
        { "Tahoma", 0.60 },
        { "Trebuchet MS", 0.58 },
        { "Gill Sans", 0.52 },
        { "Futura", 0.60 }
    } };
    for ( const auto& [family, factor] : cFontWidths )
        if ( fontFamily == family )
            return factor;
    return 0.55;
}

double calcAutoFontSize( const std::string& text, double width, double height,
    const std::string& fontFamily, int heaviness )
{
    const double widthFactor = fontWidthFactor( fontFamily ) + heaviness / 100.0 * 0.15;

    size_t longestLine = 0;
    const auto lines = split( text, '\n' );
    for ( const auto& line : lines )
        longestLine = std::max( longestLine, utf8Length( line ) );

    const double maxTextWidth = width * 0.75;
    const double sizeByWidth = longestLine > 0 ? maxTextWidth / ( double( longestLine ) * widthFactor ) : cMaxAutoFontSize;
    const double sizeByHeight = height * 0.6 / double( std::max<size_t>( lines.size(), 1 ) );

    return std::clamp( std::min( sizeByWidth, sizeByHeight ), cMinAutoFontSize, cMaxAutoFontSize );
}

} //namespace DS
