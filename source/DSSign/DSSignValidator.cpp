#include "DSSignValidator.h"
#include "DSMesh/DSStringConvert.h"
#include "DSPch/DSFmt.h"

#include <algorithm>
#include <cmath>

namespace DS
{

namespace
{

// non-ASCII characters present in common fonts
const std::u32string cSafeAccentedChars = U"äöüÄÖÜßéèêëàâçñ";

std::string formatNumber( double v, bool floatingPoint )
{
    if ( floatingPoint && std::isfinite( v ) && v == std::floor( v ) )
        return fmt::format( "{:.1f}", v );
    return fmt::format( "{}", v );
}

std::string join( const std::vector<std::string>& parts, const char* sep )
{
    std::string res;
    for ( const auto& p : parts )
    {
        if ( !res.empty() )
            res += sep;
        res += p;
    }
    return res;
}

} //anonymous namespace

std::string formatRange( double min, double max, bool floatingPoint )
{
    return formatNumber( min, floatingPoint ) + "-" + formatNumber( max, floatingPoint );
}

Expected<std::string> SignValidator::validateDimensions( double width, double height ) const
{
    std::vector<std::string> errors;
    if ( !( ranges_.widthMin <= width && width <= ranges_.widthMax ) )
        errors.push_back( fmt::format( "Width must be between {}mm", formatRange( ranges_.widthMin, ranges_.widthMax ) ) );
    if ( !( ranges_.heightMin <= height && height <= ranges_.heightMax ) )
        errors.push_back( fmt::format( "Height must be between {}mm", formatRange( ranges_.heightMin, ranges_.heightMax ) ) );

    if ( width > 0 && height > 0 )
    {
        const double aspectRatio = width / height;
        if ( aspectRatio > 20 || aspectRatio < 0.05 )
            errors.push_back( fmt::format( "Unusual aspect ratio ({:.1f}:1)", aspectRatio ) );
    }

    if ( !errors.empty() )
        return unexpected( join( errors, "; " ) );
    return std::string{};
}

Expected<std::string> SignValidator::validateText( const std::string& text ) const
{
    if ( trim( text ).empty() )
        return unexpected( std::string( "Text cannot be empty" ) );

    const auto codePoints = utf8ToCodePoints( text );
    if ( codePoints.size() > size_t( std::max( ranges_.maxTextLength, 0 ) ) )
        return unexpected( fmt::format( "Text too long (max {} characters)", ranges_.maxTextLength ) );

    std::u32string problematic;
    for ( char32_t c : codePoints )
    {
        if ( c <= 127 || cSafeAccentedChars.find( c ) != std::u32string::npos )
            continue;
        if ( problematic.find( c ) == std::u32string::npos )
            problematic.push_back( c );
    }
    if ( problematic.empty() )
        return std::string{};

    std::vector<std::string> chars;
    for ( char32_t c : problematic )
        chars.push_back( codePointsToUtf8( std::u32string( 1, c ) ) );
    return fmt::format( "Warning: Special characters may not render correctly: {}", join( chars, ", " ) );
}

Expected<std::string> SignValidator::validateFontSize( double fontSize, const std::string& text, double width, bool autoSize ) const
{
    if ( autoSize )
        return std::string{};

    if ( !( ranges_.fontSizeMin <= fontSize && fontSize <= ranges_.fontSizeMax ) )
        return unexpected( fmt::format( "Font size must be between {}mm", formatRange( ranges_.fontSizeMin, ranges_.fontSizeMax ) ) );

    const double avgCharWidth = fontSize * 0.6;
    const double estimatedTextWidth = double( utf8Length( text ) ) * avgCharWidth;
    if ( estimatedTextWidth > width * 1.2 )
        return unexpected( fmt::format( "Text likely too wide for sign (estimated {:.0f}mm, sign width {:.0f}mm)", estimatedTextWidth, width ) );

    return std::string{};
}

Expected<std::string> SignValidator::validateThickness( double bottom, double top ) const
{
    std::vector<std::string> errors;
    const auto range = formatRange( ranges_.thicknessMin, ranges_.thicknessMax, true );
    if ( !( ranges_.thicknessMin <= bottom && bottom <= ranges_.thicknessMax ) )
        errors.push_back( fmt::format( "Bottom thickness must be between {}mm", range ) );
    if ( !( ranges_.thicknessMin <= top && top <= ranges_.thicknessMax ) )
        errors.push_back( fmt::format( "Top thickness must be between {}mm", range ) );

    const double total = bottom + top;
    if ( total > 10 )
        errors.push_back( fmt::format( "Total thickness {:.1f}mm may be excessive", total ) );

    if ( !errors.empty() )
        return unexpected( join( errors, "; " ) );
    return std::string{};
}

Expected<std::string> SignValidator::validateHeaviness( int heaviness, double fontSize, double topThickness ) const
{
    if ( heaviness < 0 || heaviness > 100 )
        return unexpected( std::string( "Heaviness must be between 0-100" ) );

    std::vector<std::string> warnings;
    if ( heaviness > 75 && fontSize > 20 && topThickness < 1.5 )
        warnings.push_back( "Heavy text with large font may cut through thin top layer" );
    if ( heaviness > 90 && topThickness < 2.0 )
        warnings.push_back( "Extra bold text may require thicker top layer" );

    return join( warnings, "; " );
}

ValidationReport SignValidator::preValidateAll( const std::string& text, double width, double height,
    double fontSize, int heaviness, double bottomThickness, double topThickness, bool autoSize ) const
{
    ValidationReport report;
    auto collect = [&report] ( const Expected<std::string>& res )
    {
        if ( !res )
            report.errors.push_back( res.error() );
        else if ( !res->empty() )
            report.warnings.push_back( *res );
    };

    collect( validateText( text ) );
    collect( validateDimensions( width, height ) );
    collect( validateFontSize( fontSize, text, width, autoSize ) );
    collect( validateThickness( bottomThickness, topThickness ) );
    collect( validateHeaviness( heaviness, fontSize, topThickness ) );

    report.valid = report.errors.empty();
    return report;
}

double SignValidator::estimateCutArea( const std::string& text, double fontSize, int heaviness ) const
{
    const double charArea = ( fontSize * 0.7 ) * ( fontSize * 0.9 );
    const double heavinessFactor = 1.0 + heaviness / 100.0 * 0.5;
    return double( utf8Length( text ) ) * charArea * heavinessFactor;
}

CutThroughEstimate SignValidator::willTextCutThrough( const std::string& text, double fontSize, int heaviness,
    double signWidth, double signHeight, double topThickness ) const
{
    const double cutArea = estimateCutArea( text, fontSize, heaviness );
    const double signArea = signWidth * signHeight;
    const double coverageRatio = signArea > 0 ? cutArea / signArea : 1.0;

    int riskScore = 0;
    if ( coverageRatio > 0.7 )
        riskScore += 40;
    if ( heaviness > 80 )
        riskScore += 20;
    if ( fontSize > signHeight * 0.8 )
        riskScore += 20;
    if ( topThickness < 1.0 )
        riskScore += 20;
    // bold text is cut with several offsets
    if ( heaviness > 75 )
        riskScore += 10;

    CutThroughEstimate res;
    res.willCut = riskScore >= 60;
    res.confidence = std::min( riskScore, 100 );
    return res;
}

SuggestedParams SignValidator::suggestParameters( const std::string& text, double width, double height ) const
{
    const size_t textLength = utf8Length( text );
    const double len = double( std::max<size_t>( textLength, 1 ) );

    double font = 0;
    if ( textLength <= 5 )
        font = std::min( height * 0.6, width / ( len * 0.8 ) );
    else if ( textLength <= 10 )
        font = std::min( height * 0.5, width / ( len * 0.7 ) );
    else
        font = std::min( height * 0.4, width / ( len * 0.6 ) );
    font = std::max( ranges_.fontSizeMin, std::min( font, ranges_.fontSizeMax ) );

    SuggestedParams res;
    res.fontSize = roundToPrecision( font, 1 );
    res.heaviness = 50;
    res.bottomThickness = 1.0;
    res.topThickness = font > height * 0.5 ? 1.5 : 1.0;
    res.autoSize = textLength > 15;
    return res;
}

} //namespace DS
