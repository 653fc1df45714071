#include "DSSignPreview.h"
#include "DSSignGenerator.h"
#include "DSFontParams.h"
#include "DSMesh/DSStringConvert.h"
#include "DSPch/DSFmt.h"

#include <algorithm>
#include <cmath>

namespace DS
{

namespace
{

// shows integral values with one decimal digit: 100 -> "100.0"
std::string formatMillimeters( double v )
{
    if ( std::isfinite( v ) && v == std::floor( v ) )
        return fmt::format( "{:.1f}", v );
    return fmt::format( "{}", v );
}

double previewAutoFontSize( const std::string& text, double rectWidth, double rectHeight,
    const std::string& fontFamily, int heaviness )
{
    const double widthFactor = fontWidthFactor( fontFamily ) + heaviness / 100.0 * 0.15;
    const size_t length = utf8Length( text );
    const double sizeByWidth = length > 0 ? rectWidth * 0.75 / ( double( length ) * widthFactor ) : 12;
    return std::min( sizeByWidth, rectHeight * 0.6 );
}

} //anonymous namespace

PreviewLayout calcPreviewLayout( const SignParams& params, const Vector2d& canvasSize )
{
    PreviewLayout res;
    res.canvasSize = canvasSize;
    if ( params.width > 0 && params.height > 0 )
        res.scale = std::min( ( canvasSize.x - 2 * cPreviewBorder ) / params.width, ( canvasSize.y - 2 * cPreviewBorder ) / params.height );

    const Vector2d rectSize{ params.width * res.scale, params.height * res.scale };
    const Vector2d rectPos = ( canvasSize - rectSize ) / 2.0;
    res.plateRect = Box2d( rectPos, rectPos + rectSize );
    res.textCenter = rectPos + rectSize / 2.0;

    if ( params.isAutoSize() )
        res.fontSize = previewAutoFontSize( params.text, rectSize.x, rectSize.y, params.fontFamily, params.heaviness );
    else
        res.fontSize = *params.fontSize * res.scale;

    double sizeAdjustment = 1.0;
    const int h = params.heaviness;
    if ( h <= 15 )
    {
        res.textColor = "#404040";
        sizeAdjustment = 0.9;
    }
    else if ( h <= 25 )
    {
        res.textColor = "#303030";
        sizeAdjustment = 0.95;
    }
    else if ( h <= 50 )
    {
        sizeAdjustment = 1.0;
    }
    else if ( h <= 75 )
    {
        sizeAdjustment = 1.1;
    }
    else
    {
        sizeAdjustment = 1.2;
    }
    res.fontSize *= sizeAdjustment;
    res.boldWeight = h > 25;

    if ( h > 75 )
    {
        for ( int dx = -1; dx <= 1; ++dx )
            for ( int dy = -1; dy <= 1; ++dy )
                res.textOffsets.emplace_back( dx, dy );
    }
    else if ( h > 50 )
        res.textOffsets = { { 0, 0 }, { 1, 0 }, { -1, 0 }, { 0, 1 }, { 0, -1 } };
    else
        res.textOffsets = { { 0, 0 } };

    res.dimensionCaption = fmt::format( "{}mm \xC3\x97 {}mm", formatMillimeters( params.width ), formatMillimeters( params.height ) );
    res.captionPos = { canvasSize.x / 2, rectPos.y + rectSize.y + 20 };
    return res;
}

ContoursSave::SvgScene makePreviewScene( const GeneratedSign& sign, const Vector2d& canvasSize )
{
    const auto layout = calcPreviewLayout( sign.params, canvasSize );

    // mm around the origin -> canvas pixels around the plate center
    auto toCanvas = [&layout] ( Contours2d contours )
    {
        for ( auto& c : contours )
            for ( auto& p : c )
                p = layout.textCenter + Vector2d{ p.x, -p.y } * layout.scale;
        return contours;
    };

    ContoursSave::SvgScene scene;
    scene.size = canvasSize;

    ContoursSave::SvgShape plate;
    plate.contours = toCanvas( { sign.plate } );
    plate.fill = layout.plateFill;
    plate.stroke = layout.plateOutline;
    plate.strokeWidth = 2;
    scene.shapes.push_back( std::move( plate ) );

    const auto glyphs = toCanvas( sign.glyphs );
    for ( const auto& offset : layout.textOffsets )
    {
        ContoursSave::SvgShape text;
        text.contours = glyphs;
        for ( auto& c : text.contours )
            for ( auto& p : c )
                p += offset;
        text.fill = layout.textColor;
        scene.shapes.push_back( std::move( text ) );
    }

    ContoursSave::SvgLabel caption;
    caption.pos = layout.captionPos;
    caption.text = layout.dimensionCaption;
    caption.fontSize = 10;
    caption.fontFamily = "Arial";
    caption.fill = "#666666";
    scene.labels.push_back( std::move( caption ) );
    return scene;
}

Expected<void> savePreviewSvg( const GeneratedSign& sign, const std::filesystem::path& file, const Vector2d& canvasSize )
{
    return ContoursSave::toSvg( makePreviewScene( sign, canvasSize ), file );
}

} //namespace DS
