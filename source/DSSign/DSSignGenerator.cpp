#include "DSSignGenerator.h"
#include "DSMesh/DS2DContoursTriangulation.h"
#include "DSMesh/DSContour.h"
#include "DSMesh/DSLayeredExtrusion.h"
#include "DSMesh/DSMeshSave.h"
#include "DSMesh/DSStringConvert.h"
#include "DSMesh/DSTimer.h"
#include "DSSymbolMesh/DSSymbolMesh.h"
#include "DSPch/DSSpdlog.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace DS
{

namespace
{

constexpr size_t cMaxFileNameLength = 30;
// minimal distance between text and plate border for automatic font size, mm
constexpr double cMinTextMargin = 1.0;
// top layer must keep this part of plate area
constexpr double cMinMaterialRatio = 0.01;

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

std::string layerName( SignLayer layer )
{
    return asString( layer );
}

std::array<std::pair<SignLayer, const TriMesh*>, 3> layerMeshes( const GeneratedSign& sign )
{
    return { {
        { SignLayer::Base, &sign.base },
        { SignLayer::Top, &sign.top },
        { SignLayer::Combined, &sign.combined }
    } };
}

} //anonymous namespace

const char* asString( SignLayer layer )
{
    switch ( layer )
    {
    case SignLayer::Base:
        return "base";
    case SignLayer::Top:
        return "top";
    case SignLayer::Combined:
        return "combined";
    }
    return "";
}

const char* fileSuffix( SignLayer layer )
{
    switch ( layer )
    {
    case SignLayer::Base:
        return "bottom_black";
    case SignLayer::Top:
        return "top_yellow";
    case SignLayer::Combined:
        return "combined_preview";
    }
    return "";
}

SignGenerator::SignGenerator( SignGeneratorSettings settings )
    : settings_( std::move( settings ) )
    , validator_( settings_.ranges )
{}

SignExpected<void> SignGenerator::validate_( const SignParams& params ) const
{
    const double checkedFontSize = params.fontSize.value_or( 12.0 );
    const auto report = validator_.preValidateAll( params.text, params.width, params.height, checkedFontSize,
        params.heaviness, params.bottomThickness, params.topThickness, params.isAutoSize() );

    for ( const auto& warning : report.warnings )
        spdlog::warn( warning );

    if ( !report.valid )
        return unexpected( SignError::validation( "parameters", join( report.errors, "; " ) ) );

    if ( params.cornerRadius < 0 )
        return unexpected( SignError::validation( "corner_radius", "Corner radius must not be negative" ) );

    if ( params.fontSize )
    {
        const auto cut = validator_.willTextCutThrough( params.text, *params.fontSize, params.heaviness,
            params.width, params.height, params.topThickness );
        if ( cut.willCut && cut.confidence > 70 )
            spdlog::warn( "Text may cut through top layer (confidence: {}%). Consider reducing font size or heaviness.", cut.confidence );
    }
    return {};
}

SignExpected<void> SignGenerator::placeText_( GeneratedSign& sign ) const
{
    auto& glyphs = sign.glyphs;
    if ( glyphs.empty() )
        return {};

    const auto box = computeBoundingBox( glyphs );
    translateContours( glyphs, -box.center() );
    auto size = box.size();

    const auto& params = sign.params;
    if ( params.isAutoSize() )
    {
        const double margin = std::max( std::min( params.cornerRadius, std::min( params.width, params.height ) / 4 ), cMinTextMargin );
        const double availWidth = params.width - 2 * margin;
        const double availHeight = params.height - 2 * margin;
        if ( availWidth <= 0 || availHeight <= 0 )
            return unexpected( SignError::geometry( "text placement", "Sign is too small for the text" ) );
        const double scale = std::min( availWidth / size.x, availHeight / size.y );
        if ( scale < 1 )
        {
            spdlog::debug( "Text {:.1f}x{:.1f}mm is scaled by {:.3f} to fit the sign", size.x, size.y, scale );
            scaleContours( glyphs, scale );
            size *= scale;
        }
    }
    else if ( size.x > params.width || size.y > params.height )
    {
        return unexpected( SignError::geometry( "text placement",
            fmt::format( "Text size {:.1f}x{:.1f}mm exceeds the sign {}x{}mm", size.x, size.y, params.width, params.height ) ) );
    }
    return {};
}

SignExpected<GeneratedSign> SignGenerator::generate( const SignParams& params, bool validate ) const
{
    DS_TIMER;
    spdlog::info( "Generating sign: '{}' ({}x{}mm)", params.text, params.width, params.height );

    if ( validate )
    {
        if ( auto res = validate_( params ); !res )
            return unexpected( std::move( res.error() ) );
    }

    if ( !( params.width > 0 && params.height > 0 ) )
        return unexpected( SignError::geometry( "sign generation", "Sign dimensions must be positive" ) );

    GeneratedSign sign;
    sign.params = params;
    if ( params.isAutoSize() )
    {
        sign.fontSize = calcAutoFontSize( params.text, params.width, params.height, params.fontFamily, params.heaviness );
        spdlog::debug( "Auto-calculated font size: {:.1f}mm", sign.fontSize );
    }
    else
    {
        sign.fontSize = *params.fontSize;
    }
    sign.fontParams = calcFontParams( params.heaviness, params.fontFamily );
    const double adjustedFontSize = sign.fontSize * sign.fontParams.sizeMultiplier;

    auto font = FontFinder::instance().resolve( params.fontFamily, settings_.allowFontFallback );
    if ( !font )
        return unexpected( SignError::font( params.fontFamily, font.error() ) );
    sign.font = std::move( *font );
    spdlog::debug( "Using font {} ({})", sign.font.family, utf8string( sign.font.path ) );

    SymbolMeshParams symbolParams;
    symbolParams.text = params.text;
    symbolParams.align = AlignType::Center;
    symbolParams.pathToFontFile = sign.font.path;
    symbolParams.faceIndex = sign.font.faceIndex;
    symbolParams.fontSize = adjustedFontSize;
    symbolParams.fontDetalization = settings_.fontDetalization;
    auto glyphs = createSymbolContours( symbolParams );
    if ( !glyphs )
        return unexpected( SignError::font( params.fontFamily, glyphs.error() ) );
    sign.glyphs = std::move( *glyphs );

    if ( auto res = placeText_( sign ); !res )
        return unexpected( std::move( res.error() ) );

    sign.plate = makeRoundedRectContour( params.width, params.height, std::max( params.cornerRadius, 0.0 ), settings_.cornerSegments );

    // glyph outlines are already merged, only the plate border can cross them
    for ( const auto& glyph : sign.glyphs )
        if ( PlanarTriangulation::findIntersectingContours( { sign.plate, glyph } ) )
            return unexpected( SignError::geometry( "text placement", "Text touches the sign border" ) );

    Contours2d contours;
    contours.reserve( sign.glyphs.size() + 1 );
    contours.push_back( sign.plate );
    contours.insert( contours.end(), sign.glyphs.begin(), sign.glyphs.end() );

    const auto tree = PlanarTriangulation::buildContourTree( std::move( contours ) );
    const auto plateTree = PlanarTriangulation::buildContourTree( { sign.plate } );

    const float b = float( params.bottomThickness );
    const float t = float( params.topThickness );
    const double cutDepth = params.topThickness * sign.fontParams.cutDepthMultiplier * 1.1;
    const bool throughCut = cutDepth >= params.topThickness;
    const float zFloor = throughCut ? b : float( params.bottomThickness + params.topThickness - cutDepth );

    const double plateArea = std::abs( calcOrientedArea<double>( sign.plate ) );
    if ( throughCut && tree.materialArea() < cMinMaterialRatio * plateArea )
        return unexpected( SignError::geometry( "top layer creation", "Text cutout may have removed all material" ) );

    auto base = makeLayerSolid( plateTree, 0.0f, 0.0f, b );
    if ( !base )
    {
        spdlog::error( "Sign generation failed: {}", base.error() );
        return unexpected( SignError::geometry( "sign generation", base.error() ) );
    }
    sign.base = std::move( *base );

    auto top = makeLayerSolid( tree, b, zFloor, b + t );
    if ( !top || top->numTris() == 0 )
    {
        if ( !top )
            spdlog::error( "Top layer creation failed: {}", top.error() );
        return unexpected( SignError::geometry( "top layer creation", "Text cutout may have removed all material" ) );
    }
    sign.top = std::move( *top );

    auto combined = makeLayerSolid( tree, 0.0f, zFloor, b + t );
    if ( !combined )
    {
        spdlog::error( "Sign generation failed: {}", combined.error() );
        return unexpected( SignError::geometry( "sign generation", combined.error() ) );
    }
    sign.combined = std::move( *combined );

    for ( const auto& [layer, mesh] : layerMeshes( sign ) )
    {
        if ( !mesh->isClosed() || mesh->volume() <= 0 )
            return unexpected( SignError::geometry( "solid validation",
                fmt::format( "{} layer is not a closed solid", layerName( layer ) ) ) );
    }

    spdlog::info( "Sign generation successful" );
    return sign;
}

std::string SignGenerator::sanitizeFilename( const std::string& text )
{
    std::string safe;
    size_t length = 0;
    for ( char32_t c : utf8ToCodePoints( text ) )
    {
        if ( length == cMaxFileNameLength )
            break;
        ++length;
        if ( isAlphanumeric( c ) || c == U' ' || c == U'-' || c == U'_' )
            safe += codePointsToUtf8( std::u32string( 1, c ) );
        else
            safe.push_back( '_' );
    }
    safe = trim( safe );
    std::replace( safe.begin(), safe.end(), ' ', '_' );
    if ( safe.empty() )
        return "sign";
    return safe;
}

std::filesystem::path SignGenerator::stlPath( const std::string& baseName, int heaviness, SignLayer layer ) const
{
    const auto fileName = fmt::format( "{}_{}_{}.stl", sanitizeFilename( baseName ), weightLabel( heaviness ), fileSuffix( layer ) );
    return settings_.outputDir / pathFromUtf8( fileName );
}

SignExpected<void> SignGenerator::exportLayer_( const TriMesh& mesh, const std::filesystem::path& path, SignLayer layer ) const
{
    const auto name = layerName( layer );
    if ( mesh.numTris() == 0 || !mesh.isClosed() )
    {
        spdlog::error( "{} has invalid geometry", name );
        return unexpected( SignError::stlExport( name, "Invalid geometry",
            { "Check text size", "Reduce heaviness", "Increase layer thickness" } ) );
    }

    MeshSave::SaveSettings saveSettings;
    saveSettings.solidName = fmt::format( "DuoSign {}", fileSuffix( layer ) );
    auto saved = settings_.asciiStl ?
        MeshSave::toAsciiStl( mesh, path, saveSettings ) :
        MeshSave::toBinaryStl( mesh, path, saveSettings );
    if ( !saved )
    {
        spdlog::error( "Export failed for {}: {}", name, saved.error() );
        return unexpected( SignError::stlExport( name, saved.error(), { "Check parameters", "Try simpler text" } ) );
    }

    std::error_code ec;
    if ( !std::filesystem::exists( path, ec ) )
        return unexpected( SignError::stlExport( name, "File not created", { "Try different parameters", "Check disk space" } ) );

    const auto fileSize = std::filesystem::file_size( path, ec );
    if ( ec || fileSize == 0 )
    {
        std::filesystem::remove( path, ec );
        return unexpected( SignError::stlExport( name, "Empty file created",
            { "Text may have cut through entirely", "Adjust parameters" } ) );
    }

    spdlog::info( "Successfully exported: {}", utf8string( path.filename() ) );
    return {};
}

SignExpected<std::vector<std::filesystem::path>> SignGenerator::exportStl( const GeneratedSign& sign,
    const std::string& baseName, int heaviness ) const
{
    DS_TIMER;
    std::error_code ec;
    std::filesystem::create_directories( settings_.outputDir, ec );
    if ( ec )
        return unexpected( SignError::stlExport( "files", fmt::format( "Cannot create directory {}: {}",
            utf8string( settings_.outputDir ), systemToUtf8( ec.message() ) ), { "Check the output directory path" } ) );

    std::vector<std::filesystem::path> created;
    for ( const auto& [layer, mesh] : layerMeshes( sign ) )
    {
        const auto path = stlPath( baseName, heaviness, layer );
        if ( auto res = exportLayer_( *mesh, path, layer ); !res )
            return unexpected( std::move( res.error() ) );
        created.push_back( path );
    }
    return created;
}

} //namespace DS
