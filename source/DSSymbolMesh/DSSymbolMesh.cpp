#include "DSSymbolMesh.h"

#include "DSMesh/DS2DContoursTriangulation.h"
#include "DSMesh/DSBox.h"
#include "DSMesh/DSStringConvert.h"
#include "DSMesh/DSTimer.h"
#include "DSPch/DSSpdlog.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H

#include <algorithm>
#include <memory>

namespace DS
{

namespace
{

// FreeType char size in 26.6 fixed point at 72 dpi, the em square is 128 pixels
constexpr FT_F26Dot6 cCharSize = 128 << 6;

struct FreeTypeLibraryDeleter
{
    void operator()( FT_Library library ) const { FT_Done_FreeType( library ); }
};
using FreeTypeLibraryPtr = std::unique_ptr<std::remove_pointer_t<FT_Library>, FreeTypeLibraryDeleter>;

struct FreeTypeFaceDeleter
{
    void operator()( FT_Face face ) const { FT_Done_Face( face ); }
};
using FreeTypeFacePtr = std::unique_ptr<std::remove_pointer_t<FT_Face>, FreeTypeFaceDeleter>;

struct OutlineDecomposer
{
    OutlineDecomposer( unsigned bezierSteps ) :
        bezierSteps( bezierSteps )
    {
    }
    void decompose( FT_Outline* outline, Vector2d offset = {} );
    void clearLast( size_t firstContour );

    unsigned bezierSteps;
    Contours2d contours;
    Vector2d offset;
};

int MoveToCb( const FT_Vector* to, void* user )
{
    auto decomposer = static_cast<OutlineDecomposer*>( user );
    decomposer->contours.push_back( { Vector2d( ( double )to->x,( double )to->y ) + decomposer->offset } );
    return 0;
}

int LineToCb( const FT_Vector* to, void* user )
{
    auto decomposer = static_cast<OutlineDecomposer*>( user );
    decomposer->contours.back().push_back( Vector2d( ( double )to->x, ( double )to->y ) + decomposer->offset );
    return 0;
}

int ConicToCb( const FT_Vector* control, const FT_Vector* to, void* user )
{
    auto decomposer = static_cast<OutlineDecomposer*>( user );
    const Vector2d from = decomposer->contours.back().back();
    Vector2d control2d = { ( double )control->x + decomposer->offset.x ,( double )control->y + decomposer->offset.y };
    Vector2d to2d = { ( double )to->x + decomposer->offset.x,( double )to->y + decomposer->offset.y };
    auto& contour = decomposer->contours.back();
    for ( unsigned i = 0; i < decomposer->bezierSteps; ++i )
    {
        double t = double( i + 1 ) / double( decomposer->bezierSteps );
        contour.push_back( ( 1 - t )*( ( 1 - t )*from + t * control2d ) + t * ( ( 1 - t )*control2d + t * to2d ) );
    }
    return 0;
}

int CubicToCb( const FT_Vector* control1, const FT_Vector* control2, const FT_Vector* to, void* user )
{
    auto decomposer = static_cast<OutlineDecomposer*>( user );
    const Vector2d from = decomposer->contours.back().back();
    Vector2d control12d = { ( double )control1->x + decomposer->offset.x,( double )control1->y + decomposer->offset.y };
    Vector2d control22d = { ( double )control2->x + decomposer->offset.x,( double )control2->y + decomposer->offset.y };
    Vector2d to2d = { ( double )to->x + decomposer->offset.x,( double )to->y + decomposer->offset.y };
    auto& contour = decomposer->contours.back();
    for ( unsigned i = 0; i < decomposer->bezierSteps; ++i )
    {
        double t = double( i + 1 ) / double( decomposer->bezierSteps );
        const Vector2d p0 = ( 1 - t ) * ( ( 1 - t ) * from + t * control12d ) + t * ( ( 1 - t ) * control12d + t * control22d );
        const Vector2d p1 = ( 1 - t ) * ( ( 1 - t ) * control12d + t * control22d ) + t * ( ( 1 - t ) * control22d + t * to2d );
        contour.push_back( ( 1 - t ) * p0 + t * p1 );
    }
    return 0;
}

void OutlineDecomposer::decompose( FT_Outline* outline, Vector2d offsetP /* = {} */)
{
    FT_Outline_Funcs funcs;
    funcs.move_to = MoveToCb;
    funcs.line_to = LineToCb;
    funcs.conic_to = ConicToCb;
    funcs.cubic_to = CubicToCb;
    funcs.shift = 0;
    funcs.delta = 0;
    offset = offsetP;
    const size_t firstContour = contours.size();
    FT_Outline_Decompose( outline, &funcs, this );
    // TrueType outlines have clockwise outer contours
    if ( FT_Outline_Get_Orientation( outline ) == FT_ORIENTATION_TRUETYPE )
        for ( size_t i = firstContour; i < contours.size(); ++i )
            std::reverse( contours[i].begin(), contours[i].end() );
}

// removes closing point repeating the first one
void OutlineDecomposer::clearLast( size_t firstContour )
{
    for ( size_t i = firstContour; i < contours.size(); ++i )
    {
        auto& contour = contours[i];
        if ( contour.size() > 1 && contour.front() == contour.back() )
            contour.erase( contour.end() - 1 );
    }
}

} //anonymous namespace

Expected<Contours2d> createSymbolContours( const SymbolMeshParams& params )
{
    DS_TIMER;

    std::error_code ec;
    if ( !std::filesystem::is_regular_file( params.pathToFontFile, ec ) )
        return unexpected( "Cannot find file with font" );

    // Begin
    FT_Library rawLibrary = nullptr;
    if ( FT_Init_FreeType( &rawLibrary ) != 0 )
        return unexpected( "Cannot initialize FreeType library" );
    FreeTypeLibraryPtr library( rawLibrary );

    FT_Face rawFace = nullptr;
    if ( FT_New_Face( library.get(), utf8string( params.pathToFontFile ).c_str(), params.faceIndex, &rawFace ) != 0 )
        return unexpected( "Font file is not valid" );
    FreeTypeFacePtr face( rawFace );
    if ( !FT_IS_SCALABLE( face ) )
        return unexpected( "Font has no scalable outlines" );

    FT_Set_Char_Size( face.get(), cCharSize, cCharSize, 72, 72 );
    OutlineDecomposer decomposer( unsigned( std::max( params.fontDetalization, 1 ) ) );

    const std::u32string str = utf8ToCodePoints( params.text );

    // Find space width
    FT_UInt index = FT_Get_Char_Index( face.get(), U' ' );
    FT_Pos spaceAdvance = cCharSize / 4;
    if ( index != 0 && FT_Load_Glyph( face.get(), index, FT_LOAD_NO_BITMAP ) == 0 )
        spaceAdvance = face->glyph->advance.x;
    auto addOffsetX = FT_Pos( params.symbolsDistanceAdditionalOffset.x * double( spaceAdvance ) );
    auto offsetY = FT_Pos( cCharSize * ( 1.0 + params.symbolsDistanceAdditionalOffset.y ) );

    // <the last contour index of a line, width of the line>
    std::vector<std::pair<size_t, double>> contourId2width;
    double maxLineWidth = 0;
    size_t contoursPrevSize = 0;
    auto updateContourSizeAndWidth = [&]( FT_Pos lineAdvance ) {
        bool isInitialized = false;
        double minX = 0.0;
        double maxX = 0.0;
        for ( size_t j = contoursPrevSize; j < decomposer.contours.size(); ++j )
        {
            for ( const auto& p : decomposer.contours[j] )
            {
                if ( !isInitialized )
                {
                    minX = p.x;
                    maxX = p.x;
                    isInitialized = true;
                }
                minX = std::min( minX, p.x );
                maxX = std::max( maxX, p.x );
            }
        }
        // a line of spaces has no contours but still has width
        const double width = isInitialized ? maxX - minX : double( lineAdvance );
        contourId2width.emplace_back( decomposer.contours.size(), width );
        maxLineWidth = std::max( maxLineWidth, width );
        contoursPrevSize = decomposer.contours.size();
    };

    // Body
    FT_Pos xOffset{ 0 };
    FT_Pos yOffset{ 0 };
    FT_UInt previous = 0;
    FT_Bool kerning = FT_HAS_KERNING( face );
    for ( int i = 0; i < int( str.length() ); ++i )
    {
        if ( str[i] == U'\n' )
        {
            updateContourSizeAndWidth( xOffset );
            xOffset = 0;
            yOffset -= offsetY;
            previous = 0;
            continue;
        }

        index = FT_Get_Char_Index( face.get(), str[i] );
        if ( index == 0 )
            return unexpected( "Font does not contain symbol at position " + std::to_string( i ) );
        if ( kerning && previous )
        {
            FT_Vector delta;
            if ( FT_Get_Kerning( face.get(), previous, index, FT_KERNING_DEFAULT, &delta ) == 0 )
                xOffset += delta.x;
        }
        if ( FT_Load_Glyph( face.get(), index, FT_LOAD_NO_BITMAP ) )
        {
            spdlog::warn( "Cannot load glyph of symbol at position {}", i );
            continue;
        }

        // decompose
        // y offset is needed to resolve degenerate intersections of some fonts (YN sequence of Times New Roman for example)
        const size_t firstContour = decomposer.contours.size();
        decomposer.decompose( &face->glyph->outline,
                              { double( xOffset ), ( i % 2 == 0 ) ? yOffset + 0.0 : yOffset + 0.5 } );
        decomposer.clearLast( firstContour );

        xOffset += ( face->glyph->advance.x + addOffsetX );
        previous = index;
    }
    updateContourSizeAndWidth( xOffset );

    if ( params.align != AlignType::Left )
    {
        size_t lineStart = 0;
        for ( const auto& [lineEnd, lineWidth] : contourId2width )
        {
            const double shift = params.align == AlignType::Right ? maxLineWidth - lineWidth : ( maxLineWidth - lineWidth ) / 2;
            for ( size_t i = lineStart; i < lineEnd; ++i )
                for ( auto& p : decomposer.contours[i] )
                    p.x += shift;
            lineStart = lineEnd;
        }
    }

    const double scale = params.fontSize / double( cCharSize );
    Contours2d res;
    res.reserve( decomposer.contours.size() );
    for ( auto& c : decomposer.contours )
    {
        if ( c.size() < 3 )
            continue;
        for ( auto& p : c )
            p *= scale;
        res.push_back( std::move( c ) );
    }
    // glyphs of some fonts consist of overlapping parts (accents, cedillas), and neighbor glyphs may touch
    return PlanarTriangulation::getOutline( res, { .innerType = PlanarTriangulation::WindingMode::NonZero } );
}

}
