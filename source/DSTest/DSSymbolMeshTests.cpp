#include <DSSymbolMesh/DSSymbolMesh.h>
#include <DSSymbolMesh/DSFontFinder.h>
#include <DSMesh/DSContour.h>
#include <DSMesh/DSBox.h>
#include <DSMesh/DSStringConvert.h>
#include <DSMesh/DSUniqueTemporaryFolder.h>
#include <DSMesh/DSGTest.h>
#include <algorithm>
#include <fstream>
#include <optional>

namespace DS
{

namespace
{

std::optional<FontInfo> anyTestFont()
{
    auto font = FontFinder::instance().resolve( "DejaVu Sans", true );
    if ( !font )
        return {};
    return *font;
}

Box2d boundingBox( const Contours2d& contours )
{
    Box2d box;
    for ( const auto& c : contours )
        for ( const auto& p : c )
            box.include( p );
    return box;
}

} //anonymous namespace

TEST( DSSymbolMesh, LetterWithCounter )
{
    const auto font = anyTestFont();
    if ( !font )
        GTEST_SKIP() << "No fonts are installed";

    SymbolMeshParams params;
    params.text = "O";
    params.pathToFontFile = font->path;
    params.faceIndex = font->faceIndex;
    params.fontSize = 10;
    auto contours = createSymbolContours( params );
    ASSERT_TRUE( contours.has_value() ) << contours.error();
    ASSERT_EQ( contours->size(), 2u );

    const double a0 = calcOrientedArea( ( *contours )[0] );
    const double a1 = calcOrientedArea( ( *contours )[1] );
    EXPECT_GT( std::max( a0, a1 ), 0 );
    EXPECT_LT( std::min( a0, a1 ), 0 );

    const auto box = boundingBox( *contours );
    EXPECT_GT( box.size().y, 6.0 );
    EXPECT_LT( box.size().y, 8.5 );
    for ( const auto& c : *contours )
        EXPECT_NE( c.front(), c.back() );
}

TEST( DSSymbolMesh, MultilineCentered )
{
    const auto font = anyTestFont();
    if ( !font )
        GTEST_SKIP() << "No fonts are installed";

    SymbolMeshParams params;
    params.pathToFontFile = font->path;
    params.faceIndex = font->faceIndex;
    params.fontSize = 10;
    params.text = "I";
    auto single = createSymbolContours( params );
    ASSERT_TRUE( single.has_value() ) << single.error();

    params.text = "I\nI";
    auto twoLines = createSymbolContours( params );
    ASSERT_TRUE( twoLines.has_value() ) << twoLines.error();
    EXPECT_EQ( twoLines->size(), 2 * single->size() );
    EXPECT_GT( boundingBox( *twoLines ).size().y, 2 * boundingBox( *single ).size().y );

    params.text = "IIII\nI";
    params.align = AlignType::Center;
    auto centered = createSymbolContours( params );
    ASSERT_TRUE( centered.has_value() ) << centered.error();
    const auto all = boundingBox( *centered );
    // the single symbol of the second line is the last contour
    const auto last = boundingBox( { centered->back() } );
    EXPECT_NEAR( last.center().x, all.center().x, 0.5 );
}

TEST( DSSymbolMesh, ScaledBySize )
{
    const auto font = anyTestFont();
    if ( !font )
        GTEST_SKIP() << "No fonts are installed";

    SymbolMeshParams params;
    params.pathToFontFile = font->path;
    params.faceIndex = font->faceIndex;
    params.text = "H";
    params.fontSize = 10;
    auto small = createSymbolContours( params );
    params.fontSize = 20;
    auto large = createSymbolContours( params );
    ASSERT_TRUE( small.has_value() && large.has_value() );
    EXPECT_NEAR( boundingBox( *large ).size().y, 2 * boundingBox( *small ).size().y, 0.05 );
}

TEST( DSSymbolMesh, Errors )
{
    SymbolMeshParams params;
    params.text = "A";
    params.pathToFontFile = "no_such_font.ttf";
    auto missing = createSymbolContours( params );
    ASSERT_FALSE( missing.has_value() );
    EXPECT_EQ( missing.error(), "Cannot find file with font" );

    UniqueTemporaryFolder folder;
    ASSERT_TRUE( bool( folder ) );
    params.pathToFontFile = folder / "broken.ttf";
    {
        std::ofstream out( params.pathToFontFile );
        out << "not a font";
    }
    auto broken = createSymbolContours( params );
    ASSERT_FALSE( broken.has_value() );
    EXPECT_EQ( broken.error(), "Font file is not valid" );
}

TEST( DSSymbolMesh, FontFinderOverEmptyDirectory )
{
    UniqueTemporaryFolder folder;
    ASSERT_TRUE( bool( folder ) );
    FontFinder finder( { folder } );
    EXPECT_TRUE( finder.fonts().empty() );
    EXPECT_TRUE( finder.availableFamilies().empty() );

    auto strict = finder.findFamily( "Arial" );
    ASSERT_FALSE( strict.has_value() );
    EXPECT_EQ( strict.error(), "Font family 'Arial' is not installed" );

    auto fallback = finder.resolve( "Arial", true );
    ASSERT_FALSE( fallback.has_value() );
    EXPECT_EQ( fallback.error(), "No fonts are installed" );
}

TEST( DSSymbolMesh, FontFinderResolvesPath )
{
    const auto font = anyTestFont();
    if ( !font )
        GTEST_SKIP() << "No fonts are installed";

    UniqueTemporaryFolder folder;
    ASSERT_TRUE( bool( folder ) );
    FontFinder finder( { folder } );
    auto byPath = finder.resolve( utf8string( font->path ), false );
    ASSERT_TRUE( byPath.has_value() ) << byPath.error();
    EXPECT_EQ( byPath->path, font->path );

    auto byFamily = FontFinder::instance().findFamily( toLower( font->family ) );
    ASSERT_TRUE( byFamily.has_value() );
    EXPECT_EQ( byFamily->family, font->family );
}

} //namespace DS
