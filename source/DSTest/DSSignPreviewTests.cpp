#include <DSSign/DSSignPreview.h>
#include <DSSign/DSSignGenerator.h>
#include <DSMesh/DSContour.h>
#include <DSMesh/DSUniqueTemporaryFolder.h>
#include <DSMesh/DSGTest.h>
#include <fstream>
#include <sstream>

namespace DS
{

TEST( DSSign, PreviewLayoutDefaults )
{
    SignParams params;
    params.fontSize = 16.0;
    const auto layout = calcPreviewLayout( params );
    EXPECT_DOUBLE_EQ( layout.scale, 4.1 );
    EXPECT_NEAR( layout.plateRect.min.x, 20, 1e-9 );
    EXPECT_NEAR( layout.plateRect.min.y, 148.75, 1e-9 );
    EXPECT_NEAR( layout.plateRect.max.x, 430, 1e-9 );
    EXPECT_NEAR( layout.plateRect.max.y, 251.25, 1e-9 );
    EXPECT_NEAR( layout.textCenter.x, 225, 1e-9 );
    EXPECT_NEAR( layout.textCenter.y, 200, 1e-9 );
    EXPECT_NEAR( layout.fontSize, 65.6, 1e-9 );
    EXPECT_EQ( layout.textColor, "#000000" );
    EXPECT_TRUE( layout.boldWeight );
    ASSERT_EQ( layout.textOffsets.size(), 1u );
    EXPECT_EQ( layout.textOffsets[0], Vector2d( 0, 0 ) );
    EXPECT_EQ( layout.dimensionCaption, "100.0mm \xC3\x97 25.0mm" );
    EXPECT_NEAR( layout.captionPos.x, 225, 1e-9 );
    EXPECT_NEAR( layout.captionPos.y, 271.25, 1e-9 );
}

TEST( DSSign, PreviewLayoutByHeaviness )
{
    SignParams params;
    EXPECT_TRUE( params.isAutoSize() );
    EXPECT_NEAR( calcPreviewLayout( params ).fontSize, 61.5, 1e-9 );

    params.heaviness = 10;
    auto light = calcPreviewLayout( params );
    EXPECT_EQ( light.textColor, "#404040" );
    EXPECT_FALSE( light.boldWeight );
    EXPECT_EQ( light.textOffsets.size(), 1u );

    params.heaviness = 20;
    EXPECT_EQ( calcPreviewLayout( params ).textColor, "#303030" );

    params.heaviness = 60;
    EXPECT_EQ( calcPreviewLayout( params ).textOffsets.size(), 5u );

    params.heaviness = 90;
    auto heavy = calcPreviewLayout( params );
    EXPECT_EQ( heavy.textOffsets.size(), 9u );
    EXPECT_TRUE( heavy.boldWeight );

    params.text = "";
    params.width = 12.5;
    const auto empty = calcPreviewLayout( params );
    EXPECT_NEAR( empty.fontSize, 12 * 1.2, 1e-9 );
    EXPECT_EQ( empty.dimensionCaption, "12.5mm \xC3\x97 25.0mm" );
}

TEST( DSSign, PreviewScene )
{
    GeneratedSign sign;
    sign.params.heaviness = 90;
    sign.plate = makeRoundedRectContour( 100, 25, 2 );
    sign.glyphs = { makeRoundedRectContour( 10, 10, 0 ) };

    const auto scene = makePreviewScene( sign );
    ASSERT_EQ( scene.shapes.size(), 10u );
    ASSERT_EQ( scene.labels.size(), 1u );
    EXPECT_EQ( scene.shapes[0].fill, "#FFD700" );
    EXPECT_EQ( scene.labels[0].text, "100.0mm \xC3\x97 25.0mm" );

    // the glyph square is centered on the canvas with y flipped
    Box2d glyphBox;
    for ( const auto& p : scene.shapes[5].contours[0] )
        glyphBox.include( p );
    EXPECT_NEAR( glyphBox.center().x, 225, 1e-9 );
    EXPECT_NEAR( glyphBox.center().y, 200, 1e-9 );
    EXPECT_NEAR( glyphBox.size().x, 41, 1e-9 );

    UniqueTemporaryFolder folder;
    ASSERT_TRUE( bool( folder ) );
    const auto file = folder / "preview.svg";
    auto saved = savePreviewSvg( sign, file );
    ASSERT_TRUE( saved.has_value() ) << saved.error();

    std::ifstream in( file );
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE( ss.str().find( "#FFD700" ), std::string::npos );
    EXPECT_NE( ss.str().find( "25.0mm" ), std::string::npos );
}

} //namespace DS
