#include <DSSign/DSSignGenerator.h>
#include <DSSign/DSSignParams.h>
#include <DSMesh/DS2DContoursTriangulation.h>
#include <DSMesh/DSUniqueTemporaryFolder.h>
#include <DSMesh/DSStringConvert.h>
#include <DSMesh/DSGTest.h>
#include <DSPch/DSJson.h>
#include <fstream>
#include <optional>
#include <utility>
#include <vector>

namespace DS
{

namespace
{

std::optional<std::string> installedFamily()
{
    auto font = FontFinder::instance().resolve( "DejaVu Sans", true );
    if ( !font )
        return {};
    return font->family;
}

} //anonymous namespace

TEST( DSSign, GenerateSign )
{
    const auto family = installedFamily();
    if ( !family )
        GTEST_SKIP() << "No fonts are installed";

    SignParams params;
    params.text = "TEST";
    params.fontFamily = *family;
    params.bottomThickness = 1.0;
    params.topThickness = 1.5;

    SignGenerator generator;
    auto sign = generator.generate( params );
    ASSERT_TRUE( sign.has_value() ) << sign.error().what();
    EXPECT_GT( sign->fontSize, 0 );
    EXPECT_EQ( sign->fontParams.style, FontStyle::Regular );
    EXPECT_FALSE( sign->glyphs.empty() );

    for ( const TriMesh* mesh : { &sign->base, &sign->top, &sign->combined } )
    {
        EXPECT_TRUE( mesh->isClosed() );
        EXPECT_GT( mesh->volume(), 0 );
    }
    EXPECT_NEAR( sign->combined.volume(), sign->base.volume() + sign->top.volume(), 1e-2 * sign->combined.volume() );
    EXPECT_LT( sign->top.volume(), 100 * 25 * 1.5 );

    const auto baseBox = sign->base.computeBoundingBox();
    EXPECT_NEAR( baseBox.min.z, 0, 1e-6 );
    EXPECT_NEAR( baseBox.max.z, 1.0, 1e-6 );
    EXPECT_NEAR( baseBox.size().x, 100, 1e-3 );
    EXPECT_NEAR( baseBox.size().y, 25, 1e-3 );

    const auto topBox = sign->top.computeBoundingBox();
    EXPECT_NEAR( topBox.min.z, 1.0, 1e-6 );
    EXPECT_NEAR( topBox.max.z, 2.5, 1e-6 );

    // text is centered on the plate
    Box2d textBox;
    for ( const auto& c : sign->glyphs )
        for ( const auto& p : c )
            textBox.include( p );
    EXPECT_NEAR( textBox.center().x, 0, 1e-6 );
    EXPECT_NEAR( textBox.center().y, 0, 1e-6 );
}

TEST( DSSign, GenerateMultilineSign )
{
    const auto family = installedFamily();
    if ( !family )
        GTEST_SKIP() << "No fonts are installed";

    SignParams params;
    params.text = "FIRE\nEXIT";
    params.fontFamily = *family;
    params.width = 80;
    params.height = 50;
    params.heaviness = 80;

    auto sign = SignGenerator().generate( params );
    ASSERT_TRUE( sign.has_value() ) << sign.error().what();
    EXPECT_EQ( sign->fontParams.style, FontStyle::ExtraBold );
    EXPECT_TRUE( sign->top.isClosed() );
}

TEST( DSSign, GenerateOverlappingGlyphs )
{
    // glyphs with overlapping parts, serifs of neighbor glyphs and descenders above accents of the next line
    const std::vector<std::pair<std::string, std::string>> cases = {
        { "DejaVu Sans", "\xC3\xA7" },
        { "DejaVu Sans", "\xC3\x87" },
        { "DejaVu Serif", "VX" },
        { "DejaVu Serif", "/V" },
        { "DejaVu Sans", "gjpqy\n\xC3\x85\xC3\x89\xC3\x96" }
    };
    int numChecked = 0;
    for ( const auto& [family, text] : cases )
    {
        if ( !FontFinder::instance().resolve( family, false ) )
            continue;
        ++numChecked;

        SignParams params;
        params.text = text;
        params.fontFamily = family;
        params.width = 100;
        params.height = 40;

        auto sign = SignGenerator().generate( params );
        ASSERT_TRUE( sign.has_value() ) << text << ": " << sign.error().what();
        EXPECT_FALSE( PlanarTriangulation::findIntersectingContours( sign->glyphs ).has_value() ) << text;
        EXPECT_TRUE( sign->top.isClosed() ) << text;
        EXPECT_TRUE( sign->combined.isClosed() ) << text;
        EXPECT_NEAR( sign->combined.volume(), sign->base.volume() + sign->top.volume(), 1e-2 * sign->combined.volume() ) << text;
    }
    if ( numChecked == 0 )
        GTEST_SKIP() << "DejaVu fonts are not installed";
}

TEST( DSSign, GenerateOversizedText )
{
    const auto family = installedFamily();
    if ( !family )
        GTEST_SKIP() << "No fonts are installed";

    SignParams params;
    params.text = "WWWWWWWW";
    params.fontFamily = *family;
    params.fontSize = 50.0;

    auto sign = SignGenerator().generate( params, false );
    ASSERT_FALSE( sign.has_value() );
    EXPECT_EQ( sign.error().kind, SignError::Kind::Geometry );
    EXPECT_EQ( sign.error().subject, "text placement" );

    // automatic size always fits the text
    params.fontSize.reset();
    auto fitted = SignGenerator().generate( params );
    ASSERT_TRUE( fitted.has_value() ) << fitted.error().what();
}

TEST( DSSign, GenerateInvalidParameters )
{
    SignParams params;
    params.text = "TEST";
    params.width = 5;
    params.fontSize = 16.0;

    auto sign = SignGenerator().generate( params );
    ASSERT_FALSE( sign.has_value() );
    EXPECT_EQ( sign.error().kind, SignError::Kind::Validation );
    EXPECT_EQ( sign.error().what().rfind( "Validation error for parameters: Width must be between 10-500mm", 0 ), 0u );

    params.width = 100;
    params.cornerRadius = -1;
    auto radius = SignGenerator().generate( params );
    ASSERT_FALSE( radius.has_value() );
    EXPECT_EQ( radius.error().subject, "corner_radius" );

    params.text = "";
    params.cornerRadius = 2;
    auto empty = SignGenerator().generate( params );
    ASSERT_FALSE( empty.has_value() );
    EXPECT_EQ( empty.error().message, "Text cannot be empty" );

    params.text = "TEST";
    params.width = 0;
    auto flat = SignGenerator().generate( params, false );
    ASSERT_FALSE( flat.has_value() );
    EXPECT_EQ( flat.error().kind, SignError::Kind::Geometry );
}

TEST( DSSign, GenerateWithMissingFont )
{
    SignGeneratorSettings settings;
    settings.allowFontFallback = false;

    SignParams params;
    params.text = "TEST";
    params.fontFamily = "No Such Font Family";

    auto sign = SignGenerator( settings ).generate( params );
    ASSERT_FALSE( sign.has_value() );
    EXPECT_EQ( sign.error().kind, SignError::Kind::Font );
    EXPECT_EQ( sign.error().subject, "No Such Font Family" );
}

TEST( DSSign, ExportSign )
{
    const auto family = installedFamily();
    if ( !family )
        GTEST_SKIP() << "No fonts are installed";

    UniqueTemporaryFolder folder;
    ASSERT_TRUE( bool( folder ) );
    SignGeneratorSettings settings;
    settings.outputDir = folder / "output";
    SignGenerator generator( settings );

    SignParams params;
    params.text = "TEST";
    params.fontFamily = *family;
    auto sign = generator.generate( params );
    ASSERT_TRUE( sign.has_value() ) << sign.error().what();

    auto files = generator.exportStl( *sign, params.text, params.heaviness );
    ASSERT_TRUE( files.has_value() ) << files.error().what();
    ASSERT_EQ( files->size(), 3u );
    EXPECT_EQ( ( *files )[0].filename(), std::filesystem::path( "TEST_regular_bottom_black.stl" ) );
    EXPECT_EQ( ( *files )[1].filename(), std::filesystem::path( "TEST_regular_top_yellow.stl" ) );
    EXPECT_EQ( ( *files )[2].filename(), std::filesystem::path( "TEST_regular_combined_preview.stl" ) );

    const TriMesh* meshes[3] = { &sign->base, &sign->top, &sign->combined };
    for ( int i = 0; i < 3; ++i )
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size( ( *files )[i], ec );
        ASSERT_FALSE( ec );
        EXPECT_EQ( ( size - 84 ) % 50, 0u );
        EXPECT_GT( size, 84u );
        EXPECT_LE( size, 84 + 50 * meshes[i]->numTris() );

        std::ifstream in( ( *files )[i], std::ios::binary );
        char header[80] = {};
        in.read( header, 80 );
        EXPECT_EQ( std::string( header ).rfind( "DuoSign ", 0 ), 0u );
    }
}

TEST( DSSign, ExportErrors )
{
    UniqueTemporaryFolder folder;
    ASSERT_TRUE( bool( folder ) );

    SignGeneratorSettings settings;
    settings.outputDir = folder / "output";
    auto invalid = SignGenerator( settings ).exportStl( GeneratedSign{}, "TEST", 50 );
    ASSERT_FALSE( invalid.has_value() );
    EXPECT_EQ( invalid.error().kind, SignError::Kind::StlExport );
    EXPECT_EQ( invalid.error().subject, "base" );
    EXPECT_EQ( invalid.error().message, "Invalid geometry" );
    EXPECT_EQ( invalid.error().suggestions.size(), 3u );

    {
        std::ofstream out( folder / "blocker" );
        out << "file";
    }
    settings.outputDir = folder / "blocker" / "output";
    auto blocked = SignGenerator( settings ).exportStl( GeneratedSign{}, "TEST", 50 );
    ASSERT_FALSE( blocked.has_value() );
    EXPECT_EQ( blocked.error().kind, SignError::Kind::StlExport );
    EXPECT_EQ( blocked.error().subject, "files" );
}

TEST( DSSign, SanitizeFilename )
{
    EXPECT_EQ( SignGenerator::sanitizeFilename( "EXIT" ), "EXIT" );
    EXPECT_EQ( SignGenerator::sanitizeFilename( "  Hello World!  " ), "Hello_World_" );
    EXPECT_EQ( SignGenerator::sanitizeFilename( "Straße" ), "Straße" );
    EXPECT_EQ( SignGenerator::sanitizeFilename( "Café Ñandú" ), "Café_Ñandú" );
    EXPECT_EQ( SignGenerator::sanitizeFilename( "日本 Привет" ), "日本_Привет" );
    EXPECT_EQ( SignGenerator::sanitizeFilename( "a→b №5" ), "a_b__5" );
    std::string accented;
    for ( int i = 0; i < 40; ++i )
        accented += "é";
    EXPECT_EQ( utf8Length( SignGenerator::sanitizeFilename( accented ) ), 30u );
    EXPECT_EQ( SignGenerator::sanitizeFilename( "a/b\\c:d" ), "a_b_c_d" );
    EXPECT_EQ( SignGenerator::sanitizeFilename( "FIRE\nEXIT" ), "FIRE_EXIT" );
    EXPECT_EQ( SignGenerator::sanitizeFilename( std::string( 40, 'A' ) ), std::string( 30, 'A' ) );
    EXPECT_EQ( SignGenerator::sanitizeFilename( "" ), "sign" );
    EXPECT_EQ( SignGenerator::sanitizeFilename( "   " ), "sign" );
}

TEST( DSSign, StlPath )
{
    SignGeneratorSettings settings;
    settings.outputDir = "out";
    SignGenerator generator( settings );
    EXPECT_EQ( generator.stlPath( "My Sign", 80, SignLayer::Top ), std::filesystem::path( "out" ) / "My_Sign_extrabold_top_yellow.stl" );
    EXPECT_EQ( generator.stlPath( "", 10, SignLayer::Combined ).filename(), std::filesystem::path( "sign_light_combined_preview.stl" ) );
    EXPECT_STREQ( asString( SignLayer::Base ), "base" );
}

TEST( DSSign, SignParamsJson )
{
    SignParams params;
    Json::Value root;
    serializeToJson( params, root );
    EXPECT_EQ( root["text"].asString(), "LABEL" );
    EXPECT_EQ( root["font"].asString(), "Arial" );
    EXPECT_TRUE( root["font_size"].isNull() );
    EXPECT_FALSE( root["auto_size"].asBool() );
    EXPECT_EQ( root["heaviness"].asInt(), 50 );
    EXPECT_DOUBLE_EQ( root["corner_radius"].asDouble(), 2.0 );
    EXPECT_TRUE( params.isAutoSize() );

    params.text = "EXIT";
    params.fontSize = 18.0;
    params.bottomThickness = 1.2;
    serializeToJson( params, root );

    SignParams restored;
    deserializeFromJson( root, restored );
    EXPECT_EQ( restored, params );
    EXPECT_FALSE( restored.isAutoSize() );

    // missing keys keep current values
    Json::Value partial;
    partial["width"] = 150;
    partial["font_size"] = Json::nullValue;
    deserializeFromJson( partial, restored );
    EXPECT_DOUBLE_EQ( restored.width, 150.0 );
    EXPECT_EQ( restored.text, "EXIT" );
    EXPECT_FALSE( restored.fontSize.has_value() );
}

} //namespace DS
