#include <DSMesh/DSConfig.h>
#include <DSMesh/DSSerializer.h>
#include <DSMesh/DSStringConvert.h>
#include <DSMesh/DSUniqueTemporaryFolder.h>
#include <DSMesh/DSGTest.h>
#include <algorithm>
#include <fstream>

namespace DS
{

namespace
{

Json::Value testDefaults()
{
    Json::Value root{ Json::objectValue };
    root["defaults"]["text"] = "LABEL";
    root["defaults"]["width"] = 100.0;
    root["output"]["directory"] = "output";
    root["recent_files"] = Json::Value( Json::arrayValue );
    return root;
}

} //anonymous namespace

TEST( DSMesh, ConfigDottedKeys )
{
    Config cfg;
    cfg.setDefaults( testDefaults() );

    EXPECT_TRUE( cfg.hasString( "defaults.text" ) );
    EXPECT_EQ( cfg.getString( "defaults.text" ), "LABEL" );
    EXPECT_DOUBLE_EQ( cfg.getDouble( "defaults.width" ), 100.0 );
    EXPECT_FALSE( cfg.hasDouble( "defaults.height" ) );
    EXPECT_DOUBLE_EQ( cfg.getDouble( "defaults.height", 25.0 ), 25.0 );
    EXPECT_EQ( cfg.getString( "defaults.text.inner", "none" ), "none" );

    cfg.setInt( "window.width", 1100 );
    cfg.setBool( "advanced.debug_mode", true );
    EXPECT_EQ( cfg.getInt( "window.width" ), 1100 );
    EXPECT_TRUE( cfg.getBool( "advanced.debug_mode" ) );
    EXPECT_FALSE( cfg.hasBool( "window.width" ) );

    cfg.setVector2i( "window.pos", Vector2i( 10, 20 ) );
    EXPECT_TRUE( cfg.hasVector2i( "window.pos" ) );
    EXPECT_EQ( cfg.getVector2i( "window.pos" ), Vector2i( 10, 20 ) );

    cfg.setString( "defaults.text", "EXIT" );
    cfg.resetToDefaults();
    EXPECT_EQ( cfg.getString( "defaults.text" ), "LABEL" );
    EXPECT_FALSE( cfg.hasInt( "window.width" ) );
}

TEST( DSMesh, ConfigDefaultsMergedUnderValues )
{
    Config cfg;
    cfg.setString( "defaults.text", "EXIT" );
    cfg.setDefaults( testDefaults() );
    EXPECT_EQ( cfg.getString( "defaults.text" ), "EXIT" );
    EXPECT_DOUBLE_EQ( cfg.getDouble( "defaults.width" ), 100.0 );
    EXPECT_EQ( cfg.getString( "output.directory" ), "output" );
}

TEST( DSMesh, ConfigFileStack )
{
    Config cfg;
    cfg.setDefaults( testDefaults() );
    EXPECT_TRUE( cfg.getFileStack( "recent_files" ).empty() );

    for ( int i = 0; i < 12; ++i )
        cfg.pushFileStack( "recent_files", "file" + std::to_string( i ) + ".stl" );
    auto stack = cfg.getFileStack( "recent_files" );
    ASSERT_EQ( stack.size(), 10u );
    EXPECT_EQ( stack.front(), std::filesystem::path( "file11.stl" ) );
    EXPECT_EQ( stack.back(), std::filesystem::path( "file2.stl" ) );

    cfg.pushFileStack( "recent_files", "file5.stl" );
    stack = cfg.getFileStack( "recent_files" );
    ASSERT_EQ( stack.size(), 10u );
    EXPECT_EQ( stack.front(), std::filesystem::path( "file5.stl" ) );
    EXPECT_EQ( std::count( stack.begin(), stack.end(), std::filesystem::path( "file5.stl" ) ), 1 );
}

TEST( DSMesh, ConfigPresets )
{
    Config cfg;
    Json::Value preset{ Json::objectValue };
    preset["text"] = "EXIT";

    EXPECT_FALSE( cfg.loadPreset( "exit" ).has_value() );
    cfg.savePreset( "exit", preset );
    cfg.savePreset( "door v1.2", preset );
    EXPECT_EQ( cfg.getPresetNames(), ( std::vector<std::string>{ "door v1.2", "exit" } ) );

    auto loaded = cfg.loadPreset( "door v1.2" );
    ASSERT_TRUE( loaded.has_value() );
    EXPECT_EQ( ( *loaded )["text"].asString(), "EXIT" );

    EXPECT_FALSE( cfg.renamePreset( "exit", "door v1.2" ) );
    EXPECT_FALSE( cfg.renamePreset( "missing", "other" ) );
    EXPECT_TRUE( cfg.renamePreset( "exit", "emergency exit" ) );
    EXPECT_EQ( cfg.getPresetNames(), ( std::vector<std::string>{ "door v1.2", "emergency exit" } ) );

    EXPECT_TRUE( cfg.deletePreset( "door v1.2" ) );
    EXPECT_FALSE( cfg.deletePreset( "door v1.2" ) );
    EXPECT_EQ( cfg.getPresetNames(), std::vector<std::string>{ "emergency exit" } );
}

TEST( DSMesh, ConfigSaveAndReload )
{
    UniqueTemporaryFolder folder;
    ASSERT_TRUE( bool( folder ) );
    const auto file = folder / "config.json";
    {
        Config cfg;
        cfg.setDefaults( testDefaults() );
        cfg.resetToFile( file );
        cfg.setString( "defaults.text", "EXIT" );
        cfg.pushFileStack( "recent_files", "exit.stl" );
        auto res = cfg.writeToFile();
        ASSERT_TRUE( res.has_value() ) << res.error();
    }
    Config cfg;
    cfg.setDefaults( testDefaults() );
    cfg.resetToFile( file );
    EXPECT_EQ( cfg.getString( "defaults.text" ), "EXIT" );
    EXPECT_DOUBLE_EQ( cfg.getDouble( "defaults.width" ), 100.0 );
    ASSERT_EQ( cfg.getFileStack( "recent_files" ).size(), 1u );
}

TEST( DSMesh, ConfigCorruptedFileKeepsDefaults )
{
    UniqueTemporaryFolder folder;
    ASSERT_TRUE( bool( folder ) );
    const auto file = folder / "config.json";
    {
        std::ofstream out( file );
        out << "{ \"defaults\": ";
    }
    Config cfg;
    cfg.setDefaults( testDefaults() );
    cfg.resetToFile( file );
    EXPECT_EQ( cfg.getString( "defaults.text" ), "LABEL" );
}

TEST( DSMesh, ConfigExportImport )
{
    UniqueTemporaryFolder folder;
    ASSERT_TRUE( bool( folder ) );
    const auto file = folder / "settings.json";

    Config cfg;
    cfg.setDefaults( testDefaults() );
    cfg.setString( "defaults.text", "EXIT" );
    ASSERT_TRUE( cfg.exportToFile( file ).has_value() );

    cfg.resetToDefaults();
    EXPECT_EQ( cfg.getString( "defaults.text" ), "LABEL" );
    auto res = cfg.importFromFile( file );
    ASSERT_TRUE( res.has_value() ) << res.error();
    EXPECT_EQ( cfg.getString( "defaults.text" ), "EXIT" );

    EXPECT_FALSE( cfg.importFromFile( folder / "missing.json" ).has_value() );
    {
        std::ofstream out( folder / "array.json" );
        out << "[1, 2]";
    }
    EXPECT_FALSE( cfg.importFromFile( folder / "array.json" ).has_value() );
    EXPECT_EQ( cfg.getString( "defaults.text" ), "EXIT" );
}

TEST( DSMesh, MergeJsonValue )
{
    Json::Value dst = testDefaults();
    Json::Value src{ Json::objectValue };
    src["defaults"]["text"] = "EXIT";
    src["recent_files"].append( "a.stl" );
    mergeJsonValue( dst, src );

    EXPECT_EQ( dst["defaults"]["text"].asString(), "EXIT" );
    EXPECT_DOUBLE_EQ( dst["defaults"]["width"].asDouble(), 100.0 );
    EXPECT_EQ( dst["recent_files"].size(), 1u );
}

TEST( DSMesh, JsonSerializer )
{
    auto parsed = deserializeJsonValue( std::string( "{ \"a\": { \"b\": 1.5 } }" ) );
    ASSERT_TRUE( parsed.has_value() ) << parsed.error();
    EXPECT_DOUBLE_EQ( ( *parsed )["a"]["b"].asDouble(), 1.5 );

    auto text = serializeJsonValue( *parsed );
    ASSERT_TRUE( text.has_value() );
    auto reparsed = deserializeJsonValue( *text );
    ASSERT_TRUE( reparsed.has_value() );
    EXPECT_EQ( *reparsed, *parsed );

    EXPECT_FALSE( deserializeJsonValue( std::string( "{ broken" ) ).has_value() );
}

TEST( DSMesh, StringHelpers )
{
    EXPECT_EQ( utf8Length( "LABEL" ), 5u );
    EXPECT_EQ( utf8Length( "Straße" ), 6u );
    EXPECT_EQ( utf8ToCodePoints( "ä€" ), std::u32string( U"ä€" ) );
    EXPECT_EQ( codePointsToUtf8( U"日本" ), "日本" );
    // truncated sequence does not hide the next characters
    EXPECT_EQ( utf8ToCodePoints( "\xE2" "A" ), std::u32string( U"\uFFFDA" ) );
    EXPECT_EQ( utf8ToCodePoints( "x\xC3" ), std::u32string( U"x\uFFFD" ) );
    EXPECT_EQ( utf8Length( "\xE2\x82" "AB" ), 4u );

    EXPECT_TRUE( isAlphanumeric( U'z' ) );
    EXPECT_TRUE( isAlphanumeric( U'7' ) );
    EXPECT_TRUE( isAlphanumeric( U'ß' ) );
    EXPECT_TRUE( isAlphanumeric( U'Ж' ) );
    EXPECT_TRUE( isAlphanumeric( U'日' ) );
    EXPECT_FALSE( isAlphanumeric( U'_' ) );
    EXPECT_FALSE( isAlphanumeric( U'×' ) );
    EXPECT_FALSE( isAlphanumeric( U'→' ) );

    EXPECT_EQ( trim( "  sign \t\n" ), "sign" );
    EXPECT_EQ( trim( "   " ), "" );
    EXPECT_EQ( toLower( "Plate.STL" ), "plate.stl" );
    EXPECT_EQ( split( "a..b", '.' ), ( std::vector<std::string>{ "a", "", "b" } ) );
    EXPECT_EQ( split( "", '.' ), std::vector<std::string>{ "" } );

    EXPECT_DOUBLE_EQ( roundToPrecision( 1.25, 1 ), 1.3 );
    EXPECT_DOUBLE_EQ( roundToPrecision( 15.04, 1 ), 15.0 );
}

} //namespace DS
