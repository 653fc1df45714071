#include "DSSignSettings.h"
#include "DSMesh/DSConfig.h"
#include "DSPch/DSJson.h"

#include <algorithm>

namespace DS
{

Json::Value getDefaultSignConfig()
{
    Json::Value root{ Json::objectValue };

    auto& window = root["window"];
    window["width"] = 1100;
    window["height"] = 820;
    window["resizable"] = true;
    window["min_width"] = 1000;
    window["min_height"] = 750;

    SignParams defaults;
    defaults.fontSize = 16.0;
    serializeToJson( defaults, root["defaults"] );

    auto& output = root["output"];
    output["directory"] = "output";
    output["auto_open_folder"] = true;
    output["file_naming"] = "{text}_{font}_{weight}";

    auto& advanced = root["advanced"];
    advanced["debug_mode"] = false;
    advanced["show_preview"] = true;
    advanced["auto_preview_update"] = true;
    advanced["max_text_length"] = 100;
    advanced["threading_enabled"] = true;

    const ValidationRanges ranges;
    auto& validation = root["validation"];
    validation["width_min"] = ranges.widthMin;
    validation["width_max"] = ranges.widthMax;
    validation["height_min"] = ranges.heightMin;
    validation["height_max"] = ranges.heightMax;
    validation["font_size_min"] = ranges.fontSizeMin;
    validation["font_size_max"] = ranges.fontSizeMax;
    validation["thickness_min"] = ranges.thicknessMin;
    validation["thickness_max"] = ranges.thicknessMax;

    root["recent_files"] = Json::Value( Json::arrayValue );

    auto& favorites = root["favorite_fonts"];
    favorites = Json::Value( Json::arrayValue );
    for ( const char* font : { "Arial", "Helvetica", "Verdana", "Impact" } )
        favorites.append( font );

    root["presets"] = Json::Value( Json::objectValue );
    return root;
}

void setupSignConfigDefaults( Config& config )
{
    config.setDefaults( getDefaultSignConfig() );
}

SignParams loadDefaultParams( const Config& config )
{
    SignParams params;
    params.fontSize = 16.0;
    deserializeFromJson( config.getJsonValue( "defaults" ), params );
    return params;
}

void saveDefaultParams( Config& config, const SignParams& params )
{
    Json::Value defaults = config.getJsonValue( "defaults", Json::Value( Json::objectValue ) );
    if ( !defaults.isObject() )
        defaults = Json::Value( Json::objectValue );
    serializeToJson( params, defaults );
    config.setJsonValue( "defaults", defaults );
}

ValidationRanges loadValidationRanges( const Config& config )
{
    ValidationRanges ranges;
    ranges.widthMin = config.getDouble( "validation.width_min", ranges.widthMin );
    ranges.widthMax = config.getDouble( "validation.width_max", ranges.widthMax );
    ranges.heightMin = config.getDouble( "validation.height_min", ranges.heightMin );
    ranges.heightMax = config.getDouble( "validation.height_max", ranges.heightMax );
    ranges.fontSizeMin = config.getDouble( "validation.font_size_min", ranges.fontSizeMin );
    ranges.fontSizeMax = config.getDouble( "validation.font_size_max", ranges.fontSizeMax );
    ranges.thicknessMin = config.getDouble( "validation.thickness_min", ranges.thicknessMin );
    ranges.thicknessMax = config.getDouble( "validation.thickness_max", ranges.thicknessMax );
    ranges.maxTextLength = config.getInt( "advanced.max_text_length", ranges.maxTextLength );
    return ranges;
}

WindowGeometry loadWindowGeometry( const Config& config )
{
    WindowGeometry res;
    res.minSize.x = config.getInt( "window.min_width", res.minSize.x );
    res.minSize.y = config.getInt( "window.min_height", res.minSize.y );
    res.resizable = config.getBool( "window.resizable", res.resizable );

    Vector2i size( config.getInt( "window.width", res.size.x ), config.getInt( "window.height", res.size.y ) );
    if ( config.hasVector2i( "window.size" ) )
        size = config.getVector2i( "window.size", size );
    res.size.x = std::max( size.x, res.minSize.x );
    res.size.y = std::max( size.y, res.minSize.y );

    if ( config.hasVector2i( "window.position" ) )
    {
        auto pos = config.getVector2i( "window.position" );
        // minimized windows on some systems report huge negative coordinates
        if ( pos.x > -32000 && pos.y > -32000 )
        {
            if ( pos.y <= 0 )
                pos.y = 40;
            res.position = pos;
        }
    }
    return res;
}

void saveWindowGeometry( Config& config, const WindowGeometry& geometry )
{
    if ( geometry.size.x <= 0 || geometry.size.y <= 0 )
        return;
    config.setVector2i( "window.size", geometry.size );
    config.setInt( "window.width", geometry.size.x );
    config.setInt( "window.height", geometry.size.y );
    if ( geometry.position )
        config.setVector2i( "window.position", *geometry.position );
}

std::string getOutputDirectory( const Config& config )
{
    return config.getString( "output.directory", "output" );
}

std::vector<std::string> getFavoriteFonts( const Config& config )
{
    std::vector<std::string> res;
    const auto fonts = config.getJsonValue( "favorite_fonts" );
    if ( !fonts.isArray() )
        return res;
    for ( const auto& f : fonts )
        if ( f.isString() )
            res.push_back( f.asString() );
    return res;
}

} //namespace DS
