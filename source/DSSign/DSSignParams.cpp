#include "DSSignParams.h"
#include "DSPch/DSJson.h"

namespace DS
{

void serializeToJson( const SignParams& params, Json::Value& root )
{
    root["text"] = params.text;
    root["font"] = params.fontFamily;
    root["width"] = params.width;
    root["height"] = params.height;
    if ( params.fontSize )
        root["font_size"] = *params.fontSize;
    else
        root["font_size"] = Json::nullValue;
    root["auto_size"] = params.autoSize;
    root["heaviness"] = params.heaviness;
    root["bottom_thickness"] = params.bottomThickness;
    root["top_thickness"] = params.topThickness;
    root["corner_radius"] = params.cornerRadius;
}

void deserializeFromJson( const Json::Value& root, SignParams& params )
{
    if ( !root.isObject() )
        return;
    if ( root["text"].isString() )
        params.text = root["text"].asString();
    if ( root["font"].isString() )
        params.fontFamily = root["font"].asString();
    if ( root["width"].isNumeric() )
        params.width = root["width"].asDouble();
    if ( root["height"].isNumeric() )
        params.height = root["height"].asDouble();
    if ( root["font_size"].isNumeric() )
        params.fontSize = root["font_size"].asDouble();
    else if ( root.isMember( "font_size" ) && root["font_size"].isNull() )
        params.fontSize.reset();
    if ( root["auto_size"].isBool() )
        params.autoSize = root["auto_size"].asBool();
    if ( root["heaviness"].isNumeric() )
        params.heaviness = root["heaviness"].asInt();
    if ( root["bottom_thickness"].isNumeric() )
        params.bottomThickness = root["bottom_thickness"].asDouble();
    if ( root["top_thickness"].isNumeric() )
        params.topThickness = root["top_thickness"].asDouble();
    if ( root["corner_radius"].isNumeric() )
        params.cornerRadius = root["corner_radius"].asDouble();
}

} //namespace DS
