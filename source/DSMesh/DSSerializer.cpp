#include "DSSerializer.h"
#include "DSStringConvert.h"
#include "DSTimer.h"
#include "DSPch/DSJson.h"
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>

namespace DS
{

Expected<std::string> serializeJsonValue( const Json::Value& root )
{
    std::ostringstream oss;
    return serializeJsonValue( root, oss )
        .transform( [&] { return std::move( oss ).str(); } );
}

Expected<void> serializeJsonValue( const Json::Value& root, std::ostream& out )
{
    Json::StreamWriterBuilder builder;
    // see json/writer.h for available configurations
    std::unique_ptr<Json::StreamWriter> writer { builder.newStreamWriter() };

    if ( !out || writer->write( root, &out ) != 0 || !out )
        return unexpected( "Failed to write JSON" );

    return {};
}

Expected<void> serializeJsonValue( const Json::Value& root, const std::filesystem::path& path )
{
    // although json is a textual format, we open the file in binary mode to get exactly the same result on Windows and Linux
    std::ofstream out( path, std::ofstream::binary );
    if ( !out )
        return unexpected( "Cannot open file for writing " + utf8string( path ) );
    return serializeJsonValue( root, out );
}

Expected<Json::Value> deserializeJsonValue( const std::string& str )
{
    Timer t( "deserializeJsonValue( const std::string& )" );

    Json::Value root;
    Json::CharReaderBuilder readerBuilder;
    std::unique_ptr<Json::CharReader> reader{ readerBuilder.newCharReader() };
    std::string error;
    if ( !reader->parse( str.data(), str.data() + str.size(), &root, &error ) )
        return unexpected( "Cannot parse json file: " + error );

    return root;
}

Expected<Json::Value> deserializeJsonValue( std::istream& in )
{
    std::string str{ std::istreambuf_iterator<char>( in ), std::istreambuf_iterator<char>() };
    if ( in.bad() )
        return unexpected( std::string( "Json stream read error" ) );

    return deserializeJsonValue( str );
}

Expected<Json::Value> deserializeJsonValue( const std::filesystem::path& path )
{
    if ( path.empty() )
        return unexpected( "Cannot find parameters file" );

    std::ifstream ifs( path, std::ifstream::binary );
    if ( !ifs || ifs.bad() )
        return unexpected( "Cannot open json file " + utf8string( path ) );

    return addFileNameInError( deserializeJsonValue( ifs ), path );
}

void serializeToJson( const Vector2i& vec, Json::Value& root )
{
    root["x"] = vec.x;
    root["y"] = vec.y;
}

void serializeToJson( const Vector2d& vec, Json::Value& root )
{
    root["x"] = vec.x;
    root["y"] = vec.y;
}

void deserializeFromJson( const Json::Value& root, Vector2i& vec )
{
    if ( !root.isObject() )
        return;
    if ( root["x"].isInt() )
        vec.x = root["x"].asInt();
    if ( root["y"].isInt() )
        vec.y = root["y"].asInt();
}

void deserializeFromJson( const Json::Value& root, Vector2d& vec )
{
    if ( !root.isObject() )
        return;
    if ( root["x"].isNumeric() )
        vec.x = root["x"].asDouble();
    if ( root["y"].isNumeric() )
        vec.y = root["y"].asDouble();
}

void mergeJsonValue( Json::Value& dst, const Json::Value& src )
{
    if ( !src.isObject() )
        return;
    if ( !dst.isObject() )
        dst = Json::Value( Json::objectValue );
    for ( const auto& name : src.getMemberNames() )
    {
        const auto& value = src[name];
        if ( value.isObject() && dst[name].isObject() )
            mergeJsonValue( dst[name], value );
        else
            dst[name] = value;
    }
}

} // namespace DS
