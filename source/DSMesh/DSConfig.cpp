#include "DSConfig.h"
#include "DSSerializer.h"
#include "DSStringConvert.h"
#include "DSSystem.h"
#include "DSPch/DSSpdlog.h"

#include <algorithm>

namespace DS
{

namespace
{

const Json::Value& nullValue()
{
    static const Json::Value value;
    return value;
}

} //anonymous namespace

Config::Config()
{}

Config::~Config()
{
    if ( filePath_.empty() )
        return;
    auto res = writeToFile();
    if ( !res && loggerHandle_ )
        loggerHandle_->warn( res.error() );
}

Config& Config::instance()
{
    static Config cfg;
    return cfg;
}

void Config::reset( std::string appName )
{
    if ( !filePath_.empty() )
    {
        auto res = writeToFile();
        if ( !res && loggerHandle_ )
            loggerHandle_->warn( res.error() );
    }
    appName_ = std::move( appName );
    resetToFile( getUserConfigFilePath() );
}

void Config::resetToFile( const std::filesystem::path& filePath )
{
    config_ = defaults_;
    std::error_code ec;
    if ( std::filesystem::exists( filePath, ec ) )
    {
        auto readRes = deserializeJsonValue( filePath );
        if ( !readRes.has_value() )
        {
            if ( loggerHandle_ )
                loggerHandle_->error( readRes.error() );
        }
        else if ( !readRes->isObject() )
        {
            if ( loggerHandle_ )
                loggerHandle_->error( "Config file {} does not contain JSON object", utf8string( filePath ) );
        }
        else
        {
            mergeJsonValue( config_, *readRes );
        }
    }
    else
    {
        if ( loggerHandle_ )
            loggerHandle_->debug( "Config file {} does not exist yet, defaults are used", utf8string( filePath ) );
    }
    filePath_ = filePath;
}

const std::string& Config::getAppName() const
{
    return appName_;
}

void Config::setDefaults( Json::Value defaults )
{
    defaults_ = std::move( defaults );
    auto current = std::move( config_ );
    config_ = defaults_;
    mergeJsonValue( config_, current );
}

void Config::resetToDefaults()
{
    config_ = defaults_;
}

Expected<void> Config::writeToFile()
{
    if ( filePath_.empty() )
        return unexpected( "Config file path is not set" );
    if ( loggerHandle_ )
        loggerHandle_->info( "Saving config file: " + utf8string( filePath_ ) );
    auto res = serializeJsonValue( config_, filePath_ );
    if ( !res )
        return unexpected( "Failed to save json config file " + utf8string( filePath_ ) );
    return {};
}

Expected<void> Config::exportToFile( const std::filesystem::path& path ) const
{
    return serializeJsonValue( config_, path );
}

Expected<void> Config::importFromFile( const std::filesystem::path& path )
{
    auto readRes = deserializeJsonValue( path );
    if ( !readRes )
        return unexpected( std::move( readRes.error() ) );
    if ( !readRes->isObject() )
        return unexpected( "Settings file does not contain JSON object: " + utf8string( path ) );
    config_ = defaults_;
    mergeJsonValue( config_, *readRes );
    return {};
}

const Json::Value& Config::find_( const std::string& key ) const
{
    const Json::Value* node = &config_;
    for ( const auto& part : split( key, '.' ) )
    {
        if ( !node->isObject() || !node->isMember( part ) )
            return nullValue();
        node = &( *node )[part];
    }
    return *node;
}

Json::Value& Config::access_( const std::string& key )
{
    Json::Value* node = &config_;
    for ( const auto& part : split( key, '.' ) )
    {
        if ( !node->isObject() )
            *node = Json::Value( Json::objectValue );
        node = &( *node )[part];
    }
    return *node;
}

bool Config::hasBool( const std::string& key ) const
{
    return find_( key ).isBool();
}
bool Config::getBool( const std::string& key, bool defaultValue ) const
{
    const auto& val = find_( key );
    if ( val.isBool() )
        return val.asBool();
    if ( loggerHandle_ )
        loggerHandle_->debug( "Key {} does not exist, default value \"{}\" returned", key, defaultValue );
    return defaultValue;
}
void Config::setBool( const std::string& key, bool keyValue )
{
    access_( key ) = keyValue;
}

bool Config::hasInt( const std::string& key ) const
{
    return find_( key ).isInt();
}
int Config::getInt( const std::string& key, int defaultValue ) const
{
    const auto& val = find_( key );
    if ( val.isInt() )
        return val.asInt();
    if ( val.isNumeric() )
        return int( val.asDouble() );
    if ( loggerHandle_ )
        loggerHandle_->debug( "Key {} does not exist, default value \"{}\" returned", key, defaultValue );
    return defaultValue;
}
void Config::setInt( const std::string& key, int keyValue )
{
    access_( key ) = keyValue;
}

bool Config::hasDouble( const std::string& key ) const
{
    return find_( key ).isNumeric() && !find_( key ).isBool();
}
double Config::getDouble( const std::string& key, double defaultValue ) const
{
    const auto& val = find_( key );
    if ( val.isNumeric() && !val.isBool() )
        return val.asDouble();
    if ( loggerHandle_ )
        loggerHandle_->debug( "Key {} does not exist, default value \"{}\" returned", key, defaultValue );
    return defaultValue;
}
void Config::setDouble( const std::string& key, double keyValue )
{
    access_( key ) = keyValue;
}

bool Config::hasString( const std::string& key ) const
{
    return find_( key ).isString();
}
std::string Config::getString( const std::string& key, const std::string& defaultValue ) const
{
    const auto& val = find_( key );
    if ( val.isString() )
        return val.asString();
    if ( loggerHandle_ )
        loggerHandle_->debug( "Key {} does not exist, default value \"{}\" returned", key, defaultValue );
    return defaultValue;
}
void Config::setString( const std::string& key, const std::string& keyValue )
{
    access_( key ) = keyValue;
}

bool Config::hasFileStack( const std::string& key ) const
{
    return find_( key ).isArray();
}
FileNamesStack Config::getFileStack( const std::string& key, const FileNamesStack& defaultValue ) const
{
    const auto& val = find_( key );
    if ( val.isArray() )
    {
        FileNamesStack res;
        for ( const auto& v : val )
        {
            if ( v.isString() )
                res.push_back( pathFromUtf8( v.asString() ) );
        }
        return res;
    }
    if ( loggerHandle_ )
        loggerHandle_->debug( "Key {} does not exist, default value returned", key );
    return defaultValue;
}
void Config::setFileStack( const std::string& key, const FileNamesStack& keyValue )
{
    auto& val = access_( key );
    val = Json::Value( Json::arrayValue );
    for ( const auto& file : keyValue )
        val.append( utf8string( file ) );
}
void Config::pushFileStack( const std::string& key, const std::filesystem::path& file, size_t maxSize )
{
    auto stack = getFileStack( key );
    stack.erase( std::remove( stack.begin(), stack.end(), file ), stack.end() );
    stack.insert( stack.begin(), file );
    if ( stack.size() > maxSize )
        stack.resize( maxSize );
    setFileStack( key, stack );
}

bool Config::hasVector2i( const std::string& key ) const
{
    const auto& val = find_( key );
    return val.isObject() && ( val["x"].isInt() && val["y"].isInt() );
}

Vector2i Config::getVector2i( const std::string& key, const Vector2i& defaultValue /*= Vector2i( 0, 0 ) */ ) const
{
    Vector2i res = defaultValue;
    deserializeFromJson( find_( key ), res );
    return res;
}

void Config::setVector2i( const std::string& key, const Vector2i& keyValue )
{
    serializeToJson( keyValue, access_( key ) );
}

bool Config::hasJsonValue( const std::string& key ) const
{
    return !find_( key ).isNull();
}

Json::Value Config::getJsonValue( const std::string& key, const Json::Value& defaultValue /*= {} */ ) const
{
    if ( hasJsonValue( key ) )
        return find_( key );
    return defaultValue;
}

void Config::setJsonValue( const std::string& key, const Json::Value& keyValue )
{
    access_( key ) = keyValue;
}

void Config::savePreset( const std::string& name, const Json::Value& preset )
{
    // preset names may contain dots, so they are not a part of the key path
    access_( "presets" )[name] = preset;
}

std::optional<Json::Value> Config::loadPreset( const std::string& name ) const
{
    const auto& presets = find_( "presets" );
    if ( !presets.isObject() || !presets.isMember( name ) )
        return {};
    return presets[name];
}

bool Config::deletePreset( const std::string& name )
{
    auto& presets = access_( "presets" );
    if ( !presets.isObject() || !presets.isMember( name ) )
        return false;
    presets.removeMember( name );
    return true;
}

bool Config::renamePreset( const std::string& oldName, const std::string& newName )
{
    auto& presets = access_( "presets" );
    if ( !presets.isObject() || !presets.isMember( oldName ) || presets.isMember( newName ) )
        return false;
    presets[newName] = presets[oldName];
    presets.removeMember( oldName );
    return true;
}

std::vector<std::string> Config::getPresetNames() const
{
    const auto& presets = find_( "presets" );
    if ( !presets.isObject() )
        return {};
    auto names = presets.getMemberNames();
    std::sort( names.begin(), names.end() );
    return names;
}

} //namespace DS
