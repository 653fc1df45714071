#pragma once
#include "DSMeshFwd.h"
#include "DSExpected.h"
#include "DSVector2.h"
#include "DSLog.h"
#include "DSPch/DSJson.h"
#include <filesystem>
#include <optional>
#include <string>

namespace DS
{

using FileNamesStack = std::vector<std::filesystem::path>;

/// JSON settings of the application;
/// keys are dot-separated paths inside the JSON tree, e.g. "defaults.font"
class Config
{
public:
    Config( Config const& ) = delete;
    void operator=( Config const& ) = delete;

    /// creates detached config, it is not bound to any file until reset is called
    DSMESH_API Config();
    /// stores configuration to its file if it is bound to one
    DSMESH_API ~Config();

    DSMESH_API static Config& instance();

    // looks up (~/.local/share/<appname>/config.json) or (AppData\<appname>\config.json)
    // creates directory if not presented
    DSMESH_API void reset( std::string appName );

    // looks for presented *.json file, missing or broken file gives defaults
    DSMESH_API void resetToFile( const std::filesystem::path& filePath );

    DSMESH_API const std::string& getAppName() const;
    const std::filesystem::path& getFilePath() const { return filePath_; }

    // sets values used for missing keys; current values are merged over them
    DSMESH_API void setDefaults( Json::Value defaults );
    const Json::Value& getDefaults() const { return defaults_; }

    // replaces all values with defaults
    DSMESH_API void resetToDefaults();

    // writes current config to file. (implicitly called from destructor)
    DSMESH_API Expected<void> writeToFile();

    // writes current config to given file
    DSMESH_API Expected<void> exportToFile( const std::filesystem::path& path ) const;
    // reads config from given file and merges it over defaults
    DSMESH_API Expected<void> importFromFile( const std::filesystem::path& path );

public:
    // returns true if bool with presented key exists
    DSMESH_API bool hasBool( const std::string& key ) const;
    // returns bool with presented key
    DSMESH_API bool getBool( const std::string& key, bool defaultValue = false ) const;
    // sets bool for presented key
    DSMESH_API void setBool( const std::string& key, bool keyValue );

    // returns true if integer with presented key exists
    DSMESH_API bool hasInt( const std::string& key ) const;
    // returns integer with presented key
    DSMESH_API int getInt( const std::string& key, int defaultValue = 0 ) const;
    // sets integer for presented key
    DSMESH_API void setInt( const std::string& key, int keyValue );

    // returns true if number with presented key exists
    DSMESH_API bool hasDouble( const std::string& key ) const;
    // returns number with presented key
    DSMESH_API double getDouble( const std::string& key, double defaultValue = 0 ) const;
    // sets number for presented key
    DSMESH_API void setDouble( const std::string& key, double keyValue );

    // returns true if string with presented key exists
    DSMESH_API bool hasString( const std::string& key ) const;
    // returns string with presented key
    DSMESH_API std::string getString( const std::string& key, const std::string& defaultValue = {} ) const;
    // sets string for presented key
    DSMESH_API void setString( const std::string& key, const std::string& keyValue );

    // returns true if 'recently used' files exist
    DSMESH_API bool hasFileStack( const std::string& key ) const;
    // returns 'recently used' files list
    DSMESH_API FileNamesStack getFileStack( const std::string& key, const FileNamesStack& defaultValue = FileNamesStack() ) const;
    // sets 'recently used' files list
    DSMESH_API void setFileStack( const std::string& key, const FileNamesStack& keyValue );
    // puts the file on top of 'recently used' list removing its previous occurrence, keeps at most maxSize files
    DSMESH_API void pushFileStack( const std::string& key, const std::filesystem::path& file, size_t maxSize = 10 );

    // returns true if Vector2i with presented key exists
    DSMESH_API bool hasVector2i( const std::string& key ) const;
    // returns Vector2i with presented key
    DSMESH_API Vector2i getVector2i( const std::string& key, const Vector2i& defaultValue = Vector2i() ) const;
    // sets Vector2i for presented key
    DSMESH_API void setVector2i( const std::string& key, const Vector2i& keyValue );

    // returns true if json value with this key exists
    DSMESH_API bool hasJsonValue( const std::string& key ) const;
    // returns custom json value
    DSMESH_API Json::Value getJsonValue( const std::string& key, const Json::Value& defaultValue = {} ) const;
    // sets custom json value
    DSMESH_API void setJsonValue( const std::string& key, const Json::Value& keyValue );

    // stores named preset in "presets" section
    DSMESH_API void savePreset( const std::string& name, const Json::Value& preset );
    // returns stored preset
    DSMESH_API std::optional<Json::Value> loadPreset( const std::string& name ) const;
    // returns false if there is no preset with given name
    DSMESH_API bool deletePreset( const std::string& name );
    // returns false if there is no preset with old name or new name is taken
    DSMESH_API bool renamePreset( const std::string& oldName, const std::string& newName );
    // returns sorted names of stored presets
    DSMESH_API std::vector<std::string> getPresetNames() const;

    const Json::Value& getRoot() const { return config_; }

private:
    // returns null value for missing key
    const Json::Value& find_( const std::string& key ) const;
    // creates missing objects on the path
    Json::Value& access_( const std::string& key );

    std::string appName_;

    Json::Value defaults_{ Json::objectValue };
    Json::Value config_{ Json::objectValue };
    std::filesystem::path filePath_;
    // prolong logger life
    std::shared_ptr<spdlog::logger> loggerHandle_ = Logger::instance().getSpdLogger();
};

} // namespace DS
