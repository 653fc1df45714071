#pragma once

#include "DSMeshFwd.h"
#include "DSExpected.h"
#include "DSVector2.h"
#include <filesystem>
#include <iosfwd>
#include <string>

namespace Json
{
class Value;
}

namespace DS
{

/// \defgroup SerializerGroup Serializer
/// \ingroup IOGroup
/// \{

/// saves JSON value to string
[[nodiscard]] DSMESH_API Expected<std::string> serializeJsonValue( const Json::Value& root );
/// saves JSON value to stream
DSMESH_API Expected<void> serializeJsonValue( const Json::Value& root, std::ostream& out );
/// saves JSON value to file
DSMESH_API Expected<void> serializeJsonValue( const Json::Value& root, const std::filesystem::path& path );

/// loads JSON value from given string
[[nodiscard]] DSMESH_API Expected<Json::Value> deserializeJsonValue( const std::string& str );
/// loads JSON value from given stream
[[nodiscard]] DSMESH_API Expected<Json::Value> deserializeJsonValue( std::istream& in );
/// loads JSON value from given file
[[nodiscard]] DSMESH_API Expected<Json::Value> deserializeJsonValue( const std::filesystem::path& path );

DSMESH_API void serializeToJson( const Vector2i& vec, Json::Value& root );
DSMESH_API void serializeToJson( const Vector2d& vec, Json::Value& root );

DSMESH_API void deserializeFromJson( const Json::Value& root, Vector2i& vec );
DSMESH_API void deserializeFromJson( const Json::Value& root, Vector2d& vec );

/// copies all members of (src) into (dst), nested objects are merged recursively
DSMESH_API void mergeJsonValue( Json::Value& dst, const Json::Value& src );

/// \}

} // namespace DS
