#pragma once

#include "DSMeshFwd.h"
#include "DSExpected.h"
#include <filesystem>
#include <string>

namespace DS
{

/// \addtogroup BasicGroup
/// \{

#if defined __cpp_lib_char8_t

[[nodiscard]] inline std::string asString( const std::u8string & s ) { return { s.begin(), s.end() }; }
[[nodiscard]] inline std::u8string asU8String( const std::string & s ) { return { s.begin(), s.end() }; }

[[nodiscard]] inline std::filesystem::path pathFromUtf8( const std::string & s ) { return std::filesystem::path( asU8String( s ) ); }
[[nodiscard]] inline std::filesystem::path pathFromUtf8( const char * s ) { return std::filesystem::path( asU8String( std::string( s ) ) ); }

#else // std::u8string is not defined

[[nodiscard]] inline const std::string & asString( const std::string & s ) { return s; }
[[nodiscard]] inline const std::string & asU8String( const std::string & s ) { return s; }

[[nodiscard]] inline std::filesystem::path pathFromUtf8( const std::string & s ) { return std::filesystem::u8path( s ); }
[[nodiscard]] inline std::filesystem::path pathFromUtf8( const char * s ) { return std::filesystem::u8path( s ); }

#endif

/// returns filename as UTF8-encoded string
[[nodiscard]] inline std::string utf8string( const std::filesystem::path & path )
    { return asString( path.u8string() ); }

/// converts system encoded string to UTF8-encoded string
[[nodiscard]] DSMESH_API std::string systemToUtf8( const std::string & system );

/// decodes UTF8-encoded string into code points, invalid bytes are replaced with U+FFFD
[[nodiscard]] DSMESH_API std::u32string utf8ToCodePoints( const std::string & utf8 );

/// encodes code points into UTF8-encoded string
[[nodiscard]] DSMESH_API std::string codePointsToUtf8( const std::u32string & codePoints );

/// returns true for digits and letters of ASCII, Latin, Greek, Cyrillic, Armenian, Hebrew, Arabic, Devanagari, Thai,
/// Japanese kana, CJK ideographs and Hangul syllables
[[nodiscard]] DSMESH_API bool isAlphanumeric( char32_t c );

/// returns the number of code points in UTF8-encoded string
[[nodiscard]] DSMESH_API size_t utf8Length( const std::string & utf8 );

/// \}

/// if (v) contains an error, then appends given file name to that error
template<typename T>
[[nodiscard]] inline Expected<T> addFileNameInError( Expected<T> v, const std::filesystem::path & file )
{
    if ( !v.has_value() )
        v = unexpected( v.error() + ": " + utf8string( file ) );
    return v;
}

/// returns given value rounded to given number of decimal digits
[[nodiscard]] DSMESH_API double roundToPrecision( double v, int precision );

/// return a copy of the string with all alphabetic ASCII characters replaced with lower-case variants
[[nodiscard]] DSMESH_API std::string toLower( std::string str );

/// removes leading and trailing whitespace characters
[[nodiscard]] DSMESH_API std::string trim( const std::string & str );

/// splits the string by given separator, empty parts are kept
[[nodiscard]] DSMESH_API std::vector<std::string> split( const std::string & str, char separator );

} // namespace DS
