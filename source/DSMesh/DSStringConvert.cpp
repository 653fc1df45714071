#include "DSStringConvert.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace DS
{

std::string systemToUtf8( const std::string & system )
{
    // all supported platforms use UTF8 as system encoding
    return system;
}

std::u32string utf8ToCodePoints( const std::string & utf8 )
{
    std::u32string res;
    res.reserve( utf8.size() );
    size_t i = 0;
    while ( i < utf8.size() )
    {
        const auto c = (unsigned char)utf8[i];
        int extra = 0;
        char32_t cp = 0;
        if ( c < 0x80 )
            cp = c;
        else if ( ( c & 0xE0 ) == 0xC0 )
        {
            cp = c & 0x1F;
            extra = 1;
        }
        else if ( ( c & 0xF0 ) == 0xE0 )
        {
            cp = c & 0x0F;
            extra = 2;
        }
        else if ( ( c & 0xF8 ) == 0xF0 )
        {
            cp = c & 0x07;
            extra = 3;
        }
        else
        {
            res.push_back( 0xFFFD );
            ++i;
            continue;
        }
        if ( i + extra >= utf8.size() )
        {
            // truncated sequence, the following bytes are decoded separately
            res.push_back( 0xFFFD );
            ++i;
            continue;
        }
        bool valid = true;
        for ( int k = 1; k <= extra; ++k )
        {
            const auto cc = (unsigned char)utf8[i + k];
            if ( ( cc & 0xC0 ) != 0x80 )
            {
                valid = false;
                break;
            }
            cp = ( cp << 6 ) | ( cc & 0x3F );
        }
        if ( !valid )
        {
            res.push_back( 0xFFFD );
            ++i;
            continue;
        }
        res.push_back( cp );
        i += extra + 1;
    }
    return res;
}

std::string codePointsToUtf8( const std::u32string & codePoints )
{
    std::string res;
    res.reserve( codePoints.size() );
    for ( char32_t cp : codePoints )
    {
        if ( cp < 0x80 )
            res.push_back( char( cp ) );
        else if ( cp < 0x800 )
        {
            res.push_back( char( 0xC0 | ( cp >> 6 ) ) );
            res.push_back( char( 0x80 | ( cp & 0x3F ) ) );
        }
        else if ( cp < 0x10000 )
        {
            res.push_back( char( 0xE0 | ( cp >> 12 ) ) );
            res.push_back( char( 0x80 | ( ( cp >> 6 ) & 0x3F ) ) );
            res.push_back( char( 0x80 | ( cp & 0x3F ) ) );
        }
        else
        {
            res.push_back( char( 0xF0 | ( cp >> 18 ) ) );
            res.push_back( char( 0x80 | ( ( cp >> 12 ) & 0x3F ) ) );
            res.push_back( char( 0x80 | ( ( cp >> 6 ) & 0x3F ) ) );
            res.push_back( char( 0x80 | ( cp & 0x3F ) ) );
        }
    }
    return res;
}

bool isAlphanumeric( char32_t c )
{
    if ( c < 0x80 )
        return std::isalnum( int( c ) ) != 0;
    // inclusive ranges of code points sorted by their first code point
    static constexpr std::pair<char32_t, char32_t> cRanges[] = {
        { 0xAA, 0xAA }, { 0xB2, 0xB3 }, { 0xB5, 0xB5 }, { 0xB9, 0xBA }, { 0xBC, 0xBE },
        { 0xC0, 0xD6 }, { 0xD8, 0xF6 }, { 0xF8, 0x2AF }, // Latin
        { 0x386, 0x386 }, { 0x388, 0x3F5 }, { 0x3F7, 0x3FF }, // Greek
        { 0x400, 0x481 }, { 0x48A, 0x52F }, // Cyrillic
        { 0x531, 0x556 }, { 0x561, 0x587 }, // Armenian
        { 0x5D0, 0x5EA }, // Hebrew
        { 0x620, 0x64A }, { 0x660, 0x669 }, { 0x671, 0x6D3 }, // Arabic
        { 0x904, 0x939 }, { 0x966, 0x96F }, // Devanagari
        { 0xE01, 0xE30 }, { 0xE50, 0xE59 }, // Thai
        { 0x1E00, 0x1EFF }, { 0x1F00, 0x1FBC }, // Latin and Greek extended
        { 0x3041, 0x3096 }, { 0x30A1, 0x30FA }, // Hiragana, Katakana
        { 0x3400, 0x4DBF }, { 0x4E00, 0x9FFF }, // CJK ideographs
        { 0xAC00, 0xD7A3 }, // Hangul syllables
        { 0xFF10, 0xFF19 }, { 0xFF21, 0xFF3A }, { 0xFF41, 0xFF5A } // fullwidth digits and letters
    };
    for ( const auto& [first, last] : cRanges )
    {
        if ( c < first )
            return false;
        if ( c <= last )
            return true;
    }
    return false;
}

size_t utf8Length( const std::string & utf8 )
{
    return utf8ToCodePoints( utf8 ).size();
}

double roundToPrecision( double v, int precision )
{
    const double scale = std::pow( 10.0, precision );
    return std::round( v * scale ) / scale;
}

std::string toLower( std::string str )
{
    for ( auto& ch : str )
        ch = (char)std::tolower( (unsigned char)ch );
    return str;
}

std::string trim( const std::string & str )
{
    auto isSpace = [] ( char c ) { return std::isspace( (unsigned char)c ) != 0; };
    auto begin = std::find_if_not( str.begin(), str.end(), isSpace );
    auto end = std::find_if_not( str.rbegin(), str.rend(), isSpace ).base();
    if ( begin >= end )
        return {};
    return std::string( begin, end );
}

std::vector<std::string> split( const std::string & str, char separator )
{
    std::vector<std::string> res;
    size_t start = 0;
    for ( ;; )
    {
        const auto pos = str.find( separator, start );
        if ( pos == std::string::npos )
        {
            res.push_back( str.substr( start ) );
            break;
        }
        res.push_back( str.substr( start, pos - start ) );
        start = pos + 1;
    }
    return res;
}

} // namespace DS
