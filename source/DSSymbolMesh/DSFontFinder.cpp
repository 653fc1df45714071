#include "DSFontFinder.h"

#include "DSMesh/DSStringConvert.h"
#include "DSMesh/DSSystem.h"
#include "DSMesh/DSTimer.h"
#include "DSPch/DSSpdlog.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <set>

namespace DS
{

namespace
{

bool isFontFile( const std::filesystem::path& path )
{
    const auto ext = toLower( utf8string( path.extension() ) );
    return ext == ".ttf" || ext == ".otf" || ext == ".ttc" || ext == ".otc";
}

bool isRegularStyle( const std::string& style )
{
    const auto s = toLower( style );
    return s == "regular" || s == "book" || s == "roman" || s == "normal" || s == "medium";
}

// metric-compatible or visually close families that are commonly installed instead of proprietary ones
const std::vector<std::pair<std::string, std::vector<std::string>>>& similarFamilies()
{
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table =
    {
        { "arial", { "Liberation Sans", "Arimo", "Nimbus Sans", "FreeSans" } },
        { "helvetica", { "Liberation Sans", "Nimbus Sans", "TeX Gyre Heros", "FreeSans" } },
        { "arial black", { "DejaVu Sans Bold", "Liberation Sans Bold" } },
        { "verdana", { "DejaVu Sans" } },
        { "tahoma", { "DejaVu Sans" } },
        { "trebuchet ms", { "DejaVu Sans" } },
        { "impact", { "DejaVu Sans Condensed Bold", "Liberation Sans Narrow Bold" } },
        { "times new roman", { "Liberation Serif", "Tinos", "Nimbus Roman", "FreeSerif" } },
        { "courier new", { "Liberation Mono", "Cousine", "Nimbus Mono PS", "FreeMono" } },
    };
    return table;
}

} //anonymous namespace

FontFinder& FontFinder::instance()
{
    static FontFinder finder( getSystemFontDirectories() );
    return finder;
}

FontFinder::FontFinder( std::vector<std::filesystem::path> dirs ) :
    dirs_( std::move( dirs ) )
{
}

const std::vector<FontInfo>& FontFinder::fonts() const
{
    std::call_once( scanned_, [this] { scan_(); } );
    return fonts_;
}

void FontFinder::scan_() const
{
    DS_TIMER;
    FT_Library library = nullptr;
    if ( FT_Init_FreeType( &library ) != 0 )
    {
        spdlog::error( "Cannot initialize FreeType library" );
        return;
    }

    for ( const auto& dir : dirs_ )
    {
        std::error_code ec;
        std::vector<std::filesystem::path> files;
        for ( auto it = std::filesystem::recursive_directory_iterator( dir, std::filesystem::directory_options::skip_permission_denied, ec );
            !ec && it != std::filesystem::recursive_directory_iterator(); it.increment( ec ) )
        {
            if ( it->is_regular_file( ec ) && isFontFile( it->path() ) )
                files.push_back( it->path() );
        }
        if ( ec )
            spdlog::debug( "Font directory {} scan stopped: {}", utf8string( dir ), systemToUtf8( ec.message() ) );
        std::sort( files.begin(), files.end() );

        for ( const auto& file : files )
        {
            FT_Long numFaces = 1;
            for ( FT_Long faceIndex = 0; faceIndex < numFaces; ++faceIndex )
            {
                FT_Face face = nullptr;
                if ( FT_New_Face( library, utf8string( file ).c_str(), faceIndex, &face ) != 0 )
                {
                    spdlog::debug( "Cannot open font file {}", utf8string( file ) );
                    break;
                }
                numFaces = face->num_faces;
                if ( FT_IS_SCALABLE( face ) && face->family_name )
                {
                    fonts_.push_back( {
                        .family = face->family_name,
                        .style = face->style_name ? face->style_name : "",
                        .path = file,
                        .faceIndex = int( faceIndex )
                    } );
                }
                FT_Done_Face( face );
            }
        }
    }
    FT_Done_FreeType( library );
    spdlog::debug( "Found {} font faces", fonts_.size() );
}

std::vector<std::string> FontFinder::availableFamilies() const
{
    std::set<std::string> families;
    for ( const auto& f : fonts() )
        families.insert( f.family );
    return { families.begin(), families.end() };
}

Expected<FontInfo> FontFinder::findFamily( const std::string& family ) const
{
    const auto name = toLower( trim( family ) );
    const FontInfo* regular = nullptr;
    const FontInfo* any = nullptr;
    const FontInfo* styled = nullptr;
    for ( const auto& f : fonts() )
    {
        const auto fam = toLower( f.family );
        if ( fam == name )
        {
            if ( !any )
                any = &f;
            if ( !regular && isRegularStyle( f.style ) )
                regular = &f;
        }
        else if ( !styled && toLower( f.family + " " + f.style ) == name )
            styled = &f;
    }
    if ( regular )
        return *regular;
    if ( styled )
        return *styled;
    if ( any )
        return *any;
    return unexpected( "Font family '" + family + "' is not installed" );
}

Expected<FontInfo> FontFinder::resolve( const std::string& fontNameOrPath, bool allowFallback ) const
{
    std::error_code ec;
    const auto asPath = pathFromUtf8( fontNameOrPath );
    if ( isFontFile( asPath ) && std::filesystem::is_regular_file( asPath, ec ) )
        return FontInfo{ .family = utf8string( asPath.stem() ), .style = {}, .path = asPath, .faceIndex = 0 };

    auto found = findFamily( fontNameOrPath );
    if ( found || !allowFallback )
        return found;

    const auto name = toLower( trim( fontNameOrPath ) );
    for ( const auto& [key, similar] : similarFamilies() )
    {
        if ( key != name )
            continue;
        for ( const auto& s : similar )
        {
            if ( auto f = findFamily( s ) )
            {
                spdlog::info( "Font '{}' is not installed, using similar '{}'", fontNameOrPath, f->family );
                return f;
            }
        }
    }
    for ( const auto& fallback : fallbackFamilies() )
    {
        if ( auto f = findFamily( fallback ) )
        {
            spdlog::warn( "Font '{}' is not installed, using '{}'", fontNameOrPath, f->family );
            return f;
        }
    }
    if ( !fonts().empty() )
    {
        spdlog::warn( "Font '{}' is not installed, using '{}'", fontNameOrPath, fonts().front().family );
        return fonts().front();
    }
    return unexpected( "No fonts are installed" );
}

const std::vector<std::string>& FontFinder::fallbackFamilies()
{
    static const std::vector<std::string> families =
    {
        "DejaVu Sans", "Liberation Sans", "FreeSans", "Noto Sans", "Ubuntu", "Cantarell"
    };
    return families;
}

std::vector<std::string> availableFontFamilies()
{
    return FontFinder::instance().availableFamilies();
}

}
