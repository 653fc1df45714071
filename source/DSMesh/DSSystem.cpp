#include "DSSystem.h"
#include "DSConfig.h"
#include "DSLog.h"
#include "DSStringConvert.h"
#include "DSPch/DSSpdlog.h"

#include <spdlog/fmt/chrono.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

#ifndef DS_PROJECT_NAME
#define DS_PROJECT_NAME "DuoSign"
#endif

#ifndef DS_VERSION
#define DS_VERSION "1.0.0"
#endif

namespace
{

void removeOldLogs( const std::filesystem::path& dir, int hours = 24 )
{
    std::error_code ec;
    if ( !std::filesystem::is_directory( dir, ec ) )
        return;

    auto now = std::chrono::system_clock::now();
    std::time_t nowSinceEpoch = std::chrono::system_clock::to_time_t( now );

    for ( const auto& entry : std::filesystem::directory_iterator( dir, ec ) )
    {
        auto fileName = DS::utf8string( entry.path().filename() );
        auto prefixOffset = fileName.find( "DSLog_" );
        if ( prefixOffset == std::string::npos )
            continue; // not log file
        std::tm tm{};
        std::stringstream ss( fileName.substr( prefixOffset + 6, 19 ) );
        ss >> std::get_time( &tm, "%Y-%m-%d_%H-%M-%S" );
        if ( ss.fail() )
            continue; // cannot parse time
        std::time_t fileDateSinceEpoch = std::mktime( &tm );
        auto diffHours = ( nowSinceEpoch - fileDateSinceEpoch ) / 3600;
        if ( diffHours < hours )
            continue; // "young" file
        std::filesystem::remove( entry.path(), ec );
    }
}

}

namespace DS
{

std::filesystem::path getUserConfigDir()
{
#if defined( _WIN32 )
    std::filesystem::path filepath( _wgetenv( L"APPDATA" ) );
#else
    std::filesystem::path filepath;
    const auto* pw = getpwuid( getuid() );
    if ( pw )
    {
        filepath = pw->pw_dir;
    }
    else
    {
        spdlog::error( "getpwuid error! errno: {}", errno );
        filepath = GetHomeDirectory();
    }
    filepath /= ".local";
    filepath /= "share";
#endif
    filepath /= std::string( Config::instance().getAppName() );
    std::error_code ec;
    if ( !std::filesystem::is_directory( filepath, ec ) || ec )
    {
        if ( ec )
            spdlog::info( "{} is not a valid directory yet: {}", utf8string( filepath ), systemToUtf8( ec.message() ) );
        std::filesystem::create_directories( filepath, ec );
        if ( ec )
            spdlog::error( "create directories {} failed: {}", utf8string( filepath ), systemToUtf8( ec.message() ) );
    }
    return filepath;
}

std::filesystem::path getUserConfigFilePath()
{
    std::filesystem::path filepath = getUserConfigDir();
    filepath /= "config.json";
    return filepath;
}

std::filesystem::path GetTempDirectory()
{
    std::error_code ec;
    auto res = std::filesystem::temp_directory_path( ec );
    if ( ec )
        return {};
    res /= DS_PROJECT_NAME;

    if ( !std::filesystem::is_directory( res, ec ) )
    {
        ec.clear();
        if ( !std::filesystem::create_directories( res, ec ) )
            return {};
    }

    return res;
}

std::filesystem::path GetHomeDirectory()
{
#if defined( _WIN32 )
    if ( auto* home = _wgetenv( L"USERPROFILE" ) )
        return home;
#else
    if ( auto* home = std::getenv( "HOME" ) )
        return home;
    if ( auto* pw = getpwuid( getuid() ) )
        return pw->pw_dir;
#endif
    return {};
}

std::vector<std::filesystem::path> getSystemFontDirectories()
{
    std::vector<std::filesystem::path> candidates;
#if defined( _WIN32 )
    if ( auto* windir = std::getenv( "WINDIR" ) )
        candidates.push_back( std::filesystem::path( windir ) / "Fonts" );
#elif defined( __APPLE__ )
    candidates.push_back( "/System/Library/Fonts" );
    candidates.push_back( "/Library/Fonts" );
    candidates.push_back( GetHomeDirectory() / "Library" / "Fonts" );
#else
    candidates.push_back( "/usr/share/fonts" );
    candidates.push_back( "/usr/local/share/fonts" );
    if ( auto* dataHome = std::getenv( "XDG_DATA_HOME" ) )
        candidates.push_back( std::filesystem::path( dataHome ) / "fonts" );
    candidates.push_back( GetHomeDirectory() / ".local" / "share" / "fonts" );
    candidates.push_back( GetHomeDirectory() / ".fonts" );
#endif
    std::vector<std::filesystem::path> res;
    for ( auto& dir : candidates )
    {
        std::error_code ec;
        if ( std::filesystem::is_directory( dir, ec ) )
            res.push_back( std::move( dir ) );
    }
    return res;
}

std::string GetDSVersionString()
{
    std::string configPrefix = "";
#ifndef NDEBUG
    configPrefix = "Debug: ";
#endif
    return configPrefix + DS_VERSION;
}

void setupLoggerByDefault( bool verbose )
{
    // write log to console
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level( verbose ? spdlog::level::debug : spdlog::level::info );
    console_sink->set_pattern( Logger::instance().getDefaultPattern() );
    Logger::instance().addSink( console_sink );

    // write log to file
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t( now );
    auto fileName = GetTempDirectory();
    if ( !fileName.empty() )
    {
        fileName /= "Logs";
        removeOldLogs( fileName );

        fileName /= fmt::format( "DSLog_{:%Y-%m-%d_%H-%M-%S}_{}.txt", fmt::localtime( t ),
                    std::chrono::duration_cast<std::chrono::milliseconds>( now.time_since_epoch() ).count() % 1000 );

        try
        {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>( utf8string( fileName ), 1024 * 1024 * 5, 1, true );
            file_sink->set_level( spdlog::level::trace );
            file_sink->set_pattern( Logger::instance().getDefaultPattern() );
            Logger::instance().addSink( file_sink );
        }
        catch ( const spdlog::spdlog_ex& e )
        {
            spdlog::warn( "Cannot create log file {}: {}", utf8string( fileName ), e.what() );
        }
    }

    auto logger = Logger::instance().getSpdLogger();

    logger->set_level( spdlog::level::trace );

    // update file on each msg
    logger->flush_on( spdlog::level::trace );

    spdlog::debug( "DuoSign version info: {}", GetDSVersionString() );
}

} //namespace DS
