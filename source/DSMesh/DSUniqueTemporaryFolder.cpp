#include "DSUniqueTemporaryFolder.h"

#include "DSStringConvert.h"
#include "DSTimer.h"
#include "DSPch/DSSpdlog.h"

#include <ctime>

namespace DS
{

UniqueTemporaryFolder::UniqueTemporaryFolder()
{
    DS_TIMER;

    std::error_code ec;
    const auto tmp = std::filesystem::temp_directory_path( ec );
    if ( ec )
    {
        spdlog::error( "Cannot get temporary directory: {}", systemToUtf8( ec.message() ) );
        return;
    }

    constexpr int MAX_ATTEMPTS = 32;
    // current time skips folders left by terminated processes
    auto t0 = std::time( nullptr );
    for ( int i = 0; i < MAX_ATTEMPTS; ++i )
    {
        auto folder = tmp / ( "DuoSign" + std::to_string( t0 + i ) );
        if ( create_directories( folder, ec ) )
        {
            folder_ = std::move( folder );
            spdlog::debug( "Temporary folder created: {}", utf8string( folder_ ) );
            break;
        }
    }
    if ( folder_.empty() )
        spdlog::error( "Failed to create unique temporary folder" );
}

UniqueTemporaryFolder::~UniqueTemporaryFolder()
{
    if ( folder_.empty() )
        return;

    DS_TIMER;

    spdlog::debug( "Deleting temporary folder: {}", utf8string( folder_ ) );
    std::error_code ec;
    if ( !std::filesystem::remove_all( folder_, ec ) )
        spdlog::error( "Folder {} did not exist", utf8string( folder_ ) );
    else if ( ec )
        spdlog::error( "Deleting folder {} failed: {}", utf8string( folder_ ), systemToUtf8( ec.message() ) );
}

} // namespace DS
