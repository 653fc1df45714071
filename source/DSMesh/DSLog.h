#pragma once

#include "DSMeshFwd.h"

#include <memory>
#include <string_view>

namespace spdlog
{
class logger;
namespace sinks { class sink; }
using sink_ptr = std::shared_ptr<sinks::sink>;
}

namespace DS
{

/// \addtogroup BasicGroup
/// \{

/// Make default spd logger
class Logger
{
public:
    DSMESH_API static Logger& instance();

    /// simple methods to log messages
    /// for more optimal methods use getSpdLogger()
    DSMESH_API static void trace( std::string_view msg );
    DSMESH_API static void debug( std::string_view msg );
    DSMESH_API static void info( std::string_view msg );
    DSMESH_API static void warn( std::string_view msg );
    DSMESH_API static void error( std::string_view msg );

    /// store this pointer if need to prolong logger life time (necessary to log something from destructors)
    DSMESH_API const std::shared_ptr<spdlog::logger>& getSpdLogger() const;

    /// returns default logger pattern
    DSMESH_API std::string getDefaultPattern() const;

    /// adds custom sink to logger
    DSMESH_API void addSink( const spdlog::sink_ptr& sink );
private:
    Logger();
    std::shared_ptr<spdlog::logger> logger_;
};

/// \}

}
