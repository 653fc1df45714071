#include "DSLog.h"

#include "DSPch/DSSpdlog.h"

namespace DS
{

Logger& Logger::instance()
{
    static Logger theLogger;
    return theLogger;
}

void Logger::trace( std::string_view msg )
{
    instance().logger_->trace( msg );
}

void Logger::debug( std::string_view msg )
{
    instance().logger_->debug( msg );
}

void Logger::info( std::string_view msg )
{
    instance().logger_->info( msg );
}

void Logger::warn( std::string_view msg )
{
    instance().logger_->warn( msg );
}

void Logger::error( std::string_view msg )
{
    instance().logger_->error( msg );
}

const std::shared_ptr<spdlog::logger>& Logger::getSpdLogger() const
{
    return logger_;
}

std::string Logger::getDefaultPattern() const
{
    return "[%d/%m/%C %H:%M:%S.%e] [%^%l%$] %v";
}

void Logger::addSink( const spdlog::sink_ptr& sink )
{
    logger_->sinks().push_back( sink );
}

Logger::Logger()
{
    logger_ = spdlog::get( "MainLogger" );
    if ( logger_ )
        return;

    logger_ = std::make_shared<spdlog::logger>( "MainLogger" );
    spdlog::register_logger( logger_ );

    spdlog::set_default_logger( logger_ );
}

}
