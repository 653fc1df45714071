#include "DSSignWorker.h"
#include "DSMesh/DSTimer.h"
#include "DSPch/DSSpdlog.h"

#include <exception>

namespace DS
{

SignWorker::~SignWorker()
{
    if ( thread_.joinable() )
        thread_.join();
}

bool SignWorker::order( std::string name, TaskWithPostProcessing task, FailureHandler onFailure )
{
    if ( ordered_ )
    {
        spdlog::warn( "Cannot start \"{}\": \"{}\" is in progress", name, lastTaskName() );
        return false;
    }
    if ( thread_.joinable() )
        thread_.join();

    {
        std::lock_guard lock( mutex_ );
        taskName_ = std::move( name );
        onFinish_ = {};
    }
    finished_ = false;
    ordered_ = true;

    thread_ = std::thread( [this, task = std::move( task ), onFailure = std::move( onFailure )]
    {
        std::function<void()> onFinish;
        std::string error;
        {
            DS_NAMED_TIMER( lastTaskName() );
            try
            {
                onFinish = task();
            }
            catch ( const std::exception& e )
            {
                error = e.what();
                if ( error.empty() )
                    error = "Unknown error";
            }
            catch ( ... )
            {
                error = "Unknown error";
            }
        }
        if ( !error.empty() )
        {
            spdlog::error( "Task \"{}\" failed: {}", lastTaskName(), error );
            onFinish = [onFailure, error]
            {
                if ( onFailure )
                    onFailure( error );
            };
        }
        {
            std::lock_guard lock( mutex_ );
            onFinish_ = std::move( onFinish );
        }
        finished_ = true;
    } );
    return true;
}

bool SignWorker::isOrdered() const
{
    return ordered_;
}

bool SignWorker::isFinished() const
{
    return finished_;
}

bool SignWorker::processFinished()
{
    if ( !ordered_ || !finished_ )
        return false;
    if ( thread_.joinable() )
        thread_.join();

    std::function<void()> onFinish;
    {
        std::lock_guard lock( mutex_ );
        onFinish = std::move( onFinish_ );
        onFinish_ = {};
    }
    ordered_ = false;
    if ( onFinish )
        onFinish();
    return true;
}

void SignWorker::wait()
{
    if ( !ordered_ )
        return;
    if ( thread_.joinable() )
        thread_.join();
    processFinished();
}

std::string SignWorker::lastTaskName() const
{
    std::lock_guard lock( mutex_ );
    return taskName_;
}

} //namespace DS
