#pragma once

#include "DSSignFwd.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace DS
{

/// runs at most one long task at a time in a separate thread;
/// the task returns a function to be executed in the owner thread from processFinished()
class DSSIGN_CLASS SignWorker
{
public:
    /// function that returns post-processing function to be called in the owner thread
    using TaskWithPostProcessing = std::function<std::function<void()>()>;
    /// called in the owner thread with the error message if the task throws
    using FailureHandler = std::function<void( const std::string& )>;

    SignWorker() = default;
    SignWorker( const SignWorker& ) = delete;
    SignWorker& operator=( const SignWorker& ) = delete;
    /// waits for the running task, its post-processing is not called
    DSSIGN_API ~SignWorker();

    /// starts the task in a new thread; returns false if another task is in flight;
    /// an exception escaping the task is logged and passed to onFailure from processFinished()
    DSSIGN_API bool order( std::string name, TaskWithPostProcessing task, FailureHandler onFailure = {} );

    /// true if a task is ordered and its post-processing has not been run yet
    [[nodiscard]] DSSIGN_API bool isOrdered() const;
    /// true if the ordered task has finished its work
    [[nodiscard]] DSSIGN_API bool isFinished() const;

    /// if the task has finished, joins its thread, runs post-processing and returns true
    DSSIGN_API bool processFinished();

    /// blocks until the task finishes, then runs post-processing
    DSSIGN_API void wait();

    /// name of the last ordered task
    [[nodiscard]] DSSIGN_API std::string lastTaskName() const;

private:
    mutable std::mutex mutex_;
    std::thread thread_;
    std::function<void()> onFinish_;
    std::string taskName_;
    std::atomic<bool> ordered_{ false };
    std::atomic<bool> finished_{ false };
};

} //namespace DS
