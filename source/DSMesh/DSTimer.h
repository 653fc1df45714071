#pragma once

#include "DSMeshFwd.h"
#include <chrono>
#include <string>
#include <utility>

namespace DS
{

/// \addtogroup BasicGroup
/// \{

/// measures the time between construction and destruction and logs it with trace level
class Timer
{
public:
    Timer( std::string name ) { start( std::move( name ) ); }
    Timer( Timer&& other ) noexcept : name_( std::move( other.name_ ) ), start_( std::exchange( other.start_, {} ) ), started_( std::exchange( other.started_, {} ) ) {}
    Timer& operator=( Timer other ) noexcept { std::swap( name_, other.name_ ); std::swap( start_, other.start_ ); std::swap( started_, other.started_ ); return *this; }
    ~Timer() { finish(); }

    DSMESH_API void start( std::string name );
    DSMESH_API void finish();

    std::chrono::duration<double> secondsPassed() const { return std::chrono::high_resolution_clock::now() - start_; }

private:
    std::string name_;
    std::chrono::time_point<std::chrono::high_resolution_clock> start_;
    bool started_{ false };
};

/// \}

} // namespace DS

#define DS_TIMER DS::Timer _timer( __FUNCTION__ );
#define DS_NAMED_TIMER(name) DS::Timer _named_timer( name );
