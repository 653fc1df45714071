#include "DSTimer.h"
#include "DSPch/DSSpdlog.h"

using namespace std::chrono;

namespace DS
{

void Timer::start( std::string name )
{
    name_ = std::move( name );
    started_ = true;
    start_ = high_resolution_clock::now();
}

void Timer::finish()
{
    if ( !started_ )
        return;
    started_ = false;
    spdlog::trace( "{} finished in {:.3f} sec", name_, secondsPassed().count() );
}

} // namespace DS
