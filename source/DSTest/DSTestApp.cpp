#include "DSMesh/DSGTest.h"
#include "DSMesh/DSSystem.h"
#include "DSPch/DSSpdlog.h"

int main( int argc, char** argv )
{
    DS::setupLoggerByDefault();

    // print compiler info
#ifdef __clang__
    spdlog::info( "{}", __VERSION__ );
#elif defined __GNUC__
    spdlog::info( "GCC {}", __VERSION__ );
#else
    spdlog::info( "MSVC {}", _MSC_FULL_VER );
#endif

    // print standard library info
#ifdef __GLIBCXX__
    spdlog::info( "GNU libstdc++ version {}", __GLIBCXX__ );
#endif
#ifdef _LIBCPP_VERSION
    spdlog::info( "Clang's libc++ version {}", _LIBCPP_VERSION );
#endif
    spdlog::info( "DuoSign version {}", DS::GetDSVersionString() );

    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
