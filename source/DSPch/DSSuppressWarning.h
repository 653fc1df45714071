#pragma once

#define DS_STR_( x ) #x
#define DS_STR( x ) DS_STR_( x )

// Macros for disabling compiler warnings.
// `MESSAGE' is diagnostic message name used by Clang and GCC.
// `NUMBER` is warning number used by MSVC.
#if defined( __clang__ )
    #define DS_SUPPRESS_WARNING_PUSH \
        _Pragma( "clang diagnostic push" )
    #define DS_SUPPRESS_WARNING( MESSAGE, NUMBER ) \
        _Pragma( DS_STR(clang diagnostic ignored MESSAGE) )
    #define DS_SUPPRESS_WARNING_POP \
        _Pragma( "clang diagnostic pop" )
#elif defined( __GNUC__ )
    #define DS_SUPPRESS_WARNING_PUSH \
        _Pragma( "GCC diagnostic push" )
    #define DS_SUPPRESS_WARNING( MESSAGE, NUMBER ) \
        _Pragma( DS_STR(GCC diagnostic ignored MESSAGE) )
    #define DS_SUPPRESS_WARNING_POP \
        _Pragma( "GCC diagnostic pop" )
#elif defined( _MSC_VER )
    #define DS_SUPPRESS_WARNING_PUSH \
        __pragma( warning( push ) )
    #define DS_SUPPRESS_WARNING( MESSAGE, NUMBER ) \
        __pragma( warning( disable: NUMBER ) )
    #define DS_SUPPRESS_WARNING_POP \
        __pragma( warning( pop ) )
#else
    #define DS_SUPPRESS_WARNING_PUSH
    #define DS_SUPPRESS_WARNING( MESSAGE, NUMBER )
    #define DS_SUPPRESS_WARNING_POP
#endif
