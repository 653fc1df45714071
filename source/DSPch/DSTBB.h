#pragma once

// this is to include all important for us Intel Threading Building Blocks (TBB) parts and suppress warnings there

#define TBB_SUPPRESS_DEPRECATED_MESSAGES 1
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable: 4459) //declaration of 'compare' hides global declaration
#pragma warning(disable: 4464) //relative include path contains '..'
#endif
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#ifdef _MSC_VER
#pragma warning(pop)
#endif
