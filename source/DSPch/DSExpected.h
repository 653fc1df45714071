#pragma once

#ifndef DS_USE_STD_EXPECTED
// std::expected requires C++23, the build switches to it only when tl-expected is not installed
#define DS_USE_STD_EXPECTED 0
#endif

#if DS_USE_STD_EXPECTED

#include <expected>

#else // !DS_USE_STD_EXPECTED

#ifndef DS_NODISCARD_TL_EXPECTED
// declare tl::expected as nodiscard
#define DS_NODISCARD_TL_EXPECTED 1
#endif

#if DS_NODISCARD_TL_EXPECTED
#include "DSSuppressWarning.h"
DS_SUPPRESS_WARNING_PUSH
DS_SUPPRESS_WARNING( "-Wattributes", 5240 )
namespace tl { template <class T, class E> class [[nodiscard]] expected; }
DS_SUPPRESS_WARNING_POP
#endif

#include <tl/expected.hpp>

#endif
