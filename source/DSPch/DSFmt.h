#pragma once

#if defined(__GNUC__) && __GNUC__ == 13 && defined(FMT_VERSION) && (FMT_VERSION >= 90000 && FMT_VERSION < 100000)
  #pragma GCC diagnostic push
  #pragma GCC diagnostic ignored "-Warray-bounds"
#endif

#include <spdlog/tweakme.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ostr.h>

#if defined(__GNUC__) && __GNUC__ == 13 && defined(FMT_VERSION) && (FMT_VERSION >= 90000 && FMT_VERSION < 100000)
  #pragma GCC diagnostic pop
#endif
