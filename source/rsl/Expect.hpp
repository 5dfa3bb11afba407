#pragma once

#include "Expected.hpp"
#include <fmt/format.h>
#include <string>

// clang: Merged May 16 2019, Clang 9
// GCC:   Merged May 20 2021, GCC 12 (likely to release April 2022)
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

#ifndef RSL_EXPECT_NO_USE_FORMAT
#define EXPECT(expr, ...)                                                      \
  if (!(expr)) [[unlikely]] {                                                  \
    return RSL_UNEXPECTED(fmt::format("[{}:{}] {} [Internal: {}]",             \
                                      __FILE_NAME__, __LINE__,                 \
                                      (0 __VA_OPT__(, ) __VA_ARGS__), #expr)); \
  }
#else
#define EXPECT(expr, ...)                                                      \
  if (!(expr)) [[unlikely]] {                                                  \
    return RSL_UNEXPECTED(#expr);                                              \
  }
#endif
