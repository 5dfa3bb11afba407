#pragma once

#include <version>

#if __cpp_lib_expected >= 202202L
#include <expected>
#define RSL_UNEXPECTED std::unexpected
#else
#error "Unsupported compiler version: must support std::expected"
#endif
