#pragma once

#include "types.hxx"

namespace oishii {

enum class Whence {
  Set,     // Absolute -- start of file
  Current, // Relative -- current position
};

} // namespace oishii
