#pragma once

#include <bit>
#include <cstring>
#include <stdint.h>

static_assert(__cpp_lib_byteswap >= 202110L, "Depends on std::byteswap");

namespace oishii {

template <uint32_t size> struct integral_of_equal_size;

template <> struct integral_of_equal_size<1> {
  using type = uint8_t;
};

template <> struct integral_of_equal_size<2> {
  using type = uint16_t;
};

template <> struct integral_of_equal_size<4> {
  using type = uint32_t;
};

template <typename T>
using integral_of_equal_size_t =
    typename integral_of_equal_size<sizeof(T)>::type;

//! @brief Convert between host order and |fileEndian|.
//!
//! @tparam T Unsigned integral of size 1, 2 or 4.
//!
template <typename T> inline T endianDecode(T val, std::endian fileEndian) {
  static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4,
                "T must of size 1, 2, or 4");
  if constexpr (sizeof(T) == 1) {
    return val;
  } else {
    return std::endian::native != fileEndian ? std::byteswap(val) : val;
  }
}

//! Read a |T| stored in |fileEndian| order at |src|
template <typename T>
inline T loadEndian(const uint8_t* src, std::endian fileEndian) {
  integral_of_equal_size_t<T> raw;
  std::memcpy(&raw, src, sizeof(T));
  return std::bit_cast<T>(endianDecode(raw, fileEndian));
}

//! Store |val| in |fileEndian| order at |dst|
template <typename T>
inline void storeEndian(uint8_t* dst, T val, std::endian fileEndian) {
  const auto raw =
      endianDecode(std::bit_cast<integral_of_equal_size_t<T>>(val), fileEndian);
  std::memcpy(dst, &raw, sizeof(T));
}

} // namespace oishii
