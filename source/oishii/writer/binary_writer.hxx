#pragma once

#include <bit>
#include <string>
#include <vector>

#include "../Endian.hxx"
#include "../VectorStream.hxx"

#include <core/common.h>

namespace oishii {

//! @brief Writer with expanding buffer.
//!
//! Unlike the reader there is no bounds check: writes past the end grow the
//! buffer.
class Writer final : public VectorStream {
public:
  Writer(std::endian endian);

  template <typename T> void write(T val) {
    static_assert(std::is_integral_v<T>);
    if (tell() + sizeof(T) > mBuf.size())
      mBuf.resize(tell() + sizeof(T));

    storeEndian<T>(&mBuf[tell()], val, m_endian);
    seek<Whence::Current>(sizeof(T));
  }

  //! Copy |data| verbatim at the cursor, then advance past it
  void writeBuffer(std::span<const u8> data) {
    if (data.empty())
      return;
    const auto start = reserveNext(data.size());
    std::memcpy(getDataBlockStart() + start, data.data(), data.size());
    seekSet(start + data.size());
  }

  void setEndian(std::endian endian) noexcept { m_endian = endian; }
  std::endian endian() const noexcept { return m_endian; }

  //! Zero-fill up to the next multiple of |alignment|
  void alignTo(uint32_t alignment) {
    const auto pad_end = roundUp(tell(), alignment);
    while (tell() < pad_end)
      write<u8>(0);
  }

  uint32_t reserveNext(int32_t n);
  [[nodiscard]] Result<void> saveToDisk(std::string_view path) const;

private:
  std::endian m_endian = std::endian::big; // to swap
};

} // namespace oishii
