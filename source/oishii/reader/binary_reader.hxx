#pragma once

#include "../Endian.hxx"
#include "../VectorStream.hxx"
#include "../interfaces.hxx"

#include <core/common.h>

namespace oishii {

class BinaryReader final : public VectorStream {
public:
  //! Failure type is always `std::string`
  template <typename T> using Result = std::expected<T, std::string>;

  //! Read file from memory
  BinaryReader(std::vector<u8>&& view, std::string_view path,
               std::endian endian);
  BinaryReader(std::span<const u8> view, std::string_view path,
               std::endian endian);
  BinaryReader(const BinaryReader&) = delete;
  BinaryReader(BinaryReader&&);
  ~BinaryReader();

  //! Read file from disc
  static Result<BinaryReader> FromFilePath(std::string_view path,
                                           std::endian endian);

  // The |BinaryReader| keeps track of the files endianness
  std::endian endian() const { return mFileEndian; }
  void setEndian(std::endian endian) noexcept { mFileEndian = endian; }

  // Path of the file or "Unknown path"
  const char* getFile() const noexcept { return m_path.c_str(); }

  //! Get a read-only view of the file
  std::span<const u8> slice() const { return mBuf; }

  //! Pop a value from the stream (of type |T|). The stream only advances on
  //! success.
  template <typename T> Result<T> tryRead() {
    auto result = tryGetAt<T>(tell());
    if (result.has_value()) {
      seekSet(tell() + sizeof(T));
    }
    return result;
  }

  //! Pop |n| values from the stream (each of type |T|)
  template <typename T, //
            u32 n>
  auto tryReadX() -> Result<std::array<T, n>> {
    std::array<T, n> result;
    for (auto& r : result) {
      r = TRY(tryRead<T>());
    }
    return result;
  }

  //! Get a naturally aligned value from an arbitrary point in the file
  template <typename T> auto tryGetAt(u32 trans) -> Result<T> {
    static_assert(std::is_integral_v<T>);
    if (trans % sizeof(T)) {
      return std::unexpected(
          fmt::format("Alignment error: {} is not {}-byte aligned.", trans,
                      sizeof(T)));
    }

    if (static_cast<u64>(trans) + sizeof(T) > endpos()) {
      return std::unexpected(fmt::format(
          "Bounds error: Reading {} bytes from {} exceeds buffer size of {}",
          sizeof(T), trans, endpos()));
    }

    return loadEndian<T>(getStreamStart() + trans, mFileEndian);
  }

  struct ScopedRegion {
    ScopedRegion(BinaryReader& reader, std::string&& name) : mReader(reader) {
      mReader.enterRegion(std::move(name), reader.tell());
    }
    ~ScopedRegion() { mReader.exitRegion(); }

    BinaryReader& mReader;
  };

  //! Create a debug frame. warnAt prints the frames that are open.
  auto createScoped(std::string&& region) {
    return ScopedRegion(*this, std::move(region));
  }

  //! Print a warning message, with a hex dump of the selection at debug level
  void warnAt(const char* msg, u32 selectBegin, u32 selectEnd,
              bool checkStack = true);

  template <typename T>
  auto tryReadBuffer(u32 size, u32 addr) -> Result<std::vector<T>> {
    static_assert(sizeof(T) == 1);
    if (static_cast<u64>(addr) + size > endpos()) {
      return std::unexpected(
          fmt::format("Buffer read of {} bytes at {} exceeds file length {}",
                      size, addr, endpos()));
    }
    std::vector<T> out(size);
    std::copy_n(mBuf.begin() + addr, size, out.begin());
    return out;
  }
  template <typename T> auto tryReadBuffer(u32 size) -> Result<std::vector<T>> {
    auto buf = TRY(tryReadBuffer<T>(size, tell()));
    seekSet(tell() + size);
    return buf;
  }

private:
  std::string m_path = "Unknown Path";
  std::endian mFileEndian = std::endian::big;

  struct Region {
    std::string name;
    u32 start = 0;
  };
  std::vector<Region> mRegions;
  void enterRegion(std::string&& name, u32 start);
  void exitRegion();
};

} // namespace oishii

#include "stream_raii.hpp"
