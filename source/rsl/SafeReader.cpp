#include "SafeReader.hpp"

#include <algorithm>
#include <ranges>

namespace rsl {

void SafeReader::seekSet(u32 pos) { mReader.seekSet(pos); }
auto SafeReader::tell() const -> u32 { return mReader.tell(); }

auto SafeReader::U32() -> Result<u32> { return mReader.tryRead<u32>(); }
auto SafeReader::S32() -> Result<s32> { return mReader.tryRead<s32>(); }
auto SafeReader::U16() -> Result<u16> { return mReader.tryRead<u16>(); }

auto SafeReader::Magic(std::string_view ident) -> Result<std::string_view> {
  auto buf = TRY(mReader.tryReadBuffer<char>(ident.size()));
  if (!std::ranges::equal(buf, ident)) {
    auto buf_s = std::string(buf.begin(), buf.end());
    auto msg =
        fmt::format("Expected magic identifier {} at {}. Instead saw {}.",
                    ident, mReader.tell() - ident.size(), buf_s);
    mReader.warnAt(msg.c_str(), mReader.tell() - ident.size(), mReader.tell());
    return std::unexpected(msg);
  }
  return ident;
}

SafeReader::Result<std::string> SafeReader::StringAt(u32 at) {
  if (at >= mReader.endpos()) [[unlikely]] {
    return std::unexpected(fmt::format(
        "Invalid string offset {}. Out of file bounds [0, {})", at,
        mReader.endpos()));
  }

  auto span = mReader.slice().subspan(at);
  auto end = std::ranges::find(span, u8(0));

  // very unlikely
  if (end == span.end()) [[unlikely]] {
    return std::unexpected("File has been truncated. String does not contain "
                           "a final null terminator");
  }

  return std::string{reinterpret_cast<const char*>(span.data()),
                     reinterpret_cast<const char*>(&*end)};
}

} // namespace rsl
