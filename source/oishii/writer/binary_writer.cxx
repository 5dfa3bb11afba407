#include "binary_writer.hxx"
#include "../util/util.hxx"

namespace oishii {

Writer::Writer(std::endian endian) : m_endian(endian) {}

uint32_t Writer::reserveNext(int32_t n) {
  const auto start = tell();
  if (n <= 0)
    return start;

  if (start + n > mBuf.size())
    mBuf.resize(start + n);
  return start;
}

Result<void> Writer::saveToDisk(std::string_view path) const {
  return FlushFile(mBuf, path);
}

} // namespace oishii
