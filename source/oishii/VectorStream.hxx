#pragma once

#include "AbstractStream.hxx"
#include <vector>

namespace oishii {

//! Stream over an owned, in-memory buffer
class VectorStream : public AbstractStream {
public:
  VectorStream() = default;
  VectorStream(std::vector<uint8_t> buf) : mBuf(std::move(buf)) {}

  virtual void seekSet(uint32_t pos) override { mPos = pos; }
  virtual uint32_t tell() const override { return mPos; }
  virtual uint32_t endpos() const override { return mBuf.size(); }

  uint8_t* getDataBlockStart() { return mBuf.data(); }
  const uint8_t* getStreamStart() const { return mBuf.data(); }
  std::vector<uint8_t>&& takeBuf() { return std::move(mBuf); }

  std::vector<uint8_t> mBuf;
  uint32_t mPos = 0;
};

} // namespace oishii
