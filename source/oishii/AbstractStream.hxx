#pragma once

#include "interfaces.hxx"

namespace oishii {

class AbstractStream {
public:
  virtual ~AbstractStream() = default;

  template <Whence W = Whence::Set> void seek(int ofs) {
    if constexpr (W == Whence::Set) {
      seekSet(ofs);
    } else if (ofs != 0) {
      seekSet(tell() + ofs);
    }
  }

  void skip(int ofs) { seek<Whence::Current>(ofs); }

  virtual void seekSet(uint32_t pos) = 0;
  virtual uint32_t tell() const = 0;
  virtual uint32_t endpos() const = 0;
};

} // namespace oishii
