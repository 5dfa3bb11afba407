#pragma once

#include "binary_reader.hxx"

namespace oishii {

//! Seeks for the lifetime of the object, then restores the prior position.
template <Whence W = Whence::Current, typename T = BinaryReader> struct Jump {
  inline Jump(T& stream, u32 offset) : mStream(stream), back(stream.tell()) {
    mStream.template seek<W>(offset);
  }
  inline ~Jump() { mStream.template seek<Whence::Set>(back); }
  T& mStream;
  u32 back;
};

} // namespace oishii
