#pragma once

#include <core/common.h>

namespace libgx::gx {

enum class TextureFormat : u32 {
  I4 = 0x0,
  I8 = 0x1,
  IA4 = 0x2,
  IA8 = 0x3,
  RGB565 = 0x4,
  RGB5A3 = 0x5,
  RGBA8 = 0x6,

  CMPR = 0xE,
};

//! Tile geometry of a format: tiles are (1 << xshift) x (1 << yshift) pixels
//! and |bitsize| bytes.
struct ImageFormatInfo {
  u32 xshift = 0;
  u32 yshift = 0;
  u32 bitsize = 0;
};

//! Returns a zeroed ImageFormatInfo for unknown codes.
ImageFormatInfo getFormatInfo(u32 format);
inline ImageFormatInfo getFormatInfo(TextureFormat format) {
  return getFormatInfo(static_cast<u32>(format));
}

//! True if |format| names a pixel format the codec implements.
bool isKnownFormat(u32 format);
//! C4, C8 and C14X2. Valid hardware formats without palette support here.
inline bool isPaletteFormat(u32 format) {
  return format >= 0x8 && format <= 0xA;
}

u32 bitsPerPixel(TextureFormat format);

inline u32 tileWidth(TextureFormat format) {
  return 1u << getFormatInfo(format).xshift;
}
inline u32 tileHeight(TextureFormat format) {
  return 1u << getFormatInfo(format).yshift;
}

//! Dimension of mip level |level| for a base dimension of |base|
inline u32 mipDimension(u32 base, u32 level) {
  return level >= 32 ? 1 : std::max<u32>(1, base >> level);
}

u32 computeImageSize(ImageFormatInfo info, u32 width, u32 height);
u32 computeImageSize(u32 width, u32 height, u32 format, u32 number_of_images);
inline u32 computeImageSize(u32 width, u32 height, TextureFormat format,
                            u32 number_of_images) {
  return computeImageSize(width, height, static_cast<u32>(format),
                          number_of_images);
}

} // namespace libgx::gx
