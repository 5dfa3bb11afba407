#include "Texture.hpp"

IMPORT_STD;

namespace libgx::gx {

ImageFormatInfo getFormatInfo(u32 format) {
  u32 xshift = 0;
  u32 yshift = 0;
  switch (format) {
  case (u32)TextureFormat::I4:
  case (u32)TextureFormat::CMPR:
    xshift = 3;
    yshift = 3;
    break;
  case (u32)TextureFormat::I8:
  case (u32)TextureFormat::IA4:
    xshift = 3;
    yshift = 2;
    break;
  case (u32)TextureFormat::IA8:
  case (u32)TextureFormat::RGB565:
  case (u32)TextureFormat::RGB5A3:
  case (u32)TextureFormat::RGBA8:
    xshift = 2;
    yshift = 2;
    break;
  default:
    return {};
  }

  u32 bitsize = 32;
  if (format == (u32)TextureFormat::RGBA8)
    bitsize = 64;

  return {xshift, yshift, bitsize};
}

bool isKnownFormat(u32 format) { return getFormatInfo(format).bitsize != 0; }

u32 bitsPerPixel(TextureFormat format) {
  const auto info = getFormatInfo(format);
  return info.bitsize * 8 >> (info.xshift + info.yshift);
}

u32 computeImageSize(ImageFormatInfo info, u32 width, u32 height) {
  const u32 xtiles = ((width + (1 << info.xshift)) - 1) >> info.xshift;
  const u32 ytiles = ((height + (1 << info.yshift)) - 1) >> info.yshift;

  return xtiles * ytiles * info.bitsize;
}

u32 computeImageSize(u32 width, u32 height, u32 format, u32 number_of_images) {
  const auto info = getFormatInfo(format);

  if (number_of_images <= 1)
    return computeImageSize(info, width, height);

  u32 size = 0;
  for (u32 i = 0; i < number_of_images; ++i) {
    size += computeImageSize(info, mipDimension(width, i),
                             mipDimension(height, i));
  }

  return size;
}

} // namespace libgx::gx
