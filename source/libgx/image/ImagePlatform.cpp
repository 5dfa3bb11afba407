#include "ImagePlatform.hpp"
#include "CmprEncoder.hpp"

IMPORT_STD;

namespace libgx::image {

namespace {

using Color = std::array<u8, 4>;

constexpr u8 expand3(u8 v) { return static_cast<u8>(v << 5 | v << 2 | v >> 1); }
constexpr u8 expand4(u8 v) { return static_cast<u8>(v * 0x11); }
constexpr u8 expand5(u8 v) { return static_cast<u8>(v << 3 | v >> 2); }
constexpr u8 expand6(u8 v) { return static_cast<u8>(v << 2 | v >> 4); }

constexpr u8 intensity(const Color& c) {
  return static_cast<u8>((30 * c[0] + 59 * c[1] + 11 * c[2]) / 100);
}

u16 packRGB5A3(const Color& c) {
  if (c[3] == 0xff) {
    return static_cast<u16>(0x8000 | (c[0] >> 3) << 10 | (c[1] >> 3) << 5 |
                            c[2] >> 3);
  }
  return static_cast<u16>((c[3] >> 5) << 12 | (c[0] >> 4) << 8 |
                          (c[1] >> 4) << 4 | c[2] >> 4);
}
Color unpackRGB5A3(u16 v) {
  if (v & 0x8000) {
    return {expand5(v >> 10 & 0x1f), expand5(v >> 5 & 0x1f),
            expand5(v & 0x1f), 0xff};
  }
  return {expand4(v >> 8 & 0xf), expand4(v >> 4 & 0xf), expand4(v & 0xf),
          expand3(v >> 12 & 0x7)};
}

u16 packRGB565(const Color& c) {
  return static_cast<u16>((c[0] >> 3) << 11 | (c[1] >> 2) << 5 | c[2] >> 3);
}
Color unpackRGB565(u16 v) {
  return {expand5(v >> 11), expand6(v >> 5 & 0x3f), expand5(v & 0x1f), 0xff};
}

//! Calls |f(x, y)| for every pixel of the padded image, in on-disk order.
template <typename F>
void forEachTexel(u32 width, u32 height, gx::TextureFormat format, F&& f) {
  const u32 tw = gx::tileWidth(format);
  const u32 th = gx::tileHeight(format);
  for (u32 ty = 0; ty < height; ty += th) {
    for (u32 tx = 0; tx < width; tx += tw) {
      for (u32 y = 0; y < th; ++y) {
        for (u32 x = 0; x < tw; ++x) {
          f(tx + x, ty + y);
        }
      }
    }
  }
}

//! Row-major RGBA image with edge replication for out-of-range reads.
struct RGBA32ImageSource {
  std::span<const u8> buf;
  u32 width;
  u32 height;

  Color at(u32 x, u32 y) const {
    x = std::min(x, width - 1);
    y = std::min(y, height - 1);
    Color c;
    std::memcpy(c.data(), &buf[(y * width + x) * 4], 4);
    return c;
  }
};

struct RGBA32ImageTarget {
  std::span<u8> buf;
  u32 width;
  u32 height;

  void set(u32 x, u32 y, const Color& c) {
    if (x >= width || y >= height)
      return;
    std::memcpy(&buf[(y * width + x) * 4], c.data(), 4);
  }
};

void decodeRGBA8(RGBA32ImageTarget& dst, std::span<const u8> src) {
  // Each 4x4 tile is 32 bytes of AR pairs followed by 32 bytes of GB pairs
  const u8* tile = src.data();
  for (u32 ty = 0; ty < dst.height; ty += 4) {
    for (u32 tx = 0; tx < dst.width; tx += 4) {
      for (u32 i = 0; i < 16; ++i) {
        const Color c{tile[i * 2 + 1], tile[32 + i * 2], tile[32 + i * 2 + 1],
                      tile[i * 2]};
        dst.set(tx + i % 4, ty + i / 4, c);
      }
      tile += 64;
    }
  }
}

void encodeRGBA8(std::span<u8> dst, const RGBA32ImageSource& src) {
  u8* tile = dst.data();
  for (u32 ty = 0; ty < src.height; ty += 4) {
    for (u32 tx = 0; tx < src.width; tx += 4) {
      for (u32 i = 0; i < 16; ++i) {
        const auto c = src.at(tx + i % 4, ty + i / 4);
        tile[i * 2] = c[3];
        tile[i * 2 + 1] = c[0];
        tile[32 + i * 2] = c[1];
        tile[32 + i * 2 + 1] = c[2];
      }
      tile += 64;
    }
  }
}

void decodeCMPR(RGBA32ImageTarget& dst, std::span<const u8> src) {
  const u8* block = src.data();
  for (u32 ty = 0; ty < dst.height; ty += 8) {
    for (u32 tx = 0; tx < dst.width; tx += 8) {
      for (u32 sub = 0; sub < 4; ++sub) {
        std::array<u8, 64> pixels;
        DecodeDXT1Block(pixels, std::span<const u8, 8>(block, 8));
        block += 8;
        const u32 ox = tx + (sub & 1) * 4;
        const u32 oy = ty + (sub >> 1) * 4;
        for (u32 i = 0; i < 16; ++i) {
          Color c;
          std::memcpy(c.data(), &pixels[i * 4], 4);
          dst.set(ox + i % 4, oy + i / 4, c);
        }
      }
    }
  }
}

GxResult<void> checkFormat(gx::TextureFormat format) {
  if (!gx::isKnownFormat(static_cast<u32>(format))) {
    return MakeError(ErrorKind::UnsupportedFormat,
                     fmt::format("No codec for texture format 0x{:x}",
                                 static_cast<u32>(format)));
  }
  return {};
}

} // namespace

std::pair<u32, u32> getBlockedDimensions(u32 width, u32 height,
                                         gx::TextureFormat format) {
  return {roundUp(width, gx::tileWidth(format)),
          roundUp(height, gx::tileHeight(format))};
}

u32 getEncodedSize(u32 width, u32 height, gx::TextureFormat format,
                   u32 mipMapCount) {
  return gx::computeImageSize(width, height, format, mipMapCount + 1);
}

// X -> raw 8-bit RGBA
GxResult<void> decode(std::span<u8> dst, std::span<const u8> src, int width,
                      int height, gx::TextureFormat texformat) {
  TRY(checkFormat(texformat));
  GX_EXPECT(ErrorKind::ArgumentError, width >= 0 && height >= 0,
            fmt::format("Invalid dimensions {}x{}", width, height));
  const u32 w = width;
  const u32 h = height;
  const u32 needed = getEncodedSize(w, h, texformat);
  GX_EXPECT(ErrorKind::ArgumentError, src.size() >= needed,
            fmt::format("Encoded buffer is {} bytes; {}x{} {} needs {}",
                        src.size(), w, h, magic_enum::enum_name(texformat),
                        needed));
  GX_EXPECT(ErrorKind::ArgumentError, dst.size() >= w * h * 4,
            "Destination buffer too small");

  RGBA32ImageTarget target{dst, w, h};
  const auto [pw, ph] = getBlockedDimensions(w, h, texformat);
  const u8* it = src.data();

  switch (texformat) {
  case gx::TextureFormat::I4: {
    bool high = true;
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      const u8 i = expand4(high ? *it >> 4 : *it & 0xf);
      if (!high)
        ++it;
      high = !high;
      target.set(x, y, {i, i, i, i});
    });
    break;
  }
  case gx::TextureFormat::I8:
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      const u8 i = *it++;
      target.set(x, y, {i, i, i, i});
    });
    break;
  case gx::TextureFormat::IA4:
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      const u8 a = expand4(*it >> 4);
      const u8 i = expand4(*it & 0xf);
      ++it;
      target.set(x, y, {i, i, i, a});
    });
    break;
  case gx::TextureFormat::IA8:
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      const u8 a = it[0];
      const u8 i = it[1];
      it += 2;
      target.set(x, y, {i, i, i, a});
    });
    break;
  case gx::TextureFormat::RGB565:
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      target.set(x, y, unpackRGB565(static_cast<u16>(it[0] << 8 | it[1])));
      it += 2;
    });
    break;
  case gx::TextureFormat::RGB5A3:
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      target.set(x, y, unpackRGB5A3(static_cast<u16>(it[0] << 8 | it[1])));
      it += 2;
    });
    break;
  case gx::TextureFormat::RGBA8:
    decodeRGBA8(target, src);
    break;
  case gx::TextureFormat::CMPR:
    decodeCMPR(target, src);
    break;
  }

  return {};
}

// raw 8-bit RGBA -> X
GxResult<void> encode(std::span<u8> dst, std::span<const u8> src, int width,
                      int height, gx::TextureFormat texformat) {
  TRY(checkFormat(texformat));
  GX_EXPECT(ErrorKind::ArgumentError, width >= 0 && height >= 0,
            fmt::format("Invalid dimensions {}x{}", width, height));
  const u32 w = width;
  const u32 h = height;
  GX_EXPECT(ErrorKind::ArgumentError, src.size() >= w * h * 4,
            fmt::format("Source buffer is {} bytes; {}x{} needs {}",
                        src.size(), w, h, w * h * 4));
  GX_EXPECT(ErrorKind::ArgumentError,
            dst.size() >= getEncodedSize(w, h, texformat),
            "Destination buffer too small");
  if (w == 0 || h == 0)
    return {};

  const RGBA32ImageSource source{src, w, h};
  const auto [pw, ph] = getBlockedDimensions(w, h, texformat);
  u8* it = dst.data();

  switch (texformat) {
  case gx::TextureFormat::I4: {
    bool high = true;
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      const u8 i = intensity(source.at(x, y)) >> 4;
      if (high) {
        *it = static_cast<u8>(i << 4);
      } else {
        *it++ |= i;
      }
      high = !high;
    });
    break;
  }
  case gx::TextureFormat::I8:
    forEachTexel(pw, ph, texformat,
                 [&](u32 x, u32 y) { *it++ = intensity(source.at(x, y)); });
    break;
  case gx::TextureFormat::IA4:
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      const auto c = source.at(x, y);
      *it++ = static_cast<u8>((c[3] >> 4) << 4 | intensity(c) >> 4);
    });
    break;
  case gx::TextureFormat::IA8:
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      const auto c = source.at(x, y);
      *it++ = c[3];
      *it++ = intensity(c);
    });
    break;
  case gx::TextureFormat::RGB565:
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      const u16 v = packRGB565(source.at(x, y));
      *it++ = static_cast<u8>(v >> 8);
      *it++ = static_cast<u8>(v);
    });
    break;
  case gx::TextureFormat::RGB5A3:
    forEachTexel(pw, ph, texformat, [&](u32 x, u32 y) {
      const u16 v = packRGB5A3(source.at(x, y));
      *it++ = static_cast<u8>(v >> 8);
      *it++ = static_cast<u8>(v);
    });
    break;
  case gx::TextureFormat::RGBA8:
    encodeRGBA8(dst, source);
    break;
  case gx::TextureFormat::CMPR:
    EncodeDXT1(dst, src, w, h);
    break;
  }

  return {};
}

GxResult<std::vector<u8>> decode(std::span<const u8> src,
                                 gx::TextureFormat texformat, int width,
                                 int height) {
  GX_EXPECT(ErrorKind::ArgumentError, width >= 0 && height >= 0,
            fmt::format("Invalid dimensions {}x{}", width, height));
  std::vector<u8> out(static_cast<size_t>(width) * height * 4);
  TRY(decode(out, src, width, height, texformat));
  return out;
}

GxResult<std::vector<u8>> encode(std::span<const u8> src,
                                 gx::TextureFormat texformat, int width,
                                 int height) {
  TRY(checkFormat(texformat));
  GX_EXPECT(ErrorKind::ArgumentError, width >= 0 && height >= 0,
            fmt::format("Invalid dimensions {}x{}", width, height));
  std::vector<u8> out(getEncodedSize(width, height, texformat));
  TRY(encode(out, src, width, height, texformat));
  return out;
}

} // namespace libgx::image
