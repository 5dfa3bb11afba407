#include "Mipmaps.hpp"

#include <libgx/gx/Texture.hpp>

#include <cmath>

IMPORT_STD;

namespace libgx::image {

namespace {

float cubic_weight(float x) {
  constexpr float a = -0.5f; // Catmull-Rom
  const float ax = std::fabs(x);
  if (ax < 1.0f) {
    return (a + 2.0f) * ax * ax * ax - (a + 3.0f) * ax * ax + 1.0f;
  }
  if (ax < 2.0f) {
    return a * ax * ax * ax - 5.0f * a * ax * ax + 8.0f * a * ax - 4.0f * a;
  }
  return 0.0f;
}

u8 sample_clamped(std::span<const u8> src, int sx, int sy, int x, int y,
                  int channel) {
  x = std::clamp(x, 0, sx - 1);
  y = std::clamp(y, 0, sy - 1);
  return src[(static_cast<size_t>(y) * sx + x) * 4 + channel];
}

void resizeNearest(std::span<u8> dst, int dx, int dy, std::span<const u8> src,
                   int sx, int sy) {
  for (int y = 0; y < dy; ++y) {
    const int src_y = static_cast<int>(static_cast<s64>(y) * sy / dy);
    for (int x = 0; x < dx; ++x) {
      const int src_x = static_cast<int>(static_cast<s64>(x) * sx / dx);
      std::memcpy(&dst[(static_cast<size_t>(y) * dx + x) * 4],
                  &src[(static_cast<size_t>(src_y) * sx + src_x) * 4], 4);
    }
  }
}

void resizeBicubic(std::span<u8> dst, int dx, int dy, std::span<const u8> src,
                   int sx, int sy) {
  const float scale_x = static_cast<float>(sx) / static_cast<float>(dx);
  const float scale_y = static_cast<float>(sy) / static_cast<float>(dy);
  for (int y = 0; y < dy; ++y) {
    const float src_y = (static_cast<float>(y) + 0.5f) * scale_y - 0.5f;
    const int iy = static_cast<int>(std::floor(src_y));
    for (int x = 0; x < dx; ++x) {
      const float src_x = (static_cast<float>(x) + 0.5f) * scale_x - 0.5f;
      const int ix = static_cast<int>(std::floor(src_x));

      std::array<float, 4> sum{};
      float wsum = 0.0f;
      for (int j = -1; j <= 2; ++j) {
        const float wy = cubic_weight(src_y - static_cast<float>(iy + j));
        for (int i = -1; i <= 2; ++i) {
          const float wx = cubic_weight(src_x - static_cast<float>(ix + i));
          const float w = wx * wy;
          for (int c = 0; c < 4; ++c)
            sum[c] += w * sample_clamped(src, sx, sy, ix + i, iy + j, c);
          wsum += w;
        }
      }

      u8* out = &dst[(static_cast<size_t>(y) * dx + x) * 4];
      for (int c = 0; c < 4; ++c) {
        const float v = wsum != 0.0f
                            ? sum[c] / wsum
                            : sample_clamped(src, sx, sy, ix, iy, c);
        out[c] = static_cast<u8>(std::clamp(std::lround(v), 0l, 255l));
      }
    }
  }
}

} // namespace

GxResult<void> resize(std::span<u8> dst, int dx, int dy,
                      std::span<const u8> src, int sx, int sy,
                      ResizingAlgorithm type) {
  GX_EXPECT(ErrorKind::ArgumentError, dx > 0 && dy > 0 && sx > 0 && sy > 0,
            fmt::format("Cannot resize {}x{} to {}x{}", sx, sy, dx, dy));
  GX_EXPECT(ErrorKind::ArgumentError,
            src.size() >= static_cast<size_t>(sx) * sy * 4,
            "Source buffer too small");
  GX_EXPECT(ErrorKind::ArgumentError,
            dst.size() >= static_cast<size_t>(dx) * dy * 4,
            "Destination buffer too small");

  if (dx == sx && dy == sy) {
    std::copy_n(src.begin(), static_cast<size_t>(sx) * sy * 4, dst.begin());
    return {};
  }

  switch (type) {
  case ResizingAlgorithm::Nearest:
    resizeNearest(dst, dx, dy, src, sx, sy);
    break;
  case ResizingAlgorithm::Bicubic:
    resizeBicubic(dst, dx, dy, src, sx, sy);
    break;
  }
  return {};
}

u32 maxLevelCount(u32 width, u32 height) {
  u32 count = 1;
  for (u32 dim = std::max(width, height); dim > 1; dim >>= 1)
    ++count;
  return count;
}

static GxResult<void> checkLevelCount(u32 width, u32 height, u32 levelCount) {
  GX_EXPECT(ErrorKind::ArgumentError, width > 0 && height > 0,
            fmt::format("Invalid image dimensions {}x{}", width, height));
  GX_EXPECT(ErrorKind::ArgumentError,
            levelCount >= 1 && levelCount <= maxLevelCount(width, height),
            fmt::format("A {}x{} image cannot have {} mip levels (max {})",
                        width, height, levelCount,
                        maxLevelCount(width, height)));
  return {};
}

GxResult<MipChain> generateMipmaps(std::span<const u8> source, u32 width,
                                   u32 height, u32 levelCount,
                                   ResizingAlgorithm algorithm) {
  TRY(checkLevelCount(width, height, levelCount));
  GX_EXPECT(ErrorKind::ArgumentError, source.size() >= width * height * 4,
            "Source buffer too small");

  MipChain chain;
  chain.emplace_back(source.begin(), source.begin() + width * height * 4);
  for (u32 i = 1; i < levelCount; ++i) {
    const u32 w = gx::mipDimension(width, i);
    const u32 h = gx::mipDimension(height, i);
    std::vector<u8> level(w * h * 4);
    TRY(resize(level, w, h, source, width, height, algorithm));
    chain.push_back(std::move(level));
  }
  return chain;
}

GxResult<MipChain> buildMipmapChain(std::span<const u8> source, u32 width,
                                    u32 height, u32 levelCount,
                                    ResizingAlgorithm algorithm,
                                    std::span<const std::vector<u8>> externalLevels) {
  if (externalLevels.empty()) {
    return generateMipmaps(source, width, height, levelCount, algorithm);
  }

  TRY(checkLevelCount(width, height, levelCount));
  GX_EXPECT(ErrorKind::ArgumentError, externalLevels.size() == levelCount - 1,
            fmt::format("Expected {} external mip levels, got {}",
                        levelCount - 1, externalLevels.size()));
  GX_EXPECT(ErrorKind::ArgumentError, source.size() >= width * height * 4,
            "Source buffer too small");

  MipChain chain;
  chain.emplace_back(source.begin(), source.begin() + width * height * 4);
  for (u32 i = 1; i < levelCount; ++i) {
    const auto& level = externalLevels[i - 1];
    const u32 w = gx::mipDimension(width, i);
    const u32 h = gx::mipDimension(height, i);
    if (level.size() != w * h * 4) {
      return MakeError(ErrorKind::ArgumentError,
                       fmt::format("Mip level {} must be {}x{} ({} bytes), "
                                   "got {} bytes",
                                   i, w, h, w * h * 4, level.size()));
    }
    chain.push_back(level);
  }
  return chain;
}

} // namespace libgx::image
