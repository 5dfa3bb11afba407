#pragma once

#include <core/common.h>

#include <libgx/Error.hpp>

namespace libgx::image {

//! @brief Specifies an algorithm for downscaling/upscaling an image.
//!
enum class ResizingAlgorithm {
  //! Top-left sample of each source footprint, no blending
  Nearest,
  //! Catmull-Rom (a = -0.5) with clamped edges
  Bicubic,
};

//! @brief Resize a raw, 8-bit RGBA buffer.
//!
//! @param[in] dst  The desination buffer (dx * dy * 4 bytes).
//! @param[in] dx   Width of the target image in pixels.
//! @param[in] dy   Height of the target image in pixels.
//! @param[in] src  The source image (sx * sy * 4 bytes).
//! @param[in] sx   Width of the source image in pixels.
//! @param[in] sy   Height of the source image in pixels.
//! @param[in] type Algorithm to utilize for upscaling/downscaling.
//!
[[nodiscard]] GxResult<void>
resize(std::span<u8> dst, int dx, int dy, std::span<const u8> src, int sx,
       int sy, ResizingAlgorithm type = ResizingAlgorithm::Bicubic);

//! Number of levels in a full chain down to 1x1
u32 maxLevelCount(u32 width, u32 height);

//! RGBA images of each level, level 0 first
using MipChain = std::vector<std::vector<u8>>;

//! @brief Build |levelCount| levels from |source|. Level i is
//! max(1, w >> i) x max(1, h >> i), each resampled from level 0.
//!
[[nodiscard]] GxResult<MipChain>
generateMipmaps(std::span<const u8> source, u32 width, u32 height,
                u32 levelCount,
                ResizingAlgorithm algorithm = ResizingAlgorithm::Bicubic);

//! @brief As generateMipmaps, but uses caller-supplied images for levels
//! 1..levelCount-1 when |externalLevels| is non-empty.
//!
//! @param[in] externalLevels Either empty or exactly levelCount - 1 RGBA
//! images, each sized for its level.
//!
[[nodiscard]] GxResult<MipChain>
buildMipmapChain(std::span<const u8> source, u32 width, u32 height,
                 u32 levelCount, ResizingAlgorithm algorithm,
                 std::span<const std::vector<u8>> externalLevels = {});

} // namespace libgx::image
