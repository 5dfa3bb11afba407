#pragma once

#include <core/common.h>

namespace libgx::image {

//! @brief Encode a RGBA32 buffer to GC DXT1 (CMPR).
//!
//! @param[in] dest   Output buffer. Must hold the tile-padded image
//!                   (computeImageSize of the CMPR format).
//! @param[in] source Source buffer (width * height * 4). Tiles that extend
//!                   past the image repeat the nearest edge pixel.
//! @param[in] width  Width of the image.
//! @param[in] height Height of the image.
//!
void EncodeDXT1(std::span<u8> dest, std::span<const u8> source, u32 width,
                u32 height);

//! @brief Decode one 8-byte DXT1 sub-block to 16 RGBA32 pixels (row-major).
//!
void DecodeDXT1Block(std::span<u8, 64> dest, std::span<const u8, 8> block);

} // namespace libgx::image
