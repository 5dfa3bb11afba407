#pragma once

#include <core/common.h>

#include <libgx/Error.hpp>
#include <libgx/gx/Texture.hpp>

namespace libgx::image {

//! @brief Compute padded dimensions for an image.
//!
//! @param[in] width  Width of the image.
//! @param[in] height Height of the image.
//! @param[in] format Format of the image.
//!
//! @return Dimensions rounded up to the tile size of the format.
//!
[[nodiscard]] std::pair<u32, u32>
getBlockedDimensions(u32 width, u32 height, gx::TextureFormat format);

//! @brief Compute the encoded size of an image.
//!
//! @param[in] width Width of the image. Does not need to be padded.
//! @param[in] height Height of the image. Does not need to be padded.
//! @param[in] format Format of the image.
//! @param[in] mipMapCount Number of additional levels of detail past the first
//! image. Zero corresponds to the base image--no mipmapping.
//!
//! @return The computed size of the image in bytes.
//!
[[nodiscard]] u32 getEncodedSize(u32 width, u32 height,
                                 gx::TextureFormat format,
                                 u32 mipMapCount = 0);

//! @brief Decode an image to 8-bit, four-channel RGBA.
//!
//! @param[in] dst The decoded image (width * height * 4 bytes).
//! @param[in] src The encoded data, tile-padded.
//! @param[in] width The width of the image in pixels.
//! @param[in] height The height of the image in pixels.
//! @param[in] texformat The format of the image.
//!
[[nodiscard]] GxResult<void> decode(std::span<u8> dst, std::span<const u8> src,
                                    int width, int height,
                                    gx::TextureFormat texformat);

//! @brief Encode an image to a GPU texture.
//!
//! @param[in] dst The encoded image. Must hold getEncodedSize() bytes.
//! @param[in] src The raw RGBA data (width * height * 4 bytes).
//! @param[in] width The width of the image in pixels.
//! @param[in] height The height of the image in pixels.
//! @param[in] texformat The format of the image.
//!
[[nodiscard]] GxResult<void> encode(std::span<u8> dst, std::span<const u8> src,
                                    int width, int height,
                                    gx::TextureFormat texformat);

[[nodiscard]] GxResult<std::vector<u8>>
decode(std::span<const u8> src, gx::TextureFormat texformat, int width,
       int height);
[[nodiscard]] GxResult<std::vector<u8>>
encode(std::span<const u8> src, gx::TextureFormat texformat, int width,
       int height);

} // namespace libgx::image
