#pragma once

#include <core/common.h>

#include <libgx/Error.hpp>
#include <libgx/GamePolicy.hpp>
#include <libgx/gx/Texture.hpp>

namespace libgx::tpl {

//! Stand-in for the header of a headerless texture file. Built from the file
//! name and size, consumed by Tpl::load, never written.
struct GeneratedTextureHeader {
  u32 textureCount = 0;
  u32 width = 0;
  u32 height = 0;
  gx::TextureFormat format = gx::TextureFormat::CMPR;
  u32 mipmapCount = 1;

  bool operator==(const GeneratedTextureHeader&) const = default;
};

//! @brief Recover the header of a headerless file.
//!
//! @param[in] fileName Path or name of the file. The stem must end in
//!                     "<width>x<height>", e.g. "bg_160x112.bin".
//! @param[in] fileSize Size of the file in bytes.
//! @param[in] format   Pixel format the caller declares for the data.
//! @param[in] game     Decides whether a leading tag precedes the data.
//!
//! @return One entry per whole texture in the file, single level.
//!
[[nodiscard]] GxResult<GeneratedTextureHeader>
generateHeaderFromFile(std::string_view fileName, u64 fileSize,
                       gx::TextureFormat format,
                       Game game = Game::SuperMonkeyBall);

} // namespace libgx::tpl
