#pragma once

#include <core/common.h>
#include <libgx/Error.hpp>
#include <libgx/gx/Texture.hpp>

#include <bit>

namespace libgx {

enum class Game {
  SuperMonkeyBall,
  SuperMonkeyBallDX,
  FZeroGX,
};

enum class HeaderSchema {
  //! u32 count, then 16-byte entries
  Standard,
  //! "XTPL", u32 count, 16-byte entries, 32-byte descriptor before each
  //! texture's data
  DX,
};

//! Everything that differs between the games, resolved once per load/save.
struct GamePolicy {
  Game game = Game::SuperMonkeyBall;
  std::endian byteOrder = std::endian::big;
  HeaderSchema schema = HeaderSchema::Standard;
  //! Empty when the container has no leading tag
  std::string_view magic;
  u16 checkValue = 0x1234;
  u32 headerStride = 16;
  //! Bytes before the first entry header (magic + count)
  u32 headerPrefixSize = 4;
  u32 headerAlignment = 0x20;
  //! Size of the per-texture descriptor preceding texture data (DX only)
  u32 textureDescriptorSize = 0;
  //! Packer quirk: block height used to size the last mip level of a
  //! multi-level I8 texture. Zero disables the quirk.
  u32 lastI8LevelBlockHeight = 0;

  bool isDX() const { return schema == HeaderSchema::DX; }

  //! Header region size for |count| entries, including padding
  u32 headerSize(u32 count) const {
    return roundUp(headerPrefixSize + headerStride * count, headerAlignment);
  }
};

[[nodiscard]] GxResult<GamePolicy> getGamePolicy(Game game);
//! Same as above for a value of unknown provenance
[[nodiscard]] GxResult<GamePolicy> getGamePolicy(u32 game);

//! DX descriptor format code -> hardware format. CMPR, I8 and RGB5A3 have
//! their own codes; every other format is stored as its GX code.
[[nodiscard]] GxResult<gx::TextureFormat> mapDxFormat(u32 code);
//! Hardware format -> DX descriptor format code
[[nodiscard]] GxResult<u32> unmapDxFormat(gx::TextureFormat format);

//! Packed size of mip level |level| of a |levelCount| level texture, honoring
//! the packer quirk of |policy|. 16-bit dimensions can exceed 32 bits here.
u64 levelDataSize(const GamePolicy& policy, gx::TextureFormat format,
                  u32 width, u32 height, u32 level, u32 levelCount);

} // namespace libgx
