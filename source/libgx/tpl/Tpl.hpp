#pragma once

#include <core/common.h>

#include <libgx/Error.hpp>
#include <libgx/GamePolicy.hpp>
#include <libgx/tpl/GeneratedHeader.hpp>
#include <libgx/tpl/TplTexture.hpp>

namespace libgx::tpl {

//! What merge does when a mapped target slot already holds a texture
enum class CollisionPolicy {
  Overwrite,
  Skip,
};

//! Header counts and texture IDs are 16-bit in the games
constexpr u32 MaxTextureCount = 0xFFFF;

//! An ordered set of textures. Index is the texture ID used by models, so
//! slots without data are kept in place.
class Tpl {
public:
  std::vector<TplTexture> textures;

  //! @brief Parse a container.
  //!
  //! @param[in] reader Positioned at the start of the container. Its endian
  //!                   is set from the game.
  //! @param[in] game   The game the file belongs to.
  //! @param[in] header When set, the file has no header and this describes
  //!                   its contents.
  //!
  [[nodiscard]] static GxResult<Tpl>
  load(oishii::BinaryReader& reader, Game game,
       std::optional<GeneratedTextureHeader> header = std::nullopt);

  //! With |noHeader| only the DX tag and the texture data are written.
  [[nodiscard]] GxResult<void> save(oishii::Writer& writer, Game game,
                                    bool noHeader = false) const;
  //! Bytes save() writes for the same arguments
  [[nodiscard]] GxResult<u32> sizeOf(Game game, bool noHeader = false) const;

  //! @brief Copy the defined textures of |other| into this container.
  //!
  //! @param[in] indexMapping Source index -> target index. Unmapped textures
  //!                         go to the first slot without data, else the end.
  //! @param[in] collision    Applies to mapped targets that hold a texture.
  //!
  //! @return Source index -> target index of every texture copied, or
  //!         ArgumentError when a target would reach MaxTextureCount. A bad
  //!         mapping is rejected before anything is copied.
  //!
  [[nodiscard]] GxResult<std::map<u32, u32>>
  merge(const Tpl& other, const std::map<u32, u32>& indexMapping = {},
        CollisionPolicy collision = CollisionPolicy::Overwrite);

  //! Put textures[i] at textureIds[i], growing the container as needed. IDs
  //! must be below MaxTextureCount.
  [[nodiscard]] GxResult<void> placeTextures(std::vector<TplTexture> textures,
                                             std::span<const u32> textureIds);

  //! First index without data, if any
  std::optional<u32> firstUndefinedSlot() const;

  bool operator==(const Tpl&) const = default;
};

[[nodiscard]] GxResult<Tpl>
readTplFile(std::string_view path, Game game,
            std::optional<GeneratedTextureHeader> header = std::nullopt);
[[nodiscard]] GxResult<void> writeTplFile(std::string_view path,
                                          const Tpl& tpl, Game game,
                                          bool noHeader = false);

} // namespace libgx::tpl
