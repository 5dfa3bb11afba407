#pragma once

#include <core/common.h>

#include <libgx/Error.hpp>
#include <libgx/GamePolicy.hpp>
#include <libgx/gx/Texture.hpp>
#include <libgx/image/Mipmaps.hpp>

#include <oishii/reader/binary_reader.hxx>
#include <oishii/writer/binary_writer.hxx>

#include <variant>

namespace libgx::tpl {

//! Per-level decode state. Transitions only Raw -> Decoded.
enum class LevelState {
  Raw,
  Decoded,
};

struct TextureLevel {
  u32 width = 0;
  u32 height = 0;
  //! Tile-padded GX data, kept after decoding
  std::vector<u8> packed;
  //! RGBA8, width * height * 4; empty until decoded
  std::vector<u8> decoded;
  LevelState state = LevelState::Raw;

  bool operator==(const TextureLevel& rhs) const {
    return width == rhs.width && height == rhs.height && packed == rhs.packed;
  }
};

//! The 32-byte block preceding each texture's data in the DX layout
struct DxTextureDescriptor {
  u32 format = 0;
  u32 width = 0;
  u32 height = 0;
  u32 levelCount = 0;
  u32 compressed = 0;
  u32 dataLength = 0;
  u32 compressedLength = 0;
  u32 reserved = 0;

  static constexpr u32 Size = 32;

  [[nodiscard]] static Result<DxTextureDescriptor>
  read(oishii::BinaryReader& reader);
  void write(oishii::Writer& writer) const;
};

class TplTexture {
public:
  //! No levels. The raw format code is kept as found on disk.
  struct Empty {
    u32 rawFormat = 0;
    bool operator==(const Empty&) const = default;
  };
  struct Defined {
    gx::TextureFormat format = gx::TextureFormat::CMPR;
    std::vector<TextureLevel> levels;
    bool operator==(const Defined&) const = default;
  };

  TplTexture() : mData(Empty{}) {}

  //! Read |levelCount| packed levels at the reader's position. The reader is
  //! left after the last level.
  [[nodiscard]] GxResult<void>
  loadTextureData(oishii::BinaryReader& reader, const GamePolicy& policy,
                  gx::TextureFormat format, u32 width, u32 height,
                  u32 levelCount);
  void defineEmptyTexture(u32 rawFormat);
  [[nodiscard]] GxResult<void> defineFromImage(
      gx::TextureFormat format, std::span<const u8> rgba, u32 width,
      u32 height, u32 levelCount,
      image::ResizingAlgorithm algorithm = image::ResizingAlgorithm::Bicubic,
      std::span<const std::vector<u8>> externalLevels = {});

  //! Bytes saveTextureData writes. |withDescriptor| controls the DX
  //! descriptor and is ignored for other games.
  u64 sizeOfTextureData(const GamePolicy& policy,
                        bool withDescriptor = true) const;
  [[nodiscard]] GxResult<void>
  saveTextureData(oishii::Writer& writer, const GamePolicy& policy,
                  bool withDescriptor = true) const;

  //! Decode level |i| to RGBA8 on first use; later calls return the same
  //! buffer.
  [[nodiscard]] GxResult<std::span<const u8>> decodeLevel(u32 i);

  bool isDefined() const { return std::holds_alternative<Defined>(mData); }
  u32 levelCount() const;
  //! Zero for levels the texture does not have
  u32 widthOfLevel(u32 i) const;
  u32 heightOfLevel(u32 i) const;
  std::optional<LevelState> levelState(u32 i) const;
  std::optional<gx::TextureFormat> format() const;
  //! The format code written to the container header
  u32 formatRaw() const;
  //! Packed data of level |i|; empty for levels the texture does not have
  std::span<const u8> levelData(u32 i) const;

  bool operator==(const TplTexture&) const = default;

private:
  const TextureLevel* getLevel(u32 i) const;

  std::variant<Empty, Defined> mData;
};

} // namespace libgx::tpl
