#include "TplTexture.hpp"

#include <libgx/image/ImagePlatform.hpp>

IMPORT_STD;

namespace libgx::tpl {

Result<DxTextureDescriptor> DxTextureDescriptor::read(oishii::BinaryReader& reader) {
  auto scope = reader.createScoped("DX texture descriptor");
  auto fields = TRY(reader.tryReadX<u32, 8>());
  DxTextureDescriptor desc;
  desc.format = fields[0];
  desc.width = fields[1];
  desc.height = fields[2];
  desc.levelCount = fields[3];
  desc.compressed = fields[4];
  desc.dataLength = fields[5];
  desc.compressedLength = fields[6];
  desc.reserved = fields[7];
  return desc;
}

void DxTextureDescriptor::write(oishii::Writer& writer) const {
  writer.write<u32>(format);
  writer.write<u32>(width);
  writer.write<u32>(height);
  writer.write<u32>(levelCount);
  writer.write<u32>(compressed);
  writer.write<u32>(dataLength);
  writer.write<u32>(compressedLength);
  writer.write<u32>(reserved);
}

GxResult<void> TplTexture::loadTextureData(oishii::BinaryReader& reader,
                                           const GamePolicy& policy,
                                           gx::TextureFormat format,
                                           u32 width, u32 height,
                                           u32 levelCount) {
  if (!gx::isKnownFormat(static_cast<u32>(format))) {
    return MakeError(ErrorKind::InvalidFormat,
                     fmt::format("Invalid texture format 0x{:x}",
                                 static_cast<u32>(format)));
  }
  GX_EXPECT(ErrorKind::InvalidHeader, width > 0 && height > 0,
            fmt::format("Invalid texture dimensions {}x{}", width, height));
  GX_EXPECT(ErrorKind::InvalidHeader, levelCount > 0,
            "A defined texture needs at least one level");

  Defined defined{.format = format};
  defined.levels.reserve(levelCount);
  for (u32 i = 0; i < levelCount; ++i) {
    TextureLevel level;
    level.width = gx::mipDimension(width, i);
    level.height = gx::mipDimension(height, i);
    const u64 size = levelDataSize(policy, format, width, height, i, levelCount);
    GX_EXPECT(ErrorKind::InvalidHeader,
              size <= reader.endpos() - reader.tell(),
              fmt::format("Level {} of {}x{} needs {} bytes; the file ends "
                          "first",
                          i, width, height, size));
    level.packed =
        TRY(WithKind(reader.tryReadBuffer<u8>(static_cast<u32>(size)),
                     ErrorKind::InvalidHeader));
    defined.levels.push_back(std::move(level));
  }

  rsl::trace("Loaded {} {}x{} texture ({} levels)",
             magic_enum::enum_name(format), width, height, levelCount);
  mData = std::move(defined);
  return {};
}

void TplTexture::defineEmptyTexture(u32 rawFormat) {
  mData = Empty{.rawFormat = rawFormat};
}

GxResult<void> TplTexture::defineFromImage(
    gx::TextureFormat format, std::span<const u8> rgba, u32 width, u32 height,
    u32 levelCount, image::ResizingAlgorithm algorithm,
    std::span<const std::vector<u8>> externalLevels) {
  auto chain = TRY(image::buildMipmapChain(rgba, width, height, levelCount,
                                           algorithm, externalLevels));

  Defined defined{.format = format};
  for (u32 i = 0; i < chain.size(); ++i) {
    TextureLevel level;
    level.width = gx::mipDimension(width, i);
    level.height = gx::mipDimension(height, i);
    level.packed =
        TRY(image::encode(chain[i], format, level.width, level.height));
    defined.levels.push_back(std::move(level));
  }
  mData = std::move(defined);
  return {};
}

u64 TplTexture::sizeOfTextureData(const GamePolicy& policy,
                                  bool withDescriptor) const {
  const auto* defined = std::get_if<Defined>(&mData);
  if (defined == nullptr)
    return 0;

  u64 size = 0;
  if (policy.isDX() && withDescriptor)
    size += policy.textureDescriptorSize;
  const u32 count = defined->levels.size();
  const auto& base = defined->levels[0];
  for (u32 i = 0; i < count; ++i) {
    size += levelDataSize(policy, defined->format, base.width, base.height, i,
                          count);
  }
  return size;
}

GxResult<void> TplTexture::saveTextureData(oishii::Writer& writer,
                                           const GamePolicy& policy,
                                           bool withDescriptor) const {
  const auto* defined = std::get_if<Defined>(&mData);
  if (defined == nullptr)
    return {};

  const u32 count = defined->levels.size();
  const auto& base = defined->levels[0];
  if (policy.isDX() && withDescriptor) {
    DxTextureDescriptor desc;
    desc.format = TRY(unmapDxFormat(defined->format));
    desc.width = base.width;
    desc.height = base.height;
    desc.levelCount = count;
    const u64 dataLength = sizeOfTextureData(policy, false);
    GX_EXPECT(ErrorKind::ArgumentError, dataLength <= 0xFFFF'FFFF,
              fmt::format("Texture data of {} bytes does not fit a descriptor",
                          dataLength));
    desc.dataLength = static_cast<u32>(dataLength);
    desc.write(writer);
  }

  for (u32 i = 0; i < count; ++i) {
    const auto& level = defined->levels[i];
    const u64 size = levelDataSize(policy, defined->format, base.width,
                                   base.height, i, count);
    GX_EXPECT(ErrorKind::InvalidFormat, level.packed.size() <= size,
              fmt::format("Level {} holds {} bytes; expected at most {}", i,
                          level.packed.size(), size));
    writer.writeBuffer(level.packed);
    for (u64 pad = level.packed.size(); pad < size; ++pad)
      writer.write<u8>(0);
  }
  return {};
}

GxResult<std::span<const u8>> TplTexture::decodeLevel(u32 i) {
  auto* defined = std::get_if<Defined>(&mData);
  GX_EXPECT(ErrorKind::ArgumentError, defined != nullptr,
            "Texture has no levels");
  GX_EXPECT(ErrorKind::ArgumentError, i < defined->levels.size(),
            fmt::format("Level {} out of range ({} levels)", i,
                        defined->levels.size()));

  auto& level = defined->levels[i];
  if (level.state == LevelState::Raw) {
    level.decoded = TRY(image::decode(level.packed, defined->format,
                                      level.width, level.height));
    level.state = LevelState::Decoded;
  }
  return std::span<const u8>(level.decoded);
}

u32 TplTexture::levelCount() const {
  const auto* defined = std::get_if<Defined>(&mData);
  return defined ? defined->levels.size() : 0;
}

const TextureLevel* TplTexture::getLevel(u32 i) const {
  const auto* defined = std::get_if<Defined>(&mData);
  if (defined == nullptr || i >= defined->levels.size())
    return nullptr;
  return &defined->levels[i];
}

u32 TplTexture::widthOfLevel(u32 i) const {
  const auto* level = getLevel(i);
  return level ? level->width : 0;
}

u32 TplTexture::heightOfLevel(u32 i) const {
  const auto* level = getLevel(i);
  return level ? level->height : 0;
}

std::optional<LevelState> TplTexture::levelState(u32 i) const {
  const auto* level = getLevel(i);
  if (level == nullptr)
    return std::nullopt;
  return level->state;
}

std::optional<gx::TextureFormat> TplTexture::format() const {
  if (const auto* defined = std::get_if<Defined>(&mData))
    return defined->format;
  return std::nullopt;
}

u32 TplTexture::formatRaw() const {
  if (const auto* defined = std::get_if<Defined>(&mData))
    return static_cast<u32>(defined->format);
  return std::get<Empty>(mData).rawFormat;
}

std::span<const u8> TplTexture::levelData(u32 i) const {
  const auto* level = getLevel(i);
  if (level == nullptr)
    return {};
  return level->packed;
}

} // namespace libgx::tpl
