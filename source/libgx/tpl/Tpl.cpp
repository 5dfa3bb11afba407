#include "Tpl.hpp"

#include <rsl/SafeReader.hpp>

#include <limits>

IMPORT_STD;

namespace libgx::tpl {

namespace {

//! A texture header as it appears in the file, or as synthesized for a
//! headerless one
struct EntryHeader {
  u32 formatRaw = 0;
  u32 offset = 0;
  u32 width = 0;
  u32 height = 0;
  u32 levelCount = 0;

  bool isDefined() const {
    return offset != 0 && width != 0 && height != 0 && levelCount != 0;
  }
  bool isEmpty() const {
    return offset == 0 && width == 0 && height == 0 && levelCount == 0;
  }
};

GxResult<EntryHeader> readEntryHeader(rsl::SafeReader& reader,
                                      const GamePolicy& policy, u32 index) {
  auto scope = reader.scoped(fmt::format("Texture header #{}", index));
  EntryHeader header;
  header.formatRaw = TRY(WithKind(reader.U32(), ErrorKind::InvalidHeader));
  header.offset = TRY(WithKind(reader.U32(), ErrorKind::InvalidHeader));
  header.width = TRY(WithKind(reader.U16(), ErrorKind::InvalidHeader));
  header.height = TRY(WithKind(reader.U16(), ErrorKind::InvalidHeader));
  header.levelCount = TRY(WithKind(reader.U16(), ErrorKind::InvalidHeader));
  const u16 check = TRY(WithKind(reader.U16(), ErrorKind::InvalidHeader));
  if (check != policy.checkValue) {
    reader.getUnsafe().warnAt("Invalid check value", reader.tell() - 2,
                              reader.tell());
    return MakeError(
        ErrorKind::InvalidHeader,
        fmt::format("Invalid texture header #{} (Field @0x0E): expected "
                    "0x{:04x}, saw 0x{:04x}",
                    index, policy.checkValue, check));
  }
  return header;
}

constexpr u64 MaxOffset = std::numeric_limits<u32>::max();

GxResult<std::vector<EntryHeader>>
synthesizeHeaders(const GeneratedTextureHeader& gen, const GamePolicy& policy) {
  // Offsets are laid out as if a header of |count| 16-byte entries preceded
  // the data
  const u64 initialOffset =
      static_cast<u64>(gen.textureCount) * policy.headerStride;
  u64 textureSize = 0;
  for (u32 i = 0; i < gen.mipmapCount; ++i) {
    textureSize += levelDataSize(policy, gen.format, gen.width, gen.height, i,
                                 gen.mipmapCount);
  }
  const u64 endOffset = initialOffset + gen.textureCount * textureSize;
  GX_EXPECT(ErrorKind::ArgumentError, endOffset <= MaxOffset,
            fmt::format("{} {}x{} textures span {} bytes, past the 32-bit "
                        "offset range",
                        gen.textureCount, gen.width, gen.height, endOffset));

  std::vector<EntryHeader> headers(gen.textureCount);
  for (u32 i = 0; i < gen.textureCount; ++i) {
    headers[i].formatRaw = static_cast<u32>(gen.format);
    headers[i].offset = static_cast<u32>(initialOffset + i * textureSize);
    headers[i].width = gen.width;
    headers[i].height = gen.height;
    headers[i].levelCount = gen.mipmapCount;
  }
  return headers;
}

GxResult<gx::TextureFormat> resolveFormat(u32 raw, u32 index) {
  if (gx::isKnownFormat(raw))
    return static_cast<gx::TextureFormat>(raw);
  if (gx::isPaletteFormat(raw)) {
    return MakeError(ErrorKind::UnsupportedFormat,
                     fmt::format("Texture #{}: palette format 0x{:x} is not "
                                 "supported",
                                 index, raw));
  }
  return MakeError(
      ErrorKind::InvalidFormat,
      fmt::format("Invalid texture header #{} (invalid format 0x{:x})", index,
                  raw));
}

// DX: the header offset points to a descriptor that supersedes the header
GxResult<void> loadDxTexture(TplTexture& tex, oishii::BinaryReader& reader,
                             const GamePolicy& policy, u32 start,
                             const EntryHeader& hdr, u32 index) {
  oishii::Jump<oishii::Whence::Set> g(reader, start + hdr.offset);
  const auto desc = TRY(
      WithKind(DxTextureDescriptor::read(reader), ErrorKind::InvalidHeader));
  const auto format = TRY(mapDxFormat(desc.format));
  if (desc.compressed != 0) {
    rsl::warn("Texture #{}: descriptor flags compressed data ({}); reading it "
              "as raw",
              index, desc.compressed);
  }
  GX_EXPECT(ErrorKind::InvalidHeader,
            desc.width != 0 && desc.height != 0 && desc.levelCount != 0,
            fmt::format("Texture #{}: empty DX descriptor", index));
  return tex.loadTextureData(reader, policy, format, desc.width, desc.height,
                             desc.levelCount);
}

} // namespace

GxResult<Tpl> Tpl::load(oishii::BinaryReader& reader, Game game,
                        std::optional<GeneratedTextureHeader> header) {
  const auto policy = TRY(getGamePolicy(game));
  reader.setEndian(policy.byteOrder);
  rsl::SafeReader safe(reader);
  const u32 start = reader.tell();

  std::vector<EntryHeader> headers;
  if (header.has_value()) {
    GX_EXPECT(ErrorKind::ArgumentError,
              header->width != 0 && header->height != 0 &&
                  header->mipmapCount != 0,
              "Generated header has no texture dimensions");
    GX_EXPECT(ErrorKind::ArgumentError,
              gx::isKnownFormat(static_cast<u32>(header->format)),
              "Generated header has no valid format");
    headers = TRY(synthesizeHeaders(*header, policy));
  }

  // A headerless DX file still leads with its tag
  if (!policy.magic.empty()) {
    TRY(WithKind(safe.Magic(policy.magic), ErrorKind::InvalidHeader));
  }
  const u32 dataStart = header.has_value() ? reader.tell() : start;

  if (!header.has_value()) {
    const u32 count = TRY(WithKind(safe.U32(), ErrorKind::InvalidHeader));
    GX_EXPECT(ErrorKind::InvalidHeader,
              static_cast<u64>(count) * policy.headerStride <=
                  reader.endpos() - reader.tell(),
              fmt::format("{} texture headers exceed the file", count));
    headers.reserve(count);
    for (u32 i = 0; i < count; ++i) {
      headers.push_back(TRY(readEntryHeader(safe, policy, i)));
    }
  }

  const u32 headerBytes =
      header.has_value() ? header->textureCount * policy.headerStride : 0;

  Tpl tpl;
  tpl.textures.resize(headers.size());
  for (u32 i = 0; i < headers.size(); ++i) {
    const auto& hdr = headers[i];
    auto& tex = tpl.textures[i];

    if (hdr.isEmpty()) {
      tex.defineEmptyTexture(hdr.formatRaw);
      continue;
    }
    if (!hdr.isDefined()) {
      return MakeError(
          ErrorKind::InvalidHeader,
          fmt::format("Invalid texture header #{} (invalid combination of "
                      "fields: offset=0x{:x} {}x{} levels={})",
                      i, hdr.offset, hdr.width, hdr.height, hdr.levelCount));
    }

    if (policy.isDX() && !header.has_value()) {
      TRY(loadDxTexture(tex, reader, policy, start, hdr, i));
      continue;
    }

    const auto format = TRY(resolveFormat(hdr.formatRaw, i));
    oishii::Jump<oishii::Whence::Set> g(reader,
                                        dataStart + hdr.offset - headerBytes);
    TRY(tex.loadTextureData(reader, policy, format, hdr.width, hdr.height,
                            hdr.levelCount));
  }

  rsl::debug("Loaded TPL with {} textures", tpl.textures.size());
  return tpl;
}

GxResult<u32> Tpl::sizeOf(Game game, bool noHeader) const {
  const auto policy = TRY(getGamePolicy(game));
  GX_EXPECT(ErrorKind::ArgumentError, textures.size() <= MaxTextureCount,
            fmt::format("{} textures is too many for one container",
                        textures.size()));
  u64 size = noHeader ? policy.magic.size()
                      : policy.headerSize(textures.size());
  for (const auto& tex : textures)
    size += tex.sizeOfTextureData(policy, !noHeader);
  GX_EXPECT(ErrorKind::ArgumentError, size <= MaxOffset,
            fmt::format("Container of {} bytes is past the 32-bit offset "
                        "range",
                        size));
  return static_cast<u32>(size);
}

GxResult<void> Tpl::save(oishii::Writer& writer, Game game,
                         bool noHeader) const {
  const auto policy = TRY(getGamePolicy(game));
  // Offsets below fit 32 bits once the total does
  TRY(sizeOf(game, noHeader));
  writer.setEndian(policy.byteOrder);

  const u32 start = writer.tell();
  for (char c : policy.magic)
    writer.write<u8>(static_cast<u8>(c));

  if (!noHeader) {
    writer.write<u32>(textures.size());

    const u32 beginDataOffset = policy.headerSize(textures.size());
    u32 currentDataOffset = beginDataOffset;
    for (u32 i = 0; i < textures.size(); ++i) {
      const auto& tex = textures[i];
      if (tex.isDefined()) {
        GX_EXPECT(ErrorKind::ArgumentError,
                  tex.widthOfLevel(0) <= 0xFFFF &&
                      tex.heightOfLevel(0) <= 0xFFFF &&
                      tex.levelCount() <= 0xFFFF,
                  fmt::format("Texture #{} ({}x{}) does not fit a header", i,
                              tex.widthOfLevel(0), tex.heightOfLevel(0)));
        writer.write<u32>(tex.formatRaw());
        writer.write<u32>(currentDataOffset);
        writer.write<u16>(tex.widthOfLevel(0));
        writer.write<u16>(tex.heightOfLevel(0));
        writer.write<u16>(tex.levelCount());
      } else {
        writer.write<u32>(tex.formatRaw());
        writer.write<u32>(0);
        writer.write<u16>(0);
        writer.write<u16>(0);
        writer.write<u16>(0);
      }
      writer.write<u16>(policy.checkValue);

      currentDataOffset += static_cast<u32>(tex.sizeOfTextureData(policy));
    }

    // Padding counts up: 0x00, 0x01, 0x02, ...
    const u32 paddingAmount = beginDataOffset - (writer.tell() - start);
    for (u32 i = 0; i < paddingAmount; ++i)
      writer.write<u8>(static_cast<u8>(i));
  }

  for (const auto& tex : textures) {
    TRY(tex.saveTextureData(writer, policy, !noHeader));
  }
  return {};
}

std::optional<u32> Tpl::firstUndefinedSlot() const {
  auto it = std::find_if(textures.begin(), textures.end(),
                         [](const TplTexture& t) { return !t.isDefined(); });
  if (it == textures.end())
    return std::nullopt;
  return static_cast<u32>(it - textures.begin());
}

GxResult<std::map<u32, u32>> Tpl::merge(const Tpl& other,
                                        const std::map<u32, u32>& indexMapping,
                                        CollisionPolicy collision) {
  for (auto [source, target] : indexMapping) {
    GX_EXPECT(ErrorKind::ArgumentError, target < MaxTextureCount,
              fmt::format("Texture {} is mapped to slot {}; slots end at {}",
                          source, target, MaxTextureCount - 1));
  }

  std::map<u32, u32> applied;
  for (u32 i = 0; i < other.textures.size(); ++i) {
    const auto& src = other.textures[i];
    if (!src.isDefined())
      continue;

    u32 target = 0;
    if (auto it = indexMapping.find(i); it != indexMapping.end()) {
      target = it->second;
      if (target >= textures.size())
        textures.resize(target + 1);
      if (textures[target].isDefined() &&
          collision == CollisionPolicy::Skip) {
        rsl::info("Merge: slot {} is taken, skipping texture {}", target, i);
        continue;
      }
    } else if (auto slot = firstUndefinedSlot()) {
      target = *slot;
    } else {
      GX_EXPECT(ErrorKind::ArgumentError, textures.size() < MaxTextureCount,
                fmt::format("No slot left for texture {}", i));
      target = textures.size();
      textures.emplace_back();
    }

    textures[target] = src;
    applied[i] = target;
  }
  return applied;
}

GxResult<void> Tpl::placeTextures(std::vector<TplTexture> newTextures,
                                  std::span<const u32> textureIds) {
  if (newTextures.size() > textureIds.size()) {
    return MakeError(ErrorKind::ArgumentError,
                     fmt::format("Too many textures to import: {} textures "
                                 "for {} IDs",
                                 newTextures.size(), textureIds.size()));
  }
  for (u32 i = 0; i < newTextures.size(); ++i) {
    GX_EXPECT(ErrorKind::ArgumentError, textureIds[i] < MaxTextureCount,
              fmt::format("Texture ID {} is past the last slot ({})",
                          textureIds[i], MaxTextureCount - 1));
  }
  for (u32 i = 0; i < newTextures.size(); ++i) {
    const u32 id = textureIds[i];
    if (id >= textures.size())
      textures.resize(id + 1);
    textures[id] = std::move(newTextures[i]);
  }
  return {};
}

GxResult<Tpl> readTplFile(std::string_view path, Game game,
                          std::optional<GeneratedTextureHeader> header) {
  const auto policy = TRY(getGamePolicy(game));
  auto reader = TRY(WithKind(
      oishii::BinaryReader::FromFilePath(path, policy.byteOrder),
      ErrorKind::ArgumentError));
  return Tpl::load(reader, game, header);
}

GxResult<void> writeTplFile(std::string_view path, const Tpl& tpl, Game game,
                            bool noHeader) {
  oishii::Writer writer(std::endian::big);
  TRY(tpl.save(writer, game, noHeader));
  TRY(WithKind(writer.saveToDisk(path), ErrorKind::ArgumentError));
  return {};
}

} // namespace libgx::tpl
