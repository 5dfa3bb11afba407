#include <core/common.h>

#include <gtest/gtest.h>

#include <libgx/tpl/Tpl.hpp>

#include "TestUtil.hpp"

#include <filesystem>

IMPORT_STD;

using namespace libgx;
using namespace libgx::tpl;
using gx::TextureFormat;

namespace {

constexpr std::array<Game, 3> AllGames{Game::SuperMonkeyBall,
                                       Game::SuperMonkeyBallDX, Game::FZeroGX};

std::endian EndianOf(Game game) {
  return game == Game::SuperMonkeyBallDX ? std::endian::little
                                         : std::endian::big;
}

TplTexture MakeTexture(TextureFormat format, u32 width, u32 height,
                       u32 levels, u32 seed = 1) {
  TplTexture tex;
  const auto img = test::MakeImage(width, height, seed);
  auto ok = tex.defineFromImage(format, img, width, height, levels);
  EXPECT_TRUE(ok.has_value()) << ok.error().message;
  return tex;
}

TplTexture MakeEmpty(u32 raw) {
  TplTexture tex;
  tex.defineEmptyTexture(raw);
  return tex;
}

std::vector<u8> Save(const Tpl& tpl, Game game, bool noHeader = false) {
  oishii::Writer writer(std::endian::big);
  auto ok = tpl.save(writer, game, noHeader);
  EXPECT_TRUE(ok.has_value()) << ok.error().message;
  return writer.takeBuf();
}

GxResult<Tpl> Load(std::span<const u8> data, Game game,
                   std::optional<GeneratedTextureHeader> header = {}) {
  oishii::BinaryReader reader(data, "test.tpl", EndianOf(game));
  return Tpl::load(reader, game, header);
}

void PutU32BE(std::vector<u8>& buf, u32 at, u32 v) {
  buf[at] = v >> 24;
  buf[at + 1] = v >> 16;
  buf[at + 2] = v >> 8;
  buf[at + 3] = v;
}
void PutU16BE(std::vector<u8>& buf, u32 at, u16 v) {
  buf[at] = v >> 8;
  buf[at + 1] = static_cast<u8>(v);
}

} // namespace

TEST(Tpl, ThreeEntryScenario) {
  for (auto game : AllGames) {
    Tpl tpl;
    tpl.textures.push_back(MakeTexture(TextureFormat::CMPR, 64, 64, 4));
    tpl.textures.push_back(MakeEmpty(7));
    tpl.textures.emplace_back();

    const auto data = Save(tpl, game);
    auto size = tpl.sizeOf(game);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, data.size());

    auto loaded = Load(data, game);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    ASSERT_EQ(loaded->textures.size(), 3u);

    const auto& t0 = loaded->textures[0];
    EXPECT_TRUE(t0.isDefined());
    EXPECT_EQ(t0.widthOfLevel(0), 64u);
    EXPECT_EQ(t0.heightOfLevel(0), 64u);
    EXPECT_EQ(t0.levelCount(), 4u);
    EXPECT_EQ(t0.widthOfLevel(3), 8u);
    EXPECT_EQ(t0.format(), TextureFormat::CMPR);

    const auto& t1 = loaded->textures[1];
    EXPECT_FALSE(t1.isDefined());
    EXPECT_EQ(t1.levelCount(), 0u);
    EXPECT_EQ(t1.formatRaw(), 7u);

    EXPECT_FALSE(loaded->textures[2].isDefined());
    EXPECT_EQ(loaded->firstUndefinedSlot(), 1u);

    EXPECT_EQ(*loaded, tpl) << magic_enum::enum_name(game);
  }
}

TEST(Tpl, RoundTripEveryFormat) {
  const std::array<TextureFormat, 8> formats{
      TextureFormat::I4,     TextureFormat::I8,     TextureFormat::IA4,
      TextureFormat::IA8,    TextureFormat::RGB565, TextureFormat::RGB5A3,
      TextureFormat::RGBA8,  TextureFormat::CMPR};
  for (auto game : AllGames) {
    Tpl tpl;
    u32 seed = 1;
    for (auto format : formats) {
      // Not a multiple of any tile
      tpl.textures.push_back(MakeTexture(format, 20, 12, 3, seed++));
    }
    // A single-level I8 texture is outside the F-Zero GX quirk
    tpl.textures.push_back(MakeTexture(TextureFormat::I8, 16, 16, 1, seed++));

    const auto data = Save(tpl, game);
    EXPECT_EQ(*tpl.sizeOf(game), data.size());
    auto loaded = Load(data, game);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    if (game == Game::FZeroGX) {
      // Multi-level I8 is the one asymmetric case; see LastI8LevelQuirk
      loaded->textures[1] = tpl.textures[1];
    }
    EXPECT_EQ(*loaded, tpl) << magic_enum::enum_name(game);
  }
}

TEST(Tpl, RoundTripDX) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::CMPR, 32, 32, 3, 1));
  tpl.textures.push_back(MakeEmpty(0));
  tpl.textures.push_back(MakeTexture(TextureFormat::I8, 16, 8, 2, 2));
  tpl.textures.push_back(MakeTexture(TextureFormat::RGB5A3, 8, 8, 1, 3));

  const auto data = Save(tpl, Game::SuperMonkeyBallDX);
  EXPECT_EQ(*tpl.sizeOf(Game::SuperMonkeyBallDX), data.size());
  auto loaded = Load(data, Game::SuperMonkeyBallDX);
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  EXPECT_EQ(*loaded, tpl);
}

TEST(Tpl, DXDescriptorCodes) {
  const std::array<std::pair<TextureFormat, u8>, 4> expected{{
      {TextureFormat::CMPR, 0x0C},
      {TextureFormat::RGB5A3, 0x0E},
      {TextureFormat::RGBA8, 0x06},
      {TextureFormat::IA4, 0x02},
  }};
  for (auto [format, code] : expected) {
    Tpl tpl;
    tpl.textures.push_back(MakeTexture(format, 8, 8, 1));
    const auto data = Save(tpl, Game::SuperMonkeyBallDX);
    // Header format field keeps the GX code, the descriptor has the DX one
    EXPECT_EQ(data[8], static_cast<u8>(format));
    EXPECT_EQ(data[0x20], code) << magic_enum::enum_name(format);

    auto loaded = Load(data, Game::SuperMonkeyBallDX);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded->textures[0].format(), format);
  }
}

TEST(Tpl, StandardLayoutBytes) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1));
  const auto data = Save(tpl, Game::SuperMonkeyBall);
  ASSERT_EQ(data.size(), 0x20u + 32u);

  const std::vector<u8> header{
      0x00, 0x00, 0x00, 0x01, // count
      0x00, 0x00, 0x00, 0x01, // I8
      0x00, 0x00, 0x00, 0x20, // offset
      0x00, 0x08, 0x00, 0x04, // 8x4
      0x00, 0x01, 0x12, 0x34, // levels, check
  };
  EXPECT_TRUE(std::equal(header.begin(), header.end(), data.begin()));
  // Padding counts up from zero
  for (u32 i = 20; i < 0x20; ++i)
    EXPECT_EQ(data[i], i - 20) << i;
  EXPECT_TRUE(std::equal(data.begin() + 0x20, data.end(),
                         tpl.textures[0].levelData(0).begin()));
}

TEST(Tpl, DXLayoutBytes) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1));
  const auto data = Save(tpl, Game::SuperMonkeyBallDX);
  ASSERT_EQ(data.size(), 0x20u + 0x20u + 32u);

  const std::vector<u8> header{
      'X',  'T',  'P',  'L',  //
      0x01, 0x00, 0x00, 0x00, // count
      0x01, 0x00, 0x00, 0x00, // I8
      0x20, 0x00, 0x00, 0x00, // offset of the descriptor
      0x08, 0x00, 0x04, 0x00, // 8x4
      0x01, 0x00, 0x12, 0x34, // levels, check
  };
  EXPECT_TRUE(std::equal(header.begin(), header.end(), data.begin()));
  for (u32 i = 24; i < 0x20; ++i)
    EXPECT_EQ(data[i], i - 24) << i;

  const std::vector<u8> descriptor{
      0x1A, 0, 0, 0, 0x08, 0, 0, 0, 0x04, 0, 0, 0, 0x01, 0, 0, 0,
      0x00, 0, 0, 0, 0x20, 0, 0, 0, 0x00, 0, 0, 0, 0x00, 0, 0, 0,
  };
  EXPECT_TRUE(std::equal(descriptor.begin(), descriptor.end(),
                         data.begin() + 0x20));
}

TEST(Tpl, PlaceholderContributesNoData) {
  auto policy = getGamePolicy(Game::SuperMonkeyBall);
  ASSERT_TRUE(policy.has_value());
  EXPECT_EQ(MakeEmpty(0x1234).sizeOfTextureData(*policy), 0u);

  Tpl tpl;
  tpl.textures.push_back(MakeEmpty(0xDEAD));
  const auto data = Save(tpl, Game::SuperMonkeyBall);
  EXPECT_EQ(data.size(), 0x20u);
  auto loaded = Load(data, Game::SuperMonkeyBall);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->textures[0].formatRaw(), 0xDEADu);
}

TEST(Tpl, NoHeaderWritesOnlyData) {
  for (auto game : AllGames) {
    Tpl tpl;
    tpl.textures.push_back(MakeTexture(TextureFormat::CMPR, 16, 16, 2));
    tpl.textures.push_back(MakeEmpty(0));
    tpl.textures.push_back(MakeTexture(TextureFormat::RGB5A3, 8, 8, 1));

    const auto data = Save(tpl, game, true);
    const u32 tag = game == Game::SuperMonkeyBallDX ? 4 : 0;
    EXPECT_EQ(data.size(), tag + 128u + 32u + 128u);
    EXPECT_EQ(*tpl.sizeOf(game, true), data.size());
    if (tag != 0) {
      EXPECT_EQ(std::string(data.begin(), data.begin() + 4), "XTPL");
    }
  }
}

TEST(Tpl, LoadAtNonZeroOffset) {
  for (auto game : AllGames) {
    Tpl tpl;
    tpl.textures.push_back(MakeTexture(TextureFormat::CMPR, 16, 16, 2));
    tpl.textures.push_back(MakeEmpty(0));
    tpl.textures.push_back(MakeTexture(TextureFormat::IA8, 8, 8, 1));
    const auto inner = Save(tpl, game);

    // Embedded in a larger archive after 0x20 bytes of other data
    std::vector<u8> outer(0x20, 0xEE);
    outer.insert(outer.end(), inner.begin(), inner.end());
    oishii::BinaryReader reader(outer, "archive.bin", EndianOf(game));
    reader.seekSet(0x20);
    auto loaded = Tpl::load(reader, game);
    ASSERT_TRUE(loaded.has_value())
        << magic_enum::enum_name(game) << ": " << loaded.error().message;
    EXPECT_EQ(*loaded, tpl);
  }
}

TEST(Tpl, DefaultTextureIsEmpty) {
  const TplTexture tex;
  EXPECT_FALSE(tex.isDefined());
  EXPECT_EQ(tex.formatRaw(), 0u);
  EXPECT_EQ(tex.levelCount(), 0u);
  EXPECT_EQ(tex, MakeEmpty(0));

  std::vector<TplTexture> slots(3);
  EXPECT_TRUE(std::none_of(slots.begin(), slots.end(),
                           [](const TplTexture& t) { return t.isDefined(); }));
}

TEST(Tpl, LazyDecode) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::RGBA8, 8, 8, 2));
  auto loaded = Load(Save(tpl, Game::SuperMonkeyBall), Game::SuperMonkeyBall);
  ASSERT_TRUE(loaded.has_value());

  auto& tex = loaded->textures[0];
  EXPECT_EQ(tex.levelState(0), LevelState::Raw);
  EXPECT_EQ(tex.levelState(1), LevelState::Raw);
  EXPECT_EQ(tex.levelState(2), std::nullopt);

  auto first = tex.decodeLevel(1);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->size(), 4u * 4u * 4u);
  EXPECT_EQ(tex.levelState(0), LevelState::Raw);
  EXPECT_EQ(tex.levelState(1), LevelState::Decoded);

  auto second = tex.decodeLevel(1);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->data(), second->data());

  // Decoding does not change what is saved
  EXPECT_EQ(Save(*loaded, Game::SuperMonkeyBall),
            Save(tpl, Game::SuperMonkeyBall));

  auto bad = tex.decodeLevel(5);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().kind, ErrorKind::ArgumentError);
}

TEST(Tpl, LastI8LevelQuirk) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::I8, 16, 16, 3, 1));
  tpl.textures.push_back(MakeTexture(TextureFormat::CMPR, 8, 8, 1, 2));

  // 256 + 64 + 32 normally, the last level grows to 64 under F-Zero GX
  auto smb = getGamePolicy(Game::SuperMonkeyBall);
  auto fzero = getGamePolicy(Game::FZeroGX);
  EXPECT_EQ(tpl.textures[0].sizeOfTextureData(*smb), 352u);
  EXPECT_EQ(tpl.textures[0].sizeOfTextureData(*fzero), 384u);

  const auto data = Save(tpl, Game::FZeroGX);
  EXPECT_EQ(data.size(), 0x40u + 384u + 32u);
  EXPECT_EQ(*tpl.sizeOf(Game::FZeroGX), data.size());

  auto loaded = Load(data, Game::FZeroGX);
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  auto& tex = loaded->textures[0];
  EXPECT_EQ(tex.levelData(2).size(), 64u);
  EXPECT_EQ(tex.widthOfLevel(2), 4u);
  EXPECT_EQ(tex.heightOfLevel(2), 4u);
  // The extra rows are zero padding on write
  EXPECT_TRUE(std::all_of(tex.levelData(2).begin() + 32,
                          tex.levelData(2).end(),
                          [](u8 b) { return b == 0; }));
  EXPECT_NE(loaded->textures[0], tpl.textures[0]);
  EXPECT_EQ(loaded->textures[1], tpl.textures[1]);

  // Pixels survive the asymmetry
  auto original = tpl.textures[0];
  auto a = tex.decodeLevel(2);
  auto b = original.decodeLevel(2);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_TRUE(std::ranges::equal(*a, *b));

  // Saving the reloaded container is stable
  EXPECT_EQ(Save(*loaded, Game::FZeroGX), data);
}

TEST(Tpl, InvalidCheckValue) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1));
  auto data = Save(tpl, Game::SuperMonkeyBall);
  PutU16BE(data, 18, 0x4321);
  auto loaded = Load(data, Game::SuperMonkeyBall);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().kind, ErrorKind::InvalidHeader);
}

TEST(Tpl, InvalidFieldCombination) {
  Tpl tpl;
  tpl.textures.push_back(MakeEmpty(0));
  auto data = Save(tpl, Game::SuperMonkeyBall);
  // Width without offset or levels
  PutU16BE(data, 12, 8);
  auto loaded = Load(data, Game::SuperMonkeyBall);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().kind, ErrorKind::InvalidHeader);
}

TEST(Tpl, InvalidAndUnsupportedFormats) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1));
  auto data = Save(tpl, Game::SuperMonkeyBall);

  PutU32BE(data, 4, 0x7);
  auto invalid = Load(data, Game::SuperMonkeyBall);
  ASSERT_FALSE(invalid.has_value());
  EXPECT_EQ(invalid.error().kind, ErrorKind::InvalidFormat);

  // C8: a real format, but palettes are not supported
  PutU32BE(data, 4, 0x9);
  auto palette = Load(data, Game::SuperMonkeyBall);
  ASSERT_FALSE(palette.has_value());
  EXPECT_EQ(palette.error().kind, ErrorKind::UnsupportedFormat);
}

TEST(Tpl, TruncatedData) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::CMPR, 16, 16, 1));
  auto data = Save(tpl, Game::SuperMonkeyBall);
  data.resize(data.size() - 1);
  auto loaded = Load(data, Game::SuperMonkeyBall);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().kind, ErrorKind::InvalidHeader);

  const std::vector<u8> countOnly{0x00, 0x00, 0x01, 0x00};
  auto huge = Load(countOnly, Game::SuperMonkeyBall);
  ASSERT_FALSE(huge.has_value());
  EXPECT_EQ(huge.error().kind, ErrorKind::InvalidHeader);
}

TEST(Tpl, DXMagicAndDescriptor) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::CMPR, 8, 8, 1));
  auto data = Save(tpl, Game::SuperMonkeyBallDX);

  auto badMagic = data;
  badMagic[0] = 'Y';
  auto magic = Load(badMagic, Game::SuperMonkeyBallDX);
  ASSERT_FALSE(magic.has_value());
  EXPECT_EQ(magic.error().kind, ErrorKind::InvalidHeader);

  auto badFormat = data;
  badFormat[0x20] = 0x33;
  auto format = Load(badFormat, Game::SuperMonkeyBallDX);
  ASSERT_FALSE(format.has_value());
  EXPECT_EQ(format.error().kind, ErrorKind::InvalidFormat);

  // Console games reject a DX file
  auto asConsole = Load(data, Game::SuperMonkeyBall);
  EXPECT_FALSE(asConsole.has_value());
}

TEST(Tpl, MergeFillsUndefinedSlotsThenAppends) {
  Tpl target;
  target.textures.push_back(MakeTexture(TextureFormat::CMPR, 8, 8, 1, 1));
  target.textures.push_back(MakeEmpty(0));
  target.textures.push_back(MakeTexture(TextureFormat::CMPR, 8, 8, 1, 2));

  Tpl source;
  source.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1, 3));
  source.textures.push_back(MakeEmpty(0));
  source.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1, 4));

  const auto applied = target.merge(source);
  ASSERT_TRUE(applied.has_value()) << applied.error().message;
  EXPECT_EQ(*applied, (std::map<u32, u32>{{0, 1}, {2, 3}}));
  ASSERT_EQ(target.textures.size(), 4u);
  EXPECT_EQ(target.textures[1], source.textures[0]);
  EXPECT_EQ(target.textures[3], source.textures[2]);
}

TEST(Tpl, MergeMappedCollisions) {
  Tpl base;
  base.textures.push_back(MakeTexture(TextureFormat::CMPR, 8, 8, 1, 1));
  base.textures.push_back(MakeEmpty(0));

  Tpl source;
  source.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1, 3));
  source.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1, 4));
  const std::map<u32, u32> mapping{{0, 0}, {1, 4}};

  {
    Tpl target = base;
    const auto applied =
        target.merge(source, mapping, CollisionPolicy::Overwrite);
    ASSERT_TRUE(applied.has_value());
    EXPECT_EQ(*applied, mapping);
    ASSERT_EQ(target.textures.size(), 5u);
    EXPECT_EQ(target.textures[0], source.textures[0]);
    EXPECT_FALSE(target.textures[1].isDefined());
    EXPECT_FALSE(target.textures[3].isDefined());
    EXPECT_EQ(target.textures[4], source.textures[1]);
  }
  {
    Tpl target = base;
    const auto applied = target.merge(source, mapping, CollisionPolicy::Skip);
    ASSERT_TRUE(applied.has_value());
    EXPECT_EQ(*applied, (std::map<u32, u32>{{1, 4}}));
    EXPECT_EQ(target.textures[0], base.textures[0]);
    EXPECT_EQ(target.textures[4], source.textures[1]);
  }
}

TEST(Tpl, MergeRejectsSlotsPastLimit) {
  Tpl base;
  base.textures.push_back(MakeTexture(TextureFormat::CMPR, 8, 8, 1, 1));

  Tpl source;
  source.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1, 3));
  source.textures.push_back(MakeTexture(TextureFormat::I8, 8, 4, 1, 4));

  for (u32 target : {0xFFFF'FFFFu, MaxTextureCount}) {
    Tpl tpl = base;
    auto applied = tpl.merge(source, {{0, 0}, {1, target}});
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(applied.error().kind, ErrorKind::ArgumentError);
    EXPECT_EQ(tpl, base);
  }

  Tpl tpl = base;
  auto last = tpl.merge(source, {{1, MaxTextureCount - 1}});
  ASSERT_TRUE(last.has_value()) << last.error().message;
  EXPECT_EQ(tpl.textures.size(), MaxTextureCount);
  EXPECT_EQ(tpl.textures.back(), source.textures[1]);
}

TEST(Tpl, PlaceTexturesRejectsIdsPastLimit) {
  Tpl tpl;
  tpl.textures.push_back(MakeEmpty(0));
  const Tpl before = tpl;
  std::vector<TplTexture> imported{
      MakeTexture(TextureFormat::CMPR, 8, 8, 1, 1),
      MakeTexture(TextureFormat::CMPR, 8, 8, 1, 2)};

  const std::array<u32, 2> ids{0, 0xFFFF'FFFF};
  auto bad = tpl.placeTextures(imported, ids);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().kind, ErrorKind::ArgumentError);
  EXPECT_EQ(tpl, before);
}

TEST(Tpl, PlaceTextures) {
  Tpl tpl;
  tpl.textures.push_back(MakeEmpty(0));
  std::vector<TplTexture> imported{
      MakeTexture(TextureFormat::CMPR, 8, 8, 1, 1),
      MakeTexture(TextureFormat::CMPR, 8, 8, 1, 2)};
  const auto expected = imported;

  const std::array<u32, 3> ids{3, 0, 7};
  ASSERT_TRUE(tpl.placeTextures(imported, ids).has_value());
  ASSERT_EQ(tpl.textures.size(), 4u);
  EXPECT_EQ(tpl.textures[3], expected[0]);
  EXPECT_EQ(tpl.textures[0], expected[1]);

  const std::array<u32, 1> tooFew{1};
  auto bad = tpl.placeTextures(expected, tooFew);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().kind, ErrorKind::ArgumentError);
}

TEST(Tpl, FileEntryPoints) {
  Tpl tpl;
  tpl.textures.push_back(MakeTexture(TextureFormat::IA8, 16, 8, 2));
  tpl.textures.push_back(MakeEmpty(3));

  const auto path =
      (std::filesystem::temp_directory_path() / "libgx_file_test.tpl")
          .string();
  for (auto game : {Game::FZeroGX, Game::SuperMonkeyBallDX}) {
    ASSERT_TRUE(writeTplFile(path, tpl, game).has_value());
    auto loaded = readTplFile(path, game);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, tpl);
  }
  std::filesystem::remove(path);

  auto missing = readTplFile(path, Game::FZeroGX);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, ErrorKind::ArgumentError);
}
