#include <core/common.h>

#include <gtest/gtest.h>

#include <libgx/GamePolicy.hpp>

IMPORT_STD;

using namespace libgx;
using gx::TextureFormat;

TEST(GamePolicy, ConsoleGames) {
  for (auto game : {Game::SuperMonkeyBall, Game::FZeroGX}) {
    auto policy = getGamePolicy(game);
    ASSERT_TRUE(policy.has_value());
    EXPECT_EQ(policy->byteOrder, std::endian::big);
    EXPECT_EQ(policy->schema, HeaderSchema::Standard);
    EXPECT_TRUE(policy->magic.empty());
    EXPECT_EQ(policy->checkValue, 0x1234);
    EXPECT_EQ(policy->headerStride, 16u);
    EXPECT_EQ(policy->headerPrefixSize, 4u);
    EXPECT_EQ(policy->textureDescriptorSize, 0u);
  }
}

TEST(GamePolicy, DX) {
  auto policy = getGamePolicy(Game::SuperMonkeyBallDX);
  ASSERT_TRUE(policy.has_value());
  EXPECT_EQ(policy->byteOrder, std::endian::little);
  EXPECT_TRUE(policy->isDX());
  EXPECT_EQ(policy->magic, "XTPL");
  EXPECT_EQ(policy->checkValue, 0x3412);
  EXPECT_EQ(policy->headerPrefixSize, 8u);
  EXPECT_EQ(policy->textureDescriptorSize, 32u);
  EXPECT_EQ(policy->lastI8LevelBlockHeight, 0u);
}

TEST(GamePolicy, HeaderSize) {
  auto smb = getGamePolicy(Game::SuperMonkeyBall);
  auto dx = getGamePolicy(Game::SuperMonkeyBallDX);
  ASSERT_TRUE(smb.has_value());
  ASSERT_TRUE(dx.has_value());
  EXPECT_EQ(smb->headerSize(0), 0x20u);
  EXPECT_EQ(smb->headerSize(1), 0x20u);
  EXPECT_EQ(smb->headerSize(2), 0x40u);
  EXPECT_EQ(dx->headerSize(1), 0x20u);
  // 8 + 16 * 2 = 40
  EXPECT_EQ(dx->headerSize(2), 0x40u);
  EXPECT_EQ(smb->headerSize(7), 0x80u);
  EXPECT_EQ(dx->headerSize(7), 0x80u);
  EXPECT_EQ(smb->headerSize(8), 0xA0u);
  EXPECT_EQ(dx->headerSize(8), 0xA0u);
}

TEST(GamePolicy, UnknownGame) {
  auto policy = getGamePolicy(99u);
  ASSERT_FALSE(policy.has_value());
  EXPECT_EQ(policy.error().kind, ErrorKind::ArgumentError);

  auto cast = getGamePolicy(static_cast<Game>(5));
  ASSERT_FALSE(cast.has_value());
  EXPECT_EQ(cast.error().kind, ErrorKind::ArgumentError);

  EXPECT_TRUE(getGamePolicy(2u).has_value());
}

TEST(GamePolicy, DxFormatMapping) {
  const std::array<std::pair<u32, TextureFormat>, 3> pairs{{
      {0x0C, TextureFormat::CMPR},
      {0x1A, TextureFormat::I8},
      {0x0E, TextureFormat::RGB5A3},
  }};
  for (auto [code, format] : pairs) {
    auto mapped = mapDxFormat(code);
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(*mapped, format);
    auto unmapped = unmapDxFormat(format);
    ASSERT_TRUE(unmapped.has_value());
    EXPECT_EQ(*unmapped, code);
  }

  auto unknown = mapDxFormat(0x33);
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().kind, ErrorKind::InvalidFormat);

  auto palette = mapDxFormat(0x9);
  ASSERT_FALSE(palette.has_value());
  EXPECT_EQ(palette.error().kind, ErrorKind::UnsupportedFormat);

  auto noCode = unmapDxFormat(static_cast<TextureFormat>(0x7));
  ASSERT_FALSE(noCode.has_value());
  EXPECT_EQ(noCode.error().kind, ErrorKind::UnsupportedFormat);
}

TEST(GamePolicy, DxFormatFallsBackToGxCode) {
  for (auto format : {TextureFormat::I4, TextureFormat::IA4,
                      TextureFormat::IA8, TextureFormat::RGB565,
                      TextureFormat::RGBA8}) {
    const u32 code = static_cast<u32>(format);
    EXPECT_EQ(unmapDxFormat(format), code);
    EXPECT_EQ(mapDxFormat(code), format);
  }
  // The GX code of I8 is accepted too, but I8 is written as 0x1A
  EXPECT_EQ(mapDxFormat(0x1), TextureFormat::I8);
  // 0x0E is RGB5A3 on DX, not CMPR
  EXPECT_EQ(mapDxFormat(0x0E), TextureFormat::RGB5A3);
}

TEST(GamePolicy, LastI8LevelQuirk) {
  auto fzero = getGamePolicy(Game::FZeroGX);
  auto smb = getGamePolicy(Game::SuperMonkeyBall);
  ASSERT_TRUE(fzero.has_value());
  ASSERT_TRUE(smb.has_value());
  EXPECT_EQ(fzero->lastI8LevelBlockHeight, 8u);

  // 16x16, 3 levels: the 4x4 last level is sized as 4x8 (one 8x8 block)
  EXPECT_EQ(levelDataSize(*smb, TextureFormat::I8, 16, 16, 2, 3), 32u);
  EXPECT_EQ(levelDataSize(*fzero, TextureFormat::I8, 16, 16, 2, 3), 64u);
  // Earlier levels and other formats are untouched
  EXPECT_EQ(levelDataSize(*fzero, TextureFormat::I8, 16, 16, 1, 3), 64u);
  EXPECT_EQ(levelDataSize(*fzero, TextureFormat::IA4, 16, 16, 2, 3), 32u);
  // A single level is not a chain
  EXPECT_EQ(levelDataSize(*fzero, TextureFormat::I8, 4, 4, 0, 1), 32u);
}
