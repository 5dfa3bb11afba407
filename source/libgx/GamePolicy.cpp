#include "GamePolicy.hpp"

#include <rsl/SafeReader.hpp>

IMPORT_STD;

namespace libgx {

namespace {

constexpr GamePolicy SuperMonkeyBallPolicy{
    .game = Game::SuperMonkeyBall,
};

constexpr GamePolicy SuperMonkeyBallDXPolicy{
    .game = Game::SuperMonkeyBallDX,
    .byteOrder = std::endian::little,
    .schema = HeaderSchema::DX,
    .magic = "XTPL",
    .checkValue = 0x3412,
    .headerPrefixSize = 8,
    .textureDescriptorSize = 32,
};

constexpr GamePolicy FZeroGXPolicy{
    .game = Game::FZeroGX,
    .lastI8LevelBlockHeight = 8,
};

struct DxFormatPair {
  u32 code;
  gx::TextureFormat format;
};
constexpr std::array<DxFormatPair, 3> DxFormats{{
    {0x0C, gx::TextureFormat::CMPR},
    {0x1A, gx::TextureFormat::I8},
    {0x0E, gx::TextureFormat::RGB5A3},
}};

} // namespace

GxResult<GamePolicy> getGamePolicy(Game game) {
  switch (game) {
  case Game::SuperMonkeyBall:
    return SuperMonkeyBallPolicy;
  case Game::SuperMonkeyBallDX:
    return SuperMonkeyBallDXPolicy;
  case Game::FZeroGX:
    return FZeroGXPolicy;
  }
  return MakeError(ErrorKind::ArgumentError,
                   fmt::format("Unknown game {}", static_cast<u32>(game)));
}

GxResult<GamePolicy> getGamePolicy(u32 game) {
  auto as_enum = rsl::enum_cast<Game>(game);
  if (!as_enum) {
    return MakeError(ErrorKind::ArgumentError, as_enum.error());
  }
  return getGamePolicy(*as_enum);
}

GxResult<gx::TextureFormat> mapDxFormat(u32 code) {
  for (const auto& it : DxFormats) {
    if (it.code == code)
      return it.format;
  }
  // Codes outside the table are stored as the GX code itself
  if (gx::isKnownFormat(code))
    return static_cast<gx::TextureFormat>(code);
  if (gx::isPaletteFormat(code)) {
    return MakeError(ErrorKind::UnsupportedFormat,
                     fmt::format("DX texture format 0x{:x} is a palette "
                                 "format",
                                 code));
  }
  return MakeError(ErrorKind::InvalidFormat,
                   fmt::format("Unknown DX texture format 0x{:x}", code));
}

GxResult<u32> unmapDxFormat(gx::TextureFormat format) {
  for (const auto& it : DxFormats) {
    if (it.format == format)
      return it.code;
  }
  const u32 code = static_cast<u32>(format);
  if (!gx::isKnownFormat(code)) {
    return MakeError(ErrorKind::UnsupportedFormat,
                     fmt::format("No DX texture format code for 0x{:x}",
                                 code));
  }
  return code;
}

u64 levelDataSize(const GamePolicy& policy, gx::TextureFormat format,
                  u32 width, u32 height, u32 level, u32 levelCount) {
  const auto info = gx::getFormatInfo(format);
  const u32 w = gx::mipDimension(width, level);
  u32 h = gx::mipDimension(height, level);
  if (policy.lastI8LevelBlockHeight != 0 &&
      format == gx::TextureFormat::I8 && levelCount > 1 &&
      level + 1 == levelCount) {
    h = roundUp(h, policy.lastI8LevelBlockHeight);
  }
  const u64 xtiles = (static_cast<u64>(w) + (1u << info.xshift) - 1) >>
                     info.xshift;
  const u64 ytiles = (static_cast<u64>(h) + (1u << info.yshift) - 1) >>
                     info.yshift;
  return xtiles * ytiles * info.bitsize;
}

} // namespace libgx
