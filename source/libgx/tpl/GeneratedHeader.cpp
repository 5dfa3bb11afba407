#include "GeneratedHeader.hpp"

#include <charconv>
#include <filesystem>
#include <regex>

IMPORT_STD;

namespace libgx::tpl {

GxResult<GeneratedTextureHeader>
generateHeaderFromFile(std::string_view fileName, u64 fileSize,
                       gx::TextureFormat format, Game game) {
  const auto policy = TRY(getGamePolicy(game));
  if (!gx::isKnownFormat(static_cast<u32>(format))) {
    return MakeError(ErrorKind::UnsupportedFormat,
                     fmt::format("No codec for texture format 0x{:x}",
                                 static_cast<u32>(format)));
  }

  const auto stem = std::filesystem::path(fileName).stem().string();
  static const std::regex dimensions(R"((\d+)[xX](\d+)$)");
  std::smatch match;
  if (!std::regex_search(stem, match, dimensions)) {
    return MakeError(ErrorKind::ArgumentError,
                     fmt::format("\"{}\" does not end in <width>x<height>",
                                 fileName));
  }

  auto parse = [](const std::string& s) -> std::optional<u32> {
    u32 v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size())
      return std::nullopt;
    return v;
  };
  const auto width = parse(match[1].str());
  const auto height = parse(match[2].str());
  if (!width || !height || *width == 0 || *height == 0 || *width > 0xFFFF ||
      *height > 0xFFFF) {
    return MakeError(ErrorKind::ArgumentError,
                     fmt::format("Invalid dimensions in \"{}\"", fileName));
  }

  // The DX tag is not texture data
  if (fileSize < policy.magic.size()) {
    return MakeError(ErrorKind::ArgumentError,
                     fmt::format("File size {} is smaller than the \"{}\" tag",
                                 fileSize, policy.magic));
  }
  fileSize -= policy.magic.size();

  const u64 textureSize =
      static_cast<u64>(*width) * *height * gx::bitsPerPixel(format) / 8;
  if (textureSize == 0 || fileSize == 0 || fileSize % textureSize != 0) {
    return MakeError(
        ErrorKind::ArgumentError,
        fmt::format("File size {} is not a multiple of the {}x{} {} texture "
                    "size {}",
                    fileSize, *width, *height, magic_enum::enum_name(format),
                    textureSize));
  }
  const u64 count = fileSize / textureSize;
  GX_EXPECT(ErrorKind::ArgumentError, count <= 0xFFFF,
            fmt::format("{} textures is too many for one container", count));

  rsl::info("{}: {} {}x{} {} texture(s) without a header", fileName, count,
            *width, *height, magic_enum::enum_name(format));

  return GeneratedTextureHeader{
      .textureCount = static_cast<u32>(count),
      .width = *width,
      .height = *height,
      .format = format,
      .mipmapCount = 1,
  };
}

} // namespace libgx::tpl
