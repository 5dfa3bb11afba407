#include "binary_reader.hxx"
#include "../util/util.hxx"

#include <cctype>

namespace oishii {

void BinaryReader::enterRegion(std::string&& name, u32 start) {
  mRegions.push_back(Region{.name = std::move(name), .start = start});
}
void BinaryReader::exitRegion() {
  if (!mRegions.empty()) {
    mRegions.pop_back();
  }
}

void BinaryReader::warnAt(const char* msg, u32 selectBegin, u32 selectEnd,
                          bool checkStack) {
  rsl::warn("{}:0x{:02X}: {}", getFile(), selectBegin, msg);

  // Hex dump of the selection, clamped to the buffer
  const u32 lineBegin = selectBegin / 16;
  const u32 lineEnd =
      std::min<u32>(selectEnd / 16 + !!(selectEnd % 16), (endpos() + 15) / 16);

  std::string dump = "\tOffset\t00 01 02 03 04 05 06 07 08 09 0A 0B 0C 0D 0E 0F\n";
  for (u32 i = lineBegin; i < lineEnd; ++i) {
    dump += fmt::format("\t{:06X}\t", i * 16);
    std::string ascii;
    for (u32 j = 0; j < 16; ++j) {
      const u32 at = i * 16 + j;
      if (at >= endpos()) {
        dump += "   ";
        continue;
      }
      const u8 c = getStreamStart()[at];
      dump += fmt::format("{:02X} ", c);
      ascii += std::isprint(c) ? static_cast<char>(c) : '.';
    }
    dump += ascii;
    dump += '\n';
  }
  rsl::debug("{}", dump);

  if (!checkStack) {
    return;
  }
  for (auto it = mRegions.rbegin(); it != mRegions.rend(); ++it) {
    rsl::debug("\tIn {}: start=0x{:X}", it->name.empty() ? "?" : it->name,
               it->start);
  }
}

BinaryReader::BinaryReader(std::vector<u8>&& view, std::string_view path,
                           std::endian endian)
    : VectorStream(std::move(view)), m_path(path), mFileEndian(endian) {}
BinaryReader::BinaryReader(std::span<const u8> view, std::string_view path,
                           std::endian endian)
    : VectorStream(std::vector<u8>{view.begin(), view.end()}), m_path(path),
      mFileEndian(endian) {}
BinaryReader::~BinaryReader() = default;

BinaryReader::BinaryReader(BinaryReader&&) = default;

std::expected<BinaryReader, std::string>
BinaryReader::FromFilePath(std::string_view path, std::endian endian) {
  auto vec = TRY(UtilReadFile(path));
  return BinaryReader(std::move(vec), path, endian);
}

} // namespace oishii
