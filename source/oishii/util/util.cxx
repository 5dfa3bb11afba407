#include <fstream>
#include "util.hxx"

namespace oishii {

Result<std::vector<u8>> UtilReadFile(std::string_view path) {
  std::ifstream file(std::string(path), std::ios::binary | std::ios::ate);
  if (!file) {
    return std::unexpected("Failed to open file " + std::string(path));
  }

  std::vector<u8> vec(file.tellg());
  file.seekg(0, std::ios::beg);

  if (!file.read(reinterpret_cast<char*>(vec.data()), vec.size())) {
    return std::unexpected("Failed to read file " + std::string(path));
  }
  return vec;
}

Result<void> FlushFile(std::span<const u8> buf, std::string_view path) {
  std::ofstream stream(std::string(path), std::ios::binary | std::ios::out);
  if (!stream) {
    rsl::error("Failed to open {} for writing", path);
    return std::unexpected("Failed to open file " + std::string(path));
  }
  stream.write(reinterpret_cast<const char*>(buf.data()), buf.size());
  if (!stream) {
    return std::unexpected("Failed to write file " + std::string(path));
  }
  return {};
}

} // namespace oishii
