#pragma once

#include <core/common.h>
#include <magic_enum.hpp>
#include <oishii/reader/binary_reader.hxx>

namespace rsl {

inline std::string EnumError(u32 bad, auto&& good) {
  std::string values_printed;
  for (auto [id, name] : good) {
    auto id_raw = static_cast<u32>(id);
    if (!values_printed.empty())
      values_printed += ", ";
    values_printed += fmt::format("{}={}=0x{:x}", name, id_raw, id_raw);
  }
  return fmt::format(
      "Invalid enum value. Expected one of ({}). Instead saw {} (0x{:x}).",
      values_printed, bad, bad);
}

template <typename E>
inline std::expected<E, std::string> enum_cast(u32 candidate) {
  auto as_enum = magic_enum::enum_cast<E>(
      static_cast<magic_enum::underlying_type_t<E>>(candidate));
  if (!as_enum.has_value() ||
      static_cast<u32>(magic_enum::enum_integer(*as_enum)) != candidate) {
    auto values = magic_enum::enum_entries<E>();
    auto msg = EnumError(candidate, values);
    return std::unexpected(msg);
  }
  return *as_enum;
}

class SafeReader {
public:
  template <typename T> using Result = std::expected<T, std::string>;

  SafeReader(oishii::BinaryReader& reader) : mReader(reader) {}

  // Doesn't ever fail
  void seekSet(u32 pos);
  auto tell() const -> u32;

  auto U32() -> Result<u32>;
  auto S32() -> Result<s32>;
  auto U16() -> Result<u16>;

  template <typename T, typename E> auto Enum() -> Result<E> {
    static_assert(std::is_integral_v<T>);
    static_assert(sizeof(T) <= sizeof(u32));

    auto u = TRY(mReader.tryRead<T>());
    auto as_enum = enum_cast<E>(u);
    if (!as_enum.has_value()) {
      mReader.warnAt(as_enum.error().c_str(), mReader.tell() - sizeof(T),
                     mReader.tell());
      return std::unexpected(as_enum.error());
    }
    return *as_enum;
  }

  template <typename E> auto Enum32() -> Result<E> { return Enum<u32, E>(); }

  auto Magic(std::string_view ident) -> Result<std::string_view>;

  //! NUL-terminated string at the absolute position |at|
  Result<std::string> StringAt(u32 at);

  auto scoped(std::string&& name) {
    return mReader.createScoped(std::move(name));
  }

  oishii::BinaryReader& getUnsafe() { return mReader; }

private:
  oishii::BinaryReader& mReader;
};

} // namespace rsl
