#pragma once

#include <core/common.h>

#include <libgx/Error.hpp>
#include <libgx/GamePolicy.hpp>

#include <oishii/reader/binary_reader.hxx>
#include <oishii/writer/binary_writer.hxx>

namespace libgx::gma {

//! One model slot. Model data is kept as an opaque "GCMF" blob.
struct GmaEntry {
  std::string name;
  //! Empty for slots without a model
  std::vector<u8> model;

  bool isDefined() const { return !model.empty(); }
  bool operator==(const GmaEntry&) const = default;
};

//! Model container index: names and model blob placement only
class Gma {
public:
  static constexpr std::string_view ModelMagic = "GCMF";
  static constexpr u32 Alignment = 0x20;

  std::vector<GmaEntry> entries;

  [[nodiscard]] static GxResult<Gma> load(oishii::BinaryReader& reader,
                                          Game game);
  [[nodiscard]] GxResult<void> save(oishii::Writer& writer, Game game) const;
  [[nodiscard]] GxResult<u32> sizeOf(Game game) const;

  bool operator==(const Gma&) const = default;
};

} // namespace libgx::gma
