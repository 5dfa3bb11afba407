#include "Gma.hpp"

#include <rsl/SafeReader.hpp>

IMPORT_STD;

namespace libgx::gma {

namespace {

constexpr u32 HeaderSize = 8;
constexpr u32 EntrySize = 8;

struct Layout {
  u32 nameTable = 0;
  u32 modelBase = 0;
  std::vector<u32> nameOffsets;
  //! Relative to modelBase, or -1
  std::vector<s32> modelOffsets;
  u32 end = 0;
};

GxResult<Layout> computeLayout(const Gma& gma) {
  Layout layout;
  layout.nameTable = HeaderSize + EntrySize * gma.entries.size();

  u32 names = 0;
  for (const auto& entry : gma.entries) {
    layout.nameOffsets.push_back(names);
    names += entry.name.size() + 1;
  }
  layout.modelBase = roundUp(layout.nameTable + names, Gma::Alignment);

  u32 models = 0;
  for (u32 i = 0; i < gma.entries.size(); ++i) {
    const auto& entry = gma.entries[i];
    if (!entry.isDefined()) {
      layout.modelOffsets.push_back(-1);
      continue;
    }
    GX_EXPECT(ErrorKind::ArgumentError,
              entry.model.size() >= Gma::ModelMagic.size() &&
                  std::equal(Gma::ModelMagic.begin(), Gma::ModelMagic.end(),
                             entry.model.begin()),
              fmt::format("Model #{} ({}) is not a GCMF blob", i, entry.name));
    layout.modelOffsets.push_back(static_cast<s32>(models));
    models += roundUp(entry.model.size(), Gma::Alignment);
  }
  layout.end = layout.modelBase + models;
  return layout;
}

} // namespace

GxResult<Gma> Gma::load(oishii::BinaryReader& reader, Game game) {
  const auto policy = TRY(getGamePolicy(game));
  reader.setEndian(policy.byteOrder);
  rsl::SafeReader safe(reader);
  const u32 start = reader.tell();

  const u32 count = TRY(WithKind(safe.U32(), ErrorKind::InvalidHeader));
  const u32 modelBase = TRY(WithKind(safe.U32(), ErrorKind::InvalidHeader));
  const u64 nameTable = HeaderSize + static_cast<u64>(EntrySize) * count;
  GX_EXPECT(ErrorKind::InvalidHeader, start + nameTable <= reader.endpos(),
            fmt::format("{} model entries exceed the file", count));
  GX_EXPECT(ErrorKind::InvalidHeader,
            modelBase >= nameTable && start + modelBase <= reader.endpos(),
            fmt::format("Invalid model base 0x{:x}", modelBase));

  std::vector<std::pair<s32, u32>> raw(count);
  for (auto& [model, name] : raw) {
    model = TRY(WithKind(safe.S32(), ErrorKind::InvalidHeader));
    name = TRY(WithKind(safe.U32(), ErrorKind::InvalidHeader));
  }

  // Blobs are opaque, so each one runs until the next one starts
  std::vector<u32> starts;
  for (const auto& [model, name] : raw) {
    if (model != -1)
      starts.push_back(start + modelBase + static_cast<u32>(model));
  }
  std::ranges::sort(starts);

  Gma gma;
  gma.entries.resize(count);
  for (u32 i = 0; i < count; ++i) {
    const auto [model, name] = raw[i];
    auto& entry = gma.entries[i];
    entry.name = TRY(WithKind(safe.StringAt(start + nameTable + name),
                              ErrorKind::InvalidHeader));
    if (model == -1)
      continue;

    GX_EXPECT(ErrorKind::InvalidHeader, model >= 0,
              fmt::format("Model #{} has offset {}", i, model));
    const u32 pos = start + modelBase + static_cast<u32>(model);
    auto next = std::ranges::upper_bound(starts, pos);
    const u32 end = next == starts.end() ? reader.endpos() : *next;
    GX_EXPECT(ErrorKind::InvalidHeader, pos + ModelMagic.size() <= end,
              fmt::format("Model #{} at 0x{:x} is truncated", i, pos));

    {
      oishii::Jump<oishii::Whence::Set> g(reader, pos);
      auto scope = safe.scoped(fmt::format("Model #{} ({})", i, entry.name));
      TRY(WithKind(safe.Magic(ModelMagic), ErrorKind::InvalidHeader));
    }
    entry.model = TRY(WithKind(reader.tryReadBuffer<u8>(end - pos, pos),
                               ErrorKind::InvalidHeader));
  }

  rsl::debug("Loaded GMA with {} models", gma.entries.size());
  return gma;
}

GxResult<u32> Gma::sizeOf(Game game) const {
  TRY(getGamePolicy(game));
  const auto layout = TRY(computeLayout(*this));
  return layout.end;
}

GxResult<void> Gma::save(oishii::Writer& writer, Game game) const {
  const auto policy = TRY(getGamePolicy(game));
  const auto layout = TRY(computeLayout(*this));
  writer.setEndian(policy.byteOrder);
  const u32 start = writer.tell();

  writer.write<u32>(entries.size());
  writer.write<u32>(layout.modelBase);
  for (u32 i = 0; i < entries.size(); ++i) {
    writer.write<s32>(layout.modelOffsets[i]);
    writer.write<u32>(layout.nameOffsets[i]);
  }
  for (const auto& entry : entries) {
    writer.writeBuffer({reinterpret_cast<const u8*>(entry.name.data()),
                        entry.name.size()});
    writer.write<u8>(0);
  }
  while (writer.tell() - start < layout.modelBase)
    writer.write<u8>(0);

  for (const auto& entry : entries) {
    if (!entry.isDefined())
      continue;
    writer.writeBuffer(entry.model);
    const u32 padded = roundUp(entry.model.size(), Alignment);
    for (u32 i = entry.model.size(); i < padded; ++i)
      writer.write<u8>(0);
  }
  return {};
}

} // namespace libgx::gma
