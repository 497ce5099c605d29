//===-- MetadataStore.cpp - Per-compilation-unit metadata store -*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Metadata/MetadataStore.h"

#include "llvm/ADT/SmallVector.h"

namespace membank {

void MetadataStore::clear(SymbolId sym) {
  auto it = entries.lower_bound(Key(sym, 0));
  while (it != entries.end() && it->first.first == sym)
    it = entries.erase(it);
}

void MetadataStore::mirror(SymbolId from, SymbolId to) {
  if (from == to)
    return;

  llvm::SmallVector<std::pair<unsigned, std::unique_ptr<MetadataEntry>>, 8>
      copies;
  for (auto it = entries.lower_bound(Key(from, 0));
       it != entries.end() && it->first.first == from; ++it) {
    if (it->second->getTransfer() == Transfer::Mirror)
      copies.emplace_back(it->first.second, it->second->clone());
  }

  for (auto &copy : copies)
    entries[Key(to, copy.first)] = std::move(copy.second);
}

size_t MetadataStore::count(SymbolId sym) const {
  size_t n = 0;
  for (auto it = entries.lower_bound(Key(sym, 0));
       it != entries.end() && it->first.first == sym; ++it)
    ++n;
  return n;
}

} // namespace membank
