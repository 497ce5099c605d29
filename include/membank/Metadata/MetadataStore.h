//===-- MetadataStore.h - Per-compilation-unit metadata store ---*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// MetadataStore maps (symbol, metadata kind) to one owned metadata entry.
// Writes are last-write-wins: putting an entry replaces any previous entry of
// the same kind on that symbol. The store is owned by the compilation unit and
// passed explicitly to every accessor; it is not thread-safe.
//
// Entry types derive from MetadataInfo<Derived, Kind, Transfer>, which wires
// up LLVM-style RTTI (isa/cast/dyn_cast) and cloning for mirror().
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_METADATA_METADATASTORE_H
#define MEMBANK_METADATA_METADATASTORE_H

#include "membank/Banking/Types.h"

#include "llvm/Support/Casting.h"

#include <map>
#include <memory>
#include <utility>

namespace membank {

/// Closed set of metadata kinds attached to memories and accesses.
enum class MetadataKind {
  MemoryDecl,
  AccessDecl,
  Duplicates,
  Padding,
  Dispatch,
  Ports,
  Readers,
  Writers,
  Resetters,
  AccumulatorType,
  ReduceType,
  FMAReduce,
  EnableWriteBuffer,
  EnableNonBuffer,
  UnusedMemory,
};

/// What happens to an entry when its symbol is mirrored onto a new symbol.
enum class Transfer {
  Mirror, // Copied to the new symbol
  Remove, // Recomputed by dataflow; not copied
};

class MetadataEntry {
public:
  explicit MetadataEntry(MetadataKind kind) : kind(kind) {}
  virtual ~MetadataEntry() = default;

  MetadataKind getKind() const { return kind; }
  virtual Transfer getTransfer() const = 0;
  virtual std::unique_ptr<MetadataEntry> clone() const = 0;

private:
  MetadataKind kind;
};

template <typename Derived, MetadataKind K, Transfer T = Transfer::Mirror>
class MetadataInfo : public MetadataEntry {
public:
  static constexpr MetadataKind Kind = K;

  MetadataInfo() : MetadataEntry(K) {}

  static bool classof(const MetadataEntry *entry) {
    return entry->getKind() == K;
  }

  Transfer getTransfer() const override { return T; }

  std::unique_ptr<MetadataEntry> clone() const override {
    return std::make_unique<Derived>(static_cast<const Derived &>(*this));
  }
};

class MetadataStore {
public:
  MetadataStore() = default;
  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;

  /// Return the entry of type T on `sym`, or nullptr when absent.
  template <typename T> const T *get(SymbolId sym) const {
    auto it = entries.find(key(sym, T::Kind));
    if (it == entries.end())
      return nullptr;
    return llvm::cast<T>(it->second.get());
  }

  /// Attach `value` to `sym`, replacing any entry of the same kind.
  template <typename T> void put(SymbolId sym, T value) {
    entries[key(sym, T::Kind)] = std::make_unique<T>(std::move(value));
  }

  template <typename T> bool has(SymbolId sym) const {
    return entries.count(key(sym, T::Kind)) != 0;
  }

  template <typename T> void erase(SymbolId sym) {
    entries.erase(key(sym, T::Kind));
  }

  /// Drop every entry attached to `sym`.
  void clear(SymbolId sym);

  /// Copy every Transfer::Mirror entry of `from` onto `to`, replacing entries
  /// of the same kind already on `to`.
  void mirror(SymbolId from, SymbolId to);

  /// Number of entries attached to `sym`.
  size_t count(SymbolId sym) const;

  size_t size() const { return entries.size(); }

private:
  using Key = std::pair<SymbolId, unsigned>;

  static Key key(SymbolId sym, MetadataKind kind) {
    return Key(sym, static_cast<unsigned>(kind));
  }

  std::map<Key, std::unique_ptr<MetadataEntry>> entries;
};

} // namespace membank

#endif // MEMBANK_METADATA_METADATASTORE_H
