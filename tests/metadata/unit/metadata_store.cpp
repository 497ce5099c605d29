//===-- metadata_store.cpp - Metadata store semantics test ------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Verify last-write-wins puts, erase/clear, and mirroring with per-kind
// transfer policies.
//
//===----------------------------------------------------------------------===//

#include "TestUtil.h"
#include "membank/Metadata/MemoryMetadata.h"
#include "membank/Metadata/MetadataStore.h"

using namespace membank;

int main() {
  // Absent entries read as nullptr.
  {
    MetadataStore store;
    TEST_ASSERT(store.get<Padding>(1) == nullptr);
    TEST_ASSERT(!store.has<Padding>(1));
    TEST_ASSERT(store.size() == 0);
  }

  // Last write wins, per (symbol, kind).
  {
    MetadataStore store;
    Padding first;
    first.dims = {1, 2};
    store.put(1, first);
    Padding second;
    second.dims = {3};
    store.put(1, second);
    Padding other;
    other.dims = {9};
    store.put(2, other);

    TEST_ASSERT(store.has<Padding>(1));
    TEST_ASSERT(store.get<Padding>(1)->dims.size() == 1);
    TEST_ASSERT(store.get<Padding>(1)->dims[0] == 3);
    TEST_ASSERT(store.get<Padding>(2)->dims[0] == 9);
    TEST_ASSERT(store.count(1) == 1);
    TEST_ASSERT(store.size() == 2);

    // Different kinds on one symbol coexist.
    setNonBuffer(store, 1, true);
    TEST_ASSERT(store.count(1) == 2);
    TEST_ASSERT(llvm::isa<EnableNonBuffer>(
        static_cast<const MetadataEntry *>(store.get<EnableNonBuffer>(1))));

    store.erase<Padding>(1);
    TEST_ASSERT(!store.has<Padding>(1));
    TEST_ASSERT(store.has<EnableNonBuffer>(1));
    TEST_ASSERT(store.has<Padding>(2));
  }

  // clear() drops every kind of one symbol only.
  {
    MetadataStore store;
    setPadding(store, 5, {1});
    setNonBuffer(store, 5, true);
    setAccumType(store, 5, AccumType::fma());
    setPadding(store, 4, {2});
    setPadding(store, 6, {3});
    store.clear(5);
    TEST_ASSERT(store.count(5) == 0);
    TEST_ASSERT(store.count(4) == 1);
    TEST_ASSERT(store.count(6) == 1);
  }

  // mirror() copies Mirror entries and skips dataflow sets.
  {
    MetadataStore store;
    setMemoryDecl(store, 10, MemoryKind::SRAM, {8, 8}, "buf");
    setPadding(store, 10, {0, 1});
    setReaders(store, 10, {20, 21});
    setWriters(store, 10, {22});
    setResetters(store, 10, {23});
    setPadding(store, 11, {7, 7});

    store.mirror(10, 11);
    TEST_ASSERT(getMemoryDecl(store, 11) != nullptr);
    TEST_ASSERT(getMemoryDecl(store, 11)->name == "buf");
    // Replaces the existing entry of the same kind.
    TEST_ASSERT((*getPadding(store, 11))[1] == 1);
    TEST_ASSERT(readers(store, 11).empty());
    TEST_ASSERT(writers(store, 11).empty());
    TEST_ASSERT(resetters(store, 11).empty());

    // The copy is independent of the source.
    setPadding(store, 10, {5, 5});
    TEST_ASSERT((*getPadding(store, 11))[0] == 0);

    // Mirroring onto itself changes nothing.
    size_t before = store.size();
    store.mirror(10, 10);
    TEST_ASSERT(store.size() == before);
  }

  return 0;
}
