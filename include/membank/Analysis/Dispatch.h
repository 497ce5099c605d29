//===-- Dispatch.h - Duplicate commit and dispatch resolution ---*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// After banking analysis picks one Instance per physical duplicate of a
// logical memory, commitInstances() records the duplicates on the memory and,
// on every access, which duplicates each unrolled copy is routed to and the
// port it uses there. Downstream passes resolve those dispatches per unrolled
// copy; a reader is routed to at most one duplicate, a writer to at least one.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_ANALYSIS_DISPATCH_H
#define MEMBANK_ANALYSIS_DISPATCH_H

#include "membank/Banking/Instance.h"
#include "membank/Metadata/MetadataStore.h"

#include "llvm/Support/Error.h"

#include <set>

namespace membank {

/// Store the winning instances of `mem` as its duplicates and record the
/// dispatch and port of every unrolled access. Previous dispatch and port
/// entries of the committed accesses are replaced, so committing the same
/// instances twice leaves the store unchanged.
llvm::Error commitInstances(MetadataStore &store, SymbolId mem,
                            llvm::ArrayRef<Instance> instances);

/// Duplicate indices the unrolled copy `uid` of `access` is routed to.
llvm::Expected<std::set<unsigned>>
resolveDispatch(const MetadataStore &store, SymbolId access,
                llvm::ArrayRef<int64_t> uid);

/// The single duplicate a reader copy is routed to.
llvm::Expected<unsigned> resolveReader(const MetadataStore &store,
                                       SymbolId access,
                                       llvm::ArrayRef<int64_t> uid);

/// Check dispatch cardinality, index range and port presence for every
/// access of `mem`.
llvm::Error verifyDispatches(const MetadataStore &store, SymbolId mem);

/// Install duplicate `dup` of `logicalMem` as the only instance of
/// `unrolledMem`, copying the logical memory's other transferable metadata.
llvm::Error collapseToInstance(MetadataStore &store, SymbolId logicalMem,
                               unsigned dup, SymbolId unrolledMem);

} // namespace membank

#endif // MEMBANK_ANALYSIS_DISPATCH_H
