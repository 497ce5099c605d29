//===-- Dispatch.cpp - Duplicate commit and dispatch resolution -*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Analysis/Dispatch.h"
#include "membank/Banking/BankingError.h"
#include "membank/Metadata/MemoryMetadata.h"

#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "membank-dispatch"

namespace membank {

namespace {

llvm::Error checkDispatchSet(const std::set<unsigned> &dups, bool isWrite,
                             SymbolId access, llvm::ArrayRef<int64_t> uid) {
  UnrollId unroll(uid.begin(), uid.end());
  if (dups.empty())
    return missingMetadata(MembankError::MISSING_DISPATCH, access,
                           "unrolled access is not routed to any duplicate",
                           std::move(unroll));
  if (!isWrite && dups.size() > 1)
    return invariantViolation(MembankError::READER_MULTI_DISPATCH, access,
                              "reader is routed to " +
                                  llvm::Twine(dups.size()) + " duplicates",
                              std::move(unroll));
  return llvm::Error::success();
}

} // namespace

llvm::Error commitInstances(MetadataStore &store, SymbolId mem,
                            llvm::ArrayRef<Instance> instances) {
  std::vector<Memory> memories;
  for (const Instance &inst : instances) {
    if (llvm::Error err = inst.verifyPorts())
      return err;
    memories.push_back(inst.toMemory());
  }

  // Drop stale routing left by an earlier commit.
  std::set<SymbolId> stale = accesses(store, mem);
  for (const Instance &inst : instances)
    for (SymbolId access : inst.accesses())
      stale.insert(access);
  for (SymbolId access : stale) {
    store.erase<Dispatch>(access);
    store.erase<Ports>(access);
  }

  for (unsigned dup = 0; dup < instances.size(); ++dup) {
    const Instance &inst = instances[dup];
    for (const AccessMatrix *a : inst.accessMatrices()) {
      addDispatch(store, a->access, a->unroll, dup);
      addPort(store, a->access, dup, a->unroll, inst.ports.at(a->id()));
    }
  }
  setDuplicates(store, mem, std::move(memories));

  LLVM_DEBUG(llvm::dbgs() << "[membank.dispatch] memory x" << mem
                          << " committed " << instances.size()
                          << " duplicate(s)\n");
  return llvm::Error::success();
}

llvm::Expected<std::set<unsigned>>
resolveDispatch(const MetadataStore &store, SymbolId access,
                llvm::ArrayRef<int64_t> uid) {
  llvm::Expected<AccessDecl> decl = accessDecl(store, access);
  if (!decl)
    return decl.takeError();
  llvm::Expected<std::set<unsigned>> dups = dispatch(store, access, uid);
  if (!dups)
    return dups.takeError();
  if (llvm::Error err = checkDispatchSet(*dups, decl->isWrite, access, uid))
    return std::move(err);
  return dups;
}

llvm::Expected<unsigned> resolveReader(const MetadataStore &store,
                                       SymbolId access,
                                       llvm::ArrayRef<int64_t> uid) {
  llvm::Expected<std::set<unsigned>> dups = resolveDispatch(store, access, uid);
  if (!dups)
    return dups.takeError();
  return *dups->begin();
}

llvm::Error verifyDispatches(const MetadataStore &store, SymbolId mem) {
  llvm::Expected<std::vector<Memory>> memories = duplicates(store, mem);
  if (!memories)
    return memories.takeError();
  size_t nDups = memories->size();

  auto check = [&](SymbolId access, bool isWrite) -> llvm::Error {
    for (const auto &[uid, dups] : dispatches(store, access)) {
      if (llvm::Error err = checkDispatchSet(dups, isWrite, access, uid))
        return err;
      for (unsigned dup : dups) {
        if (dup >= nDups)
          return invariantViolation(MembankError::DISPATCH_OUT_OF_RANGE,
                                    access,
                                    "routed to duplicate " + llvm::Twine(dup) +
                                        " of memory x" + llvm::Twine(mem) +
                                        " which has " + llvm::Twine(nDups),
                                    uid);
        llvm::Expected<Port> p = port(store, access, dup, uid);
        if (!p)
          return p.takeError();
      }
    }
    return llvm::Error::success();
  };

  for (SymbolId access : writers(store, mem))
    if (llvm::Error err = check(access, /*isWrite=*/true))
      return err;
  for (SymbolId access : readers(store, mem))
    if (llvm::Error err = check(access, /*isWrite=*/false))
      return err;
  return llvm::Error::success();
}

llvm::Error collapseToInstance(MetadataStore &store, SymbolId logicalMem,
                               unsigned dup, SymbolId unrolledMem) {
  llvm::Expected<std::vector<Memory>> memories = duplicates(store, logicalMem);
  if (!memories)
    return memories.takeError();
  if (dup >= memories->size())
    return invariantViolation(MembankError::DISPATCH_OUT_OF_RANGE, logicalMem,
                              "duplicate " + llvm::Twine(dup) +
                                  " requested but memory has " +
                                  llvm::Twine(memories->size()));

  Memory chosen = (*memories)[dup];
  if (unrolledMem != logicalMem)
    store.mirror(logicalMem, unrolledMem);
  setInstance(store, unrolledMem, std::move(chosen));

  LLVM_DEBUG(llvm::dbgs() << "[membank.dispatch] x" << unrolledMem
                          << " <- duplicate " << dup << " of x" << logicalMem
                          << "\n");
  return llvm::Error::success();
}

} // namespace membank
