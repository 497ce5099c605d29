//===-- dispatch_commit.cpp - Commit and dispatch test ----------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Verify that committing instances records duplicates, dispatches and ports,
// that recommitting is idempotent, and that dispatch resolution enforces the
// reader/writer cardinality rules.
//
//===----------------------------------------------------------------------===//

#include "TestUtil.h"
#include "membank/Analysis/Dispatch.h"
#include "membank/Analysis/PortAssigner.h"
#include "membank/Banking/BankingError.h"
#include "membank/Metadata/MemoryMetadata.h"

using namespace membank;

namespace {

constexpr SymbolId kMem = 1;
constexpr SymbolId kWrite = 2;
constexpr SymbolId kReadA = 3;
constexpr SymbolId kReadB = 4;

AccessMatrix acc(SymbolId access, UnrollId unroll) {
  AccessMatrix a;
  a.access = access;
  a.unroll = std::move(unroll);
  a.scope = 0;
  a.matrix = {{1}};
  a.offset = {0};
  return a;
}

void declare(MetadataStore &store) {
  setMemoryDecl(store, kMem, MemoryKind::SRAM, {8}, "buf");
  setWriters(store, kMem, {kWrite});
  setReaders(store, kMem, {kReadA, kReadB});
  setAccessDecl(store, kWrite, kMem, true);
  setAccessDecl(store, kReadA, kMem, false);
  setAccessDecl(store, kReadB, kMem, false);
}

// Two duplicates: the writer feeds both, each reader uses one.
std::vector<Instance> buildPair(const MetadataStore &store,
                                const ScopeTable &scopes) {
  PortAssigner assigner;
  std::vector<Instance> result;
  for (SymbolId reader : {kReadA, kReadB}) {
    InstanceRequest req;
    req.writes = {{acc(kWrite, {0}), acc(kWrite, {1})}};
    req.reads = {{acc(reader, {0})}};
    req.banking.push_back(Banking::mod(reader == kReadA ? 2 : 4, 1, {1}, {0}));
    result.push_back(cantFailOrDie(
        assigner.buildInstance(store, kMem, scopes, std::move(req))));
  }
  return result;
}

} // namespace

int main() {
  ScopeTable scopes;
  scopes.addScope(0);

  // Commit records duplicates, dispatches and ports.
  {
    MetadataStore store;
    declare(store);
    std::vector<Instance> insts = buildPair(store, scopes);
    TEST_ASSERT(!commitInstances(store, kMem, insts));

    llvm::Expected<std::vector<Memory>> dups = duplicates(store, kMem);
    TEST_ASSERT(dups && dups->size() == 2);
    TEST_ASSERT((*dups)[0] == insts[0].toMemory());
    TEST_ASSERT((*dups)[1].totalBanks() == 4);

    // Writers broadcast to every duplicate they appear in.
    llvm::Expected<std::set<unsigned>> wr = resolveDispatch(store, kWrite, {1});
    TEST_ASSERT(wr && wr->size() == 2);

    llvm::Expected<unsigned> a = resolveReader(store, kReadA, {0});
    llvm::Expected<unsigned> b = resolveReader(store, kReadB, {0});
    TEST_ASSERT(a && *a == 0);
    TEST_ASSERT(b && *b == 1);

    llvm::Expected<Port> p = port(store, kWrite, 1, {1});
    TEST_ASSERT(p && p->muxOffset == 1 && p->muxWidth == 2);
    TEST_ASSERT(!verifyDispatches(store, kMem));

    // Recommitting leaves the stored state unchanged.
    size_t entries = store.size();
    DispatchMap before = dispatches(store, kWrite);
    std::map<unsigned, PortMap> portsBefore = *getPorts(store, kWrite);
    TEST_ASSERT(!commitInstances(store, kMem, insts));
    TEST_ASSERT(store.size() == entries);
    TEST_ASSERT(dispatches(store, kWrite) == before);
    TEST_ASSERT(*getPorts(store, kWrite) == portsBefore);
    TEST_ASSERT(llvm::cantFail(duplicates(store, kMem)) == *dups);

    // Committing a different selection drops stale routing.
    std::vector<Instance> single = {insts[0]};
    TEST_ASSERT(!commitInstances(store, kMem, single));
    TEST_ASSERT(llvm::cantFail(dispatch(store, kWrite, {0})).size() == 1);
    TEST_ASSERT(!getDispatches(store, kReadB));
    TEST_ASSERT(!getPort(store, kWrite, 1, {0}));
  }

  // Dispatch resolution failures.
  {
    MetadataStore store;
    declare(store);
    TEST_ASSERT(!commitInstances(store, kMem, buildPair(store, scopes)));

    llvm::Error missing = resolveDispatch(store, kReadA, {5}).takeError();
    UnrollId unroll;
    std::string code;
    llvm::handleAllErrors(std::move(missing), [&](const MetadataError &e) {
      unroll.assign(e.getUnroll().begin(), e.getUnroll().end());
      code = e.getCode();
    });
    TEST_ASSERT(code == MembankError::MISSING_DISPATCH);
    TEST_ASSERT(unroll == UnrollId({5}));

    TEST_ASSERT(consumeErrorCode(resolveDispatch(store, 99, {0}).takeError()) ==
                MembankError::MISSING_ACCESS_DECL);

    // A reader routed to two duplicates violates the dispatch invariant.
    addDispatch(store, kReadA, {0}, 1);
    addPort(store, kReadA, 1, {0}, Port());
    TEST_ASSERT(consumeErrorCode(resolveDispatch(store, kReadA, {0})
                                     .takeError()) ==
                MembankError::READER_MULTI_DISPATCH);
    TEST_ASSERT(consumeErrorCode(resolveReader(store, kReadA, {0})
                                     .takeError()) ==
                MembankError::READER_MULTI_DISPATCH);
    TEST_ASSERT(consumeErrorCode(verifyDispatches(store, kMem)) ==
                MembankError::READER_MULTI_DISPATCH);
  }

  // verifyDispatches range, port and writer checks.
  {
    MetadataStore store;
    declare(store);
    TEST_ASSERT(consumeErrorCode(verifyDispatches(store, kMem)) ==
                MembankError::MISSING_DUPLICATES);
    TEST_ASSERT(!commitInstances(store, kMem, buildPair(store, scopes)));

    addDispatch(store, kWrite, {0}, 5);
    TEST_ASSERT(consumeErrorCode(verifyDispatches(store, kMem)) ==
                MembankError::DISPATCH_OUT_OF_RANGE);

    MetadataStore noPort;
    declare(noPort);
    TEST_ASSERT(!commitInstances(noPort, kMem, buildPair(noPort, scopes)));
    addDispatch(noPort, kWrite, {7}, 0);
    TEST_ASSERT(consumeErrorCode(verifyDispatches(noPort, kMem)) ==
                MembankError::MISSING_PORTS);

    MetadataStore unrouted;
    declare(unrouted);
    TEST_ASSERT(!commitInstances(unrouted, kMem, buildPair(unrouted, scopes)));
    DispatchMap map = dispatches(unrouted, kWrite);
    map[UnrollId({0})].clear();
    setDispatches(unrouted, kWrite, map);
    TEST_ASSERT(consumeErrorCode(verifyDispatches(unrouted, kMem)) ==
                MembankError::MISSING_DISPATCH);
  }

  // Instances without ports are rejected before anything is stored.
  {
    MetadataStore store;
    declare(store);
    std::vector<Instance> insts = buildPair(store, scopes);
    insts[1].ports.clear();
    TEST_ASSERT(consumeErrorCode(commitInstances(store, kMem, insts)) ==
                MembankError::PORT_MISSING);
    TEST_ASSERT(!getDuplicates(store, kMem));
    TEST_ASSERT(dispatches(store, kWrite).empty());
  }

  // Collapsing a duplicate onto an unrolled memory symbol.
  {
    MetadataStore store;
    declare(store);
    setPadding(store, kMem, {1});
    std::vector<Instance> insts = buildPair(store, scopes);
    TEST_ASSERT(!commitInstances(store, kMem, insts));

    TEST_ASSERT(!collapseToInstance(store, kMem, 1, 50));
    llvm::Expected<Memory> inst = instance(store, 50);
    TEST_ASSERT(inst && *inst == insts[1].toMemory());
    TEST_ASSERT(getPadding(store, 50).has_value());
    TEST_ASSERT(getMemoryDecl(store, 50) != nullptr);
    TEST_ASSERT(readers(store, 50).empty());
    // The logical memory keeps its duplicates.
    TEST_ASSERT(llvm::cantFail(duplicates(store, kMem)).size() == 2);

    TEST_ASSERT(consumeErrorCode(collapseToInstance(store, kMem, 2, 51)) ==
                MembankError::DISPATCH_OUT_OF_RANGE);

    TEST_ASSERT(!collapseToInstance(store, kMem, 0, kMem));
    TEST_ASSERT(llvm::cantFail(instance(store, kMem)).totalBanks() == 2);
  }

  return 0;
}
