//===-- memory_metadata.cpp - Typed metadata accessor test ------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Verify the typed accessors: declarations, duplicates and instance,
// dispatch and port tables, access sets, accumulator classification and
// user flags, and the errors raised for missing metadata.
//
//===----------------------------------------------------------------------===//

#include "TestUtil.h"
#include "membank/Banking/BankingError.h"
#include "membank/Metadata/MemoryMetadata.h"

using namespace membank;

int main() {
  // Declarations, rank and constant dims.
  {
    MetadataStore store;
    TEST_ASSERT(consumeErrorCode(rank(store, 1).takeError()) ==
                MembankError::MISSING_RANK);
    TEST_ASSERT(consumeErrorCode(constDims(store, 1).takeError()) ==
                MembankError::MISSING_DIMS);

    setMemoryDecl(store, 1, MemoryKind::SRAM, {16, 32}, "weights");
    llvm::Expected<unsigned> r = rank(store, 1);
    TEST_ASSERT(r && *r == 2);
    llvm::Expected<Address> dims = constDims(store, 1);
    TEST_ASSERT(dims && (*dims)[1] == 32);

    setMemoryDecl(store, 2, MemoryKind::DRAM, {-1, 4});
    llvm::Expected<unsigned> dramRank = rank(store, 2);
    TEST_ASSERT(dramRank && *dramRank == 2);
    TEST_ASSERT(consumeErrorCode(constDims(store, 2).takeError()) ==
                MembankError::MISSING_DIMS);
  }

  // Memory kind predicates.
  {
    MetadataStore store;
    setMemoryDecl(store, 1, MemoryKind::SRAM, {4});
    setMemoryDecl(store, 2, MemoryKind::ArgIn, {});
    setMemoryDecl(store, 3, MemoryKind::DRAM, {64});
    setMemoryDecl(store, 4, MemoryKind::FIFO, {8});

    TEST_ASSERT(isSRAM(store, 1) && isLocalMem(store, 1));
    TEST_ASSERT(!isRemoteMem(store, 1));
    TEST_ASSERT(isReg(store, 2) && isLocalMem(store, 2) &&
                isRemoteMem(store, 2));
    TEST_ASSERT(isDRAM(store, 3) && isRemoteMem(store, 3) &&
                !isLocalMem(store, 3));
    TEST_ASSERT(isFIFO(store, 4) && !isLIFO(store, 4) && !isSRAM(store, 4));
    TEST_ASSERT(!isSRAM(store, 99) && !isLocalMem(store, 99));

    TEST_ASSERT(parseMemoryKind("RegFile") == MemoryKind::RegFile);
    TEST_ASSERT(!parseMemoryKind("Bram"));
    TEST_ASSERT(toString(MemoryKind::LineBuffer) == "LineBuffer");
  }

  // Duplicates, instance and padding.
  {
    MetadataStore store;
    TEST_ASSERT(!getDuplicates(store, 1));
    TEST_ASSERT(consumeErrorCode(duplicates(store, 1).takeError()) ==
                MembankError::MISSING_DUPLICATES);
    TEST_ASSERT(consumeErrorCode(instance(store, 1).takeError()) ==
                MembankError::MISSING_INSTANCE);
    TEST_ASSERT(consumeErrorCode(padding(store, 1).takeError()) ==
                MembankError::MISSING_PADDING);

    Memory a({Banking::mod(4, 1, {1}, {0})}, 1, AccumType::none());
    Memory b({Banking::mod(2, 1, {1}, {0})}, 2, AccumType::none());
    setDuplicates(store, 1, {a, b});
    llvm::Expected<std::vector<Memory>> dups = duplicates(store, 1);
    TEST_ASSERT(dups && dups->size() == 2 && (*dups)[1] == b);
    TEST_ASSERT(getInstance(store, 1) == a);
    TEST_ASSERT(consumeErrorCode(instance(store, 1).takeError()) ==
                MembankError::INSTANCE_NOT_UNIQUE);

    setInstance(store, 1, b);
    llvm::Expected<Memory> inst = instance(store, 1);
    TEST_ASSERT(inst && *inst == b);

    setPadding(store, 1, {0, 3});
    llvm::Expected<Address> pad = padding(store, 1);
    TEST_ASSERT(pad && (*pad)[1] == 3);
  }

  // Dispatch table.
  {
    MetadataStore store;
    TEST_ASSERT(dispatches(store, 7).empty());
    TEST_ASSERT(!getDispatch(store, 7, {0}));
    llvm::Error missing = dispatch(store, 7, {0, 1}).takeError();
    UnrollId reported;
    llvm::handleAllErrors(std::move(missing), [&](const MetadataError &e) {
      reported.assign(e.getUnroll().begin(), e.getUnroll().end());
    });
    TEST_ASSERT(reported == UnrollId({0, 1}));

    addDispatch(store, 7, {0}, 1);
    addDispatch(store, 7, {0}, 0);
    addDispatch(store, 7, {1}, 2);
    llvm::Expected<std::set<unsigned>> d0 = dispatch(store, 7, {0});
    TEST_ASSERT(d0 && d0->size() == 2 && d0->count(0) && d0->count(1));
    TEST_ASSERT(getDispatch(store, 7, {1})->count(2));
    TEST_ASSERT(dispatches(store, 7).size() == 2);

    DispatchMap replaced;
    replaced[UnrollId({3})] = {4};
    setDispatches(store, 7, replaced);
    TEST_ASSERT(!getDispatch(store, 7, {0}));
    TEST_ASSERT(getDispatch(store, 7, {3})->count(4));
  }

  // Port table.
  {
    MetadataStore store;
    TEST_ASSERT(!getPorts(store, 7));
    TEST_ASSERT(consumeErrorCode(ports(store, 7, 0).takeError()) ==
                MembankError::MISSING_PORTS);

    Port p;
    p.bufferStage = 1;
    p.muxWidth = 2;
    p.muxOffset = 1;
    addPort(store, 7, 0, {0}, p);
    Port q;
    addPort(store, 7, 1, {0}, q);
    addPort(store, 7, 0, {1}, q);

    TEST_ASSERT(getPorts(store, 7)->size() == 2);
    llvm::Expected<PortMap> dup0 = ports(store, 7, 0);
    TEST_ASSERT(dup0 && dup0->size() == 2);
    llvm::Expected<Port> got = port(store, 7, 0, {0});
    TEST_ASSERT(got && *got == p);
    TEST_ASSERT(getPort(store, 7, 1, {0}) == q);
    TEST_ASSERT(!getPort(store, 7, 1, {1}));
    TEST_ASSERT(consumeErrorCode(port(store, 7, 2, {0}).takeError()) ==
                MembankError::MISSING_PORTS);
  }

  // Access sets and widths.
  {
    MetadataStore store;
    setReaders(store, 1, {10, 11});
    setWriters(store, 1, {12});
    setResetters(store, 1, {13});
    setAccessDecl(store, 10, 1, false, 4);
    setAccessDecl(store, 12, 1, true, 2);

    TEST_ASSERT(readers(store, 1).size() == 2);
    TEST_ASSERT(accesses(store, 1).size() == 3);
    TEST_ASSERT(resetters(store, 1).count(13));
    TEST_ASSERT(readWidths(store, 1) == std::set<unsigned>({1, 4}));
    TEST_ASSERT(writeWidths(store, 1) == std::set<unsigned>({2}));

    llvm::Expected<AccessDecl> decl = accessDecl(store, 12);
    TEST_ASSERT(decl && decl->isWrite && decl->memory == 1);
    TEST_ASSERT(consumeErrorCode(accessDecl(store, 11).takeError()) ==
                MembankError::MISSING_ACCESS_DECL);
  }

  // Accumulators and flags.
  {
    MetadataStore store;
    TEST_ASSERT(accumType(store, 1) == AccumType::unknown());
    setAccumType(store, 1, AccumType::reduce(ReduceFunction::Max));
    TEST_ASSERT(accumType(store, 1) == AccumType::reduce(ReduceFunction::Max));
    TEST_ASSERT(accumType(store, 1) != AccumType::reduce(ReduceFunction::Min));

    TEST_ASSERT(!reduceType(store, 1));
    setReduceType(store, 1, std::optional<ReduceFunction>());
    TEST_ASSERT(!reduceType(store, 1));
    setReduceType(store, 1, ReduceFunction::Add);
    TEST_ASSERT(reduceType(store, 1) == ReduceFunction::Add);

    FMAReduceInfo info;
    info.write = 2;
    info.read = 3;
    info.mul0 = 4;
    info.mul1 = 5;
    info.latency = 6.0;
    setFmaReduceInfo(store, 1, info);
    TEST_ASSERT(fmaReduceInfo(store, 1)->mul1 == 5);
    TEST_ASSERT(!fmaReduceInfo(store, 2));

    TEST_ASSERT(!isWriteBuffer(store, 1) && !isNonBuffer(store, 1) &&
                !isUnusedMemory(store, 1));
    setWriteBuffer(store, 1, true);
    setNonBuffer(store, 1, true);
    setUnusedMemory(store, 1, true);
    TEST_ASSERT(isWriteBuffer(store, 1) && isNonBuffer(store, 1) &&
                isUnusedMemory(store, 1));
    setNonBuffer(store, 1, false);
    TEST_ASSERT(!isNonBuffer(store, 1));
  }

  return 0;
}
