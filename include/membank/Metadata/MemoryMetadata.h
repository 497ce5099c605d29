//===-- MemoryMetadata.h - Typed banking metadata accessors -----*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Metadata entries attached to memory and access symbols, and the typed
// accessors over MetadataStore. Accessors come in up to three flavours:
//
//   getFoo(store, sym)  -> std::optional<T>   absent is a normal answer
//   foo(store, sym)     -> llvm::Expected<T>  absent is a MissingMetadata error
//   setFoo(store, sym, value)                 last write wins
//
// Pre-unrolling, a logical memory carries one Memory per physical duplicate
// (duplicates). Post-unrolling, each memory symbol carries exactly one
// (instance). Dispatches and ports are attached to access symbols and are
// keyed by the unroll id of each unrolled copy of the access.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_METADATA_MEMORYMETADATA_H
#define MEMBANK_METADATA_MEMORYMETADATA_H

#include "membank/Banking/Memory.h"
#include "membank/Banking/Port.h"
#include "membank/Metadata/MetadataStore.h"

#include "llvm/Support/Error.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace membank {

//===----------------------------------------------------------------------===//
// Declarations
//===----------------------------------------------------------------------===//

enum class MemoryKind {
  SRAM,
  RegFile,
  LUT,
  LineBuffer,
  FIFO,
  LIFO,
  Reg,
  ArgIn,
  ArgOut,
  HostIO,
  DRAM,
  StreamIn,
  StreamOut,
};

llvm::StringRef toString(MemoryKind kind);
std::optional<MemoryKind> parseMemoryKind(llvm::StringRef name);

/// Static shape of a memory allocation. A negative dimension marks a size
/// that is not a compile-time constant.
struct MemoryDecl
    : MetadataInfo<MemoryDecl, MetadataKind::MemoryDecl> {
  MemoryKind kind = MemoryKind::SRAM;
  Address dims;
  std::string name;
};

/// Memory targeted by an access node, and its direction and lane count.
struct AccessDecl
    : MetadataInfo<AccessDecl, MetadataKind::AccessDecl> {
  SymbolId memory = INVALID_SYMBOL;
  bool isWrite = false;
  unsigned width = 1;
};

//===----------------------------------------------------------------------===//
// Banking results
//===----------------------------------------------------------------------===//

struct Duplicates : MetadataInfo<Duplicates, MetadataKind::Duplicates> {
  std::vector<Memory> memories;
};

/// Per-dimension padding chosen by banking analysis.
struct Padding : MetadataInfo<Padding, MetadataKind::Padding> {
  Address dims;
};

/// Unroll id -> duplicate indices the unrolled copy is routed to.
using DispatchMap = std::map<UnrollId, std::set<unsigned>>;

struct Dispatch : MetadataInfo<Dispatch, MetadataKind::Dispatch> {
  DispatchMap map;
};

/// Unroll id -> port, for one duplicate.
using PortMap = std::map<UnrollId, Port>;

/// Duplicate index -> ports of each unrolled copy on that duplicate.
struct Ports : MetadataInfo<Ports, MetadataKind::Ports> {
  std::map<unsigned, PortMap> map;
};

//===----------------------------------------------------------------------===//
// Access sets and flags
//===----------------------------------------------------------------------===//

struct Readers
    : MetadataInfo<Readers, MetadataKind::Readers, Transfer::Remove> {
  std::set<SymbolId> syms;
};

struct Writers
    : MetadataInfo<Writers, MetadataKind::Writers, Transfer::Remove> {
  std::set<SymbolId> syms;
};

struct Resetters
    : MetadataInfo<Resetters, MetadataKind::Resetters, Transfer::Remove> {
  std::set<SymbolId> syms;
};

struct AccumulatorType
    : MetadataInfo<AccumulatorType, MetadataKind::AccumulatorType> {
  AccumType type;
};

struct ReduceType : MetadataInfo<ReduceType, MetadataKind::ReduceType> {
  ReduceFunction func = ReduceFunction::Other;
};

/// Operands of a fused multiply-add accumulation: the accumulator write and
/// read, the two multiplicands, and the latency of the fused unit.
struct FMAReduceInfo {
  SymbolId write = INVALID_SYMBOL;
  SymbolId read = INVALID_SYMBOL;
  SymbolId mul0 = INVALID_SYMBOL;
  SymbolId mul1 = INVALID_SYMBOL;
  double latency = 0.0;
};

struct FMAReduce : MetadataInfo<FMAReduce, MetadataKind::FMAReduce> {
  FMAReduceInfo info;
};

/// User flag allowing buffered writes across pipeline stages.
struct EnableWriteBuffer
    : MetadataInfo<EnableWriteBuffer, MetadataKind::EnableWriteBuffer> {
  bool flag = false;
};

/// User flag forbidding N-buffering of a memory.
struct EnableNonBuffer
    : MetadataInfo<EnableNonBuffer, MetadataKind::EnableNonBuffer> {
  bool flag = false;
};

struct UnusedMemory
    : MetadataInfo<UnusedMemory, MetadataKind::UnusedMemory> {
  bool flag = false;
};

//===----------------------------------------------------------------------===//
// Memory declaration accessors
//===----------------------------------------------------------------------===//

void setMemoryDecl(MetadataStore &store, SymbolId mem, MemoryKind kind,
                   llvm::ArrayRef<int64_t> dims, llvm::StringRef name = "");
const MemoryDecl *getMemoryDecl(const MetadataStore &store, SymbolId mem);

/// Statically known rank of the memory.
llvm::Expected<unsigned> rank(const MetadataStore &store, SymbolId mem);

/// Constant dimension sizes of the memory.
llvm::Expected<Address> constDims(const MetadataStore &store, SymbolId mem);

bool isSRAM(const MetadataStore &store, SymbolId mem);
bool isRegFile(const MetadataStore &store, SymbolId mem);
bool isLUT(const MetadataStore &store, SymbolId mem);
bool isFIFO(const MetadataStore &store, SymbolId mem);
bool isLIFO(const MetadataStore &store, SymbolId mem);
bool isReg(const MetadataStore &store, SymbolId mem);
bool isDRAM(const MetadataStore &store, SymbolId mem);
bool isLocalMem(const MetadataStore &store, SymbolId mem);
bool isRemoteMem(const MetadataStore &store, SymbolId mem);

void setAccessDecl(MetadataStore &store, SymbolId access, SymbolId mem,
                   bool isWrite, unsigned width = 1);
llvm::Expected<AccessDecl> accessDecl(const MetadataStore &store,
                                      SymbolId access);

//===----------------------------------------------------------------------===//
// Duplicates / instance / padding
//===----------------------------------------------------------------------===//

std::optional<std::vector<Memory>> getDuplicates(const MetadataStore &store,
                                                 SymbolId mem);
llvm::Expected<std::vector<Memory>> duplicates(const MetadataStore &store,
                                               SymbolId mem);
void setDuplicates(MetadataStore &store, SymbolId mem,
                   std::vector<Memory> memories);

/// First duplicate, if any. Meaningful post-unrolling only.
std::optional<Memory> getInstance(const MetadataStore &store, SymbolId mem);
/// The single post-unrolling instance. Fails if duplicates are missing or if
/// more than one duplicate remains.
llvm::Expected<Memory> instance(const MetadataStore &store, SymbolId mem);
void setInstance(MetadataStore &store, SymbolId mem, Memory inst);

std::optional<Address> getPadding(const MetadataStore &store, SymbolId mem);
llvm::Expected<Address> padding(const MetadataStore &store, SymbolId mem);
void setPadding(MetadataStore &store, SymbolId mem,
                llvm::ArrayRef<int64_t> pad);

//===----------------------------------------------------------------------===//
// Dispatch and ports (on access symbols)
//===----------------------------------------------------------------------===//

std::optional<DispatchMap> getDispatches(const MetadataStore &store,
                                         SymbolId access);
/// The whole dispatch map; empty when none was recorded.
DispatchMap dispatches(const MetadataStore &store, SymbolId access);
void setDispatches(MetadataStore &store, SymbolId access, DispatchMap map);

std::optional<std::set<unsigned>> getDispatch(const MetadataStore &store,
                                              SymbolId access,
                                              llvm::ArrayRef<int64_t> uid);
llvm::Expected<std::set<unsigned>> dispatch(const MetadataStore &store,
                                            SymbolId access,
                                            llvm::ArrayRef<int64_t> uid);
void addDispatch(MetadataStore &store, SymbolId access,
                 llvm::ArrayRef<int64_t> uid, unsigned dup);

std::optional<std::map<unsigned, PortMap>>
getPorts(const MetadataStore &store, SymbolId access);
std::optional<PortMap> getPorts(const MetadataStore &store, SymbolId access,
                                unsigned dup);
llvm::Expected<PortMap> ports(const MetadataStore &store, SymbolId access,
                              unsigned dup);
void addPort(MetadataStore &store, SymbolId access, unsigned dup,
             llvm::ArrayRef<int64_t> uid, const Port &port);
std::optional<Port> getPort(const MetadataStore &store, SymbolId access,
                            unsigned dup, llvm::ArrayRef<int64_t> uid);
llvm::Expected<Port> port(const MetadataStore &store, SymbolId access,
                          unsigned dup, llvm::ArrayRef<int64_t> uid);

//===----------------------------------------------------------------------===//
// Readers / writers / resetters
//===----------------------------------------------------------------------===//

std::set<SymbolId> readers(const MetadataStore &store, SymbolId mem);
void setReaders(MetadataStore &store, SymbolId mem, std::set<SymbolId> syms);
std::set<SymbolId> writers(const MetadataStore &store, SymbolId mem);
void setWriters(MetadataStore &store, SymbolId mem, std::set<SymbolId> syms);
/// Readers and writers.
std::set<SymbolId> accesses(const MetadataStore &store, SymbolId mem);
std::set<SymbolId> resetters(const MetadataStore &store, SymbolId mem);
void setResetters(MetadataStore &store, SymbolId mem, std::set<SymbolId> syms);

/// Distinct lane counts of the memory's readers / writers. Accesses without
/// a declaration count as scalar.
std::set<unsigned> readWidths(const MetadataStore &store, SymbolId mem);
std::set<unsigned> writeWidths(const MetadataStore &store, SymbolId mem);

//===----------------------------------------------------------------------===//
// Accumulators and flags
//===----------------------------------------------------------------------===//

/// Accumulator classification; Unknown when never classified.
AccumType accumType(const MetadataStore &store, SymbolId sym);
void setAccumType(MetadataStore &store, SymbolId sym, AccumType type);

std::optional<ReduceFunction> reduceType(const MetadataStore &store,
                                         SymbolId sym);
void setReduceType(MetadataStore &store, SymbolId sym, ReduceFunction func);
void setReduceType(MetadataStore &store, SymbolId sym,
                   std::optional<ReduceFunction> func);

std::optional<FMAReduceInfo> fmaReduceInfo(const MetadataStore &store,
                                           SymbolId sym);
void setFmaReduceInfo(MetadataStore &store, SymbolId sym,
                      const FMAReduceInfo &info);

bool isWriteBuffer(const MetadataStore &store, SymbolId mem);
void setWriteBuffer(MetadataStore &store, SymbolId mem, bool flag);
bool isNonBuffer(const MetadataStore &store, SymbolId mem);
void setNonBuffer(MetadataStore &store, SymbolId mem, bool flag);
bool isUnusedMemory(const MetadataStore &store, SymbolId mem);
void setUnusedMemory(MetadataStore &store, SymbolId mem, bool flag);

} // namespace membank

#endif // MEMBANK_METADATA_MEMORYMETADATA_H
