//===-- MemoryMetadata.cpp - Typed banking metadata accessors ---*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Metadata/MemoryMetadata.h"
#include "membank/Banking/BankingError.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

namespace membank {

namespace {

std::optional<MemoryKind> kindOf(const MetadataStore &store, SymbolId mem) {
  if (const MemoryDecl *decl = store.get<MemoryDecl>(mem))
    return decl->kind;
  return std::nullopt;
}

bool kindIn(const MetadataStore &store, SymbolId mem,
            std::initializer_list<MemoryKind> kinds) {
  std::optional<MemoryKind> kind = kindOf(store, mem);
  if (!kind)
    return false;
  for (MemoryKind k : kinds)
    if (*kind == k)
      return true;
  return false;
}

std::set<unsigned> widthsOf(const MetadataStore &store,
                            const std::set<SymbolId> &syms) {
  std::set<unsigned> widths;
  for (SymbolId sym : syms) {
    const AccessDecl *decl = store.get<AccessDecl>(sym);
    widths.insert(decl ? decl->width : 1);
  }
  return widths;
}

} // namespace

//===----------------------------------------------------------------------===//
// Memory declarations
//===----------------------------------------------------------------------===//

llvm::StringRef toString(MemoryKind kind) {
  switch (kind) {
  case MemoryKind::SRAM:
    return "SRAM";
  case MemoryKind::RegFile:
    return "RegFile";
  case MemoryKind::LUT:
    return "LUT";
  case MemoryKind::LineBuffer:
    return "LineBuffer";
  case MemoryKind::FIFO:
    return "FIFO";
  case MemoryKind::LIFO:
    return "LIFO";
  case MemoryKind::Reg:
    return "Reg";
  case MemoryKind::ArgIn:
    return "ArgIn";
  case MemoryKind::ArgOut:
    return "ArgOut";
  case MemoryKind::HostIO:
    return "HostIO";
  case MemoryKind::DRAM:
    return "DRAM";
  case MemoryKind::StreamIn:
    return "StreamIn";
  case MemoryKind::StreamOut:
    return "StreamOut";
  }
  llvm_unreachable("unknown memory kind");
}

std::optional<MemoryKind> parseMemoryKind(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<MemoryKind>>(name)
      .Case("SRAM", MemoryKind::SRAM)
      .Case("RegFile", MemoryKind::RegFile)
      .Case("LUT", MemoryKind::LUT)
      .Case("LineBuffer", MemoryKind::LineBuffer)
      .Case("FIFO", MemoryKind::FIFO)
      .Case("LIFO", MemoryKind::LIFO)
      .Case("Reg", MemoryKind::Reg)
      .Case("ArgIn", MemoryKind::ArgIn)
      .Case("ArgOut", MemoryKind::ArgOut)
      .Case("HostIO", MemoryKind::HostIO)
      .Case("DRAM", MemoryKind::DRAM)
      .Case("StreamIn", MemoryKind::StreamIn)
      .Case("StreamOut", MemoryKind::StreamOut)
      .Default(std::nullopt);
}

void setMemoryDecl(MetadataStore &store, SymbolId mem, MemoryKind kind,
                   llvm::ArrayRef<int64_t> dims, llvm::StringRef name) {
  MemoryDecl decl;
  decl.kind = kind;
  decl.dims.assign(dims.begin(), dims.end());
  decl.name = name.str();
  store.put(mem, std::move(decl));
}

const MemoryDecl *getMemoryDecl(const MetadataStore &store, SymbolId mem) {
  return store.get<MemoryDecl>(mem);
}

llvm::Expected<unsigned> rank(const MetadataStore &store, SymbolId mem) {
  const MemoryDecl *decl = store.get<MemoryDecl>(mem);
  if (!decl)
    return missingMetadata(MembankError::MISSING_RANK, mem,
                           "could not statically determine the rank");
  return static_cast<unsigned>(decl->dims.size());
}

llvm::Expected<Address> constDims(const MetadataStore &store, SymbolId mem) {
  const MemoryDecl *decl = store.get<MemoryDecl>(mem);
  if (!decl)
    return missingMetadata(MembankError::MISSING_DIMS, mem,
                           "could not statically determine the dimensions");
  for (size_t i = 0; i < decl->dims.size(); ++i) {
    if (decl->dims[i] < 0)
      return missingMetadata(MembankError::MISSING_DIMS, mem,
                             "dimension " + llvm::Twine(i) +
                                 " is not a compile-time constant");
  }
  return decl->dims;
}

bool isSRAM(const MetadataStore &store, SymbolId mem) {
  return kindIn(store, mem, {MemoryKind::SRAM});
}

bool isRegFile(const MetadataStore &store, SymbolId mem) {
  return kindIn(store, mem, {MemoryKind::RegFile});
}

bool isLUT(const MetadataStore &store, SymbolId mem) {
  return kindIn(store, mem, {MemoryKind::LUT});
}

bool isFIFO(const MetadataStore &store, SymbolId mem) {
  return kindIn(store, mem, {MemoryKind::FIFO});
}

bool isLIFO(const MetadataStore &store, SymbolId mem) {
  return kindIn(store, mem, {MemoryKind::LIFO});
}

bool isReg(const MetadataStore &store, SymbolId mem) {
  return kindIn(store, mem,
                {MemoryKind::Reg, MemoryKind::ArgIn, MemoryKind::ArgOut,
                 MemoryKind::HostIO});
}

bool isDRAM(const MetadataStore &store, SymbolId mem) {
  return kindIn(store, mem, {MemoryKind::DRAM});
}

bool isLocalMem(const MetadataStore &store, SymbolId mem) {
  return isReg(store, mem) ||
         kindIn(store, mem,
                {MemoryKind::SRAM, MemoryKind::RegFile, MemoryKind::LUT,
                 MemoryKind::LineBuffer, MemoryKind::FIFO, MemoryKind::LIFO});
}

bool isRemoteMem(const MetadataStore &store, SymbolId mem) {
  // Host-visible registers are both local and remote.
  return kindIn(store, mem,
                {MemoryKind::DRAM, MemoryKind::StreamIn, MemoryKind::StreamOut,
                 MemoryKind::ArgIn, MemoryKind::ArgOut, MemoryKind::HostIO});
}

void setAccessDecl(MetadataStore &store, SymbolId access, SymbolId mem,
                   bool isWrite, unsigned width) {
  AccessDecl decl;
  decl.memory = mem;
  decl.isWrite = isWrite;
  decl.width = width;
  store.put(access, std::move(decl));
}

llvm::Expected<AccessDecl> accessDecl(const MetadataStore &store,
                                      SymbolId access) {
  const AccessDecl *decl = store.get<AccessDecl>(access);
  if (!decl)
    return missingMetadata(MembankError::MISSING_ACCESS_DECL, access,
                           "access is not declared as a reader or writer");
  return *decl;
}

//===----------------------------------------------------------------------===//
// Duplicates / instance / padding
//===----------------------------------------------------------------------===//

std::optional<std::vector<Memory>> getDuplicates(const MetadataStore &store,
                                                 SymbolId mem) {
  if (const Duplicates *dups = store.get<Duplicates>(mem))
    return dups->memories;
  return std::nullopt;
}

llvm::Expected<std::vector<Memory>> duplicates(const MetadataStore &store,
                                               SymbolId mem) {
  if (const Duplicates *dups = store.get<Duplicates>(mem))
    return dups->memories;
  return missingMetadata(MembankError::MISSING_DUPLICATES, mem,
                         "no duplicates defined");
}

void setDuplicates(MetadataStore &store, SymbolId mem,
                   std::vector<Memory> memories) {
  Duplicates dups;
  dups.memories = std::move(memories);
  store.put(mem, std::move(dups));
}

std::optional<Memory> getInstance(const MetadataStore &store, SymbolId mem) {
  const Duplicates *dups = store.get<Duplicates>(mem);
  if (!dups || dups->memories.empty())
    return std::nullopt;
  return dups->memories.front();
}

llvm::Expected<Memory> instance(const MetadataStore &store, SymbolId mem) {
  const Duplicates *dups = store.get<Duplicates>(mem);
  if (!dups || dups->memories.empty())
    return missingMetadata(MembankError::MISSING_INSTANCE, mem,
                           "no instance defined");
  if (dups->memories.size() != 1)
    return invariantViolation(MembankError::INSTANCE_NOT_UNIQUE, mem,
                              "expected exactly one instance after "
                              "unrolling, found " +
                                  llvm::Twine(dups->memories.size()));
  return dups->memories.front();
}

void setInstance(MetadataStore &store, SymbolId mem, Memory inst) {
  setDuplicates(store, mem, {std::move(inst)});
}

std::optional<Address> getPadding(const MetadataStore &store, SymbolId mem) {
  if (const Padding *pad = store.get<Padding>(mem))
    return pad->dims;
  return std::nullopt;
}

llvm::Expected<Address> padding(const MetadataStore &store, SymbolId mem) {
  if (const Padding *pad = store.get<Padding>(mem))
    return pad->dims;
  return missingMetadata(MembankError::MISSING_PADDING, mem,
                         "no padding defined");
}

void setPadding(MetadataStore &store, SymbolId mem,
                llvm::ArrayRef<int64_t> pad) {
  Padding entry;
  entry.dims.assign(pad.begin(), pad.end());
  store.put(mem, std::move(entry));
}

//===----------------------------------------------------------------------===//
// Dispatch and ports
//===----------------------------------------------------------------------===//

std::optional<DispatchMap> getDispatches(const MetadataStore &store,
                                         SymbolId access) {
  if (const Dispatch *d = store.get<Dispatch>(access))
    return d->map;
  return std::nullopt;
}

DispatchMap dispatches(const MetadataStore &store, SymbolId access) {
  if (const Dispatch *d = store.get<Dispatch>(access))
    return d->map;
  return DispatchMap();
}

void setDispatches(MetadataStore &store, SymbolId access, DispatchMap map) {
  Dispatch entry;
  entry.map = std::move(map);
  store.put(access, std::move(entry));
}

std::optional<std::set<unsigned>> getDispatch(const MetadataStore &store,
                                              SymbolId access,
                                              llvm::ArrayRef<int64_t> uid) {
  const Dispatch *d = store.get<Dispatch>(access);
  if (!d)
    return std::nullopt;
  auto it = d->map.find(UnrollId(uid.begin(), uid.end()));
  if (it == d->map.end())
    return std::nullopt;
  return it->second;
}

llvm::Expected<std::set<unsigned>> dispatch(const MetadataStore &store,
                                            SymbolId access,
                                            llvm::ArrayRef<int64_t> uid) {
  if (std::optional<std::set<unsigned>> d = getDispatch(store, access, uid))
    return *d;
  return missingMetadata(MembankError::MISSING_DISPATCH, access,
                         "no dispatch defined",
                         UnrollId(uid.begin(), uid.end()));
}

void addDispatch(MetadataStore &store, SymbolId access,
                 llvm::ArrayRef<int64_t> uid, unsigned dup) {
  DispatchMap map = dispatches(store, access);
  map[UnrollId(uid.begin(), uid.end())].insert(dup);
  setDispatches(store, access, std::move(map));
}

std::optional<std::map<unsigned, PortMap>>
getPorts(const MetadataStore &store, SymbolId access) {
  if (const Ports *p = store.get<Ports>(access))
    return p->map;
  return std::nullopt;
}

std::optional<PortMap> getPorts(const MetadataStore &store, SymbolId access,
                                unsigned dup) {
  const Ports *p = store.get<Ports>(access);
  if (!p)
    return std::nullopt;
  auto it = p->map.find(dup);
  if (it == p->map.end())
    return std::nullopt;
  return it->second;
}

llvm::Expected<PortMap> ports(const MetadataStore &store, SymbolId access,
                              unsigned dup) {
  if (std::optional<PortMap> p = getPorts(store, access, dup))
    return *p;
  return missingMetadata(MembankError::MISSING_PORTS, access,
                         "no ports defined on dispatch #" + llvm::Twine(dup));
}

void addPort(MetadataStore &store, SymbolId access, unsigned dup,
             llvm::ArrayRef<int64_t> uid, const Port &port) {
  Ports entry;
  if (const Ports *existing = store.get<Ports>(access))
    entry.map = existing->map;
  entry.map[dup][UnrollId(uid.begin(), uid.end())] = port;
  store.put(access, std::move(entry));
}

std::optional<Port> getPort(const MetadataStore &store, SymbolId access,
                            unsigned dup, llvm::ArrayRef<int64_t> uid) {
  const Ports *p = store.get<Ports>(access);
  if (!p)
    return std::nullopt;
  auto dupIt = p->map.find(dup);
  if (dupIt == p->map.end())
    return std::nullopt;
  auto it = dupIt->second.find(UnrollId(uid.begin(), uid.end()));
  if (it == dupIt->second.end())
    return std::nullopt;
  return it->second;
}

llvm::Expected<Port> port(const MetadataStore &store, SymbolId access,
                          unsigned dup, llvm::ArrayRef<int64_t> uid) {
  if (std::optional<Port> p = getPort(store, access, dup, uid))
    return *p;
  return missingMetadata(MembankError::MISSING_PORTS, access,
                         "no port defined on dispatch #" + llvm::Twine(dup),
                         UnrollId(uid.begin(), uid.end()));
}

//===----------------------------------------------------------------------===//
// Readers / writers / resetters
//===----------------------------------------------------------------------===//

std::set<SymbolId> readers(const MetadataStore &store, SymbolId mem) {
  const Readers *r = store.get<Readers>(mem);
  return r ? r->syms : std::set<SymbolId>();
}

void setReaders(MetadataStore &store, SymbolId mem, std::set<SymbolId> syms) {
  Readers entry;
  entry.syms = std::move(syms);
  store.put(mem, std::move(entry));
}

std::set<SymbolId> writers(const MetadataStore &store, SymbolId mem) {
  const Writers *w = store.get<Writers>(mem);
  return w ? w->syms : std::set<SymbolId>();
}

void setWriters(MetadataStore &store, SymbolId mem, std::set<SymbolId> syms) {
  Writers entry;
  entry.syms = std::move(syms);
  store.put(mem, std::move(entry));
}

std::set<SymbolId> accesses(const MetadataStore &store, SymbolId mem) {
  std::set<SymbolId> result = readers(store, mem);
  std::set<SymbolId> wr = writers(store, mem);
  result.insert(wr.begin(), wr.end());
  return result;
}

std::set<SymbolId> resetters(const MetadataStore &store, SymbolId mem) {
  const Resetters *r = store.get<Resetters>(mem);
  return r ? r->syms : std::set<SymbolId>();
}

void setResetters(MetadataStore &store, SymbolId mem,
                  std::set<SymbolId> syms) {
  Resetters entry;
  entry.syms = std::move(syms);
  store.put(mem, std::move(entry));
}

std::set<unsigned> readWidths(const MetadataStore &store, SymbolId mem) {
  return widthsOf(store, readers(store, mem));
}

std::set<unsigned> writeWidths(const MetadataStore &store, SymbolId mem) {
  return widthsOf(store, writers(store, mem));
}

//===----------------------------------------------------------------------===//
// Accumulators and flags
//===----------------------------------------------------------------------===//

AccumType accumType(const MetadataStore &store, SymbolId sym) {
  if (const AccumulatorType *acc = store.get<AccumulatorType>(sym))
    return acc->type;
  return AccumType::unknown();
}

void setAccumType(MetadataStore &store, SymbolId sym, AccumType type) {
  AccumulatorType entry;
  entry.type = type;
  store.put(sym, std::move(entry));
}

std::optional<ReduceFunction> reduceType(const MetadataStore &store,
                                         SymbolId sym) {
  if (const ReduceType *r = store.get<ReduceType>(sym))
    return r->func;
  return std::nullopt;
}

void setReduceType(MetadataStore &store, SymbolId sym, ReduceFunction func) {
  ReduceType entry;
  entry.func = func;
  store.put(sym, std::move(entry));
}

void setReduceType(MetadataStore &store, SymbolId sym,
                   std::optional<ReduceFunction> func) {
  if (func)
    setReduceType(store, sym, *func);
}

std::optional<FMAReduceInfo> fmaReduceInfo(const MetadataStore &store,
                                           SymbolId sym) {
  if (const FMAReduce *f = store.get<FMAReduce>(sym))
    return f->info;
  return std::nullopt;
}

void setFmaReduceInfo(MetadataStore &store, SymbolId sym,
                      const FMAReduceInfo &info) {
  FMAReduce entry;
  entry.info = info;
  store.put(sym, std::move(entry));
}

bool isWriteBuffer(const MetadataStore &store, SymbolId mem) {
  const EnableWriteBuffer *f = store.get<EnableWriteBuffer>(mem);
  return f && f->flag;
}

void setWriteBuffer(MetadataStore &store, SymbolId mem, bool flag) {
  EnableWriteBuffer entry;
  entry.flag = flag;
  store.put(mem, std::move(entry));
}

bool isNonBuffer(const MetadataStore &store, SymbolId mem) {
  const EnableNonBuffer *f = store.get<EnableNonBuffer>(mem);
  return f && f->flag;
}

void setNonBuffer(MetadataStore &store, SymbolId mem, bool flag) {
  EnableNonBuffer entry;
  entry.flag = flag;
  store.put(mem, std::move(entry));
}

bool isUnusedMemory(const MetadataStore &store, SymbolId mem) {
  const UnusedMemory *f = store.get<UnusedMemory>(mem);
  return f && f->flag;
}

void setUnusedMemory(MetadataStore &store, SymbolId mem, bool flag) {
  UnusedMemory entry;
  entry.flag = flag;
  store.put(mem, std::move(entry));
}

} // namespace membank
