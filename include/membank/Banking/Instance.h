//===-- Instance.h - Candidate physical memory duplicate --------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Instance is the working aggregate of memory analysis: the accesses served by
// one physical duplicate, the banking chosen for them, the N-buffer depth and
// the port each unrolled access connects to. Instances are transient; the
// winner's toMemory() and ports are committed into the metadata store.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_BANKING_INSTANCE_H
#define MEMBANK_BANKING_INSTANCE_H

#include "membank/Banking/AccessMatrix.h"
#include "membank/Banking/Memory.h"
#include "membank/Banking/Port.h"

#include <map>
#include <optional>
#include <set>
#include <vector>

namespace membank {

/// Unrolled accesses issued in the same logical time step.
using AccessGroup = llvm::SmallVector<AccessMatrix, 4>;

struct Instance {
  std::vector<AccessGroup> reads;
  std::vector<AccessGroup> writes;
  /// Control scopes the grouped accesses execute in.
  std::set<ScopeId> ctrls;
  /// Pipeline whose stages rotate the N-buffer, if any access needs it.
  std::optional<ScopeId> metapipe;
  llvm::SmallVector<Banking, 2> banking;
  int64_t depth = 1;
  /// Opaque heuristic from the banking search; lower is better.
  int64_t cost = 0;
  std::map<AccessId, Port> ports;
  AccumType accType;

  /// Unbanked, unaccessed instance of the given rank.
  static Instance unit(unsigned rank);

  Memory toMemory() const { return Memory(banking, depth, accType); }

  /// All access records, writes first.
  std::vector<const AccessMatrix *> accessMatrices() const;

  /// Access node ids of all access records.
  std::set<SymbolId> accesses() const;

  /// Every access record has a port and 0 <= muxOffset < muxWidth.
  llvm::Error verifyPorts() const;

  void print(llvm::raw_ostream &os) const;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const Instance &inst) {
  inst.print(os);
  return os;
}

} // namespace membank

#endif // MEMBANK_BANKING_INSTANCE_H
