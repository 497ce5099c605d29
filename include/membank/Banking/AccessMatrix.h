//===-- AccessMatrix.h - Unrolled access address records --------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// An AccessMatrix is the address function of one unrolled copy of an access
// node: addr = matrix * iters + offset, one matrix row per memory dimension.
// It is produced by the host compiler's access-pattern analysis and consumed
// here as-is.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_BANKING_ACCESSMATRIX_H
#define MEMBANK_BANKING_ACCESSMATRIX_H

#include "membank/Banking/Types.h"

#include "llvm/Support/Error.h"

#include <tuple>

namespace membank {

/// Identity of one unrolled copy of an access node.
struct AccessId {
  SymbolId access = INVALID_SYMBOL;
  UnrollId unroll;

  bool operator==(const AccessId &other) const {
    return access == other.access && unroll == other.unroll;
  }
  bool operator!=(const AccessId &other) const { return !(*this == other); }
  bool operator<(const AccessId &other) const {
    return std::tie(access, unroll) < std::tie(other.access, other.unroll);
  }
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const AccessId &id) {
  os << "x" << id.access << " ";
  printSeq(os, id.unroll);
  return os;
}

struct AccessMatrix {
  SymbolId access = INVALID_SYMBOL;
  UnrollId unroll;
  /// One row per memory dimension, one column per enclosing iterator.
  llvm::SmallVector<llvm::SmallVector<int64_t, 4>, 4> matrix;
  /// Constant address component, one entry per memory dimension.
  Address offset;
  /// Innermost control scope the access executes in.
  ScopeId scope = 0;
  /// Number of vector lanes the access reads or writes per cycle.
  unsigned width = 1;

  AccessId id() const { return AccessId{access, unroll}; }

  /// True when the address function is known.
  bool hasAddress() const { return !offset.empty(); }

  /// Two copies address the same location on every iteration.
  bool sameAddressAs(const AccessMatrix &other) const {
    return hasAddress() && access == other.access &&
           matrix == other.matrix && offset == other.offset;
  }

  /// Concrete address for the given iterator values.
  llvm::Expected<Address> evaluate(llvm::ArrayRef<int64_t> iters) const;

  /// Check width >= 1 and that matrix and offset agree with `rank`.
  llvm::Error verify(unsigned rank) const;
};

} // namespace membank

#endif // MEMBANK_BANKING_ACCESSMATRIX_H
