//===-- Types.h - Membank central type definitions --------------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Central type definitions shared across banking, metadata and analysis
// components.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_BANKING_TYPES_H
#define MEMBANK_BANKING_TYPES_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>

namespace membank {

/// Identity of an IR value (memory or access node) inside one compilation
/// unit. Assigned by the host compiler; the metadata store is keyed by it.
using SymbolId = uint32_t;

/// Identity of a control scope (controller) in the host program.
using ScopeId = uint32_t;

/// Invalid sentinel value (all-ones: 0xFFFFFFFF).
constexpr SymbolId INVALID_SYMBOL = static_cast<SymbolId>(-1);

/// Unrolled instance identity of an access: the unroll index of every
/// surrounding iterator, outermost first.
using UnrollId = llvm::SmallVector<int64_t, 4>;

/// Concrete multi-dimensional address (or dimension sizes), outermost first.
using Address = llvm::SmallVector<int64_t, 4>;

/// Print a sequence as "{a,b,c}".
inline void printSeq(llvm::raw_ostream &os, llvm::ArrayRef<int64_t> seq) {
  os << "{";
  for (size_t i = 0; i < seq.size(); ++i) {
    if (i)
      os << ",";
    os << seq[i];
  }
  os << "}";
}

} // namespace membank

#endif // MEMBANK_BANKING_TYPES_H
