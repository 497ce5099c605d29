//===-- Banking.cpp - Memory banking strategies -----------------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Banking/Banking.h"
#include "membank/Banking/BankingError.h"

#include "llvm/Support/ErrorHandling.h"

#include <cassert>

namespace membank {

namespace {

/// Floor modulo: result is in [0, n) for n > 0.
int64_t floorMod(int64_t value, int64_t n) {
  int64_t r = value % n;
  return r < 0 ? r + n : r;
}

int64_t floorDiv(int64_t value, int64_t d) {
  int64_t q = value / d;
  if ((value % d != 0) && ((value < 0) != (d < 0)))
    --q;
  return q;
}

} // namespace

Banking Banking::mod(int64_t nBanks, int64_t stride,
                     llvm::ArrayRef<int64_t> alphas,
                     llvm::ArrayRef<int64_t> dims) {
  Banking b;
  b.kind = Mod;
  b.nBanks = nBanks;
  b.stride = stride;
  b.alphas.assign(alphas.begin(), alphas.end());
  b.dims.assign(dims.begin(), dims.end());
  return b;
}

Banking Banking::unit(unsigned rank) {
  llvm::SmallVector<int64_t, 4> alphas(rank, 1);
  llvm::SmallVector<int64_t, 4> dims;
  for (unsigned i = 0; i < rank; ++i)
    dims.push_back(i);
  return mod(1, 1, alphas, dims);
}

llvm::Error Banking::verify(unsigned rank) const {
  switch (kind) {
  case Mod:
    if (nBanks < 1)
      return malformedMetadata(MembankError::BANKING_INVALID, INVALID_SYMBOL,
                               "bank count must be >= 1, got " +
                                   llvm::Twine(nBanks));
    if (stride < 1)
      return malformedMetadata(MembankError::BANKING_INVALID, INVALID_SYMBOL,
                               "stride must be >= 1, got " +
                                   llvm::Twine(stride));
    if (alphas.size() != dims.size())
      return malformedMetadata(MembankError::BANKING_INVALID, INVALID_SYMBOL,
                               "alpha has " + llvm::Twine(alphas.size()) +
                                   " entries but banking governs " +
                                   llvm::Twine(dims.size()) + " dims");
    if (rank != 0) {
      for (int64_t d : dims) {
        if (d < 0 || d >= static_cast<int64_t>(rank))
          return malformedMetadata(MembankError::BANKING_INVALID,
                                   INVALID_SYMBOL,
                                   "banking dim " + llvm::Twine(d) +
                                       " out of range for rank " +
                                       llvm::Twine(rank));
      }
    }
    return llvm::Error::success();
  }
  llvm_unreachable("unknown banking kind");
}

int64_t Banking::bankSelect(llvm::ArrayRef<int64_t> addr) const {
  switch (kind) {
  case Mod: {
    int64_t sum = 0;
    for (size_t i = 0; i < alphas.size(); ++i) {
      assert(dims[i] >= 0 && static_cast<size_t>(dims[i]) < addr.size() &&
             "address shorter than banking dims");
      sum += alphas[i] * addr[dims[i]];
    }
    return floorMod(floorDiv(sum, stride), nBanks);
  }
  }
  llvm_unreachable("unknown banking kind");
}

void Banking::print(llvm::raw_ostream &os) const {
  switch (kind) {
  case Mod:
    os << "Dims ";
    printSeq(os, dims);
    os << ": " << (stride == 1 ? "Cyclic" : "Block Cyclic") << ": N=" << nBanks
       << ", B=" << stride << ", alpha=<";
    for (size_t i = 0; i < alphas.size(); ++i) {
      if (i)
        os << ",";
      os << alphas[i];
    }
    os << ">";
    return;
  }
  llvm_unreachable("unknown banking kind");
}

bool Banking::operator==(const Banking &other) const {
  return kind == other.kind && nBanks == other.nBanks &&
         stride == other.stride && alphas == other.alphas &&
         dims == other.dims;
}

} // namespace membank
