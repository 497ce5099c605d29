//===-- Banking.h - Memory banking strategies -------------------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// A Banking maps a multi-dimensional address to a bank index. The set of
// strategies is closed (see Banking::Kind); every consumer switches over the
// kind exhaustively, so adding a strategy is a compile-time visible change.
//
// Modular banking evaluates
//
//     bank = floor((sum_i alpha[i] * addr[dims[i]]) / B) mod N
//
// B == 1 is pure cyclic banking, B > 1 is block-cyclic.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_BANKING_BANKING_H
#define MEMBANK_BANKING_BANKING_H

#include "membank/Banking/Types.h"

#include "llvm/Support/Error.h"

namespace membank {

class Banking {
public:
  enum Kind {
    Mod, // Modular (cyclic / block-cyclic) banking
  };

  /// Modular banking with N banks, stride B, factors alpha over dims.
  static Banking mod(int64_t nBanks, int64_t stride,
                     llvm::ArrayRef<int64_t> alphas,
                     llvm::ArrayRef<int64_t> dims);

  /// Single-bank banking over all dimensions of a rank-`rank` memory.
  static Banking unit(unsigned rank);

  Kind getKind() const { return kind; }
  int64_t getNBanks() const { return nBanks; }
  int64_t getStride() const { return stride; }
  llvm::ArrayRef<int64_t> getAlphas() const { return alphas; }
  llvm::ArrayRef<int64_t> getDims() const { return dims; }

  bool isCyclic() const { return stride == 1; }

  /// Check N >= 1, B >= 1, |alpha| == |dims| and dims are in [0, rank).
  /// A rank of 0 skips the dimension range check.
  llvm::Error verify(unsigned rank = 0) const;

  /// Bank index of `addr` (a full address over all memory dimensions).
  /// Every governed dim must index into `addr`; verify(addr.size()) holds
  /// for any address bankAddress() accepts.
  int64_t bankSelect(llvm::ArrayRef<int64_t> addr) const;

  void print(llvm::raw_ostream &os) const;

  bool operator==(const Banking &other) const;
  bool operator!=(const Banking &other) const { return !(*this == other); }

private:
  Banking() = default;

  Kind kind = Mod;
  int64_t nBanks = 1;
  int64_t stride = 1;
  llvm::SmallVector<int64_t, 4> alphas;
  llvm::SmallVector<int64_t, 4> dims;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const Banking &banking) {
  banking.print(os);
  return os;
}

} // namespace membank

#endif // MEMBANK_BANKING_BANKING_H
