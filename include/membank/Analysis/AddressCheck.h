//===-- AddressCheck.h - Exhaustive bank address verification ---*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// AddressVerifier walks every address of a statically sized memory and checks
// that the memory's banking maps distinct addresses to distinct
// (bank selects, bank offset) pairs and that every bank select lies in
// [0, N) of its strategy.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_ANALYSIS_ADDRESSCHECK_H
#define MEMBANK_ANALYSIS_ADDRESSCHECK_H

#include "membank/Banking/Memory.h"

#include "llvm/Support/Error.h"

#include <vector>

namespace membank {

/// Two addresses sharing one physical location.
struct AddressConflict {
  Address first;
  Address second;
  llvm::SmallVector<int64_t, 4> banks;
  int64_t offset = 0;
};

/// A bank select outside [0, N) of its strategy.
struct BankRangeViolation {
  Address addr;
  unsigned group = 0;
  int64_t bank = 0;
};

struct AddressCheckResult {
  uint64_t addressesChecked = 0;
  /// Number of addresses that landed on an already used location.
  uint64_t conflictCount = 0;
  /// The first conflicts found, up to Options::maxReportedConflicts.
  std::vector<AddressConflict> conflicts;
  std::vector<BankRangeViolation> outOfRange;
  int64_t maxOffset = -1;
  /// Every (bank selects, offset) pair up to maxOffset is used exactly once.
  bool dense = false;

  bool ok() const { return conflictCount == 0 && outOfRange.empty(); }
};

class AddressVerifier {
public:
  struct Options {
    /// Refuse to enumerate address spaces larger than this.
    uint64_t maxAddresses = uint64_t(1) << 22;
    size_t maxReportedConflicts = 16;
  };

  AddressVerifier() = default;
  explicit AddressVerifier(const Options &opts) : opts(opts) {}

  /// Enumerate the address space of a memory with sizes `dims`.
  llvm::Expected<AddressCheckResult> check(const Memory &mem,
                                           llvm::ArrayRef<int64_t> dims) const;

  /// Like check(), but fold any conflict or range violation into an error.
  llvm::Error checkConflictFree(const Memory &mem,
                                llvm::ArrayRef<int64_t> dims) const;

private:
  Options opts;
};

inline llvm::Expected<AddressCheckResult>
verifyAddressMapping(const Memory &mem, llvm::ArrayRef<int64_t> dims,
                     const AddressVerifier::Options &opts =
                         AddressVerifier::Options()) {
  return AddressVerifier(opts).check(mem, dims);
}

} // namespace membank

#endif // MEMBANK_ANALYSIS_ADDRESSCHECK_H
