//===-- AddressCheck.cpp - Exhaustive bank address verification -*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Analysis/AddressCheck.h"
#include "membank/Banking/BankingError.h"

#include "llvm/Support/Debug.h"

#include <algorithm>
#include <map>

#define DEBUG_TYPE "membank-verify"

namespace membank {

namespace {

using Location = std::pair<llvm::SmallVector<int64_t, 4>, int64_t>;

/// Advance `addr` to the next row-major address. Returns false after the last.
bool nextAddress(Address &addr, llvm::ArrayRef<int64_t> dims) {
  for (size_t i = dims.size(); i-- > 0;) {
    if (++addr[i] < dims[i])
      return true;
    addr[i] = 0;
  }
  return false;
}

} // namespace

llvm::Expected<AddressCheckResult>
AddressVerifier::check(const Memory &mem, llvm::ArrayRef<int64_t> dims) const {
  if (llvm::Error err = mem.verify(dims.size()))
    return std::move(err);

  uint64_t space = 1;
  for (int64_t d : dims) {
    if (d < 1)
      return malformedMetadata(MembankError::MISSING_DIMS, INVALID_SYMBOL,
                               "dimension size " + llvm::Twine(d) +
                                   " is not positive");
    if (space > opts.maxAddresses / static_cast<uint64_t>(d))
      return unsupportedConfiguration(
          MembankError::ADDRESS_SPACE_TOO_LARGE, INVALID_SYMBOL,
          "address space exceeds the verification limit of " +
              llvm::Twine(opts.maxAddresses) + " addresses");
    space *= static_cast<uint64_t>(d);
  }

  llvm::SmallVector<int64_t, 4> nBanks = mem.nBanks();
  AddressCheckResult result;
  std::map<Location, Address> used;
  Address addr(dims.size(), 0);
  do {
    llvm::Expected<int64_t> offset = mem.bankOffset(addr, dims);
    if (!offset)
      return offset.takeError();
    Location loc(mem.bankSelects(addr), *offset);

    for (unsigned g = 0; g < loc.first.size(); ++g)
      if (loc.first[g] < 0 || loc.first[g] >= nBanks[g])
        result.outOfRange.push_back(BankRangeViolation{addr, g, loc.first[g]});

    auto [it, inserted] = used.emplace(loc, addr);
    if (!inserted) {
      ++result.conflictCount;
      if (result.conflicts.size() < opts.maxReportedConflicts)
        result.conflicts.push_back(
            AddressConflict{it->second, addr, loc.first, loc.second});
    }
    result.maxOffset = std::max(result.maxOffset, *offset);
    ++result.addressesChecked;
  } while (nextAddress(addr, dims));

  result.dense = result.ok() &&
                 used.size() == static_cast<uint64_t>(mem.totalBanks()) *
                                    static_cast<uint64_t>(result.maxOffset + 1);

  LLVM_DEBUG(llvm::dbgs() << "[membank.verify] " << mem << ": "
                          << result.addressesChecked << " addresses, "
                          << result.conflictCount << " conflicts, "
                          << result.outOfRange.size() << " out of range\n");
  return std::move(result);
}

llvm::Error
AddressVerifier::checkConflictFree(const Memory &mem,
                                   llvm::ArrayRef<int64_t> dims) const {
  llvm::Expected<AddressCheckResult> result = check(mem, dims);
  if (!result)
    return result.takeError();
  if (!result->outOfRange.empty()) {
    const BankRangeViolation &v = result->outOfRange.front();
    std::string at;
    llvm::raw_string_ostream os(at);
    printSeq(os, v.addr);
    return invariantViolation(MembankError::BANK_SELECT_RANGE, INVALID_SYMBOL,
                              "bank " + llvm::Twine(v.bank) + " of group " +
                                  llvm::Twine(v.group) + " at address " +
                                  os.str() + " is out of range");
  }
  if (result->conflictCount) {
    std::string detail;
    llvm::raw_string_ostream os(detail);
    if (!result->conflicts.empty()) {
      const AddressConflict &c = result->conflicts.front();
      os << ", first ";
      printSeq(os, c.first);
      os << " and ";
      printSeq(os, c.second);
      os << " at offset " << c.offset;
    }
    return invariantViolation(MembankError::BANK_CONFLICT, INVALID_SYMBOL,
                              llvm::Twine(result->conflictCount) +
                                  " conflicting addresses" + os.str());
  }
  return llvm::Error::success();
}

} // namespace membank
