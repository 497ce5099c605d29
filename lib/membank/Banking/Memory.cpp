//===-- Memory.cpp - Banked memory configuration ----------------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Bank offset computation. The flat-banking offset follows the partitioning
// scheme of Wang et al. (FPGA'14, p.199) with a correction for banking
// patterns whose period is smaller than N*B in some dimension. Without the
// correction, alpha=<1,2>, N=4, B=1 on a 4x4 memory gives
//
//     banks:  0 2 0 2      offsets (bank 0):  0 * 0 *
//             1 3 1 3                         * * * *
//             2 0 2 0                         * 2 * 2
//             3 1 3 1                         * * * *
//
// i.e. distinct addresses in bank 0 share offsets. The corrected algorithm
// fences the address space into "offset chunks", each holding every bank
// exactly once:
//
//   1. P_i = NB / gcd(NB, alpha_i), or infinity when alpha_i == 0.
//   2. If some P_i == NB, that dimension alone covers every bank: all other
//      periods become 1.
//   3. chunk_t = floor(x_t / P_t), flattened with weights
//      prod_{k>t} ceil(w_k / P_k).
//   4. intrablock_t = x_t mod B, flattened with weights B^(D-t-1).
//   5. offset = chunk * B^D + intrablock.
//
// Example: alpha=<3,4>, N=6, B=1 tiles the banks as
//
//     0 4 2 | 0 4 2
//     3 1 5 | 3 1 5
//
// with P = (2, 3).
//
// The mapping is not injective for every configuration. Flat block-cyclic
// banking (B > 1) where no dimension has period N*B can collide: alpha=<2,2>,
// N=3, B=2 on 3x3 puts (0,2) and (2,0) at bank 2, offset 0. Hierarchical
// banking collides when b_t > ceil(w_t / n_t), e.g. N=(1,2), B=(1,4) on 2x6.
// Such configurations are left to the banking search to reject; the
// AddressVerifier reports them as conflicts.
//
//===----------------------------------------------------------------------===//

#include "membank/Banking/Memory.h"
#include "membank/Banking/BankingError.h"

#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/MathExtras.h"

#include <limits>
#include <numeric>

namespace membank {

namespace {

/// Period used for dimensions that never change the bank (alpha == 0).
constexpr int64_t kInfinitePeriod = std::numeric_limits<int64_t>::max();

int64_t ceilDiv(int64_t num, int64_t den) {
  return static_cast<int64_t>(llvm::divideCeil(static_cast<uint64_t>(num),
                                               static_cast<uint64_t>(den)));
}

int64_t ipow(int64_t base, size_t exp) {
  int64_t result = 1;
  for (size_t i = 0; i < exp; ++i)
    result *= base;
  return result;
}

} // namespace

llvm::StringRef toString(ReduceFunction fn) {
  switch (fn) {
  case ReduceFunction::Add:
    return "add";
  case ReduceFunction::Mul:
    return "mul";
  case ReduceFunction::Min:
    return "min";
  case ReduceFunction::Max:
    return "max";
  case ReduceFunction::Other:
    return "other";
  }
  llvm_unreachable("unknown reduce function");
}

void printAccumType(llvm::raw_ostream &os, const AccumType &acc) {
  switch (acc.kind) {
  case AccumType::None:
    os << "None";
    return;
  case AccumType::Reduce:
    os << "Reduce(" << toString(acc.func) << ")";
    return;
  case AccumType::FMA:
    os << "FMA";
    return;
  case AccumType::Unknown:
    os << "Unknown";
    return;
  }
  llvm_unreachable("unknown accumulator kind");
}

Memory Memory::unit(unsigned rank) {
  return Memory({Banking::unit(rank)}, 1, AccumType::none());
}

std::string Memory::resource(llvm::StringRef targetDefault) const {
  if (resourceType)
    return *resourceType;
  return targetDefault.str();
}

llvm::SmallVector<int64_t, 4> Memory::nBanks() const {
  llvm::SmallVector<int64_t, 4> result;
  for (const Banking &b : banking)
    result.push_back(b.getNBanks());
  return result;
}

int64_t Memory::totalBanks() const {
  int64_t total = 1;
  for (const Banking &b : banking)
    total *= b.getNBanks();
  return total;
}

int64_t Memory::bankDepth(llvm::ArrayRef<int64_t> dims) const {
  int64_t result = 1;
  for (const Banking &b : banking) {
    int64_t size = 1;
    for (int64_t d : b.getDims())
      size *= dims[d];
    result *= ceilDiv(size, b.getNBanks());
  }
  return result;
}

llvm::SmallVector<int64_t, 4>
Memory::bankSelects(llvm::ArrayRef<int64_t> addr) const {
  llvm::SmallVector<int64_t, 4> result;
  for (const Banking &b : banking)
    result.push_back(b.bankSelect(addr));
  return result;
}

llvm::Expected<int64_t> Memory::bankOffset(llvm::ArrayRef<int64_t> addr,
                                           llvm::ArrayRef<int64_t> dims) const {
  if (addr.size() != dims.size())
    return malformedMetadata(MembankError::ADDRESS_RANK_MISMATCH,
                             INVALID_SYMBOL,
                             "address has " + llvm::Twine(addr.size()) +
                                 " components but memory has rank " +
                                 llvm::Twine(dims.size()));
  if (banking.size() == 1)
    return flatOffset(addr, dims);
  if (banking.size() == dims.size())
    return hierarchicalOffset(addr, dims);
  return unsupportedConfiguration(
      MembankError::UNSUPPORTED_BANKING_SHAPE, INVALID_SYMBOL,
      "bank address calculation for " + llvm::Twine(banking.size()) +
          " banking groups over rank " + llvm::Twine(dims.size()) +
          " is not supported");
}

llvm::Expected<std::pair<llvm::SmallVector<int64_t, 4>, int64_t>>
Memory::bankAddress(llvm::ArrayRef<int64_t> addr,
                    llvm::ArrayRef<int64_t> dims) const {
  llvm::Expected<int64_t> offset = bankOffset(addr, dims);
  if (!offset)
    return offset.takeError();
  return std::make_pair(bankSelects(addr), *offset);
}

llvm::Expected<int64_t>
Memory::flatOffset(llvm::ArrayRef<int64_t> addr,
                   llvm::ArrayRef<int64_t> dims) const {
  const Banking &bank = banking.front();
  // Periodicity correction below is specific to modular banking.
  switch (bank.getKind()) {
  case Banking::Mod:
    break;
  }

  size_t rank = dims.size();
  llvm::ArrayRef<int64_t> alphas = bank.getAlphas();
  if (alphas.size() != rank)
    return unsupportedConfiguration(
        MembankError::UNSUPPORTED_BANKING_SHAPE, INVALID_SYMBOL,
        "flat banking must govern all " + llvm::Twine(rank) +
            " dims, got " + llvm::Twine(alphas.size()));

  int64_t b = bank.getStride();
  int64_t nb = bank.getNBanks() * b;

  llvm::SmallVector<int64_t, 4> periods;
  for (int64_t alpha : alphas) {
    if (alpha == 0)
      periods.push_back(kInfinitePeriod);
    else
      periods.push_back(nb / std::gcd(nb, alpha));
  }

  // A dimension whose period spans every bank makes the others redundant.
  for (size_t i = 0; i < rank; ++i) {
    if (periods[i] != nb)
      continue;
    for (size_t k = 0; k < rank; ++k)
      if (k != i)
        periods[k] = 1;
    break;
  }

  int64_t chunk = 0;
  for (size_t t = 0; t < rank; ++t) {
    int64_t weight = 1;
    for (size_t k = t + 1; k < rank; ++k)
      weight *= ceilDiv(dims[k], periods[k]);
    chunk += (addr[t] / periods[t]) * weight;
  }

  int64_t intrablock = 0;
  for (size_t t = 0; t < rank; ++t)
    intrablock += (addr[t] % b) * ipow(b, rank - t - 1);

  return chunk * ipow(b, rank) + intrablock;
}

llvm::Expected<int64_t>
Memory::hierarchicalOffset(llvm::ArrayRef<int64_t> addr,
                           llvm::ArrayRef<int64_t> dims) const {
  size_t rank = dims.size();
  for (size_t t = 0; t < rank; ++t) {
    llvm::ArrayRef<int64_t> governed = banking[t].getDims();
    if (governed.size() != 1 || governed.front() != static_cast<int64_t>(t))
      return unsupportedConfiguration(
          MembankError::UNSUPPORTED_BANKING_SHAPE, INVALID_SYMBOL,
          "hierarchical banking group " + llvm::Twine(t) +
              " must govern exactly dim " + llvm::Twine(t));
  }

  int64_t offset = 0;
  for (size_t t = 0; t < rank; ++t) {
    int64_t bt = banking[t].getStride();
    int64_t nt = banking[t].getNBanks();
    int64_t weight = 1;
    for (size_t k = t + 1; k < rank; ++k)
      weight *= ceilDiv(dims[k], banking[k].getNBanks());
    offset += ((addr[t] / (bt * nt)) * bt + addr[t] % bt) * weight;
  }
  return offset;
}

llvm::Error Memory::verify(unsigned rank) const {
  if (depth < 1)
    return malformedMetadata(MembankError::BANKING_INVALID, INVALID_SYMBOL,
                             "buffer depth must be >= 1, got " +
                                 llvm::Twine(depth));
  if (banking.size() != 1 && banking.size() != rank)
    return unsupportedConfiguration(
        MembankError::UNSUPPORTED_BANKING_SHAPE, INVALID_SYMBOL,
        llvm::Twine(banking.size()) + " banking groups over rank " +
            llvm::Twine(rank) + " (expected 1 or " + llvm::Twine(rank) + ")");
  for (const Banking &b : banking)
    if (llvm::Error err = b.verify(rank))
      return err;
  return llvm::Error::success();
}

void Memory::print(llvm::raw_ostream &os) const {
  os << "Depth: " << depth << ", Accum: ";
  printAccumType(os, accType);
  os << ", Banking: [";
  for (size_t i = 0; i < banking.size(); ++i) {
    if (i)
      os << "; ";
    os << banking[i];
  }
  os << "] <" << (isFlat() ? "Flat" : "Hierarchical") << ">";
  if (resourceType)
    os << ", Resource: " << *resourceType;
}

bool Memory::operator==(const Memory &other) const {
  return depth == other.depth && accType == other.accType &&
         resourceType == other.resourceType &&
         banking == other.banking;
}

} // namespace membank
