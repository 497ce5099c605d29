//===-- Memory.h - Banked memory configuration ------------------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Memory is the banking configuration of one physical duplicate of a logical
// memory: one or more banking strategies, the N-buffer depth and the
// accumulation classification. Memory values are immutable once built.
//
// Two banking shapes are supported:
//   - Flat:         one strategy spanning every dimension
//   - Hierarchical: one strategy per dimension (strategy t governs dim t)
// Any other grouping fails with BANK_UNSUPPORTED_BANKING_SHAPE.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_BANKING_MEMORY_H
#define MEMBANK_BANKING_MEMORY_H

#include "membank/Banking/Banking.h"

#include "llvm/Support/Error.h"

#include <optional>
#include <string>
#include <utility>

namespace membank {

/// Associative function of a reduction accumulator.
enum class ReduceFunction { Add, Mul, Min, Max, Other };

/// Accumulator classification of a memory instance.
struct AccumType {
  enum Kind { None, Reduce, FMA, Unknown };

  Kind kind = None;
  /// Only meaningful when kind == Reduce.
  ReduceFunction func = ReduceFunction::Other;

  static AccumType none() { return AccumType{None, ReduceFunction::Other}; }
  static AccumType reduce(ReduceFunction fn) { return AccumType{Reduce, fn}; }
  static AccumType fma() { return AccumType{FMA, ReduceFunction::Other}; }
  static AccumType unknown() {
    return AccumType{Unknown, ReduceFunction::Other};
  }

  bool operator==(const AccumType &other) const {
    return kind == other.kind && (kind != Reduce || func == other.func);
  }
  bool operator!=(const AccumType &other) const { return !(*this == other); }
};

llvm::StringRef toString(ReduceFunction fn);
void printAccumType(llvm::raw_ostream &os, const AccumType &acc);

class Memory {
public:
  Memory(llvm::ArrayRef<Banking> banking, int64_t depth, AccumType accType)
      : banking(banking.begin(), banking.end()), depth(depth),
        accType(accType) {}

  /// Unbanked, single-buffered memory of the given rank.
  static Memory unit(unsigned rank);

  llvm::ArrayRef<Banking> getBanking() const { return banking; }
  int64_t getDepth() const { return depth; }
  AccumType getAccType() const { return accType; }

  /// True when a single strategy spans all dimensions.
  bool isFlat() const { return banking.size() == 1; }

  /// Target resource hint. Stored and passed through, never interpreted.
  const std::optional<std::string> &getResourceType() const {
    return resourceType;
  }
  void setResourceType(std::optional<std::string> resource) {
    resourceType = std::move(resource);
  }
  /// The resource hint, or `targetDefault` when no hint was attached.
  std::string resource(llvm::StringRef targetDefault) const;

  /// Bank count of each strategy.
  llvm::SmallVector<int64_t, 4> nBanks() const;

  /// Product of all strategies' bank counts.
  int64_t totalBanks() const;

  /// Words per bank assuming an even split of each strategy's dimensions.
  int64_t bankDepth(llvm::ArrayRef<int64_t> dims) const;

  /// Bank index per strategy for the given full address. The address must
  /// cover every governed dim; use bankAddress() for unchecked input.
  llvm::SmallVector<int64_t, 4> bankSelects(llvm::ArrayRef<int64_t> addr) const;

  /// Offset of `addr` within its bank, given the memory's dimension sizes.
  llvm::Expected<int64_t> bankOffset(llvm::ArrayRef<int64_t> addr,
                                     llvm::ArrayRef<int64_t> dims) const;

  /// Bank selects and intra-bank offset of `addr`.
  llvm::Expected<std::pair<llvm::SmallVector<int64_t, 4>, int64_t>>
  bankAddress(llvm::ArrayRef<int64_t> addr,
              llvm::ArrayRef<int64_t> dims) const;

  /// Check the banking shape against the memory rank and each strategy.
  llvm::Error verify(unsigned rank) const;

  void print(llvm::raw_ostream &os) const;

  bool operator==(const Memory &other) const;
  bool operator!=(const Memory &other) const { return !(*this == other); }

private:
  llvm::Expected<int64_t> flatOffset(llvm::ArrayRef<int64_t> addr,
                                     llvm::ArrayRef<int64_t> dims) const;
  llvm::Expected<int64_t>
  hierarchicalOffset(llvm::ArrayRef<int64_t> addr,
                     llvm::ArrayRef<int64_t> dims) const;

  llvm::SmallVector<Banking, 2> banking;
  int64_t depth = 1;
  AccumType accType;
  std::optional<std::string> resourceType;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const Memory &mem) {
  mem.print(os);
  return os;
}

} // namespace membank

#endif // MEMBANK_BANKING_MEMORY_H
