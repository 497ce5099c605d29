//===-- address_check.cpp - Address mapping check test ----------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Walk whole address spaces of flat and hierarchical banking configurations
// and check where the (bank selects, offset) mapping is injective, and dense
// where the bank counts tile the memory evenly.
//
//===----------------------------------------------------------------------===//

#include "TestUtil.h"
#include "membank/Analysis/AddressCheck.h"
#include "membank/Banking/BankingError.h"

#include <vector>

using namespace membank;

namespace {

struct FlatCase {
  std::vector<int64_t> alphas;
  int64_t nBanks;
  int64_t stride;
  std::vector<int64_t> dims;
  bool dense;
};

Memory flatMemory(const FlatCase &fc) {
  Address governed;
  for (size_t i = 0; i < fc.dims.size(); ++i)
    governed.push_back(static_cast<int64_t>(i));
  return Memory({Banking::mod(fc.nBanks, fc.stride, fc.alphas, governed)}, 1,
                AccumType::none());
}

struct HierCase {
  std::vector<int64_t> nBanks;
  std::vector<int64_t> strides;
  std::vector<int64_t> dims;
};

Memory hierMemory(const HierCase &hc) {
  llvm::SmallVector<Banking, 2> groups;
  for (size_t t = 0; t < hc.dims.size(); ++t)
    groups.push_back(Banking::mod(hc.nBanks[t], hc.strides[t], {1},
                                  {static_cast<int64_t>(t)}));
  return Memory(groups, 1, AccumType::none());
}

} // namespace

int main() {
  AddressVerifier verifier;

  // Flat banking: injective for these shapes, dense when the pattern tiles.
  {
    const std::vector<FlatCase> cases = {
        {{1, 2}, 4, 1, {4, 4}, true},     {{3, 4}, 6, 1, {4, 9}, true},
        {{1, 1}, 4, 1, {8, 8}, true},     {{1, 2}, 4, 1, {8, 6}, true},
        {{1}, 4, 2, {16}, true},          {{0, 1}, 4, 1, {3, 8}, true},
        {{1, 0}, 2, 1, {4, 3}, true},     {{1, 1, 1}, 4, 1, {4, 4, 4}, true},
        {{1, 3}, 8, 1, {8, 8}, true},     {{1, 4}, 4, 2, {6, 8}, false},
        {{2, 1}, 4, 1, {5, 7}, false},    {{1, 2}, 4, 2, {4, 8}, false},
        {{1, 1}, 2, 2, {4, 4}, false},
    };
    for (const FlatCase &fc : cases) {
      Memory mem = flatMemory(fc);
      llvm::Expected<AddressCheckResult> result = verifier.check(mem, fc.dims);
      TEST_ASSERT(!!result);
      uint64_t words = 1;
      for (int64_t d : fc.dims)
        words *= static_cast<uint64_t>(d);
      TEST_ASSERT(result->addressesChecked == words);
      TEST_ASSERT(result->ok());
      TEST_ASSERT(result->dense == fc.dense);
      TEST_ASSERT(!verifier.checkConflictFree(mem, fc.dims));
    }
  }

  // Dense flat banking uses exactly bankDepth words per bank.
  {
    Memory mem = flatMemory({{1, 2}, 4, 1, {4, 4}, true});
    llvm::Expected<AddressCheckResult> result = verifier.check(mem, {4, 4});
    TEST_ASSERT(!!result);
    TEST_ASSERT(result->maxOffset + 1 == mem.bankDepth({4, 4}));
  }

  // Hierarchical banking.
  {
    const std::vector<HierCase> cases = {
        {{2, 4}, {1, 2}, {6, 8}}, {{2, 2}, {1, 1}, {4, 4}},
        {{2, 2}, {2, 1}, {8, 4}}, {{4, 1}, {1, 1}, {8, 3}},
        {{2, 3}, {1, 1}, {4, 6}}, {{2, 2}, {2, 2}, {4, 4}},
    };
    for (const HierCase &hc : cases) {
      Memory mem = hierMemory(hc);
      llvm::Expected<AddressCheckResult> result =
          verifyAddressMapping(mem, hc.dims);
      TEST_ASSERT(!!result);
      TEST_ASSERT(result->ok());
      TEST_ASSERT(result->dense);
    }

    // Uneven split: still injective, but some bank slots stay empty.
    Memory uneven = hierMemory({{3, 2}, {1, 1}, {5, 4}});
    llvm::Expected<AddressCheckResult> result =
        verifyAddressMapping(uneven, {5, 4});
    TEST_ASSERT(!!result);
    TEST_ASSERT(result->ok());
    TEST_ASSERT(!result->dense);
  }

  // Block-cyclic flat banking with no dimension of period N*B is not
  // injective: (0,2) and (2,0) share bank 2, offset 0.
  {
    Memory mem = flatMemory({{2, 2}, 3, 2, {3, 3}, false});
    llvm::Expected<AddressCheckResult> result = verifier.check(mem, {3, 3});
    TEST_ASSERT(!!result);
    TEST_ASSERT(!result->ok());
    TEST_ASSERT(result->conflictCount == 1);
    TEST_ASSERT(mem.bankSelects({0, 2}) == mem.bankSelects({2, 0}));
    TEST_ASSERT(llvm::cantFail(mem.bankOffset({0, 2}, {3, 3})) ==
                llvm::cantFail(mem.bankOffset({2, 0}, {3, 3})));
  }

  // Hierarchical banking with a stride wider than a bank's share of its
  // dimension collides as well.
  {
    Memory mem = hierMemory({{1, 2}, {1, 4}, {2, 6}});
    llvm::Expected<AddressCheckResult> result =
        verifyAddressMapping(mem, {2, 6});
    TEST_ASSERT(!!result);
    TEST_ASSERT(!result->ok());
    TEST_ASSERT(result->conflictCount == 1);
    TEST_ASSERT(consumeErrorCode(verifier.checkConflictFree(mem, {2, 6})) ==
                MembankError::BANK_CONFLICT);
  }

  // alpha=<2,2>, N=4 only reaches even banks: half the addresses collide.
  {
    Memory mem = flatMemory({{2, 2}, 4, 1, {4, 4}, false});
    llvm::Expected<AddressCheckResult> result = verifier.check(mem, {4, 4});
    TEST_ASSERT(!!result);
    TEST_ASSERT(!result->ok());
    TEST_ASSERT(result->conflictCount == 8);
    TEST_ASSERT(result->conflicts.size() == 8);
    TEST_ASSERT(!result->dense);
    for (const AddressConflict &c : result->conflicts) {
      TEST_ASSERT(c.first != c.second);
      TEST_ASSERT(c.banks.size() == 1 && c.banks.front() % 2 == 0);
      TEST_ASSERT(mem.bankSelects(c.first) == mem.bankSelects(c.second));
    }
    TEST_ASSERT(consumeErrorCode(verifier.checkConflictFree(mem, {4, 4})) ==
                MembankError::BANK_CONFLICT);

    AddressVerifier::Options opts;
    opts.maxReportedConflicts = 2;
    llvm::Expected<AddressCheckResult> capped =
        AddressVerifier(opts).check(mem, {4, 4});
    TEST_ASSERT(!!capped);
    TEST_ASSERT(capped->conflictCount == 8);
    TEST_ASSERT(capped->conflicts.size() == 2);

    opts.maxReportedConflicts = 0;
    TEST_ASSERT(consumeErrorCode(
                    AddressVerifier(opts).checkConflictFree(mem, {4, 4})) ==
                MembankError::BANK_CONFLICT);
  }

  // Input validation.
  {
    Memory mem = flatMemory({{1, 2}, 4, 1, {4, 4}, true});

    AddressVerifier::Options opts;
    opts.maxAddresses = 15;
    TEST_ASSERT(consumeErrorCode(
                    AddressVerifier(opts).check(mem, {4, 4}).takeError()) ==
                MembankError::ADDRESS_SPACE_TOO_LARGE);
    opts.maxAddresses = 16;
    llvm::Expected<AddressCheckResult> exact =
        AddressVerifier(opts).check(mem, {4, 4});
    TEST_ASSERT(exact && exact->addressesChecked == 16);

    TEST_ASSERT(consumeErrorCode(verifier.check(mem, {4, 0}).takeError()) ==
                MembankError::MISSING_DIMS);

    Memory noBanks = flatMemory({{1, 2}, 0, 1, {4, 4}, false});
    TEST_ASSERT(consumeErrorCode(verifier.check(noBanks, {4, 4}).takeError()) ==
                MembankError::BANKING_INVALID);
  }

  return 0;
}
