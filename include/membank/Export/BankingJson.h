//===-- BankingJson.h - Banking JSON input and report -----------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Input descriptions of memories, control scopes and candidate instances, as
// read by the membank driver, and the JSON report written after commit.
//
// Input schema:
//
//   { "memories": [ { "id", "name"?, "kind"?, "dims", "nonBuffer"?,
//                     "writeBuffer"?, "resource"?,
//                     "instances": [ { "banking": [ {"N", "B"?, "alpha",
//                                                    "dims"?} ],
//                                      "accum"?, "cost"?,
//                                      "reads": [[access...]],
//                                      "writes": [[access...]] } ] } ],
//     "scopes": [ { "id", "pipeline"?, "stage"? } ] }
//
//   access = { "access", "unroll"?, "scope", "width"?, "matrix"?, "offset"? }
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_EXPORT_BANKINGJSON_H
#define MEMBANK_EXPORT_BANKINGJSON_H

#include "membank/Analysis/AddressCheck.h"
#include "membank/Analysis/PortAssigner.h"
#include "membank/Metadata/MetadataStore.h"

#include "llvm/Support/JSON.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace membank {

struct BankingDesc {
  int64_t nBanks = 1;
  int64_t stride = 1;
  std::vector<int64_t> alphas;
  /// Governed dimensions; all dimensions when omitted.
  std::vector<int64_t> dims;
};

struct InstanceDesc {
  std::vector<BankingDesc> banking;
  AccumType accType = AccumType::none();
  int64_t cost = 0;
  std::vector<std::vector<AccessMatrix>> reads;
  std::vector<std::vector<AccessMatrix>> writes;
};

struct MemoryDesc {
  SymbolId id = INVALID_SYMBOL;
  std::string name;
  std::string kind = "SRAM";
  std::vector<int64_t> dims;
  bool nonBuffer = false;
  bool writeBuffer = false;
  std::optional<std::string> resource;
  std::vector<InstanceDesc> instances;
};

struct ScopeDesc {
  ScopeId id = 0;
  std::optional<ScopeId> pipeline;
  unsigned stage = 0;
};

struct BankingInput {
  std::vector<MemoryDesc> memories;
  std::vector<ScopeDesc> scopes;
};

/// Accumulator names: "none", "fma", "unknown", or a reduce function
/// ("add", "mul", "min", "max", "other").
std::optional<AccumType> parseAccumType(llvm::StringRef name);
std::string accumName(const AccumType &acc);

bool fromJSON(const llvm::json::Value &e, AccessMatrix &out,
              llvm::json::Path p);
bool fromJSON(const llvm::json::Value &e, BankingDesc &out,
              llvm::json::Path p);
bool fromJSON(const llvm::json::Value &e, InstanceDesc &out,
              llvm::json::Path p);
bool fromJSON(const llvm::json::Value &e, MemoryDesc &out, llvm::json::Path p);
bool fromJSON(const llvm::json::Value &e, ScopeDesc &out, llvm::json::Path p);
bool fromJSON(const llvm::json::Value &e, BankingInput &out,
              llvm::json::Path p);

/// Parse an input document.
llvm::Expected<BankingInput> parseBankingInput(llvm::StringRef text);

/// Record declarations, flags and access sets of every described memory,
/// and every scope.
llvm::Error populateStore(const BankingInput &input, MetadataStore &store,
                          ScopeTable &scopes);

/// Banking strategies of an instance description. Omitted governed
/// dimensions default to all `rank` dimensions.
llvm::SmallVector<Banking, 2> toBanking(const InstanceDesc &desc,
                                        unsigned rank);

/// Address verification results, per memory, per duplicate.
using VerificationMap = std::map<SymbolId, std::vector<AddressCheckResult>>;

/// Write the committed state of every described memory.
void writeReport(llvm::json::OStream &json, const MetadataStore &store,
                 const BankingInput &input, llvm::StringRef defaultResource,
                 const VerificationMap *verification = nullptr);

} // namespace membank

#endif // MEMBANK_EXPORT_BANKINGJSON_H
