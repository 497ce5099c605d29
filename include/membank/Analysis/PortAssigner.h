//===-- PortAssigner.h - Instance port assignment ---------------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// PortAssigner turns the access groups chosen for one physical duplicate into
// an Instance: it derives the control scopes, the N-buffering pipeline and
// depth, and a Port for every unrolled access.
//
// Scheduling rules, per direction (writes and reads are scheduled apart):
//   - Buffer stage: stage offset of the access inside the N-buffer pipeline,
//     None outside of it, 0 for single-buffered memories.
//   - Mux slot: each access group (accesses issued in the same logical time
//     step) gets one slot per buffer stage, in group order.
//   - Mux offset: members of a slot are packed lane after lane by width.
//   - Mux width: the widest packed slot on that buffer stage.
//   - Broadcast: reads of identical addresses in one slot share a lane.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_ANALYSIS_PORTASSIGNER_H
#define MEMBANK_ANALYSIS_PORTASSIGNER_H

#include "membank/Banking/Instance.h"
#include "membank/Metadata/MetadataStore.h"

#include "llvm/Support/Error.h"

#include <map>
#include <optional>

namespace membank {

/// Position of a control scope inside an N-buffering pipeline.
struct ScopeInfo {
  /// Pipeline this scope runs as a stage of; none for sequential scopes.
  std::optional<ScopeId> pipeline;
  unsigned stage = 0;
};

/// Control-scope information supplied by the host compiler.
class ScopeTable {
public:
  void addScope(ScopeId id, std::optional<ScopeId> pipeline = std::nullopt,
                unsigned stage = 0);

  /// Return the scope's info, or nullptr if the scope was never added.
  const ScopeInfo *lookup(ScopeId id) const;

  size_t size() const { return scopes.size(); }

private:
  std::map<ScopeId, ScopeInfo> scopes;
};

/// Inputs for one candidate duplicate, as chosen by the banking search.
struct InstanceRequest {
  std::vector<AccessGroup> reads;
  std::vector<AccessGroup> writes;
  llvm::SmallVector<Banking, 2> banking;
  AccumType accType;
  int64_t cost = 0;
};

class PortAssigner {
public:
  struct Options {
    /// Let identical reads in one mux slot share a lane.
    bool broadcastReads = true;
    /// Pack the members of an access group into one mux slot. When false,
    /// every access gets a slot of its own.
    bool packGroups = true;
  };

  PortAssigner() = default;
  explicit PortAssigner(const Options &opts) : opts(opts) {}

  /// Build the Instance for `mem`. Reads the memory's rank and non-buffer
  /// flag from `store`.
  llvm::Expected<Instance> buildInstance(const MetadataStore &store,
                                         SymbolId mem,
                                         const ScopeTable &scopes,
                                         InstanceRequest request) const;

  /// (Re)compute inst.ports from its groups, pipeline and depth.
  llvm::Error assignPorts(Instance &inst, const ScopeTable &scopes) const;

private:
  using StageMap = std::map<AccessId, std::optional<unsigned>>;

  llvm::Error findPipeline(Instance &inst, const ScopeTable &scopes,
                           SymbolId mem) const;
  void scheduleDirection(Instance &inst, const std::vector<AccessGroup> &groups,
                         const StageMap &stageOf, bool isRead) const;

  Options opts;
};

} // namespace membank

#endif // MEMBANK_ANALYSIS_PORTASSIGNER_H
