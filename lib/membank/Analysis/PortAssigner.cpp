//===-- PortAssigner.cpp - Instance port assignment -------------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Analysis/PortAssigner.h"
#include "membank/Banking/BankingError.h"
#include "membank/Metadata/MemoryMetadata.h"

#include "llvm/Support/Debug.h"

#include <algorithm>

#define DEBUG_TYPE "membank-ports"

namespace membank {

void ScopeTable::addScope(ScopeId id, std::optional<ScopeId> pipeline,
                          unsigned stage) {
  scopes[id] = ScopeInfo{pipeline, stage};
}

const ScopeInfo *ScopeTable::lookup(ScopeId id) const {
  auto it = scopes.find(id);
  if (it == scopes.end())
    return nullptr;
  return &it->second;
}

llvm::Expected<Instance>
PortAssigner::buildInstance(const MetadataStore &store, SymbolId mem,
                            const ScopeTable &scopes,
                            InstanceRequest request) const {
  llvm::Expected<unsigned> memRank = rank(store, mem);
  if (!memRank)
    return memRank.takeError();

  Instance inst;
  inst.reads = std::move(request.reads);
  inst.writes = std::move(request.writes);
  inst.banking = std::move(request.banking);
  inst.accType = request.accType;
  inst.cost = request.cost;

  if (llvm::Error err = inst.toMemory().verify(*memRank))
    return attachSymbol(std::move(err), mem);

  std::set<AccessId> seen;
  for (const AccessMatrix *a : inst.accessMatrices()) {
    if (llvm::Error err = a->verify(*memRank))
      return std::move(err);
    if (!seen.insert(a->id()).second)
      return invariantViolation(MembankError::ACCESS_DUPLICATED, a->access,
                                "unrolled access appears twice in one "
                                "instance of memory x" +
                                    llvm::Twine(mem),
                                a->unroll);
    if (!scopes.lookup(a->scope))
      return missingMetadata(MembankError::MISSING_SCOPE, a->access,
                             "enclosing scope " + llvm::Twine(a->scope) +
                                 " is unknown",
                             a->unroll);
    inst.ctrls.insert(a->scope);
  }

  if (isNonBuffer(store, mem)) {
    inst.metapipe = std::nullopt;
    inst.depth = 1;
  } else if (llvm::Error err = findPipeline(inst, scopes, mem)) {
    return std::move(err);
  }

  if (llvm::Error err = assignPorts(inst, scopes))
    return std::move(err);

  LLVM_DEBUG({
    llvm::dbgs() << "[membank.ports] memory x" << mem << "\n";
    inst.print(llvm::dbgs());
  });
  return std::move(inst);
}

llvm::Error PortAssigner::findPipeline(Instance &inst,
                                       const ScopeTable &scopes,
                                       SymbolId mem) const {
  std::map<ScopeId, std::set<unsigned>> stagesByPipeline;
  for (const AccessMatrix *a : inst.accessMatrices()) {
    const ScopeInfo *info = scopes.lookup(a->scope);
    if (info && info->pipeline)
      stagesByPipeline[*info->pipeline].insert(info->stage);
  }

  inst.metapipe = std::nullopt;
  inst.depth = 1;
  for (const auto &[pipeline, stages] : stagesByPipeline) {
    if (stages.size() < 2)
      continue;
    if (inst.metapipe)
      return unsupportedConfiguration(
          MembankError::MULTI_PIPELINE, mem,
          "accesses require N-buffering in both pipeline " +
              llvm::Twine(*inst.metapipe) + " and pipeline " +
              llvm::Twine(pipeline));
    inst.metapipe = pipeline;
    inst.depth = *stages.rbegin() - *stages.begin() + 1;
  }

  LLVM_DEBUG(if (inst.metapipe) llvm::dbgs()
             << "[membank.ports] memory x" << mem << " buffered by pipeline "
             << *inst.metapipe << " depth=" << inst.depth << "\n");
  return llvm::Error::success();
}

llvm::Error PortAssigner::assignPorts(Instance &inst,
                                      const ScopeTable &scopes) const {
  inst.ports.clear();

  std::optional<unsigned> firstStage;
  if (inst.metapipe) {
    for (const AccessMatrix *a : inst.accessMatrices()) {
      const ScopeInfo *info = scopes.lookup(a->scope);
      if (info && info->pipeline == inst.metapipe)
        firstStage = std::min(firstStage.value_or(info->stage), info->stage);
    }
  }

  StageMap stageOf;
  for (const AccessMatrix *a : inst.accessMatrices()) {
    const ScopeInfo *info = scopes.lookup(a->scope);
    if (!info)
      return missingMetadata(MembankError::MISSING_SCOPE, a->access,
                             "enclosing scope " + llvm::Twine(a->scope) +
                                 " is unknown",
                             a->unroll);
    std::optional<unsigned> stage = 0u;
    if (inst.metapipe) {
      if (info->pipeline == inst.metapipe && firstStage)
        stage = info->stage - *firstStage;
      else
        stage = std::nullopt;
    }
    stageOf[a->id()] = stage;
  }

  scheduleDirection(inst, inst.writes, stageOf, /*isRead=*/false);
  scheduleDirection(inst, inst.reads, stageOf, /*isRead=*/true);
  return inst.verifyPorts();
}

void PortAssigner::scheduleDirection(Instance &inst,
                                     const std::vector<AccessGroup> &groups,
                                     const StageMap &stageOf,
                                     bool isRead) const {
  std::map<std::optional<unsigned>, unsigned> nextSlot;
  std::map<std::optional<unsigned>, unsigned> stageWidth;
  std::vector<AccessId> scheduled;

  auto placeSlot = [&](std::optional<unsigned> stage,
                       llvm::ArrayRef<const AccessMatrix *> members) {
    unsigned slot = nextSlot[stage]++;
    unsigned cursor = 0;
    // Lane owners in this slot, with the number of reads sharing each lane.
    llvm::SmallVector<std::pair<const AccessMatrix *, unsigned>, 8> owners;

    for (const AccessMatrix *a : members) {
      Port port;
      port.bufferStage = stage;
      port.muxSlot = slot;

      bool shared = false;
      if (isRead && opts.broadcastReads) {
        for (auto &owner : owners) {
          if (!a->sameAddressAs(*owner.first))
            continue;
          port.muxOffset = inst.ports[owner.first->id()].muxOffset;
          port.broadcastFactor = ++owner.second;
          shared = true;
          break;
        }
      }
      if (!shared) {
        port.muxOffset = cursor;
        cursor += a->width;
        owners.emplace_back(a, 0);
      }

      inst.ports[a->id()] = port;
      scheduled.push_back(a->id());
    }

    unsigned &width = stageWidth[stage];
    width = std::max(width, cursor);
  };

  for (const AccessGroup &group : groups) {
    std::map<std::optional<unsigned>, std::vector<const AccessMatrix *>>
        byStage;
    for (const AccessMatrix &a : group)
      byStage[stageOf.at(a.id())].push_back(&a);

    for (auto &[stage, members] : byStage) {
      std::sort(members.begin(), members.end(),
                [](const AccessMatrix *l, const AccessMatrix *r) {
                  return l->id() < r->id();
                });
      if (opts.packGroups) {
        placeSlot(stage, members);
        continue;
      }
      for (const AccessMatrix *a : members)
        placeSlot(stage, a);
    }
  }

  for (const AccessId &id : scheduled) {
    Port &port = inst.ports[id];
    port.muxWidth = stageWidth[port.bufferStage];
  }

  LLVM_DEBUG(llvm::dbgs() << "[membank.ports] scheduled " << scheduled.size()
                          << (isRead ? " reads" : " writes") << " on "
                          << stageWidth.size() << " buffer stage(s)\n");
}

} // namespace membank
