//===-- Instance.cpp - Candidate physical memory duplicate ------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Banking/Instance.h"
#include "membank/Banking/BankingError.h"

#include <algorithm>

namespace membank {

namespace {

void printPortGroup(llvm::raw_ostream &os, const Instance &inst,
                    std::optional<unsigned> bufferStage,
                    const std::vector<AccessGroup> &groups,
                    llvm::StringRef type) {
  // Accesses on this buffer stage, ordered by mux slot then identity.
  std::vector<const AccessMatrix *> onPort;
  for (const AccessGroup &group : groups)
    for (const AccessMatrix &a : group) {
      auto it = inst.ports.find(a.id());
      if (it != inst.ports.end() && it->second.bufferStage == bufferStage)
        onPort.push_back(&a);
    }

  unsigned width = 0;
  for (const AccessMatrix *a : onPort)
    width = std::max(width, inst.ports.at(a->id()).muxWidth);

  std::stable_sort(onPort.begin(), onPort.end(),
                   [&](const AccessMatrix *l, const AccessMatrix *r) {
                     unsigned ls = inst.ports.at(l->id()).muxSlot;
                     unsigned rs = inst.ports.at(r->id()).muxSlot;
                     if (ls != rs)
                       return ls < rs;
                     return l->id() < r->id();
                   });

  if (bufferStage)
    os << *bufferStage;
  else
    os << "M";
  os << " [Type:" << type << ", Width:" << width << "]:\n";

  std::optional<unsigned> lastSlot;
  for (const AccessMatrix *a : onPort) {
    const Port &port = inst.ports.at(a->id());
    if (lastSlot != port.muxSlot) {
      os << " - Mux Port #" << port.muxSlot << ":\n";
      lastSlot = port.muxSlot;
    }
    os << "  [Ofs: " << port.muxOffset << "] " << a->id();
    if (port.broadcastFactor)
      os << " (broadcast " << port.broadcastFactor << ")";
    os << "\n      - Scope: " << a->scope << "\n";
  }
}

} // namespace

Instance Instance::unit(unsigned rank) {
  Instance inst;
  inst.banking.push_back(Banking::unit(rank));
  inst.accType = AccumType::none();
  return inst;
}

std::vector<const AccessMatrix *> Instance::accessMatrices() const {
  std::vector<const AccessMatrix *> result;
  for (const AccessGroup &group : writes)
    for (const AccessMatrix &a : group)
      result.push_back(&a);
  for (const AccessGroup &group : reads)
    for (const AccessMatrix &a : group)
      result.push_back(&a);
  return result;
}

std::set<SymbolId> Instance::accesses() const {
  std::set<SymbolId> result;
  for (const AccessMatrix *a : accessMatrices())
    result.insert(a->access);
  return result;
}

llvm::Error Instance::verifyPorts() const {
  for (const AccessMatrix *a : accessMatrices()) {
    auto it = ports.find(a->id());
    if (it == ports.end())
      return invariantViolation(MembankError::PORT_MISSING, a->access,
                                "access has no buffer port", a->unroll);
    const Port &port = it->second;
    if (port.muxOffset >= port.muxWidth)
      return invariantViolation(MembankError::PORT_OFFSET_RANGE, a->access,
                                "mux offset " + llvm::Twine(port.muxOffset) +
                                    " outside mux width " +
                                    llvm::Twine(port.muxWidth),
                                a->unroll);
  }
  return llvm::Error::success();
}

void Instance::print(llvm::raw_ostream &os) const {
  os << "<Banked>\n";
  os << "Depth:    " << depth << "\n";
  os << "Accum:    ";
  printAccumType(os, accType);
  os << "\n";
  os << "Banking:  [";
  for (size_t i = 0; i < banking.size(); ++i) {
    if (i)
      os << "; ";
    os << banking[i];
  }
  os << "] <" << (banking.size() == 1 ? "Flat" : "Hierarchical") << ">\n";
  os << "Cost:     " << cost << "\n";
  os << "Pipeline: ";
  if (metapipe)
    os << *metapipe;
  else
    os << "---";
  os << "\n";
  os << "Ports:\n";

  llvm::SmallVector<std::optional<unsigned>, 4> stages;
  for (int64_t d = 0; d < depth; ++d)
    stages.push_back(static_cast<unsigned>(d));
  if (depth > 1)
    stages.push_back(std::nullopt);

  for (std::optional<unsigned> stage : stages) {
    printPortGroup(os, *this, stage, writes, "WR");
    printPortGroup(os, *this, stage, reads, "RD");
  }
}

} // namespace membank
