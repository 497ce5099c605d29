//===-- BankingJson.cpp - Banking JSON input and report ---------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Export/BankingJson.h"
#include "membank/Banking/BankingError.h"
#include "membank/Metadata/MemoryMetadata.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

namespace membank {

namespace {

bool validId(int64_t id, llvm::json::Path p) {
  if (id >= 0 && id < static_cast<int64_t>(INVALID_SYMBOL))
    return true;
  p.report("identifier out of range");
  return false;
}

/// Non-negative count that fits an unsigned field.
bool validCount(int64_t value, llvm::json::Path p) {
  if (value >= 0 && value <= static_cast<int64_t>(UINT32_MAX))
    return true;
  p.report("value out of range");
  return false;
}

void writeSeq(llvm::json::OStream &json, llvm::StringRef key,
              llvm::ArrayRef<int64_t> seq) {
  json.attributeArray(key, [&] {
    for (int64_t v : seq)
      json.value(v);
  });
}

void writeBanking(llvm::json::OStream &json, const Banking &b) {
  json.objectBegin();
  json.attribute("N", b.getNBanks());
  json.attribute("B", b.getStride());
  writeSeq(json, "alpha", b.getAlphas());
  writeSeq(json, "dims", b.getDims());
  json.objectEnd();
}

void writeCheck(llvm::json::OStream &json, const AddressCheckResult &check) {
  json.attributeObject("verify", [&] {
    json.attribute("addresses", static_cast<int64_t>(check.addressesChecked));
    json.attribute("conflicts", static_cast<int64_t>(check.conflictCount));
    json.attribute("outOfRange", static_cast<int64_t>(check.outOfRange.size()));
    json.attribute("maxOffset", check.maxOffset);
    json.attribute("dense", check.dense);
    json.attributeArray("examples", [&] {
      for (const AddressConflict &c : check.conflicts) {
        json.objectBegin();
        writeSeq(json, "first", c.first);
        writeSeq(json, "second", c.second);
        writeSeq(json, "banks", c.banks);
        json.attribute("offset", c.offset);
        json.objectEnd();
      }
    });
  });
}

void writePort(llvm::json::OStream &json, unsigned dup, const Port &port) {
  json.objectBegin();
  json.attribute("duplicate", static_cast<int64_t>(dup));
  if (port.bufferStage)
    json.attribute("bufferStage", static_cast<int64_t>(*port.bufferStage));
  else
    json.attribute("bufferStage", nullptr);
  json.attribute("muxSlot", static_cast<int64_t>(port.muxSlot));
  json.attribute("muxWidth", static_cast<int64_t>(port.muxWidth));
  json.attribute("muxOffset", static_cast<int64_t>(port.muxOffset));
  json.attribute("broadcast", static_cast<int64_t>(port.broadcastFactor));
  json.objectEnd();
}

void writeAccess(llvm::json::OStream &json, const MetadataStore &store,
                 SymbolId access, bool isWrite) {
  json.objectBegin();
  json.attribute("access", static_cast<int64_t>(access));
  json.attribute("direction", isWrite ? "write" : "read");
  if (const AccessDecl *decl = store.get<AccessDecl>(access))
    json.attribute("width", static_cast<int64_t>(decl->width));

  std::optional<std::map<unsigned, PortMap>> allPorts = getPorts(store, access);
  json.attributeArray("dispatch", [&] {
    for (const auto &entry : dispatches(store, access)) {
      const UnrollId &uid = entry.first;
      const std::set<unsigned> &dups = entry.second;
      json.objectBegin();
      writeSeq(json, "unroll", uid);
      json.attributeArray("duplicates", [&] {
        for (unsigned dup : dups)
          json.value(static_cast<int64_t>(dup));
      });
      json.attributeArray("ports", [&] {
        if (!allPorts)
          return;
        for (unsigned dup : dups) {
          auto dupIt = allPorts->find(dup);
          if (dupIt == allPorts->end())
            continue;
          auto portIt = dupIt->second.find(uid);
          if (portIt != dupIt->second.end())
            writePort(json, dup, portIt->second);
        }
      });
      json.objectEnd();
    }
  });
  json.objectEnd();
}

} // namespace

std::optional<AccumType> parseAccumType(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<AccumType>>(name)
      .Case("none", AccumType::none())
      .Case("fma", AccumType::fma())
      .Case("unknown", AccumType::unknown())
      .Case("add", AccumType::reduce(ReduceFunction::Add))
      .Case("mul", AccumType::reduce(ReduceFunction::Mul))
      .Case("min", AccumType::reduce(ReduceFunction::Min))
      .Case("max", AccumType::reduce(ReduceFunction::Max))
      .Case("other", AccumType::reduce(ReduceFunction::Other))
      .Default(std::nullopt);
}

std::string accumName(const AccumType &acc) {
  switch (acc.kind) {
  case AccumType::None:
    return "none";
  case AccumType::Reduce:
    return toString(acc.func).str();
  case AccumType::FMA:
    return "fma";
  case AccumType::Unknown:
    return "unknown";
  }
  llvm_unreachable("unknown accumulator kind");
}

bool fromJSON(const llvm::json::Value &e, AccessMatrix &out,
              llvm::json::Path p) {
  llvm::json::ObjectMapper o(e, p);
  int64_t access = -1;
  int64_t scope = -1;
  int64_t width = 1;
  std::vector<int64_t> unroll;
  std::vector<int64_t> offset;
  std::vector<std::vector<int64_t>> matrix;
  if (!o || !o.map("access", access) || !o.map("scope", scope) ||
      !o.mapOptional("unroll", unroll) || !o.mapOptional("width", width) ||
      !o.mapOptional("matrix", matrix) || !o.mapOptional("offset", offset))
    return false;
  if (!validId(access, p.field("access")) || !validId(scope, p.field("scope")))
    return false;
  if (!validCount(width, p.field("width")))
    return false;

  out = AccessMatrix();
  out.access = static_cast<SymbolId>(access);
  out.scope = static_cast<ScopeId>(scope);
  out.width = static_cast<unsigned>(width);
  out.unroll.assign(unroll.begin(), unroll.end());
  out.offset.assign(offset.begin(), offset.end());
  for (const std::vector<int64_t> &row : matrix)
    out.matrix.emplace_back(row.begin(), row.end());
  return true;
}

bool fromJSON(const llvm::json::Value &e, BankingDesc &out,
              llvm::json::Path p) {
  llvm::json::ObjectMapper o(e, p);
  return o && o.map("N", out.nBanks) && o.mapOptional("B", out.stride) &&
         o.map("alpha", out.alphas) && o.mapOptional("dims", out.dims);
}

bool fromJSON(const llvm::json::Value &e, InstanceDesc &out,
              llvm::json::Path p) {
  llvm::json::ObjectMapper o(e, p);
  std::string accum = "none";
  if (!o || !o.map("banking", out.banking) ||
      !o.mapOptional("accum", accum) || !o.mapOptional("cost", out.cost) ||
      !o.mapOptional("reads", out.reads) ||
      !o.mapOptional("writes", out.writes))
    return false;
  std::optional<AccumType> acc = parseAccumType(accum);
  if (!acc) {
    p.field("accum").report("unknown accumulator type");
    return false;
  }
  out.accType = *acc;
  return true;
}

bool fromJSON(const llvm::json::Value &e, MemoryDesc &out, llvm::json::Path p) {
  llvm::json::ObjectMapper o(e, p);
  int64_t id = -1;
  std::string resource;
  if (!o || !o.map("id", id) || !o.map("dims", out.dims) ||
      !o.mapOptional("name", out.name) || !o.mapOptional("kind", out.kind) ||
      !o.mapOptional("nonBuffer", out.nonBuffer) ||
      !o.mapOptional("writeBuffer", out.writeBuffer) ||
      !o.mapOptional("resource", resource) ||
      !o.mapOptional("instances", out.instances))
    return false;
  if (!validId(id, p.field("id")))
    return false;
  if (!parseMemoryKind(out.kind)) {
    p.field("kind").report("unknown memory kind");
    return false;
  }
  out.id = static_cast<SymbolId>(id);
  if (!resource.empty())
    out.resource = resource;
  return true;
}

bool fromJSON(const llvm::json::Value &e, ScopeDesc &out, llvm::json::Path p) {
  llvm::json::ObjectMapper o(e, p);
  int64_t id = -1;
  int64_t pipeline = -1;
  int64_t stage = 0;
  if (!o || !o.map("id", id) || !o.mapOptional("pipeline", pipeline) ||
      !o.mapOptional("stage", stage))
    return false;
  if (!validId(id, p.field("id")))
    return false;
  if (!validCount(stage, p.field("stage")))
    return false;
  if (pipeline != -1 && !validId(pipeline, p.field("pipeline")))
    return false;
  out.id = static_cast<ScopeId>(id);
  out.stage = static_cast<unsigned>(stage);
  if (pipeline != -1)
    out.pipeline = static_cast<ScopeId>(pipeline);
  return true;
}

bool fromJSON(const llvm::json::Value &e, BankingInput &out,
              llvm::json::Path p) {
  llvm::json::ObjectMapper o(e, p);
  return o && o.map("memories", out.memories) &&
         o.mapOptional("scopes", out.scopes);
}

llvm::Expected<BankingInput> parseBankingInput(llvm::StringRef text) {
  return llvm::json::parse<BankingInput>(text, "input");
}

llvm::Error populateStore(const BankingInput &input, MetadataStore &store,
                          ScopeTable &scopes) {
  for (const ScopeDesc &scope : input.scopes)
    scopes.addScope(scope.id, scope.pipeline, scope.stage);

  for (const MemoryDesc &mem : input.memories) {
    setMemoryDecl(store, mem.id, *parseMemoryKind(mem.kind), mem.dims,
                  mem.name);
    setNonBuffer(store, mem.id, mem.nonBuffer);
    setWriteBuffer(store, mem.id, mem.writeBuffer);

    std::set<SymbolId> memReaders;
    std::set<SymbolId> memWriters;
    for (const InstanceDesc &inst : mem.instances) {
      for (const auto &group : inst.reads)
        for (const AccessMatrix &a : group)
          memReaders.insert(a.access);
      for (const auto &group : inst.writes)
        for (const AccessMatrix &a : group)
          memWriters.insert(a.access);
    }

    for (SymbolId access : memReaders)
      if (memWriters.count(access))
        return malformedMetadata(MembankError::ACCESS_DECL_CONFLICT, access,
                                 "access is listed both as reader and as "
                                 "writer of memory x" +
                                     llvm::Twine(mem.id));
    for (const std::set<SymbolId> *syms : {&memReaders, &memWriters})
      for (SymbolId access : *syms)
        if (const AccessDecl *prev = store.get<AccessDecl>(access))
          if (prev->memory != mem.id)
            return malformedMetadata(
                MembankError::ACCESS_DECL_CONFLICT, access,
                "access targets both memory x" + llvm::Twine(prev->memory) +
                    " and memory x" + llvm::Twine(mem.id));

    auto declare = [&](const std::vector<std::vector<AccessMatrix>> &groups,
                       bool isWrite) {
      for (const auto &group : groups)
        for (const AccessMatrix &a : group)
          setAccessDecl(store, a.access, mem.id, isWrite, a.width);
    };
    for (const InstanceDesc &inst : mem.instances) {
      declare(inst.reads, /*isWrite=*/false);
      declare(inst.writes, /*isWrite=*/true);
    }
    setReaders(store, mem.id, std::move(memReaders));
    setWriters(store, mem.id, std::move(memWriters));
  }
  return llvm::Error::success();
}

llvm::SmallVector<Banking, 2> toBanking(const InstanceDesc &desc,
                                        unsigned rank) {
  llvm::SmallVector<Banking, 2> result;
  for (const BankingDesc &b : desc.banking) {
    std::vector<int64_t> dims = b.dims;
    if (dims.empty())
      for (unsigned d = 0; d < rank; ++d)
        dims.push_back(d);
    result.push_back(Banking::mod(b.nBanks, b.stride, b.alphas, dims));
  }
  return result;
}

void writeReport(llvm::json::OStream &json, const MetadataStore &store,
                 const BankingInput &input, llvm::StringRef defaultResource,
                 const VerificationMap *verification) {
  json.objectBegin();
  json.attribute("version", 1);
  json.attributeArray("memories", [&] {
    for (const MemoryDesc &mem : input.memories) {
      json.objectBegin();
      json.attribute("id", static_cast<int64_t>(mem.id));
      json.attribute("name", mem.name);
      json.attribute("kind", mem.kind);
      writeSeq(json, "dims", mem.dims);
      json.attribute("unused", isUnusedMemory(store, mem.id));

      const std::vector<AddressCheckResult> *checks = nullptr;
      if (verification) {
        auto it = verification->find(mem.id);
        if (it != verification->end())
          checks = &it->second;
      }

      // Memories with dynamic dimensions have no static bank depth.
      std::optional<Address> dims;
      llvm::Expected<Address> dimsOrErr = constDims(store, mem.id);
      if (dimsOrErr)
        dims = std::move(*dimsOrErr);
      else
        llvm::consumeError(dimsOrErr.takeError());
      std::vector<Memory> dups =
          getDuplicates(store, mem.id).value_or(std::vector<Memory>());
      json.attributeArray("duplicates", [&] {
        for (unsigned i = 0; i < dups.size(); ++i) {
          const Memory &m = dups[i];
          json.objectBegin();
          json.attribute("index", static_cast<int64_t>(i));
          json.attributeArray("banking", [&] {
            for (const Banking &b : m.getBanking())
              writeBanking(json, b);
          });
          json.attribute("format", m.isFlat() ? "flat" : "hierarchical");
          json.attribute("depth", m.getDepth());
          json.attribute("accum", accumName(m.getAccType()));
          json.attribute("totalBanks", m.totalBanks());
          if (dims)
            json.attribute("bankDepth", m.bankDepth(*dims));
          json.attribute("resource", m.resource(defaultResource));
          if (checks && i < checks->size())
            writeCheck(json, (*checks)[i]);
          json.objectEnd();
        }
      });

      json.attributeArray("accesses", [&] {
        for (SymbolId access : writers(store, mem.id))
          writeAccess(json, store, access, /*isWrite=*/true);
        for (SymbolId access : readers(store, mem.id))
          writeAccess(json, store, access, /*isWrite=*/false);
      });
      json.objectEnd();
    }
  });
  json.objectEnd();
}

} // namespace membank
