//===-- membank.cpp - Membank driver ----------------------------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Reads memory, scope and candidate-instance descriptions from JSON, runs port
// assignment and dispatch commit for every memory, optionally verifies the
// bank address mapping, and writes a JSON report.
//
//===----------------------------------------------------------------------===//

#include "membank_args.h"

#include "membank/Analysis/AddressCheck.h"
#include "membank/Analysis/Dispatch.h"
#include "membank/Analysis/PortAssigner.h"
#include "membank/Banking/BankingError.h"
#include "membank/Export/BankingJson.h"
#include "membank/Metadata/MemoryMetadata.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

using namespace membank;
using namespace membank::tool;

namespace {

void PrintError(llvm::StringRef context, llvm::Error err) {
  llvm::errs() << "error: " << context << ": " << llvm::toString(std::move(err))
               << "\n";
}

bool EnsureOutputDirectory(llvm::StringRef output_path) {
  llvm::SmallString<256> dir = llvm::sys::path::parent_path(output_path);
  if (dir.empty())
    return true;

  std::error_code ec = llvm::sys::fs::create_directories(dir);
  if (ec) {
    llvm::errs() << "error: cannot create output directory: " << dir << "\n";
    llvm::errs() << ec.message() << "\n";
    return false;
  }

  return true;
}

/// Build, commit and check the duplicates of one memory.
llvm::Error ProcessMemory(const MemoryDesc &desc, MetadataStore &store,
                          const ScopeTable &scopes, const ParsedArgs &parsed,
                          VerificationMap &verification, bool &conflicts) {
  llvm::Expected<unsigned> memRank = rank(store, desc.id);
  if (!memRank)
    return memRank.takeError();

  PortAssigner assigner;
  std::vector<Instance> instances;
  for (const InstanceDesc &inst : desc.instances) {
    InstanceRequest request;
    for (const auto &group : inst.reads)
      request.reads.emplace_back(group.begin(), group.end());
    for (const auto &group : inst.writes)
      request.writes.emplace_back(group.begin(), group.end());
    request.banking = toBanking(inst, *memRank);
    request.accType = inst.accType;
    request.cost = inst.cost;

    llvm::Expected<Instance> built =
        assigner.buildInstance(store, desc.id, scopes, std::move(request));
    if (!built)
      return built.takeError();
    if (parsed.dump) {
      llvm::outs() << "memory x" << desc.id;
      if (!desc.name.empty())
        llvm::outs() << " (" << desc.name << ")";
      llvm::outs() << " duplicate #" << instances.size() << "\n";
      built->print(llvm::outs());
    }
    instances.push_back(std::move(*built));
  }

  if (instances.empty()) {
    setUnusedMemory(store, desc.id, true);
    return llvm::Error::success();
  }

  if (llvm::Error err = commitInstances(store, desc.id, instances))
    return err;

  if (desc.resource) {
    std::vector<Memory> dups = cantFailOrDie(duplicates(store, desc.id));
    for (Memory &m : dups)
      m.setResourceType(desc.resource);
    setDuplicates(store, desc.id, std::move(dups));
  }

  if (llvm::Error err = verifyDispatches(store, desc.id))
    return err;

  if (!parsed.verify)
    return llvm::Error::success();

  llvm::Expected<Address> dims = constDims(store, desc.id);
  if (!dims)
    return dims.takeError();
  AddressVerifier::Options opts;
  opts.maxAddresses = parsed.max_verify_size;
  AddressVerifier verifier(opts);
  std::vector<AddressCheckResult> &results = verification[desc.id];
  for (const Memory &m : cantFailOrDie(duplicates(store, desc.id))) {
    llvm::Expected<AddressCheckResult> result = verifier.check(m, *dims);
    if (!result)
      return result.takeError();
    if (!result->ok()) {
      llvm::errs() << "error: memory x" << desc.id << " duplicate #"
                   << results.size() << ": " << result->conflictCount
                   << " bank conflicts, " << result->outOfRange.size()
                   << " bank selects out of range\n";
      conflicts = true;
    }
    results.push_back(std::move(*result));
  }
  return llvm::Error::success();
}

} // namespace

int main(int argc, char **argv) {
  llvm::InitLLVM init_llvm(argc, argv);

  ParsedArgs parsed = ParseArgs(argc, argv);
  if (parsed.show_help) {
    PrintUsage(argv[0]);
    return parsed.had_error ? 1 : 0;
  }
  if (parsed.show_version) {
    PrintVersion();
    return parsed.had_error ? 1 : 0;
  }
  if (parsed.had_error)
    return 1;
  if (parsed.debug)
    llvm::DebugFlag = true;

  if (parsed.inputs.empty()) {
    llvm::errs() << "error: no input file\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (parsed.inputs.size() > 1) {
    llvm::errs() << "error: expected exactly one input file\n";
    return 1;
  }
  const std::string &input_path = parsed.inputs.front();

  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer =
      llvm::MemoryBuffer::getFileOrSTDIN(input_path);
  if (!buffer) {
    llvm::errs() << "error: cannot read " << input_path << ": "
                 << buffer.getError().message() << "\n";
    return 1;
  }

  llvm::Expected<BankingInput> input =
      parseBankingInput((*buffer)->getBuffer());
  if (!input) {
    PrintError(input_path, input.takeError());
    return 1;
  }

  MetadataStore store;
  ScopeTable scopes;
  if (llvm::Error err = populateStore(*input, store, scopes)) {
    PrintError(input_path, std::move(err));
    return 1;
  }

  VerificationMap verification;
  bool conflicts = false;
  for (const MemoryDesc &desc : input->memories) {
    if (llvm::Error err =
            ProcessMemory(desc, store, scopes, parsed, verification,
                          conflicts)) {
      PrintError("memory x" + std::to_string(desc.id), std::move(err));
      return 1;
    }
  }

  auto writeTo = [&](llvm::raw_ostream &out) {
    llvm::json::OStream json(out, 2);
    writeReport(json, store, *input, parsed.default_resource,
                parsed.verify ? &verification : nullptr);
    out << "\n";
  };

  if (parsed.output_path.empty()) {
    writeTo(llvm::outs());
  } else {
    if (!EnsureOutputDirectory(parsed.output_path))
      return 1;
    std::error_code ec;
    llvm::raw_fd_ostream out(parsed.output_path, ec, llvm::sys::fs::OF_Text);
    if (ec) {
      llvm::errs() << "error: cannot open " << parsed.output_path << ": "
                   << ec.message() << "\n";
      return 1;
    }
    writeTo(out);
  }

  return conflicts ? 1 : 0;
}
