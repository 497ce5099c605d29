//===-- membank_args.h - Argument parsing for membank driver ----*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_TOOLS_MEMBANK_ARGS_H
#define MEMBANK_TOOLS_MEMBANK_ARGS_H

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace membank {
namespace tool {

struct ParsedArgs {
  std::vector<std::string> inputs;
  std::string output_path;
  bool verify = false;
  uint64_t max_verify_size = uint64_t(1) << 22;
  std::string default_resource = "SRAM";
  bool dump = false;
  bool debug = false;
  bool show_help = false;
  bool show_version = false;
  bool had_error = false;
};

void PrintUsage(llvm::StringRef prog);
void PrintVersion();
ParsedArgs ParseArgs(int argc, char **argv);

} // namespace tool
} // namespace membank

#endif // MEMBANK_TOOLS_MEMBANK_ARGS_H
