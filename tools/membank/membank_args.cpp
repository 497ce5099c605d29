//===-- membank_args.cpp - Argument parsing for membank driver --*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank_args.h"

#include "llvm/Config/llvm-config.h"
#include "llvm/Support/raw_ostream.h"

namespace membank {
namespace tool {

void PrintUsage(llvm::StringRef prog) {
  llvm::outs() << "Usage: " << prog << " [options] <input.json>\n";
  llvm::outs() << "\n";
  llvm::outs() << "Build the buffer ports of every candidate duplicate "
               << "described in the input,\n";
  llvm::outs() << "commit duplicates and dispatches, and write a JSON "
               << "banking report.\n";
  llvm::outs() << "\n";
  llvm::outs() << "Options:\n";
  llvm::outs() << "  -o <report.json>           Report path "
               << "(default: stdout)\n";
  llvm::outs() << "  --verify                   Check every address of each "
               << "duplicate for bank conflicts\n";
  llvm::outs() << "  --max-verify-size <n>      Largest address space to "
               << "enumerate (default: 4194304)\n";
  llvm::outs() << "  --default-resource <name>  Resource of memories without "
               << "a hint (default: SRAM)\n";
  llvm::outs() << "  --dump                     Print each instance and its "
               << "ports\n";
  llvm::outs() << "  --debug                    Trace port assignment and "
               << "commit (debug builds)\n";
  llvm::outs() << "  -h, --help                 Show this message\n";
  llvm::outs() << "  --version                  Show version\n";
}

void PrintVersion() {
  llvm::outs() << "membank 0.1 based on LLVM " << LLVM_VERSION_STRING << "\n";
}

ParsedArgs ParseArgs(int argc, char **argv) {
  ParsedArgs parsed;
  bool passthrough_inputs = false;

  for (int i = 1; i < argc; ++i) {
    llvm::StringRef arg(argv[i]);

    if (!passthrough_inputs && arg == "--") {
      passthrough_inputs = true;
      continue;
    }

    if (!passthrough_inputs) {
      if (arg == "-h" || arg == "--help") {
        parsed.show_help = true;
        continue;
      }
      if (arg == "--version") {
        parsed.show_version = true;
        continue;
      }
      if (arg == "--verify") {
        parsed.verify = true;
        continue;
      }
      if (arg == "--dump") {
        parsed.dump = true;
        continue;
      }
      if (arg == "--debug") {
        parsed.debug = true;
        continue;
      }
      if (arg == "--max-verify-size") {
        if (i + 1 >= argc) {
          llvm::errs() << "error: --max-verify-size requires a value\n";
          parsed.had_error = true;
          break;
        }
        llvm::StringRef value(argv[++i]);
        if (value.getAsInteger(10, parsed.max_verify_size) ||
            parsed.max_verify_size == 0) {
          llvm::errs() << "error: invalid --max-verify-size: " << value
                       << "\n";
          parsed.had_error = true;
          break;
        }
        continue;
      }
      if (arg == "--default-resource") {
        if (i + 1 >= argc) {
          llvm::errs() << "error: --default-resource requires a name\n";
          parsed.had_error = true;
          break;
        }
        parsed.default_resource = argv[++i];
        continue;
      }
      if (arg == "-o") {
        if (i + 1 >= argc) {
          llvm::errs() << "error: -o requires a path\n";
          parsed.had_error = true;
          break;
        }
        parsed.output_path = argv[++i];
        continue;
      }
      llvm::StringRef joined = arg;
      if (joined.consume_front("-o") && !joined.empty()) {
        parsed.output_path = joined.str();
        continue;
      }
      if (arg.size() > 1 && arg[0] == '-') {
        llvm::errs() << "error: unknown option: " << arg << "\n";
        parsed.had_error = true;
        break;
      }
    }

    parsed.inputs.emplace_back(arg.str());
  }

  return parsed;
}

} // namespace tool
} // namespace membank
