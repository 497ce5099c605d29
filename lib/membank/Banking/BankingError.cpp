//===-- BankingError.cpp - Banking metadata error payload -------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Banking/BankingError.h"

#include "llvm/Support/ErrorHandling.h"

namespace membank {

char MetadataError::ID = 0;

MetadataError::MetadataError(Kind kind, const char *code, SymbolId symbol,
                             std::string msg, UnrollId unroll)
    : kind(kind), code(code), symbol(symbol), msg(std::move(msg)),
      unroll(std::move(unroll)) {}

void MetadataError::log(llvm::raw_ostream &os) const {
  os << bankErrMsg(code, (llvm::Twine(toString(kind)) + ": " + msg).str());
  if (symbol != INVALID_SYMBOL)
    os << " (symbol x" << symbol;
  else
    os << " (no symbol";
  if (!unroll.empty()) {
    os << ", unroll ";
    printSeq(os, unroll);
  }
  os << ")";
}

std::error_code MetadataError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

llvm::StringRef toString(MetadataError::Kind kind) {
  switch (kind) {
  case MetadataError::Kind::MissingMetadata:
    return "missing metadata";
  case MetadataError::Kind::InvariantViolation:
    return "analysis invariant violated";
  case MetadataError::Kind::UnsupportedConfiguration:
    return "unsupported configuration";
  case MetadataError::Kind::MalformedMetadata:
    return "malformed metadata";
  }
  llvm_unreachable("unknown MetadataError kind");
}

llvm::Error missingMetadata(const char *code, SymbolId symbol,
                            const llvm::Twine &msg, UnrollId unroll) {
  return llvm::make_error<MetadataError>(MetadataError::Kind::MissingMetadata,
                                         code, symbol, msg.str(),
                                         std::move(unroll));
}

llvm::Error invariantViolation(const char *code, SymbolId symbol,
                               const llvm::Twine &msg, UnrollId unroll) {
  return llvm::make_error<MetadataError>(
      MetadataError::Kind::InvariantViolation, code, symbol, msg.str(),
      std::move(unroll));
}

llvm::Error unsupportedConfiguration(const char *code, SymbolId symbol,
                                     const llvm::Twine &msg) {
  return llvm::make_error<MetadataError>(
      MetadataError::Kind::UnsupportedConfiguration, code, symbol, msg.str());
}

llvm::Error malformedMetadata(const char *code, SymbolId symbol,
                              const llvm::Twine &msg) {
  return llvm::make_error<MetadataError>(
      MetadataError::Kind::MalformedMetadata, code, symbol, msg.str());
}

llvm::Error attachSymbol(llvm::Error err, SymbolId symbol) {
  return llvm::handleErrors(
      std::move(err),
      [&](std::unique_ptr<MetadataError> e) -> llvm::Error {
        if (e->getSymbol() != INVALID_SYMBOL)
          return llvm::Error(std::move(e));
        UnrollId unroll(e->getUnroll().begin(), e->getUnroll().end());
        return llvm::make_error<MetadataError>(e->getKind(), e->getCode(),
                                               symbol, e->getMessage(),
                                               std::move(unroll));
      });
}

std::string consumeErrorCode(llvm::Error err) {
  std::string code;
  llvm::handleAllErrors(
      std::move(err),
      [&](const MetadataError &e) { code = e.getCode(); },
      [&](const llvm::ErrorInfoBase &) { code = "<foreign>"; });
  return code;
}

void reportFatalMetadataError(llvm::Error err) {
  std::string text;
  llvm::raw_string_ostream os(text);
  os << "membank: internal compiler error: ";
  llvm::logAllUnhandledErrors(std::move(err), os);
  os.flush();
  llvm::report_fatal_error(llvm::StringRef(text), /*gen_crash_diag=*/false);
}

} // namespace membank
