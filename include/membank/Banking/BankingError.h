//===-- BankingError.h - Banking metadata error codes -----------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Single source of truth for all BANK_ error code symbols, and the
// MetadataError payload carried through llvm::Error / llvm::Expected.
//
// Every failure raised by this library is a compiler-internal invariant
// violation: an earlier pass produced missing or malformed metadata. Callers
// either propagate the llvm::Error or escalate it with cantFailOrDie().
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_BANKING_BANKINGERROR_H
#define MEMBANK_BANKING_BANKINGERROR_H

#include "membank/Banking/Types.h"

#include "llvm/Support/Error.h"

#include <string>

namespace membank {

/// Centralized error code constants.
///
/// Each constant is the `code` of a MetadataError and appears as the
/// bracketed prefix of its message ("[BANK_XXX] ...").
namespace MembankError {

// --- Missing Metadata ---
inline constexpr const char *MISSING_RANK = "BANK_MISSING_RANK";
inline constexpr const char *MISSING_DIMS = "BANK_MISSING_DIMS";
inline constexpr const char *MISSING_DUPLICATES = "BANK_MISSING_DUPLICATES";
inline constexpr const char *MISSING_INSTANCE = "BANK_MISSING_INSTANCE";
inline constexpr const char *MISSING_PADDING = "BANK_MISSING_PADDING";
inline constexpr const char *MISSING_DISPATCH = "BANK_MISSING_DISPATCH";
inline constexpr const char *MISSING_PORTS = "BANK_MISSING_PORTS";
inline constexpr const char *MISSING_ACCESS_DECL = "BANK_MISSING_ACCESS_DECL";
inline constexpr const char *MISSING_SCOPE = "BANK_MISSING_SCOPE";

// --- Analysis Invariants ---
inline constexpr const char *READER_MULTI_DISPATCH =
    "BANK_READER_MULTI_DISPATCH";
inline constexpr const char *WRITER_NO_DISPATCH = "BANK_WRITER_NO_DISPATCH";
inline constexpr const char *DISPATCH_OUT_OF_RANGE =
    "BANK_DISPATCH_OUT_OF_RANGE";
inline constexpr const char *INSTANCE_NOT_UNIQUE = "BANK_INSTANCE_NOT_UNIQUE";
inline constexpr const char *PORT_MISSING = "BANK_PORT_MISSING";
inline constexpr const char *PORT_OFFSET_RANGE = "BANK_PORT_OFFSET_RANGE";
inline constexpr const char *ACCESS_DUPLICATED = "BANK_ACCESS_DUPLICATED";
inline constexpr const char *BANK_CONFLICT = "BANK_CONFLICT";
inline constexpr const char *BANK_SELECT_RANGE = "BANK_SELECT_RANGE";

// --- Malformed Metadata ---
inline constexpr const char *BANKING_INVALID = "BANK_BANKING_INVALID";
inline constexpr const char *ADDRESS_RANK_MISMATCH =
    "BANK_ADDRESS_RANK_MISMATCH";
inline constexpr const char *ACCESS_WIDTH_ZERO = "BANK_ACCESS_WIDTH_ZERO";
inline constexpr const char *ACCESS_MATRIX_SHAPE = "BANK_ACCESS_MATRIX_SHAPE";
inline constexpr const char *ACCESS_DECL_CONFLICT =
    "BANK_ACCESS_DECL_CONFLICT";

// --- Unsupported Configurations ---
inline constexpr const char *UNSUPPORTED_BANKING_SHAPE =
    "BANK_UNSUPPORTED_BANKING_SHAPE";
inline constexpr const char *MULTI_PIPELINE = "BANK_MULTI_PIPELINE";
inline constexpr const char *ADDRESS_SPACE_TOO_LARGE =
    "BANK_ADDRESS_SPACE_TOO_LARGE";

} // namespace MembankError

/// Format a bracketed error prefix: "[BANK_FOO] msg"
inline std::string bankErrMsg(const char *code, llvm::StringRef msg) {
  return (llvm::Twine("[") + code + "] " + msg).str();
}

/// Error payload for every failure in the banking metadata layer.
class MetadataError : public llvm::ErrorInfo<MetadataError> {
public:
  enum class Kind {
    MissingMetadata,          // A required metadata entry is absent
    InvariantViolation,       // Stored metadata contradicts an invariant
    UnsupportedConfiguration, // Well-formed input this library cannot handle
    MalformedMetadata,        // Metadata values out of their valid domain
  };

  static char ID;

  MetadataError(Kind kind, const char *code, SymbolId symbol, std::string msg,
                UnrollId unroll = {});

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

  Kind getKind() const { return kind; }
  const char *getCode() const { return code; }
  SymbolId getSymbol() const { return symbol; }
  llvm::ArrayRef<int64_t> getUnroll() const { return unroll; }
  const std::string &getMessage() const { return msg; }

private:
  Kind kind;
  const char *code;
  SymbolId symbol;
  std::string msg;
  UnrollId unroll;
};

llvm::StringRef toString(MetadataError::Kind kind);

/// Convenience constructors.
llvm::Error missingMetadata(const char *code, SymbolId symbol,
                            const llvm::Twine &msg, UnrollId unroll = {});
llvm::Error invariantViolation(const char *code, SymbolId symbol,
                               const llvm::Twine &msg, UnrollId unroll = {});
llvm::Error unsupportedConfiguration(const char *code, SymbolId symbol,
                                     const llvm::Twine &msg);
llvm::Error malformedMetadata(const char *code, SymbolId symbol,
                              const llvm::Twine &msg);

/// Attach `symbol` to MetadataErrors raised without one.
llvm::Error attachSymbol(llvm::Error err, SymbolId symbol);

/// Consume an error and return its BANK_ code. Returns an empty string for
/// success and "<foreign>" for errors that are not MetadataErrors.
std::string consumeErrorCode(llvm::Error err);

/// Abort compilation with the error's diagnostic context.
[[noreturn]] void reportFatalMetadataError(llvm::Error err);

/// Unwrap an Expected, escalating any error to a fatal compiler error.
template <typename T> T cantFailOrDie(llvm::Expected<T> value) {
  if (!value)
    reportFatalMetadataError(value.takeError());
  return std::move(*value);
}

inline void cantFailOrDie(llvm::Error err) {
  if (err)
    reportFatalMetadataError(std::move(err));
}

} // namespace membank

#endif // MEMBANK_BANKING_BANKINGERROR_H
