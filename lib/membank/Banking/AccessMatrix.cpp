//===-- AccessMatrix.cpp - Unrolled access address records ------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#include "membank/Banking/AccessMatrix.h"
#include "membank/Banking/BankingError.h"

namespace membank {

llvm::Expected<Address>
AccessMatrix::evaluate(llvm::ArrayRef<int64_t> iters) const {
  if (!hasAddress())
    return malformedMetadata(MembankError::ACCESS_MATRIX_SHAPE, access,
                             "access has no address function");

  if (!matrix.empty() && matrix.size() != offset.size())
    return malformedMetadata(MembankError::ACCESS_MATRIX_SHAPE, access,
                             "matrix has " + llvm::Twine(matrix.size()) +
                                 " rows but offset has " +
                                 llvm::Twine(offset.size()) + " entries");

  Address addr(offset.begin(), offset.end());
  for (size_t row = 0; row < matrix.size(); ++row) {
    const auto &coeffs = matrix[row];
    if (coeffs.size() != iters.size())
      return malformedMetadata(MembankError::ACCESS_MATRIX_SHAPE, access,
                               "matrix row " + llvm::Twine(row) + " has " +
                                   llvm::Twine(coeffs.size()) +
                                   " columns but " + llvm::Twine(iters.size()) +
                                   " iterators were given");
    for (size_t col = 0; col < coeffs.size(); ++col)
      addr[row] += coeffs[col] * iters[col];
  }
  return addr;
}

llvm::Error AccessMatrix::verify(unsigned rank) const {
  if (width == 0)
    return malformedMetadata(MembankError::ACCESS_WIDTH_ZERO, access,
                             "access width must be >= 1");
  if (!hasAddress()) {
    if (!matrix.empty())
      return malformedMetadata(MembankError::ACCESS_MATRIX_SHAPE, access,
                               "matrix given without constant offset");
    return llvm::Error::success();
  }
  if (offset.size() != rank)
    return malformedMetadata(MembankError::ACCESS_MATRIX_SHAPE, access,
                             "offset has " + llvm::Twine(offset.size()) +
                                 " entries for a rank " + llvm::Twine(rank) +
                                 " memory");
  if (!matrix.empty() && matrix.size() != rank)
    return malformedMetadata(MembankError::ACCESS_MATRIX_SHAPE, access,
                             "matrix has " + llvm::Twine(matrix.size()) +
                                 " rows for a rank " + llvm::Twine(rank) +
                                 " memory");
  size_t cols = matrix.empty() ? 0 : matrix.front().size();
  for (const auto &row : matrix)
    if (row.size() != cols)
      return malformedMetadata(MembankError::ACCESS_MATRIX_SHAPE, access,
                               "matrix rows have differing column counts");
  return llvm::Error::success();
}

} // namespace membank
