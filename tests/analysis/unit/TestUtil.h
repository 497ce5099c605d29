//===-- TestUtil.h - Analysis unit test utilities ---------------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_TEST_ANALYSIS_TESTUTIL_H
#define MEMBANK_TEST_ANALYSIS_TESTUTIL_H

#include <cstdio>
#include <cstdlib>

#define TEST_ASSERT(cond)                                                      \
  do {                                                                         \
    if (!(cond)) {                                                             \
      fprintf(stderr, "FAIL: %s:%d: %s\n", __FILE__, __LINE__, #cond);        \
      return 1;                                                                \
    }                                                                          \
  } while (0)

#endif // MEMBANK_TEST_ANALYSIS_TESTUTIL_H
