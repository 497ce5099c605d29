//===-- Port.h - Buffer port assignment for one access ----------*- C++ -*-===//
//
// Part of the Membank project.
//
//===----------------------------------------------------------------------===//
//
// Port describes where a single unrolled access connects to a banked memory.
//
//            |--------------|--------------|
//            |   Buffer 0   |   Buffer 1   |
//            |--------------|--------------|
//  bufferStage        0              1         None: outside the pipeline
//  muxWidth           3              3         Width of one mux vector
//                  |x x x|        |x x x|
//
//               |x x x|x x|     |x x x|x x x|
//  muxSlot         0    1          0     1     Time-multiplexed vector id
//
//               |( ) O|O O|    |(   )|( ) O|
//  muxOffset     0   2 0 1        0    0  2    Start lane within the vector
//
//===----------------------------------------------------------------------===//

#ifndef MEMBANK_BANKING_PORT_H
#define MEMBANK_BANKING_PORT_H

#include "llvm/Support/raw_ostream.h"

#include <optional>

namespace membank {

struct Port {
  /// N-buffer stage the access connects to. Always 0 for single-buffered
  /// memories; std::nullopt when the access runs outside the pipeline that
  /// rotates the buffers (it then sees a single, unrotated view).
  std::optional<unsigned> bufferStage;
  unsigned muxSlot = 0;
  unsigned muxWidth = 1;
  unsigned muxOffset = 0;
  /// 0 for the lane owner, k for the k-th access reusing the same lane.
  unsigned broadcastFactor = 0;

  bool operator==(const Port &other) const {
    return bufferStage == other.bufferStage && muxSlot == other.muxSlot &&
           muxWidth == other.muxWidth && muxOffset == other.muxOffset &&
           broadcastFactor == other.broadcastFactor;
  }
  bool operator!=(const Port &other) const { return !(*this == other); }
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Port &p) {
  os << "Port(buffer=";
  if (p.bufferStage)
    os << *p.bufferStage;
  else
    os << "M";
  os << ", mux=" << p.muxSlot << ", width=" << p.muxWidth
     << ", ofs=" << p.muxOffset << ", bcast=" << p.broadcastFactor << ")";
  return os;
}

} // namespace membank

#endif // MEMBANK_BANKING_PORT_H
