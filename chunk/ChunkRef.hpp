#ifndef CHUNKREF_H
#define CHUNKREF_H

#include <stdint.h>

#include <boost/operators.hpp>
#include <string>

namespace tsdump {
namespace chunk {

// Reference of a chunk inside a block: segment number in the high 32 bits,
// byte offset of the record inside that segment in the low 32 bits.
class ChunkRef : boost::equality_comparable<ChunkRef> {
 private:
  uint64_t ref_;

 public:
  ChunkRef() : ref_(0) {}
  explicit ChunkRef(uint64_t ref) : ref_(ref) {}
  ChunkRef(uint32_t segment, uint32_t offset)
      : ref_((static_cast<uint64_t>(segment) << 32) | offset) {}

  uint32_t segment() const { return static_cast<uint32_t>(ref_ >> 32); }
  uint32_t offset() const { return static_cast<uint32_t>(ref_ & 0xffffffff); }
  uint64_t value() const { return ref_; }

  std::string to_string() const {
    return "chunk " + std::to_string(ref_) + " (segment " +
           std::to_string(segment()) + ", offset " + std::to_string(offset()) +
           ")";
  }

  bool operator==(const ChunkRef &other) const { return ref_ == other.ref_; }
};

}  // namespace chunk
}  // namespace tsdump

#endif
