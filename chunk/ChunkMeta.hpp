#ifndef CHUNKMETA
#define CHUNKMETA

#include <stdint.h>

#include <limits>

#include "chunk/ChunkRef.hpp"

namespace tsdump {
namespace chunk {

class ChunkMeta {
 public:
  ChunkRef ref;
  int64_t min_time;
  int64_t max_time;

  ChunkMeta()
      : min_time(std::numeric_limits<int64_t>::max()),
        max_time(std::numeric_limits<int64_t>::min()) {}
  ChunkMeta(uint64_t ref, int64_t min_time, int64_t max_time)
      : ref(ref), min_time(min_time), max_time(max_time) {}
  ChunkMeta(const ChunkRef &ref, int64_t min_time, int64_t max_time)
      : ref(ref), min_time(min_time), max_time(max_time) {}

  bool overlap_closed(int64_t min_time, int64_t max_time) const {
    return min_time <= this->max_time && max_time >= this->min_time;
  }
};

}  // namespace chunk
}  // namespace tsdump

#endif
