#ifndef CHUNKREADERINTERFACE_H
#define CHUNKREADERINTERFACE_H

#include <stdint.h>

#include "base/Status.hpp"
#include "chunk/ChunkCodec.hpp"
#include "chunk/ChunkRef.hpp"

namespace tsdump {

namespace block {

class ChunkReaderInterface {
 public:
  virtual base::Status chunk(const chunk::ChunkRef &ref,
                             chunk::ChunkRecord *record) = 0;
  // Release underlying handles. Idempotent.
  virtual void close() = 0;
  virtual ~ChunkReaderInterface() = default;
};

}  // namespace block

}  // namespace tsdump

#endif
