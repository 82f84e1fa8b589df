#ifndef CHUNKINTERFACE_H
#define CHUNKINTERFACE_H

#include <stdint.h>

#include <memory>

#include "chunk/ChunkIteratorInterface.hpp"

namespace tsdump {
namespace chunk {

enum Encoding { EncNone, EncXOR };

// Read-only view of one decoded chunk. Iterators borrow the chunk's bytes and
// must not outlive it.
class ChunkInterface {
 public:
  virtual const uint8_t* bytes() = 0;
  virtual uint8_t encoding() = 0;
  virtual std::unique_ptr<ChunkIteratorInterface> iterator() = 0;
  virtual int num_samples() = 0;
  virtual uint64_t size() = 0;
  virtual ~ChunkInterface() = default;
};

}  // namespace chunk
}  // namespace tsdump

#endif
