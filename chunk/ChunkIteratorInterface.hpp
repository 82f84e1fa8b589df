#ifndef CHUNKITERATORINTERFACE_H
#define CHUNKITERATORINTERFACE_H

#include <stdint.h>

#include <utility>

namespace tsdump {
namespace chunk {

class ChunkIteratorInterface {
 public:
  virtual std::pair<int64_t, double> at() const = 0;
  virtual void at(int64_t* t, double* v) const = 0;
  virtual bool next() const = 0;
  virtual bool error() const = 0;
  virtual ~ChunkIteratorInterface() = default;
};

}  // namespace chunk
}  // namespace tsdump

#endif
