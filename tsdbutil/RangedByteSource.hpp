#ifndef RANGEDBYTESOURCE_H
#define RANGEDBYTESOURCE_H

#include <stdint.h>

#include <string>

#include "base/Status.hpp"

namespace tsdump {
namespace tsdbutil {

// Lazy, range-addressable view over a file or a remote object.
// Every call to range() goes to the backend; nothing is cached.
class RangedByteSource {
 public:
  // Total addressable size, resolved once when the source is opened.
  virtual uint64_t len() const = 0;

  // Fill *result with exactly the bytes in [begin, end).
  // begin > end or end > len() is a Corruption error.
  virtual base::Status range(uint64_t begin, uint64_t end,
                             std::string *result) const = 0;

  // Human readable location used in error messages.
  virtual const std::string &name() const = 0;

  virtual ~RangedByteSource() {}
};

// Shared bounds check for implementations.
base::Status check_range(const RangedByteSource &source, uint64_t begin,
                         uint64_t end);

}  // namespace tsdbutil
}  // namespace tsdump

#endif
