#ifndef SAMPLESINK_H
#define SAMPLESINK_H

#include <stdint.h>

#include <vector>

#include "base/Status.hpp"
#include "label/Label.hpp"

namespace tsdump {
namespace writer {

// Destination of dumped samples. write() is called once per (series, chunk)
// with non-empty, equally long timestamps and values.
class SampleSink {
 public:
  virtual base::Status write(const label::Labels &lset,
                             const std::vector<int64_t> &timestamps,
                             const std::vector<double> &values) = 0;
  virtual ~SampleSink() = default;
};

}  // namespace writer
}  // namespace tsdump

#endif
