#ifndef VICTORIAMETRICSWRITER_H
#define VICTORIAMETRICSWRITER_H

#include <ostream>

#include "writer/SampleSink.hpp"

namespace tsdump {
namespace writer {

// VictoriaMetrics JSON line import format:
//   {"metric":{"__name__":"up","job":"x"},"values":[1.0],"timestamps":[1000]}
// Metric keys are sorted, a repeated label name keeps its last value.
class VictoriaMetricsWriter : public SampleSink {
 private:
  std::ostream *out_;

 public:
  explicit VictoriaMetricsWriter(std::ostream *out) : out_(out) {}

  base::Status write(const label::Labels &lset,
                     const std::vector<int64_t> &timestamps,
                     const std::vector<double> &values) override;
};

}  // namespace writer
}  // namespace tsdump

#endif
