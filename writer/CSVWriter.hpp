#ifndef CSVWRITER_H
#define CSVWRITER_H

#include <ostream>
#include <string>

#include "writer/SampleSink.hpp"

namespace tsdump {
namespace writer {

// One row per sample: metric name, timestamp, value, then the values of the
// other labels ordered by label name. Fields are quoted as in RFC 4180.
class CSVWriter : public SampleSink {
 private:
  std::ostream *out_;

 public:
  explicit CSVWriter(std::ostream *out) : out_(out) {}

  base::Status write(const label::Labels &lset,
                     const std::vector<int64_t> &timestamps,
                     const std::vector<double> &values) override;
};

// Shortest fixed-point representation that parses back to v, e.g. 0.1, 1,
// 1e-07 as 0.0000001.
std::string format_float(double v);

// Field quoted if it contains a comma, a quote or a line break, or starts
// with a space.
std::string csv_field(const std::string &field);

}  // namespace writer
}  // namespace tsdump

#endif
