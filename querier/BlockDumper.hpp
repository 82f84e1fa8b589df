#ifndef BLOCKDUMPER_H
#define BLOCKDUMPER_H

#include <stdint.h>

#include <limits>
#include <string>
#include <vector>

#include "block/ChunkReaderInterface.hpp"
#include "block/IndexReaderInterface.hpp"
#include "label/Label.hpp"
#include "writer/IndexJSONWriter.hpp"
#include "writer/SampleSink.hpp"

namespace tsdump {
namespace querier {

class DumpOptions {
 public:
  // Empty key dumps every series.
  std::string label_key;
  std::vector<std::string> label_values;
  // Restricts to __name__=metric_name when not empty.
  std::string metric_name;
  // Appended to every dumped label set.
  label::Labels external_labels;
  int64_t min_timestamp;
  int64_t max_timestamp;

  DumpOptions()
      : min_timestamp(0),
        max_timestamp(std::numeric_limits<int64_t>::max()) {}
};

class BlockDumper {
 private:
  block::IndexReaderInterface *ir_;
  block::ChunkReaderInterface *cr_;
  DumpOptions options_;

 public:
  BlockDumper(block::IndexReaderInterface *ir, block::ChunkReaderInterface *cr,
              const DumpOptions &options);

  // Samples of every matched series, one sink call per non-empty chunk.
  // Stops at the first error.
  base::Status dump_samples(writer::SampleSink *sink);

  // Labels and chunk metadata of every matched series. Chunks are not read
  // and external labels and time bounds do not apply.
  base::Status dump_index(writer::IndexJSONWriter *w);
};

}  // namespace querier
}  // namespace tsdump

#endif
