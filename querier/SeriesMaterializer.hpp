#ifndef SERIESMATERIALIZER_H
#define SERIESMATERIALIZER_H

#include <stdint.h>

#include <vector>

#include "block/ChunkReaderInterface.hpp"
#include "block/IndexReaderInterface.hpp"
#include "chunk/ChunkMeta.hpp"
#include "label/Label.hpp"
#include "writer/SampleSink.hpp"

namespace tsdump {
namespace querier {

// Filtered samples of one chunk of a series.
class ChunkSamples {
 public:
  chunk::ChunkMeta meta;
  std::vector<int64_t> timestamps;
  std::vector<double> values;

  ChunkSamples() = default;
  explicit ChunkSamples(const chunk::ChunkMeta &meta) : meta(meta) {}
};

class SeriesMaterializer {
 private:
  block::IndexReaderInterface *ir_;
  block::ChunkReaderInterface *cr_;
  label::Labels external_labels_;
  int64_t min_time_;
  int64_t max_time_;

  uint64_t num_chunks_;
  uint64_t num_samples_;

  base::Status decode(const chunk::ChunkMeta &meta, ChunkSamples *samples);

 public:
  // Samples are kept when min_time <= t <= max_time and the value is finite.
  SeriesMaterializer(block::IndexReaderInterface *ir,
                     block::ChunkReaderInterface *cr,
                     const label::Labels &external_labels, int64_t min_time,
                     int64_t max_time);

  // Labels of the series followed by the external labels, as is, and every
  // chunk left non-empty after filtering. Chunks whose bounds miss the time
  // range are not fetched. Any chunk error fails the whole series.
  base::Status materialize(uint64_t ref, label::Labels *lset,
                           std::vector<ChunkSamples> *chunks);

  // materialize() then one sink call per chunk.
  base::Status write_series(uint64_t ref, writer::SampleSink *sink);

  // Chunks fetched and samples kept so far.
  uint64_t num_chunks() const { return num_chunks_; }
  uint64_t num_samples() const { return num_samples_; }
};

}  // namespace querier
}  // namespace tsdump

#endif
