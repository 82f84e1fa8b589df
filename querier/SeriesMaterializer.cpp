#include "querier/SeriesMaterializer.hpp"

#include <cmath>
#include <deque>

#include "base/Logging.hpp"
#include "chunk/ChunkUtils.hpp"

namespace tsdump {
namespace querier {

SeriesMaterializer::SeriesMaterializer(block::IndexReaderInterface *ir,
                                       block::ChunkReaderInterface *cr,
                                       const label::Labels &external_labels,
                                       int64_t min_time, int64_t max_time)
    : ir_(ir),
      cr_(cr),
      external_labels_(external_labels),
      min_time_(min_time),
      max_time_(max_time),
      num_chunks_(0),
      num_samples_(0) {}

base::Status SeriesMaterializer::decode(const chunk::ChunkMeta &meta,
                                        ChunkSamples *samples) {
  chunk::ChunkRecord record;
  base::Status s = cr_->chunk(meta.ref, &record);
  if (!s.ok()) return s;
  ++num_chunks_;

  std::unique_ptr<chunk::ChunkInterface> c;
  s = chunk::new_chunk(record, &c);
  if (!s.ok()) return s.Wrap(meta.ref.to_string());

  std::unique_ptr<chunk::ChunkIteratorInterface> it = c->iterator();
  int64_t t;
  double v;
  while (it->next()) {
    it->at(&t, &v);
    if (std::isnan(v) || std::isinf(v)) continue;
    if (t < min_time_ || t > max_time_) continue;
    samples->timestamps.push_back(t);
    samples->values.push_back(v);
  }
  if (it->error()) {
    return base::Status::Corruption(meta.ref.to_string(),
                                    "malformed chunk data");
  }
  return base::Status::OK();
}

base::Status SeriesMaterializer::materialize(
    uint64_t ref, label::Labels *lset, std::vector<ChunkSamples> *chunks) {
  std::deque<chunk::ChunkMeta> metas;
  chunks->clear();
  base::Status s = ir_->series(ref, lset, &metas);
  if (!s.ok()) return s.Wrap("series " + std::to_string(ref));
  lset->insert(lset->end(), external_labels_.begin(), external_labels_.end());

  for (const chunk::ChunkMeta &meta : metas) {
    if (!meta.overlap_closed(min_time_, max_time_)) {
      LOG_TRACE << "skip " << meta.ref.to_string() << " [" << meta.min_time
                << ", " << meta.max_time << "]";
      continue;
    }
    ChunkSamples samples(meta);
    s = decode(meta, &samples);
    if (!s.ok()) {
      chunks->clear();
      return s.Wrap("series " + std::to_string(ref) + " " +
                    label::lbs_string(*lset));
    }
    if (samples.timestamps.empty()) continue;
    num_samples_ += samples.timestamps.size();
    chunks->push_back(std::move(samples));
  }
  return base::Status::OK();
}

base::Status SeriesMaterializer::write_series(uint64_t ref,
                                              writer::SampleSink *sink) {
  label::Labels lset;
  std::vector<ChunkSamples> chunks;
  base::Status s = materialize(ref, &lset, &chunks);
  if (!s.ok()) return s;

  for (const ChunkSamples &c : chunks) {
    s = sink->write(lset, c.timestamps, c.values);
    if (!s.ok()) {
      return s.Wrap("write series " + std::to_string(ref) + " " +
                    label::lbs_string(lset));
    }
  }
  return base::Status::OK();
}

}  // namespace querier
}  // namespace tsdump
