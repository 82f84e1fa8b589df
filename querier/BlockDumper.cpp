#include "querier/BlockDumper.hpp"

#include <deque>

#include "base/Logging.hpp"
#include "querier/PostingsQuery.hpp"
#include "querier/SeriesMaterializer.hpp"

namespace tsdump {
namespace querier {

BlockDumper::BlockDumper(block::IndexReaderInterface *ir,
                         block::ChunkReaderInterface *cr,
                         const DumpOptions &options)
    : ir_(ir), cr_(cr), options_(options) {}

base::Status BlockDumper::dump_samples(writer::SampleSink *sink) {
  PostingsQuery q(ir_, options_.label_key, options_.label_values,
                  options_.metric_name);
  SeriesMaterializer m(ir_, cr_, options_.external_labels,
                       options_.min_timestamp, options_.max_timestamp);
  uint64_t num_series = 0;
  while (q.next()) {
    base::Status s = m.write_series(q.at(), sink);
    if (!s.ok()) return s;
    ++num_series;
  }
  if (!q.status().ok()) return q.status();

  LOG_INFO << "dumped " << num_series << " series, " << m.num_chunks()
           << " chunks, " << m.num_samples() << " samples";
  return base::Status::OK();
}

base::Status BlockDumper::dump_index(writer::IndexJSONWriter *w) {
  PostingsQuery q(ir_, options_.label_key, options_.label_values,
                  options_.metric_name);
  uint64_t num_series = 0;
  label::Labels lset;
  std::deque<chunk::ChunkMeta> chunks;
  while (q.next()) {
    base::Status s = ir_->series(q.at(), &lset, &chunks);
    if (s.ok()) s = w->write(lset, chunks);
    if (!s.ok()) return s.Wrap("series " + std::to_string(q.at()));
    ++num_series;
  }
  if (!q.status().ok()) return q.status();

  LOG_INFO << "dumped index of " << num_series << " series";
  return base::Status::OK();
}

}  // namespace querier
}  // namespace tsdump
