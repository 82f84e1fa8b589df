#ifndef INDEXREADERINTERFACE_H
#define INDEXREADERINTERFACE_H

#include <stdint.h>

#include <deque>
#include <memory>

#include "base/Status.hpp"
#include "chunk/ChunkMeta.hpp"
#include "index/PostingsInterface.hpp"
#include "label/Label.hpp"

namespace tsdump {
namespace block {

class IndexReaderInterface {
 public:
  // Sorted series references of name=value. A name or value absent from the
  // index gives empty postings, not an error.
  virtual base::Status postings(
      const std::string &name, const std::string &value,
      std::unique_ptr<index::PostingsInterface> *p) = 0;

  // lset and chunks are cleared first.
  virtual base::Status series(uint64_t ref, label::Labels *lset,
                              std::deque<chunk::ChunkMeta> *chunks) = 0;

  // Name/value pair whose postings cover every series.
  virtual label::Label all_postings_key() const = 0;

  // Release underlying handles. Idempotent.
  virtual void close() = 0;

  virtual ~IndexReaderInterface() = default;
};

}  // namespace block
}  // namespace tsdump

#endif
