#ifndef INDEXJSONWRITER_H
#define INDEXJSONWRITER_H

#include <deque>
#include <ostream>

#include "base/Status.hpp"
#include "chunk/ChunkMeta.hpp"
#include "label/Label.hpp"

namespace tsdump {
namespace writer {

// One JSON line per series:
//   {"labels":{...},"chunks":[{"ref":R,"minTime":A,"maxTime":B},...]}
class IndexJSONWriter {
 private:
  std::ostream *out_;

 public:
  explicit IndexJSONWriter(std::ostream *out) : out_(out) {}

  base::Status write(const label::Labels &lset,
                     const std::deque<chunk::ChunkMeta> &chunks);
};

}  // namespace writer
}  // namespace tsdump

#endif
