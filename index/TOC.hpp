#ifndef INDEX_TOC_H
#define INDEX_TOC_H

#include <stdint.h>

#include <string>

#include "base/Status.hpp"
#include "tsdbutil/RangedByteSource.hpp"

namespace tsdump {
namespace index {

extern const int INDEX_TOC_LEN;  // 6 fields + crc32

class TOC {
 public:
  TOC()
      : symbols(0),
        series(0),
        label_indices(0),
        label_indices_table(0),
        postings(0),
        postings_table(0) {}
  uint64_t symbols;
  uint64_t series;
  uint64_t label_indices;
  uint64_t label_indices_table;
  uint64_t postings;
  uint64_t postings_table;
};

// Read and verify the table of contents at the end of the index.
base::Status toc_from_source(const tsdbutil::RangedByteSource &source,
                             TOC *toc);

std::string toc_string(const TOC &toc);

}  // namespace index
}  // namespace tsdump

#endif
