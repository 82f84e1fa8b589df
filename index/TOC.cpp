#include "index/TOC.hpp"

#include "base/Checksum.hpp"
#include "base/Endian.hpp"
#include "tsdbutil/DecBuf.hpp"

namespace tsdump {
namespace index {

const int INDEX_TOC_LEN = 6 * 8 + 4;  // 6 fields + crc32

base::Status toc_from_source(const tsdbutil::RangedByteSource &source,
                             TOC *toc) {
  if (source.len() < static_cast<uint64_t>(INDEX_TOC_LEN)) {
    return base::Status::Corruption(source.name(), "index too short for TOC");
  }
  std::string b;
  base::Status s =
      source.range(source.len() - INDEX_TOC_LEN, source.len(), &b);
  if (!s.ok()) return s;

  const uint8_t *p = reinterpret_cast<const uint8_t *>(b.data());
  uint32_t crc1 = base::get_uint32_big_endian(p + b.size() - 4);
  uint32_t crc2 = base::GetCrc32c(p, b.size() - 4);
  if (crc1 != crc2) {
    return base::Status::Corruption(source.name(), "TOC checksum mismatch");
  }

  tsdbutil::DecBuf dec(p, b.size() - 4);
  toc->symbols = dec.get_BE_uint64();
  toc->series = dec.get_BE_uint64();
  toc->label_indices = dec.get_BE_uint64();
  toc->label_indices_table = dec.get_BE_uint64();
  toc->postings = dec.get_BE_uint64();
  toc->postings_table = dec.get_BE_uint64();
  return base::Status::OK();
}

std::string toc_string(const TOC &toc) {
  std::string s =
      "symbols:" + std::to_string(toc.symbols) +
      " series:" + std::to_string(toc.series) +
      " label_indices:" + std::to_string(toc.label_indices) +
      " label_indices_table:" + std::to_string(toc.label_indices_table) +
      " postings:" + std::to_string(toc.postings) +
      " postings_table:" + std::to_string(toc.postings_table);
  return s;
}

}  // namespace index
}  // namespace tsdump
