#include "chunk/ChunkUtils.hpp"

#include <boost/format.hpp>

#include "base/Endian.hpp"
#include "chunk/XORChunk.hpp"

namespace tsdump {
namespace chunk {

const uint32_t MAGIC_CHUNK = 0x85BD40DD;
const uint8_t CHUNK_FORMAT_V1 = 1;
const int SEGMENT_HEADER_SIZE = 8;
const std::string CHUNKS_DIR_NAME = "chunks";

std::string segment_file_name(uint32_t segment) {
  boost::format fmt("%06d");
  fmt % segment;
  return fmt.str();
}

base::Status check_segment_header(const tsdbutil::RangedByteSource &source) {
  if (source.len() < static_cast<uint64_t>(SEGMENT_HEADER_SIZE)) {
    return base::Status::Corruption(source.name(),
                                    "segment shorter than its header");
  }
  std::string header;
  base::Status s = source.range(0, SEGMENT_HEADER_SIZE, &header);
  if (!s.ok()) return s;
  const uint8_t *p = reinterpret_cast<const uint8_t *>(header.data());
  if (base::get_uint32_big_endian(p) != MAGIC_CHUNK) {
    return base::Status::Corruption(source.name(), "invalid segment magic");
  }
  if (p[4] != CHUNK_FORMAT_V1) {
    return base::Status::NotSupported(
        source.name(), "segment format " + std::to_string(p[4]));
  }
  return base::Status::OK();
}

base::Status new_chunk(const ChunkRecord &record,
                       std::unique_ptr<ChunkInterface> *chunk) {
  chunk->reset();
  switch (record.encoding) {
    case EncXOR:
      chunk->reset(new XORChunk(record.payload));
      return base::Status::OK();
    default:
      return base::Status::NotSupported(
          "chunk encoding " + std::to_string(record.encoding));
  }
}

}  // namespace chunk
}  // namespace tsdump
