#ifndef CHUNKCODEC_H
#define CHUNKCODEC_H

#include <stdint.h>

#include <string>

#include "base/Status.hpp"
#include "tsdbutil/RangedByteSource.hpp"

namespace tsdump {
namespace chunk {

// One chunk as stored in a segment:
//   [uvarint len(payload)][encoding byte][payload][CRC-32C big-endian]
// The checksum covers the encoding byte and the payload.
struct ChunkRecord {
  uint8_t encoding;
  std::string payload;

  ChunkRecord() : encoding(0) {}
  ChunkRecord(uint8_t encoding, const std::string &payload)
      : encoding(encoding), payload(payload) {}
};

extern const int CHUNK_LEN_FIELD_MAX_SIZE;
extern const int CHUNK_ENCODING_SIZE;
extern const int CHUNK_CRC_SIZE;

class ChunkCodec {
 public:
  // Decode the record starting at offset. The length prefix is read from a
  // small header window first, then exactly one range covering the whole
  // record is fetched. Malformed length, truncation and checksum mismatch are
  // Corruption errors.
  static base::Status decode_at(const tsdbutil::RangedByteSource &source,
                                uint64_t offset, ChunkRecord *record);
};

}  // namespace chunk
}  // namespace tsdump

#endif
