#include "chunk/ChunkCodec.hpp"

#include <algorithm>
#include <cstdio>

#include "base/Checksum.hpp"
#include "base/Endian.hpp"
#include "base/Logging.hpp"

namespace tsdump {
namespace chunk {

const int CHUNK_LEN_FIELD_MAX_SIZE = 5;
const int CHUNK_ENCODING_SIZE = 1;
const int CHUNK_CRC_SIZE = 4;

namespace {

std::string at_offset(const tsdbutil::RangedByteSource &source,
                      uint64_t offset) {
  return source.name() + " offset " + std::to_string(offset);
}

std::string hex32(uint32_t v) {
  char buf[16];
  snprintf(buf, sizeof(buf), "%08x", v);
  return std::string(buf);
}

}  // namespace

base::Status ChunkCodec::decode_at(const tsdbutil::RangedByteSource &source,
                                   uint64_t offset, ChunkRecord *record) {
  uint64_t size = source.len();
  if (offset >= size) {
    return base::Status::Corruption(
        at_offset(source, offset),
        "chunk offset beyond end of " + std::to_string(size) + " bytes");
  }

  uint64_t window = std::min<uint64_t>(
      CHUNK_LEN_FIELD_MAX_SIZE + CHUNK_ENCODING_SIZE, size - offset);
  std::string header;
  base::Status s = source.range(offset, offset + window, &header);
  if (!s.ok()) return s;

  int n = 0;
  uint64_t data_len = base::decode_unsigned_varint(
      reinterpret_cast<const uint8_t *>(header.data()), n,
      static_cast<int>(std::min<uint64_t>(window, CHUNK_LEN_FIELD_MAX_SIZE)));
  if (n == 0) {
    return base::Status::Corruption(at_offset(source, offset),
                                    "malformed chunk length");
  }

  // Compare against what is left before computing the total so a huge length
  // cannot overflow.
  uint64_t available = size - offset;
  uint64_t overhead = n + CHUNK_ENCODING_SIZE + CHUNK_CRC_SIZE;
  if (available < overhead || data_len > available - overhead) {
    return base::Status::Corruption(
        at_offset(source, offset),
        "truncated chunk record: need " + std::to_string(data_len) + "+" +
            std::to_string(overhead) + " bytes, " + std::to_string(available) +
            " available");
  }
  uint64_t total = overhead + data_len;

  std::string buf;
  s = source.range(offset, offset + total, &buf);
  if (!s.ok()) return s;

  const uint8_t *p = reinterpret_cast<const uint8_t *>(buf.data());
  uint32_t stored = base::get_uint32_big_endian(p + n + 1 + data_len);
  uint32_t computed = base::GetCrc32c(p + n, 1 + data_len);
  if (stored != computed) {
    LOG_DEBUG << "chunk checksum mismatch at " << at_offset(source, offset);
    return base::Status::Corruption(at_offset(source, offset),
                                    "chunk checksum mismatch: stored " +
                                        hex32(stored) + ", computed " +
                                        hex32(computed));
  }

  record->encoding = p[n];
  record->payload.assign(buf, n + 1, data_len);
  return base::Status::OK();
}

}  // namespace chunk
}  // namespace tsdump
