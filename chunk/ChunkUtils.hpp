#ifndef CHUNKUTILS_H
#define CHUNKUTILS_H

#include <memory>
#include <string>

#include "base/Status.hpp"
#include "chunk/ChunkCodec.hpp"
#include "chunk/ChunkInterface.hpp"

namespace tsdump {
namespace chunk {

extern const uint32_t MAGIC_CHUNK;
extern const uint8_t CHUNK_FORMAT_V1;
extern const int SEGMENT_HEADER_SIZE;
extern const std::string CHUNKS_DIR_NAME;

// File name of segment n inside the chunks directory: n zero-padded to six
// digits.
std::string segment_file_name(uint32_t segment);

// Validate the 8-byte segment header: magic, version, padding.
base::Status check_segment_header(const tsdbutil::RangedByteSource &source);

// Decompressor for a decoded record. Unknown encodings are NotSupported.
base::Status new_chunk(const ChunkRecord &record,
                       std::unique_ptr<ChunkInterface> *chunk);

}  // namespace chunk
}  // namespace tsdump

#endif
