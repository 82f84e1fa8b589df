#include "chunk/XORChunk.hpp"

#include "base/Endian.hpp"

namespace tsdump {
namespace chunk {

XORChunk::XORChunk(const std::string& data) : data_(data) {}

XORChunk::XORChunk(std::string&& data) : data_(std::move(data)) {}

const uint8_t* XORChunk::bytes() {
  return reinterpret_cast<const uint8_t*>(data_.data());
}

uint8_t XORChunk::encoding() { return static_cast<uint8_t>(EncXOR); }

std::unique_ptr<ChunkIteratorInterface> XORChunk::iterator() {
  return std::unique_ptr<ChunkIteratorInterface>(xor_iterator().release());
}

std::unique_ptr<XORIterator> XORChunk::xor_iterator() {
  return std::unique_ptr<XORIterator>(
      new XORIterator(bytes(), static_cast<int>(data_.size())));
}

int XORChunk::num_samples() {
  if (data_.size() < 2) return 0;
  return base::get_uint16_big_endian(bytes());
}

uint64_t XORChunk::size() { return data_.size(); }

}  // namespace chunk
}  // namespace tsdump
