#ifndef XORCHUNK_H
#define XORCHUNK_H

#include <string>

#include "chunk/ChunkInterface.hpp"
#include "chunk/XORIterator.hpp"

namespace tsdump {
namespace chunk {

class XORChunk : public ChunkInterface {
 private:
  std::string data_;

 public:
  // The first two bytes store the num of samples using big endian
  explicit XORChunk(const std::string& data);
  explicit XORChunk(std::string&& data);

  const uint8_t* bytes();

  uint8_t encoding();

  std::unique_ptr<ChunkIteratorInterface> iterator();

  std::unique_ptr<XORIterator> xor_iterator();

  int num_samples();

  uint64_t size();
};

}  // namespace chunk
}  // namespace tsdump

#endif
