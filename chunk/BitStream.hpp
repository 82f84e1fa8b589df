#ifndef BASE_BitStream_H
#define BASE_BitStream_H

#include <stdint.h>

#include <vector>

#include "base/TSDBException.hpp"

namespace tsdump {
namespace chunk {

extern const bool ZERO;
extern const bool ONE;

// MSB-first bit stream. Read mode borrows a byte range, write mode owns a
// growing vector. Reading past the end throws base::TSDBException.
class BitStream {
 public:
  std::vector<uint8_t> stream;
  const uint8_t *stream_ptr;
  uint8_t head_count;  // number of unread bits in current byte
  uint8_t tail_count;  // number of written bits in last byte
  bool vector_mode;
  int index;
  int end;

 public:
  // Read mode & pointer_mode
  BitStream(const uint8_t *stream_ptr, int size);

  // Write mode
  BitStream();

  // Write mode, starting with size zero bytes
  explicit BitStream(int size);

  void write_bit(bool bit);
  void write_byte(uint8_t byte);
  void write_bits(uint64_t bits, int num);
  bool read_bit();
  uint8_t read_byte();
  uint64_t read_bits(int num);
  uint64_t read_unsigned_varint();
  int64_t read_signed_varint();

  // Only meaningful in vector mode
  std::vector<uint8_t> *bytes();

  const uint8_t *bytes_ptr() const;

  int size() const;

 private:
  void next_byte();
};

}  // namespace chunk
}  // namespace tsdump

#endif
