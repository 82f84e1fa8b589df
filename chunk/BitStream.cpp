#include "chunk/BitStream.hpp"

#include <algorithm>

#include "base/Endian.hpp"

namespace tsdump {
namespace chunk {

const bool ZERO = false;
const bool ONE = true;

// Read mode & pointer_mode
BitStream::BitStream(const uint8_t *stream_ptr, int size)
    : stream_ptr(stream_ptr),
      head_count(size >= 1 ? 8 : 0),
      tail_count(0),
      vector_mode(false),
      index(0),
      end(size) {}

// Write mode
BitStream::BitStream()
    : stream_ptr(nullptr),
      head_count(0),
      tail_count(0),
      vector_mode(true),
      index(0),
      end(0) {}

// Write mode
BitStream::BitStream(int size)
    : stream(size, 0),
      stream_ptr(nullptr),
      head_count(0),
      tail_count(0),
      vector_mode(true),
      index(0),
      end(size) {}

void BitStream::write_bit(bool bit) {
  if (tail_count == 0) {
    stream.push_back(0);
    ++end;
  }
  ++tail_count;
  if (bit) stream.back() |= (1 << (8 - tail_count));
  tail_count &= 0x07;
}

void BitStream::write_byte(uint8_t byte) {
  if (tail_count == 0) {
    stream.push_back(0);
    ++end;
  }
  stream.back() |= (byte >> tail_count);
  if (tail_count != 0) {
    stream.push_back((byte << (8 - tail_count)) & 0xff);
    ++end;
  }
}

void BitStream::write_bits(uint64_t bits, int num) {
  if (num == 0) return;
  bits <<= (64 - num);
  while (num >= 8) {
    write_byte(static_cast<uint8_t>(0xff & (bits >> 56)));
    num -= 8;
    bits <<= 8;
  }
  while (num > 0) {
    write_bit((bits >> 63) == 1);
    bits <<= 1;
    --num;
  }
}

void BitStream::next_byte() {
  if (head_count == 0) {
    // all bits in current byte are consumed
    ++index;
    head_count = 8;
  }
  if (index >= end) {
    throw base::TSDBException("bitstream EOF");
  }
}

bool BitStream::read_bit() {
  next_byte();
  --head_count;
  return ((bytes_ptr()[index] >> head_count) & 0x01) == 0x01;
}

uint8_t BitStream::read_byte() { return static_cast<uint8_t>(read_bits(8)); }

uint64_t BitStream::read_bits(int num) {
  uint64_t result = 0;
  const uint8_t *ptr = bytes_ptr();
  while (num > 0) {
    next_byte();
    int take = std::min(num, static_cast<int>(head_count));
    uint64_t bits = (ptr[index] >> (head_count - take)) & ((1u << take) - 1);
    result = (result << take) | bits;
    head_count -= take;
    num -= take;
  }
  return result;
}

uint64_t BitStream::read_unsigned_varint() {
  uint64_t decoded_value = 0;
  int shift_amount = 0;
  uint8_t current = 0;

  for (int i = 0; i < base::MAX_VARINT_LEN_64; i++) {
    current = read_byte();
    if (i == base::MAX_VARINT_LEN_64 - 1 && current > 1) {
      throw base::TSDBException("bitstream varint overflows 64 bits");
    }
    decoded_value |= static_cast<uint64_t>(current & 0x7F) << shift_amount;
    if ((current & 0x80) == 0) return decoded_value;
    shift_amount += 7;
  }
  throw base::TSDBException("bitstream varint overflows 64 bits");
}

int64_t BitStream::read_signed_varint() {
  uint64_t unsigned_value = read_unsigned_varint();
  return static_cast<int64_t>(unsigned_value & 1 ? ~(unsigned_value >> 1)
                                                 : (unsigned_value >> 1));
}

std::vector<uint8_t> *BitStream::bytes() { return &stream; }

const uint8_t *BitStream::bytes_ptr() const {
  return vector_mode ? stream.data() : stream_ptr;
}

int BitStream::size() const { return end; }

}  // namespace chunk
}  // namespace tsdump
