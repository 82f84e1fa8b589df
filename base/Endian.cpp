#include "base/Endian.hpp"

#include <string.h>

namespace tsdump {
namespace base {

const int MAX_VARINT_LEN_64 = 10;  // 7 * 9 + 1
const int MAX_VARINT_LEN_32 = 5;

int get_uint16_big_endian(const uint8_t *bytes) {
  return static_cast<int>((static_cast<int>(bytes[0]) << 8) +
                          static_cast<int>(bytes[1]));
}

void put_uint16_big_endian(uint8_t *bytes, int num) {
  bytes[1] = (num & 0xff);
  bytes[0] = ((num >> 8) & 0xff);
}

uint32_t get_uint32_big_endian(const char *bytes) {
  return get_uint32_big_endian(reinterpret_cast<const uint8_t *>(bytes));
}

uint32_t get_uint32_big_endian(const uint8_t *bytes) {
  return (static_cast<uint32_t>(bytes[0]) << 24) |
         (static_cast<uint32_t>(bytes[1]) << 16) |
         (static_cast<uint32_t>(bytes[2]) << 8) |
         static_cast<uint32_t>(bytes[3]);
}

void put_uint32_big_endian(uint8_t *bytes, uint32_t num) {
  bytes[3] = (num & 0xff);
  bytes[2] = ((num >> 8) & 0xff);
  bytes[1] = ((num >> 16) & 0xff);
  bytes[0] = ((num >> 24) & 0xff);
}

uint64_t get_uint64_big_endian(const char *bytes) {
  return get_uint64_big_endian(reinterpret_cast<const uint8_t *>(bytes));
}

uint64_t get_uint64_big_endian(const uint8_t *bytes) {
  return (static_cast<uint64_t>(bytes[0]) << 56) |
         (static_cast<uint64_t>(bytes[1]) << 48) |
         (static_cast<uint64_t>(bytes[2]) << 40) |
         (static_cast<uint64_t>(bytes[3]) << 32) |
         (static_cast<uint64_t>(bytes[4]) << 24) |
         (static_cast<uint64_t>(bytes[5]) << 16) |
         (static_cast<uint64_t>(bytes[6]) << 8) |
         static_cast<uint64_t>(bytes[7]);
}

void put_uint64_big_endian(uint8_t *bytes, uint64_t num) {
  bytes[7] = (num & 0xff);
  bytes[6] = ((num >> 8) & 0xff);
  bytes[5] = ((num >> 16) & 0xff);
  bytes[4] = ((num >> 24) & 0xff);
  bytes[3] = ((num >> 32) & 0xff);
  bytes[2] = ((num >> 40) & 0xff);
  bytes[1] = ((num >> 48) & 0xff);
  bytes[0] = ((num >> 56) & 0xff);
}

uint64_t encode_double(double value) {
  uint64_t i;
  memcpy(&i, &value, sizeof(i));
  return i;
}

double decode_double(uint64_t value) {
  double f;
  memcpy(&f, &value, sizeof(f));
  return f;
}

uint64_t decode_unsigned_varint(const uint8_t *data, int &decoded_bytes,
                                int size) {
  uint64_t decoded_value = 0;
  int shift_amount = 0;
  decoded_bytes = 0;

  for (int i = 0; i < size && i < MAX_VARINT_LEN_64; i++) {
    uint8_t b = data[i];
    if (b < 0x80) {
      // The 10th byte may only carry the top bit of a 64-bit value.
      if (i == MAX_VARINT_LEN_64 - 1 && b > 1) return 0;
      decoded_bytes = i + 1;
      return decoded_value | (static_cast<uint64_t>(b) << shift_amount);
    }
    decoded_value |= static_cast<uint64_t>(b & 0x7F) << shift_amount;
    shift_amount += 7;
  }
  return 0;
}

int64_t decode_signed_varint(const uint8_t *data, int &decoded_bytes,
                             int size) {
  uint64_t unsigned_value = decode_unsigned_varint(data, decoded_bytes, size);
  return static_cast<int64_t>(unsigned_value & 1 ? ~(unsigned_value >> 1)
                                                 : (unsigned_value >> 1));
}

int encode_unsigned_varint(uint8_t *const buffer, uint64_t value) {
  int encoded = 0;

  do {
    uint8_t next_byte = value & 0x7F;
    value >>= 7;

    if (value) next_byte |= 0x80;

    buffer[encoded++] = next_byte;

  } while (value);

  return encoded;
}

int encode_signed_varint(uint8_t *const buffer, int64_t value) {
  uint64_t uvalue = (static_cast<uint64_t>(value) << 1) ^
                    static_cast<uint64_t>(value >> 63);
  return encode_unsigned_varint(buffer, uvalue);
}

void append_unsigned_varint(std::string *dst, uint64_t value) {
  uint8_t buf[MAX_VARINT_LEN_64];
  int n = encode_unsigned_varint(buf, value);
  dst->append(reinterpret_cast<const char *>(buf), n);
}

void append_signed_varint(std::string *dst, int64_t value) {
  uint8_t buf[MAX_VARINT_LEN_64];
  int n = encode_signed_varint(buf, value);
  dst->append(reinterpret_cast<const char *>(buf), n);
}

void append_uint32_big_endian(std::string *dst, uint32_t num) {
  uint8_t buf[4];
  put_uint32_big_endian(buf, num);
  dst->append(reinterpret_cast<const char *>(buf), 4);
}

void append_uint64_big_endian(std::string *dst, uint64_t num) {
  uint8_t buf[8];
  put_uint64_big_endian(buf, num);
  dst->append(reinterpret_cast<const char *>(buf), 8);
}

}  // namespace base
}  // namespace tsdump
