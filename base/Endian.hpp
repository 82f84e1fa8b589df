#ifndef ENDIAN_H
#define ENDIAN_H

#include <stdint.h>

#include <string>

namespace tsdump {
namespace base {

extern const int MAX_VARINT_LEN_64;
extern const int MAX_VARINT_LEN_32;

int get_uint16_big_endian(const uint8_t *bytes);
void put_uint16_big_endian(uint8_t *bytes, int num);

uint32_t get_uint32_big_endian(const char *bytes);
uint32_t get_uint32_big_endian(const uint8_t *bytes);
void put_uint32_big_endian(uint8_t *bytes, uint32_t num);

uint64_t get_uint64_big_endian(const char *bytes);
uint64_t get_uint64_big_endian(const uint8_t *bytes);
void put_uint64_big_endian(uint8_t *bytes, uint64_t num);

uint64_t encode_double(double value);

double decode_double(uint64_t value);

// Decode an unsigned 64-bit varint from at most `size` bytes.
// On success decoded_bytes is the number of bytes consumed. On a missing
// terminating byte or a value wider than 64 bits decoded_bytes is 0.
uint64_t decode_unsigned_varint(const uint8_t *data, int &decoded_bytes,
                                int size);

int64_t decode_signed_varint(const uint8_t *data, int &decoded_bytes, int size);

// Encode an unsigned 64-bit varint.  Returns number of encoded bytes.
// Buffer's size is at least 10
int encode_unsigned_varint(uint8_t *const buffer, uint64_t value);

// Encode a signed 64-bit varint.  Works by first zig-zag transforming
// signed value into an unsigned value, and then reusing the unsigned
// encoder.
// Buffer's size is at least 10
int encode_signed_varint(uint8_t *const buffer, int64_t value);

// Append helpers over std::string buffers.
void append_unsigned_varint(std::string *dst, uint64_t value);
void append_signed_varint(std::string *dst, int64_t value);
void append_uint32_big_endian(std::string *dst, uint32_t num);
void append_uint64_big_endian(std::string *dst, uint64_t num);

}  // namespace base
}  // namespace tsdump

#endif
