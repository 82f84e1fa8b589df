#ifndef DECBUF_H
#define DECBUF_H

#include <algorithm>
#include <cstring>
#include <string>

#include "base/Endian.hpp"

namespace tsdump {
namespace tsdbutil {

const uint8_t NO_ERR = 0;
const uint8_t ERR_INVALID_SIZE = 1;
const uint8_t ERR_INVALID_VARINT = 2;

// Bounded decoder over a byte buffer. The first failure sticks: later calls
// return zero values and leave err untouched.
class DecBuf {
 public:
  const uint8_t *b;
  uint64_t size;
  uint64_t index;
  uint8_t err;

  DecBuf(const uint8_t *b, uint64_t size)
      : b(b), size(size), index(0), err(NO_ERR) {}
  explicit DecBuf(const std::string &s)
      : b(reinterpret_cast<const uint8_t *>(s.data())),
        size(s.size()),
        index(0),
        err(NO_ERR) {}

  uint8_t error() const { return err; }

  std::string error_str() const {
    switch (err) {
      case ERR_INVALID_SIZE:
        return "invalid size";
      case ERR_INVALID_VARINT:
        return "invalid varint";
      default:
        return "no error";
    }
  }

  uint64_t len() const { return size - index; }

  uint8_t get_byte() {
    if (err != NO_ERR) return 0;
    if (size - index < 1) {
      err = ERR_INVALID_SIZE;
      return 0;
    }
    return b[index++];
  }

  uint32_t get_BE_uint32() {
    if (err != NO_ERR) return 0;
    if (size - index < 4) {
      err = ERR_INVALID_SIZE;
      return 0;
    }
    uint32_t r = base::get_uint32_big_endian(b + index);
    index += 4;
    return r;
  }

  uint64_t get_BE_uint64() {
    if (err != NO_ERR) return 0;
    if (size - index < 8) {
      err = ERR_INVALID_SIZE;
      return 0;
    }
    uint64_t r = base::get_uint64_big_endian(b + index);
    index += 8;
    return r;
  }

  uint64_t get_unsigned_variant() {
    if (err != NO_ERR) return 0;
    if (index >= size) {
      err = ERR_INVALID_SIZE;
      return 0;
    }
    int decoded = 0;
    uint64_t r = base::decode_unsigned_varint(b + index, decoded,
                                              static_cast<int>(std::min<uint64_t>(
                                                  size - index, 16)));
    if (decoded == 0) {
      err = ERR_INVALID_VARINT;
      return 0;
    }
    index += decoded;
    return r;
  }

  int64_t get_signed_variant() {
    if (err != NO_ERR) return 0;
    if (index >= size) {
      err = ERR_INVALID_SIZE;
      return 0;
    }
    int decoded = 0;
    int64_t r = base::decode_signed_varint(
        b + index, decoded,
        static_cast<int>(std::min<uint64_t>(size - index, 16)));
    if (decoded == 0) {
      err = ERR_INVALID_VARINT;
      return 0;
    }
    index += decoded;
    return r;
  }

  std::string get_uvariant_string() {
    uint64_t len = get_unsigned_variant();
    if (err != NO_ERR) return "";
    if (size - index < len) {
      err = ERR_INVALID_SIZE;
      return "";
    }
    std::string r(reinterpret_cast<const char *>(b + index), len);
    index += len;

    return r;
  }
};

}  // namespace tsdbutil
}  // namespace tsdump

#endif
