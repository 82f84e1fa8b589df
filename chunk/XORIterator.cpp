#include "chunk/XORIterator.hpp"

#include "base/Endian.hpp"

namespace tsdump {
namespace chunk {

XORIterator::XORIterator(const uint8_t *ptr, int size)
    : bstream(ptr + (size >= 2 ? 2 : size), size >= 2 ? size - 2 : 0),
      timestamp(0),
      value(0),
      delta_timestamp(0),
      leading_zero(0),
      trailing_zero(0),
      num_total(0),
      num_read(0),
      err_(false) {
  if (size < 2)
    err_ = true;
  else
    num_total = base::get_uint16_big_endian(ptr);
}

bool XORIterator::next() const {
  if (err_ || num_read == num_total) return false;

  if (num_read == 0) {
    try {
      timestamp = bstream.read_signed_varint();
      value = base::decode_double(bstream.read_bits(64));
    } catch (const base::TSDBException &e) {
      err_ = true;
      return false;
    }
    ++num_read;
    return true;
  } else if (num_read == 1) {
    try {
      delta_timestamp = bstream.read_unsigned_varint();
    } catch (const base::TSDBException &e) {
      err_ = true;
      return false;
    }
    timestamp = static_cast<int64_t>(static_cast<uint64_t>(timestamp) +
                                     delta_timestamp);
    return read_value();
  }

  // Read timestamp delta-delta
  uint8_t type = 0;
  int64_t delta_delta = 0;
  try {
    for (int i = 0; i < 4; i++) {
      type <<= 1;
      if (!bstream.read_bit()) break;
      type |= 1;
    }

    int size = 0;
    switch (type) {
      case 0x02:
        size = 14;
        break;
      case 0x06:
        size = 17;
        break;
      case 0x0e:
        size = 20;
        break;
      case 0x0f:
        delta_delta = static_cast<int64_t>(bstream.read_bits(64));
        break;
    }
    if (size != 0) {
      delta_delta = static_cast<int64_t>(bstream.read_bits(size));
      if (delta_delta > (1 << (size - 1))) {
        delta_delta -= (1 << size);
      }
    }
  } catch (const base::TSDBException &e) {
    err_ = true;
    return false;
  }

  // Two's complement wrap-around, as the Go decoder does.
  delta_timestamp += static_cast<uint64_t>(delta_delta);
  timestamp = static_cast<int64_t>(static_cast<uint64_t>(timestamp) +
                                   delta_timestamp);
  return read_value();
}

bool XORIterator::read_value() const {
  try {
    if (bstream.read_bit() != ZERO) {
      if (bstream.read_bit() != ZERO) {
        leading_zero = static_cast<uint8_t>(bstream.read_bits(5));
        uint8_t bits = static_cast<uint8_t>(bstream.read_bits(6));
        // 0 significant bits here means we overflowed and we actually need 64
        if (bits == 0) bits = 64;
        if (leading_zero + bits > 64) {
          err_ = true;
          return false;
        }
        trailing_zero = static_cast<uint8_t>(64 - leading_zero - bits);
      }

      uint64_t bits = bstream.read_bits(
          static_cast<int>(64 - leading_zero - trailing_zero));
      uint64_t vbits = base::encode_double(value);
      vbits ^= (bits << trailing_zero);
      value = base::decode_double(vbits);
    }
  } catch (const base::TSDBException &e) {
    err_ = true;
    return false;
  }

  ++num_read;
  return true;
}

}  // namespace chunk
}  // namespace tsdump
