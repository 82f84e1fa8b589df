#ifndef XORIterator_H
#define XORIterator_H

#include "chunk/BitStream.hpp"
#include "chunk/ChunkIteratorInterface.hpp"

namespace tsdump {
namespace chunk {

// Decodes the Gorilla style XOR encoding: a 2-byte big-endian sample count
// followed by the bit stream.
class XORIterator : public ChunkIteratorInterface {
 public:
  mutable BitStream bstream;
  mutable int64_t timestamp;  // Millisecond
  mutable double value;
  mutable uint64_t delta_timestamp;
  mutable uint8_t leading_zero;
  mutable uint8_t trailing_zero;
  mutable uint16_t num_total;
  mutable uint16_t num_read;
  mutable bool err_;

 public:
  // ptr points at the sample count header.
  XORIterator(const uint8_t* ptr, int size);

  std::pair<int64_t, double> at() const {
    return std::make_pair(timestamp, value);
  }
  void at(int64_t* t, double* v) const {
    *t = timestamp;
    *v = value;
  }

  bool next() const;

  bool error() const { return err_; }

 private:
  bool read_value() const;
};

}  // namespace chunk
}  // namespace tsdump

#endif
