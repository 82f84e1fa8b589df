#ifndef CHECKSUM_H
#define CHECKSUM_H
#include <stdint.h>

#include <boost/crc.hpp>
#include <string>

namespace tsdump {
namespace base {

// CRC-32C (Castagnoli), reflected, as used by Prometheus chunk records and
// index sections.
typedef boost::crc_optimal<32, 0x1EDC6F41, 0xFFFFFFFF, 0xFFFFFFFF, true, true>
    crc_32c_type;

class CRC32C {
 private:
  crc_32c_type result;

 public:
  CRC32C() {}

  void process_bytes(const std::string &my_string) {
    result.process_bytes(my_string.data(), my_string.length());
  }

  void process_bytes(const uint8_t *my_string, size_t size) {
    result.process_bytes(reinterpret_cast<const void *>(my_string), size);
  }

  void process_bytes(const char *my_string, size_t size) {
    result.process_bytes(reinterpret_cast<const void *>(my_string), size);
  }

  void reset() { result.reset(); }

  uint32_t checksum() const { return result.checksum(); }
};

uint32_t GetCrc32c(const std::string &my_string);

uint32_t GetCrc32c(const uint8_t *my_string, size_t size);
uint32_t GetCrc32c(const char *my_string, size_t size);

}  // namespace base
}  // namespace tsdump

#endif
