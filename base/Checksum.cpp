#include "base/Checksum.hpp"

namespace tsdump {
namespace base {

uint32_t GetCrc32c(const std::string &my_string) {
  crc_32c_type result;
  result.process_bytes(my_string.data(), my_string.length());
  return result.checksum();
}

uint32_t GetCrc32c(const char *my_string, size_t size) {
  crc_32c_type result;
  result.process_bytes(reinterpret_cast<const void *>(my_string), size);
  return result.checksum();
}

uint32_t GetCrc32c(const uint8_t *my_string, size_t size) {
  crc_32c_type result;
  result.process_bytes(reinterpret_cast<const void *>(my_string), size);
  return result.checksum();
}

}  // namespace base
}  // namespace tsdump
