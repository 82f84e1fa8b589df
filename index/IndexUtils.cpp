#include "index/IndexUtils.hpp"

namespace tsdump {
namespace index {

const uint32_t MAGIC_INDEX = 0xBAAAD700;
const int HEADER_LEN = 5;
const uint8_t INDEX_VERSION_V1 = 1;
const uint8_t INDEX_VERSION_V2 = 2;

const int SERIES_ALIGNMENT = 16;

}  // namespace index
}  // namespace tsdump
