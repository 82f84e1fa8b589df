#ifndef INDEXUTILS_H
#define INDEXUTILS_H

#include <stdint.h>

namespace tsdump {
namespace index {

extern const uint32_t MAGIC_INDEX;
extern const int HEADER_LEN;
extern const uint8_t INDEX_VERSION_V1;
extern const uint8_t INDEX_VERSION_V2;

// Series entries are 16-byte aligned, a series reference is offset / 16.
extern const int SERIES_ALIGNMENT;

}  // namespace index
}  // namespace tsdump

#endif
