#include "tsdbutil/RangedByteSource.hpp"

namespace tsdump {
namespace tsdbutil {

base::Status check_range(const RangedByteSource &source, uint64_t begin,
                         uint64_t end) {
  if (begin > end || end > source.len()) {
    return base::Status::Corruption(
        source.name(), "range [" + std::to_string(begin) + ", " +
                           std::to_string(end) + ") outside of " +
                           std::to_string(source.len()) + " bytes");
  }
  return base::Status::OK();
}

}  // namespace tsdbutil
}  // namespace tsdump
