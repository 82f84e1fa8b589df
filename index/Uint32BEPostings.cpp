#include "index/Uint32BEPostings.hpp"

#include "base/Endian.hpp"

namespace tsdump {
namespace index {

Uint32BEPostings::Uint32BEPostings(std::string &&data)
    : data(std::move(data)), index(-1), cur(0) {
  num = static_cast<uint32_t>(this->data.size() / 4);
}

uint64_t Uint32BEPostings::get(uint32_t i) const {
  return static_cast<uint64_t>(base::get_uint32_big_endian(
      reinterpret_cast<const uint8_t *>(data.data()) + 4 * i));
}

bool Uint32BEPostings::next() const {
  if (index >= static_cast<int64_t>(num)) return false;
  ++index;
  if (index >= static_cast<int64_t>(num)) return false;
  cur = get(static_cast<uint32_t>(index));
  return true;
}

bool Uint32BEPostings::seek(uint64_t v) const {
  if (index >= static_cast<int64_t>(num)) return false;
  if (index < 0 && !next()) return false;
  if (cur >= v) return true;

  // Binary search over the remaining entries.
  uint32_t i = static_cast<uint32_t>(index) + 1;
  uint32_t count = num - i;
  while (count > 0) {
    uint32_t step = count / 2;
    if (get(i + step) < v) {
      i += step + 1;
      count -= step + 1;
    } else {
      count = step;
    }
  }
  index = i;
  if (i >= num) return false;
  cur = get(i);
  return true;
}

uint64_t Uint32BEPostings::at() const { return cur; }

}  // namespace index
}  // namespace tsdump
