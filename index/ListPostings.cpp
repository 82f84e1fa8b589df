#include "index/ListPostings.hpp"

#include <algorithm>

namespace tsdump {
namespace index {

ListPostings::ListPostings() : index(-1) {}
ListPostings::ListPostings(const std::deque<uint64_t> &list)
    : list(list), index(-1) {}
ListPostings::ListPostings(std::deque<uint64_t> &&list)
    : list(std::move(list)), index(-1) {}

bool ListPostings::next() const {
  if (index >= static_cast<int>(list.size())) return false;
  ++index;
  return index < static_cast<int>(list.size());
}

bool ListPostings::seek(uint64_t v) const {
  int size = static_cast<int>(list.size());
  if (size == 0 || index >= size) return false;
  if (index < 0) index = 0;
  if (list[index] >= v) return true;

  auto it = std::lower_bound(list.begin() + index, list.end(), v);
  index = static_cast<int>(it - list.begin());
  return index < size;
}

uint64_t ListPostings::at() const { return list[index]; }

}  // namespace index
}  // namespace tsdump
