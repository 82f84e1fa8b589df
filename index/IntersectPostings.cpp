#include "index/IntersectPostings.hpp"

#include "index/EmptyPostings.hpp"

namespace tsdump {
namespace index {

IntersectPostings::IntersectPostings(
    std::vector<std::unique_ptr<PostingsInterface>> &&p_u)
    : p_u(std::move(p_u)) {}

bool IntersectPostings::recursive_next(uint64_t max) const {
  while (true) {
    bool find = true;
    for (auto &ptr : p_u) {
      if (!ptr->seek(max)) return false;
      if (ptr->at() > max) {
        max = ptr->at();
        find = false;
      }
    }
    if (find) return true;
  }
}

bool IntersectPostings::next() const {
  uint64_t max = 0;
  for (auto &ptr : p_u) {
    if (!ptr->next()) return false;
    if (ptr->at() > max) max = ptr->at();
  }
  return recursive_next(max);
}

bool IntersectPostings::seek(uint64_t v) const {
  uint64_t max = 0;
  for (auto &ptr : p_u) {
    if (!ptr->seek(v)) return false;
    if (ptr->at() > max) max = ptr->at();
  }
  return recursive_next(max);
}

uint64_t IntersectPostings::at() const { return p_u[0]->at(); }

std::unique_ptr<PostingsInterface> intersect(
    std::vector<std::unique_ptr<PostingsInterface>> &&list) {
  if (list.size() == 0)
    return std::unique_ptr<PostingsInterface>(new EmptyPostings());
  else if (list.size() == 1)
    return std::move(list.front());
  return std::unique_ptr<PostingsInterface>(
      new IntersectPostings(std::move(list)));
}

}  // namespace index
}  // namespace tsdump
