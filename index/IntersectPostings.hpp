#ifndef INTERSECTPOSTINGS_H
#define INTERSECTPOSTINGS_H

#include <vector>

#include "index/PostingsInterface.hpp"

namespace tsdump {
namespace index {

class IntersectPostings : public PostingsInterface {
 private:
  std::vector<std::unique_ptr<PostingsInterface>> p_u;

  bool recursive_next(uint64_t max) const;

 public:
  explicit IntersectPostings(
      std::vector<std::unique_ptr<PostingsInterface>> &&p_u);

  bool next() const;

  bool seek(uint64_t v) const;

  uint64_t at() const;
};

// Empty list gives EmptyPostings, a single list is returned as is.
std::unique_ptr<PostingsInterface> intersect(
    std::vector<std::unique_ptr<PostingsInterface>> &&list);

}  // namespace index
}  // namespace tsdump

#endif
