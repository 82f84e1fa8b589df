#ifndef LISTPOSTINGS_H
#define LISTPOSTINGS_H

#include "index/PostingsInterface.hpp"

namespace tsdump {
namespace index {

// Postings over an owned, sorted list.
class ListPostings : public PostingsInterface {
 private:
  std::deque<uint64_t> list;
  mutable int index;

 public:
  ListPostings();
  explicit ListPostings(const std::deque<uint64_t> &list);
  explicit ListPostings(std::deque<uint64_t> &&list);

  bool next() const;

  bool seek(uint64_t v) const;

  uint64_t at() const;
};

}  // namespace index
}  // namespace tsdump

#endif
