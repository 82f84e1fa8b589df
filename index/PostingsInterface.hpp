#ifndef POSTINGSINTERFACE_H
#define POSTINGSINTERFACE_H

#include <stdint.h>

#include <deque>
#include <memory>

namespace tsdump {
namespace index {

// Sorted postings
class PostingsInterface {
 public:
  virtual bool next() const = 0;
  // Advance to the first element >= v. Does not move backwards.
  virtual bool seek(uint64_t v) const = 0;
  virtual uint64_t at() const = 0;
  virtual ~PostingsInterface() {}
};

inline std::deque<uint64_t> expand_postings(const PostingsInterface &p) {
  std::deque<uint64_t> d;
  while (p.next()) d.push_back(p.at());
  return d;
}

}  // namespace index
}  // namespace tsdump

#endif
