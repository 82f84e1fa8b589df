#ifndef UINT32BEPOSTINGS_H
#define UINT32BEPOSTINGS_H

#include <string>

#include "index/PostingsInterface.hpp"

namespace tsdump {
namespace index {

// Postings stored as consecutive big-endian uint32 series references.
class Uint32BEPostings : public PostingsInterface {
 private:
  std::string data;
  uint32_t num;
  mutable int64_t index;
  mutable uint64_t cur;

  uint64_t get(uint32_t i) const;

 public:
  // data.size() must be a multiple of 4.
  explicit Uint32BEPostings(std::string &&data);

  bool next() const;

  bool seek(uint64_t v) const;

  uint64_t at() const;
};

}  // namespace index
}  // namespace tsdump

#endif
