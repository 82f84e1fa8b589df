#ifndef POSTINGSQUERY_H
#define POSTINGSQUERY_H

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "base/Status.hpp"
#include "block/IndexReaderInterface.hpp"
#include "index/PostingsInterface.hpp"

namespace tsdump {
namespace querier {

// Series references matching label_key=v for each v of label_values in the
// given order, each intersected with __name__=metric_name when a metric name
// is set. A reference matching several values is returned once per value.
// An empty label_key selects every series through the all-postings key.
//
//   PostingsQuery q(ir, "job", {"a", "b"}, "");
//   while (q.next()) use(q.at());
//   if (!q.status().ok()) ...
class PostingsQuery {
 private:
  block::IndexReaderInterface *ir_;
  std::string key_;
  std::vector<std::string> values_;
  std::string metric_name_;

  bool initialized_;
  // Postings of the metric name, expanded once.
  bool restricted_;
  std::deque<uint64_t> restriction_;

  size_t value_index_;
  std::unique_ptr<index::PostingsInterface> cur_;
  uint64_t at_;
  base::Status status_;

  bool init();

 public:
  PostingsQuery(block::IndexReaderInterface *ir, const std::string &label_key,
                const std::vector<std::string> &label_values,
                const std::string &metric_name);

  // False when exhausted or on the first error, see status().
  bool next();

  uint64_t at() const { return at_; }

  const base::Status &status() const { return status_; }
};

}  // namespace querier
}  // namespace tsdump

#endif
