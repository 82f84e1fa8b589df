#include "querier/PostingsQuery.hpp"

#include "base/Logging.hpp"
#include "index/IntersectPostings.hpp"
#include "index/ListPostings.hpp"

namespace tsdump {
namespace querier {

PostingsQuery::PostingsQuery(block::IndexReaderInterface *ir,
                             const std::string &label_key,
                             const std::vector<std::string> &label_values,
                             const std::string &metric_name)
    : ir_(ir),
      key_(label_key),
      values_(label_values),
      metric_name_(metric_name),
      initialized_(false),
      restricted_(false),
      value_index_(0),
      at_(0) {
  if (key_.empty()) {
    label::Label all = ir_->all_postings_key();
    key_ = all.label;
    values_.assign(1, all.value);
  }
}

bool PostingsQuery::init() {
  initialized_ = true;
  if (metric_name_.empty()) return true;

  std::unique_ptr<index::PostingsInterface> p;
  status_ = ir_->postings(label::METRIC_NAME, metric_name_, &p);
  if (!status_.ok()) {
    status_ = status_.Wrap("postings " + label::METRIC_NAME + "=" +
                           metric_name_);
    return false;
  }
  restriction_ = index::expand_postings(*p);
  restricted_ = true;
  LOG_DEBUG << "metric " << metric_name_ << " matches "
            << restriction_.size() << " series";
  return true;
}

bool PostingsQuery::next() {
  if (!status_.ok()) return false;
  if (!initialized_ && !init()) return false;

  while (true) {
    if (cur_ && cur_->next()) {
      at_ = cur_->at();
      return true;
    }
    cur_.reset();
    if (value_index_ >= values_.size()) return false;

    const std::string &value = values_[value_index_++];
    std::unique_ptr<index::PostingsInterface> p;
    status_ = ir_->postings(key_, value, &p);
    if (!status_.ok()) {
      status_ = status_.Wrap("postings " + key_ + "=" + value);
      return false;
    }
    if (restricted_) {
      std::vector<std::unique_ptr<index::PostingsInterface>> list;
      list.emplace_back(new index::ListPostings(restriction_));
      list.push_back(std::move(p));
      p = index::intersect(std::move(list));
    }
    cur_ = std::move(p);
  }
}

}  // namespace querier
}  // namespace tsdump
