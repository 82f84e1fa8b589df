#ifndef LABEL_H
#define LABEL_H

#include <stdint.h>

#include <deque>
#include <initializer_list>
#include <string>
#include <vector>

#include "base/Status.hpp"

namespace tsdump {
namespace label {

// Reserved label name carrying the metric name.
extern const std::string METRIC_NAME;

class Label {
 public:
  std::string label;
  std::string value;

  Label() = default;

  Label(const std::initializer_list<std::string> &l);

  Label(const std::string &label, const std::string &value);

  bool operator<(const Label &l2) const;
  bool operator==(const Label &l2) const;
};

typedef std::deque<Label> Labels;

std::string lbs_string(const Labels &lbs);

// Labels stably sorted by name only; duplicate names keep their relative
// order.
Labels lbs_sorted_by_name(const Labels &lbs);

// Value of the first label called name, empty if absent.
std::string lbs_get(const Labels &lbs, const std::string &name);

Labels lbs_from_string(const std::initializer_list<std::string> &list);

// Parse a JSON object of string values ({"dc":"eu","env":"prod"}) in document
// order. Anything else is InvalidArgument.
base::Status lbs_from_json(const std::string &json, Labels *lbs);

// Split "a, b,,c" into {"a","b","c"}: comma separated, whitespace trimmed,
// empty items dropped.
std::vector<std::string> split_label_values(const std::string &csv);

// Name/value pair addressing the postings list of every series.
extern const Label ALL_POSTINGS_KEYS;

}  // namespace label
}  // namespace tsdump

#endif
