#include "label/Label.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

namespace tsdump {
namespace label {

const std::string METRIC_NAME = "__name__";

const Label ALL_POSTINGS_KEYS = Label("", "");

Label::Label(const std::initializer_list<std::string> &l) {
  if (l.size() == 2) {
    label = *l.begin();
    value = *(l.begin() + 1);
  }
}

Label::Label(const std::string &label, const std::string &value)
    : label(label), value(value) {}

bool Label::operator<(const Label &l2) const {
  int c = label.compare(l2.label);
  if (c != 0) return c < 0;
  return value.compare(l2.value) < 0;
}

bool Label::operator==(const Label &l2) const {
  return label == l2.label && value == l2.value;
}

std::string lbs_string(const Labels &lbs) {
  std::string r = "{";
  for (size_t i = 0; i < lbs.size(); i++) {
    if (i > 0) r += ",";
    r += lbs[i].label + "=\"" + lbs[i].value + "\"";
  }
  r += "}";
  return r;
}

Labels lbs_sorted_by_name(const Labels &lbs) {
  Labels r(lbs);
  std::stable_sort(r.begin(), r.end(), [](const Label &a, const Label &b) {
    return a.label < b.label;
  });
  return r;
}

std::string lbs_get(const Labels &lbs, const std::string &name) {
  for (const Label &l : lbs) {
    if (l.label == name) return l.value;
  }
  return "";
}

Labels lbs_from_string(const std::initializer_list<std::string> &list) {
  Labels r;
  if (list.size() % 2 != 0) return r;
  std::initializer_list<std::string>::iterator it = list.begin();
  while (it != list.end()) {
    r.push_back(Label(*(it), *(it + 1)));
    ++it;
    ++it;
  }
  std::sort(r.begin(), r.end());
  return r;
}

base::Status lbs_from_json(const std::string &json, Labels *lbs) {
  lbs->clear();
  rapidjson::Document d;
  d.Parse(json.c_str(), json.size());
  if (d.HasParseError()) {
    return base::Status::InvalidArgument(
        "cannot parse labels JSON",
        std::string(rapidjson::GetParseError_En(d.GetParseError())) +
            " at offset " + std::to_string(d.GetErrorOffset()));
  }
  if (!d.IsObject()) {
    return base::Status::InvalidArgument("labels JSON must be an object",
                                         json);
  }
  for (auto &item : d.GetObject()) {
    if (!item.value.IsString()) {
      return base::Status::InvalidArgument(
          "label value must be a string",
          std::string(item.name.GetString(), item.name.GetStringLength()));
    }
    lbs->emplace_back(
        std::string(item.name.GetString(), item.name.GetStringLength()),
        std::string(item.value.GetString(), item.value.GetStringLength()));
  }
  return base::Status::OK();
}

std::vector<std::string> split_label_values(const std::string &csv) {
  std::vector<std::string> r;
  boost::char_separator<char> sep(",", "", boost::keep_empty_tokens);
  boost::tokenizer<boost::char_separator<char>> tokens(csv, sep);
  for (const std::string &token : tokens) {
    std::string v = boost::algorithm::trim_copy(token);
    if (!v.empty()) r.push_back(v);
  }
  return r;
}

}  // namespace label
}  // namespace tsdump
