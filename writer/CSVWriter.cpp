#include "writer/CSVWriter.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "writer/Writer.hpp"

namespace tsdump {
namespace writer {

std::string format_float(double v) {
  if (std::isnan(v)) return "NaN";
  if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";

  // 1074 digits after the point represent every double exactly.
  std::string s;
  for (int prec = 0; prec <= 1074; ++prec) {
    int n = snprintf(nullptr, 0, "%.*f", prec, v);
    s.resize(n + 1);
    snprintf(&s[0], s.size(), "%.*f", prec, v);
    s.resize(n);
    if (strtod(s.c_str(), nullptr) == v) break;
  }
  return s;
}

std::string csv_field(const std::string &field) {
  bool quote = field == "\\." ||
               field.find_first_of(",\"\r\n") != std::string::npos ||
               (!field.empty() && (field[0] == ' ' || field[0] == '\t'));
  if (!quote) return field;

  std::string r;
  r.reserve(field.size() + 2);
  r.push_back('"');
  for (char c : field) {
    if (c == '"') r.push_back('"');
    r.push_back(c);
  }
  r.push_back('"');
  return r;
}

base::Status CSVWriter::write(const label::Labels &lset,
                              const std::vector<int64_t> &timestamps,
                              const std::vector<double> &values) {
  if (timestamps.size() != values.size()) {
    return base::Status::InvalidArgument(
        "timestamps and values differ in length",
        std::to_string(timestamps.size()) + " != " +
            std::to_string(values.size()));
  }

  std::string name;
  label::Labels other;
  for (const label::Label &l : lset) {
    if (l.label == label::METRIC_NAME) {
      name = l.value;
      continue;
    }
    other.push_back(l);
  }
  other = label::lbs_sorted_by_name(other);

  std::string suffix;
  for (const label::Label &l : other) {
    suffix.push_back(',');
    suffix.append(csv_field(l.value));
  }

  std::string rows;
  for (size_t i = 0; i < timestamps.size(); ++i) {
    rows.append(csv_field(name));
    rows.push_back(',');
    rows.append(std::to_string(timestamps[i]));
    rows.push_back(',');
    rows.append(format_float(values[i]));
    rows.append(suffix);
    rows.push_back('\n');
  }
  return write_bytes(out_, rows.data(), rows.size());
}

}  // namespace writer
}  // namespace tsdump
