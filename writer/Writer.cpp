#include "writer/Writer.hpp"

#include <map>

#include "writer/CSVWriter.hpp"
#include "writer/VictoriaMetricsWriter.hpp"

namespace tsdump {
namespace writer {

const std::string FORMAT_VICTORIAMETRICS = "victoriametrics";
const std::string FORMAT_CSV = "csv";

base::Status new_writer(const std::string &format, std::ostream *out,
                        std::unique_ptr<SampleSink> *sink) {
  if (format == FORMAT_VICTORIAMETRICS) {
    sink->reset(new VictoriaMetricsWriter(out));
    return base::Status::OK();
  }
  if (format == FORMAT_CSV) {
    sink->reset(new CSVWriter(out));
    return base::Status::OK();
  }
  return base::Status::InvalidArgument("invalid format", format);
}

void write_label_object(const label::Labels &lset,
                        rapidjson::Writer<rapidjson::StringBuffer> *w) {
  std::map<std::string, std::string> m;
  for (const label::Label &l : lset) m[l.label] = l.value;

  w->StartObject();
  for (const auto &p : m) {
    w->Key(p.first.c_str(), static_cast<rapidjson::SizeType>(p.first.size()));
    w->String(p.second.c_str(),
              static_cast<rapidjson::SizeType>(p.second.size()));
  }
  w->EndObject();
}

base::Status write_bytes(std::ostream *out, const char *data, size_t size) {
  out->write(data, size);
  if (!*out) return base::Status::IOError("write output");
  return base::Status::OK();
}

base::Status write_line(std::ostream *out, const char *data, size_t size) {
  out->write(data, size);
  out->put('\n');
  if (!*out) return base::Status::IOError("write output");
  return base::Status::OK();
}

}  // namespace writer
}  // namespace tsdump
