#include "writer/VictoriaMetricsWriter.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "writer/Writer.hpp"

namespace tsdump {
namespace writer {

base::Status VictoriaMetricsWriter::write(
    const label::Labels &lset, const std::vector<int64_t> &timestamps,
    const std::vector<double> &values) {
  if (timestamps.size() != values.size()) {
    return base::Status::InvalidArgument(
        "timestamps and values differ in length",
        std::to_string(timestamps.size()) + " != " +
            std::to_string(values.size()));
  }

  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> w(buffer);
  w.StartObject();
  w.Key("metric");
  write_label_object(lset, &w);
  w.Key("values");
  w.StartArray();
  for (double v : values) {
    if (!w.Double(v)) {
      return base::Status::InvalidArgument("value not representable in JSON",
                                           label::lbs_string(lset));
    }
  }
  w.EndArray();
  w.Key("timestamps");
  w.StartArray();
  for (int64_t t : timestamps) w.Int64(t);
  w.EndArray();
  w.EndObject();

  return write_line(out_, buffer.GetString(), buffer.GetSize());
}

}  // namespace writer
}  // namespace tsdump
