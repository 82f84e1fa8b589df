#include "writer/IndexJSONWriter.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "writer/Writer.hpp"

namespace tsdump {
namespace writer {

base::Status IndexJSONWriter::write(const label::Labels &lset,
                                    const std::deque<chunk::ChunkMeta> &chunks) {
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> w(buffer);
  w.StartObject();
  w.Key("labels");
  write_label_object(lset, &w);
  w.Key("chunks");
  w.StartArray();
  for (const chunk::ChunkMeta &m : chunks) {
    w.StartObject();
    w.Key("ref");
    w.Uint64(m.ref.value());
    w.Key("minTime");
    w.Int64(m.min_time);
    w.Key("maxTime");
    w.Int64(m.max_time);
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();

  return write_line(out_, buffer.GetString(), buffer.GetSize());
}

}  // namespace writer
}  // namespace tsdump
