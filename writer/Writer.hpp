#ifndef WRITER_H
#define WRITER_H

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <memory>
#include <ostream>
#include <string>

#include "base/Status.hpp"
#include "label/Label.hpp"
#include "writer/SampleSink.hpp"

namespace tsdump {
namespace writer {

extern const std::string FORMAT_VICTORIAMETRICS;
extern const std::string FORMAT_CSV;

// Sink for an output format name. Unknown formats are InvalidArgument.
base::Status new_writer(const std::string &format, std::ostream *out,
                        std::unique_ptr<SampleSink> *sink);

// Labels as a JSON object with sorted keys; a repeated name keeps its last
// value.
void write_label_object(const label::Labels &lset,
                        rapidjson::Writer<rapidjson::StringBuffer> *w);

base::Status write_bytes(std::ostream *out, const char *data, size_t size);

// data followed by '\n'.
base::Status write_line(std::ostream *out, const char *data, size_t size);

}  // namespace writer
}  // namespace tsdump

#endif
