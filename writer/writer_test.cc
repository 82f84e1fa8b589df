#include <rapidjson/document.h>

#include <cstdlib>
#include <limits>
#include <sstream>

#include "gtest/gtest.h"
#include "writer/CSVWriter.hpp"
#include "writer/IndexJSONWriter.hpp"
#include "writer/VictoriaMetricsWriter.hpp"
#include "writer/Writer.hpp"

namespace tsdump {
namespace writer {

class VictoriaMetricsWriterTest : public testing::Test {};

TEST_F(VictoriaMetricsWriterTest, Line) {
  std::ostringstream out;
  VictoriaMetricsWriter w(&out);
  label::Labels lset = {label::Label("job", "node"),
                        label::Label("__name__", "up"),
                        label::Label("env", "dev"),
                        label::Label("env", "prod")};
  ASSERT_TRUE(w.write(lset, {1000, 3000}, {1.5, -2}).ok());
  ASSERT_TRUE(w.write(lset, {4000}, {0.1}).ok());

  std::istringstream in(out.str());
  std::string line;
  ASSERT_TRUE(std::getline(in, line));
  ASSERT_EQ(0u, line.find("{\"metric\":{\"__name__\":\"up\",\"env\":\"prod\","
                          "\"job\":\"node\"},\"values\":["));

  rapidjson::Document d;
  d.Parse(line.c_str());
  ASSERT_FALSE(d.HasParseError());
  ASSERT_EQ(2u, d["values"].Size());
  ASSERT_EQ(1.5, d["values"][0].GetDouble());
  ASSERT_EQ(-2.0, d["values"][1].GetDouble());
  ASSERT_EQ(1000, d["timestamps"][0].GetInt64());
  ASSERT_EQ(3000, d["timestamps"][1].GetInt64());

  ASSERT_TRUE(std::getline(in, line));
  d.Parse(line.c_str());
  ASSERT_EQ(0.1, d["values"][0].GetDouble());
  ASSERT_FALSE(std::getline(in, line));
}

TEST_F(VictoriaMetricsWriterTest, Errors) {
  std::ostringstream out;
  VictoriaMetricsWriter w(&out);
  ASSERT_TRUE(w.write({}, {1, 2}, {1}).IsInvalidArgument());

  out.setstate(std::ios::badbit);
  ASSERT_TRUE(w.write({}, {1}, {1}).IsIOError());
}

class CSVWriterTest : public testing::Test {};

TEST_F(CSVWriterTest, Rows) {
  std::ostringstream out;
  CSVWriter w(&out);
  label::Labels lset = {label::Label("zone", "a,b"),
                        label::Label("__name__", "http_requests"),
                        label::Label("code", "say \"hi\""),
                        label::Label("path", " /x")};
  ASSERT_TRUE(w.write(lset, {1000, 2000}, {1, 0.25}).ok());
  ASSERT_EQ(
      "http_requests,1000,1,\"say \"\"hi\"\"\",\" /x\",\"a,b\"\n"
      "http_requests,2000,0.25,\"say \"\"hi\"\"\",\" /x\",\"a,b\"\n",
      out.str());
}

TEST_F(CSVWriterTest, FormatFloat) {
  ASSERT_EQ("0", format_float(0));
  ASSERT_EQ("1", format_float(1));
  ASSERT_EQ("-2.5", format_float(-2.5));
  ASSERT_EQ("0.1", format_float(0.1));
  ASSERT_EQ("0.0000001", format_float(1e-7));
  ASSERT_EQ("123456789012", format_float(123456789012.0));
  double max = std::numeric_limits<double>::max();
  ASSERT_EQ(max, strtod(format_float(max).c_str(), nullptr));
  double third = 1.0 / 3;
  ASSERT_EQ(third, strtod(format_float(third).c_str(), nullptr));
}

TEST_F(CSVWriterTest, Field) {
  ASSERT_EQ("", csv_field(""));
  ASSERT_EQ("plain", csv_field("plain"));
  ASSERT_EQ("\"a\nb\"", csv_field("a\nb"));
  ASSERT_EQ("\"\\.\"", csv_field("\\."));
}

class IndexJSONWriterTest : public testing::Test {};

TEST_F(IndexJSONWriterTest, Line) {
  std::ostringstream out;
  IndexJSONWriter w(&out);
  std::deque<chunk::ChunkMeta> chunks;
  chunks.emplace_back(chunk::ChunkRef(1, 8), -10, 20);
  chunks.emplace_back(uint64_t(4294967296 + 100), 30, 40);
  ASSERT_TRUE(w.write({label::Label("b", "2"), label::Label("a", "1")}, chunks)
                  .ok());
  ASSERT_EQ(
      "{\"labels\":{\"a\":\"1\",\"b\":\"2\"},\"chunks\":["
      "{\"ref\":4294967304,\"minTime\":-10,\"maxTime\":20},"
      "{\"ref\":4294967396,\"minTime\":30,\"maxTime\":40}]}\n",
      out.str());

  std::ostringstream empty;
  IndexJSONWriter e(&empty);
  ASSERT_TRUE(e.write({}, {}).ok());
  ASSERT_EQ("{\"labels\":{},\"chunks\":[]}\n", empty.str());
}

class NewWriterTest : public testing::Test {};

TEST_F(NewWriterTest, Formats) {
  std::ostringstream out;
  std::unique_ptr<SampleSink> sink;
  ASSERT_TRUE(new_writer("victoriametrics", &out, &sink).ok());
  ASSERT_NE(nullptr, dynamic_cast<VictoriaMetricsWriter *>(sink.get()));
  ASSERT_TRUE(new_writer("csv", &out, &sink).ok());
  ASSERT_NE(nullptr, dynamic_cast<CSVWriter *>(sink.get()));

  base::Status s = new_writer("parquet", &out, &sink);
  ASSERT_TRUE(s.IsConfigurationError());
  ASSERT_NE(std::string::npos, s.ToString().find("parquet"));
}

}  // namespace writer
}  // namespace tsdump

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
