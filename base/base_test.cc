#include <limits>
#include <string>

#include "base/Checksum.hpp"
#include "base/Endian.hpp"
#include "base/Logging.hpp"
#include "base/Status.hpp"
#include "gtest/gtest.h"

namespace tsdump {
namespace base {

class ChecksumTest : public testing::Test {};

TEST_F(ChecksumTest, Castagnoli) {
  ASSERT_EQ(0xE3069283u, GetCrc32c(std::string("123456789")));
  ASSERT_EQ(0u, GetCrc32c(std::string()));

  CRC32C crc;
  crc.process_bytes(std::string("1234"));
  crc.process_bytes(std::string("56789"));
  ASSERT_EQ(0xE3069283u, crc.checksum());
}

class EndianTest : public testing::Test {};

TEST_F(EndianTest, BigEndian) {
  std::string s;
  append_uint32_big_endian(&s, 0x85BD40DD);
  ASSERT_EQ(std::string("\x85\xbd\x40\xdd", 4), s);
  ASSERT_EQ(0x85BD40DDu,
            get_uint32_big_endian(reinterpret_cast<const uint8_t *>(s.data())));

  s.clear();
  append_uint64_big_endian(&s, 0x0102030405060708ull);
  ASSERT_EQ(0x0102030405060708ull, get_uint64_big_endian(s.data()));
}

TEST_F(EndianTest, Varint) {
  uint8_t buf[10];
  int decoded = 0;

  ASSERT_EQ(1, encode_unsigned_varint(buf, 127));
  ASSERT_EQ(2, encode_unsigned_varint(buf, 128));
  ASSERT_EQ(128u, decode_unsigned_varint(buf, decoded, 10));
  ASSERT_EQ(2, decoded);

  ASSERT_EQ(10, encode_unsigned_varint(buf, std::numeric_limits<uint64_t>::max()));
  ASSERT_EQ(std::numeric_limits<uint64_t>::max(),
            decode_unsigned_varint(buf, decoded, 10));
  ASSERT_EQ(10, decoded);

  int n = encode_signed_varint(buf, -1);
  ASSERT_EQ(1, n);
  ASSERT_EQ(1, buf[0]);
  ASSERT_EQ(-1, decode_signed_varint(buf, decoded, n));

  n = encode_signed_varint(buf, std::numeric_limits<int64_t>::min());
  ASSERT_EQ(std::numeric_limits<int64_t>::min(),
            decode_signed_varint(buf, decoded, n));
}

TEST_F(EndianTest, MalformedVarint) {
  // No terminating byte inside the window.
  uint8_t buf[5] = {0x80, 0x80, 0x80, 0x80, 0x80};
  int decoded = 7;
  decode_unsigned_varint(buf, decoded, 5);
  ASSERT_EQ(0, decoded);

  decoded = 7;
  decode_unsigned_varint(buf, decoded, 0);
  ASSERT_EQ(0, decoded);
}

class StatusTest : public testing::Test {};

TEST_F(StatusTest, Taxonomy) {
  ASSERT_TRUE(Status::OK().ok());
  ASSERT_EQ("OK", Status::OK().ToString());

  ASSERT_TRUE(Status::InvalidArgument("x").IsConfigurationError());
  ASSERT_TRUE(Status::IOError("x").IsTransportError());
  ASSERT_TRUE(Status::NotFound("x").IsTransportError());
  ASSERT_TRUE(Status::TimedOut("x").IsTimeoutError());
  ASSERT_FALSE(Status::TimedOut("x").IsTransportError());
  ASSERT_TRUE(Status::Corruption("x").IsFormatError());
  ASSERT_TRUE(Status::NotSupported("x").IsFormatError());
}

TEST_F(StatusTest, Wrap) {
  Status s = Status::Corruption("segment 0", "bad magic");
  ASSERT_EQ("Corruption: segment 0: bad magic", s.ToString());

  Status w = s.Wrap("series 3");
  ASSERT_TRUE(w.IsCorruption());
  ASSERT_EQ("series 3: segment 0: bad magic", w.message());
  ASSERT_TRUE(Status::OK().Wrap("series 3").ok());

  Status copy = w;
  ASSERT_EQ(w.ToString(), copy.ToString());
}

std::string g_log;

void capture(const char *msg, int len) { g_log.append(msg, len); }

class LoggingTest : public testing::Test {
 protected:
  void SetUp() override {
    g_log.clear();
    Logger::setOutput(capture);
  }
  void TearDown() override {
    Logger::setOutput(nullptr);
    Logger::setLogLevel(Logger::INFO);
  }
};

TEST_F(LoggingTest, LevelAndIntegers) {
  Logger::setLogLevel(Logger::INFO);
  LOG_DEBUG << "hidden";
  ASSERT_TRUE(g_log.empty());

  LOG_INFO << "count " << 0 << " " << -42 << " " << uint64_t(7);
  ASSERT_NE(std::string::npos, g_log.find("INFO"));
  ASSERT_NE(std::string::npos, g_log.find("count 0 -42 7"));
  ASSERT_NE(std::string::npos, g_log.find("base_test.cc"));
}

TEST_F(LoggingTest, StreamsStatus) {
  LOG_ERROR << Status::Corruption("checksum mismatch", "segment 3");
  ASSERT_NE(std::string::npos, g_log.find("ERROR"));
  ASSERT_NE(std::string::npos,
            g_log.find("Corruption: checksum mismatch: segment 3"));
}

TEST_F(LoggingTest, ParseLevel) {
  Logger::LogLevel level;
  ASSERT_TRUE(Logger::parseLogLevel("debug", &level));
  ASSERT_EQ(Logger::DEBUG, level);
  ASSERT_TRUE(Logger::parseLogLevel("WARN", &level));
  ASSERT_EQ(Logger::WARN, level);
  ASSERT_FALSE(Logger::parseLogLevel("loud", &level));
}

}  // namespace base
}  // namespace tsdump

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
