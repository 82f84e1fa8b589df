#include <string>

#include "cloud/S3File.hpp"
#include "gtest/gtest.h"
#include "test/TestUtils.hpp"

namespace tsdump {
namespace cloud {

class S3FileTest : public testing::Test {
 public:
  test::FakeObjectStore store;
  std::string content;

  void SetUp() override {
    for (int i = 0; i < 1000; i++) content.push_back(static_cast<char>(i));
    store.put("bucket", "blocks/01/index", content);
  }
};

TEST_F(S3FileTest, RangeHeader) {
  ASSERT_EQ("bytes=0-0", range_header(0, 1));
  ASSERT_EQ("bytes=10-19", range_header(10, 20));
  ASSERT_EQ("bytes=4294967296-4294967305",
            range_header(4294967296ull, 4294967306ull));
}

TEST_F(S3FileTest, OpenProbesSizeOnce) {
  std::unique_ptr<S3ReadableFile> f;
  ASSERT_TRUE(S3ReadableFile::Open(&store, "bucket", "blocks/01/index", &f).ok());
  ASSERT_EQ(1, store.num_heads);
  ASSERT_EQ(1000u, f->len());
  ASSERT_EQ("s3://bucket/blocks/01/index", f->name());
  ASSERT_TRUE(store.range_headers.empty());

  std::string r;
  ASSERT_TRUE(f->range(10, 20, &r).ok());
  ASSERT_TRUE(f->range(10, 20, &r).ok());
  ASSERT_EQ(content.substr(10, 10), r);
  // No cache: both reads went to the store.
  ASSERT_EQ(2u, store.range_headers.size());
  ASSERT_EQ("bytes=10-19", store.range_headers[0]);
  ASSERT_EQ(1, store.num_heads);
}

TEST_F(S3FileTest, RangeExactness) {
  std::unique_ptr<S3ReadableFile> f;
  ASSERT_TRUE(S3ReadableFile::Open(&store, "bucket", "blocks/01/index", &f).ok());
  std::string r;
  for (uint64_t begin = 0; begin < 1000; begin += 97) {
    for (uint64_t end = begin + 1; end <= 1000; end += 131) {
      ASSERT_TRUE(f->range(begin, end, &r).ok());
      ASSERT_EQ(content.substr(begin, end - begin), r);
      ASSERT_EQ(range_header(begin, end), store.range_headers.back());
    }
  }

  size_t requests = store.range_headers.size();
  ASSERT_TRUE(f->range(1000, 1000, &r).ok());
  ASSERT_TRUE(r.empty());
  ASSERT_EQ(requests, store.range_headers.size());

  ASSERT_TRUE(f->range(990, 1001, &r).IsCorruption());
  ASSERT_EQ(requests, store.range_headers.size());
}

TEST_F(S3FileTest, OpenErrors) {
  std::unique_ptr<S3ReadableFile> f;
  base::Status s = S3ReadableFile::Open(&store, "bucket", "missing", &f);
  ASSERT_TRUE(s.IsNotFound());
  ASSERT_NE(std::string::npos, s.ToString().find("s3://bucket/missing"));
  ASSERT_EQ(nullptr, f.get());

  ASSERT_TRUE(S3ReadableFile::Open(nullptr, "bucket", "key", &f)
                  .IsInvalidArgument());

  store.fail_head(base::Status::TimedOut("head", "deadline exceeded"));
  ASSERT_TRUE(S3ReadableFile::Open(&store, "bucket", "blocks/01/index", &f)
                  .IsTimedOut());
}

TEST_F(S3FileTest, ShortRead) {
  std::unique_ptr<S3ReadableFile> f;
  ASSERT_TRUE(S3ReadableFile::Open(&store, "bucket", "blocks/01/index", &f).ok());
  store.truncate_bodies(3);
  std::string r;
  base::Status s = f->range(0, 100, &r);
  ASSERT_TRUE(s.IsIOError());
  ASSERT_NE(std::string::npos, s.ToString().find("short read"));
  ASSERT_TRUE(r.empty());
}

TEST_F(S3FileTest, TimeoutIsDistinct) {
  std::unique_ptr<S3ReadableFile> f;
  ASSERT_TRUE(S3ReadableFile::Open(&store, "bucket", "blocks/01/index", &f).ok());

  store.fail_get(base::Status::TimedOut("get", "request timed out"));
  std::string r;
  base::Status s = f->range(0, 10, &r);
  ASSERT_TRUE(s.IsTimeoutError());
  ASSERT_FALSE(s.IsTransportError());
  ASSERT_NE(std::string::npos, s.ToString().find("bytes=0-9"));
  // Not retried.
  ASSERT_EQ(1u, store.range_headers.size());

  store.fail_get(base::Status::IOError("get", "connection reset"));
  s = f->range(0, 10, &r);
  ASSERT_TRUE(s.IsTransportError());
}

}  // namespace cloud
}  // namespace tsdump

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
