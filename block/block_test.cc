#include "block/Block.hpp"
#include "block/BlockLocation.hpp"
#include "gtest/gtest.h"
#include "index/PostingsInterface.hpp"
#include "test/TestUtils.hpp"

namespace tsdump {
namespace block {

class BlockLocationTest : public testing::Test {};

TEST_F(BlockLocationTest, Parse) {
  BlockLocation loc;
  ASSERT_TRUE(BlockLocation::Parse("/data/01ABC", &loc).ok());
  ASSERT_FALSE(loc.is_remote());
  ASSERT_EQ("/data/01ABC", loc.dir);
  ASSERT_EQ("/data/01ABC/index", loc.locator("index"));

  ASSERT_TRUE(BlockLocation::Parse("s3://bucket/prom/01ABC/", &loc).ok());
  ASSERT_TRUE(loc.is_remote());
  ASSERT_EQ("bucket", loc.bucket);
  ASSERT_EQ("prom/01ABC", loc.prefix);
  ASSERT_EQ("prom/01ABC/index", loc.locator("index"));
  ASSERT_EQ("prom/01ABC/chunks", loc.locator("chunks"));
  ASSERT_EQ("s3://bucket/prom/01ABC", loc.to_string());

  ASSERT_TRUE(BlockLocation::Parse("s3://bucket", &loc).ok());
  ASSERT_EQ("", loc.prefix);
  ASSERT_EQ("index", loc.locator("index"));

  ASSERT_TRUE(BlockLocation::Parse("", &loc).IsConfigurationError());
  ASSERT_TRUE(BlockLocation::Parse("gs://bucket/x", &loc).IsInvalidArgument());
  ASSERT_TRUE(BlockLocation::Parse("s3:///x", &loc).IsInvalidArgument());
}

class BlockTest : public testing::Test {
 public:
  test::BlockBuilder b;

  void SetUp() override {
    b.add_series(label::lbs_from_string({"__name__", "up", "instance", "a"}),
                 {{{1000, 1}, {3000, 1}}});
  }

  static void check(Block *block) {
    std::unique_ptr<index::PostingsInterface> p;
    ASSERT_TRUE(block->index()->postings("__name__", "up", &p).ok());
    ASSERT_TRUE(p->next());
    label::Labels lset;
    std::deque<chunk::ChunkMeta> chunks;
    ASSERT_TRUE(block->index()->series(p->at(), &lset, &chunks).ok());
    ASSERT_EQ(1u, chunks.size());
    chunk::ChunkRecord r;
    ASSERT_TRUE(block->chunks()->chunk(chunks[0].ref, &r).ok());
    ASSERT_EQ(test::xor_chunk({{1000, 1}, {3000, 1}}), r.payload);
  }
};

TEST_F(BlockTest, Local) {
  test::TempDir dir;
  b.write(dir.path());
  BlockLocation loc;
  ASSERT_TRUE(BlockLocation::Parse(dir.path(), &loc).ok());

  std::unique_ptr<Block> block;
  ASSERT_TRUE(Block::Open(loc, nullptr, &block).ok());
  check(block.get());
  block->close();
  std::unique_ptr<index::PostingsInterface> p;
  ASSERT_FALSE(block->index()->postings("__name__", "up", &p).ok());
}

TEST_F(BlockTest, Remote) {
  b.build();
  test::FakeObjectStore s3;
  s3.put("bucket", "prom/01ABC/index", b.index());
  s3.put("bucket", "prom/01ABC/chunks/000000", b.segment());
  BlockLocation loc;
  ASSERT_TRUE(BlockLocation::Parse("s3://bucket/prom/01ABC", &loc).ok());

  std::unique_ptr<Block> block;
  ASSERT_TRUE(Block::Open(loc, &s3, &block).ok());
  check(block.get());
  ASSERT_EQ("prom/01ABC/index", s3.keys[0]);
  ASSERT_EQ("prom/01ABC/chunks/000000", s3.keys[1]);
}

TEST_F(BlockTest, OpenErrors) {
  std::unique_ptr<Block> block;
  BlockLocation loc;

  test::TempDir dir;
  ASSERT_TRUE(BlockLocation::Parse(dir.path() + "/missing", &loc).ok());
  ASSERT_TRUE(Block::Open(loc, nullptr, &block).IsInvalidArgument());

  // Directory without an index.
  ASSERT_TRUE(BlockLocation::Parse(dir.path(), &loc).ok());
  base::Status s = Block::Open(loc, nullptr, &block);
  ASSERT_TRUE(s.IsNotFound());
  ASSERT_NE(std::string::npos, s.ToString().find(dir.path()));

  ASSERT_TRUE(BlockLocation::Parse("s3://bucket/prom", &loc).ok());
  ASSERT_TRUE(Block::Open(loc, nullptr, &block).IsInvalidArgument());

  test::FakeObjectStore s3;
  ASSERT_TRUE(Block::Open(loc, &s3, &block).IsNotFound());
  ASSERT_EQ(nullptr, block.get());
}

}  // namespace block
}  // namespace tsdump

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
