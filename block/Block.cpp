#include "block/Block.hpp"

#include <boost/filesystem.hpp>

#include "base/Logging.hpp"
#include "chunk/ChunkUtils.hpp"
#include "chunk/SegmentChunkStore.hpp"
#include "cloud/S3File.hpp"
#include "index/IndexReader.hpp"
#include "tsdbutil/LocalFileSource.hpp"

namespace tsdump {
namespace block {

Block::Block(const BlockLocation &location,
             std::unique_ptr<IndexReaderInterface> &&indexr,
             std::unique_ptr<ChunkReaderInterface> &&chunkr)
    : location_(location),
      indexr_(std::move(indexr)),
      chunkr_(std::move(chunkr)) {}

Block::~Block() { close(); }

base::Status Block::Open(const BlockLocation &location,
                         cloud::ObjectStore *store,
                         std::unique_ptr<Block> *block) {
  std::unique_ptr<tsdbutil::RangedByteSource> source;
  std::unique_ptr<chunk::SegmentChunkStore> chunkr;
  base::Status s;

  if (location.is_remote()) {
    if (store == nullptr) {
      return base::Status::InvalidArgument("remote block without object store",
                                           location.to_string());
    }
    std::unique_ptr<cloud::S3ReadableFile> f;
    s = cloud::S3ReadableFile::Open(store, location.bucket,
                                    location.locator(INDEX_FILE_NAME), &f);
    if (s.ok()) source = std::move(f);
    chunkr = chunk::SegmentChunkStore::Remote(
        store, location.bucket, location.locator(chunk::CHUNKS_DIR_NAME));
  } else {
    boost::system::error_code ec;
    if (!boost::filesystem::is_directory(location.dir, ec)) {
      return base::Status::InvalidArgument("block directory does not exist",
                                           location.dir);
    }
    std::unique_ptr<tsdbutil::LocalFileSource> f;
    s = tsdbutil::LocalFileSource::Open(location.locator(INDEX_FILE_NAME), &f);
    if (s.ok()) source = std::move(f);
    chunkr =
        chunk::SegmentChunkStore::Local(location.locator(chunk::CHUNKS_DIR_NAME));
  }
  if (!s.ok()) return s.Wrap("open block " + location.to_string());

  std::unique_ptr<index::IndexReader> indexr;
  s = index::IndexReader::Open(std::move(source), &indexr);
  if (!s.ok()) return s.Wrap("open block " + location.to_string());

  LOG_INFO << "opened block " << location.to_string() << " index size "
           << indexr->size();
  block->reset(new Block(location, std::move(indexr), std::move(chunkr)));
  return base::Status::OK();
}

void Block::close() {
  if (indexr_) indexr_->close();
  if (chunkr_) chunkr_->close();
}

}  // namespace block
}  // namespace tsdump
