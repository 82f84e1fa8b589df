#include "chunk/SegmentChunkStore.hpp"

#include "base/Logging.hpp"
#include "chunk/ChunkUtils.hpp"
#include "cloud/S3File.hpp"
#include "tsdbutil/LocalFileSource.hpp"

namespace tsdump {
namespace chunk {

namespace {

base::Status open_local(const std::string &path,
                        std::unique_ptr<tsdbutil::RangedByteSource> *result) {
  std::unique_ptr<tsdbutil::LocalFileSource> f;
  base::Status s = tsdbutil::LocalFileSource::Open(path, &f);
  if (s.ok()) *result = std::move(f);
  return s;
}

base::Status open_remote(cloud::ObjectStore *store, const std::string &bucket,
                         const std::string &key,
                         std::unique_ptr<tsdbutil::RangedByteSource> *result) {
  std::unique_ptr<cloud::S3ReadableFile> f;
  base::Status s = cloud::S3ReadableFile::Open(store, bucket, key, &f);
  if (s.ok()) *result = std::move(f);
  return s;
}

}  // namespace

SegmentChunkStore::SegmentChunkStore(const std::string &dir,
                                     const SourceOpener &opener)
    : dir_(dir), opener_(opener), closed_(false) {}

SegmentChunkStore::~SegmentChunkStore() { close(); }

std::unique_ptr<SegmentChunkStore> SegmentChunkStore::Local(
    const std::string &dir) {
  return std::unique_ptr<SegmentChunkStore>(
      new SegmentChunkStore(dir, &open_local));
}

std::unique_ptr<SegmentChunkStore> SegmentChunkStore::Remote(
    cloud::ObjectStore *store, const std::string &bucket,
    const std::string &prefix) {
  return std::unique_ptr<SegmentChunkStore>(new SegmentChunkStore(
      prefix, [store, bucket](
                  const std::string &key,
                  std::unique_ptr<tsdbutil::RangedByteSource> *result) {
        return open_remote(store, bucket, key, result);
      }));
}

std::string SegmentChunkStore::segment_locator(uint32_t segment) const {
  if (dir_.empty()) return segment_file_name(segment);
  return dir_ + "/" + segment_file_name(segment);
}

base::Status SegmentChunkStore::segment(
    uint32_t segment, const tsdbutil::RangedByteSource **source) {
  auto it = segments_.find(segment);
  if (it != segments_.end()) {
    *source = it->second.get();
    return base::Status::OK();
  }

  std::string locator = segment_locator(segment);
  std::unique_ptr<tsdbutil::RangedByteSource> s;
  base::Status st = opener_(locator, &s);
  if (!st.ok()) return st.Wrap("segment " + std::to_string(segment));
  st = check_segment_header(*s);
  if (!st.ok()) return st.Wrap("segment " + std::to_string(segment));

  LOG_DEBUG << "opened segment " << segment << " at " << s->name() << " size "
            << s->len();
  *source = s.get();
  segments_[segment] = std::move(s);
  return base::Status::OK();
}

base::Status SegmentChunkStore::chunk(const ChunkRef &ref,
                                      ChunkRecord *record) {
  if (closed_) {
    return base::Status::InvalidArgument("chunk store closed",
                                         ref.to_string());
  }
  if (ref.offset() < static_cast<uint32_t>(SEGMENT_HEADER_SIZE)) {
    return base::Status::Corruption(ref.to_string(),
                                    "offset inside segment header");
  }

  const tsdbutil::RangedByteSource *source = nullptr;
  base::Status s = segment(ref.segment(), &source);
  if (!s.ok()) return s.Wrap(ref.to_string());

  s = ChunkCodec::decode_at(*source, ref.offset(), record);
  if (!s.ok()) return s.Wrap(ref.to_string());
  return base::Status::OK();
}

void SegmentChunkStore::close() {
  if (closed_) return;
  closed_ = true;
  segments_.clear();
}

}  // namespace chunk
}  // namespace tsdump
