#ifndef SEGMENTCHUNKSTORE_H
#define SEGMENTCHUNKSTORE_H

#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <map>
#include <memory>

#include "block/ChunkReaderInterface.hpp"
#include "cloud/ObjectStore.hpp"
#include "tsdbutil/RangedByteSource.hpp"

namespace tsdump {
namespace chunk {

// Resolves chunk references of one block against its segment files. Segments
// are opened on first use, their header checked once, and kept until close().
class SegmentChunkStore : public block::ChunkReaderInterface,
                          boost::noncopyable {
 public:
  // Open the source at a segment locator (file path or object key).
  typedef boost::function<base::Status(
      const std::string &, std::unique_ptr<tsdbutil::RangedByteSource> *)>
      SourceOpener;

  // dir is the chunks directory or object key prefix, without trailing '/'.
  SegmentChunkStore(const std::string &dir, const SourceOpener &opener);

  ~SegmentChunkStore();

  // Segments under a local directory, read with pread.
  static std::unique_ptr<SegmentChunkStore> Local(const std::string &dir);

  // Segments under bucket/prefix, read with ranged GETs.
  static std::unique_ptr<SegmentChunkStore> Remote(cloud::ObjectStore *store,
                                                   const std::string &bucket,
                                                   const std::string &prefix);

  std::string segment_locator(uint32_t segment) const;

  base::Status chunk(const ChunkRef &ref, ChunkRecord *record) override;

  void close() override;

  size_t num_open_segments() const { return segments_.size(); }

 private:
  std::string dir_;
  SourceOpener opener_;
  std::map<uint32_t, std::unique_ptr<tsdbutil::RangedByteSource>> segments_;
  bool closed_;

  base::Status segment(uint32_t segment,
                       const tsdbutil::RangedByteSource **source);
};

}  // namespace chunk
}  // namespace tsdump

#endif
