#ifndef BLOCK_H
#define BLOCK_H

#include <boost/noncopyable.hpp>
#include <memory>

#include "block/BlockLocation.hpp"
#include "block/ChunkReaderInterface.hpp"
#include "block/IndexReaderInterface.hpp"
#include "cloud/ObjectStore.hpp"

namespace tsdump {
namespace block {

// One opened block: its index reader and the chunk reader bound to its
// segments. Handles are released by close() or the destructor.
class Block : boost::noncopyable {
 private:
  BlockLocation location_;
  std::unique_ptr<IndexReaderInterface> indexr_;
  std::unique_ptr<ChunkReaderInterface> chunkr_;

  Block(const BlockLocation &location,
        std::unique_ptr<IndexReaderInterface> &&indexr,
        std::unique_ptr<ChunkReaderInterface> &&chunkr);

 public:
  // Remote locations need a non-null store, local ones ignore it.
  static base::Status Open(const BlockLocation &location,
                           cloud::ObjectStore *store,
                           std::unique_ptr<Block> *block);

  ~Block();

  const BlockLocation &location() const { return location_; }
  IndexReaderInterface *index() { return indexr_.get(); }
  ChunkReaderInterface *chunks() { return chunkr_.get(); }

  void close();
};

}  // namespace block
}  // namespace tsdump

#endif
