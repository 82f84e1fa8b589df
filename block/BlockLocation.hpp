#ifndef BLOCKLOCATION_H
#define BLOCKLOCATION_H

#include <string>

#include "base/Status.hpp"

namespace tsdump {
namespace block {

extern const std::string INDEX_FILE_NAME;

// Where a block lives, resolved once before any I/O.
class BlockLocation {
 public:
  enum Kind { LocalBlock, RemoteBlock };

  Kind kind;
  // Local directory of the block.
  std::string dir;
  // Object storage bucket and key prefix, prefix without leading or trailing
  // '/'.
  std::string bucket;
  std::string prefix;

  BlockLocation() : kind(LocalBlock) {}

  bool is_remote() const { return kind == RemoteBlock; }

  // "s3://bucket/prefix" is remote, a string without "://" a local directory.
  static base::Status Parse(const std::string &uri, BlockLocation *loc);

  // Path or object key of a file relative to the block root.
  std::string locator(const std::string &relative) const;

  std::string to_string() const;
};

}  // namespace block
}  // namespace tsdump

#endif
