#ifndef CLOUD_OBJECTSTORE_HPP
#define CLOUD_OBJECTSTORE_HPP

#include <stdint.h>

#include <string>

#include "base/Status.hpp"

namespace tsdump {
namespace cloud {

// Minimal object storage surface needed to read a block remotely.
class ObjectStore {
 public:
  // Size of bucket/key in bytes.
  virtual base::Status HeadObject(const std::string& bucket,
                                  const std::string& key, uint64_t* size) = 0;

  // range is an HTTP Range header value ("bytes=a-b"); empty reads the whole
  // object.
  virtual base::Status GetObject(const std::string& bucket,
                                 const std::string& key,
                                 const std::string& range,
                                 std::string* body) = 0;

  virtual ~ObjectStore() {}
};

}  // namespace cloud.
}  // namespace tsdump.

#endif
