#ifndef CLOUD_S3FILE_HPP
#define CLOUD_S3FILE_HPP

#include <boost/noncopyable.hpp>
#include <memory>

#include "cloud/ObjectStore.hpp"
#include "tsdbutil/RangedByteSource.hpp"

namespace tsdump {
namespace cloud {

// Read-only view over one object. The size is probed once with HEAD, every
// range() is a single ranged GET. Nothing is retried or cached here.
class S3ReadableFile : public tsdbutil::RangedByteSource, boost::noncopyable {
 public:
  static base::Status Open(ObjectStore* store, const std::string& bucket,
                           const std::string& key,
                           std::unique_ptr<S3ReadableFile>* result);

  uint64_t len() const override { return file_size_; }

  base::Status range(uint64_t begin, uint64_t end,
                     std::string* result) const override;

  const std::string& name() const override { return fname_; }

  const std::string& bucket() const { return bucket_; }
  const std::string& key() const { return key_; }

 private:
  S3ReadableFile(ObjectStore* store, const std::string& bucket,
                 const std::string& key, uint64_t file_size);

  ObjectStore* store_;
  std::string bucket_;
  std::string key_;
  std::string fname_;
  uint64_t file_size_;
};

// Inclusive HTTP range header for [begin, end). end must be > begin.
std::string range_header(uint64_t begin, uint64_t end);

}  // namespace cloud.
}  // namespace tsdump.

#endif
