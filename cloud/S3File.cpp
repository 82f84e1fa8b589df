#include "cloud/S3File.hpp"

#include <cinttypes>
#include <cstdio>

#include "base/Logging.hpp"

namespace tsdump {
namespace cloud {

std::string range_header(uint64_t begin, uint64_t end) {
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "bytes=%" PRIu64 "-%" PRIu64, begin,
           end - 1);
  return std::string(buffer);
}

S3ReadableFile::S3ReadableFile(ObjectStore* store, const std::string& bucket,
                               const std::string& key, uint64_t file_size)
    : store_(store),
      bucket_(bucket),
      key_(key),
      fname_("s3://" + bucket + "/" + key),
      file_size_(file_size) {}

base::Status S3ReadableFile::Open(ObjectStore* store, const std::string& bucket,
                                  const std::string& key,
                                  std::unique_ptr<S3ReadableFile>* result) {
  result->reset();
  if (store == nullptr) {
    return base::Status::InvalidArgument("no object store for s3://" + bucket +
                                         "/" + key);
  }

  // Size first, so that every later range is validated locally.
  uint64_t size = 0;
  base::Status s = store->HeadObject(bucket, key, &size);
  if (!s.ok()) return s.Wrap("open s3://" + bucket + "/" + key);
  LOG_DEBUG << "[s3] S3ReadableFile opened s3://" << bucket << "/" << key
            << " size " << size;
  result->reset(new S3ReadableFile(store, bucket, key, size));
  return base::Status::OK();
}

base::Status S3ReadableFile::range(uint64_t begin, uint64_t end,
                                   std::string* result) const {
  result->clear();
  base::Status s = tsdbutil::check_range(*this, begin, end);
  if (!s.ok()) return s;
  if (begin == end) return base::Status::OK();

  std::string header = range_header(begin, end);
  LOG_DEBUG << "[s3] S3ReadableFile reading " << fname_ << " " << header;
  s = store_->GetObject(bucket_, key_, header, result);
  if (!s.ok()) return s.Wrap("read " + fname_ + " " + header);
  if (result->size() != end - begin) {
    std::string got = std::to_string(result->size());
    result->clear();
    LOG_DEBUG << "[s3] S3ReadableFile short read " << fname_ << " " << header
              << " got " << got << " bytes";
    return base::Status::IOError(
        "short read " + fname_ + " " + header,
        "expected " + std::to_string(end - begin) + " bytes, got " + got);
  }
  LOG_DEBUG << "[s3] S3ReadableFile file " << fname_ << " read "
            << result->size() << " bytes";
  return base::Status::OK();
}

}  // namespace cloud.
}  // namespace tsdump.
