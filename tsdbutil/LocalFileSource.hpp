#ifndef LOCALFILESOURCE_H
#define LOCALFILESOURCE_H

#include <boost/noncopyable.hpp>
#include <memory>

#include "tsdbutil/RangedByteSource.hpp"

namespace tsdump {
namespace tsdbutil {

// Positioned reads (pread) against a file descriptor held open for the
// lifetime of the object.
class LocalFileSource : public RangedByteSource, boost::noncopyable {
 private:
  std::string filename_;
  int fd_;
  uint64_t size_;

  LocalFileSource(const std::string &filename, int fd, uint64_t size);

 public:
  // Missing file is NotFound, anything else IOError.
  static base::Status Open(const std::string &filename,
                           std::unique_ptr<LocalFileSource> *result);

  ~LocalFileSource();

  uint64_t len() const override { return size_; }

  base::Status range(uint64_t begin, uint64_t end,
                     std::string *result) const override;

  const std::string &name() const override { return filename_; }
};

}  // namespace tsdbutil
}  // namespace tsdump

#endif
