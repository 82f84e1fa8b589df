#include "tsdbutil/LocalFileSource.hpp"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "base/Logging.hpp"

namespace tsdump {
namespace tsdbutil {

namespace {

base::Status PosixError(const std::string &context, int err_number) {
  if (err_number == ENOENT)
    return base::Status::NotFound(context, strerror(err_number));
  return base::Status::IOError(context, strerror(err_number));
}

}  // namespace

LocalFileSource::LocalFileSource(const std::string &filename, int fd,
                                 uint64_t size)
    : filename_(filename), fd_(fd), size_(size) {}

base::Status LocalFileSource::Open(const std::string &filename,
                                   std::unique_ptr<LocalFileSource> *result) {
  int fd = ::open(filename.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return PosixError("open " + filename, errno);

  struct stat sbuf;
  if (::fstat(fd, &sbuf) != 0) {
    base::Status s = PosixError("stat " + filename, errno);
    ::close(fd);
    return s;
  }
  if (!S_ISREG(sbuf.st_mode)) {
    ::close(fd);
    return base::Status::IOError(filename, "not a regular file");
  }
  result->reset(
      new LocalFileSource(filename, fd, static_cast<uint64_t>(sbuf.st_size)));
  LOG_DEBUG << "opened " << filename << " size:" << sbuf.st_size;
  return base::Status::OK();
}

LocalFileSource::~LocalFileSource() {
  if (fd_ >= 0 && ::close(fd_) != 0) LOG_SYSERR << "close " << filename_;
}

base::Status LocalFileSource::range(uint64_t begin, uint64_t end,
                                    std::string *result) const {
  base::Status s = check_range(*this, begin, end);
  if (!s.ok()) return s;

  size_t n = static_cast<size_t>(end - begin);
  result->resize(n);
  size_t left = n;
  char *ptr = n > 0 ? &(*result)[0] : nullptr;
  uint64_t offset = begin;
  while (left > 0) {
    ssize_t done = ::pread(fd_, ptr, left, static_cast<off_t>(offset));
    if (done < 0) {
      // read was interrupted, try again.
      if (errno == EINTR) continue;
      return PosixError("pread " + filename_ + " offset " +
                            std::to_string(offset) + " len " +
                            std::to_string(left),
                        errno);
    } else if (done == 0) {
      // The file shrank underneath us.
      return base::Status::IOError(
          filename_, "unexpected EOF at offset " + std::to_string(offset));
    }
    ptr += done;
    offset += done;
    left -= done;
  }
  return base::Status::OK();
}

}  // namespace tsdbutil
}  // namespace tsdump
