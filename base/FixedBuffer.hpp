#ifndef BUFFER_H
#define BUFFER_H
#include <string.h>  // memcpy

#include <boost/noncopyable.hpp>
#include <string>

namespace tsdump {
namespace base {

const int SmallBuffer = 4000;
const int LargeBuffer = 4000 * 1000;

template <int SIZE>
class FixedBuffer : boost::noncopyable {
 private:
  char *cur_;
  char data_[SIZE];
  const char *end() const { return data_ + sizeof data_; }

 public:
  FixedBuffer() : cur_(data_) {}

  // Silently truncates once the buffer is full.
  void append(const char * /*restrict*/ buf, size_t len) {
    size_t n = static_cast<size_t>(avail());
    if (len > n) len = n;
    memcpy(cur_, buf, len);
    cur_ += len;
  }

  const char *data() const { return data_; }

  int length() const { return static_cast<int>(cur_ - data_); }

  char *current() { return cur_; }

  int avail() const { return static_cast<int>(end() - cur_); }

  void add(size_t len) { cur_ += len; }

  void reset() { cur_ = data_; }

  std::string toString() const { return std::string(data_, length()); }
};

}  // namespace base
}  // namespace tsdump
#endif
