#ifndef LOGSTREAM_H
#define LOGSTREAM_H
#include <string>

#include "base/FixedBuffer.hpp"
#include "base/Status.hpp"

namespace tsdump {
namespace base {

class LogStream : boost::noncopyable {
  typedef LogStream self;

 public:
  typedef FixedBuffer<SmallBuffer> Buffer;

  self &operator<<(bool v) {
    buffer_.append(v ? "1" : "0", 1);
    return *this;
  }

  self &operator<<(short);
  self &operator<<(unsigned short);
  self &operator<<(int);
  self &operator<<(unsigned int);
  self &operator<<(long);
  self &operator<<(unsigned long);
  self &operator<<(long long);
  self &operator<<(unsigned long long);

  self &operator<<(const void *);

  self &operator<<(float v) {
    *this << static_cast<double>(v);
    return *this;
  }
  self &operator<<(double);

  self &operator<<(char v) {
    buffer_.append(&v, 1);
    return *this;
  }

  self &operator<<(const char *str) {
    if (str) {
      buffer_.append(str, strlen(str));
    } else {
      buffer_.append("(null)", 6);
    }
    return *this;
  }

  self &operator<<(const std::string &v) {
    buffer_.append(v.c_str(), v.size());
    return *this;
  }

  // Same text as Status::ToString().
  self &operator<<(const Status &s) {
    *this << s.ToString();
    return *this;
  }

  void append(const char *data, int len) { buffer_.append(data, len); }
  const Buffer &buffer() const { return buffer_; }

 private:
  template <typename T>
  void formatInteger(T);

  Buffer buffer_;

  static const int kMaxNumericSize = 64;
};

}  // namespace base
}  // namespace tsdump

#endif
