#include "base/LogStream.hpp"

#include <stdint.h>
#include <stdio.h>

#include <algorithm>

namespace tsdump {
namespace base {

const char digits[] = "9876543210123456789";
const char *zero = digits + 9;
const char digitsHex[] = "0123456789ABCDEF";

// Efficient Integer to String Conversions, by Matthew Wilson.
template <typename T>
size_t convert(char buf[], T value) {
  T i = value;
  char *p = buf;

  do {
    int lsd = static_cast<int>(i % 10);
    i /= 10;
    *p++ = zero[lsd];
  } while (i != 0);

  if (value < 0) {
    *p++ = '-';
  }
  *p = '\0';
  std::reverse(buf, p);

  return p - buf;
}

size_t convertHex(char buf[], uintptr_t value) {
  uintptr_t i = value;
  char *p = buf;

  do {
    int lsd = static_cast<int>(i % 16);
    i /= 16;
    *p++ = digitsHex[lsd];
  } while (i != 0);

  *p = '\0';
  std::reverse(buf, p);

  return p - buf;
}

template <typename T>
void LogStream::formatInteger(T val) {
  if (buffer_.avail() >= kMaxNumericSize) {
    size_t add_length = convert(buffer_.current(), val);
    buffer_.add(add_length);
  }
}

LogStream &LogStream::operator<<(short val) {
  *this << static_cast<int>(val);
  return *this;
}

LogStream &LogStream::operator<<(unsigned short val) {
  *this << static_cast<unsigned int>(val);
  return *this;
}

LogStream &LogStream::operator<<(int val) {
  formatInteger(val);
  return *this;
}

LogStream &LogStream::operator<<(unsigned int val) {
  formatInteger(val);
  return *this;
}

LogStream &LogStream::operator<<(long val) {
  formatInteger(val);
  return *this;
}

LogStream &LogStream::operator<<(unsigned long val) {
  formatInteger(val);
  return *this;
}

LogStream &LogStream::operator<<(long long val) {
  formatInteger(val);
  return *this;
}

LogStream &LogStream::operator<<(unsigned long long val) {
  formatInteger(val);
  return *this;
}

LogStream &LogStream::operator<<(const void *p) {
  uintptr_t v = reinterpret_cast<uintptr_t>(p);
  if (buffer_.avail() >= kMaxNumericSize) {
    char *buf = buffer_.current();
    buf[0] = '0';
    buf[1] = 'x';
    size_t len = convertHex(buf + 2, v);
    buffer_.add(len + 2);
  }
  return *this;
}

// %g drops meaningless trailing zeros.
LogStream &LogStream::operator<<(double val) {
  if (buffer_.avail() >= kMaxNumericSize) {
    int add_length = snprintf(buffer_.current(), kMaxNumericSize, "%.12g", val);
    buffer_.add(add_length);
  }
  return *this;
}

}  // namespace base
}  // namespace tsdump
