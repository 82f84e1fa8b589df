#include "base/Status.hpp"

#include <stdint.h>
#include <string.h>

namespace tsdump {
namespace base {

const char *Status::CopyState(const char *state) {
  uint32_t size;
  memcpy(&size, state, sizeof(size));
  char *result = new char[size + 5];
  memcpy(result, state, size + 5);
  return result;
}

Status::Status(Code code, const std::string &msg, const std::string &msg2) {
  const uint32_t len1 = static_cast<uint32_t>(msg.size());
  const uint32_t len2 = static_cast<uint32_t>(msg2.size());
  const uint32_t size = len1 + (len2 ? (2 + len2) : 0);
  char *result = new char[size + 5];
  memcpy(result, &size, sizeof(size));
  result[4] = static_cast<char>(code);
  memcpy(result + 5, msg.data(), len1);
  if (len2) {
    result[5 + len1] = ':';
    result[6 + len1] = ' ';
    memcpy(result + 7 + len1, msg2.data(), len2);
  }
  state_ = result;
}

Status Status::Wrap(const std::string &context) const {
  if (ok()) return Status();
  return Status(code(), context, message());
}

std::string Status::message() const {
  if (state_ == nullptr) return std::string();
  uint32_t length;
  memcpy(&length, state_, sizeof(length));
  return std::string(state_ + 5, length);
}

std::string Status::ToString() const {
  if (state_ == nullptr) return "OK";
  const char *type;
  switch (code()) {
    case kOk:
      type = "OK";
      break;
    case kNotFound:
      type = "NotFound: ";
      break;
    case kCorruption:
      type = "Corruption: ";
      break;
    case kNotSupported:
      type = "Not implemented: ";
      break;
    case kInvalidArgument:
      type = "Invalid argument: ";
      break;
    case kIOError:
      type = "IO error: ";
      break;
    case kTimedOut:
      type = "Timed out: ";
      break;
    default:
      type = "Unknown code: ";
      break;
  }
  return std::string(type) + message();
}

}  // namespace base
}  // namespace tsdump
