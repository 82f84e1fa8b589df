#ifndef STATUS_H
#define STATUS_H

#include <string>
#include <utility>

namespace tsdump {
namespace base {

// A Status encapsulates the result of an operation. It may indicate success,
// or it may indicate an error with an associated error message.
//
// Errors fall into four families:
//   configuration  InvalidArgument
//   transport      IOError, NotFound
//   timeout        TimedOut
//   format         Corruption, NotSupported
class Status {
 public:
  // Create a success status.
  Status() noexcept : state_(nullptr) {}
  ~Status() { delete[] state_; }

  Status(const Status &rhs);
  Status &operator=(const Status &rhs);

  Status(Status &&rhs) noexcept : state_(rhs.state_) { rhs.state_ = nullptr; }
  Status &operator=(Status &&rhs) noexcept;

  // Return a success status.
  static Status OK() { return Status(); }

  // Return error status of an appropriate type.
  static Status NotFound(const std::string &msg,
                         const std::string &msg2 = std::string()) {
    return Status(kNotFound, msg, msg2);
  }
  static Status Corruption(const std::string &msg,
                           const std::string &msg2 = std::string()) {
    return Status(kCorruption, msg, msg2);
  }
  static Status NotSupported(const std::string &msg,
                             const std::string &msg2 = std::string()) {
    return Status(kNotSupported, msg, msg2);
  }
  static Status InvalidArgument(const std::string &msg,
                                const std::string &msg2 = std::string()) {
    return Status(kInvalidArgument, msg, msg2);
  }
  static Status IOError(const std::string &msg,
                        const std::string &msg2 = std::string()) {
    return Status(kIOError, msg, msg2);
  }
  static Status TimedOut(const std::string &msg,
                         const std::string &msg2 = std::string()) {
    return Status(kTimedOut, msg, msg2);
  }

  // Returns true iff the status indicates success.
  bool ok() const { return state_ == nullptr; }

  bool IsNotFound() const { return code() == kNotFound; }
  bool IsCorruption() const { return code() == kCorruption; }
  bool IsNotSupported() const { return code() == kNotSupported; }
  bool IsInvalidArgument() const { return code() == kInvalidArgument; }
  bool IsIOError() const { return code() == kIOError; }
  bool IsTimedOut() const { return code() == kTimedOut; }

  bool IsConfigurationError() const { return IsInvalidArgument(); }
  bool IsTransportError() const { return IsIOError() || IsNotFound(); }
  bool IsTimeoutError() const { return IsTimedOut(); }
  bool IsFormatError() const { return IsCorruption() || IsNotSupported(); }

  // Return a copy of this status with "context: " prepended to the message.
  // The code is preserved. OK stays OK.
  Status Wrap(const std::string &context) const;

  // Message without the code prefix.
  std::string message() const;

  // Return a string representation of this status suitable for printing.
  // Returns the string "OK" for success.
  std::string ToString() const;

 private:
  enum Code {
    kOk = 0,
    kNotFound = 1,
    kCorruption = 2,
    kNotSupported = 3,
    kInvalidArgument = 4,
    kIOError = 5,
    kTimedOut = 6
  };

  Code code() const {
    return (state_ == nullptr) ? kOk : static_cast<Code>(state_[4]);
  }

  Status(Code code, const std::string &msg, const std::string &msg2);
  static const char *CopyState(const char *s);

  // OK status has a null state_. Otherwise, state_ is a new[] array
  // of the following form:
  //    state_[0..3] == length of message
  //    state_[4]    == code
  //    state_[5..]  == message
  const char *state_;
};

inline Status::Status(const Status &rhs) {
  state_ = (rhs.state_ == nullptr) ? nullptr : CopyState(rhs.state_);
}

inline Status &Status::operator=(const Status &rhs) {
  if (state_ != rhs.state_) {
    delete[] state_;
    state_ = (rhs.state_ == nullptr) ? nullptr : CopyState(rhs.state_);
  }
  return *this;
}

inline Status &Status::operator=(Status &&rhs) noexcept {
  std::swap(state_, rhs.state_);
  return *this;
}

}  // namespace base
}  // namespace tsdump

#endif
