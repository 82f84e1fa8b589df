#ifndef TSDBEXCEPTION_H
#define TSDBEXCEPTION_H
#include <stdexcept>
#include <string>

namespace tsdump {
namespace base {

// Thrown by the chunk bit reader when the payload ends before the declared
// number of samples. Never escapes chunk iterators.
class TSDBException : public std::runtime_error {
 public:
  explicit TSDBException(const std::string &err) : std::runtime_error(err) {}
};

}  // namespace base
}  // namespace tsdump

#endif
