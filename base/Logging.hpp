#ifndef LOGGING_H
#define LOGGING_H
#include <string>

#include "base/LogStream.hpp"
#include "base/TimeStamp.hpp"

namespace tsdump {
namespace base {

class Logger {
 public:
  enum LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    NUM_LOG_LEVELS,
  };

  class SourceFile {
   public:
    template <int N>
    inline SourceFile(const char (&arr)[N]) : data_(arr), size_(N - 1) {
      const char *slash = strrchr(data_, '/');  // builtin function
      if (slash) {
        data_ = slash + 1;
        size_ -= static_cast<int>(data_ - arr);
      }
    }

    explicit SourceFile(const char *filename) : data_(filename) {
      const char *slash = strrchr(filename, '/');
      if (slash) {
        data_ = slash + 1;
      }
      size_ = static_cast<int>(strlen(data_));
    }

    const char *data_;
    int size_;
  };

  Logger(SourceFile file, int line);
  Logger(SourceFile file, int line, LogLevel level);
  Logger(SourceFile file, int line, LogLevel level, const char *func);
  Logger(SourceFile file, int line, bool toAbort);
  ~Logger();

  LogStream &stream() { return impl_.stream_; }

  static LogLevel logLevel();
  static void setLogLevel(LogLevel level);

  // Accepts "trace", "debug", "info", "warn", "error" (any case).
  static bool parseLogLevel(const std::string &name, LogLevel *level);

  typedef void (*OutputFunc)(const char *msg, int len);
  typedef void (*FlushFunc)();

  static void setOutput(OutputFunc);
  static void setFlush(FlushFunc);

 private:
  class Impl {
   public:
    typedef Logger::LogLevel LogLevel;
    Impl(LogLevel level, int old_errno, const SourceFile &file, int line);
    void formatTime();
    void finish();

    TimeStamp time_;
    LogStream stream_;
    LogLevel level_;
    int line_;
    SourceFile basename_;
  };

  Impl impl_;
};

extern Logger::LogLevel g_logLevel;

inline Logger::LogLevel Logger::logLevel() { return g_logLevel; }

//
// CAUTION: do not write:
//
// if (good)
//   LOG_INFO << "Good news";
// else
//   LOG_WARN << "Bad news";
//
// this expends to
//
// if (good)
//   if (logging_INFO)
//     logInfoStream << "Good news";
//   else
//     logWarnStream << "Bad news";
//
#define LOG_TRACE                                                           \
  if (::tsdump::base::Logger::logLevel() <= ::tsdump::base::Logger::TRACE)  \
  ::tsdump::base::Logger(__FILE__, __LINE__, ::tsdump::base::Logger::TRACE, \
                         __func__)                                          \
      .stream()
#define LOG_DEBUG                                                           \
  if (::tsdump::base::Logger::logLevel() <= ::tsdump::base::Logger::DEBUG)  \
  ::tsdump::base::Logger(__FILE__, __LINE__, ::tsdump::base::Logger::DEBUG, \
                         __func__)                                          \
      .stream()
#define LOG_INFO                                                          \
  if (::tsdump::base::Logger::logLevel() <= ::tsdump::base::Logger::INFO) \
  ::tsdump::base::Logger(__FILE__, __LINE__).stream()
#define LOG_WARN                                                          \
  if (::tsdump::base::Logger::logLevel() <= ::tsdump::base::Logger::WARN) \
  ::tsdump::base::Logger(__FILE__, __LINE__, ::tsdump::base::Logger::WARN) \
      .stream()
#define LOG_ERROR                                                         \
  ::tsdump::base::Logger(__FILE__, __LINE__, ::tsdump::base::Logger::ERROR) \
      .stream()
#define LOG_FATAL                                                         \
  ::tsdump::base::Logger(__FILE__, __LINE__, ::tsdump::base::Logger::FATAL) \
      .stream()
#define LOG_SYSERR ::tsdump::base::Logger(__FILE__, __LINE__, false).stream()

const char *strerror_tl(int savedErrno);

}  // namespace base
}  // namespace tsdump

#endif
