#include "base/Logging.hpp"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <boost/algorithm/string/case_conv.hpp>

namespace tsdump {
namespace base {

const char *LogLevelName[Logger::NUM_LOG_LEVELS] = {
    "TRACE ", "DEBUG ", "INFO  ", "WARN  ", "ERROR ", "FATAL ",
};

Logger::LogLevel g_logLevel = Logger::INFO;

__thread char t_errnobuf[512];
__thread char t_time[64];
__thread time_t t_lastSecond;

const char *strerror_tl(int savedErrno) {
  // GNU strerror_r may return a static string instead of filling the buffer.
  return strerror_r(savedErrno, t_errnobuf, sizeof t_errnobuf);
}

// stdout carries dump output, so log lines go to stderr.
void defaultOutput(const char *msg, int len) {
  size_t n = fwrite(msg, 1, len, stderr);
  size_t remain = len - n;
  while (remain > 0) {
    size_t x = ::fwrite(msg + n, sizeof(char), remain, stderr);
    if (x == 0) break;
    remain = remain - x;
    n += x;
  }
}

void defaultFlush() { fflush(stderr); }

Logger::OutputFunc g_output = defaultOutput;
Logger::FlushFunc g_flush = defaultFlush;

inline LogStream &operator<<(LogStream &s, const Logger::SourceFile &v) {
  s.append(v.data_, v.size_);
  return s;
}

Logger::Impl::Impl(LogLevel level, int savedErrno, const SourceFile &file,
                   int line)
    : time_(TimeStamp::now()),
      stream_(),
      level_(level),
      line_(line),
      basename_(file) {
  formatTime();
  stream_ << LogLevelName[level];
  if (savedErrno != 0) {
    stream_ << strerror_tl(savedErrno) << " (errno=" << savedErrno << ") ";
  }
}

void Logger::Impl::formatTime() {
  int64_t microSecondsSinceEpoch = time_.microSecondsSinceEpoch();
  time_t seconds = static_cast<time_t>(microSecondsSinceEpoch /
                                       TimeStamp::kMicroSecondsPerSecond);
  int microseconds = static_cast<int>(microSecondsSinceEpoch %
                                      TimeStamp::kMicroSecondsPerSecond);
  if (seconds != t_lastSecond) {
    t_lastSecond = seconds;
    struct tm tm_time;
    gmtime_r(&seconds, &tm_time);
    snprintf(t_time, sizeof(t_time), "%4d%02d%02d %02d:%02d:%02d",
             tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday,
             tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec);
  }
  char us[16];
  int n = snprintf(us, sizeof(us), ".%06dZ ", microseconds);
  stream_.append(t_time, 17);
  stream_.append(us, n);
}

void Logger::Impl::finish() {
  stream_ << " - " << basename_ << ':' << line_ << '\n';
}

Logger::Logger(SourceFile file, int line) : impl_(INFO, 0, file, line) {}

Logger::Logger(SourceFile file, int line, LogLevel level, const char *func)
    : impl_(level, 0, file, line) {
  impl_.stream_ << func << ' ';
}

Logger::Logger(SourceFile file, int line, LogLevel level)
    : impl_(level, 0, file, line) {}

Logger::Logger(SourceFile file, int line, bool toAbort)
    : impl_(toAbort ? FATAL : ERROR, errno, file, line) {}

Logger::~Logger() {
  impl_.finish();
  const LogStream::Buffer &buf(stream().buffer());
  g_output(buf.data(), buf.length());
  if (impl_.level_ >= ERROR) g_flush();
  if (impl_.level_ == FATAL) abort();
}

void Logger::setLogLevel(Logger::LogLevel level) { g_logLevel = level; }

bool Logger::parseLogLevel(const std::string &name, LogLevel *level) {
  std::string n = boost::algorithm::to_lower_copy(name);
  if (n == "trace")
    *level = TRACE;
  else if (n == "debug")
    *level = DEBUG;
  else if (n == "info")
    *level = INFO;
  else if (n == "warn" || n == "warning")
    *level = WARN;
  else if (n == "error")
    *level = ERROR;
  else
    return false;
  return true;
}

// nullptr restores the stderr default.
void Logger::setOutput(OutputFunc out) {
  g_output = out ? out : defaultOutput;
}

void Logger::setFlush(FlushFunc flush) {
  g_flush = flush ? flush : defaultFlush;
}

}  // namespace base
}  // namespace tsdump
