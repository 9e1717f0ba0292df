#pragma once
#include <sstream>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel lvl);
LogLevel log_level();

// one line to stderr: "[warn] dial: message"
void log_line(LogLevel lvl, const std::string& tag, const std::string& msg);

// Collects a message with operator<< and emits it on destruction.
class LogStream {
public:
  LogStream(LogLevel lvl, const char* tag) : lvl_(lvl), tag_(tag) {}
  ~LogStream() { if (lvl_ >= log_level()) log_line(lvl_, tag_, os_.str()); }

  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;

  template <typename T>
  LogStream& operator<<(const T& v) { os_ << v; return *this; }

private:
  LogLevel lvl_;
  const char* tag_;
  std::ostringstream os_;
};

inline LogStream log_debug(const char* tag) { return LogStream(LogLevel::Debug, tag); }
inline LogStream log_info(const char* tag)  { return LogStream(LogLevel::Info, tag); }
inline LogStream log_warn(const char* tag)  { return LogStream(LogLevel::Warn, tag); }
inline LogStream log_error(const char* tag) { return LogStream(LogLevel::Error, tag); }
