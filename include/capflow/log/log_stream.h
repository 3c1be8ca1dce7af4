#pragma once

#include <sstream>

#include "capflow/log/abstract_logger.h"

namespace capflow
{

class LogStream
{
 public:
  explicit LogStream(LogLevel level = LogLevel::Info);
  ~LogStream();

  template <typename T>
  LogStream& operator<<(const T& val)
  {
    _stream << val;
    return *this;
  }

 private:
  LogLevel _level;
  std::ostringstream _stream;
};

// Redirects LogStream output. nullptr restores the built-in console logger.
void setLogger(ILogger* logger);
ILogger& currentLogger();

// Threshold of the built-in console logger.
void setLogLevel(LogLevel level);

}  // namespace capflow
