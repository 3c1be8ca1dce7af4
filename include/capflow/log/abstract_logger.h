#pragma once

#include <string_view>

namespace capflow
{

enum class LogLevel
{
  Debug,
  Info,
  Warn,
  Error
};

struct ILogger
{
  virtual ~ILogger() = default;

  virtual void debug(std::string_view msg) { (void)msg; }
  virtual void info(std::string_view msg) = 0;
  virtual void warn(std::string_view msg) = 0;
  virtual void error(std::string_view msg) = 0;
};

std::string_view toString(LogLevel level);

// Accepts "debug", "info", "warn"/"warning", "error"; anything else maps to Info.
LogLevel logLevelFromString(std::string_view name);

}  // namespace capflow
