#include "capflow/log/console_logger.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace capflow
{

namespace
{

void writeTimestamp(std::FILE* out)
{
  const auto now = std::chrono::system_clock::now();
  const auto secs = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
  gmtime_r(&secs, &tm);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  std::fprintf(out, "%s.%03lld ", buf, static_cast<long long>(ms));
}

}  // namespace

std::string_view toString(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "INFO";
}

LogLevel logLevelFromString(std::string_view name)
{
  if (name == "debug")
  {
    return LogLevel::Debug;
  }
  if (name == "warn" || name == "warning")
  {
    return LogLevel::Warn;
  }
  if (name == "error")
  {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

ConsoleLogger::ConsoleLogger(LogLevel minLevel) : _minLevel(minLevel) {}

void ConsoleLogger::log(LogLevel level, std::string_view msg)
{
  if (level < minLevel())
  {
    return;
  }

  std::FILE* out = level >= LogLevel::Warn ? stderr : stdout;

  std::lock_guard<std::mutex> lock(_mutex);
  writeTimestamp(out);
  const auto tag = toString(level);
  std::fprintf(out, "[%.*s] %.*s\n", static_cast<int>(tag.size()), tag.data(),
               static_cast<int>(msg.size()), msg.data());
  std::fflush(out);
}

void ConsoleLogger::debug(std::string_view msg) { log(LogLevel::Debug, msg); }
void ConsoleLogger::info(std::string_view msg) { log(LogLevel::Info, msg); }
void ConsoleLogger::warn(std::string_view msg) { log(LogLevel::Warn, msg); }
void ConsoleLogger::error(std::string_view msg) { log(LogLevel::Error, msg); }

}  // namespace capflow
