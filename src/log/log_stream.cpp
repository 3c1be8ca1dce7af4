#include "capflow/log/log_stream.h"
#include "capflow/log/console_logger.h"

#include <atomic>

namespace capflow
{

namespace
{

ConsoleLogger& getConsoleLogger()
{
  static ConsoleLogger logger;
  return logger;
}

std::atomic<ILogger*> g_logger{nullptr};

}  // namespace

void setLogger(ILogger* logger)
{
  g_logger.store(logger, std::memory_order_release);
}

ILogger& currentLogger()
{
  ILogger* logger = g_logger.load(std::memory_order_acquire);
  if (logger)
  {
    return *logger;
  }
  return getConsoleLogger();
}

void setLogLevel(LogLevel level)
{
  getConsoleLogger().setMinLevel(level);
}

LogStream::LogStream(LogLevel level) : _level(level) {}

LogStream::~LogStream()
{
  auto& logger = currentLogger();
  const auto msg = _stream.str();
  switch (_level)
  {
    case LogLevel::Debug:
      logger.debug(msg);
      break;
    case LogLevel::Info:
      logger.info(msg);
      break;
    case LogLevel::Warn:
      logger.warn(msg);
      break;
    case LogLevel::Error:
      logger.error(msg);
      break;
  }
}

}  // namespace capflow
