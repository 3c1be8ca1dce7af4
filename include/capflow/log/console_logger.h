#pragma once

#include <atomic>
#include <mutex>
#include <string_view>

#include "capflow/log/abstract_logger.h"

namespace capflow
{

class ConsoleLogger final : public ILogger
{
 public:
  explicit ConsoleLogger(LogLevel minLevel = LogLevel::Info);

  void log(LogLevel level, std::string_view msg);
  void debug(std::string_view msg) override;
  void info(std::string_view msg) override;
  void warn(std::string_view msg) override;
  void error(std::string_view msg) override;

  void setMinLevel(LogLevel level) { _minLevel.store(level, std::memory_order_relaxed); }
  LogLevel minLevel() const { return _minLevel.load(std::memory_order_relaxed); }

 private:
  std::atomic<LogLevel> _minLevel;
  std::mutex _mutex;
};

}  // namespace capflow
