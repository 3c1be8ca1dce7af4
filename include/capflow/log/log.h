#pragma once

#include "capflow/log/log_stream.h"

#define CAPFLOW_LOG_INFO(expr) ::capflow::LogStream(::capflow::LogLevel::Info) << expr
#define CAPFLOW_LOG_WARN(expr) ::capflow::LogStream(::capflow::LogLevel::Warn) << expr
#define CAPFLOW_LOG_ERROR(expr) ::capflow::LogStream(::capflow::LogLevel::Error) << expr

#ifdef CAPFLOW_DEBUG_LOGGING
#define CAPFLOW_LOG_DEBUG(expr) ::capflow::LogStream(::capflow::LogLevel::Debug) << expr
#else
#define CAPFLOW_LOG_DEBUG(expr) \
  do                            \
  {                             \
  } while (0)
#endif
