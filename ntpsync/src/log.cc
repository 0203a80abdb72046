// Copyright (c) 2025 The NTP Sample Authors
#include "ntpsync/log.hpp"

namespace ntpsync {

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "?";
}

}  // namespace ntpsync
