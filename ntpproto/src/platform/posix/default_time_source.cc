// Copyright (c) 2025
/**
 * @file default_time_source.cc (POSIX)
 * @brief POSIX implementation - creates MonotonicClock instance.
 */
#include "ntpproto/platform/default_time_source.hpp"

#include <memory>

#include "ntpproto/monotonic_clock.hpp"

namespace ntpproto {
namespace platform {

std::unique_ptr<TimeSource> CreateDefaultTimeSource() {
  return std::make_unique<MonotonicClock>();
}

}  // namespace platform
}  // namespace ntpproto
