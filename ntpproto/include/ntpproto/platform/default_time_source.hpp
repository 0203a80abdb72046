// Copyright (c) 2025
/**
 * @file default_time_source.hpp
 * @brief Platform-specific default TimeSource factory.
 */
#pragma once

#include <memory>

#include "ntpproto/export.hpp"
#include "ntpproto/time_source.hpp"

namespace ntpproto {
namespace platform {

/**
 * @brief Creates the platform's default disciplined clock.
 * @return Unique pointer to a MonotonicClock anchored at the current time.
 */
NTPPROTO_API std::unique_ptr<TimeSource> CreateDefaultTimeSource();

}  // namespace platform
}  // namespace ntpproto
