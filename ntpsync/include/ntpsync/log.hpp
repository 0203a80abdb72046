// Copyright (c) 2025 <Your Name>
/**
 * @file log.hpp
 * @brief Logging sink shared by all engine components.
 *
 * Components never write to a stream directly. They hand a formatted line
 * (prefixed with the component name, e.g. "[Discipline] ...") and a severity
 * to the callback installed through Options::Builder::LogSink(). Without a
 * callback, logging is a no-op.
 */
#pragma once

#include <functional>
#include <string>

namespace ntpsync {

/** @brief Message severity. */
enum class LogLevel { Debug, Info, Warning, Error };

/** @brief Log sink; must be thread-safe when used with SyncService. */
using LogCallback = std::function<void(LogLevel, const std::string&)>;

/** @brief Short upper-case name for a level ("DEBUG", "INFO", ...). */
const char* ToString(LogLevel level);

}  // namespace ntpsync
