#pragma once

#include <functional>
#include <string>

namespace http_resilience {

/**
 * Log - leveled logging for the library.
 *
 * debug/info go to stdout, warn/error to stderr, each line stamped with
 * an ISO 8601 UTC time and the level. A custom sink replaces both streams.
 * Thread-safe.
 */
namespace Log {

enum class Level { Debug, Info, Warn, Error };

using Sink = std::function<void(Level level, const std::string& message)>;

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

void log(Level level, const std::string& message);

// Messages below this level are dropped (default Info)
void setMinLevel(Level level);
Level getMinLevel();

// Pass an empty function to restore console output
void setSink(Sink sink);

const char* levelToString(Level level);

} // namespace Log
} // namespace http_resilience
