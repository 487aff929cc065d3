/**
 * @file log.hpp
 * @brief Shell-friendly status lines on stderr.
 *
 * @details
 * Every line is a flat `key=value` record so it can be grepped or piped
 * into awk without a parser:
 *
 * @code
 *   level=info component=core event=unknown_transfer id=f-42 seq=3
 *   level=error component=sender event=failed id=f-7 reason=channel_closed
 * @endcode
 *
 * The minimum level is process-wide. Tests drop it to `Off`; the CLI
 * raises it to `Warn` under `--quiet`.
 */
#ifndef CHUNKWIRE_LOG_HPP
#define CHUNKWIRE_LOG_HPP

#include <stdint.h>
#include <string>

namespace chunkwire {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void     set_log_level(LogLevel level);
LogLevel log_level();

/// True when a line at @p level would be written. Use to skip building costly fields.
bool log_enabled(LogLevel level);

/**
 * @brief Write one status line.
 * @param component Short module name ("sender", "receiver", "core", ...).
 * @param fields    Pre-formatted `key=value` pairs, space separated.
 */
void log_line(LogLevel level, const char* component, const std::string& fields);

} // namespace chunkwire

#endif // CHUNKWIRE_LOG_HPP
