#pragma once

namespace vidgate {

// printf-style logging. Info and debug go to stdout, errors to stderr.
// Both streams are redirected to the log file when running as a daemon.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Only printed when verbose logging is enabled
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose_logging(bool enabled);
bool verbose_logging();

}  // namespace vidgate
