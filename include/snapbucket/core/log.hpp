#pragma once

#include <cstdio>

namespace snapbucket {

/// Global verbosity (0-3). Messages passed to log_debug(level, ...) are
/// printed only when level <= verbosity.
void set_verbosity(int level);
int verbosity();

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(int level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

/// Rewrites the current stdout line ("\r" prefixed, no newline).
void log_progress(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
/// Terminates a progress line started by log_progress.
void log_progress_done();

}  // namespace snapbucket
