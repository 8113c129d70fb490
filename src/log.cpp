#include "snapbucket/core/log.hpp"

#include <atomic>
#include <cstdarg>

namespace snapbucket {

namespace {
std::atomic<int> g_verbosity{0};
std::atomic<bool> g_progress_open{false};

void end_progress_line() {
    if (g_progress_open.exchange(false)) {
        fputc('\n', stdout);
    }
}
}  // namespace

void set_verbosity(int level) {
    g_verbosity = level < 0 ? 0 : level;
}

int verbosity() {
    return g_verbosity;
}

void log_info(const char* fmt, ...) {
    end_progress_line();
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_warn(const char* fmt, ...) {
    end_progress_line();
    fprintf(stderr, "WARNING: ");
    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

void log_error(const char* fmt, ...) {
    end_progress_line();
    fprintf(stderr, "ERROR: ");
    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

void log_debug(int level, const char* fmt, ...) {
    if (level > g_verbosity) return;
    end_progress_line();
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_progress(const char* fmt, ...) {
    fputc('\r', stdout);
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fflush(stdout);
    g_progress_open = true;
}

void log_progress_done() {
    end_progress_line();
    fflush(stdout);
}

}  // namespace snapbucket
