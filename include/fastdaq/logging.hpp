#pragma once

// Leveled printf-style logging shared by every stage of the pipeline.
//
// Usage:
//   LOG_ACQ(INFO, "stream started: %d ch @ %.0f Hz", channels, rate);
//   LOG_PROC(WARN, "cycle %llu failed: %s", cycle, e.what());
//
// Output goes to stderr unless setLogFile() redirected it. Each line carries
// the time since g_log_start_time, the level and a short category tag.

#include <chrono>
#include <cstdio>

#ifdef _WIN32
// Windows headers define ERROR, which breaks the LOG_*(ERROR, ...) macros
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace fastdaq {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4,
};

// Per-category switches (all enabled by default)
struct LogCategories {
    bool acq = true;    // Acquisition producer and devices
    bool proc = true;   // Background processor and DSP
    bool perf = true;   // Performance monitor and alerts
    bool pipe = true;   // Pipeline lifecycle, mode controller, display gate
    bool gui = true;    // Live view
};

extern LogLevel g_log_level;
extern LogCategories g_log_categories;
extern std::chrono::steady_clock::time_point g_log_start_time;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Redirect output (nullptr restores stderr). The caller keeps ownership of the FILE.
void setLogFile(FILE* file);

// Apply FASTDAQ_LOG_LEVEL (error, warn, info, debug, trace) if it is set.
void initLogLevelFromEnv();

// Parse a level name; returns false and leaves `out` untouched on unknown input.
bool parseLogLevel(const char* name, LogLevel& out);

const char* logLevelToString(LogLevel level);

#if defined(__GNUC__) || defined(__clang__)
void log(LogLevel level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));
#else
void log(LogLevel level, const char* tag, const char* fmt, ...);
#endif

} // namespace fastdaq

#define FASTDAQ_LOG_IMPL(category, tag, level, ...)                                   \
    do {                                                                              \
        if (::fastdaq::g_log_level >= ::fastdaq::LogLevel::level &&                  \
            ::fastdaq::g_log_categories.category) {                                   \
            ::fastdaq::log(::fastdaq::LogLevel::level, tag, __VA_ARGS__);            \
        }                                                                             \
    } while (0)

#define LOG_ACQ(level, ...)  FASTDAQ_LOG_IMPL(acq, "ACQ", level, __VA_ARGS__)
#define LOG_PROC(level, ...) FASTDAQ_LOG_IMPL(proc, "PROC", level, __VA_ARGS__)
#define LOG_PERF(level, ...) FASTDAQ_LOG_IMPL(perf, "PERF", level, __VA_ARGS__)
#define LOG_PIPE(level, ...) FASTDAQ_LOG_IMPL(pipe, "PIPE", level, __VA_ARGS__)
#define LOG_GUI(level, ...)  FASTDAQ_LOG_IMPL(gui, "GUI", level, __VA_ARGS__)
