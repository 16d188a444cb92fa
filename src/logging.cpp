#include "fastdaq/logging.hpp"

#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <strings.h>

namespace fastdaq {

LogLevel g_log_level = LogLevel::INFO;
LogCategories g_log_categories;
std::chrono::steady_clock::time_point g_log_start_time = std::chrono::steady_clock::now();

namespace {

std::mutex g_log_mutex;
FILE* g_log_file = nullptr;

} // namespace

void setLogLevel(LogLevel level) {
    g_log_level = level;
}

LogLevel getLogLevel() {
    return g_log_level;
}

void setLogFile(FILE* file) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = file;
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?";
}

bool parseLogLevel(const char* name, LogLevel& out) {
    if (!name) return false;
    if (strcasecmp(name, "error") == 0) { out = LogLevel::ERROR; return true; }
    if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0) {
        out = LogLevel::WARN;
        return true;
    }
    if (strcasecmp(name, "info") == 0)  { out = LogLevel::INFO;  return true; }
    if (strcasecmp(name, "debug") == 0) { out = LogLevel::DEBUG; return true; }
    if (strcasecmp(name, "trace") == 0) { out = LogLevel::TRACE; return true; }
    return false;
}

void initLogLevelFromEnv() {
    const char* env = std::getenv("FASTDAQ_LOG_LEVEL");
    if (!env || env[0] == '\0') return;

    LogLevel level;
    if (parseLogLevel(env, level)) {
        setLogLevel(level);
    } else {
        log(LogLevel::WARN, "LOG", "Ignoring unknown FASTDAQ_LOG_LEVEL '%s'", env);
    }
}

void log(LogLevel level, const char* tag, const char* fmt, ...) {
    char message[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_log_start_time).count();
    int secs = static_cast<int>(elapsed / 1000);
    int ms = static_cast<int>(elapsed % 1000);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    FILE* out = g_log_file ? g_log_file : stderr;
    std::fprintf(out, "[%4d.%03d] [%-5s] [%s] %s\n",
                 secs, ms, logLevelToString(level), tag ? tag : "-", message);
    if (level <= LogLevel::WARN || g_log_file) {
        std::fflush(out);
    }
}

} // namespace fastdaq
