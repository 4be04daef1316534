#include "log.h"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <cstring>
#include <strings.h>

static LogLevel g_level = LogLevel::INFO;

bool log_parse_level(const std::string& s, LogLevel& out) {
    static const struct { const char* name; LogLevel level; } names[] = {
        {"TRACE", LogLevel::TRACE},
        {"DEBUG", LogLevel::DEBUG},
        {"INFO",  LogLevel::INFO},
        {"WARN",  LogLevel::WARN},
        {"WARNING", LogLevel::WARN},
        {"ERROR", LogLevel::ERROR},
    };
    for (auto& n : names) {
        if (strcasecmp(s.c_str(), n.name) == 0) {
            out = n.level;
            return true;
        }
    }
    return false;
}

static const char* level_str(LogLevel l) {
    switch (l) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

void log_init(const std::string& level) {
    const char* env = std::getenv("LOG_LEVEL");
    std::string wanted = (env && env[0]) ? env : level;

    LogLevel parsed = LogLevel::INFO;
    bool known = log_parse_level(wanted, parsed);
    g_level = parsed;
    if (!known && !wanted.empty()) {
        LOG_WARN("unknown log level '%s', using INFO", wanted.c_str());
    }
}

void log_msg(LogLevel level, const char* file, int line, const char* fmt, ...) {
    if (level < g_level) return;

    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    struct tm tm;
    localtime_r(&ts.tv_sec, &tm);

    char timebuf[32];
    strftime(timebuf, sizeof(timebuf), "%Y-%m-%d %H:%M:%S", &tm);

    const char* base = std::strrchr(file, '/');
    base = base ? base + 1 : file;

    fprintf(stderr, "%s.%03ld [%-5s] %s:%d: ",
            timebuf, ts.tv_nsec / 1000000, level_str(level), base, line);

    va_list ap;
    va_start(ap, fmt);
    vfprintf(stderr, fmt, ap);
    va_end(ap);

    fputc('\n', stderr);
}
