#include "Logging.hpp"

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <vector>

namespace {

std::mutex g_log_mutex;
LogLevel g_level = LOG_INFO;
FILE *g_mirror = nullptr;

static void timestamp(char *buf, size_t n)
{
    const time_t now = time(nullptr);
    struct tm tmv;
    localtime_r(&now, &tmv);
    strftime(buf, n, "%Y-%m-%d %H:%M:%S", &tmv);
}

} // namespace

void logSetLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
}

LogLevel logLevel()
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_level;
}

bool logOpenFile(const std::string &path)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_mirror != nullptr) {
        fclose(g_mirror);
        g_mirror = nullptr;
    }
    if (path.empty()) {
        return true;
    }
    g_mirror = fopen(path.c_str(), "a");
    return g_mirror != nullptr;
}

void logCloseFile()
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_mirror != nullptr) {
        fclose(g_mirror);
        g_mirror = nullptr;
    }
}

void logMsg(LogLevel level, const char *fmt, ...)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_level) {
        return;
    }

    va_list ap;
    va_start(ap, fmt);
    va_list ap2;
    va_copy(ap2, ap);
    const int len = vsnprintf(nullptr, 0, fmt, ap);
    va_end(ap);
    std::vector<char> buf(len > 0 ? (size_t)len + 1 : 1, '\0');
    if (len > 0) {
        vsnprintf(buf.data(), buf.size(), fmt, ap2);
    }
    va_end(ap2);
    const char *body = buf.data();

    char ts[32];
    timestamp(ts, sizeof(ts));

    fprintf(stderr, "%s [%s] %s\n", ts, LogLevelName(level), body);
    if (g_mirror != nullptr) {
        fprintf(g_mirror, "%s [%s] %s\n", ts, LogLevelName(level), body);
        fflush(g_mirror);
    }
}

void logFatalBlock(const std::string &what, const std::string &label, const std::string &value)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "\n  Fatal Error: %s\n", what.c_str());
    if (!label.empty()) {
        fprintf(stderr, "  %s: %s\n", label.c_str(), value.c_str());
    }
    if (g_mirror != nullptr) {
        fprintf(g_mirror, "\n  Fatal Error: %s\n", what.c_str());
        if (!label.empty()) {
            fprintf(g_mirror, "  %s: %s\n", label.c_str(), value.c_str());
        }
        fflush(g_mirror);
    }
}
