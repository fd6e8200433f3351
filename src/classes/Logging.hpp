//  Logging.hpp
//  gridtiler
//
//  Diagnostic log on stderr (optionally mirrored to a file). Lines from
//  concurrent tiles are written whole under one lock. stdout is left to
//  the run summary.
//
#ifndef Logging_hpp
#define Logging_hpp

#include <string>

enum LogLevel {
    LOG_DEBUG = 0,
    LOG_INFO = 1,
    LOG_WARN = 2,
    LOG_ERROR = 3
};

static inline const char *LogLevelName(LogLevel level)
{
    switch (level) {
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO:  return "INFO";
        case LOG_WARN:  return "WARN";
        case LOG_ERROR: return "ERROR";
        default:        return "UNKNOWN";
    }
}

void logSetLevel(LogLevel level);
LogLevel logLevel();

/* Mirror every line to path (appending). Empty path closes the mirror. */
bool logOpenFile(const std::string &path);
void logCloseFile();

void logMsg(LogLevel level, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

/*
 * Multi-line fatal block in the form
 *
 *   Fatal Error: <what>
 *   <label>: <value>
 */
void logFatalBlock(const std::string &what, const std::string &label, const std::string &value);

#endif /* Logging_hpp */
