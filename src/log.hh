#ifndef LOG_HH
#define LOG_HH

/**
 * Set by -d: per-part messages instead of a progress bar.
 */
extern int DEBUG_F;

/**
 * Severity of a log line. Debug lines are dropped unless DEBUG_F is set.
 */
enum LogLevel {
    LEVEL_DEBUG,
    LEVEL_INFO,
    LEVEL_WARNING,
    LEVEL_ERROR,
};

/**
 * Writes one line to stderr: a timestamp, the level, then the formatted
 * message. Safe to call from any thread; lines never interleave.
 */
void logMessage(LogLevel level, const char* format, ...)
        __attribute__((format(printf, 2, 3)));

#define logDebug(...)   logMessage(LEVEL_DEBUG, __VA_ARGS__)
#define logInfo(...)    logMessage(LEVEL_INFO, __VA_ARGS__)
#define logWarning(...) logMessage(LEVEL_WARNING, __VA_ARGS__)
#define logError(...)   logMessage(LEVEL_ERROR, __VA_ARGS__)

#endif /* LOG_HH */
