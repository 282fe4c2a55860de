#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <sys/time.h>

#include "common.hh"
#include "log.hh"

int DEBUG_F = 0;

namespace {

std::mutex logMutex;

const char*
levelName(LogLevel level)
{
    switch (level) {
        case LEVEL_DEBUG:
            return "DEBUG";
        case LEVEL_INFO:
            return "INFO";
        case LEVEL_WARNING:
            return "WARN";
        case LEVEL_ERROR:
            return "ERROR";
    }
    return "?";
}

}

void
logMessage(LogLevel level, const char* format, ...)
{
    if (level == LEVEL_DEBUG && !DEBUG_F) {
        return;
    }

    struct timeval now;
    gettimeofday(&now, NULL);
    struct tm local;
    localtime_r(&now.tv_sec, &local);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &local);

    Guard _(logMutex);
    fprintf(stderr, "%s.%06ld %-5s ", stamp,
            static_cast<long>(now.tv_usec), levelName(level));
    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);
    fputc('\n', stderr);
}
