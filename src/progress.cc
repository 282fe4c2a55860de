#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdio>
#include <iostream>

#include "log.hh"
#include "progress.hh"

namespace {

/// Minimum time between two redraws of the bar.
const std::chrono::milliseconds BAR_REDRAW(100);

/**
 * Formats a number of seconds as hh:mm:ss.
 */
std::string
clockTime(uint64_t seconds)
{
    char text[32];
    snprintf(text, sizeof(text), "%02lu:%02lu:%02lu",
             static_cast<unsigned long>(seconds / 3600),
             static_cast<unsigned long>((seconds % 3600) / 60),
             static_cast<unsigned long>(seconds % 60));
    return text;
}

}

Progress::Progress(const char* doneLabel, const char* retryLabel,
                   uint64_t totalParts, bool quiet,
                   Clock::duration reportInterval)
    : doneLabel(doneLabel)
    , retryLabel(retryLabel)
    , totalParts(totalParts)
    , bar(!quiet && !DEBUG_F && isatty(STDOUT_FILENO))
    , reportInterval(reportInterval)
    , start(Clock::now())
    , lastReport(start)
    , done(0)
    , retries(0)
{}

void
Progress::update(uint64_t done, uint64_t retries)
{
    if (done > totalParts) done = totalParts;
    if (done == this->done && retries == this->retries) return;
    this->done = done;
    this->retries = retries;
    report(false);
}

void
Progress::finish()
{
    report(true);
    if (bar) {
        std::cout << std::endl;
    }
}

std::string
Progress::status(double elapsedSeconds) const
{
    double rate = elapsedSeconds > 0 ? done / elapsedSeconds : 0;
    int percentage = totalParts == 0 ? 100
            : static_cast<int>(done * 100 / totalParts);

    std::string eta;
    if (done == totalParts) {
        eta = clockTime(0);
    } else if (rate > 0) {
        eta = clockTime(static_cast<uint64_t>((totalParts - done) / rate));
    } else {
        eta = "--:--:--";
    }

    char text[160];
    snprintf(text, sizeof(text), "%s=%lu/%lu (%d%%) %s=%lu rate=%.1f parts/s "
             "eta=%s", doneLabel, static_cast<unsigned long>(done),
             static_cast<unsigned long>(totalParts), percentage, retryLabel,
             static_cast<unsigned long>(retries), rate, eta.c_str());
    return text;
}

void
Progress::report(bool force)
{
    Clock::time_point now = Clock::now();
    Clock::duration due = bar ? Clock::duration(BAR_REDRAW) : reportInterval;
    if (!force && now - lastReport < due) {
        return;
    }
    lastReport = now;

    std::chrono::duration<double> elapsed = now - start;
    std::string text = status(elapsed.count());
    if (bar) {
        drawBar(text);
    } else {
        logInfo("progress %s", text.c_str());
    }
}

void
Progress::drawBar(const std::string& text) const
{
    struct winsize w;
    w.ws_col = 0;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) < 0) w.ws_col = 0;

    int room = static_cast<int>(w.ws_col) - static_cast<int>(text.size()) - 3;
    if (room >= 10) {
        int barwidth = room < 50 ? room : 50;
        int pos = totalParts == 0 ? barwidth
                : static_cast<int>(barwidth * done / totalParts);
        std::cout << "[";
        for (int i = 0; i < barwidth; ++i) {
            if (i < pos) std::cout << "=";
            else if (i == pos) std::cout << ">";
            else std::cout << " ";
        }
        std::cout << "] ";
    }
    std::cout << text << "\r";
    std::cout.flush();
}
