#ifndef PROGRESS_HH
#define PROGRESS_HH

#include <cstdint>
#include <string>

#include "common.hh"

/**
 * Reports how far a transfer has got in parts, and how many parts had to
 * be recovered. On a terminal it redraws a one-line bar; otherwise, and
 * with -q or -d, it logs a progress line once per report interval.
 */
class Progress {
  public:
    /**
     * \param doneLabel
     *      Name of the completed-parts counter, e.g. "acked".
     * \param retryLabel
     *      Name of the recovered-parts counter, e.g. "resent".
     * \param totalParts
     *      Parts in the whole transfer.
     * \param quiet
     *      Never draw the bar.
     */
    Progress(const char* doneLabel, const char* retryLabel,
             uint64_t totalParts, bool quiet,
             Clock::duration reportInterval = std::chrono::seconds(1));

    /**
     * Records the latest counters and reports them if due. Counters past
     * the total are clamped.
     */
    void update(uint64_t done, uint64_t retries);

    /**
     * Reports the final counters whether due or not.
     */
    void finish();

    /**
     * One-line summary, e.g.
     * "acked=5/10 (50%) resent=2 rate=2.5 parts/s eta=00:00:02".
     */
    std::string status(double elapsedSeconds) const;

  private:
    void report(bool force);
    void drawBar(const std::string& text) const;

    const char* doneLabel;

    const char* retryLabel;

    const uint64_t totalParts;

    const bool bar;

    const Clock::duration reportInterval;

    const Clock::time_point start;

    Clock::time_point lastReport;

    uint64_t done;

    uint64_t retries;

    DISALLOW_COPY_AND_ASSIGN(Progress)
};

#endif /* PROGRESS_HH */
