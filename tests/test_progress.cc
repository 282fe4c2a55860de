#include "progress.hh"

#include <cassert>
#include <string>

int main() {
    Progress progress("acked", "resent", 10, true);
    assert(progress.status(0) ==
           "acked=0/10 (0%) resent=0 rate=0.0 parts/s eta=--:--:--");

    progress.update(5, 2);
    assert(progress.status(2.0) ==
           "acked=5/10 (50%) resent=2 rate=2.5 parts/s eta=00:00:02");

    // Counts past the total are clamped; a finished transfer has no wait.
    progress.update(15, 3);
    assert(progress.status(4.0) ==
           "acked=10/10 (100%) resent=3 rate=2.5 parts/s eta=00:00:00");
    progress.finish();

    // Slow transfers show hours.
    Progress slow("received", "lost", 7201, true);
    slow.update(1, 0);
    assert(slow.status(1.0) ==
           "received=1/7201 (0%) lost=0 rate=1.0 parts/s eta=02:00:00");

    Progress empty("received", "lost", 0, true);
    assert(empty.status(0) ==
           "received=0/0 (100%) lost=0 rate=0.0 parts/s eta=00:00:00");

    return 0;
}
