#pragma once

#include "betting.hpp"

namespace hilo {

// Pure schedule arithmetic. Boundaries count as closed: betting is open only
// strictly before the cutoff, settlement is allowed at or after the interval.
struct WindowPolicy {
    static Timestamp bettingDeadline(Timestamp lastSettlement, Duration interval, Duration cutoffLead);
    static Timestamp settlementDue(Timestamp lastSettlement, Duration interval);

    static bool bettingOpen(Timestamp now,
                            Timestamp lastSettlement,
                            Duration interval,
                            Duration cutoffLead,
                            bool paused);
    static bool settlementReady(Timestamp now, Timestamp lastSettlement, Duration interval);

    static Duration timeUntilBettingCloses(Timestamp now,
                                           Timestamp lastSettlement,
                                           Duration interval,
                                           Duration cutoffLead);
    static Duration timeUntilSettlement(Timestamp now, Timestamp lastSettlement, Duration interval);
};

} // namespace hilo
