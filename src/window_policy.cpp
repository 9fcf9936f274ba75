#include "window_policy.hpp"

namespace hilo {

Timestamp WindowPolicy::settlementDue(Timestamp lastSettlement, Duration interval) {
    return saturatingAdd(lastSettlement, interval);
}

Timestamp WindowPolicy::bettingDeadline(Timestamp lastSettlement,
                                        Duration interval,
                                        Duration cutoffLead) {
    Timestamp due = settlementDue(lastSettlement, interval);
    // An oversized lead closes betting instead of wrapping.
    return cutoffLead >= due ? 0 : due - cutoffLead;
}

bool WindowPolicy::bettingOpen(Timestamp now,
                               Timestamp lastSettlement,
                               Duration interval,
                               Duration cutoffLead,
                               bool paused) {
    if (paused) {
        return false;
    }
    return now < bettingDeadline(lastSettlement, interval, cutoffLead);
}

bool WindowPolicy::settlementReady(Timestamp now, Timestamp lastSettlement, Duration interval) {
    return now >= settlementDue(lastSettlement, interval);
}

Duration WindowPolicy::timeUntilBettingCloses(Timestamp now,
                                              Timestamp lastSettlement,
                                              Duration interval,
                                              Duration cutoffLead) {
    Timestamp deadline = bettingDeadline(lastSettlement, interval, cutoffLead);
    return now < deadline ? deadline - now : 0;
}

Duration WindowPolicy::timeUntilSettlement(Timestamp now, Timestamp lastSettlement, Duration interval) {
    Timestamp due = settlementDue(lastSettlement, interval);
    return now < due ? due - now : 0;
}

} // namespace hilo
