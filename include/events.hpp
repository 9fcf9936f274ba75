#pragma once

#include "betting.hpp"
#include "fixed_point.hpp"

#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace hilo {

struct BetPlaced {
    RoundId round = 0;
    Address participant;
    Side side = Side::Higher;
    Amount amount = 0;
    Centi baseline;
};

struct RoundSettled {
    RoundId round = 0;
    Centi reportedOutcome;
    Centi priorBaseline;
    std::optional<Side> winningSide;
    bool tie = false;
    Amount totalPot = 0;
    Amount fee = 0;
};

struct WinningsClaimed {
    RoundId round = 0;
    Address participant;
    Amount amount = 0;
};

struct FundsRescued {
    Address recipient;
    Amount amount = 0;
};

// Admin changes: pause flag, roles, limits, schedule.
struct ConfigChanged {
    std::string field;
    std::string value;
};

using MarketEvent = std::variant<BetPlaced, RoundSettled, WinningsClaimed, FundsRescued, ConfigChanged>;
using EventListener = std::function<void(const MarketEvent&)>;

// Canonical little-endian wire form, used as the audit log leaf preimage.
std::string encodeEvent(const MarketEvent& event);
// Single-line human readable form.
std::string describeEvent(const MarketEvent& event);

} // namespace hilo
