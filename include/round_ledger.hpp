#pragma once

#include "betting.hpp"
#include "events.hpp"
#include "market_config.hpp"

#include <map>
#include <unordered_map>

namespace hilo {

struct RoundBook {
    Centi baseline;
    Amount higherPool = 0;
    Amount lowerPool = 0;
    std::unordered_map<Address, Position> positions;

    Amount pool(Side side) const { return side == Side::Higher ? higherPool : lowerPool; }
    Amount newStakes() const { return higherPool + lowerPool; }
};

// Stake bookkeeping for the live round plus the per-participant positions of
// every past round, which claims read after settlement.
class RoundLedger {
public:
    struct Checkpoint {
        RoundId round;
        Timestamp lastSettlement;
        Amount rollover;
    };

    RoundLedger(Centi initialBaseline, Timestamp openedAt);

    RoundId currentRound() const { return currentRound_; }
    const RoundBook& current() const { return rounds_.at(currentRound_); }
    const RoundBook* book(RoundId round) const;
    Centi baseline() const { return current().baseline; }
    Timestamp lastSettlement() const { return lastSettlement_; }
    Amount rollover() const { return rollover_; }

    // Validates against `cfg` and the betting window, then books the stake.
    // Nothing is mutated when a MarketError is thrown.
    BetPlaced stake(const Bet& bet, const MarketConfig& cfg, Timestamp now);

    Position position(RoundId round, const Address& participant) const;

    // Opens the next round with `newBaseline`; the sealed round's book is kept.
    void advance(Centi newBaseline, Timestamp settledAt, Amount newRollover);

    Checkpoint checkpoint() const;
    void rollback(const Checkpoint& cp);

private:
    RoundId currentRound_ = 1;
    Timestamp lastSettlement_;
    Amount rollover_ = 0;
    std::map<RoundId, RoundBook> rounds_;
};

} // namespace hilo
