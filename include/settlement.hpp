#pragma once

#include "betting.hpp"
#include "events.hpp"
#include "market_config.hpp"
#include "round_ledger.hpp"
#include "transfer_gateway.hpp"

#include <map>
#include <optional>

namespace hilo {

enum class RoundOutcome { NoParticipation, OneSided, Tie, Decided };

const char* toString(RoundOutcome outcome);

// Frozen at settlement; claims read only this, never the live pools.
struct RoundResult {
    RoundId round = 0;
    RoundOutcome outcome = RoundOutcome::NoParticipation;
    Centi baseline;
    Centi reportedOutcome;
    Amount higherPool = 0;
    Amount lowerPool = 0;
    Amount rolloverBefore = 0;
    Amount rolloverAfter = 0;
    Amount fee = 0;
    // Decided: owed to the winning side after fee. OneSided: refundable stakes.
    Amount distributable = 0;
    std::optional<Side> winningSide;
    Timestamp settledAt = 0;

    Amount newStakes() const { return higherPool + lowerPool; }
    Amount totalPot() const { return newStakes() + rolloverBefore; }
    Amount winningPool() const {
        if (!winningSide) {
            return 0;
        }
        return *winningSide == Side::Higher ? higherPool : lowerPool;
    }
};

class SettlementEngine {
public:
    explicit SettlementEngine(RoundLedger& ledger) : ledger_(ledger) {}

    // Pure classification of one round. Does not check timing or bounds.
    static RoundResult classify(RoundId round,
                                const RoundBook& book,
                                Amount rollover,
                                Centi reportedOutcome,
                                std::uint32_t feeBps,
                                Timestamp now);

    // Validates timing and outcome domain, freezes the result, rotates the
    // ledger and delivers the fee to cfg.treasury out of `available`. If the
    // fee transfer fails every change is rolled back and TransferFailed is thrown.
    RoundSettled settle(Centi reportedOutcome,
                        Timestamp now,
                        const MarketConfig& cfg,
                        Amount available,
                        TransferGateway& gateway);

    const RoundResult* result(RoundId round) const;
    std::size_t settledRounds() const { return results_.size(); }
    Amount totalFees() const { return totalFees_; }

private:
    RoundLedger& ledger_;
    std::map<RoundId, RoundResult> results_;
    Amount totalFees_ = 0;
};

} // namespace hilo
