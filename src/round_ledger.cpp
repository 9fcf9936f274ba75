#include "round_ledger.hpp"

#include "errors.hpp"
#include "window_policy.hpp"

#include <string>

#include <spdlog/spdlog.h>

namespace hilo {

RoundLedger::RoundLedger(Centi initialBaseline, Timestamp openedAt) : lastSettlement_(openedAt) {
    RoundBook first;
    first.baseline = initialBaseline;
    rounds_.emplace(currentRound_, std::move(first));
}

const RoundBook* RoundLedger::book(RoundId round) const {
    auto it = rounds_.find(round);
    return it == rounds_.end() ? nullptr : &it->second;
}

BetPlaced RoundLedger::stake(const Bet& bet, const MarketConfig& cfg, Timestamp now) {
    if (cfg.paused) {
        throw MarketError(ErrorCode::Paused, "Market is paused");
    }
    if (cfg.safeMode) {
        throw MarketError(ErrorCode::SafeMode, "Market is in safe mode; new stakes are disabled");
    }
    if (bet.amount == 0) {
        throw MarketError(ErrorCode::StakeZero, "Stake must be positive");
    }
    if (bet.amount < cfg.minStake) {
        throw MarketError(ErrorCode::StakeBelowMinimum,
                          "Stake " + std::to_string(bet.amount) + " below minimum " +
                              std::to_string(cfg.minStake));
    }
    if (cfg.maxStake != 0 && bet.amount > cfg.maxStake) {
        throw MarketError(ErrorCode::StakeAboveMaximum,
                          "Stake " + std::to_string(bet.amount) + " above maximum " +
                              std::to_string(cfg.maxStake));
    }
    if (!WindowPolicy::bettingOpen(now, lastSettlement_, cfg.settlementInterval, cfg.bettingCutoff, false)) {
        throw MarketError(ErrorCode::BettingClosed,
                          "Betting is closed for round " + std::to_string(currentRound_));
    }

    RoundBook& book = rounds_.at(currentRound_);
    Amount& pool = bet.side == Side::Higher ? book.higherPool : book.lowerPool;
    Amount newPool = checkedAdd(pool, bet.amount);
    // The settlement total must stay representable as well.
    (void)checkedAdd(checkedAdd(book.newStakes(), bet.amount), rollover_);

    Position& position = book.positions[bet.participant];
    Amount& held = bet.side == Side::Higher ? position.higher : position.lower;
    held += bet.amount;
    pool = newPool;

    spdlog::debug("round {} pools higher={} lower={}", currentRound_, book.higherPool, book.lowerPool);
    return BetPlaced{ currentRound_, bet.participant, bet.side, bet.amount, book.baseline };
}

Position RoundLedger::position(RoundId round, const Address& participant) const {
    const RoundBook* roundBook = book(round);
    if (roundBook == nullptr) {
        return {};
    }
    auto it = roundBook->positions.find(participant);
    return it == roundBook->positions.end() ? Position{} : it->second;
}

void RoundLedger::advance(Centi newBaseline, Timestamp settledAt, Amount newRollover) {
    RoundBook next;
    next.baseline = newBaseline;
    rounds_.emplace(currentRound_ + 1, std::move(next));
    ++currentRound_;
    lastSettlement_ = settledAt;
    rollover_ = newRollover;
}

RoundLedger::Checkpoint RoundLedger::checkpoint() const {
    return Checkpoint{ currentRound_, lastSettlement_, rollover_ };
}

void RoundLedger::rollback(const Checkpoint& cp) {
    rounds_.erase(rounds_.upper_bound(cp.round), rounds_.end());
    currentRound_ = cp.round;
    lastSettlement_ = cp.lastSettlement;
    rollover_ = cp.rollover;
}

} // namespace hilo
