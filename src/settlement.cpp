#include "settlement.hpp"

#include "errors.hpp"
#include "window_policy.hpp"

#include <string>

#include <spdlog/spdlog.h>

namespace hilo {

const char* toString(RoundOutcome outcome) {
    switch (outcome) {
    case RoundOutcome::NoParticipation: return "no-participation";
    case RoundOutcome::OneSided: return "one-sided";
    case RoundOutcome::Tie: return "tie";
    case RoundOutcome::Decided: return "decided";
    }
    return "unknown";
}

RoundResult SettlementEngine::classify(RoundId round,
                                       const RoundBook& book,
                                       Amount rollover,
                                       Centi reportedOutcome,
                                       std::uint32_t feeBps,
                                       Timestamp now) {
    RoundResult result;
    result.round = round;
    result.baseline = book.baseline;
    result.reportedOutcome = reportedOutcome;
    result.higherPool = book.higherPool;
    result.lowerPool = book.lowerPool;
    result.rolloverBefore = rollover;
    result.rolloverAfter = rollover;
    result.settledAt = now;

    const Amount newStakes = checkedAdd(book.higherPool, book.lowerPool);
    const Amount total = checkedAdd(newStakes, rollover);

    // No new stakes: nothing to refund and nobody who could win the carried
    // pot, so any rollover stays where it is. An unchanged outcome over a
    // carried pot is still reported as a tie.
    if (newStakes == 0) {
        result.outcome = (rollover != 0 && reportedOutcome == book.baseline) ? RoundOutcome::Tie
                                                                             : RoundOutcome::NoParticipation;
        return result;
    }

    if ((book.higherPool == 0) != (book.lowerPool == 0)) {
        result.outcome = RoundOutcome::OneSided;
        result.distributable = newStakes;
        return result;
    }

    if (reportedOutcome == book.baseline) {
        result.outcome = RoundOutcome::Tie;
        result.rolloverAfter = total;
        return result;
    }

    result.outcome = RoundOutcome::Decided;
    result.winningSide = reportedOutcome > book.baseline ? Side::Higher : Side::Lower;
    // Carried rollover is fee-exempt.
    result.fee = mulDivFloor(newStakes, feeBps, kMaxFeeBps);
    result.distributable = total - result.fee;
    result.rolloverAfter = 0;
    return result;
}

RoundSettled SettlementEngine::settle(Centi reportedOutcome,
                                      Timestamp now,
                                      const MarketConfig& cfg,
                                      Amount available,
                                      TransferGateway& gateway) {
    if (!WindowPolicy::settlementReady(now, ledger_.lastSettlement(), cfg.settlementInterval)) {
        throw MarketError(
            ErrorCode::SettlementTooEarly,
            "Round " + std::to_string(ledger_.currentRound()) + " cannot settle for another " +
                std::to_string(WindowPolicy::timeUntilSettlement(now, ledger_.lastSettlement(),
                                                                 cfg.settlementInterval)) +
                "s");
    }
    if (!cfg.outcomeInRange(reportedOutcome)) {
        throw MarketError(ErrorCode::OutcomeOutOfRange,
                          "Reported outcome " + reportedOutcome.toString() + " outside [" +
                              cfg.outcomeMin.toString() + ", " + cfg.outcomeMax.toString() + "]");
    }

    const RoundId round = ledger_.currentRound();
    RoundResult result =
        classify(round, ledger_.current(), ledger_.rollover(), reportedOutcome, cfg.feeBps, now);
    if (result.fee > 0 && cfg.treasury.empty()) {
        throw MarketError(ErrorCode::InvalidConfig, "Treasury is not configured");
    }
    if (result.fee > available) {
        throw MarketError(ErrorCode::InsufficientBalance,
                          "Fee " + std::to_string(result.fee) + " exceeds held balance " +
                              std::to_string(available));
    }

    RoundSettled event;
    event.round = round;
    event.reportedOutcome = reportedOutcome;
    event.priorBaseline = result.baseline;
    event.winningSide = result.winningSide;
    event.tie = result.outcome == RoundOutcome::Tie;
    event.totalPot = result.totalPot();
    event.fee = result.fee;

    // Snapshot first, then rotate; the snapshot is what claims will read.
    const RoundLedger::Checkpoint checkpoint = ledger_.checkpoint();
    results_.emplace(round, result);
    ledger_.advance(reportedOutcome, now, result.rolloverAfter);

    auto undo = [&]() {
        ledger_.rollback(checkpoint);
        results_.erase(round);
    };

    if (result.fee > 0) {
        bool delivered = false;
        try {
            delivered = gateway.send(cfg.treasury, result.fee);
        } catch (...) {
            undo();
            throw;
        }
        if (!delivered) {
            undo();
            spdlog::warn("round {} settlement aborted: treasury {} refused fee {}", round, cfg.treasury,
                         result.fee);
            throw MarketError(ErrorCode::TransferFailed,
                              "Fee transfer to treasury " + cfg.treasury + " failed");
        }
    }

    totalFees_ += result.fee;
    spdlog::info("round {} settled {}: outcome={} baseline={} pot={} fee={} rollover={}", round,
                 toString(result.outcome), reportedOutcome.toString(), result.baseline.toString(),
                 result.totalPot(), result.fee, result.rolloverAfter);
    return event;
}

const RoundResult* SettlementEngine::result(RoundId round) const {
    auto it = results_.find(round);
    return it == results_.end() ? nullptr : &it->second;
}

} // namespace hilo
