#include "claims.hpp"

#include "errors.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace hilo {

namespace {

ClaimEngine::Assessment blockedBy(ErrorCode code, std::string reason) {
    ClaimEngine::Assessment out;
    out.blocked = code;
    out.reason = std::move(reason);
    return out;
}

} // namespace

ClaimEngine::Assessment ClaimEngine::assess(RoundId round,
                                            const Address& participant,
                                            Timestamp now,
                                            Duration claimWindow) const {
    const RoundResult* result = settlement_.result(round);
    if (result == nullptr) {
        return blockedBy(ErrorCode::RoundNotSettled, "Round " + std::to_string(round) + " is not settled");
    }
    if (hasClaimed(round, participant)) {
        return blockedBy(ErrorCode::AlreadyClaimed,
                         participant + " already claimed round " + std::to_string(round));
    }
    if (claimWindow != 0 && now > saturatingAdd(result->settledAt, claimWindow)) {
        return blockedBy(ErrorCode::ClaimWindowClosed,
                         "Claim window for round " + std::to_string(round) + " has closed");
    }

    const Position position = ledger_.position(round, participant);
    Assessment out;
    switch (result->outcome) {
    case RoundOutcome::NoParticipation:
    case RoundOutcome::Tie:
        break;
    case RoundOutcome::OneSided:
        // Only one side had stake, so the total is a full refund.
        out.payout = position.total();
        break;
    case RoundOutcome::Decided: {
        const Amount stake = position.on(*result->winningSide);
        if (stake != 0) {
            out.payout = mulDivFloor(stake, result->distributable, result->winningPool());
        }
        break;
    }
    }

    if (out.payout == 0) {
        return blockedBy(ErrorCode::NothingToClaim,
                         "Nothing to claim for " + participant + " in round " + std::to_string(round) +
                             " (" + toString(result->outcome) + ")");
    }
    return out;
}

Amount ClaimEngine::claimable(RoundId round,
                              const Address& participant,
                              Timestamp now,
                              Duration claimWindow) const {
    Assessment assessment = assess(round, participant, now, claimWindow);
    return assessment.ok() ? assessment.payout : 0;
}

WinningsClaimed ClaimEngine::claim(RoundId round,
                                   const Address& participant,
                                   Timestamp now,
                                   Duration claimWindow,
                                   TransferGateway& gateway) {
    Assessment assessment = assess(round, participant, now, claimWindow);
    if (!assessment.ok()) {
        throw MarketError(*assessment.blocked, assessment.reason);
    }

    auto& claimedInRound = claimed_[round];
    claimedInRound.insert(participant);
    auto undo = [&]() {
        claimedInRound.erase(participant);
        if (claimedInRound.empty()) {
            claimed_.erase(round);
        }
    };

    bool delivered = false;
    try {
        delivered = gateway.send(participant, assessment.payout);
    } catch (...) {
        undo();
        throw;
    }
    if (!delivered) {
        undo();
        spdlog::warn("claim by {} for round {} failed: transfer of {} refused", participant, round,
                     assessment.payout);
        throw MarketError(ErrorCode::TransferFailed,
                          "Payout transfer to " + participant + " failed");
    }

    totalPaid_ += assessment.payout;
    spdlog::info("{} claimed {} for round {}", participant, assessment.payout, round);
    return WinningsClaimed{ round, participant, assessment.payout };
}

bool ClaimEngine::hasClaimed(RoundId round, const Address& participant) const {
    auto it = claimed_.find(round);
    return it != claimed_.end() && it->second.count(participant) != 0;
}

} // namespace hilo
