#include "market.hpp"

#include "errors.hpp"
#include "window_policy.hpp"

#include <exception>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace hilo {

HiLoMarket::HiLoMarket(MarketConfig config,
                       Centi initialBaseline,
                       Timestamp deployedAt,
                       TransferGatewayPtr gateway,
                       OutcomeSourcePtr outcomeSource)
    : config_(std::move(config)),
      access_(config_),
      ledger_(initialBaseline, deployedAt),
      settlement_(ledger_),
      claims_(ledger_, settlement_),
      gateway_(std::move(gateway)),
      outcomeSource_(std::move(outcomeSource)) {
    config_.validate();
    if (!gateway_) {
        throw MarketError(ErrorCode::InvalidConfig, "Transfer gateway not configured");
    }
    if (!config_.outcomeInRange(initialBaseline)) {
        throw MarketError(ErrorCode::OutcomeOutOfRange,
                          "Initial baseline " + initialBaseline.toString() + " outside outcome domain");
    }
    spdlog::info("market opened: owner={} keeper={} baseline={} interval={}s cutoff={}s fee={}bps",
                 config_.owner, config_.keeper, initialBaseline.toString(),
                 config_.settlementInterval, config_.bettingCutoff, config_.feeBps);
}

void HiLoMarket::stake(const Address& caller, Side side, Amount amount, Timestamp now) {
    if (caller.empty()) {
        throw MarketError(ErrorCode::InvalidConfig, "Participant identity must not be empty");
    }
    auto lock = guard_.acquire();
    Amount newHeld = checkedAdd(heldBalance_, amount);
    BetPlaced event = ledger_.stake(Bet{ caller, side, amount }, config_, now);
    heldBalance_ = newHeld;
    spdlog::info("{} staked {} on {} in round {}", caller, amount, toString(side), event.round);
    emit(event);
}

void HiLoMarket::receive(const Address& sender, Amount amount) {
    spdlog::warn("rejected unsolicited transfer of {} from {}", amount, sender);
    throw MarketError(ErrorCode::UnsolicitedTransfer,
                      "Value may only enter the market through stake()");
}

bool HiLoMarket::bettingOpen(Timestamp now) const {
    return WindowPolicy::bettingOpen(now, ledger_.lastSettlement(), config_.settlementInterval,
                                     config_.bettingCutoff, config_.paused || config_.safeMode);
}

Duration HiLoMarket::timeUntilBettingCloses(Timestamp now) const {
    return WindowPolicy::timeUntilBettingCloses(now, ledger_.lastSettlement(),
                                                config_.settlementInterval, config_.bettingCutoff);
}

Duration HiLoMarket::timeUntilSettlement(Timestamp now) const {
    return WindowPolicy::timeUntilSettlement(now, ledger_.lastSettlement(), config_.settlementInterval);
}

MarketState HiLoMarket::getMarketState(Timestamp now) const {
    const RoundBook& book = ledger_.current();
    MarketState state;
    state.round = ledger_.currentRound();
    state.baseline = book.baseline;
    state.higherPool = book.higherPool;
    state.lowerPool = book.lowerPool;
    state.rollover = ledger_.rollover();
    state.bettingOpen = bettingOpen(now);
    state.timeUntilBettingCloses = timeUntilBettingCloses(now);
    state.timeUntilSettlement = timeUntilSettlement(now);
    state.paused = config_.paused;
    state.safeMode = config_.safeMode;
    return state;
}

BetView HiLoMarket::getMyBet(const Address& participant) const {
    return BetView{ ledger_.currentRound(), ledger_.position(ledger_.currentRound(), participant) };
}

Amount HiLoMarket::claimable(RoundId round, const Address& participant, Timestamp now) const {
    Amount payout = claims_.claimable(round, participant, now, config_.claimWindow);
    return payout <= heldBalance_ ? payout : 0;
}

RoundResult HiLoMarket::settle(const Address& caller, Centi reportedOutcome, Timestamp now) {
    access_.requireSettler(caller, "settle");
    requireNotPaused("settle");
    auto lock = guard_.acquire();

    RoundSettled event = settlement_.settle(reportedOutcome, now, config_, heldBalance_, *gateway_);
    heldBalance_ -= event.fee;
    emit(event);
    return *settlement_.result(event.round);
}

RoundResult HiLoMarket::settleFromSource(const Address& caller, Timestamp now) {
    access_.requireSettler(caller, "settleFromSource");
    if (!outcomeSource_) {
        throw MarketError(ErrorCode::InvalidConfig, "Outcome source not configured");
    }
    requireNotPaused("settleFromSource");
    if (guard_.entered()) {
        throw MarketError(ErrorCode::ReentrantCall, "Reentrant call rejected");
    }
    OutcomeReport report = outcomeSource_->fetchReport();
    RoundResult result = settle(caller, report.value, now);
    if (!report.evidence.empty()) {
        auditLog_.appendRaw("outcome-evidence:" + std::to_string(result.round) + ":" +
                            config_.outcomeSourceId + ":" + report.evidence);
    }
    return result;
}

Amount HiLoMarket::claim(const Address& caller, RoundId round, Timestamp now) {
    auto lock = guard_.acquire();
    ClaimEngine::Assessment assessment = claims_.assess(round, caller, now, config_.claimWindow);
    if (assessment.ok() && assessment.payout > heldBalance_) {
        throw MarketError(ErrorCode::InsufficientBalance,
                          "Market holds " + std::to_string(heldBalance_) + ", payout needs " +
                              std::to_string(assessment.payout));
    }
    WinningsClaimed event = claims_.claim(round, caller, now, config_.claimWindow, *gateway_);
    heldBalance_ -= event.amount;
    emit(event);
    return event.amount;
}

template <typename Mutate>
void HiLoMarket::updateConfig(const Address& caller,
                              const char* operation,
                              const std::string& value,
                              Mutate mutate) {
    access_.requireOwner(caller, operation);
    auto lock = guard_.acquire();
    MarketConfig candidate = config_;
    mutate(candidate);
    candidate.validate();
    config_ = std::move(candidate);
    spdlog::info("{} -> {}", operation, value);
    emit(ConfigChanged{ operation, value });
}

void HiLoMarket::pause(const Address& caller) {
    updateConfig(caller, "pause", "true", [](MarketConfig& cfg) { cfg.paused = true; });
}

void HiLoMarket::unpause(const Address& caller) {
    updateConfig(caller, "unpause", "false", [](MarketConfig& cfg) { cfg.paused = false; });
}

void HiLoMarket::setKeeper(const Address& caller, const Address& keeper) {
    updateConfig(caller, "setKeeper", keeper, [&](MarketConfig& cfg) { cfg.keeper = keeper; });
}

void HiLoMarket::setTreasury(const Address& caller, const Address& treasury) {
    updateConfig(caller, "setTreasury", treasury, [&](MarketConfig& cfg) { cfg.treasury = treasury; });
}

void HiLoMarket::setMinBet(const Address& caller, Amount minStake) {
    updateConfig(caller, "setMinBet", std::to_string(minStake),
                 [&](MarketConfig& cfg) { cfg.minStake = minStake; });
}

void HiLoMarket::setMaxBet(const Address& caller, Amount maxStake) {
    updateConfig(caller, "setMaxBet", std::to_string(maxStake),
                 [&](MarketConfig& cfg) { cfg.maxStake = maxStake; });
}

void HiLoMarket::setSafeMode(const Address& caller, bool enabled) {
    updateConfig(caller, "setSafeMode", enabled ? "true" : "false",
                 [&](MarketConfig& cfg) { cfg.safeMode = enabled; });
}

void HiLoMarket::setFeeBps(const Address& caller, std::uint32_t feeBps) {
    updateConfig(caller, "setFeeBps", std::to_string(feeBps),
                 [&](MarketConfig& cfg) { cfg.feeBps = feeBps; });
}

void HiLoMarket::setSchedule(const Address& caller, Duration interval, Duration cutoffLead) {
    updateConfig(caller, "setSchedule", std::to_string(interval) + "/" + std::to_string(cutoffLead),
                 [&](MarketConfig& cfg) {
                     cfg.settlementInterval = interval;
                     cfg.bettingCutoff = cutoffLead;
                 });
}

void HiLoMarket::setOutcomeBounds(const Address& caller, Centi min, Centi max) {
    updateConfig(caller, "setOutcomeBounds", min.toString() + ".." + max.toString(),
                 [&](MarketConfig& cfg) {
                     cfg.outcomeMin = min;
                     cfg.outcomeMax = max;
                 });
}

void HiLoMarket::setClaimWindow(const Address& caller, Duration window) {
    updateConfig(caller, "setClaimWindow", std::to_string(window),
                 [&](MarketConfig& cfg) { cfg.claimWindow = window; });
}

void HiLoMarket::setOutcomeSource(const Address& caller, OutcomeSourcePtr source, const std::string& sourceId) {
    updateConfig(caller, "setOutcomeSource", sourceId,
                 [&](MarketConfig& cfg) { cfg.outcomeSourceId = sourceId; });
    outcomeSource_ = std::move(source);
}

void HiLoMarket::transferOwnership(const Address& caller, const Address& newOwner) {
    auto lock = guard_.acquire();
    access_.transferOwnership(caller, newOwner);
    spdlog::info("ownership transferred to {}", newOwner);
    emit(ConfigChanged{ "transferOwnership", newOwner });
}

void HiLoMarket::rescue(const Address& caller, const Address& recipient, Amount amount) {
    access_.requireOwner(caller, "rescue");
    if (!config_.paused) {
        throw MarketError(ErrorCode::NotPaused, "rescue is only available while paused");
    }
    if (recipient.empty() || amount == 0) {
        throw MarketError(ErrorCode::InvalidConfig, "rescue needs a recipient and a positive amount");
    }
    auto lock = guard_.acquire();
    if (amount > heldBalance_) {
        throw MarketError(ErrorCode::InsufficientBalance,
                          "Market holds " + std::to_string(heldBalance_) + ", rescue asked for " +
                              std::to_string(amount));
    }
    if (!gateway_->send(recipient, amount)) {
        spdlog::warn("rescue of {} to {} refused", amount, recipient);
        throw MarketError(ErrorCode::TransferFailed, "Rescue transfer to " + recipient + " failed");
    }
    heldBalance_ -= amount;
    spdlog::warn("rescued {} to {}", amount, recipient);
    emit(FundsRescued{ recipient, amount });
}

std::optional<RoundResult> HiLoMarket::roundResult(RoundId round) const {
    const RoundResult* result = settlement_.result(round);
    if (result == nullptr) {
        return std::nullopt;
    }
    return *result;
}

Position HiLoMarket::positionOf(RoundId round, const Address& participant) const {
    return ledger_.position(round, participant);
}

bool HiLoMarket::hasClaimed(RoundId round, const Address& participant) const {
    return claims_.hasClaimed(round, participant);
}

void HiLoMarket::addListener(EventListener listener) {
    listeners_.push_back(std::move(listener));
}

void HiLoMarket::emit(const MarketEvent& event) {
    events_.push_back(event);
    auditLog_.append(event);
    spdlog::debug("event {}", describeEvent(event));
    // Runs after the commit; listener failures are logged only.
    for (const auto& listener : listeners_) {
        try {
            listener(event);
        } catch (const std::exception& ex) {
            spdlog::error("event listener failed on {}: {}", describeEvent(event), ex.what());
        }
    }
}

void HiLoMarket::requireNotPaused(const char* operation) const {
    if (config_.paused) {
        throw MarketError(ErrorCode::Paused, std::string(operation) + " is unavailable while paused");
    }
}

} // namespace hilo
