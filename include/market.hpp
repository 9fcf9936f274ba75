#pragma once

#include "access_control.hpp"
#include "audit_log.hpp"
#include "betting.hpp"
#include "claims.hpp"
#include "events.hpp"
#include "market_config.hpp"
#include "oracle.hpp"
#include "reentrancy_guard.hpp"
#include "round_ledger.hpp"
#include "settlement.hpp"
#include "transfer_gateway.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hilo {

struct MarketState {
    RoundId round = 0;
    Centi baseline;
    Amount higherPool = 0;
    Amount lowerPool = 0;
    Amount rollover = 0;
    bool bettingOpen = false;
    Duration timeUntilBettingCloses = 0;
    Duration timeUntilSettlement = 0;
    bool paused = false;
    bool safeMode = false;
};

struct BetView {
    RoundId round = 0;
    Position position;
};

// Higher/lower market over a rolling baseline. All mutating operations take
// the caller identity and the current time explicitly and are all-or-nothing.
class HiLoMarket {
public:
    HiLoMarket(MarketConfig config,
               Centi initialBaseline,
               Timestamp deployedAt,
               TransferGatewayPtr gateway,
               OutcomeSourcePtr outcomeSource = nullptr);

    HiLoMarket(const HiLoMarket&) = delete;
    HiLoMarket& operator=(const HiLoMarket&) = delete;

    // Value-bearing: `amount` arrives with the call.
    void stake(const Address& caller, Side side, Amount amount, Timestamp now);
    // Value sent outside stake(). Always rejected.
    void receive(const Address& sender, Amount amount);

    bool bettingOpen(Timestamp now) const;
    Duration timeUntilBettingCloses(Timestamp now) const;
    Duration timeUntilSettlement(Timestamp now) const;
    MarketState getMarketState(Timestamp now) const;
    BetView getMyBet(const Address& participant) const;
    Amount claimable(RoundId round, const Address& participant, Timestamp now) const;

    RoundResult settle(const Address& caller, Centi reportedOutcome, Timestamp now);
    RoundResult settleFromSource(const Address& caller, Timestamp now);

    Amount claim(const Address& caller, RoundId round, Timestamp now);

    void pause(const Address& caller);
    void unpause(const Address& caller);
    void setKeeper(const Address& caller, const Address& keeper);
    void setTreasury(const Address& caller, const Address& treasury);
    void setMinBet(const Address& caller, Amount minStake);
    void setMaxBet(const Address& caller, Amount maxStake);
    void setSafeMode(const Address& caller, bool enabled);
    void setFeeBps(const Address& caller, std::uint32_t feeBps);
    void setSchedule(const Address& caller, Duration interval, Duration cutoffLead);
    void setOutcomeBounds(const Address& caller, Centi min, Centi max);
    void setClaimWindow(const Address& caller, Duration window);
    void setOutcomeSource(const Address& caller, OutcomeSourcePtr source, const std::string& sourceId);
    void transferOwnership(const Address& caller, const Address& newOwner);
    // Owner only, and only while paused.
    void rescue(const Address& caller, const Address& recipient, Amount amount);

    std::optional<RoundResult> roundResult(RoundId round) const;
    Position positionOf(RoundId round, const Address& participant) const;
    bool hasClaimed(RoundId round, const Address& participant) const;
    RoundId currentRound() const { return ledger_.currentRound(); }
    Amount rollover() const { return ledger_.rollover(); }
    Amount heldBalance() const { return heldBalance_; }
    Amount totalFees() const { return settlement_.totalFees(); }
    const MarketConfig& config() const { return config_; }

    const std::vector<MarketEvent>& events() const { return events_; }
    const AuditLog& auditLog() const { return auditLog_; }
    std::string auditRoot() const { return auditLog_.merkleRoot(); }
    void addListener(EventListener listener);

private:
    template <typename Mutate>
    void updateConfig(const Address& caller,
                      const char* operation,
                      const std::string& value,
                      Mutate mutate);
    void emit(const MarketEvent& event);
    void requireNotPaused(const char* operation) const;

    MarketConfig config_;
    AccessControl access_;
    ReentrancyGuard guard_;
    RoundLedger ledger_;
    SettlementEngine settlement_;
    ClaimEngine claims_;
    TransferGatewayPtr gateway_;
    OutcomeSourcePtr outcomeSource_;
    Amount heldBalance_ = 0;

    std::vector<MarketEvent> events_;
    AuditLog auditLog_;
    std::vector<EventListener> listeners_;
};

} // namespace hilo
