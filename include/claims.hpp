#pragma once

#include "betting.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "round_ledger.hpp"
#include "settlement.hpp"
#include "transfer_gateway.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_set>

namespace hilo {

// Pull-based payouts against frozen RoundResults.
class ClaimEngine {
public:
    struct Assessment {
        Amount payout = 0;
        std::optional<ErrorCode> blocked;
        std::string reason;

        bool ok() const { return !blocked.has_value(); }
    };

    ClaimEngine(const RoundLedger& ledger, const SettlementEngine& settlement)
        : ledger_(ledger), settlement_(settlement) {}

    // What claim() would do right now, without side effects.
    Assessment assess(RoundId round, const Address& participant, Timestamp now, Duration claimWindow) const;

    // Zero whenever claim() would fail.
    Amount claimable(RoundId round, const Address& participant, Timestamp now, Duration claimWindow) const;

    // Marks the claim, then pays. A refused transfer clears the mark again and
    // throws TransferFailed so the participant can retry.
    WinningsClaimed claim(RoundId round,
                          const Address& participant,
                          Timestamp now,
                          Duration claimWindow,
                          TransferGateway& gateway);

    bool hasClaimed(RoundId round, const Address& participant) const;
    Amount totalPaid() const { return totalPaid_; }

private:
    const RoundLedger& ledger_;
    const SettlementEngine& settlement_;
    std::map<RoundId, std::unordered_set<Address>> claimed_;
    Amount totalPaid_ = 0;
};

} // namespace hilo
