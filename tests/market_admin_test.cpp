#include "access_control.hpp"
#include "market.hpp"

#include "test_support.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <variant>

namespace {

using namespace hilo;
using namespace hilo::testing;

const Centi kUp = Centi::fromRaw(1450);

void constructionIsValidated() {
    spdlog::set_level(spdlog::level::warn);
    auto gateway = std::make_shared<RecordingGateway>();

    MarketConfig noOwner = makeConfig();
    noOwner.owner.clear();
    expectError(ErrorCode::InvalidConfig,
                [&] { HiLoMarket m(noOwner, Centi::fromRaw(1210), kDeployedAt, gateway); }, "missing owner");

    MarketConfig badCutoff = makeConfig();
    badCutoff.bettingCutoff = badCutoff.settlementInterval + 1;
    expectError(ErrorCode::InvalidConfig,
                [&] { HiLoMarket m(badCutoff, Centi::fromRaw(1210), kDeployedAt, gateway); }, "cutoff too long");

    expectError(ErrorCode::InvalidConfig,
                [&] { HiLoMarket m(makeConfig(), Centi::fromRaw(1210), kDeployedAt, nullptr); }, "no gateway");
    expectError(ErrorCode::OutcomeOutOfRange,
                [&] { HiLoMarket m(makeConfig(), Centi::fromRaw(0), kDeployedAt, gateway); },
                "baseline outside domain");
}

void privilegedCallsRequireOwner() {
    Fixture fx;
    auto& market = *fx.market;
    auto source = std::make_shared<FixedOutcomeSource>(OutcomeReport{ kUp, "" });
    for (const char* caller : { "alice", "keeper", "" }) {
        const std::string who = std::string("caller '") + caller + "' ";
        expectError(ErrorCode::Unauthorized, [&] { market.pause(caller); }, who + "pause");
        expectError(ErrorCode::Unauthorized, [&] { market.unpause(caller); }, who + "unpause");
        expectError(ErrorCode::Unauthorized, [&] { market.setKeeper(caller, caller); }, who + "setKeeper");
        expectError(ErrorCode::Unauthorized, [&] { market.setTreasury(caller, caller); }, who + "setTreasury");
        expectError(ErrorCode::Unauthorized, [&] { market.setMinBet(caller, 5); }, who + "setMinBet");
        expectError(ErrorCode::Unauthorized, [&] { market.setMaxBet(caller, 5); }, who + "setMaxBet");
        expectError(ErrorCode::Unauthorized, [&] { market.setSafeMode(caller, true); }, who + "setSafeMode");
        expectError(ErrorCode::Unauthorized, [&] { market.setFeeBps(caller, 0); }, who + "setFeeBps");
        expectError(ErrorCode::Unauthorized, [&] { market.setSchedule(caller, 60, 10); }, who + "setSchedule");
        expectError(ErrorCode::Unauthorized,
                    [&] { market.setOutcomeBounds(caller, Centi::fromRaw(1), Centi::fromRaw(2)); },
                    who + "setOutcomeBounds");
        expectError(ErrorCode::Unauthorized, [&] { market.setClaimWindow(caller, 10); }, who + "setClaimWindow");
        expectError(ErrorCode::Unauthorized, [&] { market.setOutcomeSource(caller, source, "x"); },
                    who + "setOutcomeSource");
        expectError(ErrorCode::Unauthorized, [&] { market.transferOwnership(caller, caller); },
                    who + "transferOwnership");
        expectError(ErrorCode::Unauthorized, [&] { market.rescue(caller, caller, 1); }, who + "rescue");
    }
    check(market.events().empty(), "rejected calls emit nothing");
    check(market.config().owner == "owner", "owner unchanged");
}

void stakeLimitsAndWindow() {
    Fixture fx;
    auto& market = *fx.market;
    market.setMinBet("owner", 10);
    market.setMaxBet("owner", 50);

    const Timestamp t = Fixture::bettingAt(1);
    expectError(ErrorCode::StakeZero, [&] { market.stake("alice", Side::Higher, 0, t); }, "zero stake");
    expectError(ErrorCode::StakeBelowMinimum, [&] { market.stake("alice", Side::Higher, 9, t); }, "below min");
    expectError(ErrorCode::StakeAboveMaximum, [&] { market.stake("alice", Side::Higher, 51, t); }, "above max");
    market.stake("alice", Side::Higher, 10, t);
    market.stake("alice", Side::Higher, 50, t);

    const Timestamp deadline = Fixture::dueAt(1) - kCutoff;
    market.stake("bob", Side::Lower, 20, deadline - 1);
    expectError(ErrorCode::BettingClosed, [&] { market.stake("bob", Side::Lower, 20, deadline); },
                "stake at the deadline");
    expectError(ErrorCode::BettingClosed, [&] { market.stake("bob", Side::Lower, 20, Fixture::dueAt(1) + 999); },
                "stake after the settlement boundary");

    checkEq(market.positionOf(1, "alice").higher, 60ULL, "stakes accumulate");
    checkEq(market.heldBalance(), 80ULL, "held tracks accepted stakes only");

    // A rejected update leaves the config untouched.
    expectError(ErrorCode::InvalidConfig, [&] { market.setMinBet("owner", 60); }, "min above max");
    checkEq(market.config().minStake, 10ULL, "min unchanged");
    expectError(ErrorCode::InvalidConfig, [&] { market.setFeeBps("owner", 10'001); }, "fee above 100%");
    checkEq(market.config().feeBps, 200U, "fee unchanged");
    expectError(ErrorCode::InvalidConfig, [&] { market.setSchedule("owner", 0, 0); }, "zero interval");
    expectError(ErrorCode::InvalidConfig,
                [&] { market.setOutcomeBounds("owner", Centi::fromRaw(500), Centi::fromRaw(500)); },
                "empty outcome domain");

    market.setMaxBet("owner", 0);
    market.stake("carol", Side::Lower, 1'000'000, deadline - 1);
    expectError(ErrorCode::InvalidConfig, [&] { market.stake("", Side::Lower, 10, deadline - 1); },
                "anonymous stake");
}

void pauseAndSafeMode() {
    Fixture fx;
    auto& market = *fx.market;
    const Timestamp t = Fixture::bettingAt(1);
    market.stake("alice", Side::Higher, 100, t);
    market.stake("bob", Side::Lower, 100, t);

    market.pause("owner");
    check(!market.bettingOpen(t), "paused market is closed");
    check(market.getMarketState(t).paused, "state reports pause");
    expectError(ErrorCode::Paused, [&] { market.stake("carol", Side::Higher, 5, t); }, "stake while paused");
    market.unpause("owner");
    check(market.bettingOpen(t), "unpause reopens betting");

    market.setSafeMode("owner", true);
    check(!market.bettingOpen(t), "safe mode closes betting");
    check(market.getMarketState(t).safeMode, "state reports safe mode");
    expectError(ErrorCode::SafeMode, [&] { market.stake("carol", Side::Higher, 5, t); }, "stake in safe mode");

    // Wind-down: existing money can still move out.
    market.settle("keeper", kUp, Fixture::dueAt(1));
    checkEq(market.claim("alice", 1, Fixture::dueAt(1)), 196ULL, "claim in safe mode");
    market.setSafeMode("owner", false);
    market.stake("carol", Side::Higher, 5, Fixture::bettingAt(2));
}

void keeperAndOwnerRotation() {
    Fixture fx;
    auto& market = *fx.market;
    market.setKeeper("owner", "keeper2");
    expectError(ErrorCode::Unauthorized, [&] { market.settle("keeper", kUp, Fixture::dueAt(1)); }, "old keeper");
    market.settle("keeper2", kUp, Fixture::dueAt(1));

    expectError(ErrorCode::InvalidConfig, [&] { market.transferOwnership("owner", ""); }, "empty new owner");
    market.transferOwnership("owner", "founder");
    expectError(ErrorCode::Unauthorized, [&] { market.pause("owner"); }, "old owner");
    market.pause("founder");
    check(market.config().paused, "new owner paused");

    market.setKeeper("founder", "");
    market.unpause("founder");
    expectError(ErrorCode::Unauthorized, [&] { market.settle("keeper2", kUp, Fixture::dueAt(2)); },
                "cleared keeper");
    market.settle("founder", kUp, Fixture::dueAt(2));

    const auto* cleared = std::get_if<ConfigChanged>(&market.events()[market.events().size() - 3]);
    check(cleared != nullptr && cleared->field == "setKeeper" && cleared->value.empty(),
          "keeper removal recorded");
}

void rescueIsGated() {
    Fixture fx;
    auto& market = *fx.market;
    market.stake("alice", Side::Higher, 300, Fixture::bettingAt(1));

    expectError(ErrorCode::NotPaused, [&] { market.rescue("owner", "vault", 100); }, "rescue while live");
    market.pause("owner");
    expectError(ErrorCode::InvalidConfig, [&] { market.rescue("owner", "vault", 0); }, "zero rescue");
    expectError(ErrorCode::InvalidConfig, [&] { market.rescue("owner", "", 10); }, "no recipient");
    expectError(ErrorCode::InsufficientBalance, [&] { market.rescue("owner", "vault", 301); }, "over-rescue");

    fx.gateway->refusing.insert("vault");
    expectError(ErrorCode::TransferFailed, [&] { market.rescue("owner", "vault", 100); }, "refused rescue");
    checkEq(market.heldBalance(), 300ULL, "held intact after refusal");
    fx.gateway->refusing.clear();

    market.rescue("owner", "vault", 120);
    checkEq(market.heldBalance(), 180ULL, "held reduced");
    checkEq(fx.gateway->receivedBy("vault"), 120ULL, "vault paid");
    const auto* rescued = std::get_if<FundsRescued>(&market.events().back());
    check(rescued != nullptr && rescued->amount == 120 && rescued->recipient == "vault", "rescue event");
}

void unsolicitedValueIsRefused() {
    Fixture fx;
    auto& market = *fx.market;
    expectError(ErrorCode::UnsolicitedTransfer, [&] { market.receive("mallory", 500); }, "plain transfer");
    checkEq(market.heldBalance(), 0ULL, "nothing credited");
    check(market.events().empty(), "no event for refused value");
}

void outcomeSourceSettlement() {
    Fixture fx;
    auto& market = *fx.market;
    market.stake("alice", Side::Higher, 100, Fixture::bettingAt(1));
    market.stake("bob", Side::Lower, 100, Fixture::bettingAt(1));
    expectError(ErrorCode::InvalidConfig, [&] { market.settleFromSource("keeper", Fixture::dueAt(1)); },
                "no source configured");

    auto source = std::make_shared<FixedOutcomeSource>(OutcomeReport{ Centi::fromRaw(1100), "feed#42" });
    market.setOutcomeSource("owner", source, "feed-a");
    check(market.config().outcomeSourceId == "feed-a", "source id recorded");

    expectError(ErrorCode::Unauthorized, [&] { market.settleFromSource("alice", Fixture::dueAt(1)); },
                "bettor pulls outcome");
    checkEq(source->reads, std::size_t{ 0 }, "unauthorized call never reads the source");
    expectError(ErrorCode::SettlementTooEarly, [&] { market.settleFromSource("keeper", Fixture::dueAt(1) - 1); },
                "early pull");

    const std::size_t leavesBefore = market.auditLog().size();
    RoundResult result = market.settleFromSource("keeper", Fixture::dueAt(1));
    check(result.winningSide && *result.winningSide == Side::Lower, "source outcome applied");
    checkEq(market.auditLog().size(), leavesBefore + 2, "settlement event plus evidence");
    check(market.auditLog().leaves().back() == AuditLog::hash("outcome-evidence:1:feed-a:feed#42"),
          "evidence leaf");

    source->set(OutcomeReport{ Centi::fromRaw(0), "" });
    expectError(ErrorCode::OutcomeOutOfRange, [&] { market.settleFromSource("keeper", Fixture::dueAt(2)); },
                "source reports outside domain");
    checkEq(market.currentRound(), 2ULL, "bad report does not advance");
}

void viewsAndListeners() {
    Fixture fx;
    auto& market = *fx.market;
    std::size_t heard = 0;
    std::size_t bets = 0;
    market.addListener([&](const MarketEvent& event) {
        ++heard;
        if (std::holds_alternative<BetPlaced>(event)) {
            ++bets;
        }
    });

    const Timestamp t = Fixture::bettingAt(1);
    market.stake("alice", Side::Higher, 70, t);
    market.stake("alice", Side::Lower, 30, t);
    market.stake("bob", Side::Lower, 40, t);

    BetView mine = market.getMyBet("alice");
    checkEq(mine.round, 1ULL, "bet view round");
    checkEq(mine.position.higher, 70ULL, "bet view higher");
    checkEq(mine.position.lower, 30ULL, "bet view lower");
    check(market.getMyBet("nobody").position.empty(), "empty view for strangers");

    MarketState state = market.getMarketState(t);
    checkEq(state.round, 1ULL, "state round");
    check(state.baseline == Centi::fromRaw(1210), "state baseline");
    checkEq(state.higherPool, 70ULL, "state higher pool");
    checkEq(state.lowerPool, 70ULL, "state lower pool");
    check(state.bettingOpen, "state open");
    checkEq(state.timeUntilBettingCloses, kInterval - kCutoff - 10, "betting countdown");
    checkEq(state.timeUntilSettlement, kInterval - 10, "settlement countdown");

    market.setFeeBps("owner", 150);
    const auto* changed = std::get_if<ConfigChanged>(&market.events().back());
    check(changed != nullptr && changed->field == "setFeeBps" && changed->value == "150", "fee change event");

    market.settle("keeper", kUp, Fixture::dueAt(1));
    checkEq(market.totalFees(), 2ULL, "floor(140 * 150 / 10000)");
    checkEq(heard, market.events().size(), "listener saw every event");
    checkEq(bets, std::size_t{ 3 }, "listener saw each stake");
    checkEq(market.auditLog().size(), market.events().size(), "one leaf per event");
    checkEq(market.getMyBet("alice").round, 2ULL, "view follows the live round");
    check(market.getMyBet("alice").position.empty(), "new round has no position");
}

void failingListenerDoesNotUndoCommittedWork() {
    Fixture fx;
    auto& market = *fx.market;
    market.addListener([](const MarketEvent& event) {
        if (std::holds_alternative<WinningsClaimed>(event)) {
            throw std::runtime_error("listener failed");
        }
    });
    std::size_t afterFailure = 0;
    market.addListener([&](const MarketEvent&) { ++afterFailure; });

    market.stake("alice", Side::Higher, 100, Fixture::bettingAt(1));
    market.stake("bob", Side::Lower, 100, Fixture::bettingAt(1));
    market.settle("keeper", kUp, Fixture::dueAt(1));

    checkEq(market.claim("alice", 1, Fixture::dueAt(1)), 196ULL, "claim reports its payout");
    check(market.hasClaimed(1, "alice"), "claim recorded");
    checkEq(fx.gateway->receivedBy("alice"), 196ULL, "paid once");
    checkEq(market.heldBalance(), 0ULL, "held reduced");
    checkEq(afterFailure, market.events().size(), "later listeners still notified");
    expectError(ErrorCode::AlreadyClaimed, [&] { market.claim("alice", 1, Fixture::dueAt(1)); },
                "retry after listener failure");
}

void treasuryCannotReenterSettlement() {
    Fixture fx;
    auto& market = *fx.market;
    market.stake("alice", Side::Higher, 100, Fixture::bettingAt(1));
    market.stake("bob", Side::Lower, 100, Fixture::bettingAt(1));

    const Timestamp t = Fixture::dueAt(1);
    std::size_t nested = 0;
    fx.gateway->onSend = [&](const Address& recipient, Amount) {
        if (recipient != "treasury") {
            return;
        }
        ++nested;
        expectError(ErrorCode::ReentrantCall, [&] { market.settle("keeper", kUp, t); }, "nested settle");
        expectError(ErrorCode::ReentrantCall, [&] { market.stake("carol", Side::Higher, 10, t - kCutoff - 1); },
                    "nested stake");
        expectError(ErrorCode::ReentrantCall, [&] { market.claim("alice", 1, t); }, "nested claim");
        expectError(ErrorCode::ReentrantCall, [&] { market.setTreasury("owner", "elsewhere"); },
                    "nested admin call");
    };

    RoundResult result = market.settle("keeper", kUp, t);
    fx.gateway->onSend = nullptr;
    checkEq(nested, std::size_t{ 1 }, "treasury called once");
    checkEq(result.fee, 4ULL, "outer settlement completes");
    checkEq(fx.gateway->receivedBy("treasury"), 4ULL, "fee delivered once");
    checkEq(market.totalFees(), 4ULL, "fee recorded once");
    checkEq(market.currentRound(), 2ULL, "one rotation");
    check(market.config().treasury == "treasury", "nested setter had no effect");
    checkEq(market.positionOf(1, "carol").total(), 0ULL, "nested stake had no effect");
}

void rescueRecipientCannotReenter() {
    Fixture fx;
    auto& market = *fx.market;
    market.stake("alice", Side::Higher, 300, Fixture::bettingAt(1));
    market.pause("owner");

    std::size_t nested = 0;
    fx.gateway->onSend = [&](const Address& recipient, Amount) {
        if (recipient != "vault") {
            return;
        }
        ++nested;
        expectError(ErrorCode::ReentrantCall, [&] { market.rescue("owner", "vault", 50); }, "nested rescue");
        expectError(ErrorCode::ReentrantCall, [&] { market.unpause("owner"); }, "nested unpause");
        expectError(ErrorCode::ReentrantCall, [&] { market.claim("vault", 1, Fixture::dueAt(1)); },
                    "nested claim");
        expectError(ErrorCode::ReentrantCall,
                    [&] { market.stake("vault", Side::Lower, 10, Fixture::bettingAt(1)); }, "nested stake");
    };

    market.rescue("owner", "vault", 100);
    fx.gateway->onSend = nullptr;
    checkEq(nested, std::size_t{ 1 }, "recipient called once");
    checkEq(fx.gateway->receivedBy("vault"), 100ULL, "rescued once");
    checkEq(market.heldBalance(), 200ULL, "held reduced once");
    check(market.config().paused, "nested unpause had no effect");
}

void missingTreasuryBlocksFeeRounds() {
    Fixture fx;
    auto& market = *fx.market;
    market.setTreasury("owner", "");
    market.stake("alice", Side::Higher, 100, Fixture::bettingAt(1));
    market.stake("bob", Side::Lower, 100, Fixture::bettingAt(1));
    expectError(ErrorCode::InvalidConfig, [&] { market.settle("keeper", kUp, Fixture::dueAt(1)); },
                "fee with no treasury");
    market.setFeeBps("owner", 0);
    RoundResult result = market.settle("keeper", kUp, Fixture::dueAt(1));
    checkEq(result.distributable, 200ULL, "fee-free round needs no treasury");
}

} // namespace

int main() {
    hilo::testing::testName() = "market_admin_test";
    constructionIsValidated();
    privilegedCallsRequireOwner();
    stakeLimitsAndWindow();
    pauseAndSafeMode();
    keeperAndOwnerRotation();
    rescueIsGated();
    unsolicitedValueIsRefused();
    outcomeSourceSettlement();
    viewsAndListeners();
    missingTreasuryBlocksFeeRounds();
    failingListenerDoesNotUndoCommittedWork();
    treasuryCannotReenterSettlement();
    rescueRecipientCannotReenter();
    std::cout << "market_admin_test passed" << std::endl;
    return 0;
}
