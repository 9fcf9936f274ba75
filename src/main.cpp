#include "betting.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "market.hpp"
#include "market_config.hpp"
#include "transfer_gateway.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

using namespace hilo;

namespace {

// Console stand-in for the value layer: every transfer lands in a local wallet.
class WalletGateway : public TransferGateway {
public:
    bool send(const Address& recipient, Amount amount) override {
        wallets_[recipient] += amount;
        return true;
    }

    void print() const {
        if (wallets_.empty()) {
            std::cout << "  (no payouts yet)\n";
        }
        for (const auto& [who, amount] : wallets_) {
            std::cout << "  " << who << ": " << amount << "\n";
        }
    }

private:
    std::map<Address, Amount> wallets_;
};

void printState(const HiLoMarket& market, Timestamp now) {
    MarketState state = market.getMarketState(now);
    std::cout << "Round " << state.round << "  baseline " << state.baseline.toString() << "\n";
    std::cout << "  higher pool: " << state.higherPool << "  lower pool: " << state.lowerPool
              << "  rollover: " << state.rollover << "\n";
    std::cout << "  betting " << (state.bettingOpen ? "open" : "closed") << ", closes in "
              << state.timeUntilBettingCloses << "s, settles in " << state.timeUntilSettlement << "s\n";
    if (state.paused) {
        std::cout << "  market is PAUSED\n";
    }
    if (state.safeMode) {
        std::cout << "  market is in SAFE MODE\n";
    }
    std::cout << "  held balance: " << market.heldBalance() << "  fees to date: " << market.totalFees() << "\n";
}

void printHelp() {
    std::cout << "Commands:\n"
                 "  stake <who> <higher|lower> <amount>\n"
                 "  settle <who> <outcome>          e.g. settle keeper 14.50\n"
                 "  claim <who> <round>\n"
                 "  claimable <who> <round>\n"
                 "  mybet <who>\n"
                 "  state | wallets | root\n"
                 "  advance <seconds>\n"
                 "  pause | unpause | safemode <on|off>   (as owner)\n"
                 "  help | quit\n";
}

} // namespace

int main() {
    MarketConfig defaults;
    defaults.owner = "owner";
    defaults.keeper = "keeper";
    defaults.treasury = "treasury";

    MarketConfig cfg;
    try {
        configureLogging();
        cfg = loadMarketConfig(defaults);
    } catch (const MarketError& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    Timestamp now = static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());

    std::cout << "Initial baseline (e.g. 12.10): ";
    std::string baselineText;
    if (!(std::cin >> baselineText)) {
        return 0;
    }

    auto wallets = std::make_shared<WalletGateway>();
    std::unique_ptr<HiLoMarket> market;
    try {
        market = std::make_unique<HiLoMarket>(cfg, Centi::parse(baselineText), now, wallets);
    } catch (const MarketError& ex) {
        std::cerr << "Unable to open market: " << ex.what() << "\n";
        return 1;
    }
    market->addListener([](const MarketEvent& event) { std::cout << "  event: " << describeEvent(event) << "\n"; });

    std::cout << "Higher/lower market open. Owner=" << cfg.owner << " keeper=" << cfg.keeper
              << " treasury=" << cfg.treasury << " fee=" << cfg.feeBps << "bps\n";
    printHelp();

    std::string line;
    std::getline(std::cin, line);
    while (true) {
        std::cout << "\n[t=" << now << "] > ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream in(line);
        std::string command;
        if (!(in >> command)) {
            continue;
        }
        if (command == "quit" || command == "exit") {
            break;
        }

        try {
            if (command == "help") {
                printHelp();
            } else if (command == "state") {
                printState(*market, now);
            } else if (command == "wallets") {
                wallets->print();
            } else if (command == "root") {
                std::cout << "Audit root (" << market->auditLog().size() << " leaves): " << market->auditRoot()
                          << "\n";
            } else if (command == "advance") {
                Duration seconds = 0;
                if (!(in >> seconds)) {
                    std::cout << "Usage: advance <seconds>\n";
                    continue;
                }
                now += seconds;
            } else if (command == "stake") {
                std::string who;
                std::string sideText;
                Amount amount = 0;
                if (!(in >> who >> sideText >> amount)) {
                    std::cout << "Usage: stake <who> <higher|lower> <amount>\n";
                    continue;
                }
                auto side = parseSide(sideText);
                if (!side) {
                    std::cout << "Unknown side \"" << sideText << "\"\n";
                    continue;
                }
                market->stake(who, *side, amount, now);
            } else if (command == "settle") {
                std::string who;
                std::string outcome;
                if (!(in >> who >> outcome)) {
                    std::cout << "Usage: settle <who> <outcome>\n";
                    continue;
                }
                RoundResult result = market->settle(who, Centi::parse(outcome), now);
                std::cout << "Round " << result.round << " " << toString(result.outcome) << ", distributable "
                          << result.distributable << ", fee " << result.fee << "\n";
            } else if (command == "claim" || command == "claimable") {
                std::string who;
                RoundId round = 0;
                if (!(in >> who >> round)) {
                    std::cout << "Usage: " << command << " <who> <round>\n";
                    continue;
                }
                if (command == "claim") {
                    std::cout << who << " received " << market->claim(who, round, now) << "\n";
                } else {
                    std::cout << who << " can claim " << market->claimable(round, who, now) << "\n";
                }
            } else if (command == "mybet") {
                std::string who;
                if (!(in >> who)) {
                    std::cout << "Usage: mybet <who>\n";
                    continue;
                }
                BetView bet = market->getMyBet(who);
                std::cout << who << " in round " << bet.round << ": higher " << bet.position.higher << ", lower "
                          << bet.position.lower << "\n";
            } else if (command == "pause") {
                market->pause(cfg.owner);
            } else if (command == "unpause") {
                market->unpause(cfg.owner);
            } else if (command == "safemode") {
                std::string flag;
                in >> flag;
                market->setSafeMode(cfg.owner, flag == "on");
            } else {
                std::cout << "Unknown command. Type help.\n";
            }
        } catch (const MarketError& ex) {
            std::cout << "Rejected [" << toString(ex.kind()) << "/" << toString(ex.code()) << "]: " << ex.what()
                      << "\n";
        }
    }

    std::cout << "\nFinal audit root: " << market->auditRoot() << "\n";
    spdlog::info("console closed after {} events", market->events().size());
    return 0;
}
