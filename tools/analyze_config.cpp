#include "errors.hpp"
#include "fixed_point.hpp"
#include "market_config.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>

namespace {

// Net multiple on a winning stake when the winning side holds `share` of a
// two-sided pot and no rollover is carried.
double payoutMultiple(double share, std::uint32_t feeBps) {
    return (1.0 - static_cast<double>(feeBps) / 10'000.0) / share;
}

} // namespace

int main() {
    hilo::MarketConfig defaults;
    defaults.owner = "owner";
    hilo::MarketConfig cfg;
    try {
        hilo::configureLogging();
        cfg = hilo::loadMarketConfig(defaults);
    } catch (const hilo::MarketError& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    std::cout << "=== MARKET SCHEDULE ===\n";
    std::cout << "Settlement interval: " << cfg.settlementInterval << "s\n";
    std::cout << "Betting cutoff lead: " << cfg.bettingCutoff << "s (betting open "
              << (cfg.settlementInterval - cfg.bettingCutoff) << "s per round)\n";
    std::cout << "Claim window: ";
    if (cfg.claimWindow == 0) {
        std::cout << "unlimited\n";
    } else {
        std::cout << cfg.claimWindow << "s after settlement\n";
    }
    std::cout << "Stake limits: min " << cfg.minStake << ", max ";
    if (cfg.maxStake == 0) {
        std::cout << "unlimited\n";
    } else {
        std::cout << cfg.maxStake << "\n";
    }
    std::cout << "Outcome domain: [" << cfg.outcomeMin.toString() << ", " << cfg.outcomeMax.toString() << "]\n";

    std::cout << "\n=== FEE ANALYSIS ===\n";
    std::cout << "Fee rate: " << cfg.feeBps << " bps (" << std::fixed << std::setprecision(2)
              << (static_cast<double>(cfg.feeBps) / 100.0) << "% of new stakes in decided rounds)\n";
    for (hilo::Amount pot : { 100ULL, 1'000ULL, 10'000ULL, 1'000'000ULL }) {
        hilo::Amount fee = hilo::mulDivFloor(pot, cfg.feeBps, hilo::kMaxFeeBps);
        std::cout << "  pot " << std::setw(9) << pot << " -> fee " << std::setw(7) << fee << ", winners share "
                  << (pot - fee) << '\n';
    }
    hilo::Amount smallestFeePot = cfg.feeBps == 0 ? 0 : (hilo::kMaxFeeBps + cfg.feeBps - 1) / cfg.feeBps;
    if (smallestFeePot != 0) {
        std::cout << "Smallest decided pot that pays any fee: " << smallestFeePot << '\n';
    }

    std::cout << "\n=== BREAK-EVEN ===\n";
    std::cout << "Winning-side share of pot -> payout multiple, break-even win rate\n";
    for (double share : { 0.10, 0.25, 0.50, 0.75, 0.90 }) {
        double multiple = payoutMultiple(share, cfg.feeBps);
        std::cout << "  " << std::setw(4) << std::setprecision(0) << (share * 100.0) << "% -> "
                  << std::setprecision(3) << multiple << "x, " << std::setprecision(1)
                  << (100.0 / multiple) << "%\n";
    }
    std::cout << "Ties and one-sided rounds carry no fee; ties roll the pot forward.\n";
    return 0;
}
