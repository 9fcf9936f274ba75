#pragma once

#include "betting.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace hilo {

struct MarketConfig {
    Amount minStake = 1;
    Amount maxStake = 0; // 0 = unlimited
    Duration settlementInterval = 3'600;
    Duration bettingCutoff = 300;
    std::uint32_t feeBps = 200;
    Duration claimWindow = 0; // 0 = claims never expire

    Centi outcomeMin = Centi::fromRaw(1);
    Centi outcomeMax = Centi::fromRaw(std::numeric_limits<std::int64_t>::max());

    Address owner;
    Address keeper;
    Address treasury;
    std::string outcomeSourceId;

    bool paused = false;
    bool safeMode = false;

    // Throws MarketError(InvalidConfig) naming the first violated rule.
    void validate() const;
    bool outcomeInRange(Centi value) const { return value >= outcomeMin && value <= outcomeMax; }
};

constexpr std::uint32_t kMaxFeeBps = 10'000;

// Applies HILO_* environment overrides on top of `defaults` and validates the result.
MarketConfig loadMarketConfig(const MarketConfig& defaults = MarketConfig{});

// Deployment scope used when signing audit roots. HILO_DEPLOYMENT_ID is required.
std::string resolveDeploymentId();
std::string resolveChainId();

// Reads HILO_LOG_LEVEL and applies it to the default spdlog logger. Unknown
// level names throw MarketError(InvalidConfig).
void configureLogging();

// Digits only, within uint64 range; anything else throws MarketError(InvalidConfig) naming `name`.
std::uint64_t parseUnsigned(const char* name, const std::string& value);

} // namespace hilo
