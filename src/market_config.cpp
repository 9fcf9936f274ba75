#include "market_config.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace hilo {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(env);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

void overrideUnsigned(const char* name, std::uint64_t& field) {
    if (auto value = readEnv(name)) {
        field = parseUnsigned(name, *value);
    }
}

void overrideCenti(const char* name, Centi& field) {
    if (auto value = readEnv(name)) {
        try {
            field = Centi::parse(*value);
        } catch (const MarketError& ex) {
            throw MarketError(ErrorCode::InvalidConfig, std::string(name) + ": " + ex.what());
        }
    }
}

void overrideString(const char* name, std::string& field) {
    if (auto value = readEnv(name)) {
        field = *value;
    }
}

} // namespace

std::uint64_t parseUnsigned(const char* name, const std::string& value) {
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw MarketError(ErrorCode::InvalidConfig,
                          std::string(name) + " must be an unsigned integer, got \"" + value + "\"");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw MarketError(ErrorCode::InvalidConfig, std::string(name) + " is out of range");
    }
}

void MarketConfig::validate() const {
    auto reject = [](const std::string& reason) {
        throw MarketError(ErrorCode::InvalidConfig, "Invalid market config: " + reason);
    };
    if (feeBps > kMaxFeeBps) {
        reject("fee rate above 10000 bps");
    }
    if (maxStake != 0 && minStake > maxStake) {
        reject("minimum stake exceeds maximum stake");
    }
    if (settlementInterval == 0) {
        reject("settlement interval must be positive");
    }
    if (bettingCutoff > settlementInterval) {
        reject("betting cutoff exceeds settlement interval");
    }
    if (!(outcomeMin < outcomeMax)) {
        reject("outcome domain is empty");
    }
    if (owner.empty()) {
        reject("owner must be set");
    }
}

MarketConfig loadMarketConfig(const MarketConfig& defaults) {
    MarketConfig cfg = defaults;
    overrideUnsigned("HILO_MIN_STAKE", cfg.minStake);
    overrideUnsigned("HILO_MAX_STAKE", cfg.maxStake);
    overrideUnsigned("HILO_INTERVAL", cfg.settlementInterval);
    overrideUnsigned("HILO_CUTOFF", cfg.bettingCutoff);
    overrideUnsigned("HILO_CLAIM_WINDOW", cfg.claimWindow);

    std::uint64_t feeBps = cfg.feeBps;
    overrideUnsigned("HILO_FEE_BPS", feeBps);
    if (feeBps > kMaxFeeBps) {
        throw MarketError(ErrorCode::InvalidConfig, "HILO_FEE_BPS must be at most 10000");
    }
    cfg.feeBps = static_cast<std::uint32_t>(feeBps);

    overrideCenti("HILO_OUTCOME_MIN", cfg.outcomeMin);
    overrideCenti("HILO_OUTCOME_MAX", cfg.outcomeMax);
    overrideString("HILO_OWNER", cfg.owner);
    overrideString("HILO_KEEPER", cfg.keeper);
    overrideString("HILO_TREASURY", cfg.treasury);
    overrideString("HILO_OUTCOME_SOURCE", cfg.outcomeSourceId);

    cfg.validate();
    return cfg;
}

std::string resolveDeploymentId() {
    auto deployment = readEnv("HILO_DEPLOYMENT_ID");
    if (!deployment) {
        throw MarketError(ErrorCode::InvalidConfig,
                          "HILO_DEPLOYMENT_ID must be set to a non-empty deployment scope");
    }
    if (*deployment == "default") {
        throw MarketError(
            ErrorCode::InvalidConfig,
            "HILO_DEPLOYMENT_ID cannot be \"default\"; set an environment-specific value such as \"mainnet\" or \"testnet\"");
    }
    return *deployment;
}

std::string resolveChainId() {
    return readEnv("HILO_CHAIN_ID").value_or("");
}

void configureLogging() {
    auto level = readEnv("HILO_LOG_LEVEL");
    if (!level) {
        return;
    }
    const spdlog::level::level_enum parsed = spdlog::level::from_str(*level);
    // from_str maps unknown names to off.
    if (parsed == spdlog::level::off && *level != "off") {
        throw MarketError(ErrorCode::InvalidConfig,
                          "HILO_LOG_LEVEL must be one of trace, debug, info, warning, error, critical, off; got \"" +
                              *level + "\"");
    }
    spdlog::set_level(parsed);
}

} // namespace hilo
