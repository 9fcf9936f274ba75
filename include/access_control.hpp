#pragma once

#include "betting.hpp"
#include "errors.hpp"
#include "market_config.hpp"

namespace hilo {

// Role checks over the owner/keeper identities held in MarketConfig.
// Owner holds every privilege; keeper may additionally settle.
class AccessControl {
public:
    explicit AccessControl(MarketConfig& config) : config_(config) {}

    const Address& owner() const { return config_.owner; }
    const Address& keeper() const { return config_.keeper; }

    bool isOwner(const Address& caller) const;
    bool canSettle(const Address& caller) const;

    // Throw MarketError(Unauthorized).
    void requireOwner(const Address& caller, const char* operation) const;
    void requireSettler(const Address& caller, const char* operation) const;

    void transferOwnership(const Address& caller, const Address& newOwner);

private:
    MarketConfig& config_;
};

} // namespace hilo
