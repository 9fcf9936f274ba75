#include "access_control.hpp"

#include "errors.hpp"

#include <string>

#include <spdlog/spdlog.h>

namespace hilo {

bool AccessControl::isOwner(const Address& caller) const {
    return !caller.empty() && caller == config_.owner;
}

bool AccessControl::canSettle(const Address& caller) const {
    return isOwner(caller) || (!config_.keeper.empty() && caller == config_.keeper);
}

void AccessControl::requireOwner(const Address& caller, const char* operation) const {
    if (!isOwner(caller)) {
        spdlog::warn("rejected {} from {}: owner only", operation, caller);
        throw MarketError(ErrorCode::Unauthorized,
                          std::string(operation) + " is restricted to the owner");
    }
}

void AccessControl::requireSettler(const Address& caller, const char* operation) const {
    if (!canSettle(caller)) {
        spdlog::warn("rejected {} from {}: keeper or owner only", operation, caller);
        throw MarketError(ErrorCode::Unauthorized,
                          std::string(operation) + " is restricted to the keeper or owner");
    }
}

void AccessControl::transferOwnership(const Address& caller, const Address& newOwner) {
    requireOwner(caller, "transferOwnership");
    if (newOwner.empty()) {
        throw MarketError(ErrorCode::InvalidConfig, "New owner must not be empty");
    }
    config_.owner = newOwner;
}

} // namespace hilo
