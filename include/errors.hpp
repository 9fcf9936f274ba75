#pragma once

#include <stdexcept>
#include <string>

namespace hilo {

enum class ErrorKind { Validation, Authorization, StateConflict, TransferFailure };

enum class ErrorCode {
    // validation
    StakeZero,
    StakeBelowMinimum,
    StakeAboveMaximum,
    BettingClosed,
    Paused,
    SafeMode,
    OutcomeOutOfRange,
    InvalidConfig,
    ArithmeticOverflow,
    InsufficientBalance,
    UnsolicitedTransfer,
    // authorization
    Unauthorized,
    // state conflict
    SettlementTooEarly,
    NotPaused,
    RoundNotSettled,
    AlreadyClaimed,
    NothingToClaim,
    ClaimWindowClosed,
    ReentrantCall,
    // transfer failure
    TransferFailed,
};

ErrorKind kindOf(ErrorCode code);
const char* toString(ErrorCode code);
const char* toString(ErrorKind kind);

class MarketError : public std::runtime_error {
public:
    MarketError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }
    ErrorKind kind() const { return kindOf(code_); }

private:
    ErrorCode code_;
};

} // namespace hilo
