#include "errors.hpp"

namespace hilo {

ErrorKind kindOf(ErrorCode code) {
    switch (code) {
    case ErrorCode::Unauthorized:
        return ErrorKind::Authorization;
    case ErrorCode::SettlementTooEarly:
    case ErrorCode::NotPaused:
    case ErrorCode::RoundNotSettled:
    case ErrorCode::AlreadyClaimed:
    case ErrorCode::NothingToClaim:
    case ErrorCode::ClaimWindowClosed:
    case ErrorCode::ReentrantCall:
        return ErrorKind::StateConflict;
    case ErrorCode::TransferFailed:
        return ErrorKind::TransferFailure;
    default:
        return ErrorKind::Validation;
    }
}

const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::StakeZero: return "stake_zero";
    case ErrorCode::StakeBelowMinimum: return "stake_below_minimum";
    case ErrorCode::StakeAboveMaximum: return "stake_above_maximum";
    case ErrorCode::BettingClosed: return "betting_closed";
    case ErrorCode::Paused: return "paused";
    case ErrorCode::SafeMode: return "safe_mode";
    case ErrorCode::OutcomeOutOfRange: return "outcome_out_of_range";
    case ErrorCode::InvalidConfig: return "invalid_config";
    case ErrorCode::ArithmeticOverflow: return "arithmetic_overflow";
    case ErrorCode::InsufficientBalance: return "insufficient_balance";
    case ErrorCode::UnsolicitedTransfer: return "unsolicited_transfer";
    case ErrorCode::Unauthorized: return "unauthorized";
    case ErrorCode::SettlementTooEarly: return "settlement_too_early";
    case ErrorCode::NotPaused: return "not_paused";
    case ErrorCode::RoundNotSettled: return "round_not_settled";
    case ErrorCode::AlreadyClaimed: return "already_claimed";
    case ErrorCode::NothingToClaim: return "nothing_to_claim";
    case ErrorCode::ClaimWindowClosed: return "claim_window_closed";
    case ErrorCode::ReentrantCall: return "reentrant_call";
    case ErrorCode::TransferFailed: return "transfer_failed";
    }
    return "unknown";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Validation: return "validation";
    case ErrorKind::Authorization: return "authorization";
    case ErrorKind::StateConflict: return "state-conflict";
    case ErrorKind::TransferFailure: return "transfer-failure";
    }
    return "unknown";
}

} // namespace hilo
