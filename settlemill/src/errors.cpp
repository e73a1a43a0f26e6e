#include "errors.hpp"

namespace settlemill {

const char* toString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidSignature:
        return "InvalidSignature";
    case ErrorCode::InvalidAmount:
        return "InvalidAmount";
    case ErrorCode::UnauthorizedSender:
        return "UnauthorizedSender";
    case ErrorCode::UnauthorizedTaker:
        return "UnauthorizedTaker";
    case ErrorCode::UnauthorizedMaker:
        return "UnauthorizedMaker";
    case ErrorCode::ArithmeticOverflow:
        return "ArithmeticOverflow";
    case ErrorCode::MalformedCalldata:
        return "MalformedCalldata";
    case ErrorCode::EpochNotIncreasing:
        return "EpochNotIncreasing";
    case ErrorCode::SettlementFailed:
        return "SettlementFailed";
    case ErrorCode::TransactionReplayed:
        return "TransactionReplayed";
    case ErrorCode::InvalidTransactionSignature:
        return "InvalidTransactionSignature";
    case ErrorCode::FillOrKillNotFilled:
        return "FillOrKillNotFilled";
    case ErrorCode::MismatchedAssets:
        return "MismatchedAssets";
    case ErrorCode::InvalidConfig:
        return "InvalidConfig";
    }
    return "Unknown";
}

ExchangeError::ExchangeError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(toString(code)) + ": " + message), m_code(code)
{
}

} // namespace settlemill
