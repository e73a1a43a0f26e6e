#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace settlemill {

// Hard failures: the whole invocation is aborted and no state changes
enum class ErrorCode : uint8_t {
    InvalidSignature = 1,
    InvalidAmount,
    UnauthorizedSender,
    UnauthorizedTaker,
    UnauthorizedMaker,
    ArithmeticOverflow,
    MalformedCalldata,
    EpochNotIncreasing,
    SettlementFailed,
    TransactionReplayed,
    InvalidTransactionSignature,
    FillOrKillNotFilled,
    MismatchedAssets,
    InvalidConfig
};

[[nodiscard]] const char* toString(ErrorCode code);

class ExchangeError : public std::runtime_error {
public:
    ExchangeError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

} // namespace settlemill
