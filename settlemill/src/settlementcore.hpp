#pragma once

#include "errors.hpp"
#include "events.hpp"
#include "fillledger.hpp"
#include "order.hpp"
#include "settlement.hpp"
#include "signatureverifier.hpp"

#include <functional>
#include <stdexcept>
#include <vector>

namespace settlemill {

// Derived from the ledger, never stored
enum class OrderState : uint8_t { Fresh = 1, PartiallyFilled = 2, FullyFilled = 3, Cancelled = 4 };

[[nodiscard]] const char* toString(OrderState state);

struct OrderInfo {
    OrderHash orderHash;
    OrderState state;
    Amount filledAmount;    // Taker asset
    Amount cancelledAmount; // Taker asset
    Amount remainingAmount; // Taker asset still fillable
};

// The order fill/cancel state machine. Hard failures throw ExchangeError and leave
// the ledger untouched; soft outcomes return zero and publish a SoftFailureEvent.
// Invocations must be serialized by the host; the core does no locking.
class SettlementCore {
public:
    // Callback type for published records
    using EventCallback = std::function<void(const ExchangeEvent&)>;

    // Authoritative current time in seconds
    using Clock = std::function<Timestamp()>;

    SettlementCore(Address venue, FillLedger& ledger, const SignatureVerifier& verifier,
                   SettlementCollaborator& settlement, Clock clock = systemClock);

    // Set optional event callback. Records are delivered once the outermost ledger
    // savepoint commits (the invocation's own, or an enclosing one such as a relayed
    // transaction's) and dropped if it rolls back. Exceptions thrown by the callback
    // are reported on stderr and never undo or fail the committed invocation.
    void setEventCallback(EventCallback callback);

    // Returns the taker amount filled. sender is the party submitting the call and is
    // checked against order.senderAddress; takerAddress receives the maker asset.
    Amount fillOrder(const Order& order, const Amount& takerAssetFillAmount, const Signature& signature,
                     const Address& sender, const Address& takerAddress);

    // Direct call: the taker submits for itself
    Amount fillOrder(const Order& order, const Amount& takerAssetFillAmount, const Signature& signature,
                     const Address& takerAddress);

    // Throws FillOrKillNotFilled unless exactly takerAssetFillAmount is filled
    Amount fillOrKillOrder(const Order& order, const Amount& takerAssetFillAmount, const Signature& signature,
                           const Address& takerAddress);

    // All-or-nothing; element i of the result is the amount filled for request i
    std::vector<Amount> batchFillOrders(const std::vector<FillRequest>& requests, const Address& takerAddress);

    // Fills orders sharing one taker asset, in sequence, until takerAssetFillAmount is reached
    Amount fillOrdersUpTo(const std::vector<SignedOrder>& orders, const Amount& takerAssetFillAmount,
                          const Address& takerAddress);

    // caller must be the maker (and the sender, if the order names one)
    Amount cancelOrder(const Order& order, const Amount& takerAssetCancelAmount, const Address& caller);

    std::vector<Amount> batchCancelOrders(const std::vector<CancelRequest>& requests, const Address& caller);

    // Cancels every order of caller with salt <= salt; returns the new epoch (salt + 1)
    Uint256 cancelOrdersUpTo(const Uint256& salt, const Address& caller);

    // Queries
    [[nodiscard]] OrderHash getOrderHash(const Order& order) const;
    [[nodiscard]] OrderInfo getOrderInfo(const Order& order) const;
    [[nodiscard]] const Address& venue() const { return m_venue; }

    [[nodiscard]] static Timestamp systemClock();

private:
    // Runs one logical transaction: a ledger savepoint, buffered events and
    // translation of checked-arithmetic exceptions. Nested calls join the outer one.
    template <typename Operation>
    auto transact(Operation&& operation) -> decltype(operation());

    Amount applyFill(const Order& order, const Amount& takerAssetFillAmount, const Signature& signature,
                     const Address& sender, const Address& takerAddress);
    Amount applyCancel(const Order& order, const Amount& takerAssetCancelAmount, const Address& caller);

    void emit(ExchangeEvent event);
    void deferPending();
    void publish(const std::vector<ExchangeEvent>& events) const;
    void abandon();

    Address m_venue;
    FillLedger& m_ledger;
    const SignatureVerifier& m_verifier;
    SettlementCollaborator& m_settlement;
    Clock m_clock;

    EventCallback m_eventCallback;
    std::vector<ExchangeEvent> m_pendingEvents;
    int m_depth = 0;
};

template <typename Operation>
auto SettlementCore::transact(Operation&& operation) -> decltype(operation())
{
    using Result = decltype(operation());

    FillLedger::Savepoint savepoint(m_ledger);
    ++m_depth;
    Result result{};
    try {
        result = operation();
    } catch (const std::overflow_error& e) {
        abandon();
        throw ExchangeError(ErrorCode::ArithmeticOverflow, e.what());
    } catch (const std::range_error& e) {
        abandon();
        throw ExchangeError(ErrorCode::ArithmeticOverflow, e.what());
    } catch (...) {
        abandon();
        throw;
    }

    if (--m_depth == 0) {
        deferPending();
    }
    savepoint.commit();
    return result;
}

} // namespace settlemill
