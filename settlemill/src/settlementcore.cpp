#include "settlementcore.hpp"

#include "hex.hpp"
#include "orderhasher.hpp"
#include "roundingguard.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace settlemill {

const char* toString(OrderState state)
{
    switch (state) {
    case OrderState::Fresh:
        return "Fresh";
    case OrderState::PartiallyFilled:
        return "PartiallyFilled";
    case OrderState::FullyFilled:
        return "FullyFilled";
    case OrderState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

SettlementCore::SettlementCore(Address venue, FillLedger& ledger, const SignatureVerifier& verifier,
                               SettlementCollaborator& settlement, Clock clock)
    : m_venue(venue), m_ledger(ledger), m_verifier(verifier), m_settlement(settlement), m_clock(std::move(clock))
{
}

void SettlementCore::setEventCallback(EventCallback callback) { m_eventCallback = std::move(callback); }

Amount SettlementCore::fillOrder(const Order& order, const Amount& takerAssetFillAmount, const Signature& signature,
                                 const Address& sender, const Address& takerAddress)
{
    return transact([&] { return applyFill(order, takerAssetFillAmount, signature, sender, takerAddress); });
}

Amount SettlementCore::fillOrder(const Order& order, const Amount& takerAssetFillAmount, const Signature& signature,
                                 const Address& takerAddress)
{
    return fillOrder(order, takerAssetFillAmount, signature, takerAddress, takerAddress);
}

Amount SettlementCore::fillOrKillOrder(const Order& order, const Amount& takerAssetFillAmount,
                                       const Signature& signature, const Address& takerAddress)
{
    return transact([&] {
        Amount filled = applyFill(order, takerAssetFillAmount, signature, takerAddress, takerAddress);
        if (filled != takerAssetFillAmount) {
            throw ExchangeError(ErrorCode::FillOrKillNotFilled,
                                "filled " + filled.str() + " of " + takerAssetFillAmount.str());
        }
        return filled;
    });
}

std::vector<Amount> SettlementCore::batchFillOrders(const std::vector<FillRequest>& requests,
                                                    const Address& takerAddress)
{
    return transact([&] {
        std::vector<Amount> filled;
        filled.reserve(requests.size());
        for (const auto& request : requests) {
            filled.push_back(applyFill(request.order, request.takerAssetFillAmount, request.signature, takerAddress,
                                       takerAddress));
        }
        return filled;
    });
}

Amount SettlementCore::fillOrdersUpTo(const std::vector<SignedOrder>& orders, const Amount& takerAssetFillAmount,
                                      const Address& takerAddress)
{
    return transact([&] {
        Amount totalFilled = 0;
        for (const auto& signedOrder : orders) {
            if (signedOrder.order.takerAssetAddress != orders.front().order.takerAssetAddress) {
                throw ExchangeError(ErrorCode::MismatchedAssets, "orders must share one taker asset");
            }
            totalFilled += applyFill(signedOrder.order, takerAssetFillAmount - totalFilled, signedOrder.signature,
                                     takerAddress, takerAddress);
            if (totalFilled == takerAssetFillAmount) {
                break;
            }
        }
        return totalFilled;
    });
}

Amount SettlementCore::cancelOrder(const Order& order, const Amount& takerAssetCancelAmount, const Address& caller)
{
    return transact([&] { return applyCancel(order, takerAssetCancelAmount, caller); });
}

std::vector<Amount> SettlementCore::batchCancelOrders(const std::vector<CancelRequest>& requests,
                                                      const Address& caller)
{
    return transact([&] {
        std::vector<Amount> cancelled;
        cancelled.reserve(requests.size());
        for (const auto& request : requests) {
            cancelled.push_back(applyCancel(request.order, request.takerAssetCancelAmount, caller));
        }
        return cancelled;
    });
}

Uint256 SettlementCore::cancelOrdersUpTo(const Uint256& salt, const Address& caller)
{
    return transact([&] {
        Uint256 newEpoch = salt + 1;
        m_ledger.bumpMakerEpoch(caller, newEpoch);
        emit(CancelUpToEvent{caller, newEpoch});
        return newEpoch;
    });
}

OrderHash SettlementCore::getOrderHash(const Order& order) const { return hashOrder(order, m_venue); }

OrderInfo SettlementCore::getOrderInfo(const Order& order) const
{
    OrderInfo info{};
    info.orderHash = getOrderHash(order);
    info.filledAmount = m_ledger.filledAmount(info.orderHash);
    info.cancelledAmount = m_ledger.cancelledAmount(info.orderHash);

    Amount unavailable = info.filledAmount + info.cancelledAmount;
    info.remainingAmount = unavailable < order.takerAssetAmount ? order.takerAssetAmount - unavailable : Amount(0);

    if (unavailable == 0) {
        info.state = OrderState::Fresh;
    } else if (info.remainingAmount != 0) {
        info.state = OrderState::PartiallyFilled;
    } else if (info.cancelledAmount != 0) {
        info.state = OrderState::Cancelled;
    } else {
        info.state = OrderState::FullyFilled;
    }
    return info;
}

Timestamp SettlementCore::systemClock()
{
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(duration).count());
}

Amount SettlementCore::applyFill(const Order& order, const Amount& takerAssetFillAmount, const Signature& signature,
                                 const Address& sender, const Address& takerAddress)
{
    OrderHash orderHash = hashOrder(order, m_venue);
    Amount unavailable = m_ledger.getUnavailableAmount(orderHash);

    // A recorded fill proves the signature was verified; a cancel alone does not
    if (m_ledger.filledAmount(orderHash) == 0) {
        if (order.makerAssetAmount == 0 || order.takerAssetAmount == 0) {
            throw ExchangeError(ErrorCode::InvalidAmount, "order amounts must be positive");
        }
        if (!m_verifier.isValidSignature(personalMessageDigest(orderHash), signature, order.makerAddress)) {
            throw ExchangeError(ErrorCode::InvalidSignature,
                                "order " + hex::encode(orderHash) + " is not signed by its maker");
        }
    }

    if (!isNullAddress(order.senderAddress) && order.senderAddress != sender) {
        throw ExchangeError(ErrorCode::UnauthorizedSender, "sender " + hex::encode(sender) + " may not submit order");
    }
    if (!isNullAddress(order.takerAddress) && order.takerAddress != takerAddress) {
        throw ExchangeError(ErrorCode::UnauthorizedTaker, "taker " + hex::encode(takerAddress) + " may not fill order");
    }
    if (takerAssetFillAmount == 0) {
        throw ExchangeError(ErrorCode::InvalidAmount, "fill amount must be positive");
    }

    if (Uint256(m_clock()) >= order.expirationTimeSeconds) {
        emit(SoftFailureEvent{SoftFailure::OrderExpired, orderHash, takerAssetFillAmount});
        return 0;
    }

    Amount remaining = order.takerAssetAmount - unavailable;
    Amount filledAmount = std::min(takerAssetFillAmount, remaining);
    if (filledAmount == 0) {
        emit(SoftFailureEvent{SoftFailure::OrderUnfillable, orderHash, takerAssetFillAmount});
        return 0;
    }

    if (hasRoundingError(filledAmount, order.takerAssetAmount, order.makerAssetAmount)) {
        emit(SoftFailureEvent{SoftFailure::RoundingErrorTooLarge, orderHash, takerAssetFillAmount});
        return 0;
    }

    if (order.salt < m_ledger.makerEpoch(order.makerAddress)) {
        emit(SoftFailureEvent{SoftFailure::OrderUnfillable, orderHash, takerAssetFillAmount});
        return 0;
    }

    m_ledger.recordFill(orderHash, filledAmount);

    auto settled = m_settlement.settle(order, takerAddress, filledAmount);
    if (!settled.has_value()) {
        throw ExchangeError(ErrorCode::SettlementFailed, "asset transfer failed for order " + hex::encode(orderHash));
    }
    m_ledger.onRollback([this, order, takerAddress, filledAmount, result = *settled] {
        m_settlement.revert(order, takerAddress, filledAmount, result);
    });

    FillEvent fill{};
    fill.makerAddress = order.makerAddress;
    fill.takerAddress = takerAddress;
    fill.feeRecipientAddress = order.feeRecipientAddress;
    fill.makerAssetAddress = order.makerAssetAddress;
    fill.takerAssetAddress = order.takerAssetAddress;
    fill.makerAssetFilledAmount = settled->makerAssetFilledAmount;
    fill.takerAssetFilledAmount = filledAmount;
    fill.makerFeePaid = settled->makerFeePaid;
    fill.takerFeePaid = settled->takerFeePaid;
    fill.orderHash = orderHash;
    emit(fill);

    return filledAmount;
}

Amount SettlementCore::applyCancel(const Order& order, const Amount& takerAssetCancelAmount, const Address& caller)
{
    OrderHash orderHash = hashOrder(order, m_venue);

    if (!isNullAddress(order.senderAddress) && order.senderAddress != caller) {
        throw ExchangeError(ErrorCode::UnauthorizedSender, "sender " + hex::encode(caller) + " may not cancel order");
    }
    if (order.makerAddress != caller) {
        throw ExchangeError(ErrorCode::UnauthorizedMaker, "only the maker may cancel order " + hex::encode(orderHash));
    }
    if (order.makerAssetAmount == 0 || order.takerAssetAmount == 0 || takerAssetCancelAmount == 0) {
        throw ExchangeError(ErrorCode::InvalidAmount, "order and cancel amounts must be positive");
    }

    if (Uint256(m_clock()) >= order.expirationTimeSeconds) {
        emit(SoftFailureEvent{SoftFailure::OrderExpired, orderHash, takerAssetCancelAmount});
        return 0;
    }

    Amount remaining = order.takerAssetAmount - m_ledger.getUnavailableAmount(orderHash);
    Amount cancelledAmount = std::min(takerAssetCancelAmount, remaining);
    if (cancelledAmount == 0) {
        emit(SoftFailureEvent{SoftFailure::OrderUnfillable, orderHash, takerAssetCancelAmount});
        return 0;
    }

    m_ledger.recordCancel(orderHash, cancelledAmount);

    CancelEvent cancel{};
    cancel.makerAddress = order.makerAddress;
    cancel.feeRecipientAddress = order.feeRecipientAddress;
    cancel.makerAssetAddress = order.makerAssetAddress;
    cancel.takerAssetAddress = order.takerAssetAddress;
    cancel.makerAssetCancelledAmount = getPartialAmount(cancelledAmount, order.takerAssetAmount, order.makerAssetAmount);
    cancel.takerAssetCancelledAmount = cancelledAmount;
    cancel.orderHash = orderHash;
    emit(cancel);

    return cancelledAmount;
}

void SettlementCore::emit(ExchangeEvent event) { m_pendingEvents.push_back(std::move(event)); }

void SettlementCore::deferPending()
{
    std::vector<ExchangeEvent> events;
    events.swap(m_pendingEvents);
    if (events.empty()) {
        return;
    }
    m_ledger.onCommit([this, events] { publish(events); });
}

void SettlementCore::publish(const std::vector<ExchangeEvent>& events) const
{
    if (m_eventCallback == nullptr) {
        return;
    }
    // State is already committed here, so a failing observer is reported and skipped
    for (const auto& event : events) {
        try {
            m_eventCallback(event);
        } catch (const std::exception& e) {
            std::cerr << "Event callback failed: " << e.what() << std::endl;
        }
    }
}

void SettlementCore::abandon()
{
    if (--m_depth == 0) {
        m_pendingEvents.clear();
    }
}

} // namespace settlemill
