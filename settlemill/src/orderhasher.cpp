#include "orderhasher.hpp"

#include "abicodec.hpp"
#include "keccak.hpp"

#include <string_view>

namespace settlemill {

namespace {

constexpr size_t kSerializedOrderSize = 7 * abi::kAddressSize + 6 * abi::kWordSize;

constexpr std::string_view kPersonalMessagePrefix = "\x19"
                                                    "Ethereum Signed Message:\n32";

} // namespace

Bytes serializeOrder(const Order& order, const Address& venue)
{
    Bytes out;
    out.reserve(kSerializedOrderSize);

    abi::appendPacked(out, venue);
    abi::appendPacked(out, order.senderAddress);
    abi::appendPacked(out, order.makerAddress);
    abi::appendPacked(out, order.takerAddress);
    abi::appendPacked(out, order.makerAssetAddress);
    abi::appendPacked(out, order.takerAssetAddress);
    abi::appendPacked(out, order.feeRecipientAddress);
    abi::appendPacked(out, order.makerAssetAmount);
    abi::appendPacked(out, order.takerAssetAmount);
    abi::appendPacked(out, order.makerFeeAmount);
    abi::appendPacked(out, order.takerFeeAmount);
    abi::appendPacked(out, order.expirationTimeSeconds);
    abi::appendPacked(out, order.salt);

    return out;
}

OrderHash hashOrder(const Order& order, const Address& venue) { return keccak256(serializeOrder(order, venue)); }

Hash256 personalMessageDigest(const Hash256& hash)
{
    Keccak256 sponge;
    sponge.update(reinterpret_cast<const uint8_t*>(kPersonalMessagePrefix.data()), kPersonalMessagePrefix.size());
    sponge.update(hash);
    return sponge.finalize();
}

} // namespace settlemill
