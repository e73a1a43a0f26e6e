#include "calldata.hpp"

#include "abicodec.hpp"
#include "errors.hpp"
#include "keccak.hpp"

#include <algorithm>
#include <string>

namespace settlemill {

namespace {

// Sequential reader over a payload; every read is bounds-checked
class CalldataReader {
public:
    explicit CalldataReader(const Bytes& payload) : m_payload(payload), m_offset(0) {}

    Selector readSelector()
    {
        Selector selector{};
        const uint8_t* bytes = take(selector.size(), "selector");
        std::copy(bytes, bytes + selector.size(), selector.begin());
        return selector;
    }

    Address readAddress(const char* field)
    {
        Address address{};
        if (!abi::decodeAddressWord(take(abi::kWordSize, field), address)) {
            throw ExchangeError(ErrorCode::MalformedCalldata, std::string(field) + " has non-zero padding");
        }
        return address;
    }

    Uint256 readUint256(const char* field) { return abi::decodeUint256(take(abi::kWordSize, field)); }

    Bytes readBytes(size_t length, const char* field)
    {
        const uint8_t* bytes = take(length, field);
        return Bytes(bytes, bytes + length);
    }

    [[nodiscard]] size_t remaining() const { return m_payload.size() - m_offset; }

private:
    const uint8_t* take(size_t length, const char* field)
    {
        if (remaining() < length) {
            throw ExchangeError(ErrorCode::MalformedCalldata, "payload ends inside " + std::string(field));
        }
        const uint8_t* start = m_payload.data() + m_offset;
        m_offset += length;
        return start;
    }

    const Bytes& m_payload;
    size_t m_offset;
};

} // namespace

const Selector& fillOrderSelector()
{
    static const Selector selector = [] {
        Hash256 hash = keccak256(kFillOrderSignature);
        Selector result{};
        std::copy(hash.begin(), hash.begin() + result.size(), result.begin());
        return result;
    }();
    return selector;
}

PayloadKind payloadKind(const Bytes& payload)
{
    if (payload.size() >= kSelectorSize && std::equal(fillOrderSelector().begin(), fillOrderSelector().end(),
                                                      payload.begin())) {
        return PayloadKind::FillOrder;
    }
    return PayloadKind::Unsupported;
}

FillOrderCall decodeFillOrderArgs(const Bytes& payload)
{
    if (payload.size() < kFillOrderHeadSize) {
        throw ExchangeError(ErrorCode::MalformedCalldata, "payload of " + std::to_string(payload.size()) +
                                                              " bytes is shorter than the " +
                                                              std::to_string(kFillOrderHeadSize) + " byte minimum");
    }

    CalldataReader reader(payload);
    if (reader.readSelector() != fillOrderSelector()) {
        throw ExchangeError(ErrorCode::MalformedCalldata, "selector is not fillOrder");
    }

    FillOrderCall call{};
    Order& order = call.order;
    order.senderAddress = reader.readAddress("senderAddress");
    order.makerAddress = reader.readAddress("makerAddress");
    order.takerAddress = reader.readAddress("takerAddress");
    order.makerAssetAddress = reader.readAddress("makerAssetAddress");
    order.takerAssetAddress = reader.readAddress("takerAssetAddress");
    order.feeRecipientAddress = reader.readAddress("feeRecipientAddress");
    order.makerAssetAmount = reader.readUint256("makerAssetAmount");
    order.takerAssetAmount = reader.readUint256("takerAssetAmount");
    order.makerFeeAmount = reader.readUint256("makerFeeAmount");
    order.takerFeeAmount = reader.readUint256("takerFeeAmount");
    order.expirationTimeSeconds = reader.readUint256("expirationTimeSeconds");
    order.salt = reader.readUint256("salt");
    call.takerAssetFillAmount = reader.readUint256("takerAssetFillAmount");

    Uint256 signatureLength = reader.readUint256("signature length");
    if (signatureLength != abi::kSignatureSize) {
        throw ExchangeError(ErrorCode::MalformedCalldata,
                            "signature length must be 65, got " + signatureLength.str());
    }
    call.signature = abi::decodeSignature(reader.readBytes(abi::kSignatureSize, "signature"));

    if (reader.remaining() != 0) {
        throw ExchangeError(ErrorCode::MalformedCalldata,
                            std::to_string(reader.remaining()) + " trailing bytes after signature");
    }
    return call;
}

Bytes encodeFillOrderCall(const FillOrderCall& call)
{
    const Order& order = call.order;

    Bytes out;
    out.reserve(kFillOrderPayloadSize);
    out.insert(out.end(), fillOrderSelector().begin(), fillOrderSelector().end());
    abi::appendWord(out, order.senderAddress);
    abi::appendWord(out, order.makerAddress);
    abi::appendWord(out, order.takerAddress);
    abi::appendWord(out, order.makerAssetAddress);
    abi::appendWord(out, order.takerAssetAddress);
    abi::appendWord(out, order.feeRecipientAddress);
    abi::appendWord(out, order.makerAssetAmount);
    abi::appendWord(out, order.takerAssetAmount);
    abi::appendWord(out, order.makerFeeAmount);
    abi::appendWord(out, order.takerFeeAmount);
    abi::appendWord(out, order.expirationTimeSeconds);
    abi::appendWord(out, order.salt);
    abi::appendWord(out, call.takerAssetFillAmount);
    abi::appendWord(out, Uint256(abi::kSignatureSize));

    Bytes signature = abi::encodeSignature(call.signature);
    out.insert(out.end(), signature.begin(), signature.end());
    return out;
}

} // namespace settlemill
