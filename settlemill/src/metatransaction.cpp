#include "metatransaction.hpp"

#include "abicodec.hpp"
#include "errors.hpp"
#include "hex.hpp"
#include "keccak.hpp"
#include "orderhasher.hpp"

namespace settlemill {

MetaTransactionGate::MetaTransactionGate(SettlementCore& core, FillLedger& ledger, const SignatureVerifier& verifier)
    : m_core(core), m_ledger(ledger), m_verifier(verifier)
{
}

ExecutionResult MetaTransactionGate::execute(const Uint256& nonce, const Address& signer, const Bytes& payload,
                                             const Signature& signature, const Address& sender)
{
    ExecutionResult result{};
    result.transactionHash = transactionHash(nonce, payload);
    result.kind = payloadKind(payload);

    if (m_ledger.isTransactionExecuted(result.transactionHash)) {
        throw ExchangeError(ErrorCode::TransactionReplayed,
                            "transaction " + hex::encode(result.transactionHash) + " was already executed");
    }
    if (!m_verifier.isValidSignature(personalMessageDigest(result.transactionHash), signature, signer)) {
        throw ExchangeError(ErrorCode::InvalidTransactionSignature,
                            "transaction " + hex::encode(result.transactionHash) + " is not signed by " +
                                hex::encode(signer));
    }

    FillLedger::Savepoint savepoint(m_ledger);
    m_ledger.markTransactionExecuted(result.transactionHash);

    if (result.kind == PayloadKind::FillOrder) {
        FillOrderCall call = decodeFillOrderArgs(payload);
        result.takerAssetFilledAmount =
            m_core.fillOrder(call.order, call.takerAssetFillAmount, call.signature, sender, signer);
    }

    savepoint.commit();
    return result;
}

Hash256 MetaTransactionGate::transactionHash(const Uint256& nonce, const Bytes& payload)
{
    Keccak256 sponge;
    sponge.update(abi::encodeUint256(nonce));
    sponge.update(payload);
    return sponge.finalize();
}

} // namespace settlemill
