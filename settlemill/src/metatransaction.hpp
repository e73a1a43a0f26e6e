#pragma once

#include "calldata.hpp"
#include "fillledger.hpp"
#include "settlementcore.hpp"
#include "signatureverifier.hpp"

namespace settlemill {

struct ExecutionResult {
    Hash256 transactionHash;
    PayloadKind kind;
    Amount takerAssetFilledAmount; // Zero unless a fill-order payload filled something
};

// Executes instructions signed off-line by a signer and submitted by a third party.
// Each (nonce, payload) pair executes at most once.
class MetaTransactionGate {
public:
    MetaTransactionGate(SettlementCore& core, FillLedger& ledger, const SignatureVerifier& verifier);

    // Throws TransactionReplayed or InvalidTransactionSignature before any state change;
    // a hard failure of the dispatched call also unmarks the transaction.
    // Unsupported payloads are marked executed and otherwise ignored.
    ExecutionResult execute(const Uint256& nonce, const Address& signer, const Bytes& payload,
                            const Signature& signature, const Address& sender);

    // keccak256(nonce as 32-byte word || payload); signed via the personal-message digest
    [[nodiscard]] static Hash256 transactionHash(const Uint256& nonce, const Bytes& payload);

private:
    SettlementCore& m_core;
    FillLedger& m_ledger;
    const SignatureVerifier& m_verifier;
};

} // namespace settlemill
