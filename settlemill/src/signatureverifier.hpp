#pragma once

#include "order.hpp"
#include "types.hpp"

#include <optional>

namespace settlemill {

// Capability injected into the settlement core and the meta-transaction gate.
// Implementations must never throw; malformed material is simply invalid.
class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;

    // Raw check over the digest supplied; callers apply personal-message prefixing
    [[nodiscard]] virtual bool isValidSignature(const Hash256& digest, const Signature& signature,
                                                const Address& expectedSigner) const = 0;
};

// secp256k1 public key recovery backed by OpenSSL point arithmetic
class EcdsaSignatureVerifier : public SignatureVerifier {
public:
    [[nodiscard]] bool isValidSignature(const Hash256& digest, const Signature& signature,
                                        const Address& expectedSigner) const override;

    // Address of the key that produced the signature, if recovery succeeds
    [[nodiscard]] std::optional<Address> recoverSigner(const Hash256& digest, const Signature& signature) const;
};

// Last 20 bytes of keccak256 over the 64-byte uncompressed public key (x || y)
[[nodiscard]] Address addressFromPublicKey(const uint8_t* publicKey64);

} // namespace settlemill
