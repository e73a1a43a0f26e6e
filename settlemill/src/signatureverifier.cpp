#include "signatureverifier.hpp"

#include "keccak.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>

namespace settlemill {

namespace {

struct BignumDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct BignumContextDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct GroupDeleter {
    void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};
struct PointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_free(point); }
};

using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
using BignumContextPtr = std::unique_ptr<BN_CTX, BignumContextDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

constexpr size_t kUncompressedPointSize = 65; // 0x04 || x || y

// Q = r^-1 * (s * R - e * G), where R is the curve point with x = r and the y parity of recoveryId
std::optional<Address> recover(const Hash256& digest, const Signature& signature, int recoveryId)
{
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    BignumContextPtr ctx(BN_CTX_new());
    if (!group || !ctx) {
        return std::nullopt;
    }
    const BIGNUM* order = EC_GROUP_get0_order(group.get());

    BignumPtr r(BN_bin2bn(signature.r.data(), static_cast<int>(signature.r.size()), nullptr));
    BignumPtr s(BN_bin2bn(signature.s.data(), static_cast<int>(signature.s.size()), nullptr));
    BignumPtr e(BN_bin2bn(digest.data(), static_cast<int>(digest.size()), nullptr));
    BignumPtr zero(BN_new());
    BignumPtr u1(BN_new());
    BignumPtr u2(BN_new());
    if (!r || !s || !e || !zero || !u1 || !u2) {
        return std::nullopt;
    }
    BN_zero(zero.get());

    if (BN_is_zero(r.get()) || BN_is_zero(s.get()) || BN_cmp(r.get(), order) >= 0 || BN_cmp(s.get(), order) >= 0) {
        return std::nullopt;
    }

    PointPtr point(EC_POINT_new(group.get()));
    if (!point ||
        EC_POINT_set_compressed_coordinates(group.get(), point.get(), r.get(), recoveryId & 1, ctx.get()) != 1) {
        return std::nullopt;
    }

    BignumPtr rInverse(BN_mod_inverse(nullptr, r.get(), order, ctx.get()));
    if (!rInverse) {
        return std::nullopt;
    }

    // u1 = -e / r mod n, u2 = s / r mod n
    if (BN_nnmod(e.get(), e.get(), order, ctx.get()) != 1 ||
        BN_mod_sub(u1.get(), zero.get(), e.get(), order, ctx.get()) != 1 ||
        BN_mod_mul(u1.get(), u1.get(), rInverse.get(), order, ctx.get()) != 1 ||
        BN_mod_mul(u2.get(), s.get(), rInverse.get(), order, ctx.get()) != 1) {
        return std::nullopt;
    }

    PointPtr publicKey(EC_POINT_new(group.get()));
    if (!publicKey || EC_POINT_mul(group.get(), publicKey.get(), u1.get(), point.get(), u2.get(), ctx.get()) != 1 ||
        EC_POINT_is_at_infinity(group.get(), publicKey.get()) == 1) {
        return std::nullopt;
    }

    uint8_t encoded[kUncompressedPointSize];
    if (EC_POINT_point2oct(group.get(), publicKey.get(), POINT_CONVERSION_UNCOMPRESSED, encoded, sizeof(encoded),
                           ctx.get()) != kUncompressedPointSize) {
        return std::nullopt;
    }

    return addressFromPublicKey(encoded + 1);
}

} // namespace

bool EcdsaSignatureVerifier::isValidSignature(const Hash256& digest, const Signature& signature,
                                              const Address& expectedSigner) const
{
    auto signer = recoverSigner(digest, signature);
    return signer.has_value() && signer.value() == expectedSigner;
}

std::optional<Address> EcdsaSignatureVerifier::recoverSigner(const Hash256& digest, const Signature& signature) const
{
    int v = signature.v < 27 ? signature.v + 27 : signature.v;
    if (v != 27 && v != 28) {
        return std::nullopt;
    }

    auto signer = recover(digest, signature, v - 27);

    // Failed point decompression leaves entries on the thread's error queue
    ERR_clear_error();
    return signer;
}

Address addressFromPublicKey(const uint8_t* publicKey64)
{
    Hash256 hash = keccak256(publicKey64, 64);
    Address address{};
    std::copy(hash.end() - address.size(), hash.end(), address.begin());
    return address;
}

} // namespace settlemill
