#include "../src/hex.hpp"
#include "../src/keccak.hpp"
#include "../src/signatureverifier.hpp"
#include "testsigner.hpp"
#include <gtest/gtest.h>

using namespace settlemill;
using testsupport::TestSigner;

class SignatureVerifierTest : public ::testing::Test {
protected:
    EcdsaSignatureVerifier verifier;
    TestSigner alice{1};
    TestSigner bob{2};
    Hash256 digest = keccak256("settle this");
};

TEST_F(SignatureVerifierTest, KnownAddresses)
{
    EXPECT_EQ("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf", hex::encode(alice.address()));
    EXPECT_EQ("0x2b5ad5c4795c026514f8317c7a215e218dccd6cf", hex::encode(bob.address()));
}

TEST_F(SignatureVerifierTest, RecoversSigner)
{
    Signature signature = alice.sign(digest);
    auto recovered = verifier.recoverSigner(digest, signature);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(alice.address(), recovered.value());

    EXPECT_TRUE(verifier.isValidSignature(digest, signature, alice.address()));
    EXPECT_FALSE(verifier.isValidSignature(digest, signature, bob.address()));
}

TEST_F(SignatureVerifierTest, WrongDigestFails)
{
    Signature signature = alice.sign(digest);
    EXPECT_FALSE(verifier.isValidSignature(keccak256("something else"), signature, alice.address()));
}

TEST_F(SignatureVerifierTest, FlippedRecoveryIdFails)
{
    Signature signature = alice.sign(digest);
    signature.v = signature.v == 27 ? 28 : 27;
    EXPECT_FALSE(verifier.isValidSignature(digest, signature, alice.address()));
}

TEST_F(SignatureVerifierTest, LowRecoveryIdIsNormalized)
{
    Signature signature = alice.sign(digest);
    signature.v -= 27;
    EXPECT_TRUE(verifier.isValidSignature(digest, signature, alice.address()));
}

TEST_F(SignatureVerifierTest, MalformedSignaturesAreInvalid)
{
    Signature signature = alice.sign(digest);

    Signature badV = signature;
    badV.v = 29;
    EXPECT_FALSE(verifier.isValidSignature(digest, badV, alice.address()));

    Signature zeroR = signature;
    zeroR.r = Hash256{};
    EXPECT_FALSE(verifier.isValidSignature(digest, zeroR, alice.address()));

    Signature zeroS = signature;
    zeroS.s = Hash256{};
    EXPECT_FALSE(verifier.isValidSignature(digest, zeroS, alice.address()));

    // r >= curve order
    Signature hugeR = signature;
    hugeR.r.fill(0xFF);
    EXPECT_FALSE(verifier.recoverSigner(digest, hugeR).has_value());

    EXPECT_FALSE(verifier.isValidSignature(digest, Signature{}, alice.address()));
}

TEST_F(SignatureVerifierTest, NullSignerNeverMatches)
{
    EXPECT_FALSE(verifier.isValidSignature(digest, Signature{}, kNullAddress));
}
