#include "abicodec.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

namespace settlemill::abi {

Hash256 encodeUint256(const Uint256& value)
{
    Bytes significant;
    boost::multiprecision::export_bits(value, std::back_inserter(significant), 8);

    // export_bits emits the minimal big-endian form; right-align it in the word
    Hash256 word{};
    std::copy(significant.begin(), significant.end(), word.end() - significant.size());
    return word;
}

Uint256 decodeUint256(const uint8_t* word)
{
    Uint256 value;
    boost::multiprecision::import_bits(value, word, word + kWordSize);
    return value;
}

void appendPacked(Bytes& out, const Address& address) { out.insert(out.end(), address.begin(), address.end()); }

void appendPacked(Bytes& out, const Uint256& value)
{
    Hash256 word = encodeUint256(value);
    out.insert(out.end(), word.begin(), word.end());
}

void appendWord(Bytes& out, const Address& address)
{
    out.insert(out.end(), kWordSize - kAddressSize, uint8_t{0});
    appendPacked(out, address);
}

void appendWord(Bytes& out, const Uint256& value) { appendPacked(out, value); }

bool decodeAddressWord(const uint8_t* word, Address& address)
{
    const uint8_t* padEnd = word + (kWordSize - kAddressSize);
    if (std::any_of(word, padEnd, [](uint8_t byte) { return byte != 0; })) {
        return false;
    }
    std::copy(padEnd, word + kWordSize, address.begin());
    return true;
}

Bytes encodeSignature(const Signature& signature)
{
    Bytes out;
    out.reserve(kSignatureSize);
    out.insert(out.end(), signature.r.begin(), signature.r.end());
    out.insert(out.end(), signature.s.begin(), signature.s.end());
    out.push_back(signature.v);
    return out;
}

Signature decodeSignature(const Bytes& bytes)
{
    if (bytes.size() != kSignatureSize) {
        throw std::invalid_argument("Signature must be 65 bytes, got " + std::to_string(bytes.size()));
    }

    Signature signature{};
    std::copy(bytes.begin(), bytes.begin() + 32, signature.r.begin());
    std::copy(bytes.begin() + 32, bytes.begin() + 64, signature.s.begin());
    signature.v = bytes[64];
    return signature;
}

} // namespace settlemill::abi
