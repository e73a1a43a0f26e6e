#include "keccak.hpp"

namespace settlemill {

namespace {

constexpr std::array<uint64_t, 24> kRoundConstants = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
    0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

constexpr std::array<int, 24> kRotations = {1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
                                            27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44};

constexpr std::array<int, 24> kPiLanes = {10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
                                          15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1};

inline uint64_t rotateLeft(uint64_t value, int shift) { return (value << shift) | (value >> (64 - shift)); }

void permute(std::array<uint64_t, 25>& state)
{
    for (uint64_t roundConstant : kRoundConstants) {
        // Theta
        uint64_t columns[5];
        for (int x = 0; x < 5; ++x) {
            columns[x] = state[x] ^ state[x + 5] ^ state[x + 10] ^ state[x + 15] ^ state[x + 20];
        }
        for (int x = 0; x < 5; ++x) {
            uint64_t mix = columns[(x + 4) % 5] ^ rotateLeft(columns[(x + 1) % 5], 1);
            for (int y = 0; y < 25; y += 5) {
                state[y + x] ^= mix;
            }
        }

        // Rho and Pi
        uint64_t carry = state[1];
        for (int i = 0; i < 24; ++i) {
            int lane = kPiLanes[i];
            uint64_t next = state[lane];
            state[lane] = rotateLeft(carry, kRotations[i]);
            carry = next;
        }

        // Chi
        for (int y = 0; y < 25; y += 5) {
            uint64_t row[5];
            for (int x = 0; x < 5; ++x) {
                row[x] = state[y + x];
            }
            for (int x = 0; x < 5; ++x) {
                state[y + x] = row[x] ^ (~row[(x + 1) % 5] & row[(x + 2) % 5]);
            }
        }

        // Iota
        state[0] ^= roundConstant;
    }
}

} // namespace

void Keccak256::update(const uint8_t* data, size_t length)
{
    for (size_t i = 0; i < length; ++i) {
        absorbByte(data[i]);
    }
}

void Keccak256::absorbByte(uint8_t byte)
{
    // Lanes are little-endian
    m_state[m_offset / 8] ^= static_cast<uint64_t>(byte) << (8 * (m_offset % 8));
    if (++m_offset == kRate) {
        permute(m_state);
        m_offset = 0;
    }
}

Hash256 Keccak256::finalize()
{
    m_state[m_offset / 8] ^= static_cast<uint64_t>(0x01) << (8 * (m_offset % 8));
    m_state[(kRate - 1) / 8] ^= static_cast<uint64_t>(0x80) << (8 * ((kRate - 1) % 8));
    permute(m_state);

    Hash256 digest{};
    for (size_t i = 0; i < digest.size(); ++i) {
        digest[i] = static_cast<uint8_t>(m_state[i / 8] >> (8 * (i % 8)));
    }

    reset();
    return digest;
}

void Keccak256::reset()
{
    m_state.fill(0);
    m_offset = 0;
}

Hash256 keccak256(const uint8_t* data, size_t length)
{
    Keccak256 sponge;
    sponge.update(data, length);
    return sponge.finalize();
}

Hash256 keccak256(const Bytes& data) { return keccak256(data.data(), data.size()); }

Hash256 keccak256(std::string_view text)
{
    return keccak256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace settlemill
