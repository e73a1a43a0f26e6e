#pragma once

#include "types.hpp"

#include <array>
#include <string_view>

namespace settlemill {

// Keccak-256 as used by Ethereum (original 0x01 padding, not FIPS-202 SHA3)
class Keccak256 {
public:
    Keccak256() = default;

    void update(const uint8_t* data, size_t length);
    void update(const Bytes& data) { update(data.data(), data.size()); }

    template <size_t N>
    void update(const std::array<uint8_t, N>& data)
    {
        update(data.data(), N);
    }

    // Pads, squeezes the digest and resets the sponge for reuse
    [[nodiscard]] Hash256 finalize();

    void reset();

private:
    static constexpr size_t kRate = 136; // (1600 - 2 * 256) / 8

    void absorbByte(uint8_t byte);

    std::array<uint64_t, 25> m_state{};
    size_t m_offset = 0; // Bytes absorbed into the current block
};

[[nodiscard]] Hash256 keccak256(const uint8_t* data, size_t length);
[[nodiscard]] Hash256 keccak256(const Bytes& data);
[[nodiscard]] Hash256 keccak256(std::string_view text);

} // namespace settlemill
