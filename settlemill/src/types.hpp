#pragma once

#include <boost/container_hash/hash.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace settlemill {

// 256-bit unsigned integer; overflow and negative results throw
using Uint256 = boost::multiprecision::checked_uint256_t;

using Amount = Uint256;     // Token base units
using Timestamp = uint64_t; // Seconds since epoch
using Bytes = std::vector<uint8_t>;

using Address = std::array<uint8_t, 20>;
using Hash256 = std::array<uint8_t, 32>;
using OrderHash = Hash256; // Keccak-256 of the venue-bound order fields

inline constexpr Address kNullAddress{};

[[nodiscard]] inline bool isNullAddress(const Address& address) { return address == kNullAddress; }

// Hash functor for fixed-width byte keys (addresses, digests) in unordered containers.
// Mixes every byte; vanity addresses share long prefixes.
struct ByteArrayHash {
    template <std::size_t N>
    std::size_t operator()(const std::array<uint8_t, N>& bytes) const
    {
        return boost::hash_range(bytes.begin(), bytes.end());
    }
};

} // namespace settlemill
