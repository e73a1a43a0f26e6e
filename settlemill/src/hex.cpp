#include "hex.hpp"

#include <algorithm>
#include <stdexcept>

namespace settlemill::hex {

namespace {

int nibble(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string_view stripPrefix(std::string_view text)
{
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    return text;
}

template <size_t N>
std::array<uint8_t, N> toFixed(std::string_view text, const char* what)
{
    Bytes bytes = decode(text);
    if (bytes.size() != N) {
        throw std::invalid_argument(std::string("Expected ") + std::to_string(N) + " bytes for " + what + ", got " +
                                    std::to_string(bytes.size()));
    }
    std::array<uint8_t, N> result{};
    std::copy(bytes.begin(), bytes.end(), result.begin());
    return result;
}

} // namespace

std::string encode(const uint8_t* data, size_t length)
{
    static constexpr char kDigits[] = "0123456789abcdef";

    std::string out;
    out.reserve(2 + length * 2);
    out += "0x";
    for (size_t i = 0; i < length; ++i) {
        out += kDigits[data[i] >> 4];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

Bytes decode(std::string_view text)
{
    std::string_view digits = stripPrefix(text);
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length: " + std::string(text));
    }

    Bytes out;
    out.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        int high = nibble(digits[i]);
        int low = nibble(digits[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex digit in: " + std::string(text));
        }
        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return out;
}

Address toAddress(std::string_view text) { return toFixed<20>(text, "address"); }

Hash256 toHash(std::string_view text) { return toFixed<32>(text, "hash"); }

bool isValidOrderHash(std::string_view text)
{
    if (text.size() != 66 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return false;
    }
    return std::all_of(text.begin() + 2, text.end(), [](char c) { return nibble(c) >= 0; });
}

} // namespace settlemill::hex
