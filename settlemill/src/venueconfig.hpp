#pragma once

#include "balancesheet.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace settlemill {

struct BalanceSeed {
    Address token;
    Address owner;
    Amount amount;
};

// Venue settings loaded from JSON:
// { "venue": "0x..", "feeToken": "0x..", "now": 1700000000,
//   "balances": [ { "token": "0x..", "owner": "0x..", "amount": "1000" } ] }
class VenueConfig {
public:
    // Load from JSON file; throws std::runtime_error if the file cannot be read
    void loadFromFile(const std::string& path);

    // Throws ExchangeError(InvalidConfig) on a missing venue or malformed value
    void loadFromString(const std::string& json);

    // Credit every seeded balance
    void seed(BalanceSheet& sheet) const;

    [[nodiscard]] const Address& venue() const { return m_venue; }
    [[nodiscard]] const Address& feeToken() const { return m_feeToken; }
    [[nodiscard]] const std::optional<Timestamp>& fixedTime() const { return m_fixedTime; }
    [[nodiscard]] const std::vector<BalanceSeed>& balances() const { return m_balances; }

private:
    Address m_venue{};
    Address m_feeToken{};
    std::optional<Timestamp> m_fixedTime;
    std::vector<BalanceSeed> m_balances;
};

} // namespace settlemill
