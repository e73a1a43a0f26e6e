#include "venueconfig.hpp"

#include "errors.hpp"
#include "hex.hpp"
#include "jsonutils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace settlemill {

using namespace json;

namespace {

Address parseAddress(const std::string& text, const std::string& field)
{
    try {
        return hex::toAddress(text);
    } catch (const std::invalid_argument& e) {
        throw ExchangeError(ErrorCode::InvalidConfig, field + ": " + e.what());
    }
}

Amount parseAmount(const std::string& text, const std::string& field)
{
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ExchangeError(ErrorCode::InvalidConfig, field + " must be a decimal string, got '" + text + "'");
    }
    // A leading zero would make the parser read octal
    auto firstDigit = std::min(text.find_first_not_of('0'), text.size() - 1);
    try {
        return Amount(text.substr(firstDigit));
    } catch (const std::exception& e) {
        throw ExchangeError(ErrorCode::InvalidConfig, field + " does not fit in 256 bits: " + e.what());
    }
}

} // namespace

void VenueConfig::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open venue file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());
}

void VenueConfig::loadFromString(const std::string& json)
{
    std::string venue = extractString(json, "venue");
    if (venue.empty()) {
        throw ExchangeError(ErrorCode::InvalidConfig, "missing venue address");
    }
    m_venue = parseAddress(venue, "venue");

    m_feeToken = kNullAddress;
    if (hasKey(json, "feeToken")) {
        m_feeToken = parseAddress(extractString(json, "feeToken"), "feeToken");
    }

    m_fixedTime.reset();
    if (hasKey(json, "now")) {
        try {
            m_fixedTime = extractUnsigned(json, "now");
        } catch (const std::logic_error& e) {
            throw ExchangeError(ErrorCode::InvalidConfig, std::string("now: ") + e.what());
        }
    }

    m_balances.clear();
    for (const auto& objectJson : extractObjects(json, "balances")) {
        BalanceSeed seed{};
        seed.token = parseAddress(extractString(objectJson, "token"), "balances.token");
        seed.owner = parseAddress(extractString(objectJson, "owner"), "balances.owner");
        seed.amount = parseAmount(extractString(objectJson, "amount"), "balances.amount");
        m_balances.push_back(std::move(seed));
    }
}

void VenueConfig::seed(BalanceSheet& sheet) const
{
    for (const auto& balance : m_balances) {
        sheet.deposit(balance.token, balance.owner, balance.amount);
    }
}

} // namespace settlemill
