#include "abicodec.hpp"
#include "balancesheet.hpp"
#include "errors.hpp"
#include "fillledger.hpp"
#include "hex.hpp"
#include "metatransaction.hpp"
#include "settlementcore.hpp"
#include "signatureverifier.hpp"
#include "venueconfig.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

using namespace settlemill;

namespace {

void printEvent(const ExchangeEvent& event)
{
    std::visit(
        [](const auto& record) {
            using Record = std::decay_t<decltype(record)>;
            if constexpr (std::is_same_v<Record, FillEvent>) {
                std::cout << "FILL order=" << hex::encode(record.orderHash) << " maker=" << hex::encode(record.makerAddress)
                          << " taker=" << hex::encode(record.takerAddress)
                          << " makerFilled=" << record.makerAssetFilledAmount
                          << " takerFilled=" << record.takerAssetFilledAmount << " makerFee=" << record.makerFeePaid
                          << " takerFee=" << record.takerFeePaid << std::endl;
            } else if constexpr (std::is_same_v<Record, CancelEvent>) {
                std::cout << "CANCEL order=" << hex::encode(record.orderHash)
                          << " maker=" << hex::encode(record.makerAddress)
                          << " makerCancelled=" << record.makerAssetCancelledAmount
                          << " takerCancelled=" << record.takerAssetCancelledAmount << std::endl;
            } else if constexpr (std::is_same_v<Record, CancelUpToEvent>) {
                std::cout << "CANCEL_UP_TO maker=" << hex::encode(record.makerAddress)
                          << " epoch=" << record.orderEpoch << std::endl;
            } else {
                std::cout << "NOOP " << toString(record.kind) << " order=" << hex::encode(record.orderHash)
                          << " requested=" << record.requestedAmount << std::endl;
            }
        },
        event);
}

// <nonce> <signer> <payloadHex> <signatureHex> [sender]
bool replayLine(MetaTransactionGate& gate, const std::string& line, size_t lineNumber)
{
    std::istringstream fields(line);
    std::string nonceText, signerText, payloadText, signatureText, senderText;
    if (!(fields >> nonceText >> signerText >> payloadText >> signatureText)) {
        std::cerr << "Line " << lineNumber << ": expected <nonce> <signer> <payload> <signature> [sender]"
                  << std::endl;
        return false;
    }
    fields >> senderText;

    try {
        if (nonceText.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("nonce must be a decimal integer");
        }
        // A leading zero would make the parser read octal
        Uint256 nonce(nonceText.substr(std::min(nonceText.find_first_not_of('0'), nonceText.size() - 1)));
        Address signer = hex::toAddress(signerText);
        Address sender = senderText.empty() ? signer : hex::toAddress(senderText);
        Bytes payload = hex::decode(payloadText);
        Signature signature = settlemill::abi::decodeSignature(hex::decode(signatureText));

        ExecutionResult result = gate.execute(nonce, signer, payload, signature, sender);
        std::cout << "TX " << hex::encode(result.transactionHash)
                  << (result.kind == PayloadKind::FillOrder ? " fillOrder" : " unsupported")
                  << " filled=" << result.takerAssetFilledAmount << std::endl;
        return true;

    } catch (const ExchangeError& e) {
        std::cerr << "Line " << lineNumber << ": rejected: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Line " << lineNumber << ": malformed field: " << e.what() << std::endl;
    }
    return false;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " <venue.json> <transactions.txt>" << std::endl;
            return 1;
        }
        std::string venuePath = argv[1];
        std::string transactionsPath = argv[2];

        std::cout << "SettleMill Settlement Engine" << std::endl;
        std::cout << "Loading venue from " << venuePath << "..." << std::endl;

        VenueConfig config;
        config.loadFromFile(venuePath);
        std::cout << "Venue " << hex::encode(config.venue()) << ", " << config.balances().size()
                  << " seeded balances." << std::endl;

        // Initialize components
        BalanceSheet balances(config.feeToken());
        config.seed(balances);

        FillLedger ledger;
        EcdsaSignatureVerifier verifier;
        SettlementCore::Clock clock = SettlementCore::systemClock;
        if (config.fixedTime().has_value()) {
            Timestamp now = *config.fixedTime();
            clock = [now] { return now; };
            std::cout << "Clock fixed at " << now << std::endl;
        }

        SettlementCore core(config.venue(), ledger, verifier, balances, clock);
        core.setEventCallback(printEvent);
        MetaTransactionGate gate(core, ledger, verifier);

        std::ifstream transactions(transactionsPath);
        if (!transactions.is_open()) {
            throw std::runtime_error("Failed to open transactions file: " + transactionsPath);
        }

        size_t lineNumber = 0;
        size_t executed = 0;
        size_t rejected = 0;
        std::string line;
        while (std::getline(transactions, line)) {
            ++lineNumber;
            auto firstChar = line.find_first_not_of(" \t\r");
            if (firstChar == std::string::npos || line[firstChar] == '#') {
                continue;
            }
            if (replayLine(gate, line, lineNumber)) {
                ++executed;
            } else {
                ++rejected;
            }
        }

        std::cout << "Replayed " << executed << " transactions, rejected " << rejected << "." << std::endl;
        std::cout << "Ledger holds " << ledger.entryCount() << " orders, " << ledger.executedTransactionCount()
                  << " executed transactions." << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
