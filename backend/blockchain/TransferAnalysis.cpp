#include "include/TransferAnalysis.h"
#include "Callout/Logger.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <cctype>
#include <memory>
#include <utility>

namespace Transfers {

const char* const TRANSFER_TOPIC =
    "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";

namespace {

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

BignumPtr NewBignum() {
    return BignumPtr(BN_new(), &BN_free);
}

bool IsHexDigits(const std::string& text, size_t from) {
    for (size_t i = from; i < text.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

// 0x followed by 64 hex digits
bool IsTopic(const std::string& topic) {
    return topic.size() == 66 && topic.compare(0, 2, "0x") == 0 && IsHexDigits(topic, 2);
}

// Low 20 bytes of an indexed address topic
std::string TopicAddress(const std::string& topic) {
    return "0x" + topic.substr(26);
}

bool DecimalToBignum(const std::string& decimal, BignumPtr& out) {
    BIGNUM* raw = nullptr;
    if (decimal.empty() || BN_dec2bn(&raw, decimal.c_str()) != static_cast<int>(decimal.size())) {
        BN_free(raw);
        return false;
    }
    out.reset(raw);
    return true;
}

struct Balance {
    std::string address;
    BignumPtr change;
};

BIGNUM* BalanceFor(std::vector<Balance>& balances, const std::string& address) {
    for (auto& balance : balances) {
        if (balance.address == address) {
            return balance.change.get();
        }
    }
    balances.push_back(Balance{address, NewBignum()});
    BN_zero(balances.back().change.get());
    return balances.back().change.get();
}

} // namespace

std::string TransferTypeToString(TransferType type) {
    switch (type) {
        case TransferType::Erc20:
            return "erc20";
        case TransferType::Erc721:
            return "erc721";
    }
    return "erc20";
}

std::optional<std::string> HexToDecimal(const std::string& hex) {
    if (hex.compare(0, 2, "0x") != 0 && hex.compare(0, 2, "0X") != 0) {
        return std::nullopt;
    }
    std::string digits = hex.substr(2);
    if (!IsHexDigits(digits, 0)) {
        return std::nullopt;
    }

    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return std::string("0");
    }
    digits = digits.substr(first);
    if (digits.size() > 64) {
        return std::nullopt;
    }

    BIGNUM* raw = nullptr;
    if (BN_hex2bn(&raw, digits.c_str()) != static_cast<int>(digits.size())) {
        BN_free(raw);
        return std::nullopt;
    }
    BignumPtr value(raw, &BN_free);

    char* text = BN_bn2dec(value.get());
    if (text == nullptr) {
        return std::nullopt;
    }
    std::string decimal(text);
    OPENSSL_free(text);
    return decimal;
}

std::string FormatUnits(const std::string& baseUnits, int decimals) {
    size_t first = baseUnits.find_first_not_of('0');
    if (first == std::string::npos) {
        return "0";
    }
    std::string digits = baseUnits.substr(first);
    if (decimals <= 0) {
        return digits;
    }

    size_t places = static_cast<size_t>(decimals);
    std::string integerPart = "0";
    std::string fraction;
    if (digits.size() > places) {
        integerPart = digits.substr(0, digits.size() - places);
        fraction = digits.substr(digits.size() - places);
    } else {
        fraction = std::string(places - digits.size(), '0') + digits;
    }

    size_t last = fraction.find_last_not_of('0');
    if (last == std::string::npos) {
        return integerPart;
    }
    return integerPart + "." + fraction.substr(0, last + 1);
}

std::optional<TokenTransfer> DecodeTransferLog(const EthereumService::EventLog& log) {
    if (log.topics.size() < 3 || log.topics[0] != TRANSFER_TOPIC) {
        return std::nullopt;
    }
    for (size_t i = 1; i < log.topics.size() && i < 4; ++i) {
        if (!IsTopic(log.topics[i])) {
            CALLOUT_LOG_DEBUG("Transfers", "Skipping Transfer log with a malformed topic",
                              "Contract: " + log.address);
            return std::nullopt;
        }
    }

    TokenTransfer transfer;
    transfer.token = log.address;
    transfer.from = TopicAddress(log.topics[1]);
    transfer.to = TopicAddress(log.topics[2]);

    std::optional<std::string> value;
    if (log.topics.size() >= 4) {
        transfer.type = TransferType::Erc721;
        value = HexToDecimal(log.topics[3]);
    } else {
        value = HexToDecimal(log.data);
    }
    if (!value) {
        CALLOUT_LOG_DEBUG("Transfers", "Skipping Transfer log with an undecodable value",
                          "Contract: " + log.address);
        return std::nullopt;
    }
    transfer.value = *value;
    return transfer;
}

std::vector<TokenTransfer> DecodeTransferLogs(const std::vector<EthereumService::EventLog>& logs) {
    std::vector<TokenTransfer> transfers;
    for (const auto& log : logs) {
        auto transfer = DecodeTransferLog(log);
        if (transfer) {
            transfers.push_back(*transfer);
        }
    }
    return transfers;
}

void ApplyTokenInfo(TokenTransfer& transfer, const EthereumService::TokenInfo& info) {
    transfer.info = info;
    if (transfer.type == TransferType::Erc20 && info.decimals && *info.decimals == 0) {
        transfer.type = TransferType::Erc721;
    }
}

TransferSummary SummarizeTransfers(const std::vector<TokenTransfer>& transfers) {
    TransferSummary summary;
    summary.transfers = transfers;

    // Insertion order decides ties
    std::vector<Balance> balances;
    for (const auto& transfer : transfers) {
        BignumPtr amount = NewBignum();
        if (transfer.type == TransferType::Erc721) {
            BN_one(amount.get());
        } else if (!DecimalToBignum(transfer.value, amount)) {
            continue;
        }

        BIGNUM* from = BalanceFor(balances, transfer.from);
        BN_sub(from, from, amount.get());
        BIGNUM* to = BalanceFor(balances, transfer.to);
        BN_add(to, to, amount.get());
    }

    BignumPtr maxLoss = NewBignum();
    BignumPtr maxGain = NewBignum();
    BN_zero(maxLoss.get());
    BN_zero(maxGain.get());

    for (const auto& balance : balances) {
        const BIGNUM* change = balance.change.get();
        if (BN_is_zero(change)) {
            continue;
        }
        if (BN_is_negative(change)) {
            if (BN_ucmp(change, maxLoss.get()) > 0) {
                BN_copy(maxLoss.get(), change);
                summary.victim = balance.address;
            }
        } else if (BN_ucmp(change, maxGain.get()) > 0) {
            BN_copy(maxGain.get(), change);
            summary.scammer = balance.address;
        }
    }

    CALLOUT_LOG_DEBUG("Transfers", "Summarized transfers",
                      "Count: " + std::to_string(transfers.size()) +
                          " | Victim: " + summary.victim.value_or("none") +
                          " | Scammer: " + summary.scammer.value_or("none"));
    return summary;
}

} // namespace Transfers
