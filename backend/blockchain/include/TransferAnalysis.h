#pragma once

#include "EthereumService.h"

#include <optional>
#include <string>
#include <vector>

namespace Transfers {

// keccak256("Transfer(address,address,uint256)"), shared by ERC-20 and ERC-721
extern const char* const TRANSFER_TOPIC;

enum class TransferType {
    Erc20,
    Erc721
};

std::string TransferTypeToString(TransferType type);

/**
 * @brief One decoded Transfer event
 *
 * Addresses are lowercase and 0x-prefixed. value is a decimal string in the
 * token's base units; for ERC-721 it is the token id.
 */
struct TokenTransfer {
    TransferType type = TransferType::Erc20;
    std::string token;  // emitting contract
    std::string from;
    std::string to;
    std::string value;
    std::optional<EthereumService::TokenInfo> info;
};

/**
 * @brief Who lost and who gained in a set of transfers
 *
 * victim is the address with the largest net outflow, scammer the one with
 * the largest net inflow. Each ERC-721 transfer moves one unit.
 */
struct TransferSummary {
    std::optional<std::string> victim;
    std::optional<std::string> scammer;
    std::vector<TokenTransfer> transfers;
};

/**
 * @brief Decode a Transfer event log
 * @return The transfer, or nullopt for other events and malformed topics
 *
 * A fourth topic (indexed token id) marks an ERC-721 transfer.
 */
std::optional<TokenTransfer> DecodeTransferLog(const EthereumService::EventLog& log);

// Transfer events of a receipt, in log order
std::vector<TokenTransfer> DecodeTransferLogs(const std::vector<EthereumService::EventLog>& logs);

/**
 * @brief Attach token metadata
 *
 * A token reporting zero decimals is treated as ERC-721 when the log did not
 * already say so.
 */
void ApplyTokenInfo(TokenTransfer& transfer, const EthereumService::TokenInfo& info);

TransferSummary SummarizeTransfers(const std::vector<TokenTransfer>& transfers);

/**
 * @brief Convert a 0x-prefixed hex quantity of up to 256 bits to decimal
 * @return The decimal string, or nullopt for malformed or oversized input
 *
 * "0x" alone is zero, as in empty log data.
 */
std::optional<std::string> HexToDecimal(const std::string& hex);

/**
 * @brief Render a base-unit amount with a decimal point
 *
 * FormatUnits("1500000", 6) is "1.5"; trailing fractional zeros are dropped.
 */
std::string FormatUnits(const std::string& baseUnits, int decimals);

} // namespace Transfers
