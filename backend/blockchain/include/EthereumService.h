#pragma once

#include "Callout/CalloutTypes.h"
#include "HttpTransport.h"
#include "NetworkConfig.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace EthereumService {

/**
 * @brief One entry of an EIP-2930 access list
 */
struct AccessListEntry {
    std::string address;
    std::vector<std::string> storageKeys;
};

/**
 * @brief Transaction as returned by eth_getTransactionByHash
 *
 * Quantities are kept as the node's 0x-prefixed hex strings so that
 * arbitrarily wide values (value, fees) survive without conversion.
 */
struct TransactionRecord {
    std::string hash;
    std::string from;
    std::optional<std::string> to;       // nullopt for contract creation
    std::string value;
    std::string input;                   // calldata
    std::string nonce;
    std::string gas;
    std::optional<std::string> chainId;
    std::optional<std::string> type;     // "0x0", "0x1", "0x2", ...
    std::optional<std::string> gasPrice;
    std::optional<std::string> maxFeePerGas;
    std::optional<std::string> maxPriorityFeePerGas;
    std::optional<std::vector<AccessListEntry>> accessList;
    std::string r;
    std::string s;
    std::string v;
    std::optional<std::string> yParity;
};

/**
 * @brief Summary row from an explorer txlist query
 */
struct ExplorerTransaction {
    std::string hash;
    std::string from;
    std::string to;
    std::string blockNumber;
    std::string timeStamp;
    std::string input;
};

/**
 * @brief One log emitted by a transaction
 */
struct EventLog {
    std::string address;              // emitting contract
    std::vector<std::string> topics;  // topics[0] is the event signature hash
    std::string data;
};

/**
 * @brief Transaction receipt as returned by eth_getTransactionReceipt
 */
struct TransactionReceipt {
    std::string transactionHash;
    std::optional<std::string> status;  // "0x1" success, "0x0" reverted
    std::vector<EventLog> logs;
};

/**
 * @brief Token metadata from an explorer tokeninfo query
 */
struct TokenInfo {
    std::string symbol;
    std::string name;
    std::optional<int> decimals;
};

/**
 * @brief Parse a JSON transaction object (the "result" of eth_getTransactionByHash)
 * @param jsonText JSON text of the object
 * @return The record, or nullopt if it is not an object or lacks the signature fields
 */
std::optional<TransactionRecord> ParseTransactionRecord(const std::string& jsonText);

/**
 * @brief Parse a JSON receipt object (the "result" of eth_getTransactionReceipt)
 * @return The receipt, or nullopt if the text is not a JSON object
 */
std::optional<TransactionReceipt> ParseTransactionReceipt(const std::string& jsonText);

/**
 * @brief Explorer and JSON-RPC client
 *
 * Failures are classified into stable error kinds: transport, HTTP and JSON
 * problems are NetworkError; a null RPC result is TransactionNotFound; an
 * empty API key is MissingApiKey.
 */
class EthereumClient {
public:
    explicit EthereumClient(std::shared_ptr<HttpTransport> transport);

    /**
     * @brief Fetch a transaction over JSON-RPC
     * @param rpcUrl Chain RPC endpoint
     * @param txHash 0x-prefixed 32-byte hash
     */
    Callout::Result<TransactionRecord> GetTransactionByHash(const std::string& rpcUrl,
                                                            const std::string& txHash);

    /**
     * @brief Fetch a transaction receipt over JSON-RPC
     *
     * A null result (unknown or still pending transaction) is TransactionNotFound.
     */
    Callout::Result<TransactionReceipt> GetTransactionReceipt(const std::string& rpcUrl,
                                                              const std::string& txHash);

    /**
     * @brief List an address's most recent transactions from a block explorer
     *
     * Queries module=account&action=txlist sorted newest first. An explorer
     * reply of status "0" with an empty result is an empty list, not an error.
     *
     * @param network Network whose explorer to query
     * @param address Account address
     * @param apiKey Explorer API key (required)
     * @param limit Page size
     */
    Callout::Result<std::vector<ExplorerTransaction>> GetRecentTransactions(
        const NetworkConfig& network, const std::string& address, const std::string& apiKey,
        uint32_t limit = 5);

    /**
     * @brief Ask a block explorer whether it knows a transaction hash
     *
     * Uses module=proxy&action=eth_getTransactionByHash. The hash exists when
     * the result object carries a "hash" field.
     */
    Callout::Result<bool> LookupTransactionHash(const NetworkConfig& network,
                                                const std::string& txHash,
                                                const std::string& apiKey);

    /**
     * @brief Look up a token contract's symbol, name and decimals
     *
     * Uses module=token&action=tokeninfo. Accepts both the list form
     * (tokenName, symbol, divisor) and the object form (name, symbol, decimals).
     */
    Callout::Result<TokenInfo> GetTokenInfo(const NetworkConfig& network,
                                            const std::string& contractAddress,
                                            const std::string& apiKey);

private:
    std::shared_ptr<HttpTransport> m_transport;
    uint64_t m_requestId;
};

} // namespace EthereumService
