/**
 * @file TestTransactions.h
 * @brief Golden signed transactions, all signed by TEST_PRIVATE_KEY
 *
 * Field values are the hex quantities a node returns from
 * eth_getTransactionByHash. ToRpcResponse() wraps a record the way a
 * JSON-RPC endpoint does, for use with MockHttpTransport.
 */

#pragma once

#include "EthereumService.h"
#include "TestUtils.h"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace TestTransactions {

constexpr const char* RECIPIENT = "0x3535353535353535353535353535353535353535";

constexpr const char* EIP155_HASH = "0x33469b22e9f636356c4160a87eb19df52b7412e8eac32a4a55ffe88ea8350788";
constexpr const char* PRE_EIP155_HASH = "0x1111111111111111111111111111111111111111111111111111111111111111";
constexpr const char* ACCESS_LIST_HASH = "0x2222222222222222222222222222222222222222222222222222222222222222";
constexpr const char* DYNAMIC_FEE_HASH = "0x3333333333333333333333333333333333333333333333333333333333333333";

// EIP-155 example: 1 ETH, nonce 9, chain 1 (v = 37)
inline EthereumService::TransactionRecord Eip155Transaction() {
    EthereumService::TransactionRecord tx;
    tx.hash = EIP155_HASH;
    tx.from = TEST_ADDRESS;
    tx.to = std::string(RECIPIENT);
    tx.nonce = "0x9";
    tx.gasPrice = std::string("0x4a817c800");
    tx.gas = "0x5208";
    tx.value = "0xde0b6b3a7640000";
    tx.input = "0x";
    tx.type = std::string("0x0");
    tx.v = "0x25";
    tx.r = "0x28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276";
    tx.s = "0x67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83";
    return tx;
}

// Unprotected legacy transaction (v = 27)
inline EthereumService::TransactionRecord PreEip155Transaction() {
    EthereumService::TransactionRecord tx;
    tx.hash = PRE_EIP155_HASH;
    tx.from = TEST_ADDRESS;
    tx.to = std::string(RECIPIENT);
    tx.nonce = "0x0";
    tx.gasPrice = std::string("0x3b9aca00");
    tx.gas = "0x5208";
    tx.value = "0x1";
    tx.input = "0x";
    tx.v = "0x1b";
    tx.r = "0x5fe92babbf06bb926110e43d56e6f42e3b142f1db7ee07012c0a9440a99dcac6";
    tx.s = "0x36caa19be1d31113c2a5339aafd528f4241d8f6b4dbdb84276b805b5d8c7d5af";
    return tx;
}

// EIP-2930 on Polygon (chain 137)
inline EthereumService::TransactionRecord AccessListTransaction() {
    EthereumService::TransactionRecord tx;
    tx.hash = ACCESS_LIST_HASH;
    tx.from = TEST_ADDRESS;
    tx.to = std::string(RECIPIENT);
    tx.chainId = std::string("0x89");
    tx.nonce = "0x3";
    tx.gasPrice = std::string("0x6fc23ac00");
    tx.gas = "0x61a8";
    tx.value = "0x5";
    tx.input = "0x";
    tx.type = std::string("0x1");
    tx.accessList = std::vector<EthereumService::AccessListEntry>();
    tx.v = "0x0";
    tx.yParity = std::string("0x0");
    tx.r = "0x8a078793a990f76c986fb99f57291d803d8218f9353931273dae848d2704b027";
    // Nodes drop leading zero nibbles
    tx.s = "0x6e71a641d2ddbc8f3d4d5b9097a6bb7b54400ec21647afb0bcc3e783a54d3fd";
    return tx;
}

// EIP-1559 on chain 1 carrying "Hello" as calldata
inline EthereumService::TransactionRecord DynamicFeeTransaction() {
    EthereumService::TransactionRecord tx;
    tx.hash = DYNAMIC_FEE_HASH;
    tx.from = TEST_ADDRESS;
    tx.to = std::string(RECIPIENT);
    tx.chainId = std::string("0x1");
    tx.nonce = "0x7";
    tx.maxPriorityFeePerGas = std::string("0x77359400");
    tx.maxFeePerGas = std::string("0x174876e800");
    tx.gas = "0x7530";
    tx.value = "0x0";
    tx.input = "0x48656c6c6f";
    tx.type = std::string("0x2");
    tx.accessList = std::vector<EthereumService::AccessListEntry>();
    tx.v = "0x0";
    tx.yParity = std::string("0x0");
    tx.r = "0x9377c312145a5afb911bf9e8c067bcf6094c533603687850df502b61290bbf5e";
    tx.s = "0x5bbdee1fb8ea5d6f4baee4d7634f2ed5f3394191ffdb9b30ad3281b44dfd3132";
    return tx;
}

inline nlohmann::json ToJson(const EthereumService::TransactionRecord& tx) {
    nlohmann::json object = {{"hash", tx.hash},   {"from", tx.from},   {"value", tx.value},
                             {"input", tx.input}, {"nonce", tx.nonce}, {"gas", tx.gas},
                             {"r", tx.r},         {"s", tx.s},         {"v", tx.v}};
    object["to"] = tx.to ? nlohmann::json(*tx.to) : nlohmann::json(nullptr);
    if (tx.chainId) object["chainId"] = *tx.chainId;
    if (tx.type) object["type"] = *tx.type;
    if (tx.gasPrice) object["gasPrice"] = *tx.gasPrice;
    if (tx.maxFeePerGas) object["maxFeePerGas"] = *tx.maxFeePerGas;
    if (tx.maxPriorityFeePerGas) object["maxPriorityFeePerGas"] = *tx.maxPriorityFeePerGas;
    if (tx.yParity) object["yParity"] = *tx.yParity;
    if (tx.accessList) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& entry : *tx.accessList) {
            list.push_back({{"address", entry.address}, {"storageKeys", entry.storageKeys}});
        }
        object["accessList"] = list;
    }
    return object;
}

inline std::string ToRpcResponse(const EthereumService::TransactionRecord& tx) {
    nlohmann::json response = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", ToJson(tx)}};
    return response.dump();
}

inline std::string RpcNullResult() {
    return R"({"jsonrpc":"2.0","id":1,"result":null})";
}

// Explorer txlist reply with one row per (hash, from) pair
inline std::string TxListResponse(const std::vector<std::pair<std::string, std::string>>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& row : rows) {
        result.push_back({{"hash", row.first},
                          {"from", row.second},
                          {"to", RECIPIENT},
                          {"blockNumber", "19000000"},
                          {"timeStamp", "1700000000"}});
    }
    nlohmann::json response = {{"status", "1"}, {"message", "OK"}, {"result", result}};
    return response.dump();
}

inline std::string EmptyTxListResponse() {
    return R"({"status":"0","message":"No transactions found","result":[]})";
}

inline std::string ProxyFoundResponse(const std::string& hash) {
    nlohmann::json response = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"hash", hash}}}};
    return response.dump();
}

// ---- Receipts and explorer rows for theft analysis and the message feed ----

constexpr const char* THEFT_HASH = "0x4444444444444444444444444444444444444444444444444444444444444444";
constexpr const char* USDC_TOKEN = "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48";
constexpr const char* USDC_TOKEN_CHECKSUMMED = "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48";
constexpr const char* TRANSFER_EVENT = "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";
constexpr const char* APPROVAL_EVENT = "0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925";

inline std::string Lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Address left-padded to a 32-byte indexed topic
inline std::string AddressTopic(const std::string& address) {
    return "0x000000000000000000000000" + Lowercase(address.substr(2));
}

// 32-byte word from unprefixed hex digits
inline std::string Word(const std::string& digits) {
    return "0x" + std::string(64 - digits.size(), '0') + digits;
}

inline nlohmann::json ReceiptLog(const std::string& token, const std::vector<std::string>& topics,
                                 const std::string& data) {
    return {{"address", token}, {"topics", topics}, {"data", data}, {"logIndex", "0x0"}};
}

inline nlohmann::json TransferLog(const std::string& token, const std::string& from,
                                  const std::string& to, const std::string& valueDigits) {
    return ReceiptLog(token, {TRANSFER_EVENT, AddressTopic(from), AddressTopic(to)}, Word(valueDigits));
}

/**
 * TEST_ADDRESS approves and loses 1500 USDC (0x59682f00 base units) to
 * SECOND_ADDRESS, which forwards 500 USDC (0x1dcd6500) to RECIPIENT.
 */
inline nlohmann::json TheftLogs() {
    return nlohmann::json::array(
        {ReceiptLog(USDC_TOKEN, {APPROVAL_EVENT, AddressTopic(TEST_ADDRESS), AddressTopic(SECOND_ADDRESS)},
                    Word("ffffffff")),
         TransferLog(USDC_TOKEN, TEST_ADDRESS, SECOND_ADDRESS, "59682f00"),
         TransferLog(USDC_TOKEN, SECOND_ADDRESS, RECIPIENT, "1dcd6500")});
}

inline std::string ReceiptResponse(const std::string& hash, const nlohmann::json& logs,
                                   const std::string& status = "0x1") {
    nlohmann::json receipt = {{"transactionHash", hash},
                              {"status", status},
                              {"blockNumber", "0x121eac0"},
                              {"logs", logs}};
    nlohmann::json response = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", receipt}};
    return response.dump();
}

// Etherscan tokeninfo reply
inline std::string TokenInfoResponse(const std::string& symbol, const std::string& name,
                                     const std::string& divisor) {
    nlohmann::json row = {{"contractAddress", USDC_TOKEN},
                          {"tokenName", name},
                          {"symbol", symbol},
                          {"divisor", divisor}};
    nlohmann::json response = {
        {"status", "1"}, {"message", "OK"}, {"result", nlohmann::json::array({row})}};
    return response.dump();
}

struct FeedRow {
    std::string hash;
    std::string from;
    std::string to;
    std::string input;
};

// Explorer txlist reply carrying calldata
inline std::string FeedTxListResponse(const std::vector<FeedRow>& rows) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& row : rows) {
        result.push_back({{"hash", row.hash},
                          {"from", row.from},
                          {"to", row.to},
                          {"input", row.input},
                          {"blockNumber", "19000000"},
                          {"timeStamp", "1700000000"}});
    }
    nlohmann::json response = {{"status", "1"}, {"message", "OK"}, {"result", result}};
    return response.dump();
}

} // namespace TestTransactions
