#include "include/EthereumService.h"
#include "Callout/Logger.h"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using Callout::ErrorKind;
using Callout::Result;

namespace EthereumService {

namespace {

std::optional<std::string> OptionalString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string StringOr(const json& object, const char* key, const std::string& fallback) {
    auto value = OptionalString(object, key);
    return value ? *value : fallback;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<TransactionRecord> RecordFromJson(const json& tx) {
    if (!tx.is_object()) {
        return std::nullopt;
    }

    TransactionRecord record;
    record.hash = StringOr(tx, "hash", "");
    record.from = StringOr(tx, "from", "");
    record.to = OptionalString(tx, "to");
    record.value = StringOr(tx, "value", "0x0");
    record.input = StringOr(tx, "input", StringOr(tx, "data", "0x"));
    record.nonce = StringOr(tx, "nonce", "0x0");
    record.gas = StringOr(tx, "gas", "0x0");
    record.chainId = OptionalString(tx, "chainId");
    record.type = OptionalString(tx, "type");
    record.gasPrice = OptionalString(tx, "gasPrice");
    record.maxFeePerGas = OptionalString(tx, "maxFeePerGas");
    record.maxPriorityFeePerGas = OptionalString(tx, "maxPriorityFeePerGas");
    record.yParity = OptionalString(tx, "yParity");

    auto r = OptionalString(tx, "r");
    auto s = OptionalString(tx, "s");
    auto v = OptionalString(tx, "v");
    if (!r || !s || (!v && !record.yParity)) {
        return std::nullopt;
    }
    record.r = *r;
    record.s = *s;
    record.v = v ? *v : *record.yParity;

    auto accessList = tx.find("accessList");
    if (accessList != tx.end() && accessList->is_array()) {
        std::vector<AccessListEntry> entries;
        for (const auto& item : *accessList) {
            if (!item.is_object()) {
                continue;
            }
            AccessListEntry entry;
            entry.address = StringOr(item, "address", "");
            auto keys = item.find("storageKeys");
            if (keys != item.end() && keys->is_array()) {
                for (const auto& key : *keys) {
                    if (key.is_string()) {
                        entry.storageKeys.push_back(key.get<std::string>());
                    }
                }
            }
            entries.push_back(entry);
        }
        record.accessList = entries;
    }

    return record;
}

std::optional<TransactionReceipt> ReceiptFromJson(const json& object) {
    if (!object.is_object()) {
        return std::nullopt;
    }

    TransactionReceipt receipt;
    receipt.transactionHash = StringOr(object, "transactionHash", "");
    receipt.status = OptionalString(object, "status");

    auto logs = object.find("logs");
    if (logs != object.end() && logs->is_array()) {
        for (const auto& item : *logs) {
            if (!item.is_object()) {
                continue;
            }
            EventLog log;
            log.address = ToLower(StringOr(item, "address", ""));
            log.data = StringOr(item, "data", "0x");
            auto topics = item.find("topics");
            if (topics != item.end() && topics->is_array()) {
                for (const auto& topic : *topics) {
                    if (topic.is_string()) {
                        log.topics.push_back(ToLower(topic.get<std::string>()));
                    }
                }
            }
            receipt.logs.push_back(log);
        }
    }
    return receipt;
}

// "result" of a JSON-RPC call taking a transaction hash; a null result is TransactionNotFound
Result<json> CallRpc(HttpTransport& transport, const std::string& rpcUrl, uint64_t requestId,
                     const std::string& method, const std::string& txHash) {
    json payload = {{"jsonrpc", "2.0"},
                    {"id", requestId},
                    {"method", method},
                    {"params", json::array({txHash})}};

    HttpResponse response = transport.PostJson(rpcUrl, payload.dump());
    if (!response.ok()) {
        CALLOUT_LOG_WARNING("EthereumClient", "RPC request failed",
                            "RPC: " + rpcUrl + " | Method: " + method + " | " + response.error);
        return Result<json>(ErrorKind::NetworkError,
                            "RPC request to " + rpcUrl + " failed: " + response.error);
    }

    try {
        json data = json::parse(response.body);

        if (data.contains("error") && !data["error"].is_null()) {
            std::string message = data["error"].is_object()
                                      ? StringOr(data["error"], "message", "unknown error")
                                      : data["error"].dump();
            return Result<json>(ErrorKind::NetworkError, "RPC error: " + message);
        }

        if (!data.contains("result") || data["result"].is_null()) {
            return Result<json>(ErrorKind::TransactionNotFound, "Transaction not found: " + txHash);
        }
        return Result<json>(data["result"]);
    } catch (const json::exception& e) {
        return Result<json>(ErrorKind::NetworkError,
                            std::string("Malformed RPC response: ") + e.what());
    }
}

// Decimal places from a string or number field
std::optional<int> DecimalsField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        return it->get<int>();
    }
    if (it->is_string()) {
        std::string digits = it->get<std::string>();
        if (!digits.empty() && digits.size() <= 3 &&
            std::all_of(digits.begin(), digits.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::stoi(digits);
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<TransactionRecord> ParseTransactionRecord(const std::string& jsonText) {
    try {
        return RecordFromJson(json::parse(jsonText));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::optional<TransactionReceipt> ParseTransactionReceipt(const std::string& jsonText) {
    try {
        return ReceiptFromJson(json::parse(jsonText));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

EthereumClient::EthereumClient(std::shared_ptr<HttpTransport> transport)
    : m_transport(std::move(transport)), m_requestId(0) {}

Result<TransactionRecord> EthereumClient::GetTransactionByHash(const std::string& rpcUrl,
                                                               const std::string& txHash) {
    auto result = CallRpc(*m_transport, rpcUrl, ++m_requestId, "eth_getTransactionByHash", txHash);
    if (!result) {
        return Result<TransactionRecord>(result.kind(), result.error());
    }

    auto record = RecordFromJson(*result);
    if (!record) {
        return Result<TransactionRecord>(ErrorKind::SignatureRecoveryFailed,
                                         "Transaction " + txHash + " carries no signature");
    }

    CALLOUT_LOG_DEBUG("EthereumClient", "Fetched transaction",
                      "Hash: " + txHash + " | Type: " + record->type.value_or("legacy"));
    return Result<TransactionRecord>(*record);
}

Result<TransactionReceipt> EthereumClient::GetTransactionReceipt(const std::string& rpcUrl,
                                                                 const std::string& txHash) {
    auto result = CallRpc(*m_transport, rpcUrl, ++m_requestId, "eth_getTransactionReceipt", txHash);
    if (!result) {
        return Result<TransactionReceipt>(result.kind(), result.error());
    }

    auto receipt = ReceiptFromJson(*result);
    if (!receipt) {
        return Result<TransactionReceipt>(ErrorKind::NetworkError,
                                          "Malformed receipt for " + txHash);
    }

    CALLOUT_LOG_DEBUG("EthereumClient", "Fetched receipt",
                      "Hash: " + txHash + " | Logs: " + std::to_string(receipt->logs.size()));
    return Result<TransactionReceipt>(*receipt);
}

Result<std::vector<ExplorerTransaction>> EthereumClient::GetRecentTransactions(
    const NetworkConfig& network, const std::string& address, const std::string& apiKey,
    uint32_t limit) {
    if (apiKey.empty()) {
        return Result<std::vector<ExplorerTransaction>>(ErrorKind::MissingApiKey,
                                                        "Explorer API key is required");
    }

    QueryParameters parameters = {{"module", "account"},       {"action", "txlist"},
                                  {"address", address},         {"startblock", "0"},
                                  {"endblock", "99999999"},     {"page", "1"},
                                  {"offset", std::to_string(limit)}, {"sort", "desc"},
                                  {"apikey", apiKey}};

    HttpResponse response = m_transport->Get(network.explorerApiBase, parameters);
    if (!response.ok()) {
        return Result<std::vector<ExplorerTransaction>>(
            ErrorKind::NetworkError, network.name + " explorer request failed: " + response.error);
    }

    try {
        json data = json::parse(response.body);
        std::vector<ExplorerTransaction> transactions;

        bool hasList = data.contains("result") && data["result"].is_array();
        if (StringOr(data, "status", "0") != "1") {
            // "No transactions found" comes back as status 0 with an empty list
            if (hasList && data["result"].empty()) {
                return Result<std::vector<ExplorerTransaction>>(transactions);
            }
            std::string detail = data.contains("result") && data["result"].is_string()
                                     ? data["result"].get<std::string>()
                                     : StringOr(data, "message", "unknown error");
            return Result<std::vector<ExplorerTransaction>>(
                ErrorKind::NetworkError, network.name + " explorer error: " + detail);
        }

        if (!hasList) {
            return Result<std::vector<ExplorerTransaction>>(
                ErrorKind::NetworkError, network.name + " explorer returned no transaction list");
        }

        for (const auto& tx_json : data["result"]) {
            if (!tx_json.is_object()) {
                continue;
            }
            ExplorerTransaction tx;
            tx.hash = StringOr(tx_json, "hash", "");
            tx.from = ToLower(StringOr(tx_json, "from", ""));
            tx.to = ToLower(StringOr(tx_json, "to", ""));
            tx.blockNumber = StringOr(tx_json, "blockNumber", "0");
            tx.timeStamp = StringOr(tx_json, "timeStamp", "0");
            tx.input = StringOr(tx_json, "input", "0x");
            transactions.push_back(tx);
        }

        return Result<std::vector<ExplorerTransaction>>(transactions);
    } catch (const json::exception& e) {
        return Result<std::vector<ExplorerTransaction>>(
            ErrorKind::NetworkError, network.name + " explorer response malformed: " + e.what());
    }
}

Result<bool> EthereumClient::LookupTransactionHash(const NetworkConfig& network,
                                                   const std::string& txHash,
                                                   const std::string& apiKey) {
    if (apiKey.empty()) {
        return Result<bool>(ErrorKind::MissingApiKey, "Explorer API key is required");
    }

    QueryParameters parameters = {{"module", "proxy"},
                                  {"action", "eth_getTransactionByHash"},
                                  {"txhash", txHash},
                                  {"apikey", apiKey}};

    HttpResponse response = m_transport->Get(network.explorerApiBase, parameters);
    if (!response.ok()) {
        return Result<bool>(ErrorKind::NetworkError,
                            network.name + " explorer request failed: " + response.error);
    }

    try {
        json data = json::parse(response.body);
        auto result = data.find("result");
        bool found = result != data.end() && result->is_object() && result->contains("hash") &&
                     !(*result)["hash"].is_null();
        return Result<bool>(found);
    } catch (const json::exception& e) {
        return Result<bool>(ErrorKind::NetworkError,
                            network.name + " explorer response malformed: " + e.what());
    }
}

Result<TokenInfo> EthereumClient::GetTokenInfo(const NetworkConfig& network,
                                               const std::string& contractAddress,
                                               const std::string& apiKey) {
    if (apiKey.empty()) {
        return Result<TokenInfo>(ErrorKind::MissingApiKey, "Explorer API key is required");
    }

    QueryParameters parameters = {{"module", "token"},
                                  {"action", "tokeninfo"},
                                  {"contractaddress", contractAddress},
                                  {"apikey", apiKey}};

    HttpResponse response = m_transport->Get(network.explorerApiBase, parameters);
    if (!response.ok()) {
        return Result<TokenInfo>(ErrorKind::NetworkError,
                                 network.name + " explorer request failed: " + response.error);
    }

    try {
        json data = json::parse(response.body);
        auto result = data.find("result");
        const json* entry = nullptr;
        if (result != data.end()) {
            if (result->is_array() && !result->empty()) {
                entry = &result->front();
            } else if (result->is_object()) {
                entry = &*result;
            }
        }
        if (entry == nullptr || !entry->is_object()) {
            return Result<TokenInfo>(ErrorKind::NetworkError,
                                     network.name + " explorer has no token info for " +
                                         contractAddress);
        }

        TokenInfo info;
        info.symbol = StringOr(*entry, "symbol", "");
        info.name = StringOr(*entry, "tokenName", StringOr(*entry, "name", ""));
        info.decimals = DecimalsField(*entry, "divisor");
        if (!info.decimals) {
            info.decimals = DecimalsField(*entry, "decimals");
        }
        return Result<TokenInfo>(info);
    } catch (const json::exception& e) {
        return Result<TokenInfo>(ErrorKind::NetworkError,
                                 network.name + " explorer response malformed: " + e.what());
    }
}

} // namespace EthereumService
