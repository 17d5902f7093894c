#include "include/PublicKeyRecovery.h"
#include "Callout/Errors.h"
#include "Callout/Logger.h"
#include "Crypto.h"
#include "RLPEncoder.h"

#include <algorithm>
#include <cctype>

using Callout::ErrorKind;
using Callout::Result;
using EthereumService::NetworkConfig;
using EthereumService::TransactionRecord;

namespace Recovery {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Parse a 0x-prefixed hex quantity that must fit in 64 bits
bool ParseHexU64(const std::string& hex, uint64_t& value) {
    std::string digits = Crypto::StripHexPrefix(hex);
    if (digits.empty()) {
        return false;
    }
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        value = 0;
        return Crypto::IsHexString(digits);
    }
    digits = digits.substr(first);
    if (digits.size() > 16 || !Crypto::IsHexString(digits)) {
        return false;
    }
    value = std::stoull(digits, nullptr, 16);
    return true;
}

Result<SigningPayload> MalformedField(const std::string& field) {
    return Result<SigningPayload>(ErrorKind::SignatureRecoveryFailed,
                                  "Transaction field '" + field + "' is missing or malformed");
}

// Incrementally collects RLP items; the first malformed field is remembered
class FieldList {
public:
    void quantity(const std::optional<std::string>& hex, const char* name) {
        if (!hex) {
            fail(name);
            return;
        }
        add(RLP::Encoder::EncodeQuantity(*hex), name);
    }

    void bytes(const std::string& hex, const char* name) {
        add(RLP::Encoder::EncodeHex(hex), name);
    }

    void uint(uint64_t value) { m_items.push_back(RLP::Encoder::EncodeUInt(value)); }

    void to(const std::optional<std::string>& to) {
        if (to) {
            add(RLP::Encoder::EncodeHex(*to), "to");
        } else {
            // Contract creation
            m_items.push_back(RLP::Encoder::EncodeBytes({}));
        }
    }

    void accessList(const std::optional<std::vector<EthereumService::AccessListEntry>>& list) {
        std::vector<std::vector<uint8_t>> entries;
        if (list) {
            for (const auto& entry : *list) {
                auto address = RLP::Encoder::EncodeHex(entry.address);
                if (!address) {
                    fail("accessList.address");
                    return;
                }
                std::vector<std::vector<uint8_t>> keys;
                for (const auto& key : entry.storageKeys) {
                    auto encoded = RLP::Encoder::EncodeHex(key);
                    if (!encoded) {
                        fail("accessList.storageKeys");
                        return;
                    }
                    keys.push_back(*encoded);
                }
                entries.push_back(RLP::Encoder::EncodeList({*address, RLP::Encoder::EncodeList(keys)}));
            }
        }
        m_items.push_back(RLP::Encoder::EncodeList(entries));
    }

    bool ok() const { return m_failedField.empty(); }
    const std::string& failedField() const { return m_failedField; }

    std::vector<uint8_t> encode(std::optional<uint8_t> typePrefix) const {
        std::vector<uint8_t> out;
        if (typePrefix) {
            out.push_back(*typePrefix);
        }
        std::vector<uint8_t> list = RLP::Encoder::EncodeList(m_items);
        out.insert(out.end(), list.begin(), list.end());
        return out;
    }

private:
    void add(const std::optional<std::vector<uint8_t>>& item, const char* name) {
        if (!item) {
            fail(name);
            return;
        }
        m_items.push_back(*item);
    }

    void fail(const char* name) {
        if (m_failedField.empty()) {
            m_failedField = name;
        }
    }

    std::vector<std::vector<uint8_t>> m_items;
    std::string m_failedField;
};

// Chain id from the record, or from an EIP-155 v value; nullopt when the record's is malformed
std::optional<uint64_t> ResolveChainId(const TransactionRecord& tx, uint64_t v) {
    if (tx.chainId) {
        uint64_t chainId = 0;
        if (!ParseHexU64(*tx.chainId, chainId)) {
            return std::nullopt;
        }
        return chainId;
    }
    if (v >= 35) {
        return (v - 35) / 2;
    }
    return std::nullopt;
}

void AppendLegacyFields(FieldList& fields, const TransactionRecord& tx) {
    fields.quantity(tx.nonce, "nonce");
    fields.quantity(tx.gasPrice, "gasPrice");
    fields.quantity(tx.gas, "gas");
    fields.to(tx.to);
    fields.quantity(tx.value, "value");
    fields.bytes(tx.input, "input");
}

void AppendDynamicFeeFields(FieldList& fields, const TransactionRecord& tx, uint64_t chainId) {
    fields.uint(chainId);
    fields.quantity(tx.nonce, "nonce");
    fields.quantity(tx.maxPriorityFeePerGas, "maxPriorityFeePerGas");
    fields.quantity(tx.maxFeePerGas, "maxFeePerGas");
    fields.quantity(tx.gas, "gas");
    fields.to(tx.to);
    fields.quantity(tx.value, "value");
    fields.bytes(tx.input, "input");
    fields.accessList(tx.accessList);
}

} // namespace

std::string TransactionKindToString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::Legacy:
            return "legacy";
        case TransactionKind::AccessList:
            return "eip2930";
        case TransactionKind::DynamicFee:
            return "eip1559";
        case TransactionKind::Other:
            return "other";
    }
    return "other";
}

TransactionKind ClassifyTransaction(const TransactionRecord& tx) {
    if (!tx.type) {
        return TransactionKind::Legacy;
    }
    uint64_t type = 0;
    if (!ParseHexU64(*tx.type, type)) {
        return TransactionKind::Other;
    }
    switch (type) {
        case 0:
            return TransactionKind::Legacy;
        case 1:
            return TransactionKind::AccessList;
        case 2:
            return TransactionKind::DynamicFee;
        default:
            return TransactionKind::Other;
    }
}

std::string SearchStateToString(SearchState state) {
    switch (state) {
        case SearchState::Found:
            return "Found";
        case SearchState::AbortedOnMismatch:
            return "AbortedOnMismatch";
        case SearchState::ExhaustedAllNetworks:
            return "ExhaustedAllNetworks";
    }
    return "ExhaustedAllNetworks";
}

Result<SigningPayload> BuildSigningPayload(const TransactionRecord& tx) {
    uint64_t v = 0;
    if (!ParseHexU64(tx.v, v)) {
        return MalformedField("v");
    }

    SigningPayload payload;
    payload.kind = ClassifyTransaction(tx);

    // Recovery id: yParity when present, otherwise normalized from v
    uint64_t recoveryId = 0;
    if (tx.yParity) {
        if (!ParseHexU64(*tx.yParity, recoveryId)) {
            return MalformedField("yParity");
        }
    } else if (v >= 35) {
        recoveryId = (v - 35) % 2;
    } else if (v >= 27) {
        recoveryId = v - 27;
    } else {
        recoveryId = v;
    }
    if (recoveryId > 1) {
        return MalformedField("v");
    }
    payload.recoveryId = static_cast<int>(recoveryId);

    FieldList fields;
    std::optional<uint8_t> typePrefix;

    switch (payload.kind) {
        case TransactionKind::Legacy: {
            AppendLegacyFields(fields, tx);
            if (v >= 35) {
                // EIP-155 replay protection
                auto chainId = ResolveChainId(tx, v);
                if (!chainId) {
                    return MalformedField("chainId");
                }
                fields.uint(*chainId);
                fields.uint(0);
                fields.uint(0);
            }
            break;
        }
        case TransactionKind::AccessList: {
            auto chainId = ResolveChainId(tx, v);
            if (!chainId) {
                return MalformedField("chainId");
            }
            fields.uint(*chainId);
            fields.quantity(tx.nonce, "nonce");
            fields.quantity(tx.gasPrice, "gasPrice");
            fields.quantity(tx.gas, "gas");
            fields.to(tx.to);
            fields.quantity(tx.value, "value");
            fields.bytes(tx.input, "input");
            fields.accessList(tx.accessList);
            typePrefix = 0x01;
            break;
        }
        case TransactionKind::DynamicFee: {
            auto chainId = ResolveChainId(tx, v);
            if (!chainId) {
                return MalformedField("chainId");
            }
            AppendDynamicFeeFields(fields, tx, *chainId);
            typePrefix = 0x02;
            break;
        }
        case TransactionKind::Other: {
            // Best effort: keep whichever fee fields the record carries
            payload.approximate = true;
            auto chainId = ResolveChainId(tx, v);
            if (tx.maxFeePerGas || tx.maxPriorityFeePerGas) {
                AppendDynamicFeeFields(fields, tx, chainId.value_or(0));
                typePrefix = 0x02;
            } else {
                AppendLegacyFields(fields, tx);
                if (chainId) {
                    fields.uint(*chainId);
                    fields.uint(0);
                    fields.uint(0);
                }
            }
            CALLOUT_LOG_WARNING("Recovery", "Unsupported transaction type, signing hash is approximate",
                                "Hash: " + tx.hash + " | Type: " + tx.type.value_or("?"));
            break;
        }
    }

    if (!fields.ok()) {
        return MalformedField(fields.failedField());
    }

    payload.preimage = fields.encode(typePrefix);
    if (!Crypto::Keccak256(payload.preimage.data(), payload.preimage.size(), payload.hash)) {
        return Result<SigningPayload>(ErrorKind::SignatureRecoveryFailed,
                                      "Failed to hash signing payload");
    }
    return Result<SigningPayload>(payload);
}

Result<SigningPayload> RecoverSigner(const TransactionRecord& tx, std::vector<uint8_t>& publicKey) {
    auto payload = BuildSigningPayload(tx);
    if (!payload) {
        return payload;
    }

    std::vector<uint8_t> r;
    std::vector<uint8_t> s;
    if (!RLP::Encoder::HexToBytes(tx.r, r) || !RLP::Encoder::HexToBytes(tx.s, s)) {
        return Result<SigningPayload>(ErrorKind::SignatureRecoveryFailed,
                                      "Signature components are not valid hex");
    }

    // Nodes may zero-pad r and s; the curve scalars are at most 32 bytes
    while (r.size() > 32 && r.front() == 0) {
        r.erase(r.begin());
    }
    while (s.size() > 32 && s.front() == 0) {
        s.erase(s.begin());
    }

    if (!Crypto::RecoverPublicKey(payload->hash, r, s, payload->recoveryId, publicKey)) {
        return Result<SigningPayload>(ErrorKind::SignatureRecoveryFailed,
                                      "ECDSA public key recovery failed for " + tx.hash);
    }

    return payload;
}

PublicKeyRecoveryEngine::PublicKeyRecoveryEngine(
    std::shared_ptr<EthereumService::HttpTransport> transport,
    std::vector<NetworkConfig> networks, std::string apiKey)
    : m_client(std::move(transport)), m_networks(std::move(networks)), m_apiKey(std::move(apiKey)) {}

Result<RecoveredPublicKey> PublicKeyRecoveryEngine::recoverFromRecord(const TransactionRecord& tx,
                                                                     const std::string& txHash) {
    std::vector<uint8_t> publicKey;
    auto payload = RecoverSigner(tx, publicKey);
    if (!payload) {
        return Result<RecoveredPublicKey>(payload.kind(), payload.error());
    }

    RecoveredPublicKey recovered;
    if (!Crypto::PublicKeyToAddress(publicKey, recovered.derivedAddress)) {
        return Result<RecoveredPublicKey>(ErrorKind::SignatureRecoveryFailed,
                                          "Recovered key is not a valid uncompressed point");
    }
    recovered.publicKey = "0x" + Crypto::BytesToHex(publicKey);
    recovered.txHash = txHash;
    recovered.approximate = payload->approximate;
    return Result<RecoveredPublicKey>(recovered);
}

Result<RecoveredPublicKey> PublicKeyRecoveryEngine::recoverOnNetwork(const NetworkConfig& network,
                                                                    const std::string& txHash) {
    auto tx = m_client.GetTransactionByHash(network.rpcUrl, txHash);
    if (!tx) {
        return Result<RecoveredPublicKey>(tx.kind(), tx.error());
    }

    auto recovered = recoverFromRecord(*tx, txHash);
    if (recovered) {
        recovered->chainId = network.chainId;
        recovered->chainName = network.name;
    }
    return recovered;
}

Result<RecoveredPublicKey> PublicKeyRecoveryEngine::FetchAndRecoverPublicKey(
    const std::string& rpcUrl, const std::string& txHash) {
    CALLOUT_SCOPED_LOG("Recovery", "FetchAndRecoverPublicKey");

    for (const auto& network : m_networks) {
        if (network.rpcUrl == rpcUrl) {
            return recoverOnNetwork(network, txHash);
        }
    }

    // Endpoint outside the configured list
    auto tx = m_client.GetTransactionByHash(rpcUrl, txHash);
    if (!tx) {
        return Result<RecoveredPublicKey>(tx.kind(), tx.error());
    }

    auto recovered = recoverFromRecord(*tx, txHash);
    if (recovered) {
        uint64_t v = 0;
        if (!ParseHexU64(tx->v, v)) {
            v = 0;
        }
        auto chainId = ResolveChainId(*tx, v);
        recovered->chainId = chainId.value_or(0);
        std::optional<NetworkConfig> known;
        if (chainId) {
            known = EthereumService::FindNetwork(m_networks, *chainId);
        }
        recovered->chainName =
            known ? known->name : "Chain " + std::to_string(recovered->chainId);
    }
    return recovered;
}

Result<NetworkConfig> PublicKeyRecoveryEngine::SearchTransactionAcrossChains(
    const std::string& txHash) {
    if (m_apiKey.empty()) {
        CALLOUT_LOG_WARNING("Recovery", "Explorer API key not provided, skipping cross-chain search");
        return Result<NetworkConfig>(ErrorKind::MissingApiKey,
                                     "Explorer API key is required for cross-chain search");
    }

    for (const auto& network : m_networks) {
        auto found = m_client.LookupTransactionHash(network, txHash, m_apiKey);
        if (!found) {
            CALLOUT_LOG_DEBUG("Recovery", "Lookup failed, trying next network",
                              network.name + " | " + found.error());
            continue;
        }
        if (*found) {
            CALLOUT_LOG_INFO("Recovery", "Transaction located", "Chain: " + network.name);
            return Result<NetworkConfig>(network);
        }
    }

    return Result<NetworkConfig>(ErrorKind::TransactionNotFoundOnAnyNetwork,
                                 "Transaction " + txHash + " was not found on any supported network");
}

Result<RecoveredPublicKey> PublicKeyRecoveryEngine::RecoverPublicKeyFromTransaction(
    const std::string& txHash) {
    auto network = SearchTransactionAcrossChains(txHash);
    if (!network) {
        return Result<RecoveredPublicKey>(network.kind(), network.error());
    }
    return recoverOnNetwork(*network, txHash);
}

AddressSearchOutcome PublicKeyRecoveryEngine::SearchAddress(
    const std::string& address, std::optional<uint64_t> preferredChainId) {
    AddressSearchOutcome outcome;
    const std::string target = ToLower(address);

    auto skip = [&outcome](const NetworkConfig& network, ErrorKind kind,
                           const std::string& message) {
        outcome.attempts.push_back(network.name + ": " + Callout::ErrorKindToString(kind) + " " +
                                   message);
        CALLOUT_LOG_DEBUG("Recovery", "Skipping network", outcome.attempts.back());
    };

    for (const auto& network : EthereumService::OrderNetworks(m_networks, preferredChainId)) {
        auto listed = m_client.GetRecentTransactions(network, address, m_apiKey);
        if (!listed) {
            skip(network, listed.kind(), listed.error());
            continue;
        }

        auto outgoing = std::find_if(listed->begin(), listed->end(),
                                     [&target](const EthereumService::ExplorerTransaction& tx) {
                                         return tx.from == target;
                                     });
        if (outgoing == listed->end()) {
            skip(network, ErrorKind::NoOutgoingTransactionsFound, "no outgoing transactions");
            continue;
        }

        auto recovered = recoverOnNetwork(network, outgoing->hash);
        if (!recovered) {
            skip(network, recovered.kind(), recovered.error());
            continue;
        }

        if (ToLower(recovered->derivedAddress) != target) {
            outcome.state = SearchState::AbortedOnMismatch;
            outcome.mismatchDetail = "Address mismatch: recovered " + recovered->derivedAddress +
                                     " but expected " + address +
                                     ". The recovered public key does not belong to this address.";
            CALLOUT_LOG_ERROR("Recovery", "Recovered key does not match target address",
                              "Chain: " + network.name + " | Tx: " + outgoing->hash);
            return outcome;
        }

        outcome.state = SearchState::Found;
        outcome.key = *recovered;
        CALLOUT_LOG_INFO("Recovery", "Public key recovered",
                         "Chain: " + network.name + " | Tx: " + outgoing->hash);
        return outcome;
    }

    outcome.state = SearchState::ExhaustedAllNetworks;
    return outcome;
}

Result<RecoveredPublicKey> PublicKeyRecoveryEngine::RecoverPublicKeyFromAddress(
    const std::string& address, std::optional<uint64_t> preferredChainId) {
    if (m_apiKey.empty()) {
        return Result<RecoveredPublicKey>(ErrorKind::MissingApiKey,
                                          "Explorer API key is required for public key recovery");
    }

    AddressSearchOutcome outcome = SearchAddress(address, preferredChainId);
    switch (outcome.state) {
        case SearchState::Found:
            return Result<RecoveredPublicKey>(outcome.key);
        case SearchState::AbortedOnMismatch:
            return Result<RecoveredPublicKey>(ErrorKind::AddressMismatch, outcome.mismatchDetail);
        case SearchState::ExhaustedAllNetworks:
            break;
    }

    std::string message = "No outgoing transactions found for " + address +
                          " on any supported network. The address must have sent at least one "
                          "transaction to derive its public key.";
    if (!outcome.attempts.empty()) {
        message += " Last failure: " + outcome.attempts.back();
    }
    return Result<RecoveredPublicKey>(ErrorKind::NoOutgoingTransactionsFound, message);
}

} // namespace Recovery
