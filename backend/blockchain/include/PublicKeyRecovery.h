#pragma once

#include "Callout/CalloutTypes.h"
#include "EthereumService.h"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Recovery {

/**
 * @brief Closed set of transaction layouts the signing hash can be rebuilt for
 */
enum class TransactionKind {
    Legacy,      // type 0, EIP-155 or pre-EIP-155
    AccessList,  // type 1, EIP-2930
    DynamicFee,  // type 2, EIP-1559
    Other        // anything else; rebuilt best-effort and flagged approximate
};

std::string TransactionKindToString(TransactionKind kind);

TransactionKind ClassifyTransaction(const EthereumService::TransactionRecord& tx);

/**
 * @brief The exact bytes a sender signed, and their keccak256
 */
struct SigningPayload {
    TransactionKind kind;
    std::vector<uint8_t> preimage;
    std::array<uint8_t, 32> hash;
    int recoveryId;
    bool approximate;  // true only for TransactionKind::Other

    SigningPayload() : kind(TransactionKind::Legacy), hash(), recoveryId(0), approximate(false) {}
};

/**
 * @brief Rebuild the signing preimage and hash of a transaction
 *
 * Legacy with v >= 35: RLP[nonce, gasPrice, gas, to, value, data, chainId, 0, 0].
 * Legacy with v in {27, 28}: RLP[nonce, gasPrice, gas, to, value, data].
 * Type 1: 0x01 || RLP[chainId, nonce, gasPrice, gas, to, value, data, accessList].
 * Type 2: 0x02 || RLP[chainId, nonce, maxPriorityFeePerGas, maxFeePerGas, gas, to, value,
 *         data, accessList].
 *
 * @return The payload, or SignatureRecoveryFailed if a required field is missing or malformed
 */
Callout::Result<SigningPayload> BuildSigningPayload(const EthereumService::TransactionRecord& tx);

/**
 * @brief Recover the signer of a fetched transaction
 * @param tx Transaction record
 * @param publicKey Receives the 65-byte uncompressed key
 * @return The signing payload used, or SignatureRecoveryFailed
 */
Callout::Result<SigningPayload> RecoverSigner(const EthereumService::TransactionRecord& tx,
                                              std::vector<uint8_t>& publicKey);

/**
 * @brief Public key recovered from an on-chain signature
 *
 * derivedAddress is always the address of publicKey.
 */
struct RecoveredPublicKey {
    std::string publicKey;       // 0x04-prefixed, 130 hex characters
    std::string derivedAddress;  // EIP-55 checksummed
    std::string txHash;
    uint64_t chainId;
    std::string chainName;
    bool approximate;

    RecoveredPublicKey() : chainId(0), approximate(false) {}
};

/**
 * @brief Final state of an address-driven search over the network list
 */
enum class SearchState {
    Found,
    AbortedOnMismatch,
    ExhaustedAllNetworks
};

/**
 * @brief Outcome of the address-driven fold, with what was learned on the way
 */
struct AddressSearchOutcome {
    SearchState state;
    RecoveredPublicKey key;               // set when Found
    std::string mismatchDetail;           // set when AbortedOnMismatch
    std::vector<std::string> attempts;    // "<chain>: <ErrorKind> <message>" for skipped networks

    AddressSearchOutcome() : state(SearchState::ExhaustedAllNetworks) {}
};

std::string SearchStateToString(SearchState state);

/**
 * @brief Recovers transaction senders' public keys across the configured networks
 *
 * Networks are searched strictly in order. Network and availability failures
 * move the search to the next network; an address mismatch stops it at once.
 */
class PublicKeyRecoveryEngine {
public:
    PublicKeyRecoveryEngine(std::shared_ptr<EthereumService::HttpTransport> transport,
                            std::vector<EthereumService::NetworkConfig> networks,
                            std::string apiKey);

    /**
     * @brief Fetch a transaction from an RPC endpoint and recover its sender's key
     *
     * chainId and chainName are taken from the configured network with this
     * rpcUrl, falling back to the transaction's own chain id.
     */
    Callout::Result<RecoveredPublicKey> FetchAndRecoverPublicKey(const std::string& rpcUrl,
                                                                 const std::string& txHash);

    /**
     * @brief Find the first network whose explorer knows txHash
     * @return The network, TransactionNotFoundOnAnyNetwork, or MissingApiKey
     */
    Callout::Result<EthereumService::NetworkConfig> SearchTransactionAcrossChains(
        const std::string& txHash);

    /**
     * @brief Locate a hash's chain and recover its sender's key in one step
     */
    Callout::Result<RecoveredPublicKey> RecoverPublicKeyFromTransaction(const std::string& txHash);

    /**
     * @brief Fold over the networks looking for an outgoing transaction of address
     */
    AddressSearchOutcome SearchAddress(const std::string& address,
                                       std::optional<uint64_t> preferredChainId = std::nullopt);

    /**
     * @brief Recover the public key of an address from its latest outgoing transaction
     * @return The key, AddressMismatch, NoOutgoingTransactionsFound, or MissingApiKey
     */
    Callout::Result<RecoveredPublicKey> RecoverPublicKeyFromAddress(
        const std::string& address, std::optional<uint64_t> preferredChainId = std::nullopt);

    const std::vector<EthereumService::NetworkConfig>& networks() const { return m_networks; }

private:
    Callout::Result<RecoveredPublicKey> recoverOnNetwork(
        const EthereumService::NetworkConfig& network, const std::string& txHash);

    // Recover and derive the address; chain fields are left for the caller
    Callout::Result<RecoveredPublicKey> recoverFromRecord(
        const EthereumService::TransactionRecord& tx, const std::string& txHash);

    EthereumService::EthereumClient m_client;
    std::vector<EthereumService::NetworkConfig> m_networks;
    std::string m_apiKey;
};

} // namespace Recovery
