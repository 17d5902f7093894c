#pragma once

#include "Callout/CalloutTypes.h"
#include "Callout/Config.h"
#include "EnvelopeManager.h"
#include "PublicKeyRecovery.h"
#include "TemplateTypes.h"
#include "TransferAnalysis.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CalloutAPI {

enum class ProtectionMode {
  None,
  Passphrase,         // "ENC:PASS:v1:" envelope
  PublicKeyEnvelope,  // "ENC:PUBKEY:v1:" envelope
  PublicKeyRaw        // unframed ECIES bytes as calldata
};

std::string ProtectionModeToString(ProtectionMode mode);

struct Protection {
  ProtectionMode mode = ProtectionMode::None;
  std::string secret;  // passphrase, or the recipient's public key

  static Protection None();
  static Protection WithPassphrase(const std::string &passphrase);
  static Protection ForPublicKey(const std::string &publicKeyHex, bool raw = false);
};

struct PreparedCalldata {
  std::string calldata;  // 0x-prefixed
  size_t byteLength = 0;
  ProtectionMode mode = ProtectionMode::None;
};

// Zero-value transaction handed to an external sender
struct TransactionRequest {
  std::string to;
  std::string value = "0";
  std::string data;
  uint64_t chainId = 1;
  std::string generatedAt;  // ISO 8601 UTC
};

struct SignedMessageInfo {
  std::string message;
  std::string signature;
  std::optional<std::string> signer;  // nullopt when recovery failed
};

// Everything the read path can learn from a calldata payload
struct ReadResult {
  std::string calldata;
  std::string text;
  size_t byteLength = 0;
  bool isLikelyText = false;
  std::optional<Envelope::Format> envelope;
  bool rawEciesCandidate = false;
  std::optional<SignedMessageInfo> signedMessage;
  std::optional<Templates::MessageTemplate> matchedTemplate;
  std::optional<Templates::ExtractedTemplateData> templateData;
};

// A transaction whose calldata reads as a message
struct FeedEntry {
  std::string txHash;
  std::string sender;
  std::string target;
  std::string message;
  uint64_t timestamp = 0;  // unix seconds
  uint64_t chainId = 0;
  bool encrypted = false;  // message is an "ENC:" envelope
};

/**
 * @brief Keep the transactions whose calldata decodes to text
 *
 * Contract creations, empty calldata, calldata whose first byte is not
 * printable ASCII (a function selector) and non-text payloads are skipped.
 */
std::vector<FeedEntry> DecodeFeed(const std::vector<EthereumService::ExplorerTransaction> &transactions,
                                  uint64_t chain_id);

// Parties and transfers of a theft transaction, with template values drawn from them
struct TheftReport {
  std::string txHash;
  uint64_t chainId = 0;
  std::string chainName;
  std::optional<std::string> victim;   // EIP-55 checksummed
  std::optional<std::string> scammer;  // EIP-55 checksummed
  std::vector<Transfers::TokenTransfer> transfers;
  Templates::VariableValues variables;
};

/**
 * @brief Template values for a theft transaction
 *
 * Fills theft_tx_hash and chain_id, the victim into exploited_address and
 * victim_address, and the scammer into spammer_address. The victim's first
 * outgoing fungible transfer supplies amount, token_name and contract_address.
 */
Templates::VariableValues TheftTemplateValues(const std::string &tx_hash, uint64_t chain_id,
                                              const Transfers::TransferSummary &summary);

/**
 * @brief Compose, protect, encode and read calldata messages
 *
 * Write path: template -> plaintext -> optional envelope -> calldata.
 * Read path: calldata -> text -> envelope detection / signed message /
 * template recognition.
 */
class MessageService {
private:
  Recovery::PublicKeyRecoveryEngine engine;
  EthereumService::EthereumClient client;
  std::string api_key;
  std::optional<uint64_t> preferred_chain_id;

  Callout::Result<EthereumService::NetworkConfig> resolveNetwork(const std::string &tx_hash,
                                                                 std::optional<uint64_t> chain_id);

public:
  MessageService(std::shared_ptr<EthereumService::HttpTransport> transport,
                 std::vector<EthereumService::NetworkConfig> networks,
                 const std::string &api_key,
                 std::optional<uint64_t> preferred_chain_id = std::nullopt);

  // Real HTTP transport and the default network list
  explicit MessageService(const Callout::Config &config);
  ~MessageService() = default;

  // Composition
  std::string Compose(const Templates::MessageTemplate &message_template,
                      const Templates::VariableValues &values) const;

  // Protection and encoding; blank plaintext is EmptyInput
  Callout::Result<PreparedCalldata> PrepareCalldata(const std::string &plaintext,
                                                    const Protection &protection) const;

  TransactionRequest PrepareTransaction(const std::string &to, const std::string &calldata,
                                        uint64_t chain_id) const;

  /**
   * @brief Decode calldata and report what it contains
   * @return The analysis, or MalformedHex
   */
  Callout::Result<ReadResult> Read(const std::string &calldata) const;

  /**
   * @brief Decrypt calldata, an envelope, or raw ECIES hex with secret
   *
   * secret is the passphrase for passphrase envelopes and the private key
   * otherwise.
   */
  Callout::Result<std::string> Decrypt(const std::string &input, const std::string &secret) const;

  /**
   * @brief Recover a recipient's public key from an address or a tx hash
   * @param target 0x address (searched across networks) or 0x tx hash
   * @param chain_id Preferred chain for address search
   */
  Callout::Result<Recovery::RecoveredPublicKey>
  RecoverRecipientKey(const std::string &target, std::optional<uint64_t> chain_id = std::nullopt);

  /**
   * @brief Identify victim and scammer from a theft transaction's Transfer events
   *
   * Without chain_id the hash is located through the explorers. Token
   * metadata is looked up when an explorer API key is configured.
   *
   * @return The report, MalformedHex, UnsupportedChain, or the lookup's error
   */
  Callout::Result<TheftReport> AnalyzeTheftTransaction(const std::string &tx_hash,
                                                       std::optional<uint64_t> chain_id = std::nullopt);

  /**
   * @brief Messages an address has sent, newest first
   * @param chain_id Chain to read; the preferred chain, then the first network, otherwise
   */
  Callout::Result<std::vector<FeedEntry>> FetchFeed(const std::string &address,
                                                    std::optional<uint64_t> chain_id = std::nullopt,
                                                    uint32_t limit = 50);
};

} // namespace CalloutAPI
