#include "CalloutAPI.h"
#include "Callout/Logger.h"
#include "Crypto.h"
#include "MessageCodec.h"
#include "SignedMessage.h"
#include "TemplateEngine.h"
#include "TemplateExtraction.h"
#include "TemplateRecognition.h"
#include "Validation.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace CalloutAPI {

namespace {

std::string CurrentIsoTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

std::string WithHexPrefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return "0x" + hex.substr(2);
    }
    return "0x" + hex;
}

size_t CalldataByteLength(const std::string& calldata) {
    return calldata.size() >= 2 ? (calldata.size() - 2) / 2 : 0;
}

std::string Checksummed(const std::string& address) {
    std::string checksummed;
    return Crypto::EIP55_ToChecksumAddress(address, checksummed) ? checksummed : address;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

uint64_t ParseTimestamp(const std::string& text) {
    if (text.empty() || text.size() > 18 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return 0;
    }
    return std::stoull(text);
}

// Calldata that opens with a function selector rather than text
bool StartsWithSelector(const std::string& hex) {
    if (hex.size() < 10) {
        return false;
    }
    int firstByte = std::stoi(hex.substr(2, 2), nullptr, 16);
    return firstByte < 0x20 || firstByte > 0x7e;
}

} // namespace

std::string ProtectionModeToString(ProtectionMode mode) {
    switch (mode) {
        case ProtectionMode::None:
            return "none";
        case ProtectionMode::Passphrase:
            return "passphrase";
        case ProtectionMode::PublicKeyEnvelope:
            return "public-key";
        case ProtectionMode::PublicKeyRaw:
            return "public-key-raw";
    }
    return "none";
}

std::vector<FeedEntry> DecodeFeed(const std::vector<EthereumService::ExplorerTransaction>& transactions,
                                  uint64_t chain_id) {
    std::vector<FeedEntry> entries;
    for (const auto& tx : transactions) {
        if (tx.to.empty() || tx.input.size() < 4) {
            continue;
        }
        std::string hex = WithHexPrefix(tx.input);
        if (!Crypto::IsHexString(hex.substr(2)) || StartsWithSelector(hex) ||
            !Codec::IsLikelyText(hex)) {
            continue;
        }
        auto decoded = Codec::Decode(hex);
        if (!decoded) {
            continue;
        }

        FeedEntry entry;
        entry.txHash = tx.hash;
        entry.sender = tx.from;
        entry.target = tx.to;
        entry.message = *decoded;
        entry.timestamp = ParseTimestamp(tx.timeStamp);
        entry.chainId = chain_id;
        entry.encrypted = decoded->rfind("ENC:", 0) == 0;
        entries.push_back(entry);
    }
    return entries;
}

Templates::VariableValues TheftTemplateValues(const std::string& tx_hash, uint64_t chain_id,
                                              const Transfers::TransferSummary& summary) {
    Templates::VariableValues values;
    values["theft_tx_hash"] = tx_hash;
    values["chain_id"] = std::to_string(chain_id);

    if (summary.scammer) {
        values["spammer_address"] = Checksummed(*summary.scammer);
    }
    if (!summary.victim) {
        return values;
    }
    values["exploited_address"] = Checksummed(*summary.victim);
    values["victim_address"] = values["exploited_address"];

    for (const auto& transfer : summary.transfers) {
        if (transfer.from != *summary.victim || transfer.type != Transfers::TransferType::Erc20) {
            continue;
        }
        values["contract_address"] = Checksummed(transfer.token);
        if (transfer.info && transfer.info->decimals) {
            values["amount"] = Transfers::FormatUnits(transfer.value, *transfer.info->decimals);
        } else {
            values["amount"] = transfer.value;
        }
        if (transfer.info && !transfer.info->symbol.empty()) {
            values["token_name"] = transfer.info->symbol;
        }
        break;
    }
    return values;
}

Protection Protection::None() {
    return Protection();
}

Protection Protection::WithPassphrase(const std::string& passphrase) {
    Protection protection;
    protection.mode = ProtectionMode::Passphrase;
    protection.secret = passphrase;
    return protection;
}

Protection Protection::ForPublicKey(const std::string& publicKeyHex, bool raw) {
    Protection protection;
    protection.mode = raw ? ProtectionMode::PublicKeyRaw : ProtectionMode::PublicKeyEnvelope;
    protection.secret = publicKeyHex;
    return protection;
}

MessageService::MessageService(std::shared_ptr<EthereumService::HttpTransport> transport,
                               std::vector<EthereumService::NetworkConfig> networks,
                               const std::string& api_key,
                               std::optional<uint64_t> preferred_chain_id)
    : engine(transport, std::move(networks), api_key),
      client(std::move(transport)),
      api_key(api_key),
      preferred_chain_id(preferred_chain_id) {}

MessageService::MessageService(const Callout::Config& config)
    : MessageService(EthereumService::CreateHttpTransport(config.httpTimeoutMs),
                     EthereumService::DefaultNetworks(), config.explorerApiKey,
                     config.preferredChainId) {}

std::string MessageService::Compose(const Templates::MessageTemplate& message_template,
                                    const Templates::VariableValues& values) const {
    return Templates::ApplyTemplate(message_template, values);
}

Callout::Result<PreparedCalldata> MessageService::PrepareCalldata(const std::string& plaintext,
                                                                  const Protection& protection) const {
    if (Validation::Trim(plaintext).empty()) {
        return Callout::Result<PreparedCalldata>(Callout::ErrorKind::EmptyInput,
                                                 "Message is empty");
    }

    PreparedCalldata prepared;
    prepared.mode = protection.mode;

    switch (protection.mode) {
        case ProtectionMode::None:
            prepared.calldata = Codec::Encode(plaintext);
            break;

        case ProtectionMode::Passphrase: {
            auto envelope = Envelope::EncryptWithPassphrase(plaintext, protection.secret);
            if (!envelope) {
                return Callout::Result<PreparedCalldata>(envelope.kind(), envelope.error());
            }
            prepared.calldata = Codec::Encode(*envelope);
            break;
        }

        case ProtectionMode::PublicKeyEnvelope: {
            auto envelope = Envelope::EncryptWithPublicKey(plaintext, protection.secret);
            if (!envelope) {
                return Callout::Result<PreparedCalldata>(envelope.kind(), envelope.error());
            }
            prepared.calldata = Codec::Encode(*envelope);
            break;
        }

        case ProtectionMode::PublicKeyRaw: {
            auto hex = Envelope::EncryptWithPublicKeyRaw(plaintext, protection.secret);
            if (!hex) {
                return Callout::Result<PreparedCalldata>(hex.kind(), hex.error());
            }
            prepared.calldata = "0x" + *hex;
            break;
        }
    }

    prepared.byteLength = CalldataByteLength(prepared.calldata);
    CALLOUT_LOG_INFO("MessageService", "Calldata prepared",
                     "Protection: " + ProtectionModeToString(protection.mode) +
                         " | Bytes: " + std::to_string(prepared.byteLength));
    return Callout::Result<PreparedCalldata>(prepared);
}

TransactionRequest MessageService::PrepareTransaction(const std::string& to,
                                                      const std::string& calldata,
                                                      uint64_t chain_id) const {
    TransactionRequest request;
    request.to = Validation::Trim(to);
    request.value = "0";
    request.data = WithHexPrefix(Validation::Trim(calldata));
    request.chainId = chain_id;
    request.generatedAt = CurrentIsoTimestamp();
    return request;
}

Callout::Result<ReadResult> MessageService::Read(const std::string& calldata) const {
    ReadResult result;
    result.calldata = WithHexPrefix(Validation::Trim(calldata));

    auto decoded = Codec::Decode(result.calldata);
    if (!decoded) {
        return Callout::Result<ReadResult>(decoded.kind(), decoded.error());
    }

    result.text = *decoded;
    result.byteLength = CalldataByteLength(result.calldata);
    result.isLikelyText = Codec::IsLikelyText(result.calldata);
    result.envelope = Envelope::DetectFormat(result.text);

    if (!result.envelope && !result.isLikelyText) {
        result.rawEciesCandidate = Envelope::LooksLikeEciesCiphertext(result.calldata);
    }

    // Protected payloads carry nothing readable beyond their framing
    if (result.envelope || result.rawEciesCandidate) {
        return Callout::Result<ReadResult>(result);
    }

    auto parsed = SignedMessage::ParseSignedMessage(result.text);
    if (parsed) {
        SignedMessageInfo info;
        info.message = parsed->message;
        info.signature = parsed->signature;
        info.signer = SignedMessage::RecoverSignedMessageAddress(*parsed);
        if (!info.signer) {
            CALLOUT_LOG_WARNING("MessageService", "Signed message signature did not recover");
        }
        result.signedMessage = info;
    }

    result.matchedTemplate = Templates::IdentifyTemplate(result.text);
    if (result.matchedTemplate) {
        std::string body = parsed ? parsed->message : result.text;
        result.templateData = Templates::ExtractTemplateData(body, *result.matchedTemplate);
    }

    return Callout::Result<ReadResult>(result);
}

Callout::Result<std::string> MessageService::Decrypt(const std::string& input,
                                                     const std::string& secret) const {
    std::string trimmed = Validation::Trim(input);
    if (trimmed.empty()) {
        return Callout::Result<std::string>(Callout::ErrorKind::EmptyInput, "Nothing to decrypt");
    }

    // Envelope text given directly
    if (Envelope::DetectFormat(trimmed)) {
        return Envelope::Decrypt(trimmed, secret);
    }

    // Calldata whose text is an envelope
    auto decoded = Codec::Decode(trimmed);
    if (decoded && Envelope::DetectFormat(*decoded)) {
        return Envelope::Decrypt(*decoded, secret);
    }

    // Calldata that is itself ECIES ciphertext
    if (Envelope::LooksLikeEciesCiphertext(trimmed)) {
        return Envelope::DecryptWithPrivateKey(trimmed, secret);
    }

    return Callout::Result<std::string>(Callout::ErrorKind::NotAnEncryptedPayload,
                                        "Input is not an encrypted message");
}

Callout::Result<Recovery::RecoveredPublicKey>
MessageService::RecoverRecipientKey(const std::string& target, std::optional<uint64_t> chain_id) {
    std::string trimmed = Validation::Trim(target);

    if (Validation::IsTxHash(trimmed)) {
        return engine.RecoverPublicKeyFromTransaction(trimmed);
    }

    auto validation = Validation::ValidateAddress(trimmed);
    if (!validation.isValid) {
        auto kind = trimmed.empty() ? Callout::ErrorKind::EmptyInput
                                    : Callout::ErrorKind::MalformedHex;
        return Callout::Result<Recovery::RecoveredPublicKey>(kind, validation.error);
    }

    return engine.RecoverPublicKeyFromAddress(trimmed, chain_id ? chain_id : preferred_chain_id);
}

Callout::Result<EthereumService::NetworkConfig>
MessageService::resolveNetwork(const std::string& tx_hash, std::optional<uint64_t> chain_id) {
    if (!chain_id) {
        return engine.SearchTransactionAcrossChains(tx_hash);
    }
    auto network = EthereumService::FindNetwork(engine.networks(), *chain_id);
    if (!network) {
        return Callout::Result<EthereumService::NetworkConfig>(
            Callout::ErrorKind::UnsupportedChain,
            "No network configured for chain " + std::to_string(*chain_id));
    }
    return Callout::Result<EthereumService::NetworkConfig>(*network);
}

Callout::Result<TheftReport> MessageService::AnalyzeTheftTransaction(const std::string& tx_hash,
                                                                     std::optional<uint64_t> chain_id) {
    std::string trimmed = Validation::Trim(tx_hash);
    if (!Validation::IsTxHash(trimmed)) {
        auto kind = trimmed.empty() ? Callout::ErrorKind::EmptyInput : Callout::ErrorKind::MalformedHex;
        return Callout::Result<TheftReport>(kind, "Expected a 0x-prefixed 32-byte transaction hash");
    }

    auto network = resolveNetwork(trimmed, chain_id);
    if (!network) {
        return Callout::Result<TheftReport>(network.kind(), network.error());
    }

    auto receipt = client.GetTransactionReceipt(network->rpcUrl, trimmed);
    if (!receipt) {
        return Callout::Result<TheftReport>(receipt.kind(), receipt.error());
    }
    if (receipt->status && *receipt->status == "0x0") {
        CALLOUT_LOG_WARNING("MessageService", "Theft transaction reverted", "Hash: " + trimmed);
    }

    std::vector<Transfers::TokenTransfer> transfers = Transfers::DecodeTransferLogs(receipt->logs);

    // Metadata is optional; one lookup per token contract
    if (!api_key.empty()) {
        std::vector<std::string> looked_up;
        for (const auto& transfer : transfers) {
            if (std::find(looked_up.begin(), looked_up.end(), transfer.token) != looked_up.end()) {
                continue;
            }
            looked_up.push_back(transfer.token);

            auto info = client.GetTokenInfo(*network, transfer.token, api_key);
            if (!info) {
                CALLOUT_LOG_DEBUG("MessageService", "Token info unavailable",
                                  "Token: " + transfer.token + " | " + info.error());
                continue;
            }
            for (auto& same_token : transfers) {
                if (same_token.token == transfer.token) {
                    Transfers::ApplyTokenInfo(same_token, *info);
                }
            }
        }
    }

    Transfers::TransferSummary summary = Transfers::SummarizeTransfers(transfers);

    TheftReport report;
    report.txHash = trimmed;
    report.chainId = network->chainId;
    report.chainName = network->name;
    if (summary.victim) {
        report.victim = Checksummed(*summary.victim);
    }
    if (summary.scammer) {
        report.scammer = Checksummed(*summary.scammer);
    }
    report.transfers = summary.transfers;
    report.variables = TheftTemplateValues(trimmed, network->chainId, summary);

    CALLOUT_LOG_INFO("MessageService", "Theft transaction analyzed",
                     "Hash: " + trimmed + " | Chain: " + network->name +
                         " | Transfers: " + std::to_string(report.transfers.size()));
    return Callout::Result<TheftReport>(report);
}

Callout::Result<std::vector<FeedEntry>> MessageService::FetchFeed(const std::string& address,
                                                                  std::optional<uint64_t> chain_id,
                                                                  uint32_t limit) {
    std::string trimmed = Validation::Trim(address);
    auto validation = Validation::ValidateAddress(trimmed);
    if (!validation.isValid) {
        auto kind = trimmed.empty() ? Callout::ErrorKind::EmptyInput : Callout::ErrorKind::MalformedHex;
        return Callout::Result<std::vector<FeedEntry>>(kind, validation.error);
    }

    const auto& networks = engine.networks();
    std::optional<uint64_t> wanted = chain_id ? chain_id : preferred_chain_id;
    std::optional<EthereumService::NetworkConfig> network;
    if (wanted) {
        network = EthereumService::FindNetwork(networks, *wanted);
    } else if (!networks.empty()) {
        network = networks.front();
    }
    if (!network) {
        return Callout::Result<std::vector<FeedEntry>>(
            Callout::ErrorKind::UnsupportedChain,
            "No network configured for chain " + std::to_string(wanted.value_or(0)));
    }

    auto transactions = client.GetRecentTransactions(*network, trimmed, api_key, limit);
    if (!transactions) {
        return Callout::Result<std::vector<FeedEntry>>(transactions.kind(), transactions.error());
    }

    // Only what the address sent
    std::string sender = ToLower(trimmed);
    std::vector<EthereumService::ExplorerTransaction> sent;
    for (const auto& tx : *transactions) {
        if (tx.from == sender) {
            sent.push_back(tx);
        }
    }

    std::vector<FeedEntry> feed = DecodeFeed(sent, network->chainId);
    CALLOUT_LOG_DEBUG("MessageService", "Feed fetched",
                      "Address: " + sender + " | Transactions: " + std::to_string(sent.size()) +
                          " | Messages: " + std::to_string(feed.size()));
    return Callout::Result<std::vector<FeedEntry>>(feed);
}

} // namespace CalloutAPI
