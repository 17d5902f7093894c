#include "Callout/Config.h"
#include "Callout/Errors.h"
#include "Callout/Logger.h"
#include "CalloutAPI.h"
#include "Crypto.h"
#include "MessageCodec.h"
#include "SignedMessage.h"
#include "TemplateCatalog.h"
#include "TemplateEngine.h"
#include "Validation.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

namespace {

const char* const USAGE =
    "Usage: callout <command> [options]\n"
    "\n"
    "Commands:\n"
    "  encode   -m <text>                          Encode text as calldata\n"
    "  decode   -d <hex>                           Decode calldata to text\n"
    "  encrypt  -m <text> (-k <pubkey> [--raw] | --passphrase)\n"
    "                                              Encrypt (passphrase read from stdin)\n"
    "  decrypt  -d <hex|envelope>                  Decrypt (key or passphrase read from stdin)\n"
    "  sign     -m <text>                          Sign (private key read from stdin)\n"
    "  prepare  -t <address> (-m <text> | -d <hex>) [-c <chain>]\n"
    "                                              Build a zero-value transaction request\n"
    "  template --list | --id <id> [--set key=value ...]\n"
    "                                              List or render message templates\n"
    "  recover  (--address <address> | --tx <hash>) [-c <chain>]\n"
    "                                              Recover a public key from on-chain signatures\n"
    "  theft    --tx <hash> [-c <chain>]           Find victim and scammer of a theft transaction\n"
    "                                              and prefill template variables\n"
    "  feed     --address <address> [-c <chain>]   List messages an address has sent\n"
    "  read     -d <hex>                           Analyze calldata\n"
    "\n"
    "Options:\n"
    "  -o, --output <file>   Write JSON to a file instead of stdout\n";

struct CommandLine {
    std::string command;
    std::map<std::string, std::string> values;
    std::vector<std::string> assignments;  // --set key=value
    bool raw = false;
    bool list = false;
    bool passphrase = false;

    std::optional<std::string> get(const std::string& name) const {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

class CliError : public std::runtime_error {
public:
    explicit CliError(const std::string& message) : std::runtime_error(message) {}
};

std::string LongName(const std::string& flag) {
    static const std::map<std::string, std::string> aliases = {
        {"-m", "message"}, {"-d", "data"},   {"-k", "pubkey"}, {"-t", "to"},
        {"-c", "chain"},   {"-o", "output"}, {"-i", "id"}};
    auto it = aliases.find(flag);
    if (it != aliases.end()) {
        return it->second;
    }
    if (flag.rfind("--", 0) == 0) {
        return flag.substr(2);
    }
    throw CliError("Unknown option: " + flag);
}

CommandLine ParseCommandLine(int argc, char* argv[]) {
    if (argc < 2) {
        throw CliError("No command given.\n\n" + std::string(USAGE));
    }

    CommandLine commandLine;
    commandLine.command = argv[1];

    static const std::vector<std::string> valueFlags = {
        "message", "data", "pubkey", "to", "chain", "output", "id", "set", "address", "tx"};

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string name = LongName(arg);

        if (name == "raw") {
            commandLine.raw = true;
            continue;
        }
        if (name == "list") {
            commandLine.list = true;
            continue;
        }
        if (name == "passphrase") {
            commandLine.passphrase = true;
            continue;
        }
        if (std::find(valueFlags.begin(), valueFlags.end(), name) == valueFlags.end()) {
            throw CliError("Unknown option: " + arg);
        }
        if (i + 1 >= argc) {
            throw CliError("Option " + arg + " requires a value");
        }

        std::string value = argv[++i];
        if (name == "set") {
            commandLine.assignments.push_back(value);
        } else {
            commandLine.values[name] = value;
        }
    }
    return commandLine;
}

std::string Require(const CommandLine& commandLine, const std::string& name,
                    const std::string& shortFlag) {
    auto value = commandLine.get(name);
    if (!value || value->empty()) {
        throw CliError("--" + name + " (" + shortFlag + ") is required for " +
                       commandLine.command);
    }
    return *value;
}

uint64_t ParseChainId(const std::optional<std::string>& text, uint64_t fallback) {
    if (!text) {
        return fallback;
    }
    if (text->empty() || !std::isdigit(static_cast<unsigned char>((*text)[0]))) {
        throw CliError("Invalid chain id: " + *text);
    }
    try {
        size_t consumed = 0;
        unsigned long long chainId = std::stoull(*text, &consumed, 10);
        if (consumed != text->size() || chainId == 0) {
            throw CliError("Invalid chain id: " + *text);
        }
        return chainId;
    } catch (const std::logic_error&) {
        throw CliError("Invalid chain id: " + *text);
    }
}

// Secrets are never taken from argv
std::string ReadSecretFromStdin(const std::string& prompt) {
    std::cerr << prompt << std::endl;
    std::string secret((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    std::string trimmed = Validation::Trim(secret);
    Crypto::SecureWipeString(secret);
    return trimmed;
}

void WriteOutput(const json& output, const std::optional<std::string>& path) {
    std::string text = output.dump(2, ' ', false, json::error_handler_t::replace);
    if (!path) {
        std::cout << text << std::endl;
        return;
    }

    std::ofstream file(*path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw CliError("Cannot write " + *path);
    }
    file << text << '\n';
    std::cout << "Artifact written to " << *path << std::endl;
}

template<typename T>
const T& Unwrap(const Callout::Result<T>& result) {
    if (!result) {
        throw CliError(result.error());
    }
    return *result;
}

json TemplateDataToJson(const Templates::ExtractedTemplateData& data) {
    auto field = [](const std::optional<std::string>& value) {
        return value ? json(*value) : json(nullptr);
    };
    return json{{"theftTxHash", field(data.theftTxHash)},
                {"receiveAddress", field(data.receiveAddress)},
                {"exploitedAddress", field(data.exploitedAddress)},
                {"scammerAddress", field(data.scammerAddress)},
                {"amount", field(data.amount)},
                {"tokenName", field(data.tokenName)},
                {"chainId", field(data.chainId)},
                {"deadline", field(data.deadline)},
                {"projectName", field(data.projectName)},
                {"contractAddress", field(data.contractAddress)},
                {"recoveryPercentage",
                 data.recoveryPercentage ? json(*data.recoveryPercentage) : json(nullptr)}};
}

json RunEncode(const CommandLine& commandLine) {
    std::string message = Require(commandLine, "message", "-m");
    std::string calldata = Codec::Encode(message);
    return json{{"command", "encode"},
                {"message", message},
                {"calldata", calldata},
                {"byteLength", (calldata.size() - 2) / 2}};
}

json RunDecode(const CommandLine& commandLine) {
    std::string data = Validation::Trim(Require(commandLine, "data", "-d"));
    std::string text = Unwrap(Codec::Decode(data));
    bool encrypted = Envelope::IsEncrypted(text);
    return json{{"command", "decode"},
                {"calldata", data},
                {"message", encrypted ? "[encrypted - use decrypt command]" : text},
                {"encrypted", encrypted},
                {"isLikelyText", Codec::IsLikelyText(data)}};
}

json RunEncrypt(const CommandLine& commandLine, CalloutAPI::MessageService& service) {
    std::string message = Require(commandLine, "message", "-m");
    auto pubkey = commandLine.get("pubkey");

    CalloutAPI::Protection protection;
    if (commandLine.passphrase) {
        if (pubkey) {
            throw CliError("Use either --pubkey or --passphrase, not both");
        }
        protection = CalloutAPI::Protection::WithPassphrase(
            ReadSecretFromStdin("Enter the passphrase:"));
    } else {
        if (!pubkey) {
            throw CliError("--pubkey (-k) or --passphrase is required for encrypt");
        }
        auto validation = Validation::ValidatePublicKey(*pubkey);
        if (!validation.isValid) {
            throw CliError(validation.error);
        }
        protection = CalloutAPI::Protection::ForPublicKey(*pubkey, commandLine.raw);
    }

    auto prepared = Unwrap(service.PrepareCalldata(message, protection));
    Crypto::SecureWipeString(protection.secret);

    json output{{"command", "encrypt"},
                {"message", message},
                {"protection", CalloutAPI::ProtectionModeToString(prepared.mode)},
                {"calldata", prepared.calldata},
                {"byteLength", prepared.byteLength}};
    if (pubkey) {
        output["publicKey"] = *pubkey;
    }
    return output;
}

json RunDecrypt(const CommandLine& commandLine, CalloutAPI::MessageService& service) {
    std::string data = Require(commandLine, "data", "-d");
    std::string secret = ReadSecretFromStdin("Enter your private key or passphrase:");
    if (secret.empty()) {
        throw CliError("A private key or passphrase is required for decryption");
    }

    auto decrypted = service.Decrypt(data, secret);
    Crypto::SecureWipeString(secret);
    return json{{"command", "decrypt"}, {"calldata", data}, {"message", Unwrap(decrypted)}};
}

json RunSign(const CommandLine& commandLine) {
    std::string message = Require(commandLine, "message", "-m");
    std::string privateKey = ReadSecretFromStdin("Enter your private key:");
    if (privateKey.empty()) {
        throw CliError("Private key is required for signing");
    }

    auto signature = SignedMessage::SignMessage(message, privateKey);
    Crypto::SecureWipeString(privateKey);

    std::string signedFormat = SignedMessage::FormatSignedMessage(message, Unwrap(signature));
    auto signer = SignedMessage::RecoverSignedMessageAddress({message, *signature});
    std::string calldata = Codec::Encode(signedFormat);

    return json{{"command", "sign"},
                {"message", message},
                {"signer", signer ? json(*signer) : json(nullptr)},
                {"signature", *signature},
                {"signedFormat", signedFormat},
                {"calldata", calldata},
                {"byteLength", (calldata.size() - 2) / 2}};
}

json RunPrepare(const CommandLine& commandLine, CalloutAPI::MessageService& service) {
    std::string to = Require(commandLine, "to", "-t");
    auto validation = Validation::ValidateAddress(to);
    if (!validation.isValid) {
        throw CliError(validation.error);
    }

    auto message = commandLine.get("message");
    auto data = commandLine.get("data");
    if (!message && !data) {
        throw CliError("Either --message (-m) or --data (-d) is required for prepare");
    }

    std::string calldata = data ? *data : Codec::Encode(*message);
    auto request = service.PrepareTransaction(to, calldata, ParseChainId(commandLine.get("chain"), 1));

    return json{{"command", "prepare"},
                {"transaction",
                 {{"to", request.to},
                  {"value", request.value},
                  {"data", request.data},
                  {"chainId", request.chainId}}},
                {"meta",
                 {{"message", message ? json(*message) : json(nullptr)},
                  {"byteLength", (request.data.size() - 2) / 2},
                  {"generatedAt", request.generatedAt}}}};
}

json RunTemplate(const CommandLine& commandLine, CalloutAPI::MessageService& service) {
    if (commandLine.list) {
        json categories = json::array();
        for (const auto& category : Templates::GetTemplateCategories()) {
            json templates = json::array();
            for (const auto& messageTemplate : Templates::GetTemplatesByCategory(category.id)) {
                templates.push_back({{"id", messageTemplate.id},
                                     {"name", messageTemplate.name},
                                     {"description", messageTemplate.description}});
            }
            categories.push_back({{"id", category.id},
                                  {"name", category.name},
                                  {"description", category.description},
                                  {"templates", templates}});
        }
        return json{{"command", "template"}, {"categories", categories}};
    }

    std::string id = Require(commandLine, "id", "-i");
    auto messageTemplate = Templates::GetTemplateById(id);
    if (!messageTemplate) {
        throw CliError("Unknown template: " + id);
    }

    Templates::VariableValues values;
    for (const auto& assignment : commandLine.assignments) {
        size_t equals = assignment.find('=');
        if (equals == std::string::npos || equals == 0) {
            throw CliError("--set expects key=value, got: " + assignment);
        }
        values[assignment.substr(0, equals)] = assignment.substr(equals + 1);
    }

    json variables = json::array();
    for (const auto& variable : messageTemplate->variables) {
        auto it = values.find(variable.key);
        std::string value = it != values.end() ? it->second : "";
        auto error = Templates::ValidateVariable(variable, value);
        variables.push_back({{"key", variable.key},
                             {"label", variable.label},
                             {"type", Templates::VariableTypeToString(variable.type)},
                             {"optional", variable.optional},
                             {"value", value},
                             {"error", error ? json(*error) : json(nullptr)}});
    }

    std::string message = service.Compose(*messageTemplate, values);
    auto progress = Templates::GetVariableProgress(*messageTemplate, values);
    std::string calldata = Codec::Encode(message);

    return json{{"command", "template"},
                {"templateId", messageTemplate->id},
                {"message", message},
                {"complete", Templates::AllVariablesFilled(*messageTemplate, values)},
                {"progress", {{"filled", progress.filled}, {"total", progress.total}}},
                {"variables", variables},
                {"calldata", calldata},
                {"byteLength", (calldata.size() - 2) / 2}};
}

json RunRecover(const CommandLine& commandLine, CalloutAPI::MessageService& service) {
    auto address = commandLine.get("address");
    auto tx = commandLine.get("tx");
    if (!address == !tx) {
        throw CliError("Exactly one of --address or --tx is required for recover");
    }

    std::optional<uint64_t> chainId;
    if (commandLine.get("chain")) {
        chainId = ParseChainId(commandLine.get("chain"), 1);
    }

    std::string target = address ? *address : *tx;
    auto recovered = Callout::WithRetry([&]() { return service.RecoverRecipientKey(target, chainId); });
    if (!recovered) {
        throw CliError(Callout::UserMessageFor(recovered.kind()) + ": " + recovered.error());
    }

    return json{{"command", "recover"},
                {"target", target},
                {"publicKey", recovered->publicKey},
                {"address", recovered->derivedAddress},
                {"txHash", recovered->txHash},
                {"chainId", recovered->chainId},
                {"chainName", recovered->chainName},
                {"approximate", recovered->approximate}};
}

json RunTheft(const CommandLine& commandLine, CalloutAPI::MessageService& service) {
    std::string txHash = Require(commandLine, "tx", "--tx");
    std::optional<uint64_t> chainId;
    if (commandLine.get("chain")) {
        chainId = ParseChainId(commandLine.get("chain"), 1);
    }

    auto analyzed =
        Callout::WithRetry([&]() { return service.AnalyzeTheftTransaction(txHash, chainId); });
    if (!analyzed) {
        throw CliError(Callout::UserMessageFor(analyzed.kind()) + ": " + analyzed.error());
    }

    json transfers = json::array();
    for (const auto& transfer : analyzed->transfers) {
        json item{{"type", Transfers::TransferTypeToString(transfer.type)},
                  {"token", transfer.token},
                  {"from", transfer.from},
                  {"to", transfer.to},
                  {"value", transfer.value}};
        if (transfer.info) {
            item["symbol"] = transfer.info->symbol;
            item["name"] = transfer.info->name;
            item["decimals"] = transfer.info->decimals ? json(*transfer.info->decimals) : json(nullptr);
        }
        transfers.push_back(item);
    }

    json variables = json::object();
    for (const auto& entry : analyzed->variables) {
        variables[entry.first] = entry.second;
    }

    return json{{"command", "theft"},
                {"txHash", analyzed->txHash},
                {"chainId", analyzed->chainId},
                {"chainName", analyzed->chainName},
                {"victim", analyzed->victim ? json(*analyzed->victim) : json(nullptr)},
                {"scammer", analyzed->scammer ? json(*analyzed->scammer) : json(nullptr)},
                {"transfers", transfers},
                {"variables", variables}};
}

json RunFeed(const CommandLine& commandLine, CalloutAPI::MessageService& service) {
    std::string address = Require(commandLine, "address", "--address");
    std::optional<uint64_t> chainId;
    if (commandLine.get("chain")) {
        chainId = ParseChainId(commandLine.get("chain"), 1);
    }

    auto feed = Callout::WithRetry([&]() { return service.FetchFeed(address, chainId); });
    if (!feed) {
        throw CliError(Callout::UserMessageFor(feed.kind()) + ": " + feed.error());
    }

    json messages = json::array();
    for (const auto& entry : *feed) {
        messages.push_back({{"txHash", entry.txHash},
                            {"from", entry.sender},
                            {"to", entry.target},
                            {"timestamp", entry.timestamp},
                            {"chainId", entry.chainId},
                            {"encrypted", entry.encrypted},
                            {"message", entry.message}});
    }
    return json{{"command", "feed"}, {"address", address}, {"messages", messages}};
}

json RunRead(const CommandLine& commandLine, CalloutAPI::MessageService& service) {
    std::string data = Require(commandLine, "data", "-d");
    auto read = service.Read(data);
    const auto& result = Unwrap(read);

    bool protectedPayload = result.envelope.has_value() || result.rawEciesCandidate;
    json output{{"command", "read"},
                {"calldata", result.calldata},
                {"byteLength", result.byteLength},
                {"isLikelyText", result.isLikelyText},
                {"encrypted", protectedPayload},
                {"format", result.envelope ? json(Envelope::FormatToString(*result.envelope))
                                           : result.rawEciesCandidate ? json("raw-ecies")
                                                                      : json(nullptr)},
                {"message", protectedPayload ? json(nullptr) : json(result.text)}};

    if (result.signedMessage) {
        output["signedMessage"] = {
            {"message", result.signedMessage->message},
            {"signature", result.signedMessage->signature},
            {"signer", result.signedMessage->signer ? json(*result.signedMessage->signer)
                                                    : json(nullptr)}};
    }
    if (result.matchedTemplate) {
        output["template"] = {{"id", result.matchedTemplate->id},
                              {"name", result.matchedTemplate->name}};
    }
    if (result.templateData) {
        output["templateData"] = TemplateDataToJson(*result.templateData);
    }
    return output;
}

} // namespace

int main(int argc, char* argv[]) {
    Callout::Config config = Callout::LoadConfigFromEnvironment();
    if (!Callout::InitializeLogging(config)) {
        std::cerr << "Warning: logging could not be initialized" << std::endl;
    }

    int exitCode = 0;
    try {
        CommandLine commandLine = ParseCommandLine(argc, argv);
        if (commandLine.command == "help" || commandLine.command == "--help" ||
            commandLine.command == "-h") {
            std::cout << USAGE;
            Callout::Logger::getInstance().shutdown();
            return 0;
        }

        CalloutAPI::MessageService service(config);
        json output;
        const std::string& command = commandLine.command;

        if (command == "encode") {
            output = RunEncode(commandLine);
        } else if (command == "decode") {
            output = RunDecode(commandLine);
        } else if (command == "encrypt") {
            output = RunEncrypt(commandLine, service);
        } else if (command == "decrypt") {
            output = RunDecrypt(commandLine, service);
        } else if (command == "sign") {
            output = RunSign(commandLine);
        } else if (command == "prepare") {
            output = RunPrepare(commandLine, service);
        } else if (command == "template") {
            output = RunTemplate(commandLine, service);
        } else if (command == "recover") {
            output = RunRecover(commandLine, service);
        } else if (command == "theft") {
            output = RunTheft(commandLine, service);
        } else if (command == "feed") {
            output = RunFeed(commandLine, service);
        } else if (command == "read") {
            output = RunRead(commandLine, service);
        } else {
            throw CliError("Unknown command: " + command + ". Run \"callout --help\" for usage.");
        }

        WriteOutput(output, commandLine.get("output"));
    } catch (const CliError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exitCode = 1;
    } catch (const json::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exitCode = 1;
    }

    Callout::Logger::getInstance().shutdown();
    return exitCode;
}
