#include "include/TemplateExtraction.h"
#include "Callout/Logger.h"
#include "Validation.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <regex>
#include <set>
#include <vector>

namespace Templates {

namespace {

const std::vector<std::string> COMMON_CAPITALIZED_WORDS = {
    "Return", "This", "Notice", "Message", "Transaction", "Address", "Funds"};

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string EscapeRegex(const std::string& text) {
    static const std::string special = ".*+?^${}()|[]\\";
    std::string escaped;
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool EqualsIgnoreCase(const std::optional<std::string>& a, const std::string& b) {
    return a && ToLower(*a) == ToLower(b);
}

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsUpper(char c) {
    return c >= 'A' && c <= 'Z';
}

bool IsLower(char c) {
    return c >= 'a' && c <= 'z';
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

// Unbounded runs below are scanned by hand; std::regex recurses once per character.

// Length of the CamelCase run (Word or WordWord...) starting at pos, 0 if none
size_t CamelCaseLength(const std::string& text, size_t pos) {
    size_t end = pos;
    while (end + 1 < text.size() && IsUpper(text[end]) && IsLower(text[end + 1])) {
        end += 2;
        while (end < text.size() && IsLower(text[end])) {
            ++end;
        }
    }
    return end - pos;
}

// First CamelCase word standing on word boundaries
std::optional<std::string> FindCamelCaseWord(const std::string& text) {
    for (size_t pos = 0; pos < text.size(); ++pos) {
        if (pos > 0 && IsWordChar(text[pos - 1])) {
            continue;
        }
        size_t length = CamelCaseLength(text, pos);
        if (length > 0 && (pos + length == text.size() || !IsWordChar(text[pos + length]))) {
            return text.substr(pos, length);
        }
    }
    return std::nullopt;
}

// Text up to the first '.' or newline, cut before a " to " or " and " connective
std::string DeadlinePhrase(const std::string& text) {
    std::string line = text.substr(0, text.find_first_of(".\n"));
    const std::string lower = ToLower(line);
    for (size_t i = 1; i < line.size(); ++i) {
        if (!IsSpace(line[i])) {
            continue;
        }
        size_t word = i;
        while (word < line.size() && IsSpace(line[word])) {
            ++word;
        }
        for (const std::string connective : {"to", "and"}) {
            size_t next = word + connective.size();
            if (lower.compare(word, connective.size(), connective) == 0 && next < line.size() &&
                IsSpace(line[next])) {
                return line.substr(0, i);
            }
        }
        i = word - 1;
    }
    return line;
}

// First "<1-3 digits>%" at or after pos on the same line
std::optional<std::string> PercentOnLine(const std::string& text, size_t pos) {
    for (; pos < text.size() && text[pos] != '\n' && text[pos] != '\r'; ++pos) {
        for (size_t length = 3; length >= 1; --length) {
            if (pos + length >= text.size() || text[pos + length] != '%') {
                continue;
            }
            bool digits = true;
            for (size_t k = pos; k < pos + length; ++k) {
                digits = digits && IsDigit(text[k]);
            }
            if (digits) {
                return text.substr(pos, length);
            }
        }
    }
    return std::nullopt;
}

bool IsCommonCapitalizedWord(const std::string& word) {
    return std::find(COMMON_CAPITALIZED_WORDS.begin(), COMMON_CAPITALIZED_WORDS.end(), word) !=
           COMMON_CAPITALIZED_WORDS.end();
}

// Trimmed text following the first case-insensitive occurrence of prefix
std::optional<std::string> TextAfterPrefix(const std::string& message, const std::string& prefix) {
    size_t index = ToLower(message).find(ToLower(prefix));
    if (index == std::string::npos) {
        return std::nullopt;
    }
    return Validation::Trim(message.substr(index + prefix.size()));
}

std::optional<std::string> FirstGroup(const std::string& text, const std::regex& pattern,
                                      size_t group = 1) {
    std::smatch match;
    if (!std::regex_search(text, match, pattern) || !match[group].matched) {
        return std::nullopt;
    }
    return match[group].str();
}

std::string StripCommas(std::string value) {
    value.erase(std::remove(value.begin(), value.end(), ','), value.end());
    return value;
}

std::optional<int> PercentageInRange(const std::string& digits) {
    if (digits.empty() || digits.size() > 3) {
        return std::nullopt;
    }
    int percentage = std::stoi(digits);
    if (percentage > 0 && percentage <= 100) {
        return percentage;
    }
    return std::nullopt;
}

enum class ExtractorKind {
    Address,
    TxHash,
    Amount,
    TokenSymbol,
    Deadline,
    ProjectName,
    ChainId,
    Percentage,
    Integer,
    None
};

ExtractorKind ExtractorFor(const TemplateVariable& variable) {
    const std::string& key = variable.key;
    if (key == "theft_tx_hash") {
        return ExtractorKind::TxHash;
    }
    if (key == "amount" || key == "recovered_amount") {
        return ExtractorKind::Amount;
    }
    if (key == "token_name") {
        return ExtractorKind::TokenSymbol;
    }
    if (key == "deadline") {
        return ExtractorKind::Deadline;
    }
    if (key == "project_name") {
        return ExtractorKind::ProjectName;
    }
    if (key == "chain_id") {
        return ExtractorKind::ChainId;
    }
    if (key == "recovery_percentage") {
        return ExtractorKind::Percentage;
    }

    switch (variable.type) {
        case VariableType::Address:
            return ExtractorKind::Address;
        case VariableType::Number:
            return ExtractorKind::Integer;
        case VariableType::Text:
        case VariableType::Date:
            break;
    }
    return ExtractorKind::None;
}

} // namespace

std::optional<std::string> ExtractVariableValue(const TemplateVariable& variable,
                                                const std::string& message) {
    if (!variable.prefix || variable.prefix->empty()) {
        return std::nullopt;
    }
    const std::string& prefix = *variable.prefix;
    const ExtractorKind kind = ExtractorFor(variable);

    // These two search the whole message for "<prefix><digits>"
    if (kind == ExtractorKind::ChainId) {
        std::regex pattern(EscapeRegex(ToLower(prefix)) + "\\s*(\\d{1,5})(?!\\d)(?!\\s*%)",
                           std::regex::ECMAScript | std::regex::icase);
        auto digits = FirstGroup(message, pattern);
        if (digits) {
            long chainId = std::stol(*digits);
            if (chainId > 0 && chainId < 100000) {
                return digits;
            }
        }
        return std::nullopt;
    }

    if (kind == ExtractorKind::Percentage) {
        std::regex pattern(EscapeRegex(ToLower(prefix)) + "\\s*(\\d{1,3})%",
                           std::regex::ECMAScript | std::regex::icase);
        auto digits = FirstGroup(message, pattern);
        if (digits) {
            auto percentage = PercentageInRange(*digits);
            if (percentage) {
                return std::to_string(*percentage);
            }
        }
        return std::nullopt;
    }

    auto after = TextAfterPrefix(message, prefix);
    if (!after) {
        return std::nullopt;
    }

    switch (kind) {
        case ExtractorKind::Address: {
            static const std::regex pattern("^(0x[a-fA-F0-9]{40})\\b",
                                            std::regex::ECMAScript | std::regex::icase);
            return FirstGroup(*after, pattern);
        }
        case ExtractorKind::TxHash: {
            static const std::regex pattern("^(0x[a-fA-F0-9]{64})\\b",
                                            std::regex::ECMAScript | std::regex::icase);
            return FirstGroup(*after, pattern);
        }
        case ExtractorKind::Amount: {
            static const std::regex pattern(
                "^(\\d{1,3}(?:,\\d{3})+(?:\\.\\d+)?|\\d+(?:\\.\\d+)?)(?!\\d)(?!,\\d)(?!\\.\\d)(?!\\s*%)");
            auto amount = FirstGroup(*after, pattern);
            if (amount) {
                std::string plain = StripCommas(*amount);
                if (plain != "0") {
                    return plain;
                }
            }
            return std::nullopt;
        }
        case ExtractorKind::TokenSymbol: {
            static const std::regex pattern(
                "^([A-Z]{2,10}|ETH|USDC|USDT|DAI|WBTC|PLS|PLSX|HEX|eHEX|pHEX|WETH)\\b",
                std::regex::ECMAScript | std::regex::icase);
            auto token = FirstGroup(*after, pattern);
            if (token) {
                return ToUpper(*token);
            }
            return std::nullopt;
        }
        case ExtractorKind::Deadline: {
            std::string trimmed = Validation::Trim(DeadlinePhrase(*after));
            if (!trimmed.empty()) {
                return trimmed;
            }
            return std::nullopt;
        }
        case ExtractorKind::ProjectName: {
            size_t length = CamelCaseLength(*after, 0);
            std::string project = after->substr(0, length);
            if (project.size() > 3 && !IsCommonCapitalizedWord(project)) {
                return project;
            }
            return std::nullopt;
        }
        case ExtractorKind::Integer: {
            size_t length = 0;
            while (length < after->size() && IsDigit((*after)[length])) {
                ++length;
            }
            if (length == 0) {
                return std::nullopt;
            }
            return after->substr(0, length);
        }
        case ExtractorKind::ChainId:
        case ExtractorKind::Percentage:
        case ExtractorKind::None:
            break;
    }
    return std::nullopt;
}

ExtractedTemplateData ExtractTemplateData(const std::string& message,
                                          const MessageTemplate& messageTemplate) {
    ExtractedTemplateData extracted;

    auto setAddress = [](std::optional<std::string>& field, const std::string& value) {
        if (!field && Validation::IsAddress(value)) {
            field = value;
        }
    };
    auto setText = [](std::optional<std::string>& field, const std::string& value) {
        if (!field) {
            field = value;
        }
    };

    for (const auto& variable : messageTemplate.variables) {
        auto value = ExtractVariableValue(variable, message);
        if (!value || value->empty()) {
            continue;
        }

        const std::string& key = variable.key;
        if (key == "theft_tx_hash") {
            if (!extracted.theftTxHash && Validation::IsTxHash(*value)) {
                extracted.theftTxHash = *value;
            }
        } else if (key == "receive_address" || key == "recovery_address") {
            setAddress(extracted.receiveAddress, *value);
        } else if (key == "exploited_address" || key == "victim_address") {
            setAddress(extracted.exploitedAddress, *value);
        } else if (key == "spammer_address") {
            setAddress(extracted.scammerAddress, *value);
        } else if (key == "contract_address") {
            setAddress(extracted.contractAddress, *value);
        } else if (key == "chain_id") {
            setText(extracted.chainId, *value);
        } else if (key == "amount" || key == "recovered_amount") {
            setText(extracted.amount, *value);
        } else if (key == "token_name") {
            setText(extracted.tokenName, *value);
        } else if (key == "deadline") {
            setText(extracted.deadline, *value);
        } else if (key == "project_name") {
            setText(extracted.projectName, *value);
        } else if (key == "recovery_percentage") {
            if (!extracted.recoveryPercentage) {
                extracted.recoveryPercentage = PercentageInRange(*value);
            }
        }
    }

    // Heuristic fallbacks for whatever the prefixes did not yield

    if (!extracted.theftTxHash) {
        static const std::regex txHashPattern("\\b(0x[a-fA-F0-9]{64})\\b",
                                              std::regex::ECMAScript | std::regex::icase);
        auto hash = FirstGroup(message, txHashPattern);
        if (hash && Validation::IsTxHash(*hash)) {
            extracted.theftTxHash = hash;
        }
    }

    bool needsAddresses = !extracted.receiveAddress || !extracted.exploitedAddress ||
                          !extracted.scammerAddress || !extracted.contractAddress;
    if (needsAddresses) {
        static const std::regex addressPattern("\\b(0x[a-fA-F0-9]{40})\\b",
                                               std::regex::ECMAScript | std::regex::icase);
        std::vector<std::string> addresses;
        for (std::sregex_iterator it(message.begin(), message.end(), addressPattern), end;
             it != end; ++it) {
            std::string address = (*it)[1].str();
            if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
                addresses.push_back(address);
            }
        }

        const std::string messageLower = ToLower(message);
        for (const auto& address : addresses) {
            if (!Validation::IsAddress(address)) {
                continue;
            }
            if (EqualsIgnoreCase(extracted.receiveAddress, address) ||
                EqualsIgnoreCase(extracted.exploitedAddress, address) ||
                EqualsIgnoreCase(extracted.scammerAddress, address) ||
                EqualsIgnoreCase(extracted.contractAddress, address)) {
                continue;
            }

            size_t index = messageLower.find(ToLower(address));
            if (index == std::string::npos) {
                continue;
            }

            // 50 characters on either side decide the address's role
            size_t beforeStart = index >= 50 ? index - 50 : 0;
            std::string context = messageLower.substr(beforeStart, index - beforeStart) + " " +
                                  messageLower.substr(index + address.size(), 50);

            if (!extracted.receiveAddress &&
                ContainsAny(context, {"return", "receive", "to", "send to", "address to return"})) {
                extracted.receiveAddress = address;
                continue;
            }
            if (!extracted.exploitedAddress &&
                ContainsAny(context, {"exploited", "victim", "taken from", "stolen from",
                                      "funds from"})) {
                extracted.exploitedAddress = address;
                continue;
            }
            if (!extracted.scammerAddress &&
                ContainsAny(context, {"scammer", "exploiter", "spammer", "who controls",
                                      "malicious"})) {
                extracted.scammerAddress = address;
                continue;
            }
            if (!extracted.contractAddress &&
                ContainsAny(context, {"contract", "deployed", "token contract"})) {
                extracted.contractAddress = address;
                continue;
            }
        }

        std::set<std::string> identified;
        for (const auto* field : {&extracted.receiveAddress, &extracted.exploitedAddress,
                                  &extracted.scammerAddress, &extracted.contractAddress}) {
            if (*field) {
                identified.insert(**field);
            }
        }

        // Remaining addresses fill the open roles in order
        for (const auto& address : addresses) {
            if (!Validation::IsAddress(address) || identified.count(address)) {
                continue;
            }
            if (!extracted.receiveAddress) {
                extracted.receiveAddress = address;
            } else if (!extracted.exploitedAddress) {
                extracted.exploitedAddress = address;
            } else if (!extracted.scammerAddress) {
                extracted.scammerAddress = address;
            } else {
                continue;
            }
            identified.insert(address);
        }
    }

    if (!extracted.chainId) {
        static const std::regex chainPattern("\\bchain\\s*(?:id|#)?\\s*:?\\s*(\\d{1,5})\\b",
                                             std::regex::ECMAScript | std::regex::icase);
        auto digits = FirstGroup(message, chainPattern);
        if (digits) {
            long chainId = std::stol(*digits);
            if (chainId > 0 && chainId < 100000) {
                extracted.chainId = digits;
            }
        }
    }

    if (!extracted.amount) {
        static const std::regex amountPattern(
            "\\b([1-9]\\d{0,2}(?:,\\d{3})*(?:\\.\\d+)?|\\d{4,})(?:\\s|$|[^\\d%])(?!\\s*%)",
            std::regex::ECMAScript | std::regex::icase);
        std::smatch match;
        if (std::regex_search(message, match, amountPattern)) {
            size_t index = static_cast<size_t>(match.position(0));
            size_t beforeStart = index >= 20 ? index - 20 : 0;
            std::string before = ToLower(message.substr(beforeStart, index - beforeStart));
            std::string after = Validation::Trim(message.substr(index + match.length(0)));
            if (before.find("chain") == std::string::npos && (after.empty() || after[0] != '%')) {
                std::string amount = StripCommas(match[1].str());
                if (amount != "0" && (!extracted.chainId || amount != *extracted.chainId)) {
                    extracted.amount = amount;
                }
            }
        }
    }

    if (!extracted.tokenName) {
        static const std::regex tokenPattern(
            "\\b(ETH|USDC|USDT|DAI|WBTC|PLS|PLSX|HEX|eHEX|pHEX|WETH)\\b",
            std::regex::ECMAScript | std::regex::icase);
        auto token = FirstGroup(message, tokenPattern);
        if (token) {
            extracted.tokenName = ToUpper(*token);
        }
    }

    if (!extracted.deadline) {
        static const std::regex keywordPattern("\\b(?:deadline|by|before|until)",
                                               std::regex::ECMAScript | std::regex::icase);
        for (std::sregex_iterator it(message.begin(), message.end(), keywordPattern), end;
             it != end && !extracted.deadline; ++it) {
            size_t pos = static_cast<size_t>(it->position(0) + it->length(0));
            while (pos < message.size() && IsSpace(message[pos])) {
                ++pos;
            }
            if (pos < message.size() && message[pos] == ':') {
                ++pos;
            }
            size_t stop = message.find_first_of(".\n", pos);
            std::string deadline = Validation::Trim(
                message.substr(pos, stop == std::string::npos ? std::string::npos : stop - pos));
            if (!deadline.empty()) {
                extracted.deadline = deadline;
            }
        }
    }

    if (!extracted.projectName) {
        auto project = FindCamelCaseWord(message);
        if (project && project->size() > 3 && !IsCommonCapitalizedWord(*project)) {
            extracted.projectName = project;
        }
    }

    if (!extracted.recoveryPercentage) {
        static const std::regex directPattern("\\b(?:return|send|give)\\s+(\\d{1,3})%",
                                              std::regex::ECMAScript | std::regex::icase);
        static const std::regex contextPattern("\\b(?:return|recovery|send back)",
                                               std::regex::ECMAScript | std::regex::icase);
        auto digits = FirstGroup(message, directPattern);
        size_t exhaustedUntil = 0;
        for (std::sregex_iterator it(message.begin(), message.end(), contextPattern), end;
             it != end && !digits; ++it) {
            size_t pos = static_cast<size_t>(it->position(0) + it->length(0));
            if (pos < exhaustedUntil) {
                continue;
            }
            digits = PercentOnLine(message, pos);
            // Later keywords on this line would rescan a suffix of it
            exhaustedUntil = std::min(message.size(), message.find_first_of("\r\n", pos));
        }
        if (digits) {
            extracted.recoveryPercentage = PercentageInRange(*digits);
        }
    }

    CALLOUT_LOG_DEBUG("TemplateExtraction", "Extracted template data",
                      "Template: " + messageTemplate.id);
    return extracted;
}

} // namespace Templates
