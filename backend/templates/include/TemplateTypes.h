#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Templates {

enum class VariableType {
    Address,
    Text,
    Number,
    Date
};

std::string VariableTypeToString(VariableType type);

/**
 * @brief A named slot in a message template
 *
 * prefix is the literal text expected right before the value in a rendered
 * message. It is used only to extract values back out, never for rendering.
 */
struct TemplateVariable {
    std::string key;          // referenced as ${key} in the template string
    std::string label;
    std::string placeholder;
    VariableType type;
    bool optional;
    std::optional<std::string> prefix;

    TemplateVariable() : type(VariableType::Text), optional(false) {}
};

struct TemplateCategory {
    std::string id;
    std::string name;
    std::string description;
    std::string senderLabel;  // who the sender represents, e.g. "victim"
    std::string targetLabel;  // who the recipient represents, e.g. "scammer"
};

/**
 * @brief A message body with ${key} and ${key? ...} placeholders
 *
 * Every key referenced by templateString is either declared in variables or
 * is a derived key (bounty_percentage).
 */
struct MessageTemplate {
    std::string id;
    std::string name;
    std::string categoryId;
    std::string templateString;
    std::string description;
    std::vector<TemplateVariable> variables;
};

using VariableValues = std::map<std::string, std::string>;

struct VariableProgress {
    size_t filled;
    size_t total;

    VariableProgress() : filled(0), total(0) {}
};

/**
 * @brief Structured fields recovered from a decoded template message
 *
 * Every field is best-effort; nullopt means nothing plausible was found.
 */
struct ExtractedTemplateData {
    std::optional<std::string> theftTxHash;
    std::optional<std::string> receiveAddress;
    std::optional<std::string> exploitedAddress;
    std::optional<std::string> scammerAddress;
    std::optional<std::string> amount;
    std::optional<std::string> tokenName;
    std::optional<std::string> chainId;
    std::optional<std::string> deadline;
    std::optional<std::string> projectName;
    std::optional<std::string> contractAddress;
    std::optional<int> recoveryPercentage;
};

} // namespace Templates
