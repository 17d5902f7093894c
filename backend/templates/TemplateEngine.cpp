#include "include/TemplateEngine.h"
#include "Callout/Logger.h"
#include "Validation.h"

#include <algorithm>
#include <cctype>
#include <functional>
#include <regex>

namespace Templates {

const char* const DERIVED_BOUNTY_KEY = "bounty_percentage";
const char* const RECOVERY_PERCENTAGE_KEY = "recovery_percentage";

namespace {

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Trimmed value of key, or nullopt when absent or blank
std::optional<std::string> FilledValue(const VariableValues& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    std::string trimmed = Validation::Trim(it->second);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

// Leading integer with optional sign after optional whitespace; trailing text is ignored
std::optional<long> ParseLeadingInteger(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        ++i;
    }
    size_t digitsStart = i;
    long value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        if (value < 100000) {
            value = value * 10 + (text[i] - '0');
        }
        ++i;
    }
    if (i == digitsStart) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

// Parses "${word" at pos; keyEnd receives the index just past the word
bool ParseReferenceHead(const std::string& text, size_t pos, std::string& key, size_t& keyEnd) {
    if (text.compare(pos, 2, "${") != 0) {
        return false;
    }
    size_t end = pos + 2;
    while (end < text.size() && IsWordChar(text[end])) {
        ++end;
    }
    if (end == pos + 2) {
        return false;
    }
    key = text.substr(pos + 2, end - pos - 2);
    keyEnd = end;
    return true;
}

// Replace every plain ${key} reference using resolve; conditional heads are left alone
std::string ReplaceReferences(const std::string& text,
                              const std::function<std::string(const std::string&)>& resolve) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        std::string key;
        size_t keyEnd = 0;
        if (ParseReferenceHead(text, i, key, keyEnd) && keyEnd < text.size() &&
            text[keyEnd] == '}') {
            out += resolve(key);
            i = keyEnd + 1;
            continue;
        }
        out += text[i];
        ++i;
    }
    return out;
}

// One pass over the outermost ${key? ...} blocks
std::string ResolveConditionals(const std::string& text, const VariableValues& values,
                                bool& changed) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        std::string key;
        size_t keyEnd = 0;
        if (ParseReferenceHead(text, i, key, keyEnd) && keyEnd < text.size() &&
            text[keyEnd] == '?') {
            size_t contentStart = keyEnd + 1;
            size_t pos = contentStart;
            int depth = 1;
            while (pos < text.size() && depth > 0) {
                if (text[pos] == '{') {
                    ++depth;
                } else if (text[pos] == '}') {
                    --depth;
                }
                ++pos;
            }

            if (depth == 0) {
                std::string content = text.substr(contentStart, pos - 1 - contentStart);
                auto value = FilledValue(values, key);
                if (value) {
                    out += ReplaceReferences(content, [&](const std::string& innerKey) {
                        if (innerKey == key) {
                            return *value;
                        }
                        auto innerValue = FilledValue(values, innerKey);
                        return innerValue ? *innerValue : "[" + innerKey + "]";
                    });
                }
                changed = true;
                i = pos;
                continue;
            }
        }
        out += text[i];
        ++i;
    }
    return out;
}

} // namespace

std::string ApplyTemplate(const MessageTemplate& messageTemplate, const VariableValues& values) {
    return InterpolateTemplate(messageTemplate.templateString, values, &messageTemplate);
}

std::string InterpolateTemplate(const std::string& templateString, const VariableValues& values,
                                const MessageTemplate* messageTemplate) {
    VariableValues resolved = values;

    if (!FilledValue(resolved, DERIVED_BOUNTY_KEY)) {
        auto recovery = resolved.find(RECOVERY_PERCENTAGE_KEY);
        if (recovery != resolved.end() && !recovery->second.empty()) {
            auto percentage = ParseLeadingInteger(recovery->second);
            if (percentage && *percentage > 0 && *percentage <= 100) {
                resolved[DERIVED_BOUNTY_KEY] = std::to_string(100 - *percentage);
            }
        }
    }

    std::string result = templateString;
    bool changed = true;
    for (int pass = 0; pass < MAX_CONDITIONAL_PASSES && changed; ++pass) {
        changed = false;
        result = ResolveConditionals(result, resolved, changed);
    }
    if (changed) {
        // The last pass resolved something; check whether any block is still pending
        bool pending = false;
        ResolveConditionals(result, resolved, pending);
        if (pending) {
            CALLOUT_LOG_WARNING("TemplateEngine", "Conditional nesting exceeds pass limit",
                                "Passes: " + std::to_string(MAX_CONDITIONAL_PASSES));
        }
    }

    return ReplaceReferences(result, [&](const std::string& key) {
        auto value = FilledValue(resolved, key);
        if (value) {
            return *value;
        }
        bool optional = false;
        if (messageTemplate) {
            for (const auto& variable : messageTemplate->variables) {
                if (variable.key == key) {
                    optional = variable.optional;
                    break;
                }
            }
        }
        return optional ? std::string() : "[" + key + "]";
    });
}

bool AllVariablesFilled(const MessageTemplate& messageTemplate, const VariableValues& values) {
    return std::all_of(messageTemplate.variables.begin(), messageTemplate.variables.end(),
                       [&values](const TemplateVariable& variable) {
                           return variable.optional || FilledValue(values, variable.key).has_value();
                       });
}

VariableProgress GetVariableProgress(const MessageTemplate& messageTemplate,
                                     const VariableValues& values) {
    VariableProgress progress;
    progress.total = messageTemplate.variables.size();
    for (const auto& variable : messageTemplate.variables) {
        if (FilledValue(values, variable.key)) {
            ++progress.filled;
        }
    }
    return progress;
}

std::optional<std::string> ValidateVariable(const TemplateVariable& variable,
                                            const std::string& value) {
    std::string trimmed = Validation::Trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    switch (variable.type) {
        case VariableType::Address: {
            static const std::regex addressPattern("^0x[a-fA-F0-9]{40}$");
            if (!std::regex_match(trimmed, addressPattern)) {
                return std::string("Must be a valid 0x address (42 characters)");
            }
            return std::nullopt;
        }
        case VariableType::Number: {
            static const std::regex numberPattern("^\\d[\\d,]*\\.?\\d*$");
            if (!std::regex_match(trimmed, numberPattern)) {
                return std::string("Must be a valid number");
            }
            return std::nullopt;
        }
        case VariableType::Text:
        case VariableType::Date:
            return std::nullopt;
    }
    return std::nullopt;
}

std::vector<std::string> ExtractVariableKeys(const std::string& templateString) {
    std::vector<std::string> keys;
    ReplaceReferences(templateString, [&keys](const std::string& key) {
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
            keys.push_back(key);
        }
        return std::string();
    });
    return keys;
}

std::string VariableTypeToString(VariableType type) {
    switch (type) {
        case VariableType::Address:
            return "address";
        case VariableType::Text:
            return "text";
        case VariableType::Number:
            return "number";
        case VariableType::Date:
            return "date";
    }
    return "text";
}

} // namespace Templates
