#include "include/TemplateRecognition.h"
#include "include/TemplateCatalog.h"
#include "Callout/Logger.h"
#include "SignedMessage.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>
#include <set>
#include <sstream>

namespace Templates {

namespace {

constexpr double KEY_PHRASE_THRESHOLD = 0.6;
constexpr size_t MIN_UNIQUE_IDENTIFIERS = 2;

const std::set<std::string> STOP_WORDS = {
    "the",   "a",     "an",      "and",   "or",     "but",    "in",      "on",
    "at",    "to",    "for",     "of",    "with",   "by",     "this",    "that",
    "is",    "are",   "was",     "were",  "be",     "been",   "have",    "has",
    "had",   "will",  "would",   "should", "could", "may",    "might",   "can",
    "must",  "from",  "into",    "onto",  "upon",   "about",  "above",   "below",
    "between", "among", "return", "funds", "address", "message", "transaction"};

// Phrases distinctive enough that two of them identify a template on their own
const std::map<std::string, std::vector<std::string>>& UniqueIdentifiers() {
    static const std::map<std::string, std::vector<std::string>> identifiers = {
        {"scam-bounty-simple",
         {"return 90%", "keep 10%", "legitimate bounty", "good-faith offer"}},
        {"scam-bounty", {"return 90%", "keep 10%", "legitimate bounty", "good-faith offer"}},
        {"scam-legal", {"legal action", "law enforcement", "attorney", "litigation"}},
        {"scam-deadline",
         {"final warning", "last opportunity", "without escalation", "collected evidence"}},
        {"rug-accountability",
         {"deployed and controlled", "removed without community consent",
          "immutable on-chain record"}},
        {"rug-community",
         {"public notice", "identified as a rug pull", "drained approximately",
          "permanent and searchable"}},
        {"approval-revoke",
         {"revoke your approval", "revoke.cash", "approval manager",
          "exploiting token approvals"}},
        {"approval-demand",
         {"exploited token approvals", "exploit transactions", "exchanges have been notified"}},
        {"warning-identity",
         {"public record", "associated with", "identified in connection", "permanent warning"}},
        {"warning-exchange",
         {"exchange & bridge notice", "proceeds of theft", "should be frozen",
          "legitimate owner recovery"}},
    };
    return identifiers;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool HasUniqueIdentifiers(const std::string& messageLower, const std::string& templateId) {
    const auto& identifiers = UniqueIdentifiers();
    auto it = identifiers.find(templateId);
    if (it == identifiers.end()) {
        return false;
    }
    size_t found = std::count_if(it->second.begin(), it->second.end(),
                                 [&messageLower](const std::string& identifier) {
                                     return messageLower.find(identifier) != std::string::npos;
                                 });
    return found >= MIN_UNIQUE_IDENTIFIERS;
}

bool MatchesTemplate(const std::string& messageLower, const MessageTemplate& messageTemplate) {
    std::vector<std::string> phrases = ExtractKeyPhrases(messageTemplate.templateString);

    size_t matched = 0;
    for (const auto& phrase : phrases) {
        if (messageLower.find(phrase) != std::string::npos) {
            ++matched;
        }
    }

    size_t threshold = std::max<size_t>(
        1, static_cast<size_t>(std::ceil(phrases.size() * KEY_PHRASE_THRESHOLD)));
    return matched >= threshold || HasUniqueIdentifiers(messageLower, messageTemplate.id);
}

} // namespace

std::string ExtractMessageContent(const std::string& decodedText) {
    auto framed = SignedMessage::ExtractFramedContent(decodedText);
    return framed ? *framed : decodedText;
}

std::vector<std::string> ExtractKeyPhrases(const std::string& templateString) {
    static const std::regex referencePattern("\\$\\{[^}]+\\}");
    static const std::regex conditionalPattern("\\$\\{[^}]+\\?\\s*[^}]+\\s*\\}");

    // Literal text only; placeholders carry no signal
    std::string core = ToLower(templateString);
    core = std::regex_replace(core, referencePattern, "");
    core = std::regex_replace(core, conditionalPattern, "");

    std::vector<std::string> words;
    std::istringstream stream(core);
    std::string token;
    while (stream >> token) {
        std::string word;
        for (char c : token) {
            if (IsWordChar(c)) {
                word += c;
            }
        }
        if (word.size() >= 3 && STOP_WORDS.count(word) == 0) {
            words.push_back(word);
        }
    }

    std::vector<std::string> phrases;
    for (size_t i = 0; i + 1 < words.size(); ++i) {
        std::string twoWord = words[i] + " " + words[i + 1];
        if (twoWord.size() >= 6) {
            phrases.push_back(twoWord);
        }
        if (i + 2 < words.size()) {
            std::string threeWord = twoWord + " " + words[i + 2];
            if (threeWord.size() >= 9) {
                phrases.push_back(threeWord);
            }
        }
    }

    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto* list : {&words, &phrases}) {
        for (const auto& phrase : *list) {
            if (seen.insert(phrase).second) {
                unique.push_back(phrase);
            }
        }
    }
    return unique;
}

std::optional<MessageTemplate> IdentifyTemplate(const std::string& decodedText) {
    if (decodedText.empty()) {
        return std::nullopt;
    }

    const std::string messageLower = ToLower(ExtractMessageContent(decodedText));
    for (const auto& messageTemplate : GetMessageTemplates()) {
        if (MatchesTemplate(messageLower, messageTemplate)) {
            CALLOUT_LOG_DEBUG("TemplateRecognition", "Template identified",
                              "Template: " + messageTemplate.id);
            return messageTemplate;
        }
    }
    return std::nullopt;
}

} // namespace Templates
