#pragma once

#include "TemplateTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace Templates {

/**
 * @brief Identify which built-in template a decoded message was rendered from
 *
 * Signed-message framing (MESSAGE: "..."\nSIGNATURE:) is unwrapped first.
 * Templates are tried in catalog order; the first one that matches wins. A
 * template matches when at least 60% of its key phrases occur in the message,
 * or when two or more of its distinctive phrases do.
 *
 * @return The template, or nullopt when none matches
 */
std::optional<MessageTemplate> IdentifyTemplate(const std::string& decodedText);

// Text inside signed-message framing, or decodedText unchanged
std::string ExtractMessageContent(const std::string& decodedText);

// Lowercase words, two-word and three-word phrases of a template's literal text
std::vector<std::string> ExtractKeyPhrases(const std::string& templateString);

} // namespace Templates
