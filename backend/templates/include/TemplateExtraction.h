#pragma once

#include "TemplateTypes.h"

#include <optional>
#include <string>

namespace Templates {

/**
 * @brief Pull one variable's value out of a rendered message
 *
 * Finds the variable's prefix case-insensitively and matches a type-specific
 * pattern at the start of what follows: a 0x address, a 64-hex tx hash, a
 * leading integer (optionally followed by %), a token symbol, a phrase up to
 * a stop word, or a capitalized word run.
 *
 * Best-effort: returns a plausible value or nullopt, not necessarily the value
 * that was interpolated.
 */
std::optional<std::string> ExtractVariableValue(const TemplateVariable& variable,
                                                const std::string& message);

/**
 * @brief Recover structured fields from a message rendered from messageTemplate
 *
 * Prefix-based extraction runs first; pattern and context heuristics fill in
 * whatever is still missing.
 */
ExtractedTemplateData ExtractTemplateData(const std::string& message,
                                          const MessageTemplate& messageTemplate);

} // namespace Templates
