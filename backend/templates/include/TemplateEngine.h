#pragma once

#include "TemplateTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace Templates {

// Key computed from recovery_percentage when not supplied
extern const char* const DERIVED_BOUNTY_KEY;
extern const char* const RECOVERY_PERCENTAGE_KEY;

// Guards conditional resolution against pathological input
constexpr int MAX_CONDITIONAL_PASSES = 50;

/**
 * @brief Render a template with the given values
 *
 * Unfilled required variables render as "[key]"; unfilled optional ones
 * render as the empty string.
 */
std::string ApplyTemplate(const MessageTemplate& messageTemplate, const VariableValues& values);

/**
 * @brief Render a raw template string
 *
 * Resolution order:
 *  1. bounty_percentage = 100 - recovery_percentage, when recovery_percentage
 *     parses to (0, 100] and bounty_percentage is absent or blank.
 *  2. ${key? content} blocks, outermost first, by brace-depth scanning. A blank
 *     key removes the whole block; otherwise ${...} references in content are
 *     substituted ("[other]" when unfilled) and the content replaces the block.
 *     Blocks nested inside resolved content are handled by the next pass.
 *  3. Remaining ${key} references.
 *
 * @param templateString Template text
 * @param values Variable values
 * @param messageTemplate Declared variables, used to tell optional keys apart (may be null)
 */
std::string InterpolateTemplate(const std::string& templateString, const VariableValues& values,
                                const MessageTemplate* messageTemplate = nullptr);

// True iff every non-optional variable has a non-blank value
bool AllVariablesFilled(const MessageTemplate& messageTemplate, const VariableValues& values);

/**
 * @brief Filled count over all declared variables, optional ones included
 *
 * Informational only. Use AllVariablesFilled to decide whether a message is
 * ready to send.
 */
VariableProgress GetVariableProgress(const MessageTemplate& messageTemplate,
                                     const VariableValues& values);

/**
 * @brief Check a value against its variable's type
 * @return An error message, or nullopt when valid or blank
 */
std::optional<std::string> ValidateVariable(const TemplateVariable& variable,
                                            const std::string& value);

// Unique ${key} references in order of first appearance
std::vector<std::string> ExtractVariableKeys(const std::string& templateString);

} // namespace Templates
