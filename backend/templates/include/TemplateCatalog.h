#pragma once

#include "TemplateTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace Templates {

// scam-recovery, rug-pull, approval-exploit, public-warning, whitehat-recovery
const std::vector<TemplateCategory>& GetTemplateCategories();

// Built-in templates, in recognition order
const std::vector<MessageTemplate>& GetMessageTemplates();

std::vector<MessageTemplate> GetTemplatesByCategory(const std::string& categoryId);

std::optional<MessageTemplate> GetTemplateById(const std::string& id);

} // namespace Templates
