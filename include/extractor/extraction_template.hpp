#pragma once

#include "core/types.hpp"
#include "text/pattern.hpp"

#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace goldminer {

/**
 * @brief One bank-scoped extraction template
 *
 * Every field pattern exposes a named group called after its field,
 * e.g. amount -> `(?<amount>[\d,.]+)`. Patterns keep declaration order.
 */
struct ExtractionTemplate {
    std::string bank_id;
    std::string name;
    std::vector<std::pair<FieldName, Pattern>> field_patterns;
    std::set<FieldName> required_fields;
};

struct BankTemplates {
    std::string bank_id;
    std::vector<ExtractionTemplate> templates;   // tried in this order
};

// Bank declaration order breaks auto-detect ties
using TemplateSet = std::vector<BankTemplates>;

// ============================================================================
// Bank selection for extraction
// ============================================================================

struct SpecifiedBank {
    std::string bank_id;
};

struct AutoDetect {};

using BankSelector = std::variant<SpecifiedBank, AutoDetect>;

} // namespace goldminer
