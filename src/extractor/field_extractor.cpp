#include "extractor/field_extractor.hpp"
#include "config/config_loader.hpp"
#include "config/rule_reload.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <optional>

namespace goldminer {

FieldExtractor::FieldExtractor()
    : store_(std::make_shared<Store>()) {}

FieldExtractor::FieldExtractor(TemplateSet templates)
    : store_(std::make_shared<Store>(Store{std::move(templates)})) {}

// ============================================================================
// Template application
// ============================================================================

ExtractedFields FieldExtractor::apply_template(std::string_view text,
                                               const ExtractionTemplate& tmpl,
                                               size_t& matched_count) {
    ExtractedFields fields(Confidence::LOW);
    matched_count = 0;

    for (const auto& [field, pattern] : tmpl.field_patterns) {
        auto value = pattern.capture(text, field_name_to_string(field));
        if (!value) continue;

        std::string trimmed = utils::trim(*value);
        if (trimmed.empty()) continue;

        if (field == FieldName::CARD_SUFFIX &&
            (trimmed.size() != 4 || !utils::is_ascii_digits(trimmed))) {
            utils::log::warn(std::format("Template {}/{} captured card suffix '{}' (not 4 digits), dropped",
                                          tmpl.bank_id, tmpl.name, trimmed));
            continue;
        }

        fields.get(field) = std::move(trimmed);
        ++matched_count;
    }
    return fields;
}

Confidence FieldExtractor::score(const ExtractionTemplate& tmpl, size_t matched_count) {
    const size_t declared = tmpl.field_patterns.size();
    return (matched_count * 2 >= declared) ? Confidence::HIGH : Confidence::MEDIUM;
}

FieldExtractor::Candidate FieldExtractor::extract_for_bank(std::string_view text,
                                                           const BankTemplates& bank) {
    // Best partial: most fields matched, earlier template on ties
    Candidate partial{ExtractedFields(Confidence::LOW), 0, false};
    partial.fields.matched_bank = bank.bank_id;

    for (const auto& tmpl : bank.templates) {
        size_t matched_count = 0;
        ExtractedFields fields = apply_template(text, tmpl, matched_count);

        const bool all_required = std::all_of(
            tmpl.required_fields.begin(), tmpl.required_fields.end(),
            [&fields](FieldName field) { return fields.get(field).has_value(); });

        if (all_required) {
            fields.confidence = score(tmpl, matched_count);
            fields.matched_bank = bank.bank_id;
            fields.matched_template = tmpl.name;
            return Candidate{std::move(fields), matched_count, true};
        }
        if (matched_count > partial.matched) {
            fields.matched_bank = bank.bank_id;
            partial = Candidate{std::move(fields), matched_count, false};
        }
    }
    return partial;
}

// ============================================================================
// Public API
// ============================================================================

ExtractedFields FieldExtractor::extract(std::string_view text, const BankSelector& bank) const {
    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);

    if (const auto* specified = std::get_if<SpecifiedBank>(&bank)) {
        for (const auto& candidate : store->banks) {
            if (candidate.bank_id == specified->bank_id) {
                return extract_for_bank(text, candidate).fields;
            }
        }
        utils::log::warn(std::format("No extraction templates for bank '{}'", specified->bank_id));
        ExtractedFields none(Confidence::LOW);
        none.matched_bank = specified->bank_id;
        return none;
    }

    // AutoDetect: strict '>' keeps the earlier bank on equal confidence.
    // Without any selected template, the partial with the most fields wins.
    std::optional<Candidate> best;
    std::optional<Candidate> best_partial;
    for (const auto& candidate : store->banks) {
        auto found = extract_for_bank(text, candidate);
        if (!found.selected) {
            if (found.matched > 0 && (!best_partial || found.matched > best_partial->matched)) {
                best_partial = std::move(found);
            }
            continue;
        }
        if (!best || static_cast<int>(found.fields.confidence) >
                         static_cast<int>(best->fields.confidence)) {
            best = std::move(found);
            if (best->fields.confidence == Confidence::HIGH) break;
        }
    }
    if (best) return std::move(best->fields);
    if (best_partial) return std::move(best_partial->fields);
    return ExtractedFields(Confidence::LOW);
}

void FieldExtractor::load(TemplateSet templates) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    auto store = std::make_shared<Store>(Store{std::move(templates)});
    std::atomic_store_explicit(&store_, std::shared_ptr<const Store>(std::move(store)),
                               std::memory_order_release);
}

bool FieldExtractor::reload_from_file(const std::string& path) {
    return reload_rule_file("templates", path, ConfigLoader::load_templates,
        [this](TemplateSet templates) { load(std::move(templates)); });
}

size_t FieldExtractor::bank_count() const {
    return std::atomic_load_explicit(&store_, std::memory_order_acquire)->banks.size();
}

size_t FieldExtractor::template_count() const {
    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    size_t count = 0;
    for (const auto& bank : store->banks) count += bank.templates.size();
    return count;
}

} // namespace goldminer
