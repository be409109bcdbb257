#pragma once

#include "core/types.hpp"
#include "extractor/extraction_template.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace goldminer {

/**
 * @brief Field Extractor - template-based regex extraction
 *
 * For one bank, templates are tried in declaration order and the first
 * whose required fields all match is selected, even if a later template
 * would extract more optional fields.
 *
 * Confidence:
 * - HIGH:   all required fields matched and at least half of the
 *           declared fields matched
 * - MEDIUM: all required fields matched, fewer than half declared
 * - LOW:    no template selected; the fields of the template that
 *           matched the most of them (earlier on ties) are kept so the
 *           record can be reviewed, and matched_template stays empty
 *
 * Amounts stay raw text. A captured card suffix that is not exactly four
 * ASCII digits is dropped.
 *
 * AutoDetect tries every bank and keeps the highest confidence; ties go
 * to the earlier bank, then the earlier template.
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr).
 */
class FieldExtractor {
public:
    FieldExtractor();
    explicit FieldExtractor(TemplateSet templates);

    [[nodiscard]] ExtractedFields extract(std::string_view text, const BankSelector& bank) const;

    void load(TemplateSet templates);
    bool reload_from_file(const std::string& path);

    [[nodiscard]] size_t bank_count() const;
    [[nodiscard]] size_t template_count() const;

private:
    struct Store {
        TemplateSet banks;
    };

    struct Candidate {
        ExtractedFields fields;
        size_t matched = 0;
        bool selected = false;  // every required field matched
    };

    [[nodiscard]] static Candidate extract_for_bank(std::string_view text,
                                                    const BankTemplates& bank);
    [[nodiscard]] static ExtractedFields apply_template(std::string_view text,
                                                        const ExtractionTemplate& tmpl,
                                                        size_t& matched_count);
    [[nodiscard]] static Confidence score(const ExtractionTemplate& tmpl, size_t matched_count);

    std::atomic<std::shared_ptr<const Store>> store_;
    mutable std::mutex reload_mutex_;
};

} // namespace goldminer
