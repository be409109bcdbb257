#include "core/record_json.hpp"

namespace goldminer {

namespace {

template<typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // anonymous namespace

nlohmann::json record_to_json(const TransactionRecord& record) {
    const auto& f = record.fields;
    const auto& a = record.account;

    nlohmann::json j;
    j["message"] = record.message_text;
    j["text_repaired"] = record.text_repaired;
    j["transaction_state"] = transaction_state_to_string(record.transaction_state);
    j["resolved_date"] = record.resolved_date;
    j["needs_review"] = record.needs_review;
    j["content_hash"] = record.content_hash;

    j["promo"] = {
        {"skip", record.promo.skip},
        {"reason", record.promo.reason},
        {"matched_keywords", record.promo.matched_keywords},
        {"confidence", confidence_to_string(record.promo.confidence)},
    };

    j["bank"] = {
        {"bank_id", record.bank.bank_id},
        {"confidence_score", record.bank.confidence_score},
        {"match_kind", match_kind_to_string(record.bank.match_kind)},
        {"unmatched", record.bank.unmatched},
    };

    j["fields"] = {
        {"amount", optional_json(f.amount)},
        {"currency", optional_json(f.currency)},
        {"date_raw", optional_json(f.date_raw)},
        {"payee", optional_json(f.payee)},
        {"transaction_type", optional_json(f.transaction_type)},
        {"card_suffix", optional_json(f.card_suffix)},
        {"confidence", confidence_to_string(f.confidence)},
        {"matched_bank", f.matched_bank},
        {"matched_template", f.matched_template},
    };

    j["normalized_merchant"] = optional_json(record.normalized_merchant);

    j["account"] = {
        {"account_id", a.account_id},
        {"account_type", account_type_to_string(a.account_type)},
        {"interest_rate", optional_json(a.interest_rate)},
        {"credit_limit", optional_json(a.credit_limit)},
        {"billing_cycle", optional_json(a.billing_cycle)},
        {"label", a.label},
        {"is_known", a.is_known},
    };

    j["category"] = {
        {"category", record.category.category},
        {"subcategory", record.category.subcategory},
        {"tags", record.category.tags},
        {"match_priority", match_priority_to_string(record.category.match_priority)},
    };

    j["anomalies"] = record.anomalies.names();
    return j;
}

nlohmann::json record_to_json(const TransactionRecord& record, const std::optional<WriteOutcome>& outcome) {
    auto j = record_to_json(record);
    j["store_outcome"] = outcome ? write_outcome_to_string(*outcome) : "filtered";
    return j;
}

nlohmann::json summary_to_json(const BatchSummary& s) {
    return {
        {"processed", s.processed},
        {"promo_filtered", s.promo_filtered},
        {"unknown_bank", s.unknown_bank},
        {"low_confidence", s.low_confidence},
        {"anomalous", s.anomalous},
        {"inserted", s.inserted},
        {"updated", s.updated},
        {"skipped", s.skipped},
        {"failed", s.failed},
        {"by_state", s.by_state},
    };
}

} // namespace goldminer
