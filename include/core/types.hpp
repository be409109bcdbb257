#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace goldminer {

using Timestamp = std::chrono::system_clock::time_point;

inline constexpr std::string_view kUnknownBank = "unknown_bank";

// ============================================================================
// Basic Enums
// ============================================================================

enum class Confidence { LOW, MEDIUM, HIGH };

enum class MatchKind { EXACT, FUZZY };

enum class AccountType { CREDIT, DEBIT, PREPAID, UNKNOWN };

enum class MatchPriority { EXACT, FUZZY, KEYWORD, FALLBACK };

enum class TransactionState { MONETARY, PROMO, OTP, DECLINED, UNKNOWN };

enum class AnomalyFlag : uint8_t { HIGH_VALUE, BURST_FREQUENCY, UNKNOWN_MERCHANT };

/**
 * @brief Closed set of fields a template can extract
 */
enum class FieldName : uint8_t { AMOUNT, CURRENCY, DATE, PAYEE, TRANSACTION_TYPE, CARD_SUFFIX };

inline constexpr std::array<FieldName, 6> kAllFields = {
    FieldName::AMOUNT, FieldName::CURRENCY, FieldName::DATE,
    FieldName::PAYEE, FieldName::TRANSACTION_TYPE, FieldName::CARD_SUFFIX
};

// ============================================================================
// Enum <-> string
// ============================================================================

inline const char* confidence_to_string(Confidence c) {
    switch (c) {
        case Confidence::LOW:    return "low";
        case Confidence::MEDIUM: return "medium";
        case Confidence::HIGH:   return "high";
    }
    return "low";
}

inline const char* match_kind_to_string(MatchKind kind) {
    switch (kind) {
        case MatchKind::EXACT: return "exact";
        case MatchKind::FUZZY: return "fuzzy";
    }
    return "exact";
}

inline const char* account_type_to_string(AccountType type) {
    switch (type) {
        case AccountType::CREDIT:  return "Credit";
        case AccountType::DEBIT:   return "Debit";
        case AccountType::PREPAID: return "Prepaid";
        case AccountType::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

inline std::optional<AccountType> parse_account_type(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (const char c : s) lower += static_cast<char>((c >= 'A' && c <= 'Z') ? c + 32 : c);
    if (lower == "credit")  return AccountType::CREDIT;
    if (lower == "debit")   return AccountType::DEBIT;
    if (lower == "prepaid") return AccountType::PREPAID;
    if (lower == "unknown") return AccountType::UNKNOWN;
    return std::nullopt;
}

inline const char* match_priority_to_string(MatchPriority p) {
    switch (p) {
        case MatchPriority::EXACT:    return "exact";
        case MatchPriority::FUZZY:    return "fuzzy";
        case MatchPriority::KEYWORD:  return "keyword";
        case MatchPriority::FALLBACK: return "fallback";
    }
    return "fallback";
}

inline const char* transaction_state_to_string(TransactionState s) {
    switch (s) {
        case TransactionState::MONETARY: return "MONETARY";
        case TransactionState::PROMO:    return "PROMO";
        case TransactionState::OTP:      return "OTP";
        case TransactionState::DECLINED: return "DECLINED";
        case TransactionState::UNKNOWN:  return "UNKNOWN";
    }
    return "UNKNOWN";
}

inline const char* anomaly_flag_to_string(AnomalyFlag f) {
    switch (f) {
        case AnomalyFlag::HIGH_VALUE:       return "high_value";
        case AnomalyFlag::BURST_FREQUENCY:  return "burst_frequency";
        case AnomalyFlag::UNKNOWN_MERCHANT: return "unknown_merchant";
    }
    return "unknown";
}

inline std::optional<AnomalyFlag> parse_anomaly_flag(std::string_view s) {
    if (s == "high_value")       return AnomalyFlag::HIGH_VALUE;
    if (s == "burst_frequency")  return AnomalyFlag::BURST_FREQUENCY;
    if (s == "unknown_merchant") return AnomalyFlag::UNKNOWN_MERCHANT;
    return std::nullopt;
}

inline const char* field_name_to_string(FieldName f) {
    switch (f) {
        case FieldName::AMOUNT:           return "amount";
        case FieldName::CURRENCY:         return "currency";
        case FieldName::DATE:             return "date";
        case FieldName::PAYEE:            return "payee";
        case FieldName::TRANSACTION_TYPE: return "transaction_type";
        case FieldName::CARD_SUFFIX:      return "card_suffix";
    }
    return "unknown";
}

inline std::optional<FieldName> parse_field_name(std::string_view s) {
    for (const auto f : kAllFields) {
        if (s == field_name_to_string(f)) return f;
    }
    return std::nullopt;
}

// ============================================================================
// Pipeline Input
// ============================================================================

struct RawMessage {
    std::string text;
    std::optional<Timestamp> source_timestamp;
    std::optional<Timestamp> file_created_at;
};

// ============================================================================
// Stage Outputs
// ============================================================================

struct PromoVerdict {
    bool skip = false;
    std::string reason;
    std::vector<std::string> matched_keywords;   // distinct, in match order
    Confidence confidence = Confidence::LOW;
};

struct BankMatch {
    std::string bank_id;
    int confidence_score = 0;                    // 0-100
    MatchKind match_kind = MatchKind::EXACT;
    bool unmatched = true;

    static BankMatch unknown() {
        BankMatch m;
        m.bank_id = std::string(kUnknownBank);
        return m;
    }
};

/**
 * @brief Fields pulled out of a message by one template
 *
 * Amount stays raw text. Confidence has no default: every construction
 * site states it.
 */
struct ExtractedFields {
    std::optional<std::string> amount;
    std::optional<std::string> currency;
    std::optional<std::string> date_raw;
    std::optional<std::string> payee;
    std::optional<std::string> transaction_type;
    std::optional<std::string> card_suffix;      // nullopt or exactly 4 ASCII digits
    Confidence confidence;
    std::string matched_bank;
    std::string matched_template;

    explicit ExtractedFields(Confidence c) : confidence(c) {}

    [[nodiscard]] const std::optional<std::string>& get(FieldName f) const {
        switch (f) {
            case FieldName::AMOUNT:           return amount;
            case FieldName::CURRENCY:         return currency;
            case FieldName::DATE:             return date_raw;
            case FieldName::PAYEE:            return payee;
            case FieldName::TRANSACTION_TYPE: return transaction_type;
            case FieldName::CARD_SUFFIX:      return card_suffix;
        }
        return amount;
    }

    std::optional<std::string>& get(FieldName f) {
        return const_cast<std::optional<std::string>&>(std::as_const(*this).get(f));
    }
};

struct AccountMetadata {
    std::string account_id;
    AccountType account_type = AccountType::UNKNOWN;
    std::optional<double> interest_rate;
    std::optional<double> credit_limit;
    std::optional<int> billing_cycle;            // 1-31
    std::string label;
    std::optional<std::string> card_suffix;
    bool is_known = false;
};

struct CategoryAssignment {
    std::string category;
    std::string subcategory;
    std::set<std::string> tags;
    MatchPriority match_priority = MatchPriority::FALLBACK;
};

/**
 * @brief Set of fired anomaly rules (never mutually exclusive)
 */
class AnomalyFlags {
public:
    void set(AnomalyFlag f) { bits_ |= mask(f); }
    [[nodiscard]] bool test(AnomalyFlag f) const { return (bits_ & mask(f)) != 0; }
    [[nodiscard]] bool empty() const { return bits_ == 0; }
    [[nodiscard]] size_t count() const {
        size_t n = 0;
        for (uint8_t b = bits_; b != 0; b &= static_cast<uint8_t>(b - 1)) ++n;
        return n;
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto f : {AnomalyFlag::HIGH_VALUE, AnomalyFlag::BURST_FREQUENCY,
                             AnomalyFlag::UNKNOWN_MERCHANT}) {
            if (test(f)) out.emplace_back(anomaly_flag_to_string(f));
        }
        return out;
    }

    bool operator==(const AnomalyFlags&) const = default;

private:
    static constexpr uint8_t mask(AnomalyFlag f) {
        return static_cast<uint8_t>(1u << static_cast<unsigned>(f));
    }
    uint8_t bits_ = 0;
};

// ============================================================================
// Terminal Aggregate
// ============================================================================

struct TransactionRecord {
    std::string message_text;                    // normalized text
    bool text_repaired = false;

    PromoVerdict promo;
    BankMatch bank;
    ExtractedFields fields{Confidence::LOW};
    std::optional<std::string> normalized_merchant;
    AccountMetadata account;
    CategoryAssignment category;
    AnomalyFlags anomalies;

    std::string resolved_date;                   // YYYY-MM-DD
    std::optional<Timestamp> event_time;
    TransactionState transaction_state = TransactionState::UNKNOWN;
    bool needs_review = false;
    std::string content_hash;

    // Downstream expense aggregation only sees MONETARY records
    [[nodiscard]] bool aggregatable() const {
        return transaction_state == TransactionState::MONETARY;
    }

    // Promotional messages are filtered, not reviewed
    [[nodiscard]] bool low_confidence() const {
        return !promo.skip && fields.confidence == Confidence::LOW;
    }
};

} // namespace goldminer
