#include "core/date_resolver.hpp"
#include "core/utils.hpp"

#include <array>
#include <chrono>
#include <format>

namespace goldminer {

namespace {

constexpr std::array<std::string_view, 4> kMessageFormats = {
    "%d/%m/%Y", "%Y-%m-%d", "%m/%d/%Y", "%d-%m-%Y",
};

constexpr std::array<std::string_view, 2> kShortFormats = {"%d/%m", "%d-%m"};

constexpr std::array<std::string_view, 7> kHistoryFormats = {
    "%Y-%m-%d", "%Y-%m-%d %H:%M:%S", "%Y/%m/%d", "%d/%m/%Y", "%m/%d/%Y",
    "%Y-%m-%dT%H:%M:%S", "%Y-%m-%dT%H:%M:%S.%f",
};

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Reads between min_len and max_len digits; greedy
bool read_number(std::string_view text, size_t& pos, size_t min_len, size_t max_len, int& out) {
    size_t len = 0;
    int value = 0;
    while (pos + len < text.size() && len < max_len && is_digit(text[pos + len])) {
        value = value * 10 + (text[pos + len] - '0');
        ++len;
    }
    if (len < min_len) return false;
    pos += len;
    out = value;
    return true;
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

bool DateResolver::match_format(std::string_view text, std::string_view format, Fields& out) {
    Fields f;
    size_t pos = 0;
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%' || i + 1 >= format.size()) {
            if (pos >= text.size() || text[pos] != format[i]) return false;
            ++pos;
            continue;
        }
        const char directive = format[++i];
        bool ok = false;
        int fraction = 0;
        switch (directive) {
            case 'Y': ok = read_number(text, pos, 4, 4, f.year); break;
            case 'm': ok = read_number(text, pos, 1, 2, f.month); break;
            case 'd': ok = read_number(text, pos, 1, 2, f.day); break;
            case 'H': ok = read_number(text, pos, 1, 2, f.hour); break;
            case 'M': ok = read_number(text, pos, 1, 2, f.minute); break;
            case 'S': ok = read_number(text, pos, 1, 2, f.second); break;
            case 'f': ok = read_number(text, pos, 1, 9, fraction); break;
            default: return false;
        }
        if (!ok) return false;
    }
    if (pos != text.size()) return false;
    out = f;
    return true;
}

std::optional<Timestamp> DateResolver::to_timestamp(const Fields& f) {
    if (f.year < 0 || f.month < 1 || f.day < 1) return std::nullopt;
    if (f.hour > 23 || f.minute > 59 || f.second > 59) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{f.year},
        std::chrono::month{static_cast<unsigned>(f.month)},
        std::chrono::day{static_cast<unsigned>(f.day)}};
    if (!ymd.ok()) return std::nullopt;

    return std::chrono::sys_days{ymd} + std::chrono::hours{f.hour} +
           std::chrono::minutes{f.minute} + std::chrono::seconds{f.second};
}

int DateResolver::year_of(Timestamp tp) {
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(tp)};
    return static_cast<int>(ymd.year());
}

std::optional<Timestamp> DateResolver::parse_date(std::string_view text, const DateContext& ctx) {
    const std::string trimmed = utils::trim(text);
    if (trimmed.empty()) return std::nullopt;

    for (const auto format : kMessageFormats) {
        Fields f;
        if (!match_format(trimmed, format, f)) continue;
        if (auto tp = to_timestamp(f)) return tp;
    }

    const auto year_source = ctx.file_created_at ? ctx.file_created_at : ctx.source_timestamp;
    if (!year_source) return std::nullopt;
    for (const auto format : kShortFormats) {
        Fields f;
        if (!match_format(trimmed, format, f)) continue;
        f.year = year_of(*year_source);
        if (auto tp = to_timestamp(f)) return tp;
    }
    return std::nullopt;
}

std::optional<Timestamp> DateResolver::parse_timestamp(std::string_view text) {
    const std::string trimmed = utils::trim(text);
    if (trimmed.empty()) return std::nullopt;
    for (const auto format : kHistoryFormats) {
        Fields f;
        if (!match_format(trimmed, format, f)) continue;
        if (auto tp = to_timestamp(f)) return tp;
    }
    return std::nullopt;
}

// ============================================================================
// Resolution
// ============================================================================

ResolvedDate DateResolver::resolve(const std::optional<std::string>& date_raw, const DateContext& ctx) {
    if (date_raw) {
        if (auto tp = parse_date(*date_raw, ctx)) {
            return ResolvedDate{format_date(*tp), tp, true};
        }
        utils::log::debug(std::format("Unparseable message date '{}', using message metadata", *date_raw));
    }

    const auto fallback = ctx.source_timestamp ? ctx.source_timestamp : ctx.file_created_at;
    if (!fallback) return ResolvedDate{std::string(kUnknownDate), std::nullopt, false};
    return ResolvedDate{format_date(*fallback), fallback, false};
}

std::string DateResolver::format_date(Timestamp tp) {
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(tp)};
    return std::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

std::string DateResolver::format_datetime(Timestamp tp) {
    const auto day = std::chrono::floor<std::chrono::days>(tp);
    const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::seconds>(tp - day)};
    return std::format("{} {:02}:{:02}:{:02}", format_date(tp), hms.hours().count(),
                       hms.minutes().count(), hms.seconds().count());
}

} // namespace goldminer
