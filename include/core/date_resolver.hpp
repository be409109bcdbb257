#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace goldminer {

// Timestamps carried by the message itself; never the processing clock
struct DateContext {
    std::optional<Timestamp> source_timestamp;
    std::optional<Timestamp> file_created_at;
};

struct ResolvedDate {
    std::string iso;                       // YYYY-MM-DD, or kUnknownDate
    std::optional<Timestamp> event_time;   // midnight UTC of iso when parsed from text
    bool from_message = false;
};

/**
 * @brief Turns extracted date text into an ISO calendar date
 *
 * Full formats, tried in order (day-first wins on ambiguity):
 *   %d/%m/%Y  %Y-%m-%d  %m/%d/%Y  %d-%m-%Y
 * Short formats %d/%m and %d-%m take their year from file_created_at,
 * then source_timestamp. Without a parseable date the record date comes
 * from source_timestamp, then file_created_at; with neither it is
 * kUnknownDate and event_time is empty. The result depends only on the
 * message, so re-processing it later yields the same date and hash.
 * All calendar math is UTC.
 */
class DateResolver {
public:
    static constexpr std::string_view kUnknownDate = "unknown";

    [[nodiscard]] static ResolvedDate resolve(const std::optional<std::string>& date_raw,
                                              const DateContext& ctx);

    /**
     * @brief Parse a date or datetime string from history
     *
     * Accepts %Y-%m-%d, %Y-%m-%d %H:%M:%S, %Y/%m/%d, %d/%m/%Y, %m/%d/%Y,
     * %Y-%m-%dT%H:%M:%S and the same with fractional seconds.
     */
    [[nodiscard]] static std::optional<Timestamp> parse_timestamp(std::string_view text);

    [[nodiscard]] static std::optional<Timestamp> parse_date(std::string_view text,
                                                             const DateContext& ctx);

    [[nodiscard]] static std::string format_date(Timestamp tp);
    [[nodiscard]] static std::string format_datetime(Timestamp tp);

private:
    struct Fields {
        int year = -1;
        int month = -1;
        int day = -1;
        int hour = 0;
        int minute = 0;
        int second = 0;
    };

    [[nodiscard]] static bool match_format(std::string_view text, std::string_view format,
                                           Fields& out);
    [[nodiscard]] static std::optional<Timestamp> to_timestamp(const Fields& f);
    [[nodiscard]] static int year_of(Timestamp tp);
};

} // namespace goldminer
