#pragma once

#include "core/error.hpp"

#include <boost/regex.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace goldminer {

/**
 * @brief Compiled Perl-syntax pattern over UTF-8 bytes
 *
 * Supports named groups `(?<name>...)` and lookaround. Case-insensitive
 * matching folds ASCII letters only; Arabic and other non-ASCII text is
 * matched byte-for-byte.
 *
 * Matching never throws: a match aborted by the engine (complexity
 * limit) is logged and reported as no match.
 */
class Pattern {
public:
    [[nodiscard]] static Result<Pattern> compile(const std::string& source, bool icase = true);

    [[nodiscard]] bool search(std::string_view text) const;

    /**
     * @brief First match's named group, or nullopt when no match or the
     *        group did not participate
     */
    [[nodiscard]] std::optional<std::string> capture(std::string_view text,
                                                     const std::string& group) const;

    /**
     * @brief First match's numbered group (0 = whole match)
     */
    [[nodiscard]] std::optional<std::string> capture(std::string_view text, int index) const;

    [[nodiscard]] bool has_group(const std::string& group) const;
    [[nodiscard]] const std::string& source() const { return source_; }

private:
    Pattern(std::string source, boost::regex re)
        : source_(std::move(source)), re_(std::move(re)) {}

    using Match = boost::match_results<std::string_view::const_iterator>;

    [[nodiscard]] bool run(std::string_view text, Match& m) const;

    std::string source_;
    boost::regex re_;
};

} // namespace goldminer
