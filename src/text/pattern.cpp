#include "text/pattern.hpp"
#include "core/utils.hpp"

#include <format>

namespace goldminer {

Result<Pattern> Pattern::compile(const std::string& source, bool icase) {
    if (source.empty()) {
        return Result<Pattern>::error(ErrorCategory::PATTERN_ERROR, "empty pattern");
    }
    try {
        boost::regex::flag_type flags = boost::regex::perl;
        if (icase) flags |= boost::regex::icase;
        return Result<Pattern>::ok(Pattern(source, boost::regex(source, flags)));
    } catch (const boost::regex_error& e) {
        return Result<Pattern>::error(ErrorCategory::PATTERN_ERROR,
            std::format("invalid pattern '{}': {}", source, e.what()));
    }
}

bool Pattern::run(std::string_view text, Match& m) const {
    try {
        return boost::regex_search(text.begin(), text.end(), m, re_);
    } catch (const std::runtime_error& e) {
        utils::log::warn(std::format("Pattern '{}' aborted: {}", source_, e.what()));
        return false;
    }
}

bool Pattern::search(std::string_view text) const {
    Match m;
    return run(text, m);
}

std::optional<std::string> Pattern::capture(std::string_view text, const std::string& group) const {
    if (!has_group(group)) return std::nullopt;
    Match m;
    if (!run(text, m)) return std::nullopt;
    const auto& sub = m[group.c_str()];
    if (!sub.matched) return std::nullopt;
    return sub.str();
}

std::optional<std::string> Pattern::capture(std::string_view text, int index) const {
    if (index < 0 || static_cast<size_t>(index) > re_.mark_count()) return std::nullopt;
    Match m;
    if (!run(text, m)) return std::nullopt;
    const auto& sub = m[index];
    if (!sub.matched) return std::nullopt;
    return sub.str();
}

bool Pattern::has_group(const std::string& group) const {
    return source_.find("(?<" + group + ">") != std::string::npos ||
           source_.find("(?P<" + group + ">") != std::string::npos ||
           source_.find("(?'" + group + "'") != std::string::npos;
}

} // namespace goldminer
