#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace goldminer::utils {

// ============================================================================
// Numeric Parsing (std::from_chars: no exceptions, no locale)
// ============================================================================

// Whole input must be consumed
[[nodiscard]] inline std::optional<double> try_parse_double(std::string_view sv) {
    double value{};
    const char* const last = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(sv.data(), last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

// ============================================================================
// ASCII String Helpers (Unicode-aware variants live in text/)
// ============================================================================

inline constexpr std::string_view kAsciiSpace = " \t\n\r\f\v";

[[nodiscard]] inline bool is_ascii_space(char c) {
    return kAsciiSpace.find(c) != std::string_view::npos;
}

[[nodiscard]] inline std::string to_lower(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    for (const char c : str) {
        out += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
    return out;
}

[[nodiscard]] inline std::string trim(std::string_view str) {
    const auto first = str.find_first_not_of(kAsciiSpace);
    if (first == std::string_view::npos) return {};
    const auto last = str.find_last_not_of(kAsciiSpace);
    return std::string(str.substr(first, last - first + 1));
}

/**
 * @brief Trim, then collapse every internal whitespace run to one space
 */
[[nodiscard]] inline std::string collapse_whitespace(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    bool gap = false;
    for (const char c : str) {
        if (is_ascii_space(c)) {
            gap = !out.empty();
            continue;
        }
        if (gap) out += ' ';
        gap = false;
        out += c;
    }
    return out;
}

[[nodiscard]] inline bool is_ascii_digits(std::string_view sv) {
    if (sv.empty()) return false;
    return sv.find_first_not_of("0123456789") == std::string_view::npos;
}

// Lowercase hex of a digest
[[nodiscard]] inline std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static constexpr std::string_view kDigits = "0123456789abcdef";
    std::string hex(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        hex[2 * i] = kDigits[data[i] >> 4];
        hex[2 * i + 1] = kDigits[data[i] & 0x0F];
    }
    return hex;
}

// ============================================================================
// Stopwatch for stage and batch timing
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] std::chrono::microseconds elapsed_us() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_);
    }

    [[nodiscard]] std::chrono::milliseconds elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed_us());
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::INFO};
    return level;
}

inline const char* tag(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO ";
        case Level::WARN:  return "WARN ";
        case Level::ERROR: return "ERROR";
    }
    return "?    ";
}

inline void write(Level level, std::string_view msg) {
    if (level < threshold().load(std::memory_order_relaxed)) return;

    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    ::localtime_r(&secs, &local);
    char clock[16];
    std::strftime(clock, sizeof(clock), "%H:%M:%S", &local);

    const std::string line = std::format("{}.{:03} [{}] {}\n", clock, millis, tag(level), msg);

    static std::mutex sink_mutex;
    std::lock_guard<std::mutex> lock(sink_mutex);
    std::cerr << line;
}

} // namespace detail

inline void set_level(Level level) {
    detail::threshold().store(level, std::memory_order_relaxed);
}

// Unrecognized names leave the threshold unchanged
inline bool set_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") set_level(Level::DEBUG);
    else if (lower == "info") set_level(Level::INFO);
    else if (lower == "warn" || lower == "warning") set_level(Level::WARN);
    else if (lower == "error") set_level(Level::ERROR);
    else return false;
    return true;
}

inline void debug(std::string_view msg) { detail::write(Level::DEBUG, msg); }
inline void info(std::string_view msg)  { detail::write(Level::INFO, msg); }
inline void warn(std::string_view msg)  { detail::write(Level::WARN, msg); }
inline void error(std::string_view msg) { detail::write(Level::ERROR, msg); }

} // namespace log

} // namespace goldminer::utils
