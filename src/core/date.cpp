/// @file src/core/date.cpp
/// @brief ISO date parsing and formatting.

#include "rebal/types.hpp"

#include <fmt/format.h>

#include <charconv>

namespace rebal {

namespace {

/// Parse exactly `width` ASCII digits from `text` at `pos`.
[[nodiscard]] std::optional<int> parse_fixed(std::string_view text,
                                             std::size_t      pos,
                                             std::size_t      width) noexcept {
    if (pos + width > text.size()) return std::nullopt;
    int value = 0;
    const char* first = text.data() + pos;
    const char* last  = first + width;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

}  // namespace

// ─── parse_date ───────────────────────────────────────────────────────────────

std::optional<Date> parse_date(std::string_view text) noexcept {
    // Tolerate surrounding whitespace and a trailing time component
    // ("2023-01-31 00:00:00" is common in exported price files).
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' ||
                             text.back() == '\r')) {
        text.remove_suffix(1);
    }
    if (text.size() > 10 && (text[10] == ' ' || text[10] == 'T')) {
        text = text.substr(0, 10);
    }
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    // Reject signs: from_chars accepts a leading '-'.
    for (std::size_t i : {0U, 5U, 8U}) {
        if (text[i] < '0' || text[i] > '9') return std::nullopt;
    }

    const auto y = parse_fixed(text, 0, 4);
    const auto m = parse_fixed(text, 5, 2);
    const auto d = parse_fixed(text, 8, 2);
    if (!y || !m || !d) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{*y},
        std::chrono::month{static_cast<unsigned>(*m)},
        std::chrono::day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return std::nullopt;

    return Date{ymd};
}

// ─── format_date ──────────────────────────────────────────────────────────────

std::string format_date(Date d) {
    const std::chrono::year_month_day ymd{d};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

// ─── make_date ────────────────────────────────────────────────────────────────

Date make_date(int year, unsigned month, unsigned day) noexcept {
    return Date{std::chrono::year_month_day{
        std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}}};
}

}  // namespace rebal
