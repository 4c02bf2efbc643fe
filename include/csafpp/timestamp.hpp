#pragma once

/**
 * @file timestamp.hpp
 * @brief UTC date-time value with one canonical text form
 *
 * Accepted input:
 * - RFC 3339 date-time: "2021-07-21T10:00:00Z", "2021-07-21T10:00:00.000Z",
 *   "2021-07-21 12:00:00+02:00" (fraction up to 9 digits, 'T'/'t'/' ' separator)
 * - Bare full-date "2021-07-21" (midnight UTC)
 *
 * Canonical output is UTC with a 'Z' suffix. The fraction is omitted when
 * zero and otherwise printed with 3, 6 or 9 digits, whichever is the
 * shortest exact form. parse() only yields instants whose UTC date falls in
 * years 0000-9999, so the canonical text always has a four-digit year.
 */

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace csafpp {

class Timestamp
{
public:
    using Seconds = std::chrono::sys_seconds;

    Timestamp() = default;

    /// Nanoseconds beyond one second carry into @p seconds
    explicit Timestamp(Seconds seconds, std::uint32_t nanoseconds = 0);

    /**
     * Parse external text
     * @return Timestamp, or std::nullopt when the text is not a date-time or
     *         the instant lies outside years 0000-9999 in UTC
     */
    [[nodiscard]] static std::optional<Timestamp> parse(std::string_view text);

    /**
     * Midnight UTC of a civil date
     */
    [[nodiscard]] static Timestamp from_date(std::chrono::year_month_day date);

    [[nodiscard]] Seconds seconds() const noexcept { return m_seconds; }
    [[nodiscard]] std::uint32_t nanoseconds() const noexcept { return m_nanoseconds; }

    /// UTC calendar day
    [[nodiscard]] std::chrono::sys_days day() const { return std::chrono::floor<std::chrono::days>(m_seconds); }

    /// Canonical RFC 3339 text ("2021-07-21T10:00:00Z")
    [[nodiscard]] std::string to_string() const;

    /// Date part only ("2021-07-21"); years outside 0000-9999 keep their sign and digits
    [[nodiscard]] std::string date_string() const;

    [[nodiscard]] auto operator<=>(const Timestamp&) const = default;

private:
    Seconds m_seconds{};
    std::uint32_t m_nanoseconds = 0;
};

}  // namespace csafpp
