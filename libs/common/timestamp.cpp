/**
 * @file timestamp.cpp
 * @brief RFC 3339 parsing and canonical formatting for Timestamp
 */

#include "csafpp/timestamp.hpp"

#include <cctype>
#include <cstddef>

namespace csafpp {

namespace {

namespace chr = std::chrono;

/// Cursor over the input text; every reader fails without consuming on mismatch
class TextCursor
{
public:
    explicit TextCursor(std::string_view text)
        : m_text(text)
    {}

    [[nodiscard]] bool at_end() const noexcept { return m_pos == m_text.size(); }

    [[nodiscard]] std::optional<int> digits(std::size_t count)
    {
        if (m_text.size() - m_pos < count) {
            return std::nullopt;
        }
        int value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            const char c = m_text[m_pos + i];
            if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        m_pos += count;
        return value;
    }

    [[nodiscard]] bool consume(char expected)
    {
        if (at_end() || m_text[m_pos] != expected) {
            return false;
        }
        ++m_pos;
        return true;
    }

    [[nodiscard]] std::optional<char> consume_any_of(std::string_view accepted)
    {
        if (at_end() || accepted.find(m_text[m_pos]) == std::string_view::npos) {
            return std::nullopt;
        }
        return m_text[m_pos++];
    }

    /// Fraction digits after '.', scaled to nanoseconds (max 9 digits)
    [[nodiscard]] std::optional<std::uint32_t> fraction_nanos()
    {
        std::uint32_t nanos = 0;
        std::size_t count = 0;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(m_text[m_pos])) != 0) {
            if (count == 9) {
                return std::nullopt;
            }
            nanos = nanos * 10 + static_cast<std::uint32_t>(m_text[m_pos] - '0');
            ++count;
            ++m_pos;
        }
        if (count == 0) {
            return std::nullopt;
        }
        for (; count < 9; ++count) {
            nanos *= 10;
        }
        return nanos;
    }

private:
    std::string_view m_text;
    std::size_t m_pos = 0;
};

constexpr std::uint32_t kNanosPerSecond = 1'000'000'000;

/// [0000-01-01, 10000-01-01): the instants with a four-digit UTC year
constexpr chr::sys_days kFirstDay{chr::year{0} / chr::January / 1};
constexpr chr::sys_days kEndDay{chr::year{10'000} / chr::January / 1};

void append_padded(std::string& out, long long value, int width)
{
    std::string digits = std::to_string(value);
    if (static_cast<int>(digits.size()) < width) {
        out.append(static_cast<std::size_t>(width) - digits.size(), '0');
    }
    out += digits;
}

[[nodiscard]] std::optional<chr::year_month_day> read_date(TextCursor& cursor)
{
    auto year = cursor.digits(4);
    if (!year || !cursor.consume('-')) {
        return std::nullopt;
    }
    auto month = cursor.digits(2);
    if (!month || !cursor.consume('-')) {
        return std::nullopt;
    }
    auto day = cursor.digits(2);
    if (!day) {
        return std::nullopt;
    }
    chr::year_month_day date{chr::year{*year},
                             chr::month{static_cast<unsigned>(*month)},
                             chr::day{static_cast<unsigned>(*day)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

}  // namespace

std::optional<Timestamp> Timestamp::parse(std::string_view text)
{
    TextCursor cursor(text);
    auto date = read_date(cursor);
    if (!date) {
        return std::nullopt;
    }
    if (cursor.at_end()) {
        return from_date(*date);
    }

    if (!cursor.consume_any_of("Tt ")) {
        return std::nullopt;
    }
    auto hour = cursor.digits(2);
    if (!hour || *hour > 23 || !cursor.consume(':')) {
        return std::nullopt;
    }
    auto minute = cursor.digits(2);
    if (!minute || *minute > 59 || !cursor.consume(':')) {
        return std::nullopt;
    }
    auto second = cursor.digits(2);
    if (!second || *second > 59) {
        return std::nullopt;
    }
    std::uint32_t nanos = 0;
    if (cursor.consume('.')) {
        auto fraction = cursor.fraction_nanos();
        if (!fraction) {
            return std::nullopt;
        }
        nanos = *fraction;
    }

    chr::minutes offset{0};
    if (auto sign = cursor.consume_any_of("Zz+-"); !sign) {
        return std::nullopt;
    } else if (*sign == '+' || *sign == '-') {
        auto offset_hours = cursor.digits(2);
        if (!offset_hours || *offset_hours > 23 || !cursor.consume(':')) {
            return std::nullopt;
        }
        auto offset_minutes = cursor.digits(2);
        if (!offset_minutes || *offset_minutes > 59) {
            return std::nullopt;
        }
        offset = chr::hours{*offset_hours} + chr::minutes{*offset_minutes};
        if (*sign == '-') {
            offset = -offset;
        }
    }
    if (!cursor.at_end()) {
        return std::nullopt;
    }

    const chr::sys_seconds utc = chr::sys_days{*date} + chr::hours{*hour} + chr::minutes{*minute}
                                 + chr::seconds{*second} - offset;
    if (utc < kFirstDay || utc >= kEndDay) {
        return std::nullopt;
    }
    return Timestamp(utc, nanos);
}

Timestamp::Timestamp(Seconds seconds, std::uint32_t nanoseconds)
    : m_seconds(seconds + chr::seconds{nanoseconds / kNanosPerSecond})
    , m_nanoseconds(nanoseconds % kNanosPerSecond)
{}

Timestamp Timestamp::from_date(chr::year_month_day date)
{
    return Timestamp(Seconds{chr::sys_days{date}});
}

std::string Timestamp::to_string() const
{
    const chr::hh_mm_ss<chr::seconds> time_of_day{m_seconds - day()};

    std::string out = date_string();
    out += 'T';
    append_padded(out, time_of_day.hours().count(), 2);
    out += ':';
    append_padded(out, time_of_day.minutes().count(), 2);
    out += ':';
    append_padded(out, time_of_day.seconds().count(), 2);

    long long nanos = m_nanoseconds;
    if (nanos != 0) {
        int width = 9;
        while (width > 3 && nanos % 1000 == 0) {
            nanos /= 1000;
            width -= 3;
        }
        out += '.';
        append_padded(out, nanos, width);
    }
    out += 'Z';
    return out;
}

std::string Timestamp::date_string() const
{
    const chr::year_month_day date{day()};
    const int year = static_cast<int>(date.year());
    std::string out;
    if (year < 0) {
        out += '-';
    }
    append_padded(out, year < 0 ? -static_cast<long long>(year) : year, 4);
    out += '-';
    append_padded(out, static_cast<unsigned>(date.month()), 2);
    out += '-';
    append_padded(out, static_cast<unsigned>(date.day()), 2);
    return out;
}

}  // namespace csafpp
