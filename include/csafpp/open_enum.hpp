#pragma once

/**
 * @file open_enum.hpp
 * @brief Closed code sets with a lossless fallback for unrecognized text
 *
 * Every advisory code (document category, tracking status, TLP label, ...)
 * is a scoped enum plus an EnumTraits specialization listing the canonical
 * text of each variant. Fields store OpenEnum<E>, which holds either a known
 * variant or the exact text it was parsed from, so documents written against
 * a newer schema still parse and re-serialize byte-for-byte.
 */

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace csafpp {

/**
 * Specialize for each code set:
 *   static constexpr std::string_view kTypeName;
 *   static constexpr std::array<std::pair<E, std::string_view>, N> kValues;
 */
template <typename E>
struct EnumTraits;

/**
 * @brief Canonical text of a known variant
 */
template <typename E>
[[nodiscard]] constexpr std::string_view to_text(E value)
{
    for (const auto& [known, text] : EnumTraits<E>::kValues) {
        if (known == value) {
            return text;
        }
    }
    return {};
}

/**
 * @brief Known variant whose canonical text equals `text`, if any
 */
template <typename E>
[[nodiscard]] constexpr std::optional<E> from_text(std::string_view text)
{
    for (const auto& [known, known_text] : EnumTraits<E>::kValues) {
        if (known_text == text) {
            return known;
        }
    }
    return std::nullopt;
}

template <typename E>
class OpenEnum
{
public:
    OpenEnum()
        : m_value(EnumTraits<E>::kValues.front().first)
    {}

    // Implicit so that `status = TrackingStatus::kFinal` reads naturally.
    OpenEnum(E value)  // NOLINT(google-explicit-constructor)
        : m_value(value)
    {}

    /**
     * Build from external text. Recognized text always maps to the known
     * variant, so two OpenEnums compare equal iff their text is equal.
     */
    [[nodiscard]] static OpenEnum parse(std::string_view text)
    {
        if (auto known = from_text<E>(text)) {
            return OpenEnum(*known);
        }
        OpenEnum result;
        result.m_value = std::string(text);
        return result;
    }

    [[nodiscard]] bool is_known() const noexcept { return std::holds_alternative<E>(m_value); }

    [[nodiscard]] std::optional<E> known() const
    {
        if (const auto* value = std::get_if<E>(&m_value)) {
            return *value;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string_view text() const
    {
        if (const auto* value = std::get_if<E>(&m_value)) {
            return to_text(*value);
        }
        return std::get<std::string>(m_value);
    }

    [[nodiscard]] bool operator==(const OpenEnum& other) const = default;
    [[nodiscard]] bool operator==(E other) const { return known() == other; }

private:
    std::variant<E, std::string> m_value;
};

}  // namespace csafpp
