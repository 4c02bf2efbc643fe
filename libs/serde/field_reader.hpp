#pragma once

/**
 * @file field_reader.hpp
 * @brief Path-tracking JSON decoding helpers (internal)
 *
 * Records are decoded by a `read_fields(FieldReader&, Record&)` overload in
 * namespace csafpp::serde, found by argument-dependent lookup from
 * Decoder<T>. A FieldReader keeps only the first error; once it has failed,
 * further reads are no-ops and finish() returns that error, so a record is
 * either decoded completely or not at all.
 */

#include "csafpp/common.hpp"
#include "csafpp/csaf.hpp"
#include "csafpp/open_enum.hpp"
#include "csafpp/timestamp.hpp"

#include <cstddef>
#include <format>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace csafpp::serde {

using Json = nlohmann::json;

[[nodiscard]] std::string json_type_name(const Json& j);

[[nodiscard]] inline std::string child_path(const std::string& parent, std::string_view key)
{
    std::string path = parent;
    path += '/';
    path += key;
    return path;
}

[[nodiscard]] inline std::string index_path(const std::string& parent, std::size_t index)
{
    return parent + "/" + std::to_string(index);
}

class FieldReader
{
public:
    FieldReader(const Json& value, std::string path, const ParseOptions& options)
        : m_value(value)
        , m_path(std::move(path))
        , m_options(options)
    {
        if (!m_value.is_object()) {
            m_error = ParseError::type_mismatch(m_path, "object", json_type_name(m_value));
        }
    }

    /// Mandatory key; absence is kMissingField
    template <typename T>
    void required(std::string_view key, T& out);

    /// Optional key; absence and null both read as std::nullopt
    template <typename T>
    void optional(std::string_view key, std::optional<T>& out);

    /// Optional array whose absence is stored as an empty vector
    template <typename T>
    void optional_or_empty(std::string_view key, std::vector<T>& out);

    template <typename T>
    [[nodiscard]] ParseResult<T> finish(T value)
    {
        if (m_error) {
            return std::unexpected(std::move(*m_error));
        }
        return value;
    }

private:
    [[nodiscard]] const Json* find(std::string_view key) const
    {
        if (m_error) {
            return nullptr;
        }
        auto it = m_value.find(std::string(key));
        if (it == m_value.end()) {
            return nullptr;
        }
        return &*it;
    }

    const Json& m_value;
    std::string m_path;
    const ParseOptions& m_options;
    std::optional<ParseError> m_error;
};

// ============================================================================
// Decoders
// ============================================================================

/// Records: delegate to the read_fields overload for T
template <typename T>
struct Decoder
{
    [[nodiscard]] static ParseResult<T>
    decode(const Json& j, const std::string& path, const ParseOptions& options)
    {
        FieldReader reader(j, path, options);
        T value{};
        read_fields(reader, value);
        return reader.finish(std::move(value));
    }
};

template <>
struct Decoder<std::string>
{
    [[nodiscard]] static ParseResult<std::string>
    decode(const Json& j, const std::string& path, const ParseOptions& /*options*/)
    {
        if (!j.is_string()) {
            return std::unexpected(ParseError::type_mismatch(path, "string", json_type_name(j)));
        }
        return j.get<std::string>();
    }
};

/// Scores keep the full double read by the JSON reader; output uses shortest
/// round-trip formatting, so no precision is lost across cycles.
template <>
struct Decoder<double>
{
    [[nodiscard]] static ParseResult<double>
    decode(const Json& j, const std::string& path, const ParseOptions& /*options*/)
    {
        if (!j.is_number()) {
            return std::unexpected(ParseError::type_mismatch(path, "number", json_type_name(j)));
        }
        return j.get<double>();
    }
};

template <>
struct Decoder<Timestamp>
{
    [[nodiscard]] static ParseResult<Timestamp>
    decode(const Json& j, const std::string& path, const ParseOptions& /*options*/)
    {
        if (!j.is_string()) {
            return std::unexpected(ParseError::type_mismatch(path, "date-time", json_type_name(j)));
        }
        const auto& text = j.get_ref<const std::string&>();
        auto timestamp = Timestamp::parse(text);
        if (!timestamp) {
            return std::unexpected(
                ParseError::type_mismatch(path, "date-time", std::format("malformed date-time \"{}\"", text)));
        }
        return *timestamp;
    }
};

template <typename E>
struct Decoder<OpenEnum<E>>
{
    [[nodiscard]] static ParseResult<OpenEnum<E>>
    decode(const Json& j, const std::string& path, const ParseOptions& options)
    {
        if (!j.is_string()) {
            return std::unexpected(ParseError::type_mismatch(path, "string", json_type_name(j)));
        }
        const auto& text = j.get_ref<const std::string&>();
        auto value = OpenEnum<E>::parse(text);
        if (options.strict_enums && !value.is_known()) {
            return std::unexpected(ParseError::unknown_variant(
                path, std::string(EnumTraits<E>::kTypeName), text));
        }
        return value;
    }
};

template <typename T>
struct Decoder<std::vector<T>>
{
    [[nodiscard]] static ParseResult<std::vector<T>>
    decode(const Json& j, const std::string& path, const ParseOptions& options)
    {
        if (!j.is_array()) {
            return std::unexpected(ParseError::type_mismatch(path, "array", json_type_name(j)));
        }
        std::vector<T> items;
        items.reserve(j.size());
        for (std::size_t i = 0; i < j.size(); ++i) {
            auto item = Decoder<T>::decode(j[i], index_path(path, i), options);
            if (!item) {
                return std::unexpected(std::move(item.error()));
            }
            items.push_back(std::move(*item));
        }
        return items;
    }
};

template <typename T>
struct Decoder<std::set<T>>
{
    [[nodiscard]] static ParseResult<std::set<T>>
    decode(const Json& j, const std::string& path, const ParseOptions& options)
    {
        auto items = Decoder<std::vector<T>>::decode(j, path, options);
        if (!items) {
            return std::unexpected(std::move(items.error()));
        }
        return std::set<T>(std::make_move_iterator(items->begin()),
                           std::make_move_iterator(items->end()));
    }
};

// ============================================================================
// FieldReader members
// ============================================================================

template <typename T>
void FieldReader::required(std::string_view key, T& out)
{
    if (m_error) {
        return;
    }
    const Json* field = find(key);
    if (field == nullptr) {
        m_error = ParseError::missing_field(child_path(m_path, key));
        return;
    }
    auto value = Decoder<T>::decode(*field, child_path(m_path, key), m_options);
    if (!value) {
        m_error = std::move(value.error());
        return;
    }
    out = std::move(*value);
}

template <typename T>
void FieldReader::optional(std::string_view key, std::optional<T>& out)
{
    const Json* field = find(key);
    if (field == nullptr || field->is_null()) {
        out.reset();
        return;
    }
    auto value = Decoder<T>::decode(*field, child_path(m_path, key), m_options);
    if (!value) {
        m_error = std::move(value.error());
        return;
    }
    out = std::move(*value);
}

template <typename T>
void FieldReader::optional_or_empty(std::string_view key, std::vector<T>& out)
{
    std::optional<std::vector<T>> items;
    optional(key, items);
    out = items ? std::move(*items) : std::vector<T>{};
}

}  // namespace csafpp::serde
