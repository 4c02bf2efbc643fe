#pragma once

/**
 * @file csaf.hpp
 * @brief CSAF 2.0 root value and its JSON serialization contract
 *
 * Contract:
 * - Absent optional fields are omitted on output, never written as null.
 * - An optional collection that is present but empty is written as [] and
 *   reads back as present-but-empty.
 * - Keys are emitted in declared field order.
 * - Unknown keys are ignored on input.
 * - parse(serialize(v)) == v for every v produced by parse().
 */

#include "csafpp/common.hpp"
#include "csafpp/document.hpp"
#include "csafpp/product_tree.hpp"
#include "csafpp/vulnerability.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csafpp {

struct Csaf
{
    Document document;
    std::optional<ProductTree> product_tree;
    /// Absent is the canonical "no vulnerabilities" state
    std::optional<std::vector<Vulnerability>> vulnerabilities;

    bool operator==(const Csaf&) const = default;
};

struct ParseOptions
{
    /// Reject enum text outside the known variants (ParseErrorKind::kUnknownVariant)
    bool strict_enums = false;
};

struct SerializeOptions
{
    /// Indentation width; -1 selects the compact single-line form
    int indent = 2;
};

/**
 * Decode a CSAF JSON document
 * @param bytes UTF-8 JSON text
 * @param options Parse policy
 * @return Csaf value, or the first error encountered (no partial results)
 */
[[nodiscard]] ParseResult<Csaf> parse(std::string_view bytes, const ParseOptions& options = {});

/**
 * Encode a Csaf value as JSON text
 * @return Deterministic JSON text; keys in declared field order
 */
[[nodiscard]] std::string serialize(const Csaf& csaf, const SerializeOptions& options = {});

}  // namespace csafpp
