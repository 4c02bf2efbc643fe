#pragma once

/**
 * @file interop.hpp
 * @brief Conversion between RustSec-style minimal advisories and CSAF
 *
 * from_minimal_advisory() synthesizes the tracking, publisher and product
 * scaffolding CSAF requires. to_minimal_advisory() is a projection, not an
 * inverse: it recovers the minimal-format fields of a document produced by
 * from_minimal_advisory(), but generated product identifiers and other
 * scaffolding are dropped.
 */

#include "csafpp/common.hpp"
#include "csafpp/csaf.hpp"
#include "csafpp/cvss.hpp"
#include "csafpp/document.hpp"
#include "csafpp/vulnerability.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace csafpp::interop {

/**
 * @brief Package affected by a minimal advisory, with version requirements
 *        such as ">= 1.2.3" or "< 0.9"
 */
struct AffectedPackage
{
    std::string name;
    std::vector<std::string> affected;    ///< Explicitly vulnerable ranges
    std::vector<std::string> patched;     ///< Ranges containing the fix
    std::vector<std::string> unaffected;  ///< Ranges never vulnerable

    bool operator==(const AffectedPackage&) const = default;
};

struct MinimalAdvisory
{
    std::string id;           ///< "RUSTSEC-2021-0001"
    std::string title;
    std::string description;
    std::chrono::year_month_day date{};
    std::optional<AffectedPackage> package;
    std::optional<CvssSeverity> severity;
    std::optional<csafpp::cvss::V3Vector> cvss;
    std::vector<std::string> aliases;     ///< "CVE-2021-1234", "GHSA-..."
    std::vector<std::string> references;  ///< URLs
    std::optional<std::string> url;
    std::optional<std::chrono::year_month_day> withdrawn;

    bool operator==(const MinimalAdvisory&) const = default;
};

/**
 * @brief Values the minimal format cannot supply
 */
struct ConversionDefaults
{
    Publisher publisher;
    DocumentCategory category = DocumentCategory::kSecurityAdvisory;
};

/// RustSec Advisory Database as publisher
[[nodiscard]] ConversionDefaults rustsec_defaults();

/// Convert a minimal advisory into a complete CSAF document
[[nodiscard]] Csaf from_minimal_advisory(const MinimalAdvisory& advisory,
                                         const ConversionDefaults& defaults = rustsec_defaults());

/**
 * Project a CSAF document onto the minimal format
 * @return Advisory, or kMultipleVulnerabilities / kMissingRequiredField
 */
[[nodiscard]] InteropResult<MinimalAdvisory> to_minimal_advisory(const Csaf& csaf);

}  // namespace csafpp::interop
