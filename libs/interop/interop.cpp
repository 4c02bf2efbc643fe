/**
 * @file interop.cpp
 * @brief MinimalAdvisory <-> Csaf conversion
 */

#include "csafpp/interop.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <map>
#include <ranges>
#include <string_view>
#include <utility>

namespace csafpp::interop {

namespace {

namespace chr = std::chrono;

constexpr std::string_view kProductIdPrefix = "CSAFPID-";
constexpr std::string_view kAnyUnpatchedRange = "*";
constexpr std::string_view kUrlSummary = "Advisory details";
constexpr std::string_view kReferenceSummary = "Reference";
constexpr std::string_view kInitialRevisionSummary = "Initial version.";

/// "GHSA-jfh8-c2jp-5v3q" -> "GHSA"; ids without '-' use the whole text
[[nodiscard]] std::string id_system(std::string_view id)
{
    return std::string(id.substr(0, id.find('-')));
}

[[nodiscard]] bool is_cve(std::string_view alias)
{
    return alias.starts_with("CVE-");
}

[[nodiscard]] chr::year_month_day date_of(const Timestamp& timestamp)
{
    return chr::year_month_day{timestamp.day()};
}

/// Synthesized identifiers are numbered from 1: "CSAFPID-0001"
[[nodiscard]] ProductId product_id(std::size_t ordinal)
{
    return std::format("{}{:04}", kProductIdPrefix, ordinal);
}

/**
 * @brief Allocates one product per distinct version range of a package and
 *        builds the matching product_name / product_version_range branches
 */
class ProductCatalog
{
public:
    explicit ProductCatalog(std::string package_name)
        : m_package_name(std::move(package_name))
    {}

    [[nodiscard]] ProductIdSet ids_for(const std::vector<std::string>& ranges)
    {
        ProductIdSet ids;
        for (const auto& range : ranges) {
            ids.insert(id_for(range));
        }
        return ids;
    }

    [[nodiscard]] Branch to_branch() &&
    {
        return Branch{.branches = std::move(m_ranges),
                      .category = BranchCategory::kProductName,
                      .name = m_package_name,
                      .product = std::nullopt};
    }

private:
    [[nodiscard]] ProductId id_for(const std::string& range)
    {
        if (auto it = m_ids.find(range); it != m_ids.end()) {
            return it->second;
        }
        ProductId id = product_id(m_ids.size() + 1);
        m_ids.emplace(range, id);
        m_ranges.push_back(Branch{.branches = {},
                                  .category = BranchCategory::kProductVersionRange,
                                  .name = range,
                                  .product = FullProductName{.name = std::format("{} {}", m_package_name, range),
                                                             .product_id = id,
                                                             .product_identification_helper =
                                                                 std::nullopt}});
        return id;
    }

    std::string m_package_name;
    std::map<std::string, ProductId> m_ids;
    std::vector<Branch> m_ranges;
};

[[nodiscard]] std::optional<ProductIdSet> non_empty(ProductIdSet ids)
{
    if (ids.empty()) {
        return std::nullopt;
    }
    return ids;
}

template <typename T>
[[nodiscard]] std::optional<std::vector<T>> non_empty(std::vector<T> items)
{
    if (items.empty()) {
        return std::nullopt;
    }
    return items;
}

[[nodiscard]] std::string join_ranges(const std::vector<std::string>& ranges)
{
    std::string joined;
    for (const auto& range : ranges) {
        if (!joined.empty()) {
            joined += " or ";
        }
        joined += range;
    }
    return joined;
}

/// Package section of the vulnerability plus the product tree it refers to
struct PackageMapping
{
    ProductTree tree;
    ProductIdSet affected;
    ProductIdSet fixed;
    ProductIdSet not_affected;
};

[[nodiscard]] PackageMapping map_package(const AffectedPackage& package)
{
    ProductCatalog catalog(package.name);
    PackageMapping mapping;
    mapping.affected = package.affected.empty()
                           ? catalog.ids_for({std::string(kAnyUnpatchedRange)})
                           : catalog.ids_for(package.affected);
    mapping.fixed = catalog.ids_for(package.patched);
    mapping.not_affected = catalog.ids_for(package.unaffected);
    mapping.tree.branches = std::vector<Branch>{std::move(catalog).to_branch()};
    return mapping;
}

[[nodiscard]] std::optional<CvssSeverity> parse_severity(std::string_view text)
{
    std::string upper(text);
    std::ranges::transform(upper, upper.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::toupper(c));
    });
    return from_text<CvssSeverity>(upper);
}

[[nodiscard]] std::optional<CvssSeverity> recover_severity(const Csaf& csaf, const Vulnerability& vulnerability)
{
    if (vulnerability.scores) {
        for (const auto& score : *vulnerability.scores) {
            if (score.cvss_v3) {
                if (auto known = score.cvss_v3->base_severity.known()) {
                    return known;
                }
                return cvss::severity_for(score.cvss_v3->base_score);
            }
            if (score.cvss_v2) {
                return cvss::severity_for(score.cvss_v2->base_score);
            }
        }
    }
    if (csaf.document.aggregate_severity) {
        return parse_severity(csaf.document.aggregate_severity->text);
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<cvss::V3Vector> recover_cvss(const Vulnerability& vulnerability)
{
    if (!vulnerability.scores) {
        return std::nullopt;
    }
    for (const auto& score : *vulnerability.scores) {
        if (score.cvss_v3) {
            if (auto vector = cvss::parse_v3(score.cvss_v3->vector_string)) {
                return *vector;
            }
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::string recover_description(const Csaf& csaf, const Vulnerability& vulnerability)
{
    const auto find_note = [](const std::optional<std::vector<Note>>& notes,
                              NoteCategory category) -> const Note* {
        if (!notes) {
            return nullptr;
        }
        auto it = std::ranges::find_if(*notes, [category](const Note& note) {
            return note.category == category;
        });
        return it == notes->end() ? nullptr : &*it;
    };
    for (const auto* note : {find_note(vulnerability.notes, NoteCategory::kDescription),
                             find_note(csaf.document.notes, NoteCategory::kDescription),
                             find_note(csaf.document.notes, NoteCategory::kSummary)}) {
        if (note != nullptr) {
            return note->text;
        }
    }
    return {};
}

/// Walk product_name branches and classify their version ranges by status
[[nodiscard]] std::optional<AffectedPackage> recover_package(const Csaf& csaf,
                                                             const Vulnerability& vulnerability)
{
    if (!csaf.product_tree || !csaf.product_tree->branches) {
        return std::nullopt;
    }
    const auto contains = [](const std::optional<ProductIdSet>& ids, const ProductId& id) {
        return ids && ids->contains(id);
    };
    const ProductStatus status = vulnerability.product_status.value_or(ProductStatus{});

    for (const auto& branch : *csaf.product_tree->branches) {
        if (branch.category != BranchCategory::kProductName) {
            continue;
        }
        AffectedPackage package{.name = branch.name};
        for (const auto& range : branch.branches) {
            if (range.category != BranchCategory::kProductVersionRange || !range.product) {
                continue;
            }
            const ProductId& id = range.product->product_id;
            if (contains(status.known_affected, id) && range.name != kAnyUnpatchedRange) {
                package.affected.push_back(range.name);
            }
            if (contains(status.fixed, id)) {
                package.patched.push_back(range.name);
            }
            if (contains(status.known_not_affected, id)) {
                package.unaffected.push_back(range.name);
            }
        }
        return package;
    }
    return std::nullopt;
}

}  // namespace

ConversionDefaults rustsec_defaults()
{
    return ConversionDefaults{
        .publisher = Publisher{.category = PublisherCategory::kOther,
                               .contact_details = std::nullopt,
                               .issuing_authority = std::nullopt,
                               .name = "RustSec Advisory Database",
                               .namespace_uri = "https://rustsec.org"},
        .category = DocumentCategory::kSecurityAdvisory,
    };
}

Csaf from_minimal_advisory(const MinimalAdvisory& advisory, const ConversionDefaults& defaults)
{
    const Timestamp published = Timestamp::from_date(advisory.date);

    Csaf csaf;
    Document& document = csaf.document;
    document.category = defaults.category;
    document.csaf_version = CsafVersion::kV2_0;
    document.publisher = defaults.publisher;
    document.title = advisory.title;
    if (advisory.severity) {
        document.aggregate_severity = AggregateSeverity{.namespace_uri = std::nullopt,
                                                        .text = std::string(to_text(*advisory.severity))};
    }

    std::vector<Reference> references;
    if (advisory.url) {
        references.push_back(Reference{.category = ReferenceCategory::kExternal,
                                       .summary = std::string(kUrlSummary),
                                       .url = *advisory.url});
    }
    for (const auto& url : advisory.references) {
        references.push_back(Reference{.category = ReferenceCategory::kExternal,
                                       .summary = std::string(kReferenceSummary),
                                       .url = url});
    }
    document.references = non_empty(std::move(references));

    Tracking& tracking = document.tracking;
    tracking.aliases = non_empty(advisory.aliases);
    tracking.id = advisory.id;
    tracking.initial_release_date = published;
    tracking.current_release_date =
        advisory.withdrawn ? Timestamp::from_date(*advisory.withdrawn) : published;
    tracking.revision_history = {Revision{.date = published,
                                          .legacy_version = std::nullopt,
                                          .number = "1",
                                          .summary = std::string(kInitialRevisionSummary)}};
    tracking.status = advisory.withdrawn ? TrackingStatus::kWithdrawn : TrackingStatus::kFinal;
    tracking.version = "1";

    Vulnerability vulnerability;
    std::vector<VulnerabilityId> ids{
        VulnerabilityId{.system_name = id_system(advisory.id), .text = advisory.id}
    };
    for (const auto& alias : advisory.aliases) {
        if (!vulnerability.cve && is_cve(alias)) {
            vulnerability.cve = alias;
            continue;
        }
        ids.push_back(VulnerabilityId{.system_name = id_system(alias), .text = alias});
    }
    vulnerability.ids = std::move(ids);
    if (!advisory.description.empty()) {
        vulnerability.notes = std::vector<Note>{
            Note{.audience = std::nullopt,
                 .category = NoteCategory::kDescription,
                 .text = advisory.description,
                 .title = std::nullopt}
        };
    }
    vulnerability.title = advisory.title;

    std::vector<ProductId> affected_products;
    if (advisory.package) {
        PackageMapping mapping = map_package(*advisory.package);
        affected_products.assign(mapping.affected.begin(), mapping.affected.end());
        vulnerability.product_status = ProductStatus{
            .fixed = non_empty(mapping.fixed),
            .known_affected = non_empty(mapping.affected),
            .known_not_affected = non_empty(mapping.not_affected),
        };
        if (!advisory.package->patched.empty()) {
            vulnerability.remediations = std::vector<Remediation>{
                Remediation{.category = RemediationCategory::kVendorFix,
                            .details = std::format("Upgrade {} to {}",
                                                   advisory.package->name,
                                                   join_ranges(advisory.package->patched)),
                            .product_ids = affected_products}
            };
        }
        csaf.product_tree = std::move(mapping.tree);
    } else if (advisory.cvss) {
        // A score names at least one product; without a package it covers everything affected
        const ProductId id = product_id(1);
        csaf.product_tree = ProductTree{
            .full_product_names = std::vector<FullProductName>{
                FullProductName{.name = std::format("Products affected by {}", advisory.id),
                                .product_id = id,
                                .product_identification_helper = std::nullopt}
            }
        };
        vulnerability.product_status = ProductStatus{.known_affected = ProductIdSet{id}};
        affected_products.push_back(id);
    }
    if (advisory.cvss) {
        vulnerability.scores = std::vector<Score>{
            Score{.cvss_v3 = cvss::to_csaf(*advisory.cvss), .products = affected_products}
        };
    }

    csaf.vulnerabilities = std::vector<Vulnerability>{std::move(vulnerability)};
    return csaf;
}

InteropResult<MinimalAdvisory> to_minimal_advisory(const Csaf& csaf)
{
    if (!csaf.vulnerabilities || csaf.vulnerabilities->empty()) {
        return std::unexpected(InteropError::missing_required_field("/vulnerabilities"));
    }
    if (csaf.vulnerabilities->size() > 1) {
        return std::unexpected(InteropError::multiple_vulnerabilities(csaf.vulnerabilities->size()));
    }
    const Vulnerability& vulnerability = csaf.vulnerabilities->front();
    const Document& document = csaf.document;

    if (document.tracking.id.empty()) {
        return std::unexpected(InteropError::missing_required_field("/document/tracking/id"));
    }

    MinimalAdvisory advisory;
    advisory.id = document.tracking.id;
    advisory.title = !document.title.empty() ? document.title : vulnerability.title.value_or("");
    if (advisory.title.empty()) {
        return std::unexpected(InteropError::missing_required_field("/document/title"));
    }
    advisory.date = date_of(document.tracking.initial_release_date);
    if (document.tracking.status == TrackingStatus::kWithdrawn) {
        advisory.withdrawn = date_of(document.tracking.current_release_date);
    }

    advisory.description = recover_description(csaf, vulnerability);
    advisory.package = recover_package(csaf, vulnerability);
    advisory.severity = recover_severity(csaf, vulnerability);
    advisory.cvss = recover_cvss(vulnerability);

    if (vulnerability.cve) {
        advisory.aliases.push_back(*vulnerability.cve);
    }
    if (vulnerability.ids) {
        for (const auto& id : *vulnerability.ids) {
            if (id.text != advisory.id) {
                advisory.aliases.push_back(id.text);
            }
        }
    }

    if (document.references) {
        for (const auto& reference : *document.references) {
            if (!advisory.url && reference.summary == kUrlSummary) {
                advisory.url = reference.url;
                continue;
            }
            advisory.references.push_back(reference.url);
        }
    }
    return advisory;
}

}  // namespace csafpp::interop
