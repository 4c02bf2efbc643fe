/**
 * @file test_interop.cpp
 * @brief MinimalAdvisory <-> Csaf conversion
 */

#include "csafpp/interop.hpp"

#include "csafpp/csaf.hpp"
#include "csafpp/cvss.hpp"
#include "csafpp/schema_validate.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace csafpp::interop::test {

namespace {

using std::chrono::January;
using std::chrono::March;
using std::chrono::year;

MinimalAdvisory make_example_advisory()
{
    MinimalAdvisory advisory;
    advisory.id = "RUSTSEC-2021-0001";
    advisory.title = "Example";
    advisory.description = "Use-after-free in `Example::drain`.";
    advisory.date = year{2021} / January / 1;
    advisory.package = AffectedPackage{.name = "example-crate",
                                       .affected = {},
                                       .patched = {">= 1.2.3"},
                                       .unaffected = {}};
    return advisory;
}

const Vulnerability& only_vulnerability(const Csaf& csaf)
{
    EXPECT_TRUE(csaf.vulnerabilities);
    EXPECT_EQ(csaf.vulnerabilities->size(), 1U);
    return csaf.vulnerabilities->front();
}

}  // namespace

TEST(InteropTest, HappyPathRecoversIdentity)
{
    const MinimalAdvisory advisory = make_example_advisory();

    auto back = to_minimal_advisory(from_minimal_advisory(advisory));
    ASSERT_TRUE(back) << back.error().message;

    EXPECT_EQ(back->id, "RUSTSEC-2021-0001");
    EXPECT_EQ(back->title, "Example");
    EXPECT_EQ(back->date, year{2021} / January / 1);
    EXPECT_EQ(back->description, advisory.description);
    EXPECT_EQ(back->package, advisory.package);
    EXPECT_FALSE(back->withdrawn);
}

TEST(InteropTest, ForwardSynthesizesTracking)
{
    const Csaf csaf = from_minimal_advisory(make_example_advisory());
    const Tracking& tracking = csaf.document.tracking;

    EXPECT_EQ(csaf.document.category, DocumentCategory::kSecurityAdvisory);
    EXPECT_EQ(csaf.document.csaf_version, CsafVersion::kV2_0);
    EXPECT_EQ(csaf.document.publisher.name, "RustSec Advisory Database");
    EXPECT_EQ(csaf.document.publisher.namespace_uri, "https://rustsec.org");
    EXPECT_EQ(tracking.id, "RUSTSEC-2021-0001");
    EXPECT_EQ(tracking.status, TrackingStatus::kFinal);
    EXPECT_EQ(tracking.initial_release_date.to_string(), "2021-01-01T00:00:00Z");
    EXPECT_EQ(tracking.current_release_date, tracking.initial_release_date);
    ASSERT_EQ(tracking.revision_history.size(), 1U);
    EXPECT_EQ(tracking.revision_history[0].date, tracking.initial_release_date);
    EXPECT_EQ(tracking.revision_history[0].number, "1");

    // No minimal-format source for these.
    EXPECT_FALSE(csaf.document.aggregate_severity);
    EXPECT_FALSE(csaf.document.references);
    EXPECT_FALSE(csaf.document.distribution);
    EXPECT_FALSE(csaf.document.notes);
}

TEST(InteropTest, ForwardMapsPackageRangesToProducts)
{
    MinimalAdvisory advisory = make_example_advisory();
    advisory.package->affected = {">= 1.0.0, < 1.2.3"};
    advisory.package->patched = {">= 1.2.3", ">= 1.2.3"};
    advisory.package->unaffected = {"< 1.0.0"};

    const Csaf csaf = from_minimal_advisory(advisory);
    ASSERT_TRUE(csaf.product_tree);
    ASSERT_TRUE(csaf.product_tree->branches);
    ASSERT_EQ(csaf.product_tree->branches->size(), 1U);

    const Branch& package = csaf.product_tree->branches->front();
    EXPECT_EQ(package.category, BranchCategory::kProductName);
    EXPECT_EQ(package.name, "example-crate");
    // One product per distinct range.
    ASSERT_EQ(package.branches.size(), 3U);
    EXPECT_EQ(package.branches[0].category, BranchCategory::kProductVersionRange);
    EXPECT_EQ(package.branches[0].name, ">= 1.0.0, < 1.2.3");
    ASSERT_TRUE(package.branches[0].product);
    EXPECT_EQ(package.branches[0].product->product_id, "CSAFPID-0001");
    EXPECT_EQ(package.branches[1].product->product_id, "CSAFPID-0002");
    EXPECT_EQ(package.branches[2].product->product_id, "CSAFPID-0003");

    const Vulnerability& vulnerability = only_vulnerability(csaf);
    ASSERT_TRUE(vulnerability.product_status);
    EXPECT_EQ(vulnerability.product_status->known_affected, ProductIdSet{"CSAFPID-0001"});
    EXPECT_EQ(vulnerability.product_status->fixed, ProductIdSet{"CSAFPID-0002"});
    EXPECT_EQ(vulnerability.product_status->known_not_affected, ProductIdSet{"CSAFPID-0003"});
    EXPECT_FALSE(vulnerability.product_status->under_investigation);

    ASSERT_TRUE(vulnerability.remediations);
    ASSERT_EQ(vulnerability.remediations->size(), 1U);
    const Remediation& remediation = vulnerability.remediations->front();
    EXPECT_EQ(remediation.category, RemediationCategory::kVendorFix);
    EXPECT_EQ(remediation.details, "Upgrade example-crate to >= 1.2.3 or >= 1.2.3");
    EXPECT_EQ(remediation.product_ids, (std::vector<ProductId>{"CSAFPID-0001"}));
}

TEST(InteropTest, NoPatchedVersionMeansNoRemediation)
{
    MinimalAdvisory advisory = make_example_advisory();
    advisory.package->patched.clear();

    const Csaf csaf = from_minimal_advisory(advisory);
    const Vulnerability& vulnerability = only_vulnerability(csaf);
    EXPECT_FALSE(vulnerability.remediations);
    ASSERT_TRUE(vulnerability.product_status);
    EXPECT_FALSE(vulnerability.product_status->fixed);
}

TEST(InteropTest, AliasesSplitIntoCveAndIds)
{
    MinimalAdvisory advisory = make_example_advisory();
    advisory.aliases = {"CVE-2021-1234", "GHSA-jfh8-c2jp-5v3q"};

    const Csaf csaf = from_minimal_advisory(advisory);
    EXPECT_EQ(csaf.document.tracking.aliases, advisory.aliases);
    const Vulnerability& vulnerability = only_vulnerability(csaf);
    EXPECT_EQ(vulnerability.cve, "CVE-2021-1234");
    ASSERT_TRUE(vulnerability.ids);
    ASSERT_EQ(vulnerability.ids->size(), 2U);
    EXPECT_EQ((*vulnerability.ids)[0].system_name, "RUSTSEC");
    EXPECT_EQ((*vulnerability.ids)[0].text, "RUSTSEC-2021-0001");
    EXPECT_EQ((*vulnerability.ids)[1].system_name, "GHSA");
    EXPECT_EQ((*vulnerability.ids)[1].text, "GHSA-jfh8-c2jp-5v3q");

    auto back = to_minimal_advisory(csaf);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(back->aliases, advisory.aliases);
}

TEST(InteropTest, UrlAndReferencesRoundTrip)
{
    MinimalAdvisory advisory = make_example_advisory();
    advisory.url = "https://github.com/example/example-crate/issues/7";
    advisory.references = {"https://example.com/blog/disclosure"};

    const Csaf csaf = from_minimal_advisory(advisory);
    ASSERT_TRUE(csaf.document.references);
    ASSERT_EQ(csaf.document.references->size(), 2U);
    EXPECT_EQ(csaf.document.references->front().category, ReferenceCategory::kExternal);

    auto back = to_minimal_advisory(csaf);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(back->url, advisory.url);
    EXPECT_EQ(back->references, advisory.references);
}

TEST(InteropTest, WithdrawnAdvisory)
{
    MinimalAdvisory advisory = make_example_advisory();
    advisory.withdrawn = year{2021} / March / 15;

    const Csaf csaf = from_minimal_advisory(advisory);
    EXPECT_EQ(csaf.document.tracking.status, TrackingStatus::kWithdrawn);
    EXPECT_EQ(csaf.document.tracking.current_release_date.date_string(), "2021-03-15");
    EXPECT_EQ(csaf.document.tracking.initial_release_date.date_string(), "2021-01-01");

    auto back = to_minimal_advisory(csaf);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(back->withdrawn, advisory.withdrawn);
    EXPECT_EQ(back->date, advisory.date);
}

TEST(InteropTest, SeverityAndCvss)
{
    MinimalAdvisory advisory = make_example_advisory();
    auto vector = cvss::parse_v3("CVSS:3.1/AV:N/AC:L/PR:N/UI:N/S:U/C:H/I:H/A:H");
    ASSERT_TRUE(vector) << vector.error().message;
    advisory.cvss = *vector;
    advisory.severity = CvssSeverity::kCritical;

    const Csaf csaf = from_minimal_advisory(advisory);
    ASSERT_TRUE(csaf.document.aggregate_severity);
    EXPECT_EQ(csaf.document.aggregate_severity->text, "CRITICAL");
    const Vulnerability& vulnerability = only_vulnerability(csaf);
    ASSERT_TRUE(vulnerability.scores);
    const Score& score = vulnerability.scores->front();
    ASSERT_TRUE(score.cvss_v3);
    EXPECT_DOUBLE_EQ(score.cvss_v3->base_score, 9.8);
    EXPECT_EQ(score.products, (std::vector<ProductId>{"CSAFPID-0001"}));

    auto back = to_minimal_advisory(csaf);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(back->severity, CvssSeverity::kCritical);
    EXPECT_EQ(back->cvss, advisory.cvss);
}

TEST(InteropTest, StatedSeverityIsKeptBesideComputedScore)
{
    MinimalAdvisory advisory = make_example_advisory();
    auto vector = cvss::parse_v3("CVSS:3.1/AV:N/AC:L/PR:N/UI:N/S:U/C:H/I:H/A:H");
    ASSERT_TRUE(vector) << vector.error().message;
    advisory.cvss = *vector;
    advisory.severity = CvssSeverity::kHigh;

    const Csaf csaf = from_minimal_advisory(advisory);
    ASSERT_TRUE(csaf.document.aggregate_severity);
    EXPECT_EQ(csaf.document.aggregate_severity->text, "HIGH");
    const Vulnerability& vulnerability = only_vulnerability(csaf);
    ASSERT_TRUE(vulnerability.scores);
    EXPECT_EQ(vulnerability.scores->front().cvss_v3->base_severity, CvssSeverity::kCritical);

    // The score is consulted first on the way back
    auto back = to_minimal_advisory(csaf);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(back->severity, CvssSeverity::kCritical);
}

TEST(InteropTest, ScoreWithoutPackageNamesPlaceholderProduct)
{
    MinimalAdvisory advisory = make_example_advisory();
    advisory.package.reset();
    auto vector = cvss::parse_v3("CVSS:3.1/AV:N/AC:L/PR:N/UI:R/S:U/C:L/I:L/A:N");
    ASSERT_TRUE(vector) << vector.error().message;
    advisory.cvss = *vector;

    const Csaf csaf = from_minimal_advisory(advisory);
    ASSERT_TRUE(csaf.product_tree);
    EXPECT_FALSE(csaf.product_tree->branches);
    ASSERT_TRUE(csaf.product_tree->full_product_names);
    ASSERT_EQ(csaf.product_tree->full_product_names->size(), 1U);
    const FullProductName& product = csaf.product_tree->full_product_names->front();
    EXPECT_EQ(product.product_id, "CSAFPID-0001");
    EXPECT_EQ(product.name, "Products affected by RUSTSEC-2021-0001");

    const Vulnerability& vulnerability = only_vulnerability(csaf);
    ASSERT_TRUE(vulnerability.product_status);
    EXPECT_EQ(vulnerability.product_status->known_affected, ProductIdSet{"CSAFPID-0001"});
    ASSERT_TRUE(vulnerability.scores);
    EXPECT_EQ(vulnerability.scores->front().products, (std::vector<ProductId>{"CSAFPID-0001"}));
    EXPECT_FALSE(vulnerability.remediations);

    auto valid = validate_document(serialize(csaf),
                                   std::string(CSAFPP_SCHEMA_DIR) + "/csaf_core.schema.json");
    EXPECT_TRUE(valid) << valid.error().message;

    auto back = to_minimal_advisory(csaf);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_FALSE(back->package);
    EXPECT_EQ(back->cvss, advisory.cvss);
}

TEST(InteropTest, SeverityFallsBackToAggregateText)
{
    MinimalAdvisory advisory = make_example_advisory();
    advisory.severity = CvssSeverity::kMedium;

    Csaf csaf = from_minimal_advisory(advisory);
    csaf.document.aggregate_severity->text = "Medium";

    auto back = to_minimal_advisory(csaf);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(back->severity, CvssSeverity::kMedium);
}

TEST(InteropTest, ConvertedDocumentSurvivesSerialization)
{
    MinimalAdvisory advisory = make_example_advisory();
    advisory.aliases = {"CVE-2021-1234"};
    advisory.url = "https://rustsec.org/advisories/RUSTSEC-2021-0001.html";
    advisory.severity = CvssSeverity::kHigh;

    const Csaf csaf = from_minimal_advisory(advisory);
    auto reparsed = parse(serialize(csaf), ParseOptions{.strict_enums = true});
    ASSERT_TRUE(reparsed) << reparsed.error().message;
    EXPECT_EQ(*reparsed, csaf);

    auto back = to_minimal_advisory(*reparsed);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(*back, advisory);
}

TEST(InteropTest, CustomDefaults)
{
    ConversionDefaults defaults{
        .publisher = Publisher{.category = PublisherCategory::kCoordinator,
                               .contact_details = "security@example.org",
                               .issuing_authority = std::nullopt,
                               .name = "Example CERT",
                               .namespace_uri = "https://cert.example.org"},
        .category = DocumentCategory::kInformationalAdvisory,
    };

    const Csaf csaf = from_minimal_advisory(make_example_advisory(), defaults);
    EXPECT_EQ(csaf.document.publisher, defaults.publisher);
    EXPECT_EQ(csaf.document.category, DocumentCategory::kInformationalAdvisory);
}

TEST(InteropTest, TwoVulnerabilitiesAreRejected)
{
    Csaf csaf = from_minimal_advisory(make_example_advisory());
    csaf.vulnerabilities->push_back(csaf.vulnerabilities->front());

    auto back = to_minimal_advisory(csaf);
    ASSERT_FALSE(back);
    EXPECT_EQ(back.error().kind, InteropErrorKind::kMultipleVulnerabilities);
    EXPECT_EQ(back.error().count, 2U);
    EXPECT_EQ(back.error().path, "/vulnerabilities");
}

TEST(InteropTest, MissingVulnerabilitiesAreRejected)
{
    Csaf csaf = from_minimal_advisory(make_example_advisory());
    csaf.vulnerabilities.reset();

    auto back = to_minimal_advisory(csaf);
    ASSERT_FALSE(back);
    EXPECT_EQ(back.error().kind, InteropErrorKind::kMissingRequiredField);
    EXPECT_EQ(back.error().path, "/vulnerabilities");
}

TEST(InteropTest, MissingTrackingIdIsRejected)
{
    Csaf csaf = from_minimal_advisory(make_example_advisory());
    csaf.document.tracking.id.clear();

    auto back = to_minimal_advisory(csaf);
    ASSERT_FALSE(back);
    EXPECT_EQ(back.error().kind, InteropErrorKind::kMissingRequiredField);
    EXPECT_EQ(back.error().path, "/document/tracking/id");
}

TEST(InteropTest, TitleFallsBackToVulnerabilityTitle)
{
    Csaf csaf = from_minimal_advisory(make_example_advisory());
    csaf.document.title.clear();

    auto back = to_minimal_advisory(csaf);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(back->title, "Example");

    csaf.vulnerabilities->front().title.reset();
    back = to_minimal_advisory(csaf);
    ASSERT_FALSE(back);
    EXPECT_EQ(back.error().path, "/document/title");
}

// The reverse direction is a projection: these differences are expected.
TEST(InteropTest, ReverseIsNotAnInverse)
{
    MinimalAdvisory advisory = make_example_advisory();
    advisory.aliases = {"GHSA-jfh8-c2jp-5v3q", "CVE-2021-1234"};
    advisory.severity = CvssSeverity::kHigh;
    auto vector = cvss::parse_v3("CVSS:3.1/AV:N/AC:L/PR:N/UI:N/S:U/C:H/I:H/A:H");
    ASSERT_TRUE(vector);
    advisory.cvss = *vector;

    auto back = to_minimal_advisory(from_minimal_advisory(advisory));
    ASSERT_TRUE(back) << back.error().message;

    // The CVE alias moves to the front.
    EXPECT_EQ(back->aliases, (std::vector<std::string>{"CVE-2021-1234", "GHSA-jfh8-c2jp-5v3q"}));
    // Severity is re-derived from the score, not from the stated rating.
    EXPECT_EQ(back->severity, CvssSeverity::kCritical);
    EXPECT_NE(*back, advisory);

    // Identity fields survive regardless.
    EXPECT_EQ(back->id, advisory.id);
    EXPECT_EQ(back->title, advisory.title);
    EXPECT_EQ(back->date, advisory.date);
}

TEST(InteropTest, ForeignDocumentProjectsBestEffort)
{
    Csaf csaf = from_minimal_advisory(make_example_advisory());
    csaf.product_tree.reset();
    csaf.vulnerabilities->front().notes.reset();
    csaf.document.notes = std::vector<Note>{
        Note{.audience = std::nullopt,
             .category = NoteCategory::kSummary,
             .text = "Document-level summary.",
             .title = std::nullopt}
    };

    auto back = to_minimal_advisory(csaf);
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_FALSE(back->package);
    EXPECT_EQ(back->description, "Document-level summary.");
}

}  // namespace csafpp::interop::test
