#pragma once

/**
 * @file vulnerability.hpp
 * @brief Vulnerability section: status, scores, remediations, threats
 */

#include "csafpp/definitions.hpp"
#include "csafpp/open_enum.hpp"
#include "csafpp/timestamp.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csafpp {

// ============================================================================
// Code sets
// ============================================================================

enum class CvssSeverity : std::uint8_t {
    kNone,
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

template <>
struct EnumTraits<CvssSeverity>
{
    static constexpr std::string_view kTypeName = "CVSS severity";
    static constexpr std::array kValues = {
        std::pair{    CvssSeverity::kNone,     std::string_view{"NONE"}},
        std::pair{     CvssSeverity::kLow,      std::string_view{"LOW"}},
        std::pair{  CvssSeverity::kMedium,   std::string_view{"MEDIUM"}},
        std::pair{    CvssSeverity::kHigh,     std::string_view{"HIGH"}},
        std::pair{CvssSeverity::kCritical, std::string_view{"CRITICAL"}},
    };
};

enum class CvssV2Version : std::uint8_t {
    kV2_0,
};

template <>
struct EnumTraits<CvssV2Version>
{
    static constexpr std::string_view kTypeName = "CVSS v2 version";
    static constexpr std::array kValues = {
        std::pair{CvssV2Version::kV2_0, std::string_view{"2.0"}},
    };
};

enum class CvssV3Version : std::uint8_t {
    kV3_0,
    kV3_1,
};

template <>
struct EnumTraits<CvssV3Version>
{
    static constexpr std::string_view kTypeName = "CVSS v3 version";
    static constexpr std::array kValues = {
        std::pair{CvssV3Version::kV3_0, std::string_view{"3.0"}},
        std::pair{CvssV3Version::kV3_1, std::string_view{"3.1"}},
    };
};

enum class FlagLabel : std::uint8_t {
    kComponentNotPresent,
    kInlineMitigationsAlreadyExist,
    kVulnerableCodeCannotBeControlledByAdversary,
    kVulnerableCodeNotInExecutePath,
    kVulnerableCodeNotPresent,
};

template <>
struct EnumTraits<FlagLabel>
{
    static constexpr std::string_view kTypeName = "flag label";
    static constexpr std::array kValues = {
        std::pair{FlagLabel::kComponentNotPresent, std::string_view{"component_not_present"}},
        std::pair{FlagLabel::kInlineMitigationsAlreadyExist,
                  std::string_view{"inline_mitigations_already_exist"}},
        std::pair{FlagLabel::kVulnerableCodeCannotBeControlledByAdversary,
                  std::string_view{"vulnerable_code_cannot_be_controlled_by_adversary"}},
        std::pair{FlagLabel::kVulnerableCodeNotInExecutePath,
                  std::string_view{"vulnerable_code_not_in_execute_path"}},
        std::pair{FlagLabel::kVulnerableCodeNotPresent, std::string_view{"vulnerable_code_not_present"}},
    };
};

enum class InvolvementParty : std::uint8_t {
    kCoordinator,
    kDiscoverer,
    kOther,
    kUser,
    kVendor,
};

template <>
struct EnumTraits<InvolvementParty>
{
    static constexpr std::string_view kTypeName = "involvement party";
    static constexpr std::array kValues = {
        std::pair{InvolvementParty::kCoordinator, std::string_view{"coordinator"}},
        std::pair{ InvolvementParty::kDiscoverer,  std::string_view{"discoverer"}},
        std::pair{      InvolvementParty::kOther,       std::string_view{"other"}},
        std::pair{       InvolvementParty::kUser,        std::string_view{"user"}},
        std::pair{     InvolvementParty::kVendor,      std::string_view{"vendor"}},
    };
};

enum class InvolvementStatus : std::uint8_t {
    kCompleted,
    kContactAttempted,
    kDisputed,
    kInProgress,
    kNotContacted,
    kOpen,
};

template <>
struct EnumTraits<InvolvementStatus>
{
    static constexpr std::string_view kTypeName = "involvement status";
    static constexpr std::array kValues = {
        std::pair{       InvolvementStatus::kCompleted,         std::string_view{"completed"}},
        std::pair{InvolvementStatus::kContactAttempted, std::string_view{"contact_attempted"}},
        std::pair{        InvolvementStatus::kDisputed,          std::string_view{"disputed"}},
        std::pair{      InvolvementStatus::kInProgress,       std::string_view{"in_progress"}},
        std::pair{    InvolvementStatus::kNotContacted,     std::string_view{"not_contacted"}},
        std::pair{            InvolvementStatus::kOpen,              std::string_view{"open"}},
    };
};

enum class RemediationCategory : std::uint8_t {
    kMitigation,
    kNoFixPlanned,
    kNoneAvailable,
    kVendorFix,
    kWorkaround,
};

template <>
struct EnumTraits<RemediationCategory>
{
    static constexpr std::string_view kTypeName = "remediation category";
    static constexpr std::array kValues = {
        std::pair{   RemediationCategory::kMitigation,     std::string_view{"mitigation"}},
        std::pair{ RemediationCategory::kNoFixPlanned,  std::string_view{"no_fix_planned"}},
        std::pair{RemediationCategory::kNoneAvailable, std::string_view{"none_available"}},
        std::pair{    RemediationCategory::kVendorFix,      std::string_view{"vendor_fix"}},
        std::pair{   RemediationCategory::kWorkaround,     std::string_view{"workaround"}},
    };
};

enum class RestartCategory : std::uint8_t {
    kConnected,
    kDependencies,
    kMachine,
    kNone,
    kParent,
    kService,
    kSystem,
    kVulnerableComponent,
    kZone,
};

template <>
struct EnumTraits<RestartCategory>
{
    static constexpr std::string_view kTypeName = "restart category";
    static constexpr std::array kValues = {
        std::pair{          RestartCategory::kConnected,            std::string_view{"connected"}},
        std::pair{       RestartCategory::kDependencies,         std::string_view{"dependencies"}},
        std::pair{            RestartCategory::kMachine,              std::string_view{"machine"}},
        std::pair{               RestartCategory::kNone,                 std::string_view{"none"}},
        std::pair{             RestartCategory::kParent,               std::string_view{"parent"}},
        std::pair{            RestartCategory::kService,              std::string_view{"service"}},
        std::pair{             RestartCategory::kSystem,               std::string_view{"system"}},
        std::pair{RestartCategory::kVulnerableComponent, std::string_view{"vulnerable_component"}},
        std::pair{               RestartCategory::kZone,                 std::string_view{"zone"}},
    };
};

enum class ThreatCategory : std::uint8_t {
    kExploitStatus,
    kImpact,
    kTargetSet,
};

template <>
struct EnumTraits<ThreatCategory>
{
    static constexpr std::string_view kTypeName = "threat category";
    static constexpr std::array kValues = {
        std::pair{ThreatCategory::kExploitStatus, std::string_view{"exploit_status"}},
        std::pair{       ThreatCategory::kImpact,         std::string_view{"impact"}},
        std::pair{    ThreatCategory::kTargetSet,     std::string_view{"target_set"}},
    };
};

// ============================================================================
// Records
// ============================================================================

struct Cwe
{
    std::string id;
    std::string name;

    bool operator==(const Cwe&) const = default;
};

struct Flag
{
    std::optional<Timestamp> date;
    std::optional<std::vector<ProductGroupId>> group_ids;
    OpenEnum<FlagLabel> label;
    std::optional<std::vector<ProductId>> product_ids;

    bool operator==(const Flag&) const = default;
};

struct VulnerabilityId
{
    std::string system_name;
    std::string text;

    bool operator==(const VulnerabilityId&) const = default;
};

struct Involvement
{
    std::optional<Timestamp> date;
    OpenEnum<InvolvementParty> party;
    OpenEnum<InvolvementStatus> status;
    std::optional<std::string> summary;

    bool operator==(const Involvement&) const = default;
};

/// Set semantics: duplicates collapse and order is irrelevant
using ProductIdSet = std::set<ProductId>;

struct ProductStatus
{
    std::optional<ProductIdSet> first_affected;
    std::optional<ProductIdSet> first_fixed;
    std::optional<ProductIdSet> fixed;
    std::optional<ProductIdSet> known_affected;
    std::optional<ProductIdSet> known_not_affected;
    std::optional<ProductIdSet> last_affected;
    std::optional<ProductIdSet> recommended;
    std::optional<ProductIdSet> under_investigation;

    bool operator==(const ProductStatus&) const = default;
};

struct RestartRequired
{
    OpenEnum<RestartCategory> category;
    std::optional<std::string> details;

    bool operator==(const RestartRequired&) const = default;
};

struct Remediation
{
    OpenEnum<RemediationCategory> category;
    std::optional<Timestamp> date;
    std::string details;
    std::optional<std::vector<std::string>> entitlements;
    std::optional<std::vector<ProductGroupId>> group_ids;
    std::optional<std::vector<ProductId>> product_ids;
    std::optional<RestartRequired> restart_required;
    std::optional<std::string> url;

    bool operator==(const Remediation&) const = default;
};

/**
 * @brief CVSS v2 score object; JSON keys are camelCase
 */
struct CvssV2
{
    OpenEnum<CvssV2Version> version;
    std::string vector_string;
    double base_score = 0.0;
    std::optional<std::string> access_vector;
    std::optional<std::string> access_complexity;
    std::optional<std::string> authentication;
    std::optional<std::string> confidentiality_impact;
    std::optional<std::string> integrity_impact;
    std::optional<std::string> availability_impact;
    std::optional<double> temporal_score;
    std::optional<double> environmental_score;

    bool operator==(const CvssV2&) const = default;
};

/**
 * @brief CVSS v3.x score object; JSON keys are camelCase
 */
struct CvssV3
{
    OpenEnum<CvssV3Version> version;
    std::string vector_string;
    std::optional<std::string> attack_vector;
    std::optional<std::string> attack_complexity;
    std::optional<std::string> privileges_required;
    std::optional<std::string> user_interaction;
    std::optional<std::string> scope;
    std::optional<std::string> confidentiality_impact;
    std::optional<std::string> integrity_impact;
    std::optional<std::string> availability_impact;
    double base_score = 0.0;
    OpenEnum<CvssSeverity> base_severity;
    std::optional<double> temporal_score;
    std::optional<OpenEnum<CvssSeverity>> temporal_severity;
    std::optional<double> environmental_score;
    std::optional<OpenEnum<CvssSeverity>> environmental_severity;

    bool operator==(const CvssV3&) const = default;
};

struct Score
{
    std::optional<CvssV2> cvss_v2;
    std::optional<CvssV3> cvss_v3;
    std::vector<ProductId> products;

    bool operator==(const Score&) const = default;
};

struct Threat
{
    OpenEnum<ThreatCategory> category;
    std::optional<Timestamp> date;
    std::string details;
    std::optional<std::vector<ProductGroupId>> group_ids;
    std::optional<std::vector<ProductId>> product_ids;

    bool operator==(const Threat&) const = default;
};

struct Vulnerability
{
    std::optional<std::vector<Acknowledgment>> acknowledgments;
    std::optional<std::string> cve;
    std::optional<Cwe> cwe;
    std::optional<Timestamp> discovery_date;
    std::optional<std::vector<Flag>> flags;
    std::optional<std::vector<VulnerabilityId>> ids;
    std::optional<std::vector<Involvement>> involvements;
    std::optional<std::vector<Note>> notes;
    std::optional<ProductStatus> product_status;
    std::optional<std::vector<Reference>> references;
    std::optional<Timestamp> release_date;
    std::optional<std::vector<Remediation>> remediations;
    std::optional<std::vector<Score>> scores;
    std::optional<std::vector<Threat>> threats;
    std::optional<std::string> title;

    bool operator==(const Vulnerability&) const = default;
};

}  // namespace csafpp
