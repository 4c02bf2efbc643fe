#pragma once

/**
 * @file document.hpp
 * @brief Document-level metadata: publisher, tracking, distribution
 */

#include "csafpp/definitions.hpp"
#include "csafpp/open_enum.hpp"
#include "csafpp/timestamp.hpp"
#include "csafpp/version.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csafpp {

// ============================================================================
// Code sets
// ============================================================================

enum class DocumentCategory : std::uint8_t {
    kGenericCsaf,
    kSecurityAdvisory,
    kVex,
    kInformationalAdvisory,
    kSecurityIncidentResponse,
};

template <>
struct EnumTraits<DocumentCategory>
{
    static constexpr std::string_view kTypeName = "document category";
    static constexpr std::array kValues = {
        std::pair{             DocumentCategory::kGenericCsaf,                    std::string_view{"generic_csaf"}},
        std::pair{        DocumentCategory::kSecurityAdvisory,          std::string_view{"csaf_security_advisory"}},
        std::pair{                     DocumentCategory::kVex,                        std::string_view{"csaf_vex"}},
        std::pair{   DocumentCategory::kInformationalAdvisory,     std::string_view{"csaf_informational_advisory"}},
        std::pair{DocumentCategory::kSecurityIncidentResponse, std::string_view{"csaf_security_incident_response"}},
    };
};

enum class CsafVersion : std::uint8_t {
    kV2_0,
};

template <>
struct EnumTraits<CsafVersion>
{
    static constexpr std::string_view kTypeName = "CSAF version";
    static constexpr std::array kValues = {
        std::pair{CsafVersion::kV2_0, std::string_view{kCsafVersion}},
    };
};

enum class PublisherCategory : std::uint8_t {
    kCoordinator,
    kDiscoverer,
    kOther,
    kTranslator,
    kUser,
    kVendor,
};

template <>
struct EnumTraits<PublisherCategory>
{
    static constexpr std::string_view kTypeName = "publisher category";
    static constexpr std::array kValues = {
        std::pair{PublisherCategory::kCoordinator, std::string_view{"coordinator"}},
        std::pair{ PublisherCategory::kDiscoverer,  std::string_view{"discoverer"}},
        std::pair{      PublisherCategory::kOther,       std::string_view{"other"}},
        std::pair{ PublisherCategory::kTranslator,  std::string_view{"translator"}},
        std::pair{       PublisherCategory::kUser,        std::string_view{"user"}},
        std::pair{     PublisherCategory::kVendor,      std::string_view{"vendor"}},
    };
};

/// CSAF defines draft/final/interim; kWithdrawn marks converted withdrawn advisories
enum class TrackingStatus : std::uint8_t {
    kDraft,
    kFinal,
    kInterim,
    kWithdrawn,
};

template <>
struct EnumTraits<TrackingStatus>
{
    static constexpr std::string_view kTypeName = "tracking status";
    static constexpr std::array kValues = {
        std::pair{    TrackingStatus::kDraft,     std::string_view{"draft"}},
        std::pair{    TrackingStatus::kFinal,     std::string_view{"final"}},
        std::pair{  TrackingStatus::kInterim,   std::string_view{"interim"}},
        std::pair{TrackingStatus::kWithdrawn, std::string_view{"withdrawn"}},
    };
};

enum class TlpLabel : std::uint8_t {
    kAmber,
    kGreen,
    kRed,
    kWhite,
};

template <>
struct EnumTraits<TlpLabel>
{
    static constexpr std::string_view kTypeName = "TLP label";
    static constexpr std::array kValues = {
        std::pair{TlpLabel::kAmber, std::string_view{"AMBER"}},
        std::pair{TlpLabel::kGreen, std::string_view{"GREEN"}},
        std::pair{  TlpLabel::kRed,   std::string_view{"RED"}},
        std::pair{TlpLabel::kWhite, std::string_view{"WHITE"}},
    };
};

// ============================================================================
// Records
// ============================================================================

struct AggregateSeverity
{
    std::optional<std::string> namespace_uri;  ///< JSON key "namespace"
    std::string text;

    bool operator==(const AggregateSeverity&) const = default;
};

struct Tlp
{
    OpenEnum<TlpLabel> label;
    std::optional<std::string> url;

    bool operator==(const Tlp&) const = default;
};

struct Distribution
{
    std::optional<std::string> text;
    std::optional<Tlp> tlp;

    bool operator==(const Distribution&) const = default;
};

struct Publisher
{
    OpenEnum<PublisherCategory> category;
    std::optional<std::string> contact_details;
    std::optional<std::string> issuing_authority;
    std::string name;
    std::string namespace_uri;  ///< JSON key "namespace"

    bool operator==(const Publisher&) const = default;
};

struct Engine
{
    std::string name;
    std::optional<std::string> version;

    bool operator==(const Engine&) const = default;
};

struct Generator
{
    std::optional<Timestamp> date;
    Engine engine;

    bool operator==(const Generator&) const = default;
};

struct Revision
{
    Timestamp date;
    std::optional<std::string> legacy_version;
    std::string number;
    std::string summary;

    bool operator==(const Revision&) const = default;
};

/**
 * @brief Tracking metadata
 *
 * `revision_history` is stored in the order given; csafpp never sorts it.
 */
struct Tracking
{
    std::optional<std::vector<std::string>> aliases;
    Timestamp current_release_date;
    std::optional<Generator> generator;
    std::string id;
    Timestamp initial_release_date;
    std::vector<Revision> revision_history;
    OpenEnum<TrackingStatus> status;
    std::string version;

    bool operator==(const Tracking&) const = default;
};

struct Document
{
    std::optional<std::vector<Acknowledgment>> acknowledgments;
    std::optional<AggregateSeverity> aggregate_severity;
    OpenEnum<DocumentCategory> category;
    OpenEnum<CsafVersion> csaf_version;
    std::optional<Distribution> distribution;
    std::optional<std::string> lang;
    std::optional<std::vector<Note>> notes;
    Publisher publisher;
    std::optional<std::vector<Reference>> references;
    std::optional<std::string> source_lang;
    std::string title;
    Tracking tracking;

    bool operator==(const Document&) const = default;
};

}  // namespace csafpp
