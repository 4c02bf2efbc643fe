#pragma once

/**
 * @file definitions.hpp
 * @brief Records and code sets shared by the document, product tree and
 *        vulnerability sections (CSAF 2.0 "$defs")
 */

#include "csafpp/open_enum.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csafpp {

/// Opaque product reference ("CSAFPID-0001"); never resolved by csafpp
using ProductId = std::string;
/// Opaque product group reference ("CSAFGID-0001")
using ProductGroupId = std::string;

// ============================================================================
// Code sets
// ============================================================================

enum class NoteCategory : std::uint8_t {
    kDescription,
    kDetails,
    kFaq,
    kGeneral,
    kLegalDisclaimer,
    kOther,
    kSummary,
};

template <>
struct EnumTraits<NoteCategory>
{
    static constexpr std::string_view kTypeName = "note category";
    static constexpr std::array kValues = {
        std::pair{    NoteCategory::kDescription,      std::string_view{"description"}},
        std::pair{        NoteCategory::kDetails,          std::string_view{"details"}},
        std::pair{            NoteCategory::kFaq,              std::string_view{"faq"}},
        std::pair{        NoteCategory::kGeneral,          std::string_view{"general"}},
        std::pair{NoteCategory::kLegalDisclaimer, std::string_view{"legal_disclaimer"}},
        std::pair{          NoteCategory::kOther,            std::string_view{"other"}},
        std::pair{        NoteCategory::kSummary,          std::string_view{"summary"}},
    };
};

enum class ReferenceCategory : std::uint8_t {
    kExternal,
    kSelf,
};

template <>
struct EnumTraits<ReferenceCategory>
{
    static constexpr std::string_view kTypeName = "reference category";
    static constexpr std::array kValues = {
        std::pair{ReferenceCategory::kExternal, std::string_view{"external"}},
        std::pair{    ReferenceCategory::kSelf,     std::string_view{"self"}},
    };
};

enum class BranchCategory : std::uint8_t {
    kArchitecture,
    kHostName,
    kLanguage,
    kLegacy,
    kPatchLevel,
    kProductFamily,
    kProductName,
    kProductVersion,
    kProductVersionRange,
    kServicePack,
    kSpecification,
    kVendor,
};

template <>
struct EnumTraits<BranchCategory>
{
    static constexpr std::string_view kTypeName = "branch category";
    static constexpr std::array kValues = {
        std::pair{       BranchCategory::kArchitecture,          std::string_view{"architecture"}},
        std::pair{           BranchCategory::kHostName,             std::string_view{"host_name"}},
        std::pair{           BranchCategory::kLanguage,              std::string_view{"language"}},
        std::pair{             BranchCategory::kLegacy,                std::string_view{"legacy"}},
        std::pair{         BranchCategory::kPatchLevel,           std::string_view{"patch_level"}},
        std::pair{      BranchCategory::kProductFamily,        std::string_view{"product_family"}},
        std::pair{        BranchCategory::kProductName,          std::string_view{"product_name"}},
        std::pair{     BranchCategory::kProductVersion,       std::string_view{"product_version"}},
        std::pair{BranchCategory::kProductVersionRange, std::string_view{"product_version_range"}},
        std::pair{        BranchCategory::kServicePack,          std::string_view{"service_pack"}},
        std::pair{      BranchCategory::kSpecification,         std::string_view{"specification"}},
        std::pair{             BranchCategory::kVendor,                std::string_view{"vendor"}},
    };
};

// ============================================================================
// Shared records
// ============================================================================

struct Acknowledgment
{
    std::optional<std::vector<std::string>> names;
    std::optional<std::string> organization;
    std::optional<std::string> summary;
    std::optional<std::vector<std::string>> urls;

    bool operator==(const Acknowledgment&) const = default;
};

struct Note
{
    std::optional<std::string> audience;
    OpenEnum<NoteCategory> category;
    std::string text;
    std::optional<std::string> title;

    bool operator==(const Note&) const = default;
};

struct Reference
{
    std::optional<OpenEnum<ReferenceCategory>> category;
    std::string summary;
    std::string url;

    bool operator==(const Reference&) const = default;
};

struct FileHash
{
    std::string algorithm;
    std::string value;

    bool operator==(const FileHash&) const = default;
};

struct Hashes
{
    std::vector<FileHash> file_hashes;
    std::string filename;

    bool operator==(const Hashes&) const = default;
};

struct GenericUri
{
    std::string namespace_uri;  ///< JSON key "namespace"
    std::string uri;

    bool operator==(const GenericUri&) const = default;
};

struct ProductIdentificationHelper
{
    std::optional<std::string> cpe;
    std::optional<std::vector<Hashes>> hashes;
    std::optional<std::vector<std::string>> model_numbers;
    std::optional<std::string> purl;
    std::optional<std::vector<std::string>> sbom_urls;
    std::optional<std::vector<std::string>> serial_numbers;
    std::optional<std::vector<std::string>> skus;
    std::optional<std::vector<GenericUri>> x_generic_uris;

    bool operator==(const ProductIdentificationHelper&) const = default;
};

struct FullProductName
{
    std::string name;
    ProductId product_id;
    std::optional<ProductIdentificationHelper> product_identification_helper;

    bool operator==(const FullProductName&) const = default;
};

/**
 * @brief Node of the product hierarchy
 *
 * Each branch owns its children, so the hierarchy is a strict tree of
 * arbitrary depth. An empty `branches` vector is serialized as an absent key
 * (CSAF forbids empty branch arrays), so "no children" has a single state.
 */
struct Branch
{
    std::vector<Branch> branches;
    OpenEnum<BranchCategory> category;
    std::string name;
    std::optional<FullProductName> product;

    bool operator==(const Branch&) const = default;
};

}  // namespace csafpp
