#pragma once

/**
 * @file product_tree.hpp
 * @brief Product hierarchy, relationships and product groups
 */

#include "csafpp/definitions.hpp"
#include "csafpp/open_enum.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csafpp {

enum class RelationshipCategory : std::uint8_t {
    kDefaultComponentOf,
    kExternalComponentOf,
    kInstalledOn,
    kInstalledWith,
    kOptionalComponentOf,
};

template <>
struct EnumTraits<RelationshipCategory>
{
    static constexpr std::string_view kTypeName = "relationship category";
    static constexpr std::array kValues = {
        std::pair{ RelationshipCategory::kDefaultComponentOf,  std::string_view{"default_component_of"}},
        std::pair{RelationshipCategory::kExternalComponentOf, std::string_view{"external_component_of"}},
        std::pair{        RelationshipCategory::kInstalledOn,          std::string_view{"installed_on"}},
        std::pair{      RelationshipCategory::kInstalledWith,        std::string_view{"installed_with"}},
        std::pair{RelationshipCategory::kOptionalComponentOf, std::string_view{"optional_component_of"}},
    };
};

struct ProductGroup
{
    ProductGroupId group_id;
    std::vector<ProductId> product_ids;
    std::optional<std::string> summary;

    bool operator==(const ProductGroup&) const = default;
};

/**
 * @brief Combination of two products
 *
 * Both references are lookup keys into the tree, not ownership edges.
 */
struct Relationship
{
    OpenEnum<RelationshipCategory> category;
    FullProductName full_product_name;
    ProductId product_reference;
    ProductId relates_to_product_reference;

    bool operator==(const Relationship&) const = default;
};

struct ProductTree
{
    std::optional<std::vector<Branch>> branches;
    std::optional<std::vector<FullProductName>> full_product_names;
    std::optional<std::vector<ProductGroup>> product_groups;
    std::optional<std::vector<Relationship>> relationships;

    bool operator==(const ProductTree&) const = default;
};

}  // namespace csafpp
