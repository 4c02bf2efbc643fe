#pragma once

/**
 * @file cvss.hpp
 * @brief CVSS v3.x vector parsing and base score calculation
 */

#include "csafpp/common.hpp"
#include "csafpp/vulnerability.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace csafpp::cvss {

enum class AttackVector : std::uint8_t { kNetwork, kAdjacent, kLocal, kPhysical };
enum class AttackComplexity : std::uint8_t { kLow, kHigh };
enum class PrivilegesRequired : std::uint8_t { kNone, kLow, kHigh };
enum class UserInteraction : std::uint8_t { kNone, kRequired };
enum class Scope : std::uint8_t { kUnchanged, kChanged };
enum class Impact : std::uint8_t { kHigh, kLow, kNone };

/**
 * @brief Base metric group of a CVSS v3.0 / v3.1 vector
 */
struct V3Vector
{
    CvssV3Version version = CvssV3Version::kV3_1;
    AttackVector attack_vector = AttackVector::kNetwork;
    AttackComplexity attack_complexity = AttackComplexity::kLow;
    PrivilegesRequired privileges_required = PrivilegesRequired::kNone;
    UserInteraction user_interaction = UserInteraction::kNone;
    Scope scope = Scope::kUnchanged;
    Impact confidentiality = Impact::kNone;
    Impact integrity = Impact::kNone;
    Impact availability = Impact::kNone;
    std::string text;  ///< Vector string as given

    bool operator==(const V3Vector&) const = default;
};

/**
 * Parse "CVSS:3.1/AV:N/AC:L/PR:N/UI:N/S:U/C:H/I:H/A:H"
 *
 * All eight base metrics are required, each at most once. Temporal and
 * environmental metrics are accepted and ignored.
 * @return Vector or error "InvalidCvss"
 */
[[nodiscard]] Result<V3Vector> parse_v3(std::string_view text);

/**
 * CVSS 3.1 base score (0.0 - 10.0, one decimal, rounded up)
 */
[[nodiscard]] double base_score(const V3Vector& vector);

/**
 * Qualitative severity rating of a score
 */
[[nodiscard]] CvssSeverity severity_for(double score);

/**
 * Complete CSAF cvss_v3 object (metric names, base score, severity)
 */
[[nodiscard]] CvssV3 to_csaf(const V3Vector& vector);

}  // namespace csafpp::cvss
