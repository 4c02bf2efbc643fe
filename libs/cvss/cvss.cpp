/**
 * @file cvss.cpp
 * @brief CVSS v3.x base score (FIRST CVSS v3.1 specification, section 7)
 */

#include "csafpp/cvss.hpp"

#include <algorithm>
#include <cmath>
#include <array>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <utility>

namespace csafpp::cvss {

namespace {

[[nodiscard]] Error invalid(std::string_view text, std::string_view detail)
{
    return Error::make("InvalidCvss", std::format("Invalid CVSS v3 vector \"{}\": {}", text, detail));
}

/// Temporal and environmental metric keys; they do not affect the base score
constexpr std::array<std::string_view, 14> kNonBaseMetrics = {
    "E", "RL", "RC", "CR", "IR", "AR", "MAV", "MAC", "MPR", "MUI", "MS", "MC", "MI", "MA"};

/// Round up to one decimal, immune to floating point noise (CVSS v3.1 Appendix A)
[[nodiscard]] double round_up(double value)
{
    const auto scaled = static_cast<std::int64_t>(std::llround(value * 100'000.0));
    if (scaled % 10'000 == 0) {
        return static_cast<double>(scaled) / 100'000.0;
    }
    return static_cast<double>(scaled / 10'000 + 1) / 10.0;
}

[[nodiscard]] double weight(AttackVector value)
{
    switch (value) {
        case AttackVector::kNetwork:
            return 0.85;
        case AttackVector::kAdjacent:
            return 0.62;
        case AttackVector::kLocal:
            return 0.55;
        case AttackVector::kPhysical:
            return 0.2;
    }
    return 0.0;
}

[[nodiscard]] double weight(AttackComplexity value)
{
    return value == AttackComplexity::kLow ? 0.77 : 0.44;
}

[[nodiscard]] double weight(PrivilegesRequired value, Scope scope)
{
    switch (value) {
        case PrivilegesRequired::kNone:
            return 0.85;
        case PrivilegesRequired::kLow:
            return scope == Scope::kChanged ? 0.68 : 0.62;
        case PrivilegesRequired::kHigh:
            return scope == Scope::kChanged ? 0.5 : 0.27;
    }
    return 0.0;
}

[[nodiscard]] double weight(UserInteraction value)
{
    return value == UserInteraction::kNone ? 0.85 : 0.62;
}

[[nodiscard]] double weight(Impact value)
{
    switch (value) {
        case Impact::kHigh:
            return 0.56;
        case Impact::kLow:
            return 0.22;
        case Impact::kNone:
            return 0.0;
    }
    return 0.0;
}

[[nodiscard]] std::optional<Impact> parse_impact(std::string_view value)
{
    if (value == "H") {
        return Impact::kHigh;
    }
    if (value == "L") {
        return Impact::kLow;
    }
    if (value == "N") {
        return Impact::kNone;
    }
    return std::nullopt;
}

[[nodiscard]] const char* impact_name(Impact value)
{
    switch (value) {
        case Impact::kHigh:
            return "HIGH";
        case Impact::kLow:
            return "LOW";
        case Impact::kNone:
            return "NONE";
    }
    return "NONE";
}

struct BaseMetricsSeen
{
    bool av = false;
    bool ac = false;
    bool pr = false;
    bool ui = false;
    bool s = false;
    bool c = false;
    bool i = false;
    bool a = false;

    [[nodiscard]] bool complete() const noexcept { return av && ac && pr && ui && s && c && i && a; }
};

/// Apply one "KEY:VALUE" component; returns an error message on failure
[[nodiscard]] std::optional<std::string>
apply_metric(std::string_view key, std::string_view value, V3Vector& out, BaseMetricsSeen& seen)
{
    const auto mark = [](bool& flag) -> bool {
        if (flag) {
            return false;
        }
        flag = true;
        return true;
    };
    const auto bad_value = [&]() {
        return std::format("bad value \"{}\" for {}", value, key);
    };

    if (key == "AV") {
        if (!mark(seen.av)) {
            return "duplicate metric AV";
        }
        if (value == "N") {
            out.attack_vector = AttackVector::kNetwork;
        } else if (value == "A") {
            out.attack_vector = AttackVector::kAdjacent;
        } else if (value == "L") {
            out.attack_vector = AttackVector::kLocal;
        } else if (value == "P") {
            out.attack_vector = AttackVector::kPhysical;
        } else {
            return bad_value();
        }
    } else if (key == "AC") {
        if (!mark(seen.ac)) {
            return "duplicate metric AC";
        }
        if (value == "L") {
            out.attack_complexity = AttackComplexity::kLow;
        } else if (value == "H") {
            out.attack_complexity = AttackComplexity::kHigh;
        } else {
            return bad_value();
        }
    } else if (key == "PR") {
        if (!mark(seen.pr)) {
            return "duplicate metric PR";
        }
        if (value == "N") {
            out.privileges_required = PrivilegesRequired::kNone;
        } else if (value == "L") {
            out.privileges_required = PrivilegesRequired::kLow;
        } else if (value == "H") {
            out.privileges_required = PrivilegesRequired::kHigh;
        } else {
            return bad_value();
        }
    } else if (key == "UI") {
        if (!mark(seen.ui)) {
            return "duplicate metric UI";
        }
        if (value == "N") {
            out.user_interaction = UserInteraction::kNone;
        } else if (value == "R") {
            out.user_interaction = UserInteraction::kRequired;
        } else {
            return bad_value();
        }
    } else if (key == "S") {
        if (!mark(seen.s)) {
            return "duplicate metric S";
        }
        if (value == "U") {
            out.scope = Scope::kUnchanged;
        } else if (value == "C") {
            out.scope = Scope::kChanged;
        } else {
            return bad_value();
        }
    } else if (key == "C" || key == "I" || key == "A") {
        bool& flag = key == "C" ? seen.c : (key == "I" ? seen.i : seen.a);
        if (!mark(flag)) {
            return std::format("duplicate metric {}", key);
        }
        auto impact = parse_impact(value);
        if (!impact) {
            return bad_value();
        }
        Impact& target = key == "C" ? out.confidentiality
                                    : (key == "I" ? out.integrity : out.availability);
        target = *impact;
    } else if (std::ranges::find(kNonBaseMetrics, key) == kNonBaseMetrics.end()) {
        return std::format("unknown metric {}", key);
    }
    return std::nullopt;
}

}  // namespace

Result<V3Vector> parse_v3(std::string_view text)
{
    V3Vector vector;
    vector.text = std::string(text);

    std::string_view rest = text;
    if (rest.starts_with("CVSS:3.1/")) {
        vector.version = CvssV3Version::kV3_1;
    } else if (rest.starts_with("CVSS:3.0/")) {
        vector.version = CvssV3Version::kV3_0;
    } else {
        return std::unexpected(invalid(text, "missing CVSS:3.0/ or CVSS:3.1/ prefix"));
    }
    rest.remove_prefix(std::string_view("CVSS:3.x/").size());
    if (rest.ends_with('/')) {
        return std::unexpected(invalid(text, "trailing '/'"));
    }

    BaseMetricsSeen seen;
    while (!rest.empty()) {
        const auto slash = rest.find('/');
        std::string_view component = rest.substr(0, slash);
        rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);

        const auto colon = component.find(':');
        if (colon == std::string_view::npos || colon == 0 || colon + 1 == component.size()) {
            return std::unexpected(invalid(text, std::format("malformed component \"{}\"", component)));
        }
        if (auto error = apply_metric(component.substr(0, colon), component.substr(colon + 1), vector, seen)) {
            return std::unexpected(invalid(text, *error));
        }
    }
    if (!seen.complete()) {
        return std::unexpected(invalid(text, "missing base metric"));
    }
    return vector;
}

double base_score(const V3Vector& vector)
{
    const double iss = 1.0
                       - ((1.0 - weight(vector.confidentiality)) * (1.0 - weight(vector.integrity))
                          * (1.0 - weight(vector.availability)));
    const bool changed = vector.scope == Scope::kChanged;
    const double impact = changed ? 7.52 * (iss - 0.029) - 3.25 * std::pow(iss - 0.02, 15.0)
                                  : 6.42 * iss;
    const double exploitability = 8.22 * weight(vector.attack_vector)
                                  * weight(vector.attack_complexity)
                                  * weight(vector.privileges_required, vector.scope)
                                  * weight(vector.user_interaction);
    if (impact <= 0.0) {
        return 0.0;
    }
    if (changed) {
        return round_up(std::min(1.08 * (impact + exploitability), 10.0));
    }
    return round_up(std::min(impact + exploitability, 10.0));
}

CvssSeverity severity_for(double score)
{
    if (score <= 0.0) {
        return CvssSeverity::kNone;
    }
    if (score < 4.0) {
        return CvssSeverity::kLow;
    }
    if (score < 7.0) {
        return CvssSeverity::kMedium;
    }
    if (score < 9.0) {
        return CvssSeverity::kHigh;
    }
    return CvssSeverity::kCritical;
}

CvssV3 to_csaf(const V3Vector& vector)
{
    CvssV3 cvss;
    cvss.version = vector.version;
    cvss.vector_string = vector.text;
    switch (vector.attack_vector) {
        case AttackVector::kNetwork:
            cvss.attack_vector = "NETWORK";
            break;
        case AttackVector::kAdjacent:
            cvss.attack_vector = "ADJACENT_NETWORK";
            break;
        case AttackVector::kLocal:
            cvss.attack_vector = "LOCAL";
            break;
        case AttackVector::kPhysical:
            cvss.attack_vector = "PHYSICAL";
            break;
    }
    cvss.attack_complexity = vector.attack_complexity == AttackComplexity::kLow ? "LOW" : "HIGH";
    switch (vector.privileges_required) {
        case PrivilegesRequired::kNone:
            cvss.privileges_required = "NONE";
            break;
        case PrivilegesRequired::kLow:
            cvss.privileges_required = "LOW";
            break;
        case PrivilegesRequired::kHigh:
            cvss.privileges_required = "HIGH";
            break;
    }
    cvss.user_interaction = vector.user_interaction == UserInteraction::kNone ? "NONE" : "REQUIRED";
    cvss.scope = vector.scope == Scope::kUnchanged ? "UNCHANGED" : "CHANGED";
    cvss.confidentiality_impact = impact_name(vector.confidentiality);
    cvss.integrity_impact = impact_name(vector.integrity);
    cvss.availability_impact = impact_name(vector.availability);
    cvss.base_score = base_score(vector);
    cvss.base_severity = severity_for(cvss.base_score);
    return cvss;
}

}  // namespace csafpp::cvss
