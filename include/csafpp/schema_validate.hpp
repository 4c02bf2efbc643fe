#pragma once

/**
 * @file schema_validate.hpp
 * @brief Structural JSON Schema validation of raw advisory documents
 *
 * Hosts run this before parse() when they want schema-level diagnostics
 * (valijson messages with JSON-pointer context) instead of the first
 * ParseError. Content rules of the CSAF profiles are not checked here.
 */

#include "csafpp/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace csafpp {

/**
 * Validate JSON against a JSON Schema file.
 *
 * `$defs` are accepted as `definitions`; references of the form
 * "csafpp:schema/<name>" resolve to "<name>.schema.json" next to the schema.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path);

/**
 * Parse JSON text and validate it against a JSON Schema file
 * @return Empty on success; "DocumentParseFailed" or a validate_json() error
 */
[[nodiscard]] VoidResult validate_document(std::string_view bytes, const std::string& schema_path);

}  // namespace csafpp
