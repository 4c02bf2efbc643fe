/**
 * @file schema_validate.cpp
 * @brief Structural validation of advisory JSON with valijson
 */

#include "csafpp/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <memory>
#include <utility>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace csafpp {

namespace {

namespace fs = std::filesystem;
using Json = nlohmann::json;

constexpr std::string_view kRefPrefix = "csafpp:schema/";
constexpr std::string_view kSchemaSuffix = ".schema.json";

/// Rewrite 2020-12 "$defs" into the draft-07 "definitions" valijson resolves
void rewrite_defs(Json& node)
{
    if (node.is_array()) {
        for (auto& element : node) {
            rewrite_defs(element);
        }
        return;
    }
    if (!node.is_object()) {
        return;
    }
    if (auto defs = node.find("$defs"); defs != node.end() && !node.contains("definitions")) {
        Json copy = *defs;
        node["definitions"] = std::move(copy);
    }
    for (auto& [key, value] : node.items()) {
        if (key != "$ref") {
            rewrite_defs(value);
            continue;
        }
        if (!value.is_string()) {
            continue;
        }
        const auto& ref = value.get_ref<const std::string&>();
        constexpr std::string_view kDefsPointer = "#/$defs/";
        if (ref.starts_with(kDefsPointer)) {
            value = "#/definitions/" + ref.substr(kDefsPointer.size());
        }
    }
}

[[nodiscard]] Result<Json> read_schema_file(const fs::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", std::format("Failed to open schema file: {}", path.string())));
    }
    Json schema;
    try {
        in >> schema;
    } catch (const Json::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed", std::format("Failed to parse schema JSON {}: {}", path.string(), ex.what())));
    }
    rewrite_defs(schema);
    return schema;
}

/**
 * @brief Schemas referenced as "csafpp:schema/<name>", loaded on demand from
 *        the directory of the root schema and owned until validation ends
 */
class SchemaDirectory
{
public:
    explicit SchemaDirectory(fs::path dir)
        : m_dir(std::move(dir))
    {}

    [[nodiscard]] const Json* fetch(const std::string& uri)
    {
        if (!uri.starts_with(kRefPrefix)) {
            m_unresolved.push_back(uri);
            return nullptr;
        }
        const std::string name = uri.substr(kRefPrefix.size());
        if (auto it = m_loaded.find(name); it != m_loaded.end()) {
            return it->second.get();
        }
        auto schema = read_schema_file(m_dir / (name + std::string(kSchemaSuffix)));
        if (!schema) {
            m_unresolved.push_back(uri);
            return nullptr;
        }
        auto owned = std::make_unique<Json>(std::move(*schema));
        const Json* raw = owned.get();
        m_loaded.emplace(name, std::move(owned));
        return raw;
    }

    [[nodiscard]] const std::vector<std::string>& unresolved() const noexcept { return m_unresolved; }

private:
    fs::path m_dir;
    std::map<std::string, std::unique_ptr<Json>> m_loaded;
    std::vector<std::string> m_unresolved;
};

[[nodiscard]] std::string describe_failures(valijson::ValidationResults& results)
{
    std::string report;
    valijson::ValidationResults::Error failure;
    while (results.popError(failure)) {
        std::string pointer;
        for (std::string_view segment : failure.context) {
            if (segment == "<root>") {
                continue;
            }
            // valijson labels members and indices as "[name]" / "[0]"
            if (segment.size() >= 2 && segment.front() == '[' && segment.back() == ']') {
                segment = segment.substr(1, segment.size() - 2);
            }
            pointer += std::format("/{}", segment);
        }
        if (!report.empty()) {
            report += '\n';
        }
        report += std::format("{}: {}", pointer.empty() ? std::string("/") : pointer, failure.description);
    }
    return report.empty() ? std::string("Schema validation failed.") : report;
}

}  // namespace

VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto root = read_schema_file(schema_path);
    if (!root) {
        return std::unexpected(std::move(root.error()));
    }

    SchemaDirectory directory(fs::path(schema_path).parent_path());
    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*root);
        parser.populateSchema(
            schema_adapter,
            schema,
            [&directory](const std::string& uri) { return directory.fetch(uri); },
            [](const Json* /*owned by directory*/) {});
    } catch (const std::exception& ex) {
        std::string message = std::format("Failed to build schema: {}", ex.what());
        for (const auto& uri : directory.unresolved()) {
            message += std::format("\nunresolved reference: {}", uri);
        }
        return std::unexpected(Error::make("SchemaBuildFailed", std::move(message)));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(schema, target, &results)) {
        return std::unexpected(Error::make("SchemaValidationFailed", describe_failures(results)));
    }
    return {};
}

VoidResult validate_document(std::string_view bytes, const std::string& schema_path)
{
    Json document;
    try {
        document = Json::parse(bytes.begin(), bytes.end());
    } catch (const Json::parse_error& ex) {
        return std::unexpected(
            Error::make("DocumentParseFailed", std::format("Failed to parse document JSON: {}", ex.what())));
    }
    return validate_json(document, schema_path);
}

}  // namespace csafpp
