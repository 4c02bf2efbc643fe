#include "csafpp/schema_validate.hpp"

#include "csafpp/csaf.hpp"
#include "csafpp/interop.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace csafpp::test {

namespace {

std::string schema_path(const std::string& name)
{
    return std::string(CSAFPP_SCHEMA_DIR) + "/" + name;
}

std::string core_schema()
{
    return schema_path("csaf_core.schema.json");
}

std::string read_data_file(const std::string& name)
{
    std::ifstream in(std::string(CSAFPP_TEST_DATA_DIR) + "/" + name, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

}  // namespace

TEST(SchemaValidateTest, DataFilesPass)
{
    for (const char* name : {"generic_template.json", "vendor_advisory.json", "forward_compatible.json"}) {
        SCOPED_TRACE(name);
        auto result = validate_document(read_data_file(name), core_schema());

        EXPECT_TRUE(result) << result.error().message;
    }
}

TEST(SchemaValidateTest, UnknownEnumTextPasses)
{
    auto j = nlohmann::json::parse(read_data_file("forward_compatible.json"));
    j["document"]["tracking"]["status"] = "superseded";
    j["document"]["references"] = nlohmann::json::array(
        {nlohmann::json{{"category", "related"}, {"summary", "Upstream"}, {"url", "https://example.com"}}});

    auto result = validate_json(j, core_schema());

    EXPECT_TRUE(result) << result.error().message;
}

TEST(SchemaValidateTest, ScoreWithoutProductsFails)
{
    auto j = nlohmann::json::parse(read_data_file("generic_template.json"));
    nlohmann::json score{
        {"cvss_v3",
         {{"version", "3.1"},
          {"vectorString", "CVSS:3.1/AV:N/AC:L/PR:N/UI:N/S:U/C:H/I:H/A:H"},
          {"baseScore", 9.8},
          {"baseSeverity", "CRITICAL"}}},
        {"products", nlohmann::json::array()}
    };
    nlohmann::json vulnerability{{"scores", nlohmann::json::array({score})}};
    j["vulnerabilities"] = nlohmann::json::array({vulnerability});

    auto result = validate_json(j, core_schema());

    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("/vulnerabilities/0/scores/0/products"), std::string::npos);
}

TEST(SchemaValidateTest, MissingTrackingFieldFails)
{
    auto j = nlohmann::json::parse(read_data_file("generic_template.json"));
    j["document"]["tracking"].erase("revision_history");

    auto result = validate_json(j, core_schema());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
    EXPECT_NE(result.error().message.find("/document/tracking"), std::string::npos);
}

TEST(SchemaValidateTest, EmptyRevisionHistoryFails)
{
    auto j = nlohmann::json::parse(read_data_file("generic_template.json"));
    j["document"]["tracking"]["revision_history"] = nlohmann::json::array();

    auto result = validate_json(j, core_schema());

    ASSERT_FALSE(result);
    EXPECT_FALSE(result.error().message.empty());
}

TEST(SchemaValidateTest, ProductTreeRulesComeFromReferencedSchema)
{
    auto j = nlohmann::json::parse(read_data_file("vendor_advisory.json"));
    j["product_tree"]["branches"][0].erase("name");

    auto result = validate_json(j, core_schema());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidateTest, SerializedOutputPasses)
{
    interop::MinimalAdvisory advisory;
    advisory.id = "RUSTSEC-2021-0001";
    advisory.title = "Example";
    advisory.date = std::chrono::year{2021} / std::chrono::January / 1;
    advisory.package = interop::AffectedPackage{.name = "example-crate",
                                                .affected = {},
                                                .patched = {">= 1.2.3"},
                                                .unaffected = {}};

    auto result = validate_document(serialize(interop::from_minimal_advisory(advisory)), core_schema());

    EXPECT_TRUE(result) << result.error().message;
}

TEST(SchemaValidateTest, UnparsableDocumentFails)
{
    auto result = validate_document("{\"document\":", core_schema());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "DocumentParseFailed");
}

TEST(SchemaValidateTest, MissingSchemaFileFails)
{
    auto result = validate_json(nlohmann::json::object(), schema_path("does_not_exist.schema.json"));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

TEST(SchemaValidateTest, UnresolvedReferenceFailsToBuild)
{
    const auto dir = std::filesystem::temp_directory_path() / "csafpp_schema_ref_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / "dangling.schema.json";
    {
        std::ofstream out(path);
        out << R"({"type":"object","properties":{"x":{"$ref":"csafpp:schema/absent"}}})";
    }

    auto result = validate_json(nlohmann::json::object(), path.string());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaBuildFailed");
    EXPECT_NE(result.error().message.find("unresolved reference: csafpp:schema/absent"), std::string::npos);
    std::filesystem::remove_all(dir);
}

}  // namespace csafpp::test
