/**
 * @file test_round_trip.cpp
 * @brief parse/serialize round-trip stability
 */

#include "csafpp/csaf.hpp"

#include <fstream>
#include <iterator>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace csafpp;
using Json = nlohmann::json;

namespace {

std::string read_data_file(const std::string& name)
{
    std::ifstream in(std::string(CSAFPP_TEST_DATA_DIR) + "/" + name, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

class RoundTripTest : public ::testing::TestWithParam<std::string>
{};

}  // namespace

TEST_P(RoundTripTest, ParseSerializeParseIsIdentity)
{
    auto first = parse(read_data_file(GetParam()));
    ASSERT_TRUE(first) << first.error().message;

    const std::string text = serialize(*first);
    auto second = parse(text);
    ASSERT_TRUE(second) << second.error().message << "\n" << text;

    EXPECT_EQ(*second, *first);
}

TEST_P(RoundTripTest, SecondSerializationIsByteIdentical)
{
    auto first = parse(read_data_file(GetParam()));
    ASSERT_TRUE(first) << first.error().message;

    const std::string text = serialize(*first);
    auto second = parse(text);
    ASSERT_TRUE(second) << second.error().message;

    EXPECT_EQ(serialize(*second), text);
    EXPECT_EQ(serialize(*second, SerializeOptions{.indent = -1}),
              serialize(*first, SerializeOptions{.indent = -1}));
}

TEST_P(RoundTripTest, OutputNeverContainsNull)
{
    auto csaf = parse(read_data_file(GetParam()));
    ASSERT_TRUE(csaf) << csaf.error().message;

    const Json j = Json::parse(serialize(*csaf));
    bool found_null = false;
    const auto visit = [&found_null](const auto& self, const Json& node) -> void {
        if (node.is_null()) {
            found_null = true;
            return;
        }
        if (node.is_structured()) {
            for (const auto& child : node) {
                self(self, child);
            }
        }
    };
    visit(visit, j);
    EXPECT_FALSE(found_null);
}

INSTANTIATE_TEST_SUITE_P(DataFiles,
                         RoundTripTest,
                         ::testing::Values("generic_template.json",
                                           "vendor_advisory.json",
                                           "forward_compatible.json"));

TEST(RoundTrip, GenericTemplateEndToEnd)
{
    auto csaf = parse(read_data_file("generic_template.json"));
    ASSERT_TRUE(csaf) << csaf.error().message;
    EXPECT_FALSE(csaf->product_tree);
    EXPECT_FALSE(csaf->vulnerabilities);

    auto reparsed = parse(serialize(*csaf));
    ASSERT_TRUE(reparsed) << reparsed.error().message;
    EXPECT_EQ(*reparsed, *csaf);
    EXPECT_FALSE(reparsed->product_tree);
    EXPECT_FALSE(reparsed->vulnerabilities);
}

TEST(RoundTrip, UnknownEnumTextSurvivesExactly)
{
    const std::string input = read_data_file("forward_compatible.json");
    auto csaf = parse(input);
    ASSERT_TRUE(csaf) << csaf.error().message;

    const Json out = Json::parse(serialize(*csaf));
    EXPECT_EQ(out["document"]["category"], "csaf_deprecated_security_advisory");
    EXPECT_EQ(out["document"]["publisher"]["category"], "multiplier");
    EXPECT_EQ(out["vulnerabilities"][0]["remediations"][0]["category"], "fix_planned");
    // Unknown keys are not carried over.
    EXPECT_FALSE(out.contains("$schema"));
    EXPECT_FALSE(out["document"].contains("license_expression"));
    EXPECT_FALSE(out["vulnerabilities"][0].contains("metrics"));
}

TEST(RoundTrip, ScoresKeepFullPrecision)
{
    Json j = Json::parse(read_data_file("vendor_advisory.json"));
    auto& cvss = j["vulnerabilities"][0]["scores"][0]["cvss_v3"];
    cvss["baseScore"] = 9.8;
    cvss["temporalScore"] = 0.1 + 0.2;
    cvss["environmentalScore"] = 7;

    auto first = parse(j.dump());
    ASSERT_TRUE(first) << first.error().message;
    auto second = parse(serialize(*first));
    ASSERT_TRUE(second) << second.error().message;

    const auto& v3 = *second->vulnerabilities->front().scores->front().cvss_v3;
    EXPECT_EQ(v3.base_score, 9.8);
    EXPECT_EQ(v3.temporal_score, 0.1 + 0.2);
    EXPECT_EQ(v3.environmental_score, 7.0);
}

TEST(RoundTrip, OffsetTimestampsNormalizeOnce)
{
    auto csaf = parse(read_data_file("vendor_advisory.json"));
    ASSERT_TRUE(csaf) << csaf.error().message;

    const Json out = Json::parse(serialize(*csaf));
    EXPECT_EQ(out["document"]["tracking"]["current_release_date"], "2023-05-02T06:15:00Z");
}

TEST(RoundTrip, RevisionHistoryOrderIsPreserved)
{
    auto csaf = parse(read_data_file("vendor_advisory.json"));
    ASSERT_TRUE(csaf) << csaf.error().message;

    const Json out = Json::parse(serialize(*csaf));
    const auto& history = out["document"]["tracking"]["revision_history"];
    ASSERT_EQ(history.size(), 2U);
    EXPECT_EQ(history[0]["number"], "2");
    EXPECT_EQ(history[1]["number"], "1");
}
