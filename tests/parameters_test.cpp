#include <gtest/gtest.h>

#include "tests/keycap_test_common.hpp"

#include <vector>

using namespace keycap_test;

namespace {

const std::vector<KeyWidth> kAllWidths = {
    KeyWidth::U1, KeyWidth::U1_25, KeyWidth::U1_5, KeyWidth::U1_75, KeyWidth::U2,
    KeyWidth::U2_25, KeyWidth::U2_75, KeyWidth::U6, KeyWidth::U6_25, KeyWidth::U7
};

} // namespace

TEST(ParametersTest, Defaults) {
    KeycapParameters params;
    EXPECT_EQ(params.width, KeyWidth::U1);
    EXPECT_EQ(params.profileFamily, ProfileFamily::Cherry);
    EXPECT_EQ(params.profileRow, ProfileRow::R3);
    EXPECT_DOUBLE_EQ(params.bevelRadius, 1.5);
    EXPECT_EQ(params.stemType, StemType::CherryMX);
    EXPECT_DOUBLE_EQ(params.wallThickness, 0.91);

    EXPECT_TRUE(validateParameters(params, ProfileTable::defaults()).success);
}

TEST(ParametersTest, FootprintGrowsWithWidth) {
    KeycapParameters params;
    params.width = KeyWidth::U1;
    EXPECT_NEAR(params.footprintWidth(), 18.15, 1e-9);
    EXPECT_NEAR(params.footprintDepth(), 18.15, 1e-9);

    double previous = 0.0;
    for (KeyWidth width : kAllWidths) {
        params.width = width;
        SCOPED_TRACE(toString(width));
        EXPECT_GT(params.footprintWidth(), previous);
        EXPECT_NEAR(params.footprintWidth(), params.widthUnits() * 19.05 - 0.9, 1e-9);
        previous = params.footprintWidth();
    }

    params.width = KeyWidth::U6_25;
    EXPECT_DOUBLE_EQ(params.widthUnits(), 6.25);
}

TEST(ParametersTest, RejectsOutOfRangeValues) {
    const ProfileTable& table = ProfileTable::defaults();

    KeycapParameters params;
    params.bevelRadius = -0.1;
    auto negativeBevel = validateParameters(params, table);
    EXPECT_FALSE(negativeBevel.success);
    EXPECT_EQ(negativeBevel.errorCode, errors::kConfiguration);

    params.bevelRadius = 2.5;
    EXPECT_FALSE(validateParameters(params, table).success);

    params.bevelRadius = 2.0;
    EXPECT_TRUE(validateParameters(params, table).success);

    params.wallThickness = 0.0;
    EXPECT_FALSE(validateParameters(params, table).success);

    params.wallThickness = 6.5;
    EXPECT_FALSE(validateParameters(params, table).success);

    params.wallThickness = 6.0;
    EXPECT_TRUE(validateParameters(params, table).success);
}

TEST(ParametersTest, UndefinedProfileRowIsConfigurationError) {
    KeycapParameters params;
    params.profileFamily = ProfileFamily::SA;
    params.profileRow = ProfileRow::R4;

    auto result = validateParameters(params, ProfileTable::defaults());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errors::kConfiguration);
    EXPECT_NE(result.errorMessage.find("SA"), std::string::npos);
}

TEST(ParametersTest, ParseKeyWidth) {
    EXPECT_EQ(parseKeyWidth("1").value, KeyWidth::U1);
    EXPECT_EQ(parseKeyWidth("1.25").value, KeyWidth::U1_25);
    EXPECT_EQ(parseKeyWidth("2.25u").value, KeyWidth::U2_25);
    EXPECT_EQ(parseKeyWidth(" 6.25U ").value, KeyWidth::U6_25);
    EXPECT_EQ(parseKeyWidth("7U").value, KeyWidth::U7);

    auto bad = parseKeyWidth("3U");
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.errorCode, errors::kConfiguration);
    EXPECT_FALSE(parseKeyWidth("").success);
    EXPECT_FALSE(parseKeyWidth("wide").success);
}

TEST(ParametersTest, ParseProfileAndStem) {
    EXPECT_EQ(parseProfileFamily("cherry").value, ProfileFamily::Cherry);
    EXPECT_EQ(parseProfileFamily("OEM").value, ProfileFamily::OEM);
    EXPECT_EQ(parseProfileFamily("sa").value, ProfileFamily::SA);
    EXPECT_FALSE(parseProfileFamily("DSA").success);

    EXPECT_EQ(parseProfileRow("R1").value, ProfileRow::R1);
    EXPECT_EQ(parseProfileRow("r4").value, ProfileRow::R4);
    EXPECT_EQ(parseProfileRow("3").value, ProfileRow::R3);
    EXPECT_FALSE(parseProfileRow("R5").success);

    EXPECT_EQ(parseStemType("CHERRY_MX").value, StemType::CherryMX);
    EXPECT_EQ(parseStemType("cherry-mx").value, StemType::CherryMX);
    EXPECT_EQ(parseStemType("None").value, StemType::None);
    EXPECT_FALSE(parseStemType("alps").success);
}

TEST(ParametersTest, ToStringMatchesParsers) {
    for (KeyWidth width : kAllWidths) {
        auto parsed = parseKeyWidth(toString(width));
        ASSERT_TRUE(parsed.success) << toString(width);
        EXPECT_EQ(parsed.value, width);
    }

    EXPECT_EQ(toString(KeyWidth::U1_75), "1.75U");
    EXPECT_EQ(toString(ProfileFamily::OEM), "OEM");
    EXPECT_EQ(toString(ProfileRow::R2), "R2");
    EXPECT_EQ(toString(StemType::CherryMX), "CherryMX");
    EXPECT_EQ(parseStemType(toString(StemType::None)).value, StemType::None);
}
