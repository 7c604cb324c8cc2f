#include <gtest/gtest.h>
#include "paw-mon/airmon_parser.h"

using namespace paw;

TEST(AirmonParserTest, StartWithExplicitVifName) {
    auto parsed = parseAirmonStart("wlan0",
        "PHY\tInterface\tDriver\t\tChipset\n\n"
        "phy0\twlan0\t\tath9k_htc\tAtheros Communications, Inc. AR9271\n\n"
        "\t\t(mac80211 monitor mode vif enabled for [phy0]wlan0 on [phy0]wlan0mon)\n"
        "\t\t(mac80211 station mode vif disabled for [phy0]wlan0)\n", 0);

    EXPECT_EQ(parsed.verdict, AirmonVerdict::CONFIRMED);
    EXPECT_EQ(parsed.new_name, "wlan0mon");
    EXPECT_TRUE(parsed.explicit_name);
}

TEST(AirmonParserTest, StartWithoutNameUsesSuffix) {
    auto parsed = parseAirmonStart("wlan0", "monitor mode enabled\n", 0);

    EXPECT_EQ(parsed.verdict, AirmonVerdict::CONFIRMED);
    EXPECT_EQ(parsed.new_name, "wlan0mon");
    EXPECT_FALSE(parsed.explicit_name);
}

TEST(AirmonParserTest, StartOldStyleMonInterface) {
    auto parsed = parseAirmonStart("wlan0", "wlan0\t\tAtheros\tath5k - [phy0]\n"
                                            "\t\t\t\t(monitor mode enabled on mon0)\n", 0);

    EXPECT_EQ(parsed.verdict, AirmonVerdict::CONFIRMED);
    EXPECT_EQ(parsed.new_name, "mon0");
    EXPECT_TRUE(parsed.explicit_name);
}

TEST(AirmonParserTest, ChannelAfterOnIsNotAName) {
    auto parsed = parseAirmonStart("wlan0mon",
        "\t\t(mac80211 monitor mode already enabled for [phy0]wlan0mon on [phy0]10)\n", 0);

    EXPECT_EQ(parsed.verdict, AirmonVerdict::CONFIRMED);
    EXPECT_EQ(parsed.new_name, "wlan0mon");
    EXPECT_FALSE(parsed.explicit_name);
}

TEST(AirmonParserTest, StartErrorIsFailure) {
    auto parsed = parseAirmonStart("wlan9", "", 1);
    EXPECT_EQ(parsed.verdict, AirmonVerdict::FAILED);
    EXPECT_EQ(parsed.new_name, "wlan9");

    parsed = parseAirmonStart("wlan9", "Error: wlan9 does not exist\n", 0);
    EXPECT_EQ(parsed.verdict, AirmonVerdict::FAILED);
}

TEST(AirmonParserTest, UnrecognizedOutputIsUncertain) {
    auto parsed = parseAirmonStart("wlan0", "PHY\tInterface\tDriver\t\tChipset\n", 0);

    EXPECT_EQ(parsed.verdict, AirmonVerdict::UNCERTAIN);
    EXPECT_EQ(parsed.new_name, "wlan0");
}

TEST(AirmonParserTest, StopWithStationVif) {
    auto parsed = parseAirmonStop("wlan0mon",
        "PHY\tInterface\tDriver\t\tChipset\n\n"
        "phy0\twlan0mon\tath9k_htc\tAtheros Communications, Inc. AR9271\n\n"
        "\t\t(mac80211 station mode vif enabled on [phy0]wlan0)\n\n"
        "\t\t(mac80211 monitor mode vif disabled for [phy0]wlan0mon)\n", 0);

    EXPECT_EQ(parsed.verdict, AirmonVerdict::CONFIRMED);
    EXPECT_EQ(parsed.new_name, "wlan0");
    EXPECT_TRUE(parsed.explicit_name);
}

TEST(AirmonParserTest, StopDisabledOnlyStripsSuffix) {
    auto parsed = parseAirmonStop("wlan1mon", "(mac80211 monitor mode vif disabled for [phy1]wlan1mon)\n", 0);

    EXPECT_EQ(parsed.verdict, AirmonVerdict::CONFIRMED);
    EXPECT_EQ(parsed.new_name, "wlan1");
    EXPECT_FALSE(parsed.explicit_name);
}

TEST(AirmonParserTest, StopFailure) {
    auto parsed = parseAirmonStop("wlan1mon", "You must run this script as root.\n", 0);
    EXPECT_EQ(parsed.verdict, AirmonVerdict::FAILED);
    EXPECT_EQ(parsed.new_name, "wlan1mon");
}

TEST(AirmonParserTest, SuffixConvention) {
    EXPECT_EQ(monitorNameFor("wlan0"), "wlan0mon");
    EXPECT_EQ(monitorNameFor("wlan0mon"), "wlan0mon");
    EXPECT_EQ(managedNameFor("wlan0mon"), "wlan0");
    EXPECT_EQ(managedNameFor("wlan0"), "wlan0");
    EXPECT_EQ(managedNameFor("mon"), "mon");
}
