#include "netrec/wifi_types.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace netrec;
using netrec::test::makeSaved;
using netrec::test::makeScan;

TEST(WifiTypesTest, SecurityFromCapabilities) {
    EXPECT_EQ(SecurityType::Open, securityFromCapabilities("[ESS]"));
    EXPECT_EQ(SecurityType::Open, securityFromCapabilities(""));
    EXPECT_EQ(SecurityType::Wep, securityFromCapabilities("[WEP][ESS]"));
    EXPECT_EQ(SecurityType::Psk, securityFromCapabilities("[WPA-PSK-TKIP][WPA2-PSK-CCMP][ESS]"));
    EXPECT_EQ(SecurityType::Psk, securityFromCapabilities("[WPA2-SAE][ESS]"));
    EXPECT_EQ(SecurityType::Eap, securityFromCapabilities("[WPA2-EAP-CCMP][ESS][HS20]"));
}

TEST(WifiTypesTest, Band) {
    EXPECT_EQ(Band::Ghz24, makeScan("a", "00:00:00:00:00:01", -50, 2412).band());
    EXPECT_EQ(Band::Ghz24, makeScan("a", "00:00:00:00:00:01", -50, 2484).band());
    EXPECT_EQ(Band::Ghz5, makeScan("a", "00:00:00:00:00:01", -50, 5180).band());
    EXPECT_EQ(Band::Ghz5, makeScan("a", "00:00:00:00:00:01", -50, 5825).band());
    EXPECT_EQ(Band::Unknown, makeScan("a", "00:00:00:00:00:01", -50, 60480).band());
}

TEST(WifiTypesTest, SignalLevel) {
    EXPECT_EQ(0, calculateSignalLevel(-110, 5));
    EXPECT_EQ(0, calculateSignalLevel(-100, 5));
    EXPECT_EQ(3, calculateSignalLevel(-60, 5));
    EXPECT_EQ(4, calculateSignalLevel(-55, 5));
    EXPECT_EQ(4, calculateSignalLevel(-20, 5));
    EXPECT_EQ(0, calculateSignalLevel(-50, 1));
}

TEST(WifiTypesTest, SignalPercent) {
    EXPECT_EQ(0, makeScan("a", "00:00:00:00:00:01", -100).getSignalPercent());
    EXPECT_EQ(50, makeScan("a", "00:00:00:00:00:01", -75).getSignalPercent());
    EXPECT_EQ(100, makeScan("a", "00:00:00:00:00:01", -40).getSignalPercent());
}

TEST(WifiTypesTest, SavedNetworkMatchesScan) {
    ScanObservation open = makeScan("a", "00:00:00:00:00:01", -50, 2412, "[ESS]");
    ScanObservation psk = makeScan("a", "00:00:00:00:00:01", -50, 2412, "[WPA2-PSK-CCMP][ESS]");
    ScanObservation eap = makeScan("a", "00:00:00:00:00:01", -50, 2412, "[WPA2-EAP-CCMP][ESS]");

    EXPECT_TRUE(makeSaved("a").matchesScan(open));
    EXPECT_FALSE(makeSaved("a").matchesScan(psk));
    EXPECT_TRUE(makeSaved("a", SecurityType::Psk).matchesScan(psk));
    EXPECT_FALSE(makeSaved("a", SecurityType::Psk).matchesScan(open));
    EXPECT_TRUE(makeSaved("a", SecurityType::Eap).matchesScan(eap));
    EXPECT_TRUE(makeSaved("a", SecurityType::Passpoint).matchesScan(eap));
    EXPECT_FALSE(makeSaved("a", SecurityType::Passpoint).matchesScan(psk));
}

TEST(WifiTypesTest, CoarseState) {
    EXPECT_EQ(CoarseNetworkState::Disconnected, coarseState(NetworkState::Scanning));
    EXPECT_EQ(CoarseNetworkState::Disconnected, coarseState(NetworkState::Failed));
    EXPECT_EQ(CoarseNetworkState::Connecting, coarseState(NetworkState::CaptivePortalCheck));
    EXPECT_EQ(CoarseNetworkState::Connected, coarseState(NetworkState::Connected));
    EXPECT_EQ(CoarseNetworkState::Unknown, coarseState(NetworkState::Unknown));
}

TEST(WifiTypesTest, ScanJsonEscapesSsid) {
    ScanObservation scan = makeScan("say \"hi\"", "00:00:00:00:00:01", -50, 2412, "[ESS]");
    std::string json = scan.toJson();
    EXPECT_NE(std::string::npos, json.find("\"ssid\":\"say \\\"hi\\\"\""));
    EXPECT_NE(std::string::npos, json.find("\"frequency\":2412"));
}
