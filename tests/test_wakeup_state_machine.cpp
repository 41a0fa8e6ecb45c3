#include "netrec/wakeup_state_machine.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace netrec;
using netrec::test::MockRadioController;
using netrec::test::makeSaved;
using netrec::test::makeScan;
using ::testing::_;
using ::testing::Return;

namespace {

const char* const kSsid1 = "ssid1";
const char* const kSsid2 = "ssid2";
const char* const kBssid1 = "00:00:00:00:00:01";
const char* const kBssid2 = "00:00:00:00:00:02";

class MockNetworkSelector : public NetworkSelector {
public:
    MOCK_METHOD(std::optional<SavedNetwork>, selectNetwork,
                ((const std::map<std::string, SavedNetwork>&), (const std::vector<ScanObservation>&)),
                (const, override));
};

class WakeupStateMachineTest : public ::testing::Test {
protected:
    WakeupStateMachineTest() : wakeup_(selector_, radio_) {
        wakeup_.onSettingsChanged(true, false);
        wakeup_.onWifiApStateChanged(ApState::Disabled);
        wakeup_.onConfiguredNetworksChanged({makeSaved(kSsid1), makeSaved(kSsid2)});
    }

    std::vector<ScanObservation> scanWith(const std::string& ssid, const std::string& bssid) {
        return {makeScan(ssid, bssid, -50)};
    }

    std::vector<ScanObservation> emptyScan() {
        return {makeScan("stranger", "00:00:00:00:00:99", -50)};
    }

    // Wi-Fi turned off while ssid1 is in range.
    void disableNearSsid1() {
        wakeup_.onWifiStateChanged(WifiState::Enabled);
        wakeup_.onScanResults(scanWith(kSsid1, kBssid1));
        wakeup_.onWifiStateChanged(WifiState::Disabled);
    }

    NetworkSelector selector_;
    ::testing::StrictMock<MockRadioController> radio_;
    WakeupStateMachine wakeup_;
};

} // namespace

TEST_F(WakeupStateMachineTest, DisableSnapshotsVisibleSavedNetworks) {
    disableNearSsid1();

    EXPECT_EQ(WakeupStateMachine::State::Disarmed, wakeup_.state());
    ASSERT_EQ(1u, wakeup_.remainingConfirmations().size());
    EXPECT_EQ(3, wakeup_.remainingConfirmations().at(kSsid1));
}

TEST_F(WakeupStateMachineTest, EnableClearsSnapshot) {
    disableNearSsid1();
    wakeup_.onWifiStateChanged(WifiState::Enabled);

    EXPECT_EQ(WakeupStateMachine::State::Armed, wakeup_.state());
    EXPECT_TRUE(wakeup_.remainingConfirmations().empty());
}

TEST_F(WakeupStateMachineTest, EnablesWifiOnlyAfterThirdConfirmingScan) {
    disableNearSsid1();

    wakeup_.onScanResults(emptyScan());
    wakeup_.onScanResults(emptyScan());
    wakeup_.onScanResults(emptyScan());
    ::testing::Mock::VerifyAndClearExpectations(&radio_);
    EXPECT_TRUE(wakeup_.remainingConfirmations().empty());

    EXPECT_CALL(radio_, setWifiEnabled(true)).Times(1);
    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    EXPECT_EQ(WakeupStateMachine::State::Armed, wakeup_.state());
}

TEST_F(WakeupStateMachineTest, EnablesWifiOncePerDisable) {
    wakeup_.onWifiStateChanged(WifiState::Disabled);

    EXPECT_CALL(radio_, setWifiEnabled(true)).Times(1);
    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    // Radio has not reported Enabled yet.
    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    wakeup_.onScanResults(scanWith(kSsid1, kBssid1));
    ::testing::Mock::VerifyAndClearExpectations(&radio_);
    EXPECT_EQ(WakeupStateMachine::State::Armed, wakeup_.state());

    wakeup_.onWifiStateChanged(WifiState::Enabled);
    wakeup_.onWifiStateChanged(WifiState::Disabled);
    EXPECT_CALL(radio_, setWifiEnabled(true)).Times(0);
    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
}

TEST_F(WakeupStateMachineTest, SelectedNetworkSeenDuringCountdownWaitsForThirdScan) {
    disableNearSsid1();

    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    ::testing::Mock::VerifyAndClearExpectations(&radio_);
    EXPECT_EQ(1, wakeup_.remainingConfirmations().at(kSsid1));

    EXPECT_CALL(radio_, setWifiEnabled(true)).Times(1);
    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
}

TEST_F(WakeupStateMachineTest, ReappearingNetworkResetsCountdown) {
    disableNearSsid1();

    for (int round = 0; round < 5; round++) {
        wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
        wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
        EXPECT_EQ(1, wakeup_.remainingConfirmations().at(kSsid1));
        wakeup_.onScanResults(scanWith(kSsid1, kBssid1));
        EXPECT_EQ(3, wakeup_.remainingConfirmations().at(kSsid1));
    }
    EXPECT_EQ(WakeupStateMachine::State::Disarmed, wakeup_.state());
}

TEST_F(WakeupStateMachineTest, NoSelectionStaysDisarmed) {
    disableNearSsid1();
    for (int i = 0; i < 5; i++) {
        wakeup_.onScanResults(emptyScan());
    }
    EXPECT_EQ(WakeupStateMachine::State::Disarmed, wakeup_.state());
}

TEST_F(WakeupStateMachineTest, SuppressedWhenFeatureDisabled) {
    disableNearSsid1();
    wakeup_.onSettingsChanged(false, false);
    for (int i = 0; i < 4; i++) {
        wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    }
    EXPECT_EQ(3, wakeup_.remainingConfirmations().at(kSsid1));
}

TEST_F(WakeupStateMachineTest, SuppressedInAirplaneMode) {
    disableNearSsid1();
    wakeup_.onSettingsChanged(true, true);
    for (int i = 0; i < 4; i++) {
        wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    }
}

TEST_F(WakeupStateMachineTest, SuppressedWhileHotspotEnabled) {
    disableNearSsid1();
    wakeup_.onWifiApStateChanged(ApState::Enabled);
    for (int i = 0; i < 4; i++) {
        wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    }

    wakeup_.onWifiApStateChanged(ApState::Disabled);
    EXPECT_CALL(radio_, setWifiEnabled(true)).Times(1);
    for (int i = 0; i < 3; i++) {
        wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    }
}

TEST_F(WakeupStateMachineTest, SuppressedWhileWifiEnabled) {
    wakeup_.onWifiStateChanged(WifiState::Enabled);
    for (int i = 0; i < 4; i++) {
        wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    }
    EXPECT_EQ(WakeupStateMachine::State::Armed, wakeup_.state());
}

TEST_F(WakeupStateMachineTest, IneligibleNetworksAreIgnored) {
    SavedNetwork external = makeSaved(kSsid1);
    external.use_external_scores = true;
    SavedNetwork disabled = makeSaved(kSsid2);
    disabled.enabled = false;
    SavedNetwork noInternet = makeSaved("ssid3");
    noInternet.no_internet_access = true;
    SavedNetwork noInternetExpected = makeSaved("ssid4");
    noInternetExpected.no_internet_access_expected = true;

    wakeup_.onConfiguredNetworksChanged({external, disabled, noInternet, noInternetExpected});
    EXPECT_TRUE(wakeup_.savedNetworks().empty());

    wakeup_.onWifiStateChanged(WifiState::Disabled);
    wakeup_.onScanResults(scanWith(kSsid1, kBssid1));
    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
}

TEST_F(WakeupStateMachineTest, ConfigurationChangePrunesSnapshot) {
    disableNearSsid1();
    EXPECT_EQ(1u, wakeup_.remainingConfirmations().size());

    EXPECT_CALL(radio_, setWifiEnabled(true)).Times(1);
    wakeup_.onConfiguredNetworksChanged({makeSaved(kSsid2)});
    EXPECT_TRUE(wakeup_.remainingConfirmations().empty());

    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
}

TEST_F(WakeupStateMachineTest, SnapshotUsesScansSeenWhileSuppressed) {
    // Scans arriving while Wi-Fi is enabled still define what is in range.
    wakeup_.onWifiStateChanged(WifiState::Enabled);
    wakeup_.onScanResults(scanWith(kSsid1, kBssid1));
    wakeup_.onScanResults(scanWith(kSsid2, kBssid2));
    wakeup_.onWifiStateChanged(WifiState::Disabled);

    ASSERT_EQ(1u, wakeup_.remainingConfirmations().size());
    EXPECT_EQ(1u, wakeup_.remainingConfirmations().count(kSsid2));
}

TEST_F(WakeupStateMachineTest, UsesSelectorVerdict) {
    MockNetworkSelector selector;
    ::testing::StrictMock<MockRadioController> radio;
    WakeupStateMachine wakeup(selector, radio);
    wakeup.onSettingsChanged(true, false);
    wakeup.onConfiguredNetworksChanged({makeSaved(kSsid1)});
    wakeup.onWifiStateChanged(WifiState::Disabled);

    EXPECT_CALL(selector, selectNetwork(_, _)).WillOnce(Return(std::nullopt));
    wakeup.onScanResults(scanWith(kSsid1, kBssid1));
    ::testing::Mock::VerifyAndClearExpectations(&selector);

    EXPECT_CALL(selector, selectNetwork(_, _)).WillOnce(Return(makeSaved(kSsid1)));
    EXPECT_CALL(radio, setWifiEnabled(true));
    wakeup.onScanResults(scanWith(kSsid1, kBssid1));
}

TEST_F(WakeupStateMachineTest, Dump) {
    disableNearSsid1();
    std::ostringstream out;
    wakeup_.dump(out);
    EXPECT_NE(std::string::npos, out.str().find("state=disarmed"));
    EXPECT_NE(std::string::npos, out.str().find("ssid1=3"));
}
