#ifndef NETREC_WAKEUP_STATE_MACHINE_HPP
#define NETREC_WAKEUP_STATE_MACHINE_HPP

#include "netrec/collaborators.hpp"
#include "netrec/network_selector.hpp"
#include "netrec/wifi_types.hpp"

#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace netrec {

struct WakeupConfig {
    // Scans a network must be missing from before the user is considered
    // to have left it.
    int scans_to_confirm_ap_loss = 3;
};

// Re-enables Wi-Fi once the user has moved away from every saved network
// that was in range when they turned Wi-Fi off, and a saved network worth
// joining is in range.
//
// All handlers must be called from the same event worker.
class WakeupStateMachine {
public:
    enum class State {
        Armed,
        Disarmed
    };

    WakeupStateMachine(const NetworkSelector& selector, RadioController& radio,
                       const WakeupConfig& config = WakeupConfig());

    void onSettingsChanged(bool wakeupEnabled, bool airplaneModeEnabled);
    void onWifiStateChanged(WifiState state);
    void onWifiApStateChanged(ApState state);
    void onConfiguredNetworksChanged(const std::vector<SavedNetwork>& networks);
    void onScanResults(const std::vector<ScanObservation>& scans);

    State state() const { return state_; }
    const std::map<std::string, int>& remainingConfirmations() const { return ssidsOnDisable_; }
    const std::map<std::string, SavedNetwork>& savedNetworks() const { return savedNetworks_; }

    void dump(std::ostream& out) const;

private:
    static bool isEligible(const SavedNetwork& network);
    bool isSuppressed() const;

    const NetworkSelector& selector_;
    RadioController& radio_;
    WakeupConfig config_;

    State state_ = State::Armed;
    bool wakeupEnabled_ = false;
    bool airplaneModeEnabled_ = false;
    WifiState wifiState_ = WifiState::Unknown;
    ApState apState_ = ApState::Disabled;

    // Keyed by unquoted SSID.
    std::map<std::string, SavedNetwork> savedNetworks_;
    std::set<std::string> savedSsidsInLastScan_;
    std::map<std::string, int> ssidsOnDisable_;
};

const char* wakeupStateName(WakeupStateMachine::State state);

} // namespace netrec

#endif
