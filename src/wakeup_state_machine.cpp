#include "netrec/wakeup_state_machine.hpp"

#include <optional>

#include <spdlog/spdlog.h>

namespace netrec {

const char* wakeupStateName(WakeupStateMachine::State state) {
    return state == WakeupStateMachine::State::Armed ? "armed" : "disarmed";
}

WakeupStateMachine::WakeupStateMachine(const NetworkSelector& selector, RadioController& radio,
                                       const WakeupConfig& config)
    : selector_(selector), radio_(radio), config_(config) {}

void WakeupStateMachine::onSettingsChanged(bool wakeupEnabled, bool airplaneModeEnabled) {
    wakeupEnabled_ = wakeupEnabled;
    airplaneModeEnabled_ = airplaneModeEnabled;
    spdlog::debug("[WakeupStateMachine] wakeup={} airplane={}", wakeupEnabled_, airplaneModeEnabled_);
}

void WakeupStateMachine::onWifiApStateChanged(ApState state) {
    apState_ = state;
}

void WakeupStateMachine::onWifiStateChanged(WifiState state) {
    wifiState_ = state;
    switch (state) {
        case WifiState::Enabled:
            ssidsOnDisable_.clear();
            state_ = State::Armed;
            break;
        case WifiState::Disabled:
            for (const auto& ssid : savedSsidsInLastScan_) {
                ssidsOnDisable_[ssid] = config_.scans_to_confirm_ap_loss;
            }
            state_ = State::Disarmed;
            spdlog::debug("[WakeupStateMachine] Wi-Fi disabled near {} saved networks",
                          ssidsOnDisable_.size());
            break;
        default:
            break;
    }
}

bool WakeupStateMachine::isEligible(const SavedNetwork& network) {
    if (!network.enabled || network.use_external_scores) {
        return false;
    }
    if (network.no_internet_access || network.no_internet_access_expected) {
        return false;
    }
    return !network.printableSsid().empty();
}

void WakeupStateMachine::onConfiguredNetworksChanged(const std::vector<SavedNetwork>& networks) {
    savedNetworks_.clear();
    for (const auto& network : networks) {
        if (isEligible(network)) {
            savedNetworks_[network.printableSsid()] = network;
        }
    }

    for (auto it = savedSsidsInLastScan_.begin(); it != savedSsidsInLastScan_.end();) {
        if (savedNetworks_.count(*it) == 0) {
            it = savedSsidsInLastScan_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = ssidsOnDisable_.begin(); it != ssidsOnDisable_.end();) {
        if (savedNetworks_.count(it->first) == 0) {
            it = ssidsOnDisable_.erase(it);
        } else {
            ++it;
        }
    }
    spdlog::debug("[WakeupStateMachine] {} of {} configured networks eligible",
                  savedNetworks_.size(), networks.size());
}

bool WakeupStateMachine::isSuppressed() const {
    // Armed until the next Disabled event; Wi-Fi is enabled at most once per disable.
    return state_ == State::Armed
        || !wakeupEnabled_
        || airplaneModeEnabled_
        || wifiState_ != WifiState::Disabled
        || apState_ != ApState::Disabled;
}

void WakeupStateMachine::onScanResults(const std::vector<ScanObservation>& scans) {
    savedSsidsInLastScan_.clear();
    for (const auto& scan : scans) {
        if (savedNetworks_.count(scan.ssid) > 0) {
            savedSsidsInLastScan_.insert(scan.ssid);
        }
    }

    if (isSuppressed()) {
        return;
    }

    // Forget networks the user has moved away from.
    for (auto it = ssidsOnDisable_.begin(); it != ssidsOnDisable_.end();) {
        if (savedSsidsInLastScan_.count(it->first) > 0) {
            it->second = config_.scans_to_confirm_ap_loss;
            ++it;
        } else if (--it->second <= 0) {
            it = ssidsOnDisable_.erase(it);
        } else {
            ++it;
        }
    }

    if (!ssidsOnDisable_.empty()) {
        spdlog::debug("[WakeupStateMachine] Still near {} networks from the disabled set",
                      ssidsOnDisable_.size());
        return;
    }

    std::optional<SavedNetwork> selected = selector_.selectNetwork(savedNetworks_, scans);
    if (!selected) {
        return;
    }
    spdlog::info("[WakeupStateMachine] Enabling Wi-Fi for {}", selected->ssid);
    state_ = State::Armed;
    radio_.setWifiEnabled(true);
}

void WakeupStateMachine::dump(std::ostream& out) const {
    out << "WakeupStateMachine: state=" << wakeupStateName(state_)
        << " wakeup=" << wakeupEnabled_
        << " airplane=" << airplaneModeEnabled_
        << " wifi=" << wifiStateName(wifiState_)
        << " ap=" << apStateName(apState_) << "\n";
    out << "  saved:";
    for (const auto& entry : savedNetworks_) {
        out << " " << entry.first;
    }
    out << "\n  in last scan:";
    for (const auto& ssid : savedSsidsInLastScan_) {
        out << " " << ssid;
    }
    out << "\n  on disable:";
    for (const auto& entry : ssidsOnDisable_) {
        out << " " << entry.first << "=" << entry.second;
    }
    out << "\n";
}

} // namespace netrec
