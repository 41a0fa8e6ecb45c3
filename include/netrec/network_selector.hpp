#ifndef NETREC_NETWORK_SELECTOR_HPP
#define NETREC_NETWORK_SELECTOR_HPP

#include "netrec/wifi_types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netrec {

struct SelectorConfig {
    int threshold_qualified_rssi_24 = -80;
    int threshold_qualified_rssi_5 = -77;
    int threshold_saturated_rssi_24 = -60;
    int rssi_score_slope = 4;
    int rssi_score_offset = 85;
    int passpoint_security_award = 40;
    int security_award = 80;
    int band_5ghz_award = 40;
};

// Picks the saved network the platform would most likely join if Wi-Fi
// were enabled.
class NetworkSelector {
public:
    explicit NetworkSelector(const SelectorConfig& config = SelectorConfig());
    virtual ~NetworkSelector() = default;

    // savedNetworks is keyed by unquoted SSID. When two candidates score the
    // same, the one seen first in `scans` wins.
    virtual std::optional<SavedNetwork> selectNetwork(
        const std::map<std::string, SavedNetwork>& savedNetworks,
        const std::vector<ScanObservation>& scans) const;

    int calculateScore(const ScanObservation& scan, const SavedNetwork& network) const;

    const SelectorConfig& config() const { return config_; }

private:
    bool isQualified(const ScanObservation& scan) const;

    SelectorConfig config_;
};

} // namespace netrec

#endif
