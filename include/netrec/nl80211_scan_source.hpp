#ifndef NETREC_NL80211_SCAN_SOURCE_HPP
#define NETREC_NL80211_SCAN_SOURCE_HPP

#include "netrec/wifi_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace netrec {

class Nl80211ScanSource {
public:
    // An empty interface name picks the first wlan*/wlp*/wlo*/wlx* interface.
    explicit Nl80211ScanSource(const std::string& interface = "");
    ~Nl80211ScanSource();

    const std::string& interfaceName() const { return interface_; }

    // Throws std::runtime_error when netlink or the interface is unavailable.
    std::vector<ScanObservation> cachedScanResults();

private:
    std::string interface_;
};

// Capability string for a BSS, e.g. "[WPA2-PSK][ESS]", built from its
// information elements and 802.11 capability field.
std::string buildCapabilities(const uint8_t* ie, int ielen, uint16_t capability);

} // namespace netrec

#endif
