#ifndef NETREC_WIFI_TYPES_HPP
#define NETREC_WIFI_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace netrec {

enum class Band {
    Unknown,
    Ghz24,
    Ghz5
};

enum class SecurityType {
    Open,
    Wep,
    Psk,
    Eap,
    Passpoint
};

const char* securityName(SecurityType security);

// Security advertised by a capability string such as "[WPA2-PSK-CCMP][ESS]".
// Never returns Passpoint; passpoint networks advertise EAP.
SecurityType securityFromCapabilities(const std::string& capabilities);

// Maps an RSSI to 0..levels-1 bars between -100 dBm and -55 dBm.
int calculateSignalLevel(int rssi, int levels);

std::string jsonEscape(const std::string& text);

struct ScanObservation {
    std::string ssid;             // unquoted, as broadcast
    std::string bssid;
    int rssi = -127;              // dBm
    uint32_t frequency = 0;       // MHz
    std::string capabilities;

    Band band() const;
    bool is24GHz() const { return band() == Band::Ghz24; }
    bool is5GHz() const { return band() == Band::Ghz5; }
    bool isOpen() const;

    int getSignalPercent() const;
    std::string toJson() const;
};

struct SavedNetwork {
    std::string ssid;             // quoted
    std::string bssid;            // empty when not pinned to one AP
    SecurityType security = SecurityType::Open;
    bool enabled = true;
    bool no_internet_access = false;
    bool no_internet_access_expected = false;
    bool use_external_scores = false;

    bool isOpen() const { return security == SecurityType::Open; }
    bool isPasspoint() const { return security == SecurityType::Passpoint; }

    bool matchesScan(const ScanObservation& scan) const;

    std::string printableSsid() const;

    bool operator==(const SavedNetwork& other) const;
    bool operator!=(const SavedNetwork& other) const { return !(*this == other); }
};

enum class WifiState {
    Disabling,
    Disabled,
    Enabling,
    Enabled,
    Unknown
};

enum class ApState {
    Disabling,
    Disabled,
    Enabling,
    Enabled,
    Failed
};

enum class NetworkState {
    Idle,
    Scanning,
    Connecting,
    Authenticating,
    ObtainingIpAddr,
    Connected,
    Suspended,
    Disconnecting,
    Disconnected,
    Failed,
    Blocked,
    VerifyingPoorLink,
    CaptivePortalCheck,
    Unknown
};

enum class CoarseNetworkState {
    Connecting,
    Connected,
    Suspended,
    Disconnecting,
    Disconnected,
    Unknown
};

CoarseNetworkState coarseState(NetworkState state);

const char* wifiStateName(WifiState state);
const char* apStateName(ApState state);
const char* networkStateName(NetworkState state);

} // namespace netrec

#endif
