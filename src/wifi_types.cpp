#include "netrec/wifi_types.hpp"
#include "netrec/network_key.hpp"

#include <cstdio>
#include <sstream>

namespace netrec {

static const int kMinRssi = -100;
static const int kMaxRssi = -55;

const char* securityName(SecurityType security) {
    switch (security) {
        case SecurityType::Open: return "Open";
        case SecurityType::Wep: return "WEP";
        case SecurityType::Psk: return "PSK";
        case SecurityType::Eap: return "EAP";
        case SecurityType::Passpoint: return "Passpoint";
    }
    return "Open";
}

SecurityType securityFromCapabilities(const std::string& capabilities) {
    if (capabilities.find("EAP") != std::string::npos) {
        return SecurityType::Eap;
    }
    if (capabilities.find("PSK") != std::string::npos
        || capabilities.find("SAE") != std::string::npos) {
        return SecurityType::Psk;
    }
    if (capabilities.find("WEP") != std::string::npos) {
        return SecurityType::Wep;
    }
    return SecurityType::Open;
}

int calculateSignalLevel(int rssi, int levels) {
    if (levels <= 1) return 0;
    if (rssi <= kMinRssi) return 0;
    if (rssi >= kMaxRssi) return levels - 1;
    return (rssi - kMinRssi) * (levels - 1) / (kMaxRssi - kMinRssi);
}

Band ScanObservation::band() const {
    if (frequency > 2400 && frequency < 2500) return Band::Ghz24;
    if (frequency > 4900 && frequency < 5900) return Band::Ghz5;
    return Band::Unknown;
}

bool ScanObservation::isOpen() const {
    return securityFromCapabilities(capabilities) == SecurityType::Open;
}

int ScanObservation::getSignalPercent() const {
    if (rssi <= -100) return 0;
    if (rssi >= -50) return 100;
    return 2 * (rssi + 100);
}

std::string jsonEscape(const std::string& text) {
    std::string escaped;
    for (char c : text) {
        switch (c) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    escaped += buf;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

std::string ScanObservation::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"ssid\":\"" << jsonEscape(ssid) << "\",";
    json << "\"bssid\":\"" << bssid << "\",";
    json << "\"signal_dbm\":" << rssi << ",";
    json << "\"signal_percent\":" << getSignalPercent() << ",";
    json << "\"frequency\":" << frequency << ",";
    json << "\"capabilities\":\"" << capabilities << "\"";
    json << "}";
    return json.str();
}

bool SavedNetwork::matchesScan(const ScanObservation& scan) const {
    SecurityType advertised = securityFromCapabilities(scan.capabilities);
    if (security == SecurityType::Passpoint) {
        return advertised == SecurityType::Eap;
    }
    return advertised == security;
}

std::string SavedNetwork::printableSsid() const {
    return unquoteSsid(ssid);
}

bool SavedNetwork::operator==(const SavedNetwork& other) const {
    return ssid == other.ssid && bssid == other.bssid && security == other.security
        && enabled == other.enabled && no_internet_access == other.no_internet_access
        && no_internet_access_expected == other.no_internet_access_expected
        && use_external_scores == other.use_external_scores;
}

CoarseNetworkState coarseState(NetworkState state) {
    switch (state) {
        case NetworkState::Idle:
        case NetworkState::Scanning:
        case NetworkState::Disconnected:
        case NetworkState::Failed:
        case NetworkState::Blocked:
            return CoarseNetworkState::Disconnected;
        case NetworkState::Connecting:
        case NetworkState::Authenticating:
        case NetworkState::ObtainingIpAddr:
        case NetworkState::VerifyingPoorLink:
        case NetworkState::CaptivePortalCheck:
            return CoarseNetworkState::Connecting;
        case NetworkState::Connected:
            return CoarseNetworkState::Connected;
        case NetworkState::Suspended:
            return CoarseNetworkState::Suspended;
        case NetworkState::Disconnecting:
            return CoarseNetworkState::Disconnecting;
        case NetworkState::Unknown:
            return CoarseNetworkState::Unknown;
    }
    return CoarseNetworkState::Unknown;
}

const char* wifiStateName(WifiState state) {
    switch (state) {
        case WifiState::Disabling: return "disabling";
        case WifiState::Disabled: return "disabled";
        case WifiState::Enabling: return "enabling";
        case WifiState::Enabled: return "enabled";
        case WifiState::Unknown: return "unknown";
    }
    return "unknown";
}

const char* apStateName(ApState state) {
    switch (state) {
        case ApState::Disabling: return "disabling";
        case ApState::Disabled: return "disabled";
        case ApState::Enabling: return "enabling";
        case ApState::Enabled: return "enabled";
        case ApState::Failed: return "failed";
    }
    return "failed";
}

const char* networkStateName(NetworkState state) {
    switch (state) {
        case NetworkState::Idle: return "idle";
        case NetworkState::Scanning: return "scanning";
        case NetworkState::Connecting: return "connecting";
        case NetworkState::Authenticating: return "authenticating";
        case NetworkState::ObtainingIpAddr: return "obtaining_ipaddr";
        case NetworkState::Connected: return "connected";
        case NetworkState::Suspended: return "suspended";
        case NetworkState::Disconnecting: return "disconnecting";
        case NetworkState::Disconnected: return "disconnected";
        case NetworkState::Failed: return "failed";
        case NetworkState::Blocked: return "blocked";
        case NetworkState::VerifyingPoorLink: return "verifying_poor_link";
        case NetworkState::CaptivePortalCheck: return "captive_portal_check";
        case NetworkState::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace netrec
