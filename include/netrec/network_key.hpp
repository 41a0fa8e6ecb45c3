#ifndef NETREC_NETWORK_KEY_HPP
#define NETREC_NETWORK_KEY_HPP

#include <string>

namespace netrec {

// BSSID used by scores that apply to every access point of an SSID.
extern const char* const kAnyBssid;

std::string quoteSsid(const std::string& ssid);

std::string unquoteSsid(const std::string& ssid);

bool isValidBssid(const std::string& bssid);

class NetworkKey {
public:
    // ssid must be quoted ("name") or a hex literal (0x...), bssid a
    // colon separated MAC address. Throws std::invalid_argument otherwise.
    NetworkKey(const std::string& ssid, const std::string& bssid);

    static NetworkKey wildcard(const std::string& ssid);

    const std::string& ssid() const { return ssid_; }
    const std::string& bssid() const { return bssid_; }

    bool isWildcard() const;
    NetworkKey toWildcard() const;

    std::string toString() const;

    bool operator==(const NetworkKey& other) const;
    bool operator!=(const NetworkKey& other) const { return !(*this == other); }
    bool operator<(const NetworkKey& other) const;

private:
    std::string ssid_;
    std::string bssid_;
};

} // namespace netrec

#endif
