#include "netrec/network_key.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace netrec {

const char* const kAnyBssid = "00:00:00:00:00:00";

static bool is_quoted(const std::string& s) {
    return s.size() >= 2 && s.front() == '"' && s.back() == '"';
}

static bool is_hex_ssid(const std::string& s) {
    if (s.size() <= 2 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X')) {
        return false;
    }
    return std::all_of(s.begin() + 2, s.end(),
        [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string quoteSsid(const std::string& ssid) {
    if (is_quoted(ssid)) {
        return ssid;
    }
    return "\"" + ssid + "\"";
}

std::string unquoteSsid(const std::string& ssid) {
    if (is_quoted(ssid)) {
        return ssid.substr(1, ssid.size() - 2);
    }
    return ssid;
}

bool isValidBssid(const std::string& bssid) {
    if (bssid.size() != 17) {
        return false;
    }
    for (size_t i = 0; i < bssid.size(); i++) {
        unsigned char c = static_cast<unsigned char>(bssid[i]);
        if (i % 3 == 2) {
            if (c != ':') return false;
        } else if (!std::isxdigit(c)) {
            return false;
        }
    }
    return true;
}

NetworkKey::NetworkKey(const std::string& ssid, const std::string& bssid)
    : ssid_(ssid), bssid_(bssid) {
    if (!is_quoted(ssid_) && !is_hex_ssid(ssid_)) {
        throw std::invalid_argument("SSID must be quoted or a hex literal: " + ssid_);
    }
    if (!isValidBssid(bssid_)) {
        throw std::invalid_argument("Invalid BSSID: " + bssid_);
    }
    std::transform(bssid_.begin(), bssid_.end(), bssid_.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

NetworkKey NetworkKey::wildcard(const std::string& ssid) {
    return NetworkKey(ssid, kAnyBssid);
}

bool NetworkKey::isWildcard() const {
    return bssid_ == kAnyBssid;
}

NetworkKey NetworkKey::toWildcard() const {
    return NetworkKey(ssid_, kAnyBssid);
}

std::string NetworkKey::toString() const {
    return ssid_ + "," + bssid_;
}

bool NetworkKey::operator==(const NetworkKey& other) const {
    return ssid_ == other.ssid_ && bssid_ == other.bssid_;
}

bool NetworkKey::operator<(const NetworkKey& other) const {
    if (ssid_ != other.ssid_) return ssid_ < other.ssid_;
    return bssid_ < other.bssid_;
}

} // namespace netrec
