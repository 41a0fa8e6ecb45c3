#include "netrec/nl80211_scan_source.hpp"

#include <linux/nl80211.h>
#include <netlink/netlink.h>
#include <netlink/genl/genl.h>
#include <netlink/genl/ctrl.h>
#include <net/if.h>
#include <ifaddrs.h>

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace netrec {

namespace {

const uint8_t kIeSsid = 0;
const uint8_t kIeRsn = 48;
const uint8_t kIeVendor = 221;

const uint8_t kWpaOui[] = {0x00, 0x50, 0xf2, 0x01};
const uint8_t kHs20Oui[] = {0x50, 0x6f, 0x9a, 0x10};

const uint16_t kCapabilityEss = 1 << 0;
const uint16_t kCapabilityIbss = 1 << 1;
const uint16_t kCapabilityPrivacy = 1 << 4;

struct ScanData {
    std::vector<ScanObservation>* observations;
};

class NlSocket {
public:
    NlSocket() : sock_(nl_socket_alloc()) {
        if (!sock_) {
            throw std::runtime_error("Failed to allocate netlink socket");
        }
        if (genl_connect(sock_) < 0) {
            nl_socket_free(sock_);
            throw std::runtime_error("Failed to connect to generic netlink");
        }
    }
    ~NlSocket() {
        nl_close(sock_);
        nl_socket_free(sock_);
    }
    NlSocket(const NlSocket&) = delete;
    NlSocket& operator=(const NlSocket&) = delete;

    nl_sock* get() const { return sock_; }

private:
    nl_sock* sock_;
};

std::string find_wireless_interface() {
    struct ifaddrs *ifaddr, *ifa;
    std::string interface;

    if (getifaddrs(&ifaddr) == -1) {
        return "wlan0";
    }

    for (ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == NULL) continue;

        std::string name(ifa->ifa_name);
        if (name.find("wlan") == 0 || name.find("wlp") == 0 ||
            name.find("wlo") == 0 || name.find("wlx") == 0) {
            interface = name;
            break;
        }
    }

    freeifaddrs(ifaddr);
    return interface.empty() ? "wlan0" : interface;
}

// Key management suite of an RSN or WPA element, starting at `offset` (just
// past the version field).
std::string key_management(const uint8_t* data, int len, int offset) {
    // Group cipher.
    offset += 4;
    if (offset + 2 > len) return "";
    int pairwise = data[offset] | (data[offset + 1] << 8);
    offset += 2 + 4 * pairwise;
    if (offset + 2 > len) return "";
    int akmCount = data[offset] | (data[offset + 1] << 8);
    offset += 2;

    std::string result;
    for (int i = 0; i < akmCount && offset + 4 <= len; i++, offset += 4) {
        const char* name = nullptr;
        switch (data[offset + 3]) {
            case 1: case 5: name = "EAP"; break;
            case 2: case 6: name = "PSK"; break;
            case 8: name = "SAE"; break;
            default: break;
        }
        if (name != nullptr && result.find(name) == std::string::npos) {
            result += result.empty() ? name : std::string("+") + name;
        }
    }
    return result;
}

std::string bssid_to_string(const uint8_t* mac) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 6; i++) {
        if (i > 0) oss << ":";
        oss << std::setw(2) << static_cast<int>(mac[i]);
    }
    return oss.str();
}

int scan_result_handler(struct nl_msg* msg, void* arg) {
    ScanData* data = static_cast<ScanData*>(arg);
    struct genlmsghdr* gnlh = static_cast<struct genlmsghdr*>(nlmsg_data(nlmsg_hdr(msg)));
    struct nlattr* tb[NL80211_ATTR_MAX + 1];
    struct nlattr* bss[NL80211_BSS_MAX + 1];

    nla_parse(tb, NL80211_ATTR_MAX, genlmsg_attrdata(gnlh, 0),
              genlmsg_attrlen(gnlh, 0), NULL);

    if (!tb[NL80211_ATTR_BSS]) {
        return NL_SKIP;
    }
    if (nla_parse_nested(bss, NL80211_BSS_MAX, tb[NL80211_ATTR_BSS], NULL)) {
        return NL_SKIP;
    }

    ScanObservation observation;

    if (bss[NL80211_BSS_BSSID]) {
        observation.bssid = bssid_to_string(static_cast<uint8_t*>(nla_data(bss[NL80211_BSS_BSSID])));
    }
    if (bss[NL80211_BSS_SIGNAL_MBM]) {
        observation.rssi = static_cast<int32_t>(nla_get_u32(bss[NL80211_BSS_SIGNAL_MBM])) / 100;
    }
    if (bss[NL80211_BSS_FREQUENCY]) {
        observation.frequency = nla_get_u32(bss[NL80211_BSS_FREQUENCY]);
    }

    uint16_t capability = 0;
    if (bss[NL80211_BSS_CAPABILITY]) {
        capability = nla_get_u16(bss[NL80211_BSS_CAPABILITY]);
    }

    if (bss[NL80211_BSS_INFORMATION_ELEMENTS]) {
        uint8_t* ie = static_cast<uint8_t*>(nla_data(bss[NL80211_BSS_INFORMATION_ELEMENTS]));
        int ielen = nla_len(bss[NL80211_BSS_INFORMATION_ELEMENTS]);

        for (int i = 0; i + 1 < ielen; ) {
            uint8_t id = ie[i];
            uint8_t len = ie[i + 1];
            if (i + 2 + len > ielen) break;
            if (id == kIeSsid && len > 0 && len <= 32) {
                observation.ssid = std::string(reinterpret_cast<char*>(&ie[i + 2]), len);
            }
            i += 2 + len;
        }
        observation.capabilities = buildCapabilities(ie, ielen, capability);
    } else {
        observation.capabilities = buildCapabilities(nullptr, 0, capability);
    }

    // Hidden networks cannot be matched against saved configurations.
    if (!observation.ssid.empty()) {
        data->observations->push_back(observation);
    }

    return NL_SKIP;
}

int finish_handler(struct nl_msg* msg, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = 0;
    return NL_SKIP;
}

int error_handler(struct sockaddr_nl* nla, struct nlmsgerr* err, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = err->error;
    return NL_STOP;
}

} // namespace

std::string buildCapabilities(const uint8_t* ie, int ielen, uint16_t capability) {
    std::string rsn;
    std::string wpa;
    bool has_rsn = false;
    bool has_wpa = false;
    bool has_hs20 = false;

    for (int i = 0; ie != nullptr && i + 1 < ielen; ) {
        uint8_t id = ie[i];
        uint8_t len = ie[i + 1];
        if (i + 2 + len > ielen) break;
        const uint8_t* body = &ie[i + 2];

        if (id == kIeRsn) {
            has_rsn = true;
            rsn = key_management(body, len, 2);
        } else if (id == kIeVendor && len >= 4) {
            if (memcmp(body, kWpaOui, 4) == 0) {
                has_wpa = true;
                wpa = key_management(body, len, 6);
            } else if (memcmp(body, kHs20Oui, 4) == 0) {
                has_hs20 = true;
            }
        }
        i += 2 + len;
    }

    std::string caps;
    if (has_wpa) {
        caps += "[WPA" + (wpa.empty() ? std::string() : "-" + wpa) + "]";
    }
    if (has_rsn) {
        caps += "[WPA2" + (rsn.empty() ? std::string() : "-" + rsn) + "]";
    }
    if (!has_rsn && !has_wpa && (capability & kCapabilityPrivacy)) {
        caps += "[WEP]";
    }
    if (capability & kCapabilityEss) {
        caps += "[ESS]";
    }
    if (capability & kCapabilityIbss) {
        caps += "[IBSS]";
    }
    if (has_hs20) {
        caps += "[HS20]";
    }
    return caps;
}

Nl80211ScanSource::Nl80211ScanSource(const std::string& interface)
    : interface_(interface.empty() ? find_wireless_interface() : interface) {}

Nl80211ScanSource::~Nl80211ScanSource() {}

std::vector<ScanObservation> Nl80211ScanSource::cachedScanResults() {
    std::vector<ScanObservation> observations;

    NlSocket sock;

    int nl80211_id = genl_ctrl_resolve(sock.get(), "nl80211");
    if (nl80211_id < 0) {
        throw std::runtime_error("nl80211 not found (kernel might be too old or WiFi not available)");
    }

    int if_index = if_nametoindex(interface_.c_str());
    if (if_index == 0) {
        throw std::runtime_error("Wireless interface " + interface_ + " not found");
    }
    spdlog::debug("[Nl80211ScanSource] Reading cached scan results of {}", interface_);

    struct nl_msg* msg = nlmsg_alloc();
    if (!msg) {
        throw std::runtime_error("Failed to allocate netlink message");
    }
    genlmsg_put(msg, 0, 0, nl80211_id, 0, NLM_F_DUMP, NL80211_CMD_GET_SCAN, 0);
    nla_put_u32(msg, NL80211_ATTR_IFINDEX, if_index);

    struct nl_cb* cb = nl_cb_alloc(NL_CB_DEFAULT);
    if (!cb) {
        nlmsg_free(msg);
        throw std::runtime_error("Failed to allocate netlink callbacks");
    }
    ScanData scan_data = {&observations};
    int err = 1;
    nl_cb_set(cb, NL_CB_VALID, NL_CB_CUSTOM, scan_result_handler, &scan_data);
    nl_cb_err(cb, NL_CB_CUSTOM, error_handler, &err);
    nl_cb_set(cb, NL_CB_FINISH, NL_CB_CUSTOM, finish_handler, &err);

    if (nl_send_auto(sock.get(), msg) < 0) {
        nl_cb_put(cb);
        nlmsg_free(msg);
        throw std::runtime_error("Failed to request scan results");
    }

    while (err > 0) {
        if (nl_recvmsgs(sock.get(), cb) < 0) {
            break;
        }
    }

    nl_cb_put(cb);
    nlmsg_free(msg);

    if (err < 0) {
        throw std::runtime_error("Scan dump failed with error: " + std::to_string(err));
    }

    std::sort(observations.begin(), observations.end(),
        [](const ScanObservation& a, const ScanObservation& b) {
            if (a.ssid != b.ssid) return a.ssid < b.ssid;
            return a.rssi > b.rssi;
        });

    spdlog::debug("[Nl80211ScanSource] {} access points in cache", observations.size());
    return observations;
}

} // namespace netrec
