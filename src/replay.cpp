#include "netrec/replay.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace netrec {

static std::vector<std::string> split_words(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

static int parse_int(const std::string& text, const char* what) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid ") + what + ": '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument(std::string("invalid ") + what + ": '" + text + "'");
    }
    return value;
}

static bool parse_flag(const std::string& text, const std::string& key) {
    if (text == "1") return true;
    if (text == "0") return false;
    throw std::invalid_argument("invalid value for " + key + ": '" + text + "'");
}

SecurityType parseSecurity(const std::string& text) {
    if (text == "open") return SecurityType::Open;
    if (text == "wep") return SecurityType::Wep;
    if (text == "psk") return SecurityType::Psk;
    if (text == "eap") return SecurityType::Eap;
    if (text == "passpoint") return SecurityType::Passpoint;
    throw std::invalid_argument("unknown security type: '" + text + "'");
}

WifiState parseWifiState(const std::string& text) {
    if (text == "enabled") return WifiState::Enabled;
    if (text == "disabled") return WifiState::Disabled;
    if (text == "enabling") return WifiState::Enabling;
    if (text == "disabling") return WifiState::Disabling;
    if (text == "unknown") return WifiState::Unknown;
    throw std::invalid_argument("unknown wifi state: '" + text + "'");
}

ApState parseApState(const std::string& text) {
    if (text == "enabled") return ApState::Enabled;
    if (text == "disabled") return ApState::Disabled;
    if (text == "enabling") return ApState::Enabling;
    if (text == "disabling") return ApState::Disabling;
    if (text == "failed") return ApState::Failed;
    throw std::invalid_argument("unknown ap state: '" + text + "'");
}

NetworkState parseNetworkState(const std::string& text) {
    static const NetworkState all[] = {
        NetworkState::Idle, NetworkState::Scanning, NetworkState::Connecting,
        NetworkState::Authenticating, NetworkState::ObtainingIpAddr, NetworkState::Connected,
        NetworkState::Suspended, NetworkState::Disconnecting, NetworkState::Disconnected,
        NetworkState::Failed, NetworkState::Blocked, NetworkState::VerifyingPoorLink,
        NetworkState::CaptivePortalCheck, NetworkState::Unknown
    };
    for (NetworkState state : all) {
        if (text == networkStateName(state)) {
            return state;
        }
    }
    throw std::invalid_argument("unknown network state: '" + text + "'");
}

std::vector<ScanObservation> parseScanList(const std::string& text) {
    std::vector<ScanObservation> scans;
    std::istringstream stream(text);
    std::string entry;
    while (std::getline(stream, entry, ';')) {
        if (entry.empty()) {
            continue;
        }
        // Fields after the SSID never contain commas; split from the right.
        std::string fields[4];
        std::string rest = entry;
        for (int i = 3; i >= 0; i--) {
            size_t comma = rest.rfind(',');
            if (comma == std::string::npos) {
                throw std::invalid_argument("malformed scan entry: '" + entry + "'");
            }
            fields[i] = rest.substr(comma + 1);
            rest = rest.substr(0, comma);
        }

        ScanObservation scan;
        scan.ssid = rest;
        scan.bssid = fields[0];
        scan.rssi = parse_int(fields[1], "rssi");
        int frequency = parse_int(fields[2], "frequency");
        if (frequency < 0) {
            throw std::invalid_argument("invalid frequency: '" + fields[2] + "'");
        }
        scan.frequency = static_cast<uint32_t>(frequency);
        scan.capabilities = fields[3];
        scans.push_back(scan);
    }
    return scans;
}

Settings parseSettings(const std::vector<std::string>& tokens) {
    Settings settings;
    for (const auto& token : tokens) {
        size_t eq = token.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("expected key=value, got '" + token + "'");
        }
        std::string key = token.substr(0, eq);
        std::string value = token.substr(eq + 1);
        if (key == "wakeup") {
            settings.wakeup_enabled = parse_flag(value, key);
        } else if (key == "airplane") {
            settings.airplane_mode = parse_flag(value, key);
        } else if (key == "notify") {
            settings.notification_enabled = parse_flag(value, key);
        } else {
            throw std::invalid_argument("unknown setting: '" + key + "'");
        }
    }
    return settings;
}

void ReplayRunner::Radio::setWifiEnabled(bool enabled) {
    out_ << "radio: wifi " << (enabled ? "enabled" : "disabled") << "\n";
}

void ReplayRunner::Radio::connect(const SavedNetwork& network) {
    out_ << "radio: connect " << network.ssid << "\n";
}

void ReplayRunner::Notification::show(const NotificationContent& content) {
    out_ << "notify: " << notificationKindName(content.kind)
         << " ssid=" << content.ssid
         << " badge=" << badgeName(content.badge)
         << " level=" << content.signal_level << "\n";
}

void ReplayRunner::Notification::retract() {
    out_ << "notify: retract\n";
}

void ReplayRunner::Sink::updateScores(const std::vector<ScoredNetwork>& networks) {
    for (const auto& network : networks) {
        out_ << "scores: " << network.toString() << "\n";
    }
}

ReplayRunner::ReplayRunner(std::ostream& out, const Config& config)
    : out_(out),
      now_(),
      radio_(out),
      notifier_(out),
      sink_(out),
      service_(radio_, notifier_, sink_, config, [this] { return now_; }) {}

void ReplayRunner::execute(const std::string& line) {
    size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') {
        return;
    }
    std::string trimmed = line.substr(first);
    size_t space = trimmed.find_first_of(" \t");
    std::string command = trimmed.substr(0, space);
    std::string argument;
    if (space != std::string::npos) {
        size_t start = trimmed.find_first_not_of(" \t", space);
        size_t end = trimmed.find_last_not_of(" \t\r");
        if (start != std::string::npos) {
            argument = trimmed.substr(start, end - start + 1);
        }
    }
    std::vector<std::string> args = split_words(argument);

    if (command == "saved") {
        if (args.size() < 2 || args.size() > 3) {
            throw std::invalid_argument("usage: saved <ssid> <security> [external|noexternal]");
        }
        SavedNetwork network;
        network.ssid = quoteSsid(args[0]);
        network.security = parseSecurity(args[1]);
        if (args.size() == 3) {
            if (args[2] == "external") {
                network.use_external_scores = true;
            } else if (args[2] != "noexternal") {
                throw std::invalid_argument("unknown saved network flag: '" + args[2] + "'");
            }
        }
        saved_.push_back(network);
        return;
    }
    if (command == "configured") {
        service_.onConfiguredNetworksChanged(saved_);
    } else if (command == "wifi") {
        if (args.size() != 1) throw std::invalid_argument("usage: wifi <state>");
        service_.onWifiStateChanged(parseWifiState(args[0]));
    } else if (command == "ap") {
        if (args.size() != 1) throw std::invalid_argument("usage: ap <state>");
        service_.onWifiApStateChanged(parseApState(args[0]));
    } else if (command == "network") {
        if (args.size() != 1) throw std::invalid_argument("usage: network <state>");
        service_.onNetworkStateChanged(parseNetworkState(args[0]));
    } else if (command == "scan") {
        lastScan_ = parseScanList(argument);
        service_.onScanResults(lastScan_);
    } else if (command == "settings") {
        service_.onSettingsChanged(parseSettings(args));
    } else if (command == "addScore") {
        if (argument.empty()) throw std::invalid_argument("usage: addScore <line>");
        service_.runDiagnosticCommand({"addScore", argument}, out_);
    } else if (command == "connect") {
        service_.onConnectToRecommendedNetwork();
    } else if (command == "dismiss") {
        service_.onNotificationDeleted();
    } else if (command == "advance") {
        if (args.size() != 1) throw std::invalid_argument("usage: advance <ms>");
        int ms = parse_int(args[0], "duration");
        if (ms < 0) throw std::invalid_argument("duration must not be negative");
        now_ += std::chrono::milliseconds(ms);
    } else if (command == "recommend") {
        recommend();
        return;
    } else if (command == "dump") {
        service_.runPending();
        service_.dump(out_);
        return;
    } else {
        throw std::invalid_argument("unknown command: '" + command + "'");
    }
    service_.runPending();
}

void ReplayRunner::recommend() {
    RecommendationRequest request;
    request.scans = lastScan_;
    std::future<Recommendation> result = service_.requestRecommendation(request);
    service_.runPending();
    Recommendation recommendation = result.get();
    if (recommendation.shouldConnect()) {
        out_ << "recommend: " << recommendation.connect->ssid << "\n";
    } else {
        out_ << "recommend: none\n";
    }
}

void ReplayRunner::run(std::istream& in) {
    std::string line;
    int number = 0;
    while (std::getline(in, line)) {
        number++;
        try {
            execute(line);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("line " + std::to_string(number) + ": " + e.what());
        }
    }
    spdlog::debug("[ReplayRunner] Replayed {} lines", number);
}

} // namespace netrec
