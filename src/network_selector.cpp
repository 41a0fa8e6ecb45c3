#include "netrec/network_selector.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace netrec {

NetworkSelector::NetworkSelector(const SelectorConfig& config) : config_(config) {}

bool NetworkSelector::isQualified(const ScanObservation& scan) const {
    if (scan.is5GHz() && scan.rssi < config_.threshold_qualified_rssi_5) {
        return false;
    }
    if (scan.is24GHz() && scan.rssi < config_.threshold_qualified_rssi_24) {
        return false;
    }
    return true;
}

std::optional<SavedNetwork> NetworkSelector::selectNetwork(
    const std::map<std::string, SavedNetwork>& savedNetworks,
    const std::vector<ScanObservation>& scans) const {
    const SavedNetwork* candidate = nullptr;
    int candidateScore = 0;

    for (const auto& scan : scans) {
        auto saved = savedNetworks.find(scan.ssid);
        if (saved == savedNetworks.end()) {
            continue;
        }
        if (!isQualified(scan)) {
            continue;
        }
        // The advertised security may have changed since the user saved it.
        if (!saved->second.matchesScan(scan)) {
            continue;
        }
        int score = calculateScore(scan, saved->second);
        if (candidate == nullptr || score > candidateScore) {
            candidate = &saved->second;
            candidateScore = score;
        }
    }

    if (candidate == nullptr) {
        return std::nullopt;
    }
    spdlog::debug("[NetworkSelector] Selected {} with score {}", candidate->ssid, candidateScore);
    return *candidate;
}

int NetworkSelector::calculateScore(const ScanObservation& scan, const SavedNetwork& network) const {
    int rssi = std::min(scan.rssi, config_.threshold_saturated_rssi_24);
    int score = (rssi + config_.rssi_score_offset) * config_.rssi_score_slope;

    if (scan.is5GHz()) {
        score += config_.band_5ghz_award;
    }

    if (network.isPasspoint()) {
        score += config_.passpoint_security_award;
    } else if (!network.isOpen()) {
        score += config_.security_award;
    }
    return score;
}

} // namespace netrec
