#include "netrec/recommendation_engine.hpp"

#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace netrec {

static std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.push_back("");
    }
    return parts;
}

static int parse_int(const std::string& text, const char* field) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid ") + field + ": '" + text + "'");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(std::string("Invalid ") + field + ": '" + text + "'");
    }
    return value;
}

static bool parse_flag(const std::string& text, const char* field) {
    if (text == "0") return false;
    if (text == "1") return true;
    throw std::invalid_argument(std::string("Invalid ") + field + " flag: '" + text + "'");
}

ScoredNetwork parseScoredNetwork(const std::string& line) {
    std::vector<std::string> fields = split(line, '|');
    if (fields.size() != 5) {
        throw std::invalid_argument("Expected 5 '|' separated fields: " + line);
    }

    // The SSID may itself contain commas; the BSSID never does.
    const std::string& keyField = fields[0];
    size_t comma = keyField.rfind(',');
    if (comma == std::string::npos) {
        throw std::invalid_argument("Missing BSSID in network key: " + keyField);
    }
    NetworkKey key(keyField.substr(0, comma), keyField.substr(comma + 1));

    std::vector<std::string> curveFields = split(fields[1], ',');
    if (curveFields.size() < 2) {
        throw std::invalid_argument("Score curve needs a bucket width and at least one sample");
    }
    ScoreCurve curve;
    curve.start = kConstantCurveStart;
    curve.bucket_width = parse_int(curveFields[0], "bucket width");
    if (curve.bucket_width <= 0) {
        throw std::invalid_argument("Bucket width must be positive: " + curveFields[0]);
    }
    for (size_t i = 1; i < curveFields.size(); i++) {
        int sample = parse_int(curveFields[i], "score sample");
        if (sample < -128 || sample > 127) {
            throw std::invalid_argument("Score sample out of range: " + curveFields[i]);
        }
        curve.buckets.push_back(static_cast<int8_t>(sample));
    }

    ScoredNetwork network(key, curve);
    network.metered_hint = parse_flag(fields[2], "metered");
    network.has_captive_portal = parse_flag(fields[3], "captive portal");

    std::optional<Badge> badge = parseBadge(fields[4]);
    if (!badge) {
        throw std::invalid_argument("Unknown badge: " + fields[4]);
    }
    network.badge = *badge;
    if (network.badge != Badge::None) {
        network.badge_curve = makeBadgeCurve(network.badge);
    }
    return network;
}

RecommendationEngine::RecommendationEngine(ScoreStore& store, ScoreSink& sink)
    : store_(store), sink_(sink) {}

Recommendation RecommendationEngine::recommend(const RecommendationRequest& request) const {
    Recommendation result;
    if (request.scans.empty()) {
        // Nothing new to go on; stay with whatever is current.
        result.connect = request.current_config;
        return result;
    }

    const ScanObservation* best = nullptr;
    int bestScore = 0;
    for (const auto& scan : request.scans) {
        if (!isValidBssid(scan.bssid)) {
            spdlog::warn("[RecommendationEngine] Ignoring scan of '{}' with invalid BSSID '{}'",
                         scan.ssid, scan.bssid);
            continue;
        }
        std::optional<ScoredNetwork> score =
            store_.get(NetworkKey(quoteSsid(scan.ssid), scan.bssid));
        if (!score) {
            continue;
        }
        if (!passesFilter(scan, *score, request.filter)) {
            continue;
        }
        int value = score->curve.lookupScore(scan.rssi);
        if (best == nullptr || value > bestScore) {
            best = &scan;
            bestScore = value;
        }
    }

    if (best == nullptr) {
        spdlog::debug("[RecommendationEngine] No scored network among {} scan results",
                      request.scans.size());
        return result;
    }

    const SavedNetwork* saved = findSaved(best->ssid);
    result.connect = saved != nullptr ? *saved : toSavedNetwork(*best);
    result.scan = *best;
    spdlog::debug("[RecommendationEngine] Recommending {} ({}) with score {}",
                  result.connect->ssid, best->bssid, bestScore);
    return result;
}

bool RecommendationEngine::passesFilter(const ScanObservation& scan, const ScoredNetwork& score,
                                        const CapabilityFilter& filter) const {
    if (filter.require_saved && findSaved(scan.ssid) == nullptr) {
        return false;
    }
    if (filter.require_unmetered && score.metered_hint) {
        return false;
    }
    if (filter.require_no_captive_portal && score.has_captive_portal) {
        return false;
    }
    return true;
}

const SavedNetwork* RecommendationEngine::findSaved(const std::string& ssid) const {
    for (const auto& network : savedNetworks_) {
        if (network.printableSsid() == ssid) {
            return &network;
        }
    }
    return nullptr;
}

SavedNetwork RecommendationEngine::toSavedNetwork(const ScanObservation& scan) const {
    SavedNetwork network;
    network.ssid = quoteSsid(scan.ssid);
    network.bssid = scan.bssid;
    network.security = securityFromCapabilities(scan.capabilities);
    return network;
}

void RecommendationEngine::onRequestScores(const std::vector<NetworkKey>& keys) {
    if (keys.empty()) {
        return;
    }
    std::vector<ScoredNetwork> scores;
    for (const auto& key : keys) {
        // Wildcard scores are for local lookups only.
        if (key.isWildcard()) {
            continue;
        }
        std::optional<ScoredNetwork> score = store_.getExact(key);
        if (score) {
            scores.push_back(*score);
        }
    }
    if (scores.empty()) {
        spdlog::debug("[RecommendationEngine] No stored scores for {} requested keys", keys.size());
        return;
    }
    sink_.updateScores(scores);
}

ScoredNetwork RecommendationEngine::addScore(const std::string& line) {
    ScoredNetwork network = parseScoredNetwork(line);
    store_.put(network);
    spdlog::info("[RecommendationEngine] Added score for {}", network.key.toString());
    if (!network.key.isWildcard()) {
        sink_.updateScores({network});
    }
    return network;
}

bool RecommendationEngine::handleCommand(const std::vector<std::string>& args, std::ostream& out) {
    if (args.empty()) {
        return false;
    }
    if (args[0] == "addScore") {
        if (args.size() != 2) {
            throw std::invalid_argument("usage: addScore \"<ssid>\",<bssid>|<width>,<s0>,...|<metered>|<captive>|<badge>");
        }
        ScoredNetwork network = addScore(args[1]);
        out << "Added score: " << network.toString() << "\n";
        return true;
    }
    if (args[0] == "dump") {
        dump(out);
        return true;
    }
    return false;
}

void RecommendationEngine::setSavedNetworks(const std::vector<SavedNetwork>& networks) {
    savedNetworks_ = networks;
}

std::optional<ScoredNetwork> RecommendationEngine::scoreFor(const NetworkKey& key) const {
    return store_.get(key);
}

void RecommendationEngine::dump(std::ostream& out) const {
    std::vector<ScoredNetwork> scores = store_.snapshot();
    out << "RecommendationEngine: " << scores.size() << " scores, "
        << savedNetworks_.size() << " saved networks\n";
    for (const auto& score : scores) {
        out << "  " << score.toString() << "\n";
    }
}

} // namespace netrec
