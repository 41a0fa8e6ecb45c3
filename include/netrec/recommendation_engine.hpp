#ifndef NETREC_RECOMMENDATION_ENGINE_HPP
#define NETREC_RECOMMENDATION_ENGINE_HPP

#include "netrec/collaborators.hpp"
#include "netrec/score_store.hpp"
#include "netrec/wifi_types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace netrec {

struct CapabilityFilter {
    bool require_saved = false;
    bool require_unmetered = false;
    bool require_no_captive_portal = false;
};

struct RecommendationRequest {
    std::vector<ScanObservation> scans;
    CapabilityFilter filter;
    std::optional<SavedNetwork> current_config;
};

struct Recommendation {
    std::optional<SavedNetwork> connect;
    // The scan result that won. Unset when `connect` came from current_config.
    std::optional<ScanObservation> scan;

    bool shouldConnect() const { return connect.has_value(); }
};

// Parses `"<ssid>",<bssid>|<bucketWidth>,<s0>,...|<metered>|<captive>|<badge>`.
// Throws std::invalid_argument on any malformed field.
ScoredNetwork parseScoredNetwork(const std::string& line);

class RecommendationEngine {
public:
    RecommendationEngine(ScoreStore& store, ScoreSink& sink);
    virtual ~RecommendationEngine() = default;

    virtual Recommendation recommend(const RecommendationRequest& request) const;

    void onRequestScores(const std::vector<NetworkKey>& keys);

    // Stores one score given in the diagnostic line format and publishes it
    // unless it is keyed by the wildcard BSSID.
    ScoredNetwork addScore(const std::string& line);

    // Diagnostic commands: `addScore <line>` and `dump`. Returns false for an
    // unknown command.
    bool handleCommand(const std::vector<std::string>& args, std::ostream& out);

    void setSavedNetworks(const std::vector<SavedNetwork>& networks);

    std::optional<ScoredNetwork> scoreFor(const NetworkKey& key) const;

    void dump(std::ostream& out) const;

private:
    bool passesFilter(const ScanObservation& scan, const ScoredNetwork& score,
                      const CapabilityFilter& filter) const;
    const SavedNetwork* findSaved(const std::string& ssid) const;
    SavedNetwork toSavedNetwork(const ScanObservation& scan) const;

    ScoreStore& store_;
    ScoreSink& sink_;
    std::vector<SavedNetwork> savedNetworks_;
};

} // namespace netrec

#endif
