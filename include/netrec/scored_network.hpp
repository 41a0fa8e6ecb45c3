#ifndef NETREC_SCORED_NETWORK_HPP
#define NETREC_SCORED_NETWORK_HPP

#include "netrec/network_key.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace netrec {

// Start RSSI of every curve built from the diagnostic score protocol.
constexpr int kConstantCurveStart = -150;

// Score reported for an RSSI when a curve has no buckets.
constexpr int8_t kUnscored = -128;

enum class Badge : int8_t {
    None = 0,
    SD = 10,
    HD = 20,
    UHD4K = 30
};

std::optional<Badge> parseBadge(const std::string& text);
const char* badgeName(Badge badge);

struct ScoreCurve {
    int start = kConstantCurveStart;
    int bucket_width = 10;
    std::vector<int8_t> buckets;

    // RSSI values outside the curve clamp to the first or last bucket.
    int8_t lookupScore(int rssi) const;

    bool operator==(const ScoreCurve& other) const;
    bool operator!=(const ScoreCurve& other) const { return !(*this == other); }
};

// Curve that reports `badge` at or above -80 dBm and None below.
ScoreCurve makeBadgeCurve(Badge badge);

struct ScoredNetwork {
    NetworkKey key;
    ScoreCurve curve;
    bool metered_hint = false;
    bool has_captive_portal = false;
    Badge badge = Badge::None;
    std::optional<ScoreCurve> badge_curve;

    ScoredNetwork(NetworkKey key, ScoreCurve curve)
        : key(std::move(key)), curve(std::move(curve)) {}

    Badge calculateBadge(int rssi) const;

    std::string toString() const;
};

} // namespace netrec

#endif
