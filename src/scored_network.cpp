#include "netrec/scored_network.hpp"

#include <algorithm>
#include <sstream>

namespace netrec {

// Badge curves share the layout of the constant score curves: 13 buckets of
// 10 dB starting at -150 dBm. Index 7 covers -80 dBm.
static const int kBadgeCurveBuckets = 13;
static const int kBadgeCurveFirstBadgedBucket = 7;

std::optional<Badge> parseBadge(const std::string& text) {
    if (text == "NONE") return Badge::None;
    if (text == "SD") return Badge::SD;
    if (text == "HD") return Badge::HD;
    if (text == "4K") return Badge::UHD4K;
    return std::nullopt;
}

const char* badgeName(Badge badge) {
    switch (badge) {
        case Badge::None: return "NONE";
        case Badge::SD: return "SD";
        case Badge::HD: return "HD";
        case Badge::UHD4K: return "4K";
    }
    return "NONE";
}

int8_t ScoreCurve::lookupScore(int rssi) const {
    if (buckets.empty() || bucket_width <= 0) {
        return kUnscored;
    }
    int index = (rssi - start) / bucket_width;
    index = std::max(0, std::min(index, static_cast<int>(buckets.size()) - 1));
    return buckets[index];
}

bool ScoreCurve::operator==(const ScoreCurve& other) const {
    return start == other.start && bucket_width == other.bucket_width
        && buckets == other.buckets;
}

ScoreCurve makeBadgeCurve(Badge badge) {
    ScoreCurve curve;
    curve.start = kConstantCurveStart;
    curve.bucket_width = 10;
    curve.buckets.assign(kBadgeCurveBuckets, static_cast<int8_t>(Badge::None));
    std::fill(curve.buckets.begin() + kBadgeCurveFirstBadgedBucket, curve.buckets.end(),
              static_cast<int8_t>(badge));
    return curve;
}

Badge ScoredNetwork::calculateBadge(int rssi) const {
    if (!badge_curve) {
        return Badge::None;
    }
    switch (badge_curve->lookupScore(rssi)) {
        case static_cast<int8_t>(Badge::SD): return Badge::SD;
        case static_cast<int8_t>(Badge::HD): return Badge::HD;
        case static_cast<int8_t>(Badge::UHD4K): return Badge::UHD4K;
        default: return Badge::None;
    }
}

std::string ScoredNetwork::toString() const {
    std::ostringstream out;
    out << key.toString() << "|" << curve.bucket_width;
    for (int8_t score : curve.buckets) {
        out << "," << static_cast<int>(score);
    }
    out << "|" << (metered_hint ? 1 : 0)
        << "|" << (has_captive_portal ? 1 : 0)
        << "|" << badgeName(badge);
    return out.str();
}

} // namespace netrec
